#include "bj/basic_strategy.h"
#include <stdexcept>

namespace bj_solver {

namespace {

bool up_in(int up, int lo, int hi) { return up >= lo && up <= hi; }

// Paires: retourne true si le split est recommandé
bool should_split(Rank pair_rank, int up) {
    switch (pair_rank) {
        case Rank::ACE:
        case Rank::EIGHT:
            return true;
        case Rank::TEN:
        case Rank::JACK:
        case Rank::QUEEN:
        case Rank::KING:
            return up_in(up, 5, 6);
        case Rank::NINE:
            return up_in(up, 2, 6) || up_in(up, 8, 9);
        case Rank::SEVEN:
        case Rank::THREE:
        case Rank::TWO:
            return up_in(up, 2, 7);
        case Rank::SIX:
            return up_in(up, 2, 6);
        case Rank::FIVE:
            return up_in(up, 2, 9);
        case Rank::FOUR:
            return up_in(up, 5, 6);
        default:
            return false;
    }
}

} // namespace

Action basic_action(const Hand& player_hand, Card dealer_up_card) {
    if (player_hand.empty()) {
        throw std::invalid_argument("basic_action: main vide.");
    }
    if (dealer_up_card >= INVALID_CARD) {
        throw std::invalid_argument("basic_action: carte visible du croupier invalide.");
    }

    const int total = player_hand.total();
    const int up = card_value(dealer_up_card); // As = 11

    if (player_hand.can_split() && should_split(get_rank(player_hand.cards()[0]), up)) {
        return Action::SPLIT;
    }

    if (player_hand.is_soft()) {
        if (total >= 19) return Action::STAND;
        if (total == 18) return up >= 9 ? Action::HIT : Action::STAND;
        return Action::HIT;
    }

    // Mains dures
    if (total >= 17) return Action::STAND;
    if (total == 16) return up >= 7 ? Action::HIT : Action::STAND;
    if (total == 15) return up >= 10 ? Action::HIT : Action::STAND;
    if (total == 13 || total == 14) return up_in(up, 2, 6) ? Action::STAND : Action::HIT;
    if (total == 12) return up_in(up, 4, 6) ? Action::STAND : Action::HIT;
    return Action::HIT;
}

} // namespace bj_solver
