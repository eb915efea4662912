#include "bj/game_utils.hpp"
#include <iomanip>
#include <sstream>

namespace bj_solver {

std::string phase_to_string(Phase p) {
    switch (p) {
        case Phase::BETTING:     return "Betting";
        case Phase::DEALING:     return "Dealing";
        case Phase::INSURANCE:   return "Insurance";
        case Phase::PLAYER_TURN: return "PlayerTurn";
        case Phase::DEALER_TURN: return "DealerTurn";
        case Phase::GAME_OVER:   return "GameOver";
        default:                 return "UnknownPhase";
    }
}

std::string result_to_string(HandResult r) {
    switch (r) {
        case HandResult::PLAYER_WIN:       return "Player Win";
        case HandResult::DEALER_WIN:       return "Dealer Win";
        case HandResult::PUSH:             return "Push";
        case HandResult::PLAYER_BLACKJACK: return "Player Blackjack";
        case HandResult::DEALER_BLACKJACK: return "Dealer Blackjack";
        case HandResult::PLAYER_SURRENDER: return "Player Surrender";
        default:                           return "UnknownResult";
    }
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << (cards[i] >= INVALID_CARD ? "--" : bj_solver::to_string(cards[i]));
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::string composition_to_string(const Composition& composition) {
    std::stringstream ss;
    for (Rank r : ALL_RANKS) {
        if (r != Rank::TWO) ss << " ";
        ss << bj_solver::to_string(r) << ":" << composition[rank_index(r)];
    }
    return ss.str();
}

std::string distribution_to_string(const DealerDistribution& distribution) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(4);
    bool first = true;
    for (const auto& [total, p] : distribution) {
        if (!first) ss << " ";
        first = false;
        if (total >= BUST_TOTAL) ss << "bust"; else ss << total;
        ss << ":" << p;
    }
    return ss.str();
}

} // namespace bj_solver
