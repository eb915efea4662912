#include "bj/game_state.h"
#include "bj/game_utils.hpp"          // Pour phase_to_string
#include "spdlog/spdlog.h"             // Logging
#include <stdexcept>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <cstddef>

namespace bj_solver {

// -----------------------------------------------------------------------------
//  Constructeurs
// -----------------------------------------------------------------------------
GameState::GameState(const GameRules& rules)
    : rules_   ((validate_rules(rules), rules)),
      shoe_    (rules.num_decks, rules.cut_card_min, rules.cut_card_max),
      counter_ (),
      engine_  (counter_, rules_),
      bankroll_(rules.initial_bankroll)
{
    counter_.reset(shoe_);
    spdlog::debug("GameState initialisé: {} paquets, bankroll {:.2f}", rules_.num_decks, bankroll_);
}

GameState::GameState(const GameRules& rules, uint32_t seed)
    : rules_   ((validate_rules(rules), rules)),
      shoe_    (rules.num_decks, rules.cut_card_min, rules.cut_card_max, seed),
      counter_ (),
      engine_  (counter_, rules_),
      bankroll_(rules.initial_bankroll)
{
    counter_.reset(shoe_);
    spdlog::debug("GameState initialisé: {} paquets, bankroll {:.2f}, seed {}", rules_.num_decks, bankroll_, seed);
}

// -----------------------------------------------------------------------------
//  Tirage: point de passage unique sabot -> compteur
// -----------------------------------------------------------------------------
std::optional<Card> GameState::draw_card() {
    auto card = shoe_.deal_card();
    if (!card) {
        spdlog::warn("GameState: sabot vide, aucune carte distribuée.");
        return std::nullopt;
    }
    counter_.observe(*card);
    counter_.check_consistency(shoe_);
    spdlog::debug("GameState: carte {} distribuée ({} restantes).", to_string(*card), shoe_.cards_remaining());
    return card;
}

Card GameState::draw_card_or_throw() {
    auto card = draw_card();
    if (!card) throw std::runtime_error("GameState: sabot vide pendant la distribution initiale.");
    return *card;
}

// -----------------------------------------------------------------------------
//  Mise et distribution
// -----------------------------------------------------------------------------
bool GameState::place_bet(double amount) {
    if (phase_ != Phase::BETTING) return false;
    if (amount < rules_.min_bet || amount > rules_.max_bet) {
        spdlog::debug("GameState: mise {:.2f} hors limites [{:.2f}, {:.2f}].", amount, rules_.min_bet, rules_.max_bet);
        return false;
    }
    if (amount > bankroll_) {
        spdlog::debug("GameState: mise {:.2f} supérieure à la bankroll {:.2f}.", amount, bankroll_);
        return false;
    }
    pending_bet_ = amount;
    bankroll_ -= amount;
    phase_ = Phase::DEALING;
    return true;
}

bool GameState::deal_initial_cards() {
    if (phase_ != Phase::DEALING) return false;

    // Brûlée + deux cartes chacun
    constexpr int CARDS_FOR_DEAL = 5;
    const bool short_shoe = shoe_.cards_remaining() < CARDS_FOR_DEAL;
    if (short_shoe &&
        shoe_.cards_remaining() + static_cast<int>(shoe_.discarded_cards().size()) < CARDS_FOR_DEAL) {
        spdlog::warn("GameState: {} cartes au total, distribution impossible.", shoe_.cards_remaining());
        return false;
    }

    if (shoe_.should_shuffle() || short_shoe) {
        shoe_.shuffle();
        counter_.reset(shoe_);
        spdlog::info("GameState: sabot remélangé ({} cartes).", shoe_.cards_remaining());
    }
    ++hand_id_;

    // Carte brûlée (pratique de casino), comptée comme les autres
    if (auto burned = shoe_.burn_card()) {
        counter_.observe(*burned);
        counter_.check_consistency(shoe_);
    }

    player_hands_.assign(1, Hand());
    hand_bets_.assign(1, pending_bet_);
    dealer_hand_.clear();
    current_hand_index_ = 0;
    last_results_.clear();

    for (int round = 0; round < 2; ++round) {
        for (auto& hand : player_hands_) {
            hand.add_card(draw_card_or_throw());
        }
        dealer_hand_.add_card(draw_card_or_throw());
    }

    // La carte visible est la seconde du croupier
    if (is_ace(get_dealer_up_card())) {
        phase_ = Phase::INSURANCE;
        return true;
    }
    resolve_naturals();
    return true;
}

void GameState::resolve_naturals() {
    if (dealer_hand_.is_blackjack() || player_hands_[0].is_blackjack()) {
        phase_ = Phase::GAME_OVER;
        settle();
        return;
    }
    phase_ = Phase::PLAYER_TURN;
}

// -----------------------------------------------------------------------------
//  Actions du joueur
// -----------------------------------------------------------------------------
void GameState::advance_hand() {
    if (current_hand_index_ + 1 < player_hands_.size()) {
        ++current_hand_index_;
    } else {
        phase_ = Phase::DEALER_TURN;
    }
}

bool GameState::hit() {
    if (phase_ != Phase::PLAYER_TURN) return false;
    Hand& hand = player_hands_[current_hand_index_];
    if (hand.is_bust() || hand.is_doubled()) return false;

    auto card = draw_card();
    if (!card) return false;
    hand.add_card(*card);

    if (hand.is_bust()) advance_hand();
    return true;
}

bool GameState::stand() {
    if (phase_ != Phase::PLAYER_TURN) return false;
    advance_hand();
    return true;
}

bool GameState::double_down() {
    if (phase_ != Phase::PLAYER_TURN) return false;
    Hand& hand = player_hands_[current_hand_index_];
    if (!hand.can_double()) return false;
    if (player_hands_.size() > 1 && !rules_.double_after_split) {
        spdlog::debug("GameState: double après split interdit par les règles.");
        return false;
    }
    const double bet = hand_bets_[current_hand_index_];
    if (bet > bankroll_) return false;
    if (shoe_.cards_remaining() < 1) return false;

    bankroll_ -= bet;
    hand_bets_[current_hand_index_] = 2.0 * bet;
    hand.add_card(draw_card_or_throw());
    hand.mark_doubled();
    advance_hand();
    return true;
}

bool GameState::split() {
    if (phase_ != Phase::PLAYER_TURN) return false;
    if (!player_hands_[current_hand_index_].can_split()) return false;
    const double bet = hand_bets_[current_hand_index_];
    if (bet > bankroll_) return false;
    if (shoe_.cards_remaining() < 2) return false;

    const Card split_card = player_hands_[current_hand_index_].pop_card();
    player_hands_.insert(player_hands_.begin() + static_cast<std::ptrdiff_t>(current_hand_index_) + 1,
                         Hand(std::vector<Card>{split_card}));
    hand_bets_.insert(hand_bets_.begin() + static_cast<std::ptrdiff_t>(current_hand_index_) + 1, bet);
    bankroll_ -= bet;

    for (size_t i = 0; i < 2; ++i) {
        player_hands_[current_hand_index_ + i].add_card(draw_card_or_throw());
    }
    spdlog::debug("GameState: split, {} mains en jeu.", player_hands_.size());
    return true;
}

bool GameState::surrender() {
    if (phase_ != Phase::PLAYER_TURN) return false;
    if (!rules_.surrender_allowed) return false;
    Hand& hand = player_hands_[current_hand_index_];
    if (hand.num_cards() != 2) return false;
    hand.mark_surrendered();
    advance_hand();
    return true;
}

bool GameState::place_insurance(double amount) {
    if (phase_ != Phase::INSURANCE) return false;
    if (amount <= 0.0 || amount > bankroll_) return false;
    if (amount > hand_bets_[0] / 2.0) return false; // Limitée à la moitié de la mise
    insurance_bet_ = amount;
    bankroll_ -= amount;
    resolve_naturals();
    return true;
}

bool GameState::decline_insurance() {
    if (phase_ != Phase::INSURANCE) return false;
    resolve_naturals();
    return true;
}

// -----------------------------------------------------------------------------
//  Croupier
// -----------------------------------------------------------------------------
bool GameState::dealer_must_draw() const {
    const int total = dealer_hand_.total();
    return total < 17 || (rules_.dealer_hits_soft_17 && total == 17 && dealer_hand_.is_soft());
}

bool GameState::has_active_hands() const {
    return std::any_of(player_hands_.begin(), player_hands_.end(),
                       [](const Hand& h) { return !h.is_bust() && !h.is_surrendered(); });
}

void GameState::finish_dealer_turn() {
    phase_ = Phase::GAME_OVER;
    settle();
}

void GameState::play_dealer_hand() {
    if (phase_ != Phase::DEALER_TURN) return;
    if (has_active_hands()) {
        while (dealer_must_draw()) {
            auto card = draw_card();
            if (!card) break;
            dealer_hand_.add_card(*card);
        }
    }
    finish_dealer_turn();
}

bool GameState::play_dealer_step(uint64_t hand_id) {
    if (hand_id != hand_id_) {
        spdlog::debug("GameState: rappel périmé ignoré (main {} , courante {}).", hand_id, hand_id_);
        return false;
    }
    if (phase_ != Phase::DEALER_TURN) return false;

    if (!has_active_hands() || !dealer_must_draw()) {
        finish_dealer_turn();
        return true;
    }
    auto card = draw_card();
    if (!card) {
        finish_dealer_turn();
        return true;
    }
    dealer_hand_.add_card(*card);
    if (!dealer_must_draw()) finish_dealer_turn();
    return true;
}

// -----------------------------------------------------------------------------
//  Règlement
// -----------------------------------------------------------------------------
std::vector<HandOutcome> GameState::compute_results() const {
    std::vector<HandOutcome> results;
    const bool dealer_bj = dealer_hand_.is_blackjack();
    const double bj_multiplier = rules_.blackjack_pays_3_to_2 ? 2.5 : 2.0;

    for (size_t i = 0; i < player_hands_.size(); ++i) {
        const Hand& hand = player_hands_[i];
        const double bet = hand_bets_[i];
        HandOutcome o{hand, HandResult::PUSH, 0.0};

        if (hand.is_surrendered()) {
            o.result = HandResult::PLAYER_SURRENDER; o.payout = 0.5 * bet;
        } else if (hand.is_bust()) {
            o.result = HandResult::DEALER_WIN;
        } else if (hand.is_blackjack()) {
            if (dealer_bj) { o.result = HandResult::PUSH; o.payout = bet; }
            else           { o.result = HandResult::PLAYER_BLACKJACK; o.payout = bet * bj_multiplier; }
        } else if (dealer_bj) {
            o.result = HandResult::DEALER_BLACKJACK;
        } else if (dealer_hand_.is_bust() || hand.total() > dealer_hand_.total()) {
            o.result = HandResult::PLAYER_WIN; o.payout = 2.0 * bet;
        } else if (hand.total() < dealer_hand_.total()) {
            o.result = HandResult::DEALER_WIN;
        } else {
            o.result = HandResult::PUSH; o.payout = bet;
        }
        results.push_back(o);
    }
    return results;
}

void GameState::settle() {
    last_results_ = compute_results();

    double total_payout = 0.0;
    if (insurance_bet_ > 0.0 && dealer_hand_.is_blackjack()) {
        total_payout += 3.0 * insurance_bet_; // 2:1 + mise
    }
    for (const auto& o : last_results_) {
        total_payout += o.payout;
        switch (o.result) {
            case HandResult::PLAYER_WIN:
            case HandResult::PLAYER_BLACKJACK: ++games_won_; break;
            case HandResult::DEALER_WIN:
            case HandResult::DEALER_BLACKJACK: ++games_lost_; break;
            case HandResult::PUSH:             ++games_pushed_; break;
            case HandResult::PLAYER_SURRENDER: break;
        }
        spdlog::info("Main {} : {} -> {} (paiement {:.2f})", hand_id_, o.hand.to_string(),
                     result_to_string(o.result), o.payout);
    }
    bankroll_ += total_payout;
    ++games_played_;
    insurance_bet_ = 0.0;
}

void GameState::start_new_hand() {
    ++hand_id_;
    phase_ = Phase::BETTING;
    pending_bet_ = 0.0;
    insurance_bet_ = 0.0;
    player_hands_.clear();
    hand_bets_.clear();
    dealer_hand_.clear();
    current_hand_index_ = 0;
    last_results_.clear();
}

// -----------------------------------------------------------------------------
//  Accesseurs
// -----------------------------------------------------------------------------
double GameState::get_total_wager() const {
    double sum = 0.0;
    for (double b : hand_bets_) sum += b;
    return sum;
}

double GameState::get_hand_bet(size_t hand_index) const {
    if (hand_index >= hand_bets_.size()) throw std::out_of_range("GameState: index de main invalide.");
    return hand_bets_[hand_index];
}

Card GameState::get_dealer_up_card() const {
    if (dealer_hand_.num_cards() < 2) return INVALID_CARD;
    return dealer_hand_.cards()[1];
}

bool GameState::has_current_hand() const {
    return current_hand_index_ < player_hands_.size();
}

const Hand& GameState::get_current_hand() const {
    if (!has_current_hand()) throw std::out_of_range("GameState: aucune main courante.");
    return player_hands_[current_hand_index_];
}

double GameState::get_win_rate() const {
    if (games_played_ == 0) return 0.0;
    return static_cast<double>(games_won_) / games_played_;
}

std::optional<Recommendation> GameState::strategy_recommendation() const {
    if (phase_ != Phase::PLAYER_TURN || !has_current_hand()) return std::nullopt;
    const Card up = get_dealer_up_card();
    if (up == INVALID_CARD) return std::nullopt;
    return engine_.recommend(get_current_hand(), up);
}

std::optional<InsuranceRecommendation> GameState::insurance_recommendation() const {
    if (phase_ != Phase::INSURANCE) return std::nullopt;
    return engine_.insurance_recommendation();
}

void GameState::set_shoe_for_testing(const std::vector<Card>& cards) {
    shoe_.set_cards_for_testing(cards);
    counter_.reset(shoe_);
}

std::string GameState::toString() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "Phase: " << phase_to_string(phase_) << " | Main #" << hand_id_
       << " | Bankroll: " << bankroll_ << "\n";
    ss << "Sabot: " << shoe_.cards_remaining() << " cartes | " << counter_.to_string()
       << " | " << counter_.count_status() << "\n";
    if (!dealer_hand_.empty()) {
        ss << "Croupier: " << dealer_hand_.to_string(phase_ != Phase::GAME_OVER) << "\n";
    }
    for (size_t i = 0; i < player_hands_.size(); ++i) {
        ss << (i == current_hand_index_ ? "-> " : "   ")
           << "Joueur: " << player_hands_[i].to_string()
           << " (total " << player_hands_[i].total() << ", mise " << hand_bets_[i] << ")\n";
    }
    return ss.str();
}

} // namespace bj_solver
