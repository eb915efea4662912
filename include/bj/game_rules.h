#ifndef BJ_GAME_RULES_H
#define BJ_GAME_RULES_H

#include <stdexcept>
#include <string>

namespace bj_solver {

// Règles de table. Le moteur lit dealer_hits_soft_17 et surrender_allowed,
// l'orchestrateur lit l'ensemble.
struct GameRules {
    int    num_decks             = 6;
    double min_bet               = 10.0;
    double max_bet               = 1000.0;
    double initial_bankroll      = 1000.0;
    bool   dealer_hits_soft_17   = true;
    bool   double_after_split    = true;
    bool   surrender_allowed     = true;
    bool   blackjack_pays_3_to_2 = true;
    int    cut_card_min          = 60;
    int    cut_card_max          = 75;
};

inline void validate_rules(const GameRules& rules) {
    if (rules.num_decks < 1) {
        throw std::invalid_argument("GameRules: num_decks must be >= 1.");
    }
    if (rules.min_bet <= 0.0 || rules.min_bet > rules.max_bet) {
        throw std::invalid_argument("GameRules: invalid bet range [" + std::to_string(rules.min_bet) +
                                    ", " + std::to_string(rules.max_bet) + "].");
    }
    if (rules.initial_bankroll < 0.0) {
        throw std::invalid_argument("GameRules: initial_bankroll must be >= 0.");
    }
    if (rules.cut_card_min < 0 || rules.cut_card_min > rules.cut_card_max) {
        throw std::invalid_argument("GameRules: invalid cut card range.");
    }
}

} // namespace bj_solver

#endif // BJ_GAME_RULES_H
