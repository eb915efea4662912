#ifndef BJ_COMMON_TYPES_H
#define BJ_COMMON_TYPES_H

#include <map>

namespace bj_solver {

// Actions du joueur. L'ordre de déclaration sert de départage entre EV égales.
enum class Action {
    HIT,
    STAND,
    DOUBLE,
    SPLIT,
    SURRENDER
};

// Rôle pour les probabilités de bust
enum class Role {
    PLAYER,
    DEALER
};

// Total final du croupier -> probabilité. BUST_TOTAL regroupe tous les totaux > 21.
constexpr int BUST_TOTAL = 22;
using DealerDistribution = std::map<int, double>;

// EV par action disponible
using ActionEVMap = std::map<Action, double>;

struct Recommendation {
    Action      optimal_action = Action::STAND;
    double      optimal_ev     = 0.0;
    Action      basic_action   = Action::STAND;
    double      basic_ev       = 0.0;
    double      ev_difference  = 0.0;
    bool        count_advantage = false;
    ActionEVMap action_evs;
};

struct InsuranceRecommendation {
    bool   should_take_insurance        = false;
    double insurance_ev                 = 0.0;
    double basic_ev                     = 0.0; // Ne jamais assurer: EV 0
    double dealer_blackjack_probability = 0.0;
    bool   count_advantage              = false;
};

inline const char* action_to_string(Action a) {
    switch (a) {
        case Action::HIT:       return "HIT";
        case Action::STAND:     return "STAND";
        case Action::DOUBLE:    return "DOUBLE";
        case Action::SPLIT:     return "SPLIT";
        case Action::SURRENDER: return "SURRENDER";
        default:                return "UNKNOWN_ACTION";
    }
}

} // namespace bj_solver

#endif // BJ_COMMON_TYPES_H
