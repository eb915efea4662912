#ifndef BJ_BASIC_STRATEGY_H
#define BJ_BASIC_STRATEGY_H

#include "bj/common_types.h"
#include "core/cards.hpp"
#include "core/hand.hpp"

namespace bj_solver {

// Table de stratégie de base fixe, indépendante du comptage.
// Sert uniquement de référence de comparaison.
Action basic_action(const Hand& player_hand, Card dealer_up_card);

} // namespace bj_solver

#endif // BJ_BASIC_STRATEGY_H
