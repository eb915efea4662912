#ifndef BJ_GAME_UTILS_HPP
#define BJ_GAME_UTILS_HPP

#include "bj/game_state.h" // Pour Phase et HandResult
#include "bj/common_types.h"
#include <string>
#include <vector>
#include "core/cards.hpp" // Pour Card et to_string(Card)

namespace bj_solver {

std::string phase_to_string(Phase p);
std::string result_to_string(HandResult r);

std::string vec_to_string(const std::vector<Card>& cards);

// "2:4 3:4 ... A:4"
std::string composition_to_string(const Composition& composition);

// "17:0.1450 ... bust:0.2800"
std::string distribution_to_string(const DealerDistribution& distribution);

} // namespace bj_solver

#endif // BJ_GAME_UTILS_HPP
