#include "bj/basic_strategy.h"
#include "core/cards.hpp"
#include "core/hand.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bj_solver;

static Card C(const std::string& s) { return card_from_string(s); }

static Hand H(const std::vector<std::string>& cards) {
    Hand h;
    for (const auto& s : cards) h.add_card(C(s));
    return h;
}

// Carte visible par valeur (11 = As)
static Card up(int value) {
    if (value == 11) return make_card(Rank::ACE, Suit::HEARTS);
    if (value == 10) return make_card(Rank::KING, Suit::HEARTS);
    return make_card(static_cast<Rank>(value - 2), Suit::HEARTS);
}

TEST_CASE("Basic strategy pairs", "[BasicStrategy]") {
    SECTION("As et 8 toujours splittés") {
        for (int u = 2; u <= 11; ++u) {
            REQUIRE(basic_action(H({"As", "Ad"}), up(u)) == Action::SPLIT);
            REQUIRE(basic_action(H({"8s", "8d"}), up(u)) == Action::SPLIT);
        }
    }

    SECTION("Paires conditionnelles") {
        struct Case { std::vector<std::string> hand; int lo; int hi; };
        const std::vector<Case> ranges = {
            {{"Ts", "Td"}, 5, 6}, {{"6s", "6d"}, 2, 6}, {{"5s", "5d"}, 2, 9},
            {{"4s", "4d"}, 5, 6}, {{"7s", "7d"}, 2, 7}, {{"3s", "3d"}, 2, 7},
            {{"2s", "2d"}, 2, 7}
        };
        for (const auto& c : ranges) {
            for (int u = 2; u <= 11; ++u) {
                const bool split = u >= c.lo && u <= c.hi;
                REQUIRE((basic_action(H(c.hand), up(u)) == Action::SPLIT) == split);
            }
        }
    }

    SECTION("Neuf: 2-6 et 8-9") {
        for (int u = 2; u <= 11; ++u) {
            const bool split = (u >= 2 && u <= 6) || u == 8 || u == 9;
            REQUIRE((basic_action(H({"9s", "9d"}), up(u)) == Action::SPLIT) == split);
        }
        // 9-9 contre 7: 18 dur, stand
        REQUIRE(basic_action(H({"9s", "9d"}), up(7)) == Action::STAND);
    }

    SECTION("Figures différentes: pas une paire") {
        REQUIRE(basic_action(H({"Ks", "Qd"}), up(5)) == Action::STAND);
        REQUIRE(basic_action(H({"Ks", "Kd"}), up(5)) == Action::SPLIT);
    }
}

TEST_CASE("Basic strategy soft totals", "[BasicStrategy]") {
    for (int u = 2; u <= 11; ++u) {
        REQUIRE(basic_action(H({"As", "8d"}), up(u)) == Action::STAND);
        REQUIRE(basic_action(H({"As", "9d"}), up(u)) == Action::STAND);
        REQUIRE(basic_action(H({"As", "6d"}), up(u)) == Action::HIT);
        REQUIRE(basic_action(H({"As", "7d"}), up(u)) == (u >= 9 ? Action::HIT : Action::STAND));
    }
    // Soft 18 à trois cartes
    REQUIRE(basic_action(H({"As", "3d", "4c"}), up(10)) == Action::HIT);
    REQUIRE(basic_action(H({"As", "3d", "4c"}), up(6)) == Action::STAND);
}

TEST_CASE("Basic strategy hard totals", "[BasicStrategy]") {
    for (int u = 2; u <= 11; ++u) {
        REQUIRE(basic_action(H({"Ts", "7d"}), up(u)) == Action::STAND);
        REQUIRE(basic_action(H({"Ts", "6d"}), up(u)) == (u >= 7 ? Action::HIT : Action::STAND));
        REQUIRE(basic_action(H({"Ts", "5d"}), up(u)) == (u >= 10 ? Action::HIT : Action::STAND));
        REQUIRE(basic_action(H({"Ts", "4d"}), up(u)) == (u <= 6 ? Action::STAND : Action::HIT));
        REQUIRE(basic_action(H({"Ts", "3d"}), up(u)) == (u <= 6 ? Action::STAND : Action::HIT));
        REQUIRE(basic_action(H({"Ts", "2d"}), up(u)) == (u >= 4 && u <= 6 ? Action::STAND : Action::HIT));
        REQUIRE(basic_action(H({"6s", "5d"}), up(u)) == Action::HIT);
    }
    // As rétrogradé: 16 dur
    REQUIRE(basic_action(H({"As", "5d", "Tc"}), up(10)) == Action::HIT);
}

TEST_CASE("Basic strategy invalid inputs", "[BasicStrategy]") {
    REQUIRE_THROWS_AS(basic_action(Hand(), up(10)), std::invalid_argument);
    REQUIRE_THROWS_AS(basic_action(H({"Ts", "7d"}), INVALID_CARD), std::invalid_argument);
}
