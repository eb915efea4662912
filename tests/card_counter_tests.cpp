#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <numeric>
#include <stdexcept>
#include <string>
#include "bj/card_counter.h"
#include "core/cards.hpp"
#include "core/shoe.hpp"

using namespace bj_solver;
using Catch::Matchers::WithinAbs;

static Card C(const std::string& s) { return card_from_string(s); }

// Composition "low" petites cartes (5) + "high" dix
static Composition low_high(int low, int high) {
    Composition comp{};
    comp[rank_index(Rank::FIVE)] = low;
    comp[rank_index(Rank::TEN)] = high;
    return comp;
}

TEST_CASE("CardCounter follows the shoe", "[CardCounter]") {
    Shoe shoe(2, 0, 0, 321);
    CardCounter counter;
    counter.reset(shoe);

    REQUIRE(counter.initial_size() == 104);
    REQUIRE(counter.cards_remaining() == 104);
    REQUIRE(counter.running_count() == 0);
    REQUIRE_THAT(counter.true_count(), WithinAbs(0.0, 1e-12));

    SECTION("Composition identique au sabot après chaque observation") {
        int expected_rc = 0;
        while (auto card = shoe.deal_card()) {
            counter.observe(*card);
            expected_rc += card_count_value(*card);
            REQUIRE_NOTHROW(counter.check_consistency(shoe));
            REQUIRE(counter.running_count() == expected_rc);
            REQUIRE(counter.cards_remaining() == shoe.cards_remaining());
            const Composition& comp = counter.composition();
            REQUIRE(std::accumulate(comp.begin(), comp.end(), 0) == counter.cards_remaining());
        }
        // Sabot équilibré entièrement vu
        REQUIRE(counter.running_count() == 0);
        REQUIRE(counter.cards_seen() == 104);
        REQUIRE_THAT(counter.penetration(), WithinAbs(1.0, 1e-12));
        // Sabot vide: TC et probabilités à 0
        REQUIRE_THAT(counter.true_count(), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.decks_remaining(), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.probability(Rank::ACE), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.probability_ten_value(), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.probability_low_card(), WithinAbs(0.0, 1e-12));
    }

    SECTION("Observation manquée détectée") {
        auto card = shoe.deal_card();
        REQUIRE(card.has_value());
        REQUIRE_THROWS_AS(counter.check_consistency(shoe), std::logic_error);
        counter.observe(*card);
        REQUIRE_NOTHROW(counter.check_consistency(shoe));
    }

    SECTION("Observation en double détectée") {
        auto card = shoe.deal_card();
        counter.observe(*card);
        counter.observe(*card);
        REQUIRE_THROWS_AS(counter.check_consistency(shoe), std::logic_error);
    }
}

TEST_CASE("CardCounter observe_all", "[CardCounter]") {
    CardCounter counter;
    counter.reset(low_high(4, 8));
    counter.observe_all({C("5c"), C("5d"), C("Ts")});
    REQUIRE(counter.cards_seen() == 3);
    REQUIRE(counter.card_count(Rank::FIVE) == 2);
    REQUIRE(counter.card_count(Rank::TEN) == 7);
    REQUIRE(counter.running_count() == 1);

    // Arrêt à la première carte en trop
    REQUIRE_THROWS_AS(counter.observe_all({C("5h"), C("5s"), C("5c")}), std::logic_error);
    REQUIRE(counter.card_count(Rank::FIVE) == 0);
}

TEST_CASE("CardCounter rejects negative compositions", "[CardCounter]") {
    CardCounter counter;
    counter.reset(low_high(1, 0));
    counter.observe(C("5h"));
    REQUIRE(counter.card_count(Rank::FIVE) == 0);
    REQUIRE_THROWS_AS(counter.observe(C("5d")), std::logic_error);
    REQUIRE_THROWS_AS(counter.observe(C("Kd")), std::logic_error);
    REQUIRE_THROWS_AS(counter.observe(INVALID_CARD), std::invalid_argument);

    Composition bad{};
    bad[0] = -1;
    REQUIRE_THROWS_AS(counter.reset(bad), std::invalid_argument);
}

TEST_CASE("CardCounter probabilities", "[CardCounter]") {
    CardCounter counter;

    SECTION("Paquet complet") {
        Shoe shoe(1, 0, 0, 5);
        counter.reset(shoe);
        REQUIRE_THAT(counter.probability(Rank::SEVEN), WithinAbs(4.0 / 52.0, 1e-12));
        REQUIRE_THAT(counter.probability_ten_value(), WithinAbs(16.0 / 52.0, 1e-12));
        REQUIRE_THAT(counter.probability_ace(), WithinAbs(4.0 / 52.0, 1e-12));
        REQUIRE_THAT(counter.probability_low_card(), WithinAbs(20.0 / 52.0, 1e-12));
        REQUIRE_THAT(counter.probability_high_card(), WithinAbs(20.0 / 52.0, 1e-12));

        double sum = 0.0;
        for (Rank r : ALL_RANKS) sum += counter.probability(r);
        REQUIRE_THAT(sum, WithinAbs(1.0, 1e-12));
    }

    SECTION("Après observations") {
        counter.reset(low_high(4, 8));
        counter.observe(C("Td"));
        counter.observe(C("Ts"));
        REQUIRE_THAT(counter.probability(Rank::TEN), WithinAbs(0.6, 1e-12));
        REQUIRE_THAT(counter.probability(Rank::FIVE), WithinAbs(0.4, 1e-12));
        REQUIRE(counter.running_count() == -2);
    }

    SECTION("Composition vide") {
        counter.reset(Composition{});
        REQUIRE(counter.cards_remaining() == 0);
        REQUIRE_THAT(counter.probability(Rank::TWO), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.true_count(), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.penetration(), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(counter.betting_multiplier(), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("CardCounter true count, status and betting multiplier", "[CardCounter]") {
    CardCounter counter;

    SECTION("TC = 0") {
        counter.reset(low_high(10, 17));
        REQUIRE(counter.count_status() == "Neutral");
        REQUIRE_THAT(counter.betting_multiplier(), WithinAbs(1.0, 1e-12));
    }

    SECTION("TC = 1") {
        // 53 cartes, une basse vue -> 52 restantes, RC 1
        counter.reset(low_high(20, 33));
        counter.observe(C("5c"));
        REQUIRE_THAT(counter.true_count(), WithinAbs(1.0, 1e-12));
        REQUIRE(counter.count_status() == "Favorable");
        REQUIRE_THAT(counter.betting_multiplier(), WithinAbs(1.5, 1e-12));
    }

    SECTION("TC = 2") {
        // 27 cartes, une basse vue -> 26 restantes (un demi-paquet), RC 1
        counter.reset(low_high(10, 17));
        counter.observe(C("5c"));
        REQUIRE_THAT(counter.decks_remaining(), WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(counter.true_count(), WithinAbs(2.0, 1e-12));
        REQUIRE(counter.count_status() == "Very Favorable");
        REQUIRE_THAT(counter.betting_multiplier(), WithinAbs(2.0, 1e-12));
    }

    SECTION("TC = 4") {
        counter.reset(low_high(10, 18));
        counter.observe(C("5c"));
        counter.observe(C("5d"));
        REQUIRE_THAT(counter.true_count(), WithinAbs(4.0, 1e-12));
        REQUIRE_THAT(counter.betting_multiplier(), WithinAbs(2.5, 1e-12));
    }

    SECTION("TC négatifs") {
        counter.reset(low_high(20, 33));
        counter.observe(C("Tc"));
        REQUIRE_THAT(counter.true_count(), WithinAbs(-1.0, 1e-12));
        REQUIRE(counter.count_status() == "Unfavorable");
        REQUIRE_THAT(counter.betting_multiplier(), WithinAbs(1.0, 1e-12));
        counter.observe(C("Tc"));
        REQUIRE(counter.count_status() == "Very Unfavorable");
    }
}
