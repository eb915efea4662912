#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "core/cards.hpp"
#include <string>

using namespace bj_solver;

TEST_CASE("Card Creation and Properties", "[cards]") {
    Card ac = make_card(Rank::ACE, Suit::CLUBS);
    Card kd = make_card(Rank::KING, Suit::DIAMONDS);
    Card _2s = make_card(Rank::TWO, Suit::SPADES);

    SECTION("Card ranks and suits are correct") {
        REQUIRE(get_rank(ac) == Rank::ACE);
        REQUIRE(get_suit(ac) == Suit::CLUBS);
        REQUIRE(get_rank(kd) == Rank::KING);
        REQUIRE(get_suit(kd) == Suit::DIAMONDS);
        REQUIRE(get_rank(_2s) == Rank::TWO);
        REQUIRE(get_suit(_2s) == Suit::SPADES);
    }

    SECTION("Indices compacts 0-51 distincts") {
        REQUIRE(make_card(Rank::TWO, Suit::CLUBS) == 0);
        REQUIRE(make_card(Rank::ACE, Suit::SPADES) == 51);
        REQUIRE(ac != make_card(Rank::ACE, Suit::DIAMONDS));
    }

    SECTION("Cartes invalides") {
        REQUIRE(get_rank(INVALID_CARD) != Rank::ACE);
        REQUIRE_FALSE(is_ace(INVALID_CARD));
    }
}

TEST_CASE("Card String Conversions", "[cards][string]") {
    SECTION("to_string conversions") {
        REQUIRE(to_string(make_card(Rank::ACE, Suit::SPADES)) == "As");
        REQUIRE(to_string(make_card(Rank::TEN, Suit::DIAMONDS)) == "Td");
        REQUIRE(to_string(make_card(Rank::TWO, Suit::CLUBS)) == "2c");
        REQUIRE(to_string(INVALID_CARD) == "??");
        REQUIRE(to_string(Rank::QUEEN) == "Q");
        REQUIRE(to_string(Suit::HEARTS) == "h");
    }

    SECTION("card_from_string conversions") {
        REQUIRE(card_from_string("As") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("Td") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("2c") == make_card(Rank::TWO, Suit::CLUBS));
        REQUIRE(card_from_string("kH") == make_card(Rank::KING, Suit::HEARTS)); // Casse tolérée
    }

    SECTION("card_from_string invalid inputs") {
        REQUIRE_THROWS_AS(card_from_string("XX"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("A"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("1c"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("Ahx"), std::invalid_argument);
        REQUIRE_THROWS_AS(rank_from_char('Z'), std::invalid_argument);
        REQUIRE_THROWS_AS(suit_from_char('x'), std::invalid_argument);
    }
}

TEST_CASE("Blackjack Card Values", "[cards][values]") {
    SECTION("Valeurs de jeu") {
        REQUIRE(rank_value(Rank::TWO) == 2);
        REQUIRE(rank_value(Rank::NINE) == 9);
        REQUIRE(rank_value(Rank::TEN) == 10);
        REQUIRE(rank_value(Rank::JACK) == 10);
        REQUIRE(rank_value(Rank::KING) == 10);
        REQUIRE(rank_value(Rank::ACE) == 11);
        REQUIRE(soft_value(card_from_string("Ah")) == 1);
        REQUIRE(soft_value(card_from_string("7h")) == 7);
    }

    SECTION("Hi-Lo") {
        int total = 0;
        for (Rank r : ALL_RANKS) {
            const int v = rank_count_value(r);
            if (r <= Rank::SIX) REQUIRE(v == 1);
            else if (r <= Rank::NINE) REQUIRE(v == 0);
            else REQUIRE(v == -1);
            total += v;
        }
        // Paquet équilibré: 5 basses, 5 hautes
        REQUIRE(total == 0);
        REQUIRE(card_count_value(card_from_string("Ac")) == -1);
        REQUIRE(card_count_value(card_from_string("5c")) == 1);
    }

    SECTION("Figures comptent comme des dix") {
        REQUIRE(is_ten_value(Rank::TEN));
        REQUIRE(is_ten_value(Rank::QUEEN));
        REQUIRE_FALSE(is_ten_value(Rank::ACE));
        REQUIRE_FALSE(is_ten_value(Rank::NINE));
    }
}
