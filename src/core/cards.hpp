#ifndef BJ_CARDS_HPP
#define BJ_CARDS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <stdexcept> // Pour std::invalid_argument

namespace bj_solver {

// Une carte = index compact 0-51 (suit * 13 + rank)
using Card = uint8_t;

// Constante pour une carte invalide/inconnue
constexpr Card INVALID_CARD = 52;
constexpr int  NUM_RANKS    = 13;
constexpr int  NUM_SUITS    = 4;
constexpr int  CARDS_PER_DECK = 52;

// La couleur ne sert qu'à l'affichage
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };

// Ordre de déclaration uniquement (aucun ordre numérique requis)
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr std::array<Rank, NUM_RANKS> ALL_RANKS = {
    Rank::TWO, Rank::THREE, Rank::FOUR, Rank::FIVE, Rank::SIX, Rank::SEVEN, Rank::EIGHT,
    Rank::NINE, Rank::TEN, Rank::JACK, Rank::QUEEN, Rank::KING, Rank::ACE
};

constexpr std::array<Suit, NUM_SUITS> ALL_SUITS = {
    Suit::CLUBS, Suit::DIAMONDS, Suit::HEARTS, Suit::SPADES
};

constexpr int rank_index(Rank r) { return static_cast<int>(r); }

// Nombre de cartes restantes par rang, indexé par rank_index
using Composition = std::array<int, NUM_RANKS>;

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r));
}

constexpr Rank get_rank(Card c) {
    if (c >= INVALID_CARD) return static_cast<Rank>(13); // Hors enum
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    if (c >= INVALID_CARD) return static_cast<Suit>(4); // Hors enum
    return static_cast<Suit>(c / 13);
}

// Valeur de jeu: 2-9 nominale, figures = 10, As = 11
constexpr int rank_value(Rank r) {
    switch (r) {
        case Rank::ACE:   return 11;
        case Rank::TEN:
        case Rank::JACK:
        case Rank::QUEEN:
        case Rank::KING:  return 10;
        default:          return static_cast<int>(r) + 2;
    }
}

// Hi-Lo: +1 pour 2-6, 0 pour 7-9, -1 pour 10/figures/As
constexpr int rank_count_value(Rank r) {
    if (r <= Rank::SIX) return 1;
    if (r <= Rank::NINE) return 0;
    return -1;
}

constexpr bool is_ten_value(Rank r) {
    return r == Rank::TEN || r == Rank::JACK || r == Rank::QUEEN || r == Rank::KING;
}

constexpr bool is_ace(Card c)         { return get_rank(c) == Rank::ACE; }
constexpr int  card_value(Card c)     { return rank_value(get_rank(c)); }
constexpr int  card_count_value(Card c) { return rank_count_value(get_rank(c)); }

// As compté 1
constexpr int soft_value(Card c) { return is_ace(c) ? 1 : card_value(c); }

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

} // namespace bj_solver

#endif // BJ_CARDS_HPP
