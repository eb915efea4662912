#include "core/cards.hpp"
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace bj_solver {

namespace {

// Indexés par rank_index / valeur de Suit
constexpr std::string_view RANK_CHARS = "23456789TJQKA";
constexpr std::string_view SUIT_CHARS = "cdhs";

} // namespace

Rank rank_from_char(char r) {
    const auto pos = RANK_CHARS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
    }
    return static_cast<Rank>(pos);
}

Suit suit_from_char(char s) {
    const auto pos = SUIT_CHARS.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
    }
    return static_cast<Suit>(pos);
}

std::string to_string(Rank r) {
    const auto i = static_cast<size_t>(r);
    return i < RANK_CHARS.size() ? std::string(1, RANK_CHARS[i]) : "?";
}

std::string to_string(Suit s) {
    const auto i = static_cast<size_t>(s);
    return i < SUIT_CHARS.size() ? std::string(1, SUIT_CHARS[i]) : "?";
}

std::string to_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return to_string(get_rank(c)) + to_string(get_suit(c));
}

// "As", "Td", "9c"
Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string '" + s + "': expected rank + suit, e.g. 'Td'.");
    }
    try {
        return make_card(rank_from_char(s[0]), suit_from_char(s[1]));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

} // namespace bj_solver
