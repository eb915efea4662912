#include "core/hand.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bj_solver {

Hand::Hand(std::vector<Card> cards)
    : cards_(std::move(cards))
{
    for (Card c : cards_) {
        if (c >= INVALID_CARD) {
            throw std::invalid_argument("Hand: carte invalide dans la main initiale.");
        }
    }
}

void Hand::add_card(Card card) {
    if (card >= INVALID_CARD) {
        throw std::invalid_argument("Hand::add_card: carte invalide.");
    }
    cards_.push_back(card);
}

Card Hand::pop_card() {
    if (cards_.empty()) {
        throw std::logic_error("Hand::pop_card: main vide.");
    }
    Card c = cards_.back();
    cards_.pop_back();
    return c;
}

void Hand::clear() {
    cards_.clear();
    doubled_ = false;
    surrendered_ = false;
}

int Hand::soft_total() const {
    int sum = 0;
    for (Card c : cards_) sum += soft_value(c);
    return sum;
}

int Hand::total() const {
    int sum = soft_total();
    const int aces = static_cast<int>(std::count_if(cards_.begin(), cards_.end(), [](Card c) { return is_ace(c); }));
    for (int i = 0; i < aces; ++i) {
        if (sum + 10 > 21) break;
        sum += 10;
    }
    return sum;
}

bool Hand::has_ace() const {
    return std::any_of(cards_.begin(), cards_.end(), [](Card c) { return is_ace(c); });
}

// Test sur le total entièrement réduit: [A, A, 9] -> 11 + 10 <= 21 -> soft
bool Hand::is_soft() const {
    if (!has_ace()) return false;
    return total() <= 21 && soft_total() + 10 <= 21;
}

bool Hand::is_blackjack() const {
    return num_cards() == 2 && total() == 21 && has_ace();
}

bool Hand::can_split() const {
    return num_cards() == 2 && get_rank(cards_[0]) == get_rank(cards_[1]);
}

std::string Hand::to_string(bool hide_first) const {
    std::stringstream ss;
    for (size_t i = 0; i < cards_.size(); ++i) {
        if (i > 0) ss << " ";
        if (i == 0 && hide_first) {
            ss << "[XX]";
        } else {
            ss << bj_solver::to_string(cards_[i]);
        }
    }
    return ss.str();
}

} // namespace bj_solver
