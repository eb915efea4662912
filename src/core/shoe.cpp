#include "core/shoe.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace bj_solver {

Shoe::Shoe(int num_decks, int cut_card_min, int cut_card_max)
    : Shoe(num_decks, cut_card_min, cut_card_max, std::random_device{}()) {}

Shoe::Shoe(int num_decks, int cut_card_min, int cut_card_max, uint32_t seed)
    : num_decks_(num_decks),
      cut_card_min_(cut_card_min),
      cut_card_max_(cut_card_max),
      rng_(seed)
{
    if (num_decks_ < 1) {
        throw std::invalid_argument("Shoe: num_decks must be >= 1 (got " + std::to_string(num_decks_) + ").");
    }
    if (cut_card_min_ < 0 || cut_card_min_ > cut_card_max_) {
        throw std::invalid_argument("Shoe: invalid cut card range [" + std::to_string(cut_card_min_) +
                                    ", " + std::to_string(cut_card_max_) + "].");
    }
    build();
    shuffle();
}

void Shoe::build() {
    cards_.clear();
    discarded_.clear();
    cards_.reserve(static_cast<size_t>(num_decks_) * CARDS_PER_DECK);
    for (int d = 0; d < num_decks_; ++d) {
        for (Suit s : ALL_SUITS) {
            for (Rank r : ALL_RANKS) {
                cards_.push_back(make_card(r, s));
            }
        }
    }
    total_cards_ = static_cast<int>(cards_.size());
    recount();
}

void Shoe::recount() {
    counts_.fill(0);
    for (Card c : cards_) counts_[rank_index(get_rank(c))]++;
}

void Shoe::draw_cut_position() {
    std::uniform_int_distribution<int> dist(cut_card_min_, cut_card_max_);
    cut_position_ = dist(rng_);
}

void Shoe::reset() {
    build();
    shuffle();
}

void Shoe::shuffle() {
    // Remélanger TOUT le sabot, défausse comprise
    cards_.insert(cards_.end(), discarded_.begin(), discarded_.end());
    discarded_.clear();
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    recount();
    draw_cut_position();
    spdlog::debug("Shoe: {} cartes mélangées, carte de coupe à {}.", cards_.size(), cut_position_);
}

std::optional<Card> Shoe::take_top() {
    if (cards_.empty()) {
        return std::nullopt;
    }
    Card c = cards_.back();
    cards_.pop_back();
    discarded_.push_back(c);
    counts_[rank_index(get_rank(c))]--;
    return c;
}

std::optional<Card> Shoe::deal_card() {
    return take_top();
}

std::optional<Card> Shoe::burn_card() {
    auto c = take_top();
    if (c) spdlog::debug("Shoe: carte brûlée {}.", to_string(*c));
    return c;
}

bool Shoe::should_shuffle() const {
    return cards_remaining() <= cut_position_;
}

double Shoe::decks_remaining() const {
    return cards_remaining() / static_cast<double>(CARDS_PER_DECK);
}

double Shoe::penetration() const {
    if (total_cards_ == 0) return 0.0;
    return static_cast<double>(total_cards_ - cards_remaining()) / total_cards_;
}

int Shoe::suit_count(Suit s) const {
    return static_cast<int>(std::count_if(cards_.begin(), cards_.end(),
                                          [s](Card c) { return get_suit(c) == s; }));
}

void Shoe::set_cards_for_testing(const std::vector<Card>& specific_cards) {
    for (Card c : specific_cards) {
        if (c >= INVALID_CARD) {
            throw std::invalid_argument("Shoe::set_cards_for_testing: carte invalide " + std::to_string(c) + ".");
        }
    }
    cards_ = specific_cards;
    discarded_.clear();
    total_cards_ = static_cast<int>(cards_.size());
    recount();
}

} // namespace bj_solver
