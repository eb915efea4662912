#include "bj/card_counter.h"
#include "spdlog/spdlog.h"
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace bj_solver {

void CardCounter::reset(const Shoe& shoe) {
    reset(shoe.composition());
}

void CardCounter::reset(const Composition& composition) {
    for (int c : composition) {
        if (c < 0) throw std::invalid_argument("CardCounter::reset: composition négative.");
    }
    counts_ = composition;
    running_count_ = 0;
    true_count_ = 0.0;
    cards_seen_ = 0;
    initial_size_ = std::accumulate(counts_.begin(), counts_.end(), 0);
    spdlog::debug("CardCounter: reset sur {} cartes.", initial_size_);
}

void CardCounter::observe(Card card) {
    if (card >= INVALID_CARD) {
        throw std::invalid_argument("CardCounter::observe: carte invalide.");
    }
    int& remaining = counts_[rank_index(get_rank(card))];
    if (remaining <= 0) {
        throw std::logic_error("CardCounter::observe: plus aucun " + bj_solver::to_string(get_rank(card)) +
                               " dans la composition, " + bj_solver::to_string(card) + " observée en trop.");
    }
    --remaining;
    running_count_ += card_count_value(card);
    ++cards_seen_;
    update_true_count();
    spdlog::trace("CardCounter: {} observée, RC={}, TC={:.2f}", bj_solver::to_string(card), running_count_, true_count_);
}

void CardCounter::observe_all(const std::vector<Card>& cards) {
    for (Card c : cards) observe(c);
}

void CardCounter::check_consistency(const Shoe& shoe) const {
    const Composition& physical = shoe.composition();
    for (Rank r : ALL_RANKS) {
        const int i = rank_index(r);
        if (physical[i] != counts_[i]) {
            throw std::logic_error("CardCounter: divergence avec le sabot sur le rang " + bj_solver::to_string(r) +
                                   " (sabot " + std::to_string(physical[i]) +
                                   ", compteur " + std::to_string(counts_[i]) + ").");
        }
    }
}

void CardCounter::update_true_count() {
    const double decks = decks_remaining();
    true_count_ = decks > 0.0 ? running_count_ / decks : 0.0;
}

double CardCounter::decks_remaining() const {
    if (initial_size_ == 0) return 0.0;
    return cards_remaining() / static_cast<double>(CARDS_PER_DECK);
}

double CardCounter::penetration() const {
    if (initial_size_ == 0) return 0.0;
    return static_cast<double>(cards_seen_) / initial_size_;
}

double CardCounter::probability(Rank r) const {
    const int remaining = cards_remaining();
    if (remaining <= 0) return 0.0;
    return static_cast<double>(counts_[rank_index(r)]) / remaining;
}

double CardCounter::probability_of(std::initializer_list<Rank> ranks) const {
    double p = 0.0;
    for (Rank r : ranks) p += probability(r);
    return p;
}

double CardCounter::probability_ten_value() const {
    return probability_of({Rank::TEN, Rank::JACK, Rank::QUEEN, Rank::KING});
}

double CardCounter::probability_ace() const {
    return probability(Rank::ACE);
}

double CardCounter::probability_low_card() const {
    return probability_of({Rank::TWO, Rank::THREE, Rank::FOUR, Rank::FIVE, Rank::SIX});
}

double CardCounter::probability_high_card() const {
    return probability_of({Rank::TEN, Rank::JACK, Rank::QUEEN, Rank::KING, Rank::ACE});
}

std::string CardCounter::count_status() const {
    if (true_count_ >= 2.0)  return "Very Favorable";
    if (true_count_ >= 1.0)  return "Favorable";
    if (true_count_ >= 0.0)  return "Neutral";
    if (true_count_ >= -1.0) return "Unfavorable";
    return "Very Unfavorable";
}

// Politique de mise, pas une loi physique: les coefficients doivent rester exacts.
double CardCounter::betting_multiplier() const {
    if (true_count_ <= 0.0) return 1.0;
    if (true_count_ <= 2.0) return 1.0 + true_count_ * 0.5;
    return 2.0 + (true_count_ - 2.0) * 0.25;
}

std::string CardCounter::to_string() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "CardCounter(running=" << running_count_ << ", true=" << true_count_
       << ", decks=" << decks_remaining() << ")";
    return ss.str();
}

} // namespace bj_solver
