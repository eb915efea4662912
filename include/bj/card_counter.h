#ifndef BJ_CARD_COUNTER_H
#define BJ_CARD_COUNTER_H

#include "core/cards.hpp"
#include "core/shoe.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace bj_solver {

// Suivi de la composition exacte du sabot + comptage Hi-Lo.
// observe() doit être appelé une et une seule fois par carte physique retirée
// (brûlée, distribuée, tirée, doublée, distribuée après split).
class CardCounter {
public:
    CardCounter() = default;

    // Instantané du contenu physique actuel du sabot; comptes remis à zéro.
    void reset(const Shoe& shoe);
    void reset(const Composition& composition);

    // Lance std::logic_error si le rang est déjà épuisé (observe manqué ou doublé).
    void observe(Card card);
    void observe_all(const std::vector<Card>& cards);

    // Lance std::logic_error si la composition diverge de celle du sabot.
    void check_consistency(const Shoe& shoe) const;

    int running_count() const { return running_count_; }
    double true_count() const { return true_count_; }
    double decks_remaining() const;
    double penetration() const;

    int card_count(Rank r) const { return counts_[rank_index(r)]; }
    const Composition& composition() const { return counts_; }
    int cards_remaining() const { return initial_size_ - cards_seen_; }
    int cards_seen() const { return cards_seen_; }
    int initial_size() const { return initial_size_; }

    // Sabot vide -> 0.0
    double probability(Rank r) const;
    double probability_ten_value() const;
    double probability_ace() const;
    double probability_low_card() const;   // 2-6
    double probability_high_card() const;  // 10-A

    std::string count_status() const;
    double betting_multiplier() const;

    std::string to_string() const;

private:
    int         running_count_ = 0;
    double      true_count_    = 0.0;
    Composition counts_{};
    int         cards_seen_    = 0;
    int         initial_size_  = 0;

    void update_true_count();
    double probability_of(std::initializer_list<Rank> ranks) const;
};

} // namespace bj_solver

#endif // BJ_CARD_COUNTER_H
