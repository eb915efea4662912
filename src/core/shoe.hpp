#ifndef BJ_CORE_SHOE_HPP
#define BJ_CORE_SHOE_HPP

#include "core/cards.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace bj_solver {

// Sabot multi-paquets. Les compteurs par rang sont tenus ici indépendamment
// du CardCounter; les deux doivent concorder après chaque retrait.
class Shoe {
public:
    static constexpr int DEFAULT_CUT_MIN = 60;
    static constexpr int DEFAULT_CUT_MAX = 75;

    explicit Shoe(int num_decks = 6,
                  int cut_card_min = DEFAULT_CUT_MIN,
                  int cut_card_max = DEFAULT_CUT_MAX);
    Shoe(int num_decks, int cut_card_min, int cut_card_max, uint32_t seed);
    ~Shoe() = default;

    // Retire la dernière carte (LIFO); vide -> std::nullopt
    std::optional<Card> deal_card();
    std::optional<Card> burn_card();

    // Remélange toutes les cartes (défausse comprise) et replace la carte de coupe
    void shuffle();
    void reset();

    int cut_card_position() const { return cut_position_; }
    bool should_shuffle() const;

    int num_decks() const { return num_decks_; }
    int cards_remaining() const { return static_cast<int>(cards_.size()); }
    int total_cards() const { return total_cards_; }
    double decks_remaining() const;
    double penetration() const;

    int card_count(Rank r) const { return counts_[rank_index(r)]; }
    int suit_count(Suit s) const;
    const Composition& composition() const { return counts_; }
    const std::vector<Card>& cards() const { return cards_; }
    const std::vector<Card>& discarded_cards() const { return discarded_; }

    // Remplace le contenu du sabot (ordre conservé, la dernière carte sort en premier)
    void set_cards_for_testing(const std::vector<Card>& specific_cards);

private:
    int               num_decks_;
    int               cut_card_min_;
    int               cut_card_max_;
    int               cut_position_ = 0;
    int               total_cards_ = 0;
    std::vector<Card> cards_;
    std::vector<Card> discarded_;
    Composition       counts_{};
    std::mt19937      rng_;

    void build();
    void recount();
    void draw_cut_position();
    std::optional<Card> take_top();
};

} // namespace bj_solver

#endif // BJ_CORE_SHOE_HPP
