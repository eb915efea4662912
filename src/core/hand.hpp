#ifndef BJ_HAND_HPP
#define BJ_HAND_HPP

#include "core/cards.hpp"
#include <string>
#include <vector>

namespace bj_solver {

// Main de blackjack: séquence ordonnée de cartes + drapeaux doublée/abandonnée.
// Aucune I/O, uniquement des requêtes dérivées.
class Hand {
public:
    Hand() = default;
    explicit Hand(std::vector<Card> cards); // Pré-remplie (après un split)

    void add_card(Card card);
    Card pop_card();
    void clear();

    const std::vector<Card>& cards() const { return cards_; }
    int num_cards() const { return static_cast<int>(cards_.size()); }
    bool empty() const { return cards_.empty(); }

    // Somme des valeurs "soft", puis promotion 1 -> 11 de chaque As tant que total <= 21
    int total() const;
    // Tous les As comptés 1
    int soft_total() const;

    bool has_ace() const;
    bool is_soft() const;
    bool is_bust() const { return total() > 21; }
    bool is_blackjack() const;
    bool can_split() const;
    bool can_double() const { return num_cards() == 2; }

    bool is_doubled() const { return doubled_; }
    bool is_surrendered() const { return surrendered_; }
    void mark_doubled() { doubled_ = true; }
    void mark_surrendered() { surrendered_ = true; }

    // hide_first: la carte cachée du croupier est rendue "[XX]"
    std::string to_string(bool hide_first = false) const;

private:
    std::vector<Card> cards_;
    bool doubled_ = false;
    bool surrendered_ = false;
};

} // namespace bj_solver

#endif // BJ_HAND_HPP
