#ifndef BJ_STRATEGY_ENGINE_H
#define BJ_STRATEGY_ENGINE_H

#include "bj/card_counter.h"
#include "bj/common_types.h"
#include "bj/game_rules.h"
#include "core/cards.hpp"
#include "core/hand.hpp"
#include <utility>

namespace bj_solver {

// Moteur de stratégie: distribution exacte des totaux finaux du croupier
// conditionnée par la composition restante, puis EV de chaque action.
// Aucun état persistant hors de la référence au compteur; le cache de
// mémoïsation vit le temps d'un seul calcul de distribution.
class StrategyEngine {
public:
    explicit StrategyEngine(const CardCounter& counter, const GameRules& rules = GameRules{});

    // Composition du compteur moins la carte visible (si encore présente).
    DealerDistribution dealer_outcome_distribution(Card dealer_up_card) const;

    // Distribution depuis un total arbitraire, sur la composition du compteur telle quelle.
    DealerDistribution dealer_distribution_from(int total, bool is_soft) const;

    // Récursion mémoïsée sur (total, soft, composition). Somme = 1.0 pour toute
    // composition bien formée.
    static DealerDistribution dealer_distribution(int total, bool is_soft,
                                                  const Composition& composition,
                                                  bool dealer_hits_soft_17);

    // EV en unités de mise. Lancent std::invalid_argument si l'action n'est pas disponible.
    double stand_ev(const Hand& player_hand, Card dealer_up_card) const;
    double hit_ev(const Hand& player_hand, Card dealer_up_card) const;
    double double_ev(const Hand& player_hand, Card dealer_up_card) const;
    double split_ev(const Hand& player_hand, Card dealer_up_card) const;
    double surrender_ev(const Hand& player_hand) const;
    double action_ev(Action action, const Hand& player_hand, Card dealer_up_card) const;

    // EV de toutes les actions disponibles pour cette main
    ActionEVMap evaluate_actions(const Hand& player_hand, Card dealer_up_card) const;

    // Argmax des EV; égalité -> première action dans l'ordre de déclaration.
    // Main bust -> (STAND, -1.0), blackjack naturel -> (STAND, 1.5).
    std::pair<Action, double> optimal_action(const Hand& player_hand, Card dealer_up_card) const;

    Recommendation recommend(const Hand& player_hand, Card dealer_up_card) const;
    InsuranceRecommendation insurance_recommendation() const;

    // PLAYER: probabilité de bust sur le seul prochain tirage.
    // DEALER: masse "bust" de la distribution du croupier depuis ce total (dur).
    double bust_probability(int hand_total, Role role) const;

    static double insurance_ev(double ten_value_probability) { return 3.0 * ten_value_probability - 1.0; }

    const GameRules& rules() const { return rules_; }

private:
    const CardCounter& counter_;
    GameRules          rules_;

    static double stand_ev_against(int player_total, const DealerDistribution& dealer);
    double hit_ev_with(const Hand& player_hand, Card dealer_up_card, const DealerDistribution& dealer) const;
    double double_ev_with(const Hand& player_hand, Card dealer_up_card, const DealerDistribution& dealer) const;
    double split_ev_with(const Hand& player_hand, Card dealer_up_card, const DealerDistribution& dealer) const;
    double action_ev_with(Action action, const Hand& player_hand, Card dealer_up_card,
                          const DealerDistribution& dealer) const;
    ActionEVMap evaluate_with(const Hand& player_hand, Card dealer_up_card, const DealerDistribution& dealer) const;
    std::pair<Action, double> optimal_with(const Hand& player_hand, Card dealer_up_card,
                                           const DealerDistribution& dealer, ActionEVMap& evs) const;
    bool surrender_available(const Hand& player_hand) const;
};

} // namespace bj_solver

#endif // BJ_STRATEGY_ENGINE_H
