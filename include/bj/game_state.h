#ifndef BJ_GAME_STATE_H
#define BJ_GAME_STATE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/cards.hpp"
#include "core/hand.hpp"
#include "core/shoe.hpp"
#include "bj/card_counter.h"
#include "bj/common_types.h"
#include "bj/game_rules.h"
#include "bj/strategy_engine.h"

namespace bj_solver {

enum class Phase {
    BETTING,
    DEALING,
    INSURANCE,
    PLAYER_TURN,
    DEALER_TURN,
    GAME_OVER
};

enum class HandResult {
    PLAYER_WIN,
    DEALER_WIN,
    PUSH,
    PLAYER_BLACKJACK,
    DEALER_BLACKJACK,
    PLAYER_SURRENDER
};

struct HandOutcome {
    Hand       hand;
    HandResult result = HandResult::PUSH;
    double     payout = 0.0; // Montant rendu, mise comprise
};

// Machine à états d'une main de blackjack (un seul joueur).
// Toute carte retirée du sabot passe par draw_card(), qui met le compteur à jour.
class GameState {
public:
    explicit GameState(const GameRules& rules = GameRules{});
    GameState(const GameRules& rules, uint32_t seed);
    ~GameState() = default;

    // Le moteur référence le compteur membre
    GameState(const GameState&) = delete;
    GameState& operator=(const GameState&) = delete;

    // Actions; false si indisponibles dans la phase courante (aucune mutation)
    bool place_bet(double amount);
    bool deal_initial_cards();
    bool hit();
    bool stand();
    bool double_down();
    bool split();
    bool surrender();
    bool place_insurance(double amount);
    bool decline_insurance();

    // Joue toute la main du croupier
    void play_dealer_hand();
    // Un tirage du croupier à la fois (affichage séquentiel). Refuse un hand_id périmé.
    bool play_dealer_step(uint64_t hand_id);
    bool dealer_must_draw() const;

    // Remet la table en phase de mise et invalide les rappels différés en cours
    void start_new_hand();

    // Getters
    Phase get_phase() const { return phase_; }
    uint64_t get_hand_id() const { return hand_id_; }
    double get_bankroll() const { return bankroll_; }
    double get_insurance_bet() const { return insurance_bet_; }
    double get_total_wager() const;
    double get_hand_bet(size_t hand_index) const;
    const std::vector<Hand>& get_player_hands() const { return player_hands_; }
    const Hand& get_dealer_hand() const { return dealer_hand_; }
    Card get_dealer_up_card() const;
    size_t get_current_hand_index() const { return current_hand_index_; }
    bool has_current_hand() const;
    const Hand& get_current_hand() const;
    const std::vector<HandOutcome>& determine_results() const { return last_results_; }

    int get_games_played() const { return games_played_; }
    int get_games_won() const { return games_won_; }
    int get_games_lost() const { return games_lost_; }
    int get_games_pushed() const { return games_pushed_; }
    double get_win_rate() const;

    const GameRules& get_rules() const { return rules_; }
    const Shoe& get_shoe() const { return shoe_; }
    const CardCounter& get_counter() const { return counter_; }
    const StrategyEngine& get_engine() const { return engine_; }

    std::optional<Recommendation> strategy_recommendation() const;
    std::optional<InsuranceRecommendation> insurance_recommendation() const;

    // Remplace le contenu du sabot et resynchronise le compteur
    void set_shoe_for_testing(const std::vector<Card>& cards);

    std::string toString() const;

private:
    GameRules                rules_;
    Shoe                     shoe_;
    CardCounter              counter_;
    StrategyEngine           engine_; // Après counter_ (ordre d'initialisation)

    Phase                    phase_ = Phase::BETTING;
    uint64_t                 hand_id_ = 0;
    double                   pending_bet_ = 0.0;
    std::vector<Hand>        player_hands_;
    std::vector<double>      hand_bets_;
    Hand                     dealer_hand_;
    size_t                   current_hand_index_ = 0;
    double                   insurance_bet_ = 0.0;
    double                   bankroll_ = 0.0;
    std::vector<HandOutcome> last_results_;

    int games_played_ = 0;
    int games_won_    = 0;
    int games_lost_   = 0;
    int games_pushed_ = 0;

    std::optional<Card> draw_card();
    Card draw_card_or_throw();
    void advance_hand();
    void resolve_naturals();
    bool has_active_hands() const;
    void finish_dealer_turn();
    void settle();
    std::vector<HandOutcome> compute_results() const;
};

} // namespace bj_solver

#endif // BJ_GAME_STATE_H
