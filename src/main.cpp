#include "bj/game_state.h"
#include "bj/game_utils.hpp"
#include "bj/strategy_engine.h"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cerr
#include <exception>  // std::exception
#include <cstdint>

namespace {

// Joue la main courante en suivant toujours l'action optimale du moteur
void play_player_turn(bj_solver::GameState& game)
{
    using bj_solver::Action;
    while (game.get_phase() == bj_solver::Phase::PLAYER_TURN)
    {
        auto rec = game.strategy_recommendation();
        if (!rec) break;

        spdlog::info("  {} vs {} -> {} (EV {:.3f}) | base {} (EV {:.3f}) | écart {:+.3f}",
                     game.get_current_hand().to_string(),
                     bj_solver::to_string(game.get_dealer_up_card()),
                     bj_solver::action_to_string(rec->optimal_action), rec->optimal_ev,
                     bj_solver::action_to_string(rec->basic_action), rec->basic_ev,
                     rec->ev_difference);

        bool applied = false;
        switch (rec->optimal_action)
        {
            case Action::HIT:       applied = game.hit(); break;
            case Action::STAND:     applied = game.stand(); break;
            case Action::DOUBLE:    applied = game.double_down(); break;
            case Action::SPLIT:     applied = game.split(); break;
            case Action::SURRENDER: applied = game.surrender(); break;
        }
        // Bankroll insuffisante pour doubler/splitter: on se rabat sur stand/hit
        if (!applied)
        {
            applied = rec->action_evs.count(Action::HIT) &&
                      rec->action_evs.at(Action::HIT) > rec->action_evs.at(Action::STAND)
                      ? game.hit() : game.stand();
        }
        if (!applied)
        {
            spdlog::warn("Aucune action applicable, main abandonnée au croupier.");
            break;
        }
    }
}

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage du simulateur de blackjack…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    const int      num_hands = 20;
    const uint32_t seed      = 20240601;

    bj_solver::GameRules rules;
    rules.num_decks           = 6;
    rules.min_bet             = 10.0;
    rules.max_bet             = 1000.0;
    rules.initial_bankroll    = 1000.0;
    rules.dealer_hits_soft_17 = true;
    rules.surrender_allowed   = true;

    try
    {
        bj_solver::GameState game(rules, seed);
        spdlog::info("Table créée : {} paquets, H17={}, bankroll {:.2f}.",
                     rules.num_decks, rules.dealer_hits_soft_17, game.get_bankroll());

        for (int h = 0; h < num_hands; ++h)
        {
            const auto& counter = game.get_counter();
            const double bet = rules.min_bet * counter.betting_multiplier();
            spdlog::info("Main {}/{} | RC {} TC {:.2f} ({}), pénétration {:.1f}%, mise {:.2f}",
                         h + 1, num_hands, counter.running_count(), counter.true_count(),
                         counter.count_status(), 100.0 * counter.penetration(), bet);

            if (!game.place_bet(bet))
            {
                spdlog::warn("Mise refusée (bankroll {:.2f}), arrêt.", game.get_bankroll());
                break;
            }
            game.deal_initial_cards();
            spdlog::debug("  Composition restante : {}", bj_solver::composition_to_string(counter.composition()));

            if (auto ins = game.insurance_recommendation())
            {
                spdlog::info("  Assurance : EV {:.3f}, P(BJ) {:.3f} -> {}",
                             ins->insurance_ev, ins->dealer_blackjack_probability,
                             ins->should_take_insurance ? "OUI" : "NON");
                if (!ins->should_take_insurance || !game.place_insurance(bet / 2.0))
                    game.decline_insurance();
            }

            play_player_turn(game);

            if (game.get_phase() == bj_solver::Phase::DEALER_TURN)
            {
                const auto dist = game.get_engine().dealer_outcome_distribution(game.get_dealer_up_card());
                spdlog::debug("  Distribution croupier : {}", bj_solver::distribution_to_string(dist));
                game.play_dealer_hand();
            }

            spdlog::info("  Croupier : {} (total {})",
                         game.get_dealer_hand().to_string(), game.get_dealer_hand().total());
            game.start_new_hand();
        }

        spdlog::info("Terminé : {} mains, {} gagnées, {} perdues, {} égalités, taux {:.1f}%, bankroll {:.2f}.",
                     game.get_games_played(), game.get_games_won(), game.get_games_lost(),
                     game.get_games_pushed(), 100.0 * game.get_win_rate(), game.get_bankroll());
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
