#include "bj/strategy_engine.h"
#include "bj/basic_strategy.h"
#include "spdlog/spdlog.h"
#include <array>
#include <map>
#include <numeric>
#include <stdexcept>
#include <tuple>

namespace bj_solver {

namespace {

// Totaux 0..21 + BUST_TOTAL
using Outcomes = std::array<double, BUST_TOTAL + 1>;

struct MemoKey {
    int         total;
    bool        soft;
    Composition counts;

    bool operator<(const MemoKey& other) const {
        return std::tie(total, soft, counts) < std::tie(other.total, other.soft, other.counts);
    }
};

// Cache local à un seul calcul: la composition change à chaque carte.
class DealerRecursion {
public:
    explicit DealerRecursion(bool hits_soft_17) : hits_soft_17_(hits_soft_17) {}

    Outcomes run(int total, bool soft, const Composition& counts) {
        Outcomes out{};

        if (dealer_stands(total, soft)) {
            out[total] = 1.0;
            return out;
        }

        MemoKey key{total, soft, counts};
        auto it = memo_.find(key);
        if (it != memo_.end()) return it->second;

        const int remaining = std::accumulate(counts.begin(), counts.end(), 0);
        if (remaining <= 0) {
            // Composition épuisée: le croupier reste sur son total
            spdlog::warn("DealerRecursion: composition épuisée à {} ({}), le croupier reste.",
                         total, soft ? "soft" : "dur");
            out[total] = 1.0;
            memo_.emplace(std::move(key), out);
            return out;
        }

        for (Rank r : ALL_RANKS) {
            const int idx = rank_index(r);
            const int count = counts[idx];
            if (count <= 0) continue;
            const double p = static_cast<double>(count) / remaining;

            int new_total;
            bool new_soft = soft;
            if (r == Rank::ACE) {
                if (total + 11 <= 21) {
                    new_total = total + 11;
                    new_soft = true;
                } else {
                    new_total = total + 1;
                }
            } else {
                new_total = total + rank_value(r);
            }
            // Un As compté 11 repasse à 1 plutôt que de dépasser 21
            if (new_total > 21 && new_soft) {
                new_total -= 10;
                new_soft = false;
            }

            if (new_total > 21) {
                out[BUST_TOTAL] += p;
                continue;
            }

            Composition next = counts;
            next[idx]--;
            const Outcomes sub = run(new_total, new_soft, next);
            for (size_t t = 0; t < sub.size(); ++t) {
                out[t] += p * sub[t];
            }
        }

        memo_.emplace(std::move(key), out);
        return out;
    }

    size_t memo_size() const { return memo_.size(); }

private:
    bool hits_soft_17_;
    std::map<MemoKey, Outcomes> memo_;

    // Stand sur tous les 17 sauf soft 17 en H17
    bool dealer_stands(int total, bool soft) const {
        if (total >= 18) return true;
        if (total == 17) return !(soft && hits_soft_17_);
        return false;
    }
};

void validate_inputs(const Hand& player_hand, Card dealer_up_card) {
    if (player_hand.empty()) {
        throw std::invalid_argument("StrategyEngine: main du joueur vide.");
    }
    if (dealer_up_card >= INVALID_CARD) {
        throw std::invalid_argument("StrategyEngine: carte visible du croupier invalide.");
    }
}

} // namespace

StrategyEngine::StrategyEngine(const CardCounter& counter, const GameRules& rules)
    : counter_(counter), rules_(rules) {}

// -----------------------------------------------------------------------------
//  Distribution du croupier
// -----------------------------------------------------------------------------
DealerDistribution StrategyEngine::dealer_distribution(int total, bool is_soft,
                                                       const Composition& composition,
                                                       bool dealer_hits_soft_17) {
    if (total < 0 || total > 21) {
        throw std::invalid_argument("StrategyEngine::dealer_distribution: total initial hors [0, 21]: " +
                                    std::to_string(total));
    }
    for (int c : composition) {
        if (c < 0) throw std::logic_error("StrategyEngine::dealer_distribution: composition négative.");
    }

    DealerRecursion recursion(dealer_hits_soft_17);
    const Outcomes out = recursion.run(total, is_soft, composition);
    spdlog::trace("DealerRecursion: départ {} ({}), {} états mémoïsés.",
                  total, is_soft ? "soft" : "dur", recursion.memo_size());

    DealerDistribution result;
    for (size_t t = 0; t < out.size(); ++t) {
        if (out[t] > 0.0) result[static_cast<int>(t)] = out[t];
    }
    return result;
}

DealerDistribution StrategyEngine::dealer_outcome_distribution(Card dealer_up_card) const {
    if (dealer_up_card >= INVALID_CARD) {
        throw std::invalid_argument("StrategyEngine: carte visible du croupier invalide.");
    }
    Composition working = counter_.composition();
    int& up_count = working[rank_index(get_rank(dealer_up_card))];
    // Absente de la composition: déjà observée par le compteur
    if (up_count > 0) --up_count;

    return dealer_distribution(card_value(dealer_up_card), is_ace(dealer_up_card),
                               working, rules_.dealer_hits_soft_17);
}

DealerDistribution StrategyEngine::dealer_distribution_from(int total, bool is_soft) const {
    return dealer_distribution(total, is_soft, counter_.composition(), rules_.dealer_hits_soft_17);
}

// -----------------------------------------------------------------------------
//  EV par action
// -----------------------------------------------------------------------------
double StrategyEngine::stand_ev_against(int player_total, const DealerDistribution& dealer) {
    if (player_total > 21) return -1.0;
    double ev = 0.0;
    for (const auto& [dealer_total, p] : dealer) {
        if (dealer_total > 21 || dealer_total < player_total) {
            ev += p;
        } else if (dealer_total > player_total) {
            ev -= p;
        }
    }
    return ev;
}

// Un seul tirage puis stand; probabilités globales du compteur (carte cachée non conditionnée)
double StrategyEngine::hit_ev_with(const Hand& player_hand, Card dealer_up_card,
                                   const DealerDistribution& dealer) const {
    double ev = 0.0;
    for (Rank r : ALL_RANKS) {
        const double p = counter_.probability(r);
        if (p <= 0.0) continue;
        Hand next(player_hand.cards());
        next.add_card(make_card(r, get_suit(dealer_up_card))); // La couleur n'influe pas
        ev += next.is_bust() ? -p : p * stand_ev_against(next.total(), dealer);
    }
    return ev;
}

double StrategyEngine::double_ev_with(const Hand& player_hand, Card dealer_up_card,
                                      const DealerDistribution& dealer) const {
    if (!player_hand.can_double()) {
        throw std::invalid_argument("StrategyEngine: double indisponible pour " +
                                    std::to_string(player_hand.num_cards()) + " cartes.");
    }
    double ev = 0.0;
    for (Rank r : ALL_RANKS) {
        const double p = counter_.probability(r);
        if (p <= 0.0) continue;
        Hand next(player_hand.cards());
        next.add_card(make_card(r, get_suit(dealer_up_card)));
        ev += next.is_bust() ? -2.0 * p : 2.0 * p * stand_ev_against(next.total(), dealer);
    }
    return ev;
}

// Approximation: une main = carte splittée + une carte puis stand, le tout x2.
// Pas de re-split, pas de tirage au-delà d'une carte.
double StrategyEngine::split_ev_with(const Hand& player_hand, Card dealer_up_card,
                                     const DealerDistribution& dealer) const {
    if (!player_hand.can_split()) {
        throw std::invalid_argument("StrategyEngine: split indisponible pour " + player_hand.to_string() + ".");
    }
    const Card split_card = player_hand.cards()[0];
    double ev = 0.0;
    for (Rank r : ALL_RANKS) {
        const double p = counter_.probability(r);
        if (p <= 0.0) continue;
        Hand next(std::vector<Card>{split_card});
        next.add_card(make_card(r, get_suit(dealer_up_card)));
        ev += next.is_bust() ? -p : p * stand_ev_against(next.total(), dealer);
    }
    return 2.0 * ev;
}

bool StrategyEngine::surrender_available(const Hand& player_hand) const {
    return rules_.surrender_allowed && player_hand.num_cards() == 2;
}

double StrategyEngine::surrender_ev(const Hand& player_hand) const {
    if (!surrender_available(player_hand)) {
        throw std::invalid_argument("StrategyEngine: abandon indisponible pour cette main.");
    }
    return -0.5;
}

double StrategyEngine::action_ev_with(Action action, const Hand& player_hand, Card dealer_up_card,
                                      const DealerDistribution& dealer) const {
    switch (action) {
        case Action::HIT:       return hit_ev_with(player_hand, dealer_up_card, dealer);
        case Action::STAND:     return stand_ev_against(player_hand.total(), dealer);
        case Action::DOUBLE:    return double_ev_with(player_hand, dealer_up_card, dealer);
        case Action::SPLIT:     return split_ev_with(player_hand, dealer_up_card, dealer);
        case Action::SURRENDER: return surrender_ev(player_hand);
    }
    throw std::invalid_argument("StrategyEngine: action inconnue.");
}

double StrategyEngine::stand_ev(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    if (player_hand.is_bust()) return -1.0;
    return stand_ev_against(player_hand.total(), dealer_outcome_distribution(dealer_up_card));
}

double StrategyEngine::hit_ev(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    return hit_ev_with(player_hand, dealer_up_card, dealer_outcome_distribution(dealer_up_card));
}

double StrategyEngine::double_ev(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    if (!player_hand.can_double()) {
        throw std::invalid_argument("StrategyEngine: double indisponible pour " +
                                    std::to_string(player_hand.num_cards()) + " cartes.");
    }
    return double_ev_with(player_hand, dealer_up_card, dealer_outcome_distribution(dealer_up_card));
}

double StrategyEngine::split_ev(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    if (!player_hand.can_split()) {
        throw std::invalid_argument("StrategyEngine: split indisponible pour " + player_hand.to_string() + ".");
    }
    return split_ev_with(player_hand, dealer_up_card, dealer_outcome_distribution(dealer_up_card));
}

double StrategyEngine::action_ev(Action action, const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    if (action == Action::SURRENDER) return surrender_ev(player_hand);
    return action_ev_with(action, player_hand, dealer_up_card, dealer_outcome_distribution(dealer_up_card));
}

// -----------------------------------------------------------------------------
//  Sélection de l'action optimale
// -----------------------------------------------------------------------------
ActionEVMap StrategyEngine::evaluate_with(const Hand& player_hand, Card dealer_up_card,
                                          const DealerDistribution& dealer) const {
    ActionEVMap evs;
    evs[Action::HIT]   = hit_ev_with(player_hand, dealer_up_card, dealer);
    evs[Action::STAND] = stand_ev_against(player_hand.total(), dealer);
    if (player_hand.can_double()) {
        evs[Action::DOUBLE] = double_ev_with(player_hand, dealer_up_card, dealer);
    }
    if (player_hand.can_split()) {
        evs[Action::SPLIT] = split_ev_with(player_hand, dealer_up_card, dealer);
    }
    if (surrender_available(player_hand)) {
        evs[Action::SURRENDER] = -0.5;
    }
    for (const auto& [action, ev] : evs) {
        spdlog::debug("StrategyEngine: {} vs {} -> {} EV {:.4f}",
                      player_hand.to_string(), to_string(dealer_up_card), action_to_string(action), ev);
    }
    return evs;
}

ActionEVMap StrategyEngine::evaluate_actions(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    return evaluate_with(player_hand, dealer_up_card, dealer_outcome_distribution(dealer_up_card));
}

std::pair<Action, double> StrategyEngine::optimal_with(const Hand& player_hand, Card dealer_up_card,
                                                       const DealerDistribution& dealer,
                                                       ActionEVMap& evs) const {
    if (player_hand.is_bust()) return {Action::STAND, -1.0};
    if (player_hand.is_blackjack()) return {Action::STAND, 1.5};

    evs = evaluate_with(player_hand, dealer_up_card, dealer);

    // ActionEVMap est ordonnée selon la déclaration de Action: strict '>' garde la première
    auto best = evs.begin();
    for (auto it = evs.begin(); it != evs.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return {best->first, best->second};
}

std::pair<Action, double> StrategyEngine::optimal_action(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    if (player_hand.is_bust()) return {Action::STAND, -1.0};
    if (player_hand.is_blackjack()) return {Action::STAND, 1.5};
    ActionEVMap evs;
    return optimal_with(player_hand, dealer_up_card, dealer_outcome_distribution(dealer_up_card), evs);
}

Recommendation StrategyEngine::recommend(const Hand& player_hand, Card dealer_up_card) const {
    validate_inputs(player_hand, dealer_up_card);
    const DealerDistribution dealer = dealer_outcome_distribution(dealer_up_card);

    Recommendation rec;
    std::tie(rec.optimal_action, rec.optimal_ev) =
        optimal_with(player_hand, dealer_up_card, dealer, rec.action_evs);

    rec.basic_action = basic_action(player_hand, dealer_up_card);
    auto it = rec.action_evs.find(rec.basic_action);
    if (it != rec.action_evs.end()) {
        rec.basic_ev = it->second;
    } else if (rec.basic_action == Action::STAND) {
        rec.basic_ev = stand_ev_against(player_hand.total(), dealer);
    } else if (rec.basic_action == Action::HIT) {
        rec.basic_ev = hit_ev_with(player_hand, dealer_up_card, dealer);
    } else if (rec.basic_action == Action::SPLIT && player_hand.can_split()) {
        rec.basic_ev = split_ev_with(player_hand, dealer_up_card, dealer);
    }

    rec.ev_difference   = rec.optimal_ev - rec.basic_ev;
    rec.count_advantage = rec.optimal_ev > rec.basic_ev;
    spdlog::debug("StrategyEngine: optimal {} ({:.4f}), base {} ({:.4f}), écart {:.4f}",
                  action_to_string(rec.optimal_action), rec.optimal_ev,
                  action_to_string(rec.basic_action), rec.basic_ev, rec.ev_difference);
    return rec;
}

InsuranceRecommendation StrategyEngine::insurance_recommendation() const {
    InsuranceRecommendation rec;
    rec.dealer_blackjack_probability = counter_.probability_ten_value();
    rec.insurance_ev = insurance_ev(rec.dealer_blackjack_probability);
    rec.basic_ev = 0.0;
    rec.should_take_insurance = rec.insurance_ev > 0.0;
    rec.count_advantage = rec.insurance_ev > rec.basic_ev;
    return rec;
}

// -----------------------------------------------------------------------------
//  Probabilités de bust
// -----------------------------------------------------------------------------
double StrategyEngine::bust_probability(int hand_total, Role role) const {
    if (hand_total > 21) return 1.0;
    if (hand_total < 0) {
        throw std::invalid_argument("StrategyEngine::bust_probability: total négatif.");
    }

    if (role == Role::DEALER) {
        const DealerDistribution dist = dealer_distribution_from(hand_total, false);
        auto it = dist.find(BUST_TOTAL);
        return it == dist.end() ? 0.0 : it->second;
    }

    // Aide simplifiée: prochain tirage uniquement
    double bust = 0.0;
    for (Rank r : ALL_RANKS) {
        const double p = counter_.probability(r);
        if (p <= 0.0) continue;
        const int value = (r == Rank::ACE && hand_total + 11 > 21) ? 1 : rank_value(r);
        if (hand_total + value > 21) bust += p;
    }
    return bust;
}

} // namespace bj_solver
