#include "range_model.h"
#include "errors.h"

#include <algorithm> // For std::sort, std::upper_bound
#include <cmath>     // For std::exp

#include "spdlog/spdlog.h"

namespace poker_coach {

namespace {

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

double role_tightness(SeatRole role) {
    switch (role) {
        case SeatRole::BETTOR:  return 0.10;
        case SeatRole::CALLER:  return 0.02;
        case SeatRole::WAITING: return -0.05;
        default:                return 0.0;
    }
}

double role_continue_adjustment(SeatRole role) {
    switch (role) {
        case SeatRole::BETTOR:  return 0.08;
        case SeatRole::CALLER:  return 0.05;
        case SeatRole::WAITING: return -0.03;
        default:                return 0.0;
    }
}

double combo_quality(const WeightedCombo& combo) {
    return 0.6 * combo.preflop_score / 100.0 + 0.4 * combo.made_score;
}

} // namespace

uint64_t card_mask(const std::vector<Card>& cards) {
    uint64_t mask = 0;
    for (const auto& c : cards) {
        int idx = to_phe_card_index(c);
        if (idx >= 0) mask |= (1ULL << idx);
    }
    return mask;
}

double position_width_factor(const std::string& position) {
    if (position == "BTN") return 1.35;
    if (position == "CO") return 1.15;
    if (position == "HJ") return 1.0;
    if (position == "LJ") return 0.9;
    if (position == "UTG") return 0.8;
    if (position == "SB") return 1.05;
    if (position == "BB") return 1.25;
    return 1.0;
}

double node_width_factor(NodeType node) {
    switch (node) {
        case NodeType::SINGLE_RAISED_POT: return 1.0;
        case NodeType::THREE_BET_POT:     return 0.45;
        case NodeType::FOUR_BET_POT:      return 0.2;
    }
    return 1.0;
}

double continuation_target(const Archetype& archetype, SeatRole role, double pressure) {
    double target = archetype.preflop_tightness + role_tightness(role) + clamp(pressure, 0.0, 1.0) * 0.30;
    return target - (archetype.bluff_factor - 0.4) * 0.15;
}

double continue_probability(const Archetype& archetype,
                            Street street,
                            ActionType action,
                            double size_pot_ratio,
                            SeatRole role) {
    if (action != ActionType::BET && action != ActionType::RAISE) {
        throw ConfigError("continue_probability needs a bet or raise, got " + action_type_to_string(action));
    }

    double base;
    if (action == ActionType::RAISE) {
        base = archetype.continue_vs_raise;
    } else if (street == Street::FLOP) {
        base = 1.0 - archetype.fold_to_flop_bet;
    } else if (street == Street::TURN) {
        base = 1.0 - archetype.fold_to_turn_bet;
    } else if (street == Street::RIVER) {
        base = 1.0 - archetype.fold_to_river_bet;
    } else {
        base = 1.0 - archetype.fold_to_raise;
    }

    double size_penalty = std::max(0.0, size_pot_ratio - 0.5) * 0.20;
    if (street == Street::RIVER) size_penalty *= 1.25;
    double aggression_adj = (archetype.aggression - 0.5) * 0.14;

    return clamp(base - size_penalty + role_continue_adjustment(role) + aggression_adj, 0.05, 0.95);
}

VillainRange VillainRange::build(const RangeSpec& spec,
                                 const std::vector<Card>& board,
                                 const std::vector<Card>& dead,
                                 const HandEvaluator& evaluator) {
    const Archetype& archetype = archetype_by_key(spec.archetype_key);

    VillainRange range;
    range.spec_ = spec;

    HandGenerator generator;
    std::vector<Card> excluded = dead;
    excluded.insert(excluded.end(), board.begin(), board.end());
    bool postflop = spec.street != Street::PREFLOP && board.size() >= 3;

    for (const auto& hole : generator.generate_live_hands(excluded)) {
        WeightedCombo combo;
        combo.cards = hole;
        combo.mask = card_mask({hole[0], hole[1]});
        combo.preflop_score = preflop_strength_score(hole[0], hole[1]);
        combo.made_score = postflop ? evaluator.made_hand_score({hole[0], hole[1]}, board) : 0.0;
        range.combos_.push_back(combo);
    }
    if (range.combos_.empty()) {
        throw PokerCoachError("No live combinations left for villain range");
    }

    // Opening range: strongest `width` share of combos, with a soft edge.
    std::vector<size_t> order(range.combos_.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return range.combos_[a].preflop_score > range.combos_[b].preflop_score;
    });
    double width = clamp(archetype.vpip * position_width_factor(spec.position) * node_width_factor(spec.node_type),
                         0.03, 1.0);
    double n = static_cast<double>(order.size());
    for (size_t rank = 0; rank < order.size(); ++rank) {
        double percentile = static_cast<double>(rank) / n;
        double w = sigmoid((width - percentile) / 0.04);
        range.combos_[order[rank]].weight = w < MIN_COMBO_WEIGHT ? 0.0 : w;
    }
    range.rebuild_cumulative();
    if (range.total_weight_ < MIN_COMBO_WEIGHT) {
        for (auto& combo : range.combos_) combo.weight = 1.0;
        range.rebuild_cumulative();
        range.used_fallback_ = true;
        spdlog::warn("Opening range for {} ({}) is empty, using uniform range", spec.archetype_key, spec.position);
    }

    // The villain's action at this node narrows the range once.
    if (!range.narrow(continuation_target(archetype, spec.role, spec.pressure))) {
        range.used_fallback_ = true;
        spdlog::warn("Range for {} ({}, {}) collapsed after narrowing, using un-narrowed range",
                     spec.archetype_key, spec.position, seat_role_to_string(spec.role));
    }
    return range;
}

bool VillainRange::narrow(double target) {
    std::vector<double> narrowed(combos_.size());
    double total = 0.0;
    for (size_t i = 0; i < combos_.size(); ++i) {
        double w = combos_[i].weight * sigmoid((combo_quality(combos_[i]) - target) * 7.0);
        narrowed[i] = w < MIN_COMBO_WEIGHT ? 0.0 : w;
        total += narrowed[i];
    }
    if (total < MIN_COMBO_WEIGHT) return false;
    for (size_t i = 0; i < combos_.size(); ++i) combos_[i].weight = narrowed[i];
    rebuild_cumulative();
    return true;
}

void VillainRange::rebuild_cumulative() {
    cumulative_.resize(combos_.size());
    double running = 0.0;
    for (size_t i = 0; i < combos_.size(); ++i) {
        running += combos_[i].weight;
        cumulative_[i] = running;
    }
    total_weight_ = running;
}

size_t VillainRange::live_combos() const {
    return static_cast<size_t>(std::count_if(combos_.begin(), combos_.end(),
                                             [](const WeightedCombo& c) { return c.weight > 0.0; }));
}

const WeightedCombo& VillainRange::sample(std::mt19937_64& rng, uint64_t used_mask) const {
    if (total_weight_ > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, total_weight_);
        for (int attempt = 0; attempt < 64; ++attempt) {
            auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), dist(rng));
            if (it == cumulative_.end()) --it;
            const WeightedCombo& combo = combos_[static_cast<size_t>(it - cumulative_.begin())];
            if (combo.weight > 0.0 && (combo.mask & used_mask) == 0) return combo;
        }
        // Rejection kept hitting blocked cards: draw exactly from what is left.
        double compatible = 0.0;
        for (const auto& combo : combos_) {
            if ((combo.mask & used_mask) == 0) compatible += combo.weight;
        }
        if (compatible > 0.0) {
            double pick = std::uniform_real_distribution<double>(0.0, compatible)(rng);
            const WeightedCombo* last = nullptr;
            for (const auto& combo : combos_) {
                if ((combo.mask & used_mask) != 0 || combo.weight <= 0.0) continue;
                last = &combo;
                pick -= combo.weight;
                if (pick <= 0.0) return combo;
            }
            if (last) return *last;
        }
    }

    std::vector<const WeightedCombo*> open;
    for (const auto& combo : combos_) {
        if ((combo.mask & used_mask) == 0) open.push_back(&combo);
    }
    if (open.empty()) throw PokerCoachError("No villain combination compatible with the dealt cards");
    std::uniform_int_distribution<size_t> dist(0, open.size() - 1);
    return *open[dist(rng)];
}

} // namespace poker_coach
