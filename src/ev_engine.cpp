#include "ev_engine.h"
#include "errors.h"
#include "seeding.h"

#include <algorithm> // For std::stable_sort, std::any_of
#include <cctype>    // For std::toupper
#include <cmath>     // For std::round, std::pow, std::fabs

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

namespace poker_coach {

namespace {

// Offset applied to the scenario seed so EV trials never replay the deal stream.
constexpr uint64_t EV_SEED_OFFSET = 173;

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double position_bonus(const std::string& position) {
    if (position == "BTN") return 0.08;
    if (position == "CO") return 0.05;
    if (position == "HJ") return 0.03;
    if (position == "LJ") return 0.01;
    if (position == "UTG") return -0.01;
    if (position == "SB") return -0.08;
    if (position == "BB") return -0.05;
    return 0.0;
}

// How much the pot is expected to grow before showdown.
double future_factor(Street street) {
    switch (street) {
        case Street::PREFLOP: return 2.2;
        case Street::FLOP:    return 1.45;
        case Street::TURN:    return 1.2;
        default:              return 1.0;
    }
}

double street_realization_adjustment(Street street) {
    switch (street) {
        case Street::PREFLOP: return -0.05;
        case Street::TURN:    return 0.03;
        case Street::RIVER:   return 0.06;
        default:              return 0.0;
    }
}

std::string capitalize(std::string text) {
    if (!text.empty()) text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    return text;
}

bool same_size(const std::optional<double>& a, const std::optional<double>& b) {
    if (!a || !b) return !a && !b;
    return std::fabs(round_bb(*a) - round_bb(*b)) < 1e-9;
}

} // namespace

bool ActionRow::matches(const Decision& decision) const {
    Decision d = normalize_decision(decision);
    return action == d.action && same_size(size_bb, d.size_bb) && intent == d.intent;
}

Decision ActionRow::as_decision() const {
    Decision d;
    d.action = action;
    d.size_bb = size_bb;
    d.intent = intent;
    return d;
}

Decision normalize_decision(const Decision& decision) {
    Decision d = decision;
    bool aggressive = d.action == ActionType::BET || d.action == ActionType::RAISE;
    if (!aggressive) {
        d.size_bb.reset();
        d.intent = Intent::NONE;
        return d;
    }
    if (d.size_bb && *d.size_bb <= 0.0) d.size_bb.reset();
    if (d.size_bb) d.size_bb = round_bb(*d.size_bb);
    if (d.intent == Intent::NONE) d.intent = Intent::VALUE;
    return d;
}

void validate_decision(const Scenario& scenario, const Decision& decision) {
    Decision d = normalize_decision(decision);
    if (!scenario.is_legal(d.action)) {
        std::vector<std::string> legal;
        for (ActionType a : scenario.legal_actions) legal.push_back(action_type_to_string(a));
        throw IllegalActionError(fmt::format("Action '{}' is not legal here (legal: {})",
                                             action_type_to_string(d.action), fmt::join(legal, ", ")));
    }
    if (d.action != ActionType::BET && d.action != ActionType::RAISE) return;

    if (!d.size_bb) {
        throw IllegalActionError(fmt::format("A {} needs a size in bb", action_type_to_string(d.action)));
    }
    double low = round_bb(scenario.min_size_bb(d.action));
    double high = round_bb(scenario.max_size_bb());
    const auto& menu = d.action == ActionType::BET ? scenario.bet_size_options_bb : scenario.raise_size_options_bb;
    bool on_menu = std::any_of(menu.begin(), menu.end(), [&](double s) { return same_size(s, d.size_bb); });
    if (!on_menu && (*d.size_bb < low - 1e-9 || *d.size_bb > high + 1e-9)) {
        throw IllegalActionError(fmt::format("{} size {:.1f}bb is outside the legal range [{:.1f}, {:.1f}]",
                                             capitalize(action_type_to_string(d.action)), *d.size_bb, low, high));
    }
}

bool row_precedes(const ActionRow& a, const ActionRow& b) {
    if (a.ev_bb != b.ev_bb) return a.ev_bb > b.ev_bb;
    if (a.ev_ci_bb != b.ev_ci_bb) return a.ev_ci_bb < b.ev_ci_bb;
    return static_cast<int>(a.action) < static_cast<int>(b.action);
}

std::string verdict_for_loss(double ev_loss_bb) {
    if (ev_loss_bb > 1.6) return "Major Leak";
    if (ev_loss_bb > 0.8) return "Leak";
    if (ev_loss_bb > 0.2) return "Good";
    return "Excellent";
}

std::vector<std::string> mistake_tags(const ActionRow& chosen, const ActionRow& best, double ev_loss_bb) {
    std::vector<std::string> tags;
    if (ev_loss_bb < 0.3) return tags;
    if (chosen.action == ActionType::FOLD && best.action != ActionType::FOLD) tags.push_back("Overfold");
    if (chosen.intent == Intent::BLUFF && ev_loss_bb > 0.8) tags.push_back("Overbluff");
    if (chosen.intent == Intent::VALUE && chosen.ev_bb < 0.0) tags.push_back("TooThinValue");
    if ((chosen.action == ActionType::CALL || chosen.action == ActionType::CHECK) && best.is_aggressive()) {
        tags.push_back("MissedValue");
    }
    if (chosen.is_aggressive() && chosen.intent == Intent::VALUE && best.intent == Intent::BLUFF) {
        tags.push_back("Underbluff");
    }
    return tags;
}

// --- EvCalculator ---

EvCalculator::EvCalculator(const Scenario& scenario, int simulations, const MonteCarlo& monte_carlo)
    : scenario_(scenario),
      simulations_(std::max(MIN_TRIALS, std::min(MAX_TRIALS, simulations))),
      monte_carlo_(monte_carlo),
      evaluator_(),
      base_seed_(scenario.seed + EV_SEED_OFFSET) {
    spdlog::debug("EvCalculator created for {} with {} trials", scenario_.scenario_id, simulations_);
}

const VillainRange& EvCalculator::range_for(const Seat& villain, double pressure) {
    std::string key = fmt::format("{}|{}|{}|{:.3f}", villain.archetype_key, seat_role_to_string(villain.role),
                                  villain.position, pressure);
    auto it = range_cache_.find(key);
    if (it != range_cache_.end()) return *it->second;

    RangeSpec spec;
    spec.archetype_key = villain.archetype_key;
    spec.position = villain.position;
    spec.node_type = scenario_.node_type;
    spec.street = scenario_.street;
    spec.role = villain.role;
    spec.pressure = pressure;
    auto range = std::make_unique<VillainRange>(
        VillainRange::build(spec, scenario_.board, scenario_.hero_hand, evaluator_));
    const VillainRange& ref = *range;
    range_cache_.emplace(key, std::move(range));
    return ref;
}

EquityEstimate EvCalculator::equity(const std::vector<const Seat*>& villains, double pressure) {
    if (villains.empty()) {
        EquityEstimate uncontested;
        uncontested.equity = 1.0;
        return uncontested;
    }

    std::string key = fmt::format("{}|{}|{}|{:.3f}|{}", fmt::join(scenario_.hero_hand, ""),
                                  fmt::join(scenario_.board, ""), street_to_string(scenario_.street), pressure,
                                  simulations_);
    for (const Seat* v : villains) {
        key += fmt::format("|{}:{}:{}", v->archetype_key, seat_role_to_string(v->role), v->position);
    }
    auto it = equity_cache_.find(key);
    if (it != equity_cache_.end()) return it->second;

    std::vector<const VillainRange*> ranges;
    for (const Seat* v : villains) ranges.push_back(&range_for(*v, pressure));

    EquityEstimate estimate = monte_carlo_.estimate_equity(scenario_.hero_hand, scenario_.board, ranges,
                                                           simulations_, base_seed_, fnv1a(key));
    if (estimate.fallbacks > 0) {
        spdlog::warn("{}: {} villain range(s) fell back to the opening range", scenario_.scenario_id,
                     estimate.fallbacks);
    }
    equity_cache_.emplace(key, estimate);
    return estimate;
}

double EvCalculator::line_realization(Intent intent, double callers_estimate) const {
    const HeroProfile& hero = scenario_.hero_profile;
    double base = 0.82 + position_bonus(scenario_.hero_position);
    double street_adj = street_realization_adjustment(scenario_.street);
    double intent_adj = intent == Intent::VALUE ? 0.08 : (intent == Intent::BLUFF ? -0.08 : 0.0);
    double multiway_adj = -0.04 * std::max(0.0, callers_estimate - 1.0);

    // Wide flatting ranges realize worse; very high AF follows through poorly as a bluffer.
    double gap_penalty = -std::max(0.0, hero.vpip_pfr_gap() - 0.10) * 0.28;
    double af_bluff_penalty = intent == Intent::BLUFF ? -std::max(0.0, hero.af() - 3.8) * 0.025 : 0.0;
    double pfr_bonus = std::max(0.0, hero.pfr() - 0.20) * 0.08;

    return clamp(base + street_adj + intent_adj + multiway_adj + gap_penalty + af_bluff_penalty + pfr_bonus,
                 0.45, 1.05);
}

// Positive values mean villains continue more against hero's image.
double EvCalculator::hero_image_continue_adjustment(Intent intent) const {
    double image = scenario_.hero_profile.image_bluffiness();
    return (image - 0.5) * (intent == Intent::BLUFF ? 0.22 : 0.12);
}

ActionRow EvCalculator::fold_row() const {
    ActionRow row;
    row.action = ActionType::FOLD;
    row.label = "Fold";
    row.expected_callers = static_cast<double>(scenario_.active_villains().size());
    row.pot_if_called_bb = scenario_.pot_bb;
    return row;
}

ActionRow EvCalculator::call_like_row(ActionType action) {
    double pot = scenario_.pot_bb;
    double to_call = scenario_.to_call_bb;
    std::vector<const Seat*> villains = scenario_.active_villains();

    EquityEstimate eq = equity(villains, CALL_LINE_PRESSURE);
    double realization = line_realization(Intent::NONE, static_cast<double>(villains.size()));
    double ff = future_factor(scenario_.street);

    double expected_pot;
    double ev;
    double risk;
    if (action == ActionType::CHECK) {
        expected_pot = pot * ff;
        ev = eq.equity * realization * expected_pot - (ff - 1.0) * pot * 0.11;
        risk = 0.0;
    } else {
        expected_pot = (pot + to_call) * ff;
        ev = eq.equity * realization * expected_pot - to_call - (ff - 1.0) * (pot + to_call) * 0.14;
        risk = to_call;
    }

    ActionRow row;
    row.action = action;
    row.label = capitalize(action_type_to_string(action));
    row.equity = round_to(eq.equity, 4);
    row.expected_callers = static_cast<double>(villains.size());
    row.pot_if_called_bb = round_to(expected_pot, 2);
    row.risk_bb = round_to(risk, 2);
    row.realization = round_to(realization, 3);
    row.ev_bb = round_to(ev, 3);
    row.ev_ci_bb = round_to(1.96 * eq.std_error * expected_pot * realization, 3);
    return row;
}

ActionRow EvCalculator::aggressive_row(ActionType action, double size_bb, Intent intent) {
    double pot = scenario_.pot_bb;
    double to_call = scenario_.to_call_bb;
    std::vector<const Seat*> villains = scenario_.active_villains();

    double size_ratio = size_bb / std::max(1.0, pot);
    double texture = board_texture_score(scenario_.board);
    double texture_adj = 0.0;
    if (intent == Intent::BLUFF) texture_adj = texture >= 1.5 ? -0.03 : 0.03;
    double image_adj = hero_image_continue_adjustment(intent);

    std::vector<std::pair<const Seat*, double>> continues;
    for (const Seat* v : villains) {
        double p = continue_probability(archetype_by_key(v->archetype_key), scenario_.street, action, size_ratio,
                                        v->role);
        continues.emplace_back(v, clamp(p + texture_adj + image_adj, 0.03, 0.97));
    }

    double p_all_fold = 1.0;
    double expected_callers = 0.0;
    for (const auto& c : continues) {
        p_all_fold *= 1.0 - c.second;
        expected_callers += c.second;
    }

    // Equity is taken against the villains most likely to continue.
    int target_callers = std::max(1, std::min(static_cast<int>(villains.size()),
                                              static_cast<int>(std::round(expected_callers))));
    std::stable_sort(continues.begin(), continues.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    std::vector<const Seat*> callers;
    for (int i = 0; i < target_callers && i < static_cast<int>(continues.size()); ++i) {
        callers.push_back(continues[i].first);
    }
    double pressure = clamp(0.38 + size_ratio * 0.25, 0.25, 0.95);
    EquityEstimate eq = equity(callers, pressure);
    double realization = line_realization(intent, std::max(1.0, expected_callers));

    double pot_if_called;
    if (action == ActionType::BET) {
        pot_if_called = pot + size_bb + expected_callers * size_bb;
    } else {
        pot_if_called = pot + size_bb + expected_callers * std::max(0.0, size_bb - to_call);
    }
    double risk = size_bb;

    double ev = p_all_fold * pot + (1.0 - p_all_fold) * (eq.equity * realization * pot_if_called - risk);
    if (intent == Intent::VALUE && eq.equity < 0.45) ev -= 0.7;
    if (intent == Intent::BLUFF && eq.equity > 0.58) ev -= 0.4;

    ActionRow row;
    row.action = action;
    row.size_bb = round_bb(size_bb);
    row.intent = intent;
    row.label = fmt::format("{} {:.1f}bb ({})", action == ActionType::BET ? "Bet" : "Raise", size_bb,
                            capitalize(intent_to_string(intent)));
    row.equity = round_to(eq.equity, 4);
    row.fold_equity = round_to(p_all_fold, 4);
    row.expected_callers = round_to(expected_callers, 3);
    row.pot_if_called_bb = round_to(pot_if_called, 2);
    row.risk_bb = round_to(risk, 2);
    row.realization = round_to(realization, 3);
    row.ev_bb = round_to(ev, 3);
    row.ev_ci_bb = round_to(1.96 * eq.std_error * pot_if_called * realization, 3);
    return row;
}

std::vector<ActionRow> EvCalculator::action_table(std::optional<double> custom_size) {
    std::vector<ActionRow> table;
    if (scenario_.is_legal(ActionType::FOLD)) table.push_back(fold_row());
    if (scenario_.is_legal(ActionType::CHECK)) table.push_back(call_like_row(ActionType::CHECK));
    if (scenario_.is_legal(ActionType::CALL)) table.push_back(call_like_row(ActionType::CALL));

    for (ActionType action : {ActionType::BET, ActionType::RAISE}) {
        if (!scenario_.is_legal(action)) continue;
        const auto& menu = action == ActionType::BET ? scenario_.bet_size_options_bb
                                                     : scenario_.raise_size_options_bb;
        for (double size : menu) {
            table.push_back(aggressive_row(action, size, Intent::VALUE));
            table.push_back(aggressive_row(action, size, Intent::BLUFF));
        }
        if (custom_size) {
            double size = round_bb(*custom_size);
            bool on_menu = std::any_of(menu.begin(), menu.end(), [&](double s) { return same_size(s, size); });
            if (!on_menu) {
                for (Intent intent : {Intent::VALUE, Intent::BLUFF}) {
                    ActionRow row = aggressive_row(action, size, intent);
                    row.custom_size = true;
                    table.push_back(row);
                }
            }
        }
    }

    std::stable_sort(table.begin(), table.end(), row_precedes);
    return table;
}

ActionRow EvCalculator::evaluate_choice(const Decision& decision) {
    Decision d = normalize_decision(decision);
    switch (d.action) {
        case ActionType::FOLD:
            return fold_row();
        case ActionType::CHECK:
        case ActionType::CALL:
            return call_like_row(d.action);
        case ActionType::BET:
        case ActionType::RAISE:
            if (!d.size_bb) throw IllegalActionError("A bet or raise needs a size in bb");
            return aggressive_row(d.action, *d.size_bb, d.intent);
    }
    throw IllegalActionError("Unknown action");
}

} // namespace poker_coach
