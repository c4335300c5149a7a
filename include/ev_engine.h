#ifndef POKER_COACH_EV_ENGINE_H
#define POKER_COACH_EV_ENGINE_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "monte_carlo.h"
#include "range_model.h"
#include "scenario.h"

namespace poker_coach {

// Pressure applied to villain ranges when hero only checks or calls.
constexpr double CALL_LINE_PRESSURE = 0.30;

struct Decision {
    ActionType action = ActionType::CHECK;
    std::optional<double> size_bb;
    Intent intent = Intent::NONE;
    std::string free_response; // Hero's written reasoning, stored with the attempt
};

// One candidate line with its EV estimate.
struct ActionRow {
    ActionType action = ActionType::FOLD;
    std::optional<double> size_bb;
    Intent intent = Intent::NONE;
    std::string label;
    double equity = 0.0;
    double fold_equity = 0.0;
    double expected_callers = 0.0;
    double pot_if_called_bb = 0.0;
    double risk_bb = 0.0;
    double realization = 0.0;
    double ev_bb = 0.0;
    double ev_ci_bb = 0.0;
    bool custom_size = false; // Hero's own size, not on the menu

    bool is_aggressive() const { return action == ActionType::BET || action == ActionType::RAISE; }
    bool matches(const Decision& decision) const;
    Decision as_decision() const;
};

// Rounds the size to 0.1bb, defaults bet/raise intent to value and clears
// size/intent for passive actions.
Decision normalize_decision(const Decision& decision);

// Throws IllegalActionError when the action is not legal in the scenario, or
// a bet/raise has no size or a size outside [min_size_bb, max_size_bb].
void validate_decision(const Scenario& scenario, const Decision& decision);

// Row ordering: higher EV first, then lower variance (narrower CI), then
// fold < check < call < bet < raise.
bool row_precedes(const ActionRow& a, const ActionRow& b);

// Excellent (<= 0.2bb), Good (<= 0.8), Leak (<= 1.6), Major Leak.
std::string verdict_for_loss(double ev_loss_bb);

// Overfold, Overbluff, TooThinValue, MissedValue, Underbluff; none below 0.3bb.
std::vector<std::string> mistake_tags(const ActionRow& chosen, const ActionRow& best, double ev_loss_bb);

/**
 * @brief Builds the EV table for one scenario.
 *
 * Equity comes from seeded Monte Carlo trials against weighted villain
 * ranges; results are cached per (villains, pressure, trials) for the
 * lifetime of the calculator. Not thread-safe: use one calculator per request.
 */
class EvCalculator {
public:
    // simulations is clamped to [MIN_TRIALS, MAX_TRIALS].
    EvCalculator(const Scenario& scenario, int simulations, const MonteCarlo& monte_carlo);

    // Every legal line (bet/raise crossed with menu size and intent), plus value
    // and bluff rows for `custom_size` when it is given and off the menu.
    // Sorted with row_precedes.
    std::vector<ActionRow> action_table(std::optional<double> custom_size = std::nullopt);

    // Row for exactly one decision, as action_table would build it.
    // The decision must already be valid for the scenario.
    ActionRow evaluate_choice(const Decision& decision);

    const Scenario& scenario() const { return scenario_; }
    int simulations() const { return simulations_; }

private:
    ActionRow fold_row() const;
    ActionRow call_like_row(ActionType action);
    ActionRow aggressive_row(ActionType action, double size_bb, Intent intent);

    EquityEstimate equity(const std::vector<const Seat*>& villains, double pressure);
    const VillainRange& range_for(const Seat& villain, double pressure);
    double line_realization(Intent intent, double callers_estimate) const;
    double hero_image_continue_adjustment(Intent intent) const;

    Scenario scenario_;
    int simulations_;
    const MonteCarlo& monte_carlo_;
    HandEvaluator evaluator_;
    uint64_t base_seed_;
    std::map<std::string, EquityEstimate> equity_cache_;
    std::map<std::string, std::unique_ptr<VillainRange>> range_cache_;
};

} // namespace poker_coach

#endif // POKER_COACH_EV_ENGINE_H
