#include "evaluation.h"
#include "errors.h"

#include <algorithm> // For std::find_if
#include <cmath>     // For std::round

#include "spdlog/spdlog.h"

namespace poker_coach {

EvaluationResult evaluate_decision(const Scenario& scenario,
                                   const Decision& decision,
                                   int simulations,
                                   const MonteCarlo& monte_carlo) {
    validate_decision(scenario, decision);
    Decision normalized = normalize_decision(decision);

    EvCalculator calc(scenario, simulations, monte_carlo);
    std::vector<ActionRow> actions = calc.action_table(normalized.size_bb);
    if (actions.empty()) {
        throw PokerCoachError("No legal actions were generated for scenario " + scenario.scenario_id);
    }

    auto chosen = std::find_if(actions.begin(), actions.end(),
                               [&](const ActionRow& row) { return row.matches(normalized); });
    if (chosen == actions.end()) {
        throw IllegalActionError("Chosen action not found in the action table for " + scenario.scenario_id);
    }

    EvaluationResult result;
    result.scenario_id = scenario.scenario_id;
    result.decision = normalized;
    result.best_action = actions.front();
    result.chosen_action = *chosen;
    result.ev_loss_bb = std::max(0.0, std::round((result.best_action.ev_bb - chosen->ev_bb) * 1000.0) / 1000.0);
    result.verdict = verdict_for_loss(result.ev_loss_bb);
    result.mistake_tags = mistake_tags(result.chosen_action, result.best_action, result.ev_loss_bb);
    result.simulations = calc.simulations();

    LeakAnalyzer analyzer(monte_carlo);
    result.leak_report = analyzer.build_report(scenario, normalized, result.chosen_action, result.best_action,
                                               actions, result.ev_loss_bb, calc.simulations());
    result.action_table = std::move(actions);

    spdlog::info("Evaluated {} on {}: {} ({:.3f}bb loss, {})", result.chosen_action.label, scenario.scenario_id,
                 result.verdict, result.ev_loss_bb, result.best_action.label);
    return result;
}

} // namespace poker_coach
