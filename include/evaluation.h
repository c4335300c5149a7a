#ifndef POKER_COACH_EVALUATION_H
#define POKER_COACH_EVALUATION_H

#include <string>
#include <vector>

#include "ev_engine.h"
#include "leak_report.h"
#include "monte_carlo.h"
#include "scenario.h"

namespace poker_coach {

struct EvaluationResult {
    std::string scenario_id;
    Decision decision; // Normalized
    ActionRow best_action;
    ActionRow chosen_action;
    double ev_loss_bb = 0.0;
    std::string verdict;
    std::vector<std::string> mistake_tags;
    std::vector<ActionRow> action_table;
    LeakReport leak_report;
    int simulations = 0;
};

// Scores one hero decision against the scenario's EV table.
// Throws IllegalActionError before any simulation when the decision is not
// legal for the scenario.
EvaluationResult evaluate_decision(const Scenario& scenario,
                                   const Decision& decision,
                                   int simulations,
                                   const MonteCarlo& monte_carlo);

} // namespace poker_coach

#endif // POKER_COACH_EVALUATION_H
