#ifndef POKER_COACH_LEAK_REPORT_H
#define POKER_COACH_LEAK_REPORT_H

#include <string>
#include <vector>

#include "ev_engine.h"
#include "hero_profile.h"
#include "scenario.h"

namespace poker_coach {

constexpr const char* RESIDUAL_FACTOR = "Residual/Model Uncertainty";

struct LeakFactor {
    std::string factor;
    double impact_bb = 0.0;
    double share_pct = 0.0;
    std::string detail;
};

// Pot-odds and sizing math for the chosen line.
struct SpotMath {
    double pot_bb = 0.0;
    double to_call_bb = 0.0;
    double spr = 0.0;
    std::string spr_label;
    std::vector<std::string> spr_notes;
    double required_equity = 0.0;
    double mdf = 1.0;
    double bet_to_pot = 0.0;
    double break_even_fold = 0.0;
    double target_bluff_share = 0.0;
    double target_bluff_to_value = 0.0;
    ActionType chosen_action = ActionType::CHECK;
    double chosen_size_bb = 0.0;
};

struct BlockerSignals {
    bool nut_flush_blocker = false;
    int broadway_blockers = 0;
    int paired_board_blockers = 0;
    std::string signal_text;
};

struct OpponentSnapshot {
    std::string archetype_mix;
    double average_street_fold_rate = 0.0;
    int players_in_hand = 0;
    std::string texture_label;
};

struct HeroProfileAnalysis {
    HeroProfile hero_profile;
    PositionGuidance position_guidance;
    std::vector<std::string> leak_flags;
    std::vector<std::string> recommendations; // At most 12
    OpponentSnapshot opponent_snapshot;
    SpotMath spot_math;
};

struct LeakReport {
    std::string summary;
    double optimal_gap_bb = 0.0;
    std::vector<LeakFactor> factor_breakdown; // Shares sum to 100
    HeroProfileAnalysis hero_profile_analysis;
};

SpotMath spot_math_snapshot(const Scenario& scenario, const ActionRow& chosen);
BlockerSignals hand_blocker_signals(const std::vector<Card>& hero_hand, const std::vector<Card>& board);
// Top two archetypes among the villains, e.g. "Calling Station x1, Weak-Tight x1".
std::string summarize_archetype_mix(const std::vector<const Seat*>& villains);
// Archetype fold rate versus a bet on the scenario street (fold_to_raise preflop).
double street_fold_rate(const std::string& archetype_key, Street street);

HeroProfileAnalysis hero_profile_analysis(const Scenario& scenario, const ActionRow& chosen, const ActionRow& best);

/**
 * Splits ev_loss into named factors. Raw factor impacts are scaled so they
 * add up to the loss, capped largest-first by what is left, and any remainder
 * becomes a residual factor. Shares are rounded to 0.1% and always sum to 100.
 *
 * Counterfactual factors (hero image, position) re-run the EV calculator on a
 * modified copy of the scenario with a reduced trial count.
 */
class LeakAnalyzer {
public:
    explicit LeakAnalyzer(const MonteCarlo& monte_carlo);

    std::vector<LeakFactor> factor_breakdown(const Scenario& scenario,
                                             const Decision& decision,
                                             const ActionRow& chosen,
                                             const ActionRow& best,
                                             const std::vector<ActionRow>& actions,
                                             int simulations) const;

    LeakReport build_report(const Scenario& scenario,
                            const Decision& decision,
                            const ActionRow& chosen,
                            const ActionRow& best,
                            const std::vector<ActionRow>& actions,
                            double ev_loss_bb,
                            int simulations) const;

private:
    double counterfactual_ev(const Scenario& scenario, const Decision& decision, int simulations) const;

    const MonteCarlo& monte_carlo_;
};

} // namespace poker_coach

#endif // POKER_COACH_LEAK_REPORT_H
