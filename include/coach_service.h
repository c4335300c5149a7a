#ifndef POKER_COACH_COACH_SERVICE_H
#define POKER_COACH_COACH_SERVICE_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "archetype_matcher.h"
#include "coach_config.h"
#include "coach_store.h"
#include "evaluation.h"
#include "hand_history.h"
#include "live_session.h"
#include "monte_carlo.h"
#include "player_profile.h"
#include "scenario.h"

namespace poker_coach {

struct EvaluationResponse {
    AttemptRecord attempt;
    Scenario scenario;
    EvaluationResult evaluation;
};

// One step of a live session: either a hero action or a request to deal
// the next hand.
struct LiveCommand {
    bool new_hand = false;
    ActionType action = ActionType::CHECK;
    std::optional<double> size_bb;
    Intent intent = Intent::NONE;
};

/**
 * Entry point for every coaching operation. Owns the shared Monte Carlo
 * engine, the scenario generator and the store. Each call is a
 * self-contained unit of work; the only shared state is the store.
 */
class CoachService {
public:
    explicit CoachService(CoachConfig config = CoachConfig());

    // --- Hand histories ---
    ParseReport load_hands(const std::vector<std::string>& paths) const;
    std::vector<PlayerBucket> players(const std::vector<HandRecord>& hands) const;
    PlayerProfile aggregate_profile(const std::vector<HandRecord>& hands, const std::string& player_id) const;

    // --- Archetypes ---
    ArchetypeMatch match_archetype(const StatVector& stats) const;
    ArchetypeMatch match_profile(const PlayerProfile& profile) const;

    // --- Drills ---
    // Config defaults (stack, blinds) taken from the CoachConfig.
    ScenarioConfig default_scenario_config() const;
    Scenario generate_scenario(const ScenarioConfig& config);
    Scenario get_scenario(const std::string& scenario_id) const;
    // Throws NotFoundError for an unknown scenario and IllegalActionError
    // before any simulation when the decision is not legal.
    EvaluationResponse evaluate_decision(const std::string& scenario_id,
                                         const Decision& decision,
                                         std::optional<int> simulations = std::nullopt);
    ProgressSummary progress() const;
    ClearResult clear_saved();

    // --- Live play ---
    LiveSessionState start_live_session(const OpponentProfile& opponent,
                                        std::optional<uint64_t> seed = std::nullopt,
                                        std::optional<double> starting_stack_bb = std::nullopt);
    // Opponent tendencies taken from a catalogue archetype. Throws
    // ConfigError on an unknown key.
    LiveSessionState start_live_session_from_archetype(const std::string& archetype_key,
                                                       std::optional<uint64_t> seed = std::nullopt);
    LiveSessionState live_state(const std::string& session_id) const;
    LiveSessionState advance_live_session(const std::string& session_id, const LiveCommand& command);

    const CoachConfig& config() const { return config_; }
    CoachStore& store() { return store_; }

private:
    CoachConfig config_;
    MonteCarlo monte_carlo_;
    ScenarioGenerator generator_;
    ArchetypeMatcher matcher_;
    CoachStore store_;
    std::atomic<uint64_t> session_counter_;
};

} // namespace poker_coach

#endif // POKER_COACH_COACH_SERVICE_H
