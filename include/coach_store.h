#ifndef POKER_COACH_COACH_STORE_H
#define POKER_COACH_COACH_STORE_H

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "evaluation.h"
#include "live_session.h"
#include "scenario.h"

namespace poker_coach {

// Loss at or below this counts as an accurate decision.
constexpr double ACCURATE_LOSS_BB = 0.2;
constexpr size_t RECENT_ATTEMPTS = 20;

// Flat record of one graded decision. Append-only.
struct AttemptRecord {
    int64_t attempt_id = 0;
    std::string created_at; // ISO-8601 UTC
    std::string scenario_id;
    std::string hero_position;
    Street street = Street::FLOP;
    NodeType node_type = NodeType::SINGLE_RAISED_POT;
    int players_in_hand = 0;
    ActionType chosen_action = ActionType::CHECK;
    std::optional<double> chosen_size_bb;
    Intent chosen_intent = Intent::NONE;
    double chosen_ev_bb = 0.0;
    std::string best_action; // Row label
    double best_ev_bb = 0.0;
    double ev_loss_bb = 0.0;
    std::string verdict;
    std::vector<std::string> mistake_tags;
    std::string free_response;
};

struct ProgressBucket {
    std::string label;
    int attempts = 0;
    double avg_ev_loss_bb = 0.0;
    double accuracy = 0.0;
};

struct ProgressSummary {
    int attempts = 0;
    double avg_ev_loss_bb = 0.0;
    double accuracy = 0.0;
    double avg_chosen_ev_bb = 0.0;
    std::vector<ProgressBucket> by_position;
    std::vector<ProgressBucket> by_street;
    std::vector<ProgressBucket> by_node_type;
    std::vector<AttemptRecord> recent_attempts; // Newest first
};

struct ClearResult {
    int attempts_deleted = 0;
    int scenarios_deleted = 0;
};

/**
 * Keyed in-memory store for scenarios, attempts and live sessions.
 * Every lookup miss raises NotFoundError; nothing is created on a miss.
 * Safe for concurrent use. Live sessions are shared out and serialise
 * themselves; the store only guards the map.
 */
class CoachStore {
public:
    CoachStore();

    // Throws PokerCoachError if the id is already taken; stored scenarios
    // never change.
    void save_scenario(const Scenario& scenario);
    // Gives the scenario a fresh id from the store's sequence, then saves it.
    const std::string& add_scenario(Scenario& scenario);
    Scenario get_scenario(const std::string& scenario_id) const;
    bool has_scenario(const std::string& scenario_id) const;

    // Assigns the next attempt id and a timestamp.
    AttemptRecord save_attempt(const Scenario& scenario, const EvaluationResult& evaluation);
    AttemptRecord get_attempt(int64_t attempt_id) const;
    std::vector<AttemptRecord> attempts() const;

    void save_session(std::shared_ptr<LiveSession> session);
    std::shared_ptr<LiveSession> get_session(const std::string& session_id) const;
    size_t session_count() const;

    ProgressSummary progress_summary() const;

    // Deletes all scenarios and attempts. Live sessions are kept.
    ClearResult clear();

    // Scenarios and attempts as JSON. Live sessions are not persisted.
    void save_file(const std::string& path) const;
    void load_file(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Scenario> scenarios_;
    std::vector<AttemptRecord> attempts_;
    std::map<std::string, std::shared_ptr<LiveSession>> sessions_;
    int64_t next_attempt_id_ = 1;
    uint64_t next_scenario_seq_ = 1;
};

} // namespace poker_coach

#endif // POKER_COACH_COACH_STORE_H
