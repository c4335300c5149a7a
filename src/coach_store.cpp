#include "coach_store.h"
#include "errors.h"
#include "json_io.h"

#include <algorithm> // For std::stable_sort
#include <chrono>
#include <cmath>     // For std::round
#include <ctime>     // For std::gmtime
#include <fstream>
#include <iomanip>   // For std::setw

#include "spdlog/spdlog.h"

namespace poker_coach {

namespace {

double round3(double value) { return std::round(value * 1000.0) / 1000.0; }

std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

// Groups attempts by label; most attempts first, then lower average loss.
template <typename KeyFn>
std::vector<ProgressBucket> group_by(const std::vector<AttemptRecord>& attempts, KeyFn key_fn) {
    std::map<std::string, std::pair<int, std::pair<double, int>>> groups; // label -> (count, (loss sum, accurate))
    for (const AttemptRecord& attempt : attempts) {
        auto& group = groups[key_fn(attempt)];
        group.first += 1;
        group.second.first += attempt.ev_loss_bb;
        if (attempt.ev_loss_bb <= ACCURATE_LOSS_BB) group.second.second += 1;
    }

    std::vector<ProgressBucket> buckets;
    for (const auto& entry : groups) {
        ProgressBucket bucket;
        bucket.label = entry.first;
        bucket.attempts = entry.second.first;
        bucket.avg_ev_loss_bb = round3(entry.second.second.first / bucket.attempts);
        bucket.accuracy = round3(static_cast<double>(entry.second.second.second) / bucket.attempts);
        buckets.push_back(bucket);
    }
    std::stable_sort(buckets.begin(), buckets.end(), [](const ProgressBucket& a, const ProgressBucket& b) {
        if (a.attempts != b.attempts) return a.attempts > b.attempts;
        return a.avg_ev_loss_bb < b.avg_ev_loss_bb;
    });
    return buckets;
}

} // namespace

CoachStore::CoachStore() {
    spdlog::debug("CoachStore created");
}

void CoachStore::save_scenario(const Scenario& scenario) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scenarios_.emplace(scenario.scenario_id, scenario).second) {
        spdlog::error("Refusing to overwrite scenario {}", scenario.scenario_id);
        throw PokerCoachError("Scenario id already exists: " + scenario.scenario_id);
    }
    spdlog::debug("Stored scenario {}", scenario.scenario_id);
}

const std::string& CoachStore::add_scenario(Scenario& scenario) {
    std::lock_guard<std::mutex> lock(mutex_);
    do {
        scenario.scenario_id = scenario_id_for(scenario.seed, next_scenario_seq_++);
    } while (scenarios_.count(scenario.scenario_id) > 0);
    scenarios_.emplace(scenario.scenario_id, scenario);
    spdlog::debug("Stored scenario {} (sequence {})", scenario.scenario_id, next_scenario_seq_ - 1);
    return scenario.scenario_id;
}

Scenario CoachStore::get_scenario(const std::string& scenario_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scenarios_.find(scenario_id);
    if (it == scenarios_.end()) {
        spdlog::warn("Scenario lookup miss: {}", scenario_id);
        throw NotFoundError(NotFoundError::Kind::SCENARIO, scenario_id);
    }
    return it->second;
}

bool CoachStore::has_scenario(const std::string& scenario_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scenarios_.count(scenario_id) > 0;
}

AttemptRecord CoachStore::save_attempt(const Scenario& scenario, const EvaluationResult& evaluation) {
    AttemptRecord record;
    record.created_at = utc_timestamp();
    record.scenario_id = scenario.scenario_id;
    record.hero_position = scenario.hero_position;
    record.street = scenario.street;
    record.node_type = scenario.node_type;
    record.players_in_hand = scenario.players_in_hand;
    record.chosen_action = evaluation.chosen_action.action;
    record.chosen_size_bb = evaluation.chosen_action.size_bb;
    record.chosen_intent = evaluation.chosen_action.intent;
    record.chosen_ev_bb = evaluation.chosen_action.ev_bb;
    record.best_action = evaluation.best_action.label;
    record.best_ev_bb = evaluation.best_action.ev_bb;
    record.ev_loss_bb = evaluation.ev_loss_bb;
    record.verdict = evaluation.verdict;
    record.mistake_tags = evaluation.mistake_tags;
    record.free_response = evaluation.decision.free_response;

    std::lock_guard<std::mutex> lock(mutex_);
    record.attempt_id = next_attempt_id_++;
    attempts_.push_back(record);
    spdlog::debug("Stored attempt {} for scenario {}", record.attempt_id, record.scenario_id);
    return record;
}

AttemptRecord CoachStore::get_attempt(int64_t attempt_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const AttemptRecord& attempt : attempts_) {
        if (attempt.attempt_id == attempt_id) {
            return attempt;
        }
    }
    spdlog::warn("Attempt lookup miss: {}", attempt_id);
    throw NotFoundError(NotFoundError::Kind::ATTEMPT, std::to_string(attempt_id));
}

std::vector<AttemptRecord> CoachStore::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

void CoachStore::save_session(std::shared_ptr<LiveSession> session) {
    if (!session) {
        throw PokerCoachError("Cannot store an empty live session");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = session->session_id();
    sessions_[id] = std::move(session);
    spdlog::info("Live session {} registered ({} active)", id, sessions_.size());
}

std::shared_ptr<LiveSession> CoachStore::get_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        spdlog::warn("Live session lookup miss: {}", session_id);
        throw NotFoundError(NotFoundError::Kind::SESSION, session_id);
    }
    return it->second;
}

size_t CoachStore::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

ProgressSummary CoachStore::progress_summary() const {
    std::vector<AttemptRecord> snapshot = attempts();

    ProgressSummary summary;
    summary.attempts = static_cast<int>(snapshot.size());
    if (!snapshot.empty()) {
        double loss_sum = 0.0;
        double chosen_sum = 0.0;
        int accurate = 0;
        for (const AttemptRecord& attempt : snapshot) {
            loss_sum += attempt.ev_loss_bb;
            chosen_sum += attempt.chosen_ev_bb;
            if (attempt.ev_loss_bb <= ACCURATE_LOSS_BB) accurate++;
        }
        summary.avg_ev_loss_bb = round3(loss_sum / summary.attempts);
        summary.accuracy = round3(static_cast<double>(accurate) / summary.attempts);
        summary.avg_chosen_ev_bb = round3(chosen_sum / summary.attempts);
    }

    summary.by_position = group_by(snapshot, [](const AttemptRecord& a) { return a.hero_position; });
    summary.by_street = group_by(snapshot, [](const AttemptRecord& a) { return street_to_string(a.street); });
    summary.by_node_type = group_by(snapshot, [](const AttemptRecord& a) { return node_type_to_string(a.node_type); });

    for (auto it = snapshot.rbegin(); it != snapshot.rend() && summary.recent_attempts.size() < RECENT_ATTEMPTS; ++it) {
        summary.recent_attempts.push_back(*it);
    }
    return summary;
}

ClearResult CoachStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ClearResult result;
    result.attempts_deleted = static_cast<int>(attempts_.size());
    result.scenarios_deleted = static_cast<int>(scenarios_.size());
    attempts_.clear();
    scenarios_.clear();
    spdlog::info("Cleared {} attempts and {} scenarios", result.attempts_deleted, result.scenarios_deleted);
    return result;
}

void CoachStore::save_file(const std::string& path) const {
    json document;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        json scenarios = json::array();
        for (const auto& entry : scenarios_) {
            scenarios.push_back(entry.second);
        }
        document["scenarios"] = scenarios;
        document["attempts"] = attempts_;
        document["next_attempt_id"] = next_attempt_id_;
        document["next_scenario_seq"] = next_scenario_seq_;
    }

    std::ofstream ofs(path);
    if (!ofs) {
        throw PokerCoachError("Failed to open store file for writing: " + path);
    }
    ofs << std::setw(2) << document << std::endl;
    spdlog::info("Store saved to {}", path);
}

void CoachStore::load_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw PokerCoachError("Failed to open store file: " + path);
    }

    std::map<std::string, Scenario> scenarios;
    std::vector<AttemptRecord> attempts;
    int64_t next_id = 1;
    uint64_t next_seq = 1;
    try {
        json document;
        ifs >> document;
        for (const json& raw : document.value("scenarios", json::array())) {
            Scenario scenario = raw.get<Scenario>();
            scenarios[scenario.scenario_id] = scenario;
        }
        attempts = document.value("attempts", json::array()).get<std::vector<AttemptRecord>>();
        for (const AttemptRecord& attempt : attempts) {
            next_id = std::max(next_id, attempt.attempt_id + 1);
        }
        next_id = std::max(next_id, document.value("next_attempt_id", int64_t{1}));
        next_seq = std::max(next_seq, document.value("next_scenario_seq", uint64_t{1}));
    } catch (const json::exception& e) {
        throw PokerCoachError("Invalid store file " + path + ": " + e.what());
    } catch (const ConfigError& e) {
        throw PokerCoachError("Invalid store file " + path + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    scenarios_ = std::move(scenarios);
    attempts_ = std::move(attempts);
    next_attempt_id_ = next_id;
    next_scenario_seq_ = next_seq;
    spdlog::info("Store loaded from {}: {} scenarios, {} attempts", path, scenarios_.size(), attempts_.size());
}

} // namespace poker_coach
