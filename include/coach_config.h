#ifndef POKER_COACH_COACH_CONFIG_H
#define POKER_COACH_COACH_CONFIG_H

#include <string>

#include <nlohmann/json.hpp>
#include "spdlog/spdlog.h"

#include "monte_carlo.h"
#include "scenario.h"

namespace poker_coach {

// Runtime settings. Every field is optional in the JSON file.
struct CoachConfig {
    int default_trials = DEFAULT_TRIALS;
    int min_trials = MIN_TRIALS;
    int max_trials = MAX_TRIALS;
    int worker_threads = 0; // 0 = hardware concurrency
    double default_stack_bb = DEFAULT_STACK_BB;
    double small_blind = DEFAULT_SMALL_BLIND;
    double big_blind = DEFAULT_BIG_BLIND;
    std::string log_level = "info";

    // Unknown keys are logged and ignored; wrong types or out-of-range
    // values throw ConfigError.
    static CoachConfig from_json(const nlohmann::json& document);
    static CoachConfig load_file(const std::string& path);

    // Clamps a requested trial count into [min_trials, max_trials];
    // non-positive requests get default_trials.
    int resolve_trials(int requested) const;

    spdlog::level::level_enum spdlog_level() const;
};

nlohmann::json to_json_document(const CoachConfig& config);

} // namespace poker_coach

#endif // POKER_COACH_COACH_CONFIG_H
