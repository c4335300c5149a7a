#include "coach_config.h"
#include "errors.h"

#include <algorithm> // For std::min, std::max
#include <fstream>
#include <set>

namespace poker_coach {

using json = nlohmann::json;

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "default_trials", "min_trials", "max_trials", "worker_threads",
    "default_stack_bb", "small_blind", "big_blind", "log_level"};

const std::set<std::string> LOG_LEVELS = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

int read_int(const json& document, const char* key, int fallback) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("Config field '") + key + "' must be an integer");
    }
    return it->get<int>();
}

double read_number(const json& document, const char* key, double fallback) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) return fallback;
    if (!it->is_number()) {
        throw ConfigError(std::string("Config field '") + key + "' must be a number");
    }
    return it->get<double>();
}

std::string read_string(const json& document, const char* key, const std::string& fallback) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw ConfigError(std::string("Config field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

CoachConfig CoachConfig::from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Config document must be a JSON object");
    }
    for (const auto& item : document.items()) {
        if (KNOWN_KEYS.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown config key '{}'", item.key());
        }
    }

    CoachConfig config;
    config.default_trials = read_int(document, "default_trials", config.default_trials);
    config.min_trials = read_int(document, "min_trials", config.min_trials);
    config.max_trials = read_int(document, "max_trials", config.max_trials);
    config.worker_threads = read_int(document, "worker_threads", config.worker_threads);
    config.default_stack_bb = read_number(document, "default_stack_bb", config.default_stack_bb);
    config.small_blind = read_number(document, "small_blind", config.small_blind);
    config.big_blind = read_number(document, "big_blind", config.big_blind);
    config.log_level = read_string(document, "log_level", config.log_level);

    if (config.min_trials < 1 || config.max_trials < config.min_trials) {
        throw ConfigError("Config requires 1 <= min_trials <= max_trials");
    }
    if (config.default_trials < config.min_trials || config.default_trials > config.max_trials) {
        throw ConfigError("Config default_trials must lie within [min_trials, max_trials]");
    }
    if (config.worker_threads < 0) {
        throw ConfigError("Config worker_threads must be >= 0");
    }
    if (config.default_stack_bb <= 0.0) {
        throw ConfigError("Config default_stack_bb must be positive");
    }
    if (config.small_blind <= 0.0 || config.big_blind < config.small_blind) {
        throw ConfigError("Config blinds must be positive with big_blind >= small_blind");
    }
    if (LOG_LEVELS.count(config.log_level) == 0) {
        throw ConfigError("Unknown log_level '" + config.log_level + "'");
    }
    return config;
}

CoachConfig CoachConfig::load_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigError("Failed to open config file: " + path);
    }
    json document;
    try {
        ifs >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid config JSON in " + path + ": " + e.what());
    }
    spdlog::info("Loaded config file: {}", path);
    return from_json(document);
}

int CoachConfig::resolve_trials(int requested) const {
    if (requested <= 0) {
        return default_trials;
    }
    return std::max(min_trials, std::min(max_trials, requested));
}

spdlog::level::level_enum CoachConfig::spdlog_level() const {
    if (log_level == "warning") return spdlog::level::warn;
    return spdlog::level::from_str(log_level);
}

json to_json_document(const CoachConfig& config) {
    return json{
        {"default_trials", config.default_trials},
        {"min_trials", config.min_trials},
        {"max_trials", config.max_trials},
        {"worker_threads", config.worker_threads},
        {"default_stack_bb", config.default_stack_bb},
        {"small_blind", config.small_blind},
        {"big_blind", config.big_blind},
        {"log_level", config.log_level},
    };
}

} // namespace poker_coach
