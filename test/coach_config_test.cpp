#include "gtest/gtest.h"
#include "coach_config.h"
#include "errors.h"

#include <cstdio>
#include <fstream>
#include <string>

namespace poker_coach {

using json = nlohmann::json;

TEST(CoachConfigTest, Defaults) {
    CoachConfig config = CoachConfig::from_json(json::object());
    EXPECT_EQ(config.default_trials, DEFAULT_TRIALS);
    EXPECT_EQ(config.min_trials, MIN_TRIALS);
    EXPECT_EQ(config.max_trials, MAX_TRIALS);
    EXPECT_EQ(config.worker_threads, 0);
    EXPECT_DOUBLE_EQ(config.default_stack_bb, DEFAULT_STACK_BB);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.spdlog_level(), spdlog::level::info);
}

TEST(CoachConfigTest, ReadsFieldsAndIgnoresUnknownKeys) {
    json document = {
        {"default_trials", 500},
        {"max_trials", 1000},
        {"worker_threads", 2},
        {"default_stack_bb", 150},
        {"log_level", "warning"},
        {"theme", "dark"},
    };
    CoachConfig config = CoachConfig::from_json(document);
    EXPECT_EQ(config.default_trials, 500);
    EXPECT_EQ(config.max_trials, 1000);
    EXPECT_EQ(config.worker_threads, 2);
    EXPECT_DOUBLE_EQ(config.default_stack_bb, 150.0);
    EXPECT_EQ(config.spdlog_level(), spdlog::level::warn);
}

TEST(CoachConfigTest, RejectsBadValues) {
    EXPECT_THROW(CoachConfig::from_json(json::array()), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"default_trials", "many"}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"default_trials", 1.5}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"min_trials", 0}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"min_trials", 500}, {"max_trials", 400}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"default_trials", 5000}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"worker_threads", -1}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"default_stack_bb", 0}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"small_blind", 3}, {"big_blind", 2}}), ConfigError);
    EXPECT_THROW(CoachConfig::from_json(json{{"log_level", "loud"}}), ConfigError);
}

TEST(CoachConfigTest, ResolveTrials) {
    CoachConfig config;
    EXPECT_EQ(config.resolve_trials(0), DEFAULT_TRIALS);
    EXPECT_EQ(config.resolve_trials(-5), DEFAULT_TRIALS);
    EXPECT_EQ(config.resolve_trials(10), MIN_TRIALS);
    EXPECT_EQ(config.resolve_trials(500), 500);
    EXPECT_EQ(config.resolve_trials(100000), MAX_TRIALS);
}

TEST(CoachConfigTest, LoadFile) {
    EXPECT_THROW(CoachConfig::load_file("/nonexistent/coach.json"), ConfigError);

    CoachConfig original;
    original.default_trials = 600;
    original.log_level = "debug";
    std::string path = ::testing::TempDir() + "poker_coach_config_test.json";
    {
        std::ofstream ofs(path);
        ofs << to_json_document(original).dump(2);
    }
    CoachConfig loaded = CoachConfig::load_file(path);
    EXPECT_EQ(loaded.default_trials, 600);
    EXPECT_EQ(loaded.spdlog_level(), spdlog::level::debug);

    {
        std::ofstream ofs(path);
        ofs << "{\"default_trials\": ";
    }
    EXPECT_THROW(CoachConfig::load_file(path), ConfigError);
    std::remove(path.c_str());
}

} // namespace poker_coach
