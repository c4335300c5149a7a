#include "gtest/gtest.h"
#include "coach_service.h"
#include "errors.h"

#include <cstdio>
#include <fstream>
#include <string>

namespace poker_coach {

namespace {

CoachConfig test_config() {
    CoachConfig config;
    config.worker_threads = 2;
    config.default_stack_bb = 80.0;
    return config;
}

class CoachServiceTest : public ::testing::Test {
protected:
    CoachServiceTest() : service(test_config()) {}

    Scenario flop_spot(uint64_t seed) {
        ScenarioConfig config = service.default_scenario_config();
        config.seed = seed;
        return service.generate_scenario(config);
    }

    CoachService service;
};

} // namespace

TEST_F(CoachServiceTest, DefaultScenarioConfigUsesSettings) {
    ScenarioConfig config = service.default_scenario_config();
    EXPECT_DOUBLE_EQ(config.default_stack_bb, 80.0);
    EXPECT_DOUBLE_EQ(config.big_blind, DEFAULT_BIG_BLIND);
    EXPECT_EQ(service.config().worker_threads, 2);
}

TEST_F(CoachServiceTest, GeneratedScenarioIsStored) {
    Scenario scenario = flop_spot(42);
    EXPECT_EQ(scenario.scenario_id.rfind("scn_", 0), 0u);
    EXPECT_EQ(service.get_scenario(scenario.scenario_id).hero_hand, scenario.hero_hand);
    EXPECT_THROW(service.get_scenario("scn_ffffffffffff"), NotFoundError);
}

TEST_F(CoachServiceTest, SameSeedAcrossRunsKeepsDistinctIds) {
    Scenario first = flop_spot(42);
    std::string path = ::testing::TempDir() + "poker_coach_service_store.json";
    service.store().save_file(path);

    // A second run reloads the store with a generator that starts counting from zero
    CoachService next_run(test_config());
    next_run.store().load_file(path);
    ScenarioConfig config = next_run.default_scenario_config();
    config.seed = 42;
    Scenario second = next_run.generate_scenario(config);

    EXPECT_NE(second.scenario_id, first.scenario_id);
    EXPECT_EQ(second.hero_hand, first.hero_hand);
    EXPECT_EQ(next_run.get_scenario(first.scenario_id).board, first.board);
    std::remove(path.c_str());
}

TEST_F(CoachServiceTest, EvaluateDecisionRecordsAttempt) {
    Scenario scenario = flop_spot(42);
    Decision decision;
    decision.action = ActionType::FOLD;
    decision.free_response = "too much pressure";

    EvaluationResponse response = service.evaluate_decision(scenario.scenario_id, decision, 10);
    EXPECT_EQ(response.evaluation.simulations, MIN_TRIALS); // Clamped up
    EXPECT_EQ(response.scenario.scenario_id, scenario.scenario_id);
    EXPECT_EQ(response.attempt.attempt_id, 1);
    EXPECT_EQ(response.attempt.chosen_action, ActionType::FOLD);
    EXPECT_EQ(response.attempt.free_response, "too much pressure");
    EXPECT_DOUBLE_EQ(response.attempt.ev_loss_bb, response.evaluation.ev_loss_bb);
    EXPECT_GE(response.evaluation.ev_loss_bb, 0.0);
    EXPECT_FALSE(response.evaluation.action_table.empty());

    ProgressSummary summary = service.progress();
    EXPECT_EQ(summary.attempts, 1);
    ASSERT_EQ(summary.recent_attempts.size(), 1u);
    EXPECT_EQ(summary.recent_attempts[0].scenario_id, scenario.scenario_id);
}

TEST_F(CoachServiceTest, EvaluateDecisionErrors) {
    Scenario scenario = flop_spot(42);
    Decision check;
    check.action = ActionType::CHECK;
    EXPECT_THROW(service.evaluate_decision(scenario.scenario_id, check, 120), IllegalActionError);
    EXPECT_THROW(service.evaluate_decision("scn_ffffffffffff", check), NotFoundError);
    EXPECT_THROW(service.evaluate_decision("", check), ConfigError);
    // Failed evaluations record nothing
    EXPECT_EQ(service.progress().attempts, 0);
}

TEST_F(CoachServiceTest, ClearSavedKeepsLiveSessions) {
    Scenario scenario = flop_spot(3);
    flop_spot(4);
    Decision call;
    call.action = ActionType::CALL;
    service.evaluate_decision(scenario.scenario_id, call, 120);
    LiveSessionState live = service.start_live_session_from_archetype("nit", 9);

    ClearResult result = service.clear_saved();
    EXPECT_EQ(result.attempts_deleted, 1);
    EXPECT_EQ(result.scenarios_deleted, 2);
    EXPECT_THROW(service.get_scenario(scenario.scenario_id), NotFoundError);
    EXPECT_EQ(service.live_state(live.session_id).session_id, live.session_id);
}

TEST_F(CoachServiceTest, LiveSessionLifecycle) {
    LiveSessionState state = service.start_live_session_from_archetype("calling_station", 42);
    EXPECT_EQ(state.session_id.rfind("live_", 0), 0u);
    EXPECT_EQ(state.session_id.size(), 17u);
    EXPECT_EQ(state.seed, 42u);
    EXPECT_DOUBLE_EQ(state.starting_stack_bb, 80.0);
    EXPECT_EQ(state.opponent.source, "archetype");
    EXPECT_EQ(state.hand.hero_position, "BTN");

    LiveCommand fold;
    fold.action = ActionType::FOLD;
    LiveSessionState folded = service.advance_live_session(state.session_id, fold);
    EXPECT_TRUE(folded.hand.hand_over);
    EXPECT_DOUBLE_EQ(folded.hero_net_bb, -0.5);
    EXPECT_THROW(service.advance_live_session(state.session_id, fold), IllegalActionError);

    LiveCommand next;
    next.new_hand = true;
    LiveSessionState second = service.advance_live_session(state.session_id, next);
    EXPECT_EQ(second.hand.hand_no, 2);
    EXPECT_EQ(service.live_state(state.session_id).hands_played, 2);
}

TEST_F(CoachServiceTest, LiveSessionErrors) {
    EXPECT_THROW(service.start_live_session_from_archetype("shark", 1), ConfigError);
    EXPECT_THROW(service.live_state("live_000000000000"), NotFoundError);
    EXPECT_THROW(service.advance_live_session("live_000000000000", LiveCommand{}), NotFoundError);
}

TEST_F(CoachServiceTest, SessionIdsAreUnique) {
    LiveSessionState a = service.start_live_session(OpponentProfile{}, 5);
    LiveSessionState b = service.start_live_session(OpponentProfile{}, 5, 500.0);
    EXPECT_NE(a.session_id, b.session_id);
    EXPECT_DOUBLE_EQ(b.starting_stack_bb, LIVE_MAX_STACK_BB);
    // Same seed deals the same first hand
    EXPECT_EQ(a.hand.hero_hand, b.hand.hero_hand);
}

TEST_F(CoachServiceTest, ProfilesFromHandHistory) {
    std::string path = ::testing::TempDir() + "poker_coach_service_hands.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"hands": [{
          "id": 1, "dealerSeat": 1,
          "players": [{"id": "alice", "seat": 1, "stack": 200}, {"id": "bob", "seat": 2, "stack": 200}],
          "events": [
            {"type": 3, "seat": 1, "amount": 1},
            {"type": 2, "seat": 2, "amount": 2},
            {"type": 8, "seat": 1, "amount": 6},
            {"type": 11, "seat": 2},
            {"type": 10, "seat": 1, "amount": 8}
          ]}]})";
    }
    ParseReport report = service.load_hands({path});
    ASSERT_EQ(report.hands.size(), 1u);
    EXPECT_EQ(report.errors, 0);

    std::vector<PlayerBucket> buckets = service.players(report.hands);
    ASSERT_EQ(buckets.size(), 2u);

    PlayerProfile alice = service.aggregate_profile(report.hands, "alice");
    EXPECT_EQ(alice.player_id, "alice");
    EXPECT_EQ(alice.hands_analyzed, 1);
    EXPECT_EQ(alice.style, PlayStyle::UNKNOWN); // Too few hands to classify
}

TEST_F(CoachServiceTest, MatchArchetype) {
    StatVector station{0.55, 0.08, 0.9, ""};
    EXPECT_EQ(service.match_archetype(station).key, "calling_station");

    PlayerProfile empty;
    EXPECT_THROW(service.match_profile(empty), ConfigError);
}

} // namespace poker_coach
