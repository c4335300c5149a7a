#include "coach_service.h"
#include "archetypes.h"
#include "errors.h"
#include "seeding.h"

#include <random> // For std::random_device

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

namespace poker_coach {

CoachService::CoachService(CoachConfig config)
    : config_(std::move(config)),
      monte_carlo_(config_.worker_threads),
      session_counter_(0) {
    spdlog::debug("CoachService created (trials {} in [{}, {}])",
                  config_.default_trials, config_.min_trials, config_.max_trials);
}

ParseReport CoachService::load_hands(const std::vector<std::string>& paths) const {
    HandHistoryParser parser;
    return parser.load_files(paths);
}

std::vector<PlayerBucket> CoachService::players(const std::vector<HandRecord>& hands) const {
    return HandHistoryParser::player_buckets(hands);
}

PlayerProfile CoachService::aggregate_profile(const std::vector<HandRecord>& hands, const std::string& player_id) const {
    return poker_coach::aggregate_profile(hands, player_id);
}

ArchetypeMatch CoachService::match_archetype(const StatVector& stats) const {
    return matcher_.match(stats);
}

ArchetypeMatch CoachService::match_profile(const PlayerProfile& profile) const {
    return matcher_.match(ArchetypeMatcher::from_profile(profile));
}

ScenarioConfig CoachService::default_scenario_config() const {
    ScenarioConfig config;
    config.default_stack_bb = config_.default_stack_bb;
    config.small_blind = config_.small_blind;
    config.big_blind = config_.big_blind;
    return config;
}

Scenario CoachService::generate_scenario(const ScenarioConfig& config) {
    Scenario scenario = generator_.generate(config);
    store_.add_scenario(scenario);
    spdlog::info("Generated {} ({} {} {}, hero {} {})", scenario.scenario_id, street_to_string(scenario.street),
                 node_type_to_string(scenario.node_type), action_context_to_string(scenario.action_context),
                 scenario.hero_position, fmt::join(scenario.hero_hand, ""));
    return scenario;
}

Scenario CoachService::get_scenario(const std::string& scenario_id) const {
    return store_.get_scenario(scenario_id);
}

EvaluationResponse CoachService::evaluate_decision(const std::string& scenario_id,
                                                   const Decision& decision,
                                                   std::optional<int> simulations) {
    if (scenario_id.empty()) {
        throw ConfigError("scenario_id is required");
    }
    EvaluationResponse response;
    response.scenario = store_.get_scenario(scenario_id);
    int trials = config_.resolve_trials(simulations.value_or(0));
    response.evaluation = poker_coach::evaluate_decision(response.scenario, decision, trials, monte_carlo_);
    response.attempt = store_.save_attempt(response.scenario, response.evaluation);
    return response;
}

ProgressSummary CoachService::progress() const {
    return store_.progress_summary();
}

ClearResult CoachService::clear_saved() {
    return store_.clear();
}

LiveSessionState CoachService::start_live_session(const OpponentProfile& opponent,
                                                  std::optional<uint64_t> seed,
                                                  std::optional<double> starting_stack_bb) {
    uint64_t session_seed = 0;
    if (seed) {
        session_seed = *seed;
    } else {
        std::random_device rd;
        session_seed = std::uniform_int_distribution<uint64_t>(1, 10000000)(rd);
    }
    uint64_t counter = session_counter_.fetch_add(1) + 1;
    std::string session_id = fmt::format("live_{:012x}", splitmix64(session_seed ^ splitmix64(counter)) & 0xFFFFFFFFFFFFULL);

    auto session = std::make_shared<LiveSession>(session_id, opponent, session_seed,
                                                 starting_stack_bb.value_or(config_.default_stack_bb));
    store_.save_session(session);
    return session->state();
}

LiveSessionState CoachService::start_live_session_from_archetype(const std::string& archetype_key,
                                                                 std::optional<uint64_t> seed) {
    const Archetype& archetype = archetype_by_key(archetype_key);
    return start_live_session(OpponentProfile::from_archetype(archetype), seed);
}

LiveSessionState CoachService::live_state(const std::string& session_id) const {
    return store_.get_session(session_id)->state();
}

LiveSessionState CoachService::advance_live_session(const std::string& session_id, const LiveCommand& command) {
    std::shared_ptr<LiveSession> session = store_.get_session(session_id);
    if (command.new_hand) {
        return session->new_hand();
    }
    return session->act(command.action, command.size_bb, command.intent);
}

} // namespace poker_coach
