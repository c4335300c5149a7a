#include "json_io.h"
#include "errors.h"

#include <cmath> // For std::isinf
#include <limits>

namespace poker_coach {

namespace {

template <typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> read_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

// Leaves `out` untouched when the key is absent or null.
template <typename T>
void read_if_present(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename T>
void read_alias(const json& j, const char* key, const char* alias, T& out) {
    read_if_present(j, alias, out);
    read_if_present(j, key, out);
}

json rate_value(const std::optional<double>& rate) {
    if (!rate) return nullptr;
    if (std::isinf(*rate)) return "inf";
    return *rate;
}

const json& require(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw ConfigError(std::string("Missing required field '") + key + "'");
    }
    return *it;
}

} // namespace

// --- Enums ---

void to_json(json& j, Street street) { j = street_to_string(street); }
void from_json(const json& j, Street& street) { street = street_from_string(j.get<std::string>()); }
void to_json(json& j, NodeType type) { j = node_type_to_string(type); }
void from_json(const json& j, NodeType& type) { type = node_type_from_string(j.get<std::string>()); }
void to_json(json& j, ActionContext context) { j = action_context_to_string(context); }
void from_json(const json& j, ActionContext& context) { context = action_context_from_string(j.get<std::string>()); }
void to_json(json& j, SeatRole role) { j = seat_role_to_string(role); }

void from_json(const json& j, SeatRole& role) {
    const std::string name = j.get<std::string>();
    for (SeatRole candidate : {SeatRole::OUT, SeatRole::WAITING, SeatRole::BETTOR, SeatRole::CALLER, SeatRole::HERO_TO_ACT}) {
        if (seat_role_to_string(candidate) == name) {
            role = candidate;
            return;
        }
    }
    throw ConfigError("Unknown seat role: " + name);
}

void to_json(json& j, ActionType type) { j = action_type_to_string(type); }
void from_json(const json& j, ActionType& type) { type = action_type_from_string(j.get<std::string>()); }
void to_json(json& j, Intent intent) {
    if (intent == Intent::NONE) {
        j = nullptr;
    } else {
        j = intent_to_string(intent);
    }
}
void from_json(const json& j, Intent& intent) {
    intent = j.is_null() ? Intent::NONE : intent_from_string(j.get<std::string>());
}

// --- Hero profile ---

void to_json(json& j, const HeroProfileInput& input) {
    j = json{
        {"vpip", optional_value(input.vpip)},
        {"pfr", optional_value(input.pfr)},
        {"af", optional_value(input.af)},
        {"three_bet", optional_value(input.three_bet)},
        {"fold_to_3bet", optional_value(input.fold_to_3bet)},
    };
}

void from_json(const json& j, HeroProfileInput& input) {
    input.vpip = read_optional<double>(j, "vpip");
    input.pfr = read_optional<double>(j, "pfr");
    input.af = read_optional<double>(j, "af");
    input.three_bet = read_optional<double>(j, "three_bet");
    input.fold_to_3bet = read_optional<double>(j, "fold_to_3bet");
}

void to_json(json& j, const HeroProfile& profile) {
    j = json{
        {"vpip", profile.vpip()},
        {"pfr", profile.pfr()},
        {"af", profile.af()},
        {"three_bet", profile.three_bet()},
        {"fold_to_3bet", profile.fold_to_3bet()},
        {"vpip_pfr_gap", profile.vpip_pfr_gap()},
        {"image_bluffiness", profile.image_bluffiness()},
        {"style_label", profile.style_label()},
        {"leak_flags", profile.leak_flags()},
    };
}

void from_json(const json& j, HeroProfile& profile) {
    HeroProfileInput input;
    from_json(j, input);
    profile = HeroProfile::from_input(input);
}

void to_json(json& j, const PositionGuidance& guidance) {
    j = json{
        {"position", guidance.position},
        {"street", guidance.street},
        {"target_open_low", guidance.target_open_low},
        {"target_open_high", guidance.target_open_high},
        {"style_label", guidance.style_label},
        {"notes", guidance.notes},
    };
}

void from_json(const json& j, PositionGuidance& guidance) {
    read_if_present(j, "position", guidance.position);
    read_if_present(j, "street", guidance.street);
    read_if_present(j, "target_open_low", guidance.target_open_low);
    read_if_present(j, "target_open_high", guidance.target_open_high);
    read_if_present(j, "style_label", guidance.style_label);
    read_if_present(j, "notes", guidance.notes);
}

// --- Scenario ---

void to_json(json& j, const SeatConfig& seat) {
    j = json{
        {"position", seat.position},
        {"archetype_key", optional_value(seat.archetype_key)},
        {"stack_bb", optional_value(seat.stack_bb)},
        {"in_hand", optional_value(seat.in_hand)},
    };
}

void from_json(const json& j, SeatConfig& seat) {
    seat.position = require(j, "position").get<std::string>();
    seat.archetype_key = read_optional<std::string>(j, "archetype_key");
    if (!seat.archetype_key) seat.archetype_key = read_optional<std::string>(j, "archetype");
    seat.stack_bb = read_optional<double>(j, "stack_bb");
    seat.in_hand = read_optional<bool>(j, "in_hand");
}

void to_json(json& j, const ScenarioConfig& config) {
    j = json{
        {"seed", optional_value(config.seed)},
        {"num_players", config.num_players},
        {"street", config.street},
        {"node_type", config.node_type},
        {"action_context", config.action_context},
        {"hero_position", config.hero_position},
        {"players_in_hand", optional_value(config.players_in_hand)},
        {"equal_stacks", config.equal_stacks},
        {"default_stack_bb", config.default_stack_bb},
        {"small_blind", config.small_blind},
        {"big_blind", config.big_blind},
        {"randomize_hero_profile", config.randomize_hero_profile},
        {"randomize_archetypes", config.randomize_archetypes},
        {"hero_profile", config.hero_profile},
        {"seats", config.seats},
        {"pot_bb", optional_value(config.pot_bb)},
        {"to_call_bb", optional_value(config.to_call_bb)},
        {"hero_hand", optional_value(config.hero_hand)},
        {"board", optional_value(config.board)},
    };
}

void from_json(const json& j, ScenarioConfig& config) {
    config.seed = read_optional<uint64_t>(j, "seed");
    read_if_present(j, "num_players", config.num_players);
    read_if_present(j, "street", config.street);
    read_if_present(j, "node_type", config.node_type);
    read_if_present(j, "action_context", config.action_context);
    read_if_present(j, "hero_position", config.hero_position);
    config.players_in_hand = read_optional<int>(j, "players_in_hand");
    read_if_present(j, "equal_stacks", config.equal_stacks);
    read_if_present(j, "default_stack_bb", config.default_stack_bb);
    read_alias(j, "small_blind", "sb", config.small_blind);
    read_alias(j, "big_blind", "bb", config.big_blind);
    read_if_present(j, "randomize_hero_profile", config.randomize_hero_profile);
    read_if_present(j, "randomize_archetypes", config.randomize_archetypes);
    read_if_present(j, "hero_profile", config.hero_profile);
    read_if_present(j, "seats", config.seats);
    config.pot_bb = read_optional<double>(j, "pot_bb");
    config.to_call_bb = read_optional<double>(j, "to_call_bb");
    config.hero_hand = read_optional<std::vector<Card>>(j, "hero_hand");
    config.board = read_optional<std::vector<Card>>(j, "board");
}

void to_json(json& j, const Seat& seat) {
    j = json{
        {"seat", seat.seat},
        {"position", seat.position},
        {"is_hero", seat.is_hero},
        {"archetype_key", seat.archetype_key},
        {"archetype_label", seat.archetype_label},
        {"stack_bb", seat.stack_bb},
        {"in_hand", seat.in_hand},
        {"role", seat.role},
    };
}

void from_json(const json& j, Seat& seat) {
    read_if_present(j, "seat", seat.seat);
    read_if_present(j, "position", seat.position);
    read_if_present(j, "is_hero", seat.is_hero);
    read_if_present(j, "archetype_key", seat.archetype_key);
    read_if_present(j, "archetype_label", seat.archetype_label);
    read_if_present(j, "stack_bb", seat.stack_bb);
    read_if_present(j, "in_hand", seat.in_hand);
    read_if_present(j, "role", seat.role);
}

void to_json(json& j, const Scenario& scenario) {
    j = json{
        {"scenario_id", scenario.scenario_id},
        {"seed", scenario.seed},
        {"num_players", scenario.num_players},
        {"players_in_hand", scenario.players_in_hand},
        {"street", scenario.street},
        {"node_type", scenario.node_type},
        {"requested_action_context", scenario.requested_context},
        {"action_context", scenario.action_context},
        {"small_blind", scenario.small_blind},
        {"big_blind", scenario.big_blind},
        {"hero_position", scenario.hero_position},
        {"hero_hand", scenario.hero_hand},
        {"board", scenario.board},
        {"pot_bb", scenario.pot_bb},
        {"to_call_bb", scenario.to_call_bb},
        {"effective_stack_bb", scenario.effective_stack_bb},
        {"legal_actions", scenario.legal_actions},
        {"bet_size_options_bb", scenario.bet_size_options_bb},
        {"raise_size_options_bb", scenario.raise_size_options_bb},
        {"action_history", scenario.action_history},
        {"seats", scenario.seats},
        {"hero_profile", scenario.hero_profile},
        {"position_guidance", scenario.position_guidance},
        {"randomized_hero_profile", scenario.randomized_hero_profile},
        {"randomized_archetypes", scenario.randomized_archetypes},
        {"decision_prompt", scenario.decision_prompt},
    };
}

void from_json(const json& j, Scenario& scenario) {
    scenario.scenario_id = require(j, "scenario_id").get<std::string>();
    read_if_present(j, "seed", scenario.seed);
    read_if_present(j, "num_players", scenario.num_players);
    read_if_present(j, "players_in_hand", scenario.players_in_hand);
    read_if_present(j, "street", scenario.street);
    read_if_present(j, "node_type", scenario.node_type);
    read_if_present(j, "requested_action_context", scenario.requested_context);
    read_if_present(j, "action_context", scenario.action_context);
    read_if_present(j, "small_blind", scenario.small_blind);
    read_if_present(j, "big_blind", scenario.big_blind);
    read_if_present(j, "hero_position", scenario.hero_position);
    read_if_present(j, "hero_hand", scenario.hero_hand);
    read_if_present(j, "board", scenario.board);
    read_if_present(j, "pot_bb", scenario.pot_bb);
    read_if_present(j, "to_call_bb", scenario.to_call_bb);
    read_if_present(j, "effective_stack_bb", scenario.effective_stack_bb);
    read_if_present(j, "legal_actions", scenario.legal_actions);
    read_if_present(j, "bet_size_options_bb", scenario.bet_size_options_bb);
    read_if_present(j, "raise_size_options_bb", scenario.raise_size_options_bb);
    read_if_present(j, "action_history", scenario.action_history);
    read_if_present(j, "seats", scenario.seats);
    read_if_present(j, "hero_profile", scenario.hero_profile);
    read_if_present(j, "position_guidance", scenario.position_guidance);
    read_if_present(j, "randomized_hero_profile", scenario.randomized_hero_profile);
    read_if_present(j, "randomized_archetypes", scenario.randomized_archetypes);
    read_if_present(j, "decision_prompt", scenario.decision_prompt);
}

// --- Evaluation ---

void to_json(json& j, const Decision& decision) {
    j = json{
        {"action", decision.action},
        {"size_bb", optional_value(decision.size_bb)},
        {"intent", decision.intent},
        {"free_response", decision.free_response},
    };
}

void from_json(const json& j, Decision& decision) {
    decision.action = require(j, "action").get<ActionType>();
    decision.size_bb = read_optional<double>(j, "size_bb");
    read_if_present(j, "intent", decision.intent);
    read_if_present(j, "free_response", decision.free_response);
}

void to_json(json& j, const ActionRow& row) {
    j = json{
        {"action", row.action},
        {"size_bb", optional_value(row.size_bb)},
        {"intent", row.intent},
        {"label", row.label},
        {"equity", row.equity},
        {"fold_equity", row.fold_equity},
        {"expected_callers", row.expected_callers},
        {"pot_if_called_bb", row.pot_if_called_bb},
        {"risk_bb", row.risk_bb},
        {"realization", row.realization},
        {"ev_bb", row.ev_bb},
        {"ev_ci_bb", row.ev_ci_bb},
        {"custom_size", row.custom_size},
    };
}

void to_json(json& j, const LeakFactor& factor) {
    j = json{
        {"factor", factor.factor},
        {"impact_bb", factor.impact_bb},
        {"share_pct", factor.share_pct},
        {"detail", factor.detail},
    };
}

void to_json(json& j, const SpotMath& math) {
    j = json{
        {"pot_bb", math.pot_bb},
        {"to_call_bb", math.to_call_bb},
        {"spr", math.spr},
        {"spr_label", math.spr_label},
        {"spr_notes", math.spr_notes},
        {"required_equity", math.required_equity},
        {"mdf", math.mdf},
        {"bet_to_pot", math.bet_to_pot},
        {"break_even_fold", math.break_even_fold},
        {"target_bluff_share", math.target_bluff_share},
        {"target_bluff_to_value", math.target_bluff_to_value},
        {"chosen_action", math.chosen_action},
        {"chosen_size_bb", math.chosen_size_bb},
    };
}

void to_json(json& j, const BlockerSignals& signals) {
    j = json{
        {"nut_flush_blocker", signals.nut_flush_blocker},
        {"broadway_blockers", signals.broadway_blockers},
        {"paired_board_blockers", signals.paired_board_blockers},
        {"signal_text", signals.signal_text},
    };
}

void to_json(json& j, const OpponentSnapshot& snapshot) {
    j = json{
        {"archetype_mix", snapshot.archetype_mix},
        {"average_street_fold_rate", snapshot.average_street_fold_rate},
        {"players_in_hand", snapshot.players_in_hand},
        {"texture_label", snapshot.texture_label},
    };
}

void to_json(json& j, const HeroProfileAnalysis& analysis) {
    j = json{
        {"hero_profile", analysis.hero_profile},
        {"position_guidance", analysis.position_guidance},
        {"leak_flags", analysis.leak_flags},
        {"recommendations", analysis.recommendations},
        {"opponent_snapshot", analysis.opponent_snapshot},
        {"spot_math", analysis.spot_math},
    };
}

void to_json(json& j, const LeakReport& report) {
    j = json{
        {"summary", report.summary},
        {"optimal_gap_bb", report.optimal_gap_bb},
        {"factor_breakdown", report.factor_breakdown},
        {"hero_profile_analysis", report.hero_profile_analysis},
    };
}

void to_json(json& j, const EvaluationResult& result) {
    j = json{
        {"scenario_id", result.scenario_id},
        {"decision", result.decision},
        {"best_action", result.best_action},
        {"chosen_action", result.chosen_action},
        {"ev_loss_bb", result.ev_loss_bb},
        {"verdict", result.verdict},
        {"mistake_tags", result.mistake_tags},
        {"action_table", result.action_table},
        {"leak_report", result.leak_report},
        {"simulations", result.simulations},
    };
}

// --- Player analysis ---

void to_json(json& j, const StatRates& rates) {
    j = json{
        {"hands", rates.hands},
        {"vpip", rate_value(rates.vpip)},
        {"pfr", rate_value(rates.pfr)},
        {"vpip_pfr_gap", rate_value(rates.vpip_pfr_gap)},
        {"limp", rate_value(rates.limp)},
        {"cold_call", rate_value(rates.cold_call)},
        {"three_bet", rate_value(rates.three_bet)},
        {"fold_to_3bet", rate_value(rates.fold_to_3bet)},
        {"avg_open_raise_bb", rate_value(rates.avg_open_raise_bb)},
        {"avg_three_bet_bb", rate_value(rates.avg_three_bet_bb)},
        {"cbet_flop", rate_value(rates.cbet_flop)},
        {"cbet_turn", rate_value(rates.cbet_turn)},
        {"cbet_river", rate_value(rates.cbet_river)},
        {"fold_to_bet_flop", rate_value(rates.fold_to_bet_flop)},
        {"fold_to_bet_turn", rate_value(rates.fold_to_bet_turn)},
        {"fold_to_bet_river", rate_value(rates.fold_to_bet_river)},
        {"double_barrel", rate_value(rates.double_barrel)},
        {"triple_barrel", rate_value(rates.triple_barrel)},
        {"check_raise", rate_value(rates.check_raise)},
        {"overbet", rate_value(rates.overbet)},
        {"aggression_factor", rate_value(rates.aggression_factor)},
        {"aggression_frequency", rate_value(rates.aggression_frequency)},
        {"wtsd", rate_value(rates.wtsd)},
        {"wsd", rate_value(rates.wsd)},
        {"avg_showdown_strength", rate_value(rates.avg_showdown_strength)},
        {"river_bet_value", rate_value(rates.river_bet_value)},
        {"river_bet_bluff", rate_value(rates.river_bet_bluff)},
        {"opportunities", {
            {"three_bet", rates.three_bet_opportunities},
            {"fold_to_3bet", rates.fold_to_3bet_opportunities},
            {"flop_cbet", rates.flop_cbet_opportunities},
            {"flop_faced_bet", rates.flop_faced_bet},
            {"turn_faced_bet", rates.turn_faced_bet},
            {"double_barrel", rates.double_barrel_opportunities},
            {"check_raise", rates.check_raise_opportunities},
            {"river_bet_samples", rates.river_bet_samples},
        }},
    };
}

void to_json(json& j, const Exploit& exploit) {
    j = json{
        {"category", exploit.category},
        {"description", exploit.description},
        {"counter_strategy", exploit.counter_strategy},
        {"confidence", exploit.confidence},
    };
}

void to_json(json& j, const PlayerProfile& profile) {
    j = json{
        {"player_id", profile.player_id},
        {"hands_analyzed", profile.hands_analyzed},
        {"confidence", profile.confidence},
        {"style", profile.style_label()},
        {"stats", profile.rates},
        {"tendencies", profile.tendencies},
        {"exploits", profile.exploits},
    };
}

void to_json(json& j, const PlayerBucket& bucket) {
    j = json{{"player_id", bucket.player_id}, {"hands_seen", bucket.hands_seen}};
}

void from_json(const json& j, StatVector& stats) {
    stats.vpip = require(j, "vpip").get<double>();
    stats.pfr = require(j, "pfr").get<double>();
    const json& af = require(j, "af");
    if (af.is_string() && af.get<std::string>() == "inf") {
        stats.af = std::numeric_limits<double>::infinity();
    } else {
        stats.af = af.get<double>();
    }
    read_alias(j, "style_label", "style", stats.style_label);
}

void to_json(json& j, const ArchetypeMatch& match) {
    j = json{
        {"key", match.key},
        {"label", match.label},
        {"distance", match.distance},
        {"score", match.score},
    };
}

// --- Live play ---

void to_json(json& j, const OpponentProfile& profile) {
    j = json{
        {"name", profile.name},
        {"style_label", profile.style_label},
        {"source", profile.source},
        {"hands_analyzed", profile.hands_analyzed},
        {"vpip", profile.vpip},
        {"pfr", profile.pfr},
        {"three_bet", profile.three_bet},
        {"fold_to_3bet", profile.fold_to_3bet},
        {"limp_rate", profile.limp_rate},
        {"af", profile.af},
        {"aggression_frequency", profile.aggression_frequency},
        {"flop_cbet", profile.flop_cbet},
        {"turn_cbet", profile.turn_cbet},
        {"river_cbet", profile.river_cbet},
        {"check_raise", profile.check_raise},
        {"wtsd", profile.wtsd},
        {"w_sd", profile.w_sd},
    };
}

void from_json(const json& j, OpponentProfile& profile) {
    read_if_present(j, "name", profile.name);
    read_alias(j, "style_label", "style", profile.style_label);
    read_if_present(j, "source", profile.source);
    read_if_present(j, "hands_analyzed", profile.hands_analyzed);
    read_if_present(j, "vpip", profile.vpip);
    read_if_present(j, "pfr", profile.pfr);
    read_if_present(j, "three_bet", profile.three_bet);
    read_if_present(j, "fold_to_3bet", profile.fold_to_3bet);
    read_if_present(j, "limp_rate", profile.limp_rate);
    read_if_present(j, "af", profile.af);
    read_if_present(j, "aggression_frequency", profile.aggression_frequency);
    read_if_present(j, "flop_cbet", profile.flop_cbet);
    read_if_present(j, "turn_cbet", profile.turn_cbet);
    read_if_present(j, "river_cbet", profile.river_cbet);
    read_if_present(j, "check_raise", profile.check_raise);
    read_if_present(j, "wtsd", profile.wtsd);
    read_if_present(j, "w_sd", profile.w_sd);
}

void to_json(json& j, const LiveShowdown& showdown) {
    j = json{
        {"winner", showdown.winner},
        {"reason", showdown.reason},
        {"hero_hand_category", showdown.hero_hand_category},
        {"villain_hand_category", showdown.villain_hand_category},
        {"hero_share", showdown.hero_share},
        {"hero_delta_bb", showdown.hero_delta_bb},
        {"board", showdown.board},
    };
}

void to_json(json& j, const LiveHandState& hand) {
    j = json{
        {"hand_no", hand.hand_no},
        {"hero_position", hand.hero_position},
        {"street", hand.street},
        {"board", hand.board},
        {"hero_hand", hand.hero_hand},
        {"pot_bb", hand.pot_bb},
        {"to_call_bb", hand.to_call_bb},
        {"action_context", hand.action_context},
        {"legal_actions", hand.legal_actions},
        {"size_options_bb", hand.size_options_bb},
        {"action_history", hand.action_history},
        {"hero_stack_bb", hand.hero_stack_bb},
        {"villain_stack_bb", hand.villain_stack_bb},
        {"hand_over", hand.hand_over},
        {"hero_delta_bb", hand.hero_delta_bb},
    };
    if (hand.hand_over) {
        j["villain_hand"] = hand.villain_hand;
        j["showdown"] = optional_value(hand.showdown);
    }
}

void to_json(json& j, const LiveSessionState& state) {
    j = json{
        {"session_id", state.session_id},
        {"seed", state.seed},
        {"match", {
            {"hands_played", state.hands_played},
            {"hero_net_bb", state.hero_net_bb},
            {"starting_stack_bb", state.starting_stack_bb},
            {"opponent", state.opponent},
        }},
        {"hand", state.hand},
    };
}

// --- Store ---

void to_json(json& j, const AttemptRecord& attempt) {
    j = json{
        {"attempt_id", attempt.attempt_id},
        {"created_at", attempt.created_at},
        {"scenario_id", attempt.scenario_id},
        {"hero_position", attempt.hero_position},
        {"street", attempt.street},
        {"node_type", attempt.node_type},
        {"players_in_hand", attempt.players_in_hand},
        {"chosen_action", attempt.chosen_action},
        {"chosen_size_bb", optional_value(attempt.chosen_size_bb)},
        {"chosen_intent", attempt.chosen_intent},
        {"chosen_ev_bb", attempt.chosen_ev_bb},
        {"best_action", attempt.best_action},
        {"best_ev_bb", attempt.best_ev_bb},
        {"ev_loss_bb", attempt.ev_loss_bb},
        {"verdict", attempt.verdict},
        {"mistake_tags", attempt.mistake_tags},
        {"free_response", attempt.free_response},
    };
}

void from_json(const json& j, AttemptRecord& attempt) {
    attempt.attempt_id = require(j, "attempt_id").get<int64_t>();
    attempt.scenario_id = require(j, "scenario_id").get<std::string>();
    read_if_present(j, "created_at", attempt.created_at);
    read_if_present(j, "hero_position", attempt.hero_position);
    read_if_present(j, "street", attempt.street);
    read_if_present(j, "node_type", attempt.node_type);
    read_if_present(j, "players_in_hand", attempt.players_in_hand);
    read_if_present(j, "chosen_action", attempt.chosen_action);
    attempt.chosen_size_bb = read_optional<double>(j, "chosen_size_bb");
    read_if_present(j, "chosen_intent", attempt.chosen_intent);
    read_if_present(j, "chosen_ev_bb", attempt.chosen_ev_bb);
    read_if_present(j, "best_action", attempt.best_action);
    read_if_present(j, "best_ev_bb", attempt.best_ev_bb);
    read_if_present(j, "ev_loss_bb", attempt.ev_loss_bb);
    read_if_present(j, "verdict", attempt.verdict);
    read_if_present(j, "mistake_tags", attempt.mistake_tags);
    read_if_present(j, "free_response", attempt.free_response);
}

void to_json(json& j, const ProgressBucket& bucket) {
    j = json{
        {"label", bucket.label},
        {"attempts", bucket.attempts},
        {"avg_ev_loss_bb", bucket.avg_ev_loss_bb},
        {"accuracy", bucket.accuracy},
    };
}

void to_json(json& j, const ProgressSummary& summary) {
    j = json{
        {"totals", {
            {"attempts", summary.attempts},
            {"avg_ev_loss_bb", summary.avg_ev_loss_bb},
            {"accuracy", summary.accuracy},
            {"avg_chosen_ev_bb", summary.avg_chosen_ev_bb},
        }},
        {"by_position", summary.by_position},
        {"by_street", summary.by_street},
        {"by_node_type", summary.by_node_type},
        {"recent_attempts", summary.recent_attempts},
    };
}

void to_json(json& j, const ClearResult& result) {
    j = json{{"attempts_deleted", result.attempts_deleted}, {"scenarios_deleted", result.scenarios_deleted}};
}

} // namespace poker_coach
