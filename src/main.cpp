#include <iostream>
#include <string>
#include <vector>
#include <memory>    // For std::make_shared
#include <fstream>   // For std::ifstream, std::ofstream (JSON export)
#include <iomanip>   // For std::setw, std::fixed, std::setprecision
#include <sstream>   // For std::istringstream
#include <optional>

#include "coach_config.h"
#include "coach_service.h"
#include "errors.h"
#include "json_io.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h" // For console logging
#include "spdlog/fmt/fmt.h"

using poker_coach::json;

namespace {

const char* USAGE =
    "Usage: poker_coach <command> [options]\n"
    "\n"
    "Commands:\n"
    "  analyze <hands.json>... [--player ID]   Profile players from hand histories\n"
    "  players <hands.json>...                 List players by hands seen\n"
    "  match --vpip V --pfr P --af A [--style S]\n"
    "                                          Nearest opponent archetype (rates 0..1)\n"
    "  scenario [--request FILE] [--seed N] [--players N] [--street S]\n"
    "           [--node T] [--context C] [--hero POS]\n"
    "                                          Generate a drill and store it\n"
    "  evaluate --scenario-id ID --action A [--size BB] [--intent value|bluff]\n"
    "           [--simulations N] [--reason TEXT]\n"
    "                                          Score a decision on a stored drill\n"
    "  progress                                Summary of stored attempts\n"
    "  clear                                   Delete stored drills and attempts\n"
    "  live [--archetype KEY] [--seed N] [--stack BB]\n"
    "                                          Play heads-up hands on stdin\n"
    "\n"
    "Options:\n"
    "  --config FILE   JSON runtime settings\n"
    "  --store FILE    Drill store (default poker_coach_store.json)\n"
    "  --json FILE     Also write the result as JSON\n"
    "  --verbose       Debug logging\n";

struct CliOptions {
    std::string command;
    std::vector<std::string> positional;
    std::string config_file;
    std::string store_file = "poker_coach_store.json";
    std::string json_export_file;
    bool verbose = false;

    std::string player;
    std::string request_file;
    std::optional<uint64_t> seed;
    std::optional<int> num_players;
    std::string street;
    std::string node_type;
    std::string action_context;
    std::string hero_position;

    std::string scenario_id;
    std::string action;
    std::optional<double> size_bb;
    std::string intent;
    std::optional<int> simulations;
    std::string reason;

    std::optional<double> vpip;
    std::optional<double> pfr;
    std::optional<double> af;
    std::string style;

    std::string archetype;
    std::optional<double> stack_bb;
};

double parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw poker_coach::ConfigError(fmt::format("Invalid number for {}: '{}'", flag, value));
    }
}

long long parse_integer(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw poker_coach::ConfigError(fmt::format("Invalid integer for {}: '{}'", flag, value));
    }
}

// Simple flag parser; anything that is not a flag is a positional argument.
CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        throw poker_coach::ConfigError("Missing command");
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw poker_coach::ConfigError("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") options.config_file = next();
        else if (arg == "--store") options.store_file = next();
        else if (arg == "--json") options.json_export_file = next();
        else if (arg == "--verbose" || arg == "-v") options.verbose = true;
        else if (arg == "--player") options.player = next();
        else if (arg == "--request") options.request_file = next();
        else if (arg == "--seed") {
            long long seed = parse_integer(arg, next());
            if (seed < 0) throw poker_coach::ConfigError("--seed must not be negative");
            options.seed = static_cast<uint64_t>(seed);
        }
        else if (arg == "--players") options.num_players = static_cast<int>(parse_integer(arg, next()));
        else if (arg == "--street") options.street = next();
        else if (arg == "--node") options.node_type = next();
        else if (arg == "--context") options.action_context = next();
        else if (arg == "--hero") options.hero_position = next();
        else if (arg == "--scenario-id") options.scenario_id = next();
        else if (arg == "--action") options.action = next();
        else if (arg == "--size") options.size_bb = parse_double(arg, next());
        else if (arg == "--intent") options.intent = next();
        else if (arg == "--simulations") options.simulations = static_cast<int>(parse_integer(arg, next()));
        else if (arg == "--reason") options.reason = next();
        else if (arg == "--vpip") options.vpip = parse_double(arg, next());
        else if (arg == "--pfr") options.pfr = parse_double(arg, next());
        else if (arg == "--af") options.af = parse_double(arg, next());
        else if (arg == "--style") options.style = next();
        else if (arg == "--archetype") options.archetype = next();
        else if (arg == "--stack") options.stack_bb = parse_double(arg, next());
        else if (arg.rfind("--", 0) == 0) {
            spdlog::warn("Unknown argument: {}", arg);
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

bool file_exists(const std::string& path) {
    std::ifstream ifs(path);
    return static_cast<bool>(ifs);
}

void export_json(const std::string& filename, const json& document) {
    if (filename.empty()) return;
    std::ofstream ofs(filename);
    if (!ofs) {
        throw poker_coach::PokerCoachError("Failed to open JSON file for writing: " + filename);
    }
    ofs << std::setw(2) << document << std::endl;
    spdlog::info("Result exported to {}", filename);
}

std::string format_rate(const std::optional<double>& rate) {
    if (!rate) return "  -  ";
    return fmt::format("{:5.1f}%", *rate * 100.0);
}

// --- Display ---

void display_profile(const poker_coach::PlayerProfile& profile) {
    const poker_coach::StatRates& r = profile.rates;
    std::cout << "=== " << profile.player_id << " (" << profile.hands_analyzed << " hands, "
              << profile.confidence << " confidence) ===" << std::endl;
    std::cout << "Style: " << profile.style_label() << std::endl;
    std::cout << "VPIP " << format_rate(r.vpip) << "  PFR " << format_rate(r.pfr)
              << "  3Bet " << format_rate(r.three_bet) << "  F3B " << format_rate(r.fold_to_3bet) << std::endl;
    std::cout << "CBet F/T/R " << format_rate(r.cbet_flop) << " " << format_rate(r.cbet_turn) << " "
              << format_rate(r.cbet_river) << "  AFq " << format_rate(r.aggression_frequency) << std::endl;
    if (r.aggression_factor) {
        std::cout << "AF " << std::fixed << std::setprecision(2) << *r.aggression_factor << std::endl;
    }
    for (const std::string& tendency : profile.tendencies) {
        std::cout << "  * " << tendency << std::endl;
    }
    for (const poker_coach::Exploit& exploit : profile.exploits) {
        std::cout << "  [" << exploit.category << " " << fmt::format("{:.0f}", exploit.confidence * 100.0) << "%] "
                  << exploit.description << " -> " << exploit.counter_strategy << std::endl;
    }
    std::cout << std::endl;
}

void display_scenario(const poker_coach::Scenario& s) {
    using namespace poker_coach;
    std::cout << "Drill " << s.scenario_id << " (seed " << s.seed << ")" << std::endl;
    std::cout << s.num_players << "-handed, " << s.players_in_hand << " in hand, "
              << street_to_string(s.street) << ", " << node_type_to_string(s.node_type) << ", "
              << action_context_to_string(s.action_context) << std::endl;
    std::cout << "Hero " << s.hero_position << " holds " << fmt::format("{}", fmt::join(s.hero_hand, " "))
              << "  Board: " << (s.board.empty() ? std::string("-") : fmt::format("{}", fmt::join(s.board, " ")))
              << std::endl;
    std::cout << std::fixed << std::setprecision(1)
              << "Pot " << s.pot_bb << "bb  To call " << s.to_call_bb << "bb  Effective " << s.effective_stack_bb
              << "bb" << std::endl;
    std::cout << "---------------------------------------------" << std::endl;
    for (const Seat& seat : s.seats) {
        std::cout << std::setw(5) << std::left << seat.position << std::setw(24) << seat.archetype_label
                  << std::setw(14) << seat_role_to_string(seat.role) << std::right << std::setw(7) << seat.stack_bb
                  << "bb" << std::endl;
    }
    std::cout << "---------------------------------------------" << std::endl;
    for (const std::string& line : s.action_history) {
        std::cout << "  " << line << std::endl;
    }
    std::vector<std::string> legal;
    for (ActionType action : s.legal_actions) legal.push_back(action_type_to_string(action));
    std::cout << "Legal: " << fmt::format("{}", fmt::join(legal, ", ")) << std::endl;
    if (!s.bet_size_options_bb.empty()) {
        std::cout << "Bet sizes: " << fmt::format("{}", fmt::join(s.bet_size_options_bb, ", ")) << std::endl;
    }
    if (!s.raise_size_options_bb.empty()) {
        std::cout << "Raise sizes: " << fmt::format("{}", fmt::join(s.raise_size_options_bb, ", ")) << std::endl;
    }
    std::cout << s.decision_prompt << std::endl << std::endl;
}

void display_evaluation(const poker_coach::EvaluationResponse& response) {
    using namespace poker_coach;
    const EvaluationResult& e = response.evaluation;
    std::cout << "Attempt " << response.attempt.attempt_id << " on " << e.scenario_id << " (" << e.simulations
              << " trials)" << std::endl;
    std::cout << std::fixed << std::setprecision(2)
              << "Chosen: " << e.chosen_action.label << " (" << e.chosen_action.ev_bb << "bb)" << std::endl
              << "Best:   " << e.best_action.label << " (" << e.best_action.ev_bb << "bb)" << std::endl
              << "Loss:   " << e.ev_loss_bb << "bb -> " << e.verdict << std::endl;
    if (!e.mistake_tags.empty()) {
        std::cout << "Tags:   " << fmt::format("{}", fmt::join(e.mistake_tags, ", ")) << std::endl;
    }

    std::cout << "----------------------------------------------------------------" << std::endl;
    std::cout << std::left << std::setw(22) << "Line" << std::right << std::setw(8) << "Equity" << std::setw(8)
              << "FoldEq" << std::setw(9) << "Risk" << std::setw(9) << "EV" << std::setw(8) << "+/-" << std::endl;
    for (const ActionRow& row : e.action_table) {
        std::cout << std::left << std::setw(22) << row.label << std::right << std::setw(7) << row.equity * 100.0
                  << "%" << std::setw(7) << row.fold_equity * 100.0 << "%" << std::setw(9) << row.risk_bb
                  << std::setw(9) << row.ev_bb << std::setw(8) << row.ev_ci_bb << std::endl;
    }
    std::cout << "----------------------------------------------------------------" << std::endl;

    const LeakReport& leak = e.leak_report;
    std::cout << leak.summary << std::endl;
    for (const LeakFactor& factor : leak.factor_breakdown) {
        std::cout << "  " << std::left << std::setw(26) << factor.factor << std::right << std::setw(7)
                  << factor.share_pct << "%  " << factor.detail << std::endl;
    }
    std::cout << std::endl;
}

void display_progress(const poker_coach::ProgressSummary& summary) {
    std::cout << "Attempts: " << summary.attempts << std::fixed << std::setprecision(3)
              << "  Avg loss: " << summary.avg_ev_loss_bb << "bb  Accuracy: " << summary.accuracy * 100.0 << "%"
              << std::endl;
    auto print_buckets = [](const std::string& title, const std::vector<poker_coach::ProgressBucket>& buckets) {
        if (buckets.empty()) return;
        std::cout << title << ":" << std::endl;
        for (const poker_coach::ProgressBucket& bucket : buckets) {
            std::cout << "  " << std::left << std::setw(20) << bucket.label << std::right << std::setw(5)
                      << bucket.attempts << std::setw(9) << bucket.avg_ev_loss_bb << "bb" << std::setw(8)
                      << bucket.accuracy * 100.0 << "%" << std::endl;
        }
    };
    print_buckets("By position", summary.by_position);
    print_buckets("By street", summary.by_street);
    print_buckets("By node", summary.by_node_type);
}

void display_live(const poker_coach::LiveSessionState& state) {
    using namespace poker_coach;
    const LiveHandState& hand = state.hand;
    std::cout << std::endl << "Hand #" << hand.hand_no << "  Hero " << hand.hero_position << "  "
              << street_to_string(hand.street) << std::fixed << std::setprecision(1) << "  Pot " << hand.pot_bb
              << "bb  Net " << state.hero_net_bb << "bb" << std::endl;
    std::cout << "Hero: " << fmt::format("{}", fmt::join(hand.hero_hand, " "))
              << "  Board: " << (hand.board.empty() ? std::string("-") : fmt::format("{}", fmt::join(hand.board, " ")))
              << std::endl;
    for (const std::string& line : hand.action_history) {
        std::cout << "  " << line << std::endl;
    }
    if (hand.hand_over) {
        if (!hand.villain_hand.empty()) {
            std::cout << "Villain showed " << fmt::format("{}", fmt::join(hand.villain_hand, " ")) << std::endl;
        }
        if (hand.showdown) {
            std::cout << hand.showdown->reason << std::endl;
        }
        std::cout << "Result: " << std::showpos << hand.hero_delta_bb << std::noshowpos
                  << "bb. Type 'next' for a new hand." << std::endl;
        return;
    }
    std::vector<std::string> legal;
    for (ActionType action : hand.legal_actions) legal.push_back(action_type_to_string(action));
    std::cout << "To call " << hand.to_call_bb << "bb. Legal: " << fmt::format("{}", fmt::join(legal, ", "));
    if (!hand.size_options_bb.empty()) {
        std::cout << "  Sizes: " << fmt::format("{}", fmt::join(hand.size_options_bb, ", "));
    }
    std::cout << std::endl;
}

// --- Commands ---

int run_analyze(poker_coach::CoachService& service, const CliOptions& options) {
    if (options.positional.empty()) {
        throw poker_coach::ConfigError("analyze needs at least one hand history file");
    }
    poker_coach::ParseReport report = service.load_hands(options.positional);
    spdlog::info("Parsed {} hands ({} skipped, {} warnings)", report.hands.size(), report.errors,
                 report.warnings.size());
    for (const std::string& message : report.messages) {
        spdlog::warn("{}", message);
    }

    std::vector<std::string> player_ids;
    if (!options.player.empty()) {
        player_ids.push_back(options.player);
    } else {
        for (const poker_coach::PlayerBucket& bucket : service.players(report.hands)) {
            player_ids.push_back(bucket.player_id);
        }
    }

    json output = json::array();
    for (const std::string& player_id : player_ids) {
        poker_coach::PlayerProfile profile = service.aggregate_profile(report.hands, player_id);
        display_profile(profile);
        json entry = profile;
        if (profile.hands_analyzed > 0) {
            entry["archetype"] = service.match_profile(profile);
        }
        output.push_back(entry);
    }
    export_json(options.json_export_file, output);
    return 0;
}

int run_players(poker_coach::CoachService& service, const CliOptions& options) {
    if (options.positional.empty()) {
        throw poker_coach::ConfigError("players needs at least one hand history file");
    }
    poker_coach::ParseReport report = service.load_hands(options.positional);
    std::vector<poker_coach::PlayerBucket> buckets = service.players(report.hands);
    for (const poker_coach::PlayerBucket& bucket : buckets) {
        std::cout << std::left << std::setw(24) << bucket.player_id << std::right << std::setw(6)
                  << bucket.hands_seen << std::endl;
    }
    export_json(options.json_export_file, buckets);
    return 0;
}

int run_match(poker_coach::CoachService& service, const CliOptions& options) {
    if (!options.vpip || !options.pfr || !options.af) {
        throw poker_coach::ConfigError("match needs --vpip, --pfr and --af");
    }
    poker_coach::StatVector stats;
    stats.vpip = *options.vpip;
    stats.pfr = *options.pfr;
    stats.af = *options.af;
    stats.style_label = options.style;

    poker_coach::ArchetypeMatch match = service.match_archetype(stats);
    std::cout << match.label << " (" << match.key << ")" << std::fixed << std::setprecision(3)
              << "  distance " << match.distance << "  score " << match.score << std::endl;
    export_json(options.json_export_file, match);
    return 0;
}

int run_scenario(poker_coach::CoachService& service, const CliOptions& options) {
    poker_coach::ScenarioConfig config = service.default_scenario_config();
    if (!options.request_file.empty()) {
        std::ifstream ifs(options.request_file);
        if (!ifs) {
            throw poker_coach::ConfigError("Failed to open request file: " + options.request_file);
        }
        try {
            json request;
            ifs >> request;
            // Keys absent from the request keep the configured defaults.
            json merged = config;
            merged.update(request);
            config = merged.get<poker_coach::ScenarioConfig>();
        } catch (const json::exception& e) {
            throw poker_coach::ConfigError("Invalid scenario request " + options.request_file + ": " + e.what());
        }
    }
    if (options.seed) config.seed = options.seed;
    if (options.num_players) config.num_players = *options.num_players;
    if (!options.street.empty()) config.street = poker_coach::street_from_string(options.street);
    if (!options.node_type.empty()) config.node_type = poker_coach::node_type_from_string(options.node_type);
    if (!options.action_context.empty()) {
        config.action_context = poker_coach::action_context_from_string(options.action_context);
    }
    if (!options.hero_position.empty()) config.hero_position = options.hero_position;

    poker_coach::Scenario scenario = service.generate_scenario(config);
    display_scenario(scenario);
    export_json(options.json_export_file, scenario);
    return 0;
}

int run_evaluate(poker_coach::CoachService& service, const CliOptions& options) {
    if (options.scenario_id.empty() || options.action.empty()) {
        throw poker_coach::ConfigError("evaluate needs --scenario-id and --action");
    }
    poker_coach::Decision decision;
    decision.action = poker_coach::action_type_from_string(options.action);
    decision.size_bb = options.size_bb;
    decision.intent = poker_coach::intent_from_string(options.intent);
    decision.free_response = options.reason;

    poker_coach::EvaluationResponse response =
        service.evaluate_decision(options.scenario_id, decision, options.simulations);
    display_evaluation(response);

    json output;
    output["attempt_id"] = response.attempt.attempt_id;
    output["scenario"] = response.scenario;
    output["evaluation"] = response.evaluation;
    export_json(options.json_export_file, output);
    return 0;
}

// Reads one command per line until "quit" or end of input.
int run_live(poker_coach::CoachService& service, const CliOptions& options) {
    poker_coach::LiveSessionState state;
    if (!options.archetype.empty()) {
        state = service.start_live_session_from_archetype(options.archetype, options.seed);
    } else {
        state = service.start_live_session(poker_coach::OpponentProfile(), options.seed, options.stack_bb);
    }
    const std::string session_id = state.session_id;
    std::cout << "Live session " << session_id << " vs " << state.opponent.name << " ("
              << state.opponent.style_label << ")" << std::endl;
    std::cout << "Commands: fold | check | call | bet <bb> [value|bluff] | raise <bb> [value|bluff] | next | quit"
              << std::endl;
    display_live(state);

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream words(line);
        std::string verb;
        if (!(words >> verb)) continue;
        if (verb == "quit" || verb == "q") break;

        poker_coach::LiveCommand command;
        try {
            if (verb == "next" || verb == "n") {
                command.new_hand = true;
            } else {
                command.action = poker_coach::action_type_from_string(verb);
                std::string size_text;
                std::string intent_text;
                if (words >> size_text) command.size_bb = parse_double("size", size_text);
                if (words >> intent_text) command.intent = poker_coach::intent_from_string(intent_text);
            }
            state = service.advance_live_session(session_id, command);
            display_live(state);
        } catch (const poker_coach::IllegalActionError& e) {
            std::cout << "Illegal: " << e.what() << std::endl;
        } catch (const poker_coach::ConfigError& e) {
            std::cout << "Invalid input: " << e.what() << std::endl;
        }
    }

    state = service.live_state(session_id);
    spdlog::info("Session {} finished: {} hands, net {:.1f}bb", session_id, state.hands_played, state.hero_net_bb);
    export_json(options.json_export_file, state);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // --- Setup Logging ---
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink;
    try {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        auto logger = std::make_shared<spdlog::logger>("poker_coach_logger", console_sink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return 1;
    }

    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        std::cout << USAGE;
        return argc < 2 ? 1 : 0;
    }

    try {
        CliOptions options = parse_args(argc, argv);

        poker_coach::CoachConfig config;
        if (!options.config_file.empty()) {
            config = poker_coach::CoachConfig::load_file(options.config_file);
        }
        spdlog::set_level(options.verbose ? spdlog::level::debug : config.spdlog_level());
        spdlog::debug("Configuration: {}", poker_coach::to_json_document(config).dump());

        poker_coach::CoachService service(config);
        const bool uses_store = options.command == "scenario" || options.command == "evaluate" ||
                                options.command == "progress" || options.command == "clear";
        if (uses_store && file_exists(options.store_file)) {
            service.store().load_file(options.store_file);
        }

        int status = 0;
        if (options.command == "analyze") {
            status = run_analyze(service, options);
        } else if (options.command == "players") {
            status = run_players(service, options);
        } else if (options.command == "match") {
            status = run_match(service, options);
        } else if (options.command == "scenario") {
            status = run_scenario(service, options);
        } else if (options.command == "evaluate") {
            status = run_evaluate(service, options);
        } else if (options.command == "progress") {
            poker_coach::ProgressSummary summary = service.progress();
            display_progress(summary);
            export_json(options.json_export_file, summary);
        } else if (options.command == "clear") {
            poker_coach::ClearResult result = service.clear_saved();
            std::cout << "Deleted " << result.attempts_deleted << " attempts and " << result.scenarios_deleted
                      << " drills." << std::endl;
            export_json(options.json_export_file, result);
        } else if (options.command == "live") {
            status = run_live(service, options);
        } else {
            std::cerr << "Unknown command: " << options.command << std::endl << USAGE;
            return 1;
        }

        if (uses_store) {
            service.store().save_file(options.store_file);
        }
        return status;
    } catch (const poker_coach::ConfigError& e) {
        spdlog::error("Invalid request: {}", e.what());
        return 2;
    } catch (const poker_coach::NotFoundError& e) {
        spdlog::error("{}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::error("Exception caught during execution: {}", e.what());
        return 1;
    }
}
