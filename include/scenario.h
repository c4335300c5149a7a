#ifndef POKER_COACH_SCENARIO_H
#define POKER_COACH_SCENARIO_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "cards.h"
#include "hero_profile.h"

namespace poker_coach {

constexpr double DEFAULT_SMALL_BLIND = 1.0;
constexpr double DEFAULT_BIG_BLIND = 2.0;
constexpr double DEFAULT_STACK_BB = 100.0;
// Pot fractions of the bet/raise size menu.
const double BET_SIZE_FRACTIONS[] = {0.33, 0.5, 0.75, 1.25};

enum class NodeType { SINGLE_RAISED_POT, THREE_BET_POT, FOUR_BET_POT };
enum class ActionContext { CHECKED_TO_HERO, FACING_BET, FACING_BET_AND_CALL };
enum class SeatRole { OUT, WAITING, BETTOR, CALLER, HERO_TO_ACT };

// Hero choices, declared in tie-break order (fold < check < call < bet < raise).
enum class ActionType { FOLD, CHECK, CALL, BET, RAISE };
enum class Intent { NONE, VALUE, BLUFF };

std::string node_type_to_string(NodeType type);
NodeType node_type_from_string(const std::string& name); // Throws ConfigError
std::string action_context_to_string(ActionContext context);
ActionContext action_context_from_string(const std::string& name); // Throws ConfigError
std::string seat_role_to_string(SeatRole role);
std::string action_type_to_string(ActionType type);
ActionType action_type_from_string(const std::string& name); // Throws ConfigError
std::string intent_to_string(Intent intent);
Intent intent_from_string(const std::string& name); // "" -> NONE; throws ConfigError

// Table positions by size, seat order (2: BTN BB ... 7: BTN SB BB UTG LJ HJ CO).
// Throws ConfigError outside 2..7.
const std::vector<std::string>& positions_for_table(int num_players);

struct SeatConfig {
    std::string position;
    std::optional<std::string> archetype_key;
    std::optional<double> stack_bb;
    std::optional<bool> in_hand;
};

struct ScenarioConfig {
    std::optional<uint64_t> seed;
    int num_players = 6;
    Street street = Street::FLOP;
    NodeType node_type = NodeType::SINGLE_RAISED_POT;
    ActionContext action_context = ActionContext::FACING_BET;
    std::string hero_position = "BTN";
    std::optional<int> players_in_hand; // Default min(num_players, 3)
    bool equal_stacks = true;
    double default_stack_bb = DEFAULT_STACK_BB;
    double small_blind = DEFAULT_SMALL_BLIND;
    double big_blind = DEFAULT_BIG_BLIND;
    bool randomize_hero_profile = false;
    bool randomize_archetypes = false;
    HeroProfileInput hero_profile;
    std::vector<SeatConfig> seats;

    // Replay a concrete spot instead of drawing these.
    std::optional<double> pot_bb;
    std::optional<double> to_call_bb;
    std::optional<std::vector<Card>> hero_hand;
    std::optional<std::vector<Card>> board;
};

struct Seat {
    int seat = 0;
    std::string position;
    bool is_hero = false;
    std::string archetype_key; // "hero" for the hero seat
    std::string archetype_label;
    double stack_bb = 0.0;
    bool in_hand = false;
    SeatRole role = SeatRole::OUT;
};

// A generated decision point. Immutable once stored.
struct Scenario {
    std::string scenario_id;
    uint64_t seed = 0;
    int num_players = 0;
    int players_in_hand = 0;
    Street street = Street::FLOP;
    NodeType node_type = NodeType::SINGLE_RAISED_POT;
    ActionContext requested_context = ActionContext::FACING_BET;
    ActionContext action_context = ActionContext::FACING_BET;
    double small_blind = DEFAULT_SMALL_BLIND;
    double big_blind = DEFAULT_BIG_BLIND;
    std::string hero_position;
    std::vector<Card> hero_hand;
    std::vector<Card> board;
    double pot_bb = 0.0;
    double to_call_bb = 0.0;
    double effective_stack_bb = 0.0;
    std::vector<ActionType> legal_actions;
    std::vector<double> bet_size_options_bb;
    std::vector<double> raise_size_options_bb;
    std::vector<std::string> action_history;
    std::vector<Seat> seats;
    HeroProfile hero_profile;
    PositionGuidance position_guidance;
    bool randomized_hero_profile = false;
    bool randomized_archetypes = false;
    std::string decision_prompt;

    bool is_legal(ActionType action) const;
    std::vector<const Seat*> active_villains() const;
    // Inclusive size bounds for a bet or raise.
    double min_size_bb(ActionType action) const;
    double max_size_bb() const;
};

// Rounds to one decimal, half away from zero.
double round_bb(double value);

// "scn_" plus 12 hex digits mixed from the seed and a sequence number.
std::string scenario_id_for(uint64_t seed, uint64_t sequence);

class ScenarioGenerator {
public:
    ScenarioGenerator();

    // Same (seed, config) always yields the same scenario apart from its id.
    // Random draws come from one std::mt19937_64 in this order: hero profile
    // randomisation, default archetypes by seat, in-hand trimming shuffle, pot
    // multipliers, to-call fraction, hero cards, board cards.
    // Draws go through the <random> distributions, whose output is
    // implementation-defined: replays match within one standard library only.
    // The id comes from this generator's own counter; CoachStore::add_scenario
    // re-keys it from the store's persisted sequence.
    // Throws ConfigError on invalid table size or overrides.
    Scenario generate(const ScenarioConfig& config);

private:
    std::atomic<uint64_t> counter_;
};

} // namespace poker_coach

#endif // POKER_COACH_SCENARIO_H
