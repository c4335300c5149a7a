#include "scenario.h"
#include "archetypes.h"
#include "errors.h"
#include "seeding.h"

#include <algorithm> // For std::find, std::shuffle, std::sort, std::unique
#include <cmath>     // For std::round
#include <map>
#include <set>

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

namespace poker_coach {

namespace {

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

double round_to(double value, double decimals_scale) {
    return std::round(value * decimals_scale) / decimals_scale;
}

double uniform(std::mt19937_64& rng, double low, double high) {
    std::uniform_real_distribution<double> dist(low, high);
    return dist(rng);
}

template <typename T>
const T& choice(std::mt19937_64& rng, const std::vector<T>& pool) {
    std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
    return pool[dist(rng)];
}

// Draws `count` distinct cards from `deck` and removes them.
std::vector<Card> sample_cards(std::mt19937_64& rng, std::vector<Card>& deck, int count) {
    std::vector<Card> drawn;
    for (int i = 0; i < count; ++i) {
        std::uniform_int_distribution<size_t> dist(0, deck.size() - 1);
        size_t pick = dist(rng);
        drawn.push_back(deck[pick]);
        deck.erase(deck.begin() + static_cast<std::ptrdiff_t>(pick));
    }
    return drawn;
}

// Weighted default so generated pools look realistic.
const std::vector<std::string>& default_archetype_pool(const std::string& position) {
    static const std::vector<std::string> blinds = {
        "calling_station", "weak_tight", "tag_reg", "overcaller_preflop", "lag_reg"};
    static const std::vector<std::string> early = {"tag_reg", "nit", "weak_tight", "trappy"};
    static const std::vector<std::string> late = {
        "tag_reg", "lag_reg", "one_and_done", "fit_or_fold", "calling_station"};
    if (position == "SB" || position == "BB") return blinds;
    if (position == "UTG" || position == "LJ") return early;
    return late;
}

double node_preflop_pot(NodeType node) {
    switch (node) {
        case NodeType::SINGLE_RAISED_POT: return 6.5;
        case NodeType::THREE_BET_POT:     return 18.0;
        case NodeType::FOUR_BET_POT:      return 33.0;
    }
    return 6.5;
}

std::string node_text(NodeType node) {
    switch (node) {
        case NodeType::SINGLE_RAISED_POT: return "single-raised pot";
        case NodeType::THREE_BET_POT:     return "3-bet pot";
        case NodeType::FOUR_BET_POT:      return "4-bet pot";
    }
    return "pot";
}

double pot_for_spot(NodeType node, Street street, int players_in_hand, std::mt19937_64& rng) {
    double pot = node_preflop_pot(node);
    if (street == Street::PREFLOP) return pot;

    pot *= uniform(rng, 1.1, 1.45);
    if (street == Street::TURN || street == Street::RIVER) pot *= uniform(rng, 1.2, 1.6);
    if (street == Street::RIVER) pot *= uniform(rng, 1.15, 1.55);
    pot *= 1.0 + std::max(0, players_in_hand - 2) * 0.16;
    return round_to(std::max(5.0, pot), 100.0);
}

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

std::vector<std::string> preflop_order(const std::vector<std::string>& positions) {
    static const std::vector<std::string> canonical = {"UTG", "LJ", "HJ", "CO", "BTN", "SB", "BB"};
    std::vector<std::string> ordered;
    for (const auto& p : canonical) {
        if (contains(positions, p)) ordered.push_back(p);
    }
    for (const auto& p : positions) {
        if (!contains(ordered, p)) ordered.push_back(p);
    }
    return ordered;
}

std::vector<std::string> rotate_from(const std::vector<std::string>& positions, const std::string& start) {
    auto it = std::find(positions.begin(), positions.end(), start);
    std::vector<std::string> rotated(it, positions.end());
    rotated.insert(rotated.end(), positions.begin(), it);
    return rotated;
}

// Postflop action starts left of the button: SB, or BB heads-up.
std::vector<std::string> postflop_order(const std::vector<std::string>& positions) {
    if (contains(positions, "SB")) return rotate_from(positions, "SB");
    if (positions.size() == 2 && contains(positions, "BB") && contains(positions, "BTN")) {
        return {"BB", "BTN"};
    }
    if (contains(positions, "BB")) return rotate_from(positions, "BB");
    return positions;
}

std::vector<std::string> active_acting_order(const std::vector<std::string>& table,
                                             const std::vector<std::string>& active,
                                             Street street) {
    std::vector<std::string> base = street == Street::PREFLOP ? preflop_order(table) : postflop_order(table);
    std::vector<std::string> order;
    for (const auto& p : base) {
        if (contains(active, p)) order.push_back(p);
    }
    return order;
}

// Assigns bettor/caller among the players acting before hero. The context is
// resolved downward when fewer players act first than it needs.
ActionContext assign_roles(ActionContext requested,
                           const std::vector<std::string>& prefix,
                           std::map<std::string, SeatRole>& roles) {
    if (requested == ActionContext::FACING_BET_AND_CALL && prefix.size() >= 2) {
        roles[prefix[prefix.size() - 2]] = SeatRole::BETTOR;
        roles[prefix.back()] = SeatRole::CALLER;
        return ActionContext::FACING_BET_AND_CALL;
    }
    if (requested != ActionContext::CHECKED_TO_HERO && !prefix.empty()) {
        roles[prefix.back()] = SeatRole::BETTOR;
        return ActionContext::FACING_BET;
    }
    return ActionContext::CHECKED_TO_HERO;
}

void apply_in_hand_target(std::vector<Seat>& seats, int target, std::mt19937_64& rng) {
    target = std::max(2, std::min(target, static_cast<int>(seats.size())));

    std::vector<Seat*> current;
    for (auto& s : seats) {
        if (s.in_hand) current.push_back(&s);
    }
    int count = static_cast<int>(current.size());
    if (count > target) {
        std::vector<Seat*> removable;
        for (Seat* s : current) {
            if (!s->is_hero) removable.push_back(s);
        }
        std::shuffle(removable.begin(), removable.end(), rng);
        for (int i = 0; i < count - target && i < static_cast<int>(removable.size()); ++i) {
            removable[i]->in_hand = false;
        }
    } else if (count < target) {
        std::vector<Seat*> available;
        for (auto& s : seats) {
            if (!s.in_hand && !s.is_hero) available.push_back(&s);
        }
        std::shuffle(available.begin(), available.end(), rng);
        for (int i = 0; i < target - count && i < static_cast<int>(available.size()); ++i) {
            available[i]->in_hand = true;
        }
    }
}

std::vector<std::string> build_action_history(Street street,
                                              NodeType node,
                                              const std::vector<std::string>& prefix,
                                              ActionContext context,
                                              double to_call,
                                              double pot,
                                              const std::string& hero_position) {
    std::vector<std::string> history;
    history.push_back(fmt::format("Preflop setup: {}.", node_text(node)));

    if (street == Street::PREFLOP && prefix.empty()) {
        history.push_back(fmt::format("Hero ({}) now faces preflop decision.", hero_position));
        return history;
    }

    if (context == ActionContext::FACING_BET_AND_CALL && prefix.size() >= 2) {
        for (size_t i = 0; i + 2 < prefix.size(); ++i) history.push_back(prefix[i] + " checks.");
        history.push_back(fmt::format("{} bets {:.1f}bb into {:.1f}bb.", prefix[prefix.size() - 2], to_call, pot));
        history.push_back(fmt::format("{} calls {:.1f}bb.", prefix.back(), to_call));
    } else if (context == ActionContext::FACING_BET && !prefix.empty()) {
        for (size_t i = 0; i + 1 < prefix.size(); ++i) history.push_back(prefix[i] + " checks.");
        history.push_back(fmt::format("{} bets {:.1f}bb into {:.1f}bb.", prefix.back(), to_call, pot));
    } else {
        for (const auto& p : prefix) history.push_back(p + " checks.");
        history.push_back("Action checks to Hero.");
    }
    return history;
}

// Clamps, rounds to 0.1bb, sorts and drops duplicates.
std::vector<double> round_options(const std::vector<double>& raw, double min_value, double max_value) {
    std::vector<double> out;
    if (max_value <= 0.0) return out;
    for (double v : raw) {
        double r = round_bb(clamp(v, min_value, max_value));
        if (r >= min_value && r <= max_value) out.push_back(r);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<Card> validated_cards(const std::vector<Card>& raw, size_t expected, const std::string& what) {
    if (raw.size() != expected) {
        throw ConfigError(fmt::format("{} needs {} cards, got {}", what, expected, raw.size()));
    }
    std::vector<Card> cards;
    for (const auto& c : raw) {
        Card card = normalize_card(c);
        if (!is_valid_card(card)) throw ConfigError(fmt::format("Invalid card in {}: '{}'", what, c));
        cards.push_back(card);
    }
    return cards;
}

uint64_t draw_seed() {
    std::random_device rd;
    // Up to 2^53 so the seed survives a JSON round trip as a double
    std::uniform_int_distribution<uint64_t> dist(1, (1ULL << 53) - 1);
    return dist(rd);
}

} // namespace

std::string node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::SINGLE_RAISED_POT: return "single_raised_pot";
        case NodeType::THREE_BET_POT:     return "three_bet_pot";
        case NodeType::FOUR_BET_POT:      return "four_bet_pot";
    }
    return "unknown";
}

NodeType node_type_from_string(const std::string& name) {
    if (name == "single_raised_pot") return NodeType::SINGLE_RAISED_POT;
    if (name == "three_bet_pot") return NodeType::THREE_BET_POT;
    if (name == "four_bet_pot") return NodeType::FOUR_BET_POT;
    throw ConfigError("node_type must be one of single_raised_pot, three_bet_pot, four_bet_pot; got '" + name + "'");
}

std::string action_context_to_string(ActionContext context) {
    switch (context) {
        case ActionContext::CHECKED_TO_HERO:     return "checked_to_hero";
        case ActionContext::FACING_BET:          return "facing_bet";
        case ActionContext::FACING_BET_AND_CALL: return "facing_bet_and_call";
    }
    return "unknown";
}

ActionContext action_context_from_string(const std::string& name) {
    if (name == "checked_to_hero") return ActionContext::CHECKED_TO_HERO;
    if (name == "facing_bet") return ActionContext::FACING_BET;
    if (name == "facing_bet_and_call") return ActionContext::FACING_BET_AND_CALL;
    throw ConfigError("action_context must be one of checked_to_hero, facing_bet, facing_bet_and_call; got '" +
                      name + "'");
}

std::string seat_role_to_string(SeatRole role) {
    switch (role) {
        case SeatRole::OUT:         return "out";
        case SeatRole::WAITING:     return "waiting";
        case SeatRole::BETTOR:      return "bettor";
        case SeatRole::CALLER:      return "caller";
        case SeatRole::HERO_TO_ACT: return "hero_to_act";
    }
    return "unknown";
}

std::string action_type_to_string(ActionType type) {
    switch (type) {
        case ActionType::FOLD:  return "fold";
        case ActionType::CHECK: return "check";
        case ActionType::CALL:  return "call";
        case ActionType::BET:   return "bet";
        case ActionType::RAISE: return "raise";
    }
    return "unknown";
}

ActionType action_type_from_string(const std::string& name) {
    if (name == "fold") return ActionType::FOLD;
    if (name == "check") return ActionType::CHECK;
    if (name == "call") return ActionType::CALL;
    if (name == "bet") return ActionType::BET;
    if (name == "raise") return ActionType::RAISE;
    throw ConfigError("Unknown action '" + name + "'");
}

std::string intent_to_string(Intent intent) {
    switch (intent) {
        case Intent::NONE:  return "";
        case Intent::VALUE: return "value";
        case Intent::BLUFF: return "bluff";
    }
    return "";
}

Intent intent_from_string(const std::string& name) {
    if (name.empty() || name == "none") return Intent::NONE;
    if (name == "value") return Intent::VALUE;
    if (name == "bluff") return Intent::BLUFF;
    throw ConfigError("Unknown intent '" + name + "'");
}

const std::vector<std::string>& positions_for_table(int num_players) {
    static const std::map<int, std::vector<std::string>> sets = {
        {2, {"BTN", "BB"}},
        {3, {"BTN", "SB", "BB"}},
        {4, {"BTN", "SB", "BB", "UTG"}},
        {5, {"BTN", "SB", "BB", "UTG", "CO"}},
        {6, {"BTN", "SB", "BB", "UTG", "HJ", "CO"}},
        {7, {"BTN", "SB", "BB", "UTG", "LJ", "HJ", "CO"}},
    };
    auto it = sets.find(num_players);
    if (it == sets.end()) throw ConfigError("num_players must be between 2 and 7");
    return it->second;
}

double round_bb(double value) {
    return round_to(value, 10.0);
}

bool Scenario::is_legal(ActionType action) const {
    return std::find(legal_actions.begin(), legal_actions.end(), action) != legal_actions.end();
}

std::vector<const Seat*> Scenario::active_villains() const {
    std::vector<const Seat*> villains;
    for (const auto& s : seats) {
        if (s.in_hand && !s.is_hero) villains.push_back(&s);
    }
    return villains;
}

double Scenario::min_size_bb(ActionType action) const {
    if (action == ActionType::RAISE) return std::max(to_call_bb * 2.0, to_call_bb + 1.0);
    return 1.0;
}

double Scenario::max_size_bb() const {
    return std::max(2.0, effective_stack_bb);
}

std::string scenario_id_for(uint64_t seed, uint64_t sequence) {
    return fmt::format("scn_{:012x}", splitmix64(seed ^ splitmix64(sequence)) & 0xFFFFFFFFFFFFULL);
}

ScenarioGenerator::ScenarioGenerator() : counter_(0) {
    spdlog::debug("ScenarioGenerator created");
}

Scenario ScenarioGenerator::generate(const ScenarioConfig& config) {
    Scenario s;
    s.seed = config.seed ? *config.seed : draw_seed();
    std::mt19937_64 rng(s.seed);

    if (config.street == Street::SHOWDOWN) throw ConfigError("street must be one of preflop, flop, turn, river");
    const auto& positions = positions_for_table(config.num_players);

    s.num_players = config.num_players;
    s.street = config.street;
    s.node_type = config.node_type;
    s.requested_context = config.action_context;
    s.hero_position = contains(positions, config.hero_position) ? config.hero_position : positions.front();

    double default_stack = clamp(config.default_stack_bb, 20.0, 400.0);
    if (config.small_blind > 0.0 && config.big_blind > 0.0 && config.small_blind < config.big_blind) {
        s.small_blind = config.small_blind;
        s.big_blind = config.big_blind;
    }

    // (1) hero profile
    s.randomized_hero_profile = config.randomize_hero_profile;
    s.randomized_archetypes = config.randomize_archetypes;
    s.hero_profile = config.randomize_hero_profile ? HeroProfile::randomize(rng)
                                                   : HeroProfile::from_input(config.hero_profile);

    std::map<std::string, SeatConfig> overrides;
    for (const auto& seat : config.seats) {
        if (!seat.position.empty()) overrides[seat.position] = seat;
    }

    // (2) seat archetypes in seat order
    for (size_t i = 0; i < positions.size(); ++i) {
        const std::string& position = positions[i];
        SeatConfig override;
        auto it = overrides.find(position);
        if (it != overrides.end()) override = it->second;

        Seat seat;
        seat.seat = static_cast<int>(i) + 1;
        seat.position = position;
        seat.is_hero = position == s.hero_position;
        seat.archetype_key = "hero";
        seat.archetype_label = "Hero";
        if (!seat.is_hero) {
            if (config.randomize_archetypes || !override.archetype_key || override.archetype_key->empty()) {
                seat.archetype_key = choice(rng, default_archetype_pool(position));
            } else {
                seat.archetype_key = *override.archetype_key;
                if (!is_archetype_key(seat.archetype_key)) {
                    spdlog::warn("Unknown archetype '{}' for {}, using tag_reg", seat.archetype_key, position);
                    seat.archetype_key = "tag_reg";
                }
            }
            seat.archetype_label = archetype_by_key(seat.archetype_key).label;
        }

        double stack = config.equal_stacks ? default_stack : override.stack_bb.value_or(default_stack);
        seat.stack_bb = clamp(stack, 10.0, 500.0);
        seat.in_hand = seat.is_hero || override.in_hand.value_or(true);
        seat.role = SeatRole::OUT;
        s.seats.push_back(seat);
    }

    // (3) in-hand trimming
    apply_in_hand_target(s.seats, config.players_in_hand.value_or(std::min(config.num_players, 3)), rng);

    std::vector<std::string> active;
    for (const auto& seat : s.seats) {
        if (seat.in_hand) active.push_back(seat.position);
    }
    s.players_in_hand = static_cast<int>(active.size());

    std::vector<std::string> order = active_acting_order(positions, active, s.street);
    auto hero_it = std::find(order.begin(), order.end(), s.hero_position);
    std::vector<std::string> prefix(order.begin(), hero_it);

    std::map<std::string, SeatRole> roles;
    for (const auto& p : order) roles[p] = SeatRole::WAITING;
    roles[s.hero_position] = SeatRole::HERO_TO_ACT;
    s.action_context = assign_roles(config.action_context, prefix, roles);
    for (auto& seat : s.seats) {
        if (seat.in_hand) seat.role = roles[seat.position];
    }

    // (4) pot, (5) to-call
    if (config.pot_bb) {
        if (*config.pot_bb <= 0.0) throw ConfigError("pot_bb must be positive");
        s.pot_bb = round_to(*config.pot_bb, 100.0);
    } else {
        s.pot_bb = pot_for_spot(s.node_type, s.street, s.players_in_hand, rng);
    }

    if (s.action_context == ActionContext::CHECKED_TO_HERO) {
        if (config.to_call_bb && *config.to_call_bb > 0.0) {
            throw ConfigError("to_call_bb given but no bettor acts before hero");
        }
        s.to_call_bb = 0.0;
    } else if (config.to_call_bb) {
        if (*config.to_call_bb <= 0.0) throw ConfigError("to_call_bb must be positive when facing a bet");
        s.to_call_bb = round_to(*config.to_call_bb, 100.0);
    } else if (s.action_context == ActionContext::FACING_BET) {
        s.to_call_bb = round_bb(s.pot_bb * uniform(rng, 0.22, 0.62));
    } else {
        s.to_call_bb = round_bb(s.pot_bb * uniform(rng, 0.16, 0.45));
    }

    double effective = 0.0;
    for (const auto& seat : s.seats) {
        if (seat.is_hero) effective = seat.stack_bb;
    }
    for (const auto& seat : s.seats) {
        if (seat.in_hand && !seat.is_hero) effective = std::min(effective, seat.stack_bb);
    }
    s.effective_stack_bb = round_to(effective, 100.0);

    // (6) hero cards, (7) board
    std::vector<Card> deck = full_deck();
    size_t board_count = static_cast<size_t>(board_card_count(s.street));
    std::vector<Card> fixed;
    if (config.hero_hand) {
        s.hero_hand = validated_cards(*config.hero_hand, 2, "hero_hand");
        fixed.insert(fixed.end(), s.hero_hand.begin(), s.hero_hand.end());
    }
    if (config.board) {
        s.board = validated_cards(*config.board, board_count, "board");
        fixed.insert(fixed.end(), s.board.begin(), s.board.end());
    }
    if (std::set<Card>(fixed.begin(), fixed.end()).size() != fixed.size()) {
        throw ConfigError("hero_hand and board share a card");
    }
    deck = remove_cards(deck, fixed);
    if (!config.hero_hand) s.hero_hand = sample_cards(rng, deck, 2);
    if (!config.board && board_count > 0) s.board = sample_cards(rng, deck, static_cast<int>(board_count));

    if (s.to_call_bb > 0.0) {
        if (s.to_call_bb >= s.effective_stack_bb) {
            // All-in facing: no raise is possible.
            s.legal_actions = {ActionType::FOLD, ActionType::CALL};
        } else {
            s.legal_actions = {ActionType::FOLD, ActionType::CALL, ActionType::RAISE};
            std::vector<double> raw;
            for (double pct : BET_SIZE_FRACTIONS) raw.push_back(s.to_call_bb + s.pot_bb * pct);
            raw.push_back(s.to_call_bb * 2.0);
            s.raise_size_options_bb = round_options(raw, s.min_size_bb(ActionType::RAISE), s.max_size_bb());
            if (s.raise_size_options_bb.empty()) {
                s.raise_size_options_bb = {round_bb(std::max(2.0, std::min(s.effective_stack_bb, s.to_call_bb * 2.0)))};
            }
        }
    } else {
        s.legal_actions = {ActionType::CHECK, ActionType::BET};
        std::vector<double> raw;
        for (double pct : BET_SIZE_FRACTIONS) raw.push_back(s.pot_bb * pct);
        s.bet_size_options_bb = round_options(raw, s.min_size_bb(ActionType::BET), s.max_size_bb());
        if (s.bet_size_options_bb.empty()) {
            s.bet_size_options_bb = {round_bb(std::max(1.0, s.effective_stack_bb * 0.3))};
        }
    }

    s.action_history = build_action_history(s.street, s.node_type, prefix, s.action_context,
                                            s.to_call_bb, s.pot_bb, s.hero_position);

    std::string street_name = street_to_string(s.street);
    s.position_guidance = s.hero_profile.position_guidance(s.hero_position, street_name);
    s.decision_prompt = fmt::format("Hero ({}) to act on {}. Choose one move and explain your exploit logic.",
                                    s.hero_position, street_name);

    s.scenario_id = scenario_id_for(s.seed, counter_.fetch_add(1));

    spdlog::debug("Generated scenario {} (seed {}, {} {}, {} in hand, context {})", s.scenario_id, s.seed,
                  node_type_to_string(s.node_type), street_name, s.players_in_hand,
                  action_context_to_string(s.action_context));
    return s;
}

} // namespace poker_coach
