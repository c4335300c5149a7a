#include "gtest/gtest.h"
#include "scenario.h"
#include "errors.h"

#include <set>
#include <stdexcept>

namespace poker_coach {

namespace {

ScenarioConfig seeded(uint64_t seed) {
    ScenarioConfig config;
    config.seed = seed;
    return config;
}

// SB bets 5 into 14.5, BB calls, hero on the button.
ScenarioConfig bet_and_call_spot() {
    ScenarioConfig config;
    config.seed = 7;
    config.num_players = 6;
    config.hero_position = "BTN";
    config.street = Street::FLOP;
    config.action_context = ActionContext::FACING_BET_AND_CALL;
    config.pot_bb = 14.5;
    config.to_call_bb = 5.0;
    config.equal_stacks = false;
    config.seats = {
        {"SB", std::string("calling_station"), 120.0, true},
        {"BB", std::string("weak_tight"), 95.0, true},
        {"UTG", std::nullopt, std::nullopt, false},
        {"HJ", std::nullopt, std::nullopt, false},
        {"CO", std::nullopt, std::nullopt, false},
    };
    return config;
}

const Seat& seat_at(const Scenario& s, const std::string& position) {
    for (const Seat& seat : s.seats) {
        if (seat.position == position) return seat;
    }
    throw std::out_of_range(position);
}

} // namespace

TEST(ScenarioTest, PositionsForTable) {
    EXPECT_EQ(positions_for_table(2), (std::vector<std::string>{"BTN", "BB"}));
    EXPECT_EQ(positions_for_table(6), (std::vector<std::string>{"BTN", "SB", "BB", "UTG", "HJ", "CO"}));
    EXPECT_EQ(positions_for_table(7).size(), 7u);
    EXPECT_THROW(positions_for_table(1), ConfigError);
    EXPECT_THROW(positions_for_table(8), ConfigError);
}

TEST(ScenarioTest, EnumNames) {
    EXPECT_EQ(node_type_from_string("three_bet_pot"), NodeType::THREE_BET_POT);
    EXPECT_EQ(action_context_to_string(ActionContext::FACING_BET_AND_CALL), "facing_bet_and_call");
    EXPECT_EQ(action_type_from_string("raise"), ActionType::RAISE);
    EXPECT_EQ(intent_from_string(""), Intent::NONE);
    EXPECT_EQ(intent_to_string(Intent::BLUFF), "bluff");
    EXPECT_THROW(node_type_from_string("limped_pot"), ConfigError);
    EXPECT_THROW(action_type_from_string("jam"), ConfigError);
    EXPECT_THROW(intent_from_string("merge"), ConfigError);
}

TEST(ScenarioTest, RoundBb) {
    EXPECT_DOUBLE_EQ(round_bb(2.25), 2.3);
    EXPECT_DOUBLE_EQ(round_bb(-2.25), -2.3);
    EXPECT_DOUBLE_EQ(round_bb(9.94), 9.9);
}

TEST(ScenarioTest, SameSeedSameScenario) {
    ScenarioGenerator generator;
    Scenario a = generator.generate(seeded(42));
    Scenario b = generator.generate(seeded(42));

    EXPECT_EQ(a.seed, 42u);
    EXPECT_EQ(a.hero_hand, b.hero_hand);
    EXPECT_EQ(a.board, b.board);
    EXPECT_EQ(a.action_history, b.action_history);
    EXPECT_EQ(a.legal_actions, b.legal_actions);
    EXPECT_DOUBLE_EQ(a.pot_bb, b.pot_bb);
    EXPECT_DOUBLE_EQ(a.to_call_bb, b.to_call_bb);
    EXPECT_EQ(a.raise_size_options_bb, b.raise_size_options_bb);
    ASSERT_EQ(a.seats.size(), b.seats.size());
    for (size_t i = 0; i < a.seats.size(); ++i) {
        EXPECT_EQ(a.seats[i].archetype_key, b.seats[i].archetype_key);
        EXPECT_EQ(a.seats[i].in_hand, b.seats[i].in_hand);
    }

    // Ids are unique per generated scenario.
    EXPECT_NE(a.scenario_id, b.scenario_id);
    EXPECT_EQ(a.scenario_id.rfind("scn_", 0), 0u);
    EXPECT_EQ(a.scenario_id.size(), 16u);
}

TEST(ScenarioTest, DealtCardsAreDistinct) {
    ScenarioGenerator generator;
    for (uint64_t seed = 1; seed <= 25; ++seed) {
        ScenarioConfig config = seeded(seed);
        config.street = Street::RIVER;
        Scenario s = generator.generate(config);
        ASSERT_EQ(s.hero_hand.size(), 2u);
        ASSERT_EQ(s.board.size(), 5u);
        std::set<Card> cards(s.hero_hand.begin(), s.hero_hand.end());
        cards.insert(s.board.begin(), s.board.end());
        EXPECT_EQ(cards.size(), 7u);
        EXPECT_EQ(s.players_in_hand, 3);
        EXPECT_EQ(s.active_villains().size(), 2u);
        EXPECT_GT(s.pot_bb, 0.0);
    }
}

TEST(ScenarioTest, ReplayedSpot) {
    ScenarioGenerator generator;
    Scenario s = generator.generate(bet_and_call_spot());

    EXPECT_EQ(s.players_in_hand, 3);
    EXPECT_EQ(s.action_context, ActionContext::FACING_BET_AND_CALL);
    EXPECT_DOUBLE_EQ(s.pot_bb, 14.5);
    EXPECT_DOUBLE_EQ(s.to_call_bb, 5.0);
    EXPECT_DOUBLE_EQ(s.effective_stack_bb, 95.0);
    EXPECT_EQ(s.legal_actions, (std::vector<ActionType>{ActionType::FOLD, ActionType::CALL, ActionType::RAISE}));
    EXPECT_TRUE(s.bet_size_options_bb.empty());

    ASSERT_EQ(s.raise_size_options_bb.size(), 4u);
    EXPECT_DOUBLE_EQ(s.raise_size_options_bb.front(), 10.0);
    EXPECT_NEAR(s.raise_size_options_bb.back(), 23.1, 1e-9);
    EXPECT_DOUBLE_EQ(s.min_size_bb(ActionType::RAISE), 10.0);
    EXPECT_DOUBLE_EQ(s.max_size_bb(), 95.0);

    EXPECT_EQ(seat_at(s, "SB").role, SeatRole::BETTOR);
    EXPECT_EQ(seat_at(s, "SB").archetype_key, "calling_station");
    EXPECT_DOUBLE_EQ(seat_at(s, "SB").stack_bb, 120.0);
    EXPECT_EQ(seat_at(s, "BB").role, SeatRole::CALLER);
    EXPECT_EQ(seat_at(s, "BTN").role, SeatRole::HERO_TO_ACT);
    EXPECT_TRUE(seat_at(s, "BTN").is_hero);
    EXPECT_EQ(seat_at(s, "UTG").role, SeatRole::OUT);
    EXPECT_FALSE(seat_at(s, "UTG").in_hand);

    ASSERT_EQ(s.action_history.size(), 3u);
    EXPECT_EQ(s.action_history[0], "Preflop setup: single-raised pot.");
    EXPECT_EQ(s.action_history[1], "SB bets 5.0bb into 14.5bb.");
    EXPECT_EQ(s.action_history[2], "BB calls 5.0bb.");
}

TEST(ScenarioTest, ContextResolvesDownward) {
    ScenarioGenerator generator;
    ScenarioConfig config = seeded(3);
    config.num_players = 2;
    config.hero_position = "BTN";
    config.action_context = ActionContext::FACING_BET_AND_CALL;
    Scenario heads_up = generator.generate(config);
    EXPECT_EQ(heads_up.requested_context, ActionContext::FACING_BET_AND_CALL);
    EXPECT_EQ(heads_up.action_context, ActionContext::FACING_BET);
    EXPECT_EQ(seat_at(heads_up, "BB").role, SeatRole::BETTOR);

    // First to act preflop: nobody can have bet yet.
    ScenarioConfig preflop = seeded(3);
    preflop.street = Street::PREFLOP;
    preflop.hero_position = "UTG";
    preflop.seats = {{"UTG", std::nullopt, std::nullopt, true}};
    Scenario first = generator.generate(preflop);
    EXPECT_EQ(first.action_context, ActionContext::CHECKED_TO_HERO);
    EXPECT_TRUE(first.board.empty());
    EXPECT_DOUBLE_EQ(first.to_call_bb, 0.0);
    EXPECT_EQ(first.legal_actions, (std::vector<ActionType>{ActionType::CHECK, ActionType::BET}));
    EXPECT_EQ(first.action_history.back(), "Hero (UTG) now faces preflop decision.");
}

TEST(ScenarioTest, CheckedToHeroBetMenu) {
    ScenarioGenerator generator;
    ScenarioConfig config = seeded(11);
    config.action_context = ActionContext::CHECKED_TO_HERO;
    config.pot_bb = 10.0;
    Scenario s = generator.generate(config);

    EXPECT_DOUBLE_EQ(s.to_call_bb, 0.0);
    EXPECT_TRUE(s.is_legal(ActionType::CHECK));
    EXPECT_FALSE(s.is_legal(ActionType::FOLD));
    EXPECT_EQ(s.bet_size_options_bb, (std::vector<double>{3.3, 5.0, 7.5, 12.5}));
    EXPECT_EQ(s.action_history.back(), "Action checks to Hero.");

    config.to_call_bb = 2.0;
    EXPECT_THROW(generator.generate(config), ConfigError);
}

TEST(ScenarioTest, FixedCardsAndValidation) {
    ScenarioGenerator generator;
    ScenarioConfig config = seeded(5);
    config.hero_hand = std::vector<Card>{"ah", "Kd"};
    config.board = std::vector<Card>{"Ks", "7d", "2c"};
    Scenario s = generator.generate(config);
    EXPECT_EQ(s.hero_hand, (std::vector<Card>{"Ah", "Kd"}));
    EXPECT_EQ(s.board, (std::vector<Card>{"Ks", "7d", "2c"}));

    config.board = std::vector<Card>{"Kd", "7d", "2c"};
    EXPECT_THROW(generator.generate(config), ConfigError);
    config.board = std::vector<Card>{"Ks", "7d"};
    EXPECT_THROW(generator.generate(config), ConfigError);
    config.board = std::vector<Card>{"Ks", "7d", "Zz"};
    EXPECT_THROW(generator.generate(config), ConfigError);

    ScenarioConfig bad_street = seeded(5);
    bad_street.street = Street::SHOWDOWN;
    EXPECT_THROW(generator.generate(bad_street), ConfigError);

    ScenarioConfig bad_table = seeded(5);
    bad_table.num_players = 9;
    EXPECT_THROW(generator.generate(bad_table), ConfigError);

    ScenarioConfig bad_pot = seeded(5);
    bad_pot.pot_bb = -1.0;
    EXPECT_THROW(generator.generate(bad_pot), ConfigError);
}

TEST(ScenarioTest, UnknownArchetypeFallsBackToTagReg) {
    ScenarioGenerator generator;
    ScenarioConfig config = seeded(9);
    config.seats = {{"SB", std::string("shark"), std::nullopt, true}};
    Scenario s = generator.generate(config);
    EXPECT_EQ(seat_at(s, "SB").archetype_key, "tag_reg");
}

} // namespace poker_coach
