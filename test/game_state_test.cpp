#include "gtest/gtest.h"
#include "game_state.h"
#include "errors.h"

#include <vector>

namespace poker_coach {

// Test fixture for GameState tests
class GameStateTest : public ::testing::Test {
protected:
    GameState state_hu; // Heads-Up state (BTN=P0=SB, BB=P1), blinds 0.5/1

    GameStateTest() : state_hu(2, 100.0, 0) {}

    void SetUp() override {
        state_hu = GameState(2, 100.0, 0);
        state_hu.deal_hands({{"As", "Ks"}, {"Qh", "Qd"}});
    }

    Action make(ActionType type, int player, double amount = 0.0) {
        Action action;
        action.type = type;
        action.player_index = player;
        action.amount = amount;
        return action;
    }
};

TEST_F(GameStateTest, InitialState) {
    ASSERT_EQ(state_hu.get_num_players(), 2);
    ASSERT_EQ(state_hu.get_button_position(), 0);
    ASSERT_EQ(state_hu.get_small_blind_index(), 0);
    ASSERT_EQ(state_hu.get_big_blind_index(), 1);
    ASSERT_EQ(state_hu.get_current_player(), 0); // SB acts first in HU
    EXPECT_DOUBLE_EQ(state_hu.get_pot_size(), 1.5);
    EXPECT_DOUBLE_EQ(state_hu.get_player_stacks()[0], 99.5);
    EXPECT_DOUBLE_EQ(state_hu.get_player_stacks()[1], 99.0);
    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(0), 0.5);
    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(1), 1.0);
    EXPECT_EQ(state_hu.get_current_street(), Street::PREFLOP);
    EXPECT_FALSE(state_hu.is_terminal());
    EXPECT_DOUBLE_EQ(state_hu.get_amount_to_call(0), 0.5);
    EXPECT_DOUBLE_EQ(state_hu.get_amount_to_call(1), 0.0);
    EXPECT_EQ(state_hu.get_player_hand(1), (std::vector<Card>{"Qh", "Qd"}));
}

TEST_F(GameStateTest, ApplyActionFold) {
    state_hu.apply_action(make(ActionType::FOLD, 0));

    EXPECT_TRUE(state_hu.is_terminal());
    EXPECT_EQ(state_hu.get_current_player(), -1);
    EXPECT_TRUE(state_hu.has_player_folded(0));
    EXPECT_EQ(state_hu.get_num_active_players(), 1);
    EXPECT_DOUBLE_EQ(state_hu.get_player_stacks()[0], 99.5);
}

TEST_F(GameStateTest, ApplyActionCallGivesBigBlindOption) {
    state_hu.apply_action(make(ActionType::CALL, 0));

    EXPECT_FALSE(state_hu.is_terminal());
    EXPECT_EQ(state_hu.get_current_street(), Street::PREFLOP);
    EXPECT_EQ(state_hu.get_current_player(), 1);
    EXPECT_DOUBLE_EQ(state_hu.get_pot_size(), 2.0);
    EXPECT_DOUBLE_EQ(state_hu.get_player_stacks()[0], 99.0);
    EXPECT_DOUBLE_EQ(state_hu.get_action_history().back().amount, 1.0);
}

TEST_F(GameStateTest, CheckClosesPreflopAndBigBlindActsFirstOnFlop) {
    state_hu.apply_action(make(ActionType::CALL, 0));
    state_hu.apply_action(make(ActionType::CHECK, 1));

    EXPECT_EQ(state_hu.get_current_street(), Street::FLOP);
    EXPECT_EQ(state_hu.get_current_player(), 1);
    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(0), 0.0);
    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(1), 0.0);
    EXPECT_DOUBLE_EQ(state_hu.get_player_contribution(0), 1.0);
}

TEST_F(GameStateTest, ApplyActionRaise) {
    state_hu.apply_action(make(ActionType::RAISE, 0, 3.0));

    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(0), 3.0);
    EXPECT_DOUBLE_EQ(state_hu.get_pot_size(), 4.0);
    EXPECT_DOUBLE_EQ(state_hu.get_last_raise_size(), 2.0);
    EXPECT_EQ(state_hu.get_last_aggressor(), 0);
    EXPECT_DOUBLE_EQ(state_hu.get_amount_to_call(1), 2.0);
    EXPECT_DOUBLE_EQ(state_hu.get_min_raise_to(1), 5.0);
    EXPECT_EQ(state_hu.get_current_player(), 1);
}

TEST_F(GameStateTest, ShortRaiseIsForcedToMinimum) {
    state_hu.apply_action(make(ActionType::RAISE, 0, 1.5));

    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(0), 2.0);
    EXPECT_DOUBLE_EQ(state_hu.get_action_history().back().amount, 2.0);
}

TEST_F(GameStateTest, OversizedRaiseIsAllIn) {
    state_hu.apply_action(make(ActionType::RAISE, 0, 500.0));

    EXPECT_TRUE(state_hu.is_player_all_in(0));
    EXPECT_DOUBLE_EQ(state_hu.get_bet_this_round(0), 100.0);
    EXPECT_DOUBLE_EQ(state_hu.get_player_stacks()[0], 0.0);

    state_hu.apply_action(make(ActionType::CALL, 1));
    EXPECT_TRUE(state_hu.is_terminal());
    EXPECT_EQ(state_hu.get_current_street(), Street::SHOWDOWN);
    EXPECT_DOUBLE_EQ(state_hu.get_pot_size(), 200.0);
}

TEST_F(GameStateTest, IllegalActionsThrow) {
    EXPECT_THROW(state_hu.apply_action(make(ActionType::CHECK, 0)), IllegalActionError);
    EXPECT_THROW(state_hu.apply_action(make(ActionType::BET, 0, 3.0)), IllegalActionError);
    EXPECT_THROW(state_hu.apply_action(make(ActionType::CALL, 1)), IllegalActionError); // Out of turn

    state_hu.apply_action(make(ActionType::CALL, 0));
    EXPECT_THROW(state_hu.apply_action(make(ActionType::CALL, 1)), IllegalActionError); // Nothing to call

    state_hu.apply_action(make(ActionType::CHECK, 1));
    EXPECT_THROW(state_hu.apply_action(make(ActionType::RAISE, 1, 2.0)), IllegalActionError); // No bet to raise
}

TEST_F(GameStateTest, ActionOnFinishedHandThrows) {
    state_hu.apply_action(make(ActionType::FOLD, 0));
    EXPECT_THROW(state_hu.apply_action(make(ActionType::CHECK, 1)), IllegalActionError);
}

TEST_F(GameStateTest, HistoryString) {
    state_hu.apply_action(make(ActionType::RAISE, 0, 3.0));
    state_hu.apply_action(make(ActionType::CALL, 1));
    ASSERT_EQ(state_hu.get_current_street(), Street::FLOP);
    state_hu.apply_action(make(ActionType::CHECK, 1));
    state_hu.apply_action(make(ActionType::BET, 0, 2.5));

    EXPECT_EQ(state_hu.get_history_string(), "r3/c/k/b2.5/");
}

TEST_F(GameStateTest, RiverCheckDownEndsAtShowdown) {
    state_hu.apply_action(make(ActionType::CALL, 0));
    state_hu.apply_action(make(ActionType::CHECK, 1));
    for (int street = 0; street < 3; ++street) {
        state_hu.apply_action(make(ActionType::CHECK, 1));
        state_hu.apply_action(make(ActionType::CHECK, 0));
    }
    EXPECT_TRUE(state_hu.is_terminal());
    EXPECT_EQ(state_hu.get_current_street(), Street::SHOWDOWN);
    EXPECT_DOUBLE_EQ(state_hu.get_pot_size(), 2.0);
}

TEST_F(GameStateTest, EffectiveStack) {
    GameState uneven(2, 50.0, 1);
    EXPECT_EQ(uneven.get_small_blind_index(), 1);
    EXPECT_EQ(uneven.get_current_player(), 1);
    EXPECT_DOUBLE_EQ(uneven.get_effective_stack(0), 49.0);
}

TEST(GameStateConstruction, RejectsBadSetup) {
    EXPECT_THROW(GameState(1), ConfigError);
    EXPECT_THROW(GameState(2, 100.0, 2), ConfigError);
    EXPECT_THROW(GameState(2, 0.0, 0), ConfigError);
    EXPECT_THROW(GameState(2, 100.0, 0, 1.0, 0.5), ConfigError);
}

TEST(GameStateConstruction, SixMaxBlindsAndFirstActor) {
    GameState six(6, 100.0, 0);
    EXPECT_EQ(six.get_small_blind_index(), 1);
    EXPECT_EQ(six.get_big_blind_index(), 2);
    EXPECT_EQ(six.get_current_player(), 3);
}

TEST(GameStateBoard, RejectsSixthCommunityCard) {
    GameState state;
    state.deal_community_cards({"2c", "7d", "9h"});
    state.deal_community_cards({"Ts", "Jc"});
    EXPECT_EQ(state.get_community_cards().size(), 5u);
    EXPECT_THROW(state.deal_community_cards({"Qd"}), PokerCoachError);
}

} // namespace poker_coach
