#include "gtest/gtest.h"
#include "ev_engine.h"
#include "evaluation.h"
#include "errors.h"

#include <algorithm>

namespace poker_coach {

// SB (calling station) bets 5bb into 14.5bb, BB (weak-tight) calls, hero on the button.
class EvEngineTest : public ::testing::Test {
protected:
    MonteCarlo monte_carlo{1};
    ScenarioGenerator generator;
    Scenario scenario;

    void SetUp() override {
        ScenarioConfig config;
        config.seed = 42;
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
        scenario = generator.generate(config);
    }

    static Decision decide(ActionType action, std::optional<double> size = std::nullopt, Intent intent = Intent::NONE) {
        Decision d;
        d.action = action;
        d.size_bb = size;
        d.intent = intent;
        return d;
    }

    static const ActionRow* find_row(const std::vector<ActionRow>& table, const Decision& decision) {
        auto it = std::find_if(table.begin(), table.end(), [&](const ActionRow& r) { return r.matches(decision); });
        return it == table.end() ? nullptr : &*it;
    }
};

TEST_F(EvEngineTest, NormalizeDecision) {
    Decision bet = normalize_decision(decide(ActionType::RAISE, 22.04));
    EXPECT_EQ(bet.intent, Intent::VALUE);
    ASSERT_TRUE(bet.size_bb.has_value());
    EXPECT_DOUBLE_EQ(*bet.size_bb, 22.0);

    Decision call = normalize_decision(decide(ActionType::CALL, 5.0, Intent::BLUFF));
    EXPECT_FALSE(call.size_bb.has_value());
    EXPECT_EQ(call.intent, Intent::NONE);

    EXPECT_FALSE(normalize_decision(decide(ActionType::BET, -3.0)).size_bb.has_value());
}

TEST_F(EvEngineTest, ValidateDecision) {
    EXPECT_NO_THROW(validate_decision(scenario, decide(ActionType::CALL)));
    EXPECT_NO_THROW(validate_decision(scenario, decide(ActionType::RAISE, 22.0)));
    EXPECT_THROW(validate_decision(scenario, decide(ActionType::CHECK)), IllegalActionError);
    EXPECT_THROW(validate_decision(scenario, decide(ActionType::BET, 10.0)), IllegalActionError);
    EXPECT_THROW(validate_decision(scenario, decide(ActionType::RAISE)), IllegalActionError);
    EXPECT_THROW(validate_decision(scenario, decide(ActionType::RAISE, 6.0)), IllegalActionError);
    EXPECT_THROW(validate_decision(scenario, decide(ActionType::RAISE, 200.0)), IllegalActionError);
}

TEST_F(EvEngineTest, VerdictsAndTags) {
    EXPECT_EQ(verdict_for_loss(0.0), "Excellent");
    EXPECT_EQ(verdict_for_loss(0.2), "Excellent");
    EXPECT_EQ(verdict_for_loss(0.5), "Good");
    EXPECT_EQ(verdict_for_loss(1.2), "Leak");
    EXPECT_EQ(verdict_for_loss(2.0), "Major Leak");

    ActionRow fold;
    fold.action = ActionType::FOLD;
    ActionRow call;
    call.action = ActionType::CALL;
    ActionRow raise;
    raise.action = ActionType::RAISE;
    raise.intent = Intent::VALUE;
    raise.ev_bb = 3.0;

    EXPECT_TRUE(mistake_tags(fold, raise, 0.29).empty());
    EXPECT_EQ(mistake_tags(fold, raise, 1.0), (std::vector<std::string>{"Overfold"}));
    EXPECT_EQ(mistake_tags(call, raise, 1.0), (std::vector<std::string>{"MissedValue"}));

    ActionRow bluff = raise;
    bluff.intent = Intent::BLUFF;
    ActionRow thin = raise;
    thin.ev_bb = -0.5;
    EXPECT_EQ(mistake_tags(bluff, raise, 1.0), (std::vector<std::string>{"Overbluff"}));
    EXPECT_EQ(mistake_tags(thin, bluff, 0.5), (std::vector<std::string>{"TooThinValue", "Underbluff"}));
}

TEST_F(EvEngineTest, CustomRaiseAddsValueAndBluffRows) {
    EvCalculator calc(scenario, MIN_TRIALS, monte_carlo);
    std::vector<ActionRow> table = calc.action_table(22.0);

    // Fold, call, four menu raises and one custom raise, each raise as value and bluff.
    EXPECT_EQ(table.size(), 2u + 4u * 2u + 2u);
    ASSERT_NE(find_row(table, decide(ActionType::FOLD)), nullptr);
    ASSERT_NE(find_row(table, decide(ActionType::CALL)), nullptr);
    const ActionRow* value = find_row(table, decide(ActionType::RAISE, 22.0, Intent::VALUE));
    const ActionRow* bluff = find_row(table, decide(ActionType::RAISE, 22.0, Intent::BLUFF));
    ASSERT_NE(value, nullptr);
    ASSERT_NE(bluff, nullptr);

    EXPECT_TRUE(value->custom_size);
    EXPECT_EQ(value->label, "Raise 22.0bb (Value)");
    EXPECT_EQ(bluff->label, "Raise 22.0bb (Bluff)");
    EXPECT_GT(value->fold_equity, 0.0);
    EXPECT_GT(bluff->fold_equity, 0.0);
    EXPECT_DOUBLE_EQ(value->risk_bb, 22.0);

    const ActionRow* fold = find_row(table, decide(ActionType::FOLD));
    EXPECT_DOUBLE_EQ(fold->ev_bb, 0.0);
    EXPECT_DOUBLE_EQ(fold->risk_bb, 0.0);

    const ActionRow* call = find_row(table, decide(ActionType::CALL));
    EXPECT_DOUBLE_EQ(call->risk_bb, 5.0);
    EXPECT_GE(call->equity, 0.0);
    EXPECT_LE(call->equity, 1.0);

    for (size_t i = 1; i < table.size(); ++i) {
        EXPECT_FALSE(row_precedes(table[i], table[i - 1]));
    }
}

TEST_F(EvEngineTest, MenuSizeIsNotDuplicated) {
    EvCalculator calc(scenario, MIN_TRIALS, monte_carlo);
    std::vector<ActionRow> table = calc.action_table(scenario.raise_size_options_bb.front());
    EXPECT_EQ(table.size(), 2u + 4u * 2u);
    EXPECT_TRUE(std::none_of(table.begin(), table.end(), [](const ActionRow& r) { return r.custom_size; }));
}

TEST_F(EvEngineTest, TrialsAreClamped) {
    EXPECT_EQ(EvCalculator(scenario, 5, monte_carlo).simulations(), MIN_TRIALS);
    EXPECT_EQ(EvCalculator(scenario, 100000, monte_carlo).simulations(), MAX_TRIALS);
}

TEST_F(EvEngineTest, EvaluateChoiceMatchesTable) {
    EvCalculator calc(scenario, MIN_TRIALS, monte_carlo);
    std::vector<ActionRow> table = calc.action_table(22.0);
    Decision raise = decide(ActionType::RAISE, 22.0, Intent::BLUFF);
    ActionRow single = EvCalculator(scenario, MIN_TRIALS, monte_carlo).evaluate_choice(raise);
    EXPECT_DOUBLE_EQ(single.ev_bb, find_row(table, raise)->ev_bb);
    EXPECT_DOUBLE_EQ(single.equity, find_row(table, raise)->equity);
}

TEST_F(EvEngineTest, BestActionLosesNothing) {
    EvaluationResult first = evaluate_decision(scenario, decide(ActionType::FOLD), MIN_TRIALS, monte_carlo);
    EvaluationResult best = evaluate_decision(scenario, first.best_action.as_decision(), MIN_TRIALS, monte_carlo);

    EXPECT_DOUBLE_EQ(best.ev_loss_bb, 0.0);
    EXPECT_EQ(best.verdict, "Excellent");
    EXPECT_TRUE(best.mistake_tags.empty());
    EXPECT_EQ(best.chosen_action.label, best.best_action.label);
    EXPECT_EQ(best.scenario_id, scenario.scenario_id);
    EXPECT_EQ(best.simulations, MIN_TRIALS);
}

TEST_F(EvEngineTest, EvaluateDecisionScoresLoss) {
    EvaluationResult result = evaluate_decision(scenario, decide(ActionType::RAISE, 22.0), MIN_TRIALS, monte_carlo);

    EXPECT_EQ(result.decision.intent, Intent::VALUE);
    EXPECT_EQ(result.chosen_action.label, "Raise 22.0bb (Value)");
    EXPECT_GE(result.ev_loss_bb, 0.0);
    EXPECT_NEAR(result.ev_loss_bb, result.best_action.ev_bb - result.chosen_action.ev_bb, 1e-9);
    EXPECT_EQ(result.verdict, verdict_for_loss(result.ev_loss_bb));
    EXPECT_EQ(result.action_table.size(), 12u);
    EXPECT_EQ(result.action_table.front().label, result.best_action.label);
}

TEST_F(EvEngineTest, IllegalDecisionThrowsBeforeSimulating) {
    EXPECT_THROW(evaluate_decision(scenario, decide(ActionType::CHECK), MIN_TRIALS, monte_carlo), IllegalActionError);
    EXPECT_THROW(evaluate_decision(scenario, decide(ActionType::RAISE, 1.0), MIN_TRIALS, monte_carlo),
                 IllegalActionError);
}

TEST_F(EvEngineTest, SameSeedSameTable) {
    std::vector<ActionRow> a = EvCalculator(scenario, MIN_TRIALS, monte_carlo).action_table();
    MonteCarlo threaded(4);
    std::vector<ActionRow> b = EvCalculator(scenario, MIN_TRIALS, threaded).action_table();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].label, b[i].label);
        EXPECT_DOUBLE_EQ(a[i].ev_bb, b[i].ev_bb);
    }
}

} // namespace poker_coach
