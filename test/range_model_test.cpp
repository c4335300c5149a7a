#include "gtest/gtest.h"
#include "range_model.h"
#include "errors.h"

#include <random>

namespace poker_coach {

class RangeModelTest : public ::testing::Test {
protected:
    HandEvaluator evaluator;
    std::vector<Card> board = {"Ks", "7d", "2c"};
    std::vector<Card> hero = {"Ah", "Kd"};

    RangeSpec spec(const std::string& archetype, SeatRole role = SeatRole::CALLER) {
        RangeSpec s;
        s.archetype_key = archetype;
        s.position = "BB";
        s.street = Street::FLOP;
        s.role = role;
        return s;
    }
};

TEST(CardMaskTest, BitPerCard) {
    EXPECT_EQ(card_mask({"2c"}), 1ULL);
    EXPECT_EQ(card_mask({"2c", "As"}), 1ULL | (1ULL << 51));
    EXPECT_EQ(card_mask({"??"}), 0ULL);
}

TEST_F(RangeModelTest, BuildExcludesDeadCards) {
    VillainRange range = VillainRange::build(spec("calling_station"), board, hero, evaluator);

    EXPECT_EQ(range.combos().size(), 1081u); // C(47, 2)
    uint64_t dead = card_mask(board) | card_mask(hero);
    for (const WeightedCombo& combo : range.combos()) {
        ASSERT_EQ(combo.mask & dead, 0ULL);
        EXPECT_GE(combo.weight, 0.0);
    }
    EXPECT_GT(range.total_weight(), 0.0);
    EXPECT_GT(range.live_combos(), 0u);
    EXPECT_FALSE(range.used_fallback());
}

TEST_F(RangeModelTest, TightArchetypesHoldFewerCombos) {
    VillainRange nit = VillainRange::build(spec("nit"), board, hero, evaluator);
    VillainRange station = VillainRange::build(spec("calling_station"), board, hero, evaluator);
    EXPECT_LT(nit.total_weight(), station.total_weight());
}

TEST_F(RangeModelTest, ImpossibleNarrowingLeavesRangeUntouched) {
    VillainRange range = VillainRange::build(spec("tag_reg"), board, hero, evaluator);
    double before = range.total_weight();
    size_t live = range.live_combos();

    EXPECT_FALSE(range.narrow(100.0));
    EXPECT_DOUBLE_EQ(range.total_weight(), before);
    EXPECT_EQ(range.live_combos(), live);

    EXPECT_TRUE(range.narrow(0.5));
    EXPECT_LT(range.total_weight(), before);
}

TEST_F(RangeModelTest, SampleAvoidsUsedCards) {
    VillainRange range = VillainRange::build(spec("lag_reg", SeatRole::BETTOR), board, hero, evaluator);
    std::mt19937_64 rng(123);
    uint64_t used = card_mask({"As", "Ac", "Qs", "Qh"});
    for (int i = 0; i < 200; ++i) {
        const WeightedCombo& combo = range.sample(rng, used);
        EXPECT_EQ(combo.mask & used, 0ULL);
    }
}

TEST_F(RangeModelTest, SampleThrowsWhenEverythingIsBlocked) {
    VillainRange range = VillainRange::build(spec("tag_reg"), board, hero, evaluator);
    std::mt19937_64 rng(1);
    EXPECT_THROW(range.sample(rng, ~0ULL >> 12), PokerCoachError);
}

TEST(RangeModelFactors, WidthFactors) {
    EXPECT_GT(position_width_factor("BTN"), position_width_factor("UTG"));
    EXPECT_DOUBLE_EQ(position_width_factor("XX"), 1.0);
    EXPECT_GT(node_width_factor(NodeType::SINGLE_RAISED_POT), node_width_factor(NodeType::THREE_BET_POT));
    EXPECT_GT(node_width_factor(NodeType::THREE_BET_POT), node_width_factor(NodeType::FOUR_BET_POT));
}

TEST(RangeModelFactors, ContinuationTarget) {
    const Archetype& nit = archetype_by_key("nit");
    EXPECT_GT(continuation_target(nit, SeatRole::BETTOR, 0.0), continuation_target(nit, SeatRole::WAITING, 0.0));
    EXPECT_GT(continuation_target(nit, SeatRole::CALLER, 1.0), continuation_target(nit, SeatRole::CALLER, 0.0));
    // Pressure is clamped to 0..1.
    EXPECT_DOUBLE_EQ(continuation_target(nit, SeatRole::CALLER, 5.0), continuation_target(nit, SeatRole::CALLER, 1.0));
}

TEST(RangeModelFactors, ContinueProbability) {
    const Archetype& station = archetype_by_key("calling_station");
    const Archetype& weak = archetype_by_key("weak_tight");

    double small = continue_probability(station, Street::FLOP, ActionType::BET, 0.33, SeatRole::WAITING);
    double big = continue_probability(station, Street::FLOP, ActionType::BET, 1.5, SeatRole::WAITING);
    EXPECT_GT(small, big);
    EXPECT_GT(small, continue_probability(weak, Street::FLOP, ActionType::BET, 0.33, SeatRole::WAITING));

    for (double size : {0.1, 0.5, 1.0, 3.0, 10.0}) {
        double p = continue_probability(weak, Street::RIVER, ActionType::RAISE, size, SeatRole::BETTOR);
        EXPECT_GE(p, 0.05);
        EXPECT_LE(p, 0.95);
    }

    EXPECT_THROW(continue_probability(station, Street::FLOP, ActionType::CALL, 0.5, SeatRole::WAITING), ConfigError);
    EXPECT_THROW(continue_probability(station, Street::FLOP, ActionType::FOLD, 0.5, SeatRole::WAITING), ConfigError);
}

} // namespace poker_coach
