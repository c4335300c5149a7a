#include "gtest/gtest.h"
#include "monte_carlo.h"
#include "seeding.h"

#include <random>
#include <stdexcept>
#include <vector>

namespace poker_coach {

class MonteCarloTest : public ::testing::Test {
protected:
    HandEvaluator evaluator;

    VillainRange range_for(const std::string& archetype,
                           const std::vector<Card>& board,
                           const std::vector<Card>& hero) {
        RangeSpec spec;
        spec.archetype_key = archetype;
        spec.position = "BB";
        spec.street = board.empty() ? Street::PREFLOP : Street::FLOP;
        spec.role = SeatRole::CALLER;
        return VillainRange::build(spec, board, hero, evaluator);
    }
};

TEST_F(MonteCarloTest, SameResultForAnyThreadCount) {
    std::vector<Card> hero = {"Ah", "Kd"};
    std::vector<Card> board = {"Ks", "7d", "2c"};
    VillainRange a = range_for("calling_station", board, hero);
    VillainRange b = range_for("weak_tight", board, hero);
    std::vector<const VillainRange*> villains = {&a, &b};

    MonteCarlo single(1);
    MonteCarlo multi(4);
    uint64_t key = fnv1a("raise:22");
    EquityEstimate x = single.estimate_equity(hero, board, villains, 600, 42, key);
    EquityEstimate y = multi.estimate_equity(hero, board, villains, 600, 42, key);

    EXPECT_DOUBLE_EQ(x.equity, y.equity);
    EXPECT_DOUBLE_EQ(x.std_error, y.std_error);
    EXPECT_EQ(x.trials, 600);
    EXPECT_GT(x.equity, 0.0);
    EXPECT_LT(x.equity, 1.0);
    EXPECT_GT(x.std_error, 0.0);

    // A different key draws a different sample.
    EquityEstimate z = single.estimate_equity(hero, board, villains, 600, 42, fnv1a("call"));
    EXPECT_NE(x.equity, z.equity);
}

TEST_F(MonteCarloTest, UncontestedAndNuts) {
    MonteCarlo mc(2);
    std::vector<Card> hero = {"As", "Ks"};
    std::vector<Card> board = {"Qs", "Js", "Ts", "2c", "3d"};

    EquityEstimate alone = mc.estimate_equity(hero, board, {}, 200, 1, 2);
    EXPECT_DOUBLE_EQ(alone.equity, 1.0);

    VillainRange villain = range_for("lag_reg", board, hero);
    EquityEstimate royal = mc.estimate_equity(hero, board, {&villain}, 200, 1, 2);
    EXPECT_DOUBLE_EQ(royal.equity, 1.0);
    EXPECT_DOUBLE_EQ(royal.std_error, 0.0);
}

TEST_F(MonteCarloTest, RejectsBadInput) {
    MonteCarlo mc(1);
    std::vector<Card> board = {"Ks", "7d", "2c"};
    EXPECT_THROW(mc.estimate_equity({"Ah"}, board, {}, 100, 1, 1), std::invalid_argument);
    EXPECT_THROW(mc.estimate_equity({"Ah", "Kd"}, {"2c", "3c", "4c", "5c", "6c", "7c"}, {}, 100, 1, 1),
                 std::invalid_argument);
    EXPECT_THROW(mc.estimate_equity({"Ah", "Kd"}, board, {}, 0, 1, 1), std::invalid_argument);
}

TEST_F(MonteCarloTest, AcesAgainstRandomHand) {
    MonteCarlo mc(1);
    std::mt19937_64 rng(2024);
    double equity = mc.estimate_equity({"As", "Ah"}, {}, 4000, rng);
    EXPECT_NEAR(equity, 0.85, 0.03);
}

TEST_F(MonteCarloTest, WorkerThreadsAtLeastOne) {
    EXPECT_GE(MonteCarlo(0).worker_threads(), 1);
    EXPECT_EQ(MonteCarlo(1).worker_threads(), 1);
}

} // namespace poker_coach
