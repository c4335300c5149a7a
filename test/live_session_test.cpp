#include "gtest/gtest.h"
#include "live_session.h"
#include "errors.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "spdlog/fmt/fmt.h"

namespace poker_coach {

namespace {

OpponentProfile station() {
    return OpponentProfile::from_archetype(archetype_by_key("calling_station"));
}

bool is_legal(const LiveHandState& hand, ActionType action) {
    return std::find(hand.legal_actions.begin(), hand.legal_actions.end(), action) != hand.legal_actions.end();
}

// Checks when possible, otherwise calls, until the hand ends.
LiveSessionState play_passively(LiveSession& session) {
    LiveSessionState state = session.state();
    for (int guard = 0; guard < 32 && !state.hand.hand_over; ++guard) {
        state = session.act(is_legal(state.hand, ActionType::CHECK) ? ActionType::CHECK : ActionType::CALL);
    }
    return state;
}

} // namespace

TEST(LiveSessionTest, FirstHandPutsHeroOnTheButton) {
    LiveSession session("live_test", station(), 42);
    LiveSessionState state = session.state();

    EXPECT_EQ(state.session_id, "live_test");
    EXPECT_EQ(state.seed, 42u);
    EXPECT_EQ(state.hands_played, 1);
    EXPECT_DOUBLE_EQ(state.hero_net_bb, 0.0);
    EXPECT_EQ(state.opponent.source, "archetype");

    const LiveHandState& hand = state.hand;
    EXPECT_EQ(hand.hand_no, 1);
    EXPECT_EQ(hand.hero_position, "BTN");
    EXPECT_EQ(hand.street, Street::PREFLOP);
    EXPECT_TRUE(hand.board.empty());
    EXPECT_EQ(hand.hero_hand.size(), 2u);
    EXPECT_TRUE(hand.villain_hand.empty()); // Hidden until the hand is over
    EXPECT_FALSE(hand.hand_over);
    EXPECT_DOUBLE_EQ(hand.pot_bb, 1.5);
    EXPECT_DOUBLE_EQ(hand.to_call_bb, 0.5);
    EXPECT_DOUBLE_EQ(hand.hero_stack_bb, DEFAULT_STACK_BB - LIVE_SMALL_BLIND_BB);
    EXPECT_DOUBLE_EQ(hand.villain_stack_bb, DEFAULT_STACK_BB - LIVE_BIG_BLIND_BB);
    EXPECT_TRUE(is_legal(hand, ActionType::FOLD));
    EXPECT_TRUE(is_legal(hand, ActionType::CALL));
    EXPECT_FALSE(is_legal(hand, ActionType::CHECK));
    EXPECT_EQ(hand.action_context, "facing_bet");

    ASSERT_GE(hand.action_history.size(), 3u);
    EXPECT_EQ(hand.action_history[0].rfind("Hand 1: Hero (BTN) vs", 0), 0u);
    EXPECT_EQ(hand.action_history[1], "Hero posts SB 0.5bb.");
    EXPECT_EQ(hand.action_history[2], "Villain posts BB 1.0bb.");
}

TEST(LiveSessionTest, HeroFoldEndsTheHand) {
    LiveSession session("live_fold", station(), 42);
    LiveSessionState state = session.act(ActionType::FOLD);

    EXPECT_TRUE(state.hand.hand_over);
    EXPECT_DOUBLE_EQ(state.hand.hero_delta_bb, -0.5);
    EXPECT_DOUBLE_EQ(state.hero_net_bb, -0.5);
    EXPECT_TRUE(state.hand.legal_actions.empty());
    EXPECT_EQ(state.hand.villain_hand.size(), 2u);
    ASSERT_TRUE(state.hand.showdown.has_value());
    EXPECT_EQ(state.hand.showdown->winner, "villain");
    EXPECT_EQ(state.hand.showdown->reason, "Hero folded.");
    EXPECT_EQ(state.hand.action_history.back(), "Hand ends: Hero folded.");

    EXPECT_THROW(session.act(ActionType::CALL), IllegalActionError);
}

TEST(LiveSessionTest, NewHandAlternatesPosition) {
    LiveSession session("live_rotate", station(), 7);
    session.act(ActionType::FOLD);

    LiveSessionState second = session.new_hand();
    EXPECT_EQ(second.hands_played, 2);
    EXPECT_EQ(second.hand.hand_no, 2);
    EXPECT_EQ(second.hand.hero_position, "BB");
    ASSERT_GE(second.hand.action_history.size(), 3u);
    EXPECT_EQ(second.hand.action_history[1].rfind("Villain posts SB", 0), 0u);
    EXPECT_EQ(second.hand.action_history[2], "Hero posts BB 1.0bb.");
    // Net carries over; stacks reset
    EXPECT_DOUBLE_EQ(second.hero_net_bb - second.hand.hero_delta_bb, -0.5);

    LiveSessionState third = session.new_hand();
    EXPECT_EQ(third.hand.hand_no, 3);
    EXPECT_EQ(third.hand.hero_position, "BTN");
    EXPECT_DOUBLE_EQ(third.hand.hero_stack_bb, DEFAULT_STACK_BB - LIVE_SMALL_BLIND_BB);
}

TEST(LiveSessionTest, RejectsIllegalActions) {
    LiveSession session("live_illegal", station(), 42);
    EXPECT_THROW(session.act(ActionType::CHECK), IllegalActionError);
    EXPECT_THROW(session.act(ActionType::BET, 3.0), IllegalActionError);

    LiveSessionState state = session.state();
    ASSERT_TRUE(is_legal(state.hand, ActionType::RAISE));
    EXPECT_THROW(session.act(ActionType::RAISE), IllegalActionError);
    EXPECT_THROW(session.act(ActionType::RAISE, 0.0), IllegalActionError);
    EXPECT_THROW(session.act(ActionType::RAISE, -2.0), IllegalActionError);

    // Nothing was applied by the rejected attempts
    LiveSessionState after = session.state();
    EXPECT_EQ(after.hand.action_history, state.hand.action_history);
    EXPECT_FALSE(after.hand.hand_over);
}

TEST(LiveSessionTest, RaiseSnapsToTheNearestOption) {
    LiveSession session("live_raise", station(), 42);
    LiveSessionState state = session.state();
    ASSERT_FALSE(state.hand.size_options_bb.empty());
    double smallest = *std::min_element(state.hand.size_options_bb.begin(), state.hand.size_options_bb.end());

    LiveSessionState after = session.act(ActionType::RAISE, smallest + 0.01, Intent::BLUFF);
    auto line = std::find_if(after.hand.action_history.begin(), after.hand.action_history.end(),
                             [](const std::string& entry) { return entry.rfind("Hero raises", 0) == 0; });
    ASSERT_NE(line, after.hand.action_history.end());
    EXPECT_NE(line->find("(bluff)"), std::string::npos);
    EXPECT_NE(line->find(fmt::format("{:.1f}bb", smallest)), std::string::npos);
}

TEST(LiveSessionTest, SameSeedReplaysTheSameMatch) {
    LiveSession first("live_a", station(), 1234);
    LiveSession second("live_b", station(), 1234);

    for (int hand = 0; hand < 4; ++hand) {
        LiveSessionState a = play_passively(first);
        LiveSessionState b = play_passively(second);
        ASSERT_TRUE(a.hand.hand_over);
        EXPECT_EQ(a.hand.hero_hand, b.hand.hero_hand);
        EXPECT_EQ(a.hand.villain_hand, b.hand.villain_hand);
        EXPECT_EQ(a.hand.board, b.hand.board);
        EXPECT_EQ(a.hand.action_history, b.hand.action_history);
        EXPECT_DOUBLE_EQ(a.hero_net_bb, b.hero_net_bb);
        first.new_hand();
        second.new_hand();
    }
}

TEST(LiveSessionTest, NetTracksHandDeltas) {
    LiveSession session("live_net", station(), 99);
    double expected = 0.0;
    for (int hand = 0; hand < 6; ++hand) {
        LiveSessionState state = play_passively(session);
        ASSERT_TRUE(state.hand.hand_over);
        ASSERT_TRUE(state.hand.showdown.has_value());
        EXPECT_LE(std::abs(state.hand.hero_delta_bb), DEFAULT_STACK_BB);
        if (state.hand.showdown->reason == "Showdown") {
            EXPECT_EQ(state.hand.board.size(), 5u);
            EXPECT_FALSE(state.hand.showdown->hero_hand_category.empty());
        }
        expected += state.hand.hero_delta_bb;
        EXPECT_NEAR(state.hero_net_bb, expected, 1e-6);
        session.new_hand();
    }
}

TEST(LiveSessionTest, ConcurrentCommandsMatchASerialReplay) {
    const int kThreads = 8;
    const int kCommandsPerThread = 30;
    LiveSession session("live_threads", station(), 2024);

    std::mutex folded_mutex;
    std::set<int> folded_hands;
    std::atomic<int> new_hands{0};
    std::atomic<int> rejected{0};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < kCommandsPerThread; ++i) {
                try {
                    if ((i + t) % 2 == 0) {
                        LiveSessionState folded = session.act(ActionType::FOLD);
                        std::lock_guard<std::mutex> lock(folded_mutex);
                        folded_hands.insert(folded.hand.hand_no);
                    } else {
                        session.new_hand();
                        new_hands++;
                    }
                } catch (const IllegalActionError&) {
                    rejected++; // Hand already over, or hero not to act
                } catch (const std::exception&) {
                    unexpected++;
                }
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(unexpected.load(), 0);
    LiveSessionState final_state = session.state();
    EXPECT_EQ(final_state.hands_played, 1 + new_hands.load());
    EXPECT_EQ(static_cast<int>(folded_hands.size()) + rejected.load() + new_hands.load(),
              kThreads * kCommandsPerThread);

    // Replaying the same per-hand commands on one thread reaches the same state
    LiveSession serial("live_serial", station(), 2024);
    for (int hand = 1; hand <= final_state.hands_played; ++hand) {
        if (folded_hands.count(hand) > 0) serial.act(ActionType::FOLD);
        if (hand < final_state.hands_played) serial.new_hand();
    }
    LiveSessionState replayed = serial.state();
    EXPECT_EQ(replayed.hands_played, final_state.hands_played);
    EXPECT_DOUBLE_EQ(replayed.hero_net_bb, final_state.hero_net_bb);
    EXPECT_EQ(replayed.hand.hero_hand, final_state.hand.hero_hand);
    EXPECT_EQ(replayed.hand.action_history, final_state.hand.action_history);
}

TEST(LiveSessionTest, StartingStackIsClamped) {
    LiveSession shallow("live_short", station(), 1, 5.0);
    EXPECT_DOUBLE_EQ(shallow.state().starting_stack_bb, LIVE_MIN_STACK_BB);
    LiveSession deep("live_deep", station(), 1, 1000.0);
    EXPECT_DOUBLE_EQ(deep.state().starting_stack_bb, LIVE_MAX_STACK_BB);
}

TEST(LiveSessionTest, OpponentFromPlayerProfile) {
    PlayerProfile profile;
    profile.player_id = "villain42";
    profile.hands_analyzed = 80;
    profile.style = PlayStyle::LOOSE_AGGRESSIVE;
    profile.rates.vpip = 0.41;
    profile.rates.aggression_factor = std::numeric_limits<double>::infinity();

    OpponentProfile opponent = OpponentProfile::from_player_profile(profile);
    EXPECT_EQ(opponent.name, "villain42");
    EXPECT_EQ(opponent.source, "hand_history");
    EXPECT_EQ(opponent.hands_analyzed, 80);
    EXPECT_DOUBLE_EQ(opponent.vpip, 0.41);
    EXPECT_DOUBLE_EQ(opponent.af, 8.0);
    // Undefined rates keep the defaults
    EXPECT_DOUBLE_EQ(opponent.pfr, OpponentProfile{}.pfr);
    EXPECT_DOUBLE_EQ(opponent.wtsd, OpponentProfile{}.wtsd);
}

TEST(LiveSessionTest, OpponentFromArchetype) {
    const Archetype& archetype = archetype_by_key("calling_station");
    OpponentProfile opponent = OpponentProfile::from_archetype(archetype);
    EXPECT_EQ(opponent.name, archetype.label);
    EXPECT_DOUBLE_EQ(opponent.vpip, archetype.vpip);
    EXPECT_DOUBLE_EQ(opponent.pfr, archetype.pfr);
    EXPECT_GE(opponent.af, 0.3);
    EXPECT_LE(opponent.af, 8.0);
}

} // namespace poker_coach
