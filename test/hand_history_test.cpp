#include "gtest/gtest.h"
#include "hand_history.h"
#include "errors.h"

#include <fstream>
#include <string>

namespace poker_coach {

namespace {

// alice (seat 1) has the button, bob (seat 2) posts the SB, carol (seat 3) the BB.
// alice opens, carol calls and the hand checks down to a showdown on the flop.
const char* SHOWDOWN_HAND = R"({
  "id": 1001,
  "dealerSeat": 1,
  "players": [
    {"id": "alice", "seat": 1, "stack": 200, "cards": ["Ah", "Kd"]},
    {"playerId": "bob", "seat": 2, "chips": 150},
    {"id": "carol", "seat": 3, "stack": 180, "holeCards": [{"rank": "Q", "suit": "s"}, {"rank": "Q", "suit": "c"}]}
  ],
  "events": [
    {"payload": {"type": 3, "seat": 2, "amount": 1}},
    {"payload": {"type": 2, "seat": 3, "amount": 2}},
    {"payload": {"type": 8, "seat": 1, "amount": 6}},
    {"payload": {"type": 11, "seat": 2}},
    {"payload": {"type": 7, "seat": 3, "value": 4}},
    {"payload": {"type": 9, "cards": ["Kh", "7c", "2d"]}},
    {"payload": {"type": 0, "seat": 3}},
    {"payload": {"type": 8, "seat": 1, "amount": 6}},
    {"payload": {"type": 7, "seat": 3, "amount": 6}},
    {"payload": {"type": 42, "seat": 1}},
    {"payload": {"type": 10, "seat": 1, "amount": 25, "handDescription": "a pair of Kings"}}
  ]
})";

const char* UNCONTESTED_HAND = R"({
  "id": "1002",
  "dealerSeat": 2,
  "players": [
    {"id": "alice", "seat": 1, "stack": 200},
    {"id": "bob", "seat": 2, "stack": 150}
  ],
  "events": [
    {"type": 3, "seat": 2, "amount": 1},
    {"type": 2, "seat": 1, "amount": 2},
    {"type": 11, "seat": 2},
    {"type": 10, "seat": 1, "amount": 3}
  ]
})";

} // namespace

TEST(HandHistoryTest, ResolveAmount) {
    EXPECT_DOUBLE_EQ(resolve_amount(json{{"value", 60}}), 60.0);
    EXPECT_DOUBLE_EQ(resolve_amount(json{{"amount", 5}, {"value", 60}}), 5.0);
    EXPECT_DOUBLE_EQ(resolve_amount(json{{"amount", nullptr}, {"value", 60}}), 60.0);
    EXPECT_DOUBLE_EQ(resolve_amount(json::object()), 0.0);
}

TEST(HandHistoryTest, ActionCodes) {
    EXPECT_EQ(action_kind_from_code(8), ActionKind::BET_OR_RAISE);
    EXPECT_EQ(action_kind_from_code(11), ActionKind::FOLD);
    EXPECT_FALSE(action_kind_from_code(42).has_value());
    EXPECT_EQ(action_kind_to_string(ActionKind::POST_BIG_BLIND), "post-big-blind");
}

TEST(HandHistoryTest, ParsesPlayersAndPositions) {
    HandHistoryParser parser;
    ParseReport report = parser.parse_string(std::string("{\"hands\": [") + SHOWDOWN_HAND + "]}");

    ASSERT_EQ(report.errors, 0);
    ASSERT_EQ(report.hands.size(), 1u);
    const HandRecord& hand = report.hands[0];
    EXPECT_EQ(hand.hand_id, "1001");
    EXPECT_DOUBLE_EQ(hand.small_blind, 1.0);
    EXPECT_DOUBLE_EQ(hand.big_blind, 2.0);

    const PlayerSeat* alice = hand.find_player("alice");
    const PlayerSeat* bob = hand.find_player("bob");
    const PlayerSeat* carol = hand.find_player("carol");
    ASSERT_NE(alice, nullptr);
    ASSERT_NE(bob, nullptr);
    ASSERT_NE(carol, nullptr);
    EXPECT_EQ(alice->position, 0);
    EXPECT_TRUE(alice->is_dealer);
    EXPECT_EQ(bob->position, 1);
    EXPECT_EQ(carol->position, 2);
    EXPECT_DOUBLE_EQ(bob->stack, 150.0);
    EXPECT_EQ(alice->hole_cards, (std::vector<Card>{"Ah", "Kd"}));
    EXPECT_EQ(carol->hole_cards, (std::vector<Card>{"Qs", "Qc"}));
}

TEST(HandHistoryTest, ParsesEventsWithStreetsAndPot) {
    HandHistoryParser parser;
    ParseReport report = parser.parse_string(std::string("[") + SHOWDOWN_HAND + "]");
    ASSERT_EQ(report.hands.size(), 1u);
    const HandRecord& hand = report.hands[0];

    EXPECT_EQ(hand.board, (std::vector<Card>{"Kh", "7c", "2d"}));
    EXPECT_EQ(hand.actions_on(Street::PREFLOP).size(), 5u);
    std::vector<ActionEvent> flop = hand.actions_on(Street::FLOP);
    ASSERT_EQ(flop.size(), 3u);
    EXPECT_EQ(flop[1].player_id, "alice");
    EXPECT_EQ(flop[1].kind, ActionKind::BET_OR_RAISE);
    EXPECT_DOUBLE_EQ(flop[1].pot_before, 13.0);
    EXPECT_NEAR(flop[1].pot_ratio(), 6.0 / 13.0, 1e-9);
    EXPECT_DOUBLE_EQ(hand.actions_on(Street::PREFLOP)[4].amount, 4.0); // "value" fallback

    EXPECT_TRUE(hand.folded_before("bob", Street::FLOP));
    EXPECT_FALSE(hand.folded_before("carol", Street::FLOP));

    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_NE(report.warnings[0].find("42"), std::string::npos);
}

TEST(HandHistoryTest, SettlesShowdown) {
    HandHistoryParser parser;
    ParseReport report = parser.parse_string(std::string("[") + SHOWDOWN_HAND + "]");
    ASSERT_EQ(report.hands.size(), 1u);
    const HandRecord& hand = report.hands[0];

    const ShowdownResult* alice = hand.result_for("alice");
    ASSERT_NE(alice, nullptr);
    EXPECT_TRUE(alice->reached_showdown);
    EXPECT_TRUE(alice->won_pot);
    EXPECT_DOUBLE_EQ(alice->amount_won, 25.0);
    EXPECT_EQ(alice->strength, HandCategory::ONE_PAIR);

    // Strength from the hole cards when nothing was announced.
    const ShowdownResult* carol = hand.result_for("carol");
    ASSERT_NE(carol, nullptr);
    EXPECT_TRUE(carol->reached_showdown);
    EXPECT_FALSE(carol->won_pot);
    EXPECT_EQ(carol->strength, HandCategory::ONE_PAIR);

    EXPECT_EQ(hand.result_for("bob"), nullptr);
}

TEST(HandHistoryTest, UncontestedPotIsNotAShowdown) {
    HandHistoryParser parser;
    ParseReport report = parser.parse_string(std::string("[") + UNCONTESTED_HAND + "]");
    ASSERT_EQ(report.hands.size(), 1u);
    const ShowdownResult* alice = report.hands[0].result_for("alice");
    ASSERT_NE(alice, nullptr);
    EXPECT_TRUE(alice->won_pot);
    EXPECT_FALSE(alice->reached_showdown);
}

TEST(HandHistoryTest, MalformedHandIsSkippedAndCounted) {
    HandHistoryParser parser;
    std::string text = std::string("{\"hands\": [") + SHOWDOWN_HAND + ", {\"id\": \"bad\", \"players\": []}, " +
                       "{\"id\": \"noevents\", \"players\": [{\"id\": \"x\", \"seat\": 1}]}, 7, " +
                       UNCONTESTED_HAND + "]}";
    ParseReport report = parser.parse_string(text);

    EXPECT_EQ(report.hands.size(), 2u);
    EXPECT_EQ(report.errors, 3);
    ASSERT_EQ(report.messages.size(), 3u);
    EXPECT_NE(report.messages[0].find("bad"), std::string::npos);
}

TEST(HandHistoryTest, DocumentShapeErrors) {
    HandHistoryParser parser;
    ParseReport missing = parser.parse(json{{"games", json::array()}});
    EXPECT_EQ(missing.errors, 1);
    ASSERT_EQ(missing.messages.size(), 1u);
    EXPECT_EQ(missing.messages[0], "Expected 'hands' to be a list");

    ParseReport not_list = parser.parse(json{{"hands", "nope"}});
    EXPECT_EQ(not_list.errors, 1);
    EXPECT_TRUE(not_list.hands.empty());

    EXPECT_THROW(parser.parse_string("{not json"), HandParseError);
}

TEST(HandHistoryTest, LoadFile) {
    HandHistoryParser parser;
    EXPECT_THROW(parser.load_file("/nonexistent/hands.json"), std::runtime_error);

    std::string path = ::testing::TempDir() + "poker_coach_hands.json";
    {
        std::ofstream ofs(path);
        ofs << "[" << SHOWDOWN_HAND << ", " << UNCONTESTED_HAND << "]";
    }
    ParseReport single = parser.load_file(path);
    EXPECT_EQ(single.hands.size(), 2u);

    ParseReport merged = parser.load_files({path, path});
    EXPECT_EQ(merged.hands.size(), 4u);
    EXPECT_EQ(merged.warnings.size(), 2u);
}

TEST(HandHistoryTest, PlayerBuckets) {
    HandHistoryParser parser;
    ParseReport report = parser.parse_string(std::string("[") + SHOWDOWN_HAND + ", " + UNCONTESTED_HAND + "]");
    std::vector<PlayerBucket> buckets = HandHistoryParser::player_buckets(report.hands);

    ASSERT_EQ(buckets.size(), 3u);
    EXPECT_EQ(buckets[0].player_id, "alice");
    EXPECT_EQ(buckets[0].hands_seen, 2);
    EXPECT_EQ(buckets[1].player_id, "bob");
    EXPECT_EQ(buckets[1].hands_seen, 2);
    EXPECT_EQ(buckets[2].player_id, "carol");
    EXPECT_EQ(buckets[2].hands_seen, 1);
}

} // namespace poker_coach
