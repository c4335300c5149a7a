#ifndef POKER_COACH_HAND_HISTORY_H
#define POKER_COACH_HAND_HISTORY_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cards.h"
#include "hand_evaluator.h"

namespace poker_coach {

using json = nlohmann::json;

// Event kinds of a hand history. Raw type codes: 0 check, 2 big blind,
// 3 small blind, 7 call, 8 bet/raise, 9 board dealt, 10 pot awarded, 11 fold.
enum class ActionKind : uint8_t {
    POST_SMALL_BLIND,
    POST_BIG_BLIND,
    CHECK,
    CALL,
    BET_OR_RAISE,
    FOLD,
    BOARD_DEALT,
    POT_AWARDED
};

std::string action_kind_to_string(ActionKind kind);
std::optional<ActionKind> action_kind_from_code(int code);

// One player action, tagged with the street and the pot before it happened.
struct ActionEvent {
    std::string player_id;
    int seat = 0;
    Street street = Street::PREFLOP;
    ActionKind kind = ActionKind::CHECK;
    double amount = 0.0;
    double pot_before = 0.0;
    double stack_before = 0.0;
    bool is_all_in = false;

    bool is_blind() const { return kind == ActionKind::POST_SMALL_BLIND || kind == ActionKind::POST_BIG_BLIND; }
    // amount / pot_before, 0 when the pot was empty.
    double pot_ratio() const { return pot_before > 0.0 ? amount / pot_before : 0.0; }
};

struct PlayerSeat {
    std::string player_id;
    int seat = 0;
    double stack = 0.0;
    std::vector<Card> hole_cards;
    int position = -1; // 0 = button, 1 = SB, 2 = BB, ...
    bool is_dealer = false;
};

struct ShowdownResult {
    std::string player_id;
    bool reached_showdown = false;
    bool won_pot = false;
    double amount_won = 0.0;
    HandCategory strength = HandCategory::UNKNOWN;
    std::string description;
    std::vector<Card> shown_cards;
};

// Immutable once parsed.
struct HandRecord {
    std::string hand_id;
    int dealer_seat = 0;
    double small_blind = 0.0;
    double big_blind = 0.0;
    std::vector<PlayerSeat> players;
    std::vector<ActionEvent> actions;
    std::vector<Card> board;
    std::map<std::string, ShowdownResult> results;

    const PlayerSeat* find_player(const std::string& player_id) const;
    std::vector<ActionEvent> actions_on(Street street) const;
    const ShowdownResult* result_for(const std::string& player_id) const;
    // True when the player folded on a street strictly before `street`.
    bool folded_before(const std::string& player_id, Street street) const;
};

struct ParseReport {
    std::vector<HandRecord> hands;
    int errors = 0;                    // Malformed hands skipped
    std::vector<std::string> messages; // One per error
    std::vector<std::string> warnings; // Unknown event types etc.
};

struct PlayerBucket {
    std::string player_id;
    int hands_seen = 0;
};

// Reads a numeric field as an explicit optional: empty when the key is
// missing, null, or not a number.
std::optional<double> optional_number(const json& object, const char* key);

// Monetary amount of an event payload: "amount" if present and non-null,
// else "value", else 0.
double resolve_amount(const json& payload);

class HandHistoryParser {
public:
    HandHistoryParser();

    // Accepts {"hands": [...]} or a bare array of hands. A malformed hand is
    // skipped and counted; the batch always completes.
    ParseReport parse(const json& document) const;
    ParseReport parse_string(const std::string& text) const;
    // Throws std::runtime_error when the file cannot be read, HandParseError
    // when it is not JSON.
    ParseReport load_file(const std::string& path) const;
    // Parses several files into one report.
    ParseReport load_files(const std::vector<std::string>& paths) const;

    // Throws HandParseError when players or events are missing. Unknown event
    // types are appended to `warnings` and skipped.
    HandRecord parse_hand(const json& raw, size_t index, std::vector<std::string>& warnings) const;

    // Per-player hand counts, most hands first, then by id.
    static std::vector<PlayerBucket> player_buckets(const std::vector<HandRecord>& hands);

private:
    std::vector<PlayerSeat> parse_players(const json& raw_players, int dealer_seat) const;
    std::vector<Card> parse_cards(const json& raw_cards) const;
    void parse_events(const json& events, HandRecord& hand, std::vector<std::string>& warnings) const;
    void settle_showdown(HandRecord& hand) const;

    HandEvaluator evaluator_;
};

} // namespace poker_coach

#endif // POKER_COACH_HAND_HISTORY_H
