#include "hand_history.h"
#include "errors.h"

#include <algorithm> // For std::sort, std::find
#include <fstream>
#include <iterator> // For std::back_inserter
#include <set>
#include <sstream>
#include <stdexcept>

#include "spdlog/spdlog.h"

namespace poker_coach {

namespace {

// Hand and player ids arrive as strings or numbers.
std::string id_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    if (value.is_number()) return value.dump();
    return "";
}

const json* first_present(const json& object, const char* primary, const char* fallback) {
    if (!object.is_object()) return nullptr;
    auto it = object.find(primary);
    if (it != object.end() && !it->is_null()) return &*it;
    it = object.find(fallback);
    if (it != object.end() && !it->is_null()) return &*it;
    return nullptr;
}

int int_field(const json& object, const char* key, int fallback) {
    std::optional<double> value = optional_number(object, key);
    return value ? static_cast<int>(*value) : fallback;
}

Street next_street(Street street) {
    switch (street) {
        case Street::PREFLOP: return Street::FLOP;
        case Street::FLOP:    return Street::TURN;
        default:              return Street::RIVER;
    }
}

} // namespace

std::string action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::POST_SMALL_BLIND: return "post-small-blind";
        case ActionKind::POST_BIG_BLIND:   return "post-big-blind";
        case ActionKind::CHECK:            return "check";
        case ActionKind::CALL:             return "call";
        case ActionKind::BET_OR_RAISE:     return "bet-or-raise";
        case ActionKind::FOLD:             return "fold";
        case ActionKind::BOARD_DEALT:      return "board-dealt";
        case ActionKind::POT_AWARDED:      return "pot-awarded";
    }
    return "unknown";
}

std::optional<ActionKind> action_kind_from_code(int code) {
    switch (code) {
        case 0:  return ActionKind::CHECK;
        case 2:  return ActionKind::POST_BIG_BLIND;
        case 3:  return ActionKind::POST_SMALL_BLIND;
        case 7:  return ActionKind::CALL;
        case 8:  return ActionKind::BET_OR_RAISE;
        case 9:  return ActionKind::BOARD_DEALT;
        case 10: return ActionKind::POT_AWARDED;
        case 11: return ActionKind::FOLD;
        default: return std::nullopt;
    }
}

// --- HandRecord ---

const PlayerSeat* HandRecord::find_player(const std::string& player_id) const {
    for (const PlayerSeat& player : players) {
        if (player.player_id == player_id) return &player;
    }
    return nullptr;
}

std::vector<ActionEvent> HandRecord::actions_on(Street street) const {
    std::vector<ActionEvent> out;
    for (const ActionEvent& action : actions) {
        if (action.street == street) out.push_back(action);
    }
    return out;
}

const ShowdownResult* HandRecord::result_for(const std::string& player_id) const {
    auto it = results.find(player_id);
    return it == results.end() ? nullptr : &it->second;
}

bool HandRecord::folded_before(const std::string& player_id, Street street) const {
    for (const ActionEvent& action : actions) {
        if (action.street < street && action.player_id == player_id && action.kind == ActionKind::FOLD) {
            return true;
        }
    }
    return false;
}

// --- Amount resolution ---

std::optional<double> optional_number(const json& object, const char* key) {
    if (!object.is_object()) return std::nullopt;
    auto it = object.find(key);
    if (it == object.end() || it->is_null() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

double resolve_amount(const json& payload) {
    std::optional<double> amount = optional_number(payload, "amount");
    std::optional<double> value = optional_number(payload, "value");
    return amount.value_or(value.value_or(0.0));
}

// --- HandHistoryParser ---

HandHistoryParser::HandHistoryParser() : evaluator_() {
    spdlog::debug("HandHistoryParser created");
}

ParseReport HandHistoryParser::parse(const json& document) const {
    ParseReport report;

    const json* raw_hands = &document;
    if (document.is_object()) {
        auto it = document.find("hands");
        if (it == document.end()) {
            report.errors++;
            report.messages.push_back("Expected 'hands' to be a list");
            return report;
        }
        raw_hands = &*it;
    }
    if (!raw_hands->is_array()) {
        report.errors++;
        report.messages.push_back("Expected 'hands' to be a list");
        return report;
    }

    size_t index = 0;
    for (const json& raw_hand : *raw_hands) {
        try {
            report.hands.push_back(parse_hand(raw_hand, index, report.warnings));
        } catch (const HandParseError& e) {
            report.errors++;
            report.messages.push_back(e.what());
            spdlog::warn("Skipping hand {}: {}", index, e.what());
        } catch (const json::exception& e) {
            report.errors++;
            report.messages.push_back("Error parsing hand " + std::to_string(index) + ": " + e.what());
            spdlog::warn("Skipping hand {}: {}", index, e.what());
        }
        ++index;
    }

    spdlog::info("Parsed {} hands ({} errors, {} warnings)", report.hands.size(), report.errors, report.warnings.size());
    return report;
}

ParseReport HandHistoryParser::parse_string(const std::string& text) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw HandParseError(std::string("Invalid hand history JSON: ") + e.what());
    }
    return parse(document);
}

ParseReport HandHistoryParser::load_file(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Failed to open hand history file: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    spdlog::info("Loading hand history file: {}", path);
    return parse_string(buffer.str());
}

ParseReport HandHistoryParser::load_files(const std::vector<std::string>& paths) const {
    ParseReport merged;
    for (const std::string& path : paths) {
        ParseReport single = load_file(path);
        merged.errors += single.errors;
        std::move(single.hands.begin(), single.hands.end(), std::back_inserter(merged.hands));
        merged.messages.insert(merged.messages.end(), single.messages.begin(), single.messages.end());
        merged.warnings.insert(merged.warnings.end(), single.warnings.begin(), single.warnings.end());
    }
    return merged;
}

HandRecord HandHistoryParser::parse_hand(const json& raw, size_t index, std::vector<std::string>& warnings) const {
    if (!raw.is_object()) {
        throw HandParseError("Hand " + std::to_string(index) + ": not an object");
    }

    HandRecord hand;
    auto id_it = raw.find("id");
    hand.hand_id = (id_it != raw.end()) ? id_text(*id_it) : "";
    if (hand.hand_id.empty()) hand.hand_id = "hand_" + std::to_string(index);
    hand.dealer_seat = int_field(raw, "dealerSeat", 0);

    auto players_it = raw.find("players");
    if (players_it == raw.end() || !players_it->is_array() || players_it->empty()) {
        throw HandParseError("Hand " + hand.hand_id + ": no players found");
    }
    auto events_it = raw.find("events");
    if (events_it == raw.end() || !events_it->is_array() || events_it->empty()) {
        throw HandParseError("Hand " + hand.hand_id + ": no events found");
    }

    hand.players = parse_players(*players_it, hand.dealer_seat);
    if (hand.players.empty()) {
        throw HandParseError("Hand " + hand.hand_id + ": no usable players");
    }

    parse_events(*events_it, hand, warnings);
    settle_showdown(hand);
    return hand;
}

std::vector<PlayerSeat> HandHistoryParser::parse_players(const json& raw_players, int dealer_seat) const {
    std::vector<PlayerSeat> players;
    for (const json& raw_player : raw_players) {
        if (!raw_player.is_object()) continue;

        PlayerSeat player;
        const json* id = first_present(raw_player, "id", "playerId");
        player.player_id = id ? id_text(*id) : "";
        if (player.player_id.empty()) continue;
        player.seat = int_field(raw_player, "seat", 0);

        std::optional<double> stack = optional_number(raw_player, "stack");
        player.stack = stack.value_or(optional_number(raw_player, "chips").value_or(0.0));

        const json* cards = first_present(raw_player, "cards", "holeCards");
        if (cards) player.hole_cards = parse_cards(*cards);
        player.is_dealer = (player.seat == dealer_seat);
        players.push_back(player);
    }

    // Positions relative to the dealer: 0 = dealer, 1 = SB, 2 = BB, ...
    std::vector<int> seats;
    for (const PlayerSeat& p : players) seats.push_back(p.seat);
    std::sort(seats.begin(), seats.end());
    int n = static_cast<int>(seats.size());
    int dealer_idx = 0;
    for (int i = 0; i < n; ++i) {
        if (seats[i] == dealer_seat) {
            dealer_idx = i;
            break;
        }
    }
    for (PlayerSeat& p : players) {
        int seat_idx = static_cast<int>(std::find(seats.begin(), seats.end(), p.seat) - seats.begin());
        p.position = ((seat_idx - dealer_idx) % n + n) % n;
    }
    return players;
}

std::vector<Card> HandHistoryParser::parse_cards(const json& raw_cards) const {
    std::vector<Card> cards;
    if (raw_cards.is_string()) {
        std::istringstream iss(raw_cards.get<std::string>());
        std::string token;
        while (iss >> token) cards.push_back(normalize_card(token));
        return cards;
    }
    if (!raw_cards.is_array()) return cards;

    for (const json& raw : raw_cards) {
        if (raw.is_string()) {
            cards.push_back(normalize_card(raw.get<std::string>()));
        } else if (raw.is_object()) {
            const json* rank = first_present(raw, "rank", "r");
            const json* suit = first_present(raw, "suit", "s");
            std::string text = (rank && rank->is_string()) ? rank->get<std::string>() : "?";
            text += (suit && suit->is_string()) ? suit->get<std::string>() : "?";
            cards.push_back(normalize_card(text));
        }
    }
    return cards;
}

void HandHistoryParser::parse_events(const json& events, HandRecord& hand, std::vector<std::string>& warnings) const {
    std::map<int, const PlayerSeat*> seat_to_player;
    std::map<int, double> stacks;
    for (const PlayerSeat& p : hand.players) {
        seat_to_player[p.seat] = &p;
        stacks[p.seat] = p.stack;
    }

    Street street = Street::PREFLOP;
    double pot = 0.0;

    for (const json& event : events) {
        if (!event.is_object()) continue;
        auto payload_it = event.find("payload");
        const json& payload = (payload_it != event.end() && payload_it->is_object()) ? *payload_it : event;

        std::optional<double> type_code = optional_number(payload, "type");
        if (!type_code) continue;

        std::optional<ActionKind> kind = action_kind_from_code(static_cast<int>(*type_code));
        if (!kind) {
            std::string warning = "Hand " + hand.hand_id + ": unknown action type " + std::to_string(static_cast<int>(*type_code));
            spdlog::debug("{}", warning);
            warnings.push_back(warning);
            continue;
        }

        double amount = resolve_amount(payload);
        std::optional<double> seat_value = optional_number(payload, "seat");

        if (*kind == ActionKind::BOARD_DEALT) {
            auto cards_it = payload.find("cards");
            std::vector<Card> dealt = (cards_it != payload.end()) ? parse_cards(*cards_it) : std::vector<Card>{};
            if (!dealt.empty()) {
                hand.board.insert(hand.board.end(), dealt.begin(), dealt.end());
                street = street_for_board_size(hand.board.size());
            } else {
                street = next_street(street);
            }
            continue;
        }

        if (*kind == ActionKind::POT_AWARDED) {
            if (!seat_value) continue;
            auto it = seat_to_player.find(static_cast<int>(*seat_value));
            if (it == seat_to_player.end()) continue;

            ShowdownResult& result = hand.results[it->second->player_id];
            result.player_id = it->second->player_id;
            result.won_pot = true;
            result.amount_won += amount;

            const json* desc = first_present(payload, "handDescription", "hand");
            if (desc && desc->is_string()) {
                result.description = desc->get<std::string>();
                result.strength = hand_category_from_description(result.description);
            }
            const json* shown = first_present(payload, "cards", "holeCards");
            if (shown) result.shown_cards = parse_cards(*shown);
            continue;
        }

        if (!seat_value) continue;
        int seat = static_cast<int>(*seat_value);
        auto it = seat_to_player.find(seat);
        if (it == seat_to_player.end()) continue;

        if (*kind == ActionKind::POST_SMALL_BLIND) hand.small_blind = amount;
        if (*kind == ActionKind::POST_BIG_BLIND) hand.big_blind = amount;

        ActionEvent action;
        action.player_id = it->second->player_id;
        action.seat = seat;
        action.street = street;
        action.kind = *kind;
        action.amount = amount;
        action.pot_before = pot;
        action.stack_before = stacks[seat];
        action.is_all_in = amount > 0.0 && amount >= stacks[seat];
        hand.actions.push_back(action);

        if (amount > 0.0) {
            pot += amount;
            stacks[seat] = std::max(0.0, stacks[seat] - amount);
        }
    }
}

void HandHistoryParser::settle_showdown(HandRecord& hand) const {
    if (hand.results.empty()) return;

    std::set<std::string> folded;
    for (const ActionEvent& action : hand.actions) {
        if (action.kind == ActionKind::FOLD) folded.insert(action.player_id);
    }
    std::vector<const PlayerSeat*> unfolded;
    for (const PlayerSeat& p : hand.players) {
        if (!folded.count(p.player_id)) unfolded.push_back(&p);
    }

    // Uncontested pot: the winner did not reach showdown.
    if (unfolded.size() < 2) return;

    for (const PlayerSeat* p : unfolded) {
        ShowdownResult& result = hand.results[p->player_id];
        result.player_id = p->player_id;
        result.reached_showdown = true;

        if (result.strength != HandCategory::UNKNOWN) continue;
        const std::vector<Card>& cards = result.shown_cards.size() == 2 ? result.shown_cards : p->hole_cards;
        if (cards.size() == 2 && is_valid_card(cards[0]) && is_valid_card(cards[1]) && hand.board.size() >= 3) {
            int rank = evaluator_.evaluate(cards, hand.board);
            if (rank != INVALID_HAND_RANK) result.strength = HandEvaluator::categorize(rank);
        }
    }
}

std::vector<PlayerBucket> HandHistoryParser::player_buckets(const std::vector<HandRecord>& hands) {
    std::map<std::string, int> counts;
    for (const HandRecord& hand : hands) {
        std::set<std::string> seen;
        for (const PlayerSeat& p : hand.players) {
            if (seen.insert(p.player_id).second) counts[p.player_id]++;
        }
    }
    std::vector<PlayerBucket> buckets;
    for (const auto& entry : counts) buckets.push_back({entry.first, entry.second});
    std::stable_sort(buckets.begin(), buckets.end(), [](const PlayerBucket& a, const PlayerBucket& b) {
        return a.hands_seen > b.hands_seen;
    });
    return buckets;
}

} // namespace poker_coach
