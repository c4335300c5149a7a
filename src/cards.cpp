#include "cards.h"
#include "errors.h"

#include <algorithm> // For std::sort, std::max, std::find
#include <cctype>    // For std::toupper, std::tolower
#include <functional> // For std::greater
#include <map>
#include <set>

namespace poker_coach {

namespace {

const std::string RANK_CHARS = "23456789TJQKA";
const std::string SUIT_CHARS = "cdhs";

std::vector<Card> build_deck() {
    std::vector<Card> deck;
    deck.reserve(52);
    for (char r : RANK_CHARS) {
        for (char s : SUIT_CHARS) {
            deck.push_back(std::string(1, r) + s);
        }
    }
    return deck;
}

} // namespace

std::string street_to_string(Street street) {
    switch (street) {
        case Street::PREFLOP:  return "preflop";
        case Street::FLOP:     return "flop";
        case Street::TURN:     return "turn";
        case Street::RIVER:    return "river";
        case Street::SHOWDOWN: return "showdown";
    }
    return "unknown";
}

Street street_from_string(const std::string& name) {
    if (name == "preflop") return Street::PREFLOP;
    if (name == "flop") return Street::FLOP;
    if (name == "turn") return Street::TURN;
    if (name == "river") return Street::RIVER;
    if (name == "showdown") return Street::SHOWDOWN;
    throw ConfigError("street must be one of preflop, flop, turn, river (got '" + name + "')");
}

int board_card_count(Street street) {
    switch (street) {
        case Street::PREFLOP: return 0;
        case Street::FLOP:    return 3;
        case Street::TURN:    return 4;
        default:              return 5;
    }
}

Street street_for_board_size(size_t board_cards) {
    if (board_cards >= 5) return Street::RIVER;
    if (board_cards == 4) return Street::TURN;
    if (board_cards >= 3) return Street::FLOP;
    return Street::PREFLOP;
}

int card_rank(const Card& card) {
    if (card.empty()) return 0;
    size_t idx = RANK_CHARS.find(card[0]);
    if (idx == std::string::npos) return 0;
    return static_cast<int>(idx) + 2;
}

char card_suit(const Card& card) {
    if (card.size() != 2) return '?';
    return SUIT_CHARS.find(card[1]) == std::string::npos ? '?' : card[1];
}

bool is_valid_card(const Card& card) {
    return card.size() == 2 && card_rank(card) != 0 && card_suit(card) != '?';
}

Card normalize_card(const std::string& raw) {
    std::string text;
    for (char c : raw) {
        if (!std::isspace(static_cast<unsigned char>(c))) text.push_back(c);
    }
    if (text.size() < 2) return "??";

    // Rank: "10" or a single character
    char rank = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    size_t suit_start = 1;
    if (text.compare(0, 2, "10") == 0) {
        rank = 'T';
        suit_start = 2;
    }
    if (RANK_CHARS.find(rank) == std::string::npos || suit_start >= text.size()) return "??";

    std::string suit_text = text.substr(suit_start);
    std::string lowered;
    for (char c : suit_text) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    static const std::map<std::string, char> suit_names = {
        {"c", 'c'}, {"d", 'd'}, {"h", 'h'}, {"s", 's'},
        {"clubs", 'c'}, {"diamonds", 'd'}, {"hearts", 'h'}, {"spades", 's'},
        {"\xE2\x99\xA3", 'c'}, {"\xE2\x99\xA6", 'd'}, {"\xE2\x99\xA5", 'h'}, {"\xE2\x99\xA0", 's'},
        {"\xE2\x99\xA7", 'c'}, {"\xE2\x99\xA2", 'd'}, {"\xE2\x99\xA1", 'h'}, {"\xE2\x99\xA4", 's'},
    };
    auto it = suit_names.find(lowered);
    if (it == suit_names.end()) return "??";
    return std::string(1, rank) + it->second;
}

const std::vector<Card>& full_deck() {
    static const std::vector<Card> deck = build_deck();
    return deck;
}

std::vector<Card> remove_cards(const std::vector<Card>& deck, const std::vector<Card>& dead) {
    std::set<Card> dead_set(dead.begin(), dead.end());
    std::vector<Card> out;
    out.reserve(deck.size());
    for (const Card& card : deck) {
        if (!dead_set.count(card)) out.push_back(card);
    }
    return out;
}

std::string combo_class(const Card& a, const Card& b) {
    Card c1 = a;
    Card c2 = b;
    if (card_rank(c2) > card_rank(c1)) std::swap(c1, c2);
    if (c1[0] == c2[0]) return std::string(1, c1[0]) + c2[0];
    bool suited = card_suit(c1) == card_suit(c2);
    return std::string(1, c1[0]) + c2[0] + (suited ? "s" : "o");
}

double preflop_strength_score(const Card& a, const Card& b) {
    int r1 = card_rank(a);
    int r2 = card_rank(b);
    int high = std::max(r1, r2);
    int low = std::min(r1, r2);

    double score = high * 3.0 + low * 2.0;
    if (r1 == r2) score += 24.0 + r1 * 1.5;
    if (card_suit(a) == card_suit(b)) score += 4.0;

    int gap = high - low;
    if (gap == 1) score += 4.0;
    else if (gap == 2) score += 2.0;
    else if (gap >= 4) score -= 2.0;

    if (high >= 11) score += 2.0; // Broadway high card
    return std::max(0.0, std::min(100.0, score));
}

double board_texture_score(const std::vector<Card>& board) {
    if (board.size() < 3) return 0.0;

    std::vector<int> ranks;
    std::map<char, int> suit_counts;
    for (const Card& card : board) {
        ranks.push_back(card_rank(card));
        suit_counts[card_suit(card)]++;
    }
    std::sort(ranks.begin(), ranks.end(), std::greater<int>());

    int max_suit = 0;
    for (const auto& entry : suit_counts) max_suit = std::max(max_suit, entry.second);

    int connected = 0;
    for (size_t i = 0; i + 1 < ranks.size(); ++i) {
        if (ranks[i] - ranks[i + 1] <= 2) connected++;
    }
    bool paired = std::set<int>(ranks.begin(), ranks.end()).size() < ranks.size();

    double texture = 0.9 * std::max(0, max_suit - 2);
    texture += 0.6 * connected;
    if (paired) texture += 0.8;
    return texture;
}

std::string texture_label(double texture) {
    if (texture < 0.7) return "dry";
    if (texture < 1.6) return "semi-wet";
    return "wet";
}

} // namespace poker_coach
