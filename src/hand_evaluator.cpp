#include "hand_evaluator.h"

#include <string>
#include <vector>
#include <algorithm>
#include <cctype> // For std::tolower
#include "spdlog/spdlog.h"
#include "phevaluator/phevaluator.h" // Include PokerHandEvaluator header

namespace poker_coach {

namespace {

const int INVALID_PHE_CARD_INDEX = -1; // Use -1 as invalid for phevaluator

struct CategoryBand {
    HandCategory category;
    int best_rank;  // Lowest (best) phevaluator rank in the band
    int worst_rank; // Highest (worst) phevaluator rank in the band
};

// phevaluator rank ranges per category, best to worst.
const CategoryBand CATEGORY_BANDS[] = {
    {HandCategory::ROYAL_FLUSH, 1, 1},
    {HandCategory::STRAIGHT_FLUSH, 2, 10},
    {HandCategory::FOUR_OF_A_KIND, 11, 166},
    {HandCategory::FULL_HOUSE, 167, 322},
    {HandCategory::FLUSH, 323, 1599},
    {HandCategory::STRAIGHT, 1600, 1609},
    {HandCategory::THREE_OF_A_KIND, 1610, 2467},
    {HandCategory::TWO_PAIR, 2468, 3325},
    {HandCategory::ONE_PAIR, 3326, 6185},
    {HandCategory::HIGH_CARD, 6186, 7462},
};

} // namespace

std::string hand_category_name(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::ONE_PAIR:        return "Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        case HandCategory::ROYAL_FLUSH:     return "Royal Flush";
        default:                            return "Unknown";
    }
}

HandCategory hand_category_from_description(const std::string& description) {
    std::string text;
    for (char c : description) text.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    // Longer phrases first: "straight flush" contains both "straight" and "flush".
    static const std::vector<std::pair<std::string, HandCategory>> phrases = {
        {"royal flush", HandCategory::ROYAL_FLUSH},
        {"straight flush", HandCategory::STRAIGHT_FLUSH},
        {"four of a kind", HandCategory::FOUR_OF_A_KIND},
        {"quads", HandCategory::FOUR_OF_A_KIND},
        {"full house", HandCategory::FULL_HOUSE},
        {"flush", HandCategory::FLUSH},
        {"straight", HandCategory::STRAIGHT},
        {"three of a kind", HandCategory::THREE_OF_A_KIND},
        {"trips", HandCategory::THREE_OF_A_KIND},
        {"set", HandCategory::THREE_OF_A_KIND},
        {"two pair", HandCategory::TWO_PAIR},
        {"pair", HandCategory::ONE_PAIR},
        {"high card", HandCategory::HIGH_CARD},
        {"high", HandCategory::HIGH_CARD},
    };
    for (const auto& phrase : phrases) {
        if (text.find(phrase.first) != std::string::npos) return phrase.second;
    }
    return HandCategory::UNKNOWN;
}

// Helper function to convert our string card representation ("As", "Td")
// to PokerHandEvaluator's internal card index (0-51).
int to_phe_card_index(const Card& card) {
    int rank = card_rank(card) - 2; // 0=2, ..., 12=A
    char suit_char = card_suit(card);
    int suit = -1; // 0=c, 1=d, 2=h, 3=s (PokerHandEvaluator suit order)
    if (suit_char == 'c') suit = 0;
    else if (suit_char == 'd') suit = 1;
    else if (suit_char == 'h') suit = 2;
    else if (suit_char == 's') suit = 3;

    if (rank < 0 || suit == -1) {
        spdlog::error("Invalid rank or suit in card string: {}", card);
        return INVALID_PHE_CARD_INDEX;
    }
    return rank * 4 + suit;
}

HandEvaluator::HandEvaluator() {
    spdlog::debug("HandEvaluator created");
}

int HandEvaluator::evaluate(const std::vector<Card>& private_cards, const std::vector<Card>& community_cards) const {
    if (private_cards.size() != 2) {
        spdlog::error("Invalid private card count for evaluation: {}", private_cards.size());
        return INVALID_HAND_RANK;
    }
    if (community_cards.size() < 3 || community_cards.size() > 5) {
        spdlog::warn("evaluate called with {} board cards (need 3-5). Returning worst rank.", community_cards.size());
        return INVALID_HAND_RANK;
    }

    int idx[7];
    size_t n = 0;
    for (const Card& card : private_cards) idx[n++] = to_phe_card_index(card);
    for (const Card& card : community_cards) idx[n++] = to_phe_card_index(card);
    for (size_t i = 0; i < n; ++i) {
        if (idx[i] == INVALID_PHE_CARD_INDEX) return INVALID_HAND_RANK;
    }

    // The returned value is an int representing the hand rank (1 is best, 7462 is worst).
    switch (n) {
        case 5: return evaluate_5cards(idx[0], idx[1], idx[2], idx[3], idx[4]);
        case 6: return evaluate_6cards(idx[0], idx[1], idx[2], idx[3], idx[4], idx[5]);
        default: return evaluate_7cards(idx[0], idx[1], idx[2], idx[3], idx[4], idx[5], idx[6]);
    }
}

int HandEvaluator::evaluate_7_card_hand(const std::vector<Card>& private_cards, const std::vector<Card>& community_cards) const {
    if (community_cards.size() != 5) {
        spdlog::warn("evaluate_7_card_hand called with incomplete board ({} cards). Returning worst rank.", community_cards.size());
        return INVALID_HAND_RANK;
    }
    return evaluate(private_cards, community_cards);
}

HandCategory HandEvaluator::categorize(int rank) {
    for (const CategoryBand& band : CATEGORY_BANDS) {
        if (rank >= band.best_rank && rank <= band.worst_rank) return band.category;
    }
    return HandCategory::UNKNOWN;
}

double HandEvaluator::made_hand_score(const std::vector<Card>& private_cards, const std::vector<Card>& community_cards) const {
    if (community_cards.size() < 3) return 0.0;
    int rank = evaluate(private_cards, community_cards);
    if (rank == INVALID_HAND_RANK) return 0.0;

    for (const CategoryBand& band : CATEGORY_BANDS) {
        if (rank < band.best_rank || rank > band.worst_rank) continue;
        // Straight flush and royal flush share the top step.
        int step = std::min(8, static_cast<int>(band.category) - 1);
        double span = static_cast<double>(band.worst_rank - band.best_rank);
        double kicker = span > 0.0 ? 1.0 - (rank - band.best_rank) / span : 1.0;
        return step / 8.0 + 0.3 * kicker;
    }
    return 0.0;
}

} // namespace poker_coach
