#ifndef POKER_COACH_HAND_EVALUATOR_H
#define POKER_COACH_HAND_EVALUATOR_H

#include <string>
#include <vector>
#include "cards.h"
#include "phevaluator/phevaluator.h" // Include PokerHandEvaluator header

namespace poker_coach {

// Worst possible phevaluator rank plus one, returned on invalid input.
constexpr int INVALID_HAND_RANK = 9999;

// Made-hand categories. Values double as the 1..10 showdown strength scale
// used by the statistics (HIGH_CARD = 1 ... ROYAL_FLUSH = 10).
enum class HandCategory : int {
    UNKNOWN = 0,
    HIGH_CARD = 1,
    ONE_PAIR = 2,
    TWO_PAIR = 3,
    THREE_OF_A_KIND = 4,
    STRAIGHT = 5,
    FLUSH = 6,
    FULL_HOUSE = 7,
    FOUR_OF_A_KIND = 8,
    STRAIGHT_FLUSH = 9,
    ROYAL_FLUSH = 10
};

std::string hand_category_name(HandCategory category);
// Reads "two pair", "Full House", "flush, ace high" ... UNKNOWN if nothing matches.
HandCategory hand_category_from_description(const std::string& description);

// Converts "As" to the phevaluator card index (rank * 4 + suit), -1 if invalid.
int to_phe_card_index(const Card& card);

class HandEvaluator {
public:
    HandEvaluator();

    // Evaluates 2 private cards with 3..5 community cards using PokerHandEvaluator.
    // Returns a numerical score where LOWER is better (1 = Royal Flush, 7462 = worst high card).
    // Returns INVALID_HAND_RANK on bad input.
    int evaluate(const std::vector<Card>& private_cards, const std::vector<Card>& community_cards) const;

    // Full 7-card evaluation; the board must hold exactly 5 cards.
    int evaluate_7_card_hand(const std::vector<Card>& private_cards, const std::vector<Card>& community_cards) const;

    // Category of a phevaluator rank.
    static HandCategory categorize(int rank);

    // Made-hand score in roughly [0, 1.3]: category / 8 plus a within-category
    // kicker term. 0 when fewer than 3 board cards are known.
    double made_hand_score(const std::vector<Card>& private_cards, const std::vector<Card>& community_cards) const;
};

} // namespace poker_coach

#endif // POKER_COACH_HAND_EVALUATOR_H
