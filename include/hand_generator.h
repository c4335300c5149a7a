#ifndef POKER_COACH_HAND_GENERATOR_H
#define POKER_COACH_HAND_GENERATOR_H

#include <array>
#include <vector>
#include "cards.h"

namespace poker_coach {

// Two hole cards, higher card first.
using HoleCards = std::array<Card, 2>;

class HandGenerator {
public:
    HandGenerator();

    // All 1326 two-card combinations in a fixed order (deck-index order of the
    // first card, then the second).
    std::vector<HoleCards> generate_hands() const;

    // Combinations that share no card with `dead`.
    std::vector<HoleCards> generate_live_hands(const std::vector<Card>& dead) const;
};

} // namespace poker_coach

#endif // POKER_COACH_HAND_GENERATOR_H
