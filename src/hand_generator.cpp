#include "hand_generator.h"

#include <vector>
#include <set>
#include "spdlog/spdlog.h"

namespace poker_coach {

HandGenerator::HandGenerator() {
    spdlog::debug("HandGenerator created");
}

std::vector<HoleCards> HandGenerator::generate_hands() const {
    const std::vector<Card>& deck = full_deck();
    std::vector<HoleCards> hands;
    hands.reserve(1326);
    for (size_t i = 0; i < deck.size(); ++i) {
        for (size_t j = i + 1; j < deck.size(); ++j) {
            // deck is rank-major ascending, so deck[j] is never lower than deck[i]
            hands.push_back({deck[j], deck[i]});
        }
    }
    spdlog::trace("Generated {} unique hands.", hands.size());
    return hands;
}

std::vector<HoleCards> HandGenerator::generate_live_hands(const std::vector<Card>& dead) const {
    std::set<Card> dead_set(dead.begin(), dead.end());
    std::vector<HoleCards> live;
    for (const HoleCards& hand : generate_hands()) {
        if (dead_set.count(hand[0]) || dead_set.count(hand[1])) continue;
        live.push_back(hand);
    }
    return live;
}

} // namespace poker_coach
