#ifndef POKER_COACH_STYLE_CLASSIFIER_H
#define POKER_COACH_STYLE_CLASSIFIER_H

#include <string>
#include <vector>

#include "player_stats.h"

namespace poker_coach {

enum class PlayStyle {
    UNKNOWN,
    TIGHT_PASSIVE,
    TIGHT_AGGRESSIVE,
    LOOSE_PASSIVE,
    LOOSE_AGGRESSIVE,
    MANIAC,
    NIT
};

// "Tight-Aggressive (TAG)", "Loose-Passive (Calling Station)", ...
std::string play_style_name(PlayStyle style);

// Fewer hands than this always classify as UNKNOWN.
constexpr int MIN_HANDS_FOR_STYLE = 20;

class StyleClassifier {
public:
    // Ordered decision tree, first match wins. An undefined AF never
    // satisfies an AF condition.
    static PlayStyle classify(const StatRates& rates);

    // Every tendency threshold that fires, in table order.
    static std::vector<std::string> tendencies(const StatRates& rates);
};

} // namespace poker_coach

#endif // POKER_COACH_STYLE_CLASSIFIER_H
