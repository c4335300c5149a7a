#ifndef POKER_COACH_EXPLOIT_DETECTOR_H
#define POKER_COACH_EXPLOIT_DETECTOR_H

#include <functional>
#include <string>
#include <vector>

#include "player_stats.h"

namespace poker_coach {

struct Exploit {
    std::string category; // "preflop", "flop", "turn" or "river"
    std::string description;
    std::string counter_strategy;
    double confidence = 0.0;
};

// One row of the rule table. `applies` must only read rates it checks for
// definedness; `describe` is called only when `applies` returned true.
struct ExploitRule {
    std::string category;
    std::function<bool(const StatRates&)> applies;
    std::function<std::string(const StatRates&)> describe;
    std::string counter_strategy;
    double confidence;
};

class ExploitDetector {
public:
    ExploitDetector();

    // Evaluates every rule against one profile snapshot. Matches are sorted
    // by confidence, highest first, ties in table order.
    std::vector<Exploit> detect(const StatRates& rates) const;

    const std::vector<ExploitRule>& rules() const { return rules_; }

private:
    std::vector<ExploitRule> rules_;
};

} // namespace poker_coach

#endif // POKER_COACH_EXPLOIT_DETECTOR_H
