#ifndef POKER_COACH_ARCHETYPE_MATCHER_H
#define POKER_COACH_ARCHETYPE_MATCHER_H

#include <functional>
#include <string>
#include <vector>

#include "archetypes.h"
#include "player_profile.h"

namespace poker_coach {

// Observed behaviour to classify. gap is derived from vpip and pfr.
struct StatVector {
    double vpip = 0.0;
    double pfr = 0.0;
    double af = 0.0;
    std::string style_label; // Optional corroborating evidence

    double gap() const { return vpip > pfr ? vpip - pfr : 0.0; }
};

struct ArchetypeMatch {
    std::string key;
    std::string label;
    double distance = 0.0; // After multipliers
    double score = 0.0;    // 1 / (1 + distance)
};

// Discounts one archetype's distance when the evidence supports it.
struct MatchRule {
    std::string archetype_key;
    std::function<bool(const StatVector&)> applies;
    double multiplier;
};

class ArchetypeMatcher {
public:
    // Per-dimension scales so each term contributes comparably.
    static constexpr double VPIP_SCALE = 0.18;
    static constexpr double PFR_SCALE = 0.13;
    static constexpr double AF_SCALE = 2.2;
    static constexpr double GAP_SCALE = 0.15;
    // Infinite or very large AF readings are capped before matching.
    static constexpr double AF_CAP = 6.0;
    // Used when a profile has too few postflop actions for a defined AF.
    static constexpr double DEFAULT_AF = 2.0;

    ArchetypeMatcher();

    // Nearest archetype; ties go to catalogue order.
    ArchetypeMatch match(const StatVector& stats) const;
    // All archetypes, nearest first.
    std::vector<ArchetypeMatch> rank(const StatVector& stats) const;

    // Squared, scaled distance before any multiplier.
    static double base_distance(const StatVector& stats, const Archetype& archetype);

    // Throws ConfigError when the profile has no hands.
    static StatVector from_profile(const PlayerProfile& profile);

    const std::vector<MatchRule>& rules() const { return rules_; }

private:
    std::vector<MatchRule> rules_;
};

} // namespace poker_coach

#endif // POKER_COACH_ARCHETYPE_MATCHER_H
