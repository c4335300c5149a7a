#ifndef POKER_COACH_PLAYER_PROFILE_H
#define POKER_COACH_PLAYER_PROFILE_H

#include <string>
#include <vector>

#include "exploit_detector.h"
#include "hand_history.h"
#include "player_stats.h"
#include "style_classifier.h"

namespace poker_coach {

// Low (<100 hands), Medium (<300), High (<1000), Very High.
std::string confidence_tier(int hands);

// Snapshot of one player. Rebuilt from scratch whenever hands are added.
struct PlayerProfile {
    std::string player_id;
    int hands_analyzed = 0;
    std::string confidence;
    PlayerStats stats;
    StatRates rates;
    PlayStyle style = PlayStyle::UNKNOWN;
    std::vector<std::string> tendencies;
    std::vector<Exploit> exploits;

    std::string style_label() const { return play_style_name(style); }
};

class ProfileAnalyzer {
public:
    ProfileAnalyzer();

    PlayerProfile analyze(const std::vector<HandRecord>& hands, const std::string& player_id) const;
    PlayerProfile build(const PlayerStats& stats) const;

private:
    ExploitDetector detector_;
};

// Convenience wrapper around ProfileAnalyzer::analyze.
PlayerProfile aggregate_profile(const std::vector<HandRecord>& hands, const std::string& player_id);

} // namespace poker_coach

#endif // POKER_COACH_PLAYER_PROFILE_H
