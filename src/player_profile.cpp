#include "player_profile.h"

#include "spdlog/spdlog.h"

namespace poker_coach {

std::string confidence_tier(int hands) {
    if (hands < 100) return "Low";
    if (hands < 300) return "Medium";
    if (hands < 1000) return "High";
    return "Very High";
}

ProfileAnalyzer::ProfileAnalyzer() : detector_() {
    spdlog::debug("ProfileAnalyzer created");
}

PlayerProfile ProfileAnalyzer::analyze(const std::vector<HandRecord>& hands, const std::string& player_id) const {
    StatsAggregator aggregator(player_id);
    aggregator.add_hands(hands);
    PlayerProfile profile = build(aggregator.stats());
    spdlog::info("Profiled {} over {} hands: {} ({} tendencies, {} exploits)",
                 player_id, profile.hands_analyzed, profile.style_label(),
                 profile.tendencies.size(), profile.exploits.size());
    return profile;
}

PlayerProfile ProfileAnalyzer::build(const PlayerStats& stats) const {
    PlayerProfile profile;
    profile.player_id = stats.player_id;
    profile.hands_analyzed = stats.hands_played;
    profile.confidence = confidence_tier(stats.hands_played);
    profile.stats = stats;
    profile.rates = compute_rates(stats);
    profile.style = StyleClassifier::classify(profile.rates);
    profile.tendencies = StyleClassifier::tendencies(profile.rates);
    profile.exploits = detector_.detect(profile.rates);
    return profile;
}

PlayerProfile aggregate_profile(const std::vector<HandRecord>& hands, const std::string& player_id) {
    ProfileAnalyzer analyzer;
    return analyzer.analyze(hands, player_id);
}

} // namespace poker_coach
