#include "archetype_matcher.h"
#include "errors.h"

#include <algorithm> // For std::stable_sort, std::min
#include <cctype>
#include <cmath>     // For std::isfinite

#include "spdlog/spdlog.h"

namespace poker_coach {

namespace {

std::string lowered(const std::string& text) {
    std::string out;
    for (char c : text) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool label_has(const StatVector& s, const char* needle) {
    return lowered(s.style_label).find(needle) != std::string::npos;
}

double capped_af(double af) {
    if (!std::isfinite(af)) return ArchetypeMatcher::AF_CAP;
    return std::max(0.0, std::min(af, ArchetypeMatcher::AF_CAP));
}

std::vector<MatchRule> build_rules() {
    return {
        {"calling_station", [](const StatVector& s) { return label_has(s, "calling") || label_has(s, "loose-passive"); }, 0.68},
        {"calling_station", [](const StatVector& s) { return s.vpip >= 0.35 && capped_af(s.af) <= 1.5; }, 0.76},
        {"overcaller_preflop", [](const StatVector& s) { return s.gap() > 0.20; }, 0.78},
        {"maniac", [](const StatVector& s) { return capped_af(s.af) >= 3.8; }, 0.74},
        {"lag_reg", [](const StatVector& s) { return capped_af(s.af) >= 3.8; }, 0.84},
        {"nit", [](const StatVector& s) { return s.vpip <= 0.20; }, 0.80},
        {"weak_tight", [](const StatVector& s) { return s.vpip <= 0.20; }, 0.82},
        {"maniac", [](const StatVector& s) { return label_has(s, "maniac"); }, 0.70},
        {"nit", [](const StatVector& s) { return label_has(s, "nit"); }, 0.72},
        {"tag_reg", [](const StatVector& s) { return label_has(s, "tight-aggressive"); }, 0.76},
        {"lag_reg", [](const StatVector& s) { return label_has(s, "loose-aggressive"); }, 0.76},
    };
}

} // namespace

ArchetypeMatcher::ArchetypeMatcher() : rules_(build_rules()) {
    spdlog::debug("ArchetypeMatcher created with {} rules", rules_.size());
}

double ArchetypeMatcher::base_distance(const StatVector& stats, const Archetype& archetype) {
    double d_vpip = (stats.vpip - archetype.vpip) / VPIP_SCALE;
    double d_pfr = (stats.pfr - archetype.pfr) / PFR_SCALE;
    double d_af = (capped_af(stats.af) - archetype.af) / AF_SCALE;
    double d_gap = (stats.gap() - archetype.gap()) / GAP_SCALE;
    return d_vpip * d_vpip + d_pfr * d_pfr + d_af * d_af + d_gap * d_gap;
}

std::vector<ArchetypeMatch> ArchetypeMatcher::rank(const StatVector& stats) const {
    std::vector<ArchetypeMatch> matches;
    for (const Archetype& archetype : archetype_catalogue()) {
        double distance = base_distance(stats, archetype);
        for (const MatchRule& rule : rules_) {
            if (rule.archetype_key == archetype.key && rule.applies(stats)) distance *= rule.multiplier;
        }
        matches.push_back({archetype.key, archetype.label, distance, 1.0 / (1.0 + distance)});
    }
    std::stable_sort(matches.begin(), matches.end(), [](const ArchetypeMatch& a, const ArchetypeMatch& b) {
        return a.distance < b.distance;
    });
    return matches;
}

ArchetypeMatch ArchetypeMatcher::match(const StatVector& stats) const {
    ArchetypeMatch best = rank(stats).front();
    spdlog::debug("Matched vpip={:.2f} pfr={:.2f} af={:.2f} to {} (distance {:.3f})",
                  stats.vpip, stats.pfr, stats.af, best.key, best.distance);
    return best;
}

StatVector ArchetypeMatcher::from_profile(const PlayerProfile& profile) {
    if (!profile.rates.vpip || !profile.rates.pfr) {
        throw ConfigError("Player " + profile.player_id + " has no hands to match");
    }
    StatVector stats;
    stats.vpip = *profile.rates.vpip;
    stats.pfr = *profile.rates.pfr;
    stats.af = profile.rates.aggression_factor.value_or(DEFAULT_AF);
    stats.style_label = profile.style_label();
    return stats;
}

} // namespace poker_coach
