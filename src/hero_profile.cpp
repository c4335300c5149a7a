#include "hero_profile.h"

#include <algorithm> // For std::max, std::min
#include <map>
#include <tuple>     // For std::tie

namespace poker_coach {

namespace {

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

double normalize_rate(const std::optional<double>& raw, double fallback) {
    if (!raw) return fallback;
    double value = *raw;
    if (value > 1.0) value /= 100.0;
    return clamp(value, 0.0, 1.0);
}

double uniform(std::mt19937_64& rng, double low, double high) {
    std::uniform_real_distribution<double> dist(low, high);
    return dist(rng);
}

} // namespace

std::pair<double, double> position_open_target(const std::string& position) {
    static const std::map<std::string, std::pair<double, double>> targets = {
        {"UTG", {0.17, 0.23}}, {"LJ", {0.20, 0.27}}, {"HJ", {0.22, 0.30}}, {"CO", {0.30, 0.39}},
        {"BTN", {0.44, 0.60}}, {"SB", {0.35, 0.48}}, {"BB", {0.00, 0.00}},
    };
    auto it = targets.find(position);
    return it == targets.end() ? std::make_pair(0.22, 0.30) : it->second;
}

HeroProfile::HeroProfile() : HeroProfile(0.30, 0.22, 2.8, 0.09, 0.54) {}

HeroProfile::HeroProfile(double vpip, double pfr, double af, double three_bet, double fold_to_3bet)
    : vpip_(vpip), pfr_(pfr), af_(af), three_bet_(three_bet), fold_to_3bet_(fold_to_3bet) {}

HeroProfile HeroProfile::from_input(const HeroProfileInput& input) {
    return HeroProfile(normalize_rate(input.vpip, 0.30),
                       normalize_rate(input.pfr, 0.22),
                       clamp(input.af.value_or(2.8), 0.4, 8.0),
                       normalize_rate(input.three_bet, 0.09),
                       normalize_rate(input.fold_to_3bet, 0.54));
}

HeroProfile HeroProfile::randomize(std::mt19937_64& rng) {
    // Draw order is part of the seeded contract; do not reorder.
    double vpip = uniform(rng, 0.13, 0.56);
    double max_pfr = std::max(0.08, vpip - uniform(rng, 0.01, 0.14));
    double pfr = uniform(rng, 0.08, std::min(0.44, max_pfr));
    double af = uniform(rng, 0.9, 6.3);
    double three_bet = uniform(rng, 0.025, 0.19);
    double fold_to_3bet = uniform(rng, 0.20, 0.82);

    if (vpip < 0.20) three_bet = std::min(three_bet, uniform(rng, 0.02, 0.10));
    if (pfr > 0.30) three_bet = std::max(three_bet, uniform(rng, 0.08, 0.17));

    return HeroProfile(clamp(vpip, 0.08, 0.65),
                       clamp(pfr, 0.05, 0.50),
                       clamp(af, 0.4, 8.0),
                       clamp(three_bet, 0.01, 0.30),
                       clamp(fold_to_3bet, 0.10, 0.90));
}

double HeroProfile::vpip_pfr_gap() const {
    return std::max(0.0, vpip_ - pfr_);
}

double HeroProfile::preflop_aggression_ratio() const {
    if (vpip_ <= 0.0) return 0.0;
    return pfr_ / vpip_;
}

double HeroProfile::image_bluffiness() const {
    double af_norm = clamp(af_ / 5.0, 0.0, 1.0);
    double ratio_norm = clamp(preflop_aggression_ratio(), 0.0, 1.0);
    return clamp(0.42 * vpip_ + 0.34 * pfr_ + 0.14 * af_norm + 0.10 * ratio_norm, 0.0, 1.0);
}

std::string HeroProfile::style_label() const {
    if (vpip_ < 0.17 && pfr_ < 0.13) return "Nit / Tight-Passive";
    if (vpip_ < 0.24 && pfr_ >= 0.16 && af_ >= 2.0) return "TAG";
    if (vpip_ >= 0.28 && pfr_ >= 0.20 && af_ >= 2.2) return "LAG";
    if (vpip_ >= 0.30 && pfr_ < 0.17) return "Loose-Passive";
    if (af_ >= 4.0 && vpip_ >= 0.35) return "Maniac / Over-aggressive";
    return "Hybrid / Transitional";
}

std::vector<std::string> HeroProfile::leak_flags() const {
    std::vector<std::string> flags;
    if (vpip_pfr_gap() > 0.10) flags.push_back("Large VPIP-PFR gap: likely overcalling preflop.");
    if (preflop_aggression_ratio() < 0.62 && vpip_ > 0.25) {
        flags.push_back("Low raise-to-play ratio: not converting enough opens to raises.");
    }
    if (af_ > 4.0) flags.push_back("Very high AF: likely over-bluffing late streets.");
    if (fold_to_3bet_ > 0.65) flags.push_back("High fold to 3-bet: opponents can re-raise light.");
    if (three_bet_ < 0.05) flags.push_back("Low 3-bet rate: value-heavy and potentially face-up.");
    return flags;
}

PositionGuidance HeroProfile::position_guidance(const std::string& position, const std::string& street) const {
    PositionGuidance g;
    g.position = position;
    g.street = street;
    std::tie(g.target_open_low, g.target_open_high) = position_open_target(position);
    g.style_label = style_label();

    if (position == "BTN") {
        g.notes.push_back("Apply widest pressure here; isolate stations with larger sizings.");
    }
    if (position == "SB" || position == "BB") {
        g.notes.push_back("OOP penalty is real: reduce low-equity bluffs and avoid bloating marginal pots.");
    }
    if (position == "UTG" || position == "LJ" || position == "HJ") {
        g.notes.push_back("Use tighter value-heavy opens; preserve EV by avoiding dominated offsuit broadways.");
    }
    if ((street == "turn" || street == "river") && af_ > 3.6) {
        g.notes.push_back("Your AF is high: tighten river bluffs and keep value density high.");
    }
    if (vpip_pfr_gap() > 0.10) {
        g.notes.push_back("You call too much versus your opens: convert best call candidates into raises.");
    }
    return g;
}

} // namespace poker_coach
