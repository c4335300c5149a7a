#ifndef POKER_COACH_HERO_PROFILE_H
#define POKER_COACH_HERO_PROFILE_H

#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace poker_coach {

// Raw hero stats as supplied by a caller. Each field is optional; rates
// above 1 are read as percentages.
struct HeroProfileInput {
    std::optional<double> vpip;
    std::optional<double> pfr;
    std::optional<double> af;
    std::optional<double> three_bet;
    std::optional<double> fold_to_3bet;
};

struct PositionGuidance {
    std::string position;
    std::string street;
    double target_open_low = 0.0;
    double target_open_high = 0.0;
    std::string style_label;
    std::vector<std::string> notes;
};

// Opening VPIP band for a position; unknown positions get (0.22, 0.30).
std::pair<double, double> position_open_target(const std::string& position);

class HeroProfile {
public:
    // Defaults: 0.30 / 0.22 / 2.8 / 0.09 / 0.54.
    HeroProfile();
    HeroProfile(double vpip, double pfr, double af, double three_bet, double fold_to_3bet);

    // Fills missing fields with defaults, normalises percentages and clamps.
    static HeroProfile from_input(const HeroProfileInput& input);
    // Broad random profile so drills cover tight, balanced and loose images.
    static HeroProfile randomize(std::mt19937_64& rng);

    double vpip() const { return vpip_; }
    double pfr() const { return pfr_; }
    double af() const { return af_; }
    double three_bet() const { return three_bet_; }
    double fold_to_3bet() const { return fold_to_3bet_; }

    double vpip_pfr_gap() const;
    double preflop_aggression_ratio() const;
    // How bluffy opponents perceive hero to be, 0..1.
    double image_bluffiness() const;
    std::string style_label() const;
    std::vector<std::string> leak_flags() const;
    PositionGuidance position_guidance(const std::string& position, const std::string& street) const;

private:
    double vpip_;
    double pfr_;
    double af_;
    double three_bet_;
    double fold_to_3bet_;
};

} // namespace poker_coach

#endif // POKER_COACH_HERO_PROFILE_H
