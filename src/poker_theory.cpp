#include "poker_theory.h"

#include <algorithm> // For std::max, std::min

namespace poker_coach {
namespace theory {

namespace {

constexpr double EPSILON = 1e-9;

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

} // namespace

double required_equity(double pot_before_call, double call_amount) {
    double pot = std::max(0.0, pot_before_call);
    double call = std::max(0.0, call_amount);
    if (call <= 0.0) return 0.0;
    return call / std::max(EPSILON, pot + call);
}

double minimum_defense_frequency(double pot_before_bet, double bet_size) {
    double pot = std::max(0.0, pot_before_bet);
    double bet = std::max(0.0, bet_size);
    if (bet <= 0.0) return 1.0;
    return clamp01(pot / std::max(EPSILON, pot + bet));
}

double break_even_fold_frequency(double risk, double reward) {
    double r = std::max(0.0, risk);
    double w = std::max(0.0, reward);
    if (r <= 0.0) return 0.0;
    return clamp01(r / std::max(EPSILON, r + w));
}

double polarized_bluff_share(double bet_to_pot) {
    double b = std::max(0.0, bet_to_pot);
    if (b <= 0.0) return 0.0;
    return clamp01(b / (1.0 + b));
}

double bluff_to_value_ratio(double bet_to_pot) {
    return std::max(0.0, bet_to_pot);
}

double stack_to_pot_ratio(double effective_stack, double pot) {
    return std::max(0.0, effective_stack) / std::max(EPSILON, pot);
}

SprBand classify_spr(double spr) {
    double s = std::max(0.0, spr);
    if (s < 2.0) {
        return {"Very Low SPR",
                {"Commitment threshold is low; value edges realize quickly.",
                 "Avoid high-frequency pure bluffs unless fold equity is clear."}};
    }
    if (s < 4.5) {
        return {"Low SPR",
                {"One-pair plus strong draws gain stack-off value more often.",
                 "Pressure lines should be size-disciplined to avoid over-investing weak bluff-catchers."}};
    }
    if (s < 8.0) {
        return {"Medium SPR",
                {"Mix value and pressure; future-street realization matters.",
                 "Favor hands with redraws/blockers when building aggressive lines."}};
    }
    return {"High SPR",
            {"Nutted potential rises in value; medium made hands become thinner stacks-off.",
             "Use selective aggression and protect against reverse implied odds."}};
}

} // namespace theory
} // namespace poker_coach
