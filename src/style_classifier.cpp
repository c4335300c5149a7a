#include "style_classifier.h"

#include "spdlog/fmt/fmt.h" // For fmt::format

namespace poker_coach {

namespace {

std::string pct(double rate, int decimals = 0) {
    return fmt::format("{:.{}f}%", rate * 100.0, decimals);
}

} // namespace

std::string play_style_name(PlayStyle style) {
    switch (style) {
        case PlayStyle::TIGHT_PASSIVE:    return "Tight-Passive (Rock)";
        case PlayStyle::TIGHT_AGGRESSIVE: return "Tight-Aggressive (TAG)";
        case PlayStyle::LOOSE_PASSIVE:    return "Loose-Passive (Calling Station)";
        case PlayStyle::LOOSE_AGGRESSIVE: return "Loose-Aggressive (LAG)";
        case PlayStyle::MANIAC:           return "Maniac";
        case PlayStyle::NIT:              return "Nit";
        default:                          return "Unknown";
    }
}

PlayStyle StyleClassifier::classify(const StatRates& rates) {
    if (rates.hands < MIN_HANDS_FOR_STYLE || !rates.vpip || !rates.pfr) return PlayStyle::UNKNOWN;

    double vpip = *rates.vpip;
    double pfr = *rates.pfr;
    const std::optional<double>& af = rates.aggression_factor;

    if (vpip > 0.45 && above(af, 3.5)) return PlayStyle::MANIAC;
    if (vpip < 0.14 && pfr < 0.10) return PlayStyle::NIT;

    bool tight = vpip < 0.20;
    bool loose = vpip > 0.28;
    bool aggressive = pfr > 0.22 || above(af, 2.0);
    bool passive = pfr < 0.14 && below(af, 1.5);

    if (tight && aggressive) return PlayStyle::TIGHT_AGGRESSIVE;
    if (tight && passive) return PlayStyle::TIGHT_PASSIVE;
    if (loose && aggressive) return PlayStyle::LOOSE_AGGRESSIVE;
    if (loose && passive) return PlayStyle::LOOSE_PASSIVE;

    // Middle bands
    bool leans_aggressive = pfr >= 0.14 || (af && *af >= 1.5);
    if (vpip < 0.24) return leans_aggressive ? PlayStyle::TIGHT_AGGRESSIVE : PlayStyle::TIGHT_PASSIVE;
    return leans_aggressive ? PlayStyle::LOOSE_AGGRESSIVE : PlayStyle::LOOSE_PASSIVE;
}

std::vector<std::string> StyleClassifier::tendencies(const StatRates& r) {
    std::vector<std::string> out;

    if (above(r.vpip, 0.33)) out.push_back("Plays very loose preflop (VPIP > 33%)");
    else if (below(r.vpip, 0.17)) out.push_back("Plays very tight preflop (VPIP < 17%)");
    if (above(r.vpip_pfr_gap, 0.10)) out.push_back("Large VPIP-PFR gap (" + pct(*r.vpip_pfr_gap, 1) + ") - calls too much");
    if (above(r.limp, 0.08)) out.push_back("Limps frequently (" + pct(*r.limp, 1) + ")");

    if (above(r.three_bet, 0.10)) out.push_back("Aggressive 3-bettor");
    else if (below(r.three_bet, 0.03)) out.push_back("Rarely 3-bets (value-heavy range)");
    if (above(r.fold_to_3bet, 0.65)) out.push_back("Folds to 3-bets too often (" + pct(*r.fold_to_3bet) + ")");

    if (above(r.cbet_flop, 0.70)) out.push_back("C-bets very frequently (easy to float)");
    else if (below(r.cbet_flop, 0.45)) out.push_back("Rarely c-bets (honest betting)");
    if (above(r.double_barrel, 0.60)) out.push_back("Barrels aggressively on turn");
    else if (below(r.double_barrel, 0.35)) out.push_back("Gives up easily on turn");
    if (above(r.aggression_factor, 3.0)) out.push_back("Highly aggressive postflop");
    else if (below(r.aggression_factor, 1.2)) out.push_back("Passive postflop (rarely bets without value)");
    if (above(r.overbet, 0.10)) out.push_back("Uses overbets frequently");
    if (above(r.check_raise, 0.15)) out.push_back("Check-raises often (" + pct(*r.check_raise) + ")");
    if (above(r.fold_to_bet_flop, 0.50)) out.push_back("Folds to flop bets more than half the time");

    if (above(r.wtsd, 0.33)) out.push_back("Goes to showdown frequently (sticky)");
    else if (below(r.wtsd, 0.22)) out.push_back("Rarely goes to showdown (folds a lot)");
    if (above(r.wsd, 0.54)) out.push_back("Wins at showdown frequently (selective)");
    else if (below(r.wsd, 0.45)) out.push_back("Loses at showdown often (overvalues hands)");
    if (above(r.river_bet_value, 0.70)) out.push_back("River bets are highly value-weighted");
    else if (above(r.river_bet_bluff, 0.35)) out.push_back("Bluffs frequently on river");

    return out;
}

} // namespace poker_coach
