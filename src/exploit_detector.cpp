#include "exploit_detector.h"

#include <algorithm> // For std::stable_sort

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

namespace poker_coach {

namespace {

std::string pct(double rate) {
    return fmt::format("{:.0f}%", rate * 100.0);
}

std::vector<ExploitRule> build_rules() {
    std::vector<ExploitRule> rules;

    // --- Preflop ---
    rules.push_back({"preflop",
        [](const StatRates& r) { return above(r.fold_to_3bet, 0.70) && r.fold_to_3bet_opportunities >= gates::FOLD_TO_3BET; },
        [](const StatRates& r) { return "Folds to 3-bets " + pct(*r.fold_to_3bet) + " of the time"; },
        "3-bet bluff their opens at a higher frequency, especially in position.", 0.82});
    rules.push_back({"preflop",
        [](const StatRates& r) { return above(r.limp, 0.12); },
        [](const StatRates& r) { return "Limps " + pct(*r.limp) + " of hands"; },
        "Isolate limps aggressively and punish weak capped ranges preflop.", 0.74});
    rules.push_back({"preflop",
        [](const StatRates& r) { return above(r.vpip_pfr_gap, 0.12); },
        [](const StatRates& r) { return fmt::format("Large VPIP-PFR gap ({:.1f}%)", *r.vpip_pfr_gap * 100.0); },
        "Expect wide calling ranges; value bet wider preflop and postflop.", 0.78});
    rules.push_back({"preflop",
        [](const StatRates& r) { return above(r.three_bet, 0.11); },
        [](const StatRates& r) { return "3-bets aggressively (" + pct(*r.three_bet) + ")"; },
        "Tighten marginal opens OOP and favor value-heavy 4-bets over loose flats.", 0.72});
    rules.push_back({"preflop",
        [](const StatRates& r) { return below(r.vpip, 0.17) && r.hands >= 40; },
        [](const StatRates& r) { return "Very tight VPIP (" + pct(*r.vpip) + ")"; },
        "Steal blinds more often and pressure capped defend ranges with position.", 0.70});

    // --- Flop ---
    rules.push_back({"flop",
        [](const StatRates& r) { return above(r.cbet_flop, 0.70); },
        [](const StatRates& r) { return "C-bets " + pct(*r.cbet_flop) + " of flops"; },
        "Float more flops in position and add selective bluff raises on dry textures.", 0.74});
    rules.push_back({"flop",
        [](const StatRates& r) { return below(r.cbet_flop, 0.45); },
        [](const StatRates& r) { return "Checks frequently as preflop aggressor (c-bet " + pct(*r.cbet_flop) + ")"; },
        "Stab more often when checked to on flop, especially with backdoor equity.", 0.72});
    rules.push_back({"flop",
        [](const StatRates& r) { return above(r.fold_to_bet_flop, 0.55); },
        [](const StatRates& r) { return "Folds to flop bets " + pct(*r.fold_to_bet_flop); },
        "Run more flop probes and c-bet bluffs, then shut down when called on bad runouts.", 0.81});
    rules.push_back({"flop",
        [](const StatRates& r) { return below(r.fold_to_bet_flop, 0.35); },
        [](const StatRates& r) { return "Continues vs flop bets at a high rate (" + pct(1.0 - *r.fold_to_bet_flop) + ")"; },
        "Bluff less on flop and size up value hands that can bet multiple streets.", 0.77});
    rules.push_back({"flop",
        [](const StatRates& r) { return above(r.check_raise, 0.15); },
        [](const StatRates& r) { return "Check-raises frequently (" + pct(*r.check_raise) + ")"; },
        "Do not call flop raises too light; continue mainly with strong made hands or robust draws.", 0.73});

    // --- Turn ---
    rules.push_back({"turn",
        [](const StatRates& r) { return below(r.double_barrel, 0.40); },
        [](const StatRates& r) { return "Double barrels only " + pct(*r.double_barrel); },
        "Call flop wider when ranges permit, then attack turn checks aggressively.", 0.78});
    rules.push_back({"turn",
        [](const StatRates& r) { return above(r.double_barrel, 0.62); },
        [](const StatRates& r) { return "Fires second barrel often (" + pct(*r.double_barrel) + ")"; },
        "Defend turn mainly with stronger equity and avoid marginal flop floats without turn plans.", 0.73});
    rules.push_back({"turn",
        [](const StatRates& r) { return above(r.fold_to_bet_turn, 0.55); },
        [](const StatRates& r) { return "Overfolds turn after facing bets (" + pct(*r.fold_to_bet_turn) + ")"; },
        "Increase turn probes and delayed barrels when blockers favor your range.", 0.74});
    rules.push_back({"turn",
        [](const StatRates& r) { return below(r.fold_to_bet_turn, 0.35); },
        [](const StatRates& r) { return "Calls turn frequently (" + pct(1.0 - *r.fold_to_bet_turn) + ")"; },
        "Slow down low-equity turn bluffs and lean toward high-equity semibluffs or value.", 0.70});

    // --- River ---
    rules.push_back({"river",
        [](const StatRates& r) { return above(r.river_bet_value, 0.70); },
        [](const StatRates& r) { return "River bets are heavily value-weighted (" + pct(*r.river_bet_value) + ")"; },
        "Overfold bluff-catchers to river aggression unless your blockers are exceptional.", 0.86});
    rules.push_back({"river",
        [](const StatRates& r) { return above(r.river_bet_bluff, 0.35); },
        [](const StatRates& r) { return "River bluff rate is elevated (" + pct(*r.river_bet_bluff) + ")"; },
        "Widen river bluff-catch range versus missed draws and unblocked bluff combos.", 0.77});
    rules.push_back({"river",
        [](const StatRates& r) { return above(r.wtsd, 0.33) && below(r.wsd, 0.45); },
        [](const StatRates&) { return std::string("Goes to showdown often but wins too infrequently"); },
        "Value bet thinner on river and avoid unnecessary river bluffs versus this calling profile.", 0.80});
    rules.push_back({"river",
        [](const StatRates& r) { return below(r.wtsd, 0.22) && above(r.wsd, 0.54); },
        [](const StatRates&) { return std::string("Arrives at showdown with a stronger-than-average range"); },
        "Use fewer thin bluff-catches and give more credit to large river bets.", 0.72});

    return rules;
}

} // namespace

ExploitDetector::ExploitDetector() : rules_(build_rules()) {
    spdlog::debug("ExploitDetector created with {} rules", rules_.size());
}

std::vector<Exploit> ExploitDetector::detect(const StatRates& rates) const {
    std::vector<Exploit> found;
    for (const ExploitRule& rule : rules_) {
        if (!rule.applies(rates)) continue;
        found.push_back({rule.category, rule.describe(rates), rule.counter_strategy, rule.confidence});
    }
    std::stable_sort(found.begin(), found.end(), [](const Exploit& a, const Exploit& b) {
        return a.confidence > b.confidence;
    });
    return found;
}

} // namespace poker_coach
