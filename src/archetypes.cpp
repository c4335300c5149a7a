#include "archetypes.h"
#include "errors.h"

namespace poker_coach {

namespace {

std::vector<Archetype> build_catalogue() {
    // key, label, description,
    // vpip, pfr, af, tightness, fold flop/turn/river, fold to raise,
    // continue vs raise, check-raise, aggression, bluff factor
    return {
        {"nit", "Nit", "Very selective range, avoids high-variance spots.",
         0.14, 0.11, 1.7, 0.82, 0.58, 0.62, 0.68, 0.63, 0.28, 0.06, 0.32, 0.24},
        {"tag_reg", "TAG Reg", "Solid balanced player with disciplined ranges.",
         0.22, 0.19, 2.6, 0.67, 0.44, 0.48, 0.53, 0.47, 0.43, 0.11, 0.56, 0.41},
        {"lag_reg", "LAG Reg", "Wide ranges, frequent pressure and barreling.",
         0.34, 0.27, 3.4, 0.46, 0.34, 0.39, 0.47, 0.39, 0.55, 0.17, 0.78, 0.67},
        {"calling_station", "Loose-Passive Calling Station", "Calls too much, under-bluffs, hates folding pairs.",
         0.46, 0.11, 1.1, 0.34, 0.23, 0.31, 0.42, 0.26, 0.71, 0.04, 0.21, 0.19},
        {"maniac", "Maniac", "Extreme aggression and over-bluff frequency.",
         0.52, 0.37, 4.4, 0.27, 0.28, 0.35, 0.43, 0.34, 0.62, 0.23, 0.91, 0.83},
        {"weak_tight", "Weak-Tight", "Risk-averse and overfolds to sustained pressure.",
         0.19, 0.13, 1.6, 0.73, 0.53, 0.61, 0.66, 0.58, 0.31, 0.05, 0.28, 0.22},
        {"fit_or_fold", "Fit-or-Fold Flop Player", "Continues when connected; otherwise gives up quickly.",
         0.26, 0.19, 2.0, 0.57, 0.59, 0.48, 0.50, 0.52, 0.36, 0.08, 0.44, 0.31},
        {"one_and_done", "One-and-Done C-Bettor", "C-bets frequently but under-barrels on turns.",
         0.24, 0.20, 2.2, 0.61, 0.42, 0.58, 0.59, 0.49, 0.40, 0.10, 0.53, 0.36},
        {"trappy", "Trappy Slow-Player", "Slow-plays nutted hands and under-raises value.",
         0.23, 0.16, 1.7, 0.64, 0.38, 0.43, 0.50, 0.44, 0.47, 0.13, 0.36, 0.27},
        {"overfolder_3bet", "Overfolder vs 3-Bets", "Opens reasonable range but folds too often to reraises.",
         0.25, 0.20, 2.1, 0.60, 0.43, 0.47, 0.52, 0.61, 0.33, 0.09, 0.49, 0.34},
        {"overcaller_preflop", "Overcaller Preflop", "Calls preflop too wide and arrives postflop with dominated holdings.",
         0.37, 0.16, 2.0, 0.45, 0.36, 0.45, 0.54, 0.41, 0.51, 0.10, 0.41, 0.29},
        {"short_stack_jammer", "Short-Stack Jammer", "Lower SPR strategy with shove-heavy branches.",
         0.29, 0.22, 3.0, 0.55, 0.32, 0.37, 0.46, 0.30, 0.64, 0.16, 0.74, 0.44},
    };
}

} // namespace

const std::vector<Archetype>& archetype_catalogue() {
    static const std::vector<Archetype> catalogue = build_catalogue();
    return catalogue;
}

const Archetype& archetype_by_key(const std::string& key) {
    for (const Archetype& a : archetype_catalogue()) {
        if (a.key == key) return a;
    }
    throw ConfigError("Unknown archetype: " + key);
}

bool is_archetype_key(const std::string& key) {
    for (const Archetype& a : archetype_catalogue()) {
        if (a.key == key) return true;
    }
    return false;
}

} // namespace poker_coach
