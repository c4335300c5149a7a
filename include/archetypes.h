#ifndef POKER_COACH_ARCHETYPES_H
#define POKER_COACH_ARCHETYPES_H

#include <string>
#include <vector>

namespace poker_coach {

// Canonical opponent model. Static and immutable once the catalogue is built.
struct Archetype {
    std::string key;
    std::string label;
    std::string description;
    double vpip;
    double pfr;
    double af;
    double preflop_tightness; // Hand-quality bar for continuing, 0..1
    double fold_to_flop_bet;
    double fold_to_turn_bet;
    double fold_to_river_bet;
    double fold_to_raise;
    double continue_vs_raise;
    double check_raise_rate;
    double aggression;        // 0..1
    double bluff_factor;      // 0..1

    // Derived, never stored.
    double gap() const { return vpip > pfr ? vpip - pfr : 0.0; }
};

// All twelve archetypes in catalogue order.
const std::vector<Archetype>& archetype_catalogue();

// Throws ConfigError for an unknown key.
const Archetype& archetype_by_key(const std::string& key);

bool is_archetype_key(const std::string& key);

} // namespace poker_coach

#endif // POKER_COACH_ARCHETYPES_H
