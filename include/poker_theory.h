#ifndef POKER_COACH_POKER_THEORY_H
#define POKER_COACH_POKER_THEORY_H

#include <string>
#include <vector>

namespace poker_coach {
namespace theory {

// call / (pot + call); 0 when there is nothing to call.
double required_equity(double pot_before_call, double call_amount);

// pot / (pot + bet); 1 when there is no bet.
double minimum_defense_frequency(double pot_before_bet, double bet_size);

// Fold rate a zero-equity bluff needs: risk / (risk + reward).
double break_even_fold_frequency(double risk, double reward);

// Bluff share of a polarized betting range, b / (1 + b) with b = bet / pot.
double polarized_bluff_share(double bet_to_pot);

// Bluffs per value combo under a one-street polarized model (= bet / pot).
double bluff_to_value_ratio(double bet_to_pot);

double stack_to_pot_ratio(double effective_stack, double pot);

struct SprBand {
    std::string label;
    std::vector<std::string> notes;
};

// Very Low (<2), Low (<4.5), Medium (<8) or High SPR with planning notes.
SprBand classify_spr(double spr);

} // namespace theory
} // namespace poker_coach

#endif // POKER_COACH_POKER_THEORY_H
