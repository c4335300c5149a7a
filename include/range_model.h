#ifndef POKER_COACH_RANGE_MODEL_H
#define POKER_COACH_RANGE_MODEL_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "archetypes.h"
#include "cards.h"
#include "hand_evaluator.h"
#include "hand_generator.h"
#include "scenario.h"

namespace poker_coach {

// Weights below this count as zero.
constexpr double MIN_COMBO_WEIGHT = 1e-12;

// Bitmask of cards by phevaluator index (bit i = card i).
uint64_t card_mask(const std::vector<Card>& cards);

struct WeightedCombo {
    HoleCards cards;
    uint64_t mask = 0;
    double preflop_score = 0.0; // 0..100
    double made_score = 0.0;    // 0..~1.3, 0 preflop
    double weight = 0.0;
};

// Everything that shapes one villain's range at the decision point.
struct RangeSpec {
    std::string archetype_key;
    std::string position;
    NodeType node_type = NodeType::SINGLE_RAISED_POT;
    Street street = Street::FLOP;
    SeatRole role = SeatRole::WAITING;
    double pressure = 0.0; // 0..1, higher continues tighter
};

/**
 * @brief Weighted multiset of hole-card combinations a villain can hold.
 *
 * Built from the archetype's opening width for its position and node, then
 * narrowed multiplicatively by each action the villain took (its role at the
 * decision point) and by the pressure hero's line applies. Never collapses to
 * a single hand: if narrowing removes every combo, the un-narrowed opening
 * range is used instead and `used_fallback()` reports it.
 */
class VillainRange {
public:
    // `dead` cards (hero hand and board) are excluded from the range.
    static VillainRange build(const RangeSpec& spec,
                              const std::vector<Card>& board,
                              const std::vector<Card>& dead,
                              const HandEvaluator& evaluator);

    // Applies one continuation filter: weight *= sigmoid((quality - target) * 7).
    // Returns false (and leaves the range untouched) when the result would be empty.
    bool narrow(double target);

    // Draws a combo sharing no card with `used_mask`. Falls back to a uniform
    // draw over the compatible combos when every weighted one is blocked.
    // Throws PokerCoachError if no combo at all is compatible.
    const WeightedCombo& sample(std::mt19937_64& rng, uint64_t used_mask) const;

    const std::vector<WeightedCombo>& combos() const { return combos_; }
    const RangeSpec& spec() const { return spec_; }
    double total_weight() const { return total_weight_; }
    // Combos with non-zero weight.
    size_t live_combos() const;
    bool used_fallback() const { return used_fallback_; }

private:
    VillainRange() = default;
    void rebuild_cumulative();

    RangeSpec spec_;
    std::vector<WeightedCombo> combos_;
    std::vector<double> cumulative_;
    double total_weight_ = 0.0;
    bool used_fallback_ = false;
};

// Opening width multiplier by position (BTN widest).
double position_width_factor(const std::string& position);
// Range width multiplier by pot type (3-bet and 4-bet pots are narrower).
double node_width_factor(NodeType node);

// Quality bar a combo must clear to stay in the range after the villain's action.
double continuation_target(const Archetype& archetype, SeatRole role, double pressure);

// Villain continue frequency versus a hero bet or raise of `size_pot_ratio`.
// Throws ConfigError for actions other than BET or RAISE.
double continue_probability(const Archetype& archetype,
                            Street street,
                            ActionType action,
                            double size_pot_ratio,
                            SeatRole role);

} // namespace poker_coach

#endif // POKER_COACH_RANGE_MODEL_H
