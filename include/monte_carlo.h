#ifndef POKER_COACH_MONTE_CARLO_H
#define POKER_COACH_MONTE_CARLO_H

#include <cstdint>
#include <random> // For std::mt19937_64
#include <vector>
#include "cards.h"
#include "hand_evaluator.h" // Include HandEvaluator
#include "range_model.h"

namespace poker_coach {

constexpr int DEFAULT_TRIALS = 360;
constexpr int MIN_TRIALS = 120;
constexpr int MAX_TRIALS = 2400;

struct EquityEstimate {
    double equity = 0.0;    // Win share plus split share, 0..1
    double std_error = 0.0; // From the observed trial variance
    int trials = 0;
    int fallbacks = 0;      // Villain ranges that fell back to the un-narrowed range
};

class MonteCarlo {
public:
    // worker_threads <= 0 uses every hardware thread.
    explicit MonteCarlo(int worker_threads = 0);

    /**
     * @brief Estimates hero equity against one or more weighted villain ranges.
     *
     * Each trial deals every villain a combo from its range (no card shared
     * within the trial) and completes the board. Hero scores 1/k when tied
     * with k-1 others at the best hand, 0 otherwise. Trial i uses its own
     * std::mt19937_64 seeded from trial_seed(base_seed, key_hash, i), so the
     * result is identical for any thread count.
     *
     * @param hero_hand The hero's 2 private cards.
     * @param board Known community cards (0, 3, 4 or 5).
     * @param villains Villain ranges; empty means hero wins uncontested.
     * @param num_trials Number of trials, must be positive.
     */
    EquityEstimate estimate_equity(const std::vector<Card>& hero_hand,
                                   const std::vector<Card>& board,
                                   const std::vector<const VillainRange*>& villains,
                                   int num_trials,
                                   uint64_t base_seed,
                                   uint64_t key_hash) const;

    // Heads-up equity against a uniformly random hand, drawn from `rng`.
    double estimate_equity(const std::vector<Card>& hero_hand,
                           const std::vector<Card>& board,
                           int num_simulations,
                           std::mt19937_64& rng) const;

    int worker_threads() const { return worker_threads_; }

private:
    double run_trial(const std::vector<Card>& hero_hand,
                     const std::vector<Card>& board,
                     const std::vector<const VillainRange*>& villains,
                     const std::vector<Card>& deck,
                     uint64_t dead_mask,
                     std::mt19937_64& rng) const;

    HandEvaluator hand_evaluator_; // Hand evaluator instance
    int worker_threads_;
};

} // namespace poker_coach

#endif // POKER_COACH_MONTE_CARLO_H
