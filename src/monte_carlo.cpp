#include "monte_carlo.h"
#include "errors.h"
#include "seeding.h"

#include <vector>
#include <string>
#include <algorithm> // For std::min, std::max
#include <atomic>    // For std::atomic
#include <cmath>     // For std::sqrt
#include <stdexcept> // For std::invalid_argument
#include <thread>    // For std::thread
#include "spdlog/spdlog.h" // Include spdlog

namespace poker_coach {

namespace {

// Trials per worker below which spawning threads is not worth it.
constexpr int MIN_TRIALS_PER_THREAD = 64;

void check_inputs(const std::vector<Card>& hero_hand, const std::vector<Card>& board) {
    if (hero_hand.size() != 2) {
        throw std::invalid_argument("Hero hand must contain exactly 2 cards.");
    }
    if (board.size() > 5) {
        throw std::invalid_argument("Board cannot contain more than 5 cards.");
    }
}

} // namespace

// --- MonteCarlo Implementation ---

MonteCarlo::MonteCarlo(int worker_threads) : hand_evaluator_() {
    unsigned int hardware_threads = std::thread::hardware_concurrency();
    unsigned int threads_to_use = (worker_threads <= 0) ? hardware_threads
                                                        : std::min(static_cast<unsigned int>(worker_threads), hardware_threads);
    if (threads_to_use == 0) threads_to_use = 1;
    worker_threads_ = static_cast<int>(threads_to_use);
    spdlog::debug("MonteCarlo created with {} worker threads.", worker_threads_);
}

double MonteCarlo::run_trial(const std::vector<Card>& hero_hand,
                             const std::vector<Card>& board,
                             const std::vector<const VillainRange*>& villains,
                             const std::vector<Card>& deck,
                             uint64_t dead_mask,
                             std::mt19937_64& rng) const {
    uint64_t used = dead_mask;
    std::vector<const HoleCards*> villain_hands;
    villain_hands.reserve(villains.size());
    for (const VillainRange* range : villains) {
        const WeightedCombo& combo = range->sample(rng, used);
        used |= combo.mask;
        villain_hands.push_back(&combo.cards);
    }

    // Complete the board from the cards nobody holds.
    std::vector<Card> sim_board = board;
    std::vector<const Card*> remaining;
    remaining.reserve(deck.size());
    for (const auto& card : deck) {
        if ((used & (1ULL << to_phe_card_index(card))) == 0) remaining.push_back(&card);
    }
    size_t cards_needed = 5 - board.size();
    if (remaining.size() < cards_needed) {
        throw PokerCoachError("Not enough cards left to complete the board");
    }
    for (size_t j = 0; j < cards_needed; ++j) {
        std::uniform_int_distribution<size_t> dist(j, remaining.size() - 1);
        std::swap(remaining[j], remaining[dist(rng)]);
        sim_board.push_back(*remaining[j]);
    }

    // Lower rank is better
    int hero_rank = hand_evaluator_.evaluate_7_card_hand(hero_hand, sim_board);
    int best_villain = INVALID_HAND_RANK;
    int tied = 0;
    for (const HoleCards* hand : villain_hands) {
        int rank = hand_evaluator_.evaluate_7_card_hand({(*hand)[0], (*hand)[1]}, sim_board);
        if (rank < best_villain) best_villain = rank;
        if (rank == hero_rank) ++tied;
    }
    if (hero_rank > best_villain) return 0.0;
    return 1.0 / static_cast<double>(tied + 1);
}

EquityEstimate MonteCarlo::estimate_equity(const std::vector<Card>& hero_hand,
                                           const std::vector<Card>& board,
                                           const std::vector<const VillainRange*>& villains,
                                           int num_trials,
                                           uint64_t base_seed,
                                           uint64_t key_hash) const {
    check_inputs(hero_hand, board);
    if (num_trials <= 0) {
        throw std::invalid_argument("Trial count must be positive.");
    }

    EquityEstimate estimate;
    estimate.trials = num_trials;
    for (const VillainRange* range : villains) {
        if (range->used_fallback()) estimate.fallbacks++;
    }
    if (villains.empty()) {
        estimate.equity = 1.0;
        return estimate;
    }

    std::vector<Card> dead = hero_hand;
    dead.insert(dead.end(), board.begin(), board.end());
    uint64_t dead_mask = card_mask(dead);
    const std::vector<Card>& deck = full_deck();

    // Results are stored by trial index and reduced in order, so the sum is
    // the same whatever thread ran which trial.
    std::vector<double> results(static_cast<size_t>(num_trials), 0.0);
    std::atomic<int> next_trial{0};
    std::atomic<int> failed{0};

    auto worker_task = [&](int thread_id) {
        try {
            for (int i = next_trial.fetch_add(1); i < num_trials; i = next_trial.fetch_add(1)) {
                std::mt19937_64 rng(trial_seed(base_seed, key_hash, static_cast<uint64_t>(i)));
                results[static_cast<size_t>(i)] = run_trial(hero_hand, board, villains, deck, dead_mask, rng);
            }
        } catch (const std::exception& e) {
            spdlog::error("[Thread {}] Equity trial failed: {}", thread_id, e.what());
            failed++;
        }
    };

    int threads_to_use = std::max(1, std::min(worker_threads_, num_trials / MIN_TRIALS_PER_THREAD));
    if (threads_to_use == 1) {
        worker_task(0);
    } else {
        std::vector<std::thread> threads;
        for (int t = 0; t < threads_to_use; ++t) threads.emplace_back(worker_task, t);
        for (auto& t : threads) { if (t.joinable()) t.join(); }
    }
    if (failed > 0) {
        throw PokerCoachError("Equity simulation failed in " + std::to_string(failed.load()) + " worker(s)");
    }

    double sum = 0.0;
    double sum_sq = 0.0;
    for (double x : results) {
        sum += x;
        sum_sq += x * x;
    }
    double n = static_cast<double>(num_trials);
    double mean = sum / n;
    double variance = std::max(0.0, sum_sq / n - mean * mean);
    estimate.equity = mean;
    estimate.std_error = std::sqrt(variance / n);

    spdlog::trace("Equity {:.4f} +- {:.4f} over {} trials vs {} villain(s) on {} threads",
                  estimate.equity, estimate.std_error, num_trials, villains.size(), threads_to_use);
    return estimate;
}

double MonteCarlo::estimate_equity(const std::vector<Card>& hero_hand,
                                   const std::vector<Card>& board,
                                   int num_simulations,
                                   std::mt19937_64& rng) const {
    check_inputs(hero_hand, board);
    if (num_simulations <= 0) {
        throw std::invalid_argument("Simulation count must be positive.");
    }

    std::vector<Card> current_deck = remove_cards(full_deck(), [&] {
        std::vector<Card> known = hero_hand;
        known.insert(known.end(), board.begin(), board.end());
        return known;
    }());

    int wins = 0;
    int ties = 0;
    size_t cards_needed = 5 - board.size();
    for (int i = 0; i < num_simulations; ++i) {
        // Partial shuffle: opponent hand first, then the missing board cards.
        for (size_t j = 0; j < 2 + cards_needed; ++j) {
            std::uniform_int_distribution<size_t> dist(j, current_deck.size() - 1);
            std::swap(current_deck[j], current_deck[dist(rng)]);
        }
        std::vector<Card> opponent_hand = {current_deck[0], current_deck[1]};
        std::vector<Card> current_sim_board = board;
        for (size_t j = 0; j < cards_needed; ++j) {
            current_sim_board.push_back(current_deck[2 + j]);
        }

        int hero_rank = hand_evaluator_.evaluate_7_card_hand(hero_hand, current_sim_board);
        int villain_rank = hand_evaluator_.evaluate_7_card_hand(opponent_hand, current_sim_board);
        if (hero_rank < villain_rank) {
            wins++;
        } else if (hero_rank == villain_rank) {
            ties++;
        }
    }

    return (static_cast<double>(wins) + 0.5 * static_cast<double>(ties)) / static_cast<double>(num_simulations);
}

} // namespace poker_coach
