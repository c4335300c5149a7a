#ifndef POKER_COACH_PLAYER_STATS_H
#define POKER_COACH_PLAYER_STATS_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cards.h"
#include "hand_history.h"

namespace poker_coach {

// Minimum opportunity counts before a rate is reported.
namespace gates {
constexpr int PREFLOP_HANDS = 1;
constexpr int THREE_BET = 20;
constexpr int FOLD_TO_3BET = 15;
constexpr int CBET = 20;
constexpr int FOLD_TO_BET_FLOP = 20;
constexpr int FOLD_TO_BET_LATE = 15; // Turn and river
constexpr int DOUBLE_BARREL = 20;
constexpr int TRIPLE_BARREL = 15;
constexpr int CHECK_RAISE = 15;
constexpr int OVERBET = 20;
constexpr int WTSD = 20;
constexpr int WSD = 8;
constexpr int RIVER_BET_SAMPLES = 8;
constexpr int AGGRESSION = 10;
} // namespace gates

// Bet size relative to the pot: tiny < 0.30, small < 0.45, medium < 0.70,
// large < 1.0, overbet otherwise.
std::string bet_size_bucket(double pot_ratio);

// Raw counters for one postflop street.
struct StreetCounters {
    int seen = 0;
    int bets = 0;
    int raises = 0;
    int calls = 0;
    int checks = 0;
    int folds = 0;
    int cbet_opportunities = 0;
    int cbets = 0;
    int faced_bet = 0;
    int folded_to_bet = 0;
    std::vector<double> bet_sizes; // Pot ratios

    int aggressive() const { return bets + raises; }
    int passive() const { return calls + checks; }
};

// Opportunity (denominator) and hit (numerator) counters for one player.
struct PlayerStats {
    std::string player_id;

    // Preflop
    int hands_played = 0;
    int vpip_count = 0;
    int pfr_count = 0;
    int limp_count = 0;
    int cold_call_count = 0;
    int open_raise_count = 0;
    int three_bet_count = 0;
    int three_bet_opportunities = 0;
    int fold_to_3bet_count = 0;
    int fold_to_3bet_opportunities = 0;
    std::map<int, int> hands_by_position;
    std::map<int, int> vpip_by_position;
    std::map<int, int> pfr_by_position;
    std::vector<double> open_raise_sizes_bb;
    std::vector<double> three_bet_sizes_bb;

    // Postflop
    StreetCounters flop;
    StreetCounters turn;
    StreetCounters river;
    int double_barrel_opportunities = 0;
    int double_barrels = 0;
    int triple_barrel_opportunities = 0;
    int triple_barrels = 0;
    int check_raise_opportunities = 0;
    int check_raises = 0;
    int sized_bets = 0;
    int overbets = 0;

    // Showdown
    int saw_flop = 0;
    int saw_turn = 0;
    int saw_river = 0;
    int showdowns = 0;
    int showdowns_won = 0;
    std::vector<int> showdown_strengths; // 1 = high card .. 10 = royal flush
    std::map<std::string, std::vector<int>> strengths_by_bet_size;
    std::vector<int> river_bet_strengths;

    StreetCounters& street(Street s);
    const StreetCounters& street(Street s) const;
};

// Rates derived from PlayerStats. Every field is empty until its opportunity
// gate is met; none is ever reported as 0 for lack of data.
struct StatRates {
    int hands = 0;

    std::optional<double> vpip;
    std::optional<double> pfr;
    std::optional<double> vpip_pfr_gap; // max(0, vpip - pfr)
    std::optional<double> limp;
    std::optional<double> cold_call;
    std::optional<double> three_bet;
    std::optional<double> fold_to_3bet;
    std::optional<double> avg_open_raise_bb;
    std::optional<double> avg_three_bet_bb;

    std::optional<double> cbet_flop;
    std::optional<double> cbet_turn;
    std::optional<double> cbet_river;
    std::optional<double> fold_to_bet_flop;
    std::optional<double> fold_to_bet_turn;
    std::optional<double> fold_to_bet_river;
    std::optional<double> double_barrel;
    std::optional<double> triple_barrel;
    std::optional<double> check_raise;
    std::optional<double> overbet;
    std::optional<double> aggression_factor; // Unbounded; +inf when the player never calls
    std::optional<double> aggression_frequency;

    std::optional<double> wtsd;
    std::optional<double> wsd;
    std::optional<double> avg_showdown_strength;
    std::optional<double> river_bet_value;
    std::optional<double> river_bet_bluff;

    // Opportunity counts the rates above were computed from.
    int three_bet_opportunities = 0;
    int fold_to_3bet_opportunities = 0;
    int flop_cbet_opportunities = 0;
    int flop_faced_bet = 0;
    int turn_faced_bet = 0;
    int double_barrel_opportunities = 0;
    int check_raise_opportunities = 0;
    int river_bet_samples = 0;
};

StatRates compute_rates(const PlayerStats& stats);

// Comparisons that are false while a rate is undefined.
inline bool above(const std::optional<double>& rate, double threshold) { return rate && *rate > threshold; }
inline bool below(const std::optional<double>& rate, double threshold) { return rate && *rate < threshold; }

// Walks hands one at a time and accumulates counters for a single player.
class StatsAggregator {
public:
    explicit StatsAggregator(const std::string& player_id);

    void add_hand(const HandRecord& hand);
    void add_hands(const std::vector<HandRecord>& hands);

    const PlayerStats& stats() const { return stats_; }

private:
    void add_preflop(const HandRecord& hand, const PlayerSeat& player);
    void add_postflop(const HandRecord& hand);
    void add_barrels(const HandRecord& hand);
    void add_check_raises(const HandRecord& hand);
    void add_showdown(const HandRecord& hand);

    bool saw_street(const HandRecord& hand, Street street) const;

    PlayerStats stats_;
};

} // namespace poker_coach

#endif // POKER_COACH_PLAYER_STATS_H
