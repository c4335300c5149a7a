#ifndef POKER_COACH_LIVE_SESSION_H
#define POKER_COACH_LIVE_SESSION_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "archetypes.h"
#include "cards.h"
#include "game_state.h"
#include "hand_evaluator.h"
#include "player_profile.h"
#include "scenario.h"

namespace poker_coach {

constexpr double LIVE_SMALL_BLIND_BB = 0.5;
constexpr double LIVE_BIG_BLIND_BB = 1.0;
constexpr double LIVE_MIN_STACK_BB = 20.0;
constexpr double LIVE_MAX_STACK_BB = 400.0;

// Opponent frequencies driving the live villain. Rates are 0..1.
struct OpponentProfile {
    std::string name = "Villain";
    std::string style_label = "Unknown";
    std::string source = "custom";
    int hands_analyzed = 0;
    double vpip = 0.32;
    double pfr = 0.21;
    double three_bet = 0.08;
    double fold_to_3bet = 0.45;
    double limp_rate = 0.12;
    double af = 2.2; // Clamped to [0.3, 8]
    double aggression_frequency = 0.38;
    double flop_cbet = 0.58;
    double turn_cbet = 0.44;
    double river_cbet = 0.32;
    double check_raise = 0.09;
    double wtsd = 0.30;
    double w_sd = 0.51;

    // Undefined statistics keep the defaults above.
    static OpponentProfile from_player_profile(const PlayerProfile& profile);
    static OpponentProfile from_archetype(const Archetype& archetype);
};

struct LiveShowdown {
    std::string winner; // "hero", "villain" or "split"
    std::string reason;
    std::string hero_hand_category;
    std::string villain_hand_category;
    double hero_share = 0.0;
    double hero_delta_bb = 0.0;
    std::vector<Card> board;
};

// Public view of the current hand. The villain's cards are only filled in
// once the hand is over.
struct LiveHandState {
    int hand_no = 0;
    std::string hero_position; // "BTN" or "BB"
    Street street = Street::PREFLOP;
    std::vector<Card> board;
    std::vector<Card> hero_hand;
    std::vector<Card> villain_hand;
    double pot_bb = 0.0;
    double to_call_bb = 0.0;
    std::string action_context;
    std::vector<ActionType> legal_actions;
    std::vector<double> size_options_bb;
    std::vector<std::string> action_history;
    double hero_stack_bb = 0.0;
    double villain_stack_bb = 0.0;
    bool hand_over = false;
    double hero_delta_bb = 0.0;
    std::optional<LiveShowdown> showdown;
};

struct LiveSessionState {
    std::string session_id;
    uint64_t seed = 0;
    int hands_played = 0;
    double hero_net_bb = 0.0;
    double starting_stack_bb = DEFAULT_STACK_BB;
    OpponentProfile opponent;
    LiveHandState hand;
};

/**
 * Heads-up match between the hero and a profile-driven villain.
 * Hero alternates BTN and BB every hand; stacks reset to the starting stack.
 * Every public method takes the session's own mutex, so concurrent requests
 * against one session are applied one at a time.
 */
class LiveSession {
public:
    LiveSession(std::string session_id,
                OpponentProfile opponent,
                uint64_t seed,
                double starting_stack_bb = DEFAULT_STACK_BB);

    LiveSessionState state() const;

    // Applies a hero action and lets the villain respond until the hero is
    // to act again or the hand ends. Bet/raise sizes are snapped to the
    // nearest menu option. Throws IllegalActionError on an illegal action or
    // a finished hand.
    LiveSessionState act(ActionType action, std::optional<double> size_bb = std::nullopt, Intent intent = Intent::NONE);

    LiveSessionState new_hand();

    const std::string& session_id() const { return session_id_; }

private:
    static constexpr int HERO = 0;
    static constexpr int VILLAIN = 1;

    LiveSessionState snapshot() const;
    void start_hand();
    void run_villain();
    void villain_act();
    void apply(const Action& action);
    void sync_board();
    void finish_hand();
    void update_legal_options();

    double villain_strength() const;
    double villain_fold_probability(double call_amount, bool is_raise) const;
    double villain_bet_probability(bool hero_checked) const;
    double villain_bet_size();
    bool villain_is_preflop_aggressor() const;

    std::vector<double> bet_size_options(double effective, double pot) const;
    std::vector<double> raise_size_options(double to_call, double effective, double pot) const;

    std::string session_id_;
    OpponentProfile opponent_;
    uint64_t seed_;
    double starting_stack_bb_;
    std::mt19937_64 rng_;
    HandEvaluator evaluator_;

    int hands_played_ = 0;
    double hero_net_bb_ = 0.0;
    bool button_on_hero_ = false;

    std::unique_ptr<GameState> game_;
    std::vector<Card> full_board_;
    LiveHandState hand_;
    int preflop_aggressor_ = -1;
    bool hero_checked_this_street_ = false;

    mutable std::mutex mutex_;
};

} // namespace poker_coach

#endif // POKER_COACH_LIVE_SESSION_H
