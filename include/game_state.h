#ifndef POKER_COACH_GAME_STATE_H
#define POKER_COACH_GAME_STATE_H

#include <string>
#include <vector>

#include "cards.h"
#include "scenario.h" // For ActionType

namespace poker_coach {

// A player action. Amounts are in big blinds; for BET and RAISE the amount is
// the player's total bet on the current street after the action.
struct Action {
    ActionType type = ActionType::CHECK;
    double amount = 0.0;
    int player_index = -1;
};

// Chip and turn bookkeeping for one hand. Blinds are posted on construction.
// Heads-up the button posts the small blind and acts first preflop, the big
// blind acts first on every later street.
class GameState {
public:
    GameState(int num_players = 2,
              double initial_stack = DEFAULT_STACK_BB,
              int button_position = 0,
              double small_blind = 0.5,
              double big_blind = 1.0);

    // --- Getters ---
    int get_num_players() const;
    int get_button_position() const;
    int get_small_blind_index() const;
    int get_big_blind_index() const;
    int get_current_player() const; // -1 once the hand is over
    double get_pot_size() const;
    const std::vector<double>& get_player_stacks() const;
    const std::vector<Card>& get_player_hand(int player_index) const;
    const std::vector<Card>& get_community_cards() const;
    Street get_current_street() const;
    const std::vector<Action>& get_action_history() const;
    bool is_terminal() const;
    double get_amount_to_call(int player_index) const;
    double get_bet_this_round(int player_index) const;
    const std::vector<double>& get_bets_this_round() const;
    double get_last_raise_size() const;
    int get_last_aggressor() const; // Last player to bet or raise on this street, -1 if none
    bool has_player_folded(int player_index) const;
    bool is_player_all_in(int player_index) const;
    double get_player_contribution(int player_index) const;
    int get_num_active_players() const;
    double get_big_blind() const;

    // --- Modifiers ---
    void deal_hands(const std::vector<std::vector<Card>>& hands);
    void deal_community_cards(const std::vector<Card>& cards);
    // Throws IllegalActionError for an out-of-turn or illegal action.
    void apply_action(const Action& action);
    void advance_to_next_street();

    // --- Utility ---
    std::string get_history_string() const; // e.g. "r3/c/k/b2.5/f/"
    double get_effective_stack(int player_index) const; // Smallest stack among players still in, including player_index
    // Smallest legal total bet for a raise by the player (capped by its stack).
    double get_min_raise_to(int player_index) const;

private:
    int num_players_;
    int current_player_index_;
    double pot_size_;
    std::vector<double> player_stacks_;
    std::vector<double> bets_this_round_;
    std::vector<std::vector<Card>> player_hands_;
    std::vector<Card> community_cards_;
    Street current_street_;
    std::vector<Action> action_history_;
    bool is_game_over_;
    double last_raise_size_;
    int aggressor_this_round_;
    std::vector<bool> player_folded_;
    std::vector<bool> player_all_in_;
    std::vector<double> player_contributions_;
    int button_position_;
    int sb_index_;
    int bb_index_;
    double small_blind_;
    double big_blind_;
    std::vector<bool> player_acted_this_sequence_;

    void post_blinds();
    void commit_chips(int player_index, double amount);
    void update_next_player();
    void reset_bets_for_new_street();
    double max_bet_this_round() const;
};

} // namespace poker_coach

#endif // POKER_COACH_GAME_STATE_H
