#include "game_state.h"
#include "errors.h"

#include <algorithm> // For std::max, std::min, std::fill
#include <sstream>   // For history string

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h" // For fmt::join

namespace poker_coach {

namespace {
constexpr double CHIP_EPSILON = 1e-9;
}

// --- Constructor ---
GameState::GameState(int num_players, double initial_stack, int button_position, double small_blind, double big_blind)
    : num_players_(num_players),
      current_player_index_(-1), // Set after blinds
      pot_size_(0.0),
      player_stacks_(num_players > 0 ? num_players : 0, initial_stack),
      bets_this_round_(num_players > 0 ? num_players : 0, 0.0),
      player_hands_(num_players > 0 ? num_players : 0),
      community_cards_(),
      current_street_(Street::PREFLOP),
      action_history_(),
      is_game_over_(false),
      last_raise_size_(0.0),
      aggressor_this_round_(-1),
      player_folded_(num_players > 0 ? num_players : 0, false),
      player_all_in_(num_players > 0 ? num_players : 0, false),
      player_contributions_(num_players > 0 ? num_players : 0, 0.0),
      button_position_(button_position),
      sb_index_(-1),
      bb_index_(-1),
      small_blind_(small_blind),
      big_blind_(big_blind),
      player_acted_this_sequence_(num_players > 0 ? num_players : 0, false)
{
    if (num_players < 2) {
        throw ConfigError("GameState requires at least 2 players.");
    }
    if (button_position < 0 || button_position >= num_players) {
        throw ConfigError("Invalid button position.");
    }
    if (small_blind <= 0.0 || big_blind < small_blind) {
        throw ConfigError("Blinds must be positive with big blind >= small blind.");
    }
    if (initial_stack <= 0.0) {
        throw ConfigError("Starting stack must be positive.");
    }

    if (num_players_ == 2) {
        sb_index_ = button_position_; // Button is SB heads-up
        bb_index_ = (button_position_ + 1) % num_players_;
    } else {
        sb_index_ = (button_position_ + 1) % num_players_;
        bb_index_ = (button_position_ + 2) % num_players_;
    }

    post_blinds();

    // SB (button) opens heads-up, UTG otherwise
    current_player_index_ = num_players_ == 2 ? sb_index_ : (button_position_ + 3) % num_players_;
    if (player_all_in_[current_player_index_]) {
        update_next_player();
    }

    spdlog::trace("GameState initialized. Players: {}, Stack: {}, BTN: {}, SB: {}, BB: {}, First actor: {}",
                  num_players_, initial_stack, button_position_, sb_index_, bb_index_, current_player_index_);
}

// --- Getters ---
int GameState::get_num_players() const { return num_players_; }
int GameState::get_button_position() const { return button_position_; }
int GameState::get_small_blind_index() const { return sb_index_; }
int GameState::get_big_blind_index() const { return bb_index_; }
int GameState::get_current_player() const { return current_player_index_; }
double GameState::get_pot_size() const { return pot_size_; }
const std::vector<double>& GameState::get_player_stacks() const { return player_stacks_; }
const std::vector<Card>& GameState::get_player_hand(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) {
        static const std::vector<Card> empty_hand;
        return empty_hand;
    }
    return player_hands_[player_index];
}
const std::vector<Card>& GameState::get_community_cards() const { return community_cards_; }
Street GameState::get_current_street() const { return current_street_; }
const std::vector<Action>& GameState::get_action_history() const { return action_history_; }
bool GameState::is_terminal() const { return is_game_over_; }

double GameState::get_amount_to_call(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return 0.0;
    return std::max(0.0, max_bet_this_round() - bets_this_round_[player_index]);
}
double GameState::get_bet_this_round(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return 0.0;
    return bets_this_round_[player_index];
}
const std::vector<double>& GameState::get_bets_this_round() const { return bets_this_round_; }
double GameState::get_last_raise_size() const { return last_raise_size_; }
int GameState::get_last_aggressor() const { return aggressor_this_round_; }
bool GameState::has_player_folded(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return true;
    return player_folded_[player_index];
}
bool GameState::is_player_all_in(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return false;
    return player_all_in_[player_index];
}
double GameState::get_player_contribution(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return 0.0;
    return player_contributions_[player_index];
}
int GameState::get_num_active_players() const {
    int count = 0;
    for (int i = 0; i < num_players_; ++i) {
        if (!player_folded_[i]) {
            count++;
        }
    }
    return count;
}
double GameState::get_big_blind() const { return big_blind_; }

// --- Modifiers ---
void GameState::deal_hands(const std::vector<std::vector<Card>>& hands) {
    if (static_cast<int>(hands.size()) != num_players_) {
        throw PokerCoachError("Number of hands provided does not match number of players.");
    }
    player_hands_ = hands;
    spdlog::trace("Hands dealt.");
}

void GameState::deal_community_cards(const std::vector<Card>& cards) {
    if (community_cards_.size() + cards.size() > 5) {
        throw PokerCoachError("Board cannot hold more than 5 cards.");
    }
    community_cards_.insert(community_cards_.end(), cards.begin(), cards.end());
    spdlog::trace("Community cards dealt. Board: {}", fmt::join(community_cards_, " "));
}

void GameState::apply_action(const Action& action) {
    if (is_game_over_) {
        throw IllegalActionError("Action applied to a finished hand.");
    }
    if (action.player_index != current_player_index_) {
        throw IllegalActionError(fmt::format("Action applied by player {} but player {} is to act.",
                                             action.player_index, current_player_index_));
    }

    const int player = current_player_index_;
    const double player_stack = player_stacks_[player];
    const double call_amount = get_amount_to_call(player);
    const double current_bet = bets_this_round_[player];
    const double max_bet = max_bet_this_round();

    switch (action.type) {
        case ActionType::FOLD:
            player_folded_[player] = true;
            spdlog::trace("Player {} folds.", player);
            break;

        case ActionType::CHECK:
            if (call_amount > CHIP_EPSILON) {
                throw IllegalActionError("Check not allowed when facing a bet.");
            }
            spdlog::trace("Player {} checks.", player);
            break;

        case ActionType::CALL: {
            if (call_amount <= CHIP_EPSILON) {
                throw IllegalActionError("Nothing to call; check instead.");
            }
            double committed = std::min(player_stack, call_amount);
            commit_chips(player, committed);
            spdlog::trace("Player {} calls {}.", player, committed);
            break;
        }

        case ActionType::BET:
        case ActionType::RAISE: {
            if (action.type == ActionType::BET && max_bet > CHIP_EPSILON) {
                throw IllegalActionError("Bet not allowed when a bet is already in; raise instead.");
            }
            if (action.type == ActionType::RAISE && max_bet <= CHIP_EPSILON) {
                throw IllegalActionError("Raise not allowed without a bet to raise.");
            }
            if (player_stack <= call_amount + CHIP_EPSILON) {
                throw IllegalActionError("Stack too short to raise; call or fold.");
            }

            double total_bet_amount = action.amount;
            double bet_increment = total_bet_amount - current_bet;
            if (bet_increment <= call_amount + CHIP_EPSILON) {
                throw IllegalActionError(fmt::format("Bet/raise to {:g} must exceed the current bet of {:g}.",
                                                     total_bet_amount, max_bet));
            }

            bool all_in = false;
            if (bet_increment >= player_stack - CHIP_EPSILON) {
                if (bet_increment > player_stack + CHIP_EPSILON) {
                    spdlog::debug("Player {} bet/raise {} capped by stack {}. Going all-in.", player, bet_increment, player_stack);
                }
                bet_increment = player_stack;
                total_bet_amount = current_bet + player_stack;
                all_in = true;
            }

            double min_total = get_min_raise_to(player);
            if (!all_in && total_bet_amount < min_total - CHIP_EPSILON) {
                spdlog::debug("Player {} bet/raise to {} below minimum, forcing {}.", player, total_bet_amount, min_total);
                total_bet_amount = min_total;
                bet_increment = total_bet_amount - current_bet;
                all_in = bet_increment >= player_stack - CHIP_EPSILON;
            }

            double raise_increment = total_bet_amount - max_bet;
            commit_chips(player, bet_increment);
            spdlog::trace("Player {} {}s to {}.", player, action_type_to_string(action.type), total_bet_amount);

            // A short all-in does not reopen the minimum
            last_raise_size_ = std::max(last_raise_size_, raise_increment);
            aggressor_this_round_ = player;
            std::fill(player_acted_this_sequence_.begin(), player_acted_this_sequence_.end(), false);
            break;
        }
    }

    Action recorded = action;
    recorded.amount = (action.type == ActionType::BET || action.type == ActionType::RAISE) ? bets_this_round_[player]
                    : (action.type == ActionType::CALL) ? bets_this_round_[player]
                    : 0.0;
    action_history_.push_back(recorded);
    player_acted_this_sequence_[player] = true;

    // --- Check for end of round / street / hand ---
    int active_players_remaining = 0;
    int players_can_still_act = 0;
    for (int i = 0; i < num_players_; ++i) {
        if (!player_folded_[i]) {
            active_players_remaining++;
            if (!player_all_in_[i]) {
                players_can_still_act++;
            }
        }
    }

    if (active_players_remaining <= 1) {
        is_game_over_ = true;
        current_player_index_ = -1;
        spdlog::trace("Hand over - only one player remaining.");
        return;
    }

    bool betting_round_over = true;
    double round_max = max_bet_this_round();
    for (int i = 0; i < num_players_; ++i) {
        if (!player_folded_[i] && !player_all_in_[i]) {
            bool owes = bets_this_round_[i] < round_max - CHIP_EPSILON;
            // The last player left with chips does not need to act on a matched all-in
            bool lone_actor_done = players_can_still_act <= 1 && !owes;
            if (owes || (!player_acted_this_sequence_[i] && !lone_actor_done)) {
                betting_round_over = false;
                break;
            }
        }
    }

    if (betting_round_over) {
        spdlog::trace("Betting round over on {}.", street_to_string(current_street_));
        if (current_street_ == Street::RIVER || players_can_still_act <= 1) {
            is_game_over_ = true;
            current_street_ = Street::SHOWDOWN;
            current_player_index_ = -1;
            spdlog::trace("Hand over - river betting complete or no further betting possible.");
        } else {
            advance_to_next_street();
        }
    } else {
        update_next_player();
    }
}

void GameState::advance_to_next_street() {
    if (current_street_ == Street::PREFLOP) current_street_ = Street::FLOP;
    else if (current_street_ == Street::FLOP) current_street_ = Street::TURN;
    else if (current_street_ == Street::TURN) current_street_ = Street::RIVER;
    else {
        is_game_over_ = true;
        current_street_ = Street::SHOWDOWN;
        current_player_index_ = -1;
        return;
    }
    spdlog::trace("Advancing to {}.", street_to_string(current_street_));
    reset_bets_for_new_street();

    // First player left of the button; heads-up that is the big blind
    current_player_index_ = button_position_;
    update_next_player();
}

// --- Utility ---
std::string GameState::get_history_string() const {
    std::stringstream ss;
    for (const auto& action : action_history_) {
        switch (action.type) {
            case ActionType::FOLD:  ss << "f"; break;
            case ActionType::CHECK: ss << "k"; break;
            case ActionType::CALL:  ss << "c"; break;
            case ActionType::BET:   ss << "b" << fmt::format("{:g}", action.amount); break;
            case ActionType::RAISE: ss << "r" << fmt::format("{:g}", action.amount); break;
        }
        ss << "/";
    }
    return ss.str();
}

double GameState::get_effective_stack(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return 0.0;
    double min_stack = player_stacks_[player_index];
    for (int i = 0; i < num_players_; ++i) {
        if (i != player_index && !player_folded_[i]) {
            min_stack = std::min(min_stack, player_stacks_[i]);
        }
    }
    return min_stack;
}

double GameState::get_min_raise_to(int player_index) const {
    if (player_index < 0 || player_index >= num_players_) return 0.0;
    double min_total = max_bet_this_round() + std::max(last_raise_size_, big_blind_);
    return std::min(min_total, bets_this_round_[player_index] + player_stacks_[player_index]);
}

// --- Private helpers ---
void GameState::post_blinds() {
    commit_chips(sb_index_, std::min(small_blind_, player_stacks_[sb_index_]));
    spdlog::trace("Player {} posts SB {}", sb_index_, bets_this_round_[sb_index_]);
    commit_chips(bb_index_, std::min(big_blind_, player_stacks_[bb_index_]));
    spdlog::trace("Player {} posts BB {}", bb_index_, bets_this_round_[bb_index_]);
    last_raise_size_ = big_blind_; // Opening "raise" is the big blind
    aggressor_this_round_ = -1;
    std::fill(player_acted_this_sequence_.begin(), player_acted_this_sequence_.end(), false);
}

void GameState::commit_chips(int player_index, double amount) {
    player_stacks_[player_index] -= amount;
    bets_this_round_[player_index] += amount;
    player_contributions_[player_index] += amount;
    pot_size_ += amount;
    if (player_stacks_[player_index] <= CHIP_EPSILON) {
        player_stacks_[player_index] = 0.0;
        player_all_in_[player_index] = true;
    }
}

void GameState::update_next_player() {
    if (is_game_over_) {
        current_player_index_ = -1;
        return;
    }
    int start_index = current_player_index_;
    for (int step = 1; step <= num_players_; ++step) {
        int candidate = (start_index + step) % num_players_;
        if (!player_folded_[candidate] && !player_all_in_[candidate]) {
            current_player_index_ = candidate;
            spdlog::trace("Next player to act: {}", current_player_index_);
            return;
        }
    }
    spdlog::trace("No player can act, ending betting.");
    is_game_over_ = true;
    current_street_ = Street::SHOWDOWN;
    current_player_index_ = -1;
}

void GameState::reset_bets_for_new_street() {
    std::fill(bets_this_round_.begin(), bets_this_round_.end(), 0.0);
    last_raise_size_ = 0.0;
    aggressor_this_round_ = -1;
    std::fill(player_acted_this_sequence_.begin(), player_acted_this_sequence_.end(), false);
}

double GameState::max_bet_this_round() const {
    double max_bet = 0.0;
    for (double bet : bets_this_round_) {
        max_bet = std::max(max_bet, bet);
    }
    return max_bet;
}

} // namespace poker_coach
