#include "live_session.h"
#include "errors.h"

#include <algorithm> // For std::min, std::max, std::transform
#include <cctype>    // For std::tolower
#include <cmath>     // For std::round, std::abs
#include <cstddef>
#include <set>
#include <utility>   // For std::move, std::pair

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

namespace poker_coach {

namespace {

constexpr double EPS = 1e-9;

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

double round1(double value) { return std::round(value * 10.0) / 10.0; }
double round3(double value) { return std::round(value * 1000.0) / 1000.0; }

double rate_or(const std::optional<double>& value, double fallback) {
    return value ? clamp(*value, 0.0, 1.0) : fallback;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Card draw_card(std::vector<Card>& deck, std::mt19937_64& rng) {
    std::uniform_int_distribution<size_t> pick(0, deck.size() - 1);
    size_t index = pick(rng);
    Card card = deck[index];
    deck.erase(deck.begin() + static_cast<std::ptrdiff_t>(index));
    return card;
}

// Samples from (action, weight) pairs; weights need not be normalized.
ActionType sample_action(const std::vector<std::pair<ActionType, double>>& distribution, std::mt19937_64& rng) {
    double total = 0.0;
    for (const auto& entry : distribution) total += std::max(0.0, entry.second);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double r = unit(rng) * total;
    double cumulative = 0.0;
    for (const auto& entry : distribution) {
        cumulative += std::max(0.0, entry.second);
        if (r <= cumulative) return entry.first;
    }
    return distribution.back().first;
}

} // namespace

// --- OpponentProfile ---

OpponentProfile OpponentProfile::from_player_profile(const PlayerProfile& profile) {
    const StatRates& rates = profile.rates;
    OpponentProfile out;
    out.name = profile.player_id;
    out.style_label = profile.style_label();
    out.source = "hand_history";
    out.hands_analyzed = profile.hands_analyzed;
    out.vpip = rate_or(rates.vpip, out.vpip);
    out.pfr = rate_or(rates.pfr, out.pfr);
    out.three_bet = rate_or(rates.three_bet, out.three_bet);
    out.fold_to_3bet = rate_or(rates.fold_to_3bet, out.fold_to_3bet);
    out.limp_rate = rate_or(rates.limp, out.limp_rate);
    if (rates.aggression_factor) {
        // +inf (never calls) lands on the upper clamp
        out.af = clamp(*rates.aggression_factor, 0.3, 8.0);
    }
    out.aggression_frequency = rate_or(rates.aggression_frequency, out.aggression_frequency);
    out.flop_cbet = rate_or(rates.cbet_flop, out.flop_cbet);
    out.turn_cbet = rate_or(rates.cbet_turn, out.turn_cbet);
    out.river_cbet = rate_or(rates.cbet_river, out.river_cbet);
    out.check_raise = rate_or(rates.check_raise, out.check_raise);
    out.wtsd = rate_or(rates.wtsd, out.wtsd);
    out.w_sd = rate_or(rates.wsd, out.w_sd);
    return out;
}

OpponentProfile OpponentProfile::from_archetype(const Archetype& archetype) {
    OpponentProfile out;
    out.name = archetype.label;
    out.style_label = archetype.label;
    out.source = "archetype";
    out.vpip = archetype.vpip;
    out.pfr = archetype.pfr;
    out.three_bet = clamp(archetype.pfr * 0.35, 0.01, 0.3);
    out.fold_to_3bet = archetype.fold_to_raise;
    out.limp_rate = clamp(archetype.gap() * 0.4, 0.0, 0.6);
    out.af = clamp(archetype.af, 0.3, 8.0);
    out.aggression_frequency = clamp(archetype.aggression * 0.7, 0.05, 0.9);
    out.flop_cbet = clamp(0.35 + archetype.aggression * 0.45, 0.1, 0.95);
    out.turn_cbet = clamp(0.25 + archetype.aggression * 0.38, 0.1, 0.9);
    out.river_cbet = clamp(0.15 + archetype.aggression * 0.32, 0.05, 0.85);
    out.check_raise = archetype.check_raise_rate;
    out.wtsd = clamp(0.16 + (1.0 - archetype.fold_to_river_bet) * 0.3, 0.1, 0.6);
    return out;
}

// --- LiveSession ---

LiveSession::LiveSession(std::string session_id, OpponentProfile opponent, uint64_t seed, double starting_stack_bb)
    : session_id_(std::move(session_id)),
      opponent_(std::move(opponent)),
      seed_(seed),
      starting_stack_bb_(clamp(starting_stack_bb, LIVE_MIN_STACK_BB, LIVE_MAX_STACK_BB)),
      rng_(seed) {
    opponent_.af = clamp(opponent_.af, 0.3, 8.0);
    start_hand();
    spdlog::debug("LiveSession {} created against {} (seed {})", session_id_, opponent_.name, seed_);
}

LiveSessionState LiveSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot();
}

LiveSessionState LiveSession::act(ActionType action, std::optional<double> size_bb, Intent intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hand_.hand_over) {
        throw IllegalActionError("Hand is complete. Start the next hand.");
    }
    if (std::find(hand_.legal_actions.begin(), hand_.legal_actions.end(), action) == hand_.legal_actions.end()) {
        throw IllegalActionError("Illegal action: " + action_type_to_string(action));
    }

    Action hero_action;
    hero_action.type = action;
    hero_action.player_index = HERO;

    if (action == ActionType::BET || action == ActionType::RAISE) {
        if (!size_bb) {
            throw IllegalActionError("A size is required for " + action_type_to_string(action));
        }
        if (*size_bb <= 0.0) {
            throw IllegalActionError("Bet size must be positive");
        }
        double size = *size_bb;
        if (!hand_.size_options_bb.empty()) {
            size = *std::min_element(hand_.size_options_bb.begin(), hand_.size_options_bb.end(),
                                     [&](double a, double b) { return std::abs(a - *size_bb) < std::abs(b - *size_bb); });
        }
        hero_action.amount = game_->get_bet_this_round(HERO) + size;
        std::string line_intent = intent == Intent::NONE ? "value" : intent_to_string(intent);
        hand_.action_history.push_back(fmt::format("Hero {} {:.1f}bb ({}).",
                                                   action == ActionType::BET ? "bets" : "raises", size, line_intent));
    } else if (action == ActionType::CALL) {
        hand_.action_history.push_back(fmt::format("Hero calls {:.1f}bb.",
                                                   std::min(game_->get_amount_to_call(HERO), game_->get_player_stacks()[HERO])));
    } else if (action == ActionType::CHECK) {
        hand_.action_history.push_back("Hero checks.");
        hero_checked_this_street_ = true;
    } else {
        hand_.action_history.push_back("Hero folds.");
    }

    apply(hero_action);
    run_villain();
    return snapshot();
}

LiveSessionState LiveSession::new_hand() {
    std::lock_guard<std::mutex> lock(mutex_);
    start_hand();
    return snapshot();
}

LiveSessionState LiveSession::snapshot() const {
    LiveSessionState out;
    out.session_id = session_id_;
    out.seed = seed_;
    out.hands_played = hands_played_;
    out.hero_net_bb = round3(hero_net_bb_);
    out.starting_stack_bb = starting_stack_bb_;
    out.opponent = opponent_;
    out.hand = hand_;
    out.hand.street = game_->get_current_street();
    out.hand.board = game_->get_community_cards();
    out.hand.pot_bb = std::round(game_->get_pot_size() * 100.0) / 100.0;
    out.hand.to_call_bb = hand_.hand_over ? 0.0 : std::round(game_->get_amount_to_call(HERO) * 100.0) / 100.0;
    out.hand.hero_stack_bb = game_->get_player_stacks()[HERO];
    out.hand.villain_stack_bb = game_->get_player_stacks()[VILLAIN];
    if (!hand_.hand_over) {
        out.hand.villain_hand.clear();
    }
    return out;
}

void LiveSession::start_hand() {
    hands_played_++;
    button_on_hero_ = hands_played_ % 2 == 1;

    std::vector<Card> deck = full_deck();
    std::vector<Card> hero_hand{draw_card(deck, rng_), draw_card(deck, rng_)};
    std::vector<Card> villain_hand{draw_card(deck, rng_), draw_card(deck, rng_)};
    full_board_.clear();
    for (int i = 0; i < 5; ++i) {
        full_board_.push_back(draw_card(deck, rng_));
    }

    game_ = std::make_unique<GameState>(2, starting_stack_bb_, button_on_hero_ ? HERO : VILLAIN,
                                        LIVE_SMALL_BLIND_BB, LIVE_BIG_BLIND_BB);
    game_->deal_hands({hero_hand, villain_hand});

    hand_ = LiveHandState{};
    hand_.hand_no = hands_played_;
    hand_.hero_position = button_on_hero_ ? "BTN" : "BB";
    hand_.hero_hand = hero_hand;
    hand_.villain_hand = villain_hand;
    preflop_aggressor_ = -1;
    hero_checked_this_street_ = false;

    hand_.action_history.push_back(fmt::format("Hand {}: Hero ({}) vs {} ({}).", hand_.hand_no, hand_.hero_position,
                                               opponent_.name, opponent_.style_label));
    if (button_on_hero_) {
        hand_.action_history.push_back(fmt::format("Hero posts SB {:.1f}bb.", game_->get_bet_this_round(HERO)));
        hand_.action_history.push_back(fmt::format("Villain posts BB {:.1f}bb.", game_->get_bet_this_round(VILLAIN)));
    } else {
        hand_.action_history.push_back(fmt::format("Villain posts SB {:.1f}bb.", game_->get_bet_this_round(VILLAIN)));
        hand_.action_history.push_back(fmt::format("Hero posts BB {:.1f}bb.", game_->get_bet_this_round(HERO)));
    }
    spdlog::debug("Live session {}: hand {} dealt, hero on {}", session_id_, hand_.hand_no, hand_.hero_position);

    run_villain();
}

void LiveSession::run_villain() {
    while (!game_->is_terminal() && game_->get_current_player() == VILLAIN) {
        villain_act();
    }
    if (game_->is_terminal()) {
        finish_hand();
    } else {
        update_legal_options();
    }
}

void LiveSession::apply(const Action& action) {
    Street before = game_->get_current_street();
    if (before == Street::PREFLOP && action.type == ActionType::RAISE) {
        preflop_aggressor_ = action.player_index;
    }
    game_->apply_action(action);
    if (game_->get_current_street() != before) {
        hero_checked_this_street_ = false;
        sync_board();
    }
}

void LiveSession::sync_board() {
    size_t target = 0;
    Street street = game_->get_current_street();
    if (street == Street::SHOWDOWN) {
        target = game_->get_num_active_players() > 1 ? 5 : game_->get_community_cards().size();
    } else {
        target = static_cast<size_t>(board_card_count(street));
    }

    while (game_->get_community_cards().size() < target) {
        size_t dealt = game_->get_community_cards().size();
        size_t next = dealt == 0 ? 3 : dealt + 1;
        game_->deal_community_cards(std::vector<Card>(full_board_.begin() + static_cast<std::ptrdiff_t>(dealt),
                                                      full_board_.begin() + static_cast<std::ptrdiff_t>(next)));
        Street reached = street_for_board_size(next);
        std::string name = street_to_string(reached);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        hand_.action_history.push_back("--- " + name + " ---");
    }
}

void LiveSession::villain_act() {
    Action action;
    action.player_index = VILLAIN;

    const Street street = game_->get_current_street();
    const double to_call = game_->get_amount_to_call(VILLAIN);
    const double villain_stack = game_->get_player_stacks()[VILLAIN];
    const bool first_preflop_action = street == Street::PREFLOP &&
                                      game_->get_action_history().empty() &&
                                      game_->get_small_blind_index() == VILLAIN;

    if (first_preflop_action) {
        double strength = villain_strength();
        double play = clamp(opponent_.vpip + 0.15 + (strength - 0.5) * 0.8, 0.05, 0.97);
        double raise_share = clamp(opponent_.pfr / std::max(opponent_.vpip, 0.05) + (strength - 0.5) * 0.6
                                   - opponent_.limp_rate * 0.5, 0.05, 0.95);
        ActionType selected = sample_action({{ActionType::FOLD, 1.0 - play},
                                             {ActionType::CALL, play * (1.0 - raise_share)},
                                             {ActionType::RAISE, play * raise_share}}, rng_);
        if (selected == ActionType::RAISE && villain_stack > to_call + EPS) {
            std::uniform_real_distribution<double> open_size(3.1, 5.7);
            double base = open_size(rng_) + strength * 0.8;
            base += std::max(0.0, opponent_.af - 2.8) * 0.15;
            base -= opponent_.limp_rate * 0.35;
            // Half the base lands on a 2x..3.5x open
            double total = round1(clamp(base * 0.5, 2.0 * LIVE_BIG_BLIND_BB,
                                        game_->get_bet_this_round(VILLAIN) + villain_stack));
            action.type = ActionType::RAISE;
            action.amount = total;
            hand_.action_history.push_back(fmt::format("Villain raises to {:.1f}bb from SB.", total));
        } else if (selected == ActionType::FOLD) {
            action.type = ActionType::FOLD;
            hand_.action_history.push_back("Villain folds from SB.");
        } else {
            action.type = ActionType::CALL;
            hand_.action_history.push_back(fmt::format("Villain limps/calls {:.1f}bb.", std::min(to_call, villain_stack)));
        }
        apply(action);
        return;
    }

    if (to_call > EPS) {
        const auto& history = game_->get_action_history();
        bool is_raise = !history.empty() && history.back().type == ActionType::RAISE;
        double fold = villain_fold_probability(to_call, is_raise);
        ActionType selected = sample_action({{ActionType::FOLD, fold}, {ActionType::CALL, 1.0 - fold}}, rng_);
        action.type = selected;
        if (selected == ActionType::FOLD) {
            hand_.action_history.push_back("Villain folds.");
        } else {
            hand_.action_history.push_back(fmt::format("Villain calls {:.1f}bb.", std::min(to_call, villain_stack)));
        }
        apply(action);
        return;
    }

    double strength = villain_strength();
    double bet_probability = clamp(villain_bet_probability(hero_checked_this_street_) * (0.6 + strength * 0.8), 0.05, 0.92);
    ActionType selected = villain_stack <= EPS
        ? ActionType::CHECK
        : sample_action({{ActionType::CHECK, 1.0 - bet_probability}, {ActionType::BET, bet_probability}}, rng_);

    if (selected == ActionType::CHECK) {
        action.type = ActionType::CHECK;
        hand_.action_history.push_back(hero_checked_this_street_ ? "Villain checks behind." : "Villain checks.");
        apply(action);
        return;
    }

    double size = villain_bet_size();
    // The big blind's option preflop raises over the posted blinds
    bool blinds_in = street == Street::PREFLOP;
    action.type = blinds_in ? ActionType::RAISE : ActionType::BET;
    action.amount = game_->get_bet_this_round(VILLAIN) + size;
    if (blinds_in) {
        action.amount = std::max(action.amount, game_->get_min_raise_to(VILLAIN));
    }
    hand_.action_history.push_back(fmt::format("Villain {} {:.1f}bb{}.", blinds_in ? "raises" : "bets", size,
                                               hero_checked_this_street_ ? " after check" : ""));
    apply(action);
}

void LiveSession::finish_hand() {
    sync_board();

    const double pot = game_->get_pot_size();
    LiveShowdown result;
    double hero_win = 0.0;

    if (game_->get_num_active_players() <= 1) {
        bool hero_won = game_->has_player_folded(VILLAIN);
        hero_win = hero_won ? pot : 0.0;
        result.winner = hero_won ? "hero" : "villain";
        result.reason = hero_won ? "Villain folded." : "Hero folded.";
        result.hero_share = hero_won ? 1.0 : 0.0;
        hand_.action_context = "hand_over";
    } else {
        const std::vector<Card>& board = game_->get_community_cards();
        int hero_rank = evaluator_.evaluate_7_card_hand(game_->get_player_hand(HERO), board);
        int villain_rank = evaluator_.evaluate_7_card_hand(game_->get_player_hand(VILLAIN), board);
        if (hero_rank == INVALID_HAND_RANK || villain_rank == INVALID_HAND_RANK) {
            throw PokerCoachError("Showdown evaluation failed for live hand " + std::to_string(hand_.hand_no));
        }
        // Lower phevaluator rank wins
        if (hero_rank < villain_rank) {
            result.winner = "hero";
            result.hero_share = 1.0;
        } else if (villain_rank < hero_rank) {
            result.winner = "villain";
            result.hero_share = 0.0;
        } else {
            result.winner = "split";
            result.hero_share = 0.5;
        }
        result.reason = "Showdown";
        result.hero_hand_category = hand_category_name(HandEvaluator::categorize(hero_rank));
        result.villain_hand_category = hand_category_name(HandEvaluator::categorize(villain_rank));
        hero_win = pot * result.hero_share;
        hand_.action_context = "showdown";
    }

    double delta = round3(hero_win - game_->get_player_contribution(HERO));
    result.hero_delta_bb = delta;
    result.board = game_->get_community_cards();

    hand_.hero_delta_bb = delta;
    hand_.hand_over = true;
    hand_.legal_actions.clear();
    hand_.size_options_bb.clear();
    hand_.showdown = result;
    hero_net_bb_ = round3(hero_net_bb_ + delta);

    if (result.reason == "Showdown") {
        hand_.action_history.push_back(fmt::format("Showdown: {}. Hero delta {:.2f}bb.", result.winner, delta));
    } else {
        hand_.action_history.push_back("Hand ends: " + result.reason);
    }
    spdlog::info("Live session {} hand {} finished: {} wins, hero {:+.2f}bb (net {:+.2f}bb)",
                 session_id_, hand_.hand_no, result.winner, delta, hero_net_bb_);
}

void LiveSession::update_legal_options() {
    const double to_call = game_->get_amount_to_call(HERO);
    const double pot = game_->get_pot_size();
    const double hero_stack = game_->get_player_stacks()[HERO];
    const double villain_stack = game_->get_player_stacks()[VILLAIN];

    hand_.legal_actions.clear();
    if (to_call > EPS) {
        hand_.legal_actions = {ActionType::FOLD, ActionType::CALL};
        hand_.size_options_bb = raise_size_options(to_call, std::min(hero_stack, to_call + villain_stack), pot);
        if (!hand_.size_options_bb.empty()) {
            hand_.legal_actions.push_back(ActionType::RAISE);
        }
        hand_.action_context = "facing_bet";
    } else if (game_->get_current_street() == Street::PREFLOP) {
        // Big blind option after a limp
        hand_.legal_actions = {ActionType::CHECK};
        hand_.size_options_bb = raise_size_options(0.0, std::min(hero_stack, villain_stack), pot);
        if (!hand_.size_options_bb.empty()) {
            hand_.legal_actions.push_back(ActionType::RAISE);
        }
        hand_.action_context = "checked_to_hero";
    } else {
        hand_.legal_actions = {ActionType::CHECK};
        hand_.size_options_bb = bet_size_options(std::min(hero_stack, villain_stack), pot);
        if (!hand_.size_options_bb.empty()) {
            hand_.legal_actions.push_back(ActionType::BET);
        }
        hand_.action_context = "checked_to_hero";
    }
}

double LiveSession::villain_strength() const {
    const std::vector<Card>& villain_hand = game_->get_player_hand(VILLAIN);
    const std::vector<Card>& board = game_->get_community_cards();
    if (board.size() < 3) {
        return clamp(preflop_strength_score(villain_hand[0], villain_hand[1]) / 100.0, 0.0, 1.0);
    }
    double made = evaluator_.made_hand_score(villain_hand, board);
    double top_rank = std::max(card_rank(villain_hand[0]), card_rank(villain_hand[1])) / 14.0;
    double draw_bonus = 0.0;
    if (board.size() < 5) {
        int broadway_cards = 0;
        for (const Card& card : villain_hand) {
            if (card_rank(card) >= 10) broadway_cards++;
        }
        draw_bonus = broadway_cards * 0.04 + board_texture_score(board) * 0.03;
    }
    return clamp(made * 0.78 + top_rank * 0.14 + draw_bonus, 0.0, 1.2);
}

double LiveSession::villain_fold_probability(double call_amount, bool is_raise) const {
    double pot = std::max(1.0, game_->get_pot_size());
    double pot_odds = call_amount / (pot + call_amount);
    double strength = villain_strength();
    double gap = std::max(0.0, opponent_.vpip - opponent_.pfr);
    double sticky = clamp(0.22 + opponent_.wtsd * 0.45 + gap * 0.68 - opponent_.af * 0.05, 0.05, 0.96);
    double pressure = call_amount / pot;
    double fold = 0.48 + pressure * 0.24 + pot_odds * 0.25 - strength * 0.52 - sticky * 0.34;
    if (is_raise && game_->get_current_street() == Street::PREFLOP) {
        fold += opponent_.fold_to_3bet * 0.42;
    }
    if (lower(opponent_.style_label).find("calling") != std::string::npos) {
        fold -= 0.10;
    }
    return clamp(fold, 0.02, 0.92);
}

double LiveSession::villain_bet_probability(bool hero_checked) const {
    const Street street = game_->get_current_street();
    const bool aggressor = villain_is_preflop_aggressor();
    double base = 0.0;
    switch (street) {
        case Street::FLOP:
            base = aggressor ? opponent_.flop_cbet : 0.20 + opponent_.aggression_frequency * 0.40;
            break;
        case Street::TURN:
            base = aggressor ? opponent_.turn_cbet : 0.16 + opponent_.aggression_frequency * 0.34;
            break;
        case Street::RIVER:
            base = aggressor ? opponent_.river_cbet : 0.12 + opponent_.aggression_frequency * 0.28;
            break;
        default:
            base = 0.26 + opponent_.pfr * 0.25;
            break;
    }
    if (hero_checked) {
        base += 0.12;
    }
    base += std::max(0.0, opponent_.af - 2.0) * 0.04;
    if (street == Street::TURN || street == Street::RIVER) {
        base -= board_texture_score(game_->get_community_cards()) * 0.03;
    }
    return clamp(base, 0.05, 0.92);
}

double LiveSession::villain_bet_size() {
    double pot = std::max(1.0, game_->get_pot_size());
    double texture = board_texture_score(game_->get_community_cards());
    double strength = villain_strength();

    double size_ratio = 0.0;
    if (opponent_.af < 1.2) {
        size_ratio = std::uniform_real_distribution<double>(0.38, 0.78)(rng_);
    } else if (opponent_.af > 3.2) {
        size_ratio = std::uniform_real_distribution<double>(0.42, 1.20)(rng_);
    } else {
        size_ratio = std::uniform_real_distribution<double>(0.34, 0.98)(rng_);
    }
    size_ratio += std::max(0.0, strength - 0.52) * 0.28;
    if (texture > 1.4) size_ratio += 0.10;
    if (lower(opponent_.style_label).find("calling station") != std::string::npos) size_ratio += 0.05;

    double raw = pot * clamp(size_ratio, 0.25, 1.35);
    double villain_stack = game_->get_player_stacks()[VILLAIN];
    return round1(clamp(raw, std::min(1.0, villain_stack), villain_stack));
}

bool LiveSession::villain_is_preflop_aggressor() const {
    return preflop_aggressor_ == VILLAIN;
}

std::vector<double> LiveSession::bet_size_options(double effective, double pot) const {
    if (effective <= 0.05) {
        return {};
    }
    std::set<double> sizes;
    for (double fraction : BET_SIZE_FRACTIONS) {
        sizes.insert(round1(clamp(pot * fraction, 1.0, effective)));
    }
    sizes.insert(round1(clamp(pot, 1.0, effective)));
    if (effective >= 1.0) {
        sizes.insert(round1(effective));
    }
    std::vector<double> options;
    for (double size : sizes) {
        if (size >= 0.8 && size <= effective + EPS && options.size() < 6) {
            options.push_back(size);
        }
    }
    return options;
}

std::vector<double> LiveSession::raise_size_options(double to_call, double effective, double pot) const {
    if (effective <= to_call + 0.05) {
        return {};
    }
    double min_raise = std::max(to_call * 2.0, to_call + LIVE_BIG_BLIND_BB);
    std::set<double> sizes;
    for (double size : {min_raise, to_call + pot * 0.5, to_call + pot * 0.75, to_call + pot * 1.25, effective}) {
        if (size > to_call) {
            sizes.insert(round1(clamp(size, std::min(min_raise, effective), effective)));
        }
    }
    std::vector<double> options;
    for (double size : sizes) {
        if (size > to_call + 0.1 && size <= effective + EPS && options.size() < 6) {
            options.push_back(size);
        }
    }
    return options;
}

} // namespace poker_coach
