#include "player_stats.h"

#include <algorithm> // For std::max
#include <limits>
#include <numeric>   // For std::accumulate
#include <stdexcept>

#include "spdlog/spdlog.h"

namespace poker_coach {

namespace {

const Street POSTFLOP_STREETS[] = {Street::FLOP, Street::TURN, Street::RIVER};

std::optional<double> gated_rate(int hits, int opportunities, int gate) {
    if (opportunities < gate || opportunities <= 0) return std::nullopt;
    return static_cast<double>(hits) / static_cast<double>(opportunities);
}

std::optional<double> gated_mean(const std::vector<double>& values, size_t gate) {
    if (values.empty() || values.size() < gate) return std::nullopt;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

bool is_aggressive(const ActionEvent& action) {
    return action.kind == ActionKind::BET_OR_RAISE;
}

bool player_bet_on(const std::vector<ActionEvent>& actions, const std::string& player_id) {
    for (const ActionEvent& a : actions) {
        if (a.player_id == player_id && is_aggressive(a)) return true;
    }
    return false;
}

// Last player to bet or raise in a list of actions, empty if nobody did.
std::string last_aggressor(const std::vector<ActionEvent>& actions) {
    std::string aggressor;
    for (const ActionEvent& a : actions) {
        if (is_aggressive(a)) aggressor = a.player_id;
    }
    return aggressor;
}

Street previous_street(Street street) {
    switch (street) {
        case Street::TURN:  return Street::FLOP;
        case Street::RIVER: return Street::TURN;
        default:            return Street::PREFLOP;
    }
}

} // namespace

std::string bet_size_bucket(double pot_ratio) {
    if (pot_ratio < 0.30) return "tiny";
    if (pot_ratio < 0.45) return "small";
    if (pot_ratio < 0.70) return "medium";
    if (pot_ratio < 1.0) return "large";
    return "overbet";
}

StreetCounters& PlayerStats::street(Street s) {
    switch (s) {
        case Street::FLOP:  return flop;
        case Street::TURN:  return turn;
        case Street::RIVER: return river;
        default:
            throw std::invalid_argument("No postflop counters for street " + street_to_string(s));
    }
}

const StreetCounters& PlayerStats::street(Street s) const {
    return const_cast<PlayerStats*>(this)->street(s);
}

// --- StatsAggregator ---

StatsAggregator::StatsAggregator(const std::string& player_id) {
    stats_.player_id = player_id;
    spdlog::debug("StatsAggregator created for player {}", player_id);
}

void StatsAggregator::add_hands(const std::vector<HandRecord>& hands) {
    for (const HandRecord& hand : hands) add_hand(hand);
}

void StatsAggregator::add_hand(const HandRecord& hand) {
    const PlayerSeat* player = hand.find_player(stats_.player_id);
    if (!player) return;

    bool acted_preflop = false;
    for (const ActionEvent& a : hand.actions) {
        if (a.street == Street::PREFLOP && a.player_id == stats_.player_id) {
            acted_preflop = true;
            break;
        }
    }
    // Seated but never dealt in (sitting out).
    if (!acted_preflop) return;

    add_preflop(hand, *player);
    add_postflop(hand);
    add_barrels(hand);
    add_check_raises(hand);
    add_showdown(hand);
}

void StatsAggregator::add_preflop(const HandRecord& hand, const PlayerSeat& player) {
    const std::string& me = stats_.player_id;
    std::vector<ActionEvent> actions = hand.actions_on(Street::PREFLOP);

    stats_.hands_played++;
    stats_.hands_by_position[player.position]++;

    bool invested = false;
    bool raised = false;
    bool acted = false;
    bool opened = false;
    bool limped = false;
    bool cold_called = false;
    int raises_before_us = 0;

    // Open, 3-bet, limp and cold call are judged on our first voluntary action only.
    for (const ActionEvent& a : actions) {
        if (a.is_blind()) continue;
        bool mine = a.player_id == me;

        if (!mine) {
            if (!acted && is_aggressive(a)) raises_before_us++;
            continue;
        }
        const bool first = !acted;
        acted = true;

        if (a.kind == ActionKind::BET_OR_RAISE) {
            invested = true;
            raised = true;
            if (first && raises_before_us == 0) {
                opened = true;
                stats_.open_raise_count++;
                if (hand.big_blind > 0.0) stats_.open_raise_sizes_bb.push_back(a.amount / hand.big_blind);
            } else if (first && raises_before_us == 1) {
                stats_.three_bet_count++;
                if (hand.big_blind > 0.0) stats_.three_bet_sizes_bb.push_back(a.amount / hand.big_blind);
            }
        } else if (a.kind == ActionKind::CALL) {
            invested = true;
            if (first) {
                if (raises_before_us == 0) limped = true;
                else cold_called = true;
            }
        }
    }

    if (invested) {
        stats_.vpip_count++;
        stats_.vpip_by_position[player.position]++;
    }
    if (raised) {
        stats_.pfr_count++;
        stats_.pfr_by_position[player.position]++;
    }
    if (limped) stats_.limp_count++;
    if (cold_called) stats_.cold_call_count++;
    if (raises_before_us == 1) stats_.three_bet_opportunities++;

    // Opened, then faced a re-raise: did we fold to it?
    if (opened) {
        bool past_open = false;
        bool faced_3bet = false;
        for (const ActionEvent& a : actions) {
            if (a.is_blind()) continue;
            if (!past_open) {
                past_open = a.player_id == me && is_aggressive(a);
                continue;
            }
            if (!faced_3bet) {
                faced_3bet = a.player_id != me && is_aggressive(a);
                continue;
            }
            if (a.player_id == me) {
                if (a.kind == ActionKind::FOLD) stats_.fold_to_3bet_count++;
                break;
            }
        }
        if (faced_3bet) stats_.fold_to_3bet_opportunities++;
    }
}

void StatsAggregator::add_postflop(const HandRecord& hand) {
    const std::string& me = stats_.player_id;

    for (Street street : POSTFLOP_STREETS) {
        std::vector<ActionEvent> actions = hand.actions_on(street);
        if (actions.empty() || hand.folded_before(me, street)) continue;

        StreetCounters& counters = stats_.street(street);
        counters.seen++;

        bool is_prior_aggressor = last_aggressor(hand.actions_on(previous_street(street))) == me;
        const ActionEvent* first_action = nullptr;
        bool first_to_act = true;
        bool faced_bet = false;
        bool street_opened = false;

        for (const ActionEvent& a : actions) {
            if (a.player_id != me) {
                if (is_aggressive(a)) {
                    if (!first_action) faced_bet = true;
                    street_opened = true;
                    first_to_act = false;
                } else if (a.kind == ActionKind::CHECK && !first_action) {
                    first_to_act = false;
                }
                continue;
            }
            if (!first_action) first_action = &a;

            switch (a.kind) {
                case ActionKind::BET_OR_RAISE:
                    if (street_opened) counters.raises++;
                    else counters.bets++;
                    street_opened = true;
                    if (a.pot_before > 0.0 && a.amount > 0.0) {
                        double ratio = a.pot_ratio();
                        counters.bet_sizes.push_back(ratio);
                        stats_.sized_bets++;
                        if (ratio > 1.0) stats_.overbets++;
                    }
                    break;
                case ActionKind::CALL:  counters.calls++; break;
                case ActionKind::CHECK: counters.checks++; break;
                case ActionKind::FOLD:  counters.folds++; break;
                default: break;
            }
        }

        if (is_prior_aggressor && first_to_act && first_action) {
            counters.cbet_opportunities++;
            if (is_aggressive(*first_action)) counters.cbets++;
        }
        if (faced_bet && first_action) {
            counters.faced_bet++;
            if (first_action->kind == ActionKind::FOLD) counters.folded_to_bet++;
        }
    }
}

void StatsAggregator::add_barrels(const HandRecord& hand) {
    const std::string& me = stats_.player_id;
    if (!player_bet_on(hand.actions_on(Street::FLOP), me)) return;

    std::vector<ActionEvent> turn = hand.actions_on(Street::TURN);
    if (turn.empty() || hand.folded_before(me, Street::TURN)) return;
    stats_.double_barrel_opportunities++;
    if (!player_bet_on(turn, me)) return;
    stats_.double_barrels++;

    std::vector<ActionEvent> river = hand.actions_on(Street::RIVER);
    if (river.empty() || hand.folded_before(me, Street::RIVER)) return;
    stats_.triple_barrel_opportunities++;
    if (player_bet_on(river, me)) stats_.triple_barrels++;
}

void StatsAggregator::add_check_raises(const HandRecord& hand) {
    const std::string& me = stats_.player_id;
    for (Street street : POSTFLOP_STREETS) {
        bool checked = false;
        bool bet_behind = false;
        bool raised = false;
        for (const ActionEvent& a : hand.actions_on(street)) {
            if (a.player_id == me) {
                if (!checked && !bet_behind && a.kind == ActionKind::CHECK) {
                    checked = true;
                } else if (checked && bet_behind) {
                    raised = is_aggressive(a);
                    break;
                }
            } else if (checked && is_aggressive(a)) {
                bet_behind = true;
            }
        }
        if (checked && bet_behind) {
            stats_.check_raise_opportunities++;
            if (raised) stats_.check_raises++;
        }
    }
}

bool StatsAggregator::saw_street(const HandRecord& hand, Street street) const {
    return !hand.actions_on(street).empty() && !hand.folded_before(stats_.player_id, street);
}

void StatsAggregator::add_showdown(const HandRecord& hand) {
    const std::string& me = stats_.player_id;
    bool flop = saw_street(hand, Street::FLOP);
    if (flop) stats_.saw_flop++;
    if (saw_street(hand, Street::TURN)) stats_.saw_turn++;
    if (saw_street(hand, Street::RIVER)) stats_.saw_river++;

    const ShowdownResult* result = hand.result_for(me);
    if (!result || !result->reached_showdown || !flop) return;

    stats_.showdowns++;
    if (result->won_pot) stats_.showdowns_won++;
    if (result->strength == HandCategory::UNKNOWN) return;

    int strength = static_cast<int>(result->strength);
    stats_.showdown_strengths.push_back(strength);

    // What did this player bet with the hand it showed?
    for (Street street : POSTFLOP_STREETS) {
        for (const ActionEvent& a : hand.actions_on(street)) {
            if (a.player_id != me || !is_aggressive(a) || a.pot_before <= 0.0 || a.amount <= 0.0) continue;
            stats_.strengths_by_bet_size[bet_size_bucket(a.pot_ratio())].push_back(strength);
            if (street == Street::RIVER) stats_.river_bet_strengths.push_back(strength);
        }
    }
}

// --- Rates ---

StatRates compute_rates(const PlayerStats& stats) {
    StatRates r;
    r.hands = stats.hands_played;

    r.vpip = gated_rate(stats.vpip_count, stats.hands_played, gates::PREFLOP_HANDS);
    r.pfr = gated_rate(stats.pfr_count, stats.hands_played, gates::PREFLOP_HANDS);
    if (r.vpip && r.pfr) r.vpip_pfr_gap = std::max(0.0, *r.vpip - *r.pfr);
    r.limp = gated_rate(stats.limp_count, stats.hands_played, gates::PREFLOP_HANDS);
    r.cold_call = gated_rate(stats.cold_call_count, stats.hands_played, gates::PREFLOP_HANDS);
    r.three_bet = gated_rate(stats.three_bet_count, stats.three_bet_opportunities, gates::THREE_BET);
    r.fold_to_3bet = gated_rate(stats.fold_to_3bet_count, stats.fold_to_3bet_opportunities, gates::FOLD_TO_3BET);
    r.avg_open_raise_bb = gated_mean(stats.open_raise_sizes_bb, 1);
    r.avg_three_bet_bb = gated_mean(stats.three_bet_sizes_bb, 1);

    r.cbet_flop = gated_rate(stats.flop.cbets, stats.flop.cbet_opportunities, gates::CBET);
    r.cbet_turn = gated_rate(stats.turn.cbets, stats.turn.cbet_opportunities, gates::CBET);
    r.cbet_river = gated_rate(stats.river.cbets, stats.river.cbet_opportunities, gates::CBET);
    r.fold_to_bet_flop = gated_rate(stats.flop.folded_to_bet, stats.flop.faced_bet, gates::FOLD_TO_BET_FLOP);
    r.fold_to_bet_turn = gated_rate(stats.turn.folded_to_bet, stats.turn.faced_bet, gates::FOLD_TO_BET_LATE);
    r.fold_to_bet_river = gated_rate(stats.river.folded_to_bet, stats.river.faced_bet, gates::FOLD_TO_BET_LATE);
    r.double_barrel = gated_rate(stats.double_barrels, stats.double_barrel_opportunities, gates::DOUBLE_BARREL);
    r.triple_barrel = gated_rate(stats.triple_barrels, stats.triple_barrel_opportunities, gates::TRIPLE_BARREL);
    r.check_raise = gated_rate(stats.check_raises, stats.check_raise_opportunities, gates::CHECK_RAISE);
    r.overbet = gated_rate(stats.overbets, stats.sized_bets, gates::OVERBET);

    int aggressive = stats.flop.aggressive() + stats.turn.aggressive() + stats.river.aggressive();
    int calls = stats.flop.calls + stats.turn.calls + stats.river.calls;
    int checks = stats.flop.checks + stats.turn.checks + stats.river.checks;
    if (aggressive + calls >= gates::AGGRESSION) {
        r.aggression_factor = calls == 0 ? std::numeric_limits<double>::infinity()
                                         : static_cast<double>(aggressive) / calls;
    }
    r.aggression_frequency = gated_rate(aggressive, aggressive + calls + checks, gates::AGGRESSION);

    r.wtsd = gated_rate(stats.showdowns, stats.saw_flop, gates::WTSD);
    r.wsd = gated_rate(stats.showdowns_won, stats.showdowns, gates::WSD);
    if (static_cast<int>(stats.showdown_strengths.size()) >= gates::WSD) {
        r.avg_showdown_strength = std::accumulate(stats.showdown_strengths.begin(), stats.showdown_strengths.end(), 0.0)
                                  / static_cast<double>(stats.showdown_strengths.size());
    }

    int river_samples = static_cast<int>(stats.river_bet_strengths.size());
    int river_value = 0;
    int river_bluff = 0;
    for (int s : stats.river_bet_strengths) {
        if (s >= 3) river_value++;
        if (s <= 2) river_bluff++;
    }
    r.river_bet_value = gated_rate(river_value, river_samples, gates::RIVER_BET_SAMPLES);
    r.river_bet_bluff = gated_rate(river_bluff, river_samples, gates::RIVER_BET_SAMPLES);

    r.three_bet_opportunities = stats.three_bet_opportunities;
    r.fold_to_3bet_opportunities = stats.fold_to_3bet_opportunities;
    r.flop_cbet_opportunities = stats.flop.cbet_opportunities;
    r.flop_faced_bet = stats.flop.faced_bet;
    r.turn_faced_bet = stats.turn.faced_bet;
    r.double_barrel_opportunities = stats.double_barrel_opportunities;
    r.check_raise_opportunities = stats.check_raise_opportunities;
    r.river_bet_samples = river_samples;
    return r;
}

} // namespace poker_coach
