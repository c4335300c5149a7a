#include "leak_report.h"
#include "archetypes.h"
#include "poker_theory.h"

#include <algorithm> // For std::stable_sort, std::find_if
#include <cctype>    // For std::toupper, std::isalpha
#include <cmath>     // For std::round
#include <map>
#include <set>

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

namespace poker_coach {

namespace {

double round_to(double value, double scale) {
    return std::round(value * scale) / scale;
}

double round3(double value) { return round_to(value, 1000.0); }
double round1(double value) { return round_to(value, 10.0); }

std::string title_case(std::string text) {
    bool start = true;
    for (char& c : text) {
        if (start && std::isalpha(static_cast<unsigned char>(c))) c = static_cast<char>(std::toupper(c));
        start = c == ' ' || c == '-';
    }
    return text;
}

bool has_any(const std::vector<const Seat*>& villains, const std::set<std::string>& keys) {
    for (const Seat* v : villains) {
        if (keys.count(v->archetype_key)) return true;
    }
    return false;
}

double average_fold_rate(const std::vector<const Seat*>& villains, Street street, double fallback) {
    if (villains.empty()) return fallback;
    double total = 0.0;
    for (const Seat* v : villains) total += street_fold_rate(v->archetype_key, street);
    return total / static_cast<double>(villains.size());
}

// (risk, reward) of a zero-equity bluff for break-even fold math.
std::pair<double, double> bluff_risk_reward(const Scenario& scenario, const ActionRow& row) {
    double pot = std::max(0.0, scenario.pot_bb);
    double size = row.size_bb.value_or(0.0);
    if (row.action == ActionType::BET) return {size, pot};
    if (row.action == ActionType::RAISE) {
        return {std::max(0.1, size - scenario.to_call_bb), std::max(0.0, pot + scenario.to_call_bb)};
    }
    return {0.0, pot};
}

const ActionRow* best_row(const std::vector<ActionRow>& actions,
                          ActionType action,
                          const Intent* intent = nullptr) {
    const ActionRow* best = nullptr;
    for (const auto& row : actions) {
        if (row.action != action) continue;
        if (intent && row.intent != *intent) continue;
        if (!best || row.ev_bb > best->ev_bb) best = &row;
    }
    return best;
}

struct RawFactor {
    std::string factor;
    double raw_impact_bb;
    std::string detail;
};

} // namespace

double street_fold_rate(const std::string& archetype_key, Street street) {
    const Archetype& a = archetype_by_key(archetype_key);
    switch (street) {
        case Street::FLOP:  return a.fold_to_flop_bet;
        case Street::TURN:  return a.fold_to_turn_bet;
        case Street::RIVER: return a.fold_to_river_bet;
        default:            return a.fold_to_raise;
    }
}

std::string summarize_archetype_mix(const std::vector<const Seat*>& villains) {
    if (villains.empty()) return "no active villains";

    // Count in first-seen order so equal counts keep seat order.
    std::vector<std::pair<std::string, int>> counts;
    for (const Seat* v : villains) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& c) { return c.first == v->archetype_key; });
        if (it == counts.end()) {
            counts.emplace_back(v->archetype_key, 1);
        } else {
            it->second++;
        }
    }
    std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> chunks;
    for (size_t i = 0; i < counts.size() && i < 2; ++i) {
        chunks.push_back(fmt::format("{} x{}", archetype_by_key(counts[i].first).label, counts[i].second));
    }
    return fmt::format("{}", fmt::join(chunks, ", "));
}

BlockerSignals hand_blocker_signals(const std::vector<Card>& hero_hand, const std::vector<Card>& board) {
    BlockerSignals signals;
    if (hero_hand.empty()) {
        signals.signal_text = "No blocker read available.";
        return signals;
    }

    std::map<char, int> suit_counts;
    for (const auto& c : board) suit_counts[card_suit(c)]++;
    for (const auto& entry : suit_counts) {
        if (entry.second < 3) continue;
        for (const auto& c : hero_hand) {
            if (card_suit(c) == entry.first && card_rank(c) >= 13) signals.nut_flush_blocker = true;
        }
        break;
    }

    std::map<int, int> board_ranks;
    for (const auto& c : board) board_ranks[card_rank(c)]++;
    for (const auto& c : hero_hand) {
        if (card_rank(c) >= 10) signals.broadway_blockers++;
        auto it = board_ranks.find(card_rank(c));
        if (it != board_ranks.end() && it->second >= 2) signals.paired_board_blockers++;
    }

    std::vector<std::string> notes;
    if (signals.nut_flush_blocker) notes.push_back("holds high flush blocker");
    if (signals.broadway_blockers >= 2) {
        notes.push_back("double broadway blockers");
    } else if (signals.broadway_blockers == 1) {
        notes.push_back("single broadway blocker");
    }
    if (signals.paired_board_blockers > 0) notes.push_back("blocks full-house combos on paired board");
    signals.signal_text = notes.empty() ? "blocker profile is neutral" : fmt::format("{}", fmt::join(notes, ", "));
    return signals;
}

SpotMath spot_math_snapshot(const Scenario& scenario, const ActionRow& chosen) {
    SpotMath m;
    m.pot_bb = scenario.pot_bb;
    m.to_call_bb = scenario.to_call_bb;
    m.spr = theory::stack_to_pot_ratio(scenario.effective_stack_bb, std::max(1.0, scenario.pot_bb));
    theory::SprBand band = theory::classify_spr(m.spr);
    m.spr_label = band.label;
    m.spr_notes = band.notes;
    m.required_equity = theory::required_equity(scenario.pot_bb, scenario.to_call_bb);
    m.mdf = scenario.to_call_bb > 0.0
                ? theory::minimum_defense_frequency(std::max(0.0, scenario.pot_bb - scenario.to_call_bb),
                                                    scenario.to_call_bb)
                : 1.0;

    m.chosen_action = chosen.action;
    m.chosen_size_bb = chosen.size_bb.value_or(0.0);
    if (m.chosen_size_bb > 0.0) {
        m.bet_to_pot = m.chosen_size_bb / std::max(1.0, scenario.pot_bb);
        auto rr = bluff_risk_reward(scenario, chosen);
        m.break_even_fold = theory::break_even_fold_frequency(rr.first, rr.second);
    }
    m.target_bluff_share = theory::polarized_bluff_share(m.bet_to_pot);
    m.target_bluff_to_value = theory::bluff_to_value_ratio(m.bet_to_pot);
    return m;
}

HeroProfileAnalysis hero_profile_analysis(const Scenario& scenario, const ActionRow& chosen, const ActionRow& best) {
    HeroProfileAnalysis analysis;
    const HeroProfile& hero = scenario.hero_profile;
    std::string street = street_to_string(scenario.street);
    analysis.hero_profile = hero;
    analysis.position_guidance = hero.position_guidance(scenario.hero_position, street);
    analysis.leak_flags = hero.leak_flags();

    std::vector<const Seat*> villains = scenario.active_villains();
    double texture = board_texture_score(scenario.board);
    std::string texture_text = texture_label(texture);
    std::string mix = summarize_archetype_mix(villains);
    SpotMath math = spot_math_snapshot(scenario, chosen);
    BlockerSignals blockers = hand_blocker_signals(scenario.hero_hand, scenario.board);
    double avg_fold = average_fold_rate(villains, scenario.street, 0.45);

    std::vector<std::string> recs;
    const auto& guide = analysis.position_guidance;
    if (hero.vpip() < guide.target_open_low - 0.02) {
        recs.push_back("VPIP is below positional target; widen in-position opens to avoid passing profitable steals.");
    }
    if (hero.vpip() > guide.target_open_high + 0.06) {
        recs.push_back("VPIP is above positional target; prune weakest offsuit opens to reduce dominated postflop nodes.");
    }
    if (hero.vpip_pfr_gap() > 0.10) {
        recs.push_back("VPIP-PFR gap is large: replace marginal flats with more 3-bets/folds to avoid capped ranges.");
    }
    if (hero.af() > 3.9) {
        recs.push_back("AF is very high: cap low-blocker river bluffs and retain more bluff-catchers in your checking range.");
    }
    if (hero.fold_to_3bet() > 0.65) {
        recs.push_back("Fold-to-3bet is high: defend selected suited broadways and pocket pairs to reduce exploitability.");
    }

    if (math.to_call_bb > 0.0) {
        recs.push_back(fmt::format("Facing {:.1f}bb, call threshold is {:.1f}% equity; baseline MDF is {:.1f}% "
                                   "before exploit adjustments.",
                                   math.to_call_bb, math.required_equity * 100.0, math.mdf * 100.0));
    }
    recs.push_back(fmt::format("SPR is {:.1f} ({}): {}", math.spr, math.spr_label, math.spr_notes.front()));

    switch (scenario.node_type) {
        case NodeType::SINGLE_RAISED_POT:
            recs.push_back("SRP node: leverage range advantage on favorable boards with disciplined small-to-medium sizings.");
            break;
        case NodeType::THREE_BET_POT:
            recs.push_back("3-bet pot: tighten bluff density and prioritize blocker quality plus nut-advantage board classes.");
            break;
        case NodeType::FOUR_BET_POT:
            recs.push_back("4-bet pot: very range-dense node, so shift toward high-card/blocker-driven decisions and "
                           "lower pure-bluff frequency.");
            break;
    }

    switch (scenario.action_context) {
        case ActionContext::CHECKED_TO_HERO:
            recs.push_back("Checked-to-hero node: run high-frequency stabs on dry boards, but retain check-back "
                           "protection on medium-strength holdings.");
            break;
        case ActionContext::FACING_BET:
            recs.push_back("Facing-bet node: anchor decisions around pot-odds threshold, then adjust exploitively by "
                           "villain fold/call profile.");
            break;
        case ActionContext::FACING_BET_AND_CALL:
            recs.push_back("Facing bet+call node: weight value-heavy raises and reduce thin bluffs because at least "
                           "one range has already continued.");
            break;
    }

    if (scenario.players_in_hand > 2) {
        recs.push_back(fmt::format("Multiway ({} players) and {} board reduce bluff efficiency; keep bluffs "
                                   "blocker-driven and size-disciplined.",
                                   scenario.players_in_hand, texture_text));
    } else if (texture_text == "dry") {
        recs.push_back("Heads-up on dry texture supports higher small-size stab frequency, especially in position.");
    } else {
        recs.push_back(fmt::format("{} texture rewards equity-driven barreling over pure range-denial bluffs.",
                                   title_case(texture_text)));
    }

    if (has_any(villains, {"calling_station", "overcaller_preflop"})) {
        recs.push_back("Pool includes calling-station tendencies: trim air bluffs and shift value sizing upward "
                       "(about 60-100% pot) with top-pair+ hands.");
    }
    if (has_any(villains, {"nit", "weak_tight", "fit_or_fold", "overfolder_3bet"})) {
        recs.push_back("Pool includes overfolders: increase frequent small stabs on dry boards and pressure capped "
                       "ranges on scare-card turns.");
    }
    if (has_any(villains, {"lag_reg", "maniac"})) {
        recs.push_back("Aggressive villains present: defend more bluff-catchers and avoid low-equity bluff-raises "
                       "without strong blockers.");
    }
    if (has_any(villains, {"trappy"})) {
        recs.push_back("Trappy profiles in pool: reduce auto-barrels on paired boards and protect your checking range "
                       "with medium-strength value.");
    }
    recs.push_back(fmt::format("Current villain mix ({}) has estimated {} fold rate of {:.1f}%.", mix, street,
                               avg_fold * 100.0));

    if (chosen.is_aggressive()) {
        recs.push_back(fmt::format("At {:.2f}x pot sizing, zero-equity bluff needs {:.1f}% folds; polarized bluff "
                                   "share target is {:.1f}% (ratio {:.2f}:1).",
                                   math.bet_to_pot, math.break_even_fold * 100.0, math.target_bluff_share * 100.0,
                                   math.target_bluff_to_value));
    }

    if (blockers.signal_text != "blocker profile is neutral") {
        recs.push_back(fmt::format("Blocker read: {}.", blockers.signal_text));
    } else {
        recs.push_back("Blocker read is neutral; prioritize line selection by range/nut advantage rather than pure "
                       "blocker logic.");
    }
    recs.push_back(fmt::format("Model best line is {} vs chosen {}; align future selections with that sizing/intent "
                               "profile in similar nodes.",
                               best.label, chosen.label));

    if (recs.size() > 12) recs.resize(12);
    analysis.recommendations = recs;

    analysis.opponent_snapshot.archetype_mix = mix;
    analysis.opponent_snapshot.average_street_fold_rate = round_to(avg_fold, 10000.0);
    analysis.opponent_snapshot.players_in_hand = scenario.players_in_hand;
    analysis.opponent_snapshot.texture_label = texture_text;
    analysis.spot_math = math;
    return analysis;
}

// --- LeakAnalyzer ---

LeakAnalyzer::LeakAnalyzer(const MonteCarlo& monte_carlo) : monte_carlo_(monte_carlo) {
    spdlog::debug("LeakAnalyzer created");
}

double LeakAnalyzer::counterfactual_ev(const Scenario& scenario, const Decision& decision, int simulations) const {
    EvCalculator calc(scenario, simulations, monte_carlo_);
    return calc.evaluate_choice(decision).ev_bb;
}

std::vector<LeakFactor> LeakAnalyzer::factor_breakdown(const Scenario& scenario,
                                                       const Decision& decision,
                                                       const ActionRow& chosen,
                                                       const ActionRow& best,
                                                       const std::vector<ActionRow>& actions,
                                                       int simulations) const {
    double ev_loss = std::max(0.0, best.ev_bb - chosen.ev_bb);
    if (ev_loss <= 0.01) {
        return {{RESIDUAL_FACTOR, round3(ev_loss), 100.0, "No material EV gap versus the model's best line."}};
    }

    double chosen_ev = chosen.ev_bb;
    bool aggressive = chosen.is_aggressive();
    bool bluff = chosen.intent == Intent::BLUFF;
    SpotMath math = spot_math_snapshot(scenario, chosen);
    std::vector<const Seat*> villains = scenario.active_villains();
    BlockerSignals blockers = hand_blocker_signals(scenario.hero_hand, scenario.board);
    std::vector<RawFactor> raw;

    if (const ActionRow* same_action = best_row(actions, chosen.action)) {
        double gap = std::max(0.0, best.ev_bb - same_action->ev_bb);
        if (gap > 0.02) {
            raw.push_back({"Action Choice", gap,
                           fmt::format("Best action class is {} ({:.3f}bb) while chosen class was {} (best in-class "
                                       "{:.3f}bb). Primary leak is line selection, not just sizing.",
                                       action_type_to_string(best.action), best.ev_bb,
                                       action_type_to_string(chosen.action), same_action->ev_bb)});
        }
    }

    if (chosen.action == ActionType::CALL && math.to_call_bb > 0.0) {
        double eq_gap = std::max(0.0, math.required_equity - chosen.equity);
        if (eq_gap > 0.015) {
            raw.push_back({"Pot Odds Discipline", eq_gap * (math.pot_bb + math.to_call_bb) * 0.8,
                           fmt::format("Call required about {:.1f}% equity but line had {:.1f}%. Calling below "
                                       "threshold leaks immediately unless implied odds are strong.",
                                       math.required_equity * 100.0, chosen.equity * 100.0)});
        }
    }

    if (chosen.action == ActionType::FOLD && math.to_call_bb > 0.0 &&
        (best.action == ActionType::CALL || best.action == ActionType::RAISE)) {
        double gap = std::max(0.0, best.equity - math.required_equity);
        if (gap > 0.015) {
            raw.push_back({"Overfold vs Price", gap * (math.pot_bb + math.to_call_bb) * 0.7,
                           fmt::format("Pot odds asked for {:.1f}% equity, while stronger continuing lines held about "
                                       "{:.1f}%. Folding surrendered too much defendable equity.",
                                       math.required_equity * 100.0, best.equity * 100.0)});
        }
    }

    if (aggressive) {
        Intent intent = chosen.intent;
        if (const ActionRow* same_intent = best_row(actions, chosen.action, &intent)) {
            double gap = std::max(0.0, same_intent->ev_bb - chosen_ev);
            if (gap > 0.02) {
                raw.push_back({"Sizing", gap,
                               fmt::format("Within {}/{} lines, better sizing existed ({:.1f}bb).",
                                           action_type_to_string(chosen.action), intent_to_string(intent),
                                           same_intent->size_bb.value_or(0.0))});
            }
        }

        Intent alt = bluff ? Intent::VALUE : Intent::BLUFF;
        for (const auto& row : actions) {
            if (row.action != chosen.action || row.intent != alt) continue;
            if (!row.size_bb || !chosen.size_bb || round_bb(*row.size_bb) != round_bb(*chosen.size_bb)) continue;
            double gap = std::max(0.0, row.ev_bb - chosen_ev);
            if (gap > 0.02) {
                raw.push_back({"Value/Bluff Mix", gap,
                               fmt::format("For the same size, tagging this line as {} performed better against "
                                           "these ranges.",
                                           intent_to_string(alt))});
            }
            break;
        }

        if (bluff) {
            double gap = std::max(0.0, math.break_even_fold - chosen.fold_equity);
            if (gap > 0.03) {
                raw.push_back({"Bluff Economics", gap * std::max(0.5, chosen.risk_bb),
                               fmt::format("Bluff needed {:.1f}% folds at this risk/reward, model estimated {:.1f}%.",
                                           math.break_even_fold * 100.0, chosen.fold_equity * 100.0)});
            }
            if (!blockers.nut_flush_blocker && blockers.broadway_blockers == 0) {
                double blocker_gap = std::min(ev_loss * 0.35, 0.22);
                if (blocker_gap > 0.02) {
                    raw.push_back({"Blocker Quality", blocker_gap,
                                   "Bluff line lacked high-card/nut blockers, so villain continues retained too many "
                                   "strong calls."});
                }
            }
        }
    }

    int counterfactual_sims = std::max(MIN_TRIALS, std::min(220, simulations / 2));
    Scenario neutral = scenario;
    neutral.hero_profile = HeroProfile(0.24, 0.19, 2.3, 0.08, 0.56);
    double neutral_ev = counterfactual_ev(neutral, decision, counterfactual_sims);
    double image_gap = std::max(0.0, neutral_ev - chosen_ev);
    if (image_gap > 0.02) {
        const HeroProfile& hero = scenario.hero_profile;
        raw.push_back({"Hero Table Image (VPIP/PFR/AF)", image_gap,
                       fmt::format("Your current profile shifts villain continues versus this line (style={}, "
                                   "image_bluffiness={:.2f}); pool adjusted by calling lighter versus perceived "
                                   "aggression.",
                                   hero.style_label(), hero.image_bluffiness())});
    }

    if (scenario.hero_position != "BTN") {
        Scenario on_button = scenario;
        on_button.hero_position = "BTN";
        double btn_ev = counterfactual_ev(on_button, decision, counterfactual_sims);
        double pos_gap = std::max(0.0, btn_ev - chosen_ev) * 0.7;
        if (pos_gap > 0.02) {
            raw.push_back({"Position Leverage", pos_gap,
                           fmt::format("Same line as BTN estimated {:.3f}bb versus {:.3f}bb here; OOP realization "
                                       "and check-back denial reduced EV.",
                                       btn_ev, chosen_ev)});
        }
    }

    if (scenario.players_in_hand > 2 && aggressive && bluff) {
        double ratio = chosen.size_bb.value_or(0.0) / std::max(1.0, scenario.pot_bb);
        double gap = std::min((scenario.players_in_hand - 2) * (0.12 + 0.18 * ratio), ev_loss * 0.8);
        if (gap > 0.02) {
            raw.push_back({"Multiway Bluff Penalty", gap,
                           fmt::format("{}-way node reduced fold-chain reliability; multiway bluffs require stronger "
                                       "blocker/equity backup than heads-up nodes.",
                                       scenario.players_in_hand)});
        }
    }

    if (!villains.empty()) {
        std::string street = street_to_string(scenario.street);
        double avg_fold = average_fold_rate(villains, scenario.street, 0.45);
        std::string mix = summarize_archetype_mix(villains);
        double gap = 0.0;
        std::string detail;
        if (chosen.intent == Intent::BLUFF) {
            gap = std::max(0.0, 0.44 - avg_fold) * 2.1;
            detail = fmt::format("Pool ({}) folds too little on {} (avg {:.2f}) for this bluff frequency/size.", mix,
                                 street, avg_fold);
        } else if (chosen.intent == Intent::VALUE) {
            gap = std::max(0.0, avg_fold - 0.60) * 1.2;
            detail = fmt::format("Pool ({}) folds often (avg {:.2f}); value line likely needed smaller sizing or "
                                 "stronger value density.",
                                 mix, avg_fold);
        }
        if (gap > 0.02) raw.push_back({"Opponent Archetype Mismatch", gap, detail});
    }

    double texture = board_texture_score(scenario.board);
    if (bluff && texture >= 1.4) {
        double gap = std::min(ev_loss * 0.4, 0.18 * texture);
        if (gap > 0.02) {
            raw.push_back({"Board Texture", gap,
                           fmt::format("{} texture ({:.2f}) lowers fold equity and increases natural continues from "
                                       "pair+draw holdings.",
                                       title_case(texture_label(texture)), texture)});
        }
    }

    if (math.spr >= 8.0 && aggressive && bluff) {
        double gap = std::min(ev_loss * 0.35, 0.24);
        if (gap > 0.02) {
            raw.push_back({"SPR Planning", gap,
                           fmt::format("High SPR ({:.1f}) rewards nutted potential and selective aggression; line "
                                       "over-committed medium equity.",
                                       math.spr)});
        }
    }

    std::vector<LeakFactor> factors;
    double total_raw = 0.0;
    for (const auto& f : raw) total_raw += f.raw_impact_bb;

    double remaining = ev_loss;
    if (total_raw > 0.0) {
        std::stable_sort(raw.begin(), raw.end(),
                         [](const RawFactor& a, const RawFactor& b) { return a.raw_impact_bb > b.raw_impact_bb; });
        double scale = ev_loss / total_raw;
        for (const auto& f : raw) {
            double impact = std::min(round3(f.raw_impact_bb * scale), round3(std::max(0.0, remaining)));
            if (impact <= 0.0) continue;
            remaining = round3(std::max(0.0, remaining - impact));
            factors.push_back({f.factor, impact, round1(impact / ev_loss * 100.0), f.detail});
        }
    }
    if (remaining > 0.0005) {
        factors.push_back({RESIDUAL_FACTOR, round3(remaining), round1(remaining / ev_loss * 100.0),
                           "Remaining gap from interactions between factors and simulation variance."});
    }

    // Put the rounding drift on the leading factor so shares add to exactly 100.
    double share_total = 0.0;
    for (const auto& f : factors) share_total += f.share_pct;
    if (!factors.empty()) factors.front().share_pct = round1(factors.front().share_pct + (100.0 - share_total));
    return factors;
}

LeakReport LeakAnalyzer::build_report(const Scenario& scenario,
                                      const Decision& decision,
                                      const ActionRow& chosen,
                                      const ActionRow& best,
                                      const std::vector<ActionRow>& actions,
                                      double ev_loss_bb,
                                      int simulations) const {
    LeakReport report;
    report.optimal_gap_bb = round3(ev_loss_bb);
    report.factor_breakdown = factor_breakdown(scenario, decision, chosen, best, actions, simulations);
    report.hero_profile_analysis = hero_profile_analysis(scenario, chosen, best);

    const SpotMath& math = report.hero_profile_analysis.spot_math;
    std::string top_factor = "No significant leak factors";
    if (!report.factor_breakdown.empty() && report.factor_breakdown.front().factor != RESIDUAL_FACTOR) {
        top_factor = report.factor_breakdown.front().factor;
    }
    report.summary = fmt::format(
        "EV leak {:.3f}bb in {} {} spot ({}-way, SPR {:.1f}, {} board). Pot-odds equity threshold {:.1f}%, baseline "
        "MDF {:.1f}%. Best line: {} ({:.3f}bb) vs chosen {} ({:.3f}bb). Primary driver: {}. Pool: {}.",
        ev_loss_bb, street_to_string(scenario.street), scenario.hero_position, scenario.players_in_hand, math.spr,
        texture_label(board_texture_score(scenario.board)), math.required_equity * 100.0, math.mdf * 100.0,
        best.label, best.ev_bb, chosen.label, chosen.ev_bb, top_factor,
        report.hero_profile_analysis.opponent_snapshot.archetype_mix);
    return report;
}

} // namespace poker_coach
