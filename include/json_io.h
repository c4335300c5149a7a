#ifndef POKER_COACH_JSON_IO_H
#define POKER_COACH_JSON_IO_H

#include <nlohmann/json.hpp>

#include "archetype_matcher.h"
#include "coach_store.h"
#include "ev_engine.h"
#include "evaluation.h"
#include "exploit_detector.h"
#include "hand_history.h"
#include "hero_profile.h"
#include "leak_report.h"
#include "live_session.h"
#include "player_profile.h"
#include "player_stats.h"
#include "scenario.h"

// nlohmann::json ADL hooks for the request and response shapes.
// Enums travel as their lowercase names; unknown names throw ConfigError.
// Missing optional fields read as empty; an infinite AF is written as "inf".

namespace poker_coach {

using json = nlohmann::json;

void to_json(json& j, Street street);
void from_json(const json& j, Street& street);
void to_json(json& j, NodeType type);
void from_json(const json& j, NodeType& type);
void to_json(json& j, ActionContext context);
void from_json(const json& j, ActionContext& context);
void to_json(json& j, SeatRole role);
void from_json(const json& j, SeatRole& role);
void to_json(json& j, ActionType type);
void from_json(const json& j, ActionType& type);
void to_json(json& j, Intent intent);
void from_json(const json& j, Intent& intent);

void to_json(json& j, const HeroProfileInput& input);
void from_json(const json& j, HeroProfileInput& input);
void to_json(json& j, const HeroProfile& profile);
void from_json(const json& j, HeroProfile& profile);
void to_json(json& j, const PositionGuidance& guidance);
void from_json(const json& j, PositionGuidance& guidance);

void to_json(json& j, const SeatConfig& seat);
void from_json(const json& j, SeatConfig& seat);
void to_json(json& j, const ScenarioConfig& config);
void from_json(const json& j, ScenarioConfig& config);
void to_json(json& j, const Seat& seat);
void from_json(const json& j, Seat& seat);
void to_json(json& j, const Scenario& scenario);
void from_json(const json& j, Scenario& scenario);

void to_json(json& j, const Decision& decision);
void from_json(const json& j, Decision& decision);
void to_json(json& j, const ActionRow& row);

void to_json(json& j, const LeakFactor& factor);
void to_json(json& j, const SpotMath& math);
void to_json(json& j, const BlockerSignals& signals);
void to_json(json& j, const OpponentSnapshot& snapshot);
void to_json(json& j, const HeroProfileAnalysis& analysis);
void to_json(json& j, const LeakReport& report);
void to_json(json& j, const EvaluationResult& result);

void to_json(json& j, const StatRates& rates);
void to_json(json& j, const Exploit& exploit);
void to_json(json& j, const PlayerProfile& profile);
void to_json(json& j, const PlayerBucket& bucket);
void from_json(const json& j, StatVector& stats);
void to_json(json& j, const ArchetypeMatch& match);

void to_json(json& j, const OpponentProfile& profile);
void from_json(const json& j, OpponentProfile& profile);
void to_json(json& j, const LiveShowdown& showdown);
void to_json(json& j, const LiveHandState& hand);
void to_json(json& j, const LiveSessionState& state);

void to_json(json& j, const AttemptRecord& attempt);
void from_json(const json& j, AttemptRecord& attempt);
void to_json(json& j, const ProgressBucket& bucket);
void to_json(json& j, const ProgressSummary& summary);
void to_json(json& j, const ClearResult& result);

} // namespace poker_coach

#endif // POKER_COACH_JSON_IO_H
