#pragma once

#include <map>
#include <string>

#include "aerojudge/core/challenge.h"
#include "aerojudge/core/flight_plan.h"
#include "aerojudge/core/replay_result.h"
#include "aerojudge/core/reward.h"
#include "aerojudge/core/trust.h"
#include "aerojudge/util/json.h"

namespace aerojudge {

struct RoundReport;

// JSON forms of the core value types.
//
// 64-bit identifiers (seeds, challenge ids, digests) are written as 16-digit
// hex strings because JSON numbers are doubles. Readers also accept plain
// non-negative integers for seeds. All *_from_json functions throw
// std::runtime_error on missing keys or wrong types.

json::Value vec3_to_json(const Vec3& v);
Vec3 vec3_from_json(const json::Value& v);

json::Value motion_to_json(const MotionLaw& law);
MotionLaw motion_from_json(const json::Value& v);

json::Value challenge_to_json(const ChallengeSpec& spec);
ChallengeSpec challenge_from_json(const json::Value& v);

json::Value capability_to_json(const DroneCapability& cap);
DroneCapability capability_from_json(const json::Value& v);

json::Value flight_plan_to_json(const FlightPlan& plan);
FlightPlan flight_plan_from_json(const json::Value& v);

json::Value replay_result_to_json(const ReplayResult& r);
ReplayResult replay_result_from_json(const json::Value& v);

json::Value score_breakdown_to_json(const ScoreBreakdown& b);

// {"last_round": N, "participants": {id: {"trust": v, "last_round": r}}}.
// The reader also accepts a bare {id: {"trust": v, "last_round": r}} mapping,
// in which case last_round is the largest entry round.
json::Value trust_state_to_json(const TrustState& state);
TrustState trust_state_from_json(const json::Value& v);

json::Value trust_snapshot_to_json(const TrustSnapshot& snap);

// Everything needed to re-adjudicate a round: challenge, plans, results and
// the published snapshot.
json::Value audit_record_to_json(const RoundReport& report, const ChallengeSpec& spec,
                                 const std::map<std::string, FlightPlan>& plans);

// Text helpers (pretty-printed, sorted keys).
std::string serialize_challenge(const ChallengeSpec& spec);
ChallengeSpec deserialize_challenge(const std::string& json_text);

std::string serialize_flight_plan(const FlightPlan& plan);
FlightPlan deserialize_flight_plan(const std::string& json_text);

std::string serialize_replay_result(const ReplayResult& r);
ReplayResult deserialize_replay_result(const std::string& json_text);

} // namespace aerojudge
