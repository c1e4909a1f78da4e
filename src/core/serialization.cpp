#include "aerojudge/core/serialization.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "aerojudge/core/round_scheduler.h"
#include "aerojudge/util/digest.h"

namespace aerojudge {
namespace {

using json::Array;
using json::Object;
using json::Value;

constexpr int kChallengeFormatVersion = 1;
constexpr int kTrustFormatVersion = 1;

double number_at(const Value& v, const std::string& key) {
  const Value& n = v.at(key);
  const double* d = n.as_number();
  if (!d) throw std::runtime_error("JSON key '" + key + "' must be a number");
  return *d;
}

double number_or(const Value& v, const std::string& key, double def) {
  const Value* n = v.find(key);
  if (!n) return def;
  const double* d = n->as_number();
  if (!d) throw std::runtime_error("JSON key '" + key + "' must be a number");
  return *d;
}

// Largest integer a JSON number carries exactly.
constexpr double kMaxExactInteger = 9007199254740992.0;

// Round indices: integral, -1 ("never") up to 2^53.
std::int64_t round_or(const Value& v, const std::string& key, std::int64_t def) {
  const double d = number_or(v, key, static_cast<double>(def));
  if (!std::isfinite(d) || d != std::floor(d) || d < -1.0 || d > kMaxExactInteger) {
    throw std::runtime_error("JSON key '" + key + "' must be a round index (integer >= -1)");
  }
  return static_cast<std::int64_t>(d);
}

std::string string_at(const Value& v, const std::string& key) {
  const std::string* s = v.at(key).as_string();
  if (!s) throw std::runtime_error("JSON key '" + key + "' must be a string");
  return *s;
}

Value u64_to_json(std::uint64_t x) { return digest64_to_hex(x); }

std::uint64_t u64_from_json(const Value& v, const std::string& what) {
  if (const std::string* s = v.as_string()) {
    std::uint64_t out = 0;
    if (!digest64_from_hex(*s, out)) throw std::runtime_error(what + " is not a 64-bit hex string: " + *s);
    return out;
  }
  if (const double* d = v.as_number()) {
    if (!std::isfinite(*d) || *d < 0.0 || *d != std::floor(*d) || *d > 9007199254740992.0) {
      throw std::runtime_error(what + " must be a non-negative integer");
    }
    return static_cast<std::uint64_t>(*d);
  }
  throw std::runtime_error(what + " must be a hex string or integer");
}

Value aabb_to_json(const Aabb& b) {
  Object o;
  o["min"] = vec3_to_json(b.min);
  o["max"] = vec3_to_json(b.max);
  return o;
}

Aabb aabb_from_json(const Value& v) { return Aabb{vec3_from_json(v.at("min")), vec3_from_json(v.at("max"))}; }

Value obstacle_to_json(const Obstacle& ob) {
  Object o;
  o["shape"] = std::string(obstacle_shape_label(ob.shape));
  o["anchor"] = vec3_to_json(ob.anchor);
  switch (ob.shape) {
    case ObstacleShape::Box: o["half_extents"] = vec3_to_json(ob.half_extents); break;
    case ObstacleShape::Sphere: o["radius_m"] = ob.radius_m; break;
    case ObstacleShape::Cylinder:
      o["radius_m"] = ob.radius_m;
      o["height_m"] = ob.height_m;
      break;
  }
  o["motion"] = motion_to_json(ob.motion);
  return o;
}

Obstacle obstacle_from_json(const Value& v) {
  Obstacle ob;
  if (!parse_obstacle_shape(string_at(v, "shape"), ob.shape)) {
    throw std::runtime_error("unknown obstacle shape: " + string_at(v, "shape"));
  }
  ob.anchor = vec3_from_json(v.at("anchor"));
  if (const Value* h = v.find("half_extents")) ob.half_extents = vec3_from_json(*h);
  ob.radius_m = number_or(v, "radius_m", ob.radius_m);
  ob.height_m = number_or(v, "height_m", ob.height_m);
  if (const Value* m = v.find("motion")) ob.motion = motion_from_json(*m);
  return ob;
}

Value optional_number(const std::optional<double>& d) {
  if (!d) return nullptr;
  return *d;
}

} // namespace

Value vec3_to_json(const Vec3& v) { return Array{v.x, v.y, v.z}; }

Vec3 vec3_from_json(const Value& v) {
  const Array& a = v.array();
  if (a.size() != 3) throw std::runtime_error("vector must have exactly 3 components");
  for (const auto& c : a) {
    if (!c.is_number()) throw std::runtime_error("vector components must be numbers");
  }
  return Vec3{a[0].number_value(), a[1].number_value(), a[2].number_value()};
}

Value motion_to_json(const MotionLaw& law) {
  Object o;
  o["kind"] = std::string(motion_kind_label(motion_kind(law)));
  std::visit(
      [&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LinearMotion>) {
          o["velocity_m_s"] = vec3_to_json(m.velocity_m_s);
          o["half_period_s"] = m.half_period_s;
        } else if constexpr (std::is_same_v<T, CircularMotion>) {
          o["radius_m"] = m.radius_m;
          o["angular_speed_rad_s"] = m.angular_speed_rad_s;
          o["phase_rad"] = m.phase_rad;
        }
      },
      law);
  return o;
}

MotionLaw motion_from_json(const Value& v) {
  MotionKind kind = MotionKind::Static;
  if (!parse_motion_kind(string_at(v, "kind"), kind)) {
    throw std::runtime_error("unknown motion kind: " + string_at(v, "kind"));
  }
  switch (kind) {
    case MotionKind::Static: return StaticMotion{};
    case MotionKind::Linear: {
      LinearMotion m;
      m.velocity_m_s = vec3_from_json(v.at("velocity_m_s"));
      m.half_period_s = number_at(v, "half_period_s");
      return m;
    }
    case MotionKind::Circular: {
      CircularMotion m;
      m.radius_m = number_at(v, "radius_m");
      m.angular_speed_rad_s = number_at(v, "angular_speed_rad_s");
      m.phase_rad = number_or(v, "phase_rad", 0.0);
      return m;
    }
  }
  return StaticMotion{};
}

Value challenge_to_json(const ChallengeSpec& spec) {
  Object o;
  o["aerojudge_challenge_version"] = static_cast<double>(kChallengeFormatVersion);
  o["challenge_id"] = u64_to_json(challenge_id(spec));
  o["seed"] = u64_to_json(spec.seed);
  o["difficulty_tier"] = std::string(difficulty_tier_label(spec.difficulty_tier));
  o["world_bounds"] = aabb_to_json(spec.world_bounds);
  o["start"] = vec3_to_json(spec.start);

  Array obstacles;
  obstacles.reserve(spec.obstacles.size());
  for (const auto& ob : spec.obstacles) obstacles.push_back(obstacle_to_json(ob));
  o["obstacles"] = std::move(obstacles);

  Object goal;
  goal["anchor"] = vec3_to_json(spec.goal.anchor);
  goal["motion"] = motion_to_json(spec.goal.motion);
  o["goal"] = std::move(goal);

  o["capture_radius_m"] = spec.capture_radius_m;
  o["capture_hold_s"] = spec.capture_hold_s;
  o["reference_time_s"] = spec.reference_time_s;

  Object physics;
  physics["step_s"] = spec.physics.step_s;
  physics["gravity_m_s2"] = spec.physics.gravity_m_s2;
  physics["linear_drag"] = spec.physics.linear_drag;
  o["physics"] = std::move(physics);

  o["horizon_s"] = spec.horizon_s;

  Array zones;
  for (const auto& z : spec.no_fly_zones) zones.push_back(aabb_to_json(z));
  o["no_fly_zones"] = std::move(zones);
  return o;
}

ChallengeSpec challenge_from_json(const Value& v) {
  ChallengeSpec spec;
  spec.seed = u64_from_json(v.at("seed"), "seed");
  if (!parse_difficulty_tier(string_at(v, "difficulty_tier"), spec.difficulty_tier)) {
    throw std::runtime_error("unknown difficulty tier: " + string_at(v, "difficulty_tier"));
  }
  spec.world_bounds = aabb_from_json(v.at("world_bounds"));
  spec.start = vec3_from_json(v.at("start"));
  for (const auto& ob : v.at("obstacles").array()) spec.obstacles.push_back(obstacle_from_json(ob));

  const Value& goal = v.at("goal");
  spec.goal.anchor = vec3_from_json(goal.at("anchor"));
  if (const Value* m = goal.find("motion")) spec.goal.motion = motion_from_json(*m);

  spec.capture_radius_m = number_at(v, "capture_radius_m");
  spec.capture_hold_s = number_or(v, "capture_hold_s", 0.0);
  spec.reference_time_s = number_at(v, "reference_time_s");

  const Value& physics = v.at("physics");
  spec.physics.step_s = number_at(physics, "step_s");
  spec.physics.gravity_m_s2 = number_or(physics, "gravity_m_s2", spec.physics.gravity_m_s2);
  spec.physics.linear_drag = number_or(physics, "linear_drag", spec.physics.linear_drag);

  spec.horizon_s = number_at(v, "horizon_s");
  if (const Value* zones = v.find("no_fly_zones")) {
    for (const auto& z : zones->array()) spec.no_fly_zones.push_back(aabb_from_json(z));
  }

  // A stored id that disagrees with the content means the file was edited.
  if (const Value* id = v.find("challenge_id")) {
    const std::uint64_t stored = u64_from_json(*id, "challenge_id");
    if (stored != challenge_id(spec)) {
      throw std::runtime_error("challenge_id " + digest64_to_hex(stored) + " does not match content (" +
                               digest64_to_hex(challenge_id(spec)) + ")");
    }
  }
  return spec;
}

Value capability_to_json(const DroneCapability& cap) {
  Object o;
  o["model"] = cap.model;
  o["mass_kg"] = cap.mass_kg;
  o["max_thrust_n"] = cap.max_thrust_n;
  o["max_torque_nm"] = cap.max_torque_nm;
  o["battery_capacity_j"] = cap.battery_capacity_j;
  o["watts_per_newton"] = cap.watts_per_newton;
  o["watts_per_newton_metre"] = cap.watts_per_newton_metre;
  o["body_radius_m"] = cap.body_radius_m;
  return o;
}

DroneCapability capability_from_json(const Value& v) {
  DroneCapability cap;
  cap.model = string_at(v, "model");
  cap.mass_kg = number_at(v, "mass_kg");
  cap.max_thrust_n = number_at(v, "max_thrust_n");
  cap.max_torque_nm = number_at(v, "max_torque_nm");
  cap.battery_capacity_j = number_at(v, "battery_capacity_j");
  cap.watts_per_newton = number_at(v, "watts_per_newton");
  cap.watts_per_newton_metre = number_at(v, "watts_per_newton_metre");
  cap.body_radius_m = number_at(v, "body_radius_m");
  return cap;
}

Value flight_plan_to_json(const FlightPlan& plan) {
  Object o;
  o["challenge_id"] = u64_to_json(plan.challenge_id);
  o["declared_capability"] = capability_to_json(plan.declared_capability);

  Array seq;
  seq.reserve(plan.control_sequence.size());
  for (const auto& s : plan.control_sequence) {
    Object so;
    so["t_s"] = s.t_s;
    so["thrust_n"] = vec3_to_json(s.thrust_n);
    so["yaw_torque_nm"] = s.yaw_torque_nm;
    seq.push_back(std::move(so));
  }
  o["control_sequence"] = std::move(seq);
  return o;
}

FlightPlan flight_plan_from_json(const Value& v) {
  FlightPlan plan;
  plan.challenge_id = u64_from_json(v.at("challenge_id"), "challenge_id");
  plan.declared_capability = capability_from_json(v.at("declared_capability"));
  for (const auto& sv : v.at("control_sequence").array()) {
    ControlSample s;
    s.t_s = number_at(sv, "t_s");
    s.thrust_n = vec3_from_json(sv.at("thrust_n"));
    s.yaw_torque_nm = number_or(sv, "yaw_torque_nm", 0.0);
    plan.control_sequence.push_back(s);
  }
  return plan;
}

Value replay_result_to_json(const ReplayResult& r) {
  Object o;
  o["goal_reached"] = r.goal_reached;
  o["time_to_goal_s"] = optional_number(r.time_to_goal_s);
  o["energy_used_j"] = r.energy_used_j;
  o["collided"] = r.collided;
  o["out_of_bounds"] = r.out_of_bounds;
  o["termination_reason"] = std::string(termination_reason_label(r.termination_reason));
  o["horizon_s"] = r.horizon_s;
  o["reference_time_s"] = r.reference_time_s;
  o["battery_capacity_j"] = r.battery_capacity_j;
  o["elapsed_s"] = r.elapsed_s;
  o["steps"] = static_cast<double>(r.steps);
  o["clamped_samples"] = static_cast<double>(r.clamped_samples);
  o["min_goal_distance_m"] = r.min_goal_distance_m;
  o["final_position"] = vec3_to_json(r.final_position);
  o["final_heading_rad"] = r.final_heading_rad;
  if (!r.invalid_reason.empty()) o["invalid_reason"] = r.invalid_reason;
  return o;
}

ReplayResult replay_result_from_json(const Value& v) {
  ReplayResult r;
  r.goal_reached = v.at("goal_reached").bool_value(false);
  if (const Value* t = v.find("time_to_goal_s"); t && !t->is_null()) {
    if (!t->is_number()) throw std::runtime_error("time_to_goal_s must be a number or null");
    r.time_to_goal_s = t->number_value();
  }
  r.energy_used_j = number_at(v, "energy_used_j");
  r.collided = v.at("collided").bool_value(false);
  r.out_of_bounds = v.at("out_of_bounds").bool_value(false);
  if (!parse_termination_reason(string_at(v, "termination_reason"), r.termination_reason)) {
    throw std::runtime_error("unknown termination reason: " + string_at(v, "termination_reason"));
  }
  r.horizon_s = number_at(v, "horizon_s");
  r.reference_time_s = number_at(v, "reference_time_s");
  r.battery_capacity_j = number_at(v, "battery_capacity_j");
  r.elapsed_s = number_or(v, "elapsed_s", 0.0);
  r.steps = static_cast<std::int64_t>(number_or(v, "steps", 0.0));
  r.clamped_samples = static_cast<std::int64_t>(number_or(v, "clamped_samples", 0.0));
  r.min_goal_distance_m = number_or(v, "min_goal_distance_m", 0.0);
  if (const Value* p = v.find("final_position")) r.final_position = vec3_from_json(*p);
  r.final_heading_rad = number_or(v, "final_heading_rad", 0.0);
  if (const Value* s = v.find("invalid_reason")) r.invalid_reason = s->string_value();
  return r;
}

Value score_breakdown_to_json(const ScoreBreakdown& b) {
  Object o;
  o["total"] = b.total;
  o["speed"] = b.speed;
  o["efficiency"] = b.efficiency;
  return o;
}

Value trust_state_to_json(const TrustState& state) {
  Object participants;
  for (const auto& [id, e] : state.entries) {
    Object eo;
    eo["trust"] = e.value;
    eo["last_round"] = static_cast<double>(e.last_round);
    participants[id] = std::move(eo);
  }
  Object o;
  o["aerojudge_trust_version"] = static_cast<double>(kTrustFormatVersion);
  o["last_round"] = static_cast<double>(state.last_round);
  o["participants"] = std::move(participants);
  return o;
}

TrustState trust_state_from_json(const Value& v) {
  TrustState state;
  const Value* participants = v.find("participants");
  const bool bare = participants == nullptr;
  const Object& entries = bare ? v.object() : participants->object();

  std::int64_t max_round = -1;
  for (const auto& [id, ev] : entries) {
    if (id.empty()) throw std::runtime_error("trust entry with an empty participant id");
    TrustEntry e;
    e.value = number_at(ev, "trust");
    if (!std::isfinite(e.value) || e.value < RewardPolicy::kMinScore || e.value > RewardPolicy::kMaxScore) {
      throw std::runtime_error("trust value for '" + id + "' is outside the score range");
    }
    e.last_round = round_or(ev, "last_round", -1);
    max_round = std::max(max_round, e.last_round);
    state.entries[id] = e;
  }
  state.last_round = bare ? max_round : round_or(v, "last_round", max_round);
  if (state.last_round < max_round) {
    throw std::runtime_error("checkpoint last_round " + std::to_string(state.last_round) +
                             " is older than one of its entries");
  }
  return state;
}

Value trust_snapshot_to_json(const TrustSnapshot& snap) {
  Array entries;
  entries.reserve(snap.entries.size());
  for (const auto& e : snap.entries) {
    Object eo;
    eo["id"] = e.id;
    eo["trust"] = e.value;
    eo["last_round"] = static_cast<double>(e.last_round);
    entries.push_back(std::move(eo));
  }
  Object weights;
  for (const auto& [id, w] : snap.weights) weights[id] = w;

  Object o;
  o["round_index"] = static_cast<double>(snap.round_index);
  o["entries"] = std::move(entries);
  o["weights"] = std::move(weights);
  return o;
}

Value audit_record_to_json(const RoundReport& report, const ChallengeSpec& spec,
                           const std::map<std::string, FlightPlan>& plans) {
  Object participants;
  for (const auto& [id, out] : report.participants) {
    Object po;
    po["responded"] = out.responded;
    po["score"] = out.score;
    if (out.result) {
      po["result"] = replay_result_to_json(*out.result);
      po["breakdown"] = score_breakdown_to_json(score_breakdown(*out.result));
    }
    if (const auto it = plans.find(id); it != plans.end()) {
      po["plan"] = flight_plan_to_json(it->second);
      po["plan_digest"] = u64_to_json(out.plan_digest);
    }
    participants[id] = std::move(po);
  }

  Object o;
  o["round_index"] = static_cast<double>(report.round_index);
  o["seed"] = u64_to_json(report.seed);
  o["tier"] = std::string(difficulty_tier_label(report.tier));
  o["challenge_id"] = u64_to_json(report.challenge_id);
  o["status"] = std::string(round_status_label(report.status));
  o["challenge"] = challenge_to_json(spec);
  o["participants"] = std::move(participants);
  if (report.snapshot) o["snapshot"] = trust_snapshot_to_json(*report.snapshot);
  return o;
}

std::string serialize_challenge(const ChallengeSpec& spec) { return json::stringify(challenge_to_json(spec), 2); }

ChallengeSpec deserialize_challenge(const std::string& json_text) {
  return challenge_from_json(json::parse(json_text));
}

std::string serialize_flight_plan(const FlightPlan& plan) { return json::stringify(flight_plan_to_json(plan), 2); }

FlightPlan deserialize_flight_plan(const std::string& json_text) {
  return flight_plan_from_json(json::parse(json_text));
}

std::string serialize_replay_result(const ReplayResult& r) { return json::stringify(replay_result_to_json(r), 2); }

ReplayResult deserialize_replay_result(const std::string& json_text) {
  return replay_result_from_json(json::parse(json_text));
}

} // namespace aerojudge
