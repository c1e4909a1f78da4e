#include "aerojudge/core/flight_plan.h"

#include <cmath>
#include <utility>

#include "aerojudge/util/digest.h"

namespace aerojudge {

bool capabilities_equal(const DroneCapability& a, const DroneCapability& b) {
  return a.model == b.model && a.mass_kg == b.mass_kg && a.max_thrust_n == b.max_thrust_n &&
         a.max_torque_nm == b.max_torque_nm && a.battery_capacity_j == b.battery_capacity_j &&
         a.watts_per_newton == b.watts_per_newton && a.watts_per_newton_metre == b.watts_per_newton_metre &&
         a.body_radius_m == b.body_radius_m;
}

CapabilityRegistry CapabilityRegistry::defaults() {
  CapabilityRegistry r;

  DroneCapability quad;
  quad.model = "quad-standard";
  r.add(quad);

  DroneCapability racer;
  racer.model = "quad-racer";
  racer.mass_kg = 0.6;
  racer.max_thrust_n = 24.0;
  racer.max_torque_nm = 0.4;
  racer.battery_capacity_j = 22000.0;
  racer.watts_per_newton = 18.0;
  racer.body_radius_m = 0.15;
  r.add(racer);

  DroneCapability heavy;
  heavy.model = "hex-heavy";
  heavy.mass_kg = 2.5;
  heavy.max_thrust_n = 55.0;
  heavy.max_torque_nm = 1.2;
  heavy.battery_capacity_j = 110000.0;
  heavy.watts_per_newton = 15.0;
  heavy.watts_per_newton_metre = 25.0;
  heavy.body_radius_m = 0.35;
  r.add(heavy);

  return r;
}

void CapabilityRegistry::add(DroneCapability cap) {
  std::string key = cap.model;
  profiles_[std::move(key)] = std::move(cap);
}

const DroneCapability* CapabilityRegistry::find(const std::string& model) const {
  const auto it = profiles_.find(model);
  return it == profiles_.end() ? nullptr : &it->second;
}

bool CapabilityRegistry::allows(const DroneCapability& declared) const {
  const DroneCapability* known = find(declared.model);
  return known && capabilities_equal(*known, declared);
}

std::vector<std::string> CapabilityRegistry::models() const {
  std::vector<std::string> out;
  out.reserve(profiles_.size());
  for (const auto& kv : profiles_) out.push_back(kv.first);
  return out;
}

std::uint64_t flight_plan_digest64(const FlightPlan& plan) {
  Digest64 d;
  d.add_string("aerojudge.plan.v1");
  d.add_u64(plan.challenge_id);
  d.add_string(plan.declared_capability.model);
  d.add_double(plan.declared_capability.mass_kg);
  d.add_double(plan.declared_capability.max_thrust_n);
  d.add_double(plan.declared_capability.max_torque_nm);
  d.add_double(plan.declared_capability.battery_capacity_j);
  d.add_double(plan.declared_capability.watts_per_newton);
  d.add_double(plan.declared_capability.watts_per_newton_metre);
  d.add_double(plan.declared_capability.body_radius_m);
  d.add_size(plan.control_sequence.size());
  for (const auto& s : plan.control_sequence) {
    d.add_double(s.t_s);
    d.add_double(s.thrust_n.x);
    d.add_double(s.thrust_n.y);
    d.add_double(s.thrust_n.z);
    d.add_double(s.yaw_torque_nm);
  }
  return d.value();
}

std::optional<std::string> validate_flight_plan(const ChallengeSpec& spec, const FlightPlan& plan,
                                                const CapabilityRegistry& registry, const ReplayLimits& limits) {
  if (plan.challenge_id != challenge_id(spec)) return std::string("challenge_id does not match the challenge");
  if (!registry.allows(plan.declared_capability)) {
    return "declared capability '" + plan.declared_capability.model + "' is not an allow-listed profile";
  }
  if (plan.control_sequence.empty()) return std::string("control_sequence is empty");
  if (plan.control_sequence.size() > limits.max_samples) {
    return "control_sequence has " + std::to_string(plan.control_sequence.size()) + " samples (limit " +
           std::to_string(limits.max_samples) + ")";
  }

  const double latest = spec.horizon_s + limits.timestamp_slack_s;
  double prev_t = 0.0;
  for (std::size_t i = 0; i < plan.control_sequence.size(); ++i) {
    const ControlSample& s = plan.control_sequence[i];
    if (!std::isfinite(s.t_s) || !s.thrust_n.is_finite() || !std::isfinite(s.yaw_torque_nm)) {
      return "sample " + std::to_string(i) + " contains a non-finite value";
    }
    if (s.t_s < 0.0) return "sample " + std::to_string(i) + " has a negative timestamp";
    if (s.t_s < prev_t) return "sample " + std::to_string(i) + " goes back in time";
    if (s.t_s > latest) return "sample " + std::to_string(i) + " is timestamped past the horizon";
    prev_t = s.t_s;
  }
  return std::nullopt;
}

} // namespace aerojudge
