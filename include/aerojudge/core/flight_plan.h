#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "aerojudge/core/challenge.h"
#include "aerojudge/core/vec3.h"

namespace aerojudge {

// One timestamped control command.
//
// The command stays in effect until the next sample (zero-order hold).
struct ControlSample {
  double t_s{0.0};

  // Commanded thrust in the world frame (newtons).
  Vec3 thrust_n;

  // Commanded yaw torque (newton-metres).
  double yaw_torque_nm{0.0};
};

// Physical envelope of a drone model. A plan's declared capability must match
// an allow-listed profile exactly; it bounds what the replay will accept.
struct DroneCapability {
  std::string model;

  double mass_kg{1.0};
  double max_thrust_n{25.0};
  double max_torque_nm{0.5};
  double battery_capacity_j{40000.0};

  // Electrical power drawn per newton of thrust and per newton-metre of torque.
  double watts_per_newton{16.0};
  double watts_per_newton_metre{20.0};

  // Collision sphere around the drone centre.
  double body_radius_m{0.2};
};

bool capabilities_equal(const DroneCapability& a, const DroneCapability& b);

// Allow-list of drone models participants may declare.
class CapabilityRegistry {
 public:
  // Registry pre-populated with the standard competition airframes.
  static CapabilityRegistry defaults();

  // Replaces any existing profile with the same model name.
  void add(DroneCapability cap);

  const DroneCapability* find(const std::string& model) const;

  // True if `declared` names a registered model and matches it field for field.
  bool allows(const DroneCapability& declared) const;

  std::vector<std::string> models() const;
  bool empty() const { return profiles_.empty(); }

 private:
  std::map<std::string, DroneCapability> profiles_;
};

// A participant's answer to one challenge. Evidence only; the replay engine
// re-executes it and never trusts anything it claims.
struct FlightPlan {
  std::uint64_t challenge_id{0};
  std::vector<ControlSample> control_sequence;
  DroneCapability declared_capability;
};

// Size limits applied before any physics runs.
struct ReplayLimits {
  // Hard cap on control samples per plan.
  std::size_t max_samples{20000};

  // Samples may not be timestamped past horizon + this slack.
  double timestamp_slack_s{1.0};

  // Specs needing more physics steps than this are refused outright.
  std::int64_t max_steps{2000000};
};

// Stable digest of a plan's content, used for audit records.
std::uint64_t flight_plan_digest64(const FlightPlan& plan);

// Sanitation at the trust boundary. Returns the first problem found, or
// std::nullopt if the plan may be simulated.
//
// Checks: challenge id, capability allow-list, sample count, timestamps
// (finite, >= 0, non-decreasing, within the horizon) and finite commands.
std::optional<std::string> validate_flight_plan(const ChallengeSpec& spec, const FlightPlan& plan,
                                                const CapabilityRegistry& registry,
                                                const ReplayLimits& limits = {});

} // namespace aerojudge
