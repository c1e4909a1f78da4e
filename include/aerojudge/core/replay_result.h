#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "aerojudge/core/vec3.h"

namespace aerojudge {

enum class TerminationReason : std::uint8_t {
  Goal = 0,
  Timeout = 1,
  Collision = 2,
  BatteryDepleted = 3,
  InvalidInput = 4,
};

// "goal", "timeout", "collision", "battery_depleted", "invalid_input".
const char* termination_reason_label(TerminationReason r);
bool parse_termination_reason(const std::string& text, TerminationReason& out);

// Objective outcome of replaying one flight plan. Immutable once produced.
//
// Carries the few spec/capability values the reward needs so a result can be
// scored (and audited) on its own.
struct ReplayResult {
  bool goal_reached{false};

  // Empty => the goal was never captured.
  std::optional<double> time_to_goal_s;

  double energy_used_j{0.0};
  bool collided{false};
  bool out_of_bounds{false};
  TerminationReason termination_reason{TerminationReason::InvalidInput};

  // Scoring context.
  double horizon_s{0.0};
  double reference_time_s{0.0};
  double battery_capacity_j{0.0};

  // Diagnostics.
  double elapsed_s{0.0};
  std::int64_t steps{0};
  std::int64_t clamped_samples{0};
  double min_goal_distance_m{0.0};
  Vec3 final_position;
  double final_heading_rad{0.0};
  std::string invalid_reason;
};

} // namespace aerojudge
