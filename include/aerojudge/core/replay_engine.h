#pragma once

#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "aerojudge/core/challenge.h"
#include "aerojudge/core/flight_plan.h"
#include "aerojudge/core/replay_result.h"

namespace aerojudge {

struct ReplayConfig {
  ReplayLimits limits;

  // Drone models plans may declare.
  CapabilityRegistry registry{CapabilityRegistry::defaults()};

  // Starts one replay_batch() worker. Empty = std::thread. A spawner that
  // throws just leaves fewer workers; the caller's thread drains the rest.
  std::function<std::thread(std::function<void()>)> spawn_worker;
};

// Deterministic point-mass re-execution of flight plans.
//
// The engine is the trust boundary: control samples are untrusted numbers
// that are sanitised, clamped to the declared envelope and fed into a
// simulation the engine owns. replay() never throws for bad input; malformed
// plans come back as TerminationReason::InvalidInput.
//
// Per step (dt = physics.step_s):
//   - zero-order hold: the command in effect is the last sample with
//     t_s <= k * dt (zero before the first sample)
//   - clamp |thrust| to max_thrust_n and |torque| to max_torque_nm
//   - a = thrust / m + g - drag * v / m, semi-implicit Euler
//   - energy += (|thrust| * W/N + |torque| * W/Nm) * dt
//   - first match wins: collision, battery, goal capture, horizon
class ReplayEngine {
 public:
  ReplayEngine() = default;
  explicit ReplayEngine(ReplayConfig cfg) : cfg_(std::move(cfg)) {}

  ReplayResult replay(const ChallengeSpec& spec, const FlightPlan& plan) const;

  // Replays every plan against the same spec on up to `workers` threads
  // (0 = hardware concurrency), the calling thread included. Results are
  // returned in input order. An exception escaping one replay only turns that
  // plan's result into InvalidInput. Workers are always joined before return.
  std::vector<ReplayResult> replay_batch(const ChallengeSpec& spec, const std::vector<FlightPlan>& plans,
                                         int workers = 0) const;

  const ReplayConfig& config() const { return cfg_; }

 private:
  ReplayConfig cfg_;
};

// Worst-case result for a plan that was never simulated: no goal, no time,
// energy at full battery capacity.
ReplayResult make_invalid_result(const ChallengeSpec& spec, const DroneCapability& declared,
                                 const CapabilityRegistry& registry, std::string reason);

// Number of threads replay_batch() would use for `jobs` plans.
int resolve_worker_count(int requested, std::size_t jobs);

} // namespace aerojudge
