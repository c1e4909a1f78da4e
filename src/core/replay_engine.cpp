#include "aerojudge/core/replay_engine.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <string>
#include <system_error>
#include <thread>

#include "aerojudge/util/log.h"

namespace aerojudge {
namespace {

// Clamped command actually fed to the simulation.
struct Command {
  Vec3 thrust_n;
  double yaw_torque_nm{0.0};
  bool clamped{false};
};

Command clamp_command(const ControlSample& s, const DroneCapability& cap) {
  Command c;
  c.thrust_n = s.thrust_n;
  c.yaw_torque_nm = s.yaw_torque_nm;

  const double mag = c.thrust_n.length();
  if (mag > cap.max_thrust_n) {
    c.thrust_n = c.thrust_n * (cap.max_thrust_n / mag);
    c.clamped = true;
  }
  if (std::fabs(c.yaw_torque_nm) > cap.max_torque_nm) {
    c.yaw_torque_nm = std::copysign(cap.max_torque_nm, c.yaw_torque_nm);
    c.clamped = true;
  }
  return c;
}

bool in_collision(const ChallengeSpec& spec, const Vec3& p, double body_radius, double t_s) {
  for (const auto& o : spec.obstacles) {
    if (o.signed_distance(p, t_s) < body_radius) return true;
  }
  for (const auto& z : spec.no_fly_zones) {
    if (z.signed_distance(p) < body_radius) return true;
  }
  return false;
}

double battery_capacity_for(const DroneCapability& declared, const CapabilityRegistry& registry) {
  if (const DroneCapability* known = registry.find(declared.model)) return known->battery_capacity_j;
  if (std::isfinite(declared.battery_capacity_j) && declared.battery_capacity_j > 0.0) {
    return declared.battery_capacity_j;
  }
  return 0.0;
}

} // namespace

ReplayResult make_invalid_result(const ChallengeSpec& spec, const DroneCapability& declared,
                                 const CapabilityRegistry& registry, std::string reason) {
  ReplayResult r;
  r.termination_reason = TerminationReason::InvalidInput;
  r.horizon_s = spec.horizon_s;
  r.reference_time_s = spec.reference_time_s;
  r.battery_capacity_j = battery_capacity_for(declared, registry);
  r.energy_used_j = r.battery_capacity_j;
  r.final_position = spec.start;
  const Vec3 goal0 = spec.goal.position_at(0.0);
  r.min_goal_distance_m = goal0.is_finite() && spec.start.is_finite() ? distance(spec.start, goal0) : 0.0;
  r.invalid_reason = std::move(reason);
  return r;
}

ReplayResult ReplayEngine::replay(const ChallengeSpec& spec, const FlightPlan& plan) const {
  const std::vector<std::string> spec_errors = validate_challenge(spec);
  if (!spec_errors.empty()) {
    return make_invalid_result(spec, plan.declared_capability, cfg_.registry,
                               "challenge rejected: " + spec_errors.front());
  }
  const std::int64_t total_steps = horizon_steps(spec);
  if (total_steps > cfg_.limits.max_steps) {
    return make_invalid_result(spec, plan.declared_capability, cfg_.registry,
                               "challenge needs " + std::to_string(total_steps) + " steps (limit " +
                                   std::to_string(cfg_.limits.max_steps) + ")");
  }
  if (auto err = validate_flight_plan(spec, plan, cfg_.registry, cfg_.limits)) {
    return make_invalid_result(spec, plan.declared_capability, cfg_.registry, std::move(*err));
  }

  // From here on the capability is known to equal an allow-listed profile.
  const DroneCapability& cap = plan.declared_capability;
  const auto& seq = plan.control_sequence;
  const double dt = spec.physics.step_s;
  const Vec3 gravity{0.0, 0.0, -spec.physics.gravity_m_s2};
  const double drag_per_mass = spec.physics.linear_drag / cap.mass_kg;
  const double yaw_inertia = std::max(cap.mass_kg * cap.body_radius_m * cap.body_radius_m, 1e-6);

  ReplayResult r;
  r.horizon_s = spec.horizon_s;
  r.reference_time_s = spec.reference_time_s;
  r.battery_capacity_j = cap.battery_capacity_j;
  r.termination_reason = TerminationReason::Timeout;

  Vec3 pos = spec.start;
  Vec3 vel;
  double heading = 0.0;
  double yaw_rate = 0.0;
  double energy = 0.0;
  double inside_since = -1.0;
  r.min_goal_distance_m = distance(pos, spec.goal.position_at(0.0));

  Command cmd;
  std::size_t next_sample = 0;

  for (std::int64_t k = 0; k < total_steps; ++k) {
    const double t_cmd = static_cast<double>(k) * dt;
    bool advanced = false;
    while (next_sample < seq.size() && seq[next_sample].t_s <= t_cmd) {
      ++next_sample;
      advanced = true;
    }
    if (advanced) cmd = clamp_command(seq[next_sample - 1], cap);
    if (cmd.clamped) ++r.clamped_samples;

    const Vec3 accel = cmd.thrust_n / cap.mass_kg + gravity - vel * drag_per_mass;
    vel += accel * dt;
    pos += vel * dt;
    yaw_rate += (cmd.yaw_torque_nm / yaw_inertia) * dt;
    heading = std::remainder(heading + yaw_rate * dt, 2.0 * 3.14159265358979323846);

    const double power =
        cmd.thrust_n.length() * cap.watts_per_newton + std::fabs(cmd.yaw_torque_nm) * cap.watts_per_newton_metre;
    energy += power * dt;

    const double elapsed = static_cast<double>(k + 1) * dt;
    r.steps = k + 1;
    r.elapsed_s = elapsed;

    const double goal_dist = distance(pos, spec.goal.position_at(elapsed));
    r.min_goal_distance_m = std::min(r.min_goal_distance_m, goal_dist);

    if (!spec.world_bounds.contains(pos)) {
      r.out_of_bounds = true;
      r.collided = true;
      r.termination_reason = TerminationReason::Collision;
      break;
    }
    if (in_collision(spec, pos, cap.body_radius_m, elapsed)) {
      r.collided = true;
      r.termination_reason = TerminationReason::Collision;
      break;
    }
    if (energy > cap.battery_capacity_j) {
      r.termination_reason = TerminationReason::BatteryDepleted;
      break;
    }
    if (goal_dist <= spec.capture_radius_m) {
      if (inside_since < 0.0) inside_since = elapsed;
      if (elapsed - inside_since >= spec.capture_hold_s - 1e-9) {
        r.goal_reached = true;
        r.time_to_goal_s = elapsed;
        r.termination_reason = TerminationReason::Goal;
        break;
      }
    } else {
      inside_since = -1.0;
    }
  }

  r.energy_used_j = energy;
  r.final_position = pos;
  r.final_heading_rad = heading;
  return r;
}

int resolve_worker_count(int requested, std::size_t jobs) {
  int n = requested;
  if (n <= 0) n = static_cast<int>(std::thread::hardware_concurrency());
  if (n <= 0) n = 1;
  if (jobs < static_cast<std::size_t>(n)) n = static_cast<int>(std::max<std::size_t>(jobs, 1));
  return n;
}

std::vector<ReplayResult> ReplayEngine::replay_batch(const ChallengeSpec& spec, const std::vector<FlightPlan>& plans,
                                                     int workers) const {
  std::vector<ReplayResult> results(plans.size());
  if (plans.empty()) return results;

  std::atomic<std::size_t> next{0};
  auto work = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= plans.size()) return;
      try {
        results[i] = replay(spec, plans[i]);
      } catch (const std::exception& e) {
        log::warn(std::string("Replay of plan ") + std::to_string(i) + " failed: " + e.what());
        results[i] = make_invalid_result(spec, plans[i].declared_capability, cfg_.registry,
                                         std::string("replay failed: ") + e.what());
      }
    }
  };

  const int n = resolve_worker_count(workers, plans.size());
  if (n == 1) {
    work();
    return results;
  }

  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(n - 1));
  struct JoinOnExit {
    std::vector<std::thread>& threads;
    ~JoinOnExit() {
      for (auto& th : threads) {
        if (th.joinable()) th.join();
      }
    }
  } join_on_exit{pool};

  for (int t = 1; t < n; ++t) {
    try {
      if (cfg_.spawn_worker) {
        pool.push_back(cfg_.spawn_worker(work));
      } else {
        pool.emplace_back(work);
      }
    } catch (const std::system_error& e) {
      log::warn("Replay worker " + std::to_string(t) + " of " + std::to_string(n) + " not started: " + e.what());
      break;
    }
  }
  work();
  // Workers may still be writing their last slot.
  for (auto& th : pool) th.join();
  return results;
}

} // namespace aerojudge
