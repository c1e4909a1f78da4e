#include "aerojudge/core/map_generator.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "aerojudge/util/hash_rng.h"

namespace aerojudge {
namespace {

constexpr double kTwoPi = 6.283185307179586;

// Approach probes around the goal: 8 compass points plus straight up/down.
constexpr int kApproachProbes = 10;
constexpr double kProbeExtraDistanceM = 2.0;

std::array<TierProfile, kNumDifficultyTiers> make_builtin_profiles() {
  std::array<TierProfile, kNumDifficultyTiers> t;

  TierProfile& novice = t[0];
  novice.min_obstacles = 6;
  novice.max_obstacles = 12;
  novice.world_half_extent_m = 60.0;
  novice.world_height_m = 40.0;
  novice.min_goal_distance_m = 20.0;
  novice.max_goal_distance_m = 50.0;
  novice.min_goal_elevation_m = 2.0;
  novice.max_goal_elevation_m = 6.0;
  novice.horizon_s = 120.0;
  novice.capture_radius_m = 2.0;
  novice.capture_hold_s = 0.0;
  novice.nominal_speed_m_s = 2.0;
  novice.reference_speed_m_s = 6.0;
  novice.min_obstacle_size_m = 0.5;
  novice.max_obstacle_size_m = 2.5;

  TierProfile& inter = t[1];
  inter = novice;
  inter.min_obstacles = 12;
  inter.max_obstacles = 24;
  inter.world_half_extent_m = 75.0;
  inter.min_goal_distance_m = 30.0;
  inter.max_goal_distance_m = 60.0;
  inter.max_goal_elevation_m = 12.0;
  inter.capture_radius_m = 1.5;
  inter.capture_hold_s = 0.5;
  inter.reference_speed_m_s = 7.0;
  inter.max_obstacle_size_m = 3.0;
  inter.goal_linear = true;
  inter.max_goal_speed_m_s = 0.5;
  inter.min_no_fly_zones = 0;
  inter.max_no_fly_zones = 1;

  TierProfile& adv = t[2];
  adv = inter;
  adv.min_obstacles = 24;
  adv.max_obstacles = 48;
  adv.world_half_extent_m = 85.0;
  adv.world_height_m = 50.0;
  adv.min_goal_distance_m = 40.0;
  adv.max_goal_distance_m = 70.0;
  adv.max_goal_elevation_m = 18.0;
  adv.horizon_s = 150.0;
  adv.capture_radius_m = 1.25;
  adv.capture_hold_s = 1.0;
  adv.nominal_speed_m_s = 1.5;
  adv.reference_speed_m_s = 8.0;
  adv.max_obstacle_size_m = 3.5;
  adv.goal_circular = true;
  adv.max_goal_speed_m_s = 0.6;
  adv.obstacle_linear = true;
  adv.moving_obstacle_fraction = 0.25;
  adv.max_obstacle_speed_m_s = 0.8;
  adv.min_no_fly_zones = 1;
  adv.max_no_fly_zones = 2;

  TierProfile& expert = t[3];
  expert = adv;
  expert.min_obstacles = 40;
  expert.max_obstacles = 72;
  expert.world_half_extent_m = 95.0;
  expert.world_height_m = 60.0;
  expert.min_goal_distance_m = 50.0;
  expert.max_goal_distance_m = 80.0;
  expert.max_goal_elevation_m = 24.0;
  expert.horizon_s = 180.0;
  expert.capture_radius_m = 1.0;
  expert.nominal_speed_m_s = 1.25;
  expert.reference_speed_m_s = 9.0;
  expert.max_obstacle_size_m = 4.0;
  expert.goal_may_be_static = false;
  expert.max_goal_speed_m_s = 0.8;
  expert.obstacle_circular = true;
  expert.moving_obstacle_fraction = 0.4;
  expert.max_obstacle_speed_m_s = 1.0;
  expert.min_no_fly_zones = 2;
  expert.max_no_fly_zones = 3;

  return t;
}

const std::array<TierProfile, kNumDifficultyTiers>& builtin_profiles() {
  static const std::array<TierProfile, kNumDifficultyTiers> kProfiles = make_builtin_profiles();
  return kProfiles;
}

std::vector<double> sample_times(double horizon_s) {
  std::vector<double> out;
  out.reserve(kTrajectorySamples + 1);
  for (int k = 0; k <= kTrajectorySamples; ++k) {
    out.push_back(horizon_s * static_cast<double>(k) / static_cast<double>(kTrajectorySamples));
  }
  return out;
}

Vec3 horizontal_dir(double angle) { return {std::cos(angle), std::sin(angle), 0.0}; }

MotionLaw sample_motion(util::HashRng& rng, bool allow_static, bool allow_linear, bool allow_circular,
                        double max_speed, double min_half_period, double max_half_period) {
  std::vector<MotionKind> kinds;
  if (allow_static) kinds.push_back(MotionKind::Static);
  if (allow_linear) kinds.push_back(MotionKind::Linear);
  if (allow_circular) kinds.push_back(MotionKind::Circular);
  if (kinds.empty() || max_speed <= 0.0) return StaticMotion{};

  const MotionKind kind = kinds[rng.index(kinds.size())];
  if (kind == MotionKind::Linear) {
    LinearMotion m;
    const double speed = rng.range(0.2 * max_speed, max_speed);
    m.velocity_m_s = horizontal_dir(rng.range(0.0, kTwoPi)) * speed;
    m.half_period_s = rng.range(min_half_period, max_half_period);
    return m;
  }
  if (kind == MotionKind::Circular) {
    CircularMotion m;
    m.radius_m = rng.range(1.0, 3.0);
    m.angular_speed_rad_s = rng.range(0.2 * max_speed, max_speed) / m.radius_m;
    if (rng.chance(0.5)) m.angular_speed_rad_s = -m.angular_speed_rad_s;
    m.phase_rad = rng.range(0.0, kTwoPi);
    return m;
  }
  return StaticMotion{};
}

Obstacle sample_obstacle(util::HashRng& rng, const TierProfile& p) {
  Obstacle o;
  o.shape = static_cast<ObstacleShape>(rng.index(3));
  const double span = p.world_half_extent_m * 0.95;
  const double x = rng.range(-span, span);
  const double y = rng.range(-span, span);
  const double s = rng.range(p.min_obstacle_size_m, p.max_obstacle_size_m);

  switch (o.shape) {
    case ObstacleShape::Box: {
      const double hy = rng.range(p.min_obstacle_size_m, p.max_obstacle_size_m);
      const double hz = rng.range(1.0, p.world_height_m * 0.35);
      o.half_extents = {s, hy, hz};
      o.anchor = {x, y, hz};
      break;
    }
    case ObstacleShape::Sphere: {
      o.radius_m = s;
      o.anchor = {x, y, rng.range(s, p.world_height_m * 0.6)};
      break;
    }
    case ObstacleShape::Cylinder: {
      o.radius_m = s * 0.75;
      o.height_m = rng.range(3.0, p.world_height_m * 0.7);
      o.anchor = {x, y, 0.0};
      break;
    }
  }

  const bool may_move = (p.obstacle_linear || p.obstacle_circular) && rng.chance(p.moving_obstacle_fraction);
  if (may_move) {
    o.motion = sample_motion(rng, false, p.obstacle_linear, p.obstacle_circular, p.max_obstacle_speed_m_s, 3.0, 8.0);
  }
  return o;
}

Aabb sample_no_fly_zone(util::HashRng& rng, const TierProfile& p) {
  const double span = p.world_half_extent_m * 0.8;
  const Vec3 c{rng.range(-span, span), rng.range(-span, span), 0.0};
  const double hx = rng.range(3.0, 8.0);
  const double hy = rng.range(3.0, 8.0);
  return {{c.x - hx, c.y - hy, 0.0}, {c.x + hx, c.y + hy, p.world_height_m}};
}

// Obstacle keeps clear of the goal trajectory and the start at every sampled instant.
bool obstacle_clear(const Obstacle& o, const ChallengeSpec& spec, const std::vector<double>& times) {
  const double goal_clear = spec.capture_radius_m + kGoalClearanceM;
  for (const double t : times) {
    if (o.signed_distance(spec.goal.position_at(t), t) < goal_clear) return false;
    if (o.signed_distance(spec.start, t) < kStartClearanceM) return false;
  }
  return true;
}

bool zone_clear(const Aabb& z, const ChallengeSpec& spec, const std::vector<double>& times) {
  const double goal_clear = spec.capture_radius_m + kGoalClearanceM;
  if (z.signed_distance(spec.start) < kStartClearanceM) return false;
  for (const double t : times) {
    if (z.signed_distance(spec.goal.position_at(t)) < goal_clear) return false;
  }
  return true;
}

bool point_free(const ChallengeSpec& spec, const Vec3& p, double t) {
  if (!spec.world_bounds.contains(p)) return false;
  for (const auto& o : spec.obstacles) {
    if (o.signed_distance(p, t) < 0.0) return false;
  }
  for (const auto& z : spec.no_fly_zones) {
    if (z.signed_distance(p) < 0.0) return false;
  }
  return true;
}

int free_approach_probes(const ChallengeSpec& spec, double t) {
  const Vec3 g = spec.goal.position_at(t);
  const double r = spec.capture_radius_m + kGoalClearanceM + kProbeExtraDistanceM;
  int free = 0;
  for (int k = 0; k < 8; ++k) {
    const double a = kTwoPi * static_cast<double>(k) / 8.0;
    if (point_free(spec, g + horizontal_dir(a) * r, t)) ++free;
  }
  if (point_free(spec, g + Vec3{0.0, 0.0, r}, t)) ++free;
  if (point_free(spec, g - Vec3{0.0, 0.0, r}, t)) ++free;
  return free;
}

// One layout attempt. Returns false if any placement budget runs out or the
// finished layout fails the solvability checks.
bool try_layout(ChallengeSpec& spec, const TierProfile& p, util::HashRng& rng, int placement_attempts) {
  const double half = p.world_half_extent_m;
  spec.world_bounds = {{-half, -half, 0.0}, {half, half, p.world_height_m}};
  spec.start = {rng.range(-p.start_jitter_m, p.start_jitter_m), rng.range(-p.start_jitter_m, p.start_jitter_m),
                p.start_altitude_m};
  spec.capture_radius_m = p.capture_radius_m;
  spec.capture_hold_s = p.capture_hold_s;
  spec.horizon_s = p.horizon_s;
  spec.physics = PhysicsParams{};

  const double bearing = rng.range(0.0, kTwoPi);
  const double dist = rng.range(p.min_goal_distance_m, p.max_goal_distance_m);
  const Vec3 flat = spec.start + horizontal_dir(bearing) * dist;
  spec.goal.anchor = {flat.x, flat.y, rng.range(p.min_goal_elevation_m, p.max_goal_elevation_m)};
  spec.goal.motion = sample_motion(rng, p.goal_may_be_static, p.goal_linear, p.goal_circular, p.max_goal_speed_m_s,
                                   4.0, 10.0);
  spec.reference_time_s = distance(spec.start, spec.goal.anchor) / p.reference_speed_m_s;

  const std::vector<double> times = sample_times(spec.horizon_s);

  // Goal trajectory alone must be acceptable before anything is placed around it.
  const Aabb inner = spec.world_bounds.shrunk(spec.capture_radius_m);
  for (const double t : times) {
    const Vec3 g = spec.goal.position_at(t);
    if (!inner.contains(g) || distance(spec.start, g) > p.reach_cap_m()) return false;
  }

  const int zones = rng.range_int(p.min_no_fly_zones, p.max_no_fly_zones);
  for (int i = 0; i < zones; ++i) {
    bool placed = false;
    for (int k = 0; k < placement_attempts && !placed; ++k) {
      const Aabb z = sample_no_fly_zone(rng, p);
      if (zone_clear(z, spec, times)) {
        spec.no_fly_zones.push_back(z);
        placed = true;
      }
    }
    if (!placed) return false;
  }

  const int count = rng.range_int(p.min_obstacles, p.max_obstacles);
  spec.obstacles.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    bool placed = false;
    for (int k = 0; k < placement_attempts && !placed; ++k) {
      Obstacle o = sample_obstacle(rng, p);
      if (obstacle_clear(o, spec, times)) {
        spec.obstacles.push_back(std::move(o));
        placed = true;
      }
    }
    if (!placed) return false;
  }

  return check_solvability(spec, p).empty();
}

} // namespace

const TierProfile& tier_profile(DifficultyTier tier) {
  return builtin_profiles()[static_cast<std::size_t>(tier)];
}

GeneratorOptions::GeneratorOptions() : profiles(builtin_profiles()) {}

ChallengeSpec MapGenerator::generate(std::uint64_t seed, DifficultyTier tier) const {
  const TierProfile& p = options_.profiles[static_cast<std::size_t>(tier)];
  const std::uint64_t base = util::derive_seed(seed, static_cast<std::uint64_t>(tier) + 1u);

  for (int attempt = 0; attempt < options_.max_layout_attempts; ++attempt) {
    util::HashRng rng(util::derive_seed(base, static_cast<std::uint64_t>(attempt)));
    ChallengeSpec spec;
    spec.seed = seed;
    spec.difficulty_tier = tier;
    if (try_layout(spec, p, rng, options_.max_obstacle_placement_attempts)) return spec;
  }

  throw GenerationError("map generator exhausted " + std::to_string(options_.max_layout_attempts) +
                        " layout attempts for seed " + std::to_string(seed) + " tier " +
                        difficulty_tier_label(tier));
}

ChallengeSpec generate_challenge(std::uint64_t seed, DifficultyTier tier) {
  static const MapGenerator kGenerator;
  return kGenerator.generate(seed, tier);
}

std::vector<std::string> check_solvability(const ChallengeSpec& spec, const TierProfile& profile) {
  std::vector<std::string> errors;
  const std::vector<double> times = sample_times(spec.horizon_s);
  const Aabb inner = spec.world_bounds.shrunk(spec.capture_radius_m);
  const double goal_clear = spec.capture_radius_m + kGoalClearanceM;

  if (!spec.world_bounds.shrunk(1.0).contains(spec.start)) errors.push_back("start is too close to the world edge");
  for (const auto& z : spec.no_fly_zones) {
    if (z.signed_distance(spec.start) < kStartClearanceM) {
      errors.push_back("start is inside or too close to a no-fly zone");
      break;
    }
  }

  for (const double t : times) {
    const Vec3 g = spec.goal.position_at(t);
    if (!inner.contains(g)) {
      errors.push_back("goal leaves the world bounds at t=" + std::to_string(t));
      break;
    }
    if (distance(spec.start, g) > profile.reach_cap_m()) {
      errors.push_back("goal exceeds the reachability cap at t=" + std::to_string(t));
      break;
    }
  }

  for (std::size_t i = 0; i < spec.obstacles.size(); ++i) {
    if (!obstacle_clear(spec.obstacles[i], spec, times)) {
      errors.push_back("obstacle " + std::to_string(i) + " crowds the goal or the start");
    }
  }
  for (std::size_t i = 0; i < spec.no_fly_zones.size(); ++i) {
    for (const double t : times) {
      if (spec.no_fly_zones[i].signed_distance(spec.goal.position_at(t)) < goal_clear) {
        errors.push_back("no-fly zone " + std::to_string(i) + " crowds the goal");
        break;
      }
    }
  }

  for (const double t : times) {
    if (free_approach_probes(spec, t) * 2 < kApproachProbes) {
      errors.push_back("goal is enclosed at t=" + std::to_string(t));
      break;
    }
  }
  return errors;
}

} // namespace aerojudge
