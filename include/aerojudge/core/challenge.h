#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "aerojudge/core/motion.h"
#include "aerojudge/core/vec3.h"

namespace aerojudge {

// Ordered difficulty levels. Higher tiers widen every generation range.
enum class DifficultyTier : std::uint8_t {
  Novice = 0,
  Intermediate = 1,
  Advanced = 2,
  Expert = 3,
};

constexpr int kNumDifficultyTiers = 4;

const char* difficulty_tier_label(DifficultyTier t);
bool parse_difficulty_tier(const std::string& text, DifficultyTier& out);

// Accepts 0..3; returns false otherwise.
bool difficulty_tier_from_int(int v, DifficultyTier& out);

// Axis-aligned box.
struct Aabb {
  Vec3 min;
  Vec3 max;

  bool contains(const Vec3& p) const {
    return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y && p.z >= min.z && p.z <= max.z;
  }

  Vec3 center() const { return (min + max) * 0.5; }

  // Shrinks every face inward by `margin` (may produce an empty box).
  Aabb shrunk(double margin) const {
    return {{min.x + margin, min.y + margin, min.z + margin}, {max.x - margin, max.y - margin, max.z - margin}};
  }

  // Signed distance to the surface; negative inside.
  double signed_distance(const Vec3& p) const;
};

enum class ObstacleShape : std::uint8_t {
  Box = 0,
  Sphere = 1,
  // Vertical cylinder standing on its base centre.
  Cylinder = 2,
};

const char* obstacle_shape_label(ObstacleShape s);
bool parse_obstacle_shape(const std::string& text, ObstacleShape& out);

struct Obstacle {
  ObstacleShape shape{ObstacleShape::Box};

  // Box/Sphere: centre. Cylinder: centre of the base disc.
  Vec3 anchor;

  // Box only.
  Vec3 half_extents{1.0, 1.0, 1.0};

  // Sphere and Cylinder.
  double radius_m{1.0};

  // Cylinder only.
  double height_m{1.0};

  MotionLaw motion{StaticMotion{}};

  // Signed distance from p to the obstacle surface at elapsed time t_s.
  double signed_distance(const Vec3& p, double t_s) const;

  // Radius of a sphere around the anchor that encloses the static shape.
  double bounding_radius() const;
};

struct Goal {
  Vec3 anchor;
  MotionLaw motion{StaticMotion{}};

  Vec3 position_at(double t_s) const { return aerojudge::position_at(anchor, motion, t_s); }
};

struct PhysicsParams {
  // Fixed integration step. 50 Hz.
  double step_s{0.02};

  // Applied along -z.
  double gravity_m_s2{9.81};

  // Linear drag coefficient (N per m/s).
  double linear_drag{0.1};
};

// The immutable description of one round's environment.
//
// Two generators given the same (seed, tier) produce bit-identical values.
// Challenge ids are derived from the content (see challenge_id()), so every
// validator agrees on them without coordination.
struct ChallengeSpec {
  std::uint64_t seed{0};
  DifficultyTier difficulty_tier{DifficultyTier::Novice};

  Aabb world_bounds;
  Vec3 start;

  std::vector<Obstacle> obstacles;
  Goal goal;

  // A drone within this distance of the goal's current position is inside
  // the capture zone.
  double capture_radius_m{2.0};

  // Seconds the drone must stay inside the capture zone. 0 = instant.
  double capture_hold_s{0.0};

  // Best-possible flight time for this layout; the reward speed term
  // saturates here.
  double reference_time_s{10.0};

  PhysicsParams physics;
  double horizon_s{120.0};

  std::vector<Aabb> no_fly_zones;
};

// Stable FNV-1a digest over every field of the spec.
std::uint64_t challenge_id(const ChallengeSpec& spec);

// Field-wise exact comparison (doubles compared bitwise-equal by value).
bool challenges_equal(const ChallengeSpec& a, const ChallengeSpec& b);

// Number of physics steps needed to cover the horizon.
std::int64_t horizon_steps(const ChallengeSpec& spec);

// Structural sanity checks for specs that arrive from outside the generator
// (audit files, hand-written scenarios). Empty => valid.
std::vector<std::string> validate_challenge(const ChallengeSpec& spec);

} // namespace aerojudge
