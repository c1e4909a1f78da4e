#include "aerojudge/core/challenge.h"

#include <algorithm>
#include <cmath>

#include "aerojudge/util/digest.h"
#include "aerojudge/util/strings.h"

namespace aerojudge {
namespace {

// Signed distance to a box of half extents h centred at the origin.
double box_sdf(const Vec3& q, const Vec3& h) {
  const Vec3 d{std::fabs(q.x) - h.x, std::fabs(q.y) - h.y, std::fabs(q.z) - h.z};
  const Vec3 outside{std::max(d.x, 0.0), std::max(d.y, 0.0), std::max(d.z, 0.0)};
  const double inside = std::min(std::max(d.x, std::max(d.y, d.z)), 0.0);
  return outside.length() + inside;
}

void hash_vec3(Digest64& d, const Vec3& v) {
  d.add_double(v.x);
  d.add_double(v.y);
  d.add_double(v.z);
}

void hash_aabb(Digest64& d, const Aabb& b) {
  hash_vec3(d, b.min);
  hash_vec3(d, b.max);
}

void hash_motion(Digest64& d, const MotionLaw& law) {
  d.add_enum(motion_kind(law));
  if (const auto* l = std::get_if<LinearMotion>(&law)) {
    hash_vec3(d, l->velocity_m_s);
    d.add_double(l->half_period_s);
  } else if (const auto* c = std::get_if<CircularMotion>(&law)) {
    d.add_double(c->radius_m);
    d.add_double(c->angular_speed_rad_s);
    d.add_double(c->phase_rad);
  }
}

bool aabb_equal(const Aabb& a, const Aabb& b) { return a.min == b.min && a.max == b.max; }

bool obstacle_equal(const Obstacle& a, const Obstacle& b) {
  return a.shape == b.shape && a.anchor == b.anchor && a.half_extents == b.half_extents &&
         a.radius_m == b.radius_m && a.height_m == b.height_m && motion_equal(a.motion, b.motion);
}

bool finite_positive(double v) { return std::isfinite(v) && v > 0.0; }

} // namespace

const char* difficulty_tier_label(DifficultyTier t) {
  switch (t) {
    case DifficultyTier::Novice: return "novice";
    case DifficultyTier::Intermediate: return "intermediate";
    case DifficultyTier::Advanced: return "advanced";
    case DifficultyTier::Expert: return "expert";
  }
  return "novice";
}

bool parse_difficulty_tier(const std::string& text, DifficultyTier& out) {
  const std::string s = to_lower(text);
  if (s.size() == 1 && s[0] >= '0' && s[0] <= '9') return difficulty_tier_from_int(s[0] - '0', out);
  for (int i = 0; i < kNumDifficultyTiers; ++i) {
    const auto t = static_cast<DifficultyTier>(i);
    if (s == difficulty_tier_label(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

bool difficulty_tier_from_int(int v, DifficultyTier& out) {
  if (v < 0 || v >= kNumDifficultyTiers) return false;
  out = static_cast<DifficultyTier>(v);
  return true;
}

double Aabb::signed_distance(const Vec3& p) const {
  const Vec3 h = (max - min) * 0.5;
  return box_sdf(p - center(), h);
}

const char* obstacle_shape_label(ObstacleShape s) {
  switch (s) {
    case ObstacleShape::Box: return "box";
    case ObstacleShape::Sphere: return "sphere";
    case ObstacleShape::Cylinder: return "cylinder";
  }
  return "box";
}

bool parse_obstacle_shape(const std::string& text, ObstacleShape& out) {
  const std::string s = to_lower(text);
  if (s == "box") {
    out = ObstacleShape::Box;
  } else if (s == "sphere") {
    out = ObstacleShape::Sphere;
  } else if (s == "cylinder") {
    out = ObstacleShape::Cylinder;
  } else {
    return false;
  }
  return true;
}

double Obstacle::signed_distance(const Vec3& p, double t_s) const {
  const Vec3 c = position_at(anchor, motion, t_s);
  const Vec3 q = p - c;
  switch (shape) {
    case ObstacleShape::Box: return box_sdf(q, half_extents);
    case ObstacleShape::Sphere: return q.length() - radius_m;
    case ObstacleShape::Cylinder: {
      const double dr = q.horizontal_length() - radius_m;
      const double half_h = height_m * 0.5;
      const double dz = std::fabs(q.z - half_h) - half_h;
      const double out_r = std::max(dr, 0.0);
      const double out_z = std::max(dz, 0.0);
      return std::sqrt(out_r * out_r + out_z * out_z) + std::min(std::max(dr, dz), 0.0);
    }
  }
  return q.length();
}

double Obstacle::bounding_radius() const {
  switch (shape) {
    case ObstacleShape::Box: return half_extents.length();
    case ObstacleShape::Sphere: return radius_m;
    case ObstacleShape::Cylinder: return std::sqrt(radius_m * radius_m + height_m * height_m);
  }
  return 0.0;
}

std::uint64_t challenge_id(const ChallengeSpec& spec) {
  Digest64 d;
  d.add_string("aerojudge.challenge.v1");
  d.add_u64(spec.seed);
  d.add_enum(spec.difficulty_tier);
  hash_aabb(d, spec.world_bounds);
  hash_vec3(d, spec.start);

  d.add_size(spec.obstacles.size());
  for (const auto& o : spec.obstacles) {
    d.add_enum(o.shape);
    hash_vec3(d, o.anchor);
    hash_vec3(d, o.half_extents);
    d.add_double(o.radius_m);
    d.add_double(o.height_m);
    hash_motion(d, o.motion);
  }

  hash_vec3(d, spec.goal.anchor);
  hash_motion(d, spec.goal.motion);
  d.add_double(spec.capture_radius_m);
  d.add_double(spec.capture_hold_s);
  d.add_double(spec.reference_time_s);
  d.add_double(spec.physics.step_s);
  d.add_double(spec.physics.gravity_m_s2);
  d.add_double(spec.physics.linear_drag);
  d.add_double(spec.horizon_s);

  d.add_size(spec.no_fly_zones.size());
  for (const auto& z : spec.no_fly_zones) hash_aabb(d, z);
  return d.value();
}

bool challenges_equal(const ChallengeSpec& a, const ChallengeSpec& b) {
  if (a.seed != b.seed || a.difficulty_tier != b.difficulty_tier) return false;
  if (!aabb_equal(a.world_bounds, b.world_bounds) || a.start != b.start) return false;
  if (a.obstacles.size() != b.obstacles.size()) return false;
  for (std::size_t i = 0; i < a.obstacles.size(); ++i) {
    if (!obstacle_equal(a.obstacles[i], b.obstacles[i])) return false;
  }
  if (a.goal.anchor != b.goal.anchor || !motion_equal(a.goal.motion, b.goal.motion)) return false;
  if (a.capture_radius_m != b.capture_radius_m || a.capture_hold_s != b.capture_hold_s) return false;
  if (a.reference_time_s != b.reference_time_s || a.horizon_s != b.horizon_s) return false;
  if (a.physics.step_s != b.physics.step_s || a.physics.gravity_m_s2 != b.physics.gravity_m_s2 ||
      a.physics.linear_drag != b.physics.linear_drag) {
    return false;
  }
  if (a.no_fly_zones.size() != b.no_fly_zones.size()) return false;
  for (std::size_t i = 0; i < a.no_fly_zones.size(); ++i) {
    if (!aabb_equal(a.no_fly_zones[i], b.no_fly_zones[i])) return false;
  }
  return true;
}

std::int64_t horizon_steps(const ChallengeSpec& spec) {
  if (!(spec.physics.step_s > 0.0) || !(spec.horizon_s > 0.0)) return 0;
  // Small epsilon so 120 / 0.02 yields 6000, not 5999.
  return static_cast<std::int64_t>(std::floor(spec.horizon_s / spec.physics.step_s + 1e-9));
}

std::vector<std::string> validate_challenge(const ChallengeSpec& spec) {
  std::vector<std::string> errors;
  const auto& b = spec.world_bounds;
  if (!b.min.is_finite() || !b.max.is_finite() || !(b.min.x < b.max.x) || !(b.min.y < b.max.y) ||
      !(b.min.z < b.max.z)) {
    errors.push_back("world_bounds must be a finite, non-empty box");
  }
  if (!spec.start.is_finite() || !b.contains(spec.start)) errors.push_back("start must lie inside world_bounds");
  if (!spec.goal.anchor.is_finite() || !motion_is_valid(spec.goal.motion)) {
    errors.push_back("goal must have a finite anchor and a valid motion law");
  }
  if (!finite_positive(spec.capture_radius_m)) errors.push_back("capture_radius_m must be > 0");
  if (!std::isfinite(spec.capture_hold_s) || spec.capture_hold_s < 0.0) errors.push_back("capture_hold_s must be >= 0");
  if (!finite_positive(spec.reference_time_s)) errors.push_back("reference_time_s must be > 0");
  if (!finite_positive(spec.physics.step_s)) errors.push_back("physics.step_s must be > 0");
  if (!std::isfinite(spec.physics.gravity_m_s2) || spec.physics.gravity_m_s2 < 0.0) {
    errors.push_back("physics.gravity_m_s2 must be >= 0");
  }
  if (!std::isfinite(spec.physics.linear_drag) || spec.physics.linear_drag < 0.0) {
    errors.push_back("physics.linear_drag must be >= 0");
  }
  if (!finite_positive(spec.horizon_s)) errors.push_back("horizon_s must be > 0");
  if (finite_positive(spec.horizon_s) && finite_positive(spec.physics.step_s) &&
      spec.physics.step_s > spec.horizon_s) {
    errors.push_back("physics.step_s must not exceed horizon_s");
  }
  if (finite_positive(spec.reference_time_s) && finite_positive(spec.horizon_s) &&
      spec.reference_time_s >= spec.horizon_s) {
    errors.push_back("reference_time_s must be below horizon_s");
  }

  for (std::size_t i = 0; i < spec.obstacles.size(); ++i) {
    const auto& o = spec.obstacles[i];
    const bool size_ok = (o.shape == ObstacleShape::Box)
                             ? (o.half_extents.is_finite() && o.half_extents.x > 0.0 && o.half_extents.y > 0.0 &&
                                o.half_extents.z > 0.0)
                             : (finite_positive(o.radius_m) &&
                                (o.shape != ObstacleShape::Cylinder || finite_positive(o.height_m)));
    if (!o.anchor.is_finite() || !size_ok || !motion_is_valid(o.motion)) {
      errors.push_back("obstacle " + std::to_string(i) + " has invalid geometry or motion");
    }
  }
  for (std::size_t i = 0; i < spec.no_fly_zones.size(); ++i) {
    const auto& z = spec.no_fly_zones[i];
    if (!z.min.is_finite() || !z.max.is_finite() || !(z.min.x < z.max.x) || !(z.min.y < z.max.y) ||
        !(z.min.z < z.max.z)) {
      errors.push_back("no_fly_zone " + std::to_string(i) + " must be a finite, non-empty box");
    }
  }
  return errors;
}

} // namespace aerojudge
