#pragma once

#include <string>
#include <variant>

#include "aerojudge/core/vec3.h"

namespace aerojudge {

// Motion laws for goals and obstacles.
//
// A law only carries the parameters needed to evaluate a position at a given
// elapsed time; the replay engine evaluates it and never runs anything the
// participant supplied.

// Fixed in place at the anchor.
struct StaticMotion {};

// Shuttles back and forth along `velocity_m_s`.
//
// The body travels from its anchor along velocity for `half_period_s`
// seconds, then returns along the same segment, repeating. Travel is bounded
// by |velocity| * half_period_s.
struct LinearMotion {
  Vec3 velocity_m_s;
  double half_period_s{1.0};
};

// Orbits the anchor in the horizontal plane.
//
// position(t) = anchor + radius * (cos(w t + phase), sin(w t + phase), 0)
struct CircularMotion {
  double radius_m{0.0};
  double angular_speed_rad_s{0.0};
  double phase_rad{0.0};
};

using MotionLaw = std::variant<StaticMotion, LinearMotion, CircularMotion>;

enum class MotionKind : int { Static = 0, Linear = 1, Circular = 2 };

MotionKind motion_kind(const MotionLaw& law);
const char* motion_kind_label(MotionKind k);
bool parse_motion_kind(const std::string& text, MotionKind& out);

// Offset of a body from its anchor at elapsed time t_s.
Vec3 motion_offset(const MotionLaw& law, double t_s);

inline Vec3 position_at(const Vec3& anchor, const MotionLaw& law, double t_s) {
  return anchor + motion_offset(law, t_s);
}

// Largest distance the body can ever be from its anchor.
double motion_reach(const MotionLaw& law);

// All parameters finite and half periods positive.
bool motion_is_valid(const MotionLaw& law);

bool motion_equal(const MotionLaw& a, const MotionLaw& b);

} // namespace aerojudge
