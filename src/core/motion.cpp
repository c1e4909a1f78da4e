#include "aerojudge/core/motion.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "aerojudge/util/strings.h"

namespace aerojudge {

MotionKind motion_kind(const MotionLaw& law) {
  return std::visit(
      [](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LinearMotion>) {
          return MotionKind::Linear;
        } else if constexpr (std::is_same_v<T, CircularMotion>) {
          return MotionKind::Circular;
        } else {
          return MotionKind::Static;
        }
      },
      law);
}

const char* motion_kind_label(MotionKind k) {
  switch (k) {
    case MotionKind::Static: return "static";
    case MotionKind::Linear: return "linear";
    case MotionKind::Circular: return "circular";
  }
  return "static";
}

bool parse_motion_kind(const std::string& text, MotionKind& out) {
  const std::string s = to_lower(text);
  if (s == "static") {
    out = MotionKind::Static;
  } else if (s == "linear") {
    out = MotionKind::Linear;
  } else if (s == "circular") {
    out = MotionKind::Circular;
  } else {
    return false;
  }
  return true;
}

Vec3 motion_offset(const MotionLaw& law, double t_s) {
  if (t_s < 0.0) t_s = 0.0;
  return std::visit(
      [t_s](const auto& m) -> Vec3 {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LinearMotion>) {
          if (m.half_period_s <= 0.0) return {};
          // Triangle wave in [0, half_period].
          const double period = 2.0 * m.half_period_s;
          const double phase = std::fmod(t_s, period);
          const double travel = (phase <= m.half_period_s) ? phase : (period - phase);
          return m.velocity_m_s * travel;
        } else if constexpr (std::is_same_v<T, CircularMotion>) {
          const double a = m.angular_speed_rad_s * t_s + m.phase_rad;
          return {m.radius_m * std::cos(a), m.radius_m * std::sin(a), 0.0};
        } else {
          return {};
        }
      },
      law);
}

double motion_reach(const MotionLaw& law) {
  return std::visit(
      [](const auto& m) -> double {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LinearMotion>) {
          return m.velocity_m_s.length() * std::max(0.0, m.half_period_s);
        } else if constexpr (std::is_same_v<T, CircularMotion>) {
          return std::fabs(m.radius_m);
        } else {
          return 0.0;
        }
      },
      law);
}

bool motion_is_valid(const MotionLaw& law) {
  return std::visit(
      [](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LinearMotion>) {
          return m.velocity_m_s.is_finite() && std::isfinite(m.half_period_s) && m.half_period_s > 0.0;
        } else if constexpr (std::is_same_v<T, CircularMotion>) {
          return std::isfinite(m.radius_m) && m.radius_m >= 0.0 && std::isfinite(m.angular_speed_rad_s) &&
                 std::isfinite(m.phase_rad);
        } else {
          return true;
        }
      },
      law);
}

bool motion_equal(const MotionLaw& a, const MotionLaw& b) {
  if (a.index() != b.index()) return false;
  if (const auto* la = std::get_if<LinearMotion>(&a)) {
    const auto& lb = std::get<LinearMotion>(b);
    return la->velocity_m_s == lb.velocity_m_s && la->half_period_s == lb.half_period_s;
  }
  if (const auto* ca = std::get_if<CircularMotion>(&a)) {
    const auto& cb = std::get<CircularMotion>(b);
    return ca->radius_m == cb.radius_m && ca->angular_speed_rad_s == cb.angular_speed_rad_s &&
           ca->phase_rad == cb.phase_rad;
  }
  return true;
}

} // namespace aerojudge
