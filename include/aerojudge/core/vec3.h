#pragma once
#include <cmath>

namespace aerojudge {

// 3D vector in world metres (z is up).
struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  Vec3() = default;
  Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  Vec3 operator+(const Vec3& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
  Vec3 operator-(const Vec3& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
  Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
  Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }

  // Exact equality; meant for stored/serialized coordinates.
  bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
  bool operator!=(const Vec3& rhs) const { return !(*this == rhs); }

  Vec3& operator+=(const Vec3& rhs) {
    x += rhs.x;
    y += rhs.y;
    z += rhs.z;
    return *this;
  }

  double dot(const Vec3& rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }
  double length() const { return std::sqrt(x * x + y * y + z * z); }
  double length_squared() const { return x * x + y * y + z * z; }
  double horizontal_length() const { return std::sqrt(x * x + y * y); }

  Vec3 normalized() const {
    const double len = length();
    if (len <= 1e-12) return {0.0, 0.0, 0.0};
    return {x / len, y / len, z / len};
  }

  bool is_finite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }
};

inline double distance(const Vec3& a, const Vec3& b) { return (a - b).length(); }

} // namespace aerojudge
