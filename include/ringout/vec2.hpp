#pragma once
#include <cmath>
#include <numbers>

namespace ringout {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

struct Vec2 {
  double x{};
  double y{};

  Vec2& operator+=(Vec2 o) { x += o.x; y += o.y; return *this; }
  Vec2& operator-=(Vec2 o) { x -= o.x; y -= o.y; return *this; }
  Vec2& operator*=(double s) { x *= s; y *= s; return *this; }
  bool operator==(const Vec2&) const = default;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator-(Vec2 v) { return {-v.x, -v.y}; }
inline Vec2 operator*(Vec2 v, double s) { return {v.x * s, v.y * s}; }
inline Vec2 operator*(double s, Vec2 v) { return {v.x * s, v.y * s}; }
inline Vec2 operator/(Vec2 v, double s) { return {v.x / s, v.y / s}; }

inline double dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }
inline double length_sq(Vec2 v) { return dot(v, v); }
inline double length(Vec2 v) { return std::sqrt(length_sq(v)); }
inline Vec2 perp(Vec2 v) { return {-v.y, v.x}; }

inline bool is_finite(Vec2 v) { return std::isfinite(v.x) && std::isfinite(v.y); }

// Unit vector along v, or fallback when v is (near) zero length.
inline Vec2 normalized_or(Vec2 v, Vec2 fallback) {
  const double len = length(v);
  if (!(len > 1e-12)) return fallback;
  return v / len;
}

inline Vec2 from_angle(double rad) { return {std::cos(rad), std::sin(rad)}; }

// Closest point to p on segment [a,b].
inline Vec2 closest_point_on_segment(Vec2 a, Vec2 b, Vec2 p) {
  const Vec2 ab = b - a;
  const double len2 = length_sq(ab);
  if (len2 <= 0.0) return a;
  double t = dot(p - a, ab) / len2;
  t = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
  return a + ab * t;
}

inline double distance_sq_point_segment(Vec2 p, Vec2 a, Vec2 b) {
  return length_sq(p - closest_point_on_segment(a, b, p));
}

} // namespace ringout
