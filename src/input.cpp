#include <ringout/input.hpp>
#include <algorithm>
#include <cmath>

namespace ringout {

namespace {

constexpr int kAxisMaxSq = kInputAxisMax * kInputAxisMax;

int clamp_axis(int v) { return std::clamp(v, -kInputAxisMax, kInputAxisMax); }

bool legal_axes(int x, int y) {
  return x >= -kInputAxisMax && x <= kInputAxisMax &&
         y >= -kInputAxisMax && y <= kInputAxisMax &&
         x * x + y * y <= kAxisMaxSq;
}

// Rounds to nearest; falls back to truncation toward zero when rounding
// pushes the vector outside the unit circle.
void quantize_axes(Vec2 d, int& qx, int& qy) {
  qx = clamp_axis(static_cast<int>(std::lround(d.x * kInputAxisMax)));
  qy = clamp_axis(static_cast<int>(std::lround(d.y * kInputAxisMax)));
  if (!legal_axes(qx, qy)) {
    qx = clamp_axis(static_cast<int>(std::trunc(d.x * kInputAxisMax)));
    qy = clamp_axis(static_cast<int>(std::trunc(d.y * kInputAxisMax)));
  }
  while (!legal_axes(qx, qy)) {
    if (std::abs(qx) >= std::abs(qy)) qx += (qx > 0 ? -1 : 1);
    else                              qy += (qy > 0 ? -1 : 1);
  }
}

} // namespace

bool input_is_legal(const InputFrame& f) {
  return legal_axes(f.move_x, f.move_y);
}

InputFrame sanitize_input(const InputFrame& f) {
  if (input_is_legal(f)) return f;
  InputFrame out = f;
  const Vec2 d{static_cast<double>(clamp_axis(f.move_x)) / kInputAxisMax,
               static_cast<double>(clamp_axis(f.move_y)) / kInputAxisMax};
  int qx = 0, qy = 0;
  quantize_axes(normalized_or(d, Vec2{}), qx, qy);
  out.move_x = static_cast<std::int8_t>(qx);
  out.move_y = static_cast<std::int8_t>(qy);
  return out;
}

InputFrame quantize_input(std::uint64_t tick, std::uint8_t slot, Vec2 dir, bool dash) {
  InputFrame f{tick, slot, 0, 0, dash};
  if (!is_finite(dir)) return f;
  if (length_sq(dir) > 1.0) dir = normalized_or(dir, Vec2{});
  int qx = 0, qy = 0;
  quantize_axes(dir, qx, qy);
  f.move_x = static_cast<std::int8_t>(qx);
  f.move_y = static_cast<std::int8_t>(qy);
  return f;
}

Vec2 input_direction(const InputFrame& f) {
  return {static_cast<double>(f.move_x) / kInputAxisMax,
          static_cast<double>(f.move_y) / kInputAxisMax};
}

} // namespace ringout
