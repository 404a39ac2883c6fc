#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <ringout/snap.hpp>
#include <ringout/vec2.hpp>

namespace ringout {

// Ring of recent snapshots for drawing between simulation ticks. Presentation
// only; nothing here feeds back into a Match.
class InterpBuffer {
public:
  static constexpr std::size_t kMaxCap = 128;

  explicit InterpBuffer(std::size_t cap = 64)
    : cap_(cap == 0 ? 1 : (cap <= kMaxCap ? cap : kMaxCap)) {}

  void push(const ArenaSnapshot& s) {
    buf_[write_index()] = s;
    ++size_;
  }

  void clear() { size_ = 0; }

  // Blend at target_time. Positions, velocities, facing and arena radius are
  // interpolated; discrete state (stocks, dash, effects, power-ups, match
  // result) comes from the snapshot nearer in time.
  bool sample(double target_time, ArenaSnapshot& out) const {
    const std::size_t n = current_size();
    if (n == 0) return false;
    if (n == 1) { out = buf_[index(0)]; return true; }

    const auto& first = buf_[index(0)];
    const auto& last  = buf_[index(n - 1)];
    if (target_time <= first.sim_time) { out = first; return true; }
    if (target_time >= last.sim_time)  { out = last;  return true; }

    std::size_t lo = 0, hi = 1;
    for (; hi < n; ++hi) {
      const auto& a = buf_[index(hi - 1)];
      const auto& b = buf_[index(hi)];
      if (target_time >= a.sim_time && target_time <= b.sim_time) {
        lo = hi - 1;
        break;
      }
    }

    const auto& A = buf_[index(lo)];
    const auto& B = buf_[index(hi)];
    const double span = B.sim_time - A.sim_time;
    const double t = span > 0.0 ? (target_time - A.sim_time) / span : 0.0;

    out = t < 0.5 ? A : B;
    out.sim_time = lerp(A.sim_time, B.sim_time, t);
    out.tick = t < 1.0 ? A.tick : B.tick;
    out.arena_radius = lerp(A.arena_radius, B.arena_radius, t);

    for (auto& pose : out.actors) {
      const ActorPose* pa = find_actor(A, pose.slot);
      const ActorPose* pb = find_actor(B, pose.slot);
      if (!pa || !pb) continue;
      // Teleports and respawns jump instead of sliding across the arena.
      if (pa->alive != pb->alive || jumped_(*pa, *pb, span)) continue;
      pose.x = lerp(pa->x, pb->x, t);
      pose.y = lerp(pa->y, pb->y, t);
      pose.vx = lerp(pa->vx, pb->vx, t);
      pose.vy = lerp(pa->vy, pb->vy, t);
      pose.radius = lerp(pa->radius, pb->radius, t);
      pose.facing_rad = lerp_angle_shortest(pa->facing_rad, pb->facing_rad, t);
    }
    return true;
  }

  double latest_time() const {
    const std::size_t n = current_size();
    return n == 0 ? 0.0 : buf_[index(n - 1)].sim_time;
  }

  std::size_t size() const { return current_size(); }

private:
  static double lerp(double a, double b, double t) { return a + (b - a) * t; }

  // Moved further than its own recorded speeds allow over the span.
  static bool jumped_(const ActorPose& a, const ActorPose& b, double span) {
    const double dx = b.x - a.x, dy = b.y - a.y;
    const double vmax = std::max(std::hypot(a.vx, a.vy), std::hypot(b.vx, b.vy));
    const double reach = 2.0 * vmax * span + 2.0 * std::max(a.radius, b.radius);
    return dx * dx + dy * dy > reach * reach;
  }

  static double norm_angle(double a) {
    a = std::fmod(a, kTAU);
    if (a < 0.0) a += kTAU;
    return a;
  }
  static double lerp_angle_shortest(double a, double b, double t) {
    a = norm_angle(a);
    b = norm_angle(b);
    double d = b - a;
    if (d >  kPI) d -= kTAU;
    if (d < -kPI) d += kTAU;
    return norm_angle(a + d * t);
  }

  std::size_t index(std::size_t logical) const {
    const std::size_t start = (size_ >= cap_)
      ? static_cast<std::size_t>(size_ % static_cast<std::uint64_t>(cap_))
      : 0u;
    return (start + logical) % cap_;
  }
  std::size_t write_index() const {
    return static_cast<std::size_t>(size_ % static_cast<std::uint64_t>(cap_));
  }
  std::size_t current_size() const {
    const std::uint64_t cap64 = static_cast<std::uint64_t>(cap_);
    return static_cast<std::size_t>(size_ < cap64 ? size_ : cap64);
  }

  std::size_t cap_;
  std::array<ArenaSnapshot, kMaxCap> buf_{};
  std::uint64_t size_{0};
};

} // namespace ringout
