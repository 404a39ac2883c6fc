#pragma once
#include <ringout/config.hpp>
#include <ringout/vec2.hpp>

namespace ringout {

enum class PlatformPhase : int { Stable = 0, Shrinking = 1, Settled = 2 };

const char* to_string(PlatformPhase p);

// Shrinking boundary schedule. Pure function of elapsed match time; holds no
// per-match state beyond its configuration.
class PlatformController {
public:
  explicit PlatformController(const ArenaConfig& cfg) : cfg_(cfg) {}

  // Non-increasing in t, never below min_radius.
  double current_radius(double elapsed_s) const;
  PlatformPhase phase(double elapsed_s) const;
  // Elapsed time at which min_radius is first reached.
  double end_time() const;

  // Centre distance strictly greater than the radius.
  static bool is_out_of_bounds(Vec2 pos, double radius) {
    return length_sq(pos) > radius * radius;
  }

  const ArenaConfig& config() const { return cfg_; }

private:
  int steps_to_min_() const;

  ArenaConfig cfg_;
};

} // namespace ringout
