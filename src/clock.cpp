#include <ringout/clock.hpp>
#include <algorithm>
#include <cmath>

namespace ringout {

SimulationClock::SimulationClock(double dt, int max_steps)
  : dt_(dt > 0.0 && std::isfinite(dt) ? dt : 1.0 / 60.0),
    max_steps_(std::max(1, max_steps)) {}

int SimulationClock::advance(double wall_dt) {
  if (std::isfinite(wall_dt) && wall_dt > 0.0) acc_ += wall_dt;

  // Tolerance keeps sums of exact multiples of dt from losing a step.
  const double ready = std::floor(acc_ / dt_ + 1e-9);
  const int steps = static_cast<int>(std::min(ready, static_cast<double>(max_steps_)));
  if (steps <= 0) return 0;

  acc_ = std::max(0.0, acc_ - steps * dt_);
  total_ += static_cast<std::uint64_t>(steps);
  return steps;
}

double SimulationClock::alpha() const {
  return std::clamp(acc_ / dt_, 0.0, 1.0);
}

void SimulationClock::reset() {
  acc_ = 0.0;
  total_ = 0;
}

} // namespace ringout
