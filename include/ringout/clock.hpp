#pragma once
#include <cstdint>

namespace ringout {

// Fixed-timestep accumulator. Wall time goes in, whole simulation steps come
// out; the fractional remainder carries to the next frame. At most
// max_steps are released per call and any backlog stays in the accumulator.
class SimulationClock {
public:
  SimulationClock(double dt, int max_steps);

  // Returns the number of steps to run now. Non-positive or non-finite
  // wall_dt adds nothing.
  int advance(double wall_dt);

  double dt() const { return dt_; }
  int max_steps() const { return max_steps_; }
  double accumulator() const { return acc_; }
  // Fraction of a step left in the accumulator, for presentation blending.
  double alpha() const;
  std::uint64_t total_steps() const { return total_; }
  void reset();

private:
  double dt_;
  int max_steps_;
  double acc_{0.0};
  std::uint64_t total_{0};
};

} // namespace ringout
