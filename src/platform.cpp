#include <ringout/platform.hpp>
#include <algorithm>
#include <cmath>

namespace ringout {

const char* to_string(PlatformPhase p) {
  switch (p) {
    case PlatformPhase::Stable:    return "stable";
    case PlatformPhase::Shrinking: return "shrinking";
    case PlatformPhase::Settled:   return "settled";
  }
  return "unknown";
}

int PlatformController::steps_to_min_() const {
  const double step = cfg_.step_fraction * cfg_.start_radius;
  if (!(step > 0.0)) return 0;
  const double n = (cfg_.start_radius - cfg_.min_radius) / step;
  return std::max(0, static_cast<int>(std::ceil(n - 1e-9)));
}

double PlatformController::current_radius(double elapsed_s) const {
  const double since = elapsed_s - cfg_.shrink_delay_s;
  if (!(since >= 0.0)) return cfg_.start_radius;

  double r = cfg_.start_radius;
  switch (cfg_.shrink_kind) {
    case ShrinkKind::Linear:
      r = cfg_.start_radius - cfg_.shrink_rate * since;
      break;
    case ShrinkKind::Stepped: {
      if (cfg_.step_interval_s <= 0.0) return cfg_.min_radius;
      const double n = std::floor(since / cfg_.step_interval_s);
      r = cfg_.start_radius - n * cfg_.step_fraction * cfg_.start_radius;
      break;
    }
  }
  return std::max(r, cfg_.min_radius);
}

PlatformPhase PlatformController::phase(double elapsed_s) const {
  if (elapsed_s < cfg_.shrink_delay_s) return PlatformPhase::Stable;
  if (elapsed_s >= end_time()) return PlatformPhase::Settled;
  return PlatformPhase::Shrinking;
}

double PlatformController::end_time() const {
  const double span = cfg_.start_radius - cfg_.min_radius;
  if (span <= 0.0) return cfg_.shrink_delay_s;
  if (cfg_.shrink_kind == ShrinkKind::Linear) {
    return cfg_.shrink_rate > 0.0 ? cfg_.shrink_delay_s + span / cfg_.shrink_rate
                                  : cfg_.shrink_delay_s;
  }
  return cfg_.shrink_delay_s + steps_to_min_() * cfg_.step_interval_s;
}

} // namespace ringout
