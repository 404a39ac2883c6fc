#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <ringout/config.hpp>
#include <ringout/events.hpp>
#include <ringout/interp.hpp>
#include <ringout/snap.hpp>

namespace ringout {

class SimRunner;

struct ViewerOptions {
  bool versus = false;              // second human on the arrow keys
  bool replay = false;              // runner plays a log; input keys only pace it
  DifficultyTier tier = DifficultyTier::Medium;
  std::uint64_t seed = 1;
};

// RAII application that draws interpolated snapshots and feeds keyboard
// intent to the runner.
class ViewerApp {
public:
  ViewerApp(SimRunner& sim, const ViewerOptions& opts);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  void pump_events_();
  // Rendering
  void render_frame_();
  void draw_arena_(const ArenaSnapshot& draw);
  void draw_actors_(const ArenaSnapshot& draw);
  void draw_powerups_(const ArenaSnapshot& draw);
  void draw_hud_(const ArenaSnapshot& draw);

  struct Vec2f { float x; float y; };
  Vec2f world_to_screen_(double x, double y) const;

  SimRunner& sim_;
  ViewerOptions opts_;
  InterpBuffer ibuf_{};
  ArenaSnapshot last_snap_{};
  std::uint64_t cursor_{0};

  float  scale_px_per_unit_{1.2f};
  double interp_delay_{0.050};

  // Short-lived HUD log of recent events (newest last).
  std::deque<std::string> feed_;
  float shake_{0.0f};
  std::string status_line_;
};

} // namespace ringout
