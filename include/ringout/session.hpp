#pragma once
#include <array>
#include <atomic>
#include <optional>
#include <ringout/ai.hpp>
#include <ringout/clock.hpp>
#include <ringout/match.hpp>
#include <ringout/replay.hpp>

namespace ringout {

// One live match bound to its input sources: a latched intent per human slot
// and an AIDecisionEngine per AI slot. Every tick's frames are recorded.
class Session {
public:
  Session(const MatchConfig& cfg, const MatchSetup& setup);

  // Latest intent for a human slot. A dash press stays latched until the
  // next tick consumes it.
  void set_human_intent(Slot slot, Vec2 dir, bool dash_pressed);

  // Builds both frames, records them and runs one tick.
  TickResult step_once();
  // Runs the ticks the clock releases for wall_dt; abort is checked between
  // ticks. Returns the number of ticks run.
  int update(double wall_dt);

  void request_abort() { abort_.store(true, std::memory_order_release); }
  bool aborted() const { return abort_.load(std::memory_order_acquire); }

  const Match& match() const { return match_; }
  const ReplayRecorder& recorder() const { return recorder_; }
  const ArenaSnapshot& last_snapshot() const { return last_snapshot_; }
  const SimulationClock& clock() const { return clock_; }
  const AIDecisionEngine* ai(Slot slot) const;
  EventList drain_events();

private:
  struct HumanLatch {
    Vec2 dir{};
    bool dash = false;
  };

  InputFrame frame_for_(std::size_t slot);

  Match match_;
  ReplayRecorder recorder_;
  SimulationClock clock_;
  std::array<std::optional<AIDecisionEngine>, kActorCount> ai_{};
  std::array<HumanLatch, kActorCount> latch_{};
  ArenaSnapshot last_snapshot_;
  EventList pending_;
  std::atomic<bool> abort_{false};
};

} // namespace ringout
