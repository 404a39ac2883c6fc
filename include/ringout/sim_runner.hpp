#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <ringout/config.hpp>
#include <ringout/match.hpp>
#include <ringout/replay.hpp>
#include <ringout/session.hpp>
#include <ringout/snap.hpp>
#include <ringout/snap_buffer.hpp>

namespace ringout {

// Owns the simulation thread. Drives either a live Session or a ReplayPlayer
// and publishes snapshots and events; presentation never touches the match.
class SimRunner {
public:
  SimRunner() = default;
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  // Call before start().
  void configure_live(const MatchConfig& cfg, const MatchSetup& setup);
  void configure_replay(ReplayLog log);

  void start();
  void stop();

  // New live match with the current setup (tier and control kinds) and a new
  // seed. Consumed between ticks.
  void request_restart(std::uint64_t seed);
  void request_restart(std::uint64_t seed, DifficultyTier tier);

  // Replay mode only: jump to a recorded tick. Consumed between ticks.
  void request_seek(std::size_t tick);
  // Replay position as a fraction of the log, and as a tick index.
  double replay_progress() const;
  std::size_t replay_cursor() const;

  // Intent for a human slot; safe from the UI thread.
  void set_intent(Slot slot, Vec2 dir, bool dash_pressed);

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }
  EventQueue& events() { return events_; }

  bool replay_mode() const { return replay_mode_; }
  PlaybackStatus playback_status() const;
  MatchSetup current_setup() const;

  // Writes the live session's recording so far.
  bool save_last_replay(const std::string& path) const;

  // Wall time multiplier; 0 pauses. Replays clamp it to [0, 4].
  std::atomic<double> time_scale{1.0};

private:
  void thread_main_();
  void rebuild_session_();
  void pull_intents_();

  static std::uint32_t pack_intent_(Vec2 dir);

  std::thread th_;
  std::atomic<bool> running_{false};

  SnapshotBuffer buffer_;
  EventQueue events_;

  MatchConfig cfg_{};
  MatchSetup setup_{};
  bool replay_mode_{false};

  mutable std::mutex sim_m_;              // guards session_/player_ and setup_
  std::unique_ptr<Session> session_;
  std::optional<ReplayPlayer> player_;

  std::array<std::atomic<std::uint32_t>, kActorCount> intent_dir_{};
  std::array<std::atomic<bool>, kActorCount> intent_dash_{};

  std::atomic<bool> pending_restart_{false};
  std::atomic<std::uint64_t> pending_seed_{0};
  std::atomic<int> pending_tier_{-1};
  std::atomic<std::int64_t> pending_seek_{-1};
};

} // namespace ringout
