#pragma once
#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <ringout/ai.hpp>
#include <ringout/clock.hpp>
#include <ringout/config.hpp>
#include <ringout/input.hpp>
#include <ringout/match.hpp>

namespace ringout {

inline constexpr int kReplayFormatVersion = 1;
inline constexpr const char* kReplayMagic = "RINGOUT-REPLAY";

using TickFrames = std::array<InputFrame, kActorCount>;

// Input-only record of a match: enough to rebuild it exactly, nothing derived.
struct ReplayLog {
  int version = kReplayFormatVersion;
  MatchConfig config{};
  MatchSetup setup{};
  std::vector<TickFrames> frames;   // one entry per tick, slot 0 then slot 1
};

enum class ReplayError : int {
  None = 0,
  IoFailure,
  BadHeader,
  BadVersion,
  CorruptSnapshot,
  CorruptConfig,
  BadFrame,
  FrameOrder,
  Truncated,
  ChecksumMismatch
};

const char* to_string(ReplayError e);

struct ReplayLoadResult {
  std::optional<ReplayLog> log;
  ReplayError error = ReplayError::None;
  std::string detail;

  bool ok() const { return log.has_value(); }
};

class ReplayRecorder {
public:
  ReplayRecorder(const MatchConfig& cfg, const MatchSetup& setup);

  void record(const TickFrames& frames) { log_.frames.push_back(frames); }
  const ReplayLog& log() const { return log_; }
  std::size_t tick_count() const { return log_.frames.size(); }

private:
  ReplayLog log_;
};

// FNV-1a 64 over every frame field in order.
std::uint64_t frame_checksum(const std::vector<TickFrames>& frames);

// Structural checks shared by the reader and the player.
ReplayError validate_replay(const ReplayLog& log, std::string* detail = nullptr);

void write_replay(std::ostream& out, const ReplayLog& log);
bool save_replay(const std::string& path, const ReplayLog& log);

ReplayLoadResult read_replay(std::istream& in);
ReplayLoadResult load_replay(const std::string& path);

enum class PlaybackStatus : int { Running = 0, Paused, Finished, Desync };

const char* to_string(PlaybackStatus s);

// Re-drives a Match from a log. Speed only scales how much wall time turns
// into ticks; the ticks themselves are identical at any speed.
class ReplayPlayer {
public:
  // nullopt (and *error) for logs that fail validate_replay.
  static std::optional<ReplayPlayer> create(ReplayLog log, bool verify_ai = false,
                                            ReplayError* error = nullptr);

  // Runs one recorded tick.
  PlaybackStatus step();
  // Runs the ticks due for wall_dt at the current speed; returns how many ran.
  int advance(double wall_dt);

  // Rebuilds the match from the log and runs the recorded ticks up to
  // `tick` (clamped to the frame count). Events produced on the way are
  // dropped. Seeking also clears a Desync so playback can be retried.
  PlaybackStatus seek(std::size_t tick);
  // Fraction of the recorded ticks played, in [0, 1].
  double progress() const;

  // Clamped to [0, 4]; 0 pauses.
  void set_speed(double speed);
  double speed() const { return speed_; }

  PlaybackStatus status() const;
  const Match& match() const { return match_; }
  const ReplayLog& log() const { return log_; }
  std::size_t cursor() const { return cursor_; }
  const ArenaSnapshot& last_snapshot() const { return last_snapshot_; }
  EventList drain_events();

private:
  ReplayPlayer(ReplayLog log, bool verify_ai);
  void rewind_();
  bool verify_ai_frames_(const TickFrames& recorded);

  ReplayLog log_;
  Match match_;
  SimulationClock clock_;
  std::array<std::optional<AIDecisionEngine>, kActorCount> verifiers_{};
  ArenaSnapshot last_snapshot_;
  EventList pending_;
  std::size_t cursor_{0};
  bool verify_ai_{false};
  double speed_{1.0};
  PlaybackStatus status_{PlaybackStatus::Running};
};

} // namespace ringout
