#pragma once
#include <array>
#include <cstdint>
#include <ringout/actor.hpp>
#include <ringout/config.hpp>
#include <ringout/events.hpp>
#include <ringout/input.hpp>
#include <ringout/platform.hpp>
#include <ringout/powerup.hpp>
#include <ringout/rng.hpp>
#include <ringout/snap.hpp>
#include <ringout/spatial_grid.hpp>

namespace ringout {

enum class TickStatus : int { Ok = 0, MatchOver, Desync };
enum class ControlKind : int { Human = 0, Ai = 1 };

const char* to_string(TickStatus s);
const char* to_string(ControlKind c);

struct ActorSpawn {
  Vec2 pos{};
  ControlKind control = ControlKind::Human;
  DifficultyTier tier = DifficultyTier::Medium;

  bool operator==(const ActorSpawn&) const = default;
};

// Everything besides the config needed to rebuild a match bit-exactly.
struct MatchSetup {
  std::uint64_t seed = 0;
  std::array<ActorSpawn, kActorCount> spawns{};

  bool operator==(const MatchSetup&) const = default;
};

// Actors at -/+ spawn_distance on the x axis.
MatchSetup default_setup(const MatchConfig& cfg, std::uint64_t seed,
                         ControlKind c0 = ControlKind::Human,
                         ControlKind c1 = ControlKind::Ai,
                         DifficultyTier tier = DifficultyTier::Medium);

struct TickResult {
  TickStatus status = TickStatus::Ok;
  EventList events;
  ArenaSnapshot snapshot;
};

// Authoritative match state and the tick function. Owns actors, arena
// schedule, power-ups and every RNG stream; the config is expected to have
// passed validate_config.
class Match {
public:
  Match(const MatchConfig& cfg, const MatchSetup& setup);

  // Runs tick current_tick(). frames[i] must carry tick == current_tick()
  // and slot == i, otherwise nothing changes and the status is Desync.
  // After the match ended every call returns MatchOver without mutation.
  TickResult tick(const std::array<InputFrame, kActorCount>& frames);

  std::uint64_t current_tick() const { return tick_; }
  double elapsed() const { return static_cast<double>(tick_) * cfg_.dt; }
  bool over() const { return over_; }
  int winner() const { return winner_; }
  MatchEndReason end_reason() const { return end_reason_; }

  const Actor& actor(std::size_t slot) const { return actors_[slot]; }
  const std::array<Actor, kActorCount>& actors() const { return actors_; }
  double arena_radius() const { return radius_; }
  const PlatformController& platform() const { return platform_; }
  const PowerUpManager& powerups() const { return powerups_; }
  const SpatialGrid& grid() const { return grid_; }
  const MatchConfig& config() const { return cfg_; }
  const MatchSetup& setup() const { return setup_; }

  // The AI stream for a slot. Only AI engines draw from it.
  MatchRng& ai_rng(std::size_t slot) { return ai_rng_[slot]; }
  const MatchRng& powerup_rng() const { return pu_rng_; }

  ArenaSnapshot snapshot() const;

private:
  void init_actor_(std::size_t slot);
  void resolve_collision_(const std::array<Vec2, kActorCount>& start, EventList& events);
  void eliminate_(Actor& a, EventList& events);
  void check_end_(EventList& events);

  MatchConfig cfg_;
  MatchSetup setup_;
  PlatformController platform_;
  MatchRng pu_rng_;
  std::array<MatchRng, kActorCount> ai_rng_;
  PowerUpManager powerups_;
  SpatialGrid grid_;
  std::array<Actor, kActorCount> actors_{};

  std::uint64_t tick_{0};
  std::uint64_t round_ticks_{0};
  double radius_{0.0};
  bool over_{false};
  int winner_{kNoActor};
  MatchEndReason end_reason_{MatchEndReason::None};
};

} // namespace ringout
