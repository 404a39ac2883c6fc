#pragma once
#include <cstdint>
#include <vector>
#include <ringout/actor.hpp>
#include <ringout/vec2.hpp>

namespace ringout {

enum class EventKind : int {
  DashStarted = 0,
  CollisionOccurred,
  ActorEliminated,
  ActorRespawned,
  PowerUpSpawned,
  PowerUpClaimed,
  PowerUpExpired,
  EffectExpired,
  PhysicsAnomaly,
  MatchEnded
};

enum class MatchEndReason : int { None = 0, Stocks, Timeout };

enum class PowerUpKind : int {
  SpeedBoost = 0,
  Shield,
  SizeUp,
  SizeDown,
  MultiDash,
  Teleport,
  Freeze,
  Magnet,
  Count
};

inline constexpr int kNoActor = -1;

// Discrete happening inside one tick. Consumers (audio, particles, HUD) read
// these; they never feed back into the simulation.
struct SimEvent {
  EventKind kind = EventKind::DashStarted;
  std::uint64_t tick = 0;
  int    actor = kNoActor;        // primary actor; winner for MatchEnded (kNoActor = draw)
  int    other = kNoActor;        // second actor of a collision, target of Freeze
  double magnitude = 0.0;         // collision impulse
  int    stocks_remaining = 0;
  int    powerup_slot = -1;
  PowerUpKind powerup = PowerUpKind::SpeedBoost;
  EffectKind  effect = EffectKind::SpeedBoost;
  Vec2   pos{};
  MatchEndReason end_reason = MatchEndReason::None;

  bool operator==(const SimEvent&) const = default;
};

using EventList = std::vector<SimEvent>;

const char* to_string(EventKind k);
const char* to_string(PowerUpKind k);
const char* to_string(MatchEndReason r);

} // namespace ringout
