#pragma once
#include <cstdint>
#include <vector>
#include <ringout/actor.hpp>
#include <ringout/events.hpp>
#include <ringout/platform.hpp>
#include <ringout/powerup.hpp>

namespace ringout {

struct ActorPose {
  int    slot = 0;
  double x = 0.0, y = 0.0;
  double vx = 0.0, vy = 0.0;
  double facing_rad = 0.0;
  double radius = 0.0;
  DashPhase dash = DashPhase::Ready;
  int    dash_charges = 0;
  int    stocks = 0;
  bool   alive = true;
  std::uint32_t effects_mask = 0;   // bit = EffectKind index

  bool has_effect(EffectKind k) const { return (effects_mask >> static_cast<int>(k)) & 1u; }
};

struct PowerUpPose {
  int slot = 0;
  PowerUpKind kind = PowerUpKind::SpeedBoost;
  SlotState state = SlotState::Empty;   // Spawning = telegraph, Active = claimable
  double x = 0.0, y = 0.0;
};

// Immutable copy of the public match state after a tick.
struct ArenaSnapshot {
  std::uint64_t tick = 0;        // ticks completed
  double sim_time = 0.0;         // tick * dt
  double arena_radius = 0.0;
  PlatformPhase platform_phase = PlatformPhase::Stable;
  bool   match_over = false;
  int    winner = kNoActor;
  std::vector<ActorPose> actors;
  std::vector<PowerUpPose> powerups;
};

inline const ActorPose* find_actor(const ArenaSnapshot& s, int slot) {
  for (const auto& a : s.actors) if (a.slot == slot) return &a;
  return nullptr;
}

} // namespace ringout
