#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <ringout/config.hpp>
#include <ringout/vec2.hpp>

namespace ringout {

using Slot = std::uint8_t;
inline constexpr std::size_t kActorCount = 2;

enum class DashPhase : int { Ready = 0, Active = 1, Cooldown = 2 };

enum class EffectKind : int {
  SpeedBoost = 0,
  Shield,
  SizeUp,
  SizeDown,
  MultiDash,
  Frozen,
  Magnet,
  Count
};

inline constexpr std::size_t kEffectCount = static_cast<std::size_t>(EffectKind::Count);

const char* to_string(DashPhase p);
const char* to_string(EffectKind k);

struct DashState {
  DashPhase phase = DashPhase::Ready;
  int  remaining_ticks = 0;   // Active ticks left
  int  recharge_ticks = 0;    // ticks until the next charge returns (0 = idle)
  int  charges = 1;
  bool hit_landed = false;    // knockback already applied during this dash
};

// Kinematic state of one combatant. Mutated only inside Match::tick.
struct Actor {
  Slot  slot = 0;
  Vec2  pos{};
  Vec2  vel{};
  Vec2  facing{1.0, 0.0};
  Vec2  last_valid_pos{};
  Vec2  spawn_pos{};
  DashState dash{};
  int   stocks = 1;
  bool  alive = true;
  std::array<int, kEffectCount> effects{};  // remaining ticks per kind, 0 = inactive

  bool has_effect(EffectKind k) const { return effects[static_cast<std::size_t>(k)] > 0; }
  int& effect_ticks(EffectKind k) { return effects[static_cast<std::size_t>(k)]; }
  int effect_ticks(EffectKind k) const { return effects[static_cast<std::size_t>(k)]; }

  double radius(const MatchConfig& cfg) const {
    double r = cfg.actor_radius;
    if (has_effect(EffectKind::SizeUp))   r *= cfg.powerups.size_up_multiplier;
    if (has_effect(EffectKind::SizeDown)) r *= cfg.powerups.size_down_multiplier;
    return r;
  }

  double move_speed(const MatchConfig& cfg) const {
    return has_effect(EffectKind::SpeedBoost) ? cfg.move_speed * cfg.powerups.speed_multiplier
                                              : cfg.move_speed;
  }

  int max_dash_charges(const MatchConfig& cfg) const {
    return has_effect(EffectKind::MultiDash) ? cfg.dash.charges + cfg.powerups.multi_dash_bonus
                                             : cfg.dash.charges;
  }

  // Bitmask of active effects (bit = EffectKind index).
  std::uint32_t effects_mask() const {
    std::uint32_t m = 0;
    for (std::size_t i = 0; i < kEffectCount; ++i) if (effects[i] > 0) m |= (1u << i);
    return m;
  }
};

} // namespace ringout
