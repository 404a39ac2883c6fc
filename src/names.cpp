#include <ringout/actor.hpp>
#include <ringout/events.hpp>

namespace ringout {

const char* to_string(DashPhase p) {
  switch (p) {
    case DashPhase::Ready:    return "ready";
    case DashPhase::Active:   return "active";
    case DashPhase::Cooldown: return "cooldown";
  }
  return "unknown";
}

const char* to_string(EffectKind k) {
  switch (k) {
    case EffectKind::SpeedBoost: return "speed_boost";
    case EffectKind::Shield:     return "shield";
    case EffectKind::SizeUp:     return "size_up";
    case EffectKind::SizeDown:   return "size_down";
    case EffectKind::MultiDash:  return "multi_dash";
    case EffectKind::Frozen:     return "frozen";
    case EffectKind::Magnet:     return "magnet";
    default: return "unknown";
  }
}

const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::DashStarted:       return "dash_started";
    case EventKind::CollisionOccurred: return "collision";
    case EventKind::ActorEliminated:   return "eliminated";
    case EventKind::ActorRespawned:    return "respawned";
    case EventKind::PowerUpSpawned:    return "powerup_spawned";
    case EventKind::PowerUpClaimed:    return "powerup_claimed";
    case EventKind::PowerUpExpired:    return "powerup_expired";
    case EventKind::EffectExpired:     return "effect_expired";
    case EventKind::PhysicsAnomaly:    return "physics_anomaly";
    case EventKind::MatchEnded:        return "match_ended";
  }
  return "unknown";
}

const char* to_string(PowerUpKind k) {
  switch (k) {
    case PowerUpKind::SpeedBoost: return "speed_boost";
    case PowerUpKind::Shield:     return "shield";
    case PowerUpKind::SizeUp:     return "size_up";
    case PowerUpKind::SizeDown:   return "size_down";
    case PowerUpKind::MultiDash:  return "multi_dash";
    case PowerUpKind::Teleport:   return "teleport";
    case PowerUpKind::Freeze:     return "freeze";
    case PowerUpKind::Magnet:     return "magnet";
    default: return "unknown";
  }
}

const char* to_string(MatchEndReason r) {
  switch (r) {
    case MatchEndReason::None:    return "none";
    case MatchEndReason::Stocks:  return "stocks";
    case MatchEndReason::Timeout: return "timeout";
  }
  return "unknown";
}

} // namespace ringout
