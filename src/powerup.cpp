#include <ringout/powerup.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <ringout/platform.hpp>

namespace ringout {

const char* to_string(SlotState s) {
  switch (s) {
    case SlotState::Empty:    return "empty";
    case SlotState::Spawning: return "spawning";
    case SlotState::Active:   return "active";
    case SlotState::Claimed:  return "claimed";
    case SlotState::Expired:  return "expired";
  }
  return "unknown";
}

PowerUpManager::PowerUpManager(const MatchConfig& cfg, MatchRng& rng)
  : cfg_(cfg),
    slots_(static_cast<std::size_t>(std::max(0, cfg.powerups.max_active))),
    telegraph_ticks_(seconds_to_ticks(cfg.powerups.telegraph_s, cfg.dt)),
    lifetime_ticks_(std::max(1, seconds_to_ticks(cfg.powerups.lifetime_s, cfg.dt))),
    effect_ticks_(std::max(1, seconds_to_ticks(cfg.powerups.effect_duration_s, cfg.dt))),
    freeze_ticks_(seconds_to_ticks(cfg.powerups.freeze_duration_s, cfg.dt)) {
  if (!slots_.empty()) schedule_next_(0, rng);
}

void PowerUpManager::schedule_next_(std::uint64_t from_tick, MatchRng& rng) {
  const double j = cfg_.powerups.spawn_jitter;
  const double scale = rng.uniform(1.0 - j, 1.0 + j);
  const int ticks = std::max(1, seconds_to_ticks(cfg_.powerups.spawn_interval_s * scale, cfg_.dt));
  next_spawn_tick_ = from_tick + static_cast<std::uint64_t>(ticks);
}

int PowerUpManager::active_count() const {
  return static_cast<int>(std::count_if(slots_.begin(), slots_.end(),
    [](const PowerUpSlot& s){ return s.state == SlotState::Active; }));
}

void PowerUpManager::activate_(std::size_t i, std::uint64_t tick, EventList& events) {
  auto& s = slots_[i];
  s.state = SlotState::Active;
  s.timer_ticks = 0;
  s.item.spawn_tick = tick;
  s.item.expiry_tick = tick + static_cast<std::uint64_t>(lifetime_ticks_);
  SimEvent e{};
  e.kind = EventKind::PowerUpSpawned;
  e.tick = tick;
  e.powerup_slot = static_cast<int>(i);
  e.powerup = s.item.kind;
  e.pos = s.item.pos;
  events.push_back(e);
}

void PowerUpManager::advance(std::uint64_t tick, double arena_radius, MatchRng& rng, EventList& events) {
  if (slots_.empty()) return;

  for (std::size_t i = 0; i < slots_.size(); ++i) {
    auto& s = slots_[i];
    switch (s.state) {
      case SlotState::Claimed:
      case SlotState::Expired:
        s = PowerUpSlot{};
        break;
      case SlotState::Spawning:
        if (--s.timer_ticks <= 0) activate_(i, tick, events);
        break;
      case SlotState::Active:
        // Items left outside the shrinking boundary expire early.
        if (tick >= s.item.expiry_tick || PlatformController::is_out_of_bounds(s.item.pos, arena_radius)) {
          s.state = SlotState::Expired;
          SimEvent e{};
          e.kind = EventKind::PowerUpExpired;
          e.tick = tick;
          e.powerup_slot = static_cast<int>(i);
          e.powerup = s.item.kind;
          e.pos = s.item.pos;
          events.push_back(e);
        }
        break;
      case SlotState::Empty:
        break;
    }
  }

  if (tick < next_spawn_tick_) return;

  auto it = std::find_if(slots_.begin(), slots_.end(),
                         [](const PowerUpSlot& s){ return s.state == SlotState::Empty; });
  if (it != slots_.end()) {
    const double angle = rng.uniform(0.0, kTAU);
    const double dist = rng.uniform(0.0, cfg_.powerups.spawn_radius_fraction) * arena_radius;
    const int kind = rng.uniform_int(0, static_cast<int>(PowerUpKind::Count) - 1);

    it->state = SlotState::Spawning;
    it->timer_ticks = telegraph_ticks_;
    it->item = PowerUp{};
    it->item.kind = static_cast<PowerUpKind>(kind);
    it->item.pos = from_angle(angle) * dist;
    if (telegraph_ticks_ <= 0) activate_(static_cast<std::size_t>(it - slots_.begin()), tick, events);
  }
  schedule_next_(tick, rng);
}

void PowerUpManager::register_entities(std::vector<GridEntity>& out) const {
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    if (slots_[i].state == SlotState::Active) out.push_back(GridEntity{powerup_entity(i), slots_[i].item.pos, 0.0});
  }
}

void PowerUpManager::resolve_pickups(std::uint64_t tick,
                                     std::array<Actor, kActorCount>& actors,
                                     const std::array<Vec2, kActorCount>& start_pos,
                                     const SpatialGrid& grid,
                                     double arena_radius,
                                     MatchRng& rng,
                                     EventList& events) {
  if (slots_.empty()) return;

  for (std::size_t a = 0; a < kActorCount; ++a) {
    Actor& claimant = actors[a];
    if (!claimant.alive) continue;
    const double reach_mul = claimant.has_effect(EffectKind::Magnet) ? cfg_.powerups.magnet_multiplier : 1.0;
    const double reach = claimant.radius(cfg_) + cfg_.powerups.pickup_radius * reach_mul;
    const Vec2 end_pos = claimant.pos;

    for (EntityId id : grid.query_swept(start_pos[a], end_pos, reach)) {
      if (!is_powerup_entity(id)) continue;
      const std::size_t i = powerup_slot_of(id);
      if (i >= slots_.size()) continue;
      auto& s = slots_[i];
      if (s.state != SlotState::Active) continue;

      s.state = SlotState::Claimed;
      s.item.claimed = true;

      SimEvent e{};
      e.kind = EventKind::PowerUpClaimed;
      e.tick = tick;
      e.actor = static_cast<int>(a);
      e.powerup_slot = static_cast<int>(i);
      e.powerup = s.item.kind;
      e.pos = s.item.pos;
      e.other = apply_(s.item.kind, claimant, actors[1 - a], arena_radius, rng, tick);
      events.push_back(e);
    }
  }
}

int PowerUpManager::apply_(PowerUpKind kind, Actor& claimant, Actor& opponent, double arena_radius,
                           MatchRng& rng, std::uint64_t tick) {
  switch (kind) {
    case PowerUpKind::SpeedBoost:
      claimant.effect_ticks(EffectKind::SpeedBoost) = effect_ticks_;
      break;
    case PowerUpKind::Shield:
      claimant.effect_ticks(EffectKind::Shield) = effect_ticks_;
      break;
    case PowerUpKind::Magnet:
      claimant.effect_ticks(EffectKind::Magnet) = effect_ticks_;
      break;
    case PowerUpKind::SizeUp:
      claimant.effect_ticks(EffectKind::SizeUp) = effect_ticks_;
      claimant.effect_ticks(EffectKind::SizeDown) = 0;
      break;
    case PowerUpKind::SizeDown:
      claimant.effect_ticks(EffectKind::SizeDown) = effect_ticks_;
      claimant.effect_ticks(EffectKind::SizeUp) = 0;
      break;
    case PowerUpKind::MultiDash: {
      claimant.effect_ticks(EffectKind::MultiDash) = effect_ticks_;
      auto& d = claimant.dash;
      d.charges = std::min(d.charges + cfg_.powerups.multi_dash_bonus, claimant.max_dash_charges(cfg_));
      if (d.phase == DashPhase::Cooldown && d.charges > 0) d.phase = DashPhase::Ready;
      break;
    }
    case PowerUpKind::Teleport: {
      const double angle = rng.uniform(0.0, kTAU);
      const double dist = rng.uniform(0.0, cfg_.powerups.teleport_radius_fraction) * arena_radius;
      claimant.pos = from_angle(angle) * dist;
      claimant.last_valid_pos = claimant.pos;
      claimant.vel = Vec2{};
      break;
    }
    case PowerUpKind::Freeze: {
      if (!opponent.alive || opponent.has_effect(EffectKind::Shield) || freeze_ticks_ <= 0) break;
      opponent.effect_ticks(EffectKind::Frozen) = freeze_ticks_;
      spdlog::debug("tick {}: actor {} frozen by actor {}", tick,
                    static_cast<int>(opponent.slot), static_cast<int>(claimant.slot));
      return static_cast<int>(opponent.slot);
    }
    default:
      break;
  }
  return kNoActor;
}

void tick_effects(Actor& a, const MatchConfig& cfg, std::uint64_t tick, EventList& events) {
  for (std::size_t k = 0; k < kEffectCount; ++k) {
    int& t = a.effects[k];
    if (t <= 0) continue;
    if (--t > 0) continue;
    const auto kind = static_cast<EffectKind>(k);
    if (kind == EffectKind::MultiDash) {
      a.dash.charges = std::min(a.dash.charges, cfg.dash.charges);
    }
    SimEvent e{};
    e.kind = EventKind::EffectExpired;
    e.tick = tick;
    e.actor = static_cast<int>(a.slot);
    e.effect = kind;
    events.push_back(e);
  }
}

} // namespace ringout
