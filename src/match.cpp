#include <ringout/match.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <ringout/integrator.hpp>

namespace ringout {

namespace {

double grid_half_extent(const MatchConfig& cfg) {
  return cfg.arena.start_radius * 1.25 + 4.0 * cfg.actor_radius;
}

double grid_cell(const MatchConfig& cfg) {
  const double max_r = cfg.actor_radius * std::max(1.0, cfg.powerups.size_up_multiplier);
  const double max_step = std::max(cfg.max_speed, cfg.dash.speed) * cfg.dt;
  return SpatialGrid::cell_size_for(max_r, max_step);
}

// Slot 0 starts on -x, slot 1 on +x.
Vec2 default_bearing(std::size_t slot) {
  return slot == 0 ? Vec2{-1.0, 0.0} : Vec2{1.0, 0.0};
}

} // namespace

const char* to_string(TickStatus s) {
  switch (s) {
    case TickStatus::Ok:        return "ok";
    case TickStatus::MatchOver: return "match_over";
    case TickStatus::Desync:    return "desync";
  }
  return "unknown";
}

const char* to_string(ControlKind c) {
  return c == ControlKind::Ai ? "ai" : "human";
}

MatchSetup default_setup(const MatchConfig& cfg, std::uint64_t seed,
                         ControlKind c0, ControlKind c1, DifficultyTier tier) {
  MatchSetup s{};
  s.seed = seed;
  s.spawns[0] = ActorSpawn{Vec2{-cfg.spawn_distance, 0.0}, c0, tier};
  s.spawns[1] = ActorSpawn{Vec2{ cfg.spawn_distance, 0.0}, c1, tier};
  return s;
}

Match::Match(const MatchConfig& cfg, const MatchSetup& setup)
  : cfg_(cfg),
    setup_(setup),
    platform_(cfg.arena),
    pu_rng_(setup.seed, kPowerUpStream),
    ai_rng_{MatchRng(setup.seed, kAiStreamBase + 0), MatchRng(setup.seed, kAiStreamBase + 1)},
    powerups_(cfg_, pu_rng_),
    grid_(grid_half_extent(cfg), grid_cell(cfg)),
    round_ticks_(static_cast<std::uint64_t>(seconds_to_ticks(cfg.round_time_s, cfg.dt))),
    radius_(platform_.current_radius(0.0)) {
  for (std::size_t i = 0; i < kActorCount; ++i) init_actor_(i);
  spdlog::debug("match: seed {} radius {:.1f} stocks {}", setup.seed, radius_, cfg.stocks);
}

void Match::init_actor_(std::size_t slot) {
  Actor& a = actors_[slot];
  a = Actor{};
  a.slot = static_cast<Slot>(slot);
  a.pos = setup_.spawns[slot].pos;
  a.last_valid_pos = a.pos;
  a.spawn_pos = a.pos;
  a.facing = normalized_or(-a.pos, -default_bearing(slot));
  a.stocks = cfg_.stocks;
  a.dash.charges = cfg_.dash.charges;
}

TickResult Match::tick(const std::array<InputFrame, kActorCount>& frames) {
  TickResult out{};
  if (over_) {
    out.status = TickStatus::MatchOver;
    out.snapshot = snapshot();
    return out;
  }
  for (std::size_t i = 0; i < kActorCount; ++i) {
    if (frames[i].tick != tick_ || frames[i].slot != i) {
      spdlog::error("match: frame for tick {} slot {} arrived at tick {} slot {}",
                    frames[i].tick, static_cast<int>(frames[i].slot), tick_, i);
      out.status = TickStatus::Desync;
      out.snapshot = snapshot();
      return out;
    }
  }

  const std::uint64_t t = tick_;
  EventList& ev = out.events;
  radius_ = platform_.current_radius(static_cast<double>(t + 1) * cfg_.dt);

  powerups_.advance(t, radius_, pu_rng_, ev);
  for (auto& a : actors_) if (a.alive) tick_effects(a, cfg_, t, ev);

  std::array<Vec2, kActorCount> start{};
  for (std::size_t i = 0; i < kActorCount; ++i) {
    Actor& a = actors_[i];
    const ActorStepResult r = step_actor(a, frames[i], cfg_, cfg_.dt);
    start[i] = r.start_pos;
    if (r.dash_started) {
      SimEvent e{};
      e.kind = EventKind::DashStarted;
      e.tick = t;
      e.actor = static_cast<int>(i);
      e.pos = a.pos;
      ev.push_back(e);
    }
    if (r.anomaly) {
      SimEvent e{};
      e.kind = EventKind::PhysicsAnomaly;
      e.tick = t;
      e.actor = static_cast<int>(i);
      e.pos = a.pos;
      ev.push_back(e);
    }
  }

  // Actors enter the grid with their displacement folded into the radius so
  // the broad phase covers the whole swept path.
  std::vector<GridEntity> entities;
  for (std::size_t i = 0; i < kActorCount; ++i) {
    const Actor& a = actors_[i];
    if (!a.alive) continue;
    entities.push_back(GridEntity{actor_entity(i), a.pos, a.radius(cfg_) + length(a.pos - start[i])});
  }
  powerups_.register_entities(entities);
  grid_.clear_and_rebuild(entities);

  resolve_collision_(start, ev);
  powerups_.resolve_pickups(t, actors_, start, grid_, radius_, pu_rng_, ev);

  for (auto& a : actors_) {
    if (a.alive && PlatformController::is_out_of_bounds(a.pos, radius_)) eliminate_(a, ev);
  }

  ++tick_;
  check_end_(ev);
  for (auto& e : ev) e.tick = t;

  out.status = over_ ? TickStatus::MatchOver : TickStatus::Ok;
  out.snapshot = snapshot();
  return out;
}

void Match::resolve_collision_(const std::array<Vec2, kActorCount>& start, EventList& events) {
  Actor& a = actors_[0];
  Actor& b = actors_[1];
  if (!a.alive || !b.alive) return;

  // Fast movers sweep their segment; slow ones use a point query at the end
  // widened by their own displacement.
  const double ra = a.radius(cfg_);
  const double step = length(a.pos - start[0]);
  const bool fast = step > ra || step > grid_.cell_size();
  const auto candidates = fast ? grid_.query_swept(start[0], a.pos, ra)
                               : grid_.query_radius(a.pos, ra + step);
  if (!std::binary_search(candidates.begin(), candidates.end(), actor_entity(1))) return;

  const CollisionResult c = resolve_actor_collision(a, start[0], b, start[1], cfg_);
  if (!c.collided) return;

  SimEvent e{};
  e.kind = EventKind::CollisionOccurred;
  e.tick = tick_;
  e.actor = 0;
  e.other = 1;
  e.magnitude = c.impulse;
  e.pos = (a.pos + b.pos) * 0.5;
  events.push_back(e);

  for (Actor* x : {&a, &b}) {
    if (repair_non_finite(*x)) {
      SimEvent an{};
      an.kind = EventKind::PhysicsAnomaly;
      an.tick = tick_;
      an.actor = static_cast<int>(x->slot);
      an.pos = x->pos;
      events.push_back(an);
    } else {
      x->last_valid_pos = x->pos;
    }
  }
}

void Match::eliminate_(Actor& a, EventList& events) {
  a.stocks = std::max(0, a.stocks - 1);

  SimEvent e{};
  e.kind = EventKind::ActorEliminated;
  e.tick = tick_;
  e.actor = static_cast<int>(a.slot);
  e.stocks_remaining = a.stocks;
  e.pos = a.pos;
  events.push_back(e);
  spdlog::debug("tick {}: actor {} out at r={:.2f} (arena {:.2f}), {} stocks left",
                tick_, static_cast<int>(a.slot), length(a.pos), radius_, a.stocks);

  if (a.stocks == 0) {
    a.alive = false;
    a.vel = Vec2{};
    return;
  }

  const Vec2 bearing = normalized_or(a.spawn_pos, default_bearing(a.slot));
  const double dist = std::min(length(a.spawn_pos), cfg_.respawn_fraction * radius_);
  a.pos = bearing * dist;
  a.last_valid_pos = a.pos;
  a.vel = Vec2{};
  a.facing = -bearing;
  a.dash = DashState{};
  a.dash.charges = cfg_.dash.charges;
  a.effects.fill(0);

  SimEvent r{};
  r.kind = EventKind::ActorRespawned;
  r.tick = tick_;
  r.actor = static_cast<int>(a.slot);
  r.stocks_remaining = a.stocks;
  r.pos = a.pos;
  events.push_back(r);
}

void Match::check_end_(EventList& events) {
  const bool alive0 = actors_[0].alive;
  const bool alive1 = actors_[1].alive;

  if (alive0 && alive1) {
    if (tick_ < round_ticks_) return;
    end_reason_ = MatchEndReason::Timeout;
    const Actor& a = actors_[0];
    const Actor& b = actors_[1];
    if (a.stocks != b.stocks) {
      winner_ = a.stocks > b.stocks ? 0 : 1;
    } else {
      const double da = length_sq(a.pos);
      const double db = length_sq(b.pos);
      winner_ = da < db ? 0 : (db < da ? 1 : kNoActor);
    }
  } else {
    end_reason_ = MatchEndReason::Stocks;
    winner_ = alive0 ? 0 : (alive1 ? 1 : kNoActor);
  }

  over_ = true;
  SimEvent e{};
  e.kind = EventKind::MatchEnded;
  e.tick = tick_;
  e.actor = winner_;
  e.end_reason = end_reason_;
  events.push_back(e);
  spdlog::info("match over at tick {}: winner {} ({})", tick_,
               winner_ == kNoActor ? std::string("draw") : std::to_string(winner_),
               to_string(end_reason_));
}

ArenaSnapshot Match::snapshot() const {
  ArenaSnapshot s{};
  s.tick = tick_;
  s.sim_time = elapsed();
  s.arena_radius = radius_;
  s.platform_phase = platform_.phase(elapsed());
  s.match_over = over_;
  s.winner = winner_;
  s.actors.reserve(kActorCount);
  for (const auto& a : actors_) {
    ActorPose p{};
    p.slot = a.slot;
    p.x = a.pos.x;  p.y = a.pos.y;
    p.vx = a.vel.x; p.vy = a.vel.y;
    p.facing_rad = std::atan2(a.facing.y, a.facing.x);
    p.radius = a.radius(cfg_);
    p.dash = a.dash.phase;
    p.dash_charges = a.dash.charges;
    p.stocks = a.stocks;
    p.alive = a.alive;
    p.effects_mask = a.effects_mask();
    s.actors.push_back(p);
  }
  const auto& slots = powerups_.slots();
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (slots[i].state != SlotState::Spawning && slots[i].state != SlotState::Active) continue;
    PowerUpPose pp{};
    pp.slot = static_cast<int>(i);
    pp.kind = slots[i].item.kind;
    pp.state = slots[i].state;
    pp.x = slots[i].item.pos.x;
    pp.y = slots[i].item.pos.y;
    s.powerups.push_back(pp);
  }
  return s;
}

} // namespace ringout
