#include <catch2/catch.hpp>
#include <array>
#include <set>
#include <vector>

#include <ringout/powerup.hpp>

using Catch::Detail::Approx;
using namespace ringout;

static MatchConfig slow_spawn_config() {
  MatchConfig cfg{};
  cfg.powerups.max_active = 1;
  cfg.powerups.spawn_interval_s = 1.0;
  cfg.powerups.spawn_jitter = 0.0;
  cfg.powerups.telegraph_s = 0.5;
  cfg.powerups.lifetime_s = 2.0;
  return cfg;
}

static std::array<Actor, kActorCount> fresh_actors(const MatchConfig& cfg) {
  std::array<Actor, kActorCount> actors{};
  for (std::size_t i = 0; i < kActorCount; ++i) {
    actors[i].slot = static_cast<Slot>(i);
    actors[i].stocks = cfg.stocks;
    actors[i].dash.charges = cfg.dash.charges;
  }
  return actors;
}

static const SimEvent* first_of(const EventList& ev, EventKind k) {
  for (const auto& e : ev) if (e.kind == k) return &e;
  return nullptr;
}

TEST_CASE("Power-up slot goes through telegraph, active and expiry") {
  const MatchConfig cfg = slow_spawn_config();
  MatchRng rng(7, kPowerUpStream);
  PowerUpManager m(cfg, rng);
  REQUIRE(m.slots().size() == 1);
  REQUIRE(m.next_spawn_tick() == 60);

  EventList ev;
  for (std::uint64_t t = 0; t < 60; ++t) m.advance(t, 300.0, rng, ev);
  REQUIRE(ev.empty());
  REQUIRE(m.slots()[0].state == SlotState::Empty);

  m.advance(60, 300.0, rng, ev);
  REQUIRE(m.slots()[0].state == SlotState::Spawning);
  REQUIRE(ev.empty());
  REQUIRE(length(m.slots()[0].item.pos) <= 0.7 * 300.0);

  for (std::uint64_t t = 61; t <= 90; ++t) m.advance(t, 300.0, rng, ev);
  const SimEvent* spawned = first_of(ev, EventKind::PowerUpSpawned);
  REQUIRE(spawned != nullptr);
  REQUIRE(spawned->tick == 90);
  REQUIRE(m.slots()[0].state == SlotState::Active);
  REQUIRE(m.active_count() == 1);

  // No free slot: the cadence moves on without spawning.
  for (std::uint64_t t = 91; t <= 210; ++t) m.advance(t, 300.0, rng, ev);
  const SimEvent* expired = first_of(ev, EventKind::PowerUpExpired);
  REQUIRE(expired != nullptr);
  REQUIRE(expired->tick == 210);
  REQUIRE(m.slots()[0].state == SlotState::Expired);

  m.advance(211, 300.0, rng, ev);
  REQUIRE(m.slots()[0].state == SlotState::Empty);
}

TEST_CASE("Items left outside the shrinking arena expire") {
  MatchConfig cfg = slow_spawn_config();
  cfg.powerups.telegraph_s = 0.0;
  MatchRng rng(11, kPowerUpStream);
  PowerUpManager m(cfg, rng);

  EventList ev;
  for (std::uint64_t t = 0; t <= 60; ++t) m.advance(t, 300.0, rng, ev);
  REQUIRE(m.slots()[0].state == SlotState::Active);

  m.advance(61, 1e-9, rng, ev);
  REQUIRE(m.slots()[0].state == SlotState::Expired);
  REQUIRE(first_of(ev, EventKind::PowerUpExpired) != nullptr);
}

TEST_CASE("Disabled power-ups never spawn or draw randomness") {
  MatchConfig cfg{};
  cfg.powerups.max_active = 0;
  MatchRng rng(3, kPowerUpStream);
  PowerUpManager m(cfg, rng);
  EventList ev;
  for (std::uint64_t t = 0; t < 2000; ++t) m.advance(t, 300.0, rng, ev);
  REQUIRE(ev.empty());
  REQUIRE(rng.draws() == 0);
}

TEST_CASE("Claims apply every kind's effect") {
  MatchConfig cfg{};
  cfg.powerups.max_active = 1;
  cfg.powerups.spawn_interval_s = cfg.dt;
  cfg.powerups.spawn_jitter = 0.0;
  cfg.powerups.telegraph_s = 0.0;
  const double radius = 300.0;

  MatchRng rng(21, kPowerUpStream);
  PowerUpManager m(cfg, rng);
  SpatialGrid grid(400.0, 50.0);
  std::set<PowerUpKind> seen;

  for (std::uint64_t t = 0; t < 400; ++t) {
    EventList ev;
    m.advance(t, radius, rng, ev);
    if (m.slots()[0].state != SlotState::Active) continue;

    auto actors = fresh_actors(cfg);
    const Vec2 item = m.slots()[0].item.pos;
    actors[0].pos = item;
    actors[1].pos = Vec2{-290.0, 0.0};
    const std::array<Vec2, kActorCount> start{actors[0].pos, actors[1].pos};

    std::vector<GridEntity> entities;
    m.register_entities(entities);
    grid.clear_and_rebuild(entities);
    m.resolve_pickups(t, actors, start, grid, radius, rng, ev);

    const SimEvent* claim = first_of(ev, EventKind::PowerUpClaimed);
    REQUIRE(claim != nullptr);
    REQUIRE(claim->actor == 0);
    REQUIRE(m.slots()[0].state == SlotState::Claimed);
    seen.insert(claim->powerup);

    const Actor& a = actors[0];
    const Actor& b = actors[1];
    switch (claim->powerup) {
      case PowerUpKind::SpeedBoost:
        REQUIRE(a.has_effect(EffectKind::SpeedBoost));
        REQUIRE(a.move_speed(cfg) == Approx(cfg.move_speed * cfg.powerups.speed_multiplier));
        break;
      case PowerUpKind::Shield:
        REQUIRE(a.has_effect(EffectKind::Shield));
        break;
      case PowerUpKind::SizeUp:
        REQUIRE(a.radius(cfg) == Approx(cfg.actor_radius * cfg.powerups.size_up_multiplier));
        break;
      case PowerUpKind::SizeDown:
        REQUIRE(a.radius(cfg) == Approx(cfg.actor_radius * cfg.powerups.size_down_multiplier));
        break;
      case PowerUpKind::MultiDash:
        REQUIRE(a.dash.charges == cfg.dash.charges + cfg.powerups.multi_dash_bonus);
        break;
      case PowerUpKind::Teleport:
        REQUIRE(length(a.pos) <= cfg.powerups.teleport_radius_fraction * radius + 1e-9);
        REQUIRE(a.vel == Vec2{});
        break;
      case PowerUpKind::Freeze:
        REQUIRE(claim->other == 1);
        REQUIRE(b.has_effect(EffectKind::Frozen));
        REQUIRE_FALSE(a.has_effect(EffectKind::Frozen));
        break;
      case PowerUpKind::Magnet:
        REQUIRE(a.has_effect(EffectKind::Magnet));
        break;
      default:
        FAIL("unexpected kind");
    }
  }
  REQUIRE(seen.size() == static_cast<std::size_t>(PowerUpKind::Count));
}

TEST_CASE("Pickups sweep the whole path of a fast mover") {
  MatchConfig cfg = slow_spawn_config();
  cfg.powerups.telegraph_s = 0.0;
  MatchRng rng(5, kPowerUpStream);
  PowerUpManager m(cfg, rng);

  EventList ev;
  for (std::uint64_t t = 0; t <= 60; ++t) m.advance(t, 300.0, rng, ev);
  REQUIRE(m.slots()[0].state == SlotState::Active);
  const Vec2 item = m.slots()[0].item.pos;

  auto actors = fresh_actors(cfg);
  actors[0].pos = item + Vec2{60.0, 0.0};
  actors[1].pos = Vec2{-290.0, 0.0};
  const std::array<Vec2, kActorCount> start{item - Vec2{60.0, 0.0}, actors[1].pos};

  SpatialGrid grid(400.0, 50.0);
  std::vector<GridEntity> entities;
  m.register_entities(entities);
  grid.clear_and_rebuild(entities);
  m.resolve_pickups(60, actors, start, grid, 300.0, rng, ev);
  REQUIRE(m.slots()[0].state == SlotState::Claimed);
}

TEST_CASE("Effects count down and emit EffectExpired") {
  const MatchConfig cfg{};
  Actor a{};
  a.effect_ticks(EffectKind::SpeedBoost) = 2;
  a.effect_ticks(EffectKind::MultiDash) = 1;
  a.dash.charges = 3;

  EventList ev;
  tick_effects(a, cfg, 10, ev);
  REQUIRE(a.effect_ticks(EffectKind::SpeedBoost) == 1);
  REQUIRE_FALSE(a.has_effect(EffectKind::MultiDash));
  REQUIRE(a.dash.charges == cfg.dash.charges);
  REQUIRE(ev.size() == 1);
  REQUIRE(ev[0].effect == EffectKind::MultiDash);
  REQUIRE(ev[0].tick == 10);

  tick_effects(a, cfg, 11, ev);
  REQUIRE(ev.size() == 2);
  REQUIRE(ev[1].effect == EffectKind::SpeedBoost);
  REQUIRE(a.effects_mask() == 0);
}
