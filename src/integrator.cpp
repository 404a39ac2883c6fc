#include <ringout/integrator.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace ringout {

namespace {

void advance_dash_timers(Actor& a, const MatchConfig& cfg) {
  auto& d = a.dash;
  const int max_charges = a.max_dash_charges(cfg);

  if (d.phase == DashPhase::Active) {
    if (--d.remaining_ticks <= 0) {
      d.remaining_ticks = 0;
      d.phase = d.charges > 0 ? DashPhase::Ready : DashPhase::Cooldown;
    }
  }

  if (d.recharge_ticks > 0 && --d.recharge_ticks == 0) {
    d.charges = std::min(d.charges + 1, max_charges);
  }
  if (d.charges < max_charges && d.recharge_ticks == 0) {
    const int cd = dash_cooldown_ticks(cfg);
    if (cd > 0) d.recharge_ticks = cd;
    else        d.charges = max_charges;
  }
  if (d.phase == DashPhase::Cooldown && d.charges > 0) d.phase = DashPhase::Ready;
}

} // namespace

int dash_active_ticks(const MatchConfig& cfg) {
  return std::max(1, seconds_to_ticks(cfg.dash.duration_s, cfg.dt));
}

int dash_cooldown_ticks(const MatchConfig& cfg) {
  return seconds_to_ticks(cfg.dash.cooldown_s, cfg.dt);
}

double actor_mass(const Actor& a, const MatchConfig& cfg) {
  return a.dash.phase == DashPhase::Active ? cfg.dash.mass_ratio : 1.0;
}

bool repair_non_finite(Actor& a) {
  if (is_finite(a.pos) && is_finite(a.vel)) return false;
  spdlog::warn("actor {}: non-finite state, reset to ({:.3f}, {:.3f})",
               static_cast<int>(a.slot), a.last_valid_pos.x, a.last_valid_pos.y);
  a.pos = a.last_valid_pos;
  a.vel = Vec2{};
  return true;
}

ActorStepResult step_actor(Actor& a, const InputFrame& raw, const MatchConfig& cfg, double dt) {
  ActorStepResult r{};
  r.start_pos = a.pos;
  if (!a.alive) return r;

  const InputFrame in = sanitize_input(raw);
  advance_dash_timers(a, cfg);

  const bool frozen = a.has_effect(EffectKind::Frozen);
  const Vec2 dir = frozen ? Vec2{} : input_direction(in);
  const bool has_dir = length_sq(dir) > 0.0;
  if (has_dir) a.facing = normalized_or(dir, a.facing);

  auto& d = a.dash;
  if (!frozen && in.dash && d.phase != DashPhase::Active && d.charges > 0) {
    const Vec2 heading = normalized_or(dir, normalized_or(a.facing, Vec2{1.0, 0.0}));
    a.vel = heading * cfg.dash.speed;
    a.facing = heading;
    d.phase = DashPhase::Active;
    d.remaining_ticks = dash_active_ticks(cfg);
    d.hit_landed = false;
    --d.charges;
    if (d.recharge_ticks == 0) d.recharge_ticks = dash_cooldown_ticks(cfg);
    r.dash_started = true;
  } else if (d.phase != DashPhase::Active) {
    const Vec2 target = dir * a.move_speed(cfg);
    const double k = std::min(1.0, cfg.steer_accel * dt);
    a.vel += (target - a.vel) * k;
    a.vel *= std::pow(cfg.friction_per_tick, dt * 60.0);
  }

  const double cap = std::max(cfg.max_speed, cfg.dash.speed);
  const double speed = length(a.vel);
  if (speed > cap) a.vel *= cap / speed;
  if (!has_dir && d.phase != DashPhase::Active && speed < cfg.rest_speed) a.vel = Vec2{};

  a.pos += a.vel * dt;
  if (repair_non_finite(a)) {
    r.anomaly = true;
  } else {
    a.last_valid_pos = a.pos;
  }
  return r;
}

Contact sweep_actors(Vec2 a0, Vec2 a1, double ra, Vec2 b0, Vec2 b1, double rb) {
  Contact c{};
  const Vec2 p = a0 - b0;
  const Vec2 v = (a1 - a0) - (b1 - b0);
  const double R = ra + rb;
  const double cc = dot(p, p) - R * R;
  if (cc <= 0.0) {
    // In contact at the start but separating and apart by the end: nothing to resolve.
    const Vec2 p1 = p + v;
    if (dot(p, v) >= 0.0 && dot(p1, p1) >= R * R) return c;
    c.hit = true;
    c.toi = 0.0;
  } else {
    const double aa = dot(v, v);
    const double bb = 2.0 * dot(p, v);
    if (aa <= 0.0 || bb >= 0.0) return c;   // not approaching
    const double disc = bb * bb - 4.0 * aa * cc;
    if (disc < 0.0) return c;
    const double t = (-bb - std::sqrt(disc)) / (2.0 * aa);
    if (t < 0.0 || t > 1.0) return c;
    c.hit = true;
    c.toi = t;
  }
  const Vec2 ac = a0 + (a1 - a0) * c.toi;
  const Vec2 bc = b0 + (b1 - b0) * c.toi;
  c.normal = normalized_or(bc - ac, Vec2{1.0, 0.0});
  return c;
}

CollisionResult resolve_actor_collision(Actor& a, Vec2 a0, Actor& b, Vec2 b0, const MatchConfig& cfg) {
  CollisionResult res{};
  if (!a.alive || !b.alive) return res;

  const double ra = a.radius(cfg);
  const double rb = b.radius(cfg);
  const Contact c = sweep_actors(a0, a.pos, ra, b0, b.pos, rb);
  if (!c.hit) return res;

  if (c.toi > 0.0) {
    a.pos = a0 + (a.pos - a0) * c.toi;
    b.pos = b0 + (b.pos - b0) * c.toi;
  }

  // Zero-length separation falls back to a's facing, then +x.
  const Vec2 fallback = normalized_or(a.facing, Vec2{1.0, 0.0});
  const Vec2 n = normalized_or(b.pos - a.pos, fallback);

  const double inv_a = 1.0 / actor_mass(a, cfg);
  const double inv_b = 1.0 / actor_mass(b, cfg);
  const double inv_sum = inv_a + inv_b;

  const double pen = ra + rb - length(b.pos - a.pos);
  if (pen > 0.0) {
    a.pos -= n * (pen * inv_a / inv_sum);
    b.pos += n * (pen * inv_b / inv_sum);
  }

  double j = 0.0;
  const double vn = dot(b.vel - a.vel, n);
  if (vn < 0.0) {
    j = -(1.0 + cfg.restitution) * vn / inv_sum;
    a.vel -= n * (j * inv_a);
    b.vel += n * (j * inv_b);
  }

  if (cfg.collision_push > 0.0) {
    if (!a.has_effect(EffectKind::Shield)) a.vel -= n * (cfg.collision_push * 2.0 * inv_a / inv_sum);
    if (!b.has_effect(EffectKind::Shield)) b.vel += n * (cfg.collision_push * 2.0 * inv_b / inv_sum);
  }

  const double kb = cfg.dash.knockback_scale * cfg.dash.speed;
  double knock = 0.0;
  if (a.dash.phase == DashPhase::Active && !a.dash.hit_landed) {
    a.dash.hit_landed = true;
    if (!b.has_effect(EffectKind::Shield)) { b.vel += n * kb; knock += kb; }
  }
  if (b.dash.phase == DashPhase::Active && !b.dash.hit_landed) {
    b.dash.hit_landed = true;
    if (!a.has_effect(EffectKind::Shield)) { a.vel -= n * kb; knock += kb; }
  }

  res.collided = true;
  res.impulse = j + knock;
  res.knockback = knock > 0.0;
  res.normal = n;
  return res;
}

} // namespace ringout
