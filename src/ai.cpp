#include <ringout/ai.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <ringout/integrator.hpp>
#include <ringout/match.hpp>

namespace ringout {

const char* to_string(AiMode m) {
  switch (m) {
    case AiMode::Idle:         return "idle";
    case AiMode::Approach:     return "approach";
    case AiMode::Retreat:      return "retreat";
    case AiMode::Bait:         return "bait";
    case AiMode::Punish:       return "punish";
    case AiMode::FleeBoundary: return "flee_boundary";
    case AiMode::Recover:      return "recover";
  }
  return "unknown";
}

const char* to_string(ObservedDash d) {
  switch (d) {
    case ObservedDash::Ready:    return "ready";
    case ObservedDash::Active:   return "active";
    case ObservedDash::Cooldown: return "cooldown";
  }
  return "unknown";
}

Perception perceive(const ArenaSnapshot& snap, Slot self) {
  Perception p{};
  p.tick = snap.tick;
  p.self_slot = self;
  p.arena_radius = snap.arena_radius;
  if (const ActorPose* me = find_actor(snap, self)) {
    p.self_pos = {me->x, me->y};
    p.self_vel = {me->vx, me->vy};
    p.self_facing = from_angle(me->facing_rad);
    p.self_dash_phase = me->dash;
    p.self_dash_ready = me->dash != DashPhase::Active && me->dash_charges > 0;
  }
  if (const ActorPose* opp = find_actor(snap, 1 - static_cast<int>(self))) {
    p.opponent_alive = opp->alive;
    p.opp_pos = {opp->x, opp->y};
    p.opp_vel = {opp->vx, opp->vy};
  } else {
    p.opponent_alive = false;
  }
  return p;
}

Perception perceive(const Match& match, Slot self) {
  return perceive(match.snapshot(), self);
}

namespace {

struct RuleInput {
  const Perception& p;
  const MatchConfig& cfg;
  ObservedDash opp;
  double dist;
  double margin;       // distance to the edge as a fraction of the radius
  double self_speed;
};

struct Rule {
  AiMode mode;
  bool (*applies)(const RuleInput&);
};

// Evaluated top to bottom; the first match wins.
const Rule kRules[] = {
  {AiMode::Idle,         [](const RuleInput& r) { return !r.p.opponent_alive; }},
  {AiMode::FleeBoundary, [](const RuleInput& r) { return r.margin < r.cfg.ai.flee_margin_fraction; }},
  {AiMode::Recover,      [](const RuleInput& r) {
     return r.p.self_dash_phase != DashPhase::Active &&
            r.self_speed > r.cfg.ai.recover_speed_fraction * r.cfg.move_speed; }},
  {AiMode::Punish,       [](const RuleInput& r) {
     return r.opp == ObservedDash::Active && r.dist < r.cfg.ai.punish_range && r.p.self_dash_ready; }},
  {AiMode::Approach,     [](const RuleInput& r) {
     return r.opp == ObservedDash::Cooldown && r.dist < r.cfg.ai.bait_range; }},
  {AiMode::Retreat,      [](const RuleInput& r) {
     return r.dist < r.cfg.ai.retreat_range && !r.p.self_dash_ready; }},
  {AiMode::Bait,         [](const RuleInput& r) {
     return r.dist < r.cfg.ai.bait_range && r.p.self_dash_ready && r.opp == ObservedDash::Ready; }},
  {AiMode::Approach,     [](const RuleInput& r) { return r.dist >= r.cfg.ai.bait_range; }},
};

Vec2 rotate(Vec2 v, double rad) {
  const double c = std::cos(rad), s = std::sin(rad);
  return {v.x * c - v.y * s, v.x * s + v.y * c};
}

// Pick the perpendicular of `axis` that points toward the centre.
Vec2 side_toward_centre(Vec2 axis, Vec2 centre) {
  Vec2 side = perp(axis);
  if (dot(side, centre) < 0.0) side = -side;
  return side;
}

} // namespace

AIDecisionEngine::AIDecisionEngine(const MatchConfig& cfg, Slot slot, DifficultyTier tier)
  : cfg_(cfg),
    slot_(slot),
    tier_(tier),
    params_(cfg.tier(tier)),
    reaction_ticks_(std::max(1, seconds_to_ticks(params_.reaction_s, cfg.dt))),
    prediction_ticks_(std::max(1, seconds_to_ticks(params_.prediction_s, cfg.dt))),
    dash_cooldown_ticks_(dash_active_ticks(cfg) + dash_cooldown_ticks(cfg)) {}

void AIDecisionEngine::reset() {
  mode_ = AiMode::Idle;
  decision_timer_ = 0;
  opp_history_.clear();
  opp_dash_ = ObservedDash::Ready;
  opp_dash_seen_tick_ = -1;
}

void AIDecisionEngine::observe_(const Perception& p) {
  if (!p.opponent_alive) {
    opp_history_.clear();
    opp_dash_ = ObservedDash::Ready;
    return;
  }
  opp_history_.push_back(p.opp_pos);
  while (opp_history_.size() > static_cast<std::size_t>(prediction_ticks_ + 1)) opp_history_.pop_front();

  const auto now = static_cast<std::int64_t>(p.tick);
  if (length(p.opp_vel) >= cfg_.ai.dash_detect_fraction * cfg_.dash.speed) {
    opp_dash_ = ObservedDash::Active;
    opp_dash_seen_tick_ = now;
  } else if (opp_dash_seen_tick_ >= 0 && now - opp_dash_seen_tick_ <= dash_cooldown_ticks_) {
    opp_dash_ = ObservedDash::Cooldown;
  } else {
    opp_dash_ = ObservedDash::Ready;
  }
}

Vec2 AIDecisionEngine::predicted_opponent_(const Perception& p) const {
  Vec2 v = p.opp_vel;
  if (opp_history_.size() >= 2) {
    const double span = static_cast<double>(opp_history_.size() - 1) * cfg_.dt;
    v = (opp_history_.back() - opp_history_.front()) / span;
  }
  return p.opp_pos + v * params_.prediction_s;
}

AiMode AIDecisionEngine::evaluate_(const Perception& p) const {
  const double self_r = length(p.self_pos);
  const RuleInput in{
    p, cfg_, opp_dash_,
    length(p.opp_pos - p.self_pos),
    p.arena_radius > 0.0 ? (p.arena_radius - self_r) / p.arena_radius : 0.0,
    length(p.self_vel)
  };
  for (const auto& rule : kRules) {
    if (rule.applies(in)) return rule.mode;
  }
  spdlog::debug("ai {}: no rule for dist={:.1f} margin={:.2f} opp={}, idling",
                static_cast<int>(slot_), in.dist, in.margin, to_string(opp_dash_));
  return AiMode::Idle;
}

void AIDecisionEngine::act_(const Perception& p, Vec2& dir, bool& dash) const {
  dir = Vec2{};
  dash = false;

  const Vec2 centre = normalized_or(-p.self_pos, Vec2{});
  const Vec2 to_opp = p.opp_pos - p.self_pos;
  const double dist = length(to_opp);
  const Vec2 facing = normalized_or(p.self_facing, Vec2{1.0, 0.0});

  // A dash along d should leave the actor on the platform.
  auto lands_inside = [&](Vec2 d) {
    const double travel = 1.5 * cfg_.dash.speed * cfg_.dash.duration_s;
    return length(p.self_pos + d * travel) < p.arena_radius - cfg_.actor_radius;
  };

  switch (mode_) {
    case AiMode::Idle:
      break;
    case AiMode::Approach: {
      dir = normalized_or(predicted_opponent_(p) - p.self_pos, facing);
      dash = dist > cfg_.ai.dash_range_min && dist < cfg_.ai.dash_range_max && lands_inside(dir);
      break;
    }
    case AiMode::Retreat: {
      const Vec2 away = normalized_or(-to_opp, centre);
      dir = normalized_or(away * 0.6 + centre * 0.4, away);
      break;
    }
    case AiMode::Bait: {
      const Vec2 side = side_toward_centre(normalized_or(to_opp, facing), centre);
      dir = normalized_or(side * 0.8 + centre * 0.2, side);
      if (dist <= cfg_.ai.dash_range_max * 0.75) {
        const Vec2 strike = normalized_or(predicted_opponent_(p) - p.self_pos, facing);
        if (lands_inside(strike)) { dir = strike; dash = true; }
      }
      break;
    }
    case AiMode::Punish: {
      dir = side_toward_centre(normalized_or(p.opp_vel, normalized_or(to_opp, facing)), centre);
      dash = dist < cfg_.ai.punish_range * 0.5 && lands_inside(dir);
      break;
    }
    case AiMode::FleeBoundary: {
      dir = length_sq(centre) > 0.0 ? centre : facing;
      dash = dot(p.self_vel, p.self_pos) > 0.0 &&
             p.arena_radius > 0.0 &&
             (p.arena_radius - length(p.self_pos)) / p.arena_radius < cfg_.ai.flee_margin_fraction * 0.5;
      break;
    }
    case AiMode::Recover: {
      const Vec2 brake = normalized_or(-p.self_vel, centre);
      dir = normalized_or(brake * 0.7 + centre * 0.3, brake);
      break;
    }
  }
}

InputFrame AIDecisionEngine::decide(const Perception& p, MatchRng& rng) {
  observe_(p);

  if (decision_timer_ <= 0) {
    const AiMode next = evaluate_(p);
    // Hesitation: occasionally keep the previous mode for another window.
    if (next == mode_ || !rng.chance(params_.mistake_probability)) mode_ = next;
    decision_timer_ = reaction_ticks_ - 1;
  } else {
    --decision_timer_;
  }

  Vec2 dir{};
  bool dash = false;
  act_(p, dir, dash);

  if (!p.self_dash_ready) dash = false;
  if (dash && rng.chance(params_.mistake_probability)) dash = false;
  if (length_sq(dir) > 0.0 && rng.chance(params_.mistake_probability)) {
    dir = rotate(dir, rng.uniform(-0.5, 0.5));
  }
  return quantize_input(p.tick, slot_, dir, dash);
}

} // namespace ringout
