#pragma once
#include <ringout/actor.hpp>
#include <ringout/config.hpp>
#include <ringout/input.hpp>
#include <ringout/vec2.hpp>

namespace ringout {

struct ActorStepResult {
  bool dash_started = false;
  bool anomaly = false;     // state was non-finite and got reset
  Vec2 start_pos{};         // position before integration (sweep origin)
};

// Earliest contact of two moving circles within one tick.
struct Contact {
  bool   hit = false;
  double toi = 1.0;         // fraction of the tick, 0 = overlapping at start
  Vec2   normal{1.0, 0.0};  // from a towards b at contact
};

struct CollisionResult {
  bool   collided = false;
  double impulse = 0.0;     // normal impulse plus knockback
  bool   knockback = false;
  Vec2   normal{1.0, 0.0};
};

// Advances one actor by dt: dash timers, steering or dash impulse, friction,
// speed clamp and position. Input is sanitized before use.
ActorStepResult step_actor(Actor& a, const InputFrame& in, const MatchConfig& cfg, double dt);

// Relative-motion sweep of circle a (a0 -> a1, ra) against circle b (b0 -> b1, rb).
Contact sweep_actors(Vec2 a0, Vec2 a1, double ra, Vec2 b0, Vec2 b1, double rb);

// Narrow phase and response for the two actors after both integrated this
// tick. a0/b0 are their start positions. Places both at the contact (or
// separates an overlap by inverse mass), exchanges normal impulse with
// restitution, then applies collision push and dash knockback.
CollisionResult resolve_actor_collision(Actor& a, Vec2 a0, Actor& b, Vec2 b0, const MatchConfig& cfg);

// Effective mass for momentum exchange.
double actor_mass(const Actor& a, const MatchConfig& cfg);

// Resets non-finite position/velocity to the last valid position at rest.
// Returns true if a reset happened.
bool repair_non_finite(Actor& a);

// Ticks needed for a dash to be Active and for one charge to return.
int dash_active_ticks(const MatchConfig& cfg);
int dash_cooldown_ticks(const MatchConfig& cfg);

} // namespace ringout
