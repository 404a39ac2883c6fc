#pragma once
#include <cstdint>
#include <deque>
#include <ringout/actor.hpp>
#include <ringout/config.hpp>
#include <ringout/input.hpp>
#include <ringout/rng.hpp>
#include <ringout/snap.hpp>
#include <ringout/vec2.hpp>

namespace ringout {

class Match;

enum class AiMode : int { Idle = 0, Approach, Retreat, Bait, Punish, FleeBoundary, Recover };

// Opponent dash phase as the AI believes it to be.
enum class ObservedDash : int { Ready = 0, Active, Cooldown };

const char* to_string(AiMode m);
const char* to_string(ObservedDash d);

// What an AI may know: public kinematics plus its own dash readiness.
// The opponent's dash state, effects and inputs are not included.
struct Perception {
  std::uint64_t tick = 0;          // tick the decision is for
  Slot   self_slot = 0;
  Vec2   self_pos{};
  Vec2   self_vel{};
  Vec2   self_facing{1.0, 0.0};
  DashPhase self_dash_phase = DashPhase::Ready;
  bool   self_dash_ready = true;
  bool   opponent_alive = true;
  Vec2   opp_pos{};
  Vec2   opp_vel{};
  double arena_radius = 0.0;
};

Perception perceive(const ArenaSnapshot& snap, Slot self);
Perception perceive(const Match& match, Slot self);

// Finite-state opponent. One instance per AI-controlled slot; all randomness
// comes from the match's AI stream for that slot.
class AIDecisionEngine {
public:
  AIDecisionEngine(const MatchConfig& cfg, Slot slot, DifficultyTier tier);

  // Produces a legal InputFrame for p.tick.
  InputFrame decide(const Perception& p, MatchRng& rng);

  AiMode mode() const { return mode_; }
  ObservedDash opponent_dash() const { return opp_dash_; }
  DifficultyTier tier() const { return tier_; }
  Slot slot() const { return slot_; }
  void reset();

private:
  void observe_(const Perception& p);
  AiMode evaluate_(const Perception& p) const;
  Vec2 predicted_opponent_(const Perception& p) const;
  void act_(const Perception& p, Vec2& dir, bool& dash) const;

  MatchConfig cfg_;
  Slot slot_;
  DifficultyTier tier_;
  AiTierParams params_;
  int reaction_ticks_;
  int prediction_ticks_;
  int dash_cooldown_ticks_;

  AiMode mode_{AiMode::Idle};
  int decision_timer_{0};
  std::deque<Vec2> opp_history_;
  ObservedDash opp_dash_{ObservedDash::Ready};
  std::int64_t opp_dash_seen_tick_{-1};
};

} // namespace ringout
