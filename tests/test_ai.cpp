#include <catch2/catch.hpp>

#include <ringout/ai.hpp>
#include <ringout/integrator.hpp>
#include <ringout/match.hpp>

using Catch::Detail::Approx;
using namespace ringout;

// Re-evaluates every tick and never makes mistakes.
static MatchConfig sharp_config() {
  MatchConfig cfg{};
  for (auto& t : cfg.ai.tiers) {
    t.reaction_s = 0.0;
    t.mistake_probability = 0.0;
  }
  return cfg;
}

static Perception base_perception(std::uint64_t tick = 0) {
  Perception p{};
  p.tick = tick;
  p.self_slot = 1;
  p.self_pos = Vec2{0.0, 0.0};
  p.arena_radius = 300.0;
  p.opp_pos = Vec2{-100.0, 0.0};
  return p;
}

TEST_CASE("Opponent out of play leaves the AI idle") {
  const MatchConfig cfg = sharp_config();
  AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
  MatchRng rng(1, kAiStreamBase + 1);
  Perception p = base_perception();
  p.opponent_alive = false;
  const InputFrame f = ai.decide(p, rng);
  REQUIRE(ai.mode() == AiMode::Idle);
  REQUIRE(f.move_x == 0);
  REQUIRE(f.move_y == 0);
  REQUIRE_FALSE(f.dash);
}

TEST_CASE("Near the edge the AI heads for the centre") {
  const MatchConfig cfg = sharp_config();
  AIDecisionEngine ai(cfg, 1, DifficultyTier::Hard);
  MatchRng rng(1, kAiStreamBase + 1);
  Perception p = base_perception();
  p.self_pos = Vec2{280.0, 0.0};
  p.opp_pos = Vec2{0.0, 0.0};
  const InputFrame f = ai.decide(p, rng);
  REQUIRE(ai.mode() == AiMode::FleeBoundary);
  REQUIRE(f.move_x == -127);
  REQUIRE(f.move_y == 0);
}

TEST_CASE("Mode selection follows the situation") {
  const MatchConfig cfg = sharp_config();
  MatchRng rng(2, kAiStreamBase + 1);

  SECTION("far away: approach") {
    AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
    Perception p = base_perception();
    p.opp_pos = Vec2{-280.0, 0.0};
    p.self_pos = Vec2{100.0, 0.0};
    const InputFrame f = ai.decide(p, rng);
    REQUIRE(ai.mode() == AiMode::Approach);
    REQUIRE(f.move_x < 0);
  }
  SECTION("moving too fast: recover") {
    AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
    Perception p = base_perception();
    p.self_vel = Vec2{500.0, 0.0};
    const InputFrame f = ai.decide(p, rng);
    REQUIRE(ai.mode() == AiMode::Recover);
    REQUIRE(f.move_x < 0);
  }
  SECTION("opponent dashing close by: punish") {
    AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
    Perception p = base_perception();
    p.opp_vel = Vec2{cfg.dash.speed, 0.0};
    ai.decide(p, rng);
    REQUIRE(ai.opponent_dash() == ObservedDash::Active);
    REQUIRE(ai.mode() == AiMode::Punish);
  }
  SECTION("close and own dash spent: retreat") {
    AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
    Perception p = base_perception();
    p.opp_pos = Vec2{-60.0, 0.0};
    p.self_dash_ready = false;
    p.self_dash_phase = DashPhase::Cooldown;
    const InputFrame f = ai.decide(p, rng);
    REQUIRE(ai.mode() == AiMode::Retreat);
    REQUIRE(f.move_x > 0);
    REQUIRE_FALSE(f.dash);
  }
  SECTION("mid range with both dashes ready: bait") {
    AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
    Perception p = base_perception();
    p.opp_pos = Vec2{-200.0, 0.0};
    ai.decide(p, rng);
    REQUIRE(ai.mode() == AiMode::Bait);
  }
}

TEST_CASE("Opponent dash is inferred from observed speed and followed by a cooldown") {
  const MatchConfig cfg = sharp_config();
  AIDecisionEngine ai(cfg, 1, DifficultyTier::Medium);
  MatchRng rng(3, kAiStreamBase + 1);

  Perception p = base_perception(0);
  p.opp_pos = Vec2{-200.0, 0.0};
  p.opp_vel = Vec2{cfg.dash.speed, 0.0};
  ai.decide(p, rng);
  REQUIRE(ai.opponent_dash() == ObservedDash::Active);

  p = base_perception(1);
  p.opp_pos = Vec2{-200.0, 0.0};
  ai.decide(p, rng);
  REQUIRE(ai.opponent_dash() == ObservedDash::Cooldown);
  REQUIRE(ai.mode() == AiMode::Approach);

  const auto window = static_cast<std::uint64_t>(dash_active_ticks(cfg) + dash_cooldown_ticks(cfg));
  p = base_perception(window + 1);
  p.opp_pos = Vec2{-200.0, 0.0};
  ai.decide(p, rng);
  REQUIRE(ai.opponent_dash() == ObservedDash::Ready);
}

TEST_CASE("Dash is only requested when the AI's own dash is ready") {
  const MatchConfig cfg = sharp_config();
  MatchRng rng(4, kAiStreamBase + 1);
  Perception p = base_perception();
  p.opp_pos = Vec2{-50.0, 0.0};
  p.opp_vel = Vec2{cfg.dash.speed, 0.0};

  AIDecisionEngine ready(cfg, 1, DifficultyTier::Expert);
  REQUIRE(ready.decide(p, rng).dash);
  REQUIRE(ready.mode() == AiMode::Punish);

  AIDecisionEngine spent(cfg, 1, DifficultyTier::Expert);
  p.self_dash_ready = false;
  p.self_dash_phase = DashPhase::Cooldown;
  REQUIRE_FALSE(spent.decide(p, rng).dash);
  REQUIRE(spent.opponent_dash() == ObservedDash::Active);
  REQUIRE(spent.mode() != AiMode::Punish);
  REQUIRE(spent.mode() == AiMode::Retreat);
}

TEST_CASE("Reaction time holds a mode between re-evaluations") {
  MatchConfig cfg = sharp_config();
  cfg.ai.tiers[static_cast<std::size_t>(DifficultyTier::Easy)].reaction_s = 0.25;
  AIDecisionEngine ai(cfg, 1, DifficultyTier::Easy);
  MatchRng rng(5, kAiStreamBase + 1);

  Perception far = base_perception(0);
  far.self_pos = Vec2{100.0, 0.0};
  far.opp_pos = Vec2{-280.0, 0.0};
  ai.decide(far, rng);
  REQUIRE(ai.mode() == AiMode::Approach);

  const int reaction = seconds_to_ticks(0.25, cfg.dt);
  for (int i = 1; i < reaction; ++i) {
    Perception edge = base_perception(static_cast<std::uint64_t>(i));
    edge.self_pos = Vec2{290.0, 0.0};
    edge.opp_pos = Vec2{0.0, 0.0};
    ai.decide(edge, rng);
    REQUIRE(ai.mode() == AiMode::Approach);
  }
  Perception edge = base_perception(static_cast<std::uint64_t>(reaction));
  edge.self_pos = Vec2{290.0, 0.0};
  edge.opp_pos = Vec2{0.0, 0.0};
  ai.decide(edge, rng);
  REQUIRE(ai.mode() == AiMode::FleeBoundary);
}

TEST_CASE("Decisions are legal and reproducible for a given stream") {
  const MatchConfig cfg{};
  AIDecisionEngine a(cfg, 0, DifficultyTier::Easy);
  AIDecisionEngine b(cfg, 0, DifficultyTier::Easy);
  MatchRng ra(9, kAiStreamBase);
  MatchRng rb(9, kAiStreamBase);
  MatchRng scenario(77);

  for (std::uint64_t t = 0; t < 500; ++t) {
    Perception p{};
    p.tick = t;
    p.self_slot = 0;
    p.arena_radius = 300.0;
    p.self_pos = from_angle(scenario.uniform(0.0, kTAU)) * scenario.uniform(0.0, 290.0);
    p.opp_pos = from_angle(scenario.uniform(0.0, kTAU)) * scenario.uniform(0.0, 290.0);
    p.self_vel = from_angle(scenario.uniform(0.0, kTAU)) * scenario.uniform(0.0, 700.0);
    p.opp_vel = from_angle(scenario.uniform(0.0, kTAU)) * scenario.uniform(0.0, 700.0);
    p.self_dash_ready = scenario.chance(0.5);

    const InputFrame fa = a.decide(p, ra);
    const InputFrame fb = b.decide(p, rb);
    REQUIRE(fa == fb);
    REQUIRE(input_is_legal(fa));
    REQUIRE(fa.tick == t);
    REQUIRE(fa.slot == 0);
  }
  REQUIRE(ra == rb);
}

TEST_CASE("perceive exposes public kinematics only") {
  MatchConfig cfg{};
  cfg.powerups.max_active = 0;
  Match m(cfg, default_setup(cfg, 1));
  const Perception p = perceive(m, 1);
  REQUIRE(p.self_slot == 1);
  REQUIRE(p.self_pos.x == Approx(cfg.spawn_distance));
  REQUIRE(p.opp_pos.x == Approx(-cfg.spawn_distance));
  REQUIRE(p.arena_radius == Approx(cfg.arena.start_radius));
  REQUIRE(p.self_dash_ready);
  REQUIRE(p.opponent_alive);
  REQUIRE(p.self_facing.x == Approx(-1.0));
}
