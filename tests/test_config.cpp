#include <catch2/catch.hpp>
#include <sstream>

#include <ringout/config.hpp>

using Catch::Detail::Approx;
using namespace ringout;

TEST_CASE("Default configuration is valid") {
  const MatchConfig cfg = default_match_config();
  std::string why;
  REQUIRE(validate_config(cfg, &why));
  REQUIRE(why.empty());
}

TEST_CASE("config_from_kv_stream parses header, comments and enum values") {
  std::istringstream in(
    "key,value\n"
    "# tuning for a small arena\n"
    "\n"
    "dt,0.02\n"
    "stocks,5\n"
    "arena.shrink_kind,stepped\n"
    "dash.speed, 450.5 \n"
    "ai.hard.mistake_p,0.5\n");

  auto cfg = config_from_kv_stream(in);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->dt == Approx(0.02));
  REQUIRE(cfg->stocks == 5);
  REQUIRE(cfg->arena.shrink_kind == ShrinkKind::Stepped);
  REQUIRE(cfg->dash.speed == Approx(450.5));
  REQUIRE(cfg->tier(DifficultyTier::Hard).mistake_probability == Approx(0.5));
}

TEST_CASE("Unknown keys and unparsable values are skipped, not fatal") {
  std::istringstream in(
    "no_such_key,3\n"
    "stocks,many\n"
    "line without comma\n"
    "actor_radius,12\n");

  auto cfg = config_from_kv_stream(in);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->stocks == MatchConfig{}.stocks);
  REQUIRE(cfg->actor_radius == Approx(12.0));
}

TEST_CASE("Configurations that fail validation are rejected") {
  SECTION("zero timestep") {
    std::istringstream in("dt,0\n");
    REQUIRE_FALSE(config_from_kv_stream(in).has_value());
  }
  SECTION("restitution above one") {
    std::istringstream in("restitution,1.5\n");
    REQUIRE_FALSE(config_from_kv_stream(in).has_value());
  }
  SECTION("dash shorter than a tick") {
    std::istringstream in("dash.duration_s,0.001\n");
    REQUIRE_FALSE(config_from_kv_stream(in).has_value());
  }
  SECTION("min radius above start radius") {
    std::istringstream in("arena.min_radius,400\n");
    REQUIRE_FALSE(config_from_kv_stream(in).has_value());
  }
  SECTION("too many power-up slots") {
    std::istringstream in("powerups.max_active,9\n");
    REQUIRE_FALSE(config_from_kv_stream(in).has_value());
  }
}

TEST_CASE("validate_config names the failing field") {
  MatchConfig cfg{};
  cfg.dash.mass_ratio = 0.5;
  std::string why;
  REQUIRE_FALSE(validate_config(cfg, &why));
  REQUIRE(why.find("mass") != std::string::npos);
}

TEST_CASE("write_config_kv reloads bit-exactly") {
  MatchConfig cfg{};
  cfg.dt = 1.0 / 120.0;
  cfg.friction_per_tick = 0.913;
  cfg.dash.knockback_scale = 1.0 / 3.0;
  cfg.arena.shrink_kind = ShrinkKind::Stepped;
  cfg.powerups.max_active = 2;
  cfg.ai.tiers[3].prediction_s = 0.1 + 0.2;

  std::stringstream ss;
  write_config_kv(ss, cfg);
  auto back = config_from_kv_stream(ss);
  REQUIRE(back.has_value());
  REQUIRE(back->dt == cfg.dt);
  REQUIRE(back->friction_per_tick == cfg.friction_per_tick);
  REQUIRE(back->dash.knockback_scale == cfg.dash.knockback_scale);
  REQUIRE(back->arena.shrink_kind == ShrinkKind::Stepped);
  REQUIRE(back->powerups.max_active == 2);
  REQUIRE(back->ai.tiers[3].prediction_s == cfg.ai.tiers[3].prediction_s);
}

TEST_CASE("apply_config_value rejects fractional integers") {
  MatchConfig cfg{};
  REQUIRE_FALSE(apply_config_value(cfg, "dash.charges", "2.5"));
  REQUIRE(apply_config_value(cfg, "dash.charges", "3"));
  REQUIRE(cfg.dash.charges == 3);
  REQUIRE(apply_config_value(cfg, "arena.shrink_kind", "0"));
  REQUIRE(cfg.arena.shrink_kind == ShrinkKind::Linear);
  REQUIRE_FALSE(apply_config_value(cfg, "arena.shrink_kind", "spiral"));
}

TEST_CASE("seconds_to_ticks rounds and never goes negative") {
  REQUIRE(seconds_to_ticks(0.15, 1.0 / 60.0) == 9);
  REQUIRE(seconds_to_ticks(1.0, 1.0 / 60.0) == 60);
  REQUIRE(seconds_to_ticks(-1.0, 1.0 / 60.0) == 0);
  REQUIRE(seconds_to_ticks(0.5, 0.0) == 0);
}

TEST_CASE("Difficulty tiers parse case-insensitively") {
  REQUIRE(tier_from_string(" Hard ") == DifficultyTier::Hard);
  REQUIRE(tier_from_string("EXPERT") == DifficultyTier::Expert);
  REQUIRE_FALSE(tier_from_string("nightmare").has_value());
  REQUIRE(std::string(to_string(DifficultyTier::Easy)) == "easy");
}
