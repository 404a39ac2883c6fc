#include <ringout/config.hpp>
#include <ringout/text_fields.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <ios>
#include <limits>
#include <vector>
#include <spdlog/spdlog.h>

namespace ringout {

namespace {

struct RealField {
  const char* key;
  double& (*ref)(MatchConfig&);
};

struct IntField {
  const char* key;
  int& (*ref)(MatchConfig&);
};

// Single source of truth for the "key,value" surface (loader, writer, replay header).
const RealField kRealFields[] = {
  {"dt",                  [](MatchConfig& c) -> double& { return c.dt; }},
  {"actor_radius",        [](MatchConfig& c) -> double& { return c.actor_radius; }},
  {"move_speed",          [](MatchConfig& c) -> double& { return c.move_speed; }},
  {"steer_accel",         [](MatchConfig& c) -> double& { return c.steer_accel; }},
  {"friction_per_tick",   [](MatchConfig& c) -> double& { return c.friction_per_tick; }},
  {"max_speed",           [](MatchConfig& c) -> double& { return c.max_speed; }},
  {"rest_speed",          [](MatchConfig& c) -> double& { return c.rest_speed; }},
  {"restitution",         [](MatchConfig& c) -> double& { return c.restitution; }},
  {"collision_push",      [](MatchConfig& c) -> double& { return c.collision_push; }},
  {"spawn_distance",      [](MatchConfig& c) -> double& { return c.spawn_distance; }},
  {"respawn_fraction",    [](MatchConfig& c) -> double& { return c.respawn_fraction; }},
  {"round_time_s",        [](MatchConfig& c) -> double& { return c.round_time_s; }},

  {"dash.speed",           [](MatchConfig& c) -> double& { return c.dash.speed; }},
  {"dash.duration_s",      [](MatchConfig& c) -> double& { return c.dash.duration_s; }},
  {"dash.cooldown_s",      [](MatchConfig& c) -> double& { return c.dash.cooldown_s; }},
  {"dash.mass_ratio",      [](MatchConfig& c) -> double& { return c.dash.mass_ratio; }},
  {"dash.knockback_scale", [](MatchConfig& c) -> double& { return c.dash.knockback_scale; }},

  {"arena.start_radius",    [](MatchConfig& c) -> double& { return c.arena.start_radius; }},
  {"arena.min_radius",      [](MatchConfig& c) -> double& { return c.arena.min_radius; }},
  {"arena.shrink_delay_s",  [](MatchConfig& c) -> double& { return c.arena.shrink_delay_s; }},
  {"arena.shrink_rate",     [](MatchConfig& c) -> double& { return c.arena.shrink_rate; }},
  {"arena.step_fraction",   [](MatchConfig& c) -> double& { return c.arena.step_fraction; }},
  {"arena.step_interval_s", [](MatchConfig& c) -> double& { return c.arena.step_interval_s; }},

  {"powerups.spawn_interval_s",         [](MatchConfig& c) -> double& { return c.powerups.spawn_interval_s; }},
  {"powerups.spawn_jitter",             [](MatchConfig& c) -> double& { return c.powerups.spawn_jitter; }},
  {"powerups.telegraph_s",              [](MatchConfig& c) -> double& { return c.powerups.telegraph_s; }},
  {"powerups.spawn_radius_fraction",    [](MatchConfig& c) -> double& { return c.powerups.spawn_radius_fraction; }},
  {"powerups.pickup_radius",            [](MatchConfig& c) -> double& { return c.powerups.pickup_radius; }},
  {"powerups.lifetime_s",               [](MatchConfig& c) -> double& { return c.powerups.lifetime_s; }},
  {"powerups.effect_duration_s",        [](MatchConfig& c) -> double& { return c.powerups.effect_duration_s; }},
  {"powerups.speed_multiplier",         [](MatchConfig& c) -> double& { return c.powerups.speed_multiplier; }},
  {"powerups.size_up_multiplier",       [](MatchConfig& c) -> double& { return c.powerups.size_up_multiplier; }},
  {"powerups.size_down_multiplier",     [](MatchConfig& c) -> double& { return c.powerups.size_down_multiplier; }},
  {"powerups.freeze_duration_s",        [](MatchConfig& c) -> double& { return c.powerups.freeze_duration_s; }},
  {"powerups.magnet_multiplier",        [](MatchConfig& c) -> double& { return c.powerups.magnet_multiplier; }},
  {"powerups.teleport_radius_fraction", [](MatchConfig& c) -> double& { return c.powerups.teleport_radius_fraction; }},

  {"ai.easy.reaction_s",     [](MatchConfig& c) -> double& { return c.ai.tiers[0].reaction_s; }},
  {"ai.easy.prediction_s",   [](MatchConfig& c) -> double& { return c.ai.tiers[0].prediction_s; }},
  {"ai.easy.mistake_p",      [](MatchConfig& c) -> double& { return c.ai.tiers[0].mistake_probability; }},
  {"ai.medium.reaction_s",   [](MatchConfig& c) -> double& { return c.ai.tiers[1].reaction_s; }},
  {"ai.medium.prediction_s", [](MatchConfig& c) -> double& { return c.ai.tiers[1].prediction_s; }},
  {"ai.medium.mistake_p",    [](MatchConfig& c) -> double& { return c.ai.tiers[1].mistake_probability; }},
  {"ai.hard.reaction_s",     [](MatchConfig& c) -> double& { return c.ai.tiers[2].reaction_s; }},
  {"ai.hard.prediction_s",   [](MatchConfig& c) -> double& { return c.ai.tiers[2].prediction_s; }},
  {"ai.hard.mistake_p",      [](MatchConfig& c) -> double& { return c.ai.tiers[2].mistake_probability; }},
  {"ai.expert.reaction_s",   [](MatchConfig& c) -> double& { return c.ai.tiers[3].reaction_s; }},
  {"ai.expert.prediction_s", [](MatchConfig& c) -> double& { return c.ai.tiers[3].prediction_s; }},
  {"ai.expert.mistake_p",    [](MatchConfig& c) -> double& { return c.ai.tiers[3].mistake_probability; }},
  {"ai.flee_margin_fraction",   [](MatchConfig& c) -> double& { return c.ai.flee_margin_fraction; }},
  {"ai.recover_speed_fraction", [](MatchConfig& c) -> double& { return c.ai.recover_speed_fraction; }},
  {"ai.punish_range",           [](MatchConfig& c) -> double& { return c.ai.punish_range; }},
  {"ai.retreat_range",          [](MatchConfig& c) -> double& { return c.ai.retreat_range; }},
  {"ai.bait_range",             [](MatchConfig& c) -> double& { return c.ai.bait_range; }},
  {"ai.dash_range_min",         [](MatchConfig& c) -> double& { return c.ai.dash_range_min; }},
  {"ai.dash_range_max",         [](MatchConfig& c) -> double& { return c.ai.dash_range_max; }},
  {"ai.dash_detect_fraction",   [](MatchConfig& c) -> double& { return c.ai.dash_detect_fraction; }},
};

const IntField kIntFields[] = {
  {"max_steps_per_frame",       [](MatchConfig& c) -> int& { return c.max_steps_per_frame; }},
  {"stocks",                    [](MatchConfig& c) -> int& { return c.stocks; }},
  {"dash.charges",              [](MatchConfig& c) -> int& { return c.dash.charges; }},
  {"powerups.max_active",       [](MatchConfig& c) -> int& { return c.powerups.max_active; }},
  {"powerups.multi_dash_bonus", [](MatchConfig& c) -> int& { return c.powerups.multi_dash_bonus; }},
};

constexpr const char* kShrinkKindKey = "arena.shrink_kind";

bool fail(std::string* why, const char* msg) {
  if (why) *why = msg;
  return false;
}

} // namespace

const char* to_string(DifficultyTier t) {
  switch (t) {
    case DifficultyTier::Easy:   return "easy";
    case DifficultyTier::Medium: return "medium";
    case DifficultyTier::Hard:   return "hard";
    case DifficultyTier::Expert: return "expert";
    default: return "unknown";
  }
}

std::optional<DifficultyTier> tier_from_string(const std::string& s) {
  const std::string k = lower(trim(s));
  if (k == "easy")   return DifficultyTier::Easy;
  if (k == "medium") return DifficultyTier::Medium;
  if (k == "hard")   return DifficultyTier::Hard;
  if (k == "expert") return DifficultyTier::Expert;
  return std::nullopt;
}

MatchConfig default_match_config() {
  return MatchConfig{};
}

int seconds_to_ticks(double seconds, double dt) {
  if (!(seconds > 0.0) || !(dt > 0.0)) return 0;
  return static_cast<int>(std::lround(seconds / dt));
}

bool validate_config(const MatchConfig& cfg, std::string* why) {
  MatchConfig copy = cfg;
  for (const auto& f : kRealFields) {
    if (!std::isfinite(f.ref(copy))) return fail(why, f.key);
  }

  if (!(cfg.dt > 0.0 && cfg.dt <= 0.1)) return fail(why, "dt must be in (0, 0.1]");
  if (cfg.max_steps_per_frame < 1) return fail(why, "max_steps_per_frame must be >= 1");
  if (!(cfg.actor_radius > 0.0)) return fail(why, "actor_radius must be > 0");
  if (cfg.move_speed < 0.0 || cfg.steer_accel < 0.0) return fail(why, "movement must be non-negative");
  if (!(cfg.friction_per_tick > 0.0 && cfg.friction_per_tick <= 1.0)) return fail(why, "friction_per_tick must be in (0, 1]");
  if (!(cfg.max_speed > 0.0) || cfg.rest_speed < 0.0) return fail(why, "speed limits out of range");
  if (cfg.restitution < 0.0 || cfg.restitution > 1.0) return fail(why, "restitution must be in [0, 1]");
  if (cfg.collision_push < 0.0 || cfg.spawn_distance < 0.0) return fail(why, "negative push or spawn distance");
  if (!(cfg.respawn_fraction > 0.0 && cfg.respawn_fraction <= 1.0)) return fail(why, "respawn_fraction must be in (0, 1]");
  if (cfg.stocks < 1) return fail(why, "stocks must be >= 1");
  if (!(cfg.round_time_s > 0.0)) return fail(why, "round_time_s must be > 0");

  const auto& d = cfg.dash;
  if (!(d.speed > 0.0)) return fail(why, "dash.speed must be > 0");
  if (seconds_to_ticks(d.duration_s, cfg.dt) < 1) return fail(why, "dash.duration_s shorter than one tick");
  if (d.cooldown_s < 0.0 || d.charges < 1) return fail(why, "dash cooldown/charges out of range");
  if (!(d.mass_ratio >= 1.0) || d.knockback_scale < 0.0) return fail(why, "dash mass/knockback out of range");

  const auto& a = cfg.arena;
  if (!(a.start_radius > 0.0)) return fail(why, "arena.start_radius must be > 0");
  if (!(a.min_radius > 0.0 && a.min_radius <= a.start_radius)) return fail(why, "arena.min_radius must be in (0, start_radius]");
  if (a.shrink_delay_s < 0.0) return fail(why, "arena.shrink_delay_s must be >= 0");
  if (a.shrink_kind == ShrinkKind::Linear && !(a.shrink_rate > 0.0)) return fail(why, "arena.shrink_rate must be > 0");
  if (a.shrink_kind == ShrinkKind::Stepped &&
      !(a.step_fraction > 0.0 && a.step_fraction <= 1.0 && a.step_interval_s > 0.0)) {
    return fail(why, "arena step schedule out of range");
  }

  const auto& p = cfg.powerups;
  if (p.max_active < 0 || p.max_active > 8) return fail(why, "powerups.max_active must be in [0, 8]");
  if (!(p.spawn_interval_s > 0.0 && p.lifetime_s > 0.0 && p.effect_duration_s > 0.0)) return fail(why, "power-up timings must be > 0");
  if (p.spawn_jitter < 0.0 || p.spawn_jitter >= 1.0 || p.telegraph_s < 0.0) return fail(why, "power-up spawn timing out of range");
  if (p.spawn_radius_fraction < 0.0 || p.spawn_radius_fraction > 1.0) return fail(why, "powerups.spawn_radius_fraction must be in [0, 1]");
  if (p.teleport_radius_fraction < 0.0 || p.teleport_radius_fraction > 1.0) return fail(why, "powerups.teleport_radius_fraction must be in [0, 1]");
  if (!(p.pickup_radius > 0.0 && p.speed_multiplier > 0.0 && p.size_up_multiplier > 0.0 &&
        p.size_down_multiplier > 0.0 && p.magnet_multiplier > 0.0)) {
    return fail(why, "power-up magnitudes must be > 0");
  }
  if (p.multi_dash_bonus < 0 || p.freeze_duration_s < 0.0) return fail(why, "power-up bonus out of range");

  for (const auto& t : cfg.ai.tiers) {
    if (t.reaction_s < 0.0 || t.prediction_s < 0.0) return fail(why, "ai tier timings must be >= 0");
    if (t.mistake_probability < 0.0 || t.mistake_probability > 1.0) return fail(why, "ai mistake probability must be in [0, 1]");
  }
  if (!(cfg.ai.dash_detect_fraction > 0.0)) return fail(why, "ai.dash_detect_fraction must be > 0");
  return true;
}

bool apply_config_value(MatchConfig& cfg, const std::string& key, const std::string& value) {
  const std::string k = trim(key);
  const std::string v = trim(value);
  if (k == kShrinkKindKey) {
    const std::string lv = lower(v);
    if (lv == "linear" || lv == "0")  { cfg.arena.shrink_kind = ShrinkKind::Linear;  return true; }
    if (lv == "stepped" || lv == "1") { cfg.arena.shrink_kind = ShrinkKind::Stepped; return true; }
    return false;
  }
  for (const auto& f : kRealFields) {
    if (k != f.key) continue;
    bool ok = false;
    const double d = to_double_safe(v, ok);
    if (!ok) return false;
    f.ref(cfg) = d;
    return true;
  }
  for (const auto& f : kIntFields) {
    if (k != f.key) continue;
    bool ok = false;
    const long long i = to_int_safe(v, ok);
    if (!ok || i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return false;
    f.ref(cfg) = static_cast<int>(i);
    return true;
  }
  return false;
}

std::optional<MatchConfig> config_from_kv_stream(std::istream& in, const MatchConfig& base) {
  MatchConfig cfg = base;
  std::string line;
  bool header_consumed = false;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto comma = raw.find(',');
    if (comma == std::string::npos) {
      spdlog::warn("config: line {} has no value, skipped", line_no);
      continue;
    }
    const std::string key = trim(raw.substr(0, comma));
    const std::string value = trim(raw.substr(comma + 1));

    if (!header_consumed && (key == "key" || key == "Key")) {
      header_consumed = true;
      continue;
    }
    if (!apply_config_value(cfg, key, value)) {
      spdlog::warn("config: line {} ('{}') ignored", line_no, key);
    }
  }

  std::string why;
  if (!validate_config(cfg, &why)) {
    spdlog::error("config: rejected ({})", why);
    return std::nullopt;
  }
  return cfg;
}

std::optional<MatchConfig> load_match_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("config: cannot open '{}'", path);
    return std::nullopt;
  }
  return config_from_kv_stream(f);
}

void write_config_kv(std::ostream& out, const MatchConfig& cfg, const char* prefix) {
  MatchConfig copy = cfg;
  const auto old_flags = out.flags();
  out << std::hexfloat;
  for (const auto& f : kRealFields) out << prefix << f.key << ',' << f.ref(copy) << '\n';
  out.flags(old_flags);
  for (const auto& f : kIntFields) out << prefix << f.key << ',' << f.ref(copy) << '\n';
  out << prefix << kShrinkKindKey << ','
      << (cfg.arena.shrink_kind == ShrinkKind::Stepped ? "stepped" : "linear") << '\n';
}

} // namespace ringout
