#pragma once
#include <array>
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace ringout {

enum class ShrinkKind : int {
  Linear = 0,   // rate units per second after the delay
  Stepped = 1   // fraction of the start radius every step interval
};

enum class DifficultyTier : int {
  Easy = 0,
  Medium = 1,
  Hard = 2,
  Expert = 3,
  Count
};

const char* to_string(DifficultyTier t);
std::optional<DifficultyTier> tier_from_string(const std::string& s);

struct DashConfig {
  double speed = 600.0;          // impulse, units/s
  double duration_s = 0.15;
  double cooldown_s = 1.0;       // per charge
  int    charges = 1;
  double mass_ratio = 3.0;       // effective mass of a dashing actor (idle actor = 1)
  double knockback_scale = 0.5;  // opponent knockback = scale * speed
};

struct ArenaConfig {
  double start_radius = 300.0;
  double min_radius = 100.0;
  double shrink_delay_s = 10.0;
  ShrinkKind shrink_kind = ShrinkKind::Linear;
  double shrink_rate = 20.0;     // Linear
  double step_fraction = 0.1;    // Stepped
  double step_interval_s = 5.0;  // Stepped
};

struct PowerUpConfig {
  int    max_active = 3;               // slot count; 0 disables power-ups
  double spawn_interval_s = 8.0;
  double spawn_jitter = 0.25;          // interval scaled by U[1-j, 1+j]
  double telegraph_s = 1.0;            // Spawning -> Active delay
  double spawn_radius_fraction = 0.7;
  double pickup_radius = 15.0;
  double lifetime_s = 15.0;
  double effect_duration_s = 5.0;
  double speed_multiplier = 1.5;
  double size_up_multiplier = 1.5;
  double size_down_multiplier = 0.6;
  int    multi_dash_bonus = 2;
  double freeze_duration_s = 1.5;
  double magnet_multiplier = 3.0;
  double teleport_radius_fraction = 0.3;
};

struct AiTierParams {
  double reaction_s = 0.25;           // delay between mode re-evaluations
  double prediction_s = 0.2;          // look-ahead / opponent memory window
  double mistake_probability = 0.1;
};

struct AiConfig {
  std::array<AiTierParams, static_cast<std::size_t>(DifficultyTier::Count)> tiers{{
    {0.50, 0.10, 0.25},  // Easy
    {0.25, 0.20, 0.12},  // Medium
    {0.10, 0.30, 0.05},  // Hard
    {0.05, 0.40, 0.01},  // Expert
  }};
  double flee_margin_fraction = 0.3;   // boundary margin / radius
  double recover_speed_fraction = 1.2; // own speed / move speed
  double punish_range = 180.0;
  double retreat_range = 120.0;
  double bait_range = 260.0;
  double dash_range_min = 80.0;
  double dash_range_max = 200.0;
  double dash_detect_fraction = 0.75;  // observed speed / dash speed
};

// Immutable per-match tuning. Defaults follow the original game's constants.
struct MatchConfig {
  double dt = 1.0 / 60.0;
  int    max_steps_per_frame = 8;
  double actor_radius = 20.0;
  double move_speed = 300.0;
  double steer_accel = 15.0;         // blend rate toward target velocity, 1/s
  double friction_per_tick = 0.92;   // velocity factor per 1/60 s
  double max_speed = 800.0;
  double rest_speed = 0.5;
  double restitution = 0.7;
  double collision_push = 250.0;
  double spawn_distance = 150.0;
  double respawn_fraction = 0.5;
  int    stocks = 3;
  double round_time_s = 120.0;
  DashConfig dash{};
  ArenaConfig arena{};
  PowerUpConfig powerups{};
  AiConfig ai{};

  const AiTierParams& tier(DifficultyTier t) const { return ai.tiers[static_cast<std::size_t>(t)]; }
};

MatchConfig default_match_config();

// Whole ticks for a duration at a fixed step (rounded to nearest, never negative).
int seconds_to_ticks(double seconds, double dt);

// Returns false (and the first problem in *why) for configurations the
// simulation cannot run deterministically or meaningfully.
bool validate_config(const MatchConfig& cfg, std::string* why = nullptr);

// Assign one "key,value" pair. Unknown keys and unparsable values return false.
bool apply_config_value(MatchConfig& cfg, const std::string& key, const std::string& value);

// Stream-based loader (test-friendly; no filesystem required).
// Rows are "key,value". Accepts an optional "key,value" header; ignores blank
// lines and lines starting with '#'. Invalid rows are skipped with a warning.
// Returns nullopt if the resulting configuration fails validate_config.
std::optional<MatchConfig> config_from_kv_stream(std::istream& in,
                                                 const MatchConfig& base = MatchConfig{});

// Filesystem wrapper; nullopt if the file cannot be opened or is invalid.
std::optional<MatchConfig> load_match_config_csv(const std::string& path);

// Writes every key; floating values as hexfloat so a reload is bit-exact.
void write_config_kv(std::ostream& out, const MatchConfig& cfg, const char* prefix = "");

} // namespace ringout
