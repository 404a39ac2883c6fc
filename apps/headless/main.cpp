#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <spdlog/spdlog.h>
#include <ringout/config.hpp>
#include <ringout/match.hpp>
#include <ringout/replay.hpp>
#include <ringout/session.hpp>

using namespace ringout;

// Runs AI-vs-AI matches, round-trips each recording through the text format
// and replays it with AI verification. Exit code 1 on any mismatch.

static void usage() {
  std::fprintf(stderr,
    "usage: ringout_headless [--seeds FIRST COUNT] [--tier easy|medium|hard|expert]\n"
    "                        [--config file.csv] [--out DIR] [--verbose]\n");
}

static bool same_state(const ArenaSnapshot& a, const ArenaSnapshot& b) {
  if (a.tick != b.tick || a.match_over != b.match_over || a.winner != b.winner) return false;
  if (a.arena_radius != b.arena_radius || a.actors.size() != b.actors.size()) return false;
  for (std::size_t i = 0; i < a.actors.size(); ++i) {
    const auto& x = a.actors[i];
    const auto& y = b.actors[i];
    if (x.x != y.x || x.y != y.y || x.vx != y.vx || x.vy != y.vy) return false;
    if (x.stocks != y.stocks || x.alive != y.alive || x.effects_mask != y.effects_mask) return false;
  }
  return true;
}

static bool run_one(const MatchConfig& cfg, std::uint64_t seed, DifficultyTier tier, const std::string& out_dir) {
  Session session(cfg, default_setup(cfg, seed, ControlKind::Ai, ControlKind::Ai, tier));
  const std::uint64_t cap = static_cast<std::uint64_t>(seconds_to_ticks(cfg.round_time_s, cfg.dt)) + 1;
  while (!session.match().over() && session.match().current_tick() < cap) session.step_once();

  const auto& live = session.last_snapshot();
  std::stringstream text;
  write_replay(text, session.recorder().log());
  if (!out_dir.empty()) {
    const std::string path = out_dir + "/match_" + std::to_string(seed) + ".rpl";
    if (!save_replay(path, session.recorder().log())) return false;
  }

  auto loaded = read_replay(text);
  if (!loaded.ok()) return false;
  auto player = ReplayPlayer::create(std::move(*loaded.log), /*verify_ai*/ true);
  if (!player) return false;
  while (player->step() == PlaybackStatus::Running) {}

  if (player->status() != PlaybackStatus::Finished || !same_state(live, player->last_snapshot())) {
    spdlog::error("seed {}: replay diverged ({})", seed, to_string(player->status()));
    return false;
  }
  std::printf("seed %llu: %llu ticks, winner %s (%s)\n",
              static_cast<unsigned long long>(seed),
              static_cast<unsigned long long>(live.tick),
              live.winner == kNoActor ? "draw" : (live.winner == 0 ? "P1" : "P2"),
              to_string(session.match().end_reason()));
  return true;
}

int main(int argc, char** argv) {
  std::uint64_t first = 1;
  std::uint64_t count = 10;
  DifficultyTier tier = DifficultyTier::Hard;
  std::string out_dir;
  MatchConfig cfg = default_match_config();

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    if (std::strcmp(a, "--seeds") == 0 && i + 2 < argc) {
      first = std::strtoull(argv[++i], nullptr, 10);
      count = std::strtoull(argv[++i], nullptr, 10);
    } else if (std::strcmp(a, "--tier") == 0 && i + 1 < argc) {
      const auto t = tier_from_string(argv[++i]);
      if (!t) { usage(); return 2; }
      tier = *t;
    } else if (std::strcmp(a, "--config") == 0 && i + 1 < argc) {
      auto c = load_match_config_csv(argv[++i]);
      if (!c) return 2;
      cfg = *c;
    } else if (std::strcmp(a, "--out") == 0 && i + 1 < argc) {
      out_dir = argv[++i];
    } else if (std::strcmp(a, "--verbose") == 0) {
      spdlog::set_level(spdlog::level::debug);
    } else {
      usage();
      return 2;
    }
  }

  int failures = 0;
  for (std::uint64_t s = first; s < first + count; ++s) {
    if (!run_one(cfg, s, tier, out_dir)) ++failures;
  }
  if (failures) spdlog::error("{} of {} matches failed replay verification", failures, count);
  return failures == 0 ? 0 : 1;
}
