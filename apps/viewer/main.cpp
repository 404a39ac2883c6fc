#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <spdlog/spdlog.h>
#include <ringout/config.hpp>
#include <ringout/match.hpp>
#include <ringout/replay.hpp>
#include <ringout/sim_runner.hpp>
#include <ringout/viewer/app.hpp>

using namespace ringout;

static void usage() {
  std::fprintf(stderr,
    "usage: ringout_viewer [--versus] [--tier easy|medium|hard|expert] [--seed N]\n"
    "                      [--config file.csv] [--replay file.rpl [--speed x]] [--verbose]\n");
}

int main(int argc, char** argv) {
  ViewerOptions opts{};
  std::string replay_path;
  std::string config_path;
  double speed = 1.0;

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };
    if (std::strcmp(a, "--versus") == 0) {
      opts.versus = true;
    } else if (std::strcmp(a, "--verbose") == 0) {
      spdlog::set_level(spdlog::level::debug);
    } else if (std::strcmp(a, "--tier") == 0) {
      const char* v = next();
      const auto t = v ? tier_from_string(v) : std::nullopt;
      if (!t) { usage(); return 2; }
      opts.tier = *t;
    } else if (std::strcmp(a, "--seed") == 0) {
      const char* v = next();
      if (!v) { usage(); return 2; }
      opts.seed = std::strtoull(v, nullptr, 10);
    } else if (std::strcmp(a, "--config") == 0) {
      const char* v = next();
      if (!v) { usage(); return 2; }
      config_path = v;
    } else if (std::strcmp(a, "--replay") == 0) {
      const char* v = next();
      if (!v) { usage(); return 2; }
      replay_path = v;
    } else if (std::strcmp(a, "--speed") == 0) {
      const char* v = next();
      if (!v) { usage(); return 2; }
      speed = std::strtod(v, nullptr);
    } else {
      usage();
      return 2;
    }
  }

  SimRunner sim;
  if (!replay_path.empty()) {
    auto loaded = load_replay(replay_path);
    if (!loaded.ok()) return 1;
    opts.replay = true;
    opts.tier = loaded.log->setup.spawns[1].tier;
    sim.configure_replay(std::move(*loaded.log));
    if (!sim.replay_mode()) return 1;
    sim.time_scale.store(speed);
  } else {
    MatchConfig cfg = default_match_config();
    if (!config_path.empty()) {
      auto c = load_match_config_csv(config_path);
      if (!c) return 1;
      cfg = *c;
    }
    const ControlKind p2 = opts.versus ? ControlKind::Human : ControlKind::Ai;
    sim.configure_live(cfg, default_setup(cfg, opts.seed, ControlKind::Human, p2, opts.tier));
  }
  sim.start();

  ViewerApp app(sim, opts);
  const int code = app.run();

  sim.stop();
  return code;
}
