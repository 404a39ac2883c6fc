#include <catch2/catch.hpp>
#include <chrono>
#include <thread>

#include <ringout/sim_runner.hpp>

using namespace ringout;

template <class Pred>
static bool wait_for(Pred&& done, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
  const auto until = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < until) {
    if (done()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return done();
}

TEST_CASE("SimRunner publishes snapshots from its own thread") {
  MatchConfig cfg{};
  SimRunner sim;
  sim.configure_live(cfg, default_setup(cfg, 3, ControlKind::Ai, ControlKind::Ai));
  REQUIRE_FALSE(sim.replay_mode());
  sim.time_scale.store(4.0);
  sim.start();

  std::uint64_t cursor = 0;
  ArenaSnapshot snap{};
  REQUIRE(wait_for([&] { return sim.buffer().try_consume_latest(cursor, snap) && snap.tick > 10; }));
  REQUIRE(snap.actors.size() == kActorCount);

  sim.request_restart(77, DifficultyTier::Expert);
  REQUIRE(wait_for([&] { return sim.current_setup().seed == 77; }));
  REQUIRE(sim.current_setup().spawns[1].tier == DifficultyTier::Expert);
  sim.stop();
}

TEST_CASE("SimRunner plays back a replay log") {
  MatchConfig cfg{};
  cfg.round_time_s = 0.5;
  ReplayRecorder rec(cfg, default_setup(cfg, 1));
  for (std::uint64_t t = 0; t < 30; ++t) rec.record({idle_input(t, 0), idle_input(t, 1)});

  SimRunner sim;
  sim.configure_replay(rec.log());
  REQUIRE(sim.replay_mode());
  sim.time_scale.store(4.0);
  sim.start();
  REQUIRE(wait_for([&] { return sim.playback_status() == PlaybackStatus::Finished; }));
  sim.stop();

  std::uint64_t cursor = 0;
  ArenaSnapshot snap{};
  REQUIRE(sim.buffer().try_consume_latest(cursor, snap));
  REQUIRE(snap.tick == 30);
  REQUIRE(snap.match_over);
}

TEST_CASE("An unplayable log falls back to a live match") {
  ReplayLog log{};
  log.config.dt = 0.0;
  SimRunner sim;
  sim.configure_replay(log);
  REQUIRE_FALSE(sim.replay_mode());
}

TEST_CASE("SimRunner seeks within a paused replay") {
  MatchConfig cfg{};
  cfg.round_time_s = 0.5;
  ReplayRecorder rec(cfg, default_setup(cfg, 1));
  for (std::uint64_t t = 0; t < 30; ++t) rec.record({idle_input(t, 0), idle_input(t, 1)});

  SimRunner sim;
  sim.configure_replay(rec.log());
  sim.time_scale.store(0.0);
  sim.start();

  sim.request_seek(12);
  REQUIRE(wait_for([&] { return sim.replay_cursor() == 12; }));
  REQUIRE(sim.replay_progress() == 12.0 / 30.0);
  REQUIRE(sim.playback_status() == PlaybackStatus::Paused);

  std::uint64_t cursor = 0;
  ArenaSnapshot snap{};
  REQUIRE(wait_for([&] { return sim.buffer().try_consume_latest(cursor, snap) && snap.tick == 12; }));

  sim.request_seek(1000);
  REQUIRE(wait_for([&] { return sim.playback_status() == PlaybackStatus::Finished; }));
  REQUIRE(sim.replay_cursor() == 30);
  sim.stop();
}
