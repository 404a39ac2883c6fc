#include <ringout/session.hpp>
#include <spdlog/spdlog.h>

namespace ringout {

Session::Session(const MatchConfig& cfg, const MatchSetup& setup)
  : match_(cfg, setup),
    recorder_(cfg, setup),
    clock_(cfg.dt, cfg.max_steps_per_frame),
    last_snapshot_(match_.snapshot()) {
  for (std::size_t i = 0; i < kActorCount; ++i) {
    const auto& s = setup.spawns[i];
    if (s.control == ControlKind::Ai) ai_[i].emplace(cfg, static_cast<Slot>(i), s.tier);
  }
  spdlog::info("session: seed {} {} vs {}", setup.seed,
               to_string(setup.spawns[0].control), to_string(setup.spawns[1].control));
}

void Session::set_human_intent(Slot slot, Vec2 dir, bool dash_pressed) {
  if (slot >= kActorCount) return;
  auto& l = latch_[slot];
  l.dir = dir;
  l.dash = l.dash || dash_pressed;
}

const AIDecisionEngine* Session::ai(Slot slot) const {
  if (slot >= kActorCount || !ai_[slot]) return nullptr;
  return &*ai_[slot];
}

InputFrame Session::frame_for_(std::size_t slot) {
  const auto t = match_.current_tick();
  if (ai_[slot]) {
    return ai_[slot]->decide(perceive(last_snapshot_, static_cast<Slot>(slot)), match_.ai_rng(slot));
  }
  auto& l = latch_[slot];
  const InputFrame f = quantize_input(t, static_cast<std::uint8_t>(slot), l.dir, l.dash);
  l.dash = false;
  return f;
}

TickResult Session::step_once() {
  if (match_.over()) {
    TickResult r{};
    r.status = TickStatus::MatchOver;
    r.snapshot = last_snapshot_;
    return r;
  }
  TickFrames frames{};
  for (std::size_t i = 0; i < kActorCount; ++i) frames[i] = frame_for_(i);
  recorder_.record(frames);

  TickResult r = match_.tick(frames);
  if (r.status == TickStatus::Desync) {
    spdlog::error("session: desync at tick {}", match_.current_tick());
    return r;
  }
  last_snapshot_ = r.snapshot;
  pending_.insert(pending_.end(), r.events.begin(), r.events.end());
  return r;
}

int Session::update(double wall_dt) {
  const int due = clock_.advance(wall_dt);
  int ran = 0;
  for (; ran < due; ++ran) {
    if (aborted() || match_.over()) break;
    step_once();
  }
  return ran;
}

EventList Session::drain_events() {
  EventList out;
  out.swap(pending_);
  return out;
}

} // namespace ringout
