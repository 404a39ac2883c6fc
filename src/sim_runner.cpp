#include <ringout/sim_runner.hpp>
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

namespace ringout {

void SimRunner::configure_live(const MatchConfig& cfg, const MatchSetup& setup) {
  std::lock_guard<std::mutex> lk(sim_m_);
  cfg_ = cfg;
  setup_ = setup;
  replay_mode_ = false;
  player_.reset();
  rebuild_session_();
}

void SimRunner::configure_replay(ReplayLog log) {
  std::lock_guard<std::mutex> lk(sim_m_);
  cfg_ = log.config;
  setup_ = log.setup;
  session_.reset();
  player_ = ReplayPlayer::create(std::move(log));
  replay_mode_ = player_.has_value();
  if (!replay_mode_) {
    spdlog::warn("runner: replay not playable, starting a live match instead");
    cfg_ = default_match_config();
    setup_ = default_setup(cfg_, setup_.seed);
    rebuild_session_();
  }
}

void SimRunner::rebuild_session_() {
  session_ = std::make_unique<Session>(cfg_, setup_);
  for (auto& d : intent_dash_) d.store(false, std::memory_order_relaxed);
}

void SimRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&SimRunner::thread_main_, this);
}

void SimRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  {
    std::lock_guard<std::mutex> lk(sim_m_);
    if (session_) session_->request_abort();
  }
  if (th_.joinable()) th_.join();
}

void SimRunner::request_restart(std::uint64_t seed) {
  pending_seed_.store(seed, std::memory_order_relaxed);
  pending_tier_.store(-1, std::memory_order_relaxed);
  pending_restart_.store(true, std::memory_order_release);
}

void SimRunner::request_restart(std::uint64_t seed, DifficultyTier tier) {
  pending_seed_.store(seed, std::memory_order_relaxed);
  pending_tier_.store(static_cast<int>(tier), std::memory_order_relaxed);
  pending_restart_.store(true, std::memory_order_release);
}

std::uint32_t SimRunner::pack_intent_(Vec2 dir) {
  const InputFrame f = quantize_input(0, 0, dir, false);
  return static_cast<std::uint32_t>(static_cast<std::uint8_t>(f.move_x)) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(f.move_y)) << 8);
}

void SimRunner::set_intent(Slot slot, Vec2 dir, bool dash_pressed) {
  if (slot >= kActorCount) return;
  intent_dir_[slot].store(pack_intent_(dir), std::memory_order_relaxed);
  if (dash_pressed) intent_dash_[slot].store(true, std::memory_order_release);
}

void SimRunner::pull_intents_() {
  for (std::size_t i = 0; i < kActorCount; ++i) {
    const std::uint32_t packed = intent_dir_[i].load(std::memory_order_relaxed);
    InputFrame f{};
    f.move_x = static_cast<std::int8_t>(static_cast<std::uint8_t>(packed & 0xffu));
    f.move_y = static_cast<std::int8_t>(static_cast<std::uint8_t>((packed >> 8) & 0xffu));
    const bool dash = intent_dash_[i].exchange(false, std::memory_order_acq_rel);
    session_->set_human_intent(static_cast<Slot>(i), input_direction(f), dash);
  }
}

void SimRunner::request_seek(std::size_t tick) {
  pending_seek_.store(static_cast<std::int64_t>(tick), std::memory_order_release);
}

double SimRunner::replay_progress() const {
  std::lock_guard<std::mutex> lk(sim_m_);
  return player_ ? player_->progress() : 0.0;
}

std::size_t SimRunner::replay_cursor() const {
  std::lock_guard<std::mutex> lk(sim_m_);
  return player_ ? player_->cursor() : 0;
}

PlaybackStatus SimRunner::playback_status() const {
  std::lock_guard<std::mutex> lk(sim_m_);
  if (!player_) return PlaybackStatus::Finished;
  return player_->status();
}

MatchSetup SimRunner::current_setup() const {
  std::lock_guard<std::mutex> lk(sim_m_);
  return setup_;
}

bool SimRunner::save_last_replay(const std::string& path) const {
  ReplayLog log;
  {
    std::lock_guard<std::mutex> lk(sim_m_);
    if (replay_mode_ && player_) log = player_->log();
    else if (session_)           log = session_->recorder().log();
    else return false;
  }
  return save_replay(path, log);
}

void SimRunner::thread_main_() {
  using clock = std::chrono::steady_clock;
  const auto tick_ns = std::chrono::nanoseconds(static_cast<long long>(1e9 / 240.0)); // 240 Hz wall cadence
  auto next = clock::now();
  auto last = next;

  {
    std::lock_guard<std::mutex> lk(sim_m_);
    if (player_)       buffer_.publish(player_->last_snapshot());
    else if (session_) buffer_.publish(session_->last_snapshot());
  }

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_restart_.exchange(false, std::memory_order_acq_rel)) {
      std::lock_guard<std::mutex> lk(sim_m_);
      if (replay_mode_) {
        spdlog::warn("runner: restart ignored during replay playback");
      } else {
        setup_.seed = pending_seed_.load(std::memory_order_relaxed);
        const int tier = pending_tier_.load(std::memory_order_relaxed);
        if (tier >= 0) {
          for (auto& s : setup_.spawns) s.tier = static_cast<DifficultyTier>(tier);
        }
        rebuild_session_();
        events_.clear();
        buffer_.publish(session_->last_snapshot());
      }
    }

    const std::int64_t seek_to = pending_seek_.exchange(-1, std::memory_order_acq_rel);
    if (seek_to >= 0) {
      std::lock_guard<std::mutex> lk(sim_m_);
      if (player_) {
        player_->seek(static_cast<std::size_t>(seek_to));
        events_.clear();
        buffer_.publish(player_->last_snapshot());
      }
    }

    const auto now = clock::now();
    const double real_dt = std::chrono::duration<double>(now - last).count();
    last = now;
    const double warp = std::max(0.0, time_scale.load(std::memory_order_relaxed));

    int ran = 0;
    {
      std::lock_guard<std::mutex> lk(sim_m_);
      if (player_) {
        player_->set_speed(warp);
        ran = player_->advance(real_dt);
        if (ran > 0) {
          events_.push_all(player_->drain_events());
          buffer_.publish(player_->last_snapshot());
        }
      } else if (session_) {
        pull_intents_();
        ran = session_->update(real_dt * warp);
        if (ran > 0) {
          events_.push_all(session_->drain_events());
          buffer_.publish(session_->last_snapshot());
        }
      }
    }

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }
}

} // namespace ringout
