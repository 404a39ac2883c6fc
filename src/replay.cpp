#include <ringout/replay.hpp>
#include <ringout/text_fields.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <ios>
#include <utility>
#include <spdlog/spdlog.h>

namespace ringout {

namespace {

// Parses "mx,my,dash" starting at cols[at] into f.
bool parse_frame_fields(const std::vector<std::string>& cols, std::size_t at, InputFrame& f) {
  bool ok1 = false, ok2 = false, ok3 = false;
  const long long mx = to_int_safe(cols[at], ok1);
  const long long my = to_int_safe(cols[at + 1], ok2);
  const long long d  = to_int_safe(cols[at + 2], ok3);
  if (!(ok1 && ok2 && ok3)) return false;
  if (mx < -kInputAxisMax || mx > kInputAxisMax || my < -kInputAxisMax || my > kInputAxisMax) return false;
  if (d != 0 && d != 1) return false;
  f.move_x = static_cast<std::int8_t>(mx);
  f.move_y = static_cast<std::int8_t>(my);
  f.dash = d == 1;
  return input_is_legal(f);
}

ReplayLoadResult fail(ReplayError e, std::string detail) {
  spdlog::error("replay: {} ({})", to_string(e), detail);
  ReplayLoadResult r{};
  r.error = e;
  r.detail = std::move(detail);
  return r;
}

} // namespace

const char* to_string(ReplayError e) {
  switch (e) {
    case ReplayError::None:             return "none";
    case ReplayError::IoFailure:        return "io_failure";
    case ReplayError::BadHeader:        return "bad_header";
    case ReplayError::BadVersion:       return "bad_version";
    case ReplayError::CorruptSnapshot:  return "corrupt_snapshot";
    case ReplayError::CorruptConfig:    return "corrupt_config";
    case ReplayError::BadFrame:         return "bad_frame";
    case ReplayError::FrameOrder:       return "frame_order";
    case ReplayError::Truncated:        return "truncated";
    case ReplayError::ChecksumMismatch: return "checksum_mismatch";
  }
  return "unknown";
}

const char* to_string(PlaybackStatus s) {
  switch (s) {
    case PlaybackStatus::Running:  return "running";
    case PlaybackStatus::Paused:   return "paused";
    case PlaybackStatus::Finished: return "finished";
    case PlaybackStatus::Desync:   return "desync";
  }
  return "unknown";
}

ReplayRecorder::ReplayRecorder(const MatchConfig& cfg, const MatchSetup& setup) {
  log_.config = cfg;
  log_.setup = setup;
}

std::uint64_t frame_checksum(const std::vector<TickFrames>& frames) {
  std::uint64_t h = 14695981039346656037ull;
  auto mix = [&h](std::uint8_t b) {
    h ^= b;
    h *= 1099511628211ull;
  };
  for (const auto& tf : frames) {
    for (const auto& f : tf) {
      for (int i = 0; i < 8; ++i) mix(static_cast<std::uint8_t>(f.tick >> (8 * i)));
      mix(f.slot);
      mix(static_cast<std::uint8_t>(f.move_x));
      mix(static_cast<std::uint8_t>(f.move_y));
      mix(f.dash ? 1 : 0);
    }
  }
  return h;
}

ReplayError validate_replay(const ReplayLog& log, std::string* detail) {
  auto bad = [detail](ReplayError e, const std::string& why) {
    if (detail) *detail = why;
    return e;
  };
  if (log.version != kReplayFormatVersion) return bad(ReplayError::BadVersion, "version " + std::to_string(log.version));
  std::string why;
  if (!validate_config(log.config, &why)) return bad(ReplayError::CorruptConfig, why);
  for (const auto& s : log.setup.spawns) {
    if (!is_finite(s.pos)) return bad(ReplayError::CorruptSnapshot, "non-finite spawn");
  }
  for (std::size_t t = 0; t < log.frames.size(); ++t) {
    for (std::size_t s = 0; s < kActorCount; ++s) {
      const InputFrame& f = log.frames[t][s];
      if (f.tick != t || f.slot != s) return bad(ReplayError::FrameOrder, "tick " + std::to_string(t));
      if (!input_is_legal(f)) return bad(ReplayError::BadFrame, "tick " + std::to_string(t));
    }
  }
  return ReplayError::None;
}

void write_replay(std::ostream& out, const ReplayLog& log) {
  out << kReplayMagic << ',' << log.version << '\n';
  out << "seed," << log.setup.seed << '\n';

  const auto old_flags = out.flags();
  for (std::size_t i = 0; i < kActorCount; ++i) {
    const auto& s = log.setup.spawns[i];
    out << "spawn," << i << ','
        << std::hexfloat << s.pos.x << ',' << s.pos.y << ','
        << to_string(s.control) << ',' << to_string(s.tier) << '\n';
    out.flags(old_flags);
  }

  write_config_kv(out, log.config, "config,");

  out << "ticks," << log.frames.size() << '\n';
  for (const auto& tf : log.frames) {
    out << "f," << tf[0].tick;
    for (const auto& f : tf) {
      out << ',' << static_cast<int>(f.move_x) << ',' << static_cast<int>(f.move_y) << ',' << (f.dash ? 1 : 0);
    }
    out << '\n';
  }
  out << "end," << log.frames.size() << ',' << std::hex << frame_checksum(log.frames) << '\n';
  out.flags(old_flags);
}

bool save_replay(const std::string& path, const ReplayLog& log) {
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    spdlog::error("replay: cannot open '{}' for writing", path);
    return false;
  }
  write_replay(f, log);
  f.flush();
  if (!f) {
    spdlog::error("replay: write to '{}' failed", path);
    return false;
  }
  spdlog::info("replay: saved {} ticks to '{}'", log.frames.size(), path);
  return true;
}

ReplayLoadResult read_replay(std::istream& in) {
  std::string line;
  if (!std::getline(in, line)) return fail(ReplayError::BadHeader, "empty input");

  const auto head = split_csv_line(trim(line));
  if (head.size() != 2 || head[0] != kReplayMagic) return fail(ReplayError::BadHeader, "missing magic");
  bool ok = false;
  const long long version = to_int_safe(head[1], ok);
  if (!ok) return fail(ReplayError::BadHeader, "unreadable version");
  if (version != kReplayFormatVersion) return fail(ReplayError::BadVersion, "version " + head[1]);

  ReplayLog log{};
  log.version = static_cast<int>(version);
  bool have_seed = false;
  std::array<bool, kActorCount> have_spawn{};
  bool have_ticks = false;
  std::uint64_t declared = 0;
  bool ended = false;
  std::uint64_t end_count = 0;
  std::uint64_t end_sum = 0;
  std::size_t line_no = 1;

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    const auto cols = split_csv_line(raw);
    const std::string& tag = cols[0];
    const std::string where = "line " + std::to_string(line_no);

    if (ended) return fail(ReplayError::BadFrame, where + ": data after end record");

    if (tag == "seed") {
      if (cols.size() != 2) return fail(ReplayError::BadHeader, where);
      log.setup.seed = to_u64_safe(cols[1], ok);
      if (!ok) return fail(ReplayError::BadHeader, where + ": seed");
      have_seed = true;
    } else if (tag == "spawn") {
      if (cols.size() != 6) return fail(ReplayError::CorruptSnapshot, where);
      const std::uint64_t slot = to_u64_safe(cols[1], ok);
      if (!ok || slot >= kActorCount) return fail(ReplayError::CorruptSnapshot, where + ": slot");
      bool okx = false, oky = false;
      ActorSpawn s{};
      s.pos = {to_double_safe(cols[2], okx), to_double_safe(cols[3], oky)};
      if (!(okx && oky) || !is_finite(s.pos)) return fail(ReplayError::CorruptSnapshot, where + ": position");
      if (cols[4] == "human")   s.control = ControlKind::Human;
      else if (cols[4] == "ai") s.control = ControlKind::Ai;
      else return fail(ReplayError::CorruptSnapshot, where + ": control");
      const auto tier = tier_from_string(cols[5]);
      if (!tier) return fail(ReplayError::CorruptSnapshot, where + ": tier");
      s.tier = *tier;
      log.setup.spawns[slot] = s;
      have_spawn[slot] = true;
    } else if (tag == "config") {
      if (cols.size() != 3 || !apply_config_value(log.config, cols[1], cols[2])) {
        return fail(ReplayError::CorruptConfig, where);
      }
    } else if (tag == "ticks") {
      if (cols.size() != 2) return fail(ReplayError::BadHeader, where);
      declared = to_u64_safe(cols[1], ok);
      if (!ok) return fail(ReplayError::BadHeader, where + ": ticks");
      have_ticks = true;
      log.frames.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(declared, 1u << 20)));
    } else if (tag == "f") {
      if (!have_ticks) return fail(ReplayError::BadHeader, where + ": frame before ticks record");
      if (cols.size() != 2 + 3 * kActorCount) return fail(ReplayError::BadFrame, where);
      const std::uint64_t t = to_u64_safe(cols[1], ok);
      if (!ok) return fail(ReplayError::BadFrame, where + ": tick");
      if (t != log.frames.size()) return fail(ReplayError::FrameOrder, where + ": tick " + cols[1]);
      TickFrames tf{};
      for (std::size_t s = 0; s < kActorCount; ++s) {
        tf[s].tick = t;
        tf[s].slot = static_cast<std::uint8_t>(s);
        if (!parse_frame_fields(cols, 2 + 3 * s, tf[s])) return fail(ReplayError::BadFrame, where);
      }
      log.frames.push_back(tf);
    } else if (tag == "end") {
      if (cols.size() != 3) return fail(ReplayError::Truncated, where);
      bool ok1 = false, ok2 = false;
      end_count = to_u64_safe(cols[1], ok1);
      end_sum = to_u64_safe(cols[2], ok2, 16);
      if (!(ok1 && ok2)) return fail(ReplayError::Truncated, where + ": end record");
      ended = true;
    } else {
      return fail(ReplayError::BadHeader, where + ": unknown record '" + tag + "'");
    }
  }

  if (in.bad()) return fail(ReplayError::IoFailure, "read error");
  if (!have_seed) return fail(ReplayError::BadHeader, "no seed record");
  if (!have_spawn[0] || !have_spawn[1]) return fail(ReplayError::CorruptSnapshot, "missing spawn");
  std::string why;
  if (!validate_config(log.config, &why)) return fail(ReplayError::CorruptConfig, why);
  if (!ended || !have_ticks) return fail(ReplayError::Truncated, "no end record");
  if (declared != log.frames.size() || end_count != log.frames.size()) {
    return fail(ReplayError::Truncated, std::to_string(log.frames.size()) + " of " + std::to_string(declared) + " frames");
  }
  if (end_sum != frame_checksum(log.frames)) return fail(ReplayError::ChecksumMismatch, "frames altered");

  ReplayLoadResult r{};
  r.log = std::move(log);
  return r;
}

ReplayLoadResult load_replay(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return fail(ReplayError::IoFailure, "cannot open '" + path + "'");
  auto r = read_replay(f);
  if (r.ok()) spdlog::info("replay: loaded {} ticks from '{}'", r.log->frames.size(), path);
  return r;
}

// ---- ReplayPlayer ----

std::optional<ReplayPlayer> ReplayPlayer::create(ReplayLog log, bool verify_ai, ReplayError* error) {
  std::string why;
  const ReplayError e = validate_replay(log, &why);
  if (error) *error = e;
  if (e != ReplayError::None) {
    spdlog::error("replay: not playable: {} ({})", to_string(e), why);
    return std::nullopt;
  }
  return ReplayPlayer(std::move(log), verify_ai);
}

ReplayPlayer::ReplayPlayer(ReplayLog log, bool verify_ai)
  : log_(std::move(log)),
    match_(log_.config, log_.setup),
    clock_(log_.config.dt, log_.config.max_steps_per_frame),
    last_snapshot_(match_.snapshot()),
    verify_ai_(verify_ai) {
  rewind_();
}

void ReplayPlayer::rewind_() {
  match_ = Match(log_.config, log_.setup);
  clock_.reset();
  last_snapshot_ = match_.snapshot();
  pending_.clear();
  cursor_ = 0;
  status_ = PlaybackStatus::Running;
  for (std::size_t i = 0; i < kActorCount; ++i) {
    verifiers_[i].reset();
    const auto& s = log_.setup.spawns[i];
    if (verify_ai_ && s.control == ControlKind::Ai) verifiers_[i].emplace(log_.config, static_cast<Slot>(i), s.tier);
  }
}

PlaybackStatus ReplayPlayer::seek(std::size_t tick) {
  const std::size_t target = std::min(tick, log_.frames.size());
  if (target < cursor_ || status_ == PlaybackStatus::Desync) rewind_();
  while (cursor_ < target && status_ == PlaybackStatus::Running) step();
  if (cursor_ == log_.frames.size() && status_ == PlaybackStatus::Running) status_ = PlaybackStatus::Finished;
  pending_.clear();
  spdlog::debug("replay: seek to tick {} (now at {})", tick, cursor_);
  return status();
}

double ReplayPlayer::progress() const {
  if (log_.frames.empty()) return 1.0;
  return static_cast<double>(cursor_) / static_cast<double>(log_.frames.size());
}

bool ReplayPlayer::verify_ai_frames_(const TickFrames& recorded) {
  for (std::size_t i = 0; i < kActorCount; ++i) {
    if (!verifiers_[i]) continue;
    const InputFrame expect = verifiers_[i]->decide(perceive(last_snapshot_, static_cast<Slot>(i)),
                                                    match_.ai_rng(i));
    if (!(expect == recorded[i])) {
      spdlog::error("replay: ai slot {} diverged at tick {} (recorded {},{},{} vs {},{},{})",
                    i, recorded[i].tick,
                    static_cast<int>(recorded[i].move_x), static_cast<int>(recorded[i].move_y), recorded[i].dash,
                    static_cast<int>(expect.move_x), static_cast<int>(expect.move_y), expect.dash);
      return false;
    }
  }
  return true;
}

PlaybackStatus ReplayPlayer::step() {
  if (status_ == PlaybackStatus::Finished || status_ == PlaybackStatus::Desync) return status_;
  if (cursor_ >= log_.frames.size()) {
    status_ = PlaybackStatus::Finished;
    return status_;
  }

  const TickFrames& frames = log_.frames[cursor_];
  if (!verify_ai_frames_(frames)) {
    status_ = PlaybackStatus::Desync;
    return status_;
  }

  TickResult r = match_.tick(frames);
  if (r.status == TickStatus::Desync) {
    status_ = PlaybackStatus::Desync;
    return status_;
  }
  pending_.insert(pending_.end(), r.events.begin(), r.events.end());
  last_snapshot_ = std::move(r.snapshot);
  ++cursor_;

  if (match_.over() && cursor_ < log_.frames.size()) {
    spdlog::error("replay: match ended at tick {} with {} frames left", cursor_, log_.frames.size() - cursor_);
    status_ = PlaybackStatus::Desync;
  } else if (cursor_ == log_.frames.size()) {
    status_ = PlaybackStatus::Finished;
  }
  return status();
}

int ReplayPlayer::advance(double wall_dt) {
  if (status_ != PlaybackStatus::Running || speed_ <= 0.0) return 0;
  const int due = clock_.advance(wall_dt * speed_);
  int ran = 0;
  while (ran < due && status_ == PlaybackStatus::Running) {
    step();
    ++ran;
  }
  return ran;
}

void ReplayPlayer::set_speed(double speed) {
  speed_ = std::isfinite(speed) ? std::clamp(speed, 0.0, 4.0) : 0.0;
}

PlaybackStatus ReplayPlayer::status() const {
  if (status_ == PlaybackStatus::Running && speed_ <= 0.0) return PlaybackStatus::Paused;
  return status_;
}

EventList ReplayPlayer::drain_events() {
  EventList out;
  out.swap(pending_);
  return out;
}

} // namespace ringout
