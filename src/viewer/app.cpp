#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <string>

#include <ringout/viewer/app.hpp>
#include <ringout/sim_runner.hpp>
#include <ringout/snap_buffer.hpp>

namespace ringout {

namespace {

constexpr std::size_t kFeedLines = 6;

const char* warp_label(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

Color actor_color(int slot) {
  return slot == 0 ? Color{231, 76, 60, 255} : Color{52, 152, 219, 255};
}

Color powerup_color(PowerUpKind k) {
  switch (k) {
    case PowerUpKind::SpeedBoost: return Color{241, 196, 15, 255};
    case PowerUpKind::Shield:     return Color{26, 188, 156, 255};
    case PowerUpKind::SizeUp:     return Color{230, 126, 34, 255};
    case PowerUpKind::SizeDown:   return Color{155, 89, 182, 255};
    case PowerUpKind::MultiDash:  return Color{46, 204, 113, 255};
    case PowerUpKind::Teleport:   return Color{236, 112, 99, 255};
    case PowerUpKind::Freeze:     return Color{133, 193, 233, 255};
    case PowerUpKind::Magnet:     return Color{200, 200, 210, 255};
    default:                      return WHITE;
  }
}

std::string timestamp_yyyyMMdd_HHmmss() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf);
}

Vec2 read_move(int left, int right, int up, int down) {
  Vec2 d{};
  if (IsKeyDown(left))  d.x -= 1.0;
  if (IsKeyDown(right)) d.x += 1.0;
  if (IsKeyDown(up))    d.y += 1.0;
  if (IsKeyDown(down))  d.y -= 1.0;
  return normalized_or(d, Vec2{});
}

std::string describe(const SimEvent& e) {
  char buf[128];
  switch (e.kind) {
    case EventKind::CollisionOccurred:
      std::snprintf(buf, sizeof(buf), "hit  %.0f", e.magnitude);
      break;
    case EventKind::ActorEliminated:
      std::snprintf(buf, sizeof(buf), "P%d out (%d left)", e.actor + 1, e.stocks_remaining);
      break;
    case EventKind::PowerUpClaimed:
      std::snprintf(buf, sizeof(buf), "P%d took %s", e.actor + 1, to_string(e.powerup));
      break;
    case EventKind::MatchEnded:
      if (e.actor == kNoActor) std::snprintf(buf, sizeof(buf), "draw (%s)", to_string(e.end_reason));
      else std::snprintf(buf, sizeof(buf), "P%d wins (%s)", e.actor + 1, to_string(e.end_reason));
      break;
    default:
      return {};
  }
  return buf;
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SimRunner& sim, const ViewerOptions& opts) : sim_(sim), opts_(opts) {}

ViewerApp::Vec2f ViewerApp::world_to_screen_(double x, double y) const {
  const float cx = GetScreenWidth()  * 0.5f + shake_ * std::sin(static_cast<float>(GetTime()) * 91.0f);
  const float cy = GetScreenHeight() * 0.5f + shake_ * std::cos(static_cast<float>(GetTime()) * 77.0f);
  return { cx + float(x * scale_px_per_unit_), cy - float(y * scale_px_per_unit_) };
}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, "ringout");
  SetTargetFPS(144);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    pump_events_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) {
    double cur = sim_.time_scale.load();
    sim_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   sim_.time_scale.store(0.25);
  if (IsKeyPressed(KEY_TWO))   sim_.time_scale.store(0.5);
  if (IsKeyPressed(KEY_THREE)) sim_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_FOUR))  sim_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_FIVE))  sim_.time_scale.store(4.0);

  if (IsKeyDown(KEY_KP_ADD))      scale_px_per_unit_ *= 1.01f;
  if (IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_unit_ *= 0.99f;

  if (IsKeyPressed(KEY_F1)) {
    const std::string path = "ringout_" + timestamp_yyyyMMdd_HHmmss() + ".rpl";
    status_line_ = sim_.save_last_replay(path) ? "saved " + path : "replay save failed";
  }

  if (opts_.replay) {
    // Arrow keys jump five seconds of match time.
    const double tps = last_snap_.tick > 0 && last_snap_.sim_time > 0.0
                         ? static_cast<double>(last_snap_.tick) / last_snap_.sim_time : 60.0;
    const auto step = static_cast<std::size_t>(5.0 * tps + 0.5);
    const std::size_t at = sim_.replay_cursor();
    if (IsKeyPressed(KEY_LEFT))  sim_.request_seek(at > step ? at - step : 0);
    if (IsKeyPressed(KEY_RIGHT)) sim_.request_seek(at + step);
    if (IsKeyPressed(KEY_HOME))  sim_.request_seek(0);
    return;
  }

  sim_.set_intent(0, read_move(KEY_A, KEY_D, KEY_W, KEY_S), IsKeyPressed(KEY_LEFT_SHIFT));
  if (opts_.versus) {
    sim_.set_intent(1, read_move(KEY_LEFT, KEY_RIGHT, KEY_UP, KEY_DOWN), IsKeyPressed(KEY_RIGHT_SHIFT));
  }

  if (IsKeyPressed(KEY_R)) {
    ++opts_.seed;
    sim_.request_restart(opts_.seed);
    status_line_.clear();
  }
  if (IsKeyPressed(KEY_T)) {
    const int next = (static_cast<int>(opts_.tier) + 1) % static_cast<int>(DifficultyTier::Count);
    opts_.tier = static_cast<DifficultyTier>(next);
    ++opts_.seed;
    sim_.request_restart(opts_.seed, opts_.tier);
    status_line_.clear();
  }
}

void ViewerApp::pump_snapshots_() {
  auto& buf = sim_.buffer();
  while (buf.try_consume_latest(cursor_, last_snap_)) {
    // A restart starts time over; drop stale history.
    if (last_snap_.sim_time < ibuf_.latest_time()) ibuf_.clear();
    ibuf_.push(last_snap_);
  }
}

void ViewerApp::pump_events_() {
  for (const auto& e : sim_.events().drain()) {
    if (e.kind == EventKind::CollisionOccurred) shake_ = std::min(12.0f, shake_ + float(e.magnitude) * 0.01f);
    std::string line = describe(e);
    if (line.empty()) continue;
    feed_.push_back(std::move(line));
    while (feed_.size() > kFeedLines) feed_.pop_front();
  }
  shake_ *= 0.9f;
}

void ViewerApp::render_frame_() {
  ArenaSnapshot draw = last_snap_;
  const double target = ibuf_.latest_time() - interp_delay_;
  (void)ibuf_.sample(target, draw);

  BeginDrawing();
  ClearBackground(Color{12, 14, 22, 255});
  draw_arena_(draw);
  draw_powerups_(draw);
  draw_actors_(draw);
  draw_hud_(draw);
  EndDrawing();
}

void ViewerApp::draw_arena_(const ArenaSnapshot& draw) {
  const auto c = world_to_screen_(0.0, 0.0);
  const float r = float(draw.arena_radius) * scale_px_per_unit_;
  const Color edge = draw.platform_phase == PlatformPhase::Shrinking ? Color{231, 76, 60, 255}
                                                                     : Color{90, 96, 120, 255};
  DrawCircleV({c.x, c.y}, r, Color{40, 44, 58, 255});
  DrawRing({c.x, c.y}, r - 3.0f, r, 0.0f, 360.0f, 96, edge);
}

void ViewerApp::draw_powerups_(const ArenaSnapshot& draw) {
  for (const auto& p : draw.powerups) {
    const auto s = world_to_screen_(p.x, p.y);
    const Color col = powerup_color(p.kind);
    if (p.state == SlotState::Spawning) {
      DrawCircleLines(int(s.x), int(s.y), 10.0f, col);
    } else {
      DrawCircleV({s.x, s.y}, 8.0f, col);
    }
  }
}

void ViewerApp::draw_actors_(const ArenaSnapshot& draw) {
  for (const auto& a : draw.actors) {
    if (!a.alive) continue;
    const auto s = world_to_screen_(a.x, a.y);
    const float r = float(a.radius) * scale_px_per_unit_;
    Color col = actor_color(a.slot);
    if (a.has_effect(EffectKind::Frozen)) col = Color{133, 193, 233, 255};
    DrawCircleV({s.x, s.y}, r, col);
    if (a.has_effect(EffectKind::Shield)) DrawCircleLines(int(s.x), int(s.y), r + 4.0f, Color{26, 188, 156, 255});
    if (a.dash == DashPhase::Active)      DrawCircleLines(int(s.x), int(s.y), r + 2.0f, WHITE);

    const float fc = std::cos(float(a.facing_rad)), fs = std::sin(float(a.facing_rad));
    DrawLineEx({s.x, s.y}, {s.x + fc * r, s.y - fs * r}, 3.0f, Color{20, 20, 24, 255});
  }
}

void ViewerApp::draw_hud_(const ArenaSnapshot& draw) {
  const double warp = sim_.time_scale.load();
  const ActorPose* p1 = find_actor(draw, 0);
  const ActorPose* p2 = find_actor(draw, 1);

  DrawText(TextFormat("t=%.2fs  r=%.1f  %s  warp=%s  tier=%s%s",
                      draw.sim_time, draw.arena_radius, to_string(draw.platform_phase),
                      warp_label(warp), to_string(opts_.tier),
                      opts_.replay ? "  [REPLAY]" : ""),
           20, 20, 20, Color{220, 235, 220, 255});

  if (p1 && p2) {
    DrawText(TextFormat("P1 stocks %d  dash %s x%d", p1->stocks, to_string(p1->dash), p1->dash_charges),
             20, 46, 18, actor_color(0));
    DrawText(TextFormat("P2 stocks %d  dash %s x%d", p2->stocks, to_string(p2->dash), p2->dash_charges),
             20, 68, 18, actor_color(1));
  }

  if (draw.match_over) {
    const char* msg = draw.winner == kNoActor ? "DRAW" : (draw.winner == 0 ? "P1 WINS" : "P2 WINS");
    const int w = MeasureText(msg, 48);
    DrawText(msg, GetScreenWidth() / 2 - w / 2, GetScreenHeight() / 2 - 24, 48, RAYWHITE);
  }

  int y = 100;
  for (const auto& line : feed_) {
    DrawText(line.c_str(), 20, y, 14, Color{190, 205, 190, 255});
    y += 16;
  }
  if (opts_.replay) {
    const float bar_w = static_cast<float>(GetScreenWidth() - 40);
    const float done = static_cast<float>(sim_.replay_progress());
    DrawRectangle(20, GetScreenHeight() - 64, static_cast<int>(bar_w), 6, Color{60, 70, 60, 255});
    DrawRectangle(20, GetScreenHeight() - 64, static_cast<int>(bar_w * done), 6, Color{220, 235, 220, 255});
  }
  if (!status_line_.empty()) DrawText(status_line_.c_str(), 20, GetScreenHeight() - 48, 14, YELLOW);

  DrawText(opts_.replay
             ? "Space: Pause | 1..5: 0.25x 0.5x 1x 2x 4x | Left/Right: -/+5s | Home: Start | F1: Save copy"
             : "WASD+LShift: P1 | Arrows+RShift: P2 (versus) | R: Restart | T: Tier | F1: Save replay | Space: Pause",
           20, GetScreenHeight() - 24, 14, Color{190, 205, 190, 255});
}

} // namespace ringout
