#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include <fzd/viewer/app.hpp>
#include <fzd/errors.hpp>
#include <fzd/sim_runner.hpp>
#include <fzd/track.hpp>
#include <spdlog/spdlog.h>

namespace fzd {

namespace {

static constexpr double kRadToDeg = 180.0 / kPI;

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

// Target-speed slider range of the control panel.
static constexpr double kTargetMin = 10.0;
static constexpr double kTargetMax = 35.0;

// --- HUD layout ---
static constexpr int kHUD_LINE1_Y = 20;  // size 20
static constexpr int kHUD_LINE2_Y = 46;  // size 18
static constexpr int kHUD_LINE3_Y = 70;  // size 18
static constexpr int kHUD_HELP_Y  = 96;  // size 14

static const Color kCarColor    {231, 76, 60, 255};
static const Color kTrailColor  {52, 152, 219, 160};
static const Color kTargetColor {46, 204, 113, 255};
static const Color kSpeedColor  {52, 152, 219, 255};
static const Color kThrottleCol {231, 76, 60, 255};

struct Chart {
  int x, y, w, h;
  double y_min, y_max;
};

static void draw_chart_frame(const Chart& c, const char* title) {
  DrawRectangle(c.x - 4, c.y - 22, c.w + 8, c.h + 30, Color{0,0,0,80});
  DrawRectangle(c.x, c.y, c.w, c.h, Color{24,24,28,220});
  DrawText(title, c.x, c.y - 18, 14, Color{220,220,230,255});
}

template <class Get>
static void draw_series(const Chart& c, const std::vector<HistoryPoint>& pts,
                        double t0, double t1, Get get, Color col) {
  if (pts.size() < 2 || t1 <= t0) return;
  auto to_px = [&](const HistoryPoint& p) {
    const double u = (p.time - t0) / (t1 - t0);
    double v = (get(p) - c.y_min) / (c.y_max - c.y_min);
    v = std::clamp(v, 0.0, 1.0);
    return Vector2{ float(c.x + u * c.w), float(c.y + c.h - v * c.h) };
  };
  Vector2 prev = to_px(pts.front());
  for (std::size_t i = 1; i < pts.size(); ++i) {
    const Vector2 cur = to_px(pts[i]);
    DrawLineEx(prev, cur, 2.0f, col);
    prev = cur;
  }
}

} // namespace

ViewerApp::ViewerApp(SimRunner& sim) : sim_(sim) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y, float scale) const {
  const float cx = GetScreenWidth()  * 0.35f;
  const float cy = GetScreenHeight() * 0.55f;
  return { cx + float(x * scale), cy - float(y * scale) };
}

int ViewerApp::run() {
  const int W = 1280, H = 768;
  InitWindow(W, H, "fuzzydrive - fuzzy cruise control");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::adjust_vehicle_(double d_mass, double d_drag, double d_force) {
  VehicleParams p = sim_.vehicle_params();
  p.mass             = std::clamp(p.mass + d_mass, 250.0, 2000.0);
  p.drag_coefficient = std::clamp(p.drag_coefficient + d_drag, 25.0, 250.0);
  p.max_drive_force  = std::clamp(p.max_drive_force + d_force, 2000.0, 10000.0);
  try {
    sim_.request_vehicle_params(p);
  } catch (const InvalidParameter& e) {
    spdlog::warn("vehicle params rejected: {}", e.what());
  }
}

void ViewerApp::process_input_() {
  // Time warp controls
  if (IsKeyPressed(KEY_SPACE)) {
    double cur = sim_.time_scale.load();
    sim_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   sim_.time_scale.store(0.25);
  if (IsKeyPressed(KEY_TWO))   sim_.time_scale.store(0.5);
  if (IsKeyPressed(KEY_THREE)) sim_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_FOUR))  sim_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_FIVE))  sim_.time_scale.store(4.0);

  // Target speed
  if (IsKeyPressed(KEY_UP) || IsKeyPressed(KEY_DOWN)) {
    const double step = IsKeyPressed(KEY_UP) ? 1.0 : -1.0;
    sim_.target_speed.store(std::clamp(sim_.target_speed.load() + step, kTargetMin, kTargetMax));
  }

  // Controller on/off, fuzzy/manual, manual throttle
  if (IsKeyPressed(KEY_E)) sim_.enabled.store(!sim_.enabled.load());
  if (IsKeyPressed(KEY_M)) sim_.manual.store(!sim_.manual.load());
  if (IsKeyPressed(KEY_LEFT) || IsKeyPressed(KEY_RIGHT)) {
    const double step = IsKeyPressed(KEY_RIGHT) ? 5.0 : -5.0;
    sim_.manual_throttle.store(std::clamp(sim_.manual_throttle.load() + step, 0.0, 100.0));
  }
  if (IsKeyPressed(KEY_A)) sim_.adaptive_target.store(!sim_.adaptive_target.load());

  // Vehicle parameters
  if (IsKeyPressed(KEY_Z)) adjust_vehicle_(-50.0, 0.0, 0.0);
  if (IsKeyPressed(KEY_X)) adjust_vehicle_(+50.0, 0.0, 0.0);
  if (IsKeyPressed(KEY_C)) adjust_vehicle_(0.0, -5.0, 0.0);
  if (IsKeyPressed(KEY_V)) adjust_vehicle_(0.0, +5.0, 0.0);
  if (IsKeyPressed(KEY_B)) adjust_vehicle_(0.0, 0.0, -500.0);
  if (IsKeyPressed(KEY_N)) adjust_vehicle_(0.0, 0.0, +500.0);

  // Zoom
  if (IsKeyDown(KEY_KP_ADD) || IsKeyDown(KEY_EQUAL)) scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_KP_SUBTRACT) || IsKeyDown(KEY_MINUS)) scale_px_per_m_ *= 0.99f;

  if (IsKeyPressed(KEY_R)) {
    sim_.request_reset();
    history_.clear();
    ibuf_.clear();
  }
}

void ViewerApp::pump_snapshots_() {
  auto& buf = sim_.buffer();
  while (buf.try_consume_latest(cursor_, last_snap_)) {
    ibuf_.push(last_snap_);
    history_.push(last_snap_);
  }
}

void ViewerApp::render_frame_() {
  CruiseSnapshot draw = last_snap_;
  const double target = ibuf_.latest_time() - interp_delay_;
  (void)ibuf_.sample(target, draw);

  BeginDrawing();
  ClearBackground(Color{30, 60, 30, 255});

  draw_track_(scale_px_per_m_);
  draw_car_(draw);
  draw_charts_();
  draw_hud_(draw);
  EndDrawing();
}

void ViewerApp::draw_track_(float scale_px_per_m) {
  const auto& pts = sim_.track_path().points();
  if (pts.size() < 2) return;

  const float width_m = 5.0f;
  const float half_w_px = 0.5f * width_m * scale_px_per_m;

  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
    auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, half_w_px*2.0f, Color{40,40,46,255});
  }
  // Centre line
  for (std::size_t i = 1; i < pts.size(); i += 2) {
    auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
    auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, 1.0f, Color{46,204,113,120});
  }

  // Start line at s = 0
  const Pose2 s0 = sim_.track_path().sample_pose(0.0);
  auto c = worldToScreen_(s0.x, s0.y, scale_px_per_m);
  Rectangle line{ c.x, c.y, width_m * scale_px_per_m, 3.0f };
  DrawRectanglePro(line, {line.width*0.5f, line.height*0.5f},
                   float(-(s0.heading_rad + kPI * 0.5) * kRadToDeg), Color{240,240,240,255});
}

void ViewerApp::draw_car_(const CruiseSnapshot& draw) {
  // Trail: last few seconds of travelled distance mapped back onto the track
  const auto recent = history_.window(5.0);
  for (std::size_t i = 1; i < recent.size(); ++i) {
    const Pose2 pa = sim_.track_path().sample_pose(recent[i-1].position);
    const Pose2 pb = sim_.track_path().sample_pose(recent[i].position);
    auto a = worldToScreen_(pa.x, pa.y, scale_px_per_m_);
    auto b = worldToScreen_(pb.x, pb.y, scale_px_per_m_);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, 2.0f, kTrailColor);
  }

  auto p = worldToScreen_(draw.x, draw.y, scale_px_per_m_);
  Vector2 pos{p.x, p.y};
  float len = 12.0f, wid = 6.0f;
  float c = std::cos(float(draw.heading_rad)), s = std::sin(float(draw.heading_rad));
  Vector2 nose  = { pos.x + c*len,          pos.y - s*len };
  Vector2 tailL = { pos.x - c*len + s*wid,  pos.y + s*len + c*wid };
  Vector2 tailR = { pos.x - c*len - s*wid,  pos.y + s*len - c*wid };
  DrawTriangle(nose, tailL, tailR, kCarColor);
  DrawTriangle(nose, tailR, tailL, kCarColor);
  DrawCircleV(pos, 3.0f, kCarColor);
}

void ViewerApp::draw_charts_() {
  const auto pts = history_.window(chart_window_s_);
  const int x0 = GetScreenWidth() - 440;
  const Chart speed   { x0, 160, 400, 220, 0.0, 40.0 };
  const Chart throttle{ x0, 440, 400, 220, 0.0, 100.0 };

  draw_chart_frame(speed, "Speed (blue) vs target (green) [m/s]");
  draw_chart_frame(throttle, "Throttle [%]");
  if (pts.size() < 2) return;

  const double t1 = pts.back().time;
  const double t0 = std::max(0.0, t1 - chart_window_s_);
  const double t_end = std::max(t1, t0 + chart_window_s_);
  draw_series(speed, pts, t0, t_end, [](const HistoryPoint& p){ return p.target_speed; }, kTargetColor);
  draw_series(speed, pts, t0, t_end, [](const HistoryPoint& p){ return p.speed; }, kSpeedColor);
  draw_series(throttle, pts, t0, t_end, [](const HistoryPoint& p){ return p.throttle; }, kThrottleCol);
}

void ViewerApp::draw_hud_(const CruiseSnapshot& draw) {
  const double warp = sim_.time_scale.load();
  const VehicleParams vp = sim_.vehicle_params();

  DrawText(TextFormat("t=%.1fs  lap=%llu  pos=%.1fm  warp=%s  mode=%s%s%s",
                      draw.sim_time,
                      (unsigned long long)draw.lap,
                      draw.position,
                      warpLabel(warp),
                      draw.manual ? "MANUAL" : "FUZZY",
                      draw.enabled ? "" : "  [controller off]",
                      sim_.adaptive_target.load() ? "  [adaptive target]" : ""),
           20, kHUD_LINE1_Y, 20, Color{220,235,220,255});

  DrawText(TextFormat("speed=%.1f m/s (%.1f km/h)  target=%.1f  error=%+.1f  accel=%+.2f  throttle=%.1f%%",
                      draw.speed, draw.speed * 3.6, draw.target_speed, draw.speed_error,
                      draw.acceleration, draw.throttle),
           20, kHUD_LINE2_Y, 18, draw.degenerate ? Color{255,120,120,255} : Color{235,220,220,255});

  DrawText(TextFormat("mass=%.0f kg  drag=%.0f N*s/m  drive=%.1f kN  manual throttle=%.0f%%",
                      vp.mass, vp.drag_coefficient, vp.max_drive_force / 1000.0,
                      sim_.manual_throttle.load()),
           20, kHUD_LINE3_Y, 18, Color{220,220,235,255});

  DrawText("Space: Pause | 1..5: warp | Up/Down: target | E: controller on/off | M: fuzzy/manual | "
           "Left/Right: manual throttle | A: adaptive target | Z/X mass C/V drag B/N drive | +/-: zoom | R: reset",
           20, kHUD_HELP_Y, 14, Color{190,205,190,255});
}

} // namespace fzd
