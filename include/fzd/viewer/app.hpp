#pragma once
#include <cstdint>
#include <fzd/history.hpp>
#include <fzd/interp.hpp>
#include <fzd/snap.hpp>

namespace fzd {

class SimRunner;

// RAII application that renders the latest snapshots, HUD and charts.
class ViewerApp {
public:
  explicit ViewerApp(SimRunner& sim);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void adjust_vehicle_(double d_mass, double d_drag, double d_force);
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_track_(float scale_px_per_m);
  void draw_car_(const CruiseSnapshot& draw);
  void draw_hud_(const CruiseSnapshot& draw);
  void draw_charts_();

  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y, float scale) const;

  SimRunner& sim_;
  InterpBuffer ibuf_{};
  History history_{2048};
  CruiseSnapshot last_snap_{};
  std::uint64_t cursor_{0};

  float  scale_px_per_m_{5.0f};
  double interp_delay_{0.150};
  double chart_window_s_{20.0};
};

} // namespace fzd
