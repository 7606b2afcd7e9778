#pragma once
#include <cstdint>

namespace fzd {

// Single immutable sample of one tick for the client
struct CruiseSnapshot {
  double x = 0.0;             // world X on the track (m)
  double y = 0.0;             // world Y on the track (m)
  double heading_rad = 0.0;   // world heading (rad)
  double sim_time = 0.0;      // accumulated sim time (s)
  std::uint64_t tick = 0;     // sim tick index
  std::uint64_t lap = 0;      // completed laps

  double position = 0.0;      // distance travelled (m)
  double speed = 0.0;
  double acceleration = 0.0;
  double throttle = 0.0;      // %
  double target_speed = 0.0;
  double speed_error = 0.0;

  bool enabled = true;
  bool manual = false;
  bool degenerate = false;
};

} // namespace fzd
