#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <fzd/controller.hpp>
#include <fzd/track.hpp>
#include <fzd/vehicle.hpp>

namespace fzd {

struct SimSettings {
  double dt = 0.1;             // s per tick
  double target_speed = 20.0;  // initial target
  TrackShape track = TrackShape::Oval;
};

// Upper bound for `resolution` rows.
inline constexpr std::size_t kMaxResolution = 1000000;

struct LoadedConfig {
  ControllerConfig controller = default_controller_config();
  VehicleParams vehicle{};
  SimSettings sim{};
};

// Line-oriented CSV config. Rows:
//   range,<variable>,<lo>,<hi>
//   set,<variable>,<label>,<a>,<b>,<c>[,<d>]
//   rule,<speed_error label>,<acceleration label>,<throttle label>
//   resolution,<samples>
//   vehicle,<mass|max_drive_force|drag_coefficient>,<value>
//   sim,<dt|target_speed>,<value>
//   sim,track,<oval|stadium>
// Blank lines and '#' comments are skipped. The first `set` row for a
// variable replaces its default sets; the first `rule` row replaces the
// default rule base. Malformed rows throw InvalidParameter with the line number.
LoadedConfig load_config_from_stream(std::istream& in);

// Empty if the file cannot be opened; parse errors still throw.
std::optional<LoadedConfig> load_config_file(const std::string& path);

} // namespace fzd
