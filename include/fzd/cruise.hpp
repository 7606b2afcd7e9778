#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <fzd/controller.hpp>
#include <fzd/track.hpp>
#include <fzd/vehicle.hpp>

namespace fzd {

enum class DriveMode : int {
  Fuzzy = 0,    // throttle from the fuzzy controller
  Manual = 1    // throttle from set_manual_throttle()
};

struct TickSample {
  double sim_time = 0.0;        // after this tick (s)
  std::uint64_t tick = 0;       // 1 for the first tick after reset
  double target_speed = 0.0;
  double speed_error = 0.0;     // target - speed before the step
  double throttle = 0.0;        // % applied during the step
  VehicleState state{};         // after the step
  bool degenerate = false;      // controller fell back to zero throttle
};

// One vehicle driven by a (shared, immutable) fuzzy controller.
// Each tick: error from the current state -> throttle -> one dynamics step.
class CruiseLoop {
public:
  // Throws InvalidParameter for a null controller or invalid params.
  explicit CruiseLoop(ControllerPtr controller, const VehicleParams& params = {});

  // Throws InvalidParameter if dt <= 0.
  TickSample tick(double dt);
  std::vector<TickSample> run(std::size_t ticks, double dt);

  // Zero vehicle state, sim time and tick counter. Inputs are kept.
  void reset();

  void set_target_speed(double v) { target_speed_ = v; }
  double target_speed() const { return target_speed_; }

  // Disabled: throttle 0, the vehicle coasts.
  void set_enabled(bool on) { enabled_ = on; }
  bool enabled() const { return enabled_; }

  void set_mode(DriveMode m) { mode_ = m; }
  DriveMode mode() const { return mode_; }
  void set_manual_throttle(double t) { manual_throttle_ = t; }
  double manual_throttle() const { return manual_throttle_; }

  // Target speed follows the track position instead of set_target_speed().
  void set_adaptive_target(TrackPath track, TargetProfile profile);
  void clear_adaptive_target() { adaptive_.reset(); }
  bool adaptive_target() const { return adaptive_.has_value(); }

  // Target in effect for the current position.
  double current_target() const;

  void set_vehicle_params(const VehicleParams& p) { vehicle_.set_params(p); }

  const VehicleDynamics& vehicle() const { return vehicle_; }
  const FuzzyController& controller() const { return *controller_; }
  double sim_time() const { return sim_time_; }
  std::uint64_t ticks() const { return tick_; }

private:
  struct Adaptive {
    TrackPath track;
    TargetProfile profile;
  };

  ControllerPtr controller_;
  VehicleDynamics vehicle_;
  std::optional<Adaptive> adaptive_;

  double target_speed_{20.0};
  bool enabled_{true};
  DriveMode mode_{DriveMode::Fuzzy};
  double manual_throttle_{50.0};

  double sim_time_{0.0};
  std::uint64_t tick_{0};
};

} // namespace fzd
