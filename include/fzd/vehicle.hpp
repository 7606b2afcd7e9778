#pragma once

namespace fzd {

// Plant parameters. Defaults hold 20 speed units at 50 % throttle.
struct VehicleParams {
  double mass = 500.0;               // kg
  double max_drive_force = 5000.0;   // N at 100 % throttle
  double drag_coefficient = 125.0;   // N per (m/s)
};

struct VehicleState {
  double position = 0.0;       // m travelled
  double speed = 0.0;          // m/s, never negative
  double acceleration = 0.0;   // m/s^2 produced by the last update
};

// Throws InvalidParameter unless mass > 0, drag > 0 and drive force >= 0.
void validate_vehicle_params(const VehicleParams& p);

// Explicit Euler longitudinal model: drive force minus linear drag.
class VehicleDynamics {
public:
  explicit VehicleDynamics(const VehicleParams& params = {}, const VehicleState& initial = {});

  // Advance one step; throttle is clamped to [0,100]. Throws InvalidParameter if dt <= 0.
  VehicleState update(double throttle, double dt);

  void reset() { state_ = VehicleState{}; }

  const VehicleState& state() const { return state_; }
  const VehicleParams& params() const { return params_; }

  // Replaces the plant parameters, keeping the current state.
  void set_params(const VehicleParams& params);

  // Equilibrium speed for a throttle held indefinitely.
  double steady_state_speed(double throttle) const;

private:
  VehicleParams params_;
  VehicleState state_;
};

} // namespace fzd
