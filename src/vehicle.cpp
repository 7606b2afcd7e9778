#include <fzd/vehicle.hpp>
#include <fzd/errors.hpp>
#include <fzd/membership.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace fzd {

void validate_vehicle_params(const VehicleParams& p) {
  if (!std::isfinite(p.mass) || p.mass <= 0.0) {
    throw InvalidParameter("vehicle mass must be positive, got " + std::to_string(p.mass));
  }
  if (!std::isfinite(p.drag_coefficient) || p.drag_coefficient <= 0.0) {
    throw InvalidParameter("drag coefficient must be positive, got " + std::to_string(p.drag_coefficient));
  }
  if (!std::isfinite(p.max_drive_force) || p.max_drive_force < 0.0) {
    throw InvalidParameter("max drive force must be non-negative, got " + std::to_string(p.max_drive_force));
  }
}

VehicleDynamics::VehicleDynamics(const VehicleParams& params, const VehicleState& initial)
  : params_(params), state_(initial) {
  validate_vehicle_params(params_);
  state_.speed = std::max(0.0, state_.speed);
}

void VehicleDynamics::set_params(const VehicleParams& params) {
  validate_vehicle_params(params);
  params_ = params;
}

VehicleState VehicleDynamics::update(double throttle, double dt) {
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw InvalidParameter("update: dt must be positive, got " + std::to_string(dt));
  }
  const double t = clamp_to_range(throttle, 0.0, 100.0);

  const double drive = (t / 100.0) * params_.max_drive_force;
  const double drag  = params_.drag_coefficient * state_.speed;
  state_.acceleration = (drive - drag) / params_.mass;
  state_.speed += state_.acceleration * dt;
  state_.speed = std::max(0.0, state_.speed);   // no rolling backwards
  state_.position += state_.speed * dt;
  return state_;
}

double VehicleDynamics::steady_state_speed(double throttle) const {
  const double t = clamp_to_range(throttle, 0.0, 100.0);
  return (t / 100.0) * params_.max_drive_force / params_.drag_coefficient;
}

} // namespace fzd
