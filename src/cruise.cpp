#include <fzd/cruise.hpp>
#include <fzd/errors.hpp>
#include <fzd/membership.hpp>
#include <cmath>
#include <string>
#include <utility>

namespace fzd {

CruiseLoop::CruiseLoop(ControllerPtr controller, const VehicleParams& params)
  : controller_(std::move(controller)), vehicle_(params) {
  if (!controller_) throw InvalidParameter("cruise loop requires a controller");
}

void CruiseLoop::set_adaptive_target(TrackPath track, TargetProfile profile) {
  if (track.empty()) throw InvalidParameter("adaptive target needs a non-empty track");
  if (!(profile.min_speed <= profile.max_speed)) {
    throw InvalidParameter("adaptive target: min_speed must not exceed max_speed");
  }
  adaptive_ = Adaptive{std::move(track), profile};
}

double CruiseLoop::current_target() const {
  if (adaptive_) return adaptive_->profile.target_speed_at(adaptive_->track, vehicle_.state().position);
  return target_speed_;
}

TickSample CruiseLoop::tick(double dt) {
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw InvalidParameter("tick: dt must be positive, got " + std::to_string(dt));
  }

  TickSample out;
  const VehicleState before = vehicle_.state();
  out.target_speed = current_target();
  out.speed_error = out.target_speed - before.speed;

  if (!enabled_) {
    out.throttle = 0.0;
  } else if (mode_ == DriveMode::Manual) {
    out.throttle = clamp_to_range(manual_throttle_, 0.0, 100.0);
  } else {
    // acceleration is the one produced by the previous step
    const Inference inf = controller_->evaluate(out.speed_error, before.acceleration);
    out.throttle = inf.throttle;
    out.degenerate = inf.degenerate;
  }

  out.state = vehicle_.update(out.throttle, dt);
  sim_time_ += dt;
  ++tick_;
  out.sim_time = sim_time_;
  out.tick = tick_;
  return out;
}

std::vector<TickSample> CruiseLoop::run(std::size_t ticks, double dt) {
  std::vector<TickSample> out;
  out.reserve(ticks);
  for (std::size_t i = 0; i < ticks; ++i) out.push_back(tick(dt));
  return out;
}

void CruiseLoop::reset() {
  vehicle_.reset();
  sim_time_ = 0.0;
  tick_ = 0;
}

} // namespace fzd
