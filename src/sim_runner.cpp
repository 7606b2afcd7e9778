#include <fzd/sim_runner.hpp>
#include <fzd/errors.hpp>
#include <chrono>
#include <utility>
#include <spdlog/spdlog.h>

namespace fzd {

SimRunner::SimRunner(ControllerPtr controller, const VehicleParams& params, const SimSettings& settings)
  : controller_(std::move(controller)), settings_(settings), track_(make_track(settings.track)),
    params_(params) {
  if (!controller_) throw InvalidParameter("sim runner requires a controller");
  if (!(settings_.dt > 0.0)) throw InvalidParameter("sim dt must be positive");
  validate_vehicle_params(params_);
  target_speed.store(settings_.target_speed);
}

void SimRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&SimRunner::thread_main_, this);
  spdlog::info("sim runner started (dt={}s, track length={:.1f}m)", settings_.dt, track_.length());
}

void SimRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
  spdlog::info("sim runner stopped");
}

void SimRunner::request_reset() {
  pending_reset_.store(true, std::memory_order_release);
}

void SimRunner::request_vehicle_params(const VehicleParams& p) {
  validate_vehicle_params(p);
  std::lock_guard<std::mutex> lk(params_mu_);
  params_ = p;
  pending_params_ = p;
}

VehicleParams SimRunner::vehicle_params() const {
  std::lock_guard<std::mutex> lk(params_mu_);
  return params_;
}

bool SimRunner::apply_controls_(CruiseLoop& loop) {
  bool was_reset = false;
  if (pending_reset_.exchange(false, std::memory_order_acq_rel)) {
    loop.reset();
    was_reset = true;
    spdlog::info("vehicle reset");
  }
  {
    std::lock_guard<std::mutex> lk(params_mu_);
    if (pending_params_) {
      loop.set_vehicle_params(*pending_params_);
      spdlog::debug("vehicle params: mass={} drive={} drag={}", pending_params_->mass,
                    pending_params_->max_drive_force, pending_params_->drag_coefficient);
      pending_params_.reset();
    }
  }

  loop.set_target_speed(target_speed.load(std::memory_order_relaxed));
  loop.set_enabled(enabled.load(std::memory_order_relaxed));
  loop.set_mode(manual.load(std::memory_order_relaxed) ? DriveMode::Manual : DriveMode::Fuzzy);
  loop.set_manual_throttle(manual_throttle.load(std::memory_order_relaxed));

  const bool adaptive = adaptive_target.load(std::memory_order_relaxed);
  if (adaptive && !loop.adaptive_target()) loop.set_adaptive_target(track_, profile_);
  else if (!adaptive && loop.adaptive_target()) loop.clear_adaptive_target();
  return was_reset;
}

CruiseSnapshot SimRunner::make_snapshot_(const CruiseLoop& loop, const TickSample& s) const {
  CruiseSnapshot snap{};
  const auto& st = loop.vehicle().state();
  const Pose2 pose = track_.sample_pose(st.position);
  snap.x = pose.x;
  snap.y = pose.y;
  snap.heading_rad = pose.heading_rad;
  snap.sim_time = loop.sim_time();
  snap.tick = loop.ticks();
  snap.lap = track_.laps_at(st.position);
  snap.position = st.position;
  snap.speed = st.speed;
  snap.acceleration = st.acceleration;
  snap.throttle = s.throttle;
  snap.target_speed = s.target_speed;
  snap.speed_error = s.speed_error;
  snap.enabled = loop.enabled();
  snap.manual = loop.mode() == DriveMode::Manual;
  snap.degenerate = s.degenerate;
  return snap;
}

void SimRunner::thread_main_() {
  CruiseLoop loop(controller_, vehicle_params());
  apply_controls_(loop);   // a reset requested before start() is moot here

  auto idle_sample = [&loop]{
    TickSample s{};
    s.target_speed = loop.current_target();
    s.speed_error = s.target_speed - loop.vehicle().state().speed;
    return s;
  };
  TickSample last = idle_sample();
  buffer_.publish(make_snapshot_(loop, last));

  using clock = std::chrono::steady_clock;
  const double dt = settings_.dt;
  auto next = clock::now();

  while (running_.load(std::memory_order_relaxed)) {
    if (apply_controls_(loop)) last = idle_sample();

    const double warp = time_scale.load(std::memory_order_relaxed);
    double period = dt;
    if (warp > 0.0) {
      last = loop.tick(dt);
      period = dt / warp;
    }
    // publish heartbeats even when paused
    buffer_.publish(make_snapshot_(loop, last));

    next += std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(period));
    std::this_thread::sleep_until(next);
  }
}

} // namespace fzd
