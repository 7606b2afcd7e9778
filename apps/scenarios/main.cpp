#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <fzd/config_io.hpp>
#include <fzd/controller.hpp>
#include <fzd/cruise.hpp>
#include <fzd/errors.hpp>
#include <fzd/track.hpp>
#include <fzd/vehicle.hpp>
#include <spdlog/spdlog.h>

using namespace fzd;

namespace {

struct Scenario {
  double speed_error;
  double acceleration;
  const char* description;
};

void controller_table(const FuzzyController& ctl) {
  static const Scenario kCases[] = {
    {-25.0, -5.0, "far too fast, slowing down"},
    {-10.0,  0.0, "a bit too fast, steady"},
    { -5.0,  3.0, "slightly too fast, still accelerating"},
    {  0.0,  0.0, "on target, steady"},
    {  5.0, -2.0, "slightly too slow, slowing down"},
    { 10.0,  0.0, "too slow, steady"},
    { 20.0,  5.0, "far too slow, already accelerating"},
    { 25.0, -3.0, "far too slow, slowing down"},
  };
  spdlog::info("{:<40} {:>8} {:>8} {:>9}", "scenario", "error", "accel", "throttle");
  for (const auto& c : kCases) {
    spdlog::info("{:<40} {:>8.1f} {:>8.1f} {:>8.1f}%", c.description, c.speed_error, c.acceleration,
                 ctl.compute_throttle(c.speed_error, c.acceleration));
  }
}

void constant_throttle(const VehicleParams& vp, double throttle, double duration, double dt) {
  VehicleDynamics car(vp);
  for (double t = 0.0; t < duration; t += dt) car.update(throttle, dt);
  const double v_max = car.steady_state_speed(throttle);
  const auto& st = car.state();
  spdlog::info("constant throttle {}% for {}s: position={:.1f} speed={:.2f} accel={:.3f} "
               "(v_max={:.2f}, {:.1f}% reached)",
               throttle, duration, st.position, st.speed, st.acceleration, v_max,
               v_max > 0.0 ? 100.0 * st.speed / v_max : 0.0);
}

void variable_throttle(const VehicleParams& vp, double dt) {
  VehicleDynamics car(vp);
  for (double t = 0.0; t < 30.0; t += dt) {
    const double throttle = t < 10.0 ? 80.0 : (t < 20.0 ? 40.0 : 10.0);
    car.update(throttle, dt);
  }
  spdlog::info("variable throttle 80/40/10% over 30s: final speed={:.2f}", car.state().speed);
}

void closed_loop(const ControllerPtr& ctl, const LoadedConfig& cfg) {
  CruiseLoop loop(ctl, cfg.vehicle);
  loop.set_target_speed(cfg.sim.target_speed);
  const auto samples = loop.run(200, cfg.sim.dt);
  for (const auto& s : samples) {
    if (s.tick % 20 != 0) continue;
    spdlog::info("t={:5.1f}s speed={:6.2f} target={:5.1f} error={:+6.2f} throttle={:5.1f}%",
                 s.sim_time, s.state.speed, s.target_speed, s.speed_error, s.throttle);
  }
}

// Speed each target settles at. The rule base holds 50 % throttle at zero
// error, so only the target the plant holds at 50 % is reached exactly.
void target_sweep(const ControllerPtr& ctl, const LoadedConfig& cfg) {
  CruiseLoop loop(ctl, cfg.vehicle);
  for (double target = 10.0; target <= 30.0; target += 5.0) {
    loop.reset();
    loop.set_target_speed(target);
    loop.run(600, cfg.sim.dt);
    const double v = loop.vehicle().state().speed;
    spdlog::info("target={:5.1f} settled={:6.2f} offset={:+5.2f}", target, v, v - target);
  }
  spdlog::info("zero-offset speed at 50% throttle: {:.2f}", loop.vehicle().steady_state_speed(50.0));
}

void adaptive_lap(const ControllerPtr& ctl, const LoadedConfig& cfg) {
  CruiseLoop loop(ctl, cfg.vehicle);
  const TrackPath track = make_track(cfg.sim.track);
  loop.set_adaptive_target(track, TargetProfile{});
  while (track.laps_at(loop.vehicle().state().position) < 1 && loop.ticks() < 20000) {
    const auto s = loop.tick(cfg.sim.dt);
    if (s.tick % 50 != 0) continue;
    spdlog::info("t={:5.1f}s s={:6.1f}m target={:5.1f} speed={:6.2f}",
                 s.sim_time, s.state.position, s.target_speed, s.state.speed);
  }
  spdlog::info("adaptive lap of {:.1f}m in {:.1f}s", track.length(), loop.sim_time());
}

} // namespace

// usage: fuzzydrive_scenarios [-v] [config.csv]
int main(int argc, char** argv) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-v") == 0) spdlog::set_level(spdlog::level::debug);
    else config_path = argv[i];
  }

  try {
    LoadedConfig cfg;
    if (!config_path.empty()) {
      auto loaded = load_config_file(config_path);
      if (!loaded) {
        spdlog::error("cannot open config '{}'", config_path);
        return 1;
      }
      cfg = std::move(*loaded);
    }

    const auto ctl = std::make_shared<const FuzzyController>(cfg.controller);
    controller_table(*ctl);
    constant_throttle(cfg.vehicle, 50.0, 20.0, cfg.sim.dt);
    variable_throttle(cfg.vehicle, cfg.sim.dt);
    closed_loop(ctl, cfg);
    target_sweep(ctl, cfg);
    adaptive_lap(ctl, cfg);
    return 0;
  } catch (const InvalidParameter& e) {
    spdlog::error("invalid configuration: {}", e.what());
    return 2;
  }
}
