#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <fzd/config_io.hpp>
#include <fzd/controller.hpp>
#include <fzd/cruise.hpp>
#include <fzd/snap.hpp>
#include <fzd/snap_buffer.hpp>
#include <fzd/track.hpp>
#include <fzd/vehicle.hpp>

namespace fzd {

// Owns the simulation thread (and with it the vehicle state) and publishes
// one snapshot per tick. The UI thread steers it through the atomics below.
class SimRunner {
public:
  // Throws InvalidParameter for a null controller, bad params or dt <= 0.
  SimRunner(ControllerPtr controller, const VehicleParams& params = {}, const SimSettings& settings = {});
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Applied by the sim thread before its next tick.
  void request_reset();
  // Validated here (throws InvalidParameter), applied on the next tick.
  void request_vehicle_params(const VehicleParams& p);
  VehicleParams vehicle_params() const;

  const TrackPath& track_path() const { return track_; }
  const TargetProfile& target_profile() const { return profile_; }
  const SimSettings& settings() const { return settings_; }

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }

  // Control surface
  std::atomic<double> target_speed{20.0};
  std::atomic<bool>   enabled{true};
  std::atomic<bool>   manual{false};
  std::atomic<double> manual_throttle{50.0};
  std::atomic<bool>   adaptive_target{false};
  std::atomic<double> time_scale{1.0}; // 0.0 = paused

private:
  void thread_main_();
  bool apply_controls_(CruiseLoop& loop);   // true if a reset was applied
  CruiseSnapshot make_snapshot_(const CruiseLoop& loop, const TickSample& s) const;

  ControllerPtr controller_;
  SimSettings settings_;
  TrackPath track_;
  TargetProfile profile_{};

  std::thread th_;
  std::atomic<bool> running_{false};
  SnapshotBuffer buffer_;

  mutable std::mutex params_mu_;
  VehicleParams params_;
  std::optional<VehicleParams> pending_params_;
  std::atomic<bool> pending_reset_{false};
};

} // namespace fzd
