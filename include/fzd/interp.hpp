#pragma once
#include <array>
#include <cstddef>
#include <cmath>
#include <fzd/snap.hpp>
#include <fzd/track.hpp>

namespace fzd {

// Ring of recent snapshots. The viewer samples it slightly in the past so the
// car glides between sim ticks instead of jumping.
class InterpBuffer {
public:
  static constexpr std::size_t kMaxCap = 128;

  explicit InterpBuffer(std::size_t cap = 64)
    : cap_(cap == 0 ? 1 : (cap < kMaxCap ? cap : kMaxCap)) {}

  void push(const CruiseSnapshot& s) {
    // sim_time going backwards means the vehicle was reset
    if (count_ > 0 && s.sim_time < at_(count_ - 1).sim_time) clear();
    const std::size_t slot = (head_ + count_) % cap_;
    ring_[slot] = s;
    if (count_ < cap_) ++count_;
    else head_ = (head_ + 1) % cap_;
  }

  void clear() { head_ = 0; count_ = 0; }

  // Clamps to the oldest/newest snapshot outside the buffered time span.
  bool sample(double when, CruiseSnapshot& out) const {
    if (count_ == 0) return false;
    const CruiseSnapshot& oldest = at_(0);
    const CruiseSnapshot& newest = at_(count_ - 1);
    if (count_ == 1 || when <= oldest.sim_time) { out = oldest; return true; }
    if (when >= newest.sim_time) { out = newest; return true; }

    std::size_t k = 1;
    while (k < count_ - 1 && at_(k).sim_time < when) ++k;
    const CruiseSnapshot& a = at_(k - 1);
    const CruiseSnapshot& b = at_(k);

    const double span = b.sim_time - a.sim_time;
    const double u = span > 0.0 ? (when - a.sim_time) / span : 0.0;

    out = (u < 1.0) ? a : b;   // flags, tick and lap are not blended
    out.sim_time     = mix(a.sim_time, b.sim_time, u);
    out.x            = mix(a.x, b.x, u);
    out.y            = mix(a.y, b.y, u);
    out.heading_rad  = mix_heading(a.heading_rad, b.heading_rad, u);
    out.position     = mix(a.position, b.position, u);
    out.speed        = mix(a.speed, b.speed, u);
    out.acceleration = mix(a.acceleration, b.acceleration, u);
    out.throttle     = mix(a.throttle, b.throttle, u);
    out.target_speed = mix(a.target_speed, b.target_speed, u);
    out.speed_error  = mix(a.speed_error, b.speed_error, u);
    return true;
  }

  double latest_time() const { return count_ == 0 ? 0.0 : at_(count_ - 1).sim_time; }
  std::size_t size() const { return count_; }

private:
  static double mix(double a, double b, double u) { return a + (b - a) * u; }

  static double wrap_tau(double a) {
    a = std::fmod(a, kTAU);
    return a < 0.0 ? a + kTAU : a;
  }

  // Blend along the shorter arc between the two headings.
  static double mix_heading(double a, double b, double u) {
    double d = wrap_tau(b) - wrap_tau(a);
    if (d > kPI) d -= kTAU;
    else if (d < -kPI) d += kTAU;
    return wrap_tau(wrap_tau(a) + d * u);
  }

  const CruiseSnapshot& at_(std::size_t i) const { return ring_[(head_ + i) % cap_]; }

  std::size_t cap_;
  std::array<CruiseSnapshot, kMaxCap> ring_{};
  std::size_t head_{0};
  std::size_t count_{0};
};

} // namespace fzd
