#pragma once
#include <cstddef>
#include <deque>
#include <vector>
#include <fzd/cruise.hpp>
#include <fzd/snap.hpp>

namespace fzd {

struct HistoryPoint {
  double time = 0.0;
  double speed = 0.0;
  double target_speed = 0.0;
  double throttle = 0.0;
  double speed_error = 0.0;
  double position = 0.0;
};

// Bounded time series for the speed/throttle charts. Oldest points are
// dropped beyond capacity; a time rewind (reset) clears the series.
class History {
public:
  explicit History(std::size_t capacity = 4096) : cap_(capacity == 0 ? 1 : capacity) {}

  void push(const HistoryPoint& p) {
    if (!pts_.empty() && p.time < pts_.back().time) pts_.clear();
    pts_.push_back(p);
    while (pts_.size() > cap_) pts_.pop_front();
  }

  void push(const TickSample& s) {
    push(HistoryPoint{s.sim_time, s.state.speed, s.target_speed, s.throttle, s.speed_error, s.state.position});
  }

  void push(const CruiseSnapshot& s) {
    push(HistoryPoint{s.sim_time, s.speed, s.target_speed, s.throttle, s.speed_error, s.position});
  }

  // Points no older than `seconds` before the newest one, oldest first.
  std::vector<HistoryPoint> window(double seconds) const {
    std::vector<HistoryPoint> out;
    if (pts_.empty()) return out;
    const double from = pts_.back().time - seconds;
    for (const auto& p : pts_) if (p.time >= from) out.push_back(p);
    return out;
  }

  void clear() { pts_.clear(); }
  bool empty() const { return pts_.empty(); }
  std::size_t size() const { return pts_.size(); }
  std::size_t capacity() const { return cap_; }
  const HistoryPoint& back() const { return pts_.back(); }

private:
  std::size_t cap_;
  std::deque<HistoryPoint> pts_;
};

} // namespace fzd
