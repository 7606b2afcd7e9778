#pragma once
#include <vector>
#include <cmath>
#include <cstddef>
#include <algorithm>
#include <numbers>
#include <utility>

namespace fzd {

inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

struct Vec2 {
  double x{};
  double y{};
};

struct Pose2 {
  double x{};
  double y{};
  double heading_rad{};
};

// Closed centreline parameterized by arc length. The vehicle only knows the
// distance it travelled; this maps that distance onto the loop for display
// and for the adaptive target.
class TrackPath {
public:
  TrackPath() = default;
  explicit TrackPath(std::vector<Vec2> pts) { set_points(std::move(pts)); }

  // Fewer than two points leave the path empty. The loop is closed if needed.
  void set_points(std::vector<Vec2> pts) {
    pts_ = std::move(pts);
    dist_.clear();
    length_ = 0.0;
    half_width_ = 0.0;
    if (pts_.size() < 2) { pts_.clear(); return; }

    const Vec2 first = pts_.front();
    const Vec2 last = pts_.back();
    if (first.x != last.x || first.y != last.y) pts_.push_back(first);

    dist_.reserve(pts_.size());
    dist_.push_back(0.0);
    for (std::size_t i = 0; i < pts_.size(); ++i) {
      half_width_ = std::max(half_width_, std::abs(pts_[i].x));
      if (i > 0) dist_.push_back(dist_.back() + std::hypot(pts_[i].x - pts_[i-1].x, pts_[i].y - pts_[i-1].y));
    }
    length_ = dist_.back();
  }

  const std::vector<Vec2>& points() const { return pts_; }
  double length() const { return length_; }
  bool empty() const { return pts_.size() < 2; }

  // Largest |x| of the centreline.
  double half_width() const { return half_width_; }

  // Position and direction of travel `s` metres from the start line (wraps).
  Pose2 sample_pose(double s) const {
    if (empty() || length_ <= 0.0) return Pose2{};
    double d = std::fmod(s, length_);
    if (d < 0.0) d += length_;

    // first vertex strictly past d, kept inside [1, n-1]
    const auto past = std::upper_bound(dist_.begin(), dist_.end(), d);
    std::size_t j = static_cast<std::size_t>(past - dist_.begin());
    j = std::min(std::max<std::size_t>(j, 1), pts_.size() - 1);

    const Vec2& p = pts_[j - 1];
    const Vec2& q = pts_[j];
    const double seg = dist_[j] - dist_[j - 1];
    const double f = seg > 0.0 ? (d - dist_[j - 1]) / seg : 0.0;
    return Pose2{ p.x + f * (q.x - p.x), p.y + f * (q.y - p.y), std::atan2(q.y - p.y, q.x - p.x) };
  }

  // Completed laps for a travelled distance.
  std::size_t laps_at(double s) const {
    if (length_ <= 0.0 || s <= 0.0) return 0;
    return static_cast<std::size_t>(std::floor(s / length_));
  }

  // Ellipse centred at the origin, counter-clockwise from (+width/2, 0).
  static TrackPath Oval(double width, double height, int segments = 200) {
    if (width <= 0.0 || height <= 0.0 || segments < 3) return TrackPath{};
    std::vector<Vec2> pts(static_cast<std::size_t>(segments));
    for (int i = 0; i < segments; ++i) {
      const double t = kTAU * i / segments;
      pts[static_cast<std::size_t>(i)] = Vec2{ 0.5 * width * std::cos(t), 0.5 * height * std::sin(t) };
    }
    return TrackPath{std::move(pts)};
  }

  // Two straights of `straight_len` joined by half circles of `radius`.
  static TrackPath Stadium(double straight_len, double radius, int arc_pts_per_quadrant = 12) {
    if (straight_len < 0.0 || radius <= 0.0 || arc_pts_per_quadrant < 1) return TrackPath{};
    const double half = 0.5 * straight_len;
    const int steps = 2 * arc_pts_per_quadrant;
    std::vector<Vec2> pts;
    pts.reserve(static_cast<std::size_t>(2 * steps + 2));
    // right bend bottom to top, then left bend top to bottom
    for (int side = 0; side < 2; ++side) {
      const double cx = side == 0 ? half : -half;
      const double a0 = side == 0 ? -0.5 * kPI : 0.5 * kPI;
      for (int i = 0; i <= steps; ++i) {
        const double ang = a0 + kPI * i / steps;
        pts.push_back(Vec2{ cx + radius * std::cos(ang), radius * std::sin(ang) });
      }
    }
    return TrackPath{std::move(pts)};
  }

private:
  std::vector<Vec2> pts_;
  std::vector<double> dist_;   // arc length at each vertex
  double length_{0.0};
  double half_width_{0.0};
};

enum class TrackShape : int {
  Oval = 0,      // 100 x 60 ellipse
  Stadium = 1    // same footprint, straights joined by half circles
};

inline TrackPath make_track(TrackShape shape) {
  switch (shape) {
    case TrackShape::Stadium: return TrackPath::Stadium(40.0, 30.0);
    case TrackShape::Oval: break;
  }
  return TrackPath::Oval(100.0, 60.0);
}

// Target speed that follows the track: min_speed at the ends (bends),
// max_speed on the long sides.
struct TargetProfile {
  double min_speed = 15.0;
  double max_speed = 30.0;

  double target_speed_at(const TrackPath& track, double s) const {
    if (track.empty() || track.half_width() <= 0.0) return max_speed;
    const double curve = std::clamp(std::abs(track.sample_pose(s).x) / track.half_width(), 0.0, 1.0);
    return max_speed - (max_speed - min_speed) * curve;
  }
};

} // namespace fzd
