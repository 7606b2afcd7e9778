#pragma once
#include <optional>
#include <vector>

namespace fzd {

// Piecewise-linear membership function over four control points a <= b <= c <= d.
// Triangles are trapezoids with b == c; a == b (or c == d) gives a shoulder.
struct MembershipFn {
  double a = 0.0;
  double b = 0.0;
  double c = 0.0;
  double d = 0.0;

  // Degree in [0,1]; 0 outside [a, d].
  double evaluate(double x) const;

  bool is_triangle() const { return b == c; }
};

// Throw InvalidParameter if the control points are not finite or not non-decreasing.
MembershipFn make_triangle(double a, double b, double c);
MembershipFn make_trapezoid(double a, double b, double c, double d);
void validate_membership(const MembershipFn& fn);

double clamp_to_range(double x, double lo, double hi);

// Weighted centre of mass sum(x*mu)/sum(mu) of a sampled shape.
// Empty when the shape has no mass.
std::optional<double> centroid(const std::vector<double>& xs, const std::vector<double>& mu);

} // namespace fzd
