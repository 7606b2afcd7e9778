#include <fzd/membership.hpp>
#include <fzd/errors.hpp>
#include <cmath>
#include <string>

namespace fzd {

double MembershipFn::evaluate(double x) const {
  if (x < a || x > d) return 0.0;
  if (x >= b && x <= c) return 1.0;
  if (x < b) return (b > a) ? (x - a) / (b - a) : 1.0;
  return (d > c) ? (d - x) / (d - c) : 1.0;
}

void validate_membership(const MembershipFn& fn) {
  if (!std::isfinite(fn.a) || !std::isfinite(fn.b) || !std::isfinite(fn.c) || !std::isfinite(fn.d)) {
    throw InvalidParameter("membership control points must be finite");
  }
  if (!(fn.a <= fn.b && fn.b <= fn.c && fn.c <= fn.d)) {
    throw InvalidParameter("membership control points must be non-decreasing: [" +
                           std::to_string(fn.a) + ", " + std::to_string(fn.b) + ", " +
                           std::to_string(fn.c) + ", " + std::to_string(fn.d) + "]");
  }
}

MembershipFn make_triangle(double a, double b, double c) {
  return make_trapezoid(a, b, b, c);
}

MembershipFn make_trapezoid(double a, double b, double c, double d) {
  MembershipFn fn{a, b, c, d};
  validate_membership(fn);
  return fn;
}

double clamp_to_range(double x, double lo, double hi) {
  if (std::isnan(x)) return lo;
  return x < lo ? lo : (x > hi ? hi : x);
}

std::optional<double> centroid(const std::vector<double>& xs, const std::vector<double>& mu) {
  if (xs.size() != mu.size()) {
    throw InvalidParameter("centroid: sample and membership vectors differ in size");
  }
  double num = 0.0;
  double den = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    num += xs[i] * mu[i];
    den += mu[i];
  }
  if (den <= 0.0) return std::nullopt;
  return num / den;
}

} // namespace fzd
