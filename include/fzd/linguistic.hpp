#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <fzd/membership.hpp>

namespace fzd {

struct FuzzySet {
  std::string label;   // e.g. "negative_large"
  MembershipFn fn;
};

// Named numeric axis [lo, hi] covered by labelled fuzzy sets.
struct LinguisticVariable {
  std::string name;
  double lo = 0.0;
  double hi = 1.0;
  std::vector<FuzzySet> sets;

  // Throws InvalidParameter on an empty name, bad range, no sets,
  // duplicate/empty labels or malformed control points.
  void validate() const;

  std::optional<std::size_t> index_of(const std::string& label) const;

  double clamp(double x) const { return clamp_to_range(x, lo, hi); }

  // One degree per set (same order as `sets`); x is clamped into [lo, hi] first.
  std::vector<double> fuzzify(double x) const;

  // `resolution` evenly spaced points from lo to hi inclusive (resolution >= 2).
  std::vector<double> sample_axis(std::size_t resolution) const;
};

} // namespace fzd
