#include <fzd/linguistic.hpp>
#include <fzd/errors.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace fzd {

void LinguisticVariable::validate() const {
  if (name.empty()) throw InvalidParameter("linguistic variable without a name");
  if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
    throw InvalidParameter("variable '" + name + "': range must satisfy lo < hi");
  }
  if (sets.empty()) throw InvalidParameter("variable '" + name + "' has no fuzzy sets");

  for (std::size_t i = 0; i < sets.size(); ++i) {
    const auto& s = sets[i];
    if (s.label.empty()) throw InvalidParameter("variable '" + name + "' has a set without a label");
    for (std::size_t j = 0; j < i; ++j) {
      if (sets[j].label == s.label) {
        throw InvalidParameter("variable '" + name + "': duplicate label '" + s.label + "'");
      }
    }
    try {
      validate_membership(s.fn);
    } catch (const InvalidParameter& e) {
      throw InvalidParameter("variable '" + name + "', set '" + s.label + "': " + e.what());
    }
  }
}

std::optional<std::size_t> LinguisticVariable::index_of(const std::string& label) const {
  auto it = std::find_if(sets.begin(), sets.end(), [&](const FuzzySet& s){ return s.label == label; });
  if (it == sets.end()) return std::nullopt;
  return static_cast<std::size_t>(std::distance(sets.begin(), it));
}

std::vector<double> LinguisticVariable::fuzzify(double x) const {
  const double xc = clamp(x);
  std::vector<double> out;
  out.reserve(sets.size());
  for (const auto& s : sets) out.push_back(s.fn.evaluate(xc));
  return out;
}

std::vector<double> LinguisticVariable::sample_axis(std::size_t resolution) const {
  if (resolution < 2) throw InvalidParameter("variable '" + name + "': resolution must be >= 2");
  std::vector<double> xs(resolution, 0.0);
  const double step = (hi - lo) / double(resolution - 1);
  for (std::size_t i = 0; i < resolution; ++i) xs[i] = lo + step * double(i);
  xs.back() = hi;
  return xs;
}

} // namespace fzd
