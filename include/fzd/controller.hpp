#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <fzd/linguistic.hpp>

namespace fzd {

// IF speed_error is <speed_error> AND acceleration is <acceleration>
// THEN throttle is <throttle>.
struct Rule {
  std::string speed_error;
  std::string acceleration;
  std::string throttle;
};

struct ControllerConfig {
  LinguisticVariable speed_error;
  LinguisticVariable acceleration;
  LinguisticVariable throttle;
  std::vector<Rule> rules;
  std::size_t resolution = 1001;   // throttle axis samples used by the centroid
};

// speed_error [-30,30] x5 labels, acceleration [-10,10] x3, throttle [0,100] x5, 15 rules.
ControllerConfig default_controller_config();

// Full trace of one inference; also the hook for observing degenerate aggregates.
struct Inference {
  double speed_error = 0.0;        // after clamping
  double acceleration = 0.0;       // after clamping
  std::vector<double> speed_error_degrees;
  std::vector<double> acceleration_degrees;
  std::vector<double> rule_strengths;   // one per rule, min of both antecedents
  std::vector<double> aggregated;       // one per throttle set, max over its rules
  double throttle = 0.0;
  bool degenerate = false;              // no rule fired; throttle forced to 0
};

struct ControlSurface {
  std::vector<double> speed_errors;
  std::vector<double> accelerations;
  std::vector<double> throttle;   // row-major: [acceleration index][speed_error index]

  double at(std::size_t acc_idx, std::size_t se_idx) const {
    return throttle[acc_idx * speed_errors.size() + se_idx];
  }
};

inline constexpr std::size_t kMaxSurfaceAxisPoints = 10001;

// Mamdani inference (min AND, max aggregation, centroid defuzzification).
// Immutable after construction; share one instance across vehicles.
class FuzzyController {
public:
  // Throws InvalidParameter when the configuration is inconsistent.
  explicit FuzzyController(ControllerConfig cfg);

  double compute_throttle(double speed_error, double acceleration) const;
  Inference evaluate(double speed_error, double acceleration) const;

  // Throttle over both input ranges sampled every se_step / acc_step.
  // Throws InvalidParameter for non-positive steps or more than
  // kMaxSurfaceAxisPoints samples on either axis.
  ControlSurface control_surface(double se_step, double acc_step) const;

  const ControllerConfig& config() const { return cfg_; }

private:
  struct ResolvedRule {
    std::size_t se;
    std::size_t acc;
    std::size_t out;
  };

  void resolve_rules_();

  ControllerConfig cfg_;
  std::vector<ResolvedRule> rules_;
  std::vector<double> axis_;                  // sampled throttle axis
  std::vector<std::vector<double>> out_mu_;   // [throttle set][sample]
};

using ControllerPtr = std::shared_ptr<const FuzzyController>;

inline ControllerPtr make_default_controller() {
  return std::make_shared<const FuzzyController>(default_controller_config());
}

} // namespace fzd
