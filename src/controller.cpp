#include <fzd/controller.hpp>
#include <fzd/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <spdlog/spdlog.h>

namespace fzd {

ControllerConfig default_controller_config() {
  ControllerConfig cfg;

  cfg.speed_error.name = "speed_error";
  cfg.speed_error.lo = -30.0;
  cfg.speed_error.hi = 30.0;
  cfg.speed_error.sets = {
    {"negative_large", make_trapezoid(-30, -30, -20, -10)},
    {"negative_small", make_triangle(-15, -5, 0)},
    {"zero",           make_triangle(-5, 0, 5)},
    {"positive_small", make_triangle(0, 5, 15)},
    {"positive_large", make_trapezoid(10, 20, 30, 30)},
  };

  cfg.acceleration.name = "acceleration";
  cfg.acceleration.lo = -10.0;
  cfg.acceleration.hi = 10.0;
  cfg.acceleration.sets = {
    {"negative", make_trapezoid(-10, -10, -5, 0)},
    {"zero",     make_triangle(-3, 0, 3)},
    {"positive", make_trapezoid(0, 5, 10, 10)},
  };

  cfg.throttle.name = "throttle";
  cfg.throttle.lo = 0.0;
  cfg.throttle.hi = 100.0;
  cfg.throttle.sets = {
    {"very_low",  make_trapezoid(0, 0, 10, 20)},
    {"low",       make_triangle(10, 25, 40)},
    {"medium",    make_triangle(30, 50, 70)},
    {"high",      make_triangle(60, 75, 90)},
    {"very_high", make_trapezoid(80, 90, 100, 100)},
  };

  // Too fast: back off, harder when still accelerating.
  // Too slow: open up, less when already accelerating.
  cfg.rules = {
    {"negative_large", "negative", "very_low"},
    {"negative_large", "zero",     "very_low"},
    {"negative_large", "positive", "very_low"},
    {"negative_small", "negative", "very_low"},
    {"negative_small", "zero",     "low"},
    {"negative_small", "positive", "low"},
    {"zero",           "negative", "medium"},
    {"zero",           "zero",     "medium"},
    {"zero",           "positive", "low"},
    {"positive_small", "negative", "high"},
    {"positive_small", "zero",     "high"},
    {"positive_small", "positive", "high"},
    {"positive_large", "negative", "very_high"},
    {"positive_large", "zero",     "very_high"},
    {"positive_large", "positive", "very_high"},
  };
  return cfg;
}

FuzzyController::FuzzyController(ControllerConfig cfg) : cfg_(std::move(cfg)) {
  cfg_.speed_error.validate();
  cfg_.acceleration.validate();
  cfg_.throttle.validate();
  if (cfg_.resolution < 2) throw InvalidParameter("controller resolution must be >= 2");
  resolve_rules_();

  axis_ = cfg_.throttle.sample_axis(cfg_.resolution);
  out_mu_.assign(cfg_.throttle.sets.size(), std::vector<double>(axis_.size(), 0.0));
  for (std::size_t k = 0; k < cfg_.throttle.sets.size(); ++k) {
    const auto& fn = cfg_.throttle.sets[k].fn;
    for (std::size_t i = 0; i < axis_.size(); ++i) out_mu_[k][i] = fn.evaluate(axis_[i]);
  }
}

void FuzzyController::resolve_rules_() {
  if (cfg_.rules.empty()) throw InvalidParameter("rule base is empty");
  rules_.clear();
  rules_.reserve(cfg_.rules.size());
  for (std::size_t i = 0; i < cfg_.rules.size(); ++i) {
    const auto& r = cfg_.rules[i];
    const auto se  = cfg_.speed_error.index_of(r.speed_error);
    const auto acc = cfg_.acceleration.index_of(r.acceleration);
    const auto out = cfg_.throttle.index_of(r.throttle);
    if (!se || !acc || !out) {
      throw InvalidParameter("rule " + std::to_string(i) + " references an undefined label ('" +
                             r.speed_error + "', '" + r.acceleration + "' -> '" + r.throttle + "')");
    }
    rules_.push_back(ResolvedRule{*se, *acc, *out});
  }
}

Inference FuzzyController::evaluate(double speed_error, double acceleration) const {
  Inference inf;
  inf.speed_error  = cfg_.speed_error.clamp(speed_error);
  inf.acceleration = cfg_.acceleration.clamp(acceleration);
  inf.speed_error_degrees  = cfg_.speed_error.fuzzify(inf.speed_error);
  inf.acceleration_degrees = cfg_.acceleration.fuzzify(inf.acceleration);

  inf.rule_strengths.reserve(rules_.size());
  inf.aggregated.assign(cfg_.throttle.sets.size(), 0.0);
  for (const auto& r : rules_) {
    const double w = std::min(inf.speed_error_degrees[r.se], inf.acceleration_degrees[r.acc]);
    inf.rule_strengths.push_back(w);
    inf.aggregated[r.out] = std::max(inf.aggregated[r.out], w);
  }

  // Clip each consequent at its aggregated degree, combine by max.
  std::vector<double> shape(axis_.size(), 0.0);
  for (std::size_t k = 0; k < inf.aggregated.size(); ++k) {
    const double level = inf.aggregated[k];
    if (level <= 0.0) continue;
    const auto& mu = out_mu_[k];
    for (std::size_t i = 0; i < shape.size(); ++i) {
      shape[i] = std::max(shape[i], std::min(level, mu[i]));
    }
  }

  const auto c = centroid(axis_, shape);
  if (!c) {
    inf.degenerate = true;
    inf.throttle = 0.0;
    spdlog::warn("fuzzy controller: no rule fired for speed_error={:.3f} acceleration={:.3f}; throttle=0",
                 inf.speed_error, inf.acceleration);
    return inf;
  }
  inf.throttle = cfg_.throttle.clamp(*c);
  return inf;
}

double FuzzyController::compute_throttle(double speed_error, double acceleration) const {
  return evaluate(speed_error, acceleration).throttle;
}

ControlSurface FuzzyController::control_surface(double se_step, double acc_step) const {
  if (!(se_step > 0.0) || !(acc_step > 0.0)) {
    throw InvalidParameter("control_surface: steps must be positive");
  }
  ControlSurface surf;
  const auto& se = cfg_.speed_error;
  const auto& ac = cfg_.acceleration;
  const double cells_se  = std::floor((se.hi - se.lo) / se_step + 1e-9);
  const double cells_acc = std::floor((ac.hi - ac.lo) / acc_step + 1e-9);
  if (!(cells_se < double(kMaxSurfaceAxisPoints)) || !(cells_acc < double(kMaxSurfaceAxisPoints))) {
    throw InvalidParameter("control_surface: steps too small, at most " +
                           std::to_string(kMaxSurfaceAxisPoints) + " points per axis");
  }
  const auto n_se  = static_cast<std::size_t>(cells_se) + 1;
  const auto n_acc = static_cast<std::size_t>(cells_acc) + 1;
  for (std::size_t i = 0; i < n_se; ++i)  surf.speed_errors.push_back(se.lo + se_step * double(i));
  for (std::size_t j = 0; j < n_acc; ++j) surf.accelerations.push_back(ac.lo + acc_step * double(j));

  surf.throttle.reserve(n_se * n_acc);
  for (double a : surf.accelerations) {
    for (double e : surf.speed_errors) surf.throttle.push_back(compute_throttle(e, a));
  }
  return surf;
}

} // namespace fzd
