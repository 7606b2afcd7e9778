#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <cstring>
#include <vector>

#include <fzd/controller.hpp>
#include <fzd/errors.hpp>

using Catch::Approx;
using namespace fzd;

TEST_CASE("Default controller loads") {
  const auto cfg = default_controller_config();
  REQUIRE(cfg.speed_error.sets.size() == 5);
  REQUIRE(cfg.acceleration.sets.size() == 3);
  REQUIRE(cfg.throttle.sets.size() == 5);
  REQUIRE(cfg.rules.size() == 15);
  REQUIRE_NOTHROW(FuzzyController(cfg));
}

TEST_CASE("Output stays inside the throttle range") {
  const FuzzyController fc(default_controller_config());
  for (int e = -40; e <= 40; e += 2) {
    for (int a = -12; a <= 12; ++a) {
      const double t = fc.compute_throttle(double(e), double(a));
      REQUIRE(std::isfinite(t));
      REQUIRE(t >= 0.0);
      REQUIRE(t <= 100.0);
    }
  }
}

TEST_CASE("Zero error and zero acceleration hold a mid throttle") {
  const FuzzyController fc(default_controller_config());
  const double t = fc.compute_throttle(0.0, 0.0);
  REQUIRE(t > 30.0);
  REQUIRE(t < 70.0);
  REQUIRE(t == Approx(50.0).margin(0.5));
}

TEST_CASE("Throttle grows with speed error") {
  const FuzzyController fc(default_controller_config());

  SECTION("sweep at zero acceleration never decreases") {
    double prev = fc.compute_throttle(-30.0, 0.0);
    for (int i = 1; i <= 120; ++i) {
      const double e = -30.0 + 0.5 * i;
      const double t = fc.compute_throttle(e, 0.0);
      REQUIRE(t >= prev - 1e-9);
      prev = t;
    }
  }

  SECTION("too slow opens up, too fast backs off") {
    REQUIRE(fc.compute_throttle(25.0, 0.0) > 80.0);
    REQUIRE(fc.compute_throttle(-25.0, 0.0) < 20.0);
    REQUIRE(fc.compute_throttle(10.0, 0.0) > fc.compute_throttle(0.0, 0.0));
    REQUIRE(fc.compute_throttle(-10.0, 0.0) < fc.compute_throttle(0.0, 0.0));
  }
}

TEST_CASE("Identical inputs give bit-identical outputs") {
  const FuzzyController fc(default_controller_config());
  const double a = fc.compute_throttle(7.3, -1.2);
  const double b = fc.compute_throttle(7.3, -1.2);
  REQUIRE(std::memcmp(&a, &b, sizeof(double)) == 0);
}

TEST_CASE("Out-of-range inputs behave as the nearest boundary") {
  const FuzzyController fc(default_controller_config());
  REQUIRE(fc.compute_throttle(100.0, 50.0) == fc.compute_throttle(30.0, 10.0));
  REQUIRE(fc.compute_throttle(-100.0, -50.0) == fc.compute_throttle(-30.0, -10.0));

  const auto inf = fc.evaluate(45.0, -20.0);
  REQUIRE(inf.speed_error == 30.0);
  REQUIRE(inf.acceleration == -10.0);
}

TEST_CASE("Inference trace") {
  const FuzzyController fc(default_controller_config());
  const auto inf = fc.evaluate(0.0, 0.0);
  REQUIRE(inf.rule_strengths.size() == 15);
  REQUIRE(inf.speed_error_degrees.size() == 5);
  REQUIRE(inf.acceleration_degrees.size() == 3);
  REQUIRE(inf.aggregated.size() == 5);

  const auto medium = fc.config().throttle.index_of("medium");
  REQUIRE(medium.has_value());
  REQUIRE(inf.aggregated[*medium] == Approx(1.0));
  REQUIRE_FALSE(inf.degenerate);
  REQUIRE(inf.throttle == fc.compute_throttle(0.0, 0.0));
}

TEST_CASE("No fired rule falls back to zero throttle") {
  auto cfg = default_controller_config();
  cfg.rules = {{"zero", "zero", "medium"}};
  const FuzzyController fc(cfg);

  const auto inf = fc.evaluate(25.0, 0.0);
  REQUIRE(inf.degenerate);
  REQUIRE(inf.throttle == 0.0);
  REQUIRE_FALSE(std::isnan(fc.compute_throttle(25.0, 0.0)));

  REQUIRE_FALSE(fc.evaluate(0.0, 0.0).degenerate);
}

TEST_CASE("Inconsistent configurations are rejected") {
  SECTION("rule with an undefined label") {
    auto cfg = default_controller_config();
    cfg.rules.push_back({"zero", "sideways", "medium"});
    REQUIRE_THROWS_AS(FuzzyController(cfg), InvalidParameter);
  }
  SECTION("empty rule base") {
    auto cfg = default_controller_config();
    cfg.rules.clear();
    REQUIRE_THROWS_AS(FuzzyController(cfg), InvalidParameter);
  }
  SECTION("malformed control points") {
    auto cfg = default_controller_config();
    cfg.throttle.sets[2].fn = MembershipFn{70.0, 50.0, 50.0, 30.0};
    REQUIRE_THROWS_AS(FuzzyController(cfg), InvalidParameter);
  }
  SECTION("resolution too small") {
    auto cfg = default_controller_config();
    cfg.resolution = 1;
    REQUIRE_THROWS_AS(FuzzyController(cfg), InvalidParameter);
  }
}

TEST_CASE("Control surface") {
  const FuzzyController fc(default_controller_config());
  const auto surf = fc.control_surface(2.0, 1.0);
  REQUIRE(surf.speed_errors.size() == 31);
  REQUIRE(surf.accelerations.size() == 21);
  REQUIRE(surf.throttle.size() == 31 * 21);

  REQUIRE(surf.speed_errors[15] == 0.0);
  REQUIRE(surf.accelerations[10] == 0.0);
  REQUIRE(surf.at(10, 15) == fc.compute_throttle(0.0, 0.0));

  for (double t : surf.throttle) {
    REQUIRE(t >= 0.0);
    REQUIRE(t <= 100.0);
  }

  REQUIRE_THROWS_AS(fc.control_surface(0.0, 1.0), InvalidParameter);
  REQUIRE_THROWS_AS(fc.control_surface(1.0, -1.0), InvalidParameter);

  // grids too fine to allocate are rejected instead of overflowing the count
  REQUIRE_THROWS_AS(fc.control_surface(1e-300, 1.0), InvalidParameter);
  REQUIRE_THROWS_AS(fc.control_surface(1.0, 1e-6), InvalidParameter);
  REQUIRE(fc.control_surface(0.006, 10.0).speed_errors.size() == kMaxSurfaceAxisPoints);
}
