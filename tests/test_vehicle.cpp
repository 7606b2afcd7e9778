#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fzd/vehicle.hpp>
#include <fzd/errors.hpp>

using Catch::Approx;
using namespace fzd;

TEST_CASE("One Euler step from rest") {
  VehicleDynamics v;
  const auto s = v.update(100.0, 0.1);
  REQUIRE(s.acceleration == Approx(10.0));
  REQUIRE(s.speed == Approx(1.0));
  REQUIRE(s.position == Approx(0.1));
  REQUIRE(v.state().speed == s.speed);
}

TEST_CASE("Constant throttle converges to the steady state") {
  VehicleDynamics v;
  REQUIRE(v.steady_state_speed(50.0) == Approx(20.0));
  for (int i = 0; i < 2000; ++i) v.update(50.0, 0.1);
  REQUIRE(v.state().speed == Approx(20.0).margin(1e-3));
  REQUIRE(v.state().acceleration == Approx(0.0).margin(1e-3));
}

TEST_CASE("Throttle is clamped to [0,100]") {
  VehicleDynamics a, b;
  a.update(150.0, 0.1);
  b.update(100.0, 0.1);
  REQUIRE(a.state().speed == b.state().speed);

  VehicleDynamics c;
  c.update(-20.0, 0.1);
  REQUIRE(c.state().speed == 0.0);
  REQUIRE(c.state().position == 0.0);
}

TEST_CASE("Speed never goes negative") {
  // drag * dt / mass > 1 overshoots zero in a single step
  VehicleDynamics v({}, VehicleState{0.0, 10.0, 0.0});
  const auto s = v.update(0.0, 5.0);
  REQUIRE(s.speed == 0.0);
  REQUIRE(s.position == 0.0);
}

TEST_CASE("Non-positive dt is rejected and leaves the state untouched") {
  VehicleDynamics v;
  v.update(60.0, 0.1);
  const auto before = v.state();
  REQUIRE_THROWS_AS(v.update(60.0, 0.0), InvalidParameter);
  REQUIRE_THROWS_AS(v.update(60.0, -0.1), InvalidParameter);
  REQUIRE(v.state().speed == before.speed);
  REQUIRE(v.state().position == before.position);
}

TEST_CASE("Reset zeroes the state") {
  VehicleDynamics v;
  for (int i = 0; i < 10; ++i) v.update(80.0, 0.1);
  REQUIRE(v.state().position > 0.0);

  v.reset();
  REQUIRE(v.state().position == 0.0);
  REQUIRE(v.state().speed == 0.0);
  REQUIRE(v.state().acceleration == 0.0);

  v.reset();
  REQUIRE(v.state().speed == 0.0);
}

TEST_CASE("Vehicle parameter validation") {
  REQUIRE_THROWS_AS(VehicleDynamics(VehicleParams{0.0, 5000.0, 125.0}), InvalidParameter);
  REQUIRE_THROWS_AS(VehicleDynamics(VehicleParams{500.0, 5000.0, -1.0}), InvalidParameter);
  REQUIRE_THROWS_AS(VehicleDynamics(VehicleParams{500.0, -1.0, 125.0}), InvalidParameter);

  VehicleDynamics v;
  v.update(100.0, 0.1);
  REQUIRE_THROWS_AS(v.set_params(VehicleParams{-5.0, 5000.0, 125.0}), InvalidParameter);
  REQUIRE(v.params().mass == 500.0);

  v.set_params(VehicleParams{1000.0, 5000.0, 125.0});
  REQUIRE(v.params().mass == 1000.0);
  REQUIRE(v.state().speed == Approx(1.0));
}
