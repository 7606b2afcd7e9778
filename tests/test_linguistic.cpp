#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fzd/linguistic.hpp>
#include <fzd/errors.hpp>

using Catch::Approx;
using namespace fzd;

static LinguisticVariable acceleration_var() {
  LinguisticVariable v;
  v.name = "acceleration";
  v.lo = -10.0;
  v.hi = 10.0;
  v.sets = {
    {"negative", make_trapezoid(-10, -10, -5, 0)},
    {"zero",     make_triangle(-3, 0, 3)},
    {"positive", make_trapezoid(0, 5, 10, 10)},
  };
  return v;
}

TEST_CASE("LinguisticVariable lookup and fuzzification") {
  const auto v = acceleration_var();
  REQUIRE_NOTHROW(v.validate());

  REQUIRE(v.index_of("zero") == 1u);
  REQUIRE_FALSE(v.index_of("huge").has_value());

  const auto d = v.fuzzify(-2.5);
  REQUIRE(d.size() == 3);
  REQUIRE(d[0] == Approx(0.5));
  REQUIRE(d[1] == Approx(1.0 / 6.0));
  REQUIRE(d[2] == 0.0);
}

TEST_CASE("fuzzify clamps out-of-range input to the nearest boundary") {
  const auto v = acceleration_var();
  REQUIRE(v.fuzzify(50.0) == v.fuzzify(10.0));
  REQUIRE(v.fuzzify(-50.0) == v.fuzzify(-10.0));
  REQUIRE(v.fuzzify(50.0)[2] == Approx(1.0));
}

TEST_CASE("LinguisticVariable validation") {
  SECTION("empty range") {
    auto v = acceleration_var();
    v.hi = v.lo;
    REQUIRE_THROWS_AS(v.validate(), InvalidParameter);
  }
  SECTION("no sets") {
    auto v = acceleration_var();
    v.sets.clear();
    REQUIRE_THROWS_AS(v.validate(), InvalidParameter);
  }
  SECTION("duplicate label") {
    auto v = acceleration_var();
    v.sets.push_back({"zero", make_triangle(-1, 0, 1)});
    REQUIRE_THROWS_AS(v.validate(), InvalidParameter);
  }
  SECTION("control points built by hand out of order") {
    auto v = acceleration_var();
    v.sets[1].fn = MembershipFn{3.0, 0.0, 0.0, -3.0};
    REQUIRE_THROWS_AS(v.validate(), InvalidParameter);
  }
  SECTION("missing name") {
    auto v = acceleration_var();
    v.name.clear();
    REQUIRE_THROWS_AS(v.validate(), InvalidParameter);
  }
}

TEST_CASE("sample_axis spans the range inclusively") {
  LinguisticVariable v;
  v.name = "throttle";
  v.lo = 0.0;
  v.hi = 100.0;
  const auto xs = v.sample_axis(5);
  REQUIRE(xs.size() == 5);
  REQUIRE(xs[0] == 0.0);
  REQUIRE(xs[1] == Approx(25.0));
  REQUIRE(xs[2] == Approx(50.0));
  REQUIRE(xs[4] == 100.0);
  REQUIRE_THROWS_AS(v.sample_axis(1), InvalidParameter);
}
