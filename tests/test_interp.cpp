#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include <fzd/snap.hpp>
#include <fzd/interp.hpp>

using Catch::Approx;
using namespace fzd;

TEST_CASE("InterpBuffer linear interpolation by sim_time") {
  InterpBuffer ib;
  CruiseSnapshot a{}, b{};

  a.sim_time = 0.0; a.x = 0.0; a.y = 0.0; a.position = 0.0; a.speed = 10.0; a.throttle = 40.0; a.tick = 1;
  b.sim_time = 1.0; b.x = 10.0; b.y = 20.0; b.position = 30.0; b.speed = 12.0; b.throttle = 60.0; b.tick = 2;
  a.heading_rad = 0.0; b.heading_rad = kPI/2;
  b.manual = true;

  ib.push(a);
  ib.push(b);

  CruiseSnapshot out{};
  REQUIRE(ib.sample(0.5, out));  // half-way
  REQUIRE(out.x == Approx(5.0));
  REQUIRE(out.y == Approx(10.0));
  REQUIRE(out.position == Approx(15.0));
  REQUIRE(out.speed == Approx(11.0));
  REQUIRE(out.throttle == Approx(50.0));
  REQUIRE(out.heading_rad == Approx(kPI/4).margin(1e-9));
  REQUIRE(out.tick == 1);          // discrete fields from the older snapshot
  REQUIRE_FALSE(out.manual);
}

TEST_CASE("InterpBuffer clamps outside range") {
  InterpBuffer ib;
  CruiseSnapshot a{}, b{};
  a.sim_time = 2.0; a.speed = 2.0;
  b.sim_time = 3.0; b.speed = 4.0;
  ib.push(a); ib.push(b);

  CruiseSnapshot out{};
  REQUIRE(ib.sample(1.5, out));
  REQUIRE(out.speed == Approx(2.0));
  REQUIRE(ib.sample(3.5, out));
  REQUIRE(out.speed == Approx(4.0));
  REQUIRE(ib.latest_time() == 3.0);
}

TEST_CASE("InterpBuffer shortest-angle wrap around 2pi") {
  InterpBuffer ib;
  CruiseSnapshot a{}, b{}, out{};

  // 359 deg to 1 deg crosses the wrap
  a.sim_time = 0.0; a.heading_rad = kTAU - (kPI/180.0);
  b.sim_time = 1.0; b.heading_rad = (kPI/180.0);
  ib.push(a); ib.push(b);

  REQUIRE(ib.sample(0.5, out));
  REQUIRE(std::cos(out.heading_rad) == Approx(1.0).margin(1e-9));
  REQUIRE(std::sin(out.heading_rad) == Approx(0.0).margin(1e-9));
}

TEST_CASE("InterpBuffer requires at least one snapshot") {
  InterpBuffer ib;
  CruiseSnapshot out{};
  REQUIRE_FALSE(ib.sample(0.0, out));

  CruiseSnapshot a{}; a.sim_time = 42.0; a.speed = 7.0;
  ib.push(a);
  REQUIRE(ib.sample(0.0, out));
  REQUIRE(out.speed == Approx(7.0));
}

TEST_CASE("InterpBuffer drops history when time rewinds") {
  InterpBuffer ib;
  for (int i = 0; i < 5; ++i) {
    CruiseSnapshot s{}; s.sim_time = 0.1 * i; s.position = double(i);
    ib.push(s);
  }
  REQUIRE(ib.size() == 5);

  CruiseSnapshot r{}; r.sim_time = 0.0; r.position = 0.0;
  ib.push(r);   // vehicle reset
  REQUIRE(ib.size() == 1);
  REQUIRE(ib.latest_time() == 0.0);
}

TEST_CASE("InterpBuffer keeps only the newest snapshots") {
  InterpBuffer ib(4);
  for (int i = 0; i < 10; ++i) {
    CruiseSnapshot s{}; s.sim_time = double(i); s.speed = double(i);
    ib.push(s);
  }
  REQUIRE(ib.size() == 4);
  REQUIRE(ib.latest_time() == 9.0);

  CruiseSnapshot out{};
  REQUIRE(ib.sample(0.0, out));
  REQUIRE(out.speed == Approx(6.0));   // oldest kept
  REQUIRE(ib.sample(7.5, out));
  REQUIRE(out.speed == Approx(7.5));
}
