#include <catch2/catch.hpp>

#include <ringout/platform.hpp>

using Catch::Detail::Approx;
using namespace ringout;

static ArenaConfig linear_arena() {
  ArenaConfig a{};
  a.start_radius = 300.0;
  a.min_radius = 100.0;
  a.shrink_delay_s = 10.0;
  a.shrink_kind = ShrinkKind::Linear;
  a.shrink_rate = 20.0;
  return a;
}

TEST_CASE("Linear shrink holds, shrinks, then settles at the minimum") {
  PlatformController p(linear_arena());
  REQUIRE(p.current_radius(0.0) == Approx(300.0));
  REQUIRE(p.current_radius(10.0) == Approx(300.0));
  REQUIRE(p.current_radius(15.0) == Approx(200.0));
  REQUIRE(p.current_radius(20.0) == Approx(100.0));
  REQUIRE(p.current_radius(1000.0) == Approx(100.0));
  REQUIRE(p.end_time() == Approx(20.0));

  REQUIRE(p.phase(5.0) == PlatformPhase::Stable);
  REQUIRE(p.phase(15.0) == PlatformPhase::Shrinking);
  REQUIRE(p.phase(20.0) == PlatformPhase::Settled);
}

TEST_CASE("Stepped shrink drops by a fraction of the start radius per interval") {
  ArenaConfig a = linear_arena();
  a.shrink_kind = ShrinkKind::Stepped;
  a.step_fraction = 0.1;
  a.step_interval_s = 5.0;
  PlatformController p(a);

  REQUIRE(p.current_radius(14.9) == Approx(300.0));
  REQUIRE(p.current_radius(15.0) == Approx(270.0));
  REQUIRE(p.current_radius(20.0) == Approx(240.0));
  // 7 steps of 30 overshoot the minimum; the radius stops at it.
  REQUIRE(p.end_time() == Approx(45.0));
  REQUIRE(p.current_radius(45.0) == Approx(100.0));
  REQUIRE(p.phase(44.0) == PlatformPhase::Shrinking);
  REQUIRE(p.phase(45.0) == PlatformPhase::Settled);
}

TEST_CASE("Radius never increases over time") {
  for (ShrinkKind k : {ShrinkKind::Linear, ShrinkKind::Stepped}) {
    ArenaConfig a = linear_arena();
    a.shrink_kind = k;
    PlatformController p(a);
    double prev = p.current_radius(0.0);
    for (int i = 1; i < 4000; ++i) {
      const double r = p.current_radius(i / 60.0);
      REQUIRE(r <= prev);
      REQUIRE(r >= a.min_radius);
      prev = r;
    }
  }
}

TEST_CASE("Out of bounds is strictly beyond the radius") {
  REQUIRE_FALSE(PlatformController::is_out_of_bounds(Vec2{3.0, 4.0}, 5.0));
  REQUIRE(PlatformController::is_out_of_bounds(Vec2{3.0, 4.001}, 5.0));
  REQUIRE_FALSE(PlatformController::is_out_of_bounds(Vec2{}, 1.0));
}
