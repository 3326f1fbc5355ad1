/// @file test_polar.cpp
/// @brief Tests for polar/cartesian conversion and square fitting

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "geometry/polar.hpp"

#include <cmath>

using namespace analogdial;
using Catch::Approx;

namespace {

/// Difference of two angles folded into [-180, 180)
double angle_difference(double a, double b) {
    double d = std::fmod(a - b, 360.0);
    if (d >= 180.0) {
        d -= 360.0;
    } else if (d < -180.0) {
        d += 360.0;
    }
    return d;
}

} // namespace

TEST_CASE("Cardinal directions on a y-down surface", "[polar]") {
    Vec2 east = to_cartesian({10.0, 0.0});
    CHECK(east.x == Approx(10.0));
    CHECK(east.y == Approx(0.0).margin(1e-12));

    // Positive angles turn clockwise on screen: 90 points down
    Vec2 down = to_cartesian({10.0, 90.0});
    CHECK(down.x == Approx(0.0).margin(1e-12));
    CHECK(down.y == Approx(10.0));

    Vec2 up = to_cartesian({10.0, -90.0});
    CHECK(up.x == Approx(0.0).margin(1e-12));
    CHECK(up.y == Approx(-10.0));

    Vec2 west = to_cartesian({10.0, -180.0});
    CHECK(west.x == Approx(-10.0));
    CHECK(west.y == Approx(0.0).margin(1e-12));
}

TEST_CASE("Polar round trip recovers radius and angle", "[polar]") {
    double r = GENERATE(0.5, 1.0, 42.0, 1000.0);
    double phi = GENERATE(-450.0, -225.0, -90.0, -1.0, 0.0, 45.0, 179.0, 180.0, 300.0, 720.5);

    Polar back = to_polar(to_cartesian({r, phi}));

    INFO("r=" << r << " phi=" << phi << " -> r=" << back.r << " phi=" << back.phi);
    CHECK(back.r == Approx(r));
    CHECK(angle_difference(back.phi, phi) == Approx(0.0).margin(1e-9));
    CHECK(back.phi > -180.0);
    CHECK(back.phi <= 180.0);
}

TEST_CASE("Zero radius maps to the origin", "[polar]") {
    Vec2 p = to_cartesian({0.0, 123.0});
    CHECK(p.x == Approx(0.0).margin(1e-12));
    CHECK(p.y == Approx(0.0).margin(1e-12));

    Polar back = to_polar(p);
    CHECK(back.r == 0.0);
}

TEST_CASE("Polar placement translates from the center", "[polar]") {
    Vec2 p = place_polar({100.0, 50.0}, {20.0, 90.0});
    CHECK(p.x == Approx(100.0));
    CHECK(p.y == Approx(70.0));
}

TEST_CASE("Square is fitted to the smaller side and centered", "[polar]") {
    Rect wide = fit_square({10.0, 20.0, 300.0, 100.0});
    CHECK(wide.w == 100.0);
    CHECK(wide.h == 100.0);
    CHECK(wide.x == 110.0);
    CHECK(wide.y == 20.0);

    Rect tall = fit_square({0.0, 0.0, 80.0, 200.0});
    CHECK(tall.w == 80.0);
    CHECK(tall.x == 0.0);
    CHECK(tall.y == 60.0);

    Rect empty = fit_square({5.0, 5.0, -10.0, 40.0});
    CHECK(empty.w == 0.0);
    CHECK(empty.h == 0.0);

    Vec2 c = rect_center(wide);
    CHECK(c.x == 160.0);
    CHECK(c.y == 70.0);
}
