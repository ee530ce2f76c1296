#include <catch2/catch.hpp>
#include "ponifit/GeometryModel.hpp"
#include <cmath>
#include <stdexcept>

using namespace ponifit;

namespace {

Vector pose(double dist, double poni1, double poni2,
            double rot1 = 0.0, double rot2 = 0.0, double rot3 = 0.0)
{
    Vector p(6);
    p << dist, poni1, poni2, rot1, rot2, rot3;
    return p;
}

} // namespace

TEST_CASE("Pixel indices map to pixel centres", "[geometry]") {
    const FlatDetectorGeometry geo(1e-4, 2e-4);
    const auto pos = geo.calc_cartesian_positions(10.0, 20.0);
    CHECK(pos.first  == Approx(10.5e-4));
    CHECK(pos.second == Approx(41e-4));
    CHECK(geo.pixel1() == 1e-4);
    CHECK(geo.pixel2() == 2e-4);
}

TEST_CASE("Non-positive pixel sizes are rejected", "[geometry]") {
    CHECK_THROWS_AS(FlatDetectorGeometry(0.0, 1e-4), std::invalid_argument);
    CHECK_THROWS_AS(FlatDetectorGeometry(1e-4, -1e-4), std::invalid_argument);
}

TEST_CASE("Untilted detector gives atan(r / L)", "[geometry]") {
    const FlatDetectorGeometry geo(1e-4, 1e-4);
    const Vector p = pose(0.1, 0.05, 0.05);

    // pixel centre exactly on the poni
    CHECK(geo.tth(499.5, 499.5, p) == Approx(0.0).margin(1e-12));

    // 0.02 m away along either axis
    CHECK(geo.tth(699.5, 499.5, p) == Approx(std::atan(0.2)));
    CHECK(geo.tth(499.5, 299.5, p) == Approx(std::atan(0.2)));
}

TEST_CASE("Rotation around the beam leaves 2theta unchanged", "[geometry]") {
    const FlatDetectorGeometry geo(1e-4, 1e-4);
    const double a = geo.tth(650.0, 420.0, pose(0.1, 0.05, 0.05));
    const double b = geo.tth(650.0, 420.0, pose(0.1, 0.05, 0.05, 0.0, 0.0, 0.7));
    CHECK(a == Approx(b));
}

TEST_CASE("A tilt moves the direct beam off the poni", "[geometry]") {
    const FlatDetectorGeometry geo(1e-4, 1e-4);
    CHECK(geo.tth(499.5, 499.5, pose(0.1, 0.05, 0.05, 0.03)) == Approx(0.03));
    CHECK(geo.tth(499.5, 499.5, pose(0.1, 0.05, 0.05, -0.03)) == Approx(0.03));
}

TEST_CASE("Column overloads evaluate every observation", "[geometry]") {
    const FlatDetectorGeometry geo(1e-4, 1e-4);
    Vector d1(3), d2(3);
    d1 << 499.5, 699.5, 499.5;
    d2 << 499.5, 499.5, 299.5;

    const Vector t = geo.tth(d1, d2, pose(0.1, 0.05, 0.05));
    REQUIRE(t.size() == 3);
    CHECK(t[1] == Approx(std::atan(0.2)));

    const auto xy = geo.calc_cartesian_positions(d1, d2);
    CHECK(xy.first[1] == Approx(0.07));
    CHECK(xy.second[2] == Approx(0.03));

    CHECK_THROWS_AS(geo.tth(d1, Vector::Zero(2), pose(0.1, 0.05, 0.05)),
                    std::invalid_argument);
    CHECK_THROWS_AS(geo.tth(1.0, 1.0, Vector::Zero(5)), std::invalid_argument);
}
