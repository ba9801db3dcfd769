/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skypass/observer.hpp>
#include <skypass/transform.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

namespace skypass {
namespace {

using namespace std::chrono;

constexpr double PI = std::numbers::pi;

// Polar radius of the WGS84 ellipsoid (km)
constexpr double WGS84_B = WGS84_A * (1.0 - WGS84_F);

class TransformTest : public ::testing::Test {
protected:
    // On the equator at the prime meridian, at sea level
    ObserverLocation origin = ObserverLocation::fromDegrees("Origin", 0.0, 0.0, 0.0);
};

TEST_F(TransformTest, EciToEcefRotatesAboutPolarAxis) {
    Vec3 r = eciToECEF({1.0, 0.0, 2.0}, PI / 2);
    EXPECT_NEAR(r.x, 0.0, 1e-15);
    EXPECT_NEAR(r.y, -1.0, 1e-15);
    EXPECT_DOUBLE_EQ(r.z, 2.0);

    Vec3 unchanged = eciToECEF({3.0, 4.0, 5.0}, 0.0);
    EXPECT_DOUBLE_EQ(unchanged.x, 3.0);
    EXPECT_DOUBLE_EQ(unchanged.y, 4.0);
}

TEST_F(TransformTest, InertialToEarthFixedUsesSiderealTime) {
    Instant instant = sys_days{year{2000}/January/1} + hours{12};
    double g = gmst(toJulianDate(instant));

    StateVector state{{7000.0, 0.0, 100.0}, {0.0, 7.5, 0.0}, instant};
    auto fixed = inertialToEarthFixed(state);

    EXPECT_NEAR(fixed.positionInKilometers.x, 7000.0 * std::cos(g), 1e-9);
    EXPECT_NEAR(fixed.positionInKilometers.y, -7000.0 * std::sin(g), 1e-9);
    EXPECT_DOUBLE_EQ(fixed.positionInKilometers.z, 100.0);
    EXPECT_EQ(fixed.instant, instant);
}

TEST_F(TransformTest, CorotatingPointHasNoGroundVelocity) {
    // A point moving with the Earth's rotation is stationary in the fixed frame
    Vec3 r{6500.0, 1200.0, 300.0};
    Vec3 omega{0.0, 0.0, EARTH_ROTATION_RATE};
    StateVector state{r, omega.cross(r), sys_days{year{2024}/March/15}};

    auto fixed = inertialToEarthFixed(state);
    EXPECT_NEAR(fixed.velocityInKilometersPerSecond.magnitude(), 0.0, 1e-12);
    EXPECT_NEAR(fixed.positionInKilometers.magnitude(), r.magnitude(), 1e-9);
}

TEST_F(TransformTest, EquatorAndPoleOnTheEllipsoid) {
    Vec3 equator = geodeticToEarthFixed({0.0, 0.0, 0.0});
    EXPECT_NEAR(equator.x, WGS84_A, 1e-9);
    EXPECT_NEAR(equator.y, 0.0, 1e-9);
    EXPECT_NEAR(equator.z, 0.0, 1e-9);

    Geodetic pole = earthFixedToGeodetic({0.0, 0.0, WGS84_B});
    EXPECT_NEAR(pole.latInRadians, PI / 2, 1e-12);
    EXPECT_NEAR(pole.altInKilometers, 0.0, 1e-9);

    Geodetic southPole = earthFixedToGeodetic({0.0, 0.0, -(WGS84_B + 10.0)});
    EXPECT_NEAR(southPole.latInRadians, -PI / 2, 1e-12);
    EXPECT_NEAR(southPole.altInKilometers, 10.0, 1e-9);
}

TEST_F(TransformTest, GeodeticRoundTrip) {
    std::vector<Geodetic> points = {
        Geodetic::fromDegrees(45.0, 30.0, 500.0),
        Geodetic::fromDegrees(-33.87, 151.21, 58.0),
        Geodetic::fromDegrees(89.9, -10.0, 400000.0),
        Geodetic::fromDegrees(0.0, -120.0, 35786000.0),
        Geodetic::fromDegrees(-60.0, 179.99, 800000.0),
    };

    for (const auto &g : points) {
        Geodetic back = earthFixedToGeodetic(geodeticToEarthFixed(g));
        EXPECT_NEAR(back.latInRadians, g.latInRadians, 1e-10);
        EXPECT_NEAR(back.lonInRadians, g.lonInRadians, 1e-10);
        // 1 mm
        EXPECT_NEAR(back.altInKilometers, g.altInKilometers, 1e-6);
    }
}

TEST_F(TransformTest, GeodeticRejectsPointsNearTheCenter) {
    EXPECT_THROW(earthFixedToGeodetic({0.5, 0.0, 0.0}), TransformError);
    EXPECT_THROW(earthFixedToGeodetic({0.0, 0.0, 0.0}), TransformError);
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(earthFixedToGeodetic({nan, 7000.0, 0.0}), TransformError);
}

TEST_F(TransformTest, TargetOverheadIsAtZenith) {
    Vec3 overhead = geodeticToEarthFixed(Geodetic::fromDegrees(0.0, 0.0, 500000.0));
    auto look = toTopocentric(origin, overhead, {0.0, 0.0, 0.0});
    EXPECT_NEAR(look.elevationInDegrees, 90.0, 1e-9);
    EXPECT_NEAR(look.rangeInKilometers, 500.0, 1e-9);
    EXPECT_DOUBLE_EQ(look.rangeRateInKilometersPerSecond, 0.0);
}

TEST_F(TransformTest, AzimuthIsClockwiseFromNorth) {
    // At the equator and prime meridian, +Z is north and +Y is east
    Vec3 site = origin.getPosition();

    auto north = toTopocentric(origin, site + Vec3{0.0, 0.0, 1000.0}, {0.0, 0.0, 0.0});
    EXPECT_NEAR(north.azimuthInDegrees, 0.0, 1e-9);
    EXPECT_NEAR(north.elevationInDegrees, 0.0, 1e-9);
    EXPECT_NEAR(north.rangeInKilometers, 1000.0, 1e-9);

    auto east = toTopocentric(origin, site + Vec3{0.0, 1000.0, 0.0}, {0.0, 0.0, 0.0});
    EXPECT_NEAR(east.azimuthInDegrees, 90.0, 1e-9);

    auto south = toTopocentric(origin, site + Vec3{0.0, 0.0, -1000.0}, {0.0, 0.0, 0.0});
    EXPECT_NEAR(south.azimuthInDegrees, 180.0, 1e-9);

    auto west = toTopocentric(origin, site + Vec3{0.0, -1000.0, 0.0}, {0.0, 0.0, 0.0});
    EXPECT_NEAR(west.azimuthInDegrees, 270.0, 1e-9);

    auto below = toTopocentric(origin, site + Vec3{-1000.0, 0.0, 0.0}, {0.0, 0.0, 0.0});
    EXPECT_NEAR(below.elevationInDegrees, -90.0, 1e-9);
}

TEST_F(TransformTest, AzimuthIsNormalized) {
    Vec3 site = origin.getPosition();
    // Just west of north
    auto look = toTopocentric(origin, site + Vec3{0.0, -1e-3, 1000.0}, {0.0, 0.0, 0.0});
    EXPECT_GE(look.azimuthInDegrees, 0.0);
    EXPECT_LT(look.azimuthInDegrees, 360.0);
    EXPECT_GT(look.azimuthInDegrees, 359.0);
}

TEST_F(TransformTest, RangeRateSign) {
    Vec3 target = origin.getPosition() + Vec3{0.0, 0.0, 1000.0};

    auto approaching = toTopocentric(origin, target, {0.0, 0.0, -1.0});
    EXPECT_NEAR(approaching.rangeRateInKilometersPerSecond, -1.0, 1e-12);

    auto receding = toTopocentric(origin, target, {0.0, 0.0, 2.0});
    EXPECT_NEAR(receding.rangeRateInKilometersPerSecond, 2.0, 1e-12);

    auto crossing = toTopocentric(origin, target, {0.0, 3.0, 0.0});
    EXPECT_NEAR(crossing.rangeRateInKilometersPerSecond, 0.0, 1e-12);
}

TEST_F(TransformTest, TargetAtObserverIsUndefined) {
    EXPECT_THROW(toTopocentric(origin, origin.getPosition(), {1.0, 0.0, 0.0}), TransformError);
}

TEST_F(TransformTest, ObserverAtHighLatitude) {
    // Local vertical of an observer at 60N points away from the polar axis
    auto observer = ObserverLocation::fromDegrees("North", 60.0, 25.0, 0.0);
    Vec3 up = geodeticToEarthFixed(Geodetic::fromDegrees(60.0, 25.0, 100000.0));
    auto look = toTopocentric(observer, up, {0.0, 0.0, 0.0});
    EXPECT_NEAR(look.elevationInDegrees, 90.0, 1e-7);
    EXPECT_NEAR(look.rangeInKilometers, 100.0, 1e-8);
}

} // namespace
} // namespace skypass
