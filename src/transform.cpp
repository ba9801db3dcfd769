/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/transform.hpp>
#include <skypass/observer.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace skypass {

Geodetic Geodetic::fromDegrees(double latInDegrees, double lonInDegrees, double altInMeters) {
    return {
        latInDegrees * DEGREES_TO_RADIANS,
        lonInDegrees * DEGREES_TO_RADIANS,
        altInMeters / 1000.0
    };
}

// Rotation about Z by Greenwich sidereal time
Vec3 eciToECEF(const Vec3 &eci, double gst) {
    double cosGST = std::cos(gst);
    double sinGST = std::sin(gst);

    return {
         eci.x * cosGST + eci.y * sinGST,
        -eci.x * sinGST + eci.y * cosGST,
         eci.z
    };
}

EarthFixedState inertialToEarthFixed(const StateVector &state) {
    double gst = gmst(toJulianDate(state.instant));

    Vec3 position = eciToECEF(state.positionInKilometers, gst);
    Vec3 rotatedVelocity = eciToECEF(state.velocityInKilometersPerSecond, gst);

    // v_fixed = R·v - ω × r_fixed, with ω along +Z
    Vec3 omega{0.0, 0.0, EARTH_ROTATION_RATE};
    Vec3 velocity = rotatedVelocity - omega.cross(position);

    return {position, velocity, state.instant};
}

Geodetic earthFixedToGeodetic(const Vec3 &position) {
    double x = position.x, y = position.y, z = position.z;
    if (!position.isFinite() || position.magnitude() <= MINIMUM_GEODETIC_RADIUS) {
        throw TransformError("Geodetic coordinates are undefined within "
            + std::to_string(MINIMUM_GEODETIC_RADIUS) + " km of the Earth's center");
    }

    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    // Bowring-form iteration: lat = atan2(z + e²·N·sin(lat), p)
    double lat = std::atan2(z, p * (1 - WGS84_E2));
    for (int i = 0; i < GEODETIC_MAX_ITERATIONS; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
        double next = std::atan2(z + WGS84_E2 * N * sinLat, p);
        bool converged = std::abs(next - lat) < GEODETIC_TOLERANCE;
        lat = next;
        if (converged) {
            break;
        }
    }

    // Projection onto the normal; valid at the poles where p / cos(lat) is not
    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double alt = p * cosLat + z * sinLat - WGS84_A * std::sqrt(1 - WGS84_E2 * sinLat * sinLat);

    return {lat, lon, alt};
}

Vec3 geodeticToEarthFixed(const Geodetic &geodetic) {
    double sinLat = std::sin(geodetic.latInRadians);
    double cosLat = std::cos(geodetic.latInRadians);
    double sinLon = std::sin(geodetic.lonInRadians);
    double cosLon = std::cos(geodetic.lonInRadians);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    return {
        (N + geodetic.altInKilometers) * cosLat * cosLon,
        (N + geodetic.altInKilometers) * cosLat * sinLon,
        (N * (1.0 - WGS84_E2) + geodetic.altInKilometers) * sinLat
    };
}

LookAngle toTopocentric(const ObserverLocation &observer,
                        const Vec3 &targetPosition,
                        const Vec3 &targetVelocity) {
    Vec3 rho = targetPosition - observer.getPosition();
    double range = rho.magnitude();
    if (!(range > 0.0)) {
        throw TransformError("Target coincides with the observer");
    }

    double sinLat = observer.sinLat();
    double cosLat = observer.cosLat();
    double sinLon = observer.sinLon();
    double cosLon = observer.cosLon();

    // ECEF -> South-East-Zenith
    double south  =  sinLat * cosLon * rho.x + sinLat * sinLon * rho.y - cosLat * rho.z;
    double east   = -sinLon * rho.x + cosLon * rho.y;
    double zenith =  cosLat * cosLon * rho.x + cosLat * sinLon * rho.y + sinLat * rho.z;

    double elevation = std::asin(std::clamp(zenith / range, -1.0, 1.0));

    // North is -S, so this is measured clockwise from north
    double azimuth = std::atan2(east, -south);
    if (azimuth < 0) {
        azimuth += 2.0 * std::numbers::pi;
    }
    double azimuthInDegrees = azimuth * RADIANS_TO_DEGREES;
    if (azimuthInDegrees >= 360.0) {
        azimuthInDegrees = 0.0;
    }

    // The observer is fixed to the ground, so its Earth-fixed velocity is zero
    double rangeRate = rho.dot(targetVelocity) / range;

    return {
        .azimuthInDegrees = azimuthInDegrees,
        .elevationInDegrees = elevation * RADIANS_TO_DEGREES,
        .rangeInKilometers = range,
        .rangeRateInKilometersPerSecond = rangeRate
    };
}

}
