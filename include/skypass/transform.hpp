/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_TRANSFORM_HPP
#define __SKYPASS_TRANSFORM_HPP

#include <skypass/time.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace skypass {

class ObserverLocation;

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378.137;                    // Semi-major axis (km) - equatorial radius
constexpr double WGS84_F = 1.0 / 298.257223563;         // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);    // Eccentricity squared ≈ 0.00669437999014

// Earth rotation rate in rad/s (IERS conventional value)
constexpr double EARTH_ROTATION_RATE = 7.292115e-5;

// Geodetic conversion stops when latitude moves less than this (radians)
constexpr double GEODETIC_TOLERANCE = 1.0e-12;
constexpr int GEODETIC_MAX_ITERATIONS = 50;

// Below this radius (km) geodetic coordinates are undefined
constexpr double MINIMUM_GEODETIC_RADIUS = 1.0;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    bool isFinite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }
};

/**
 * Inertial (TEME) position and velocity of a satellite at an instant.
 */
struct StateVector {
    Vec3 positionInKilometers;
    Vec3 velocityInKilometersPerSecond;
    Instant instant;
};

/**
 * Earth-fixed (ECEF) position and ground-relative velocity at an instant.
 */
struct EarthFixedState {
    Vec3 positionInKilometers;
    Vec3 velocityInKilometersPerSecond;
    Instant instant;
};

/**
 * Geodetic coordinates representing a position on or above Earth's surface.
 */
struct Geodetic {
    double latInRadians;      ///< Geodetic latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;      ///< Longitude (-π to +π, positive = East)
    double altInKilometers;   ///< Altitude above the WGS84 ellipsoid surface

    static Geodetic fromDegrees(double latInDegrees, double lonInDegrees, double altInMeters);

    double latInDegrees() const { return latInRadians * RADIANS_TO_DEGREES; }
    double lonInDegrees() const { return lonInRadians * RADIANS_TO_DEGREES; }
};

/**
 * Observer-relative pointing data for a target.
 */
struct LookAngle {
    double azimuthInDegrees;                ///< Clockwise from true north, [0, 360)
    double elevationInDegrees;              ///< Above the local horizontal plane, [-90, 90]
    double rangeInKilometers;               ///< Slant range to the target
    double rangeRateInKilometersPerSecond;  ///< Rate of change of range (negative = approaching)
};

/**
 * Raised when a conversion is asked for a point where it is undefined.
 */
class TransformError : public std::domain_error {
public:
    explicit TransformError(const std::string& msg) : std::domain_error(msg) {}
};

// ============================================================================
// Coordinate System Transformations
// ============================================================================

/**
 * Rotates a vector about the polar axis from the inertial frame into the
 * Earth-fixed frame.
 *
 * @param gst Greenwich sidereal time in radians
 */
Vec3 eciToECEF(const Vec3 &eci, double gst);

/**
 * Converts an inertial state to the Earth-fixed frame at the state's instant.
 *
 * The rotation uses GMST only: polar motion and nutation are not applied,
 * which leaves errors of a few tens of meters at LEO distances. The velocity
 * has the frame rotation (ω × r) removed so it is relative to the ground.
 */
EarthFixedState inertialToEarthFixed(const StateVector &state);

/**
 * Converts Earth-fixed coordinates to WGS84 geodetic coordinates.
 *
 * Fixed-point iteration on latitude stops once the change falls below
 * GEODETIC_TOLERANCE, or after GEODETIC_MAX_ITERATIONS. The iteration
 * contracts for every point outside the ellipsoid's evolute (about 43 km
 * from the center).
 *
 * @throws TransformError if the point is within 1 km of the Earth's center
 */
Geodetic earthFixedToGeodetic(const Vec3 &position);

/**
 * Converts WGS84 geodetic coordinates to an Earth-fixed position (km).
 */
Vec3 geodeticToEarthFixed(const Geodetic &geodetic);

/**
 * Projects a target's Earth-fixed position and ground-relative velocity into
 * the observer's South-East-Zenith frame.
 *
 * @throws TransformError if the target coincides with the observer
 */
LookAngle toTopocentric(const ObserverLocation &observer,
                        const Vec3 &targetPosition,
                        const Vec3 &targetVelocity);

}

#endif
