/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4 Satellite Propagation Module
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __SKYPASS_SGP4_HPP
#define __SKYPASS_SGP4_HPP

#include <numbers>
#include <stdexcept>
#include <string>

namespace skypass::sgp4 {

// ============================================================================
// SGP4 Constants
// ============================================================================

// WGS-72 Earth constants used by the published element sets
constexpr double MU = 398600.8;                    // Earth gravitational parameter (km^3/s^2)
constexpr double RADIUS_EARTH_KM = 6378.135;       // Earth equatorial radius (km)
constexpr double J2 = 0.001082616;                 // Second gravitational zonal harmonic
constexpr double J3 = -0.00000253881;              // Third gravitational zonal harmonic
constexpr double J4 = -0.00000165597;              // Fourth gravitational zonal harmonic
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // sqrt(GM) in Earth radii^1.5/min
constexpr double VKMPERSEC = 7.905366149846074;    // km/s per velocity unit
constexpr double TWO_PI = 2.0 * std::numbers::pi;
constexpr double X2O3 = 2.0 / 3.0;

// Orbits with a period at or above this use the deep-space (SDP4) terms
constexpr double DEEP_SPACE_PERIOD_MINUTES = 225.0;

// Julian Date of 1950 January 0.0, the reference for deep-space epochs
constexpr double JD_1950 = 2433281.5;

// ============================================================================
// SGP4 Exception Classes
// ============================================================================

/**
 * Base exception class for SGP4 propagation errors.
 */
class SGP4Exception : public std::runtime_error {
public:
    explicit SGP4Exception(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Thrown when the orbit intersects the Earth (perigee or radius below the surface).
 */
class SatelliteDecayedException : public SGP4Exception {
public:
    explicit SatelliteDecayedException(const std::string& msg = "Satellite has decayed") : SGP4Exception(msg) {}
};

/**
 * Thrown when orbital elements are invalid.
 */
class InvalidOrbitException : public SGP4Exception {
public:
    explicit InvalidOrbitException(const std::string& msg) : SGP4Exception(msg) {}
};

// ============================================================================
// SGP4 Data Structures
// ============================================================================

/**
 * Mean elements in SGP4 units.
 */
struct Elements {
    double epoch_jd;           // Epoch (Julian Date, UTC)
    double bstar;              // BSTAR drag term (1/Earth radii)
    double inclination;        // Inclination (radians)
    double raan;               // Right ascension of ascending node (radians)
    double eccentricity;       // Eccentricity
    double arg_perigee;        // Argument of perigee (radians)
    double mean_anomaly;       // Mean anomaly (radians)
    double mean_motion;        // Mean motion (Kozai, rad/min)
};

/**
 * Lunar-solar and resonance terms for orbits with periods of 225 minutes or more.
 */
struct DeepSpace {
    int irez = 0;                 // Resonance: 0 none, 1 synchronous, 2 half day

    // Lunar-solar periodic coefficients
    double e3 = 0.0, ee2 = 0.0;
    double se2 = 0.0, se3 = 0.0;
    double sgh2 = 0.0, sgh3 = 0.0, sgh4 = 0.0;
    double sh2 = 0.0, sh3 = 0.0;
    double si2 = 0.0, si3 = 0.0;
    double sl2 = 0.0, sl3 = 0.0, sl4 = 0.0;
    double xgh2 = 0.0, xgh3 = 0.0, xgh4 = 0.0;
    double xh2 = 0.0, xh3 = 0.0;
    double xi2 = 0.0, xi3 = 0.0;
    double xl2 = 0.0, xl3 = 0.0, xl4 = 0.0;
    double zmol = 0.0, zmos = 0.0;

    // Lunar-solar secular rates
    double dedt = 0.0, didt = 0.0, dmdt = 0.0, dnodt = 0.0, domdt = 0.0;

    // Resonance terms
    double d2201 = 0.0, d2211 = 0.0, d3210 = 0.0, d3222 = 0.0, d4410 = 0.0;
    double d4422 = 0.0, d5220 = 0.0, d5232 = 0.0, d5421 = 0.0, d5433 = 0.0;
    double del1 = 0.0, del2 = 0.0, del3 = 0.0;
    double xfact = 0.0;
    double xlamo = 0.0;
};

/**
 * Propagation coefficients computed once from the mean elements.
 */
struct Coefficients {
    bool isimp = false;           // Simple drag flag (perigee below 220 km, or deep space)
    bool deepSpace = false;       // Period of 225 minutes or more
    double gsto = 0.0;            // Greenwich sidereal time at epoch (rad)

    double argpo = 0.0;           // Argument of perigee (rad)
    double bstar = 0.0;           // Drag term
    double ecco = 0.0;            // Eccentricity
    double inclo = 0.0;           // Inclination (rad)
    double mo = 0.0;              // Mean anomaly (rad)
    double nodeo = 0.0;           // Right ascension (rad)
    double no_unkozai = 0.0;      // Mean motion (un-Kozai'd, rad/min)

    double aycof = 0.0;
    double con41 = 0.0;
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double delmo = 0.0;
    double eta = 0.0;
    double argpdot = 0.0;
    double omgcof = 0.0;
    double sinmao = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double x1mth2 = 0.0;
    double x7thm1 = 0.0;
    double mdot = 0.0;
    double nodedot = 0.0;
    double xlcof = 0.0;
    double xmcof = 0.0;
    double nodecf = 0.0;

    DeepSpace deep;
};

/**
 * Output from SGP4 propagation.
 */
struct Result {
    double r[3];  // Position (km) in TEME frame
    double v[3];  // Velocity (km/s) in TEME frame
};

// ============================================================================
// SGP4 Public API
// ============================================================================

/**
 * Greenwich Mean Sidereal Time (IAU-82) for a UT1 Julian Date, in radians.
 */
double gstime(double jdut1);

/**
 * Compute the propagation coefficients for a set of mean elements. Periods
 * of 225 minutes or more also get the deep-space terms.
 *
 * @throws InvalidOrbitException if eccentricity or mean motion are out of range
 * @throws SatelliteDecayedException if perigee is below the Earth's surface
 */
Coefficients initialize(const Elements& elements);

/**
 * Propagate to time since epoch.
 *
 * @param coefficients Output of initialize()
 * @param tsince Minutes since epoch
 * @throws InvalidOrbitException if the perturbed elements become invalid
 * @throws SatelliteDecayedException if the satellite has decayed
 */
Result propagate(const Coefficients& coefficients, double tsince);

} // namespace skypass::sgp4

#endif // __SKYPASS_SGP4_HPP
