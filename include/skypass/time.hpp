/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_TIME_HPP
#define __SKYPASS_TIME_HPP

#include <chrono>
#include <numbers>

namespace skypass {

/** A UTC instant. Leap seconds are not modelled (POSIX time scale). */
using Instant = std::chrono::system_clock::time_point;

// Astronomical constants
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01T00:00:00Z
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

/**
 * Converts an instant to a Julian Date.
 */
double toJulianDate(Instant instant);

/**
 * Converts a Julian Date back to an instant, rounded to the clock's resolution.
 */
Instant fromJulianDate(double julianDate);

/**
 * Computes Greenwich Mean Sidereal Time (GMST) for a given Julian Date.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(double julianDate);

/**
 * Seconds elapsed from one instant to another (negative when `to` is earlier).
 */
double secondsBetween(Instant from, Instant to);

/**
 * Offsets an instant by a fractional number of seconds.
 */
Instant addSeconds(Instant instant, double seconds);

}

#endif
