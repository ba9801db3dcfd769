/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/time.hpp>

#include <cmath>

namespace skypass {

double toJulianDate(Instant instant) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        instant.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

Instant fromJulianDate(double julianDate) {
    using namespace std::chrono;

    duration<double, days::period> sinceEpoch{julianDate - UNIX_EPOCH_JD};
    return Instant{round<system_clock::duration>(sinceEpoch)};
}

// Greenwich Mean Sidereal Time in radians
double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

    // Normalize to [0, 360)
    gmstInDegrees = std::fmod(gmstInDegrees, 360.0);
    if (gmstInDegrees < 0) gmstInDegrees += 360.0;

    return gmstInDegrees * DEGREES_TO_RADIANS;
}

double secondsBetween(Instant from, Instant to) {
    return std::chrono::duration<double>(to - from).count();
}

Instant addSeconds(Instant instant, double seconds) {
    using namespace std::chrono;
    return instant + round<system_clock::duration>(duration<double>(seconds));
}

}
