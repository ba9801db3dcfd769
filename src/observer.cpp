/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/observer.hpp>

#include <cmath>
#include <stdexcept>

namespace skypass {

namespace {

Geodetic validated(const Geodetic &g) {
    if (!std::isfinite(g.latInRadians) || !std::isfinite(g.lonInRadians) || !std::isfinite(g.altInKilometers)) {
        throw std::invalid_argument("Observer coordinates must be finite");
    }
    double lat = g.latInDegrees();
    double lon = g.lonInDegrees();
    // Allow for rounding in the degree/radian conversion at the boundaries
    constexpr double slack = 1e-9;
    if (lat < -90.0 - slack || lat > 90.0 + slack) {
        throw std::invalid_argument("Observer latitude out of range [-90, 90]: " + std::to_string(lat));
    }
    if (lon < -180.0 - slack || lon >= 360.0) {
        throw std::invalid_argument("Observer longitude out of range [-180, 360): " + std::to_string(lon));
    }
    return g;
}

}

ObserverLocation::ObserverLocation(std::string name, const Geodetic &geodetic)
    : name_(std::move(name)),
      geodetic_(validated(geodetic)),
      position_(geodeticToEarthFixed(geodetic_)),
      sinLat_(std::sin(geodetic_.latInRadians)),
      cosLat_(std::cos(geodetic_.latInRadians)),
      sinLon_(std::sin(geodetic_.lonInRadians)),
      cosLon_(std::cos(geodetic_.lonInRadians)) {}

ObserverLocation ObserverLocation::fromDegrees(std::string name, double latInDegrees,
                                               double lonInDegrees, double altInMeters) {
    return ObserverLocation(std::move(name), Geodetic::fromDegrees(latInDegrees, lonInDegrees, altInMeters));
}

}
