/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_OBSERVER_HPP
#define __SKYPASS_OBSERVER_HPP

#include <skypass/transform.hpp>

#include <string>

namespace skypass {

/**
 * A fixed ground station. The Earth-fixed position and the SEZ rotation
 * terms are computed once at construction and reused for every query.
 */
class ObserverLocation {
public:
    /**
     * @throws std::invalid_argument if latitude is outside [-90°, 90°],
     *         longitude outside [-180°, 360°) or any value is not finite
     */
    ObserverLocation(std::string name, const Geodetic &geodetic);

    /**
     * Build an observer from degrees and meters, as configured by the user.
     */
    static ObserverLocation fromDegrees(std::string name, double latInDegrees,
                                        double lonInDegrees, double altInMeters);

    const std::string& getName() const { return name_; }
    const Geodetic& getGeodetic() const { return geodetic_; }

    /** Earth-fixed position in kilometers. */
    const Vec3& getPosition() const { return position_; }

    double sinLat() const { return sinLat_; }
    double cosLat() const { return cosLat_; }
    double sinLon() const { return sinLon_; }
    double cosLon() const { return cosLon_; }

private:
    std::string name_;
    Geodetic geodetic_;
    Vec3 position_;
    double sinLat_, cosLat_, sinLon_, cosLon_;
};

}

#endif
