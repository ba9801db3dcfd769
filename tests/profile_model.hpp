/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_TESTS_PROFILE_MODEL_HPP
#define __SKYPASS_TESTS_PROFILE_MODEL_HPP

#include <skypass/observer.hpp>
#include <skypass/propagator.hpp>

#include <cmath>
#include <functional>
#include <numbers>
#include <stop_token>

namespace skypass::test_support {

/**
 * Propagation model that places the target wherever a scripted elevation
 * profile says it should be as seen from one observer.
 *
 * The profile maps seconds since `base` to elevation in degrees. Azimuth
 * sweeps slowly so that consecutive positions differ; range is fixed.
 */
class ProfileModel : public PropagationModel {
public:
    using Profile = std::function<double(double)>;
    using Failure = std::function<bool(int catalogNumber, double seconds)>;

    static constexpr double RANGE_IN_KILOMETERS = 1500.0;

    ProfileModel(ObserverLocation observer, Instant base, Profile profile, Failure failure = {})
        : observer_(std::move(observer)), base_(base), profile_(std::move(profile)), failure_(std::move(failure)) {}

    /** Request a stop on `source` the first time an instant past `seconds` is propagated. */
    void stopAfter(double seconds, std::stop_source *source) {
        stopAfter_ = seconds;
        stopSource_ = source;
    }

    StateVector propagate(const OrbitalElements &elements, Instant instant) const override {
        double t = secondsBetween(base_, instant);
        if (stopSource_ && t > stopAfter_) {
            stopSource_->request_stop();
        }
        if (failure_ && failure_(elements.getCatalogNumber(), t)) {
            throw PropagationError(PropagationError::Kind::Degenerate, "scripted failure");
        }

        double el = profile_(t) * DEGREES_TO_RADIANS;
        double az = std::fmod(t * 0.01, 360.0) * DEGREES_TO_RADIANS;

        // South-East-Zenith components of the line of sight
        double south = -RANGE_IN_KILOMETERS * std::cos(el) * std::cos(az);
        double east = RANGE_IN_KILOMETERS * std::cos(el) * std::sin(az);
        double zenith = RANGE_IN_KILOMETERS * std::sin(el);

        double sinLat = observer_.sinLat(), cosLat = observer_.cosLat();
        double sinLon = observer_.sinLon(), cosLon = observer_.cosLon();
        Vec3 rho{
            sinLat * cosLon * south - sinLon * east + cosLat * cosLon * zenith,
            sinLat * sinLon * south + cosLon * east + cosLat * sinLon * zenith,
            -cosLat * south + sinLat * zenith
        };
        Vec3 fixed = observer_.getPosition() + rho;

        // Back into the inertial frame; the target is at rest relative to the ground
        double gst = gmst(toJulianDate(instant));
        Vec3 inertial = eciToECEF(fixed, -gst);
        Vec3 omega{0.0, 0.0, EARTH_ROTATION_RATE};

        return {inertial, omega.cross(inertial), instant};
    }

private:
    ObserverLocation observer_;
    Instant base_;
    Profile profile_;
    Failure failure_;
    double stopAfter_ = 0.0;
    std::stop_source *stopSource_ = nullptr;
};

/** 90 minute cycle between -50 and +30 degrees, rising through 0 shortly after the start. */
inline double sinusoid(double seconds) {
    return 40.0 * std::sin(2.0 * std::numbers::pi * seconds / 5400.0) - 10.0;
}

}

#endif
