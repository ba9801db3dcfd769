/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/propagator.hpp>
#include <skypass/sgp4.hpp>
#include <skypass/time.hpp>

#include <cmath>

namespace skypass {

const char* toString(PropagationError::Kind kind) {
    switch (kind) {
        case PropagationError::Kind::Degenerate:
            return "degenerate orbit";
        case PropagationError::Kind::NumericalDivergence:
            return "numerical divergence";
        case PropagationError::Kind::OutOfRange:
            return "out of range";
    }
    return "unknown";
}

Sgp4Model::Sgp4Model(std::chrono::days maxElementAge) : maxElementAge_(maxElementAge) {}

StateVector Sgp4Model::propagate(const OrbitalElements &elements, Instant instant) const {
    using namespace std::chrono;
    using Kind = PropagationError::Kind;

    auto age = elements.ageAt(instant);
    if (std::abs(age.count()) > static_cast<double>(maxElementAge_.count())) {
        throw PropagationError(Kind::OutOfRange,
            "Elements for " + std::to_string(elements.getCatalogNumber()) + " are "
            + std::to_string(static_cast<int>(std::abs(age.count())))
            + " days from the requested time (limit " + std::to_string(maxElementAge_.count()) + ")");
    }

    sgp4::Elements input{
        .epoch_jd = toJulianDate(elements.getEpoch()),
        .bstar = elements.getBstarDragTerm(),
        .inclination = elements.getInclination() * DEGREES_TO_RADIANS,
        .raan = elements.getRightAscensionOfAscendingNode() * DEGREES_TO_RADIANS,
        .eccentricity = elements.getEccentricity(),
        .arg_perigee = elements.getArgumentOfPerigee() * DEGREES_TO_RADIANS,
        .mean_anomaly = elements.getMeanAnomaly() * DEGREES_TO_RADIANS,
        .mean_motion = elements.getMeanMotion() * sgp4::TWO_PI / 1440.0
    };

    // Minutes since epoch from the exact duration, not from Julian Dates
    double tsince = duration<double, minutes::period>(instant - elements.getEpoch()).count();

    sgp4::Result result;
    try {
        auto coefficients = sgp4::initialize(input);
        result = sgp4::propagate(coefficients, tsince);
    } catch (const sgp4::SGP4Exception &e) {
        throw PropagationError(Kind::Degenerate, e.what());
    }

    StateVector state{
        .positionInKilometers = {result.r[0], result.r[1], result.r[2]},
        .velocityInKilometersPerSecond = {result.v[0], result.v[1], result.v[2]},
        .instant = instant
    };

    if (!state.positionInKilometers.isFinite() || !state.velocityInKilometersPerSecond.isFinite()) {
        throw PropagationError(Kind::NumericalDivergence,
            "Non-finite state vector for " + std::to_string(elements.getCatalogNumber()));
    }

    return state;
}

}
