/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_PROPAGATOR_HPP
#define __SKYPASS_PROPAGATOR_HPP

#include <skypass/elements.hpp>
#include <skypass/transform.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace skypass {

/**
 * Raised when a state vector cannot be produced for an element set and instant.
 */
class PropagationError : public std::runtime_error {
public:
    enum class Kind {
        Degenerate,           ///< Non-physical orbit (perigee below the surface, decayed, invalid elements)
        NumericalDivergence,  ///< The model produced a non-finite value
        OutOfRange            ///< The instant is too far from the element epoch
    };

    PropagationError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* toString(PropagationError::Kind kind);

/**
 * Produces inertial state vectors from orbital elements. Implementations
 * must be deterministic: identical inputs give identical outputs.
 */
class PropagationModel {
public:
    virtual ~PropagationModel() = default;

    /**
     * @throws PropagationError if no physically meaningful state exists
     */
    virtual StateVector propagate(const OrbitalElements &elements, Instant instant) const = 0;
};

/**
 * SGP4 model, with the SDP4 lunar-solar and resonance terms for periods of
 * 225 minutes or more.
 *
 * Coefficients are recomputed from the elements on every call, so the model
 * holds no per-satellite state and may be shared between callers.
 */
class Sgp4Model : public PropagationModel {
public:
    static constexpr std::chrono::days DEFAULT_MAX_ELEMENT_AGE{90};

    explicit Sgp4Model(std::chrono::days maxElementAge = DEFAULT_MAX_ELEMENT_AGE);

    StateVector propagate(const OrbitalElements &elements, Instant instant) const override;

    std::chrono::days getMaxElementAge() const { return maxElementAge_; }

private:
    std::chrono::days maxElementAge_;
};

}

#endif
