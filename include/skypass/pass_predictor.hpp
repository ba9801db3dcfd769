/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_PASS_PREDICTOR_HPP
#define __SKYPASS_PASS_PREDICTOR_HPP

#include <skypass/elements.hpp>
#include <skypass/observer.hpp>
#include <skypass/propagator.hpp>
#include <skypass/transform.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace skypass {

/**
 * Raised for prediction settings that can never produce a meaningful scan,
 * and internally when a pass boundary cannot be refined.
 */
class PredictionError : public std::runtime_error {
public:
    enum class Kind {
        InvalidConfiguration,
        NonConvergence
    };

    PredictionError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

struct PredictionSettings {
    double horizonInDays = 1.0;                              ///< Length of the search window
    std::chrono::seconds step{60};                           ///< Coarse scan interval
    double minElevationInDegrees = 0.0;                      ///< Rise/set threshold
    int maxPasses = 0;                                       ///< Stop after this many passes (0 = no limit)
    std::chrono::milliseconds refineTolerance{100};          ///< Bracket width at which refinement stops

    /**
     * @throws PredictionError (InvalidConfiguration) if the step or horizon is
     *         not positive, the step exceeds the horizon, the threshold lies
     *         outside [-90, 90], the tolerance is not positive or maxPasses is negative
     */
    void validate() const;

    bool operator==(const PredictionSettings&) const = default;
};

/**
 * One continuous interval during which a satellite is at or above the
 * elevation threshold.
 */
struct Pass {
    int catalogNumber;            ///< Catalog number of the satellite
    std::string name;             ///< Name of the satellite
    Instant riseTime;             ///< Elevation crosses the threshold upwards
    Instant maxElevationTime;     ///< Culmination
    Instant setTime;              ///< Elevation crosses the threshold downwards
    LookAngle riseAngle;
    LookAngle maxAngle;
    LookAngle setAngle;

    std::chrono::system_clock::duration duration() const { return setTime - riseTime; }
};

/**
 * Passes for one satellite, plus what went wrong while finding them.
 */
struct PredictionResult {
    std::vector<Pass> passes;                 ///< Ordered by rise time, non-overlapping
    std::optional<std::string> diagnostic;    ///< Set when samples failed or the run was cut short
    int samples = 0;                          ///< Coarse samples evaluated
    int failedSamples = 0;                    ///< Coarse samples without data
    bool cancelled = false;
};

/**
 * Look angle of a satellite from an observer at an instant.
 *
 * @throws PropagationError if the model cannot produce a state
 * @throws TransformError if the geometry is undefined
 */
LookAngle lookAngleAt(const PropagationModel &model, const OrbitalElements &elements,
                      const ObserverLocation &observer, Instant instant);

/**
 * Finds rise, culmination and set events for satellites over one observer.
 *
 * The coarse scan assumes no pass is shorter than twice the step; a pass
 * that starts and ends between two samples can be missed. Passes already in
 * progress at the start of the horizon, or not finished by its end, are not
 * reported because one of their boundaries is unknown.
 *
 * The predictor keeps a reference to the model, which must outlive it.
 */
class PassPredictor {
public:
    /**
     * @throws PredictionError (InvalidConfiguration) for invalid settings
     */
    PassPredictor(const PropagationModel &model, ObserverLocation observer, PredictionSettings settings);

    /**
     * Predict passes of one satellite starting at `start`.
     *
     * Never throws for propagation failures: failing samples are treated as
     * missing data and reported through the result's diagnostic. When more
     * than half of the coarse samples fail, no passes are returned.
     *
     * The stop token is polled between coarse samples; a stopped run returns
     * the passes completed so far with `cancelled` set.
     */
    PredictionResult predict(const OrbitalElements &elements, Instant start,
                             std::stop_token stop = {}) const;

    /**
     * Predict passes for a batch of satellites, keyed by catalog number.
     * A satellite that cannot be predicted gets an empty result with a
     * diagnostic; the others are unaffected.
     */
    std::map<int, PredictionResult> predictAll(const std::vector<OrbitalElements> &satellites,
                                               Instant start, std::stop_token stop = {}) const;

    const ObserverLocation& getObserver() const { return observer_; }
    const PredictionSettings& getSettings() const { return settings_; }

private:
    struct Sample {
        Instant time;
        double elevationInDegrees;
    };

    // Look angle for refinement; failures become NonConvergence
    LookAngle observe(const OrbitalElements &elements, Instant instant) const;
    Instant refineCrossing(const OrbitalElements &elements, Instant low, Instant high, bool rising) const;
    Instant findMaximum(const OrbitalElements &elements, Instant low, Instant high) const;
    std::optional<Pass> assemble(const OrbitalElements &elements, Instant rise,
                                 const Sample &lastAbove, const Sample &firstBelow,
                                 const Sample &highest) const;

    const PropagationModel &model_;
    ObserverLocation observer_;
    PredictionSettings settings_;
};

}

#endif
