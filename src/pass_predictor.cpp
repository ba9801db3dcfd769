/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/pass_predictor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using spdlog::debug;
using spdlog::warn;

namespace skypass {

LookAngle lookAngleAt(const PropagationModel &model, const OrbitalElements &elements,
                      const ObserverLocation &observer, Instant instant) {
    auto state = model.propagate(elements, instant);
    auto fixed = inertialToEarthFixed(state);
    return toTopocentric(observer, fixed.positionInKilometers, fixed.velocityInKilometersPerSecond);
}

// ============================================================================
// Prediction Settings
// ============================================================================

void PredictionSettings::validate() const {
    using Kind = PredictionError::Kind;
    using namespace std::chrono;

    if (!(horizonInDays > 0.0)) {
        throw PredictionError(Kind::InvalidConfiguration,
            fmt::format("Search horizon must be positive (got {} days)", horizonInDays));
    }
    if (step <= seconds::zero()) {
        throw PredictionError(Kind::InvalidConfiguration,
            fmt::format("Scan step must be positive (got {} s)", step.count()));
    }
    if (duration<double, days::period>(step).count() > horizonInDays) {
        throw PredictionError(Kind::InvalidConfiguration,
            fmt::format("Scan step of {} s is longer than the {} day horizon", step.count(), horizonInDays));
    }
    if (!(minElevationInDegrees >= -90.0 && minElevationInDegrees <= 90.0)) {
        throw PredictionError(Kind::InvalidConfiguration,
            fmt::format("Minimum elevation must be within [-90, 90] (got {})", minElevationInDegrees));
    }
    if (refineTolerance <= milliseconds::zero()) {
        throw PredictionError(Kind::InvalidConfiguration, "Refinement tolerance must be positive");
    }
    if (maxPasses < 0) {
        throw PredictionError(Kind::InvalidConfiguration, "Maximum pass count cannot be negative");
    }
}

// ============================================================================
// Pass Predictor
// ============================================================================

PassPredictor::PassPredictor(const PropagationModel &model, ObserverLocation observer, PredictionSettings settings)
    : model_(model), observer_(std::move(observer)), settings_(std::move(settings)) {
    settings_.validate();
}

LookAngle PassPredictor::observe(const OrbitalElements &elements, Instant instant) const {
    try {
        return lookAngleAt(model_, elements, observer_, instant);
    } catch (const PropagationError &e) {
        throw PredictionError(PredictionError::Kind::NonConvergence,
            fmt::format("No data while refining pass: {}", e.what()));
    } catch (const TransformError &e) {
        throw PredictionError(PredictionError::Kind::NonConvergence,
            fmt::format("No data while refining pass: {}", e.what()));
    }
}

// Bisection on the threshold crossing. A rising bracket is [below, above],
// a setting bracket [above, below]; the returned instant is on the above side.
Instant PassPredictor::refineCrossing(const OrbitalElements &elements, Instant low, Instant high, bool rising) const {
    using namespace std::chrono;

    auto tolerance = duration_cast<system_clock::duration>(settings_.refineTolerance);
    while (high - low > tolerance) {
        Instant mid = low + (high - low) / 2;
        bool above = observe(elements, mid).elevationInDegrees >= settings_.minElevationInDegrees;
        if (above == rising) {
            high = mid;
        } else {
            low = mid;
        }
    }

    return rising ? high : low;
}

// Golden section search for the elevation maximum in [low, high]
Instant PassPredictor::findMaximum(const OrbitalElements &elements, Instant low, Instant high) const {
    using namespace std::chrono;

    constexpr double PHI = 1.618033988749895;  // Golden ratio
    constexpr double RESPHI = 2.0 - PHI;       // 1 - 1/phi

    auto tolerance = duration_cast<system_clock::duration>(settings_.refineTolerance);
    auto span = high - low;
    Instant x1 = low + duration_cast<system_clock::duration>(span * RESPHI);
    Instant x2 = high - duration_cast<system_clock::duration>(span * RESPHI);

    double f1 = observe(elements, x1).elevationInDegrees;
    double f2 = observe(elements, x2).elevationInDegrees;

    while (high - low > tolerance) {
        if (f1 > f2) {
            high = x2;
            x2 = x1;
            f2 = f1;
            span = high - low;
            x1 = low + duration_cast<system_clock::duration>(span * RESPHI);
            f1 = observe(elements, x1).elevationInDegrees;
        } else {
            low = x1;
            x1 = x2;
            f1 = f2;
            span = high - low;
            x2 = high - duration_cast<system_clock::duration>(span * RESPHI);
            f2 = observe(elements, x2).elevationInDegrees;
        }
    }

    return low + (high - low) / 2;
}

std::optional<Pass> PassPredictor::assemble(const OrbitalElements &elements, Instant rise,
                                            const Sample &lastAbove, const Sample &firstBelow,
                                            const Sample &highest) const {
    Instant set = refineCrossing(elements, lastAbove.time, firstBelow.time, false);
    if (set <= rise) {
        debug("Rejecting zero-length pass of {} at {}", elements.getCatalogNumber(),
              std::chrono::system_clock::to_time_t(rise));
        return std::nullopt;
    }

    Instant maxTime = findMaximum(elements, rise, set);
    LookAngle maxAngle = observe(elements, maxTime);

    // Two culminations in one pass can mislead the search; look again around
    // the best coarse sample, staying inside the pass
    if (highest.elevationInDegrees > maxAngle.elevationInDegrees) {
        auto step = std::chrono::duration_cast<std::chrono::system_clock::duration>(settings_.step);
        Instant low = std::max(rise, highest.time - step);
        Instant high = std::min(set, highest.time + step);
        Instant localTime = findMaximum(elements, low, high);
        LookAngle localAngle = observe(elements, localTime);
        if (localAngle.elevationInDegrees > maxAngle.elevationInDegrees) {
            maxTime = localTime;
            maxAngle = localAngle;
        }
    }

    LookAngle riseAngle = observe(elements, rise);
    LookAngle setAngle = observe(elements, set);

    if (!(rise < maxTime && maxTime < set)
        || maxAngle.elevationInDegrees < riseAngle.elevationInDegrees
        || maxAngle.elevationInDegrees < setAngle.elevationInDegrees) {
        debug("Rejecting degenerate pass of {}: culmination not inside the pass", elements.getCatalogNumber());
        return std::nullopt;
    }

    return Pass{
        .catalogNumber = elements.getCatalogNumber(),
        .name = elements.getName(),
        .riseTime = rise,
        .maxElevationTime = maxTime,
        .setTime = set,
        .riseAngle = riseAngle,
        .maxAngle = maxAngle,
        .setAngle = setAngle
    };
}

PredictionResult PassPredictor::predict(const OrbitalElements &elements, Instant start,
                                        std::stop_token stop) const {
    using namespace std::chrono;

    PredictionResult result;

    auto step = duration_cast<system_clock::duration>(settings_.step);
    auto horizon = duration_cast<system_clock::duration>(duration<double, days::period>(settings_.horizonInDays));
    Instant end = start + horizon;
    double threshold = settings_.minElevationInDegrees;

    std::optional<Sample> previous;     // last sample that had data
    std::optional<Instant> rise;        // refined rise of the pass being followed
    std::optional<Sample> highest;      // best coarse sample of that pass
    bool gap = false;                   // a sample failed since `previous`
    std::string firstFailure;

    for (Instant t = start; ; t += step) {
        if (t > end) {
            t = end;
        }
        if (stop.stop_requested()) {
            result.cancelled = true;
            break;
        }

        result.samples++;
        std::optional<Sample> current;
        try {
            current = Sample{t, lookAngleAt(model_, elements, observer_, t).elevationInDegrees};
        } catch (const PropagationError &e) {
            result.failedSamples++;
            gap = true;
            if (firstFailure.empty()) {
                firstFailure = e.what();
                debug("No data for {} at sample {}: {}", elements.getCatalogNumber(), result.samples, e.what());
            }
        } catch (const TransformError &e) {
            result.failedSamples++;
            gap = true;
            if (firstFailure.empty()) {
                firstFailure = e.what();
                debug("No data for {} at sample {}: {}", elements.getCatalogNumber(), result.samples, e.what());
            }
        }

        if (current) {
            bool above = current->elevationInDegrees >= threshold;
            bool wasAbove = previous && previous->elevationInDegrees >= threshold;

            // The pass may have set and risen again while there was no data
            if (gap && rise) {
                warn("Dropping pass of {}: no data inside the pass", elements.getCatalogNumber());
                rise.reset();
                highest.reset();
            }

            if (previous && !wasAbove && above && gap) {
                warn("Dropping pass of {}: no data at the rise", elements.getCatalogNumber());
            } else if (previous && !wasAbove && above) {
                try {
                    rise = refineCrossing(elements, previous->time, current->time, true);
                    highest = current;
                } catch (const PredictionError &e) {
                    warn("Dropping pass of {}: {}", elements.getCatalogNumber(), e.what());
                    rise.reset();
                }
            } else if (wasAbove && above) {
                if (rise && current->elevationInDegrees > highest->elevationInDegrees) {
                    highest = current;
                }
            } else if (wasAbove && !above) {
                if (rise) {
                    try {
                        if (auto pass = assemble(elements, *rise, *previous, *current, *highest)) {
                            result.passes.push_back(std::move(*pass));
                        }
                    } catch (const PredictionError &e) {
                        warn("Dropping pass of {}: {}", elements.getCatalogNumber(), e.what());
                    }
                }
                rise.reset();
                highest.reset();
            }
            previous = current;
            gap = false;
        }

        if (settings_.maxPasses > 0 && static_cast<int>(result.passes.size()) >= settings_.maxPasses) {
            break;
        }
        if (t == end) {
            break;
        }
    }

    std::string diagnostic;
    if (result.failedSamples * 2 > result.samples) {
        result.passes.clear();
        diagnostic = fmt::format("{} of {} samples had no data ({}); no passes reported",
                                 result.failedSamples, result.samples, firstFailure);
    } else if (result.failedSamples > 0) {
        diagnostic = fmt::format("{} of {} samples had no data ({})",
                                 result.failedSamples, result.samples, firstFailure);
    }
    if (result.cancelled) {
        if (!diagnostic.empty()) {
            diagnostic += "; ";
        }
        diagnostic += fmt::format("cancelled after {} samples", result.samples);
    }
    if (!diagnostic.empty()) {
        result.diagnostic = diagnostic;
    }

    return result;
}

std::map<int, PredictionResult> PassPredictor::predictAll(const std::vector<OrbitalElements> &satellites,
                                                          Instant start, std::stop_token stop) const {
    std::map<int, PredictionResult> results;
    for (const auto &elements : satellites) {
        if (stop.stop_requested()) {
            break;
        }
        auto result = predict(elements, start, stop);
        if (result.diagnostic) {
            warn("{} ({}): {}", elements.getName(), elements.getCatalogNumber(), *result.diagnostic);
        }
        results.insert_or_assign(elements.getCatalogNumber(), std::move(result));
    }
    return results;
}

}
