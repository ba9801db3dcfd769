/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/tracker.hpp>

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace skypass {

void TrackingSettings::validate() const {
    prediction.validate();
    radio.validate();
    for (const auto &[id, link] : frequencies) {
        if (!(link.downlinkFrequencyInMHz >= 0.0) || !(link.uplinkFrequencyInMHz >= 0.0)) {
            throw std::invalid_argument(fmt::format("Radio frequencies of satellite {} must be zero or positive", id));
        }
    }
    if (alerts.leadTime < std::chrono::minutes::zero()) {
        throw std::invalid_argument("Alert lead time cannot be negative");
    }
    if (staleElementAge <= std::chrono::days::zero()) {
        throw std::invalid_argument("Stale element age must be positive");
    }
}

RadioSettings TrackingSettings::radioFor(int catalogNumber) const {
    RadioSettings settings = radio;
    auto it = frequencies.find(catalogNumber);
    if (it != frequencies.end()) {
        settings.downlinkFrequencyInMHz = it->second.downlinkFrequencyInMHz;
        settings.uplinkFrequencyInMHz = it->second.uplinkFrequencyInMHz;
    }
    return settings;
}

TrackingContext::TrackingContext(std::unique_ptr<PropagationModel> model, ObserverLocation observer, TrackingSettings settings)
    : model_(std::move(model)), observer_(std::move(observer)), settings_(std::move(settings)) {
    if (!model_) {
        throw std::invalid_argument("A propagation model is required");
    }
    settings_.validate();
}

void TrackingContext::track(OrbitalElements elements) {
    int id = elements.getCatalogNumber();
    debug("Tracking {} ({})", elements.getName(), id);
    satellites_.insert_or_assign(id, std::move(elements));
    predictions_.erase(id);
    stale_ = true;
}

bool TrackingContext::untrack(int catalogNumber) {
    predictions_.erase(catalogNumber);
    return satellites_.erase(catalogNumber) > 0;
}

void TrackingContext::updateSettings(TrackingSettings settings) {
    settings.validate();
    if (!(settings.prediction == settings_.prediction)) {
        stale_ = true;
    }
    settings_ = std::move(settings);
}

void TrackingContext::updateObserver(ObserverLocation observer) {
    observer_ = std::move(observer);
    stale_ = true;
}

SatelliteStatus TrackingContext::evaluate(const OrbitalElements &elements, Instant now) const {
    SatelliteStatus status{
        .catalogNumber = elements.getCatalogNumber(),
        .name = elements.getName()
    };

    try {
        auto state = model_->propagate(elements, now);
        auto fixed = inertialToEarthFixed(state);
        auto lookAngle = toTopocentric(observer_, fixed.positionInKilometers, fixed.velocityInKilometersPerSecond);

        status.subSatellitePoint = earthFixedToGeodetic(fixed.positionInKilometers);
        status.speedInKilometersPerSecond = state.velocityInKilometersPerSecond.magnitude();
        status.visible = lookAngle.elevationInDegrees >= settings_.prediction.minElevationInDegrees;
        if (settings_.radioEnabled) {
            status.window = evaluateLink(lookAngle, settings_.radioFor(elements.getCatalogNumber()));
        }
        status.state = state;
        status.lookAngle = lookAngle;
    } catch (const PropagationError &e) {
        debug("No data for {} ({}): {}", elements.getName(), elements.getCatalogNumber(), e.what());
        status.subSatellitePoint.reset();
        status.window.reset();
        status.error = e.what();
    } catch (const TransformError &e) {
        debug("No data for {} ({}): {}", elements.getName(), elements.getCatalogNumber(), e.what());
        status.subSatellitePoint.reset();
        status.window.reset();
        status.error = e.what();
    }

    return status;
}

std::vector<SatelliteStatus> TrackingContext::snapshot(Instant now) const {
    std::vector<SatelliteStatus> statuses;
    statuses.reserve(satellites_.size());
    for (const auto &[id, elements] : satellites_) {
        statuses.push_back(evaluate(elements, now));
    }
    return statuses;
}

SatelliteStatus TrackingContext::status(int catalogNumber, Instant now) const {
    auto it = satellites_.find(catalogNumber);
    if (it == satellites_.end()) {
        throw std::out_of_range("Satellite " + std::to_string(catalogNumber) + " is not tracked");
    }
    return evaluate(it->second, now);
}

bool TrackingContext::needsRefresh(Instant now) const {
    return stale_ || now >= refreshAfter_;
}

bool TrackingContext::refreshPasses(Instant now, std::stop_token stop) {
    using namespace std::chrono;

    if (!needsRefresh(now)) {
        return false;
    }

    std::vector<OrbitalElements> batch;
    batch.reserve(satellites_.size());
    for (const auto &[id, elements] : satellites_) {
        auto age = elements.ageAt(now);
        if (age > settings_.staleElementAge) {
            warn("Elements for {} ({}) are {:.0f} days old; predictions may be inaccurate",
                 elements.getName(), id, age.count());
        }
        batch.push_back(elements);
    }

    PassPredictor predictor(*model_, observer_, settings_.prediction);
    auto results = predictor.predictAll(batch, now, stop);
    if (stop.stop_requested()) {
        info("Pass prediction cancelled; keeping previous results");
        return false;
    }

    // Run again once the earliest cached pass is over, or halfway through the horizon
    auto horizon = duration_cast<system_clock::duration>(
        duration<double, days::period>(settings_.prediction.horizonInDays));
    Instant next = now + horizon / 2;
    for (const auto &[id, result] : results) {
        if (!result.passes.empty()) {
            next = std::min(next, result.passes.front().setTime);
        }
    }

    predictions_ = std::move(results);
    refreshAfter_ = next;
    stale_ = false;
    debug("Predicted passes for {} satellites", predictions_.size());
    return true;
}

std::vector<Pass> TrackingContext::passesFor(int catalogNumber) const {
    auto it = predictions_.find(catalogNumber);
    if (it == predictions_.end()) {
        return {};
    }
    return it->second.passes;
}

std::optional<std::string> TrackingContext::diagnosticFor(int catalogNumber) const {
    auto it = predictions_.find(catalogNumber);
    if (it == predictions_.end()) {
        return std::nullopt;
    }
    return it->second.diagnostic;
}

std::optional<Pass> TrackingContext::nextPass(int catalogNumber, Instant now) const {
    auto it = predictions_.find(catalogNumber);
    if (it == predictions_.end()) {
        return std::nullopt;
    }
    for (const auto &pass : it->second.passes) {
        if (pass.setTime > now) {
            return pass;
        }
    }
    return std::nullopt;
}

std::vector<PassAlert> TrackingContext::alerts(Instant now) const {
    using namespace std::chrono;

    std::vector<PassAlert> result;
    if (!settings_.alerts.enabled) {
        return result;
    }

    for (const auto &[id, prediction] : predictions_) {
        for (const auto &pass : prediction.passes) {
            if (pass.riseTime <= now) {
                continue;
            }
            if (pass.maxAngle.elevationInDegrees >= settings_.alerts.minElevationInDegrees) {
                auto until = pass.riseTime - now;
                if (until <= settings_.alerts.leadTime) {
                    result.push_back(PassAlert{
                        .catalogNumber = id,
                        .name = pass.name,
                        .pass = pass,
                        .timeUntilRise = duration_cast<seconds>(until)
                    });
                }
            }
            // Only the first upcoming pass of each satellite can alert
            break;
        }
    }

    std::sort(result.begin(), result.end(), [](const PassAlert &a, const PassAlert &b) {
        return a.pass.riseTime < b.pass.riseTime;
    });
    return result;
}

}
