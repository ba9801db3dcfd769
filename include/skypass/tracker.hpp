/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_TRACKER_HPP
#define __SKYPASS_TRACKER_HPP

#include <skypass/elements.hpp>
#include <skypass/observer.hpp>
#include <skypass/pass_predictor.hpp>
#include <skypass/propagator.hpp>
#include <skypass/radio.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace skypass {

struct AlertSettings {
    bool enabled = true;
    std::chrono::minutes leadTime{15};          ///< Alert when a pass starts within this long
    double minElevationInDegrees = 20.0;        ///< Ignore passes that culminate lower
};

struct TrackingSettings {
    PredictionSettings prediction;
    RadioSettings radio;
    std::map<int, SatelliteFrequencies> frequencies;  ///< Per catalog number
    bool radioEnabled = true;
    AlertSettings alerts;
    std::chrono::days staleElementAge{30};      ///< Warn about elements older than this

    /**
     * Radio settings for one satellite: its own frequencies when it has an
     * entry in `frequencies`, otherwise the ones in `radio`.
     */
    RadioSettings radioFor(int catalogNumber) const;

    /**
     * @throws PredictionError or std::invalid_argument for invalid values
     */
    void validate() const;
};

/**
 * Live state of one tracked satellite. When the satellite could not be
 * propagated, only the identification and `error` are set.
 */
struct SatelliteStatus {
    int catalogNumber;
    std::string name;
    std::optional<StateVector> state;
    std::optional<Geodetic> subSatellitePoint;
    std::optional<LookAngle> lookAngle;
    std::optional<CommunicationWindow> window;  ///< Present when radio evaluation is enabled
    double speedInKilometersPerSecond = 0.0;    ///< Inertial speed
    bool visible = false;                       ///< At or above the pass threshold
    std::optional<std::string> error;

    bool hasData() const { return state.has_value(); }
};

struct PassAlert {
    int catalogNumber;
    std::string name;
    Pass pass;
    std::chrono::seconds timeUntilRise;
};

/**
 * Everything the host loop needs between ticks: tracked satellites, the
 * observer, settings and the most recent pass predictions.
 *
 * The context is not synchronized; it belongs to the thread that drives it.
 */
class TrackingContext {
public:
    /**
     * @throws std::invalid_argument if the model is null
     * @throws PredictionError or std::invalid_argument for invalid settings
     */
    TrackingContext(std::unique_ptr<PropagationModel> model, ObserverLocation observer, TrackingSettings settings);

    /** Add a satellite, replacing any element set with the same catalog number. */
    void track(OrbitalElements elements);

    /** @return false if the satellite was not tracked */
    bool untrack(int catalogNumber);

    const ElementDatabase& getTracked() const { return satellites_; }
    const ObserverLocation& getObserver() const { return observer_; }
    const TrackingSettings& getSettings() const { return settings_; }

    /** Replace the settings; cached passes are recomputed on the next refresh. */
    void updateSettings(TrackingSettings settings);

    void updateObserver(ObserverLocation observer);

    /**
     * Current state of every tracked satellite, ordered by catalog number.
     * Failures are reported per satellite and never abort the snapshot.
     */
    std::vector<SatelliteStatus> snapshot(Instant now) const;

    /**
     * @throws std::out_of_range if the satellite is not tracked
     */
    SatelliteStatus status(int catalogNumber, Instant now) const;

    /** True when cached passes are missing, outdated or were made with other settings. */
    bool needsRefresh(Instant now) const;

    /**
     * Re-run pass prediction if needed.
     *
     * @return true if the cache was replaced; a cancelled run leaves the
     *         previous cache in place and returns false
     */
    bool refreshPasses(Instant now, std::stop_token stop = {});

    /** Cached passes of one satellite (empty if unknown or not yet predicted). */
    std::vector<Pass> passesFor(int catalogNumber) const;

    std::optional<std::string> diagnosticFor(int catalogNumber) const;

    /** The pass in progress at `now`, or else the next one to rise. */
    std::optional<Pass> nextPass(int catalogNumber, Instant now) const;

    /** Upcoming passes that rise within the alert lead time. */
    std::vector<PassAlert> alerts(Instant now) const;

private:
    SatelliteStatus evaluate(const OrbitalElements &elements, Instant now) const;

    std::unique_ptr<PropagationModel> model_;
    ObserverLocation observer_;
    TrackingSettings settings_;
    ElementDatabase satellites_;

    std::map<int, PredictionResult> predictions_;
    bool stale_ = true;
    Instant refreshAfter_;
};

}

#endif
