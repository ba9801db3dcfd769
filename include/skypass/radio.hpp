/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_RADIO_HPP
#define __SKYPASS_RADIO_HPP

#include <skypass/transform.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace skypass {

constexpr double SPEED_OF_LIGHT_KM_PER_SEC = 299792.458;

/**
 * Qualitative link estimate from elevation and slant range.
 */
enum class SignalStrength {
    Excellent,  ///< >= 45° and closer than 2000 km
    Good,       ///< >= 30° and closer than 2500 km
    Fair,       ///< >= 15° and closer than 3000 km
    Poor,       ///< >= 5°
    NoSignal
};

std::ostream& operator<<(std::ostream &os, const SignalStrength &strength);

/**
 * Anchor for the signal quality heuristic: `quality` is reported at
 * `rangeInKilometers`.
 */
struct SignalReference {
    double rangeInKilometers = 1000.0;
    double quality = 1.0;
};

struct RadioSettings {
    double downlinkFrequencyInMHz = 0.0;    ///< 0 when the satellite has no downlink
    double uplinkFrequencyInMHz = 0.0;      ///< 0 when the satellite has no uplink
    double minElevationInDegrees = 10.0;    ///< Communication-window threshold
    SignalReference reference;

    /**
     * @throws std::invalid_argument for negative frequencies, a threshold
     *         outside [-90, 90] or a non-positive reference
     */
    void validate() const;
};

/**
 * Transmitter frequencies of one satellite, overriding the ones in
 * RadioSettings. 0 means the satellite has no such link.
 */
struct SatelliteFrequencies {
    double downlinkFrequencyInMHz = 0.0;
    double uplinkFrequencyInMHz = 0.0;

    bool operator==(const SatelliteFrequencies&) const = default;
};

/**
 * Radio view of one satellite at one instant.
 */
struct CommunicationWindow {
    bool open;                              ///< Elevation at or above the threshold
    double downlinkShiftInHz;               ///< Observed minus transmitted downlink frequency
    double downlinkObservedInMHz;           ///< Frequency to tune the receiver to
    double uplinkShiftInHz;                 ///< Pre-compensation applied to the uplink
    double uplinkCorrectedInMHz;            ///< Frequency to transmit on
    double signalQuality;                   ///< Heuristic in [0, 1]
    SignalStrength strength;
    std::optional<std::string> recommendedMode;
    std::string reason;
};

/**
 * Non-relativistic Doppler shift: `-f * rangeRate / c`.
 *
 * Range-rate is negative while the satellite approaches, which gives a
 * positive shift (received frequency above transmitted).
 *
 * @param baseFrequency transmitted frequency, any unit; the result has the same unit
 * @param rangeRateInKilometersPerSecond signed rate of change of range
 * @param speedOfLight in km/s
 */
double dopplerShift(double baseFrequency, double rangeRateInKilometersPerSecond,
                    double speedOfLight = SPEED_OF_LIGHT_KM_PER_SEC);

/**
 * Offset to add to an uplink frequency so that it arrives at the satellite
 * on its nominal value. Opposite in sign to the downlink shift.
 */
double uplinkCompensation(double baseFrequency, double rangeRateInKilometersPerSecond,
                          double speedOfLight = SPEED_OF_LIGHT_KM_PER_SEC);

/**
 * True iff the elevation is at or above the threshold.
 */
bool communicationWindow(const LookAngle &lookAngle, double minElevationInDegrees);

/**
 * Inverse-square falloff from the reference pair, clamped to [0, 1].
 *
 * This is an approximation for ranking passes. It ignores antenna gains,
 * atmospheric loss and transmitter power and is not a calibrated link budget.
 */
double signalQuality(double rangeInKilometers, const SignalReference &reference = {});

SignalStrength classifySignal(const LookAngle &lookAngle);

/**
 * Suggested operating mode, or nothing below the window threshold.
 */
std::optional<std::string> recommendedMode(const LookAngle &lookAngle, double minElevationInDegrees);

/**
 * Full radio evaluation for a look angle.
 */
CommunicationWindow evaluateLink(const LookAngle &lookAngle, const RadioSettings &settings);

}

#endif
