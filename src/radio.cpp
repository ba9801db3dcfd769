/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/radio.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace skypass {

std::ostream& operator<<(std::ostream &os, const SignalStrength &strength) {
    switch (strength) {
        case SignalStrength::Excellent:
            os << "Excellent";
            break;
        case SignalStrength::Good:
            os << "Good";
            break;
        case SignalStrength::Fair:
            os << "Fair";
            break;
        case SignalStrength::Poor:
            os << "Poor";
            break;
        case SignalStrength::NoSignal:
            os << "No Signal";
            break;
    }
    return os;
}

void RadioSettings::validate() const {
    if (!(downlinkFrequencyInMHz >= 0.0) || !(uplinkFrequencyInMHz >= 0.0)) {
        throw std::invalid_argument("Radio frequencies must be zero or positive");
    }
    if (!(minElevationInDegrees >= -90.0 && minElevationInDegrees <= 90.0)) {
        throw std::invalid_argument(fmt::format("Communication window elevation out of range: {}", minElevationInDegrees));
    }
    if (!(reference.rangeInKilometers > 0.0) || !(reference.quality > 0.0)) {
        throw std::invalid_argument("Signal reference range and quality must be positive");
    }
}

double dopplerShift(double baseFrequency, double rangeRateInKilometersPerSecond, double speedOfLight) {
    return -baseFrequency * rangeRateInKilometersPerSecond / speedOfLight;
}

double uplinkCompensation(double baseFrequency, double rangeRateInKilometersPerSecond, double speedOfLight) {
    return baseFrequency * rangeRateInKilometersPerSecond / speedOfLight;
}

bool communicationWindow(const LookAngle &lookAngle, double minElevationInDegrees) {
    return lookAngle.elevationInDegrees >= minElevationInDegrees;
}

double signalQuality(double rangeInKilometers, const SignalReference &reference) {
    if (!(rangeInKilometers > 0.0)) {
        return 1.0;
    }
    double ratio = reference.rangeInKilometers / rangeInKilometers;
    return std::clamp(reference.quality * ratio * ratio, 0.0, 1.0);
}

SignalStrength classifySignal(const LookAngle &lookAngle) {
    double elevation = lookAngle.elevationInDegrees;
    double range = lookAngle.rangeInKilometers;

    if (elevation >= 45.0 && range < 2000.0) {
        return SignalStrength::Excellent;
    }
    if (elevation >= 30.0 && range < 2500.0) {
        return SignalStrength::Good;
    }
    if (elevation >= 15.0 && range < 3000.0) {
        return SignalStrength::Fair;
    }
    if (elevation >= 5.0) {
        return SignalStrength::Poor;
    }
    return SignalStrength::NoSignal;
}

std::optional<std::string> recommendedMode(const LookAngle &lookAngle, double minElevationInDegrees) {
    double elevation = lookAngle.elevationInDegrees;
    if (elevation >= 30.0) {
        return "FM/SSB";
    }
    if (elevation >= 15.0) {
        return "SSB";
    }
    if (elevation >= minElevationInDegrees) {
        return "SSB (difficult)";
    }
    return std::nullopt;
}

CommunicationWindow evaluateLink(const LookAngle &lookAngle, const RadioSettings &settings) {
    double rangeRate = lookAngle.rangeRateInKilometersPerSecond;
    double downlinkShift = dopplerShift(settings.downlinkFrequencyInMHz * 1e6, rangeRate);
    double uplinkShift = uplinkCompensation(settings.uplinkFrequencyInMHz * 1e6, rangeRate);
    bool open = communicationWindow(lookAngle, settings.minElevationInDegrees);

    std::string reason = open
        ? fmt::format("Elevation {:.1f}° at {:.0f} km", lookAngle.elevationInDegrees, lookAngle.rangeInKilometers)
        : fmt::format("Elevation {:.1f}° is below the {:.1f}° minimum",
                      lookAngle.elevationInDegrees, settings.minElevationInDegrees);

    return CommunicationWindow{
        .open = open,
        .downlinkShiftInHz = downlinkShift,
        .downlinkObservedInMHz = settings.downlinkFrequencyInMHz + downlinkShift / 1e6,
        .uplinkShiftInHz = uplinkShift,
        .uplinkCorrectedInMHz = settings.uplinkFrequencyInMHz + uplinkShift / 1e6,
        .signalQuality = open ? signalQuality(lookAngle.rangeInKilometers, settings.reference) : 0.0,
        .strength = open ? classifySignal(lookAngle) : SignalStrength::NoSignal,
        .recommendedMode = open ? recommendedMode(lookAngle, settings.minElevationInDegrees) : std::nullopt,
        .reason = std::move(reason)
    };
}

}
