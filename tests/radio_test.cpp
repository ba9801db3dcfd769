/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skypass/radio.hpp>

#include <sstream>
#include <stdexcept>

namespace skypass {
namespace {

LookAngle lookAt(double elevation, double range, double rangeRate = 0.0) {
    return {
        .azimuthInDegrees = 180.0,
        .elevationInDegrees = elevation,
        .rangeInKilometers = range,
        .rangeRateInKilometersPerSecond = rangeRate
    };
}

TEST(DopplerTest, ApproachingRaisesFrequency) {
    // -1 km/s at 100 MHz: +100e6 / 299792.458 Hz
    double shift = dopplerShift(100e6, -1.0);
    EXPECT_GT(shift, 0.0);
    EXPECT_NEAR(shift, 333.564095, 1e-6);
}

TEST(DopplerTest, RecedingLowersFrequency) {
    EXPECT_LT(dopplerShift(100e6, 1.0), 0.0);
    EXPECT_NEAR(dopplerShift(100e6, 1.0), -dopplerShift(100e6, -1.0), 1e-12);
}

TEST(DopplerTest, LinearInRangeRate) {
    double base = dopplerShift(437.8e6, 1.0);
    EXPECT_NEAR(dopplerShift(437.8e6, 2.5), 2.5 * base, 1e-9);
    EXPECT_NEAR(dopplerShift(437.8e6, -7.2), -7.2 * base, 1e-9);
    EXPECT_DOUBLE_EQ(dopplerShift(437.8e6, 0.0), 0.0);
}

TEST(DopplerTest, CustomSpeedOfLight) {
    EXPECT_DOUBLE_EQ(dopplerShift(1000.0, -1.0, 10.0), 100.0);
}

TEST(DopplerTest, UplinkCompensationOpposesDownlinkShift) {
    EXPECT_DOUBLE_EQ(uplinkCompensation(145.9e6, -3.0), -dopplerShift(145.9e6, -3.0));
    // Transmit lower while the satellite approaches
    EXPECT_LT(uplinkCompensation(145.9e6, -3.0), 0.0);
}

TEST(WindowTest, ThresholdIsInclusive) {
    EXPECT_TRUE(communicationWindow(lookAt(10.0, 1500.0), 10.0));
    EXPECT_TRUE(communicationWindow(lookAt(10.000001, 1500.0), 10.0));
    EXPECT_FALSE(communicationWindow(lookAt(9.999999, 1500.0), 10.0));
}

TEST(SignalQualityTest, ReferencePoint) {
    EXPECT_DOUBLE_EQ(signalQuality(1000.0), 1.0);
    EXPECT_DOUBLE_EQ(signalQuality(2000.0), 0.25);
    EXPECT_DOUBLE_EQ(signalQuality(500.0, {.rangeInKilometers = 1000.0, .quality = 0.2}), 0.8);
}

TEST(SignalQualityTest, ClampedToUnitInterval) {
    EXPECT_DOUBLE_EQ(signalQuality(10.0), 1.0);
    EXPECT_DOUBLE_EQ(signalQuality(0.0), 1.0);
    EXPECT_GE(signalQuality(1e9), 0.0);
}

TEST(SignalQualityTest, DecreasesWithRange) {
    double previous = signalQuality(1000.0);
    for (double range = 1100.0; range < 5000.0; range += 100.0) {
        double q = signalQuality(range);
        EXPECT_LT(q, previous) << "at " << range << " km";
        previous = q;
    }
}

TEST(SignalStrengthTest, Classification) {
    EXPECT_EQ(classifySignal(lookAt(60.0, 600.0)), SignalStrength::Excellent);
    EXPECT_EQ(classifySignal(lookAt(60.0, 2100.0)), SignalStrength::Good);
    EXPECT_EQ(classifySignal(lookAt(35.0, 2400.0)), SignalStrength::Good);
    EXPECT_EQ(classifySignal(lookAt(20.0, 2900.0)), SignalStrength::Fair);
    EXPECT_EQ(classifySignal(lookAt(20.0, 3100.0)), SignalStrength::Poor);
    EXPECT_EQ(classifySignal(lookAt(5.0, 3100.0)), SignalStrength::Poor);
    EXPECT_EQ(classifySignal(lookAt(4.9, 3100.0)), SignalStrength::NoSignal);
}

TEST(SignalStrengthTest, StreamOutput) {
    std::ostringstream os;
    os << SignalStrength::NoSignal << "/" << SignalStrength::Fair;
    EXPECT_EQ(os.str(), "No Signal/Fair");
}

TEST(ModeTest, RecommendationByElevation) {
    EXPECT_EQ(recommendedMode(lookAt(45.0, 800.0), 10.0), "FM/SSB");
    EXPECT_EQ(recommendedMode(lookAt(20.0, 1500.0), 10.0), "SSB");
    EXPECT_EQ(recommendedMode(lookAt(12.0, 2000.0), 10.0), "SSB (difficult)");
    EXPECT_FALSE(recommendedMode(lookAt(8.0, 2200.0), 10.0).has_value());
}

TEST(LinkTest, OpenWindow) {
    RadioSettings settings;
    settings.downlinkFrequencyInMHz = 437.8;
    settings.uplinkFrequencyInMHz = 145.9;

    auto window = evaluateLink(lookAt(40.0, 900.0, -5.0), settings);
    EXPECT_TRUE(window.open);
    EXPECT_GT(window.downlinkShiftInHz, 0.0);
    EXPECT_NEAR(window.downlinkShiftInHz, dopplerShift(437.8e6, -5.0), 1e-9);
    EXPECT_NEAR(window.downlinkObservedInMHz, 437.8 + window.downlinkShiftInHz / 1e6, 1e-12);
    EXPECT_LT(window.uplinkShiftInHz, 0.0);
    EXPECT_NEAR(window.uplinkCorrectedInMHz, 145.9 + window.uplinkShiftInHz / 1e6, 1e-12);
    EXPECT_EQ(window.strength, SignalStrength::Good);
    EXPECT_DOUBLE_EQ(window.signalQuality, 1.0);
    EXPECT_EQ(window.recommendedMode, "FM/SSB");
    EXPECT_FALSE(window.reason.empty());
}

TEST(LinkTest, ClosedWindowStillReportsDoppler) {
    RadioSettings settings;
    settings.downlinkFrequencyInMHz = 437.8;

    auto window = evaluateLink(lookAt(3.0, 2800.0, 6.0), settings);
    EXPECT_FALSE(window.open);
    EXPECT_LT(window.downlinkShiftInHz, 0.0);
    EXPECT_EQ(window.strength, SignalStrength::NoSignal);
    EXPECT_DOUBLE_EQ(window.signalQuality, 0.0);
    EXPECT_FALSE(window.recommendedMode.has_value());
    EXPECT_NE(window.reason.find("below"), std::string::npos);
}

TEST(LinkTest, NoFrequencyMeansNoShift) {
    RadioSettings settings;
    auto window = evaluateLink(lookAt(50.0, 700.0, -6.5), settings);
    EXPECT_DOUBLE_EQ(window.downlinkShiftInHz, 0.0);
    EXPECT_DOUBLE_EQ(window.uplinkShiftInHz, 0.0);
}

TEST(RadioSettingsTest, Validation) {
    RadioSettings settings;
    EXPECT_NO_THROW(settings.validate());

    settings.downlinkFrequencyInMHz = -1.0;
    EXPECT_THROW(settings.validate(), std::invalid_argument);

    settings = RadioSettings{};
    settings.minElevationInDegrees = 95.0;
    EXPECT_THROW(settings.validate(), std::invalid_argument);

    settings = RadioSettings{};
    settings.reference.rangeInKilometers = 0.0;
    EXPECT_THROW(settings.validate(), std::invalid_argument);
}

} // namespace
} // namespace skypass
