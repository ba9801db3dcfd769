/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skypass/pass_predictor.hpp>
#include <skypass/sgp4.hpp>

#include "profile_model.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>
#include <stop_token>

namespace skypass {
namespace {

using namespace std::chrono;
using test_support::ProfileModel;
using test_support::sinusoid;

// ISS TLE data from Celestrak (real example)
constexpr const char* ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

constexpr const char* NOAA_19_TLE =
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

// Vanguard 1, the first case of the published SGP4 verification set
constexpr const char* VANGUARD_TLE =
    "1 00005U 58002B   00179.78495062  .00000023  00000-0  28098-4 0  4753\n"
    "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667";

// Threshold crossings of the default sinusoid, 40 sin(x) - 10 = 0
constexpr double FIRST_RISE = 217.16;
constexpr double FIRST_SET = 2482.84;

class PassPredictorTest : public ::testing::Test {
protected:
    ObserverLocation observer = ObserverLocation::fromDegrees("Philadelphia", 39.95, -75.17, 12.0);
    Instant base = sys_days{year{2025}/December/1};
    OrbitalElements iss = OrbitalElements::fromTLE(ISS_TLE);
    OrbitalElements noaa = OrbitalElements::fromTLE(NOAA_19_TLE);
    PredictionSettings settings;

    double offset(Instant instant) const {
        return secondsBetween(base, instant);
    }

    PredictionError::Kind rejectionKind(const PredictionSettings &s) {
        ProfileModel model(observer, base, sinusoid);
        try {
            PassPredictor predictor(model, observer, s);
        } catch (const PredictionError &e) {
            return e.kind();
        }
        ADD_FAILURE() << "Expected a PredictionError";
        return PredictionError::Kind::NonConvergence;
    }
};

TEST_F(PassPredictorTest, FindsEveryCycleOfTheProfile) {
    ProfileModel model(observer, base, sinusoid);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    // 16 full 90 minute cycles in a day
    ASSERT_EQ(result.passes.size(), 16u);
    EXPECT_FALSE(result.diagnostic.has_value());
    EXPECT_EQ(result.failedSamples, 0);
    EXPECT_EQ(result.samples, 1441);
    EXPECT_FALSE(result.cancelled);

    const auto &first = result.passes.front();
    EXPECT_EQ(first.catalogNumber, 25544);
    EXPECT_EQ(first.name, "ISS (ZARYA)");
    EXPECT_NEAR(offset(first.riseTime), FIRST_RISE, 0.2);
    EXPECT_NEAR(offset(first.setTime), FIRST_SET, 0.2);
    EXPECT_NEAR(offset(first.maxElevationTime), 1350.0, 1.0);
    EXPECT_NEAR(first.maxAngle.elevationInDegrees, 30.0, 1e-4);
    EXPECT_GE(first.riseAngle.elevationInDegrees, 0.0);
    EXPECT_NEAR(first.riseAngle.elevationInDegrees, 0.0, 0.01);
    EXPECT_NEAR(first.setAngle.elevationInDegrees, 0.0, 0.01);
    EXPECT_NEAR(first.maxAngle.rangeInKilometers, ProfileModel::RANGE_IN_KILOMETERS, 1e-6);
}

TEST_F(PassPredictorTest, PassesAreOrderedAndWellFormed) {
    ProfileModel model(observer, base, sinusoid);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    ASSERT_FALSE(result.passes.empty());

    for (size_t i = 0; i < result.passes.size(); i++) {
        const auto &pass = result.passes[i];
        EXPECT_LT(pass.riseTime, pass.maxElevationTime);
        EXPECT_LT(pass.maxElevationTime, pass.setTime);
        EXPECT_GE(pass.maxAngle.elevationInDegrees, pass.riseAngle.elevationInDegrees);
        EXPECT_GE(pass.maxAngle.elevationInDegrees, pass.setAngle.elevationInDegrees);
        EXPECT_NEAR(duration<double>(pass.duration()).count(), FIRST_SET - FIRST_RISE, 0.4);
        if (i > 0) {
            EXPECT_LT(result.passes[i - 1].setTime, pass.riseTime);
            EXPECT_NEAR(offset(pass.riseTime) - offset(result.passes[i - 1].riseTime), 5400.0, 0.4);
        }
    }
}

TEST_F(PassPredictorTest, StopsAtMaximumPassCount) {
    settings.maxPasses = 3;
    ProfileModel model(observer, base, sinusoid);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    EXPECT_EQ(result.passes.size(), 3u);
    // The scan ends with the third set instead of running the whole day
    EXPECT_LT(result.samples, 300);
}

TEST_F(PassPredictorTest, ThresholdAppliesToRiseAndSet) {
    settings.minElevationInDegrees = 20.0;
    ProfileModel model(observer, base, sinusoid);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    ASSERT_EQ(result.passes.size(), 16u);
    for (const auto &pass : result.passes) {
        EXPECT_NEAR(pass.riseAngle.elevationInDegrees, 20.0, 0.01);
        EXPECT_NEAR(pass.setAngle.elevationInDegrees, 20.0, 0.01);
        EXPECT_GE(pass.riseAngle.elevationInDegrees, 20.0);
    }
}

TEST_F(PassPredictorTest, ThresholdAboveCulminationGivesNoPasses) {
    settings.minElevationInDegrees = 35.0;
    ProfileModel model(observer, base, sinusoid);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    EXPECT_TRUE(result.passes.empty());
    // Nothing went wrong; the satellite simply never gets that high
    EXPECT_FALSE(result.diagnostic.has_value());
}

TEST_F(PassPredictorTest, PeakJustReachingTheThreshold) {
    // Single sharp peak of 10 degrees at t = 900 s
    auto peak = [](double t) { return std::max(-20.0, 10.0 - std::abs(t - 900.0) * 0.05); };
    ProfileModel model(observer, base, peak);

    settings.minElevationInDegrees = 9.99;
    auto result = PassPredictor(model, observer, settings).predict(iss, base);
    ASSERT_EQ(result.passes.size(), 1u);
    EXPECT_NEAR(result.passes[0].maxAngle.elevationInDegrees, 10.0, 0.01);
    EXPECT_NEAR(offset(result.passes[0].maxElevationTime), 900.0, 0.5);

    settings.minElevationInDegrees = 10.001;
    result = PassPredictor(model, observer, settings).predict(iss, base);
    EXPECT_TRUE(result.passes.empty());
}

TEST_F(PassPredictorTest, PassesCutByTheHorizonAreDropped) {
    // Starts and ends at culmination, so the first and last passes are partial
    auto shifted = [](double t) { return 40.0 * std::cos(2.0 * std::numbers::pi * t / 5400.0) - 10.0; };
    ProfileModel model(observer, base, shifted);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    ASSERT_EQ(result.passes.size(), 15u);
    EXPECT_NEAR(offset(result.passes.front().riseTime), 4267.2, 0.2);
    EXPECT_LT(result.passes.back().setTime, base + days{1});
    EXPECT_FALSE(result.diagnostic.has_value());
}

TEST_F(PassPredictorTest, GapBelowTheHorizonIsNotATransition) {
    auto gap = [](int, double t) { return t >= 3000.0 && t <= 5000.0; };
    ProfileModel model(observer, base, sinusoid, gap);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    EXPECT_EQ(result.passes.size(), 16u);
    // Samples 3000, 3060, ..., 4980
    EXPECT_EQ(result.failedSamples, 34);
    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_NE(result.diagnostic->find("scripted failure"), std::string::npos);
}

TEST_F(PassPredictorTest, PassWithUnknownBoundaryIsDropped) {
    // The eighth pass sets at 40282.8 s, inside the gap
    auto gap = [](int, double t) { return t >= 40000.0 && t <= 41000.0; };
    ProfileModel model(observer, base, sinusoid, gap);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    EXPECT_EQ(result.passes.size(), 15u);
    EXPECT_EQ(result.failedSamples, 17);
    EXPECT_TRUE(result.diagnostic.has_value());

    for (const auto &pass : result.passes) {
        EXPECT_FALSE(offset(pass.riseTime) < 41000.0 && offset(pass.setTime) > 40000.0);
    }
}

TEST_F(PassPredictorTest, GapAcrossTwoPassesDoesNotMergeThem) {
    // Two passes split by a dip to -5 degrees between 3000 s and 3300 s
    auto twoPasses = [](double t) {
        if (t >= 600.0 && t <= 3000.0) {
            return 30.0 * std::sin(std::numbers::pi * (t - 600.0) / 2400.0);
        }
        if (t >= 3300.0 && t <= 5700.0) {
            return 30.0 * std::sin(std::numbers::pi * (t - 3300.0) / 2400.0);
        }
        return -5.0;
    };
    settings.horizonInDays = 0.1;

    ProfileModel complete(observer, base, twoPasses);
    auto result = PassPredictor(complete, observer, settings).predict(iss, base);
    ASSERT_EQ(result.passes.size(), 2u);
    EXPECT_NEAR(offset(result.passes[0].setTime), 3000.0, 0.2);
    EXPECT_NEAR(offset(result.passes[1].riseTime), 3300.0, 0.2);

    // No data from just before the first set until just after the second rise
    auto gap = [](int, double t) { return t >= 2950.0 && t <= 3350.0; };
    ProfileModel gapped(observer, base, twoPasses, gap);
    result = PassPredictor(gapped, observer, settings).predict(iss, base);

    // Samples 3000, 3060, ..., 3300
    EXPECT_EQ(result.failedSamples, 6);
    for (const auto &pass : result.passes) {
        EXPECT_FALSE(offset(pass.riseTime) < 3000.0 && offset(pass.setTime) > 3300.0)
            << "pass from " << offset(pass.riseTime) << " s to " << offset(pass.setTime) << " s spans the dip";
    }
    EXPECT_TRUE(result.passes.empty());
}

TEST_F(PassPredictorTest, CulminationNextToTheRiseSample) {
    // Crosses the horizon 50 ms before the 600 s sample and peaks at 3.5
    // degrees half a second later, then a lower second hump peaks at 1800 s.
    // The search over the whole pass settles on the second hump.
    auto earlyPeak = [](double t) {
        if (t < 600.0 - 0.05 - 5.0 / 60.0) return -5.0;
        if (t <= 600.0) return 60.0 * (t - 599.95);
        if (t <= 600.5) return 3.0 + (t - 600.0);
        if (t <= 700.0) return 3.5 - 2.5 * (t - 600.5) / 99.5;
        if (t <= 1800.0) return 1.0 + (t - 700.0) / 1100.0;
        if (t <= 3030.0) return 2.0 - 2.0 * (t - 1800.0) / 1230.0;
        return -5.0;
    };
    settings.horizonInDays = 0.05;
    ProfileModel model(observer, base, earlyPeak);

    auto result = PassPredictor(model, observer, settings).predict(iss, base);
    ASSERT_EQ(result.passes.size(), 1u);
    const auto &pass = result.passes.front();
    EXPECT_NEAR(offset(pass.riseTime), 600.0, 0.1);
    EXPECT_NEAR(offset(pass.setTime), 3030.0, 0.2);
    EXPECT_NEAR(offset(pass.maxElevationTime), 600.5, 0.1);
    EXPECT_NEAR(pass.maxAngle.elevationInDegrees, 3.5, 0.01);
    EXPECT_LT(pass.riseTime, pass.maxElevationTime);
}

TEST_F(PassPredictorTest, MostlyFailingSamplesGiveNoPasses) {
    auto failing = [](int, double t) { return t > 10000.0; };
    ProfileModel model(observer, base, sinusoid, failing);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base);
    EXPECT_TRUE(result.passes.empty());
    EXPECT_GT(result.failedSamples * 2, result.samples);
    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_NE(result.diagnostic->find("no passes reported"), std::string::npos);
}

TEST_F(PassPredictorTest, CancelledBeforeStarting) {
    ProfileModel model(observer, base, sinusoid);
    PassPredictor predictor(model, observer, settings);

    std::stop_source source;
    source.request_stop();
    auto result = predictor.predict(iss, base, source.get_token());

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.passes.empty());
    EXPECT_EQ(result.samples, 0);
    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_NE(result.diagnostic->find("cancelled"), std::string::npos);
}

TEST_F(PassPredictorTest, CancelledMidwayKeepsCompletedPasses) {
    std::stop_source source;
    ProfileModel model(observer, base, sinusoid);
    model.stopAfter(30000.0, &source);
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, base, source.get_token());
    EXPECT_TRUE(result.cancelled);
    // Sets at 2482.8 + 5400k for k = 0..5 all fall before 30000 s
    EXPECT_EQ(result.passes.size(), 6u);
    EXPECT_LT(result.samples, 1441);
}

TEST_F(PassPredictorTest, RejectsInvalidSettings) {
    using Kind = PredictionError::Kind;

    PredictionSettings s;
    s.step = seconds{0};
    EXPECT_EQ(rejectionKind(s), Kind::InvalidConfiguration);

    s = PredictionSettings{};
    s.horizonInDays = 0.0;
    EXPECT_EQ(rejectionKind(s), Kind::InvalidConfiguration);

    s = PredictionSettings{};
    s.horizonInDays = 0.01;
    s.step = hours{1};
    EXPECT_EQ(rejectionKind(s), Kind::InvalidConfiguration);

    s = PredictionSettings{};
    s.minElevationInDegrees = 95.0;
    EXPECT_EQ(rejectionKind(s), Kind::InvalidConfiguration);

    s = PredictionSettings{};
    s.maxPasses = -1;
    EXPECT_EQ(rejectionKind(s), Kind::InvalidConfiguration);

    s = PredictionSettings{};
    s.refineTolerance = milliseconds{0};
    EXPECT_EQ(rejectionKind(s), Kind::InvalidConfiguration);
}

TEST_F(PassPredictorTest, BatchIsolatesFailingSatellites) {
    auto noaaFails = [](int catalogNumber, double) { return catalogNumber == 33591; };
    ProfileModel model(observer, base, sinusoid, noaaFails);
    PassPredictor predictor(model, observer, settings);

    auto results = predictor.predictAll({iss, noaa}, base);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results.at(25544).passes.size(), 16u);
    EXPECT_FALSE(results.at(25544).diagnostic.has_value());
    EXPECT_TRUE(results.at(33591).passes.empty());
    EXPECT_TRUE(results.at(33591).diagnostic.has_value());
}

TEST_F(PassPredictorTest, RealOrbitOverPhiladelphia) {
    Sgp4Model model;
    PassPredictor predictor(model, observer, settings);

    auto result = predictor.predict(iss, iss.getEpoch());
    EXPECT_EQ(result.failedSamples, 0);
    EXPECT_FALSE(result.diagnostic.has_value());
    // A 51.6 degree orbit passes over 40N several times a day
    ASSERT_GE(result.passes.size(), 2u);
    EXPECT_LE(result.passes.size(), 10u);

    for (const auto &pass : result.passes) {
        EXPECT_GT(pass.duration(), seconds{0});
        EXPECT_LT(pass.duration(), minutes{15});
        EXPECT_GT(pass.maxAngle.elevationInDegrees, 0.0);
        EXPECT_LE(pass.maxAngle.elevationInDegrees, 90.0);

        // The refined rise sits on the crossing
        EXPECT_LT(lookAngleAt(model, iss, observer, pass.riseTime - seconds{1}).elevationInDegrees, 0.0);
        EXPECT_GT(lookAngleAt(model, iss, observer, pass.riseTime + seconds{1}).elevationInDegrees, 0.0);
        EXPECT_LT(lookAngleAt(model, iss, observer, pass.setTime + seconds{1}).elevationInDegrees, 0.0);
    }
}

TEST_F(PassPredictorTest, LookAngleFromSantiago) {
    // Six hours after epoch Vanguard 1 is over the Pacific off Chile. The
    // expected values come from the published TEME state rotated by IAU-82
    // GMST and resolved in the observer's East-North-Up frame.
    Sgp4Model model;
    auto vanguard = OrbitalElements::fromTLE(VANGUARD_TLE);
    auto santiago = ObserverLocation::fromDegrees("Santiago", -33.45, -70.67, 570.0);

    auto angle = lookAngleAt(model, vanguard, santiago, vanguard.getEpoch() + minutes{360});
    EXPECT_NEAR(angle.azimuthInDegrees, 313.910, 0.1);
    EXPECT_NEAR(angle.elevationInDegrees, 47.347, 0.1);
    EXPECT_NEAR(angle.rangeInKilometers, 3014.072, 1.0);
    // Approaching
    EXPECT_NEAR(angle.rangeRateInKilometersPerSecond, -3.806, 0.01);
}

} // namespace
} // namespace skypass
