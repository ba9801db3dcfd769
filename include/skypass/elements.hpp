/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_ELEMENTS_HPP
#define __SKYPASS_ELEMENTS_HPP

#include <skypass/time.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

namespace skypass {

/**
 * Raw fields of a two-line element set. Angles are in degrees as they
 * appear in the TLE; mean motion is in revolutions per day.
 */
struct ElementData {
    std::string name;
    int catalogNumber = 0;
    char classification = 'U';
    std::string designator;
    Instant epoch;
    double firstDerivativeMeanMotion = 0.0;
    double secondDerivativeMeanMotion = 0.0;
    double bstarDragTerm = 0.0;
    int elementSetNumber = 0;
    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;
    int revolutionNumberAtEpoch = 0;
};

// ============================================================================
// Orbital Elements
// ============================================================================

/**
 * An immutable mean element set describing one satellite's orbit at its epoch.
 *
 * Usage:
 *   auto elements = OrbitalElements::fromTLE(tleString);
 *   auto state = Sgp4Model{}.propagate(elements, now);
 *
 * Instances are read-only after construction and may be shared freely.
 */
class OrbitalElements {
public:
    explicit OrbitalElements(ElementData data);

    /**
     * Parse a two- or three-line element set. A non-empty line before line 1
     * is taken as the satellite name.
     *
     * @throws std::invalid_argument if a line is missing, too short, has a bad
     *         checksum or contains a malformed field
     */
    static OrbitalElements fromTLE(std::string_view tle);

    /**
     * Parse a two-line element set with a separately supplied name.
     */
    static OrbitalElements fromTLE(std::string_view name, std::string_view tle);

    const std::string& getName() const;
    int getCatalogNumber() const;
    char getClassification() const;
    const std::string& getDesignator() const;
    Instant getEpoch() const;
    double getFirstDerivativeMeanMotion() const;
    double getSecondDerivativeMeanMotion() const;
    double getBstarDragTerm() const;
    int getElementSetNumber() const;

    double getInclination() const;                  ///< degrees
    double getRightAscensionOfAscendingNode() const; ///< degrees
    double getEccentricity() const;
    double getArgumentOfPerigee() const;            ///< degrees
    double getMeanAnomaly() const;                  ///< degrees
    double getMeanMotion() const;                   ///< revolutions per day
    int getRevolutionNumberAtEpoch() const;

    /** Orbital period in minutes (1440 / mean motion). */
    double getPeriodInMinutes() const;

    /** Distance of an instant from the element epoch (positive after epoch). */
    std::chrono::duration<double, std::chrono::days::period> ageAt(Instant instant) const;

    /**
     * Standard 3-line TLE representation (name line first) with checksums.
     */
    std::string toTLE() const;

private:
    ElementData data_;
};

// ============================================================================
// TLE Database Functions
// ============================================================================

using ElementDatabase = std::map<int, OrbitalElements>;

/**
 * Load every element set found in a stream into the database, keyed by
 * catalog number. Malformed entries are logged and skipped.
 *
 * @return the number of entries loaded
 */
int loadTLEDatabase(std::istream &s, ElementDatabase &database);

/**
 * Load a TLE file. A missing file is logged and leaves the database untouched.
 *
 * @throws std::runtime_error if the file exists but cannot be opened
 */
int loadTLEDatabase(const std::string &filepath, ElementDatabase &database);

// TLE formatting utilities
int calculateChecksum(std::string_view line);
std::string toTLEExponential(double value);
std::string formatFirstDerivative(double value);

}

#endif
