/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_CONFIG_HPP
#define __SKYPASS_CONFIG_HPP

#include <skypass/observer.hpp>
#include <skypass/time.hpp>
#include <skypass/tracker.hpp>

#include <map>
#include <set>
#include <string>
#include <type_traits>

namespace skypass {

/**
 * User settings gathered from the command line and the config file.
 *
 * Setters clamp values that have a natural range; validate() rejects the
 * rest and is called once before any computation starts.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    const std::string& getObserverName() const;
    void setObserverName(const std::string &name);

    double getLongitude() const;
    void setLongitude(const double l);

    double getLatitude() const;
    void setLatitude(const double l);

    /** Meters above the WGS84 ellipsoid. */
    double getAltitude() const;
    void setAltitude(const double a);

    const std::string& getTLEFile() const;
    void setTLEFile(const std::string &path);

    void addSatellite(const int catalogNumber);

    template<typename Container>
    std::enable_if_t<std::is_same_v<typename Container::value_type, int>>
    addAllSatellites(const Container &catalogNumbers) {
        for (int id : catalogNumbers) {
            addSatellite(id);
        }
    }

    void removeSatellite(const int catalogNumber);
    void clearSatellites();
    const std::set<int>& getSatellites() const;
    bool hasSatellites() const;

    /** Search horizon, 1 to 10 days. */
    int getDays() const;
    void setDays(const int days);

    int getStepSeconds() const;
    void setStepSeconds(const int seconds);

    /** Rise/set threshold for passes, 0 to 90 degrees. */
    int getMinimumElevation() const;
    void setMinimumElevation(const int degrees);

    /** Threshold for a usable radio contact, 0 to 90 degrees. */
    int getWindowElevation() const;
    void setWindowElevation(const int degrees);

    /** Passes per satellite; 0 means all passes in the horizon. */
    int getMaxPasses() const;
    void setMaxPasses(const int passes);

    bool getRadioEnabled() const;
    void setRadioEnabled(bool enabled);

    double getDownlinkFrequency() const;
    void setDownlinkFrequency(const double mhz);

    double getUplinkFrequency() const;
    void setUplinkFrequency(const double mhz);

    /** Frequencies of one satellite, used instead of the global ones. */
    void setFrequencies(const int catalogNumber, const double downlinkMHz, const double uplinkMHz);

    /**
     * Parse and store an assignment of the form `ID:DOWNLINK[:UPLINK]`, in MHz.
     *
     * @throws std::invalid_argument if the assignment is malformed
     */
    void addFrequencies(const std::string &assignment);

    const std::map<int, SatelliteFrequencies>& getFrequencies() const;

    bool getAlertsEnabled() const;
    void setAlertsEnabled(bool enabled);

    int getAlertLeadMinutes() const;
    void setAlertLeadMinutes(const int minutes);

    int getAlertElevation() const;
    void setAlertElevation(const int degrees);

    /** Seconds between track updates, at least 1. */
    int getTrackInterval() const;
    void setTrackInterval(const int seconds);

    bool getVerbose() const;
    void setVerbose(bool);

    Instant getTime() const;
    void setTime(const Instant tp);

    /**
     * @throws std::invalid_argument for non-finite or out-of-range coordinates,
     *         a non-positive step or negative frequencies
     */
    void validate() const;

    ObserverLocation toObserver() const;
    TrackingSettings toTrackingSettings() const;

private:
    std::string observerName = "Ground Station";
    double longitude = 0.0;
    double latitude = 0.0;
    double altitude = 0.0;
    std::string tleFile;
    std::set<int> satellites;
    int days = 1;
    int stepSeconds = 60;
    int minimumElevation = 0;
    int windowElevation = 10;
    int maxPasses = 0;
    bool radioEnabled = true;
    double downlinkFrequency = 0.0;
    double uplinkFrequency = 0.0;
    std::map<int, SatelliteFrequencies> frequencies;
    bool alertsEnabled = true;
    int alertLeadMinutes = 15;
    int alertElevation = 20;
    int trackInterval = 1;
    bool verbose = false;
    Instant time;
};

}

#endif
