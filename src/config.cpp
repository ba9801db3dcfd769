/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/config.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace skypass {

namespace {

// True when the whole field is a number
bool parseField(const std::string &field, int &value) {
    try {
        std::size_t used = 0;
        value = std::stoi(field, &used);
        return used == field.size();
    } catch (const std::logic_error &) {
        return false;
    }
}

bool parseField(const std::string &field, double &value) {
    try {
        std::size_t used = 0;
        value = std::stod(field, &used);
        return used == field.size();
    } catch (const std::logic_error &) {
        return false;
    }
}

}

const std::string& Config::getObserverName() const {
    return observerName;
}

void Config::setObserverName(const std::string &name) {
    observerName = name;
}

double Config::getLatitude() const {
    return latitude;
}

void Config::setLatitude(const double l) {
    latitude = l;
}

double Config::getLongitude() const {
    return longitude;
}

void Config::setLongitude(const double l) {
    longitude = l;
}

double Config::getAltitude() const {
    return altitude;
}

void Config::setAltitude(const double a) {
    altitude = a;
}

const std::string& Config::getTLEFile() const {
    return tleFile;
}

void Config::setTLEFile(const std::string &path) {
    tleFile = path;
}

void Config::addSatellite(const int catalogNumber) {
    satellites.insert(catalogNumber);
}

void Config::removeSatellite(const int catalogNumber) {
    satellites.erase(catalogNumber);
}

void Config::clearSatellites() {
    satellites.clear();
}

const std::set<int>& Config::getSatellites() const {
    return satellites;
}

bool Config::hasSatellites() const {
    return !satellites.empty();
}

int Config::getDays() const {
    return days;
}

void Config::setDays(const int d) {
    days = std::clamp(d, 1, 10);
}

int Config::getStepSeconds() const {
    return stepSeconds;
}

void Config::setStepSeconds(const int seconds) {
    stepSeconds = seconds;
}

int Config::getMinimumElevation() const {
    return minimumElevation;
}

void Config::setMinimumElevation(const int degrees) {
    minimumElevation = std::clamp(degrees, 0, 90);
}

int Config::getWindowElevation() const {
    return windowElevation;
}

void Config::setWindowElevation(const int degrees) {
    windowElevation = std::clamp(degrees, 0, 90);
}

int Config::getMaxPasses() const {
    return maxPasses;
}

void Config::setMaxPasses(const int passes) {
    maxPasses = std::max(passes, 0);
}

bool Config::getRadioEnabled() const {
    return radioEnabled;
}

void Config::setRadioEnabled(bool enabled) {
    radioEnabled = enabled;
}

double Config::getDownlinkFrequency() const {
    return downlinkFrequency;
}

void Config::setDownlinkFrequency(const double mhz) {
    downlinkFrequency = mhz;
}

double Config::getUplinkFrequency() const {
    return uplinkFrequency;
}

void Config::setUplinkFrequency(const double mhz) {
    uplinkFrequency = mhz;
}

void Config::setFrequencies(const int catalogNumber, const double downlinkMHz, const double uplinkMHz) {
    frequencies.insert_or_assign(catalogNumber, SatelliteFrequencies{downlinkMHz, uplinkMHz});
}

void Config::addFrequencies(const std::string &assignment) {
    std::vector<std::string> fields;
    std::size_t begin = 0;
    while (true) {
        auto end = assignment.find(':', begin);
        fields.push_back(assignment.substr(begin, end - begin));
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1;
    }

    int id = 0;
    double downlink = 0.0;
    double uplink = 0.0;
    if (fields.size() < 2 || fields.size() > 3
        || !parseField(fields[0], id)
        || !parseField(fields[1], downlink)
        || (fields.size() == 3 && !parseField(fields[2], uplink))) {
        throw std::invalid_argument(fmt::format("Expected ID:DOWNLINK[:UPLINK] in MHz (got '{}')", assignment));
    }
    setFrequencies(id, downlink, uplink);
}

const std::map<int, SatelliteFrequencies>& Config::getFrequencies() const {
    return frequencies;
}

bool Config::getAlertsEnabled() const {
    return alertsEnabled;
}

void Config::setAlertsEnabled(bool enabled) {
    alertsEnabled = enabled;
}

int Config::getAlertLeadMinutes() const {
    return alertLeadMinutes;
}

void Config::setAlertLeadMinutes(const int minutes) {
    alertLeadMinutes = std::max(minutes, 0);
}

int Config::getAlertElevation() const {
    return alertElevation;
}

void Config::setAlertElevation(const int degrees) {
    alertElevation = std::clamp(degrees, 0, 90);
}

int Config::getTrackInterval() const {
    return trackInterval;
}

void Config::setTrackInterval(const int seconds) {
    trackInterval = std::max(seconds, 1);
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

Instant Config::getTime() const {
    return time;
}

void Config::setTime(const Instant tp) {
    time = tp;
}

void Config::validate() const {
    if (!std::isfinite(latitude) || latitude < -90.0 || latitude > 90.0) {
        throw std::invalid_argument(fmt::format("Latitude must be between -90 and 90 degrees (got {})", latitude));
    }
    if (!std::isfinite(longitude) || longitude < -180.0 || longitude >= 360.0) {
        throw std::invalid_argument(fmt::format("Longitude must be between -180 and 360 degrees (got {})", longitude));
    }
    if (!std::isfinite(altitude)) {
        throw std::invalid_argument("Altitude must be a finite number of meters");
    }
    if (stepSeconds <= 0) {
        throw std::invalid_argument(fmt::format("Time step must be positive (got {} s)", stepSeconds));
    }
    if (!(downlinkFrequency >= 0.0) || !(uplinkFrequency >= 0.0)) {
        throw std::invalid_argument("Radio frequencies cannot be negative");
    }
    for (const auto &[id, link] : frequencies) {
        if (!(link.downlinkFrequencyInMHz >= 0.0) || !(link.uplinkFrequencyInMHz >= 0.0)) {
            throw std::invalid_argument(fmt::format("Radio frequencies of satellite {} cannot be negative", id));
        }
    }
}

ObserverLocation Config::toObserver() const {
    return ObserverLocation::fromDegrees(observerName, latitude, longitude, altitude);
}

TrackingSettings Config::toTrackingSettings() const {
    TrackingSettings settings;
    settings.prediction.horizonInDays = days;
    settings.prediction.step = std::chrono::seconds(stepSeconds);
    settings.prediction.minElevationInDegrees = minimumElevation;
    settings.prediction.maxPasses = maxPasses;
    settings.radio.downlinkFrequencyInMHz = downlinkFrequency;
    settings.radio.uplinkFrequencyInMHz = uplinkFrequency;
    settings.radio.minElevationInDegrees = windowElevation;
    settings.frequencies = frequencies;
    settings.radioEnabled = radioEnabled;
    settings.alerts.enabled = alertsEnabled;
    settings.alerts.leadTime = std::chrono::minutes(alertLeadMinutes);
    settings.alerts.minElevationInDegrees = alertElevation;
    return settings;
}

}
