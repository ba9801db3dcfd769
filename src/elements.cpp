/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass/elements.hpp>

#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ranges>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace skypass {

namespace {

constexpr std::string_view WHITESPACE = " \t\r";
constexpr std::size_t TLE_LINE_LENGTH = 69;

// Trim leading whitespace from a string_view
std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Trim trailing whitespace from a string_view
std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

template <typename T>
T toNumber(std::string_view str, std::string_view field) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Invalid " + std::string(field) + ": '" + std::string(str) + "'");
    }
    return value;
}

// Leading '+' is legal in TLE fields but not for from_chars
std::string_view stripPlus(std::string_view str) {
    return str.starts_with('+') ? str.substr(1) : str;
}

// "11606-4" -> 0.11606e-4, "-11606-4" -> -0.11606e-4
double fromExponentialString(std::string_view str, std::string_view field) {
    str = trimLeft(str);
    bool negativeMantissa = false;
    if (str.starts_with('-') || str.starts_with('+')) {
        negativeMantissa = str.front() == '-';
        str = str.substr(1);
    }

    auto pos = str.find_last_of("+-");
    if (pos == std::string_view::npos || pos == 0) {
        throw std::invalid_argument("Invalid " + std::string(field) + ": '" + std::string(str) + "'");
    }

    std::string mantissaStr = "0." + std::string(str.substr(0, pos));
    double mantissa = toNumber<double>(mantissaStr, field);
    int exponent = toNumber<int>(str.substr(pos + 1), field);
    if (str[pos] == '-') {
        exponent = -exponent;
    }
    double value = mantissa * std::pow(10.0, exponent);
    return negativeMantissa ? -value : value;
}

// YYDDD.DDDDDDDD, two-digit years below 57 are in the 21st century
Instant parseEpoch(std::string_view epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)), "epoch year");
    double dayOfYear = toNumber<double>(trimLeft(epochStr.substr(2)), "epoch day");
    if (dayOfYear < 1.0 || dayOfYear >= 367.0) {
        throw std::invalid_argument("Invalid epoch day: " + std::string(epochStr));
    }

    y += (y < 57) ? 2000 : 1900;

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

void checkLine(std::string_view line, char number) {
    if (line.size() < TLE_LINE_LENGTH) {
        throw std::invalid_argument(std::string("TLE line ") + number + " is too short: '" + std::string(line) + "'");
    }
    int expected = line[68] - '0';
    if (calculateChecksum(line.substr(0, 68)) != expected) {
        throw std::invalid_argument(std::string("TLE line ") + number + " has an invalid checksum");
    }
}

} // namespace

// ============================================================================
// Orbital Elements
// ============================================================================

OrbitalElements::OrbitalElements(ElementData data) : data_(std::move(data)) {}

OrbitalElements OrbitalElements::fromTLE(std::string_view name, std::string_view tle) {
    auto elements = fromTLE(tle);
    elements.data_.name = std::string(name);
    return elements;
}

OrbitalElements OrbitalElements::fromTLE(std::string_view tle) {
    ElementData data;

    bool firstLineParsed = false;
    bool secondLineParsed = false;
    int line1CatalogNumber = 0;
    for (auto line : tle | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trimLeft(trimRight(lineStr));
        if (lineView.starts_with("1 ")) {
            checkLine(lineView, '1');
            // Columns 3-7: catalog number, 8: classification, 10-17: designator
            line1CatalogNumber = toNumber<int>(trimLeft(lineView.substr(2, 5)), "catalog number");
            data.catalogNumber = line1CatalogNumber;
            data.classification = lineView[7];
            data.designator = std::string(lineView.substr(9, 8));
            // Columns 19-32: epoch
            data.epoch = parseEpoch(lineView.substr(18, 14));
            // Columns 34-43: first derivative of mean motion
            data.firstDerivativeMeanMotion = toNumber<double>(
                stripPlus(trimLeft(lineView.substr(33, 10))), "first derivative of mean motion");
            // Columns 45-52 and 54-61: exponential format
            data.secondDerivativeMeanMotion = fromExponentialString(lineView.substr(44, 8), "second derivative of mean motion");
            data.bstarDragTerm = fromExponentialString(lineView.substr(53, 8), "BSTAR drag term");
            // Columns 65-68: element set number
            data.elementSetNumber = toNumber<int>(trimLeft(lineView.substr(64, 4)), "element set number");
            firstLineParsed = true;
        } else if (lineView.starts_with("2 ")) {
            checkLine(lineView, '2');
            int catalogNumber = toNumber<int>(trimLeft(lineView.substr(2, 5)), "catalog number");
            if (firstLineParsed && catalogNumber != line1CatalogNumber) {
                throw std::invalid_argument("TLE lines describe different satellites: "
                    + std::to_string(line1CatalogNumber) + " and " + std::to_string(catalogNumber));
            }
            data.inclination = toNumber<double>(trimLeft(lineView.substr(8, 8)), "inclination");
            data.rightAscensionOfAscendingNode = toNumber<double>(trimLeft(lineView.substr(17, 8)), "right ascension");
            // Columns 27-33: eccentricity with implied leading decimal point
            data.eccentricity = toNumber<double>("0." + std::string(trimLeft(lineView.substr(26, 7))), "eccentricity");
            data.argumentOfPerigee = toNumber<double>(trimLeft(lineView.substr(34, 8)), "argument of perigee");
            data.meanAnomaly = toNumber<double>(trimLeft(lineView.substr(43, 8)), "mean anomaly");
            data.meanMotion = toNumber<double>(trimLeft(lineView.substr(52, 11)), "mean motion");
            data.revolutionNumberAtEpoch = toNumber<int>(trimLeft(lineView.substr(63, 5)), "revolution number");
            secondLineParsed = true;
        } else if (!firstLineParsed && !secondLineParsed && !lineView.empty()) {
            // Optional name line ("0 " prefix is used by some sources)
            data.name = std::string(lineView.starts_with("0 ") ? trimLeft(lineView.substr(2)) : lineView);
        }

        if (firstLineParsed && secondLineParsed) {
            break;
        }
    }

    if (!firstLineParsed || !secondLineParsed) {
        throw std::invalid_argument("Incomplete TLE: both line 1 and line 2 are required");
    }

    return OrbitalElements(std::move(data));
}

const std::string& OrbitalElements::getName() const {
    return data_.name;
}

int OrbitalElements::getCatalogNumber() const {
    return data_.catalogNumber;
}

char OrbitalElements::getClassification() const {
    return data_.classification;
}

const std::string& OrbitalElements::getDesignator() const {
    return data_.designator;
}

Instant OrbitalElements::getEpoch() const {
    return data_.epoch;
}

double OrbitalElements::getFirstDerivativeMeanMotion() const {
    return data_.firstDerivativeMeanMotion;
}

double OrbitalElements::getSecondDerivativeMeanMotion() const {
    return data_.secondDerivativeMeanMotion;
}

double OrbitalElements::getBstarDragTerm() const {
    return data_.bstarDragTerm;
}

int OrbitalElements::getElementSetNumber() const {
    return data_.elementSetNumber;
}

double OrbitalElements::getInclination() const {
    return data_.inclination;
}

double OrbitalElements::getRightAscensionOfAscendingNode() const {
    return data_.rightAscensionOfAscendingNode;
}

double OrbitalElements::getEccentricity() const {
    return data_.eccentricity;
}

double OrbitalElements::getArgumentOfPerigee() const {
    return data_.argumentOfPerigee;
}

double OrbitalElements::getMeanAnomaly() const {
    return data_.meanAnomaly;
}

double OrbitalElements::getMeanMotion() const {
    return data_.meanMotion;
}

int OrbitalElements::getRevolutionNumberAtEpoch() const {
    return data_.revolutionNumberAtEpoch;
}

double OrbitalElements::getPeriodInMinutes() const {
    return 1440.0 / data_.meanMotion;
}

std::chrono::duration<double, std::chrono::days::period> OrbitalElements::ageAt(Instant instant) const {
    return instant - data_.epoch;
}

// ============================================================================
// TLE Formatting
// ============================================================================

// Mod 10 sum of digits, with '-' counting as 1
int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

// [sign]NNNNN[sign]E, e.g. " 15237-3" for 0.00015237
std::string toTLEExponential(double value) {
    if (value == 0.0) {
        return " 00000+0";
    }

    char sign = (value >= 0) ? ' ' : '-';
    value = std::abs(value);

    int exponent = static_cast<int>(std::floor(std::log10(value)));
    double mantissa = value / std::pow(10.0, exponent + 1);
    int mantissaInt = static_cast<int>(std::round(mantissa * 100000));

    if (mantissaInt >= 100000) {
        mantissaInt = 10000;
        exponent++;
    }

    char expSign = (exponent + 1 >= 0) ? '+' : '-';
    int expAbs = std::abs(exponent + 1);

    std::ostringstream ss;
    ss << sign << std::setw(5) << std::setfill('0') << mantissaInt << expSign << expAbs;
    return ss.str();
}

// " .00008010" or "-.00012345"
std::string formatFirstDerivative(double value) {
    char sign = (value >= 0) ? ' ' : '-';
    value = std::abs(value);

    std::ostringstream ss;
    ss << sign << '.' << std::setw(8) << std::setfill('0')
       << static_cast<int>(std::round(value * 100000000));
    return ss.str();
}

std::string OrbitalElements::toTLE() const {
    using namespace std::chrono;

    std::ostringstream tleStream;
    tleStream << data_.name << '\n';

    // Epoch as YYDDD.DDDDDDDD
    auto epochDays = floor<days>(data_.epoch);
    year_month_day ymd{epochDays};
    int twoDigitYear = static_cast<int>(ymd.year()) % 100;
    int dayOfYear = (epochDays - sys_days{ymd.year()/January/1}).count() + 1;
    double fracDay = duration_cast<duration<double, std::ratio<86400>>>(data_.epoch - epochDays).count();
    long fracDigits = static_cast<long>(std::round(fracDay * 100000000));
    if (fracDigits >= 100000000) {
        fracDigits = 99999999;
    }

    std::ostringstream epochStr;
    epochStr << std::setw(2) << std::setfill('0') << twoDigitYear
             << std::setw(3) << std::setfill('0') << dayOfYear
             << '.' << std::setw(8) << std::setfill('0') << fracDigits;

    std::ostringstream line1;
    line1 << "1 "
          << std::setw(5) << std::setfill('0') << data_.catalogNumber
          << data_.classification << ' '
          << std::left << std::setw(8) << std::setfill(' ') << data_.designator << ' '
          << epochStr.str() << ' '
          << formatFirstDerivative(data_.firstDerivativeMeanMotion) << ' '
          << toTLEExponential(data_.secondDerivativeMeanMotion) << ' '
          << toTLEExponential(data_.bstarDragTerm) << ' '
          << "0 "
          << std::right << std::setw(4) << std::setfill(' ') << (data_.elementSetNumber % 10000);

    std::string line1Str = line1.str();
    tleStream << line1Str << calculateChecksum(line1Str) << '\n';

    int eccInt = static_cast<int>(std::round(data_.eccentricity * 10000000));

    std::ostringstream line2;
    line2 << "2 "
          << std::setw(5) << std::setfill('0') << data_.catalogNumber << ' '
          << std::fixed << std::setprecision(4)
          << std::setw(8) << std::setfill(' ') << data_.inclination << ' '
          << std::setw(8) << std::setfill(' ') << data_.rightAscensionOfAscendingNode << ' '
          << std::setw(7) << std::setfill('0') << eccInt << ' '
          << std::setw(8) << std::setfill(' ') << data_.argumentOfPerigee << ' '
          << std::setw(8) << std::setfill(' ') << data_.meanAnomaly << ' '
          << std::setprecision(8) << std::setw(11) << std::setfill(' ') << data_.meanMotion
          << std::setw(5) << std::setfill('0') << (data_.revolutionNumberAtEpoch % 100000);

    std::string line2Str = line2.str();
    tleStream << line2Str << calculateChecksum(line2Str) << '\n';

    return tleStream.str();
}

// ============================================================================
// TLE Database Functions
// ============================================================================

int loadTLEDatabase(const std::string &filepath, ElementDatabase &database) {
    info("Loading TLE database from file: {}", filepath);
    if (!std::filesystem::exists(filepath)) {
        warn("TLE database file does not exist: {}", filepath);
        return 0;
    }
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open TLE database file: " + filepath);
    }
    return loadTLEDatabase(file, database);
}

int loadTLEDatabase(std::istream &s, ElementDatabase &database) {
    bool haveFirstLine = false;
    std::string line, line1, nameLine;
    int entriesLoaded = 0;
    int entriesSkipped = 0;

    while (std::getline(s, line)) {
        std::string_view trimmed = trimRight(line);
        if (trimmed.empty()) continue;

        if (trimmed.starts_with("1 ")) {
            line1 = std::string(trimmed);
            haveFirstLine = true;
        } else if (trimmed.starts_with("2 ")) {
            if (!haveFirstLine) {
                debug("Skipping TLE line 2 without a preceding line 1: {}", trimmed);
                entriesSkipped++;
                continue;
            }
            std::ostringstream tleStream;
            tleStream << nameLine << '\n' << line1 << '\n' << trimmed << '\n';
            try {
                auto elements = OrbitalElements::fromTLE(tleStream.str());
                database.insert_or_assign(elements.getCatalogNumber(), std::move(elements));
                entriesLoaded++;
            } catch (const std::invalid_argument &e) {
                warn("Skipping malformed TLE entry '{}': {}", nameLine, e.what());
                entriesSkipped++;
            }
            haveFirstLine = false;
            line1.clear();
            nameLine.clear();
        } else {
            nameLine = std::string(trimmed);
        }
    }

    info("Loaded {} TLE entries ({} skipped).", entriesLoaded, entriesSkipped);
    return entriesLoaded;
}

}
