/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skypass.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int) {
    interrupted = 1;
}

}

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Convert azimuth in degrees to compass direction string */
std::string azimuthToCompass(double deg) {
    if (deg < 0) deg += 360.0;
    if (deg >= 360.0) deg -= 360.0;

    if (deg < 11.25) return "N";
    if (deg < 33.75) return "NNE";
    if (deg < 56.25) return "NE";
    if (deg < 78.75) return "ENE";
    if (deg < 101.25) return "E";
    if (deg < 123.75) return "ESE";
    if (deg < 146.25) return "SE";
    if (deg < 168.75) return "SSE";
    if (deg < 191.25) return "S";
    if (deg < 213.75) return "SSW";
    if (deg < 236.25) return "SW";
    if (deg < 258.75) return "WSW";
    if (deg < 281.25) return "W";
    if (deg < 303.75) return "WNW";
    if (deg < 326.25) return "NW";
    if (deg < 348.75) return "NNW";
    return "N";
}

std::string formatTimeUTC(const skypass::Instant instant) {
    return date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(instant));
}

skypass::Instant parseTimeUTC(const std::string &timeStr) {
    std::istringstream in(timeStr);
    std::chrono::system_clock::time_point tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
    }
    return tp;
}

void printElements(std::ostream &os, const skypass::OrbitalElements &elements) {
    os << elements.getName() << std::endl;
    os << "  NORAD ID: " << elements.getCatalogNumber() << std::endl;
    os << "  Classification: " << elements.getClassification() << std::endl;
    os << "  Designator: " << elements.getDesignator() << std::endl;
    os << "  Epoch: " << formatTimeUTC(elements.getEpoch()) << std::endl;
    os << "  First Derivative of Mean Motion: " << elements.getFirstDerivativeMeanMotion() << std::endl;
    os << "  Second Derivative of Mean Motion: " << elements.getSecondDerivativeMeanMotion() << std::endl;
    os << "  Bstar Drag Term: " << elements.getBstarDragTerm() << std::endl;
    os << "  Element Set Number: " << elements.getElementSetNumber() << std::endl;
    os << "  Inclination: " << elements.getInclination() << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << elements.getRightAscensionOfAscendingNode() << " deg" << std::endl;
    os << "  Eccentricity: " << elements.getEccentricity() << std::endl;
    os << "  Argument of Perigee: " << elements.getArgumentOfPerigee() << " deg" << std::endl;
    os << "  Mean Anomaly: " << elements.getMeanAnomaly() << " deg" << std::endl;
    os << "  Mean Motion: " << elements.getMeanMotion() << " revs per day" << std::endl;
    os << "  Period: " << fmt::format("{:.2f}", elements.getPeriodInMinutes()) << " min" << std::endl;
    os << "  Revolution Number at Epoch: " << elements.getRevolutionNumberAtEpoch() << std::endl;
    os << std::endl;
}

void printPasses(std::vector<skypass::Pass> passes, skypass::Instant now) {
    using namespace std::chrono;

    constexpr std::string_view rowFormat = "{:^25} {:^25} {:^25} {:^14} {:^18} {:^12} {:^12} {:^12} {:^10}";
    constexpr std::string_view satFormat = " {:<5} {:<17}";
    constexpr std::string_view durationFormat = "{:>3}m {:>2}s";
    constexpr std::string_view etaFormat = "{:>2}h {:>2}m {:>2}s";
    constexpr std::string_view azFormat = "{:>6.2f} {:<3}";
    constexpr std::string_view elFormat = "{:<5.2f}";

    std::string sep25(25, '-');
    std::string sep18(18, '-');
    std::string sep14(14, '-');
    std::string sep12(12, '-');
    std::string sep10(10, '-');

    std::sort(passes.begin(), passes.end(), [](const skypass::Pass &a, const skypass::Pass &b) {
        return a.riseTime < b.riseTime;
    });

    std::cout << "Upcoming Passes:" << std::endl;
    std::cout << fmt::format(rowFormat, "Satellite", "Start", "End", "Duration", "Starts In", "Start Az", "End Az", "Max Az", "Max Elev") << std::endl;
    std::cout << fmt::format(rowFormat, sep25, sep25, sep25, sep14, sep18, sep12, sep12, sep12, sep10) << std::endl;
    for (const auto &pass : passes) {
        auto length = duration_cast<seconds>(pass.duration());
        auto lengthMins = duration_cast<minutes>(length).count();
        auto lengthSecs = (length % minutes(1)).count();
        auto eta = std::max(duration_cast<seconds>(pass.riseTime - now), seconds::zero());
        auto etaHours = duration_cast<hours>(eta).count();
        auto etaMins = duration_cast<minutes>(eta % hours(1)).count();
        auto etaSecs = (eta % minutes(1)).count();

        std::cout << fmt::format(rowFormat,
            fmt::format(satFormat, pass.catalogNumber, pass.name.substr(0, 17)),
            formatTimeUTC(pass.riseTime),
            formatTimeUTC(pass.setTime),
            fmt::format(durationFormat, lengthMins, lengthSecs),
            fmt::format(etaFormat, etaHours, etaMins, etaSecs),
            fmt::format(azFormat, pass.riseAngle.azimuthInDegrees, azimuthToCompass(pass.riseAngle.azimuthInDegrees)),
            fmt::format(azFormat, pass.setAngle.azimuthInDegrees, azimuthToCompass(pass.setAngle.azimuthInDegrees)),
            fmt::format(azFormat, pass.maxAngle.azimuthInDegrees, azimuthToCompass(pass.maxAngle.azimuthInDegrees)),
            fmt::format(elFormat, pass.maxAngle.elevationInDegrees)) << std::endl;
    }
    std::cout << std::endl;
}

void printWindow(const skypass::CommunicationWindow &window, const skypass::RadioSettings &radio) {
    std::cout << "  Window:    " << (window.open ? "OPEN" : "CLOSED") << " (" << window.reason << ")" << std::endl;
    if (radio.downlinkFrequencyInMHz > 0.0) {
        std::cout << "  Downlink:  " << fmt::format("{:.6f} MHz ({:+.0f} Hz)", window.downlinkObservedInMHz, window.downlinkShiftInHz) << std::endl;
    }
    if (radio.uplinkFrequencyInMHz > 0.0) {
        std::cout << "  Uplink:    " << fmt::format("{:.6f} MHz ({:+.0f} Hz)", window.uplinkCorrectedInMHz, window.uplinkShiftInHz) << std::endl;
    }
    std::cout << "  Signal:    " << window.strength << fmt::format(" ({:.2f})", window.signalQuality) << std::endl;
    if (window.recommendedMode) {
        std::cout << "  Mode:      " << *window.recommendedMode << std::endl;
    }
}

/** Look up the requested satellites, reporting the ones that are missing. */
std::vector<skypass::OrbitalElements> selectSatellites(const skypass::ElementDatabase &database,
                                                       const std::set<int> &ids) {
    std::vector<skypass::OrbitalElements> selected;
    for (auto noradID : ids) {
        auto it = database.find(noradID);
        if (it == database.end()) {
            std::cerr << "Satellite with Norad ID " << noradID << " not found in the local TLE database." << std::endl;
            continue;
        }
        selected.push_back(it->second);
    }
    return selected;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    skypass::Config config;
    config.setTime(std::chrono::system_clock::now());
    config.setTLEFile(expandTilde("~/.skypass.tle"));

    auto configFile = expandTilde("~/.skypass.toml");

    CLI::App app{"SkyPass"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--name",
        [&config](const std::string &name) { config.setObserverName(name); },
        "Name of the ground station");
    app.add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "The latitude of the ground station (in decimal format)");
    app.add_option_function<double>("--long",
        [&config](const double l) { config.setLongitude(l); },
        "The longitude of the ground station (in decimal format)");
    app.add_option_function<double>("--alt",
        [&config](const double e) { config.setAltitude(e); },
        "Altitude above sea level in meters");
    app.add_option_function<std::string>("--tle",
        [&config](const std::string &path) { config.setTLEFile(expandTilde(path)); },
        "TLE file to read satellites from (default: ~/.skypass.tle)");
    app.add_option_function<std::vector<int>>("--sat",
        [&config](const std::vector<int> &ids) { config.addAllSatellites(ids); },
        "Satellites used when a command is given no Norad IDs");
    app.add_option_function<int>("--days",
        [&config](const int days) { config.setDays(days); },
        "Number of days to search for passes (default 1, max 10)");
    app.add_option_function<int>("--step",
        [&config](const int step) { config.setStepSeconds(step); },
        "Coarse pass search step in seconds (default 60)");
    app.add_option_function<int>("--elev",
        [&config](const int elev) { config.setMinimumElevation(elev); },
        "Passes start and end when the satellite crosses this elevation, in degrees (default 0)");
    app.add_option_function<int>("--max",
        [&config](const int max) { config.setMaxPasses(max); },
        "Maximum number of passes per satellite (default 0, no limit)");
    app.add_option_function<int>("--window-elev",
        [&config](const int elev) { config.setWindowElevation(elev); },
        "Minimum elevation for radio contact, in degrees (default 10)");
    app.add_option_function<double>("--downlink",
        [&config](const double mhz) { config.setDownlinkFrequency(mhz); },
        "Downlink frequency in MHz");
    app.add_option_function<double>("--uplink",
        [&config](const double mhz) { config.setUplinkFrequency(mhz); },
        "Uplink frequency in MHz");
    app.add_option_function<std::vector<std::string>>("--freq",
        [&config](const std::vector<std::string> &assignments) {
            try {
                for (const auto &assignment : assignments) {
                    config.addFrequencies(assignment);
                }
            } catch (const std::invalid_argument &e) {
                throw CLI::ValidationError("--freq", e.what());
            }
        },
        "Frequencies of one satellite as ID:DOWNLINK[:UPLINK] in MHz, overriding --downlink and --uplink");
    app.add_flag_function("--no-radio",
        [&config](const int64_t v) { config.setRadioEnabled(v == 0); },
        "Do not evaluate radio links");
    app.add_option_function<int>("--alert-lead",
        [&config](const int minutes) { config.setAlertLeadMinutes(minutes); },
        "Alert when a pass starts within this many minutes (default 15)");
    app.add_option_function<int>("--alert-elev",
        [&config](const int elev) { config.setAlertElevation(elev); },
        "Only alert for passes that reach this elevation, in degrees (default 20)");
    app.add_flag_function("--no-alerts",
        [&config](const int64_t v) { config.setAlertsEnabled(v == 0); },
        "Do not print pass alerts while tracking");
    app.add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) {
            try {
                config.setTime(parseTimeUTC(timeStr));
            } catch (const std::invalid_argument &e) {
                throw CLI::ValidationError("--time", e.what());
            }
        },
        "Time of the calculation (format: YYYY-MM-DD HH:MM:SS UTC, default: now)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");

    app.ignore_case();

    auto infoCommand = app.add_subcommand("info", "View satellite information from the local TLE database");
    std::vector<int> infoIDs;
    infoCommand->add_option("id", infoIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    auto tleCommand = app.add_subcommand("tle", "View raw TLE data from the local TLE database");
    std::vector<int> tleIDs;
    tleCommand->add_option("id", tleIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    auto geoCommand = app.add_subcommand("geo", "Get geodetic location (lat/long/alt) of the satellite at given time");
    std::vector<int> geoIDs;
    geoCommand->add_option("id", geoIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    auto lookCommand = app.add_subcommand("look", "Get look angles (azimuth/elevation/range) for antenna pointing");
    std::vector<int> lookIDs;
    lookCommand->add_option("id", lookIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    auto radioCommand = app.add_subcommand("radio", "Get Doppler corrected frequencies and link quality");
    std::vector<int> radioIDs;
    radioCommand->add_option("id", radioIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    auto passesCommand = app.add_subcommand("passes", "Predict satellite passes");
    std::vector<int> passesIDs;
    passesCommand->add_option("id", passesIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    auto trackCommand = app.add_subcommand("track", "Real-time tracking output (updates every interval)");
    std::vector<int> trackIDs;
    int trackDuration = 60;
    trackCommand->add_option("id", trackIDs, "Norad ID(s) of satellite(s) (ie. 25544)");
    trackCommand->add_option_function<int>("--interval",
        [&config](const int interval) { config.setTrackInterval(interval); },
        "Update interval in seconds (default 1, minimum 1)");
    trackCommand->add_option("--duration", trackDuration, "Duration to track in seconds (default 60, 0 = until interrupted)");

    // Shared setup for every command: logging, validation, the requested IDs
    // and the element database
    auto prepare = [&config](CLI::App *command, const std::vector<int> &ids, skypass::ElementDatabase &database) {
        spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);
        config.validate();
        if (!ids.empty()) {
            config.clearSatellites();
            config.addAllSatellites(ids);
        }
        if (!config.hasSatellites()) {
            std::cerr << "Please provide at least one satellite's Norad ID." << std::endl;
            std::cerr << command->help() << std::endl;
            std::exit(1);
        }
        skypass::loadTLEDatabase(config.getTLEFile(), database);
    };

    // Command callbacks

    infoCommand->final_callback([infoCommand, &prepare, &config, &infoIDs](void) {
        try {
            skypass::ElementDatabase database;
            prepare(infoCommand, infoIDs, database);
            for (const auto &elements : selectSatellites(database, config.getSatellites())) {
                printElements(std::cout, elements);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    tleCommand->final_callback([tleCommand, &prepare, &config, &tleIDs](void) {
        try {
            skypass::ElementDatabase database;
            prepare(tleCommand, tleIDs, database);
            for (const auto &elements : selectSatellites(database, config.getSatellites())) {
                std::cout << elements.toTLE() << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    geoCommand->final_callback([geoCommand, &prepare, &config, &geoIDs](void) {
        using namespace skypass;
        try {
            ElementDatabase database;
            prepare(geoCommand, geoIDs, database);
            Sgp4Model model;
            for (const auto &elements : selectSatellites(database, config.getSatellites())) {
                std::cout << "Satellite: " << elements.getName() << std::endl;
                try {
                    auto state = model.propagate(elements, config.getTime());
                    auto fixed = inertialToEarthFixed(state);
                    auto geo = earthFixedToGeodetic(fixed.positionInKilometers);
                    std::cout << "  Latitude:  " << fmt::format("{:8.3f}", geo.latInDegrees()) << " deg" << std::endl;
                    std::cout << "  Longitude: " << fmt::format("{:8.3f}", geo.lonInDegrees()) << " deg" << std::endl;
                    std::cout << "  Altitude:  " << fmt::format("{:8.1f}", geo.altInKilometers) << " km" << std::endl;
                    std::cout << "  Speed:     " << fmt::format("{:8.3f}", state.velocityInKilometersPerSecond.magnitude()) << " km/s" << std::endl;
                } catch (const PropagationError &err) {
                    std::cout << "  No data: " << err.what() << std::endl;
                }
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    lookCommand->final_callback([lookCommand, &prepare, &config, &lookIDs](void) {
        using namespace skypass;
        try {
            ElementDatabase database;
            prepare(lookCommand, lookIDs, database);
            auto observer = config.toObserver();
            Sgp4Model model;
            for (const auto &elements : selectSatellites(database, config.getSatellites())) {
                std::cout << "Satellite: " << elements.getName() << std::endl;
                try {
                    auto angles = lookAngleAt(model, elements, observer, config.getTime());
                    bool visible = angles.elevationInDegrees >= config.getMinimumElevation();
                    std::cout << "  Visible:   " << (visible ? "YES" : "NO") << " (min elevation: " << config.getMinimumElevation() << " deg)" << std::endl;
                    std::cout << "  Azimuth:   " << fmt::format("{:6.2f}", angles.azimuthInDegrees) << " deg (" << azimuthToCompass(angles.azimuthInDegrees) << ")" << std::endl;
                    std::cout << "  Elevation: " << fmt::format("{:6.2f}", angles.elevationInDegrees) << " deg" << std::endl;
                    std::cout << "  Range:     " << fmt::format("{:6.1f}", angles.rangeInKilometers) << " km" << std::endl;
                    std::cout << "  Rate:      " << fmt::format("{:+6.3f}", angles.rangeRateInKilometersPerSecond) << " km/s" << std::endl;
                } catch (const PropagationError &err) {
                    std::cout << "  No data: " << err.what() << std::endl;
                }
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    radioCommand->final_callback([radioCommand, &prepare, &config, &radioIDs](void) {
        using namespace skypass;
        try {
            ElementDatabase database;
            prepare(radioCommand, radioIDs, database);
            auto observer = config.toObserver();
            auto settings = config.toTrackingSettings();
            settings.validate();
            Sgp4Model model;
            for (const auto &elements : selectSatellites(database, config.getSatellites())) {
                auto radio = settings.radioFor(elements.getCatalogNumber());
                std::cout << "Satellite: " << elements.getName() << std::endl;
                try {
                    auto angles = lookAngleAt(model, elements, observer, config.getTime());
                    std::cout << "  Azimuth:   " << fmt::format("{:6.2f}", angles.azimuthInDegrees) << " deg (" << azimuthToCompass(angles.azimuthInDegrees) << ")" << std::endl;
                    std::cout << "  Elevation: " << fmt::format("{:6.2f}", angles.elevationInDegrees) << " deg" << std::endl;
                    printWindow(evaluateLink(angles, radio), radio);
                } catch (const PropagationError &err) {
                    std::cout << "  No data: " << err.what() << std::endl;
                }
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    passesCommand->final_callback([passesCommand, &prepare, &config, &passesIDs](void) {
        using namespace skypass;
        try {
            ElementDatabase database;
            prepare(passesCommand, passesIDs, database);
            auto satellites = selectSatellites(database, config.getSatellites());

            Sgp4Model model;
            PassPredictor predictor(model, config.toObserver(), config.toTrackingSettings().prediction);
            auto results = predictor.predictAll(satellites, config.getTime());

            std::vector<Pass> passes;
            for (const auto &elements : satellites) {
                const auto &result = results.at(elements.getCatalogNumber());
                if (result.passes.empty()) {
                    std::cerr << "No passes found for " << elements.getName() << " (" << elements.getCatalogNumber() << ")" << std::endl;
                }
                passes.insert(passes.end(), result.passes.begin(), result.passes.end());
            }

            printPasses(passes, config.getTime());
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    trackCommand->final_callback([trackCommand, &prepare, &config, &trackIDs, &trackDuration](void) {
        using namespace skypass;
        using namespace std::chrono;
        try {
            ElementDatabase database;
            prepare(trackCommand, trackIDs, database);

            TrackingContext context(std::make_unique<Sgp4Model>(), config.toObserver(), config.toTrackingSettings());
            for (const auto &elements : selectSatellites(database, config.getSatellites())) {
                context.track(elements);
            }
            if (context.getTracked().empty()) {
                std::exit(1);
            }

            std::signal(SIGINT, onInterrupt);
            std::signal(SIGTERM, onInterrupt);

            constexpr std::string_view headerFormat = "{:<20} {:>10} {:>5} {:>10} {:>11} {:>10} {:>14} {:<10}";
            constexpr std::string_view rowFormat = "{:<20} {:>7.2f} {:>3}  {:>8.2f} {:>11.1f} {:>+10.3f} {:>14} {:<10}";

            std::cout << fmt::format(headerFormat, "Satellite", "Azimuth", "", "Elevation", "Range (km)", "Rate", "Downlink (MHz)", "Signal") << std::endl;
            std::cout << std::string(100, '-') << std::endl;

            std::set<std::pair<int, Instant>> announced;
            auto endTime = system_clock::now() + seconds(trackDuration);

            while (!interrupted && (trackDuration <= 0 || system_clock::now() < endTime)) {
                auto now = system_clock::now();
                context.refreshPasses(now);

                for (const auto &alert : context.alerts(now)) {
                    if (announced.insert({alert.catalogNumber, alert.pass.riseTime}).second) {
                        auto wait = duration_cast<minutes>(alert.timeUntilRise);
                        std::cout << fmt::format("*** {} rises in {} min at {} (max elevation {:.1f} deg)",
                            alert.name, wait.count(), formatTimeUTC(alert.pass.riseTime),
                            alert.pass.maxAngle.elevationInDegrees) << std::endl;
                    }
                }

                for (const auto &status : context.snapshot(now)) {
                    if (!status.hasData()) {
                        std::cout << fmt::format("{:<20} no data: {}", status.name.substr(0, 20), status.error.value_or("")) << std::endl;
                        continue;
                    }
                    std::string downlink = "-";
                    std::string signal = "-";
                    if (status.window) {
                        if (context.getSettings().radioFor(status.catalogNumber).downlinkFrequencyInMHz > 0.0) {
                            downlink = fmt::format("{:.6f}", status.window->downlinkObservedInMHz);
                        }
                        std::ostringstream strength;
                        strength << status.window->strength;
                        signal = strength.str();
                    }
                    const auto &angles = *status.lookAngle;
                    std::cout << fmt::format(rowFormat,
                        status.name.substr(0, 20),
                        angles.azimuthInDegrees,
                        azimuthToCompass(angles.azimuthInDegrees),
                        angles.elevationInDegrees,
                        angles.rangeInKilometers,
                        angles.rangeRateInKilometersPerSecond,
                        downlink,
                        signal) << std::endl;
                }

                if (context.getTracked().size() > 1) {
                    std::cout << std::endl;
                }

                std::this_thread::sleep_for(seconds(config.getTrackInterval()));
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    spdlog::set_default_logger(spdlog::stderr_color_mt("skypass"));

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
