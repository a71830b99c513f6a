/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

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

/** Parse a UTC time given on the command line */
orrery::time_point parseTimeOption(const std::string &timeStr) {
    auto tp = orrery::parseInstant(timeStr);
    if (!tp.has_value()) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD[THH:MM:SS]): " + timeStr);
    }
    return *tp;
}

/** Convert body names to bodies, defaulting to all eight */
std::vector<orrery::Body> selectBodies(const std::vector<std::string> &names) {
    if (names.empty()) {
        return {orrery::ALL_BODIES.begin(), orrery::ALL_BODIES.end()};
    }
    std::vector<orrery::Body> bodies;
    for (const auto &name : names) {
        auto body = orrery::bodyFromName(name);
        if (!body.has_value()) {
            throw orrery::UnknownBodyException(name);
        }
        bodies.push_back(*body);
    }
    return bodies;
}

/** Print a table of positions */
void printPositions(const std::vector<orrery::PlanetPosition> &positions) {
    constexpr std::string_view rowFormat = "{:<8} {:>10} {:>10} {:>10} {:>11} {:>11} {:>11}";
    constexpr std::string_view valueFormat = "{:<8} {:>10.4f} {:>10.4f} {:>10.4f} {:>11.2f} {:>11.2f} {:>11.2f}";

    std::cout << std::format(rowFormat, "Body", "Long (deg)", "Angle", "Spin", "X", "Y", "Z") << std::endl;
    std::cout << std::format(rowFormat, std::string(8, '-'), std::string(10, '-'), std::string(10, '-'),
                             std::string(10, '-'), std::string(11, '-'), std::string(11, '-'),
                             std::string(11, '-')) << std::endl;
    for (const auto &p : positions) {
        std::cout << std::format(valueFormat, p.name, p.longitudeDegrees, p.rotationRadians, p.spinRadians,
                                 p.position.x, p.position.y, p.position.z) << std::endl;
    }
}

/** Program entry point */
int main(int argc, char* argv[]) {

    orrery::Config config;
    config.setSimulationSpeed(1.0);
    config.setAnimationSpeed(0.5);
    config.setEasing(orrery::Easing::EaseInOutCubic);
    config.setCacheCapacity(1000);
    config.setVerbose(false);
    config.setTime(std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()));

    spdlog::set_level(spdlog::level::warn);

    auto configFile = expandTilde("~/.orrery.toml");

    CLI::App app{"Orrery"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<double>("--speed",
        [&config](const double s) { config.setSimulationSpeed(s); },
        "Simulation speed multiplier for speed mode (1 = real time)");
    app.add_option_function<double>("--anim-speed",
        [&config](const double s) { config.setAnimationSpeed(s); },
        "Date transition speed from 0 (slowest) to 1 (instant)");
    app.add_option_function<std::string>("--easing",
        [&config](const std::string &name) { config.setEasing(name); },
        "Date transition easing (linear, easeInOutQuad, easeInOutCubic, easeOutQuart)");
    app.add_option_function<double>("--min-duration",
        [&config](const double ms) { config.setMinimumDurationMs(ms); },
        "Shortest date transition in milliseconds (default 300)");
    app.add_option_function<double>("--max-duration",
        [&config](const double ms) { config.setMaximumDurationMs(ms); },
        "Longest date transition in milliseconds (default 3000)");
    app.add_option_function<std::size_t>("--cache-size",
        [&config](const std::size_t n) { config.setCacheCapacity(n); },
        "Maximum number of cached longitudes (default 1000)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::warn);
        },
        "Display debugging information");

    app.ignore_case();

    // Positions command - date mode positions at an instant
    auto positionsCommand = app.add_subcommand("positions", "Display planet positions at a date");

    std::vector<std::string> positionsBodies;
    positionsCommand->add_option("body", positionsBodies, "Planet name(s) (ie. Earth)");
    positionsCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { config.setTime(parseTimeOption(timeStr)); },
        "Time at which to get positions (format: YYYY-MM-DD[THH:MM:SS] UTC)"
    );

    // Simulate command - run speed mode for a number of frames
    auto simulateCommand = app.add_subcommand("simulate", "Run the continuous simulation and display final positions");

    std::vector<std::string> simulateBodies;
    int simulateFrames = 600;
    double simulateFps = 60.0;
    simulateCommand->add_option("body", simulateBodies, "Planet name(s) (ie. Earth)");
    simulateCommand->add_option("--frames", simulateFrames, "Number of frames to simulate (default 600)");
    simulateCommand->add_option("--fps", simulateFps, "Frames per second (default 60)");

    // Transition command - animate between two dates
    auto transitionCommand = app.add_subcommand("transition", "Animate the date between two instants");

    orrery::time_point transitionTo = orrery::J2000_EPOCH;
    std::string transitionBody = "Earth";
    double transitionFps = 30.0;
    transitionCommand->add_option_function<std::string>("--from",
        [&config](const std::string &timeStr) { config.setTime(parseTimeOption(timeStr)); },
        "Start of the transition (format: YYYY-MM-DD[THH:MM:SS] UTC)"
    )->required();
    transitionCommand->add_option_function<std::string>("--to",
        [&transitionTo](const std::string &timeStr) { transitionTo = parseTimeOption(timeStr); },
        "End of the transition (format: YYYY-MM-DD[THH:MM:SS] UTC)"
    )->required();
    transitionCommand->add_option("--body", transitionBody, "Planet to follow (default Earth)");
    transitionCommand->add_option("--fps", transitionFps, "Frames per second (default 30)");

    // Catalog command - show and validate orbital parameters
    auto catalogCommand = app.add_subcommand("catalog", "Display and validate the planet catalog");

    // Command callbacks

    positionsCommand->final_callback([&config, &positionsBodies](void) {
        using namespace orrery;
        try {
            auto bodies = selectBodies(positionsBodies);

            Vsop87Ephemeris model;
            SolarSystem system(model, config);
            system.setMode(SimulationMode::Date);

            std::vector<PlanetPosition> positions;
            for (auto body : bodies) {
                positions.push_back(system.positionAt(body, config.getTime()));
            }

            if (!isInAccurateRange(config.getTime())) {
                std::cerr << std::format("Warning: {} is outside {}-{}, positions are approximate",
                                         formatInstant(config.getTime()), MIN_ACCURATE_YEAR, MAX_ACCURATE_YEAR)
                          << std::endl;
            }

            std::cout << "Positions at " << formatInstant(config.getTime()) << ":" << std::endl;
            printPositions(positions);
            std::cout << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    simulateCommand->final_callback([&config, &simulateBodies, &simulateFrames, &simulateFps](void) {
        using namespace orrery;
        try {
            if (simulateFrames < 0) {
                throw std::invalid_argument("Frame count must not be negative");
            }
            if (!(simulateFps > 0.0)) {
                throw std::invalid_argument("Frames per second must be positive");
            }
            auto bodies = selectBodies(simulateBodies);

            Vsop87Ephemeris model;
            SolarSystem system(model, config);

            double frameTime = 1.0 / simulateFps;
            for (int i = 0; i < simulateFrames; ++i) {
                system.tick(frameTime);
            }

            std::vector<PlanetPosition> positions;
            for (auto body : bodies) {
                positions.push_back(system.position(body));
            }

            std::cout << std::format("Simulated {} frames at {:g}x, clock at {}", simulateFrames,
                                     system.simulationSpeed(), formatInstant(system.currentDate())) << std::endl;
            printPositions(positions);
            std::cout << std::endl;

            for (auto body : bodies) {
                std::cout << std::format("{:<8} revolutions: {}", bodyName(body),
                                         system.integrator(body).state().completedRevolutions) << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    transitionCommand->final_callback([&config, &transitionTo, &transitionBody, &transitionFps](void) {
        using namespace orrery;
        try {
            if (!(transitionFps > 0.0)) {
                throw std::invalid_argument("Frames per second must be positive");
            }
            auto body = bodyFromName(transitionBody);
            if (!body.has_value()) {
                throw UnknownBodyException(transitionBody);
            }

            Vsop87Ephemeris model;
            SolarSystem system(model, config);
            system.setMode(SimulationMode::Date);
            system.selectDate(transitionTo);

            constexpr std::string_view rowFormat = "{:>5} {:<26} {:>10.4f}";
            double frameTime = 1.0 / transitionFps;
            int frame = 0;

            auto start = system.position(*body);
            std::cout << std::format(rowFormat, frame, formatInstant(start.instant), start.longitudeDegrees) << std::endl;
            while (system.isTransitioning()) {
                system.tick(frameTime);
                ++frame;
                auto p = system.position(*body);
                std::cout << std::format(rowFormat, frame, formatInstant(p.instant), p.longitudeDegrees) << std::endl;
            }
            std::cout << std::format("{} frames, {} longitudes cached", frame, system.cache().size()) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    catalogCommand->final_callback([](void) {
        using namespace orrery;
        try {
            constexpr std::string_view rowFormat = "{:<8} {:>9} {:>7} {:>8} {:>8} {:>10} {:>10}";
            constexpr std::string_view valueFormat = "{:<8} {:>9.1f} {:>7.4f} {:>8.3f} {:>8.3f} {:>10.3f} {:>10.3f}";

            std::cout << std::format(rowFormat, "Body", "Distance", "Ecc", "Incl", "Tilt", "Period", "Rotation")
                      << std::endl;
            for (const auto &p : planetCatalog()) {
                std::cout << std::format(valueFormat, bodyName(p.body), p.distanceScale, p.eccentricity,
                                         p.inclinationDegrees, p.axialTiltDegrees, p.orbitalPeriodDays,
                                         p.rotation.directionSign() * p.rotation.periodMagnitudeDays)
                          << std::endl;
            }
            std::cout << std::endl;

            auto errors = validateCatalog(planetCatalog());
            if (errors.empty()) {
                std::cout << "Catalog is valid." << std::endl;
                return;
            }
            for (const auto &e : errors) {
                std::cerr << std::format("{}: {} = {} (expected {})", e.bodyName, e.field, e.value, e.expected)
                          << std::endl;
            }
            std::exit(1);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
