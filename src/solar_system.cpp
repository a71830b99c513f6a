/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/solar_system.hpp>
#include <orrery/angles.hpp>

#include <algorithm>
#include <cmath>
#include <exception>

#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::info;
using spdlog::warn;
using spdlog::error;

// Speed-mode clock stops about 300,000 years past its start
constexpr double MAX_CLOCK_OFFSET_SECONDS = 1.0e13;

// Zero position returned when a query fails
static PlanetPosition emptyPosition(Body body) {
    PlanetPosition p;
    p.body = body;
    p.name = std::string(bodyName(body));
    return p;
}

// Spin angle after a number of days, given the body's rotation
static double spinAfterDays(const Rotation &rotation, double days) {
    if (!(rotation.periodMagnitudeDays > 0.0) || !std::isfinite(days)) {
        return 0.0;
    }
    double turns = std::fmod(days / rotation.periodMagnitudeDays, 1.0);
    return normalizeRadians(rotation.directionSign() * turns * FULL_CIRCLE_RADIANS);
}

SolarSystem::SolarSystem(const EphemerisModel &model, Config config)
    : catalog(planetCatalog()),
      longitudeCache(model, config.getCacheCapacity()),
      transition(config.getTime(), config.getEasing(),
                 DurationConfig{milliseconds_f{config.getMinimumDurationMs()},
                                milliseconds_f{config.getMaximumDurationMs()}}),
      speed(config.getSimulationSpeed()),
      clockStart(config.getTime()) {
    integrators.reserve(catalog.size());
    for (const auto &params : catalog) {
        integrators.emplace_back(params);
    }
    transition.setAnimationSpeed(config.getAnimationSpeed());
}

SimulationMode SolarSystem::mode() const {
    return currentMode;
}

void SolarSystem::setMode(SimulationMode newMode) {
    if (newMode == currentMode) {
        return;
    }
    if (newMode == SimulationMode::Speed) {
        transition.skipToTarget();
        longitudeCache.clear();
    }
    currentMode = newMode;
    info("Switched to {} mode", newMode == SimulationMode::Speed ? "speed" : "date");
}

void SolarSystem::toggleMode() {
    setMode(currentMode == SimulationMode::Speed ? SimulationMode::Date : SimulationMode::Speed);
}

void SolarSystem::setSimulationSpeed(double s) {
    if (!std::isfinite(s) || s < 0.0) {
        warn("Invalid simulation speed: {}, keeping {}", s, speed);
        return;
    }
    speed = s;
}

double SolarSystem::simulationSpeed() const {
    return speed;
}

void SolarSystem::setAnimationSpeed(double s) {
    transition.setAnimationSpeed(s);
}

double SolarSystem::animationSpeed() const {
    return transition.animationSpeed();
}

void SolarSystem::tick(double deltaSeconds) {
    if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0) {
        warn("Invalid frame time: {}s, skipping frame", deltaSeconds);
        return;
    }

    if (currentMode == SimulationMode::Date) {
        transition.advance(milliseconds_f{deltaSeconds * 1000.0});
        return;
    }

    if (!std::isfinite(deltaSeconds * speed)) {
        warn("Simulated step overflowed ({}s x {}), skipping frame", deltaSeconds, speed);
        return;
    }

    for (auto &integrator : integrators) {
        integrator.tick(deltaSeconds, speed);
    }
    simulatedSeconds = std::min(simulatedSeconds + deltaSeconds * speed, MAX_CLOCK_OFFSET_SECONDS);
}

void SolarSystem::selectDate(time_point target) {
    transition.begin(target);
}

bool SolarSystem::selectDate(std::string_view target) {
    auto tp = parseInstant(target);
    if (!tp.has_value()) {
        error("Invalid date selected: '{}'", target);
        return false;
    }
    selectDate(*tp);
    return true;
}

void SolarSystem::skipTransition() {
    transition.skipToTarget();
}

bool SolarSystem::isTransitioning() const {
    return transition.isAnimating();
}

time_point SolarSystem::currentDate() const {
    if (currentMode == SimulationMode::Date) {
        return transition.currentDate();
    }
    auto millis = std::llround(std::min(simulatedSeconds, MAX_CLOCK_OFFSET_SECONDS) * 1000.0);
    return clockStart + std::chrono::milliseconds{millis};
}

PlanetPosition SolarSystem::position(Body body) {
    if (currentMode == SimulationMode::Date) {
        return positionAt(body, transition.currentDate());
    }
    return speedPosition(body);
}

PlanetPosition SolarSystem::position(std::string_view name) {
    auto body = bodyFromName(name);
    if (!body.has_value()) {
        warn("Unsupported body: {}", name);
        PlanetPosition p;
        p.name = std::string(name);
        return p;
    }
    return position(*body);
}

PlanetPosition SolarSystem::positionAt(Body body, time_point tp) {
    try {
        const auto &params = catalog.at(bodyIndex(body));

        PlanetPosition p;
        p.body = body;
        p.name = std::string(bodyName(body));
        p.instant = tp;
        p.longitudeDegrees = longitudeCache.get(body, tp);
        p.rotationRadians = normalizeRadians(longitudeToRadians(p.longitudeDegrees));
        p.spinRadians = spinAfterDays(params.rotation, daysSinceEpoch(tp));
        p.position = ellipticalPosition(params, p.rotationRadians);
        return p;
    } catch (const std::exception &e) {
        error("Error calculating position of {} at {}: {}", bodyName(body), formatInstant(tp), e.what());
        return emptyPosition(body);
    }
}

std::vector<PlanetPosition> SolarSystem::positions() {
    std::vector<PlanetPosition> result;
    result.reserve(ALL_BODIES.size());
    for (auto body : ALL_BODIES) {
        result.push_back(position(body));
    }
    return result;
}

const OrbitIntegrator& SolarSystem::integrator(Body body) const {
    return integrators.at(bodyIndex(body));
}

LongitudeCache& SolarSystem::cache() {
    return longitudeCache;
}

PlanetPosition SolarSystem::speedPosition(Body body) {
    try {
        const auto &integrator = integrators.at(bodyIndex(body));

        PlanetPosition p;
        p.body = body;
        p.name = std::string(bodyName(body));
        p.instant = currentDate();
        p.rotationRadians = integrator.angle();
        p.longitudeDegrees = normalizeDegrees(integrator.angle() * RADIANS_TO_DEGREES);
        p.spinRadians = integrator.spin();
        p.position = integrator.position();
        return p;
    } catch (const std::exception &e) {
        error("Error calculating position of {}: {}", bodyName(body), e.what());
        return emptyPosition(body);
    }
}

}
