/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/integrator.hpp>
#include <orrery/angles.hpp>
#include <orrery/epoch.hpp>
#include <orrery/inclination.hpp>

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::debug;
using spdlog::warn;

// Revolution steps at or above this saturate the counter
constexpr double MAX_WHOLE_REVOLUTIONS_STEP = 9.0e18;

Vec3 ellipticalPosition(const OrbitalParameters &params, double angleRadians) {
    double a = params.distanceScale;
    double b = a * (1.0 - params.eccentricity);
    double x = a * std::cos(angleRadians);
    double zFlat = b * std::sin(angleRadians);
    return applyInclination(x, zFlat, params.inclinationDegrees);
}

OrbitIntegrator::OrbitIntegrator(const OrbitalParameters &params) : params(params) {}

void OrbitIntegrator::tick(double deltaTimeSeconds, double speedMultiplier) {
    if (!std::isfinite(deltaTimeSeconds) || deltaTimeSeconds < 0.0) {
        warn("Invalid time delta for {}: {}, holding position", bodyName(params.body), deltaTimeSeconds);
        idle = true;
        return;
    }
    if (!std::isfinite(speedMultiplier) || speedMultiplier < 0.0) {
        warn("Invalid speed multiplier for {}: {}, holding position", bodyName(params.body), speedMultiplier);
        idle = true;
        return;
    }
    if (speedMultiplier == 0.0 || deltaTimeSeconds == 0.0) {
        idle = true;
        return;
    }

    double simulatedSeconds = deltaTimeSeconds * speedMultiplier;
    if (!std::isfinite(simulatedSeconds)) {
        warn("Simulated step for {} overflowed ({}s x {}), holding position",
             bodyName(params.body), deltaTimeSeconds, speedMultiplier);
        idle = true;
        return;
    }

    // Orbit, counting each wrap through 2π
    double step = simulatedSeconds * angularSpeed();
    double partial = std::fmod(step, FULL_CIRCLE_RADIANS);
    double wraps = std::round((step - partial) / FULL_CIRCLE_RADIANS);

    double next = current.angleAccumulatorRadians + partial;
    if (next >= FULL_CIRCLE_RADIANS) {
        next -= FULL_CIRCLE_RADIANS;
        wraps += 1.0;
    }
    if (next < 0.0 || next >= FULL_CIRCLE_RADIANS) {
        next = 0.0;
    }
    current.angleAccumulatorRadians = next;
    addRevolutions(wraps);

    // Spin
    double spinStep = std::fmod(simulatedSeconds * spinSpeed(), FULL_CIRCLE_RADIANS);
    current.spinRadians = normalizeRadians(current.spinRadians + spinStep);

    idle = false;
}

void OrbitIntegrator::addRevolutions(double wraps) {
    constexpr auto MAX_REVOLUTIONS = std::numeric_limits<std::uint64_t>::max();

    // Saturates rather than wrapping the counter
    if (!(wraps < MAX_WHOLE_REVOLUTIONS_STEP)) {
        current.completedRevolutions = MAX_REVOLUTIONS;
        return;
    }
    auto count = static_cast<std::uint64_t>(wraps);
    if (count > MAX_REVOLUTIONS - current.completedRevolutions) {
        current.completedRevolutions = MAX_REVOLUTIONS;
    } else {
        current.completedRevolutions += count;
    }
}

void OrbitIntegrator::advanceTo(double elapsedSeconds, double speedMultiplier) {
    if (!std::isfinite(elapsedSeconds)) {
        warn("Invalid frame clock for {}: {}", bodyName(params.body), elapsedSeconds);
        idle = true;
        return;
    }

    double delta = elapsedSeconds - current.lastSampleTimeSeconds;
    current.lastSampleTimeSeconds = elapsedSeconds;

    if (delta < 0.0) {
        debug("Frame clock for {} went backwards by {}s, resynchronising", bodyName(params.body), -delta);
        idle = true;
        return;
    }

    tick(delta, speedMultiplier);
}

void OrbitIntegrator::reset() {
    current = SimulationState{};
    idle = true;
}

void OrbitIntegrator::setParameters(const OrbitalParameters &newParams) {
    params = newParams;
    reset();
}

const OrbitalParameters& OrbitIntegrator::parameters() const {
    return params;
}

const SimulationState& OrbitIntegrator::state() const {
    return current;
}

double OrbitIntegrator::angle() const {
    return current.angleAccumulatorRadians;
}

double OrbitIntegrator::totalAngle() const {
    return static_cast<double>(current.completedRevolutions) * FULL_CIRCLE_RADIANS
           + current.angleAccumulatorRadians;
}

double OrbitIntegrator::spin() const {
    return current.spinRadians;
}

Vec3 OrbitIntegrator::position() const {
    return ellipticalPosition(params, current.angleAccumulatorRadians);
}

double OrbitIntegrator::angularSpeed() const {
    if (!(params.orbitalPeriodDays > 0.0)) {
        return 0.0;
    }
    return FULL_CIRCLE_RADIANS / (params.orbitalPeriodDays * SECONDS_PER_DAY);
}

double OrbitIntegrator::spinSpeed() const {
    // A zero rotation period means the body does not spin
    if (!(params.rotation.periodMagnitudeDays > 0.0)) {
        return 0.0;
    }
    return params.rotation.directionSign() * FULL_CIRCLE_RADIANS
           / (params.rotation.periodMagnitudeDays * SECONDS_PER_DAY);
}

bool OrbitIntegrator::isIdle() const {
    return idle;
}

}
