/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/config.hpp>

#include <cmath>
#include <stdexcept>

namespace orrery {

double Config::getSimulationSpeed() {
    return simulationSpeed;
}

void Config::setSimulationSpeed(const double speed) {
    if (std::isfinite(speed) && speed >= 0.0) {
        simulationSpeed = speed;
    } else {
        simulationSpeed = 0.0;
    }
}

double Config::getAnimationSpeed() {
    return animationSpeed;
}

void Config::setAnimationSpeed(const double speed) {
    if (speed >= 0.0 && speed <= 1.0) {
        animationSpeed = speed;
    } else if (speed > 1.0) {
        animationSpeed = 1.0;
    } else {
        animationSpeed = 0.0;
    }
}

Easing Config::getEasing() {
    return easing;
}

void Config::setEasing(const Easing e) {
    easing = e;
}

void Config::setEasing(const std::string &name) {
    auto e = easingFromName(name);
    if (!e.has_value()) {
        throw std::invalid_argument("Unknown easing: " + name);
    }
    easing = *e;
}

double Config::getMinimumDurationMs() {
    return minimumDurationMs;
}

void Config::setMinimumDurationMs(const double ms) {
    if (std::isfinite(ms) && ms >= 0.0) {
        minimumDurationMs = ms;
    } else {
        minimumDurationMs = 0.0;
    }
    if (maximumDurationMs < minimumDurationMs) {
        maximumDurationMs = minimumDurationMs;
    }
}

double Config::getMaximumDurationMs() {
    return maximumDurationMs;
}

void Config::setMaximumDurationMs(const double ms) {
    if (std::isfinite(ms) && ms >= minimumDurationMs) {
        maximumDurationMs = ms;
    } else {
        maximumDurationMs = minimumDurationMs;
    }
}

std::size_t Config::getCacheCapacity() {
    return cacheCapacity;
}

void Config::setCacheCapacity(const std::size_t capacity) {
    if (capacity > 0) {
        cacheCapacity = capacity;
    } else {
        cacheCapacity = 1;
    }
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

time_point Config::getTime() {
    return time;
}

void Config::setTime(const time_point tp) {
    time = tp;
}

}
