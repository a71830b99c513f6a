/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_CONFIG_HPP
#define __ORRERY_CONFIG_HPP

#include <orrery/easing.hpp>
#include <orrery/epoch.hpp>

#include <cstddef>
#include <string>

namespace orrery {

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    // Speed mode multiplier, 1 = real time
    double getSimulationSpeed();
    void setSimulationSpeed(const double speed);

    // Date transition speed, 0 = slowest, 1 = instant
    double getAnimationSpeed();
    void setAnimationSpeed(const double speed);

    Easing getEasing();
    void setEasing(const Easing e);

    /**
     * Sets the easing by name.
     * @throws std::invalid_argument if the name is not a known easing
     */
    void setEasing(const std::string &name);

    double getMinimumDurationMs();
    void setMinimumDurationMs(const double ms);

    double getMaximumDurationMs();
    void setMaximumDurationMs(const double ms);

    std::size_t getCacheCapacity();
    void setCacheCapacity(const std::size_t capacity);

    bool getVerbose();
    void setVerbose(bool);

    time_point getTime();
    void setTime(const time_point tp);

private:
    double simulationSpeed = 1.0;
    double animationSpeed = 0.5;
    Easing easing = Easing::EaseInOutCubic;
    double minimumDurationMs = 300.0;
    double maximumDurationMs = 3000.0;
    std::size_t cacheCapacity = 1000;
    bool verbose = false;
    time_point time = J2000_EPOCH;
};

}

#endif
