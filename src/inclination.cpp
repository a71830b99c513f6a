/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/inclination.hpp>
#include <orrery/angles.hpp>

#include <cmath>

#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::warn;

double inclinationRotation(double inclinationDegrees) {
    if (!std::isfinite(inclinationDegrees)) {
        warn("Invalid inclination: {}, using 0", inclinationDegrees);
        return 0.0;
    }
    return degreesToRadiansClamped(inclinationDegrees);
}

Vec3 applyInclination(double x, double zFlat, double inclinationDegrees) {
    double theta = inclinationRotation(inclinationDegrees);
    return {
        x,
        -zFlat * std::sin(theta),
        zFlat * std::cos(theta)
    };
}

}
