/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/angles.hpp>

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::error;

double longitudeToRadians(double longitudeDegrees) {
    if (!std::isfinite(longitudeDegrees)) {
        error("Invalid longitude provided to longitudeToRadians: {}", longitudeDegrees);
        return 0.0;
    }
    return (longitudeDegrees / FULL_CIRCLE_DEGREES) * FULL_CIRCLE_RADIANS;
}

double degreesToRadiansClamped(double degrees) {
    if (!std::isfinite(degrees)) {
        return 0.0;
    }
    return std::clamp(degrees, -180.0, 180.0) * DEGREES_TO_RADIANS;
}

double normalizeDegrees(double degrees) {
    if (!std::isfinite(degrees)) {
        return 0.0;
    }
    double result = std::fmod(degrees, FULL_CIRCLE_DEGREES);
    if (result < 0.0) result += FULL_CIRCLE_DEGREES;
    // fmod of a tiny negative number can round up to exactly 360
    if (result >= FULL_CIRCLE_DEGREES) result = 0.0;
    return result;
}

double normalizeRadians(double radians) {
    if (!std::isfinite(radians)) {
        return 0.0;
    }
    double result = std::fmod(radians, FULL_CIRCLE_RADIANS);
    if (result < 0.0) result += FULL_CIRCLE_RADIANS;
    if (result >= FULL_CIRCLE_RADIANS) result = 0.0;
    return result;
}

}
