/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_ANGLES_HPP
#define __ORRERY_ANGLES_HPP

#include <numbers>

namespace orrery {

constexpr double FULL_CIRCLE_RADIANS = 2.0 * std::numbers::pi;
constexpr double FULL_CIRCLE_DEGREES = 360.0;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

/**
 * Converts an ecliptic longitude to a rotation angle: (degrees / 360) * 2π.
 * Non-finite input is logged and converts to 0.
 */
double longitudeToRadians(double longitudeDegrees);

/**
 * Clamps an angle to [-180, 180] degrees and converts it to radians.
 * Non-finite input converts to 0.
 */
double degreesToRadiansClamped(double degrees);

/**
 * Wraps an angle into [0, 360).
 */
double normalizeDegrees(double degrees);

/**
 * Wraps an angle into [0, 2π).
 */
double normalizeRadians(double radians);

}

#endif
