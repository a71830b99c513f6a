/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_EASING_HPP
#define __ORRERY_EASING_HPP

#include <optional>
#include <string_view>

namespace orrery {

/**
 * Shapes transition progress. Every easing maps [0, 1] onto [0, 1] with
 * f(0) = 0 and f(1) = 1 and never decreases. Input outside [0, 1] is clamped.
 */
using EasingFunction = double (*)(double);

// Constant speed
double linear(double t);

// Quadratic ease-in-out, gentler than cubic
double easeInOutQuad(double t);

// Cubic ease-in-out: slow start, fast middle, slow end
double easeInOutCubic(double t);

// Quartic ease-out: fast start, slow end
double easeOutQuart(double t);

enum class Easing {
    Linear,
    EaseInOutQuad,
    EaseInOutCubic,
    EaseOutQuart
};

EasingFunction easingFunction(Easing easing);

std::string_view easingName(Easing easing);

/**
 * Looks up an easing by its name ("linear", "easeInOutQuad", "easeInOutCubic", "easeOutQuart").
 */
std::optional<Easing> easingFromName(std::string_view name);

}

#endif
