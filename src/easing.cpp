/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/easing.hpp>

#include <algorithm>
#include <cmath>

namespace orrery {

static double clampProgress(double t) {
    if (std::isnan(t)) {
        return 0.0;
    }
    return std::clamp(t, 0.0, 1.0);
}

double linear(double t) {
    return clampProgress(t);
}

double easeInOutQuad(double t) {
    t = clampProgress(t);
    return t < 0.5 ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2) / 2.0;
}

double easeInOutCubic(double t) {
    t = clampProgress(t);
    return t < 0.5 ? 4.0 * t * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 3) / 2.0;
}

double easeOutQuart(double t) {
    t = clampProgress(t);
    return 1.0 - std::pow(1.0 - t, 4);
}

EasingFunction easingFunction(Easing easing) {
    switch (easing) {
        case Easing::Linear:
            return linear;
        case Easing::EaseInOutQuad:
            return easeInOutQuad;
        case Easing::EaseInOutCubic:
            return easeInOutCubic;
        case Easing::EaseOutQuart:
            return easeOutQuart;
    }
    return linear;
}

std::string_view easingName(Easing easing) {
    switch (easing) {
        case Easing::Linear:
            return "linear";
        case Easing::EaseInOutQuad:
            return "easeInOutQuad";
        case Easing::EaseInOutCubic:
            return "easeInOutCubic";
        case Easing::EaseOutQuart:
            return "easeOutQuart";
    }
    return "linear";
}

std::optional<Easing> easingFromName(std::string_view name) {
    for (auto easing : {Easing::Linear, Easing::EaseInOutQuad, Easing::EaseInOutCubic, Easing::EaseOutQuart}) {
        if (easingName(easing) == name) {
            return easing;
        }
    }
    return std::nullopt;
}

}
