/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/date_transition.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::debug;
using spdlog::warn;

time_point interpolate(time_point start, time_point target, double progress) {
    if (std::isnan(progress) || progress <= 0.0) {
        return start;
    }
    if (progress >= 1.0) {
        return target;
    }

    auto span = static_cast<double>((target - start).count());
    auto offset = static_cast<std::int64_t>(span * progress);
    return start + std::chrono::milliseconds{offset};
}

TimeDirection direction(time_point start, time_point target) {
    return target > start ? TimeDirection::Forward : TimeDirection::Backward;
}

milliseconds_f duration(time_point start, time_point target, double speed, const DurationConfig &config) {
    if (start == target) {
        return milliseconds_f{0.0};
    }
    if (!std::isfinite(speed)) {
        warn("Invalid animation speed: {}, using instant mode", speed);
        return milliseconds_f{0.0};
    }
    if (speed >= 1.0) {
        return milliseconds_f{0.0};
    }
    speed = std::max(speed, 0.0);

    double days = std::abs(static_cast<double>((target - start).count())) / MILLISECONDS_PER_DAY;

    // A reversed pair of bounds collapses onto the minimum
    double minimum = std::max(config.minDuration.count(), 0.0);
    double maximum = std::max(config.maxDuration.count(), minimum);

    // log10(1) = 0, log10(10) = 1, log10(366) ~ 2.56
    double base = std::clamp(std::log10(days + 1.0) * 1000.0, minimum, maximum);

    double scaled = base * (1.0 - speed * 0.9);
    return milliseconds_f{std::max(minimum * 0.1, scaled)};
}

bool isSameInstant(time_point a, time_point b) {
    auto diff = a > b ? a - b : b - a;
    return diff < std::chrono::seconds{1};
}

DateTransition::DateTransition(time_point date, Easing easing, DurationConfig config)
    : easingKind(easing), config(config) {
    current.startDate = date;
    current.targetDate = date;
    current.currentDate = date;
}

void DateTransition::setAnimationSpeed(double s) {
    if (std::isnan(s)) {
        warn("Invalid animation speed: {}, keeping {}", s, speed);
        return;
    }
    speed = std::clamp(s, 0.0, 1.0);
}

double DateTransition::animationSpeed() const {
    return speed;
}

bool DateTransition::isInstantMode() const {
    return speed >= 1.0;
}

void DateTransition::setEasing(Easing easing) {
    easingKind = easing;
}

Easing DateTransition::easing() const {
    return easingKind;
}

void DateTransition::begin(time_point target) {
    if (isInstantMode()) {
        current.animating = false;
        current.currentDate = target;
        current.targetDate = target;
        current.progress = 1.0;
        return;
    }

    // Stop any running animation on the date shown now, then restart from there
    time_point start = current.currentDate;
    if (current.animating) {
        current.animating = false;
        current.startDate = start;
        current.targetDate = start;
        current.progress = 1.0;
    }

    if (isSameInstant(start, target)) {
        return;
    }

    auto length = duration(start, target, speed, config);
    if (length.count() <= 0.0) {
        current.animating = false;
        current.currentDate = target;
        current.targetDate = target;
        current.progress = 1.0;
        return;
    }

    current.animating = true;
    current.startDate = start;
    current.targetDate = target;
    current.currentDate = start;
    current.progress = 0.0;
    current.direction = direction(start, target);
    current.duration = length;
    elapsed = milliseconds_f{0.0};

    debug("Transition from {} to {} over {:.0f}ms", formatInstant(start), formatInstant(target), length.count());
}

time_point DateTransition::advance(milliseconds_f delta) {
    if (!current.animating) {
        return current.currentDate;
    }
    if (!std::isfinite(delta.count()) || delta.count() < 0.0) {
        warn("Invalid frame time: {}ms, transition not advanced", delta.count());
        return current.currentDate;
    }

    elapsed += delta;
    double rawProgress = std::min(elapsed / current.duration, 1.0);
    double eased = easingFunction(easingKind)(rawProgress);

    current.currentDate = interpolate(current.startDate, current.targetDate, eased);
    current.progress = rawProgress;

    if (rawProgress >= 1.0) {
        current.animating = false;
        current.currentDate = current.targetDate;
        current.progress = 1.0;
    }

    return current.currentDate;
}

void DateTransition::skipToTarget() {
    current.animating = false;
    current.currentDate = current.targetDate;
    current.progress = 1.0;
}

bool DateTransition::isAnimating() const {
    return current.animating;
}

time_point DateTransition::currentDate() const {
    return current.currentDate;
}

const TransitionState& DateTransition::state() const {
    return current;
}

}
