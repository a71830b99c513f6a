/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_DATE_TRANSITION_HPP
#define __ORRERY_DATE_TRANSITION_HPP

#include <orrery/easing.hpp>
#include <orrery/epoch.hpp>

#include <chrono>

namespace orrery {

using milliseconds_f = std::chrono::duration<double, std::milli>;

enum class TimeDirection {
    Forward,    ///< Target is later than start, planets move counter-clockwise
    Backward    ///< Target is earlier than (or equal to) start, planets move clockwise
};

/**
 * Bounds for the length of an animated date transition.
 */
struct DurationConfig {
    milliseconds_f minDuration{300.0};
    milliseconds_f maxDuration{3000.0};
};

/**
 * Linear interpolation between two instants on the millisecond timeline.
 * Progress is clamped to [0, 1]; 0 gives start and 1 gives target exactly.
 */
time_point interpolate(time_point start, time_point target, double progress);

TimeDirection direction(time_point start, time_point target);

/**
 * Length of the animation between two instants.
 *
 * The base length grows with the logarithm of the span in days,
 * clamp(log10(days + 1) * 1000ms, min, max), and is shortened by the speed
 * setting, base * (1 - 0.9 * speed), never going below a tenth of the minimum.
 * Equal instants and a speed of 1 or more (instant mode) give zero.
 *
 * @param speed Animation speed in [0, 1]; values outside are clamped
 */
milliseconds_f duration(time_point start, time_point target, double speed,
                        const DurationConfig &config = DurationConfig{});

/**
 * Two instants less than one second apart are treated as the same date.
 */
bool isSameInstant(time_point a, time_point b);

struct TransitionState {
    time_point startDate = J2000_EPOCH;
    time_point targetDate = J2000_EPOCH;
    time_point currentDate = J2000_EPOCH;
    double progress = 0.0;                   ///< Raw (un-eased) progress, [0, 1]
    TimeDirection direction = TimeDirection::Forward;
    milliseconds_f duration{0.0};
    bool animating = false;
};

/**
 * Animated transition from the current date to a newly selected one.
 *
 * The owner calls advance() once per frame with the frame time. Each frame the
 * raw progress is eased and used to interpolate the displayed date.
 */
class DateTransition {
public:
    static constexpr double DEFAULT_ANIMATION_SPEED = 0.5;

    explicit DateTransition(time_point current,
                            Easing easing = Easing::EaseInOutCubic,
                            DurationConfig config = DurationConfig{});
    ~DateTransition() = default;

    /**
     * Sets the animation speed, clamped to [0, 1]. A speed of 1 is instant mode.
     */
    void setAnimationSpeed(double speed);
    double animationSpeed() const;
    bool isInstantMode() const;

    void setEasing(Easing easing);
    Easing easing() const;

    /**
     * Starts a transition from the current date to the target.
     *
     * In instant mode, or when the computed duration is zero, the date jumps
     * straight to the target. A target within one second of the current date
     * is ignored. A transition already in progress restarts from the date
     * currently displayed.
     */
    void begin(time_point target);

    /**
     * Advances a running transition by the given frame time.
     * @return The date to display this frame
     */
    time_point advance(milliseconds_f delta);

    /**
     * Ends any running transition and jumps to its target.
     */
    void skipToTarget();

    bool isAnimating() const;
    time_point currentDate() const;
    const TransitionState& state() const;

private:
    Easing easingKind;
    DurationConfig config;
    double speed = DEFAULT_ANIMATION_SPEED;
    milliseconds_f elapsed{0.0};
    TransitionState current;
};

}

#endif
