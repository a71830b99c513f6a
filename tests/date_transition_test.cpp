/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orrery/date_transition.hpp>

#include <chrono>
#include <cmath>
#include <limits>

namespace orrery {
namespace {

using std::chrono::milliseconds;

time_point at(const char *text) {
    auto tp = parseInstant(text);
    EXPECT_TRUE(tp.has_value()) << "Could not parse " << text;
    return tp.value_or(J2000_EPOCH);
}

// ============================================================================
// interpolate
// ============================================================================

TEST(InterpolateTest, Endpoints) {
    auto start = at("1850-03-01T10:00:00Z");
    auto target = at("2150-11-30T17:45:12.345Z");
    EXPECT_EQ(interpolate(start, target, 0.0), start);
    EXPECT_EQ(interpolate(start, target, 1.0), target);
}

TEST(InterpolateTest, ExactMidpoint) {
    EXPECT_EQ(interpolate(at("2024-01-01"), at("2024-01-03"), 0.5), at("2024-01-02"));
    EXPECT_EQ(interpolate(at("2024-01-03"), at("2024-01-01"), 0.5), at("2024-01-02"));
}

TEST(InterpolateTest, ProgressIsClamped) {
    auto start = at("2024-01-01");
    auto target = at("2024-12-31");
    EXPECT_EQ(interpolate(start, target, -0.5), start);
    EXPECT_EQ(interpolate(start, target, 1.5), target);
    EXPECT_EQ(interpolate(start, target, std::numeric_limits<double>::quiet_NaN()), start);
}

TEST(InterpolateTest, MovesMonotonically) {
    auto start = at("2024-01-01");
    auto target = at("1700-01-01");
    auto previous = start;
    for (int i = 1; i <= 100; ++i) {
        auto tp = interpolate(start, target, i / 100.0);
        EXPECT_LE(tp, previous);
        previous = tp;
    }
}

// ============================================================================
// direction / isSameInstant
// ============================================================================

TEST(DirectionTest, ForwardAndBackward) {
    EXPECT_EQ(direction(at("2024-01-01"), at("2024-01-02")), TimeDirection::Forward);
    EXPECT_EQ(direction(at("2024-01-02"), at("2024-01-01")), TimeDirection::Backward);
    EXPECT_EQ(direction(at("2024-01-01"), at("2024-01-01")), TimeDirection::Backward);
}

TEST(SameInstantTest, WithinOneSecond) {
    auto tp = at("2024-01-01");
    EXPECT_TRUE(isSameInstant(tp, tp));
    EXPECT_TRUE(isSameInstant(tp, tp + milliseconds{999}));
    EXPECT_TRUE(isSameInstant(tp + milliseconds{999}, tp));
    EXPECT_FALSE(isSameInstant(tp, tp + milliseconds{1000}));
}

// ============================================================================
// duration
// ============================================================================

TEST(DurationTest, ZeroForEqualDatesOrInstantMode) {
    auto tp = at("2024-01-01");
    EXPECT_EQ(duration(tp, tp, 0.5).count(), 0.0);
    EXPECT_EQ(duration(tp, at("2025-01-01"), 1.0).count(), 0.0);
    EXPECT_EQ(duration(tp, at("2025-01-01"), 1.5).count(), 0.0);
    EXPECT_EQ(duration(tp, at("2025-01-01"), std::numeric_limits<double>::quiet_NaN()).count(), 0.0);
}

TEST(DurationTest, LogarithmicBase) {
    // One day: log10(2) * 1000 = 301ms
    EXPECT_NEAR(duration(at("2024-01-01"), at("2024-01-02"), 0.0).count(), 301.03, 0.01);
    // One hour: below the minimum
    EXPECT_DOUBLE_EQ(duration(at("2024-01-01"), at("2024-01-01T01:00:00Z"), 0.0).count(), 300.0);
    // Ten years: above the maximum
    EXPECT_DOUBLE_EQ(duration(at("2014-01-01"), at("2024-01-01"), 0.0).count(), 3000.0);
}

TEST(DurationTest, SpeedShortensDuration) {
    auto start = at("2014-01-01");
    auto target = at("2024-01-01");
    EXPECT_NEAR(duration(start, target, 0.5).count(), 1650.0, 1e-9);
    EXPECT_DOUBLE_EQ(duration(start, target, -1.0).count(), duration(start, target, 0.0).count());
}

TEST(DurationTest, MonotonicInSpan) {
    auto start = at("2000-01-01");
    double previous = 0.0;
    for (int days : {1, 2, 5, 10, 50, 100, 500, 1000, 10000}) {
        double d = duration(start, start + std::chrono::days{days}, 0.3).count();
        EXPECT_GE(d, previous) << days;
        previous = d;
    }
}

TEST(DurationTest, DecreasingInSpeed) {
    auto start = at("2000-01-01");
    auto target = at("2001-01-01");
    double previous = std::numeric_limits<double>::infinity();
    for (double speed : {0.0, 0.2, 0.4, 0.6, 0.8, 0.99}) {
        double d = duration(start, target, speed).count();
        EXPECT_LT(d, previous) << speed;
        EXPECT_GE(d, 30.0);
        previous = d;
    }
}

TEST(DurationTest, CustomBounds) {
    DurationConfig config{milliseconds_f{100.0}, milliseconds_f{500.0}};
    EXPECT_DOUBLE_EQ(duration(at("1900-01-01"), at("2100-01-01"), 0.0, config).count(), 500.0);
    EXPECT_DOUBLE_EQ(duration(at("2024-01-01"), at("2024-01-01T00:00:02Z"), 0.0, config).count(), 100.0);
}

TEST(DurationTest, ReversedBoundsUseMinimum) {
    DurationConfig config{milliseconds_f{2000.0}, milliseconds_f{500.0}};
    EXPECT_DOUBLE_EQ(duration(at("1900-01-01"), at("2100-01-01"), 0.0, config).count(), 2000.0);
    EXPECT_DOUBLE_EQ(duration(at("2024-01-01"), at("2024-01-02"), 0.0, config).count(), 2000.0);
}

// ============================================================================
// DateTransition
// ============================================================================

class DateTransitionTest : public ::testing::Test {
protected:
    time_point start = at("2024-01-01");
    time_point target = at("2025-01-01");
    DateTransition transition{start};
};

TEST_F(DateTransitionTest, Defaults) {
    EXPECT_DOUBLE_EQ(transition.animationSpeed(), 0.5);
    EXPECT_FALSE(transition.isInstantMode());
    EXPECT_FALSE(transition.isAnimating());
    EXPECT_EQ(transition.easing(), Easing::EaseInOutCubic);
    EXPECT_EQ(transition.currentDate(), start);
}

TEST_F(DateTransitionTest, AnimationSpeedIsClamped) {
    transition.setAnimationSpeed(2.0);
    EXPECT_DOUBLE_EQ(transition.animationSpeed(), 1.0);
    EXPECT_TRUE(transition.isInstantMode());

    transition.setAnimationSpeed(-1.0);
    EXPECT_DOUBLE_EQ(transition.animationSpeed(), 0.0);
    EXPECT_FALSE(transition.isInstantMode());
}

TEST_F(DateTransitionTest, InstantModeJumps) {
    transition.setAnimationSpeed(1.0);
    transition.begin(target);
    EXPECT_FALSE(transition.isAnimating());
    EXPECT_EQ(transition.currentDate(), target);
    EXPECT_DOUBLE_EQ(transition.state().progress, 1.0);
}

TEST_F(DateTransitionTest, SameDateIsNoOp) {
    transition.begin(start + milliseconds{500});
    EXPECT_FALSE(transition.isAnimating());
    EXPECT_EQ(transition.currentDate(), start);
}

TEST_F(DateTransitionTest, AnimatesToTarget) {
    transition.begin(target);
    ASSERT_TRUE(transition.isAnimating());

    const auto &state = transition.state();
    EXPECT_EQ(state.startDate, start);
    EXPECT_EQ(state.targetDate, target);
    EXPECT_EQ(state.direction, TimeDirection::Forward);
    EXPECT_DOUBLE_EQ(state.duration.count(), duration(start, target, 0.5).count());

    auto previous = transition.currentDate();
    int frames = 0;
    while (transition.isAnimating() && frames < 1000) {
        auto tp = transition.advance(milliseconds_f{16.0});
        EXPECT_GE(tp, previous);
        EXPECT_LE(tp, target);
        previous = tp;
        ++frames;
    }

    EXPECT_FALSE(transition.isAnimating());
    EXPECT_EQ(transition.currentDate(), target);
    EXPECT_DOUBLE_EQ(transition.state().progress, 1.0);
    EXPECT_GT(frames, 10);
}

TEST_F(DateTransitionTest, LinearEasingHalfway) {
    transition.setEasing(Easing::Linear);
    transition.setAnimationSpeed(0.0);
    transition.begin(at("2024-01-03"));

    double half = transition.state().duration.count() / 2.0;
    auto tp = transition.advance(milliseconds_f{half});
    auto diff = std::chrono::abs(tp - at("2024-01-02"));
    EXPECT_LE(diff.count(), 1);
    EXPECT_NEAR(transition.state().progress, 0.5, 1e-9);
}

TEST_F(DateTransitionTest, BackwardTransition) {
    auto past = at("1900-01-01");
    transition.begin(past);
    EXPECT_EQ(transition.state().direction, TimeDirection::Backward);

    transition.advance(milliseconds_f{100000.0});
    EXPECT_EQ(transition.currentDate(), past);
    EXPECT_FALSE(transition.isAnimating());
}

TEST_F(DateTransitionTest, SkipToTarget) {
    transition.begin(target);
    transition.advance(milliseconds_f{50.0});
    transition.skipToTarget();
    EXPECT_FALSE(transition.isAnimating());
    EXPECT_EQ(transition.currentDate(), target);
}

TEST_F(DateTransitionTest, RestartFromDisplayedDate) {
    transition.begin(target);
    auto midway = transition.advance(milliseconds_f{transition.state().duration.count() / 2.0});

    auto next = at("2030-01-01");
    transition.begin(next);
    EXPECT_TRUE(transition.isAnimating());
    EXPECT_EQ(transition.state().startDate, midway);
    EXPECT_EQ(transition.state().targetDate, next);
    EXPECT_DOUBLE_EQ(transition.state().progress, 0.0);
}

TEST_F(DateTransitionTest, SelectingShownDateStops) {
    transition.begin(start + std::chrono::days{3650});
    auto shown = transition.advance(milliseconds_f{200.0});
    ASSERT_TRUE(transition.isAnimating());

    transition.begin(shown);
    EXPECT_FALSE(transition.isAnimating());
    EXPECT_EQ(transition.state().targetDate, shown);
    EXPECT_EQ(transition.advance(milliseconds_f{200.0}), shown);
    EXPECT_EQ(transition.currentDate(), shown);
}

TEST_F(DateTransitionTest, InvalidFrameTimeIgnored) {
    transition.begin(target);
    transition.advance(milliseconds_f{std::numeric_limits<double>::quiet_NaN()});
    transition.advance(milliseconds_f{-10.0});
    EXPECT_EQ(transition.currentDate(), start);
    EXPECT_TRUE(transition.isAnimating());
}

TEST_F(DateTransitionTest, AdvanceWhenIdleReturnsCurrent) {
    EXPECT_EQ(transition.advance(milliseconds_f{100.0}), start);
}

}  // namespace
}  // namespace orrery
