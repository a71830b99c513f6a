/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orrery/inclination.hpp>

#include <cmath>
#include <limits>
#include <numbers>

namespace orrery {
namespace {

TEST(InclinationTest, ZeroInclinationLeavesPointFlat) {
    auto p = applyInclination(123.0, -45.0, 0.0);
    EXPECT_DOUBLE_EQ(p.x, 123.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
    EXPECT_DOUBLE_EQ(p.z, -45.0);
}

TEST(InclinationTest, RightAngleTiltsIntoY) {
    auto p = applyInclination(100.0, 50.0, 90.0);
    EXPECT_NEAR(p.x, 100.0, 1e-9);
    EXPECT_NEAR(p.y, -50.0, 1e-9);
    EXPECT_NEAR(p.z, 0.0, 1e-9);
}

TEST(InclinationTest, PreservesLength) {
    for (double incl = -180.0; incl <= 180.0; incl += 7.5) {
        for (double angle = 0.0; angle < 2.0 * std::numbers::pi; angle += 0.3) {
            double x = 1520.0 * std::cos(angle);
            double z = 1378.0 * std::sin(angle);
            auto p = applyInclination(x, z, incl);
            EXPECT_NEAR(p.magnitude(), std::hypot(x, z), 1e-4);
        }
    }
}

TEST(InclinationTest, NonFiniteInclinationIsFlat) {
    for (double bad : {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity()}) {
        auto p = applyInclination(10.0, 20.0, bad);
        EXPECT_DOUBLE_EQ(p.x, 10.0);
        EXPECT_DOUBLE_EQ(p.y, 0.0);
        EXPECT_DOUBLE_EQ(p.z, 20.0);
    }
}

TEST(InclinationTest, ClampsOutsideHalfTurn) {
    auto clamped = applyInclination(10.0, 20.0, 400.0);
    auto halfTurn = applyInclination(10.0, 20.0, 180.0);
    EXPECT_DOUBLE_EQ(clamped.y, halfTurn.y);
    EXPECT_DOUBLE_EQ(clamped.z, halfTurn.z);

    EXPECT_NEAR(halfTurn.z, -20.0, 1e-9);
}

TEST(InclinationTest, RotationMatchesTransform) {
    EXPECT_NEAR(inclinationRotation(7.005), 7.005 * std::numbers::pi / 180.0, 1e-12);
    EXPECT_NEAR(inclinationRotation(-200.0), -std::numbers::pi, 1e-12);
    EXPECT_EQ(inclinationRotation(std::numeric_limits<double>::quiet_NaN()), 0.0);
}

}  // namespace
}  // namespace orrery
