/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orrery/longitude_cache.hpp>

#include "log_capture.hpp"
#include "stub_ephemeris.hpp"

#include <chrono>

namespace orrery {
namespace {

using test::LogCapture;
using test::StubEphemeris;

time_point at(const char *text) {
    auto tp = parseInstant(text);
    EXPECT_TRUE(tp.has_value()) << "Could not parse " << text;
    return tp.value_or(J2000_EPOCH);
}

time_point dayAfterEpoch(int n) {
    return J2000_EPOCH + std::chrono::days{n};
}

class LongitudeCacheTest : public ::testing::Test {
protected:
    StubEphemeris stub;
    LongitudeCache cache{stub};
};

// ============================================================================
// Hits and misses
// ============================================================================

TEST_F(LongitudeCacheTest, StartsEmpty) {
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.capacity(), 1000u);
}

TEST_F(LongitudeCacheTest, RepeatedLookupUsesCache) {
    double first = cache.get(Body::Earth, at("2024-06-15"));
    double second = cache.get(Body::Earth, at("2024-06-15"));
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(stub.calls, 1);
}

TEST_F(LongitudeCacheTest, SameDayDifferentTimeSharesEntry) {
    double morning = cache.get(Body::Earth, at("2024-06-15T01:00:00Z"));
    double evening = cache.get(Body::Earth, at("2024-06-15T23:00:00Z"));
    EXPECT_EQ(morning, evening);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(LongitudeCacheTest, DistinctBodyOrDayAddsEntry) {
    cache.get(Body::Earth, at("2024-06-15"));
    cache.get(Body::Mars, at("2024-06-15"));
    EXPECT_EQ(cache.size(), 2u);
    cache.get(Body::Earth, at("2024-06-16"));
    EXPECT_EQ(cache.size(), 3u);
}

TEST_F(LongitudeCacheTest, ValueMatchesBoundary) {
    auto tp = at("2024-06-15");
    double cached = cache.get("Mars", tp);
    EXPECT_EQ(cached, eclipticLongitude(stub, "Mars", tp));
}

TEST_F(LongitudeCacheTest, ClearEmptiesCache) {
    cache.get(Body::Earth, at("2024-06-15"));
    cache.get(Body::Venus, at("2024-06-15"));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);

    cache.get(Body::Earth, at("2024-06-15"));
    EXPECT_EQ(stub.calls, 3);
}

TEST(LongitudeCacheVsop87Test, EarthDateTextCachedOnce) {
    Vsop87Ephemeris model;
    LongitudeCache cache(model);

    double first = cache.get("Earth", "2024-06-15");
    double second = cache.get("Earth", "2024-06-15");
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, eclipticLongitude(model, "Earth", "2024-06-15"));
}

TEST_F(LongitudeCacheTest, OutOfRangeMissWarns) {
    LogCapture log;
    cache.get(Body::Uranus, at("2350-06-01"));
    EXPECT_TRUE(log.contains("outside the supported range"));
    EXPECT_EQ(log.warnings(), 1);

    // Served from the cache, the model is not asked again
    cache.get(Body::Uranus, at("2350-06-01"));
    EXPECT_EQ(log.warnings(), 1);
    EXPECT_EQ(stub.calls, 1);
}

// ============================================================================
// Failures are not cached
// ============================================================================

TEST_F(LongitudeCacheTest, UnknownBodyNotCached) {
    EXPECT_EQ(cache.get("Pluto", at("2024-06-15")), 0.0);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(stub.calls, 0);
}

TEST_F(LongitudeCacheTest, InvalidDateNotCached) {
    EXPECT_EQ(cache.get("Earth", "invalid-date"), 0.0);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(LongitudeCacheTest, ModelFailureNotCached) {
    stub.failure = StubEphemeris::Failure::Throw;
    EXPECT_EQ(cache.get(Body::Earth, at("2024-06-15")), 0.0);
    EXPECT_EQ(cache.size(), 0u);

    stub.failure = StubEphemeris::Failure::None;
    cache.get(Body::Earth, at("2024-06-15"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(stub.calls, 2);
}

// ============================================================================
// Eviction
// ============================================================================

TEST_F(LongitudeCacheTest, NeverExceedsCapacity) {
    for (int day = 0; day < 2500; ++day) {
        cache.get(Body::Jupiter, dayAfterEpoch(day));
        ASSERT_LE(cache.size(), cache.capacity());
    }
}

TEST_F(LongitudeCacheTest, EvictsOldestBatch) {
    for (int day = 0; day < 1000; ++day) {
        cache.get(Body::Saturn, dayAfterEpoch(day));
    }
    EXPECT_EQ(cache.size(), 1000u);

    // The next new entry drops the first hundred
    cache.get(Body::Saturn, dayAfterEpoch(1000));
    EXPECT_EQ(cache.size(), 901u);

    int calls = stub.calls;
    cache.get(Body::Saturn, dayAfterEpoch(100));
    EXPECT_EQ(stub.calls, calls);

    cache.get(Body::Saturn, dayAfterEpoch(99));
    EXPECT_EQ(stub.calls, calls + 1);
}

TEST(LongitudeCacheSmallTest, CustomCapacity) {
    StubEphemeris stub;
    LongitudeCache cache(stub, 10, 3);
    EXPECT_EQ(cache.capacity(), 10u);

    for (int day = 0; day < 10; ++day) {
        cache.get(Body::Earth, dayAfterEpoch(day));
    }
    cache.get(Body::Earth, dayAfterEpoch(10));
    EXPECT_EQ(cache.size(), 8u);
}

TEST(LongitudeCacheSmallTest, ZeroCapacityStillHoldsOne) {
    StubEphemeris stub;
    LongitudeCache cache(stub, 0);
    cache.get(Body::Earth, dayAfterEpoch(0));
    cache.get(Body::Earth, dayAfterEpoch(1));
    EXPECT_EQ(cache.capacity(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

}  // namespace
}  // namespace orrery
