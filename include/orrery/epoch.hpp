/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_EPOCH_HPP
#define __ORRERY_EPOCH_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace orrery {

// Millisecond resolution keeps 1700-2300 (and well beyond) inside a 64-bit count.
using time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using calendar_day = std::chrono::time_point<std::chrono::system_clock, std::chrono::days>;

constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double MILLISECONDS_PER_DAY = SECONDS_PER_DAY * 1000.0;

// Years for which the ephemeris model is considered accurate
constexpr int MIN_ACCURATE_YEAR = 1700;
constexpr int MAX_ACCURATE_YEAR = 2300;

// J2000.0 reference epoch, 2000-01-01T12:00:00Z (946728000 seconds after the Unix epoch)
constexpr time_point J2000_EPOCH{std::chrono::milliseconds{946728000000LL}};
constexpr double J2000_JULIAN_DAY = 2451545.0;

/**
 * Days elapsed since J2000.0. Negative for instants before the epoch.
 */
double daysSinceEpoch(time_point tp);

/**
 * Forgiving variant that parses the instant first.
 * Unparseable text is logged and treated as zero days.
 */
double daysSinceEpoch(std::string_view instant);

/**
 * Converts days since J2000.0 back to an instant, rounded to the nearest millisecond.
 * @throws InvalidInstantException if days is not finite or is out of range
 */
time_point epochToInstant(double days);

/**
 * Parses a UTC instant. Accepted forms:
 *   YYYY-MM-DD
 *   YYYY-MM-DDTHH:MM:SS[.fff][Z]
 *   YYYY-MM-DD HH:MM:SS[.fff]
 * @return The instant, or std::nullopt if the text is not a valid calendar instant
 */
std::optional<time_point> parseInstant(std::string_view text);

/**
 * Formats an instant as ISO-8601 UTC with milliseconds, e.g. 2024-06-15T00:00:00.000Z
 */
std::string formatInstant(time_point tp);

/**
 * Returns the UTC calendar year of an instant.
 */
int utcYear(time_point tp);

/**
 * Returns the UTC calendar day containing the instant.
 */
calendar_day calendarDay(time_point tp);

/**
 * Checks whether the instant lies within MIN_ACCURATE_YEAR..MAX_ACCURATE_YEAR inclusive.
 */
bool isInAccurateRange(time_point tp);

}

#endif
