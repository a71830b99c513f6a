/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/epoch.hpp>
#include <orrery/exceptions.hpp>

#include <array>
#include <chrono>
#include <cmath>
#include <sstream>
#include <string>

#include <date/date.h>
#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::error;

// Helper function to trim surrounding whitespace from a string_view
static std::string_view trim(std::string_view str) {
    auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

double daysSinceEpoch(time_point tp) {
    auto millis = (tp - J2000_EPOCH).count();
    return static_cast<double>(millis) / MILLISECONDS_PER_DAY;
}

double daysSinceEpoch(std::string_view instant) {
    auto tp = parseInstant(instant);
    if (!tp.has_value()) {
        error("Invalid instant provided to daysSinceEpoch: '{}'", instant);
        return 0.0;
    }
    return daysSinceEpoch(*tp);
}

time_point epochToInstant(double days) {
    // Roughly +/- 25 million years, far inside the range of a millisecond count
    constexpr double MAX_DAYS = 1.0e10;

    if (!std::isfinite(days)) {
        throw InvalidInstantException("Days since epoch is not finite");
    }
    if (std::abs(days) > MAX_DAYS) {
        throw InvalidInstantException("Days since epoch out of range: " + std::to_string(days));
    }

    auto millis = std::llround(days * MILLISECONDS_PER_DAY);
    return J2000_EPOCH + std::chrono::milliseconds{millis};
}

std::optional<time_point> parseInstant(std::string_view text) {
    // Longest forms first so that a bare date does not match a prefix of a full timestamp
    constexpr std::array<const char*, 7> formats = {
        "%Y-%m-%dT%H:%M:%SZ",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%MZ",
        "%Y-%m-%dT%H:%M",
        "%Y-%m-%d %H:%M",
        "%Y-%m-%d",
    };

    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    for (auto format : formats) {
        std::istringstream in{std::string(trimmed)};
        time_point tp;
        in >> date::parse(format, tp);
        if (in.fail()) {
            continue;
        }
        // Reject trailing garbage
        if (in.peek() != std::char_traits<char>::eof()) {
            continue;
        }
        return tp;
    }

    return std::nullopt;
}

std::string formatInstant(time_point tp) {
    return date::format("%FT%TZ", tp);
}

int utcYear(time_point tp) {
    using namespace std::chrono;
    year_month_day ymd{floor<days>(tp)};
    return static_cast<int>(ymd.year());
}

calendar_day calendarDay(time_point tp) {
    return std::chrono::floor<std::chrono::days>(tp);
}

bool isInAccurateRange(time_point tp) {
    int year = utcYear(tp);
    return year >= MIN_ACCURATE_YEAR && year <= MAX_ACCURATE_YEAR;
}

}
