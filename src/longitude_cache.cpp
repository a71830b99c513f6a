/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/longitude_cache.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::debug;
using spdlog::warn;
using spdlog::error;

LongitudeCache::LongitudeCache(const EphemerisModel &model, std::size_t capacity, std::size_t evictionBatch)
    : model(model), maxEntries(std::max<std::size_t>(capacity, 1)),
      evictionBatch(std::max<std::size_t>(evictionBatch, 1)) {}

double LongitudeCache::get(Body body, time_point tp) {
    Key key{body, calendarDay(tp)};

    auto it = entries.find(key);
    if (it != entries.end()) {
        return it->second;
    }

    auto longitude = tryEclipticLongitude(model, body, tp);
    if (!longitude.has_value()) {
        return 0.0;
    }

    if (entries.size() >= maxEntries) {
        evict();
    }

    entries.emplace(key, *longitude);
    insertionOrder.push_back(key);
    return *longitude;
}

double LongitudeCache::get(std::string_view name, time_point tp) {
    auto body = bodyFromName(name);
    if (!body.has_value()) {
        warn("Unsupported body: {}", name);
        return 0.0;
    }
    return get(*body, tp);
}

double LongitudeCache::get(std::string_view name, std::string_view instant) {
    auto tp = parseInstant(instant);
    if (!tp.has_value()) {
        error("Invalid date provided to longitude cache: '{}'", instant);
        return 0.0;
    }
    return get(name, *tp);
}

void LongitudeCache::clear() {
    entries.clear();
    insertionOrder.clear();
}

std::size_t LongitudeCache::size() const {
    return entries.size();
}

std::size_t LongitudeCache::capacity() const {
    return maxEntries;
}

void LongitudeCache::evict() {
    auto count = std::min(evictionBatch, insertionOrder.size());
    for (std::size_t i = 0; i < count; ++i) {
        entries.erase(insertionOrder.front());
        insertionOrder.pop_front();
    }
    debug("Longitude cache evicted {} entries, {} remain", count, entries.size());
}

}
