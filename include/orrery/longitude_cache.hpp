/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_LONGITUDE_CACHE_HPP
#define __ORRERY_LONGITUDE_CACHE_HPP

#include <orrery/catalog.hpp>
#include <orrery/ephemeris.hpp>
#include <orrery/epoch.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <string_view>
#include <utility>

namespace orrery {

/**
 * Bounded memo of ecliptic longitudes keyed by body and UTC calendar day.
 *
 * All instants within the same UTC day share one entry. When the cache is full,
 * the oldest entries by insertion order are evicted in a batch before a new
 * entry is stored. Failed lookups are never stored.
 *
 * Not thread-safe. Each cache belongs to a single simulation context.
 */
class LongitudeCache {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1000;
    static constexpr std::size_t DEFAULT_EVICTION_BATCH = 100;

    explicit LongitudeCache(const EphemerisModel &model,
                            std::size_t capacity = DEFAULT_CAPACITY,
                            std::size_t evictionBatch = DEFAULT_EVICTION_BATCH);
    ~LongitudeCache() = default;

    /**
     * Longitude of a body in degrees, [0, 360).
     * Model failures give 0 and are not cached.
     */
    double get(Body body, time_point tp);

    /**
     * As above by body name. Unknown names give 0 with a warning.
     */
    double get(std::string_view name, time_point tp);

    /**
     * As above, parsing the instant first. Unparseable instants give 0 with an error.
     */
    double get(std::string_view name, std::string_view instant);

    void clear();

    std::size_t size() const;
    std::size_t capacity() const;

private:
    using Key = std::pair<Body, calendar_day>;

    void evict();

    const EphemerisModel &model;
    std::size_t maxEntries;
    std::size_t evictionBatch;
    std::map<Key, double> entries;
    std::deque<Key> insertionOrder;
};

}

#endif
