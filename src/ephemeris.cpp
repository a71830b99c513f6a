/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/ephemeris.hpp>
#include <orrery/angles.hpp>
#include <orrery/exceptions.hpp>

#include <array>
#include <cmath>
#include <exception>
#include <string>

#include <libnova/libnova.h>
#include <spdlog/spdlog.h>

namespace orrery {

using spdlog::warn;
using spdlog::error;

using HelioCoordsFunction = void (*)(double, ln_helio_posn *);

// libnova lookups, in catalog order
static const std::array<HelioCoordsFunction, BODY_COUNT> HELIO_COORDS = {
    ln_get_mercury_helio_coords,
    ln_get_venus_helio_coords,
    ln_get_earth_helio_coords,
    ln_get_mars_helio_coords,
    ln_get_jupiter_helio_coords,
    ln_get_saturn_helio_coords,
    ln_get_uranus_helio_coords,
    ln_get_neptune_helio_coords,
};

double julianDay(time_point tp) {
    return J2000_JULIAN_DAY + daysSinceEpoch(tp);
}

double Vsop87Ephemeris::eclipticLongitude(Body body, time_point tp) const {
    double jde = ln_get_jde(julianDay(tp));

    ln_helio_posn position{};
    HELIO_COORDS.at(bodyIndex(body))(jde, &position);

    if (!std::isfinite(position.L)) {
        throw EphemerisException("libnova returned no longitude for " + std::string(bodyName(body))
                                 + " at JDE " + std::to_string(jde));
    }
    return position.L;
}

std::optional<double> tryEclipticLongitude(const EphemerisModel &model, Body body, time_point tp) {
    if (!isInAccurateRange(tp)) {
        warn("Date {} is outside the supported range ({}-{}), accuracy may be reduced",
             formatInstant(tp), MIN_ACCURATE_YEAR, MAX_ACCURATE_YEAR);
    }

    try {
        double longitude = model.eclipticLongitude(body, tp);
        if (!std::isfinite(longitude)) {
            error("Ephemeris returned a non-finite longitude for {} at {}", bodyName(body), formatInstant(tp));
            return std::nullopt;
        }
        return normalizeDegrees(longitude);
    } catch (const std::exception &e) {
        error("Error calculating longitude for {} at {}: {}", bodyName(body), formatInstant(tp), e.what());
        return std::nullopt;
    }
}

double eclipticLongitude(const EphemerisModel &model, std::string_view name, time_point tp) {
    auto body = bodyFromName(name);
    if (!body.has_value()) {
        warn("Unsupported body: {}", name);
        return 0.0;
    }

    return tryEclipticLongitude(model, *body, tp).value_or(0.0);
}

double eclipticLongitude(const EphemerisModel &model, std::string_view name, std::string_view instant) {
    auto tp = parseInstant(instant);
    if (!tp.has_value()) {
        error("Invalid date provided to eclipticLongitude: '{}'", instant);
        return 0.0;
    }
    return eclipticLongitude(model, name, *tp);
}

std::vector<std::string_view> supportedBodies() {
    std::vector<std::string_view> names;
    names.reserve(ALL_BODIES.size());
    for (auto body : ALL_BODIES) {
        names.push_back(bodyName(body));
    }
    return names;
}

}
