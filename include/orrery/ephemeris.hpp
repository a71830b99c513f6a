/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Ephemeris Module
 * Heliocentric ecliptic longitudes of the major planets, computed by libnova.
 * See: http://libnova.sourceforge.net/
 */

#ifndef __ORRERY_EPHEMERIS_HPP
#define __ORRERY_EPHEMERIS_HPP

#include <orrery/catalog.hpp>
#include <orrery/epoch.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace orrery {

/**
 * Source of heliocentric ecliptic longitudes.
 *
 * Implementations must be synchronous and pure: the same body and instant
 * always give the same answer. They may throw on failure.
 */
class EphemerisModel {
public:
    virtual ~EphemerisModel() = default;

    /**
     * Heliocentric ecliptic longitude of a body, in degrees.
     */
    virtual double eclipticLongitude(Body body, time_point tp) const = 0;
};

/**
 * Ephemeris model backed by libnova's VSOP87 planetary theory.
 *
 * The instant is converted to a Julian Ephemeris Day before the lookup, and the
 * result is the heliocentric longitude of the body referred to the ecliptic and
 * equinox of date.
 */
class Vsop87Ephemeris : public EphemerisModel {
public:
    Vsop87Ephemeris() = default;
    ~Vsop87Ephemeris() override = default;

    /**
     * @throws EphemerisException if libnova gives a non-finite longitude
     */
    double eclipticLongitude(Body body, time_point tp) const override;
};

/**
 * Julian Day (UT) of an instant.
 */
double julianDay(time_point tp);

/**
 * Asks the model for a longitude and normalises it into [0, 360).
 * Instants outside 1700-2300 are answered with a warning.
 * Model exceptions and non-finite results are logged and give std::nullopt.
 */
std::optional<double> tryEclipticLongitude(const EphemerisModel &model, Body body, time_point tp);

/**
 * Fail-soft longitude lookup by body name.
 *
 * Unknown body names give 0 with a warning. Model failures give 0 with an
 * error. Instants outside 1700-2300 are answered with a warning.
 */
double eclipticLongitude(const EphemerisModel &model, std::string_view bodyName, time_point tp);

/**
 * As above, parsing the instant first. Unparseable instants give 0 with an error.
 */
double eclipticLongitude(const EphemerisModel &model, std::string_view bodyName, std::string_view instant);

/**
 * Names of the bodies the ephemeris can answer for.
 */
std::vector<std::string_view> supportedBodies();

}

#endif
