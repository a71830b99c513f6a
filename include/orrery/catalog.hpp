/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_CATALOG_HPP
#define __ORRERY_CATALOG_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orrery {

// 1 AU is drawn as 1000 scene units
constexpr double AU_TO_SCENE_UNITS = 1000.0;

/**
 * The eight planets the engine knows about.
 */
enum class Body {
    Mercury,
    Venus,
    Earth,
    Mars,
    Jupiter,
    Saturn,
    Uranus,
    Neptune
};

constexpr std::size_t BODY_COUNT = 8;

constexpr std::array<Body, BODY_COUNT> ALL_BODIES = {
    Body::Mercury, Body::Venus, Body::Earth, Body::Mars,
    Body::Jupiter, Body::Saturn, Body::Uranus, Body::Neptune
};

constexpr std::size_t bodyIndex(Body body) {
    return static_cast<std::size_t>(body);
}

/**
 * Canonical name of a body ("Mercury" ... "Neptune").
 */
std::string_view bodyName(Body body);

/**
 * Case-sensitive lookup of a body by its canonical name.
 */
std::optional<Body> bodyFromName(std::string_view name);

enum class SpinDirection {
    Prograde,
    Retrograde
};

/**
 * Sidereal rotation of a body about its own axis.
 */
struct Rotation {
    double periodMagnitudeDays;   ///< Length of one sidereal day, always >= 0
    SpinDirection direction;      ///< Retrograde bodies spin clockwise seen from above

    /**
     * Builds a rotation from a signed period in days, where a negative
     * period means retrograde spin.
     */
    static Rotation fromSignedDays(double days);

    /**
     * +1 for prograde spin, -1 for retrograde spin.
     */
    double directionSign() const;
};

/**
 * Immutable reference data for one body.
 */
struct OrbitalParameters {
    Body body;
    double distanceScale;         ///< Semi-major axis in scene units (> 0)
    double eccentricity;          ///< [0, 1)
    double inclinationDegrees;    ///< Tilt of the orbit plane relative to the ecliptic
    double axialTiltDegrees;      ///< Tilt of the spin axis relative to the orbit plane
    double orbitalPeriodDays;     ///< Sidereal orbital period (> 0)
    Rotation rotation;
};

/**
 * Orbital parameters for all eight bodies, in ALL_BODIES order.
 * Values are from the NASA JPL planetary fact sheets.
 */
const std::vector<OrbitalParameters>& planetCatalog();

/**
 * Orbital parameters for a single body from planetCatalog().
 */
const OrbitalParameters& orbitalParameters(Body body);

/**
 * A single problem found while validating catalog data.
 */
struct ValidationError {
    std::string bodyName;
    std::string field;
    double value;
    std::string expected;
};

/**
 * Checks one body's parameters. Returns an empty vector when they are valid.
 */
std::vector<ValidationError> validateOrbitalParameters(const OrbitalParameters &params);

/**
 * Checks every entry of a catalog. Returns an empty vector when all are valid.
 */
std::vector<ValidationError> validateCatalog(const std::vector<OrbitalParameters> &catalog);

}

#endif
