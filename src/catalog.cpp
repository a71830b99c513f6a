/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orrery/catalog.hpp>

#include <cmath>

namespace orrery {

std::string_view bodyName(Body body) {
    switch (body) {
        case Body::Mercury: return "Mercury";
        case Body::Venus:   return "Venus";
        case Body::Earth:   return "Earth";
        case Body::Mars:    return "Mars";
        case Body::Jupiter: return "Jupiter";
        case Body::Saturn:  return "Saturn";
        case Body::Uranus:  return "Uranus";
        case Body::Neptune: return "Neptune";
    }
    return "";
}

std::optional<Body> bodyFromName(std::string_view name) {
    for (auto body : ALL_BODIES) {
        if (bodyName(body) == name) {
            return body;
        }
    }
    return std::nullopt;
}

Rotation Rotation::fromSignedDays(double days) {
    return {
        std::abs(days),
        days < 0.0 ? SpinDirection::Retrograde : SpinDirection::Prograde
    };
}

double Rotation::directionSign() const {
    return direction == SpinDirection::Retrograde ? -1.0 : 1.0;
}

const std::vector<OrbitalParameters>& planetCatalog() {
    static const std::vector<OrbitalParameters> catalog = {
        // body            distance (AU)                  e       incl    tilt    period     rotation
        {Body::Mercury, 0.39 * AU_TO_SCENE_UNITS,  0.2056, 7.005,  0.034,  87.969,   Rotation::fromSignedDays(58.646)},
        {Body::Venus,   0.72 * AU_TO_SCENE_UNITS,  0.0068, 3.395,  177.4,  224.701,  Rotation::fromSignedDays(-243.025)},
        {Body::Earth,   1.0 * AU_TO_SCENE_UNITS,   0.0167, 0.0,    23.5,   365.256,  Rotation::fromSignedDays(1.0)},
        {Body::Mars,    1.52 * AU_TO_SCENE_UNITS,  0.0934, 1.85,   25.2,   686.98,   Rotation::fromSignedDays(1.03)},
        {Body::Jupiter, 5.2 * AU_TO_SCENE_UNITS,   0.0484, 1.303,  3.13,   4332.59,  Rotation::fromSignedDays(0.41)},
        {Body::Saturn,  9.55 * AU_TO_SCENE_UNITS,  0.0539, 2.485,  26.7,   10759.22, Rotation::fromSignedDays(0.44)},
        {Body::Uranus,  19.19 * AU_TO_SCENE_UNITS, 0.0463, 0.773,  97.8,   30688.5,  Rotation::fromSignedDays(-0.72)},
        {Body::Neptune, 30.07 * AU_TO_SCENE_UNITS, 0.0086, 1.77,   28.3,   60182.0,  Rotation::fromSignedDays(0.67)},
    };
    return catalog;
}

const OrbitalParameters& orbitalParameters(Body body) {
    return planetCatalog().at(bodyIndex(body));
}

std::vector<ValidationError> validateOrbitalParameters(const OrbitalParameters &params) {
    std::vector<ValidationError> errors;
    std::string name(bodyName(params.body));

    if (!std::isfinite(params.distanceScale) || params.distanceScale <= 0.0) {
        errors.push_back({name, "distanceScale", params.distanceScale, "positive number"});
    }

    if (!std::isfinite(params.orbitalPeriodDays) || params.orbitalPeriodDays <= 0.0) {
        errors.push_back({name, "orbitalPeriodDays", params.orbitalPeriodDays, "positive number"});
    }

    // NaN fails both comparisons, so test for the valid range instead
    if (!(params.eccentricity >= 0.0 && params.eccentricity < 1.0)) {
        errors.push_back({name, "eccentricity", params.eccentricity, "number between 0 and 1"});
    }

    if (!std::isfinite(params.rotation.periodMagnitudeDays) || params.rotation.periodMagnitudeDays < 0.0) {
        errors.push_back({name, "rotation.periodMagnitudeDays", params.rotation.periodMagnitudeDays,
                          "non-negative number"});
    }

    if (!(params.inclinationDegrees >= 0.0 && params.inclinationDegrees <= 180.0)) {
        errors.push_back({name, "inclinationDegrees", params.inclinationDegrees,
                          "number between 0 and 180 degrees"});
    }

    if (!(params.axialTiltDegrees >= 0.0 && params.axialTiltDegrees <= 180.0)) {
        errors.push_back({name, "axialTiltDegrees", params.axialTiltDegrees,
                          "number between 0 and 180 degrees"});
    }

    return errors;
}

std::vector<ValidationError> validateCatalog(const std::vector<OrbitalParameters> &catalog) {
    std::vector<ValidationError> allErrors;
    for (const auto &params : catalog) {
        auto errors = validateOrbitalParameters(params);
        allErrors.insert(allErrors.end(), errors.begin(), errors.end());
    }
    return allErrors;
}

}
