/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_INCLINATION_HPP
#define __ORRERY_INCLINATION_HPP

#include <orrery/vec3.hpp>

namespace orrery {

/**
 * Tilts a point of a flat orbit into 3D.
 *
 * The flat orbit lies in the XZ plane, so the point (x, 0, zFlat) is rotated
 * about the X axis by the inclination θ:
 *
 *   x' = x
 *   y' = -zFlat * sin(θ)
 *   z' =  zFlat * cos(θ)
 *
 * This is a pure rotation and preserves the length of (x, zFlat).
 * The inclination is clamped to [-180, 180] degrees; a non-finite
 * inclination is logged and treated as 0 (flat orbit).
 *
 * @param x X position on the flat orbit
 * @param zFlat Z position on the flat orbit
 * @param inclinationDegrees Orbital inclination relative to the ecliptic
 * @return The inclined position
 */
Vec3 applyInclination(double x, double zFlat, double inclinationDegrees);

/**
 * Rotation about the X axis, in radians, that tilts an orbit outline the
 * same way applyInclination tilts the body on it.
 */
double inclinationRotation(double inclinationDegrees);

}

#endif
