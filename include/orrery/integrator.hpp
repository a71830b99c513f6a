/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_INTEGRATOR_HPP
#define __ORRERY_INTEGRATOR_HPP

#include <orrery/catalog.hpp>
#include <orrery/vec3.hpp>

#include <cstdint>

namespace orrery {

/**
 * Per-body state advanced once per frame in speed mode.
 */
struct SimulationState {
    double angleAccumulatorRadians = 0.0;   ///< Orbital angle, wrapped into [0, 2π)
    std::uint64_t completedRevolutions = 0; ///< Number of times the angle has wrapped
    double spinRadians = 0.0;               ///< Spin about the body's axis, [0, 2π)
    double lastSampleTimeSeconds = 0.0;     ///< Frame clock reading of the last advanceTo()
};

/**
 * Position on the body's flat ellipse at a given orbital angle, tilted by
 * its inclination. Semi-major axis a = distanceScale, semi-minor axis
 * b = a * (1 - e), with the sun at the centre of the ellipse.
 */
Vec3 ellipticalPosition(const OrbitalParameters &params, double angleRadians);

/**
 * Continuous orbit integrator for speed mode.
 *
 * Advances the orbital angle at a uniform angular speed of one revolution per
 * orbital period and the spin at one revolution per rotation period, both
 * scaled by a speed multiplier. A speed of 1 runs in real time.
 */
class OrbitIntegrator {
public:
    explicit OrbitIntegrator(const OrbitalParameters &params);
    ~OrbitIntegrator() = default;

    /**
     * Advances by deltaTimeSeconds of wall time at the given speed multiplier.
     * Non-finite or negative inputs are logged and leave the state untouched.
     */
    void tick(double deltaTimeSeconds, double speedMultiplier);

    /**
     * Advances to a frame clock reading, using the time since the previous
     * reading as the delta. A clock that goes backwards is resynchronised
     * without moving the body.
     */
    void advanceTo(double elapsedSeconds, double speedMultiplier);

    void reset();

    /**
     * Switches to a different body and resets the state.
     */
    void setParameters(const OrbitalParameters &params);

    const OrbitalParameters& parameters() const;
    const SimulationState& state() const;

    // Wrapped orbital angle, [0, 2π)
    double angle() const;

    // Unwrapped orbital angle, including completed revolutions
    double totalAngle() const;

    double spin() const;

    Vec3 position() const;

    // Radians per simulated second
    double angularSpeed() const;
    double spinSpeed() const;

    bool isIdle() const;

private:
    void addRevolutions(double wraps);

    OrbitalParameters params;
    SimulationState current;
    bool idle = true;
};

}

#endif
