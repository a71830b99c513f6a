/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_SOLAR_SYSTEM_HPP
#define __ORRERY_SOLAR_SYSTEM_HPP

#include <orrery/catalog.hpp>
#include <orrery/config.hpp>
#include <orrery/date_transition.hpp>
#include <orrery/ephemeris.hpp>
#include <orrery/epoch.hpp>
#include <orrery/integrator.hpp>
#include <orrery/longitude_cache.hpp>
#include <orrery/vec3.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace orrery {

enum class SimulationMode {
    Speed,  ///< Continuous integration at a speed multiplier
    Date    ///< Positions from the ephemeris at a calendar date
};

/**
 * Where a body is and how it is turned at one instant.
 */
struct PlanetPosition {
    Body body = Body::Mercury;
    std::string name;
    double longitudeDegrees = 0.0;   ///< [0, 360)
    double rotationRadians = 0.0;    ///< Orbital angle, [0, 2π)
    double spinRadians = 0.0;        ///< Spin about the body's own axis, [0, 2π)
    Vec3 position{0.0, 0.0, 0.0};    ///< Scene units
    time_point instant = J2000_EPOCH;
};

/**
 * Simulation context for the eight planets.
 *
 * Owns one integrator per body for speed mode, and the longitude cache and
 * date transition for date mode. The ephemeris model is borrowed and must
 * outlive the SolarSystem.
 *
 * Queries never throw. A failure is logged and gives a zero position.
 * Not thread-safe; use one SolarSystem per thread.
 */
class SolarSystem {
public:
    explicit SolarSystem(const EphemerisModel &model, Config config = Config{});
    ~SolarSystem() = default;

    SimulationMode mode() const;

    /**
     * Switches between speed and date mode. Returning to speed mode clears
     * the longitude cache.
     */
    void setMode(SimulationMode newMode);
    void toggleMode();

    void setSimulationSpeed(double speed);
    double simulationSpeed() const;

    void setAnimationSpeed(double speed);
    double animationSpeed() const;

    /**
     * Advances one frame. Speed mode moves every integrator, date mode moves
     * the running date transition.
     */
    void tick(double deltaSeconds);

    /**
     * Starts a transition to a new date (date mode).
     */
    void selectDate(time_point target);

    /**
     * Parses and selects a date. Unparseable text is logged and ignored.
     * @return true if the date was accepted
     */
    bool selectDate(std::string_view target);

    void skipTransition();
    bool isTransitioning() const;

    /**
     * The date being shown in date mode, or the simulated clock in speed mode.
     */
    time_point currentDate() const;

    /**
     * Position of a body in the current mode.
     */
    PlanetPosition position(Body body);

    /**
     * As above by name. Unknown names give a zero position with a warning.
     */
    PlanetPosition position(std::string_view name);

    /**
     * Date mode position of a body at an arbitrary instant.
     */
    PlanetPosition positionAt(Body body, time_point tp);

    std::vector<PlanetPosition> positions();

    const OrbitIntegrator& integrator(Body body) const;

    LongitudeCache& cache();

private:
    PlanetPosition speedPosition(Body body);

    std::vector<OrbitalParameters> catalog;
    std::vector<OrbitIntegrator> integrators;
    LongitudeCache longitudeCache;
    DateTransition transition;
    SimulationMode currentMode = SimulationMode::Speed;
    double speed;
    time_point clockStart;
    double simulatedSeconds = 0.0;
};

}

#endif
