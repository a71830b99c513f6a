/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_HPP
#define __ORRERY_HPP

#include <orrery/config.hpp>
#include <orrery/exceptions.hpp>
#include <orrery/epoch.hpp>
#include <orrery/angles.hpp>
#include <orrery/easing.hpp>
#include <orrery/catalog.hpp>
#include <orrery/ephemeris.hpp>
#include <orrery/longitude_cache.hpp>
#include <orrery/inclination.hpp>
#include <orrery/integrator.hpp>
#include <orrery/date_transition.hpp>
#include <orrery/solar_system.hpp>

#endif
