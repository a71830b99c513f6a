/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_EXCEPTIONS_HPP
#define __ORRERY_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace orrery {

/**
 * Base exception class for position engine errors.
 *
 * These never cross the SolarSystem facade or the ephemeris boundary functions;
 * they are caught there, logged, and replaced with a zero result.
 */
class OrreryException : public std::runtime_error {
public:
    explicit OrreryException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a calendar instant cannot be parsed or represented.
 */
class InvalidInstantException : public OrreryException {
public:
    explicit InvalidInstantException(const std::string& msg) : OrreryException(msg) {}
};

/**
 * Exception thrown when a body name is not one of the eight planets.
 */
class UnknownBodyException : public OrreryException {
public:
    explicit UnknownBodyException(const std::string& name)
        : OrreryException("Unknown body: " + name) {}
};

/**
 * Exception thrown when the ephemeris model cannot produce a position.
 */
class EphemerisException : public OrreryException {
public:
    explicit EphemerisException(const std::string& msg) : OrreryException(msg) {}
};

}

#endif
