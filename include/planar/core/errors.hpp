/**
 * @file errors.hpp
 * @brief Exception types raised by the physics core
 *
 * All failures are local and synchronous: they are thrown to the immediate
 * caller and never retried internally.
 * - InvalidArgument: bad input (duplicate chain tag, unknown parent,
 *   degenerate polygon, non-positive mass/inertia/cell size)
 * - DivideByZero: zero divisor or zero-magnitude normalization
 * - PreconditionViolation: an object queried before it is ready
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Errors {

class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

class DivideByZero : public std::domain_error {
public:
    explicit DivideByZero(const std::string& what) : std::domain_error(what) {}
};

class PreconditionViolation : public std::logic_error {
public:
    explicit PreconditionViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace Errors
