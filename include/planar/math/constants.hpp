/**
 * @file constants.hpp
 * @brief Contains fundamental math constants.
 *
 * This header defines common mathematical constants used throughout the project,
 * such as PI. These constants are provided as compile-time constexpr values.
 */

#pragma once

namespace MathConstants {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

} // namespace MathConstants
