/**
 * @file math_utils.hpp
 * @brief Scalar helpers and curve sampling shared by the engine and its hosts
 *
 * - clip/sign used by the vector algebra and the angle constraint
 * - linear interpolation and range mapping
 * - quadratic and cubic Bezier sampling (de Casteljau) for smooth outlines
 */

#pragma once

#include <vector>
#include "planar/math/vector_math.hpp"

namespace MathUtils {

/**
 * @brief Clamps a value into [minVal, maxVal]
 */
double clip(double val, double minVal, double maxVal);

/**
 * @brief Sign of a value, with sign(0) == +1
 *
 * The angle constraint relies on zero counting as positive so that a
 * perfectly straight or folded triple still gets a correction direction.
 */
double sign(double val);

/**
 * @brief Linear interpolation a + factor*(b-a)
 * @param limit Clamp factor into [0,1] first
 */
double interp1d(double a, double b, double factor, bool limit = false);

/**
 * @brief Component-wise linear interpolation between two points
 */
Vector interp2d(const Vector& p0, const Vector& p1, double factor);

/**
 * @brief Maps value from the range [srcA, srcB] onto [tarA, tarB]
 *
 * @throws Errors::DivideByZero if srcA == srcB
 */
double mapper1d(double value, double srcA, double srcB, double tarA, double tarB);

/**
 * @brief Samples a quadratic Bezier curve
 * @param segments Number of segments; the result has segments+1 points
 * @throws Errors::InvalidArgument if segments < 1
 */
std::vector<Vector> quadraticBezier(const Vector& p0, const Vector& p1, const Vector& p2, int segments);

/**
 * @brief Samples a cubic Bezier curve
 * @param segments Number of segments; the result has segments+1 points
 * @throws Errors::InvalidArgument if segments < 1
 */
std::vector<Vector> cubicBezier(const Vector& p0, const Vector& p1, const Vector& p2, const Vector& p3,
                                int segments);

} // namespace MathUtils
