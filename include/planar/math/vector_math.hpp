/**
 * @file vector_math.hpp
 * @brief 2D vector mathematics library
 *
 * This file provides the fundamental 2D geometric primitive of the engine:
 * - Vector value type used for points, directions, velocities and forces
 * - Geometric operations (dot product, cross product, signed angle, rotation)
 * - Parallel/perpendicular decomposition used by collision response
 *
 * The coordinate convention is y-up: up() is (0, +1) and a positive angle
 * rotates counter-clockwise.
 */

#ifndef PLANAR_VECTOR_MATH_HPP
#define PLANAR_VECTOR_MATH_HPP

#include <ostream>

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/** @brief Converts degrees to radians */
double deg2rad(double degrees);

/** @brief Converts radians to degrees */
double rad2deg(double radians);

/**
 * @brief Represents a 2D vector with direction and magnitude
 *
 * Vector is a plain value type. Every operation returns a new Vector;
 * the compound assignment operators only modify the local copy they are
 * called on.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    /**
     * @brief Adds two vectors
     * @param b Vector to add
     * @return Sum vector
     */
    Vector operator+(const Vector& b) const;

    /**
     * @brief Subtracts two vectors
     * @param b Vector to subtract
     * @return Difference vector
     */
    Vector operator-(const Vector& b) const;

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(double scalar) const;

    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     * @throws Errors::DivideByZero if scalar is 0
     */
    Vector operator/(double scalar) const;

    /**
     * @brief Guarded division
     * @param scalar Divisor
     * @param ignoreZeroDivisor Return the zero vector instead of throwing when scalar is 0
     * @throws Errors::DivideByZero if scalar is 0 and the flag is not set
     */
    Vector divide(double scalar, bool ignoreZeroDivisor) const;

    /** @brief Returns vector magnitude */
    double mag() const;

    /** @brief Returns squared magnitude (no square root, for comparisons) */
    double magSquare() const;

    /**
     * @brief Returns the unit vector in the same direction
     *
     * The caller decides what a zero vector means: with ignoreZeroMagnitude
     * the zero vector is returned, otherwise Errors::DivideByZero is thrown.
     */
    Vector normalize(bool ignoreZeroMagnitude) const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dot(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector& other) const;

    /**
     * @brief Signed angle from this vector to another
     *
     * The magnitude comes from acos of the cosine clamped to [-1, 1]; the
     * sign comes from the cross product (positive counter-clockwise). A zero
     * cross product counts as positive.
     *
     * @param other Other vector
     * @return Angle in radians in [-pi, pi]
     * @throws Errors::DivideByZero if either vector has zero magnitude
     */
    double angle(const Vector& other) const;

    /**
     * @brief Rotates vector about a pivot
     * @param theta Rotation angle in radians (positive is counter-clockwise)
     * @param pivot Rotation center, origin by default
     * @return Rotated vector
     */
    Vector rotate(double theta, const Vector& pivot = Vector()) const;

    /**
     * @brief Component of this vector parallel to another
     * @throws Errors::DivideByZero if other is the zero vector
     */
    Vector componentParallel(const Vector& other) const;

    /**
     * @brief Component of this vector perpendicular to another
     * @throws Errors::DivideByZero if other is the zero vector
     */
    Vector componentPerpendicular(const Vector& other) const;

    /**
     * @brief Calculates Euclidean distance to another point
     */
    double dist(const Vector& other) const;

    /**
     * @brief Clamps the magnitude into [minMag, maxMag], keeping direction
     * @throws Errors::DivideByZero for the zero vector
     */
    Vector clip(double minMag, double maxMag) const;

    /** @brief Zero vector */
    static Vector origin();
    /** @brief (-mag, 0) */
    static Vector left(double mag = 1.0);
    /** @brief (mag, 0) */
    static Vector right(double mag = 1.0);
    /** @brief (0, mag) */
    static Vector up(double mag = 1.0);
    /** @brief (0, -mag) */
    static Vector down(double mag = 1.0);

    /**
     * @brief Adds another vector to this one
     * @param v Vector to add
     * @return Reference to this vector
     */
    Vector& operator+=(const Vector& v);

    /**
     * @brief Subtracts another vector from this one
     * @param v Vector to subtract
     * @return Reference to this vector
     */
    Vector& operator-=(const Vector& v);
};

/** @brief scalar * vector */
Vector operator*(double scalar, const Vector& v);

/** @brief Component-wise approximate equality */
bool nearlyEqual(const Vector& a, const Vector& b, double epsilon=EPSILON);

/** @brief Prints as V2(x, y) with two decimals */
std::ostream& operator<<(std::ostream& os, const Vector& v);

#endif // PLANAR_VECTOR_MATH_HPP
