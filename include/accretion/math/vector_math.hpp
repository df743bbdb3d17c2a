/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * This file provides the geometric primitives used by the simulation:
 * - Vector class for velocities, accelerations and directions
 * - Position class for point locations in 2D space
 * - Dot/cross products, normalisation and length helpers
 */

#ifndef ACCRETION_VECTOR_MATH_HPP
#define ACCRETION_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Represents a 2D point in space
 *
 * Position class is used for absolute locations in 2D space.
 * Supports basic arithmetic and conversion to/from Vector.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;
    Position operator/(double scalar) const;

    /**
     * @brief Displaces this position by a vector
     * @param v Offset to apply
     * @return New position moved by v
     */
    Position operator+(const Vector& v) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /**
     * @brief Squared distance to another position (no square root)
     */
    double distSquared(const Position& p) const;

    Position& operator+=(const Position& p);
    Position& operator-=(const Position& p);
    Position& operator+=(const Vector& v);
};

/**
 * @brief Represents a 2D vector with direction and magnitude
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

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector &other) const;

    /** @brief Returns perpendicular vector (rotated 90 degrees counter-clockwise) */
    Vector perp() const;

    /** @brief Returns normalized vector (length = 1), or (1,0) for a zero vector */
    Vector normalized() const;

    /**
     * @brief Returns normalized vector, or the zero vector when this has no length
     */
    Vector normalizedOrZero() const;

    /**
     * @brief Shortens the vector to at most maxLength, keeping its direction
     * @param maxLength Upper bound on the returned length
     */
    Vector clampLength(double maxLength) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

/** @brief Scalar-first multiplication */
Vector operator*(double scalar, const Vector& v);

#endif
