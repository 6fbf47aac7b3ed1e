/**
 * @file vector_math.hpp
 * @brief 2D vector mathematics for the disc simulator
 *
 * Provides the Vector2D primitive used for positions, velocities and
 * accelerations, along with the handful of operations the physics systems
 * need (arithmetic, dot product, length, normalization).
 */

#ifndef DISCSIM_VECTOR_MATH_HPP
#define DISCSIM_VECTOR_MATH_HPP

/**
 * @brief Threshold below which a vector is treated as zero-length
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a 2D vector (x, y)
 */
class Vector2D {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector2D();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector2D(double x, double y);

    Vector2D operator-() const;
    Vector2D operator+(const Vector2D& b) const;
    Vector2D operator-(const Vector2D& b) const;
    Vector2D operator*(double scalar) const;
    Vector2D operator/(double scalar) const;

    Vector2D& operator+=(const Vector2D& v);
    Vector2D& operator-=(const Vector2D& v);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector2D& v) const;

    /**
     * @brief Euclidean distance between two points
     * @param p Other point
     */
    double dist(const Vector2D& p) const;

    /**
     * @brief Returns the unit vector in this direction
     *
     * A zero-length vector has no direction; (1, 0) is returned instead.
     */
    Vector2D normalized() const;

    /** @brief True if neither component is NaN or infinite */
    bool isFinite() const;
};

/** @brief Scalar-first multiplication */
Vector2D operator*(double scalar, const Vector2D& v);

#endif
