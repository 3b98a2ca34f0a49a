#ifndef BOX_NAV_GEOMETRY_HPP_
#define BOX_NAV_GEOMETRY_HPP_

#include <cmath>
#include "BoxNavigation/types.hpp"

// Small vector helpers shared by the box and corridor code.

inline Point2D operator+(const Point2D& a, const Point2D& b) { return {a.x + b.x, a.y + b.y}; }
inline Point2D operator-(const Point2D& a, const Point2D& b) { return {a.x - b.x, a.y - b.y}; }
inline Point2D operator*(const Point2D& a, double s) { return {a.x * s, a.y * s}; }

inline double dot(const Point2D& a, const Point2D& b) { return a.x * b.x + a.y * b.y; }

// z component of the 3D cross product
inline double cross(const Point2D& a, const Point2D& b) { return a.x * b.y - a.y * b.x; }

// Calculate 2D Euclidean distance
inline double dist(const Point2D& a, const Point2D& b)
{
    return std::sqrt(std::pow(a.x - b.x, 2) + std::pow(a.y - b.y, 2));
}

// Rotate a point around the world origin (radians, counter-clockwise)
inline Point2D rotate_point(const Point2D& p, double rotation)
{
    return {p.x * std::cos(rotation) - p.y * std::sin(rotation),
            p.y * std::cos(rotation) + p.x * std::sin(rotation)};
}

/**
 * Normalize angle to [-pi, pi] range.
 * Constant time for any finite input, however many turns it spans.
 */
inline double normalize_angle(double angle)
{
    return std::remainder(angle, 2.0 * M_PI);
}

inline double deg_to_rad(double degrees) { return degrees * M_PI / 180.0; }
inline double rad_to_deg(double radians) { return radians * 180.0 / M_PI; }

#endif // BOX_NAV_GEOMETRY_HPP_
