/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <ostream>

namespace RiverForge {

// A simple 2D vector in the horizontal (x, z) plane. World z maps to getY().
class Vector2D {
public:
    Vector2D() : m_x(0.0), m_y(0.0) {}
    Vector2D(double x, double y) : m_x(x), m_y(y) {}

    double getX() const { return m_x; }
    double getY() const { return m_y; }
    void setX(double x) { m_x = x; }
    void setY(double y) { m_y = y; }

    double length() const { return std::sqrt(lengthSquared()); }
    double lengthSquared() const { return m_x * m_x + m_y * m_y; }

    Vector2D normalized() const {
        double lenSq = lengthSquared();
        if (lenSq < 1e-12) return Vector2D(1.0, 0.0); // Default direction
        double invLen = 1.0 / std::sqrt(lenSq);
        return Vector2D(m_x * invLen, m_y * invLen);
    }

    double dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator*(double scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    bool operator==(const Vector2D& other) const {
        return m_x == other.m_x && m_y == other.m_y;
    }

    static double distanceSquared(const Vector2D& a, const Vector2D& b) {
        double dx = a.m_x - b.m_x;
        double dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static double distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

private:
    double m_x{0.0};
    double m_y{0.0};
};

// Stream operator for Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ")";
}

} // namespace RiverForge

#endif  // VECTOR_2D_HPP
