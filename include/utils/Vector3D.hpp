/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <algorithm>
#include <cmath>
#include <ostream>

// A simple 3D vector class
class Vector3D {
public:
    // Below this length a vector is treated as having no direction
    static constexpr float DEGENERATE_EPSILON = 1e-12f;

    // Constructors
    Vector3D() : m_x(0.0f), m_y(0.0f), m_z(0.0f) {}
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    bool isZero() const { return m_x == 0.0f && m_y == 0.0f && m_z == 0.0f; }

    bool isFinite() const {
        return std::isfinite(m_x) && std::isfinite(m_y) && std::isfinite(m_z);
    }

    // Unit-length copy; a degenerate vector is returned unchanged
    Vector3D normalized() const {
        float const len = length();
        if (!(len > DEGENERATE_EPSILON)) {
            return *this;
        }
        return Vector3D(m_x / len, m_y / len, m_z / len);
    }

    void normalize() { *this = normalized(); }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    Vector3D cross(const Vector3D& v2) const {
        return Vector3D(m_y * v2.m_z - m_z * v2.m_y,
                        m_z * v2.m_x - m_x * v2.m_z,
                        m_x * v2.m_y - m_y * v2.m_x);
    }

    // Operator overloads
    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    Vector3D& operator+=(const Vector3D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        m_z += v2.m_z;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D& operator-=(const Vector3D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        m_z -= v2.m_z;
        return *this;
    }

    Vector3D operator-() const { return Vector3D(-m_x, -m_y, -m_z); }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    Vector3D& operator/=(float scalar) {
        m_x /= scalar;
        m_y /= scalar;
        m_z /= scalar;
        return *this;
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }

    bool operator!=(const Vector3D& v2) const { return !(*this == v2); }

    static float distanceSquared(const Vector3D& a, const Vector3D& b) {
        return (b - a).lengthSquared();
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    // Angle in radians; cosine is clamped so rounding never yields NaN
    static float angleBetween(const Vector3D& a, const Vector3D& b) {
        float const cosine = std::clamp(a.normalized().dot(b.normalized()), -1.0f, 1.0f);
        return std::acos(cosine);
    }

    /**
     * Rotates unit vector `from` toward unit vector `to` by at most
     * maxAngle radians, staying in the plane the two span.
     */
    static Vector3D rotateTowards(const Vector3D& from, const Vector3D& to, float maxAngle) {
        float const angle = angleBetween(from, to);
        if (angle <= maxAngle) {
            return to;
        }

        Vector3D ortho = to - from * from.dot(to);
        if (ortho.length() <= DEGENERATE_EPSILON) {
            // Opposite directions: any perpendicular is a valid plane
            Vector3D axis = std::abs(from.getX()) < 0.9f ? Vector3D(1.0f, 0.0f, 0.0f)
                                                         : Vector3D(0.0f, 1.0f, 0.0f);
            ortho = from.cross(axis);
        }
        ortho.normalize();

        return (from * std::cos(maxAngle) + ortho * std::sin(maxAngle)).normalized();
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

// Stream operator for Vector3D (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, const Vector3D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ", " << v.getZ() << ")";
}

#endif  // VECTOR_3D_HPP
