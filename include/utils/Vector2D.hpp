/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <ostream>

// 2D world-space vector used for positions, velocities and steering forces
class Vector2D {
public:
    static constexpr float EPSILON_SQ = 0.000001f;

    constexpr Vector2D() : m_x(0.0f), m_y(0.0f) {}
    constexpr Vector2D(float x, float y) : m_x(x), m_y(y) {}

    constexpr float getX() const { return m_x; }
    constexpr float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    constexpr float lengthSquared() const { return m_x * m_x + m_y * m_y; }
    constexpr bool isZero() const { return lengthSquared() < EPSILON_SQ; }

    // Unit vector in the same direction; the zero vector stays zero so that
    // steering sums with no contributors do not invent a heading
    Vector2D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < EPSILON_SQ) return Vector2D();
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector2D(m_x * invLen, m_y * invLen);
    }

    void normalize() { *this = normalized(); }

    constexpr float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    constexpr Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    constexpr Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    constexpr Vector2D operator-() const { return Vector2D(-m_x, -m_y); }

    constexpr Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    constexpr Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_y / scalar);
    }

    Vector2D& operator+=(const Vector2D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        return *this;
    }

    Vector2D& operator-=(const Vector2D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        return *this;
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    Vector2D& operator/=(float scalar) {
        m_x /= scalar;
        m_y /= scalar;
        return *this;
    }

    // Exact comparison; waypoint lists are compared element-wise in tests
    constexpr bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }
    constexpr bool operator!=(const Vector2D& v2) const { return !(*this == v2); }

    static constexpr float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    static constexpr Vector2D lerp(const Vector2D& a, const Vector2D& b, float t) {
        return Vector2D(a.m_x + (b.m_x - a.m_x) * t, a.m_y + (b.m_y - a.m_y) * t);
    }

    friend std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
        return os << "(" << v.m_x << ", " << v.m_y << ")";
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
