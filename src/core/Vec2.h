#pragma once

#include <cmath>

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    Vec2 &operator+=(const Vec2 &rhs)
    {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    Vec2 &operator-=(const Vec2 &rhs)
    {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    Vec2 &operator*=(float scalar)
    {
        x *= scalar;
        y *= scalar;
        return *this;
    }
};

inline Vec2 operator+(Vec2 lhs, const Vec2 &rhs)
{
    lhs += rhs;
    return lhs;
}

inline Vec2 operator-(Vec2 lhs, const Vec2 &rhs)
{
    lhs -= rhs;
    return lhs;
}

inline Vec2 operator*(Vec2 lhs, float scalar)
{
    lhs *= scalar;
    return lhs;
}

inline Vec2 operator*(float scalar, Vec2 rhs)
{
    rhs *= scalar;
    return rhs;
}

inline bool operator==(const Vec2 &lhs, const Vec2 &rhs)
{
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

inline bool operator!=(const Vec2 &lhs, const Vec2 &rhs)
{
    return !(lhs == rhs);
}

inline float dot(const Vec2 &a, const Vec2 &b)
{
    return a.x * b.x + a.y * b.y;
}

inline float lengthSq(const Vec2 &v)
{
    return dot(v, v);
}

inline float length(const Vec2 &v)
{
    return std::sqrt(lengthSq(v));
}

inline float distance(const Vec2 &a, const Vec2 &b)
{
    return length(a - b);
}

inline Vec2 normalize(const Vec2 &v)
{
    const float len = length(v);
    if (len <= 0.0f)
    {
        return {0.0f, 0.0f};
    }
    return {v.x / len, v.y / len};
}
