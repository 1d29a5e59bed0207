#pragma once

#include <algorithm>
#include <cmath>

namespace bomber::entities {

struct Vec2 {
    float x{0.0F};
    float y{0.0F};

    Vec2& operator+=(const Vec2& other) {
        x += other.x;
        y += other.y;
        return *this;
    }
};

inline Vec2 operator+(Vec2 a, const Vec2& b) { return a += b; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(const Vec2& v, float s) { return Vec2{v.x * s, v.y * s}; }

inline float Length(const Vec2& v) { return std::hypot(v.x, v.y); }

inline float Distance(const Vec2& a, const Vec2& b) { return std::hypot(a.x - b.x, a.y - b.y); }

// Unlike std::clamp this tolerates lo > hi and then prefers lo.
inline float Clamp(float value, float lo, float hi) { return std::max(lo, std::min(hi, value)); }

} // namespace bomber::entities
