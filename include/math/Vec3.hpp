#pragma once

#include <algorithm>
#include <cmath>

namespace math {

constexpr float PI = 3.14159265358979f;
constexpr float RAD_TO_DEG = 180.0f / PI;
constexpr float EPSILON = 1e-6f;

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator-() const { return {-x, -y, -z}; }
    Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }

    float dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }

    Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }

    float sqrLength() const { return dot(*this); }
    float length() const { return std::sqrt(sqrLength()); }

    /**
     * Unit vector, or the zero vector if the length is degenerate.
     */
    Vec3 normalized() const {
        float len = length();
        if (len < EPSILON) return {};
        return {x / len, y / len, z / len};
    }
};

/**
 * Rotation quaternion (w + xi + yj + zk), identity by default.
 */
struct Quat {
    float w = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vec3 rotate(const Vec3& v) const {
        // v' = v + 2w(q x v) + 2 q x (q x v)
        Vec3 q{x, y, z};
        Vec3 t = q.cross(v) * 2.0f;
        return v + t * w + q.cross(t);
    }
};

inline float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

/**
 * Position of value between a and b (a -> 0, b -> 1), unclamped.
 * Works with a > b (descending ranges).
 */
inline float inverseLerp(float a, float b, float value) {
    if (std::fabs(b - a) < EPSILON) return 0.0f;
    return (value - a) / (b - a);
}

/**
 * Unsigned angle between two vectors in degrees [0, 180].
 * Returns 0 when either vector is degenerate.
 */
inline float angleDeg(const Vec3& a, const Vec3& b) {
    float denom = std::sqrt(a.sqrLength() * b.sqrLength());
    if (denom < EPSILON) return 0.0f;
    float cosine = std::clamp(a.dot(b) / denom, -1.0f, 1.0f);
    return std::acos(cosine) * RAD_TO_DEG;
}

inline float distance(const Vec3& a, const Vec3& b) {
    return (a - b).length();
}

} // namespace math
