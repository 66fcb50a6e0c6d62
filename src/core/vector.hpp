#pragma once

#include "core/types.hpp"

#include <cmath>

namespace hf {

/// Planar vector. For field directions x maps to world X and y to world Z.
struct Vector2 {
    f32 x = 0, y = 0;

    Vector2 operator+(const Vector2& o) const { return {x + o.x, y + o.y}; }
    Vector2 operator-(const Vector2& o) const { return {x - o.x, y - o.y}; }
    Vector2 operator*(f32 s) const { return {x * s, y * s}; }
    Vector2& operator+=(const Vector2& o) {
        x += o.x;
        y += o.y;
        return *this;
    }
    bool operator==(const Vector2& o) const { return x == o.x && y == o.y; }

    f32 length_squared() const { return x * x + y * y; }
    f32 length() const { return std::sqrt(length_squared()); }

    /// Unit vector in the same direction, or zero for a degenerate input.
    Vector2 normalized_or_zero() const {
        f32 len = length();
        if (!(len > 1e-6f) || !std::isfinite(len)) return {};
        return {x / len, y / len};
    }
};

struct Vector3 {
    f32 x = 0, y = 0, z = 0;

    Vector3 operator+(const Vector3& o) const {
        return {x + o.x, y + o.y, z + o.z};
    }
    Vector3 operator-(const Vector3& o) const {
        return {x - o.x, y - o.y, z - o.z};
    }
    Vector3 operator-() const { return {-x, -y, -z}; }
    Vector3 operator*(f32 s) const { return {x * s, y * s, z * s}; }
    Vector3& operator+=(const Vector3& o) {
        x += o.x;
        y += o.y;
        z += o.z;
        return *this;
    }
    Vector3& operator*=(f32 s) {
        x *= s;
        y *= s;
        z *= s;
        return *this;
    }
    bool operator==(const Vector3& o) const {
        return x == o.x && y == o.y && z == o.z;
    }

    f32 length_squared() const { return x * x + y * y + z * z; }
    f32 length() const { return std::sqrt(length_squared()); }

    Vector3 normalized_or_zero() const {
        f32 len = length();
        if (!(len > 1e-6f) || !std::isfinite(len)) return {};
        return {x / len, y / len, z / len};
    }

    /// Horizontal (XZ) projection with y dropped to zero.
    Vector3 flat() const { return {x, 0.0f, z}; }
    Vector2 xz() const { return {x, z}; }
};

} // namespace hf
