// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#ifndef MPUDRV_MATH_VEC3_H
#define MPUDRV_MATH_VEC3_H

// Vec3 / Vec3i: 3-axis sensor vectors.
// Pure C++, no Pico SDK dependencies. Must compile on any host.

#include <cstdint>

namespace mpudrv {

// Scaled sample (g, deg/s, rad/s).
struct Vec3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
    Vec3 operator-(const Vec3& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
    Vec3 operator-() const { return {-x, -y, -z}; }
    Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
    Vec3 operator/(float s) const { return {x / s, y / s, z / s}; }

    Vec3& operator*=(float s) { x *= s; y *= s; z *= s; return *this; }
};

// Raw counts, widened from int16 so sums and offsets cannot overflow.
struct Vec3i {
    int32_t x{0};
    int32_t y{0};
    int32_t z{0};

    constexpr Vec3i() = default;
    constexpr Vec3i(int32_t x_, int32_t y_, int32_t z_) : x(x_), y(y_), z(z_) {}

    Vec3i operator+(const Vec3i& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
    Vec3i operator-(const Vec3i& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }

    Vec3i& operator+=(const Vec3i& rhs) { x += rhs.x; y += rhs.y; z += rhs.z; return *this; }

    bool operator==(const Vec3i& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
    bool operator!=(const Vec3i& rhs) const { return !(*this == rhs); }

    Vec3 to_float() const {
        return {static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)};
    }
};

} // namespace mpudrv

#endif // MPUDRV_MATH_VEC3_H
