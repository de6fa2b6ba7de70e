// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#ifndef MPUDRV_DRIVERS_UNIT_CONVERSION_H
#define MPUDRV_DRIVERS_UNIT_CONVERSION_H

// Raw register bytes -> signed counts -> physical units.
// Pure C++, no Pico SDK dependencies.

#include "math/vec3.h"

#include <cstdint>

namespace mpudrv {

// Roll and pitch in radians. No yaw: there is no heading reference.
struct TiltAngles {
    float roll{0.0f};
    float pitch{0.0f};
};

namespace units {

constexpr float kPi       = 3.14159265358979F;
constexpr float kDegToRad = kPi / 180.0F;

// Big-endian two's-complement word: bytes[0] is the high byte.
// Result is in [-32768, 32767].
int32_t decode_word(const uint8_t* bytes);

// Three consecutive words (X, Y, Z) from a 6-byte burst.
Vec3i decode_vector(const uint8_t* bytes);

// Counts -> units, dividing every axis by sensitivity (counts per unit).
Vec3 scale(const Vec3i& raw, float sensitivity);

// Die temperature in °C: raw / 340 + 36.53.
float temperature_c(int32_t raw);

// Tilt from the gravity vector (NXP AN3461 eq. 28, 29). Any unit works
// as long as all three axes share it.
TiltAngles tilt_from_accel(const Vec3& accel);

} // namespace units
} // namespace mpudrv

#endif // MPUDRV_DRIVERS_UNIT_CONVERSION_H
