// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include "drivers/unit_conversion.h"
#include "drivers/mpu6050_regs.h"

#include <cmath>

namespace mpudrv {
namespace units {

constexpr int32_t kWordSignBit = 0x8000;
constexpr int32_t kWordRange   = 0x10000;

int32_t decode_word(const uint8_t* bytes) {
    int32_t word = (static_cast<int32_t>(bytes[0]) << 8) | static_cast<int32_t>(bytes[1]);
    if (word >= kWordSignBit) {
        word -= kWordRange;
    }
    return word;
}

Vec3i decode_vector(const uint8_t* bytes) {
    return {
        decode_word(&bytes[0]),
        decode_word(&bytes[2]),
        decode_word(&bytes[4]),
    };
}

Vec3 scale(const Vec3i& raw, float sensitivity) {
    return raw.to_float() / sensitivity;
}

float temperature_c(int32_t raw) {
    return (static_cast<float>(raw) / kTempSensitivity) + kTempOffset;
}

TiltAngles tilt_from_accel(const Vec3& accel) {
    TiltAngles angles;
    angles.roll  = atan2f(accel.y, sqrtf(accel.x * accel.x + accel.z * accel.z));
    angles.pitch = atan2f(-accel.x, sqrtf(accel.y * accel.y + accel.z * accel.z));
    return angles;
}

} // namespace units
} // namespace mpudrv
