// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file mpu6050_regs.h
 * @brief MPU-6050 register map, bit fields and sensitivity tables
 *
 * Reference: MPU-6000/MPU-6050 Register Map and Descriptions, Rev 4.2
 *
 * Bit fields are (start, length) with start = lowest bit of the field,
 * matching drivers/bit_field.h.
 */

#ifndef MPUDRV_DRIVERS_MPU6050_REGS_H
#define MPUDRV_DRIVERS_MPU6050_REGS_H

#include <cstdint>

namespace mpudrv {

// ============================================================================
// Configuration Enums
// ============================================================================

/**
 * @brief Accelerometer full-scale range (ACCEL_CONFIG.AFS_SEL)
 */
enum class AccelRange : uint8_t {
    RANGE_2G  = 0,  // ±2g,  16384 LSB/g
    RANGE_4G  = 1,  // ±4g,   8192 LSB/g
    RANGE_8G  = 2,  // ±8g,   4096 LSB/g
    RANGE_16G = 3,  // ±16g,  2048 LSB/g
};

/**
 * @brief Gyroscope full-scale range (GYRO_CONFIG.FS_SEL)
 */
enum class GyroRange : uint8_t {
    RANGE_250DPS  = 0,  // ±250 dps,  131 LSB/dps
    RANGE_500DPS  = 1,  // ±500 dps,  65.5 LSB/dps
    RANGE_1000DPS = 2,  // ±1000 dps, 32.8 LSB/dps
    RANGE_2000DPS = 3,  // ±2000 dps, 16.4 LSB/dps
};

/**
 * @brief Clock source (PWR_MGMT_1.CLKSEL)
 *
 * The datasheet recommends a gyro PLL over the internal oscillator.
 */
enum class ClockSource : uint8_t {
    INTERNAL_8MHZ = 0,
    PLL_XGYRO     = 1,
    PLL_YGYRO     = 2,
    PLL_ZGYRO     = 3,
    PLL_EXT_32KHZ = 4,
    PLL_EXT_19MHZ = 5,
    RESERVED      = 6,
    STOP          = 7,  // Stops the clock, keeps timing generator in reset
};

/**
 * @brief Accelerometer digital high-pass filter (ACCEL_CONFIG.ACCEL_HPF)
 *
 * Codes 5 and 6 are reserved. Feeds the motion detector only; sensor
 * output registers are not filtered.
 */
enum class AccelHpf : uint8_t {
    RESET   = 0,  // Filter off, output settles to 0
    HZ_5    = 1,
    HZ_2_5  = 2,
    HZ_1_25 = 3,
    HZ_0_63 = 4,
    HOLD    = 7,
};

// ============================================================================
// Register Addresses
// ============================================================================

namespace reg {
    constexpr uint8_t kXgOffsUsrH       = 0x13;  // X gyro offset, high byte
    constexpr uint8_t kYgOffsUsrH       = 0x15;
    constexpr uint8_t kZgOffsUsrH       = 0x17;
    constexpr uint8_t kGyroConfig       = 0x1B;
    constexpr uint8_t kAccelConfig      = 0x1C;
    constexpr uint8_t kMotThr           = 0x1F;
    constexpr uint8_t kMotDur           = 0x20;
    constexpr uint8_t kIntPinCfg        = 0x37;
    constexpr uint8_t kIntEnable        = 0x38;
    constexpr uint8_t kIntStatus        = 0x3A;
    constexpr uint8_t kAccelXoutH       = 0x3B;  // 6 bytes: X, Y, Z big-endian
    constexpr uint8_t kTempOutH         = 0x41;  // 2 bytes
    constexpr uint8_t kGyroXoutH        = 0x43;  // 6 bytes: X, Y, Z big-endian
    constexpr uint8_t kMotDetectCtrl    = 0x69;
    constexpr uint8_t kPwrMgmt1         = 0x6B;
    constexpr uint8_t kWhoAmI           = 0x75;
} // namespace reg

// ============================================================================
// Bit Definitions
// ============================================================================

/**
 * @brief Multi-bit field position inside a register
 */
struct BitBlock {
    uint8_t start;
    uint8_t length;
};

namespace bit {
    // PWR_MGMT_1
    constexpr uint8_t  kDeviceReset     = 7;
    constexpr uint8_t  kSleep           = 6;
    constexpr uint8_t  kTempDis         = 3;  // 1 = temperature sensor disabled
    constexpr BitBlock kClkSel          = {0, 3};

    // GYRO_CONFIG
    constexpr uint8_t  kXgSt            = 7;
    constexpr uint8_t  kYgSt            = 6;
    constexpr uint8_t  kZgSt            = 5;
    constexpr BitBlock kGyroFsSel       = {3, 2};

    // ACCEL_CONFIG
    constexpr uint8_t  kXaSt            = 7;
    constexpr uint8_t  kYaSt            = 6;
    constexpr uint8_t  kZaSt            = 5;
    constexpr BitBlock kAccelFsSel      = {3, 2};
    constexpr BitBlock kAccelHpf        = {0, 3};

    // INT_STATUS
    constexpr uint8_t  kMotInt          = 6;
} // namespace bit

// ============================================================================
// Device Constants
// ============================================================================

// WHO_AM_I reads 0x68 regardless of the AD0 pin
constexpr uint8_t kMpu6050ChipId        = 0x68;

// PWR_MGMT_1 on wake: sleep cleared, all sensors on, CLKSEL = PLL_XGYRO
constexpr uint8_t kPwrMgmt1Wake         = 0x01;

// Temperature conversion (Register Map Rev 4.2, Section 4.18)
constexpr float kTempSensitivity        = 340.0F;  // LSB/°C
constexpr float kTempOffset             = 36.53F;  // °C at raw 0

// Read sizes
constexpr uint8_t kVectorReadSize       = 6;   // 3-axis × 2 bytes
constexpr uint8_t kWordReadSize         = 2;

// ============================================================================
// Sensitivity Tables
// ============================================================================

namespace detail {
    constexpr float kAccelSensitivity[] = {
        16384.0F,  // ±2g
        8192.0F,   // ±4g
        4096.0F,   // ±8g
        2048.0F,   // ±16g
    };

    constexpr float kGyroSensitivity[] = {
        131.0F,    // ±250 dps
        65.5F,     // ±500 dps
        32.8F,     // ±1000 dps
        16.4F,     // ±2000 dps
    };
} // namespace detail

/**
 * @brief Accelerometer sensitivity in LSB/g for a range
 */
constexpr float accel_sensitivity(AccelRange range) {
    return detail::kAccelSensitivity[static_cast<uint8_t>(range) & 0x03U];
}

/**
 * @brief Gyroscope sensitivity in LSB/(°/s) for a range
 */
constexpr float gyro_sensitivity(GyroRange range) {
    return detail::kGyroSensitivity[static_cast<uint8_t>(range) & 0x03U];
}

} // namespace mpudrv

#endif // MPUDRV_DRIVERS_MPU6050_REGS_H
