// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file config.h
 * @brief MPU-6050 driver build configuration
 *
 * Naming:
 * - Constants use k prefix: kSamplePeriodMs, kMaxSteps
 * - Grouped by concern in nested namespaces
 *
 * Pure C++, no Pico SDK dependencies. Shared by the driver core, the
 * firmware monitor and the host tests.
 */

#ifndef MPUDRV_CONFIG_H
#define MPUDRV_CONFIG_H

#include <cstdint>

namespace mpudrv {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* kVersionString = "0.3.1";

// ============================================================================
// Pin Definitions (Feather RP2350, STEMMA QT connector)
// ============================================================================

namespace pins {

constexpr uint8_t kI2c1Sda      = 2;        // I2C1 SDA
constexpr uint8_t kI2c1Scl      = 3;        // I2C1 SCL

} // namespace pins

// ============================================================================
// I2C
// ============================================================================

namespace i2c {

constexpr uint8_t  kMpu6050     = 0x68;     // AD0 = LOW (breakout default)
constexpr uint8_t  kMpu6050Alt  = 0x69;     // AD0 = HIGH
constexpr uint32_t kFreqHz      = 400000;   // Fast mode

} // namespace i2c

// ============================================================================
// Timing Configuration
// ============================================================================

namespace timing {

constexpr uint32_t kWakeSettleMs    = 100;  // PLL lock after leaving sleep
constexpr uint32_t kResetSettleMs   = 100;  // DEVICE_RESET self-clear
constexpr uint32_t kMonitorPeriodUs = 100000;  // 10 Hz console output

} // namespace timing

// ============================================================================
// Gyro Offset Calibration
// ============================================================================

namespace calibration {

constexpr uint32_t kDiscardSamples   = 100;   // Settling reads thrown away per step
constexpr uint32_t kMeanSamples      = 1000;  // Reads averaged per step
constexpr uint32_t kSamplePeriodMs   = 2;     // 500 Hz sampling
constexpr uint32_t kMaxSteps         = 20;

// Target |mean| in raw counts. At ±250 dps this is ~0.011 dps.
constexpr float    kTargetMeanCounts = 1.5F;

// One XG_OFFS_USR LSB moves the ±250 dps output by ~4 counts
// (offset register is scaled for ±1000 dps).
constexpr float    kStepDivisor      = 4.0F;
constexpr float    kMinStepCounts    = 1.0F;

} // namespace calibration

// ============================================================================
// Motion Detection
// ============================================================================

namespace motion {

constexpr uint8_t kIntPinCfg      = 0x20;  // Active high, push-pull, latched until INT_STATUS read
constexpr uint8_t kThreshold      = 10;    // MOT_THR, 2 mg/LSB
constexpr uint8_t kDurationMs     = 40;    // MOT_DUR, 1 ms/LSB at 1 kHz
constexpr uint8_t kDetectCtrl     = 0x15;  // Decrement 1, accel on-delay +1 ms
constexpr uint8_t kIntEnable      = 0x40;  // MOT_EN only

} // namespace motion

} // namespace mpudrv

#endif // MPUDRV_CONFIG_H
