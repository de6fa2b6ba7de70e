// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file mpu6050.h
 * @brief InvenSense MPU-6050 6-axis IMU driver
 *
 * 3-axis accelerometer + 3-axis gyroscope + die temperature over any
 * SensorBus (I2C on the RP2350).
 *
 * Every operation returns Status; values come back through reference
 * out-parameters and are left untouched on failure. Bus errors are
 * returned as-is, nothing is retried.
 *
 * @code
 * hal::I2CBus bus(i2c1, pins::kI2c1Sda, pins::kI2c1Scl);
 * hal::TimingDelay delay;
 * Mpu6050 imu(bus);
 *
 * bus.begin();
 * if (!imu.init(delay).isOk()) { ... }
 * imu.calibrateGyro(delay, nullptr, nullptr);   // keep the board still
 *
 * Vec3 accel;
 * imu.getAccel(accel);    // g
 * @endcode
 *
 * Reference: MPU-6000/MPU-6050 Product Specification Rev 3.4,
 *            Register Map and Descriptions Rev 4.2
 */

#ifndef MPUDRV_DRIVERS_MPU6050_H
#define MPUDRV_DRIVERS_MPU6050_H

#include "calibration/gyro_calibrator.h"
#include "drivers/mpu6050_regs.h"
#include "drivers/mpu6050_status.h"
#include "drivers/register_access.h"
#include "drivers/unit_conversion.h"
#include "hal/Bus.h"
#include "hal/Timing.h"
#include "math/vec3.h"

#include <cstddef>
#include <cstdint>

namespace mpudrv {

class Mpu6050 {
public:
    // ========================================================================
    // Construction (no bus traffic)
    // ========================================================================

    /**
     * @brief Default address 0x68, ±2g, ±250 dps
     * @param bus Bus the device sits on (not owned, must outlive the driver)
     */
    explicit Mpu6050(hal::SensorBus& bus);
    Mpu6050(hal::SensorBus& bus, AccelRange accel_range, GyroRange gyro_range);
    Mpu6050(hal::SensorBus& bus, uint8_t address);
    Mpu6050(hal::SensorBus& bus, uint8_t address,
            AccelRange accel_range, GyroRange gyro_range);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Wake the device, verify identity, apply default configuration
     *
     * Writes PWR_MGMT_1 = 0x01 (sleep off, X gyro PLL), waits 100 ms,
     * checks WHO_AM_I, then sets ±2g, ±250 dps and accel HPF RESET.
     *
     * @return INVALID_CHIP_ID with the byte read if WHO_AM_I != 0x68
     */
    Status init(hal::Delay& delay);

    /**
     * @brief Set DEVICE_RESET and wait 100 ms
     *
     * All registers return to defaults; the device comes back asleep.
     * The cached sensitivities are not touched.
     */
    Status resetDevice(hal::Delay& delay);

    // ========================================================================
    // Configuration
    // ========================================================================

    /**
     * @brief Set accelerometer range
     *
     * The cached sensitivity changes only if the register write succeeded.
     */
    Status setAccelRange(AccelRange range);
    Status getAccelRange(AccelRange& range);

    Status setGyroRange(GyroRange range);
    Status getGyroRange(GyroRange& range);

    Status setClockSource(ClockSource source);
    Status getClockSource(ClockSource& source);

    Status setAccelHpf(AccelHpf hpf);
    Status getAccelHpf(AccelHpf& hpf);

    Status setSleepEnabled(bool enable);
    Status getSleepEnabled(bool& enabled);

    /**
     * @brief Temperature sensor on/off
     *
     * Stored inverted on the device (PWR_MGMT_1.TEMP_DIS).
     */
    Status setTempSensorEnabled(bool enable);
    Status getTempSensorEnabled(bool& enabled);

    float accelSensitivity() const { return m_accel_sensitivity; }
    float gyroSensitivity() const { return m_gyro_sensitivity; }

    // ========================================================================
    // Self-test bits
    // ========================================================================

    Status setAccelSelfTestX(bool enable);
    Status setAccelSelfTestY(bool enable);
    Status setAccelSelfTestZ(bool enable);
    Status getAccelSelfTestX(bool& enabled);
    Status getAccelSelfTestY(bool& enabled);
    Status getAccelSelfTestZ(bool& enabled);

    Status setGyroSelfTestX(bool enable);
    Status setGyroSelfTestY(bool enable);
    Status setGyroSelfTestZ(bool enable);
    Status getGyroSelfTestX(bool& enabled);
    Status getGyroSelfTestY(bool& enabled);
    Status getGyroSelfTestZ(bool& enabled);

    // ========================================================================
    // Motion detection
    // ========================================================================

    /**
     * @brief Configure the motion interrupt
     *
     * Clears PWR_MGMT_1 (internal oscillator), latches INT active high,
     * sets the accel HPF to 5 Hz and arms MOT_EN with threshold 10
     * (20 mg) and duration 40 ms.
     */
    Status setupMotionDetection();

    /**
     * @brief Read INT_STATUS.MOT_INT
     *
     * Reading INT_STATUS clears the latched interrupt.
     */
    Status getMotionDetected(bool& detected);

    // ========================================================================
    // Raw register access
    // ========================================================================

    Status readRegister(uint8_t reg, uint8_t& value);
    Status readRegisters(uint8_t reg, uint8_t* buffer, size_t length);
    Status writeRegister(uint8_t reg, uint8_t value);
    Status writeWord(uint8_t reg, uint16_t value);
    Status readBit(uint8_t reg, uint8_t n, uint8_t& value);
    Status writeBit(uint8_t reg, uint8_t n, bool enable);
    Status readBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t& value);
    Status writeBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t value);

    // ========================================================================
    // Sensor data
    // ========================================================================

    Status readRawAccel(Vec3i& raw);

    /**
     * @brief Raw gyro counts with the fine-tune offset added
     */
    Status readRawGyro(Vec3i& raw);

    Status getAccel(Vec3& accel_g);
    Status getGyroDeg(Vec3& gyro_dps);
    Status getGyro(Vec3& gyro_rads);
    Status getTemperature(float& temp_c);

    /**
     * @brief Roll and pitch (rad) from the current acceleration
     */
    Status getTiltAngles(TiltAngles& angles);

    // ========================================================================
    // Gyro calibration
    // ========================================================================

    Status getGyroOffsets(Vec3i& offsets);
    Status setGyroOffsets(int16_t x, int16_t y, int16_t z);

    /**
     * @brief Zero the gyro bias (device must be at rest)
     *
     * Resets the fine-tune offset, then runs GyroCalibrator with the
     * default tuning. On convergence the residual becomes the new
     * fine-tune offset.
     *
     * @param progress Optional, called once per step with the step index
     * @param user Passed through to progress
     * @return Bus error if any transaction failed. Non-convergence is OK;
     *         check GyroCalibrationResult::converged.
     */
    GyroCalibrationResult calibrateGyro(hal::Delay& delay,
                                        gyro_cal_progress_fn progress, void* user);
    GyroCalibrationResult calibrateGyro(hal::Delay& delay, const GyroCalConfig& config,
                                        gyro_cal_progress_fn progress, void* user);

    const Vec3i& getGyroFineTune() const { return m_gyro_fine_tune; }
    void resetGyroFineTune() { m_gyro_fine_tune = Vec3i(); }

private:
    RegisterAccess m_regs;

    float m_accel_sensitivity;
    float m_gyro_sensitivity;
    Vec3i m_gyro_fine_tune;
};

} // namespace mpudrv

#endif // MPUDRV_DRIVERS_MPU6050_H
