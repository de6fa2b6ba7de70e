// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file main.cpp
 * @brief MPU-6050 monitor firmware
 *
 * Brings up the MPU-6050 on the STEMMA QT port (I2C1), zeroes the gyro
 * bias, arms the motion interrupt and streams readings over USB CDC at
 * 10 Hz.
 */

#include "mpudrv/config.h"
#include "drivers/mpu6050.h"
#include "hal/Bus.h"
#include "hal/Timing.h"

#include "pico/stdlib.h"
#include "hardware/gpio.h"
#include "hardware/i2c.h"

#include <stdio.h>

using namespace mpudrv;

// ============================================================================
// Init: USB console
// ============================================================================

// Wait for USB CDC connection with LED blink, then drain input buffer.
static void wait_for_usb_connection() {
    stdio_init_all();

    gpio_init(PICO_DEFAULT_LED_PIN);
    gpio_set_dir(PICO_DEFAULT_LED_PIN, GPIO_OUT);

    while (!stdio_usb_connected()) {
        gpio_put(PICO_DEFAULT_LED_PIN, true);
        sleep_ms(100);
        gpio_put(PICO_DEFAULT_LED_PIN, false);
        sleep_ms(100);
    }

    sleep_ms(500);

    while (getchar_timeout_us(0) != PICO_ERROR_TIMEOUT) {}
}

// Park with a fast LED blink. Nothing else to do without the sensor.
[[noreturn]] static void halt(const char* reason) {
    printf("[FAIL] %s\n", reason);
    while (true) {
        gpio_put(PICO_DEFAULT_LED_PIN, true);
        sleep_ms(50);
        gpio_put(PICO_DEFAULT_LED_PIN, false);
        sleep_ms(50);
    }
}

// ============================================================================
// Calibration progress
// ============================================================================

static void print_cal_progress(uint32_t step, void* user) {
    (void)user;
    printf("  Gyro calibration step %lu/%lu\n",
           static_cast<unsigned long>(step + 1),
           static_cast<unsigned long>(calibration::kMaxSteps));
}

// ============================================================================
// Output
// ============================================================================

static void print_readings(Mpu6050& imu) {
    Vec3 accel;
    Vec3 gyro;
    float tempC = 0.0f;
    TiltAngles tilt;
    bool motion = false;

    Status status = imu.getAccel(accel);
    if (status.isOk()) {
        status = imu.getGyroDeg(gyro);
    }
    if (status.isOk()) {
        status = imu.getTemperature(tempC);
    }
    if (status.isOk()) {
        tilt = units::tilt_from_accel(accel);
        status = imu.getMotionDetected(motion);
    }
    if (!status.isOk()) {
        printf("[ERR] Read failed: %s\n", status_to_string(status));
        return;
    }

    printf("A[g] %6.3f %6.3f %6.3f  G[dps] %8.3f %8.3f %8.3f  "
           "T %5.2fC  roll %6.1f pitch %6.1f%s\n",
           static_cast<double>(accel.x), static_cast<double>(accel.y),
           static_cast<double>(accel.z),
           static_cast<double>(gyro.x), static_cast<double>(gyro.y),
           static_cast<double>(gyro.z),
           static_cast<double>(tempC),
           static_cast<double>(tilt.roll / units::kDegToRad),
           static_cast<double>(tilt.pitch / units::kDegToRad),
           motion ? "  MOTION" : "");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    wait_for_usb_connection();

    printf("\n");
    printf("==============================================\n");
    printf("  MPU-6050 monitor v%s\n", kVersionString);
    printf("==============================================\n\n");

    hal::I2CBus bus(i2c1, pins::kI2c1Sda, pins::kI2c1Scl, i2c::kFreqHz);
    hal::TimingDelay delay;
    Mpu6050 imu(bus);

    if (!bus.begin()) {
        halt("I2C1 init failed");
    }
    if (!bus.probe(i2c::kMpu6050)) {
        halt("No device at 0x68");
    }

    Status status = imu.init(delay);
    if (!status.isOk()) {
        printf("[ERR] init: %s (WHO_AM_I 0x%02X)\n", status_to_string(status), status.chip_id);
        halt("MPU-6050 init failed");
    }
    printf("[OK] MPU-6050 at 0x%02X\n", i2c::kMpu6050);

    printf("Calibrating gyro, keep the board still...\n");
    GyroCalibrationResult cal = imu.calibrateGyro(delay, print_cal_progress, nullptr);
    if (!cal.status.isOk()) {
        printf("[ERR] calibration: %s\n", status_to_string(cal.status));
        halt("Gyro calibration aborted");
    }
    if (cal.converged) {
        printf("[OK] Gyro offsets %ld %ld %ld, fine tune %ld %ld %ld\n",
               static_cast<long>(cal.offsets.x), static_cast<long>(cal.offsets.y),
               static_cast<long>(cal.offsets.z),
               static_cast<long>(cal.fine_tune.x), static_cast<long>(cal.fine_tune.y),
               static_cast<long>(cal.fine_tune.z));
    } else {
        printf("[WARN] Gyro did not converge after %lu steps\n",
               static_cast<unsigned long>(cal.steps));
    }

    status = imu.setupMotionDetection();
    if (!status.isOk()) {
        printf("[WARN] Motion detection setup failed: %s\n", status_to_string(status));
    }

    printf("Streaming at 10 Hz\n\n");

    hal::IntervalTimer printTimer(timing::kMonitorPeriodUs);
    while (true) {
        if (printTimer.ready()) {
            print_readings(imu);
        }
        sleep_ms(1);
    }

    return 0;
}
