// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file gyro_calibrator.h
 * @brief Gyroscope offset calibration (device at rest)
 *
 * Drives the MPU-6050 XG/YG/ZG_OFFS_USR registers until the mean gyro
 * output is strictly below kTargetMeanCounts on every axis, then reports
 * the residual the 16-bit offset registers could not cancel as a software
 * fine-tune offset.
 *
 * One step:
 *   1. Discard kDiscardSamples reads, average kMeanSamples reads
 *      (kSamplePeriodMs apart).
 *   2. Per axis with |mean| > target:
 *        offset -= trunc(sign(mean) * max(|mean| / 4, 1))
 *      Write all three offsets back.
 *   3. Progress callback with the step index.
 *   4. All |mean| < target: converged, fine_tune = trunc(-mean).
 *      An axis with |mean| == target is neither adjusted nor converged.
 *
 * Stops when converged or after kMaxSteps steps. Running out of steps is
 * not an error: the run returns OK with converged == false and a zero
 * fine-tune. A bus failure aborts the run at once; offsets already written
 * stay on the device.
 *
 * The sensor must be stationary for the whole run (~2.2 s per step at the
 * default settings).
 */

#ifndef MPUDRV_CALIBRATION_GYRO_CALIBRATOR_H
#define MPUDRV_CALIBRATION_GYRO_CALIBRATOR_H

#include "drivers/mpu6050_status.h"
#include "drivers/register_access.h"
#include "hal/Timing.h"
#include "math/vec3.h"
#include "mpudrv/config.h"

#include <cstdint>

namespace mpudrv {

// ============================================================================
// Configuration / Result
// ============================================================================

struct GyroCalConfig {
    uint32_t discard_samples{calibration::kDiscardSamples};
    uint32_t mean_samples{calibration::kMeanSamples};
    uint32_t sample_period_ms{calibration::kSamplePeriodMs};
    uint32_t max_steps{calibration::kMaxSteps};
    float target_mean_counts{calibration::kTargetMeanCounts};
    float step_divisor{calibration::kStepDivisor};
    float min_step_counts{calibration::kMinStepCounts};
};

struct GyroCalibrationResult {
    Status status;
    bool converged{false};
    uint32_t steps{0};      // Completed steps
    Vec3i offsets;          // Hardware offsets after the last successful write
    Vec3i fine_tune;        // Zero unless converged
    Vec3 mean;              // Last measured mean, raw counts
};

/**
 * @brief Called once per completed step
 *
 * Notification only. Must not touch the device.
 */
typedef void (*gyro_cal_progress_fn)(uint32_t step, void* user);

// ============================================================================
// Hardware offset registers
// ============================================================================

/**
 * @brief Read XG/YG/ZG_OFFS_USR (one 6-byte burst)
 */
hal::BusResult read_gyro_offsets(RegisterAccess& regs, Vec3i& offsets);

/**
 * @brief Write XG/YG/ZG_OFFS_USR as three 16-bit words
 *
 * Values outside int16 are clamped.
 */
hal::BusResult write_gyro_offsets(RegisterAccess& regs, const Vec3i& offsets);

// ============================================================================
// GyroCalibrator
// ============================================================================

class GyroCalibrator {
public:
    enum class State : uint8_t {
        IDLE = 0,
        SAMPLING,
        ADJUSTING,
        CONVERGED,
        EXHAUSTED,   // Step limit reached without convergence
        FAILED,      // Bus error
    };

    GyroCalibrator(RegisterAccess& regs, hal::Delay& delay, const GyroCalConfig& config);

    /**
     * @brief Run the calibration to completion (blocking)
     * @param progress Optional per-step callback
     * @param user Passed through to progress
     */
    GyroCalibrationResult run(gyro_cal_progress_fn progress, void* user);

    State state() const { return m_state; }

private:
    hal::BusResult sampleMean(Vec3& mean);
    int32_t adjustAxis(int32_t offset, float mean) const;
    bool withinTarget(const Vec3& mean) const;
    GyroCalibrationResult finish(const Status& status);

    RegisterAccess& m_regs;
    hal::Delay& m_delay;
    GyroCalConfig m_config;

    State m_state;
    uint32_t m_steps;
    bool m_converged;
    Vec3 m_mean;
    Vec3i m_offsets;
    Vec3i m_fine_tune;
};

const char* gyro_cal_state_to_string(GyroCalibrator::State state);

} // namespace mpudrv

#endif // MPUDRV_CALIBRATION_GYRO_CALIBRATOR_H
