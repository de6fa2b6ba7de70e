// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include "calibration/gyro_calibrator.h"
#include "drivers/mpu6050_regs.h"
#include "debug.h"

#include <cmath>

namespace mpudrv {

using hal::BusResult;

constexpr int32_t kOffsetMin = -32768;
constexpr int32_t kOffsetMax = 32767;

static int32_t clamp_offset(int32_t value) {
    if (value < kOffsetMin) {
        return kOffsetMin;
    }
    if (value > kOffsetMax) {
        return kOffsetMax;
    }
    return value;
}

// ============================================================================
// Hardware offset registers
// ============================================================================

BusResult read_gyro_offsets(RegisterAccess& regs, Vec3i& offsets) {
    // XG_OFFS_USRH..ZG_OFFS_USRL are consecutive
    return regs.readVector(reg::kXgOffsUsrH, offsets);
}

BusResult write_gyro_offsets(RegisterAccess& regs, const Vec3i& offsets) {
    const uint8_t regsHigh[3] = {reg::kXgOffsUsrH, reg::kYgOffsUsrH, reg::kZgOffsUsrH};
    const int32_t values[3] = {offsets.x, offsets.y, offsets.z};

    for (uint8_t i = 0; i < 3; ++i) {
        const int16_t word = static_cast<int16_t>(clamp_offset(values[i]));
        BusResult result = regs.writeWord(regsHigh[i], static_cast<uint16_t>(word));
        if (result != BusResult::OK) {
            return result;
        }
    }
    return BusResult::OK;
}

// ============================================================================
// GyroCalibrator
// ============================================================================

GyroCalibrator::GyroCalibrator(RegisterAccess& regs, hal::Delay& delay,
                               const GyroCalConfig& config)
    : m_regs(regs)
    , m_delay(delay)
    , m_config(config)
    , m_state(State::IDLE)
    , m_steps(0)
    , m_converged(false)
{
}

GyroCalibrationResult GyroCalibrator::run(gyro_cal_progress_fn progress, void* user) {
    m_steps = 0;
    m_converged = false;
    m_mean = Vec3();
    m_offsets = Vec3i();
    m_fine_tune = Vec3i();

    DBG_PRINT("[GyroCal] Calibrating gyro (max %lu steps)\n",
              static_cast<unsigned long>(m_config.max_steps));

    BusResult result = write_gyro_offsets(m_regs, m_offsets);
    if (result != BusResult::OK) {
        return finish(Status::fromBus(result));
    }

    while (!m_converged && m_steps < m_config.max_steps) {
        m_state = State::SAMPLING;
        Vec3 mean;
        result = sampleMean(mean);
        if (result != BusResult::OK) {
            return finish(Status::fromBus(result));
        }
        m_mean = mean;

        m_state = State::ADJUSTING;
        Vec3i current;
        result = read_gyro_offsets(m_regs, current);
        if (result != BusResult::OK) {
            return finish(Status::fromBus(result));
        }

        const Vec3i updated(clamp_offset(adjustAxis(current.x, mean.x)),
                            clamp_offset(adjustAxis(current.y, mean.y)),
                            clamp_offset(adjustAxis(current.z, mean.z)));
        result = write_gyro_offsets(m_regs, updated);
        if (result != BusResult::OK) {
            return finish(Status::fromBus(result));
        }
        m_offsets = updated;

        DBG_PRINT("[GyroCal] Step %lu: mean x=%.2f y=%.2f z=%.2f, "
                  "offsets x=%ld y=%ld z=%ld\n",
                  static_cast<unsigned long>(m_steps),
                  static_cast<double>(mean.x), static_cast<double>(mean.y),
                  static_cast<double>(mean.z),
                  static_cast<long>(updated.x), static_cast<long>(updated.y),
                  static_cast<long>(updated.z));

        if (progress != nullptr) {
            progress(m_steps, user);
        }

        if (withinTarget(mean)) {
            m_converged = true;
            // Truncation toward zero, same as the offset step
            m_fine_tune = Vec3i(static_cast<int32_t>(-mean.x),
                                static_cast<int32_t>(-mean.y),
                                static_cast<int32_t>(-mean.z));
        }
        ++m_steps;
    }

    if (m_converged) {
        DBG_PRINT("[GyroCal] Done after %lu steps, fine tune x=%ld y=%ld z=%ld\n",
                  static_cast<unsigned long>(m_steps),
                  static_cast<long>(m_fine_tune.x), static_cast<long>(m_fine_tune.y),
                  static_cast<long>(m_fine_tune.z));
    } else {
        DBG_PRINT("[GyroCal] No convergence after %lu steps, keeping last offsets\n",
                  static_cast<unsigned long>(m_steps));
    }
    return finish(Status::ok());
}

BusResult GyroCalibrator::sampleMean(Vec3& mean) {
    Vec3i sample;

    for (uint32_t i = 0; i < m_config.discard_samples; ++i) {
        BusResult result = m_regs.readVector(reg::kGyroXoutH, sample);
        if (result != BusResult::OK) {
            return result;
        }
        m_delay.delayMs(m_config.sample_period_ms);
    }

    int64_t sumX = 0;
    int64_t sumY = 0;
    int64_t sumZ = 0;
    for (uint32_t i = 0; i < m_config.mean_samples; ++i) {
        BusResult result = m_regs.readVector(reg::kGyroXoutH, sample);
        if (result != BusResult::OK) {
            return result;
        }
        sumX += sample.x;
        sumY += sample.y;
        sumZ += sample.z;
        m_delay.delayMs(m_config.sample_period_ms);
    }

    const float n = static_cast<float>(m_config.mean_samples > 0 ? m_config.mean_samples : 1);
    mean = Vec3(static_cast<float>(sumX) / n,
                static_cast<float>(sumY) / n,
                static_cast<float>(sumZ) / n);
    return BusResult::OK;
}

int32_t GyroCalibrator::adjustAxis(int32_t offset, float mean) const {
    const float magnitude = fabsf(mean);
    if (magnitude <= m_config.target_mean_counts) {
        return offset;
    }
    const float stepSize = fmaxf(magnitude / m_config.step_divisor, m_config.min_step_counts);
    const int32_t step = static_cast<int32_t>((mean < 0.0F) ? -stepSize : stepSize);
    return offset - step;
}

bool GyroCalibrator::withinTarget(const Vec3& mean) const {
    // Strict: an axis sitting exactly on the target is neither adjusted
    // nor converged, the loop keeps sampling it
    return fabsf(mean.x) < m_config.target_mean_counts &&
           fabsf(mean.y) < m_config.target_mean_counts &&
           fabsf(mean.z) < m_config.target_mean_counts;
}

GyroCalibrationResult GyroCalibrator::finish(const Status& status) {
    if (!status.isOk()) {
        m_state = State::FAILED;
        DBG_ERROR("[GyroCal] Aborted at step %lu: %s\n",
                  static_cast<unsigned long>(m_steps), status_to_string(status));
    } else {
        m_state = m_converged ? State::CONVERGED : State::EXHAUSTED;
    }

    GyroCalibrationResult result;
    result.status = status;
    result.converged = m_converged;
    result.steps = m_steps;
    result.offsets = m_offsets;
    result.fine_tune = m_fine_tune;
    result.mean = m_mean;
    return result;
}

const char* gyro_cal_state_to_string(GyroCalibrator::State state) {
    switch (state) {
        case GyroCalibrator::State::IDLE:      return "IDLE";
        case GyroCalibrator::State::SAMPLING:  return "SAMPLING";
        case GyroCalibrator::State::ADJUSTING: return "ADJUSTING";
        case GyroCalibrator::State::CONVERGED: return "CONVERGED";
        case GyroCalibrator::State::EXHAUSTED: return "EXHAUSTED";
        case GyroCalibrator::State::FAILED:    return "FAILED";
        default:                               return "UNKNOWN";
    }
}

} // namespace mpudrv
