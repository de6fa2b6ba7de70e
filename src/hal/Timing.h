// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file Timing.h
 * @brief Time and delay utilities
 *
 * Delay is the blocking-wait capability the driver core consumes. Timing,
 * TimingDelay and IntervalTimer are the RP2350 implementations
 * (Pico SDK hardware timer).
 *
 * @note Part of the MPU-6050 driver HAL - Hardware Abstraction Layer
 */

#ifndef MPUDRV_HAL_TIMING_H
#define MPUDRV_HAL_TIMING_H

#include <cstdint>

namespace mpudrv {
namespace hal {

/**
 * @brief Blocking millisecond delay capability
 *
 * Passed explicitly to every driver operation that has to wait (wake,
 * reset, calibration sampling). Implementations must block; there is no
 * cooperative yield in the driver.
 */
class Delay {
public:
    virtual ~Delay() = default;

    /**
     * @brief Block for at least ms milliseconds
     */
    virtual void delayMs(uint32_t ms) = 0;
};


/**
 * @brief Timing utilities
 *
 * Uses the hardware timer for timestamps.
 */
class Timing {
public:
    /**
     * @brief Get current time in microseconds (32-bit, wraps every ~71 min)
     */
    static uint32_t micros32();

    /**
     * @brief Busy-wait delay in milliseconds
     *
     * @warning Blocks the current core.
     */
    static void delayMs(uint32_t ms);

private:
    Timing() = delete;  // Static-only class
};


/**
 * @brief Delay backed by Timing::delayMs()
 */
class TimingDelay : public Delay {
public:
    void delayMs(uint32_t ms) override { Timing::delayMs(ms); }
};


/**
 * @brief Simple interval timer
 *
 * @code
 * IntervalTimer printTimer(100000);  // 100ms interval
 *
 * while (true) {
 *     if (printTimer.ready()) {
 *         printReadings();
 *     }
 * }
 * @endcode
 */
class IntervalTimer {
public:
    /**
     * @brief Construct interval timer
     * @param interval_us Interval in microseconds
     */
    explicit IntervalTimer(uint32_t interval_us);

    /**
     * @brief Check if interval has elapsed and reset if so
     * @return true if interval elapsed (automatically resets)
     */
    bool ready();

    /**
     * @brief Reset timer to current time
     */
    void reset();

private:
    uint32_t m_interval_us;
    uint32_t m_last_trigger_us;
};

} // namespace hal
} // namespace mpudrv

#endif // MPUDRV_HAL_TIMING_H
