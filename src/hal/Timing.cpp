// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file Timing.cpp
 * @brief Time and delay utilities implementation (Pico SDK)
 *
 * @note Part of the MPU-6050 driver HAL - Hardware Abstraction Layer
 */

#include "Timing.h"

#include "pico/stdlib.h"
#include "hardware/timer.h"

namespace mpudrv {
namespace hal {

// ============================================================================
// Timing class implementation
// ============================================================================

uint32_t Timing::micros32() {
    return time_us_32();
}

void Timing::delayMs(uint32_t ms) {
    // Single-threaded driver: nothing to yield to
    sleep_ms(ms);
}

// ============================================================================
// IntervalTimer class implementation
// ============================================================================

IntervalTimer::IntervalTimer(uint32_t interval_us)
    : m_interval_us(interval_us)
    , m_last_trigger_us(Timing::micros32())
{
}

bool IntervalTimer::ready() {
    uint32_t now = Timing::micros32();
    if ((now - m_last_trigger_us) >= m_interval_us) {
        m_last_trigger_us = now;
        return true;
    }
    return false;
}

void IntervalTimer::reset() {
    m_last_trigger_us = Timing::micros32();
}

} // namespace hal
} // namespace mpudrv
