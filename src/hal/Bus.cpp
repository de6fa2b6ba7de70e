// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file Bus.cpp
 * @brief I2C bus implementation on the Pico SDK
 *
 * @note Part of the MPU-6050 driver HAL - Hardware Abstraction Layer
 */

#include "Bus.h"

#include "hardware/i2c.h"
#include "hardware/gpio.h"
#include "pico/stdlib.h"

namespace mpudrv {
namespace hal {

// ============================================================================
// I2CBus class implementation
// ============================================================================

I2CBus::I2CBus(void* i2c_inst, uint8_t sda_pin, uint8_t scl_pin, uint32_t freq_hz)
    : m_i2c(i2c_inst)
    , m_sda_pin(sda_pin)
    , m_scl_pin(scl_pin)
    , m_freq_hz(freq_hz)
    , m_initialized(false)
{
}

I2CBus::~I2CBus() {
    if (m_initialized) {
        i2c_deinit(static_cast<i2c_inst_t*>(m_i2c));
    }
}

bool I2CBus::begin() {
    if (m_initialized) {
        return true;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    if (i2c_init(i2c, m_freq_hz) == 0) {
        return false;
    }

    gpio_set_function(m_sda_pin, GPIO_FUNC_I2C);
    gpio_set_function(m_scl_pin, GPIO_FUNC_I2C);

    // Breakout boards carry their own pull-ups; the internal ones are a backup
    gpio_pull_up(m_sda_pin);
    gpio_pull_up(m_scl_pin);

    m_initialized = true;
    return true;
}

BusResult I2CBus::checkTransfer(int result, size_t expected) const {
    if (result == PICO_ERROR_GENERIC) {
        return BusResult::ERR_NACK;
    }
    if (result == PICO_ERROR_TIMEOUT) {
        return BusResult::ERR_TIMEOUT;
    }
    if (result < 0 || static_cast<size_t>(result) != expected) {
        return BusResult::ERR_BUS_ERROR;
    }
    return BusResult::OK;
}

BusResult I2CBus::write(uint8_t address, const uint8_t* data, size_t length) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    if (data == nullptr || length == 0) {
        return BusResult::ERR_INVALID_PARAM;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);
    int result = i2c_write_blocking(i2c, address, data, length, false);
    return checkTransfer(result, length);
}

BusResult I2CBus::writeRead(uint8_t address, const uint8_t* out, size_t out_length,
                            uint8_t* in, size_t in_length) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    if (out == nullptr || out_length == 0 || in == nullptr || in_length == 0) {
        return BusResult::ERR_INVALID_PARAM;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    // nostop = true: repeated start keeps the register pointer for the read
    int result = i2c_write_blocking(i2c, address, out, out_length, true);
    BusResult status = checkTransfer(result, out_length);
    if (status != BusResult::OK) {
        return status;
    }

    result = i2c_read_blocking(i2c, address, in, in_length, false);
    return checkTransfer(result, in_length);
}

bool I2CBus::probe(uint8_t address) {
    if (!m_initialized) {
        return false;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    uint8_t dummy;
    int result = i2c_read_blocking(i2c, address, &dummy, 1, false);

    return result >= 0;
}

} // namespace hal
} // namespace mpudrv
