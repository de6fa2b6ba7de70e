// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file register_access.h
 * @brief Byte, word, bit and field access to a register-mapped device
 *
 * Every method is one bus transaction, except the bit and field writes,
 * which are read-modify-write: one read then one write. The pair is not
 * atomic; the caller must own the bus for the duration of the call.
 *
 * Bus failures are returned verbatim. Nothing is retried.
 */

#ifndef MPUDRV_DRIVERS_REGISTER_ACCESS_H
#define MPUDRV_DRIVERS_REGISTER_ACCESS_H

#include "hal/Bus.h"
#include "math/vec3.h"

#include <cstddef>
#include <cstdint>

namespace mpudrv {

class RegisterAccess {
public:
    /**
     * @param bus Bus the device sits on (not owned, must outlive this object)
     * @param address 7-bit device address
     */
    RegisterAccess(hal::SensorBus& bus, uint8_t address);

    uint8_t address() const { return m_address; }

    // ------------------------------------------------------------------------
    // Whole bytes
    // ------------------------------------------------------------------------

    hal::BusResult readByte(uint8_t reg, uint8_t& value);
    hal::BusResult writeByte(uint8_t reg, uint8_t value);

    /**
     * @brief Burst read starting at reg (device auto-increments)
     */
    hal::BusResult readBytes(uint8_t reg, uint8_t* buffer, size_t length);

    // ------------------------------------------------------------------------
    // 16-bit words (big-endian register pairs)
    // ------------------------------------------------------------------------

    /**
     * @brief Write [reg, high, low] as a single 3-byte transaction
     */
    hal::BusResult writeWord(uint8_t reg, uint16_t value);

    /**
     * @brief Read reg and reg+1 as a signed 16-bit value
     */
    hal::BusResult readWord(uint8_t reg, int32_t& value);

    /**
     * @brief Read three consecutive words (X, Y, Z) in one 6-byte burst
     */
    hal::BusResult readVector(uint8_t reg, Vec3i& value);

    // ------------------------------------------------------------------------
    // Bits and fields (see drivers/bit_field.h for numbering)
    // ------------------------------------------------------------------------

    /**
     * @param value Output: 0 or 1
     */
    hal::BusResult readBit(uint8_t reg, uint8_t n, uint8_t& value);
    hal::BusResult writeBit(uint8_t reg, uint8_t n, bool enable);

    /**
     * @param value Output: field value, right-aligned
     */
    hal::BusResult readBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t& value);

    /**
     * @brief Replace a field. value is truncated to `length` bits.
     */
    hal::BusResult writeBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t value);

private:
    hal::SensorBus& m_bus;
    uint8_t m_address;
};

} // namespace mpudrv

#endif // MPUDRV_DRIVERS_REGISTER_ACCESS_H
