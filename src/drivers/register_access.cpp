// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include "drivers/register_access.h"
#include "drivers/bit_field.h"
#include "drivers/mpu6050_regs.h"
#include "drivers/unit_conversion.h"

namespace mpudrv {

using hal::BusResult;

RegisterAccess::RegisterAccess(hal::SensorBus& bus, uint8_t address)
    : m_bus(bus)
    , m_address(address)
{
}

// ============================================================================
// Whole bytes
// ============================================================================

BusResult RegisterAccess::readByte(uint8_t reg, uint8_t& value) {
    return readBytes(reg, &value, 1);
}

BusResult RegisterAccess::writeByte(uint8_t reg, uint8_t value) {
    const uint8_t frame[2] = {reg, value};
    return m_bus.write(m_address, frame, sizeof(frame));
}

BusResult RegisterAccess::readBytes(uint8_t reg, uint8_t* buffer, size_t length) {
    return m_bus.writeRead(m_address, &reg, 1, buffer, length);
}

// ============================================================================
// 16-bit words
// ============================================================================

BusResult RegisterAccess::writeWord(uint8_t reg, uint16_t value) {
    const uint8_t frame[3] = {
        reg,
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value & 0x00FFU),
    };
    return m_bus.write(m_address, frame, sizeof(frame));
}

BusResult RegisterAccess::readWord(uint8_t reg, int32_t& value) {
    uint8_t buf[kWordReadSize] = {};
    BusResult result = readBytes(reg, buf, sizeof(buf));
    if (result != BusResult::OK) {
        return result;
    }
    value = units::decode_word(buf);
    return BusResult::OK;
}

BusResult RegisterAccess::readVector(uint8_t reg, Vec3i& value) {
    uint8_t buf[kVectorReadSize] = {};
    BusResult result = readBytes(reg, buf, sizeof(buf));
    if (result != BusResult::OK) {
        return result;
    }
    value = units::decode_vector(buf);
    return BusResult::OK;
}

// ============================================================================
// Bits and fields
// ============================================================================

BusResult RegisterAccess::readBit(uint8_t reg, uint8_t n, uint8_t& value) {
    uint8_t byte = 0;
    BusResult result = readByte(reg, byte);
    if (result != BusResult::OK) {
        return result;
    }
    value = bits::get_bit(byte, n);
    return BusResult::OK;
}

BusResult RegisterAccess::writeBit(uint8_t reg, uint8_t n, bool enable) {
    uint8_t byte = 0;
    BusResult result = readByte(reg, byte);
    if (result != BusResult::OK) {
        return result;
    }
    bits::set_bit(byte, n, enable);
    return writeByte(reg, byte);
}

BusResult RegisterAccess::readBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t& value) {
    uint8_t byte = 0;
    BusResult result = readByte(reg, byte);
    if (result != BusResult::OK) {
        return result;
    }
    value = bits::get_bits(byte, start, length);
    return BusResult::OK;
}

BusResult RegisterAccess::writeBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t value) {
    uint8_t byte = 0;
    BusResult result = readByte(reg, byte);
    if (result != BusResult::OK) {
        return result;
    }
    bits::set_bits(byte, start, length, value);
    return writeByte(reg, byte);
}

} // namespace mpudrv
