// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include "drivers/bit_field.h"

namespace mpudrv {
namespace bits {

namespace {

// Right-aligned mask of `length` ones. Computed in 32 bits so length 8
// does not overflow the shift.
inline uint8_t low_mask(uint8_t length) {
    return static_cast<uint8_t>((1U << length) - 1U);
}

} // namespace

uint8_t get_bit(uint8_t byte, uint8_t n) {
    return static_cast<uint8_t>((byte >> n) & 0x01U);
}

void set_bit(uint8_t& byte, uint8_t n, bool value) {
    byte = static_cast<uint8_t>(byte & ~(1U << n));
    if (value) {
        byte = static_cast<uint8_t>(byte | (1U << n));
    }
}

uint8_t get_bits(uint8_t byte, uint8_t start, uint8_t length) {
    return static_cast<uint8_t>((byte >> start) & low_mask(length));
}

void set_bits(uint8_t& byte, uint8_t start, uint8_t length, uint8_t value) {
    const uint8_t mask = low_mask(length);
    const uint32_t field = static_cast<uint32_t>(mask) << start;
    byte = static_cast<uint8_t>((byte & ~field) |
                                ((static_cast<uint32_t>(value & mask)) << start));
}

} // namespace bits
} // namespace mpudrv
