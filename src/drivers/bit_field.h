// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#ifndef MPUDRV_DRIVERS_BIT_FIELD_H
#define MPUDRV_DRIVERS_BIT_FIELD_H

// Bit and bit-range access inside a single register byte.
// Pure C++, no Pico SDK dependencies.
//
// Bits are numbered 0 (LSB) to 7. A field (start, length) covers bits
// [start, start + length). Preconditions, not checked at runtime:
//   n < 8
//   length >= 1 and start + length <= 8
//
//   76543210
//   ...xxx..   start = 2, length = 3

#include <cstdint>

namespace mpudrv {
namespace bits {

// Returns bit n of byte as 0 or 1.
uint8_t get_bit(uint8_t byte, uint8_t n);

// Clears bit n, then sets it when value is true. Other bits are unchanged.
void set_bit(uint8_t& byte, uint8_t n, bool value);

// Returns bits [start, start + length) right-aligned.
uint8_t get_bits(uint8_t byte, uint8_t start, uint8_t length);

// Replaces bits [start, start + length) with the low `length` bits of value.
// Higher bits of value are dropped: callers pass enum codes that already fit.
void set_bits(uint8_t& byte, uint8_t start, uint8_t length, uint8_t value);

} // namespace bits
} // namespace mpudrv

#endif // MPUDRV_DRIVERS_BIT_FIELD_H
