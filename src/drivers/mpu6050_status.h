// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file mpu6050_status.h
 * @brief Result type returned by every MPU-6050 driver operation
 */

#ifndef MPUDRV_DRIVERS_MPU6050_STATUS_H
#define MPUDRV_DRIVERS_MPU6050_STATUS_H

#include "hal/Bus.h"

#include <cstdint>

namespace mpudrv {

/**
 * @brief Failure category
 */
enum class ErrorKind : uint8_t {
    NONE = 0,
    BUS,              // Transport failure, see Status::bus
    INVALID_CHIP_ID,  // WHO_AM_I mismatch during init(), see Status::chip_id
};

/**
 * @brief Operation result
 *
 * Carries the bus result verbatim for ErrorKind::BUS and the byte that was
 * read for ErrorKind::INVALID_CHIP_ID.
 */
struct Status {
    ErrorKind kind{ErrorKind::NONE};
    hal::BusResult bus{hal::BusResult::OK};
    uint8_t chip_id{0};

    static constexpr Status ok() { return Status{}; }

    static constexpr Status fromBus(hal::BusResult result) {
        return (result == hal::BusResult::OK)
            ? Status{}
            : Status{ErrorKind::BUS, result, 0};
    }

    static constexpr Status invalidChipId(uint8_t id) {
        return Status{ErrorKind::INVALID_CHIP_ID, hal::BusResult::OK, id};
    }

    constexpr bool isOk() const { return kind == ErrorKind::NONE; }

    bool operator==(const Status& rhs) const {
        return kind == rhs.kind && bus == rhs.bus && chip_id == rhs.chip_id;
    }
    bool operator!=(const Status& rhs) const { return !(*this == rhs); }
};

/**
 * @brief Printable name for a status
 *
 * "OK", "INVALID_CHIP_ID", or the bus result name for ErrorKind::BUS.
 */
const char* status_to_string(const Status& status);

} // namespace mpudrv

#endif // MPUDRV_DRIVERS_MPU6050_STATUS_H
