// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include "drivers/mpu6050_status.h"

namespace mpudrv {

const char* status_to_string(const Status& status) {
    switch (status.kind) {
        case ErrorKind::NONE:
            return "OK";
        case ErrorKind::BUS:
            return hal::bus_result_to_string(status.bus);
        case ErrorKind::INVALID_CHIP_ID:
            return "INVALID_CHIP_ID";
        default:
            return "UNKNOWN";
    }
}

} // namespace mpudrv
