// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file BusResult.cpp
 * @brief Platform-independent part of the bus interface
 */

#include "Bus.h"

namespace mpudrv {
namespace hal {

const char* bus_result_to_string(BusResult result) {
    switch (result) {
        case BusResult::OK:                  return "OK";
        case BusResult::ERR_TIMEOUT:         return "ERR_TIMEOUT";
        case BusResult::ERR_NACK:            return "ERR_NACK";
        case BusResult::ERR_BUS_ERROR:       return "ERR_BUS_ERROR";
        case BusResult::ERR_INVALID_PARAM:   return "ERR_INVALID_PARAM";
        case BusResult::ERR_NOT_INITIALIZED: return "ERR_NOT_INITIALIZED";
        default:                             return "UNKNOWN";
    }
}

} // namespace hal
} // namespace mpudrv
