// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file debug.h
 * @brief Compile-time guarded debug output macros
 *
 * DBG_PRINT and DBG_ERROR are enabled only when MPUDRV_DEBUG is defined
 * (CMake option MPUDRV_ENABLE_DEBUG_OUTPUT). Otherwise they compile to
 * no-ops and the format arguments are not evaluated.
 *
 * Messages start with a bracketed module tag:
 *
 *   DBG_PRINT("[GyroCal] Step %u done\n", step);
 *   DBG_ERROR("[MPU6050] WHO_AM_I mismatch: 0x%02X\n", id);
 *
 * On the RP2350 printf() goes to USB CDC; on the host it goes to stdout.
 * DBG_ERROR writes to stderr on the host so test output stays readable.
 */

#ifndef MPUDRV_DEBUG_H
#define MPUDRV_DEBUG_H

#include <cstdio>

#ifdef MPUDRV_DEBUG

#define DBG_PRINT(fmt, ...) printf(fmt, ##__VA_ARGS__)

#ifdef PICO_BUILD
#define DBG_ERROR(fmt, ...) printf(fmt, ##__VA_ARGS__)
#else
#define DBG_ERROR(fmt, ...) fprintf(stderr, fmt, ##__VA_ARGS__)
#endif

#else

#define DBG_PRINT(fmt, ...) do {} while(0)
#define DBG_ERROR(fmt, ...) do {} while(0)

#endif // MPUDRV_DEBUG

#endif // MPUDRV_DEBUG_H
