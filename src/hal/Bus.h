// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
/**
 * @file Bus.h
 * @brief Transactional byte-bus interface for register-mapped sensors
 *
 * The driver core only sees SensorBus. I2CBus is the RP2350 implementation
 * (Pico SDK); the host tests supply a simulated device instead.
 *
 * @note Part of the MPU-6050 driver HAL - Hardware Abstraction Layer
 */

#ifndef MPUDRV_HAL_BUS_H
#define MPUDRV_HAL_BUS_H

#include <cstdint>
#include <cstddef>

namespace mpudrv {
namespace hal {

/**
 * @brief Result codes for bus operations
 */
enum class BusResult : uint8_t {
    OK = 0,
    ERR_TIMEOUT,
    ERR_NACK,
    ERR_BUS_ERROR,
    ERR_INVALID_PARAM,
    ERR_NOT_INITIALIZED
};

/**
 * @brief Printable name for a BusResult (e.g. "ERR_NACK")
 */
const char* bus_result_to_string(BusResult result);

/**
 * @brief Abstract transactional bus
 *
 * Each call is one complete bus transaction addressed to a 7-bit device
 * address. Register-mapped devices expect the register address as the
 * first outgoing byte; building that frame is the caller's job.
 *
 * No retries are done at this level. Callers own the bus exclusively for
 * the duration of any multi-transaction sequence.
 *
 * @code
 * uint8_t reg = 0x75;
 * uint8_t who_am_i = 0;
 * if (bus.writeRead(0x68, &reg, 1, &who_am_i, 1) != BusResult::OK) {
 *     return false;
 * }
 * @endcode
 */
class SensorBus {
public:
    virtual ~SensorBus() = default;

    /**
     * @brief Initialize the bus
     * @return true if initialization successful
     */
    virtual bool begin() = 0;

    /**
     * @brief Write bytes to a device in one transaction
     * @param address 7-bit device address
     * @param data Bytes to send (register address first)
     * @param length Number of bytes to send
     * @return BusResult::OK on success
     */
    virtual BusResult write(uint8_t address, const uint8_t* data, size_t length) = 0;

    /**
     * @brief Write bytes, then read bytes, with a repeated start in between
     * @param address 7-bit device address
     * @param out Bytes to send (register address first)
     * @param out_length Number of bytes to send
     * @param in Buffer for the response
     * @param in_length Number of bytes to read
     * @return BusResult::OK on success
     */
    virtual BusResult writeRead(uint8_t address, const uint8_t* out, size_t out_length,
                                uint8_t* in, size_t in_length) = 0;

    /**
     * @brief Check if a device acknowledges its address
     */
    virtual bool probe(uint8_t address) = 0;

protected:
    SensorBus() = default;

private:
    // Non-copyable
    SensorBus(const SensorBus&) = delete;
    SensorBus& operator=(const SensorBus&) = delete;
};


/**
 * @brief I2C bus implementation
 *
 * Wraps Pico SDK I2C blocking transfers. Register writes are sent as a
 * single START..STOP frame; writeRead() holds the bus with a repeated
 * start between the address phase and the read phase.
 *
 * @note I2C @ 400kHz: a 6-byte burst read takes ~200us
 */
class I2CBus : public SensorBus {
public:
    /**
     * @brief Construct I2C bus instance
     * @param i2c_inst Pico SDK I2C instance (i2c0 or i2c1)
     * @param sda_pin SDA GPIO pin number
     * @param scl_pin SCL GPIO pin number
     * @param freq_hz Bus frequency (default 400kHz)
     */
    I2CBus(void* i2c_inst, uint8_t sda_pin, uint8_t scl_pin, uint32_t freq_hz = 400000);

    ~I2CBus() override;

    bool begin() override;
    BusResult write(uint8_t address, const uint8_t* data, size_t length) override;
    BusResult writeRead(uint8_t address, const uint8_t* out, size_t out_length,
                        uint8_t* in, size_t in_length) override;
    bool probe(uint8_t address) override;

private:
    BusResult checkTransfer(int result, size_t expected) const;

    void* m_i2c;
    uint8_t m_sda_pin;
    uint8_t m_scl_pin;
    uint32_t m_freq_hz;
    bool m_initialized;
};

} // namespace hal
} // namespace mpudrv

#endif // MPUDRV_HAL_BUS_H
