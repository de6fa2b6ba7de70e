// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#ifndef MPUDRV_TEST_SIM_MPU6050_H
#define MPUDRV_TEST_SIM_MPU6050_H

// Register-file simulation of an MPU-6050 behind a SensorBus, plus a
// recording Delay. Header-only, host tests only.
//
// - write():     data[0] sets the register pointer, following bytes are
//                stored with auto-increment.
// - writeRead(): out[0] sets the register pointer, in_length bytes are
//                returned with auto-increment.
// - Every call is logged, including failed ones.
// - failAfter(n, r): the next n calls succeed, every later call returns r
//                    without touching the register file.
// - setGyroModel(): GYRO_XOUT_H..GYRO_ZOUT_L are regenerated from the
//                   current XG/YG/ZG_OFFS_USR words before each read that
//                   starts at GYRO_XOUT_H.

#include "hal/Bus.h"
#include "hal/Timing.h"
#include "math/vec3.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace mpudrv {
namespace test {

struct Transaction {
    enum class Kind { WRITE, WRITE_READ };

    Kind kind;
    uint8_t address;
    std::vector<uint8_t> out;
    size_t in_length;
    hal::BusResult result;
};

class SimMpu6050 : public hal::SensorBus {
public:
    static constexpr uint8_t kRegWhoAmI   = 0x75;
    static constexpr uint8_t kRegGyroOut  = 0x43;
    static constexpr uint8_t kRegGyroOffs = 0x13;

    // offsets = current hardware offset words, sample = 0-based index of
    // the gyro output read
    using GyroModel = std::function<Vec3i(const Vec3i& offsets, size_t sample)>;

    explicit SimMpu6050(uint8_t address = 0x68)
        : m_address(address)
        , m_regs{}
        , m_fail_countdown(0)
        , m_fail_armed(false)
        , m_fail_result(hal::BusResult::OK)
        , m_gyro_samples(0)
    {
        m_regs[kRegWhoAmI] = 0x68;
        m_regs[0x6B] = 0x40;  // Power-on: SLEEP set
    }

    // ------------------------------------------------------------------------
    // SensorBus
    // ------------------------------------------------------------------------

    bool begin() override { return true; }

    hal::BusResult write(uint8_t address, const uint8_t* data, size_t length) override {
        Transaction t{Transaction::Kind::WRITE, address,
                      std::vector<uint8_t>(data, data + length), 0, hal::BusResult::OK};
        t.result = nextResult(address);
        m_log.push_back(t);
        if (t.result != hal::BusResult::OK) {
            return t.result;
        }
        if (length == 0) {
            return hal::BusResult::OK;
        }
        uint8_t ptr = data[0];
        for (size_t i = 1; i < length; ++i) {
            m_regs[ptr & 0x7F] = data[i];
            ++ptr;
        }
        return hal::BusResult::OK;
    }

    hal::BusResult writeRead(uint8_t address, const uint8_t* out, size_t out_length,
                             uint8_t* in, size_t in_length) override {
        Transaction t{Transaction::Kind::WRITE_READ, address,
                      std::vector<uint8_t>(out, out + out_length), in_length,
                      hal::BusResult::OK};
        t.result = nextResult(address);
        m_log.push_back(t);
        if (t.result != hal::BusResult::OK) {
            return t.result;
        }
        uint8_t ptr = (out_length > 0) ? out[0] : 0;
        if (ptr == kRegGyroOut && m_gyro_model) {
            Vec3i g = m_gyro_model(gyroOffsets(), m_gyro_samples++);
            setVector(kRegGyroOut, g);
        }
        for (size_t i = 0; i < in_length; ++i) {
            in[i] = m_regs[ptr & 0x7F];
            ++ptr;
        }
        return hal::BusResult::OK;
    }

    bool probe(uint8_t address) override { return address == m_address; }

    // ------------------------------------------------------------------------
    // Register file
    // ------------------------------------------------------------------------

    uint8_t& reg(uint8_t r) { return m_regs[r & 0x7F]; }

    void setWord(uint8_t r, int32_t value) {
        const uint16_t word = static_cast<uint16_t>(static_cast<int16_t>(value));
        reg(r) = static_cast<uint8_t>(word >> 8);
        reg(static_cast<uint8_t>(r + 1)) = static_cast<uint8_t>(word & 0xFF);
    }

    int32_t word(uint8_t r) {
        const uint16_t raw = static_cast<uint16_t>((reg(r) << 8) |
                                                   reg(static_cast<uint8_t>(r + 1)));
        return static_cast<int16_t>(raw);
    }

    void setVector(uint8_t r, const Vec3i& v) {
        setWord(r, v.x);
        setWord(static_cast<uint8_t>(r + 2), v.y);
        setWord(static_cast<uint8_t>(r + 4), v.z);
    }

    Vec3i gyroOffsets() {
        return Vec3i(word(kRegGyroOffs), word(kRegGyroOffs + 2), word(kRegGyroOffs + 4));
    }

    // ------------------------------------------------------------------------
    // Instrumentation
    // ------------------------------------------------------------------------

    const std::vector<Transaction>& log() const { return m_log; }

    size_t countWrites() const {
        size_t n = 0;
        for (const Transaction& t : m_log) {
            if (t.kind == Transaction::Kind::WRITE) {
                ++n;
            }
        }
        return n;
    }

    void failAfter(size_t successes, hal::BusResult result) {
        m_fail_countdown = successes;
        m_fail_armed = true;
        m_fail_result = result;
    }

    void setGyroModel(GyroModel model) { m_gyro_model = model; }
    size_t gyroSamples() const { return m_gyro_samples; }

private:
    hal::BusResult nextResult(uint8_t address) {
        if (m_fail_armed) {
            if (m_fail_countdown == 0) {
                return m_fail_result;
            }
            --m_fail_countdown;
        }
        return (address == m_address) ? hal::BusResult::OK : hal::BusResult::ERR_NACK;
    }

    uint8_t m_address;
    std::array<uint8_t, 128> m_regs;
    std::vector<Transaction> m_log;

    size_t m_fail_countdown;
    bool m_fail_armed;
    hal::BusResult m_fail_result;

    GyroModel m_gyro_model;
    size_t m_gyro_samples;
};

class RecordingDelay : public hal::Delay {
public:
    void delayMs(uint32_t ms) override {
        calls.push_back(ms);
        total_ms += ms;
    }

    std::vector<uint32_t> calls;
    uint64_t total_ms = 0;
};

} // namespace test
} // namespace mpudrv

#endif // MPUDRV_TEST_SIM_MPU6050_H
