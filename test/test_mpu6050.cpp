// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include <gtest/gtest.h>
#include "drivers/mpu6050.h"
#include "mpudrv/config.h"
#include "sim_mpu6050.h"

#include <vector>

using namespace mpudrv;
using hal::BusResult;
using test::RecordingDelay;
using test::SimMpu6050;
using test::Transaction;

// Gain-4 offset model with a dithered X axis (see test_gyro_calibrator.cpp)
static Vec3i linear_gyro(const Vec3i& offsets, size_t sample) {
    return Vec3i(40 + 4 * offsets.x + static_cast<int32_t>(sample % 2),
                 -25 + 4 * offsets.y,
                 7 + 4 * offsets.z);
}

static std::vector<std::vector<uint8_t>> write_frames(const SimMpu6050& sim) {
    std::vector<std::vector<uint8_t>> frames;
    for (const Transaction& t : sim.log()) {
        if (t.kind == Transaction::Kind::WRITE) {
            frames.push_back(t.out);
        }
    }
    return frames;
}

// ============================================================================
// Construction
// ============================================================================

TEST(Mpu6050Test, DefaultsAreTwoGAnd250Dps) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    EXPECT_FLOAT_EQ(imu.accelSensitivity(), 16384.0f);
    EXPECT_FLOAT_EQ(imu.gyroSensitivity(), 131.0f);
    EXPECT_EQ(imu.getGyroFineTune(), Vec3i(0, 0, 0));
    EXPECT_TRUE(sim.log().empty());
}

TEST(Mpu6050Test, CustomRangesSetSensitivity) {
    SimMpu6050 sim;
    Mpu6050 imu(sim, AccelRange::RANGE_16G, GyroRange::RANGE_2000DPS);
    EXPECT_FLOAT_EQ(imu.accelSensitivity(), 2048.0f);
    EXPECT_FLOAT_EQ(imu.gyroSensitivity(), 16.4f);
    EXPECT_TRUE(sim.log().empty());
}

TEST(Mpu6050Test, CustomAddress) {
    SimMpu6050 sim(i2c::kMpu6050Alt);
    Mpu6050 imu(sim, i2c::kMpu6050Alt);
    RecordingDelay delay;

    EXPECT_TRUE(imu.init(delay).isOk());
    for (const Transaction& t : sim.log()) {
        EXPECT_EQ(t.address, i2c::kMpu6050Alt);
    }
}

TEST(Mpu6050Test, CustomAddressAndRanges) {
    SimMpu6050 sim(i2c::kMpu6050Alt);
    Mpu6050 imu(sim, i2c::kMpu6050Alt, AccelRange::RANGE_4G, GyroRange::RANGE_500DPS);
    EXPECT_FLOAT_EQ(imu.accelSensitivity(), 8192.0f);
    EXPECT_FLOAT_EQ(imu.gyroSensitivity(), 65.5f);

    uint8_t id = 0;
    EXPECT_TRUE(imu.readRegister(0x75, id).isOk());
    EXPECT_EQ(id, 0x68);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST(Mpu6050Test, InitWakesVerifiesAndConfigures) {
    SimMpu6050 sim;
    sim.reg(0x1C) = 0xFF;  // self-test bits, AFS_SEL = 3, HPF = 7
    sim.reg(0x1B) = 0x18;  // FS_SEL = 3
    Mpu6050 imu(sim, AccelRange::RANGE_16G, GyroRange::RANGE_2000DPS);
    RecordingDelay delay;

    Status status = imu.init(delay);

    EXPECT_TRUE(status.isOk());
    EXPECT_EQ(sim.log()[0].out, (std::vector<uint8_t>{0x6B, 0x01}));
    ASSERT_FALSE(delay.calls.empty());
    EXPECT_EQ(delay.calls[0], 100u);
    EXPECT_EQ(sim.reg(0x6B), 0x01);
    EXPECT_EQ(sim.reg(0x1C), 0xE0);  // self-test bits kept
    EXPECT_EQ(sim.reg(0x1B), 0x00);
    EXPECT_FLOAT_EQ(imu.accelSensitivity(), 16384.0f);
    EXPECT_FLOAT_EQ(imu.gyroSensitivity(), 131.0f);
}

TEST(Mpu6050Test, InitRejectsWrongChipId) {
    SimMpu6050 sim;
    sim.reg(0x75) = 0x70;
    sim.reg(0x1C) = 0x18;
    Mpu6050 imu(sim);
    RecordingDelay delay;

    Status status = imu.init(delay);

    EXPECT_EQ(status.kind, ErrorKind::INVALID_CHIP_ID);
    EXPECT_EQ(status.chip_id, 0x70);
    EXPECT_STREQ(status_to_string(status), "INVALID_CHIP_ID");
    EXPECT_EQ(sim.reg(0x1C), 0x18);  // configuration not applied
}

TEST(Mpu6050Test, InitPropagatesBusError) {
    SimMpu6050 sim;
    sim.failAfter(0, BusResult::ERR_NACK);
    Mpu6050 imu(sim);
    RecordingDelay delay;

    Status status = imu.init(delay);

    EXPECT_EQ(status, Status::fromBus(BusResult::ERR_NACK));
    EXPECT_STREQ(status_to_string(status), "ERR_NACK");
    EXPECT_TRUE(delay.calls.empty());
}

TEST(Mpu6050Test, ResetDeviceSetsResetBitAndWaits) {
    SimMpu6050 sim;
    sim.reg(0x6B) = 0x01;
    Mpu6050 imu(sim);
    RecordingDelay delay;

    EXPECT_TRUE(imu.resetDevice(delay).isOk());
    EXPECT_EQ(sim.reg(0x6B), 0x81);
    EXPECT_EQ(delay.calls, (std::vector<uint32_t>{100}));
}

// ============================================================================
// Configuration
// ============================================================================

TEST(Mpu6050Test, AccelRangeUpdatesNextScaledRead) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.setVector(0x3B, Vec3i(4096, 0, -8192));

    ASSERT_TRUE(imu.setAccelRange(AccelRange::RANGE_8G).isOk());
    EXPECT_FLOAT_EQ(imu.accelSensitivity(), 4096.0f);

    AccelRange range = AccelRange::RANGE_2G;
    ASSERT_TRUE(imu.getAccelRange(range).isOk());
    EXPECT_EQ(range, AccelRange::RANGE_8G);

    Vec3 accel;
    ASSERT_TRUE(imu.getAccel(accel).isOk());
    EXPECT_FLOAT_EQ(accel.x, 1.0f);
    EXPECT_FLOAT_EQ(accel.y, 0.0f);
    EXPECT_FLOAT_EQ(accel.z, -2.0f);
}

TEST(Mpu6050Test, GyroRangeUpdatesNextScaledRead) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.setVector(0x43, Vec3i(655, -655, 0));

    ASSERT_TRUE(imu.setGyroRange(GyroRange::RANGE_500DPS).isOk());
    EXPECT_EQ(sim.reg(0x1B), 0x08);

    GyroRange range = GyroRange::RANGE_250DPS;
    ASSERT_TRUE(imu.getGyroRange(range).isOk());
    EXPECT_EQ(range, GyroRange::RANGE_500DPS);

    Vec3 dps;
    ASSERT_TRUE(imu.getGyroDeg(dps).isOk());
    EXPECT_FLOAT_EQ(dps.x, 10.0f);
    EXPECT_FLOAT_EQ(dps.y, -10.0f);
}

TEST(Mpu6050Test, FailedRangeWriteKeepsSensitivity) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.failAfter(1, BusResult::ERR_TIMEOUT);  // read ok, write fails

    Status status = imu.setGyroRange(GyroRange::RANGE_2000DPS);

    EXPECT_EQ(status.bus, BusResult::ERR_TIMEOUT);
    EXPECT_FLOAT_EQ(imu.gyroSensitivity(), 131.0f);
}

TEST(Mpu6050Test, ClockSourceRoundTrip) {
    SimMpu6050 sim;
    sim.reg(0x6B) = 0x40;
    Mpu6050 imu(sim);

    ASSERT_TRUE(imu.setClockSource(ClockSource::PLL_ZGYRO).isOk());
    EXPECT_EQ(sim.reg(0x6B), 0x43);

    ClockSource source = ClockSource::INTERNAL_8MHZ;
    ASSERT_TRUE(imu.getClockSource(source).isOk());
    EXPECT_EQ(source, ClockSource::PLL_ZGYRO);
}

TEST(Mpu6050Test, AccelHpfRoundTrip) {
    SimMpu6050 sim;
    sim.reg(0x1C) = 0x10;  // ±8g
    Mpu6050 imu(sim);

    ASSERT_TRUE(imu.setAccelHpf(AccelHpf::HOLD).isOk());
    EXPECT_EQ(sim.reg(0x1C), 0x17);

    AccelHpf hpf = AccelHpf::RESET;
    ASSERT_TRUE(imu.getAccelHpf(hpf).isOk());
    EXPECT_EQ(hpf, AccelHpf::HOLD);
}

TEST(Mpu6050Test, SleepFlag) {
    SimMpu6050 sim;
    sim.reg(0x6B) = 0x01;
    Mpu6050 imu(sim);

    bool sleeping = true;
    ASSERT_TRUE(imu.getSleepEnabled(sleeping).isOk());
    EXPECT_FALSE(sleeping);

    ASSERT_TRUE(imu.setSleepEnabled(true).isOk());
    EXPECT_EQ(sim.reg(0x6B), 0x41);
}

TEST(Mpu6050Test, TempSensorEnableIsInverted) {
    SimMpu6050 sim;
    sim.reg(0x6B) = 0x01;
    Mpu6050 imu(sim);

    ASSERT_TRUE(imu.setTempSensorEnabled(false).isOk());
    EXPECT_EQ(sim.reg(0x6B), 0x09);  // TEMP_DIS set

    bool enabled = true;
    ASSERT_TRUE(imu.getTempSensorEnabled(enabled).isOk());
    EXPECT_FALSE(enabled);

    ASSERT_TRUE(imu.setTempSensorEnabled(true).isOk());
    EXPECT_EQ(sim.reg(0x6B), 0x01);
    ASSERT_TRUE(imu.getTempSensorEnabled(enabled).isOk());
    EXPECT_TRUE(enabled);
}

TEST(Mpu6050Test, SelfTestBits) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);

    ASSERT_TRUE(imu.setAccelSelfTestX(true).isOk());
    ASSERT_TRUE(imu.setAccelSelfTestZ(true).isOk());
    ASSERT_TRUE(imu.setGyroSelfTestY(true).isOk());
    EXPECT_EQ(sim.reg(0x1C), 0xA0);
    EXPECT_EQ(sim.reg(0x1B), 0x40);

    bool on = false;
    ASSERT_TRUE(imu.getAccelSelfTestX(on).isOk());
    EXPECT_TRUE(on);
    ASSERT_TRUE(imu.getAccelSelfTestY(on).isOk());
    EXPECT_FALSE(on);
    ASSERT_TRUE(imu.getAccelSelfTestZ(on).isOk());
    EXPECT_TRUE(on);
    ASSERT_TRUE(imu.getGyroSelfTestX(on).isOk());
    EXPECT_FALSE(on);
    ASSERT_TRUE(imu.getGyroSelfTestY(on).isOk());
    EXPECT_TRUE(on);
    ASSERT_TRUE(imu.getGyroSelfTestZ(on).isOk());
    EXPECT_FALSE(on);

    ASSERT_TRUE(imu.setAccelSelfTestY(true).isOk());
    ASSERT_TRUE(imu.setGyroSelfTestX(true).isOk());
    ASSERT_TRUE(imu.setGyroSelfTestZ(true).isOk());
    EXPECT_EQ(sim.reg(0x1C), 0xE0);
    EXPECT_EQ(sim.reg(0x1B), 0xE0);
}

// ============================================================================
// Motion detection
// ============================================================================

TEST(Mpu6050Test, MotionSetupSequence) {
    SimMpu6050 sim;
    sim.reg(0x6B) = 0x01;
    sim.reg(0x1C) = 0x08;  // ±4g
    Mpu6050 imu(sim, AccelRange::RANGE_4G, GyroRange::RANGE_250DPS);

    ASSERT_TRUE(imu.setupMotionDetection().isOk());

    const std::vector<std::vector<uint8_t>> expected = {
        {0x6B, 0x00},
        {0x37, 0x20},
        {0x1C, 0x09},  // HPF 5 Hz, range kept
        {0x1F, 10},
        {0x20, 40},
        {0x69, 0x15},
        {0x38, 0x40},
    };
    EXPECT_EQ(write_frames(sim), expected);
}

TEST(Mpu6050Test, MotionSetupKeepsRangeAndScale) {
    SimMpu6050 sim;
    sim.reg(0x1C) = 0x08;  // ±4g
    Mpu6050 imu(sim, AccelRange::RANGE_4G, GyroRange::RANGE_250DPS);
    sim.setVector(0x3B, Vec3i(8192, 0, -8192));

    ASSERT_TRUE(imu.setupMotionDetection().isOk());

    AccelRange range = AccelRange::RANGE_2G;
    ASSERT_TRUE(imu.getAccelRange(range).isOk());
    EXPECT_EQ(range, AccelRange::RANGE_4G);
    EXPECT_FLOAT_EQ(imu.accelSensitivity(), 8192.0f);

    Vec3 accel;
    ASSERT_TRUE(imu.getAccel(accel).isOk());
    EXPECT_FLOAT_EQ(accel.x, 1.0f);
    EXPECT_FLOAT_EQ(accel.z, -1.0f);
}

TEST(Mpu6050Test, MotionSetupStopsOnFirstFailure) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.failAfter(1, BusResult::ERR_BUS_ERROR);

    EXPECT_EQ(imu.setupMotionDetection().bus, BusResult::ERR_BUS_ERROR);
    EXPECT_EQ(sim.log().size(), 2u);
}

TEST(Mpu6050Test, MotionDetectedFlag) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    bool detected = true;

    sim.reg(0x3A) = 0x01;  // DATA_RDY only
    ASSERT_TRUE(imu.getMotionDetected(detected).isOk());
    EXPECT_FALSE(detected);

    sim.reg(0x3A) = 0x41;
    ASSERT_TRUE(imu.getMotionDetected(detected).isOk());
    EXPECT_TRUE(detected);
}

// ============================================================================
// Raw register access
// ============================================================================

TEST(Mpu6050Test, RawPassthroughs) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);

    ASSERT_TRUE(imu.writeRegister(0x1F, 0x33).isOk());
    uint8_t value = 0;
    ASSERT_TRUE(imu.readRegister(0x1F, value).isOk());
    EXPECT_EQ(value, 0x33);

    ASSERT_TRUE(imu.writeWord(0x13, 0x1234).isOk());
    uint8_t buf[2] = {};
    ASSERT_TRUE(imu.readRegisters(0x13, buf, sizeof(buf)).isOk());
    EXPECT_EQ(buf[0], 0x12);
    EXPECT_EQ(buf[1], 0x34);

    ASSERT_TRUE(imu.writeBit(0x1F, 7, true).isOk());
    ASSERT_TRUE(imu.readBit(0x1F, 7, value).isOk());
    EXPECT_EQ(value, 1);

    ASSERT_TRUE(imu.writeBits(0x1F, 0, 4, 0x0F).isOk());
    ASSERT_TRUE(imu.readBits(0x1F, 0, 4, value).isOk());
    EXPECT_EQ(value, 0x0F);
    EXPECT_EQ(sim.reg(0x1F), 0xBF);
}

// ============================================================================
// Sensor data
// ============================================================================

TEST(Mpu6050Test, GyroRadiansFromDegrees) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.setVector(0x43, Vec3i(131 * 180, 0, -131));

    Vec3 rads;
    ASSERT_TRUE(imu.getGyro(rads).isOk());
    EXPECT_NEAR(rads.x, units::kPi, 1e-5f);
    EXPECT_FLOAT_EQ(rads.y, 0.0f);
    EXPECT_NEAR(rads.z, -units::kDegToRad, 1e-7f);
}

TEST(Mpu6050Test, Temperature) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    float temp = 0.0f;

    sim.setWord(0x41, 0);
    ASSERT_TRUE(imu.getTemperature(temp).isOk());
    EXPECT_FLOAT_EQ(temp, 36.53f);

    sim.setWord(0x41, -3400);
    ASSERT_TRUE(imu.getTemperature(temp).isOk());
    EXPECT_NEAR(temp, 26.53f, 1e-4f);
}

TEST(Mpu6050Test, TiltFromLevelBoard) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.setVector(0x3B, Vec3i(0, 16384, 0));

    TiltAngles tilt;
    ASSERT_TRUE(imu.getTiltAngles(tilt).isOk());
    EXPECT_NEAR(tilt.roll, units::kPi / 2.0f, 1e-5f);
    EXPECT_NEAR(tilt.pitch, 0.0f, 1e-5f);
}

TEST(Mpu6050Test, ReadFailureLeavesOutputs) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);
    sim.failAfter(0, BusResult::ERR_TIMEOUT);

    Vec3 accel(9.0f, 9.0f, 9.0f);
    float temp = -1.0f;
    EXPECT_EQ(imu.getAccel(accel).bus, BusResult::ERR_TIMEOUT);
    EXPECT_EQ(imu.getTemperature(temp).bus, BusResult::ERR_TIMEOUT);
    EXPECT_FLOAT_EQ(accel.x, 9.0f);
    EXPECT_FLOAT_EQ(temp, -1.0f);
}

// ============================================================================
// Gyro calibration
// ============================================================================

TEST(Mpu6050Test, GyroOffsetAccessors) {
    SimMpu6050 sim;
    Mpu6050 imu(sim);

    ASSERT_TRUE(imu.setGyroOffsets(-10, 6, -32768).isOk());
    EXPECT_EQ(sim.gyroOffsets(), Vec3i(-10, 6, -32768));

    Vec3i offsets;
    ASSERT_TRUE(imu.getGyroOffsets(offsets).isOk());
    EXPECT_EQ(offsets, Vec3i(-10, 6, -32768));
}

TEST(Mpu6050Test, CalibrationFineTuneAppliesToGyroOnly) {
    SimMpu6050 sim;
    sim.setGyroModel(linear_gyro);
    sim.setVector(0x3B, Vec3i(5, -5, 16384));
    Mpu6050 imu(sim);
    RecordingDelay delay;

    GyroCalibrationResult r = imu.calibrateGyro(delay, nullptr, nullptr);

    ASSERT_TRUE(r.status.isOk());
    ASSERT_TRUE(r.converged);
    EXPECT_EQ(imu.getGyroFineTune(), Vec3i(0, 1, 1));

    // Model now outputs (0, -1, -1) on an even sample
    Vec3i gyro;
    ASSERT_TRUE(imu.readRawGyro(gyro).isOk());
    EXPECT_EQ(gyro, Vec3i(0, 0, 0));

    Vec3i accel;
    ASSERT_TRUE(imu.readRawAccel(accel).isOk());
    EXPECT_EQ(accel, Vec3i(5, -5, 16384));

    imu.resetGyroFineTune();
    EXPECT_EQ(imu.getGyroFineTune(), Vec3i(0, 0, 0));
}

TEST(Mpu6050Test, CalibrationResetsFineTuneBeforeRunning) {
    SimMpu6050 sim;
    sim.setGyroModel(linear_gyro);
    Mpu6050 imu(sim);
    RecordingDelay delay;

    ASSERT_TRUE(imu.calibrateGyro(delay, nullptr, nullptr).converged);
    ASSERT_NE(imu.getGyroFineTune(), Vec3i(0, 0, 0));

    // Second run never converges: fine tune stays cleared
    sim.setGyroModel([](const Vec3i&, size_t) { return Vec3i(500, 500, 500); });
    GyroCalConfig quick;
    quick.discard_samples = 0;
    quick.mean_samples = 4;
    quick.max_steps = 2;
    GyroCalibrationResult r = imu.calibrateGyro(delay, quick, nullptr, nullptr);

    EXPECT_TRUE(r.status.isOk());
    EXPECT_FALSE(r.converged);
    EXPECT_EQ(r.steps, 2u);
    EXPECT_EQ(imu.getGyroFineTune(), Vec3i(0, 0, 0));
}

TEST(Mpu6050Test, CalibrationBusErrorKeepsFineTuneCleared) {
    SimMpu6050 sim;
    sim.setGyroModel(linear_gyro);
    Mpu6050 imu(sim);
    RecordingDelay delay;
    sim.failAfter(10, BusResult::ERR_NACK);

    GyroCalibrationResult r = imu.calibrateGyro(delay, nullptr, nullptr);

    EXPECT_EQ(r.status.kind, ErrorKind::BUS);
    EXPECT_EQ(r.status.bus, BusResult::ERR_NACK);
    EXPECT_EQ(imu.getGyroFineTune(), Vec3i(0, 0, 0));
}
