// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 Rocket Chip Project
#include "drivers/mpu6050.h"
#include "mpudrv/config.h"
#include "debug.h"

namespace mpudrv {

using hal::BusResult;

// ============================================================================
// Construction
// ============================================================================

Mpu6050::Mpu6050(hal::SensorBus& bus)
    : Mpu6050(bus, i2c::kMpu6050, AccelRange::RANGE_2G, GyroRange::RANGE_250DPS)
{
}

Mpu6050::Mpu6050(hal::SensorBus& bus, AccelRange accel_range, GyroRange gyro_range)
    : Mpu6050(bus, i2c::kMpu6050, accel_range, gyro_range)
{
}

Mpu6050::Mpu6050(hal::SensorBus& bus, uint8_t address)
    : Mpu6050(bus, address, AccelRange::RANGE_2G, GyroRange::RANGE_250DPS)
{
}

Mpu6050::Mpu6050(hal::SensorBus& bus, uint8_t address,
                 AccelRange accel_range, GyroRange gyro_range)
    : m_regs(bus, address)
    , m_accel_sensitivity(accel_sensitivity(accel_range))
    , m_gyro_sensitivity(gyro_sensitivity(gyro_range))
    , m_gyro_fine_tune()
{
}

// ============================================================================
// Lifecycle
// ============================================================================

Status Mpu6050::init(hal::Delay& delay) {
    BusResult result = m_regs.writeByte(reg::kPwrMgmt1, kPwrMgmt1Wake);
    if (result != BusResult::OK) {
        DBG_ERROR("[MPU6050] Wake failed at 0x%02X: %s\n",
                  m_regs.address(), hal::bus_result_to_string(result));
        return Status::fromBus(result);
    }
    delay.delayMs(timing::kWakeSettleMs);

    uint8_t whoAmI = 0;
    result = m_regs.readByte(reg::kWhoAmI, whoAmI);
    if (result != BusResult::OK) {
        DBG_ERROR("[MPU6050] WHO_AM_I read failed: %s\n", hal::bus_result_to_string(result));
        return Status::fromBus(result);
    }
    if (whoAmI != kMpu6050ChipId) {
        DBG_ERROR("[MPU6050] WHO_AM_I mismatch: 0x%02X (expected 0x%02X)\n",
                  whoAmI, kMpu6050ChipId);
        return Status::invalidChipId(whoAmI);
    }

    Status status = setAccelRange(AccelRange::RANGE_2G);
    if (!status.isOk()) {
        return status;
    }
    status = setGyroRange(GyroRange::RANGE_250DPS);
    if (!status.isOk()) {
        return status;
    }
    status = setAccelHpf(AccelHpf::RESET);
    if (!status.isOk()) {
        return status;
    }

    DBG_PRINT("[MPU6050] Ready at 0x%02X\n", m_regs.address());
    return Status::ok();
}

Status Mpu6050::resetDevice(hal::Delay& delay) {
    BusResult result = m_regs.writeBit(reg::kPwrMgmt1, bit::kDeviceReset, true);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    delay.delayMs(timing::kResetSettleMs);
    return Status::ok();
}

// ============================================================================
// Configuration
// ============================================================================

Status Mpu6050::setAccelRange(AccelRange range) {
    BusResult result = m_regs.writeBits(reg::kAccelConfig, bit::kAccelFsSel.start,
                                        bit::kAccelFsSel.length,
                                        static_cast<uint8_t>(range));
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    m_accel_sensitivity = accel_sensitivity(range);
    return Status::ok();
}

Status Mpu6050::getAccelRange(AccelRange& range) {
    uint8_t field = 0;
    BusResult result = m_regs.readBits(reg::kAccelConfig, bit::kAccelFsSel.start,
                                       bit::kAccelFsSel.length, field);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    range = static_cast<AccelRange>(field);
    return Status::ok();
}

Status Mpu6050::setGyroRange(GyroRange range) {
    BusResult result = m_regs.writeBits(reg::kGyroConfig, bit::kGyroFsSel.start,
                                        bit::kGyroFsSel.length,
                                        static_cast<uint8_t>(range));
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    m_gyro_sensitivity = gyro_sensitivity(range);
    return Status::ok();
}

Status Mpu6050::getGyroRange(GyroRange& range) {
    uint8_t field = 0;
    BusResult result = m_regs.readBits(reg::kGyroConfig, bit::kGyroFsSel.start,
                                       bit::kGyroFsSel.length, field);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    range = static_cast<GyroRange>(field);
    return Status::ok();
}

Status Mpu6050::setClockSource(ClockSource source) {
    return Status::fromBus(m_regs.writeBits(reg::kPwrMgmt1, bit::kClkSel.start,
                                            bit::kClkSel.length,
                                            static_cast<uint8_t>(source)));
}

Status Mpu6050::getClockSource(ClockSource& source) {
    uint8_t field = 0;
    BusResult result = m_regs.readBits(reg::kPwrMgmt1, bit::kClkSel.start,
                                       bit::kClkSel.length, field);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    source = static_cast<ClockSource>(field);
    return Status::ok();
}

Status Mpu6050::setAccelHpf(AccelHpf hpf) {
    return Status::fromBus(m_regs.writeBits(reg::kAccelConfig, bit::kAccelHpf.start,
                                            bit::kAccelHpf.length,
                                            static_cast<uint8_t>(hpf)));
}

Status Mpu6050::getAccelHpf(AccelHpf& hpf) {
    uint8_t field = 0;
    BusResult result = m_regs.readBits(reg::kAccelConfig, bit::kAccelHpf.start,
                                       bit::kAccelHpf.length, field);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    hpf = static_cast<AccelHpf>(field);
    return Status::ok();
}

// Single-bit flag helpers shared by sleep, self-test and TEMP_DIS
static Status read_flag(RegisterAccess& regs, uint8_t reg, uint8_t n, bool& enabled) {
    uint8_t value = 0;
    BusResult result = regs.readBit(reg, n, value);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    enabled = (value != 0);
    return Status::ok();
}

static Status write_flag(RegisterAccess& regs, uint8_t reg, uint8_t n, bool enable) {
    return Status::fromBus(regs.writeBit(reg, n, enable));
}

Status Mpu6050::setSleepEnabled(bool enable) {
    return write_flag(m_regs, reg::kPwrMgmt1, bit::kSleep, enable);
}

Status Mpu6050::getSleepEnabled(bool& enabled) {
    return read_flag(m_regs, reg::kPwrMgmt1, bit::kSleep, enabled);
}

Status Mpu6050::setTempSensorEnabled(bool enable) {
    return write_flag(m_regs, reg::kPwrMgmt1, bit::kTempDis, !enable);
}

Status Mpu6050::getTempSensorEnabled(bool& enabled) {
    bool disabled = false;
    Status status = read_flag(m_regs, reg::kPwrMgmt1, bit::kTempDis, disabled);
    if (!status.isOk()) {
        return status;
    }
    enabled = !disabled;
    return Status::ok();
}

// ============================================================================
// Self-test bits
// ============================================================================

Status Mpu6050::setAccelSelfTestX(bool enable) {
    return write_flag(m_regs, reg::kAccelConfig, bit::kXaSt, enable);
}

Status Mpu6050::setAccelSelfTestY(bool enable) {
    return write_flag(m_regs, reg::kAccelConfig, bit::kYaSt, enable);
}

Status Mpu6050::setAccelSelfTestZ(bool enable) {
    return write_flag(m_regs, reg::kAccelConfig, bit::kZaSt, enable);
}

Status Mpu6050::getAccelSelfTestX(bool& enabled) {
    return read_flag(m_regs, reg::kAccelConfig, bit::kXaSt, enabled);
}

Status Mpu6050::getAccelSelfTestY(bool& enabled) {
    return read_flag(m_regs, reg::kAccelConfig, bit::kYaSt, enabled);
}

Status Mpu6050::getAccelSelfTestZ(bool& enabled) {
    return read_flag(m_regs, reg::kAccelConfig, bit::kZaSt, enabled);
}

Status Mpu6050::setGyroSelfTestX(bool enable) {
    return write_flag(m_regs, reg::kGyroConfig, bit::kXgSt, enable);
}

Status Mpu6050::setGyroSelfTestY(bool enable) {
    return write_flag(m_regs, reg::kGyroConfig, bit::kYgSt, enable);
}

Status Mpu6050::setGyroSelfTestZ(bool enable) {
    return write_flag(m_regs, reg::kGyroConfig, bit::kZgSt, enable);
}

Status Mpu6050::getGyroSelfTestX(bool& enabled) {
    return read_flag(m_regs, reg::kGyroConfig, bit::kXgSt, enabled);
}

Status Mpu6050::getGyroSelfTestY(bool& enabled) {
    return read_flag(m_regs, reg::kGyroConfig, bit::kYgSt, enabled);
}

Status Mpu6050::getGyroSelfTestZ(bool& enabled) {
    return read_flag(m_regs, reg::kGyroConfig, bit::kZgSt, enabled);
}

// ============================================================================
// Motion detection
// ============================================================================

Status Mpu6050::setupMotionDetection() {
    BusResult result = m_regs.writeByte(reg::kPwrMgmt1, 0x00);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    result = m_regs.writeByte(reg::kIntPinCfg, motion::kIntPinCfg);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    Status status = setAccelHpf(AccelHpf::HZ_5);
    if (!status.isOk()) {
        return status;
    }
    result = m_regs.writeByte(reg::kMotThr, motion::kThreshold);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    result = m_regs.writeByte(reg::kMotDur, motion::kDurationMs);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    result = m_regs.writeByte(reg::kMotDetectCtrl, motion::kDetectCtrl);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    return Status::fromBus(m_regs.writeByte(reg::kIntEnable, motion::kIntEnable));
}

Status Mpu6050::getMotionDetected(bool& detected) {
    return read_flag(m_regs, reg::kIntStatus, bit::kMotInt, detected);
}

// ============================================================================
// Raw register access
// ============================================================================

Status Mpu6050::readRegister(uint8_t reg, uint8_t& value) {
    return Status::fromBus(m_regs.readByte(reg, value));
}

Status Mpu6050::readRegisters(uint8_t reg, uint8_t* buffer, size_t length) {
    return Status::fromBus(m_regs.readBytes(reg, buffer, length));
}

Status Mpu6050::writeRegister(uint8_t reg, uint8_t value) {
    return Status::fromBus(m_regs.writeByte(reg, value));
}

Status Mpu6050::writeWord(uint8_t reg, uint16_t value) {
    return Status::fromBus(m_regs.writeWord(reg, value));
}

Status Mpu6050::readBit(uint8_t reg, uint8_t n, uint8_t& value) {
    return Status::fromBus(m_regs.readBit(reg, n, value));
}

Status Mpu6050::writeBit(uint8_t reg, uint8_t n, bool enable) {
    return Status::fromBus(m_regs.writeBit(reg, n, enable));
}

Status Mpu6050::readBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t& value) {
    return Status::fromBus(m_regs.readBits(reg, start, length, value));
}

Status Mpu6050::writeBits(uint8_t reg, uint8_t start, uint8_t length, uint8_t value) {
    return Status::fromBus(m_regs.writeBits(reg, start, length, value));
}

// ============================================================================
// Sensor data
// ============================================================================

Status Mpu6050::readRawAccel(Vec3i& raw) {
    return Status::fromBus(m_regs.readVector(reg::kAccelXoutH, raw));
}

Status Mpu6050::readRawGyro(Vec3i& raw) {
    Vec3i counts;
    BusResult result = m_regs.readVector(reg::kGyroXoutH, counts);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    raw = counts + m_gyro_fine_tune;
    return Status::ok();
}

Status Mpu6050::getAccel(Vec3& accel_g) {
    Vec3i raw;
    Status status = readRawAccel(raw);
    if (!status.isOk()) {
        return status;
    }
    accel_g = units::scale(raw, m_accel_sensitivity);
    return Status::ok();
}

Status Mpu6050::getGyroDeg(Vec3& gyro_dps) {
    Vec3i raw;
    Status status = readRawGyro(raw);
    if (!status.isOk()) {
        return status;
    }
    gyro_dps = units::scale(raw, m_gyro_sensitivity);
    return Status::ok();
}

Status Mpu6050::getGyro(Vec3& gyro_rads) {
    Vec3 dps;
    Status status = getGyroDeg(dps);
    if (!status.isOk()) {
        return status;
    }
    gyro_rads = dps * units::kDegToRad;
    return Status::ok();
}

Status Mpu6050::getTemperature(float& temp_c) {
    int32_t raw = 0;
    BusResult result = m_regs.readWord(reg::kTempOutH, raw);
    if (result != BusResult::OK) {
        return Status::fromBus(result);
    }
    temp_c = units::temperature_c(raw);
    return Status::ok();
}

Status Mpu6050::getTiltAngles(TiltAngles& angles) {
    Vec3 accel;
    Status status = getAccel(accel);
    if (!status.isOk()) {
        return status;
    }
    angles = units::tilt_from_accel(accel);
    return Status::ok();
}

// ============================================================================
// Gyro calibration
// ============================================================================

Status Mpu6050::getGyroOffsets(Vec3i& offsets) {
    return Status::fromBus(read_gyro_offsets(m_regs, offsets));
}

Status Mpu6050::setGyroOffsets(int16_t x, int16_t y, int16_t z) {
    return Status::fromBus(write_gyro_offsets(m_regs, Vec3i(x, y, z)));
}

GyroCalibrationResult Mpu6050::calibrateGyro(hal::Delay& delay,
                                             gyro_cal_progress_fn progress, void* user) {
    return calibrateGyro(delay, GyroCalConfig(), progress, user);
}

GyroCalibrationResult Mpu6050::calibrateGyro(hal::Delay& delay, const GyroCalConfig& config,
                                             gyro_cal_progress_fn progress, void* user) {
    resetGyroFineTune();

    GyroCalibrator calibrator(m_regs, delay, config);
    GyroCalibrationResult result = calibrator.run(progress, user);
    if (result.status.isOk() && result.converged) {
        m_gyro_fine_tune = result.fine_tune;
    }
    return result;
}

} // namespace mpudrv
