/**
 * @file DS1307.cpp
 * @brief Implementation of DS1307 RTC driver
 */

#include "DS1307/DS1307.h"
#include "DS1307/CommandTable.h"
#include "DS1307/Codec.h"

namespace DS1307 {

// Implementation-only helpers (not part of public API)
namespace {

/// @brief Mark a failed callback result as a transport error.
/// I2C_ERROR and TIMEOUT pass through as-is, anything else keeps its
/// detail and message under I2C_ERROR.
Status mapTransportError(const Status& st) {
  if (st.ok() || st.isTransportError()) {
    return st;
  }
  return Status::Error(Err::I2C_ERROR, st.msg, st.detail);
}

}  // namespace

// ===== Lifecycle Functions =====

Status DS1307::begin(const Config& config) {
  if (_initialized) {
    end();
  }

  if (!config.i2cWrite || !config.i2cWriteRead) {
    return Status::Error(Err::INVALID_CONFIG, "I2C transport callbacks are null");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }

  _config = config;
  _initialized = true;
  return Status::Ok();
}

Config DS1307::end() {
  Config released = _config;
  _config = Config{};
  _initialized = false;
  return released;
}

// ===== Seconds / Minutes =====

Status DS1307::getSeconds(uint8_t& out) {
  uint8_t raw = 0;
  Status st = readRegister(cmd::REG_SECONDS, raw);
  if (!st.ok()) {
    return st;
  }
  out = codec::bcdToBinary(codec::maskClockHalt(raw));
  return Status::Ok();
}

Status DS1307::setSeconds(uint8_t seconds) {
  if (seconds > cmd::MAX_SECONDS) {
    return Status::Error(Err::INVALID_INPUT, "Seconds out of range (0-59)");
  }

  // CH belongs to the chip; read it back so the write leaves it as found
  uint8_t current = 0;
  Status st = readRegister(cmd::REG_SECONDS, current);
  if (!st.ok()) {
    return st;
  }
  const uint8_t value = static_cast<uint8_t>((current & cmd::SECONDS_CH_MASK) |
                                             codec::binaryToBcd(seconds));
  return writeRegister(cmd::REG_SECONDS, value);
}

Status DS1307::getMinutes(uint8_t& out) {
  return readRegisterBcd(cmd::REG_MINUTES, out);
}

Status DS1307::setMinutes(uint8_t minutes) {
  if (minutes > cmd::MAX_MINUTES) {
    return Status::Error(Err::INVALID_INPUT, "Minutes out of range (0-59)");
  }
  return writeRegisterBcd(cmd::REG_MINUTES, minutes);
}

// ===== Hours =====

Status DS1307::getHours(Hours& out) {
  uint8_t raw = 0;
  Status st = readRegister(cmd::REG_HOURS, raw);
  if (!st.ok()) {
    return st;
  }
  out = decodeHours(raw);
  return Status::Ok();
}

Status DS1307::setHours(const Hours& hours) {
  uint8_t value = 0;
  Status st = encodeHours(hours, value);
  if (!st.ok()) {
    return st;
  }
  return writeRegister(cmd::REG_HOURS, value);
}

// ===== Date =====

Status DS1307::getDayOfWeek(uint8_t& out) {
  return readRegisterBcd(cmd::REG_DAY_OF_WEEK, out);
}

Status DS1307::setDayOfWeek(uint8_t dayOfWeek) {
  if (dayOfWeek < cmd::MIN_DAY_OF_WEEK || dayOfWeek > cmd::MAX_DAY_OF_WEEK) {
    return Status::Error(Err::INVALID_INPUT, "Day of week out of range (1-7)");
  }
  // Single digit: raw byte equals BCD
  return writeRegister(cmd::REG_DAY_OF_WEEK, dayOfWeek);
}

Status DS1307::getDayOfMonth(uint8_t& out) {
  return readRegisterBcd(cmd::REG_DAY_OF_MONTH, out);
}

Status DS1307::setDayOfMonth(uint8_t dayOfMonth) {
  if (dayOfMonth < cmd::MIN_DAY_OF_MONTH || dayOfMonth > cmd::MAX_DAY_OF_MONTH) {
    return Status::Error(Err::INVALID_INPUT, "Day of month out of range (1-31)");
  }
  return writeRegisterBcd(cmd::REG_DAY_OF_MONTH, dayOfMonth);
}

Status DS1307::getMonth(uint8_t& out) {
  return readRegisterBcd(cmd::REG_MONTH, out);
}

Status DS1307::setMonth(uint8_t month) {
  if (month < cmd::MIN_MONTH || month > cmd::MAX_MONTH) {
    return Status::Error(Err::INVALID_INPUT, "Month out of range (1-12)");
  }
  return writeRegisterBcd(cmd::REG_MONTH, month);
}

Status DS1307::getYear(uint16_t& out) {
  uint8_t offset = 0;
  Status st = readRegisterBcd(cmd::REG_YEAR, offset);
  if (!st.ok()) {
    return st;
  }
  out = static_cast<uint16_t>(cmd::MIN_YEAR + offset);
  return Status::Ok();
}

Status DS1307::setYear(uint16_t year) {
  if (year < cmd::MIN_YEAR || year > cmd::MAX_YEAR) {
    return Status::Error(Err::INVALID_INPUT, "Year out of range (2000-2099)");
  }
  return writeRegisterBcd(cmd::REG_YEAR, static_cast<uint8_t>(year - cmd::MIN_YEAR));
}

// ===== Static Utility Functions =====

Status DS1307::encodeHours(const Hours& hours, uint8_t& out) {
  switch (hours.mode) {
    case HourMode::H24:
      if (hours.hour > cmd::MAX_HOURS_24) {
        return Status::Error(Err::INVALID_INPUT, "24-hour value out of range (0-23)");
      }
      out = codec::binaryToBcd(hours.hour);
      return Status::Ok();
    case HourMode::AM:
    case HourMode::PM: {
      if (hours.hour < cmd::MIN_HOURS_12 || hours.hour > cmd::MAX_HOURS_12) {
        return Status::Error(Err::INVALID_INPUT, "12-hour value out of range (1-12)");
      }
      uint8_t flags = cmd::HOURS_12H_MASK;
      if (hours.mode == HourMode::PM) {
        flags = static_cast<uint8_t>(flags | cmd::HOURS_PM_MASK);
      }
      out = static_cast<uint8_t>(flags | codec::binaryToBcd(hours.hour));
      return Status::Ok();
    }
  }
  return Status::Error(Err::INTERNAL_ERROR, "Unknown hour mode",
                       static_cast<int32_t>(hours.mode));
}

Hours DS1307::decodeHours(uint8_t raw) {
  if (codec::is24HourFormat(raw)) {
    return Hours::h24(codec::bcdToBinary(static_cast<uint8_t>(raw & ~cmd::HOURS_12H_MASK)));
  }
  const uint8_t hour = codec::bcdToBinary(
      static_cast<uint8_t>(raw & ~(cmd::HOURS_12H_MASK | cmd::HOURS_PM_MASK)));
  return codec::isPm(raw) ? Hours::pm(hour) : Hours::am(hour);
}

// ===== Private Helper Functions =====

Status DS1307::readRegister(uint8_t reg, uint8_t& value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  uint8_t tx = reg;
  uint8_t rx = 0;
  Status st = mapTransportError(_config.i2cWriteRead(cmd::I2C_ADDR_7BIT, &tx, 1, &rx, 1,
                                                     _config.i2cTimeoutMs, _config.i2cUser));
  if (st.ok()) {
    value = rx;
  }
  return st;
}

Status DS1307::writeRegister(uint8_t reg, uint8_t value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  const uint8_t tx[2] = {reg, value};
  return mapTransportError(_config.i2cWrite(cmd::I2C_ADDR_7BIT, tx, sizeof(tx),
                                            _config.i2cTimeoutMs, _config.i2cUser));
}

Status DS1307::readRegisterBcd(uint8_t reg, uint8_t& value) {
  uint8_t raw = 0;
  Status st = readRegister(reg, raw);
  if (st.ok()) {
    value = codec::bcdToBinary(raw);
  }
  return st;
}

Status DS1307::writeRegisterBcd(uint8_t reg, uint8_t value) {
  return writeRegister(reg, codec::binaryToBcd(value));
}

}  // namespace DS1307
