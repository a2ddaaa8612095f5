/**
 * @file I2cTransport.h
 * @brief Wire-based I2C transport adapter for DS1307 examples.
 *
 * Bridges TwoWire to the DS1307::Config callbacks. The library does not
 * depend on Wire directly.
 *
 * NOT part of the library API. Example-only.
 */

#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "DS1307/Status.h"

namespace transport {

/// @brief Largest transfer the adapter accepts (AVR Wire buffer is 32 bytes).
static constexpr size_t kMaxTransfer = 32;

/**
 * @brief Map a Wire endTransmission() result to a Status.
 */
inline DS1307::Status wireResult(uint8_t result) {
  switch (result) {
    case 0:
      return DS1307::Status::Ok();
    case 1:
      return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C data too long", result);
    case 2:
      return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C address NACK", result);
    case 3:
      return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C data NACK", result);
    case 4:
      return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C bus error", result);
    case 5:
      return DS1307::Status::Error(DS1307::Err::TIMEOUT, "I2C timeout", result);
    default:
      return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C unknown error", result);
  }
}

/**
 * @brief Wire-based I2C write implementation.
 *
 * Pass to Config::i2cWrite, and pass &Wire (or custom TwoWire*) to i2cUser.
 *
 * @param addr I2C 7-bit address
 * @param data Register address followed by register data
 * @param len Number of bytes
 * @param timeoutMs Applied to Wire where the core supports it
 * @param user Pointer to TwoWire instance
 */
inline DS1307::Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                                uint32_t timeoutMs, void* user) {
  TwoWire* wire = static_cast<TwoWire*>(user);
  if (wire == nullptr) {
    return DS1307::Status::Error(DS1307::Err::INVALID_CONFIG, "Wire instance is null");
  }
  if (!data || len == 0 || len > kMaxTransfer) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "Invalid I2C write params",
                                 static_cast<int32_t>(len));
  }

#if defined(ARDUINO_ARCH_ESP32)
  wire->setTimeOut(static_cast<uint16_t>(timeoutMs));
#else
  (void)timeoutMs;
#endif

  wire->beginTransmission(addr);
  size_t written = wire->write(data, len);
  if (written != len) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C write incomplete",
                                 static_cast<int32_t>(written));
  }
  return wireResult(wire->endTransmission(true));
}

/**
 * @brief Wire-based I2C write-read implementation.
 *
 * Sends the register address with a repeated start, then reads rxLen bytes.
 * Pass to Config::i2cWriteRead.
 */
inline DS1307::Status wireWriteRead(uint8_t addr, const uint8_t* tx, size_t txLen,
                                    uint8_t* rx, size_t rxLen, uint32_t timeoutMs,
                                    void* user) {
  TwoWire* wire = static_cast<TwoWire*>(user);
  if (wire == nullptr) {
    return DS1307::Status::Error(DS1307::Err::INVALID_CONFIG, "Wire instance is null");
  }
  if (!tx || !rx || txLen == 0 || rxLen == 0 || txLen > kMaxTransfer || rxLen > kMaxTransfer) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "Invalid I2C read params");
  }

#if defined(ARDUINO_ARCH_ESP32)
  wire->setTimeOut(static_cast<uint16_t>(timeoutMs));
#else
  (void)timeoutMs;
#endif

  wire->beginTransmission(addr);
  if (wire->write(tx, txLen) != txLen) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C write incomplete");
  }
  DS1307::Status st = wireResult(wire->endTransmission(false));
  if (!st.ok()) {
    return st;
  }

  size_t read = wire->requestFrom(addr, static_cast<uint8_t>(rxLen));
  if (read != rxLen) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C read length mismatch",
                                 static_cast<int32_t>(read));
  }
  for (size_t i = 0; i < rxLen; ++i) {
    if (!wire->available()) {
      return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "I2C data not available");
    }
    rx[i] = static_cast<uint8_t>(wire->read());
  }
  return DS1307::Status::Ok();
}

}  // namespace transport
