/**
 * @file I2cScanner.h
 * @brief Simple I2C bus scanner utility for examples.
 *
 * NOT part of the library API. This is a diagnostic tool for examples.
 */

#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "DS1307/CommandTable.h"
#include "examples/common/Log.h"

namespace i2c_scanner {

/**
 * @brief Scan the 7-bit address range and print responding devices.
 * @param wire Reference to Wire object (must be initialized).
 * @return true if the DS1307 acknowledged its address
 */
inline bool scan(TwoWire& wire) {
  LOGI("Scanning I2C bus...");

  uint8_t count = 0;
  bool rtcFound = false;
  for (uint8_t addr = 0x08; addr <= 0x77; addr++) {
    wire.beginTransmission(addr);
    const uint8_t error = wire.endTransmission(true);
    if (error == 0) {
      Serial.printf("  found 0x%02X%s\n", addr,
                    addr == DS1307::cmd::I2C_ADDR_7BIT ? " (DS1307)" : "");
      count++;
      rtcFound = rtcFound || addr == DS1307::cmd::I2C_ADDR_7BIT;
    } else if (error == 5) {
      LOGW("Timeout at 0x%02X", addr);
    }
    yield();
  }

  LOGI("Scan complete. Found %d device(s).", count);
  if (!rtcFound) {
    LOGW("No device at 0x%02X. Check wiring and the 5V supply.", DS1307::cmd::I2C_ADDR_7BIT);
  }
  return rtcFound;
}

}  // namespace i2c_scanner
