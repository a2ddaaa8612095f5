/**
 * @file CliArgs.h
 * @brief Argument parsing and raw register access for the CLI example.
 *
 * NOT part of the library API. Kept free of Arduino headers so the native
 * tests can exercise it.
 */

#pragma once

#include <stdint.h>
#include <cstdlib>

#include "DS1307/CommandTable.h"
#include "DS1307/DS1307.h"

namespace cli_args {

/**
 * @brief Parse a whole token as an unsigned number (decimal, 0x hex or 0 octal).
 *
 * @param text Token, surrounding whitespace already trimmed
 * @param maxValue Largest accepted value
 * @param[out] out Parsed value, untouched on failure
 * @return false for empty text, trailing characters, a sign, or a value above maxValue
 */
inline bool parseUnsigned(const char* text, unsigned long maxValue, unsigned long& out) {
  if (text == nullptr || *text == '\0' || *text == '-' || *text == '+') {
    return false;
  }
  char* end = nullptr;
  const unsigned long value = strtoul(text, &end, 0);
  if (end == text || *end != '\0' || value > maxValue) {
    return false;
  }
  out = value;
  return true;
}

/**
 * @brief Read one register straight through the driver's transport.
 *
 * @return NOT_INITIALIZED when the driver has no transport attached
 */
inline DS1307::Status readRawRegister(const DS1307::DS1307& rtc, uint8_t reg, uint8_t& value) {
  if (!rtc.isInitialized()) {
    return DS1307::Status::Error(DS1307::Err::NOT_INITIALIZED, "Driver not initialized");
  }
  const DS1307::Config& cfg = rtc.getConfig();
  return cfg.i2cWriteRead(DS1307::cmd::I2C_ADDR_7BIT, &reg, 1, &value, 1,
                          cfg.i2cTimeoutMs, cfg.i2cUser);
}

}  // namespace cli_args
