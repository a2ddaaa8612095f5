/**
 * @file Config.h
 * @brief Configuration for DS1307 RTC library
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"

namespace DS1307 {

/// @brief I2C write callback signature.
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// @brief I2C write-read callback signature.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* tx, size_t txLen,
                                  uint8_t* rx, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/**
 * @struct Config
 * @brief Transport configuration handed to DS1307::begin()
 *
 * The library never touches the bus directly. All transactions go through
 * the two callbacks below; the application owns the bus and its pins.
 * The device address is fixed by the chip (0x68) and is not configurable.
 */
struct Config {
  /// @brief I2C write callback (required).
  I2cWriteFn i2cWrite = nullptr;

  /// @brief I2C write-read callback (required).
  I2cWriteReadFn i2cWriteRead = nullptr;

  /// @brief User context passed to I2C callbacks (e.g., TwoWire*).
  void* i2cUser = nullptr;

  /// @brief I2C transaction timeout in milliseconds (default: 50ms)
  /// @note Passed to the transport callback. The library never enforces it.
  uint32_t i2cTimeoutMs = 50;
};

}  // namespace DS1307
