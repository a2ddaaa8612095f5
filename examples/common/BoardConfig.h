/**
 * @file BoardConfig.h
 * @brief Example board defaults and I2C bring-up.
 *
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is pin-agnostic. All bus access goes through
 *          the callbacks in Config.
 */

#pragma once

#include <Arduino.h>
#include <Wire.h>

namespace board {

/// @brief I2C SDA pin. Example default for ESP32-S2/S3.
static constexpr int I2C_SDA = 21;

/// @brief I2C SCL pin. Example default for ESP32-S2/S3.
static constexpr int I2C_SCL = 22;

/// @brief DS1307 is a standard-mode (100 kHz) device.
static constexpr uint32_t I2C_FREQ_HZ = 100000;

/// @brief Wire timeout in milliseconds.
static constexpr uint16_t I2C_TIMEOUT_MS = 50;

/**
 * @brief Initialize Wire on the example pins.
 * @return true on success
 */
inline bool initI2c() {
#if defined(ARDUINO_ARCH_ESP32)
  // Clock out a stuck slave before starting the bus
  pinMode(I2C_SCL, OUTPUT);
  pinMode(I2C_SDA, INPUT_PULLUP);
  for (int i = 0; i < 9; i++) {
    digitalWrite(I2C_SCL, LOW);
    delayMicroseconds(5);
    digitalWrite(I2C_SCL, HIGH);
    delayMicroseconds(5);
  }
  if (!Wire.begin(I2C_SDA, I2C_SCL)) {
    return false;
  }
  Wire.setTimeOut(I2C_TIMEOUT_MS);
#else
  Wire.begin();
#endif
  Wire.setClock(I2C_FREQ_HZ);
  return true;
}

}  // namespace board
