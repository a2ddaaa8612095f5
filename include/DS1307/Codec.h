/**
 * @file Codec.h
 * @brief Packed-BCD and register flag conversions for DS1307 registers
 *
 * Pure functions, no bus access. None of them range-check: the chip does not
 * either, and a register holding a nibble above 9 decodes to a plausible but
 * wrong number rather than an error.
 */

#pragma once

#include <stdint.h>

#include "CommandTable.h"

namespace DS1307 {
namespace codec {

/**
 * @brief Convert packed BCD to binary
 *
 * @param bcd Register byte, high nibble = tens digit
 * @return (bcd >> 4) * 10 + (bcd & 0x0F)
 * @note Defined for every input. Only meaningful when both nibbles are <= 9.
 */
constexpr uint8_t bcdToBinary(uint8_t bcd) {
  return static_cast<uint8_t>((bcd >> 4) * 10 + (bcd & 0x0F));
}

/**
 * @brief Convert binary to packed BCD
 *
 * @param value Decimal value
 * @return ((value / 10) << 4) | (value % 10), truncated to 8 bits
 * @warning value must be <= 99. Larger values overflow the tens nibble and the
 *          high bits are dropped silently (e.g. 100 encodes as 0xA0).
 */
constexpr uint8_t binaryToBcd(uint8_t value) {
  return static_cast<uint8_t>(((value / 10) << 4) | (value % 10));
}

/**
 * @brief Clear the clock-halt bit so the seconds field can be decoded
 */
constexpr uint8_t maskClockHalt(uint8_t secondsReg) {
  return static_cast<uint8_t>(secondsReg & ~cmd::SECONDS_CH_MASK);
}

/**
 * @brief Check whether an hours register byte is in 24-hour format
 * @return true if the 12/24 mode bit is clear
 */
constexpr bool is24HourFormat(uint8_t hoursReg) {
  return (hoursReg & cmd::HOURS_12H_MASK) == 0;
}

/**
 * @brief Check the AM/PM bit of an hours register byte
 * @return true if PM
 * @note Only consult when is24HourFormat() is false; in 24-hour mode bit 5 is
 *       the tens-of-hours bit (20-23).
 */
constexpr bool isPm(uint8_t hoursReg) {
  return (hoursReg & cmd::HOURS_PM_MASK) != 0;
}

}  // namespace codec
}  // namespace DS1307
