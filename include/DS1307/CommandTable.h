/**
 * @file CommandTable.h
 * @brief DS1307 register addresses and bit definitions.
 *
 * Timekeeping registers from the DS1307 datasheet.
 * Use for direct register access via transport layer.
 *
 * @note All time/date registers are packed BCD unless noted.
 */

#pragma once

#include <stdint.h>

namespace DS1307 {

namespace cmd {

// ========== Timekeeping Registers (0x00–0x06) ==========

/// @brief Seconds register (0x00)
/// b7 = CH (clock halt), b6-b0 = BCD seconds (0–59)
static constexpr uint8_t REG_SECONDS = 0x00;

/// @brief Minutes register (0x01)
/// b7 = 0, b6-b0 = BCD minutes (0–59)
static constexpr uint8_t REG_MINUTES = 0x01;

/// @brief Hours register (0x02)
/// b6 = 12/24 select (1 = 12-hour), b5 = AM/PM in 12-hour mode (1 = PM),
/// remaining bits = BCD hour (1–12 or 0–23)
static constexpr uint8_t REG_HOURS = 0x02;

/// @brief Day-of-week register (0x03)
/// b2-b0 = day (1–7), single digit so raw equals BCD
static constexpr uint8_t REG_DAY_OF_WEEK = 0x03;

/// @brief Date/Day-of-Month register (0x04)
/// BCD: b5-b0 (1–31)
static constexpr uint8_t REG_DAY_OF_MONTH = 0x04;

/// @brief Month register (0x05)
/// BCD: b4-b0 (1–12, 1=January)
static constexpr uint8_t REG_MONTH = 0x05;

/// @brief Year register (0x06)
/// BCD: b7-b0 (year within century, 00–99, offset from 2000)
static constexpr uint8_t REG_YEAR = 0x06;

// ========== Register Bit Masks ==========

// Seconds register (REG_SECONDS, 0x00)
static constexpr uint8_t SECONDS_CH_MASK = 0x80;   ///< Clock halt (owned by the chip)

// Hours register (REG_HOURS, 0x02)
static constexpr uint8_t HOURS_12H_MASK = 0x40;    ///< 1 = 12-hour mode, 0 = 24-hour mode
static constexpr uint8_t HOURS_PM_MASK = 0x20;     ///< 1 = PM (12-hour mode only)

// ========== Field Ranges ==========

static constexpr uint8_t MAX_SECONDS = 59;
static constexpr uint8_t MAX_MINUTES = 59;
static constexpr uint8_t MAX_HOURS_24 = 23;
static constexpr uint8_t MIN_HOURS_12 = 1;
static constexpr uint8_t MAX_HOURS_12 = 12;
static constexpr uint8_t MIN_DAY_OF_WEEK = 1;
static constexpr uint8_t MAX_DAY_OF_WEEK = 7;
static constexpr uint8_t MIN_DAY_OF_MONTH = 1;
static constexpr uint8_t MAX_DAY_OF_MONTH = 31;
static constexpr uint8_t MIN_MONTH = 1;
static constexpr uint8_t MAX_MONTH = 12;
static constexpr uint16_t MIN_YEAR = 2000;         ///< Year register value 00
static constexpr uint16_t MAX_YEAR = 2099;         ///< Year register value 99

// I2C Address
static constexpr uint8_t I2C_ADDR_7BIT = 0x68;     ///< 7-bit I2C slave address (0b1101000)

}  // namespace cmd

}  // namespace DS1307
