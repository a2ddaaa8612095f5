/**
 * @file DS1307.h
 * @brief Driver for Maxim DS1307 real-time clock (RTC)
 *
 * Register-level access to the DS1307 timekeeping registers over I2C:
 * - Seconds, minutes, hours (12-hour AM/PM or 24-hour)
 * - Day of week, day of month, month, year (2000-2099)
 * - Range validation before any bus traffic
 * - Clock-halt bit preserved across seconds writes
 *
 * Each field is read or written with its own single-register transaction.
 * There is no burst access and no caching.
 *
 * @par Thread Safety
 * Not thread-safe. setSeconds() is a non-atomic read-modify-write: a write to
 * the seconds register by another bus master between the read and the write
 * is lost. Serialize access externally if the driver is shared.
 *
 * @par Usage Example
 * @code
 * #include "DS1307/DS1307.h"
 *
 * DS1307::DS1307 rtc;
 *
 * void setup() {
 *   Wire.begin();
 *
 *   DS1307::Config cfg;
 *   cfg.i2cWrite = transport::wireWrite;
 *   cfg.i2cWriteRead = transport::wireWriteRead;
 *   cfg.i2cUser = &Wire;
 *
 *   DS1307::Status st = rtc.begin(cfg);
 *   if (!st.ok()) {
 *     Serial.printf("RTC init failed: %s\n", st.msg);
 *     return;
 *   }
 *
 *   rtc.setHours(DS1307::Hours::pm(3));
 *   rtc.setMinutes(30);
 * }
 *
 * void loop() {
 *   uint8_t sec = 0;
 *   if (rtc.getSeconds(sec).ok()) {
 *     Serial.printf("sec=%u\n", sec);
 *   }
 *   delay(1000);
 * }
 * @endcode
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Config.h"
#include "Status.h"

namespace DS1307 {

/**
 * @enum HourMode
 * @brief Which hour format an Hours value carries
 */
enum class HourMode : uint8_t {
  H24 = 0,  ///< 24-hour format (0-23)
  AM = 1,   ///< 12-hour format, before noon (1-12)
  PM = 2    ///< 12-hour format, after noon (1-12)
};

/**
 * @struct Hours
 * @brief Hour value tagged with its format
 *
 * Writing an Hours value also switches the chip to the format of its tag.
 */
struct Hours {
  HourMode mode = HourMode::H24;  ///< Format tag
  uint8_t hour = 0;               ///< Hour number, range depends on mode

  constexpr Hours() = default;
  constexpr Hours(HourMode m, uint8_t h) : mode(m), hour(h) {}

  static constexpr Hours h24(uint8_t h) { return Hours{HourMode::H24, h}; }
  static constexpr Hours am(uint8_t h) { return Hours{HourMode::AM, h}; }
  static constexpr Hours pm(uint8_t h) { return Hours{HourMode::PM, h}; }

  constexpr bool operator==(const Hours& other) const {
    return mode == other.mode && hour == other.hour;
  }
  constexpr bool operator!=(const Hours& other) const { return !(*this == other); }
};

/**
 * @class DS1307
 * @brief Field-level driver for the DS1307 real-time clock
 *
 * Follows the begin/end lifecycle pattern. The driver holds the transport
 * configuration and nothing else.
 *
 * @par Bus Traffic
 * Getters issue one write-read (register address, then one byte).
 * Setters issue one write (register address + value). setSeconds() first
 * reads the seconds register to keep the clock-halt bit.
 *
 * @par Error Handling
 * All errors returned as Status. Out-of-range input fails with INVALID_INPUT
 * before any transaction. Transport failures are returned as I2C_ERROR or
 * TIMEOUT with the transport's detail and message.
 */
class DS1307 {
 public:
  /**
   * @brief Attach the driver to a transport
   *
   * @param config Transport callbacks and context
   * @return OK on success, INVALID_CONFIG if a callback is null or the
   *         timeout is zero
   * @note Performs no bus transaction.
   */
  Status begin(const Config& config);

  /**
   * @brief Detach the driver and hand the transport back
   *
   * @return The configuration passed to begin() (default Config if the
   *         driver was not initialized)
   * @note Does not touch the chip.
   */
  Config end();

  /**
   * @brief Check if library is initialized
   *
   * @return true if begin() succeeded
   */
  bool isInitialized() const { return _initialized; }

  /**
   * @brief Get current configuration
   *
   * @return Reference to active configuration
   */
  const Config& getConfig() const { return _config; }

  // ===== Seconds / Minutes =====

  /**
   * @brief Read seconds (0-59), ignoring the clock-halt bit
   *
   * @param[out] out Seconds, untouched on failure
   */
  Status getSeconds(uint8_t& out);

  /**
   * @brief Set seconds (0-59), keeping the clock-halt bit
   *
   * @param seconds New seconds value
   * @return INVALID_INPUT if seconds > 59
   * @note Read-modify-write. Not atomic on the bus.
   */
  Status setSeconds(uint8_t seconds);

  /// @brief Read minutes (0-59)
  Status getMinutes(uint8_t& out);

  /// @brief Set minutes (0-59)
  Status setMinutes(uint8_t minutes);

  // ===== Hours =====

  /**
   * @brief Read hours in whatever format the chip is running
   *
   * @param[out] out Hours tagged H24, AM or PM
   */
  Status getHours(Hours& out);

  /**
   * @brief Set hours and switch the chip to the matching format
   *
   * @param hours H24 (0-23), AM (1-12) or PM (1-12)
   * @return INVALID_INPUT if the hour is out of range for its tag
   */
  Status setHours(const Hours& hours);

  // ===== Date =====

  /// @brief Read day of week (1-7). Day numbering is user-defined.
  Status getDayOfWeek(uint8_t& out);

  /// @brief Set day of week (1-7)
  Status setDayOfWeek(uint8_t dayOfWeek);

  /// @brief Read day of month (1-31)
  Status getDayOfMonth(uint8_t& out);

  /**
   * @brief Set day of month (1-31)
   *
   * @note Not checked against the month length; the chip accepts 31 in any
   *       month.
   */
  Status setDayOfMonth(uint8_t dayOfMonth);

  /// @brief Read month (1-12)
  Status getMonth(uint8_t& out);

  /// @brief Set month (1-12)
  Status setMonth(uint8_t month);

  /// @brief Read year (2000-2099)
  Status getYear(uint16_t& out);

  /// @brief Set year (2000-2099)
  Status setYear(uint16_t year);

  // ===== Static Utility Functions =====

  /**
   * @brief Build the hours register byte for an Hours value
   *
   * @param hours Tagged hour value
   * @param[out] out Register byte with mode bits and BCD hour
   * @return INVALID_INPUT if out of range, INTERNAL_ERROR for an unknown tag
   */
  static Status encodeHours(const Hours& hours, uint8_t& out);

  /**
   * @brief Decode an hours register byte
   *
   * @param raw Hours register value
   * @return Hours tagged by the register's 12/24 and AM/PM bits
   */
  static Hours decodeHours(uint8_t raw);

 private:
  Config _config;
  bool _initialized = false;

  // I2C operations
  Status readRegister(uint8_t reg, uint8_t& value);
  Status writeRegister(uint8_t reg, uint8_t value);

  // BCD helpers
  Status readRegisterBcd(uint8_t reg, uint8_t& value);
  Status writeRegisterBcd(uint8_t reg, uint8_t value);
};

}  // namespace DS1307
