/**
 * @file Status.h
 * @brief Error status codes for DS1307 RTC library
 */

#pragma once

#include <stdint.h>

namespace DS1307 {

/**
 * @enum Err
 * @brief Error codes returned by library operations
 */
enum class Err : uint8_t {
  OK = 0,            ///< Operation successful
  NOT_INITIALIZED,   ///< Library not initialized (call begin() first)
  INVALID_CONFIG,    ///< Invalid configuration parameter
  I2C_ERROR,         ///< I2C transport failure
  TIMEOUT,           ///< I2C transport timed out
  INVALID_INPUT,     ///< Setter argument out of range, nothing was written
  INTERNAL_ERROR     ///< Driver invariant violated
};

/**
 * @struct Status
 * @brief Status result from library operations
 *
 * All library functions return Status to indicate success or failure.
 * Check status.ok() to determine if operation succeeded.
 */
struct Status {
  Err code = Err::OK;      ///< Error category
  int32_t detail = 0;      ///< Transport error code or other detail
  const char* msg = "";    ///< Static error message (never heap-allocated)

  constexpr Status() = default;

  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /**
   * @brief Check if operation succeeded
   * @return true if code == Err::OK
   */
  constexpr bool ok() const { return code == Err::OK; }

  /**
   * @brief Check if the failure was reported by the transport layer
   * @return true for I2C_ERROR and TIMEOUT
   */
  constexpr bool isTransportError() const {
    return code == Err::I2C_ERROR || code == Err::TIMEOUT;
  }

  /**
   * @brief Create successful status
   */
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /**
   * @brief Create error status
   * @param err Error code
   * @param message Static error message
   * @param detailCode Optional detail code
   */
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

}  // namespace DS1307
