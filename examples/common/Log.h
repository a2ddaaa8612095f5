/**
 * @file Log.h
 * @brief Serial logging macros for examples.
 *
 * NOT part of the library API. The library itself never logs.
 */

#pragma once

#include <Arduino.h>

#define LOG_COLOR_RESET  "\033[0m"
#define LOG_COLOR_RED    "\033[31m"
#define LOG_COLOR_GREEN  "\033[32m"
#define LOG_COLOR_YELLOW "\033[33m"
#define LOG_COLOR_CYAN   "\033[36m"

#define LOG_COLOR_RESULT(ok) ((ok) ? LOG_COLOR_GREEN : LOG_COLOR_RED)

#define LOGI(fmt, ...) Serial.printf("[I] " fmt "\n", ##__VA_ARGS__)
#define LOGW(fmt, ...) Serial.printf(LOG_COLOR_YELLOW "[W] " fmt LOG_COLOR_RESET "\n", ##__VA_ARGS__)
#define LOGE(fmt, ...) Serial.printf(LOG_COLOR_RED "[E] " fmt LOG_COLOR_RESET "\n", ##__VA_ARGS__)

inline const char* log_bool_str(bool value) {
  return value ? "true" : "false";
}
