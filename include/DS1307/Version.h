/**
 * @file Version.h
 * @brief DS1307 library version
 */

#pragma once

#include <stdint.h>

namespace DS1307 {

static constexpr uint8_t VERSION_MAJOR = 0;
static constexpr uint8_t VERSION_MINOR = 4;
static constexpr uint8_t VERSION_PATCH = 0;

/// @brief Semantic version string, kept in sync with CMakeLists.txt
static constexpr const char* VERSION = "0.4.0";

}  // namespace DS1307
