/**
 * @file main.cpp
 * @brief Interactive CLI example for DS1307 RTC
 *
 * Demonstrates field-level RTC access:
 * - Reading and setting each time/date field
 * - 12-hour and 24-hour hour formats
 * - Raw register dump through the transport
 *
 * Type 'help' for available commands.
 */

#include <Arduino.h>
#include <Wire.h>
#include <limits>

#include "examples/common/BoardConfig.h"
#include "examples/common/CliArgs.h"
#include "examples/common/I2cScanner.h"
#include "examples/common/I2cTransport.h"
#include "examples/common/Log.h"
#include "DS1307/CommandTable.h"
#include "DS1307/DS1307.h"
#include "DS1307/Version.h"

static DS1307::DS1307 g_rtc;

/**
 * @brief Convert Err enum to string.
 */
static const char* errToStr(DS1307::Err code) {
  switch (code) {
    case DS1307::Err::OK:              return "OK";
    case DS1307::Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case DS1307::Err::INVALID_CONFIG:  return "INVALID_CONFIG";
    case DS1307::Err::I2C_ERROR:       return "I2C_ERROR";
    case DS1307::Err::TIMEOUT:         return "TIMEOUT";
    case DS1307::Err::INVALID_INPUT:   return "INVALID_INPUT";
    case DS1307::Err::INTERNAL_ERROR:  return "INTERNAL_ERROR";
    default: return "UNKNOWN";
  }
}

static void print_error(const char* op, const DS1307::Status& st) {
  LOGE("%s failed: %s (code=%s, detail=%ld)", op, st.msg, errToStr(st.code),
       static_cast<long>(st.detail));
}

static const char* hourModeStr(const DS1307::Hours& hours) {
  switch (hours.mode) {
    case DS1307::HourMode::AM: return " AM";
    case DS1307::HourMode::PM: return " PM";
    default: return "";
  }
}

/**
 * @brief Non-blocking line reader from Serial.
 */
static String read_line() {
  static String buffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\r') {
      continue;
    }
    if (c == '\n') {
      String result = buffer;
      buffer = "";
      return result;
    }
    if (buffer.length() < 64) {
      buffer += c;
    }
  }
  return "";
}

static void print_help() {
  auto helpItem = [](const char* cmd, const char* desc) {
    Serial.printf("  %s%-24s%s - %s\n", LOG_COLOR_CYAN, cmd, LOG_COLOR_RESET, desc);
  };

  Serial.println();
  Serial.printf("%s=== DS1307 CLI Help ===%s\n", LOG_COLOR_CYAN, LOG_COLOR_RESET);
  Serial.printf("Library version: %s\n", DS1307::VERSION);
  helpItem("help / ?", "Show this help");
  helpItem("version / ver", "Print version info");
  helpItem("scan", "Scan I2C bus");
  helpItem("time", "Read all fields");
  helpItem("sec [0-59]", "Read or set seconds");
  helpItem("min [0-59]", "Read or set minutes");
  helpItem("hour [0-23]", "Read hours or set 24-hour value");
  helpItem("hour12 <1-12> <am|pm>", "Set 12-hour value");
  helpItem("dow [1-7]", "Read or set day of week");
  helpItem("dom [1-31]", "Read or set day of month");
  helpItem("month [1-12]", "Read or set month");
  helpItem("year [2000-2099]", "Read or set year");
  helpItem("regs", "Dump raw timekeeping registers");
  helpItem("selftest", "Read every field once");
  Serial.println();
}

/**
 * @brief Read or set a plain numeric field.
 */
template <typename T>
static void cmd_field(const char* name, const char* usage, const String& args,
                      DS1307::Status (DS1307::DS1307::*getter)(T&),
                      DS1307::Status (DS1307::DS1307::*setter)(T)) {
  if (args.length() == 0) {
    T value = 0;
    DS1307::Status st = (g_rtc.*getter)(value);
    if (!st.ok()) {
      print_error(name, st);
      return;
    }
    Serial.printf("%s = %u\n", name, static_cast<unsigned>(value));
    return;
  }

  unsigned long raw = 0;
  if (!cli_args::parseUnsigned(args.c_str(), std::numeric_limits<T>::max(), raw)) {
    LOGE("Invalid value. Usage: %s", usage);
    return;
  }
  DS1307::Status st = (g_rtc.*setter)(static_cast<T>(raw));
  if (!st.ok()) {
    print_error(name, st);
    return;
  }
  LOGI("%s set to %lu", name, raw);
}

static void cmd_hour(const String& args) {
  if (args.length() == 0) {
    DS1307::Hours hours;
    DS1307::Status st = g_rtc.getHours(hours);
    if (!st.ok()) {
      print_error("getHours", st);
      return;
    }
    Serial.printf("hour = %u%s\n", hours.hour, hourModeStr(hours));
    return;
  }

  unsigned long raw = 0;
  if (!cli_args::parseUnsigned(args.c_str(), UINT8_MAX, raw)) {
    LOGE("Invalid value. Usage: hour [0-23]");
    return;
  }
  const uint8_t h = static_cast<uint8_t>(raw);
  DS1307::Status st = g_rtc.setHours(DS1307::Hours::h24(h));
  if (!st.ok()) {
    print_error("setHours", st);
    return;
  }
  LOGI("Hour set to %u (24-hour mode)", h);
}

static void cmd_hour12(const String& args) {
  const int split = args.indexOf(' ');
  if (split < 0) {
    LOGE("Usage: hour12 <1-12> <am|pm>");
    return;
  }
  const String hourTok = args.substring(0, split);
  String meridiem = args.substring(split + 1);
  meridiem.trim();
  meridiem.toLowerCase();

  unsigned long raw = 0;
  if (!cli_args::parseUnsigned(hourTok.c_str(), UINT8_MAX, raw) ||
      (meridiem != "am" && meridiem != "pm")) {
    LOGE("Usage: hour12 <1-12> <am|pm>");
    return;
  }

  const uint8_t h = static_cast<uint8_t>(raw);
  const DS1307::Hours hours = (meridiem == "pm") ? DS1307::Hours::pm(h) : DS1307::Hours::am(h);
  DS1307::Status st = g_rtc.setHours(hours);
  if (!st.ok()) {
    print_error("setHours", st);
    return;
  }
  LOGI("Hour set to %u%s (12-hour mode)", hours.hour, hourModeStr(hours));
}

static void cmd_time() {
  uint16_t year = 0;
  uint8_t month = 0;
  uint8_t dom = 0;
  uint8_t dow = 0;
  uint8_t minute = 0;
  uint8_t second = 0;
  DS1307::Hours hours;

  // One transaction per field: the fields can roll over between reads.
  DS1307::Status st = g_rtc.getYear(year);
  if (st.ok()) st = g_rtc.getMonth(month);
  if (st.ok()) st = g_rtc.getDayOfMonth(dom);
  if (st.ok()) st = g_rtc.getDayOfWeek(dow);
  if (st.ok()) st = g_rtc.getHours(hours);
  if (st.ok()) st = g_rtc.getMinutes(minute);
  if (st.ok()) st = g_rtc.getSeconds(second);
  if (!st.ok()) {
    print_error("time", st);
    return;
  }

  Serial.printf("%04u-%02u-%02u %02u:%02u:%02u%s (dow=%u)\n",
                year, month, dom, hours.hour, minute, second, hourModeStr(hours), dow);
}

/**
 * @brief Dump registers 0x00-0x06 straight from the transport.
 */
static void cmd_regs() {
  if (!g_rtc.isInitialized()) {
    LOGE("Driver not initialized");
    return;
  }
  for (uint8_t reg = DS1307::cmd::REG_SECONDS; reg <= DS1307::cmd::REG_YEAR; ++reg) {
    uint8_t value = 0;
    DS1307::Status st = cli_args::readRawRegister(g_rtc, reg, value);
    if (!st.ok()) {
      print_error("register read", st);
      return;
    }
    Serial.printf("reg[0x%02X] = 0x%02X\n", reg, value);
  }
}

static void cmd_selftest() {
  uint32_t pass = 0;
  uint32_t fail = 0;
  auto reportCheck = [&](const char* name, const DS1307::Status& st) {
    Serial.printf("  [%s%s%s] %s%s%s\n", LOG_COLOR_RESULT(st.ok()), st.ok() ? "PASS" : "FAIL",
                  LOG_COLOR_RESET, name, st.ok() ? "" : ": ", st.ok() ? "" : st.msg);
    if (st.ok()) {
      pass++;
    } else {
      fail++;
    }
  };

  Serial.println(F("=== DS1307 Selftest (read-only) ==="));
  uint8_t u8 = 0;
  uint16_t u16 = 0;
  DS1307::Hours hours;
  reportCheck("getSeconds", g_rtc.getSeconds(u8));
  reportCheck("getMinutes", g_rtc.getMinutes(u8));
  reportCheck("getHours", g_rtc.getHours(hours));
  reportCheck("getDayOfWeek", g_rtc.getDayOfWeek(u8));
  reportCheck("getDayOfMonth", g_rtc.getDayOfMonth(u8));
  reportCheck("getMonth", g_rtc.getMonth(u8));
  reportCheck("getYear", g_rtc.getYear(u16));

  Serial.printf("Selftest result: pass=%lu fail=%s%lu%s\n", static_cast<unsigned long>(pass),
                LOG_COLOR_RESULT(fail == 0), static_cast<unsigned long>(fail), LOG_COLOR_RESET);
}

static void process_command(const String& line) {
  if (line.length() == 0) {
    return;
  }

  const int spaceIdx = line.indexOf(' ');
  const String cmd = (spaceIdx >= 0) ? line.substring(0, spaceIdx) : line;
  String args = (spaceIdx >= 0) ? line.substring(spaceIdx + 1) : "";
  args.trim();

  if (cmd == "help" || cmd == "?") {
    print_help();
  } else if (cmd == "version" || cmd == "ver") {
    Serial.printf("DS1307 library version: %s\n", DS1307::VERSION);
    Serial.printf("Example build: %s %s\n", __DATE__, __TIME__);
  } else if (cmd == "scan") {
    i2c_scanner::scan(Wire);
  } else if (cmd == "time") {
    cmd_time();
  } else if (cmd == "sec") {
    cmd_field<uint8_t>("seconds", "sec [0-59]", args, &DS1307::DS1307::getSeconds, &DS1307::DS1307::setSeconds);
  } else if (cmd == "min") {
    cmd_field<uint8_t>("minutes", "min [0-59]", args, &DS1307::DS1307::getMinutes, &DS1307::DS1307::setMinutes);
  } else if (cmd == "hour") {
    cmd_hour(args);
  } else if (cmd == "hour12") {
    cmd_hour12(args);
  } else if (cmd == "dow") {
    cmd_field<uint8_t>("day of week", "dow [1-7]", args, &DS1307::DS1307::getDayOfWeek,
                       &DS1307::DS1307::setDayOfWeek);
  } else if (cmd == "dom") {
    cmd_field<uint8_t>("day of month", "dom [1-31]", args, &DS1307::DS1307::getDayOfMonth,
                       &DS1307::DS1307::setDayOfMonth);
  } else if (cmd == "month") {
    cmd_field<uint8_t>("month", "month [1-12]", args, &DS1307::DS1307::getMonth, &DS1307::DS1307::setMonth);
  } else if (cmd == "year") {
    cmd_field<uint16_t>("year", "year [2000-2099]", args, &DS1307::DS1307::getYear, &DS1307::DS1307::setYear);
  } else if (cmd == "regs") {
    cmd_regs();
  } else if (cmd == "selftest") {
    cmd_selftest();
  } else {
    LOGW("Unknown command: '%s'. Type 'help' for available commands.", cmd.c_str());
  }
}

void setup() {
  Serial.begin(115200);
  while (!Serial && millis() < 3000) {
    delay(10);
  }

  print_help();

  LOGI("Initializing I2C (SDA=%d, SCL=%d)...", board::I2C_SDA, board::I2C_SCL);
  if (!board::initI2c()) {
    LOGE("I2C init failed");
    return;
  }

  DS1307::Config cfg;
  cfg.i2cWrite = transport::wireWrite;
  cfg.i2cWriteRead = transport::wireWriteRead;
  cfg.i2cUser = &Wire;
  cfg.i2cTimeoutMs = board::I2C_TIMEOUT_MS;

  DS1307::Status st = g_rtc.begin(cfg);
  if (!st.ok()) {
    print_error("begin", st);
    return;
  }

  // begin() does not touch the bus; read once so wiring problems show up now
  uint8_t sec = 0;
  st = g_rtc.getSeconds(sec);
  if (!st.ok()) {
    print_error("getSeconds", st);
    LOGE("Check I2C wiring and RTC power");
  } else {
    LOGI("RTC responding, seconds=%u", sec);
  }
  Serial.print("> ");
}

void loop() {
  const String line = read_line();
  if (line.length() > 0) {
    process_command(line);
    Serial.print("> ");
  }
  delay(10);
}
