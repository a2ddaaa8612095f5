#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cstring>

#include "DS1307/CommandTable.h"
#include "DS1307/Config.h"
#include "DS1307/Status.h"

namespace test_bus {

/// Register-array bus that records every transaction issued by the driver.
struct FakeI2cBus {
  uint8_t regs[256];

  bool failNextRead = false;
  bool failNextWrite = false;
  DS1307::Status failure = DS1307::Status::Error(DS1307::Err::I2C_ERROR, "forced failure", -2);

  size_t writeCount = 0;
  size_t writeReadCount = 0;
  uint8_t lastAddr = 0;

  uint8_t lastWrite[8];
  size_t lastWriteLen = 0;
  uint8_t lastReadTx[8];
  size_t lastReadTxLen = 0;
  size_t lastReadRxLen = 0;

  size_t transactions() const { return writeCount + writeReadCount; }
};

inline void resetBus(FakeI2cBus& bus) {
  std::memset(bus.regs, 0, sizeof(bus.regs));
  std::memset(bus.lastWrite, 0, sizeof(bus.lastWrite));
  std::memset(bus.lastReadTx, 0, sizeof(bus.lastReadTx));
  bus.failNextRead = false;
  bus.failNextWrite = false;
  bus.failure = DS1307::Status::Error(DS1307::Err::I2C_ERROR, "forced failure", -2);
  bus.writeCount = 0;
  bus.writeReadCount = 0;
  bus.lastAddr = 0;
  bus.lastWriteLen = 0;
  bus.lastReadTxLen = 0;
  bus.lastReadRxLen = 0;
}

inline DS1307::Status fakeI2cWrite(uint8_t addr, const uint8_t* data, size_t len,
                                   uint32_t, void* user) {
  if (!user) {
    return DS1307::Status::Error(DS1307::Err::INVALID_CONFIG, "user null");
  }
  FakeI2cBus* bus = static_cast<FakeI2cBus*>(user);
  bus->writeCount++;
  bus->lastAddr = addr;

  if (addr != DS1307::cmd::I2C_ADDR_7BIT) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "address mismatch", -1);
  }
  if (!data || len == 0 || len > sizeof(bus->lastWrite)) {
    return DS1307::Status::Error(DS1307::Err::INVALID_CONFIG, "write invalid");
  }
  std::memcpy(bus->lastWrite, data, len);
  bus->lastWriteLen = len;

  if (bus->failNextWrite) {
    bus->failNextWrite = false;
    return bus->failure;
  }

  const uint8_t reg = data[0];
  for (size_t i = 1; i < len; ++i) {
    bus->regs[static_cast<uint8_t>(reg + static_cast<uint8_t>(i - 1))] = data[i];
  }
  return DS1307::Status::Ok();
}

inline DS1307::Status fakeI2cWriteRead(uint8_t addr, const uint8_t* tx, size_t txLen,
                                       uint8_t* rx, size_t rxLen, uint32_t, void* user) {
  if (!user) {
    return DS1307::Status::Error(DS1307::Err::INVALID_CONFIG, "user null");
  }
  FakeI2cBus* bus = static_cast<FakeI2cBus*>(user);
  bus->writeReadCount++;
  bus->lastAddr = addr;

  if (addr != DS1307::cmd::I2C_ADDR_7BIT) {
    return DS1307::Status::Error(DS1307::Err::I2C_ERROR, "address mismatch", -1);
  }
  if (!tx || txLen == 0 || txLen > sizeof(bus->lastReadTx) || !rx || rxLen == 0) {
    return DS1307::Status::Error(DS1307::Err::INVALID_CONFIG, "read invalid");
  }
  std::memcpy(bus->lastReadTx, tx, txLen);
  bus->lastReadTxLen = txLen;
  bus->lastReadRxLen = rxLen;

  if (bus->failNextRead) {
    bus->failNextRead = false;
    return bus->failure;
  }

  const uint8_t reg = tx[0];
  for (size_t i = 0; i < rxLen; ++i) {
    rx[i] = bus->regs[static_cast<uint8_t>(reg + static_cast<uint8_t>(i))];
  }
  return DS1307::Status::Ok();
}

inline DS1307::Config makeConfig(FakeI2cBus& bus) {
  DS1307::Config cfg;
  cfg.i2cWrite = fakeI2cWrite;
  cfg.i2cWriteRead = fakeI2cWriteRead;
  cfg.i2cUser = &bus;
  cfg.i2cTimeoutMs = 50;
  return cfg;
}

}  // namespace test_bus
