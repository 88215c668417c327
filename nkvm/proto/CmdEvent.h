// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>

namespace nkvm::proto {

/**
 * Command codes understood by the Nano-KVM USB serial bridge.
 *
 * The bridge answers a command with the same code plus kResponseFlag on
 * success, or plus kErrorResponseFlag on failure.
 */
enum class CmdEvent : uint8_t {
  GetInfo = 0x01,
  SendKbGeneralData = 0x02,
  SendKbMediaData = 0x03,
  SendMsAbsData = 0x04,
  SendMsRelData = 0x05,
  SendMyHidData = 0x06,
  ReadMyHidData = 0x87,
  GetParaCfg = 0x08,
  SetParaCfg = 0x09,
  GetUsbString = 0x0a,
  SetUsbString = 0x0b,
  SetDefaultCfg = 0x0c,
  Reset = 0x0f,
};

inline constexpr uint8_t kResponseFlag = 0x80;
inline constexpr uint8_t kErrorResponseFlag = 0xc0;

const char *cmd_event_name(uint8_t cmd);

} // namespace nkvm::proto
