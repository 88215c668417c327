// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/hid/leds.h"

#include <asel/buf_view.h>

#include <cstdint>
#include <string>
#include <system_error>

namespace nkvm::proto {

/**
 * The payload of a GET_INFO response.
 *
 * Byte 0 is the chip version, encoded as 0x30 + tenths above V1.0.
 * Byte 1 is non-zero when the target machine has enumerated the bridge's USB
 * keyboard and mouse.  Byte 2 holds the target's lock LED bits.
 * Any further bytes are reserved.
 */
class InfoPacket {
public:
  static constexpr size_t kMinSize = 3;
  static constexpr uint8_t kVersionBase = 0x30;

  InfoPacket() = default;

  [[nodiscard]] static std::error_code parse(asel::buf_view data,
                                             InfoPacket &info);

  uint8_t version_byte() const {
    return version_byte_;
  }
  // e.g. "V1.0" for 0x30, "V1.1" for 0x31
  const std::string &chip_version() const {
    return chip_version_;
  }
  bool is_connected() const {
    return connected_;
  }
  hid::LockState locks() const {
    return locks_;
  }
  bool num_lock() const {
    return locks_.num_lock;
  }
  bool caps_lock() const {
    return locks_.caps_lock;
  }
  bool scroll_lock() const {
    return locks_.scroll_lock;
  }

  std::string to_string() const;

private:
  uint8_t version_byte_ = 0;
  std::string chip_version_;
  bool connected_ = false;
  hid::LockState locks_;
};

} // namespace nkvm::proto
