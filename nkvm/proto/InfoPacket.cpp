// Copyright (c) 2023, Adam Simpkins
#include "nkvm/proto/InfoPacket.h"

#include "nkvm/Error.h"

#include <cstdio>

namespace nkvm::proto {

namespace {
const char *bool_str(bool value) {
  return value ? "true" : "false";
}
} // namespace

std::error_code InfoPacket::parse(asel::buf_view data, InfoPacket &info) {
  if (data.size() < kMinSize) {
    return make_error_code(ErrorCode::Truncated);
  }
  if (data[0] < kVersionBase) {
    return make_error_code(ErrorCode::BadVersion);
  }

  const double version = 1.0 + (data[0] - kVersionBase) / 10.0;
  char version_buf[16];
  snprintf(version_buf, sizeof(version_buf), "V%.1f", version);

  info.version_byte_ = data[0];
  info.chip_version_ = version_buf;
  info.connected_ = data[1] != 0;
  info.locks_ = hid::LockState::from_bits(data[2]);
  return {};
}

std::string InfoPacket::to_string() const {
  std::string out = "InfoPacket(\n";
  out += "  CHIP_VERSION: " + chip_version_ + "\n";
  out += std::string("  IS_CONNECTED: ") + bool_str(connected_) + "\n";
  out += std::string("  NUM_LOCK:     ") + bool_str(locks_.num_lock) + "\n";
  out += std::string("  CAPS_LOCK:    ") + bool_str(locks_.caps_lock) + "\n";
  out += std::string("  SCROLL_LOCK:  ") + bool_str(locks_.scroll_lock) + "\n";
  out += ")";
  return out;
}

} // namespace nkvm::proto
