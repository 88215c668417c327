// Copyright (c) 2023, Adam Simpkins
#include "nkvm/hid/kbd/BootReport.h"

namespace nkvm::kbd {

void BootReport::add_key(hid::Key key) {
  if (key == hid::Key::None) {
    return;
  }
  if (hid::is_modifier(key)) {
    data_[0] |= hid::modifier_bit(key);
    return;
  }

  const auto value = static_cast<uint8_t>(key);
  for (size_t idx = kFirstKeySlot; idx < data_.size(); ++idx) {
    if (data_[idx] == value) {
      return;
    }
    if (data_[idx] == 0) {
      data_[idx] = value;
      return;
    }
  }

  if (is_rollover()) {
    return;
  }
  for (size_t idx = kFirstKeySlot; idx < data_.size(); ++idx) {
    data_[idx] = static_cast<uint8_t>(hid::Key::ErrorRollOver);
  }
}

bool BootReport::is_empty() const {
  for (size_t idx = 0; idx < data_.size(); ++idx) {
    if (data_[idx] != 0) {
      return false;
    }
  }
  return true;
}

} // namespace nkvm::kbd
