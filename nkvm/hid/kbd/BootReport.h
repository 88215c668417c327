// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/hid/usage/keys.h"

#include <asel/array.h>
#include <asel/buf_view.h>

#include <cstdint>

namespace nkvm::kbd {

/**
 * An 8-byte keyboard boot protocol report.
 *
 * Byte 0 holds the modifier bits, byte 1 is reserved, and bytes 2 through 7
 * hold up to 6 pressed non-modifier keys.  This is the payload of a
 * SEND_KB_GENERAL_DATA command.
 */
class BootReport {
public:
  static constexpr size_t kSize = 8;
  static constexpr size_t kFirstKeySlot = 2;

  constexpr BootReport() noexcept = default;

  /**
   * Add a key to the report.
   *
   * Modifier keys set their bit in byte 0.  Other keys occupy the first free
   * key slot.  If all 6 slots are already used every slot is set to
   * Key::ErrorRollOver, as the HID spec requires.
   */
  void add_key(hid::Key key);

  void set_modifiers(uint8_t modifiers) {
    data_[0] = modifiers;
  }
  uint8_t modifiers() const {
    return data_[0];
  }

  // Returns Key::None for an empty slot.  index must be less than 6.
  hid::Key key_at(size_t index) const {
    return static_cast<hid::Key>(data_[kFirstKeySlot + index]);
  }

  bool is_rollover() const {
    return data_[2] == static_cast<uint8_t>(hid::Key::ErrorRollOver);
  }
  bool is_empty() const;
  void clear() {
    data_ = {};
  }

  uint8_t *data() {
    return data_.data();
  }
  const uint8_t *data() const {
    return data_.data();
  }
  asel::buf_view view() const {
    return asel::buf_view(data_.data(), data_.size());
  }
  const asel::array<uint8_t, kSize> &array() const {
    return data_;
  }

  /**
   * Note: the == operator checks for exact equality.
   *
   * Two reports with identical sets of keys pressed but in different
   * order will compare as not equal, despite being logically equivalent.
   */
  bool operator==(const BootReport &other) const {
    return data_ == other.data_;
  }
  bool operator!=(const BootReport &other) const {
    return data_ != other.data_;
  }

private:
  asel::array<uint8_t, kSize> data_ = {};
};

} // namespace nkvm::kbd
