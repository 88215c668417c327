// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>

namespace nkvm::hid {

/**
 * Usage Codes for the LED Usage Page (0x08)
 *
 * Defined in the HID Usage Tables v1.3 spec:
 * https://usb.org/sites/default/files/hut1_3_0.pdf
 * (Section 11, page 96)
 */
enum class Led : uint8_t {
  None = 0x00,
  NumLock = 0x01,
  CapsLock = 0x02,
  ScrollLock = 0x03,
  Compose = 0x04,
  Kana = 0x05,
};

/**
 * The lock LED state of the controlled machine's keyboard.
 *
 * The bridge reports this as the host's keyboard output report: bit N holds
 * the state of LED usage N + 1.
 */
struct LockState {
  static constexpr LockState from_bits(uint8_t bits) {
    LockState state;
    state.num_lock = (bits & led_bit(Led::NumLock)) != 0;
    state.caps_lock = (bits & led_bit(Led::CapsLock)) != 0;
    state.scroll_lock = (bits & led_bit(Led::ScrollLock)) != 0;
    return state;
  }

  static constexpr uint8_t led_bit(Led led) {
    return static_cast<uint8_t>(1 << (static_cast<uint8_t>(led) - 1));
  }

  bool operator==(const LockState &) const = default;

  bool num_lock = false;
  bool caps_lock = false;
  bool scroll_lock = false;
};

} // namespace nkvm::hid
