// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>

namespace nkvm::hid {

/**
 * Usage Codes for the Keyboard/Keypad Usage Page (0x07)
 *
 * Defined in the HID Usage Tables v1.3 spec:
 * https://usb.org/sites/default/files/hut1_3_0.pdf
 * (Section 10, page 88)
 *
 * Key names follow the US layout.
 */
enum class Key : uint8_t {
  None = 0x00,
  ErrorRollOver = 0x01,
  PostFail = 0x02,
  ErrorUndefined = 0x03,
  A = 0x04,
  B = 0x05,
  C = 0x06,
  D = 0x07,
  E = 0x08,
  F = 0x09,
  G = 0x0a,
  H = 0x0b,
  I = 0x0c,
  J = 0x0d,
  K = 0x0e,
  L = 0x0f,
  M = 0x10,
  N = 0x11,
  O = 0x12,
  P = 0x13,
  Q = 0x14,
  R = 0x15,
  S = 0x16,
  T = 0x17,
  U = 0x18,
  V = 0x19,
  W = 0x1a,
  X = 0x1b,
  Y = 0x1c,
  Z = 0x1d,
  Num1 = 0x1e,
  Num2 = 0x1f,
  Num3 = 0x20,
  Num4 = 0x21,
  Num5 = 0x22,
  Num6 = 0x23,
  Num7 = 0x24,
  Num8 = 0x25,
  Num9 = 0x26,
  Num0 = 0x27,
  Enter = 0x28,
  Escape = 0x29,
  Backspace = 0x2a,
  Tab = 0x2b,
  Space = 0x2c,
  Minus = 0x2d,
  Equal = 0x2e,
  LeftBracket = 0x2f,
  RightBracket = 0x30,
  Backslash = 0x31,
  NonUsHash = 0x32,
  Semicolon = 0x33,
  Apostrophe = 0x34,
  Grave = 0x35,
  Comma = 0x36,
  Period = 0x37,
  Slash = 0x38,
  CapsLock = 0x39,
  F1 = 0x3a,
  F2 = 0x3b,
  F3 = 0x3c,
  F4 = 0x3d,
  F5 = 0x3e,
  F6 = 0x3f,
  F7 = 0x40,
  F8 = 0x41,
  F9 = 0x42,
  F10 = 0x43,
  F11 = 0x44,
  F12 = 0x45,
  PrintScreen = 0x46,
  ScrollLock = 0x47,
  Pause = 0x48,
  Insert = 0x49,
  Home = 0x4a,
  PageUp = 0x4b,
  Delete = 0x4c,
  End = 0x4d,
  PageDown = 0x4e,
  Right = 0x4f,
  Left = 0x50,
  Down = 0x51,
  Up = 0x52,
  NumLock = 0x53,
  KeypadSlash = 0x54,
  KeypadAsterisk = 0x55,
  KeypadMinus = 0x56,
  KeypadPlus = 0x57,
  KeypadEnter = 0x58,
  Keypad1 = 0x59,
  Keypad2 = 0x5a,
  Keypad3 = 0x5b,
  Keypad4 = 0x5c,
  Keypad5 = 0x5d,
  Keypad6 = 0x5e,
  Keypad7 = 0x5f,
  Keypad8 = 0x60,
  Keypad9 = 0x61,
  Keypad0 = 0x62,
  KeypadPeriod = 0x63,
  NonUsBackslash = 0x64,
  Application = 0x65,
  Power = 0x66,
  KeypadEqual = 0x67,
  F13 = 0x68,
  F14 = 0x69,
  F15 = 0x6a,
  F16 = 0x6b,
  F17 = 0x6c,
  F18 = 0x6d,
  F19 = 0x6e,
  F20 = 0x6f,
  F21 = 0x70,
  F22 = 0x71,
  F23 = 0x72,
  F24 = 0x73,
  Execute = 0x74,
  Help = 0x75,
  Menu = 0x76,
  Select = 0x77,
  Stop = 0x78,
  Again = 0x79,
  Undo = 0x7a,
  Cut = 0x7b,
  Copy = 0x7c,
  Paste = 0x7d,
  Find = 0x7e,
  Mute = 0x7f,
  VolumeUp = 0x80,
  VolumeDown = 0x81,
  // 0x82 through 0xa4 are rarely used and omitted here.
  ExSel = 0xa4,

  LeftControl = 0xe0,
  LeftShift = 0xe1,
  LeftAlt = 0xe2,
  LeftGui = 0xe3,
  RightControl = 0xe4,
  RightShift = 0xe5,
  RightAlt = 0xe6,
  RightGui = 0xe7,
};

constexpr bool is_modifier(Key key) {
  return static_cast<uint8_t>(key) >= static_cast<uint8_t>(Key::LeftControl) &&
         static_cast<uint8_t>(key) <= static_cast<uint8_t>(Key::RightGui);
}

/**
 * Bits of the modifier byte at the start of a keyboard report.
 *
 * Bit N corresponds to key usage 0xE0 + N.
 */
enum Modifier : uint8_t {
  ModNone = 0x00,
  ModLeftCtrl = 0x01,
  ModLeftShift = 0x02,
  ModLeftAlt = 0x04,
  ModLeftGui = 0x08,
  ModRightCtrl = 0x10,
  ModRightShift = 0x20,
  ModRightAlt = 0x40,
  ModRightGui = 0x80,
};

// Should only be called with keys for which is_modifier() returns true.
constexpr uint8_t modifier_bit(Key key) {
  return static_cast<uint8_t>(
      1 << (static_cast<uint8_t>(key) - static_cast<uint8_t>(Key::LeftControl)));
}

} // namespace nkvm::hid
