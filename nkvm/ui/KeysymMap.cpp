// Copyright (c) 2024, Adam Simpkins
#include "nkvm/ui/KeysymMap.h"

#include <X11/keysym.h>

using nkvm::hid::Key;

namespace nkvm::ui {

namespace {
Key offset_key(Key base, unsigned long offset) {
  return static_cast<Key>(static_cast<uint8_t>(base) + offset);
}
} // namespace

std::optional<Key> keysym_to_key(unsigned long keysym) {
  if (keysym >= XK_a && keysym <= XK_z) {
    return offset_key(Key::A, keysym - XK_a);
  }
  if (keysym >= XK_A && keysym <= XK_Z) {
    return offset_key(Key::A, keysym - XK_A);
  }
  if (keysym >= XK_1 && keysym <= XK_9) {
    return offset_key(Key::Num1, keysym - XK_1);
  }
  if (keysym >= XK_F1 && keysym <= XK_F12) {
    return offset_key(Key::F1, keysym - XK_F1);
  }
  if (keysym >= XK_F13 && keysym <= XK_F24) {
    return offset_key(Key::F13, keysym - XK_F13);
  }
  if (keysym >= XK_KP_1 && keysym <= XK_KP_9) {
    return offset_key(Key::Keypad1, keysym - XK_KP_1);
  }

  switch (keysym) {
  case XK_0:
    return Key::Num0;
  case XK_Return:
    return Key::Enter;
  case XK_Escape:
    return Key::Escape;
  case XK_BackSpace:
    return Key::Backspace;
  case XK_Tab:
  case XK_ISO_Left_Tab:
    return Key::Tab;
  case XK_space:
    return Key::Space;
  case XK_minus:
    return Key::Minus;
  case XK_equal:
    return Key::Equal;
  case XK_bracketleft:
    return Key::LeftBracket;
  case XK_bracketright:
    return Key::RightBracket;
  case XK_backslash:
    return Key::Backslash;
  case XK_semicolon:
    return Key::Semicolon;
  case XK_apostrophe:
    return Key::Apostrophe;
  case XK_grave:
    return Key::Grave;
  case XK_comma:
    return Key::Comma;
  case XK_period:
    return Key::Period;
  case XK_slash:
    return Key::Slash;
  case XK_less:
    return Key::NonUsBackslash;
  case XK_Caps_Lock:
    return Key::CapsLock;
  case XK_Print:
  case XK_Sys_Req:
    return Key::PrintScreen;
  case XK_Scroll_Lock:
    return Key::ScrollLock;
  case XK_Pause:
  case XK_Break:
    return Key::Pause;
  case XK_Insert:
    return Key::Insert;
  case XK_Home:
    return Key::Home;
  case XK_Prior:
    return Key::PageUp;
  case XK_Delete:
    return Key::Delete;
  case XK_End:
    return Key::End;
  case XK_Next:
    return Key::PageDown;
  case XK_Right:
    return Key::Right;
  case XK_Left:
    return Key::Left;
  case XK_Down:
    return Key::Down;
  case XK_Up:
    return Key::Up;
  case XK_Num_Lock:
    return Key::NumLock;
  case XK_Menu:
    return Key::Application;

  // Keypad.  With NumLock off the unshifted keysyms are the navigation ones.
  case XK_KP_Divide:
    return Key::KeypadSlash;
  case XK_KP_Multiply:
    return Key::KeypadAsterisk;
  case XK_KP_Subtract:
    return Key::KeypadMinus;
  case XK_KP_Add:
    return Key::KeypadPlus;
  case XK_KP_Enter:
    return Key::KeypadEnter;
  case XK_KP_Equal:
    return Key::KeypadEqual;
  case XK_KP_0:
  case XK_KP_Insert:
    return Key::Keypad0;
  case XK_KP_End:
    return Key::Keypad1;
  case XK_KP_Down:
    return Key::Keypad2;
  case XK_KP_Next:
    return Key::Keypad3;
  case XK_KP_Left:
    return Key::Keypad4;
  case XK_KP_Begin:
    return Key::Keypad5;
  case XK_KP_Right:
    return Key::Keypad6;
  case XK_KP_Home:
    return Key::Keypad7;
  case XK_KP_Up:
    return Key::Keypad8;
  case XK_KP_Prior:
    return Key::Keypad9;
  case XK_KP_Decimal:
  case XK_KP_Delete:
    return Key::KeypadPeriod;

  case XK_Control_L:
    return Key::LeftControl;
  case XK_Shift_L:
    return Key::LeftShift;
  case XK_Alt_L:
    return Key::LeftAlt;
  case XK_Super_L:
  case XK_Meta_L:
    return Key::LeftGui;
  case XK_Control_R:
    return Key::RightControl;
  case XK_Shift_R:
    return Key::RightShift;
  case XK_Alt_R:
  case XK_ISO_Level3_Shift:
    return Key::RightAlt;
  case XK_Super_R:
  case XK_Meta_R:
    return Key::RightGui;
  }
  return std::nullopt;
}

} // namespace nkvm::ui
