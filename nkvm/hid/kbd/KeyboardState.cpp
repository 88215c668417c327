// Copyright (c) 2024, Adam Simpkins
#include "nkvm/hid/kbd/KeyboardState.h"

namespace nkvm::kbd {

bool KeyboardState::press(hid::Key key) {
  if (key == hid::Key::None || pressed_.get(key)) {
    return false;
  }
  pressed_.set(key, true);
  return true;
}

bool KeyboardState::release(hid::Key key) {
  if (!pressed_.get(key)) {
    return false;
  }
  pressed_.set(key, false);
  return true;
}

bool KeyboardState::release_all() {
  const bool had_keys = pressed_.any_pressed();
  pressed_.clear();
  return had_keys;
}

BootReport KeyboardState::report() const {
  BootReport report;
  for (const auto &entry : pressed_.pressed_keys()) {
    report.add_key(entry.key());
  }
  return report;
}

} // namespace nkvm::kbd
