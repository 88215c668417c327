// Copyright (c) 2024, Adam Simpkins
#pragma once

#include "nkvm/hid/kbd/BootReport.h"
#include "nkvm/hid/kbd/KeyBitmap.h"

namespace nkvm::kbd {

/**
 * Tracks the set of keys held down on the local keyboard and produces the
 * boot report that describes them.
 *
 * press() and release() return true if the key state changed, so callers
 * only need to send a new report when something actually changed.
 */
class KeyboardState {
public:
  KeyboardState() = default;

  bool press(hid::Key key);
  bool release(hid::Key key);
  // Returns true if any key was held.
  bool release_all();

  bool is_pressed(hid::Key key) const {
    return pressed_.get(key);
  }
  bool any_pressed() const {
    return pressed_.any_pressed();
  }

  /**
   * Build the report for the current state.
   *
   * Keys are listed in ascending usage order.  Holding more than 6
   * non-modifier keys produces a rollover report.
   */
  BootReport report() const;

private:
  KeyBitmap pressed_;
};

} // namespace nkvm::kbd
