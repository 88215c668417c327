// Copyright (c) 2024, Adam Simpkins
#pragma once

#include "nkvm/hid/usage/keys.h"

#include <optional>

namespace nkvm::ui {

/**
 * Map an X11 keysym to the HID key at the same position on a US keyboard.
 *
 * Callers should look up the unshifted keysym (index 0 of the key's keysym
 * list) so that, e.g., both 'a' and 'A' come from the same physical key.
 * Returns std::nullopt for keysyms with no HID equivalent.
 */
std::optional<hid::Key> keysym_to_key(unsigned long keysym);

} // namespace nkvm::ui
