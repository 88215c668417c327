// Copyright (c) 2024, Adam Simpkins
#pragma once

#include "nkvm/hid/kbd/BootReport.h"
#include "nkvm/hid/usage/keys.h"

#include <optional>
#include <string_view>
#include <system_error>

namespace nkvm::kbd {

/**
 * Look up a key by name.
 *
 * Matching is case insensitive.  Single letters and digits name themselves;
 * other keys use names such as "enter", "f5", "pgdn" or "ctrl".  Returns
 * std::nullopt for unknown names.
 */
std::optional<hid::Key> key_from_name(std::string_view name);

/**
 * Parse a '+' separated key combination such as "ctrl+alt+delete" into the
 * report that presses all of its keys at once.
 *
 * This is how key combinations that the local desktop would otherwise
 * intercept are sent to the target machine.
 */
[[nodiscard]] std::error_code parse_hotkey(std::string_view combo,
                                           BootReport &report);

} // namespace nkvm::kbd
