// Copyright (c) 2024, Adam Simpkins
#pragma once

#include <array>
#include <cstdint>

namespace nkvm::mouse {

/**
 * Mouse button bits, as used in byte 1 of both mouse report types.
 */
enum Button : uint8_t {
  ButtonNone = 0x00,
  ButtonLeft = 0x01,
  ButtonRight = 0x02,
  ButtonMiddle = 0x04,
};

// Absolute coordinates are expressed in a 0-4096 range on both axes,
// independent of the target's screen resolution.
inline constexpr int kAbsoluteRange = 4096;
inline constexpr int kMaxRelativeDelta = 127;

inline constexpr uint8_t kRelativeReportId = 0x01;
inline constexpr uint8_t kAbsoluteReportId = 0x02;

using RelativeReport = std::array<uint8_t, 5>;
using AbsoluteReport = std::array<uint8_t, 7>;

/**
 * Build a SEND_MS_REL_DATA payload:
 *
 *   0x01 BUTTONS DX DY WHEEL
 *
 * Deltas are two's complement bytes.  dx and dy are clamped to +/-127, and
 * positive dy moves the pointer down.  Positive wheel values scroll up.
 */
RelativeReport make_relative_report(uint8_t buttons, int dx, int dy, int wheel);

/**
 * Build a SEND_MS_ABS_DATA payload:
 *
 *   0x02 BUTTONS X_LO X_HI Y_LO Y_HI WHEEL
 *
 * (x, y) is a position within a width x height area, and is scaled to the
 * 0-4096 absolute range.  Positions outside the area are clamped to its
 * edges.  A zero width or height maps that axis to 0.
 */
AbsoluteReport make_absolute_report(
    uint8_t buttons, int width, int height, int x, int y, int wheel);

// Scale a position within [0, extent] to the 0-4096 absolute range.
uint16_t scale_absolute(int position, int extent);

} // namespace nkvm::mouse
