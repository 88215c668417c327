// Copyright (c) 2024, Adam Simpkins
#include "nkvm/hid/mouse/MouseReport.h"

#include <algorithm>

namespace nkvm::mouse {

namespace {
uint8_t to_byte(int value) {
  return static_cast<uint8_t>(value & 0xff);
}
} // namespace

RelativeReport
make_relative_report(uint8_t buttons, int dx, int dy, int wheel) {
  dx = std::clamp(dx, -kMaxRelativeDelta, kMaxRelativeDelta);
  dy = std::clamp(dy, -kMaxRelativeDelta, kMaxRelativeDelta);
  wheel = std::clamp(wheel, -kMaxRelativeDelta, kMaxRelativeDelta);
  return RelativeReport{{
      kRelativeReportId,
      buttons,
      to_byte(dx),
      to_byte(dy),
      to_byte(wheel),
  }};
}

AbsoluteReport make_absolute_report(
    uint8_t buttons, int width, int height, int x, int y, int wheel) {
  const auto x_abs = scale_absolute(x, width);
  const auto y_abs = scale_absolute(y, height);
  wheel = std::clamp(wheel, -kMaxRelativeDelta, kMaxRelativeDelta);
  return AbsoluteReport{{
      kAbsoluteReportId,
      buttons,
      static_cast<uint8_t>(x_abs & 0xff),
      static_cast<uint8_t>(x_abs >> 8),
      static_cast<uint8_t>(y_abs & 0xff),
      static_cast<uint8_t>(y_abs >> 8),
      to_byte(wheel),
  }};
}

uint16_t scale_absolute(int position, int extent) {
  if (extent <= 0) {
    return 0;
  }
  position = std::clamp(position, 0, extent);
  const auto scaled = (static_cast<int64_t>(position) * kAbsoluteRange) / extent;
  return static_cast<uint16_t>(scaled);
}

} // namespace nkvm::mouse
