// Copyright (c) 2024, Adam Simpkins
#include "nkvm/hid/mouse/MouseReport.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

using namespace nkvm::mouse;

namespace nkvm::test {

ASEL_TEST(MouseReport, relative) {
  RelativeReport expected{{0x01, 0x01, 0x05, 0xfd, 0x00}};
  ASEL_EXPECT_EQ(expected, make_relative_report(ButtonLeft, 5, -3, 0));

  RelativeReport wheel_down{{0x01, 0x00, 0x00, 0x00, 0xff}};
  ASEL_EXPECT_EQ(wheel_down, make_relative_report(ButtonNone, 0, 0, -1));

  RelativeReport clamped{{0x01, 0x06, 0x7f, 0x81, 0x7f}};
  ASEL_EXPECT_EQ(clamped,
                 make_relative_report(
                     ButtonRight | ButtonMiddle, 500, -1000, 200));
}

ASEL_TEST(MouseReport, scale_absolute) {
  ASEL_EXPECT_EQ(scale_absolute(0, 400), 0);
  ASEL_EXPECT_EQ(scale_absolute(200, 400), 2048);
  ASEL_EXPECT_EQ(scale_absolute(100, 400), 1024);
  ASEL_EXPECT_EQ(scale_absolute(1, 3), 1365);
  ASEL_EXPECT_EQ(scale_absolute(400, 400), 4096);

  // Positions outside the window are clamped to its edges.
  ASEL_EXPECT_EQ(scale_absolute(-10, 400), 0);
  ASEL_EXPECT_EQ(scale_absolute(900, 400), 4096);

  // A zero sized window maps everything to the origin.
  ASEL_EXPECT_EQ(scale_absolute(50, 0), 0);
  ASEL_EXPECT_EQ(scale_absolute(50, -5), 0);
}

ASEL_TEST(MouseReport, absolute) {
  AbsoluteReport expected{{0x02, 0x00, 0x00, 0x08, 0x00, 0x08, 0x00}};
  ASEL_EXPECT_EQ(expected,
                 make_absolute_report(ButtonNone, 1000, 500, 500, 250, 0));

  AbsoluteReport corner{{0x02, 0x01, 0x00, 0x10, 0x00, 0x00, 0x01}};
  ASEL_EXPECT_EQ(corner,
                 make_absolute_report(ButtonLeft, 400, 100, 400, 0, 1));

  AbsoluteReport no_size{{0x02, 0x04, 0x00, 0x00, 0x00, 0x00, 0xff}};
  ASEL_EXPECT_EQ(no_size,
                 make_absolute_report(ButtonMiddle, 0, 0, 12, 34, -1));
}

} // namespace nkvm::test
