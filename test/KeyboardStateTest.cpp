// Copyright (c) 2024, Adam Simpkins
#include "nkvm/hid/kbd/KeyboardState.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

using namespace nkvm::hid;
using namespace nkvm::kbd;

namespace nkvm::test {

ASEL_TEST(KeyboardState, press_release) {
  KeyboardState state;
  ASEL_EXPECT_TRUE(state.report().is_empty());

  ASEL_EXPECT_TRUE(state.press(Key::LeftControl));
  ASEL_EXPECT_TRUE(state.press(Key::LeftAlt));
  ASEL_EXPECT_TRUE(state.press(Key::Delete));
  // Repeated presses of a held key are not changes.
  ASEL_EXPECT_FALSE(state.press(Key::Delete));
  ASEL_EXPECT_FALSE(state.press(Key::None));
  ASEL_EXPECT_TRUE(state.is_pressed(Key::Delete));

  asel::array<uint8_t, 8> ctrl_alt_del{{0x05, 0, 0x4c, 0, 0, 0, 0, 0}};
  ASEL_EXPECT_EQ(ctrl_alt_del, state.report().array());

  ASEL_EXPECT_TRUE(state.release(Key::LeftAlt));
  ASEL_EXPECT_FALSE(state.release(Key::LeftAlt));
  asel::array<uint8_t, 8> ctrl_del{{0x01, 0, 0x4c, 0, 0, 0, 0, 0}};
  ASEL_EXPECT_EQ(ctrl_del, state.report().array());

  ASEL_EXPECT_TRUE(state.release(Key::Delete));
  ASEL_EXPECT_TRUE(state.release(Key::LeftControl));
  ASEL_EXPECT_FALSE(state.any_pressed());
  ASEL_EXPECT_TRUE(state.report().is_empty());
}

ASEL_TEST(KeyboardState, report_order) {
  // Keys are reported in usage order regardless of press order.
  KeyboardState state;
  state.press(Key::Z);
  state.press(Key::Enter);
  state.press(Key::A);
  asel::array<uint8_t, 8> expected{{0, 0, 0x04, 0x1d, 0x28, 0, 0, 0}};
  ASEL_EXPECT_EQ(expected, state.report().array());
}

ASEL_TEST(KeyboardState, rollover_and_release_all) {
  KeyboardState state;
  for (auto key : {Key::A, Key::B, Key::C, Key::D, Key::E, Key::F, Key::G}) {
    state.press(key);
  }
  ASEL_EXPECT_TRUE(state.report().is_rollover());

  state.release(Key::G);
  ASEL_EXPECT_FALSE(state.report().is_rollover());

  ASEL_EXPECT_TRUE(state.release_all());
  ASEL_EXPECT_FALSE(state.release_all());
  ASEL_EXPECT_TRUE(state.report().is_empty());
}

} // namespace nkvm::test
