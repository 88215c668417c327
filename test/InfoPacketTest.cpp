// Copyright (c) 2023, Adam Simpkins
#include "nkvm/proto/InfoPacket.h"

#include "test/lib/test_utils.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

#include <vector>

using namespace nkvm::proto;

namespace nkvm::test {

ASEL_TEST(InfoPacket, parse) {
  const std::vector<uint8_t> data = {0x30, 0x01, 0x02, 0, 0, 0, 0, 0};
  InfoPacket info;
  ASEL_ASSERT_TRUE(expect_ok(InfoPacket::parse(view_of(data), info)));
  ASEL_EXPECT_EQ(info.version_byte(), 0x30);
  expect_str(info.chip_version(), "V1.0");
  ASEL_EXPECT_TRUE(info.is_connected());
  ASEL_EXPECT_FALSE(info.num_lock());
  ASEL_EXPECT_TRUE(info.caps_lock());
  ASEL_EXPECT_FALSE(info.scroll_lock());

  expect_str(info.to_string(),
             "InfoPacket(\n"
             "  CHIP_VERSION: V1.0\n"
             "  IS_CONNECTED: true\n"
             "  NUM_LOCK:     false\n"
             "  CAPS_LOCK:    true\n"
             "  SCROLL_LOCK:  false\n"
             ")");
}

ASEL_TEST(InfoPacket, versions_and_locks) {
  InfoPacket info;
  const std::vector<uint8_t> v11 = {0x31, 0x00, 0x05};
  ASEL_ASSERT_TRUE(expect_ok(InfoPacket::parse(view_of(v11), info)));
  expect_str(info.chip_version(), "V1.1");
  ASEL_EXPECT_FALSE(info.is_connected());
  ASEL_EXPECT_TRUE(info.num_lock());
  ASEL_EXPECT_FALSE(info.caps_lock());
  ASEL_EXPECT_TRUE(info.scroll_lock());
  ASEL_EXPECT_TRUE(info.locks() == hid::LockState::from_bits(0x05));

  const std::vector<uint8_t> v19 = {0x39, 0x01, 0x07};
  ASEL_ASSERT_TRUE(expect_ok(InfoPacket::parse(view_of(v19), info)));
  expect_str(info.chip_version(), "V1.9");
  ASEL_EXPECT_TRUE(info.num_lock());
  ASEL_EXPECT_TRUE(info.caps_lock());
  ASEL_EXPECT_TRUE(info.scroll_lock());
}

ASEL_TEST(InfoPacket, errors) {
  InfoPacket info;
  const std::vector<uint8_t> good = {0x30, 0x01, 0x00};
  ASEL_ASSERT_TRUE(expect_ok(InfoPacket::parse(view_of(good), info)));

  const std::vector<uint8_t> bad_version = {0x2f, 0x00, 0x07};
  expect_error(InfoPacket::parse(view_of(bad_version), info),
               ErrorCode::BadVersion);
  const std::vector<uint8_t> short_data = {0x30, 0x00};
  expect_error(InfoPacket::parse(view_of(short_data), info),
               ErrorCode::Truncated);

  // The previously parsed values are kept.
  expect_str(info.chip_version(), "V1.0");
  ASEL_EXPECT_TRUE(info.is_connected());
  ASEL_EXPECT_FALSE(info.scroll_lock());
}

} // namespace nkvm::test
