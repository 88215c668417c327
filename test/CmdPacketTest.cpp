// Copyright (c) 2023, Adam Simpkins
#include "nkvm/proto/CmdPacket.h"

#include "nkvm/Error.h"
#include "test/lib/test_utils.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

#include <vector>

using namespace nkvm::proto;

namespace nkvm::test {

namespace {
// GET_INFO reply: chip V1.0, target connected, CapsLock on.
const std::vector<uint8_t> kInfoReply = {0x57, 0xab, 0x00, 0x81, 0x08, 0x30,
                                         0x01, 0x02, 0x00, 0x00, 0x00, 0x00,
                                         0x00, 0xbe};
} // namespace

ASEL_TEST(CmdPacket, encode_no_payload) {
  CmdPacket pkt(0x00, CmdEvent::GetInfo);
  expect_bytes(pkt.encode(), {0x57, 0xab, 0x00, 0x01, 0x00, 0x03});
  ASEL_EXPECT_EQ(pkt.len(), 0);
  ASEL_EXPECT_EQ(pkt.checksum(), 0x03);
}

ASEL_TEST(CmdPacket, encode_keyboard) {
  const uint8_t report[8] = {0x02, 0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00};
  CmdPacket pkt;
  expect_ok(pkt.assign(0x00,
                       static_cast<uint8_t>(CmdEvent::SendKbGeneralData),
                       asel::buf_view(report, sizeof(report))));
  expect_bytes(pkt.encode(),
               {0x57, 0xab, 0x00, 0x02, 0x08, 0x02, 0x00, 0x04, 0x00, 0x00,
                0x00, 0x00, 0x00, 0x12});
}

ASEL_TEST(CmdPacket, checksum_wraps) {
  std::vector<uint8_t> data(4, 0xff);
  CmdPacket pkt;
  expect_ok(pkt.assign(0x01, 0x06, view_of(data)));
  // 0x57 + 0xab + 0x01 + 0x06 + 0x04 + 4 * 0xff = 0x509
  ASEL_EXPECT_EQ(pkt.checksum(), 0x09);
}

ASEL_TEST(CmdPacket, payload_too_large) {
  std::vector<uint8_t> data(256, 0x00);
  CmdPacket pkt(0x00, CmdEvent::GetInfo);
  expect_error(pkt.assign(0x00, 0x06, view_of(data)),
               ErrorCode::PayloadTooLarge);
  ASEL_EXPECT_EQ(pkt.cmd(), 0x01);

  data.resize(255);
  expect_ok(pkt.assign(0x00, 0x06, view_of(data)));
  ASEL_EXPECT_EQ(pkt.len(), 255);
  ASEL_EXPECT_EQ(pkt.encode().size(), 261);
}

ASEL_TEST(CmdPacket, decode) {
  CmdPacket pkt;
  size_t frame_end = 0;
  ASEL_ASSERT_TRUE(expect_ok(pkt.decode(view_of(kInfoReply), &frame_end)));
  ASEL_EXPECT_EQ(frame_end, kInfoReply.size());
  ASEL_EXPECT_EQ(pkt.addr(), 0x00);
  ASEL_EXPECT_EQ(pkt.cmd(), 0x81);
  ASEL_EXPECT_EQ(pkt.len(), 8);
  ASEL_EXPECT_EQ(pkt.checksum(), 0xbe);
  ASEL_EXPECT_TRUE(pkt.is_response_to(CmdEvent::GetInfo));
  ASEL_EXPECT_FALSE(pkt.is_error_response_to(CmdEvent::GetInfo));
  expect_bytes(pkt.data(), {0x30, 0x01, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00});
  ASEL_EXPECT_TRUE(pkt.encode() == kInfoReply);
}

ASEL_TEST(CmdPacket, decode_leading_garbage) {
  std::vector<uint8_t> raw = {0x00, 0x12, 0xab, 0x57};
  raw.insert(raw.end(), kInfoReply.begin(), kInfoReply.end());
  raw.push_back(0x99);

  CmdPacket pkt;
  size_t frame_end = 0;
  ASEL_ASSERT_TRUE(expect_ok(pkt.decode(view_of(raw), &frame_end)));
  ASEL_EXPECT_EQ(frame_end, 4 + kInfoReply.size());
  ASEL_EXPECT_EQ(pkt.cmd(), 0x81);
}

ASEL_TEST(CmdPacket, decode_errors) {
  CmdPacket pkt;
  ASEL_ASSERT_TRUE(expect_ok(pkt.decode(view_of(kInfoReply))));

  const std::vector<uint8_t> no_header = {0x01, 0x02, 0xab, 0x57};
  expect_error(pkt.decode(view_of(no_header)), ErrorCode::HeaderNotFound);
  expect_error(pkt.decode(asel::buf_view()), ErrorCode::HeaderNotFound);

  const std::vector<uint8_t> short_prefix = {0x57, 0xab, 0x00, 0x81, 0x08};
  expect_error(pkt.decode(view_of(short_prefix)), ErrorCode::Truncated);

  const std::vector<uint8_t> short_data(kInfoReply.begin(),
                                        kInfoReply.end() - 1);
  expect_error(pkt.decode(view_of(short_data)), ErrorCode::Truncated);

  auto bad_sum = kInfoReply;
  bad_sum.back() = 0xbf;
  expect_error(pkt.decode(view_of(bad_sum)), ErrorCode::ChecksumMismatch);

  // A failed decode leaves the previous contents alone.
  ASEL_EXPECT_EQ(pkt.cmd(), 0x81);
  ASEL_EXPECT_EQ(pkt.len(), 8);
  ASEL_EXPECT_EQ(pkt.checksum(), 0xbe);
}

ASEL_TEST(CmdPacket, error_response) {
  const std::vector<uint8_t> raw = {0x57, 0xab, 0x00, 0xc1, 0x01, 0xe1, 0xa5};
  CmdPacket pkt;
  ASEL_ASSERT_TRUE(expect_ok(pkt.decode(view_of(raw))));
  ASEL_EXPECT_TRUE(pkt.is_error_response_to(CmdEvent::GetInfo));
  ASEL_EXPECT_FALSE(pkt.is_response_to(CmdEvent::GetInfo));
  expect_str(cmd_event_name(pkt.cmd()), "GET_INFO");
  expect_str(cmd_event_name(0x87), "READ_MY_HID_DATA");
  expect_str(cmd_event_name(0x7e), "UNKNOWN");
}

} // namespace nkvm::test
