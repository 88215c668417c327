// Copyright (c) 2023, Adam Simpkins
#include "nkvm/proto/PacketParser.h"

#include "test/lib/test_utils.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

#include <vector>

using namespace nkvm::proto;

namespace nkvm::test {

namespace {
const std::vector<uint8_t> kInfoReply = {0x57, 0xab, 0x00, 0x81, 0x08, 0x30,
                                         0x01, 0x02, 0x00, 0x00, 0x00, 0x00,
                                         0x00, 0xbe};
// Acknowledgement of a SEND_KB_GENERAL_DATA command.
const std::vector<uint8_t> kKbdAck = {0x57, 0xab, 0x00, 0x82, 0x01, 0x00, 0x85};

void feed_range(PacketParser &parser,
                const std::vector<uint8_t> &data,
                size_t begin,
                size_t end) {
  parser.feed(asel::buf_view(data.data() + begin, end - begin));
}
} // namespace

ASEL_TEST(PacketParser, split_frame) {
  PacketParser parser;
  feed_range(parser, kInfoReply, 0, 5);
  ASEL_EXPECT_FALSE(parser.next().has_value());
  ASEL_EXPECT_EQ(parser.buffered(), 5);

  feed_range(parser, kInfoReply, 5, 9);
  ASEL_EXPECT_FALSE(parser.next().has_value());

  feed_range(parser, kInfoReply, 9, kInfoReply.size());
  const auto pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_TRUE(pkt->is_response_to(CmdEvent::GetInfo));
  ASEL_EXPECT_EQ(pkt->len(), 8);
  ASEL_EXPECT_EQ(parser.buffered(), 0);
  ASEL_EXPECT_FALSE(parser.next().has_value());
}

ASEL_TEST(PacketParser, split_header) {
  // The second header byte arriving in a later read must not be lost.
  PacketParser parser;
  const std::vector<uint8_t> first = {0x00, 0x11, 0x57};
  parser.feed(view_of(first));
  ASEL_EXPECT_FALSE(parser.next().has_value());
  ASEL_EXPECT_EQ(parser.buffered(), 1);

  feed_range(parser, kKbdAck, 1, kKbdAck.size());
  const auto pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_TRUE(pkt->is_response_to(CmdEvent::SendKbGeneralData));
}

ASEL_TEST(PacketParser, multiple_frames) {
  std::vector<uint8_t> data = kKbdAck;
  data.insert(data.end(), kInfoReply.begin(), kInfoReply.end());
  data.insert(data.end(), kKbdAck.begin(), kKbdAck.end());

  PacketParser parser;
  parser.feed(view_of(data));

  auto pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_EQ(pkt->cmd(), 0x82);
  pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_EQ(pkt->cmd(), 0x81);
  pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_EQ(pkt->cmd(), 0x82);
  ASEL_EXPECT_FALSE(parser.next().has_value());
  ASEL_EXPECT_EQ(parser.num_dropped(), 0);
}

ASEL_TEST(PacketParser, resync_after_bad_checksum) {
  std::vector<uint8_t> data = {0x11};
  data.insert(data.end(), kInfoReply.begin(), kInfoReply.end());
  data[data.size() - 1] = 0xbf;
  data.insert(data.end(), kKbdAck.begin(), kKbdAck.end());

  PacketParser parser;
  parser.feed(view_of(data));
  const auto pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_EQ(pkt->cmd(), 0x82);
  ASEL_EXPECT_EQ(parser.num_dropped(), 1);
  ASEL_EXPECT_EQ(parser.buffered(), 0);
}

ASEL_TEST(PacketParser, stray_header_before_frame) {
  // A spurious header whose LEN byte claims a 255 byte payload.
  const std::vector<uint8_t> noise = {0x57, 0xab, 0x00, 0x00, 0xff};

  PacketParser parser;
  parser.feed(view_of(noise));
  feed_range(parser, kInfoReply, 0, 10);
  ASEL_EXPECT_FALSE(parser.next().has_value());

  feed_range(parser, kInfoReply, 10, kInfoReply.size());
  const auto pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_TRUE(pkt->is_response_to(CmdEvent::GetInfo));
  ASEL_EXPECT_EQ(parser.num_dropped(), 1);
  ASEL_EXPECT_EQ(parser.buffered(), 0);
}

ASEL_TEST(PacketParser, overflow) {
  PacketParser parser;
  const std::vector<uint8_t> junk(PacketParser::kMaxBuffered + 100, 0x00);
  parser.feed(view_of(junk));
  ASEL_EXPECT_EQ(parser.buffered(), PacketParser::kMaxBuffered);

  // The most recent bytes survive, so a frame at the end is still found.
  parser.feed(view_of(kKbdAck));
  ASEL_EXPECT_EQ(parser.buffered(), PacketParser::kMaxBuffered);
  const auto pkt = parser.next();
  ASEL_ASSERT_TRUE(pkt.has_value());
  ASEL_EXPECT_EQ(pkt->cmd(), 0x82);

  parser.feed(view_of(junk));
  parser.clear();
  ASEL_EXPECT_EQ(parser.buffered(), 0);
}

} // namespace nkvm::test
