// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/proto/CmdPacket.h"

#include <asel/buf_view.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace nkvm::proto {

/**
 * Reassembles CmdPackets from a byte stream.
 *
 * Serial reads return whatever bytes happen to be available, so a single
 * response frame may arrive split across several reads, or several frames
 * may arrive in one read.  feed() appends raw bytes, and next() returns
 * complete frames in the order they were received.
 *
 * Bytes that precede a frame header are discarded.  A frame whose checksum
 * does not match is dropped by skipping past its header byte, so the parser
 * resynchronizes on the next header in the stream.  An incomplete frame is
 * dropped the same way once a complete, valid frame follows it.
 *
 * PacketParser is not thread safe.
 */
class PacketParser {
public:
  // A full frame is at most 261 bytes, so anything beyond a few frames worth
  // of unparsed data is stale.
  static constexpr size_t kMaxBuffered = 1024;

  PacketParser() = default;

  void feed(asel::buf_view data);
  std::optional<CmdPacket> next();

  size_t buffered() const {
    return buf_.size();
  }
  void clear() {
    buf_.clear();
  }

  // The number of corrupt frames skipped since construction.
  size_t num_dropped() const {
    return num_dropped_;
  }

private:
  bool has_complete_frame_after(size_t start) const;
  void discard_front(size_t n);

  std::vector<uint8_t> buf_;
  size_t num_dropped_ = 0;
};

} // namespace nkvm::proto
