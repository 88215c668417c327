// Copyright (c) 2023, Adam Simpkins
#include "nkvm/proto/PacketParser.h"

#include "nkvm/Error.h"
#include "nkvm/log.h"

namespace nkvm::proto {

void PacketParser::feed(asel::buf_view data) {
  buf_.insert(buf_.end(), data.data(), data.data() + data.size());
  if (buf_.size() > kMaxBuffered) {
    const auto excess = buf_.size() - kMaxBuffered;
    NKVM_LOGW("receive buffer overflow: dropping %zu stale bytes", excess);
    discard_front(excess);
  }
}

std::optional<CmdPacket> PacketParser::next() {
  while (true) {
    const asel::buf_view view(buf_.data(), buf_.size());
    const auto head = CmdPacket::find_head(view);
    if (!head) {
      // Keep a trailing HEAD1 byte, since its HEAD2 may still be in flight.
      if (!buf_.empty() && buf_.back() == CmdPacket::kHead1) {
        discard_front(buf_.size() - 1);
      } else {
        buf_.clear();
      }
      return std::nullopt;
    }
    discard_front(*head);

    CmdPacket pkt;
    size_t frame_end = 0;
    const auto err =
        pkt.decode(asel::buf_view(buf_.data(), buf_.size()), &frame_end);
    if (!err) {
      discard_front(frame_end);
      return pkt;
    }
    if (err == ErrorCode::Truncated) {
      // A stray header with a large LEN byte would otherwise hold back
      // every frame behind it until LEN bytes have arrived.
      if (!has_complete_frame_after(1)) {
        return std::nullopt;
      }
      NKVM_LOGW("dropping incomplete frame ahead of a complete one");
      ++num_dropped_;
      discard_front(1);
      continue;
    }

    NKVM_LOGW("dropping corrupt frame: %s", err.message().c_str());
    ++num_dropped_;
    discard_front(1);
  }
}

bool PacketParser::has_complete_frame_after(size_t start) const {
  while (start < buf_.size()) {
    const asel::buf_view rest(buf_.data() + start, buf_.size() - start);
    const auto head = CmdPacket::find_head(rest);
    if (!head) {
      return false;
    }
    start += *head;
    CmdPacket pkt;
    if (!pkt.decode(asel::buf_view(buf_.data() + start, buf_.size() - start))) {
      return true;
    }
    ++start;
  }
  return false;
}

void PacketParser::discard_front(size_t n) {
  if (n >= buf_.size()) {
    buf_.clear();
    return;
  }
  buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n));
}

} // namespace nkvm::proto
