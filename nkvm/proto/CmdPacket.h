// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/proto/CmdEvent.h"

#include <asel/buf_view.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace nkvm::proto {

/**
 * A framed command or response packet.
 *
 * Wire format:
 *
 *   0x57 0xAB ADDR CMD LEN DATA[LEN] SUM
 *
 * SUM is the low byte of the sum of every preceding byte in the frame,
 * including the two header bytes.
 */
class CmdPacket {
public:
  static constexpr uint8_t kHead1 = 0x57;
  static constexpr uint8_t kHead2 = 0xab;
  // HEAD1, HEAD2, ADDR, CMD, LEN
  static constexpr size_t kPrefixSize = 5;
  // The smallest possible frame: a prefix plus the checksum byte.
  static constexpr size_t kMinFrameSize = kPrefixSize + 1;
  static constexpr size_t kMaxDataSize = 0xff;

  CmdPacket() = default;
  CmdPacket(uint8_t addr, CmdEvent cmd) : addr_(addr), cmd_(uint8_t(cmd)) {
    update_checksum();
  }

  /**
   * Fill in the packet fields and compute the checksum.
   *
   * Returns ErrorCode::PayloadTooLarge if data does not fit in the LEN field,
   * in which case the packet is left unmodified.
   */
  [[nodiscard]] std::error_code
  assign(uint8_t addr, uint8_t cmd, asel::buf_view data);

  /**
   * Parse the first frame found in raw.
   *
   * Any bytes before the frame header are skipped.  On success, if frame_end
   * is non-null it is set to the offset in raw just past the checksum byte.
   * On failure the packet is left unmodified.
   */
  [[nodiscard]] std::error_code decode(asel::buf_view raw,
                                       size_t *frame_end = nullptr);

  std::vector<uint8_t> encode() const;

  uint8_t addr() const {
    return addr_;
  }
  uint8_t cmd() const {
    return cmd_;
  }
  uint8_t len() const {
    return static_cast<uint8_t>(data_.size());
  }
  asel::buf_view data() const {
    return asel::buf_view(data_.data(), data_.size());
  }
  uint8_t checksum() const {
    return sum_;
  }

  bool is_response_to(CmdEvent cmd) const {
    return cmd_ == (uint8_t(cmd) | kResponseFlag);
  }
  bool is_error_response_to(CmdEvent cmd) const {
    return cmd_ == (uint8_t(cmd) | kErrorResponseFlag);
  }

  /**
   * Returns the offset of the first 0x57 0xAB pair in raw, or std::nullopt if
   * there is none.
   */
  static std::optional<size_t> find_head(asel::buf_view raw);

  static uint8_t compute_checksum(asel::buf_view frame_without_sum);

private:
  void update_checksum();

  uint8_t addr_ = 0;
  uint8_t cmd_ = 0;
  std::vector<uint8_t> data_;
  uint8_t sum_ = 0;
};

} // namespace nkvm::proto
