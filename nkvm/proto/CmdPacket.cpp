// Copyright (c) 2023, Adam Simpkins
#include "nkvm/proto/CmdPacket.h"

#include "nkvm/Error.h"
#include "nkvm/log.h"

namespace nkvm::proto {

const char *cmd_event_name(uint8_t cmd) {
  switch (static_cast<CmdEvent>(cmd & ~kErrorResponseFlag)) {
  case CmdEvent::GetInfo:
    return "GET_INFO";
  case CmdEvent::SendKbGeneralData:
    return "SEND_KB_GENERAL_DATA";
  case CmdEvent::SendKbMediaData:
    return "SEND_KB_MEDIA_DATA";
  case CmdEvent::SendMsAbsData:
    return "SEND_MS_ABS_DATA";
  case CmdEvent::SendMsRelData:
    return "SEND_MS_REL_DATA";
  case CmdEvent::SendMyHidData:
    return "SEND_MY_HID_DATA";
  case CmdEvent::GetParaCfg:
    return "GET_PARA_CFG";
  case CmdEvent::SetParaCfg:
    return "SET_PARA_CFG";
  case CmdEvent::GetUsbString:
    return "GET_USB_STRING";
  case CmdEvent::SetUsbString:
    return "SET_USB_STRING";
  case CmdEvent::SetDefaultCfg:
    return "SET_DEFAULT_CFG";
  case CmdEvent::Reset:
    return "RESET";
  default:
    break;
  }
  // READ_MY_HID_DATA already has bit 7 set, so it only matches unmasked.
  if (cmd == uint8_t(CmdEvent::ReadMyHidData)) {
    return "READ_MY_HID_DATA";
  }
  return "UNKNOWN";
}

std::error_code
CmdPacket::assign(uint8_t addr, uint8_t cmd, asel::buf_view data) {
  if (data.size() > kMaxDataSize) {
    return make_error_code(ErrorCode::PayloadTooLarge);
  }
  addr_ = addr;
  cmd_ = cmd;
  data_.assign(data.data(), data.data() + data.size());
  update_checksum();
  return {};
}

std::error_code CmdPacket::decode(asel::buf_view raw, size_t *frame_end) {
  const auto head = find_head(raw);
  if (!head) {
    NKVM_LOGD("cannot find frame header in %zu bytes", raw.size());
    return make_error_code(ErrorCode::HeaderNotFound);
  }

  const size_t hi = *head;
  if (raw.size() - hi < kMinFrameSize) {
    return make_error_code(ErrorCode::Truncated);
  }

  const uint8_t addr = raw[hi + 2];
  const uint8_t cmd = raw[hi + 3];
  const uint8_t data_len = raw[hi + 4];
  const size_t sum_idx = hi + kPrefixSize + data_len;
  if (raw.size() < sum_idx + 1) {
    return make_error_code(ErrorCode::Truncated);
  }

  const auto expected_sum =
      compute_checksum(asel::buf_view(raw.data() + hi, sum_idx - hi));
  if (raw[sum_idx] != expected_sum) {
    NKVM_LOGD("checksum mismatch: got 0x%02x, expected 0x%02x",
              raw[sum_idx],
              expected_sum);
    return make_error_code(ErrorCode::ChecksumMismatch);
  }

  addr_ = addr;
  cmd_ = cmd;
  data_.assign(raw.data() + hi + kPrefixSize, raw.data() + sum_idx);
  sum_ = raw[sum_idx];
  if (frame_end) {
    *frame_end = sum_idx + 1;
  }
  return {};
}

std::vector<uint8_t> CmdPacket::encode() const {
  std::vector<uint8_t> out;
  out.reserve(kMinFrameSize + data_.size());
  out.push_back(kHead1);
  out.push_back(kHead2);
  out.push_back(addr_);
  out.push_back(cmd_);
  out.push_back(len());
  out.insert(out.end(), data_.begin(), data_.end());
  out.push_back(sum_);
  return out;
}

std::optional<size_t> CmdPacket::find_head(asel::buf_view raw) {
  for (size_t i = 0; i + 1 < raw.size(); ++i) {
    if (raw[i] == kHead1 && raw[i + 1] == kHead2) {
      return i;
    }
  }
  return std::nullopt;
}

uint8_t CmdPacket::compute_checksum(asel::buf_view frame_without_sum) {
  unsigned int total = 0;
  for (size_t i = 0; i < frame_without_sum.size(); ++i) {
    total += frame_without_sum[i];
  }
  return static_cast<uint8_t>(total & 0xff);
}

void CmdPacket::update_checksum() {
  unsigned int total = kHead1 + kHead2 + addr_ + cmd_ + len();
  for (const auto b : data_) {
    total += b;
  }
  sum_ = static_cast<uint8_t>(total & 0xff);
}

} // namespace nkvm::proto
