// Copyright (c) 2023, Adam Simpkins
#include "nkvm/NanoKvm.h"

#include "nkvm/Error.h"
#include "nkvm/hid/mouse/MouseReport.h"
#include "nkvm/log.h"
#include "nkvm/transport/Transport.h"

#include <algorithm>
#include <array>

using nkvm::proto::CmdEvent;
using nkvm::proto::CmdPacket;

namespace nkvm {

std::error_code NanoKvm::get_info(proto::InfoPacket &info) {
  std::lock_guard<std::mutex> guard(mutex_);
  // Leftover bytes from earlier replies can never complete this request.
  parser_.clear();
  auto err = send_locked(CmdEvent::GetInfo, asel::buf_view());
  if (err) {
    return err;
  }

  CmdPacket rsp;
  err = wait_for_response(CmdEvent::GetInfo, rsp);
  if (err) {
    return err;
  }
  err = proto::InfoPacket::parse(rsp.data(), info);
  if (err) {
    NKVM_LOGE("invalid GET_INFO reply: %s", err.message().c_str());
  }
  return err;
}

std::error_code NanoKvm::send_hid_report(asel::buf_view data) {
  std::array<uint8_t, kbd::BootReport::kSize> report = {};
  std::copy_n(data.data(), std::min(data.size(), report.size()), report.data());
  NKVM_LOGV("keyboard report: %02x %02x %02x %02x %02x %02x %02x %02x",
            report[0],
            report[1],
            report[2],
            report[3],
            report[4],
            report[5],
            report[6],
            report[7]);
  return send_command(CmdEvent::SendKbGeneralData,
                      asel::buf_view(report.data(), report.size()));
}

std::error_code NanoKvm::send_keyboard_data(uint8_t modifier, hid::Key key) {
  const std::array<uint8_t, kbd::BootReport::kSize> data{
      {modifier, 0x00, 0x00, 0x00, static_cast<uint8_t>(key), 0x00, 0x00, 0x00}};
  return send_hid_report(asel::buf_view(data.data(), data.size()));
}

std::error_code NanoKvm::send_mouse_relative_data(uint8_t buttons,
                                                  int x,
                                                  int y,
                                                  int scroll) {
  const auto report = mouse::make_relative_report(buttons, x, y, scroll);
  return send_command(CmdEvent::SendMsRelData,
                      asel::buf_view(report.data(), report.size()));
}

std::error_code NanoKvm::send_mouse_absolute_data(
    uint8_t buttons, int width, int height, int x, int y, int scroll) {
  const auto report =
      mouse::make_absolute_report(buttons, width, height, x, y, scroll);
  return send_command(CmdEvent::SendMsAbsData,
                      asel::buf_view(report.data(), report.size()));
}

std::error_code NanoKvm::reset() {
  NKVM_LOGI("resetting bridge chip");
  return send_command(CmdEvent::Reset, asel::buf_view());
}

std::error_code NanoKvm::send_command(CmdEvent cmd, asel::buf_view data) {
  std::lock_guard<std::mutex> guard(mutex_);
  return send_locked(cmd, data);
}

std::error_code NanoKvm::send_locked(CmdEvent cmd, asel::buf_view data) {
  CmdPacket pkt;
  auto err = pkt.assign(addr_, static_cast<uint8_t>(cmd), data);
  if (err) {
    return err;
  }

  const auto frame = pkt.encode();
  err = transport_->write(asel::buf_view(frame.data(), frame.size()));
  if (err) {
    NKVM_LOGE("error sending %s: %s",
              proto::cmd_event_name(static_cast<uint8_t>(cmd)),
              err.message().c_str());
  }
  return err;
}

std::error_code NanoKvm::wait_for_response(CmdEvent cmd, CmdPacket &pkt) {
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  std::array<uint8_t, 64> buf;
  while (true) {
    while (auto candidate = parser_.next()) {
      if (candidate->is_response_to(cmd)) {
        pkt = std::move(*candidate);
        return {};
      }
      if (candidate->is_error_response_to(cmd)) {
        NKVM_LOGE("%s failed on the device",
                  proto::cmd_event_name(static_cast<uint8_t>(cmd)));
        return make_error_code(ErrorCode::DeviceError);
      }
      NKVM_LOGD("skipping %s frame (0x%02x) while waiting for %s",
                proto::cmd_event_name(candidate->cmd()),
                candidate->cmd(),
                proto::cmd_event_name(static_cast<uint8_t>(cmd)));
    }

    const auto now = std::chrono::steady_clock::now();
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    size_t bytes_read = 0;
    auto err = make_error_code(ErrorCode::Timeout);
    if (remaining.count() > 0) {
      err = transport_->read(buf.data(), buf.size(), remaining, bytes_read);
    }
    if (err == ErrorCode::Timeout) {
      NKVM_LOGE("timed out waiting for %s reply",
                proto::cmd_event_name(static_cast<uint8_t>(cmd)));
      parser_.clear();
      return err;
    }
    if (err) {
      return err;
    }
    NKVM_LOGV("received %zu bytes", bytes_read);
    parser_.feed(asel::buf_view(buf.data(), bytes_read));
  }
}

} // namespace nkvm
