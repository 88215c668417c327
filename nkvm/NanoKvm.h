// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/config.h"
#include "nkvm/hid/kbd/BootReport.h"
#include "nkvm/hid/usage/keys.h"
#include "nkvm/proto/CmdEvent.h"
#include "nkvm/proto/InfoPacket.h"
#include "nkvm/proto/PacketParser.h"

#include <asel/buf_view.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <system_error>

namespace nkvm {

class Transport;

/**
 * The command interface of a Nano-KVM USB bridge.
 *
 * Each method frames one command and writes it to the transport.  Commands
 * may be issued from several threads (e.g., a UI event loop and a CLI
 * thread); writes and request/response exchanges are serialized internally.
 *
 * The bridge acknowledges every command with a short status frame.  Send
 * methods do not wait for these; get_info() skips over any that are still
 * queued when it looks for its reply.
 */
class NanoKvm {
public:
  explicit NanoKvm(Transport *transport,
                   uint8_t addr = kDefaultAddress,
                   std::chrono::milliseconds timeout = kDefaultReadTimeout)
      : transport_(transport), addr_(addr), timeout_(timeout) {}

  uint8_t addr() const {
    return addr_;
  }
  std::chrono::milliseconds timeout() const {
    return timeout_;
  }

  /**
   * Query the chip version, target connection and lock LED state.
   *
   * Returns ErrorCode::Timeout if no reply arrives within the timeout, and
   * ErrorCode::DeviceError if the bridge answers with an error frame.
   */
  [[nodiscard]] std::error_code get_info(proto::InfoPacket &info);

  /**
   * Send a raw 8-byte keyboard report.
   *
   * Only the first 8 bytes of data are used; shorter reports are padded
   * with zeros.
   */
  [[nodiscard]] std::error_code send_hid_report(asel::buf_view data);
  [[nodiscard]] std::error_code
  send_keyboard_report(const kbd::BootReport &report) {
    return send_hid_report(report.view());
  }

  /**
   * Send a report holding a modifier byte and a single key.
   *
   * Passing (0, Key::None) releases every key.
   */
  [[nodiscard]] std::error_code send_keyboard_data(uint8_t modifier,
                                                   hid::Key key);
  [[nodiscard]] std::error_code release_all() {
    return send_keyboard_data(hid::ModNone, hid::Key::None);
  }

  [[nodiscard]] std::error_code
  send_mouse_relative_data(uint8_t buttons, int x, int y, int scroll);
  [[nodiscard]] std::error_code send_mouse_absolute_data(
      uint8_t buttons, int width, int height, int x, int y, int scroll);

  // Ask the bridge chip to reboot.
  [[nodiscard]] std::error_code reset();

  [[nodiscard]] std::error_code send_command(proto::CmdEvent cmd,
                                             asel::buf_view data);

private:
  NanoKvm(NanoKvm const &) = delete;
  NanoKvm &operator=(NanoKvm const &) = delete;

  // Must be called with mutex_ held.
  [[nodiscard]] std::error_code send_locked(proto::CmdEvent cmd,
                                            asel::buf_view data);
  [[nodiscard]] std::error_code wait_for_response(proto::CmdEvent cmd,
                                                  proto::CmdPacket &pkt);

  std::mutex mutex_;
  Transport *transport_ = nullptr;
  uint8_t addr_ = kDefaultAddress;
  std::chrono::milliseconds timeout_ = kDefaultReadTimeout;
  proto::PacketParser parser_;
};

} // namespace nkvm
