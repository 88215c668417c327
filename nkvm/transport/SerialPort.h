// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/config.h"
#include "nkvm/transport/Transport.h"

#include <termios.h>

#include <string>
#include <utility>

namespace nkvm {

/**
 * A POSIX serial port configured for the KVM bridge: raw 8N1 with no flow
 * control.
 *
 * DTR and RTS are deasserted when the port is opened, since nothing on the
 * other end acts as a terminal.  The original line settings are saved on
 * open() and restored by close().
 */
class SerialPort : public Transport {
public:
  explicit SerialPort(std::string path, unsigned int baud = kDefaultBaudRate)
      : path_(std::move(path)), baud_(baud) {}
  ~SerialPort() override;

  [[nodiscard]] std::error_code open();
  void close();
  bool is_open() const {
    return fd_ >= 0;
  }

  const std::string &path() const {
    return path_;
  }
  unsigned int baud() const {
    return baud_;
  }

  [[nodiscard]] std::error_code write(asel::buf_view data) override;
  [[nodiscard]] std::error_code read(uint8_t *buf,
                                     size_t capacity,
                                     std::chrono::milliseconds timeout,
                                     size_t &bytes_read) override;

  // Discard any received but unread input.
  void flush_input();

private:
  [[nodiscard]] std::error_code configure();
  [[nodiscard]] std::error_code set_modem_lines(bool dtr, bool rts);

  std::string path_;
  unsigned int baud_ = kDefaultBaudRate;
  int fd_ = -1;
  bool saved_valid_ = false;
  struct termios saved_ = {};
};

/**
 * Convert a numeric baud rate into a termios speed_t constant.
 *
 * Returns B0 for unsupported rates.
 */
speed_t baud_to_speed(unsigned int baud);

} // namespace nkvm
