// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <asel/buf_view.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <system_error>

namespace nkvm {

/**
 * A byte stream to the KVM bridge.
 *
 * SerialPort talks to real hardware.  MockTransport records traffic so that
 * unit tests can run on any host without a device attached.
 */
class Transport {
public:
  constexpr Transport() noexcept = default;
  virtual ~Transport() = default;

  /**
   * Write all of data.
   *
   * Returns ErrorCode::ShortWrite if the stream accepted only part of it.
   */
  [[nodiscard]] virtual std::error_code write(asel::buf_view data) = 0;

  /**
   * Read up to capacity bytes into buf.
   *
   * Waits up to timeout for the first byte to become available, then returns
   * whatever is available without further waiting.  bytes_read is set to 0
   * and ErrorCode::Timeout is returned if nothing arrived in time.
   */
  [[nodiscard]] virtual std::error_code read(uint8_t *buf,
                                             size_t capacity,
                                             std::chrono::milliseconds timeout,
                                             size_t &bytes_read) = 0;

private:
  Transport(Transport const &) = delete;
  Transport &operator=(Transport const &) = delete;
};

} // namespace nkvm
