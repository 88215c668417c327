// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/transport/Transport.h"

#include <deque>
#include <vector>

namespace nkvm {

/**
 * A mock transport, for use in unit tests.
 *
 * Every write() is recorded as a separate entry in writes.  read() serves
 * bytes queued with queue_rx(), at most max_read_chunk bytes per call, and
 * reports a timeout once the queue is empty.
 */
class MockTransport : public Transport {
public:
  MockTransport() = default;

  [[nodiscard]] std::error_code write(asel::buf_view data) override;
  [[nodiscard]] std::error_code read(uint8_t *buf,
                                     size_t capacity,
                                     std::chrono::milliseconds timeout,
                                     size_t &bytes_read) override;

  ////////////////////////////////////////////////////////////////////
  // Methods to be invoked by test code
  ////////////////////////////////////////////////////////////////////

  void queue_rx(asel::buf_view data);
  void queue_rx(const std::vector<uint8_t> &data) {
    queue_rx(asel::buf_view(data.data(), data.size()));
  }
  size_t rx_pending() const {
    return rx_.size();
  }

  std::vector<std::vector<uint8_t>> writes;
  // Number of read() calls made so far.
  size_t num_reads = 0;
  size_t max_read_chunk = 64;
  // If set, the next write() fails with this error and records nothing.
  std::error_code fail_next_write;

private:
  std::deque<uint8_t> rx_;
};

} // namespace nkvm
