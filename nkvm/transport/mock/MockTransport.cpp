// Copyright (c) 2023, Adam Simpkins
#include "nkvm/transport/mock/MockTransport.h"

#include "nkvm/Error.h"

#include <algorithm>

namespace nkvm {

std::error_code MockTransport::write(asel::buf_view data) {
  if (fail_next_write) {
    const auto err = fail_next_write;
    fail_next_write.clear();
    return err;
  }
  writes.emplace_back(data.data(), data.data() + data.size());
  return {};
}

std::error_code MockTransport::read(uint8_t *buf,
                                    size_t capacity,
                                    std::chrono::milliseconds timeout,
                                    size_t &bytes_read) {
  ++num_reads;
  bytes_read = 0;
  if (rx_.empty()) {
    return make_error_code(ErrorCode::Timeout);
  }

  const auto n = std::min({capacity, max_read_chunk, rx_.size()});
  for (size_t i = 0; i < n; ++i) {
    buf[i] = rx_.front();
    rx_.pop_front();
  }
  bytes_read = n;
  return {};
}

void MockTransport::queue_rx(asel::buf_view data) {
  rx_.insert(rx_.end(), data.data(), data.data() + data.size());
}

} // namespace nkvm
