// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/Error.h"

#include <asel/buf_view.h>

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <system_error>
#include <vector>

namespace nkvm::test {

/**
 * Check that a buffer holds exactly the expected bytes.
 *
 * On mismatch ASEL_ADD_FAILURE() is called with the first differing offset,
 * and false is returned.
 */
bool expect_bytes(asel::buf_view actual, std::initializer_list<uint8_t> expected);
inline bool expect_bytes(const std::vector<uint8_t> &actual,
                         std::initializer_list<uint8_t> expected) {
  return expect_bytes(asel::buf_view(actual.data(), actual.size()), expected);
}

bool expect_ok(const std::error_code &ec);
bool expect_error(const std::error_code &ec, ErrorCode expected);

bool expect_str(std::string_view actual, std::string_view expected);

inline asel::buf_view view_of(const std::vector<uint8_t> &data) {
  return asel::buf_view(data.data(), data.size());
}

} // namespace nkvm::test
