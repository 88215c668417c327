// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <string>
#include <system_error>

namespace nkvm {

enum class ErrorCode : int {
  // No 0x57 0xAB frame header was found in the received data.
  HeaderNotFound = 1,
  // The frame header was found, but the frame is incomplete.
  Truncated,
  ChecksumMismatch,
  // A command payload does not fit in the 1-byte LEN field.
  PayloadTooLarge,
  // The GET_INFO reply carried a chip version byte below 0x30.
  BadVersion,
  Timeout,
  ShortWrite,
  // The bridge answered with an error status (0xC0 | cmd).
  DeviceError,
  UnknownKeyName,
  NotOpen,
  DisplayUnavailable,
};

class nkvm_error_category : public std::error_category {
public:
  const char *name() const noexcept override {
    return "nkvm";
  }
  std::string message(int condition) const override;
};

extern nkvm_error_category g_nkvm_error_category;

inline const std::error_category &nkvm_error() noexcept {
  return g_nkvm_error_category;
}

inline std::error_code make_error_code(ErrorCode err) {
  return std::error_code(static_cast<int>(err), g_nkvm_error_category);
}

} // namespace nkvm

namespace std {
template <>
struct is_error_code_enum<nkvm::ErrorCode> : public true_type {};
} // namespace std
