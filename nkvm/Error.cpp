// Copyright (c) 2023, Adam Simpkins
#include "nkvm/Error.h"

namespace nkvm {

nkvm_error_category g_nkvm_error_category;

std::string nkvm_error_category::message(int condition) const {
  switch (static_cast<ErrorCode>(condition)) {
  case ErrorCode::HeaderNotFound:
    return "frame header not found";
  case ErrorCode::Truncated:
    return "truncated frame";
  case ErrorCode::ChecksumMismatch:
    return "checksum mismatch";
  case ErrorCode::PayloadTooLarge:
    return "payload larger than 255 bytes";
  case ErrorCode::BadVersion:
    return "invalid chip version";
  case ErrorCode::Timeout:
    return "timed out waiting for the device";
  case ErrorCode::ShortWrite:
    return "short write to the device";
  case ErrorCode::DeviceError:
    return "device reported an error";
  case ErrorCode::UnknownKeyName:
    return "unknown key name";
  case ErrorCode::NotOpen:
    return "port is not open";
  case ErrorCode::DisplayUnavailable:
    return "cannot open X display";
  }
  return "unknown nkvm error " + std::to_string(condition);
}

} // namespace nkvm
