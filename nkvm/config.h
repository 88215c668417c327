// Copyright (c) 2023, Adam Simpkins
#pragma once

/*
 * Build configuration switches.
 *
 * NKVM_CONFIG_X11 selects whether the X11 capture window is compiled in.
 * The build files define it to 1 when libX11 is available.  Without it the
 * command line tool can still query the device and send hotkey combos.
 */
#ifndef NKVM_CONFIG_X11
#define NKVM_CONFIG_X11 0
#endif

#include <chrono>
#include <cstdint>
#include <string>

namespace nkvm {

// The Nano-KVM USB serial bridge runs at 57600 baud out of the box.
inline constexpr unsigned int kDefaultBaudRate = 57600;
inline constexpr uint8_t kDefaultAddress = 0x00;
inline constexpr std::chrono::milliseconds kDefaultReadTimeout{3000};

/**
 * Runtime settings for talking to one bridge.
 *
 * The nkvm-usb tool fills this in from its command line arguments.
 */
struct ClientOptions {
  std::string port;
  unsigned int baud = kDefaultBaudRate;
  uint8_t addr = kDefaultAddress;
  std::chrono::milliseconds timeout = kDefaultReadTimeout;
  int verbosity = 0;
};

} // namespace nkvm
