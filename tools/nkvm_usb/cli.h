// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/config.h"
#include "nkvm/hid/kbd/BootReport.h"

#include <optional>

namespace nkvm {

class NanoKvm;

namespace cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kMaxVerbosity = 3;

enum class Mode {
  Interactive,
  Info,
  Keys,
};

struct Args {
  ClientOptions client;
  Mode mode = Mode::Interactive;
  // The combo to tap in Mode::Keys.
  kbd::BootReport keys;
};

/**
 * Parse the nkvm-usb command line into args.
 *
 * Returns an exit code if the program should stop here: kExitOk after
 * printing --help, or kExitUsage after reporting a bad argument.  Returns
 * std::nullopt if the program should go on with the parsed arguments.
 */
std::optional<int> parse_args(int argc, const char *const argv[], Args &args);

// Query and print the device information.  Returns an exit code.
int print_info(NanoKvm &kvm);

// Press the keys in the report, then release everything.  Returns an exit code.
int tap_keys(NanoKvm &kvm, const kbd::BootReport &keys);

} // namespace cli
} // namespace nkvm
