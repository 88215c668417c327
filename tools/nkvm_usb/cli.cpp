// Copyright (c) 2023, Adam Simpkins
#include "tools/nkvm_usb/cli.h"

#include "nkvm/NanoKvm.h"
#include "nkvm/hid/kbd/Hotkey.h"
#include "nkvm/proto/InfoPacket.h"
#include "nkvm/transport/SerialPort.h"

#include <argparse/argparse.hpp>

#include <cstdio>
#include <exception>
#include <string>

namespace nkvm::cli {

namespace {

constexpr int kMaxBaud = 4000000;
constexpr int kMaxTimeoutMs = 600000;

void print_help(FILE *out, const argparse::ArgumentParser &program) {
  fputs(program.help().str().c_str(), out);
}

int usage_error(const argparse::ArgumentParser &program, const char *msg) {
  fprintf(stderr, "error: %s\n\n", msg);
  print_help(stderr, program);
  return kExitUsage;
}

} // namespace

std::optional<int> parse_args(int argc, const char *const argv[], Args &args) {
  int verbosity = 0;

  argparse::ArgumentParser program(
      "nkvm-usb", "0.1.0", argparse::default_arguments::none);
  program.add_description(
      "Forward keyboard and mouse input to a Nano-KVM USB bridge.");

  program.add_argument("port")
      .help("serial port of the bridge, e.g. /dev/ttyUSB0")
      .nargs(argparse::nargs_pattern::optional);

  program.add_argument("-v", "--verbose")
      .help("more diagnostics (repeat for more)")
      .action([&](const auto &) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0);

  program.add_argument("-b", "--baud")
      .help("serial baud rate")
      .default_value(static_cast<int>(kDefaultBaudRate))
      .scan<'i', int>();

  program.add_argument("-a", "--addr")
      .help("target address")
      .default_value(static_cast<int>(kDefaultAddress))
      .scan<'i', int>();

  program.add_argument("-t", "--timeout")
      .help("reply timeout in milliseconds")
      .default_value(static_cast<int>(kDefaultReadTimeout.count()))
      .scan<'i', int>();

  program.add_argument("-i", "--info")
      .help("print device information and exit")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-k", "--keys")
      .help("tap a key combo such as ctrl+alt+delete and exit");

  program.add_argument("-h", "--help")
      .help("show this help and exit")
      .default_value(false)
      .implicit_value(true);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &ex) {
    return usage_error(program, ex.what());
  }

  if (program.get<bool>("--help")) {
    print_help(stdout, program);
    return kExitOk;
  }

  const auto port = program.present("port");
  if (!port) {
    return usage_error(program, "no serial port specified");
  }
  args.client.port = *port;
  args.client.verbosity = verbosity < kMaxVerbosity ? verbosity : kMaxVerbosity;

  const auto baud = program.get<int>("--baud");
  if (baud <= 0 || baud > kMaxBaud ||
      baud_to_speed(static_cast<unsigned int>(baud)) == B0) {
    return usage_error(program, "unsupported baud rate");
  }
  args.client.baud = static_cast<unsigned int>(baud);

  const auto addr = program.get<int>("--addr");
  if (addr < 0 || addr > 0xff) {
    return usage_error(program, "address must be between 0 and 255");
  }
  args.client.addr = static_cast<uint8_t>(addr);

  const auto timeout_ms = program.get<int>("--timeout");
  if (timeout_ms <= 0 || timeout_ms > kMaxTimeoutMs) {
    return usage_error(program, "timeout must be between 1 and 600000 ms");
  }
  args.client.timeout = std::chrono::milliseconds(timeout_ms);

  const bool info = program.get<bool>("--info");
  const auto keys = program.present("--keys");
  if (info && keys) {
    return usage_error(program, "--info and --keys cannot be combined");
  }
  if (keys) {
    if (kbd::parse_hotkey(*keys, args.keys)) {
      const auto msg = "invalid key combo \"" + *keys + "\"";
      return usage_error(program, msg.c_str());
    }
    args.mode = Mode::Keys;
  } else if (info) {
    args.mode = Mode::Info;
  } else {
    args.mode = Mode::Interactive;
  }
  return std::nullopt;
}

int print_info(NanoKvm &kvm) {
  proto::InfoPacket info;
  const auto err = kvm.get_info(info);
  if (err) {
    fprintf(stderr, "error: failed to query device: %s\n", err.message().c_str());
    return kExitError;
  }
  printf("%s\n", info.to_string().c_str());
  return kExitOk;
}

int tap_keys(NanoKvm &kvm, const kbd::BootReport &keys) {
  auto err = kvm.send_keyboard_report(keys);
  if (err) {
    fprintf(stderr, "error: failed to send keys: %s\n", err.message().c_str());
    return kExitError;
  }
  err = kvm.release_all();
  if (err) {
    fprintf(stderr, "error: failed to release keys: %s\n", err.message().c_str());
    return kExitError;
  }
  return kExitOk;
}

} // namespace nkvm::cli
