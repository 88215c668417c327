// Copyright (c) 2023, Adam Simpkins
#include "nkvm/NanoKvm.h"
#include "nkvm/config.h"
#include "nkvm/log.h"
#include "nkvm/transport/SerialPort.h"
#include "tools/nkvm_usb/cli.h"

#if NKVM_CONFIG_X11
#include "nkvm/ui/CaptureWindow.h"
#endif

#include <cstdio>

using namespace nkvm::cli;

namespace {

int run_interactive(nkvm::NanoKvm &kvm) {
  const int rc = print_info(kvm);
  if (rc != kExitOk) {
    return rc;
  }

#if NKVM_CONFIG_X11
  nkvm::ui::CaptureWindow window(&kvm, nkvm::ui::CaptureWindow::Options());
  const auto err = window.open();
  if (err) {
    fprintf(stderr, "error: %s\n", err.message().c_str());
    return kExitError;
  }
  window.run();
#else
  NKVM_LOGW("built without X11 support; no capture window available");
#endif
  return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  Args args;
  if (const auto rc = parse_args(argc, argv, args)) {
    return *rc;
  }
  nkvm::set_log_level(nkvm::log_level_for_verbosity(args.client.verbosity));

  nkvm::SerialPort port(args.client.port, args.client.baud);
  const auto err = port.open();
  if (err) {
    fprintf(stderr,
            "error: unable to open %s: %s\n",
            args.client.port.c_str(),
            err.message().c_str());
    return kExitError;
  }
  port.flush_input();

  nkvm::NanoKvm kvm(&port, args.client.addr, args.client.timeout);
  switch (args.mode) {
  case Mode::Info:
    return print_info(kvm);
  case Mode::Keys:
    return tap_keys(kvm, args.keys);
  case Mode::Interactive:
    break;
  }
  return run_interactive(kvm);
}
