// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "nkvm/hid/kbd/KeyboardState.h"

#include <cstdint>
#include <string>
#include <system_error>

// Forward declaration, to keep Xlib's macros out of users of this header.
struct _XDisplay;

namespace nkvm {

class NanoKvm;

namespace ui {

/**
 * An X11 window that forwards keyboard and mouse input to a NanoKvm.
 *
 * While the window has focus every key press and release is sent as a
 * keyboard report, including key combinations that the desktop would
 * otherwise act on.  Pointer motion inside the window is sent as absolute
 * mouse positions scaled to the window size, so the window acts as a
 * stand-in for the target's screen.
 */
class CaptureWindow {
public:
  struct Options {
    int width = 400;
    int height = 100;
    std::string title = "Keyboard Capture";
    bool forward_mouse = true;
  };

  CaptureWindow(NanoKvm *kvm, Options options);
  ~CaptureWindow();

  [[nodiscard]] std::error_code open();

  /**
   * Process window events until the window is closed.
   *
   * open() must have succeeded first.
   */
  void run();

private:
  CaptureWindow(CaptureWindow const &) = delete;
  CaptureWindow &operator=(CaptureWindow const &) = delete;

  void close();
  void send_keys();
  void send_pointer(int x, int y, int wheel);
  void release_everything();
  void draw_hint();

  NanoKvm *kvm_ = nullptr;
  Options options_;
  _XDisplay *display_ = nullptr;
  unsigned long window_ = 0;
  unsigned long wm_delete_ = 0;
  bool detectable_repeat_ = false;
  int width_ = 0;
  int height_ = 0;
  int last_x_ = 0;
  int last_y_ = 0;
  uint8_t buttons_ = 0;
  kbd::KeyboardState keys_;
};

} // namespace ui
} // namespace nkvm
