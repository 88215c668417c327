// Copyright (c) 2023, Adam Simpkins
#include "nkvm/ui/CaptureWindow.h"

#include "nkvm/Error.h"
#include "nkvm/NanoKvm.h"
#include "nkvm/hid/mouse/MouseReport.h"
#include "nkvm/log.h"
#include "nkvm/ui/KeysymMap.h"

// Xlib defines macros such as None and Status, so it must come after every
// header that uses those names as identifiers.
#include <X11/XKBlib.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <cstring>
#include <utility>

namespace nkvm::ui {

namespace {
constexpr char kHint[] = "Focus this window to forward keyboard and mouse";
} // namespace

CaptureWindow::CaptureWindow(NanoKvm *kvm, Options options)
    : kvm_(kvm),
      options_(std::move(options)),
      width_(options_.width),
      height_(options_.height) {}

CaptureWindow::~CaptureWindow() {
  close();
}

std::error_code CaptureWindow::open() {
  display_ = XOpenDisplay(nullptr);
  if (!display_) {
    NKVM_LOGE("cannot open X display");
    return make_error_code(ErrorCode::DisplayUnavailable);
  }

  Bool supported = False;
  XkbSetDetectableAutoRepeat(display_, True, &supported);
  detectable_repeat_ = supported;
  NKVM_LOGD("detectable autorepeat %s",
            detectable_repeat_ ? "enabled" : "unsupported");

  const int screen = DefaultScreen(display_);
  window_ = XCreateSimpleWindow(display_,
                                RootWindow(display_, screen),
                                0,
                                0,
                                static_cast<unsigned int>(options_.width),
                                static_cast<unsigned int>(options_.height),
                                0,
                                BlackPixel(display_, screen),
                                WhitePixel(display_, screen));
  if (!window_) {
    NKVM_LOGE("cannot create capture window");
    close();
    return make_error_code(ErrorCode::DisplayUnavailable);
  }

  long event_mask = StructureNotifyMask | ExposureMask | FocusChangeMask |
                    KeyPressMask | KeyReleaseMask;
  if (options_.forward_mouse) {
    event_mask |= PointerMotionMask | ButtonPressMask | ButtonReleaseMask;
  }
  XSelectInput(display_, window_, event_mask);

  XStoreName(display_, window_, options_.title.c_str());
  XClassHint *class_hint = XAllocClassHint();
  if (class_hint) {
    char res_name[] = "nkvm-usb";
    char res_class[] = "NanoKvm";
    class_hint->res_name = res_name;
    class_hint->res_class = res_class;
    XSetClassHint(display_, window_, class_hint);
    XFree(class_hint);
  }

  Atom wm_delete = XInternAtom(display_, "WM_DELETE_WINDOW", False);
  XSetWMProtocols(display_, window_, &wm_delete, 1);
  wm_delete_ = wm_delete;

  XMapWindow(display_, window_);
  XFlush(display_);
  NKVM_LOGI("capture window open (%dx%d)", options_.width, options_.height);
  return {};
}

void CaptureWindow::close() {
  if (!display_) {
    return;
  }
  if (window_) {
    XDestroyWindow(display_, window_);
    window_ = 0;
  }
  XCloseDisplay(display_);
  display_ = nullptr;
}

void CaptureWindow::run() {
  bool running = display_ != nullptr;
  while (running) {
    XEvent xev;
    XNextEvent(display_, &xev);

    switch (xev.type) {
    case ClientMessage:
      if (static_cast<unsigned long>(xev.xclient.data.l[0]) == wm_delete_) {
        running = false;
      }
      break;
    case DestroyNotify:
      running = false;
      break;
    case MappingNotify:
      XRefreshKeyboardMapping(&xev.xmapping);
      break;
    case ConfigureNotify:
      width_ = xev.xconfigure.width;
      height_ = xev.xconfigure.height;
      break;
    case Expose:
      if (xev.xexpose.count == 0) {
        draw_hint();
      }
      break;
    case FocusOut:
      release_everything();
      break;
    case KeyPress: {
      const auto keysym = XLookupKeysym(&xev.xkey, 0);
      const auto key = keysym_to_key(keysym);
      if (!key) {
        const char *name = XKeysymToString(keysym);
        NKVM_LOGW("unhandled key event: keycode %u (%s)",
                  xev.xkey.keycode,
                  name ? name : "no keysym");
        break;
      }
      // Autorepeat presses arrive for keys that are already down, and
      // press() ignores them.
      if (keys_.press(*key)) {
        NKVM_LOGD("sending key %s as 0x%02x",
                  XKeysymToString(keysym),
                  static_cast<unsigned int>(*key));
        send_keys();
      }
      break;
    }
    case KeyRelease: {
      if (!detectable_repeat_ && XPending(display_)) {
        // Without detectable autorepeat the server reports a repeat as a
        // release immediately followed by a press with the same timestamp.
        XEvent next;
        XPeekEvent(display_, &next);
        if (next.type == KeyPress && next.xkey.time == xev.xkey.time &&
            next.xkey.keycode == xev.xkey.keycode) {
          break;
        }
      }
      const auto key = keysym_to_key(XLookupKeysym(&xev.xkey, 0));
      if (key && keys_.release(*key)) {
        send_keys();
      }
      break;
    }
    case MotionNotify:
      send_pointer(xev.xmotion.x, xev.xmotion.y, 0);
      break;
    case ButtonPress:
    case ButtonRelease: {
      const bool pressed = xev.type == ButtonPress;
      uint8_t bit = 0;
      switch (xev.xbutton.button) {
      case Button1:
        bit = mouse::ButtonLeft;
        break;
      case Button2:
        bit = mouse::ButtonMiddle;
        break;
      case Button3:
        bit = mouse::ButtonRight;
        break;
      case Button4:
        if (pressed) {
          send_pointer(xev.xbutton.x, xev.xbutton.y, 1);
        }
        break;
      case Button5:
        if (pressed) {
          send_pointer(xev.xbutton.x, xev.xbutton.y, -1);
        }
        break;
      }
      if (bit != 0) {
        buttons_ = static_cast<uint8_t>(pressed ? (buttons_ | bit)
                                                 : (buttons_ & ~bit));
        send_pointer(xev.xbutton.x, xev.xbutton.y, 0);
      }
      break;
    }
    default:
      break;
    }
  }

  release_everything();
  NKVM_LOGI("capture window closed");
}

void CaptureWindow::send_keys() {
  const auto report = keys_.report();
  const auto err = kvm_->send_keyboard_report(report);
  if (err) {
    NKVM_LOGW("failed to send keyboard report: %s", err.message().c_str());
  }
}

void CaptureWindow::send_pointer(int x, int y, int wheel) {
  last_x_ = x;
  last_y_ = y;
  const auto err =
      kvm_->send_mouse_absolute_data(buttons_, width_, height_, x, y, wheel);
  if (err) {
    NKVM_LOGW("failed to send mouse report: %s", err.message().c_str());
  }
}

void CaptureWindow::release_everything() {
  if (keys_.release_all()) {
    send_keys();
  }
  if (buttons_ != 0) {
    buttons_ = 0;
    send_pointer(last_x_, last_y_, 0);
  }
}

void CaptureWindow::draw_hint() {
  GC gc = XCreateGC(display_, window_, 0, nullptr);
  const int screen = DefaultScreen(display_);
  XSetForeground(display_, gc, BlackPixel(display_, screen));
  XDrawString(display_,
              window_,
              gc,
              10,
              height_ / 2,
              kHint,
              static_cast<int>(strlen(kHint)));
  XFreeGC(display_, gc);
}

} // namespace nkvm::ui
