// Copyright (c) 2023, Adam Simpkins
#include "nkvm/transport/SerialPort.h"

#include "nkvm/Error.h"
#include "nkvm/log.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace nkvm {

namespace {
std::error_code errno_error() {
  return std::error_code(errno, std::system_category());
}
} // namespace

speed_t baud_to_speed(unsigned int baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  case 460800:
    return B460800;
  case 921600:
    return B921600;
  }
  return B0;
}

SerialPort::~SerialPort() {
  close();
}

std::error_code SerialPort::open() {
  if (fd_ >= 0) {
    return {};
  }

  fd_ = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd_ < 0) {
    const auto err = errno_error();
    NKVM_LOGE("could not open serial port %s: %s",
              path_.c_str(),
              err.message().c_str());
    return err;
  }

  if (tcgetattr(fd_, &saved_) == 0) {
    saved_valid_ = true;
  } else {
    NKVM_LOGW("could not read settings of %s: %s",
              path_.c_str(),
              strerror(errno));
  }

  auto err = configure();
  if (!err) {
    err = set_modem_lines(false, false);
  }
  if (err) {
    NKVM_LOGE("could not configure serial port %s: %s",
              path_.c_str(),
              err.message().c_str());
    close();
    return err;
  }

  NKVM_LOGI("opened serial port %s at %u baud", path_.c_str(), baud_);
  return {};
}

void SerialPort::close() {
  if (fd_ < 0) {
    return;
  }
  if (saved_valid_ && tcsetattr(fd_, TCSANOW, &saved_) != 0) {
    NKVM_LOGW("could not restore settings of %s: %s",
              path_.c_str(),
              strerror(errno));
  }
  saved_valid_ = false;
  ::close(fd_);
  fd_ = -1;
}

std::error_code SerialPort::configure() {
  const auto speed = baud_to_speed(baud_);
  if (speed == B0) {
    NKVM_LOGE("unsupported baud rate %u", baud_);
    return std::make_error_code(std::errc::invalid_argument);
  }

  struct termios tio = {};
  if (tcgetattr(fd_, &tio) != 0) {
    return errno_error();
  }
  cfmakeraw(&tio);
  tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS | CSIZE);
  tio.c_cflag |= CS8 | CLOCAL | CREAD;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  // read() is driven by poll() timeouts, so never block inside read() itself.
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  if (cfsetispeed(&tio, speed) != 0 || cfsetospeed(&tio, speed) != 0) {
    return errno_error();
  }
  if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
    return errno_error();
  }
  tcflush(fd_, TCIOFLUSH);
  return {};
}

std::error_code SerialPort::set_modem_lines(bool dtr, bool rts) {
  int bits = 0;
  if (ioctl(fd_, TIOCMGET, &bits) != 0) {
    // Pseudo terminals and some USB adapters do not support modem lines.
    NKVM_LOGD("TIOCMGET not supported on %s", path_.c_str());
    return {};
  }
  bits = dtr ? (bits | TIOCM_DTR) : (bits & ~TIOCM_DTR);
  bits = rts ? (bits | TIOCM_RTS) : (bits & ~TIOCM_RTS);
  if (ioctl(fd_, TIOCMSET, &bits) != 0) {
    return errno_error();
  }
  return {};
}

std::error_code SerialPort::write(asel::buf_view data) {
  if (fd_ < 0) {
    return make_error_code(ErrorCode::NotOpen);
  }

  size_t offset = 0;
  while (offset < data.size()) {
    const auto n = ::write(fd_, data.data() + offset, data.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno_error();
    }
    if (n == 0) {
      NKVM_LOGE("short write to %s: %zu of %zu bytes",
                path_.c_str(),
                offset,
                data.size());
      return make_error_code(ErrorCode::ShortWrite);
    }
    offset += static_cast<size_t>(n);
  }
  return {};
}

std::error_code SerialPort::read(uint8_t *buf,
                                 size_t capacity,
                                 std::chrono::milliseconds timeout,
                                 size_t &bytes_read) {
  bytes_read = 0;
  if (fd_ < 0) {
    return make_error_code(ErrorCode::NotOpen);
  }

  struct pollfd pfd = {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  while (true) {
    const int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno_error();
    }
    if (rc == 0) {
      return make_error_code(ErrorCode::Timeout);
    }
    break;
  }

  while (true) {
    const auto n = ::read(fd_, buf, capacity);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno_error();
    }
    if (n == 0) {
      return make_error_code(ErrorCode::Timeout);
    }
    bytes_read = static_cast<size_t>(n);
    return {};
  }
}

void SerialPort::flush_input() {
  if (fd_ >= 0) {
    tcflush(fd_, TCIFLUSH);
  }
}

} // namespace nkvm
