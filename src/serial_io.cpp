// ============================================================================
// serial_io.cpp - implementation for unimix/serial_io.hpp
// ============================================================================

#include "unimix/serial_io.hpp"

#include <fcntl.h>
#include <glob.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace unimix {

static std::string errno_text(const char* what) {
  return std::string("reason=") + what + " errno=" + std::to_string(errno) + " (" + std::strerror(errno) + ")";
}

static bool to_speed(int baud, speed_t& sp) {
  switch (baud) {
    case 9600:   sp = B9600;   return true;
    case 19200:  sp = B19200;  return true;
    case 38400:  sp = B38400;  return true;
    case 57600:  sp = B57600;  return true;
    case 115200: sp = B115200; return true;
#ifdef B230400
    case 230400: sp = B230400; return true;
#endif
#ifdef B460800
    case 460800: sp = B460800; return true;
#endif
#ifdef B921600
    case 921600: sp = B921600; return true;
#endif
    default: return false;
  }
}

bool baud_supported(int baud) {
  speed_t sp;
  return to_speed(baud, sp);
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// 8N1 raw, no flow control, VMIN=VTIME=0 (poll() does the waiting).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud, std::string& err) {
  termios tio{};
  if (tcgetattr(fd, &tio) != 0) { err = errno_text("tcgetattr"); return false; }

  cfmakeraw(&tio);
  cfsetispeed(&tio, baud);
  cfsetospeed(&tio, baud);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tio) != 0) { err = errno_text("tcsetattr"); return false; }
  tcflush(fd, TCIOFLUSH);
  return true;
}

int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err) {
  speed_t sp = B115200;
  if (!to_speed(baud, sp)) {
    err = "reason=unsupported_baud baud=" + std::to_string(baud);
    return -1;
  }

  int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) { err = errno_text("open") + " dev=" + dev; return -1; }

  if (!set_raw(fd, sp, err)) {
    ::close(fd);
    return -1;
  }

  if (boot_delay_ms > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(boot_delay_ms));
  tcflush(fd, TCIOFLUSH);   // drop boot chatter
  return fd;
}

void close_serial(int fd) {
  if (fd >= 0) ::close(fd);
}

ReadStatus read_some(int fd, uint8_t* out, size_t cap, size_t& out_len,
                     int timeout_ms, std::string& err) {
  out_len = 0;
  if (fd < 0 || !out || cap == 0) { err = "reason=bad_argument"; return ReadStatus::Error; }

  pollfd pfd{fd, POLLIN, 0};
  const int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return ReadStatus::Timeout;
  if (pr < 0) {
    if (errno == EINTR) return ReadStatus::Timeout;
    err = errno_text("poll");
    return ReadStatus::Error;
  }
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    err = "reason=hangup";
    return ReadStatus::Error;
  }

  const ssize_t n = ::read(fd, out, cap);
  if (n > 0) { out_len = (size_t)n; return ReadStatus::Data; }
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return ReadStatus::Timeout;
  // readable with zero bytes: the device went away
  err = (n == 0) ? std::string("reason=eof") : errno_text("read");
  return ReadStatus::Error;
}

bool write_all(int fd, const uint8_t* data, size_t len, int timeout_ms, std::string& err) {
  if (fd < 0) { err = "reason=not_open"; return false; }
  size_t off = 0;
  while (off < len) {
    const ssize_t w = ::write(fd, data + off, len - off);
    if (w > 0) { off += (size_t)w; continue; }
    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd, POLLOUT, 0};
      const int pr = ::poll(&pfd, 1, timeout_ms);
      if (pr > 0) continue;
      err = (pr == 0) ? std::string("reason=write_timeout") : errno_text("poll");
      return false;
    }
    err = errno_text("write");
    return false;
  }
  return true;
}

// glob(3) fallback for hosts without /dev/serial/by-id
static void append_glob(std::vector<SerialPortInfo>& out, const char* pattern) {
  glob_t g{};
  if (glob(pattern, 0, nullptr, &g) == 0) {
    for (size_t i = 0; i < g.gl_pathc; ++i)
      out.push_back({g.gl_pathv[i], g.gl_pathv[i], false});
  }
  globfree(&g);
}

std::vector<SerialPortInfo> list_serial_ports() {
  std::vector<SerialPortInfo> out;

  const fs::path by_id("/dev/serial/by-id");
  std::error_code ec;
  if (fs::exists(by_id, ec)) {
    for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
      if (!it->is_symlink(ec)) continue;
      std::error_code cec;
      auto canon = fs::canonical(it->path(), cec);
      if (!cec) out.push_back({it->path().string(), canon.string(), true});
    }
  }
  if (out.empty()) {
    append_glob(out, "/dev/ttyUSB*");
    append_glob(out, "/dev/ttyACM*");
  }
  return out;
}

} // namespace unimix
