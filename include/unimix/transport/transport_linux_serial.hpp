#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport over the serial_io helpers (termios; non-blocking fd).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "unimix/serial_io.hpp"
#include "unimix/transport/transport_base.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace unimix::transport {

struct SerialConfig {
  std::string path;            // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int poll_ms{10};             // longest single recv() wait
  int write_timeout_ms{1000};  // longest wait for the driver to accept more output
  int boot_delay_ms{400};      // USB CDC auto-reset settle time
};

class LinuxSerial : public ITransport {
public:
  explicit LinuxSerial(SerialConfig cfg) : cfg_(std::move(cfg)) {}
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  // open(), close() and send() hold fd_mu_, so a write never outlives the
  // descriptor it started on. recv() runs on the thread that opens and closes.
  bool open(std::string& err) override {
    std::lock_guard<std::mutex> lk(fd_mu_);
    close_locked();
    if (cfg_.path.empty()) { err = "reason=no_port"; return false; }
    fd_ = open_serial(cfg_.path, cfg_.baud, cfg_.boot_delay_ms, err);
    return fd_ >= 0;
  }

  void close() override {
    std::lock_guard<std::mutex> lk(fd_mu_);
    close_locked();
  }

  bool is_open() const override { return fd_ >= 0; }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, std::string& err) override {
    switch (read_some(fd_, out, cap, out_len, cfg_.poll_ms, err)) {
      case ReadStatus::Data:    return RxResult::Ok;
      case ReadStatus::Timeout: return RxResult::None;
      case ReadStatus::Error:   break;
    }
    return RxResult::Error;
  }

  // Writers may come from any thread; one frame goes out whole.
  TxResult send(const uint8_t* data, std::size_t len, std::string& err) override {
    std::lock_guard<std::mutex> lk(fd_mu_);
    if (fd_ < 0) { err = "reason=not_open"; return TxResult::Error; }
    return write_all(fd_, data, len, cfg_.write_timeout_ms, err) ? TxResult::Ok : TxResult::Error;
  }

  const char* name() const override { return "Serial"; }

  const SerialConfig& config() const { return cfg_; }

private:
  void close_locked() {
    close_serial(fd_.exchange(-1));
  }

  SerialConfig cfg_;
  std::atomic<int> fd_{-1};
  std::mutex fd_mu_;
};

} // namespace unimix::transport
