#pragma once
/**
 * @file fake_transport.hpp
 * @brief Scripted in-memory ITransport for session tests.
 *
 * Each recv() pops one scripted step: a chunk of bytes, an idle read, or a
 * read error. An empty script reads as idle. Everything sent is recorded.
 * Like LinuxSerial, open/close/send share one lock and send() fails on a
 * closed link, so writers on other threads can race the reader's reconnects.
 */

#include <cstdint>
#include <cstring>
#include <chrono>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "unimix/transport/transport_base.hpp"

namespace unimix_test {

using unimix::transport::RxResult;
using unimix::transport::TxResult;

class FakeTransport : public unimix::transport::ITransport {
public:
  struct Step {
    RxResult result;
    std::vector<uint8_t> bytes;
  };

  // -------- script --------
  void push(const std::vector<uint8_t>& bytes) { append({RxResult::Ok, bytes}); }
  void push(const std::string& text) { push(std::vector<uint8_t>(text.begin(), text.end())); }
  void push_idle()  { append({RxResult::None, {}}); }
  void push_error() { append({RxResult::Error, {}}); }

  bool open_ok = true;
  bool send_ok = true;
  std::atomic<int> open_calls{0};
  std::vector<std::vector<uint8_t>> sent;   // read it after the reader has stopped

  // -------- ITransport --------
  bool open(std::string& err) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++open_calls;
    open_ = false;
    if (!open_ok) { err = "reason=open_failed"; return false; }
    open_ = true;
    return true;
  }
  void close() override {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = false;
  }
  bool is_open() const override { return open_; }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, std::string& err) override {
    out_len = 0;
    std::unique_lock<std::mutex> lk(mu_);
    if (script_.empty()) {
      lk.unlock();
      // stands in for the serial poll wait when a reader thread drives us
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      return RxResult::None;
    }
    Step s = script_.front();
    script_.pop_front();
    if (s.result == RxResult::Error) { err = "reason=scripted_error"; return RxResult::Error; }
    if (s.result == RxResult::None) return RxResult::None;

    out_len = s.bytes.size() < cap ? s.bytes.size() : cap;
    std::memcpy(out, s.bytes.data(), out_len);
    if (out_len < s.bytes.size())
      script_.push_front({RxResult::Ok, std::vector<uint8_t>(s.bytes.begin() + out_len, s.bytes.end())});
    return RxResult::Ok;
  }

  TxResult send(const uint8_t* data, std::size_t len, std::string& err) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_) { err = "reason=not_open"; return TxResult::Error; }
    if (!send_ok) { err = "reason=scripted_error"; return TxResult::Error; }
    sent.emplace_back(data, data + len);
    return TxResult::Ok;
  }

  const char* name() const override { return "Fake"; }

  size_t remaining() const {
    std::lock_guard<std::mutex> lk(mu_);
    return script_.size();
  }

private:
  void append(Step s) {
    std::lock_guard<std::mutex> lk(mu_);
    script_.push_back(std::move(s));
  }

  mutable std::mutex mu_;
  std::deque<Step> script_;
  std::atomic<bool> open_{false};
};

} // namespace unimix_test
