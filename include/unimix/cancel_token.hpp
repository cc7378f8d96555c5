#pragma once
/**
 * @file cancel_token.hpp
 * @brief Cooperative cancellation shared by the read loop, reconnect wait and statistics task.
 *
 * wait_for() is the only blocking primitive those loops use, so cancel()
 * wakes every one of them immediately.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <mutex>

namespace unimix {

class CancelToken {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      cancelled_.store(true);
    }
    cv_.notify_all();
  }

  bool cancelled() const { return cancelled_.load(); }

  /// Re-arm for another start(). Only call with no waiters.
  void rearm() { cancelled_.store(false); }

  /// Sleep up to @p ms. Returns false when cancelled (before or during).
  bool wait_for(uint32_t ms) {
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_for(lk, std::chrono::milliseconds(ms),
                         [this] { return cancelled_.load(); });
  }

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace unimix
