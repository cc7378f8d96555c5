#pragma once
/**
 * @file protocol_statistics.hpp
 * @brief Lock-free link counters plus derived rates for one transport session.
 *
 * @details
 * The reader thread, the writer path and the statistics task all touch these
 * counters, so each one is a std::atomic and every update is a single
 * fetch_add. No lock is taken; a snapshot() is therefore a near-consistent
 * view, not a transaction, which is fine for operator visibility.
 *
 * Derived values:
 *   total_frame_errors = framing + crc + escape + overflow + timeout
 *   success_rate       = received / (received + total_frame_errors) * 100
 *                        (0 when nothing has been seen yet)
 *   messages_per_second / bytes_per_second are averaged over uptime.
 *
 * reset() zeroes every counter and restarts the uptime clock.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "unimix/errors.hpp"

namespace unimix {

/// Plain copy of the counters at one instant.
struct StatsSnapshot {
  uint64_t messages_sent = 0;
  uint64_t messages_received = 0;
  uint64_t bytes_sent = 0;
  uint64_t bytes_received = 0;

  uint64_t framing_errors = 0;
  uint64_t crc_errors = 0;
  uint64_t escape_sequence_errors = 0;
  uint64_t buffer_overflow_errors = 0;
  uint64_t timeout_errors = 0;
  uint64_t parse_errors = 0;
  uint64_t unknown_type_errors = 0;
  uint64_t transport_errors = 0;

  double uptime_seconds = 0.0;

  uint64_t total_frame_errors() const {
    return framing_errors + crc_errors + escape_sequence_errors +
           buffer_overflow_errors + timeout_errors;
  }
  double success_rate() const;
  double messages_per_second() const;
  double bytes_per_second() const;

  /// One-line summary for the periodic statistics log.
  std::string summary() const;
};

class ProtocolStatistics {
public:
  using Clock = std::chrono::steady_clock;

  ProtocolStatistics();

  ProtocolStatistics(const ProtocolStatistics&) = delete;
  ProtocolStatistics& operator=(const ProtocolStatistics&) = delete;

  void record_sent(uint64_t bytes);
  void record_received(uint64_t bytes);

  /// Bump the counter matching @p kind. ErrorKind::None is ignored.
  void record_error(ErrorKind kind);

  /// Counter value for one error kind.
  uint64_t error_count(ErrorKind kind) const;

  uint64_t messages_sent() const     { return messages_sent_.load(); }
  uint64_t messages_received() const { return messages_received_.load(); }
  uint64_t bytes_sent() const        { return bytes_sent_.load(); }
  uint64_t bytes_received() const    { return bytes_received_.load(); }

  StatsSnapshot snapshot() const;
  std::string summary() const { return snapshot().summary(); }

  void reset();

private:
  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> messages_received_{0};
  std::atomic<uint64_t> bytes_sent_{0};
  std::atomic<uint64_t> bytes_received_{0};

  std::atomic<uint64_t> framing_errors_{0};
  std::atomic<uint64_t> crc_errors_{0};
  std::atomic<uint64_t> escape_sequence_errors_{0};
  std::atomic<uint64_t> buffer_overflow_errors_{0};
  std::atomic<uint64_t> timeout_errors_{0};
  std::atomic<uint64_t> parse_errors_{0};
  std::atomic<uint64_t> unknown_type_errors_{0};
  std::atomic<uint64_t> transport_errors_{0};

  std::atomic<Clock::rep> started_;
};

} // namespace unimix
