// ============================================================================
// protocol_statistics.cpp - implementation for unimix/protocol_statistics.hpp
// ============================================================================

#include "unimix/protocol_statistics.hpp"

#include <cstdio>
#include <sstream>

namespace unimix {

// -------- snapshot math --------

double StatsSnapshot::success_rate() const {
  const uint64_t total = messages_received + total_frame_errors();
  if (total == 0) return 0.0;
  return (double)messages_received / (double)total * 100.0;
}

double StatsSnapshot::messages_per_second() const {
  if (uptime_seconds <= 0.0) return 0.0;
  return (double)(messages_sent + messages_received) / uptime_seconds;
}

double StatsSnapshot::bytes_per_second() const {
  if (uptime_seconds <= 0.0) return 0.0;
  return (double)(bytes_sent + bytes_received) / uptime_seconds;
}

// ---------------------------------------------------------------------------
// summary()
// ---------
// key=value tokens, one line, grep-friendly:
//   sent=3 recv=10 tx=120 rx=800 framing=1 crc=0 escape=0 overflow=0
//   timeout=0 parse=0 unknown=0 transport=0 success=90.91% rate=0.43msg/s
//   bw=30.10B/s uptime=00:00:30
// ---------------------------------------------------------------------------
std::string StatsSnapshot::summary() const {
  const uint64_t up = (uint64_t)uptime_seconds;
  char uptime[32];
  std::snprintf(uptime, sizeof(uptime), "%02llu:%02llu:%02llu",
                (unsigned long long)(up / 3600),
                (unsigned long long)((up / 60) % 60),
                (unsigned long long)(up % 60));

  char rates[96];
  std::snprintf(rates, sizeof(rates), "success=%.2f%% rate=%.2fmsg/s bw=%.2fB/s",
                success_rate(), messages_per_second(), bytes_per_second());

  std::ostringstream o;
  o << "sent=" << messages_sent
    << " recv=" << messages_received
    << " tx=" << bytes_sent
    << " rx=" << bytes_received
    << " framing=" << framing_errors
    << " crc=" << crc_errors
    << " escape=" << escape_sequence_errors
    << " overflow=" << buffer_overflow_errors
    << " timeout=" << timeout_errors
    << " parse=" << parse_errors
    << " unknown=" << unknown_type_errors
    << " transport=" << transport_errors
    << ' ' << rates
    << " uptime=" << uptime;
  return o.str();
}

// -------- counters --------

ProtocolStatistics::ProtocolStatistics()
  : started_(Clock::now().time_since_epoch().count()) {}

void ProtocolStatistics::record_sent(uint64_t bytes) {
  messages_sent_.fetch_add(1);
  bytes_sent_.fetch_add(bytes);
}

void ProtocolStatistics::record_received(uint64_t bytes) {
  messages_received_.fetch_add(1);
  bytes_received_.fetch_add(bytes);
}

void ProtocolStatistics::record_error(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:               break;
    case ErrorKind::Framing:            framing_errors_.fetch_add(1); break;
    case ErrorKind::Crc:                crc_errors_.fetch_add(1); break;
    case ErrorKind::EscapeSequence:     escape_sequence_errors_.fetch_add(1); break;
    case ErrorKind::BufferOverflow:     buffer_overflow_errors_.fetch_add(1); break;
    case ErrorKind::Timeout:            timeout_errors_.fetch_add(1); break;
    case ErrorKind::Parse:              parse_errors_.fetch_add(1); break;
    case ErrorKind::UnknownMessageType: unknown_type_errors_.fetch_add(1); break;
    case ErrorKind::Transport:          transport_errors_.fetch_add(1); break;
  }
}

uint64_t ProtocolStatistics::error_count(ErrorKind kind) const {
  switch (kind) {
    case ErrorKind::None:               return 0;
    case ErrorKind::Framing:            return framing_errors_.load();
    case ErrorKind::Crc:                return crc_errors_.load();
    case ErrorKind::EscapeSequence:     return escape_sequence_errors_.load();
    case ErrorKind::BufferOverflow:     return buffer_overflow_errors_.load();
    case ErrorKind::Timeout:            return timeout_errors_.load();
    case ErrorKind::Parse:              return parse_errors_.load();
    case ErrorKind::UnknownMessageType: return unknown_type_errors_.load();
    case ErrorKind::Transport:          return transport_errors_.load();
  }
  return 0;
}

StatsSnapshot ProtocolStatistics::snapshot() const {
  StatsSnapshot s;
  s.messages_sent          = messages_sent_.load();
  s.messages_received      = messages_received_.load();
  s.bytes_sent             = bytes_sent_.load();
  s.bytes_received         = bytes_received_.load();
  s.framing_errors         = framing_errors_.load();
  s.crc_errors             = crc_errors_.load();
  s.escape_sequence_errors = escape_sequence_errors_.load();
  s.buffer_overflow_errors = buffer_overflow_errors_.load();
  s.timeout_errors         = timeout_errors_.load();
  s.parse_errors           = parse_errors_.load();
  s.unknown_type_errors    = unknown_type_errors_.load();
  s.transport_errors       = transport_errors_.load();

  const Clock::duration up(Clock::now().time_since_epoch().count() - started_.load());
  s.uptime_seconds = std::chrono::duration<double>(up).count();
  return s;
}

void ProtocolStatistics::reset() {
  messages_sent_ = 0;
  messages_received_ = 0;
  bytes_sent_ = 0;
  bytes_received_ = 0;
  framing_errors_ = 0;
  crc_errors_ = 0;
  escape_sequence_errors_ = 0;
  buffer_overflow_errors_ = 0;
  timeout_errors_ = 0;
  parse_errors_ = 0;
  unknown_type_errors_ = 0;
  transport_errors_ = 0;
  started_ = Clock::now().time_since_epoch().count();
}

} // namespace unimix
