// ============================================================================
// transport_session.cpp - implementation for unimix/transport_session.hpp
// For the state machine and threading notes see the header.
// Tests: tests/test_transport_session.cpp
// ============================================================================

#include "unimix/transport_session.hpp"
#include "unimix/config.hpp"

#include <chrono>

namespace unimix {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Reconnecting: return "reconnecting";
  }
  return "unknown";
}

SessionOptions SessionOptions::from_config(const AppConfig& cfg) {
  SessionOptions o;
  o.max_payload        = cfg.protocol.max_payload_size;
  o.frame_timeout_ms   = cfg.protocol.frame_timeout_ms;
  o.enable_binary      = cfg.protocol.enable_binary;
  o.fallback_threshold = cfg.protocol.fallback_threshold;
  o.text_framing       = cfg.protocol.text_framing;
  o.auto_reconnect     = cfg.serial.enable_auto_reconnect;
  o.reconnect_delay_ms = (uint32_t)cfg.serial.reconnect_delay_ms;
  o.stats_interval_ms  = cfg.logging.statistics_interval_ms;
  return o;
}

uint64_t TransportSession::steady_now_ms() {
  using namespace std::chrono;
  return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

TransportSession::TransportSession(std::unique_ptr<transport::ITransport> transport,
                                   SessionOptions options,
                                   MessageRegistry& registry,
                                   Logger log)
  : transport_(std::move(transport)),
    opt_(options),
    registry_(registry),
    log_(std::move(log)),
    assembler_(opt_.max_payload, opt_.frame_timeout_ms, &stats_, log_.with_tag("assembler")),
    splitter_(opt_.text_framing, opt_.max_payload),
    mode_(opt_.enable_binary, opt_.fallback_threshold) {
  registry_.set_statistics(&stats_);
}

TransportSession::~TransportSession() {
  stop();
}

void TransportSession::set_state(ConnectionState s) {
  const ConnectionState prev = state_.exchange(s);
  if (prev != s)
    log_.debug(std::string("state ") + to_string(prev) + " -> " + to_string(s));
}

void TransportSession::notify_status(bool connected, const std::string& detail) {
  if (status_observer_) status_observer_(connected, detail);
}

// -------- lifecycle --------

bool TransportSession::connect() {
  set_state(ConnectionState::Connecting);

  std::string err;
  if (!transport_->open(err)) {
    stats_.record_error(ErrorKind::Transport);
    log_.warn(std::string("open failed source=") + transport_->name() + " " + err);
    set_state(ConnectionState::Disconnected);
    notify_status(false, err);
    return false;
  }

  assembler_.reset();
  splitter_.reset();
  set_state(ConnectionState::Connected);
  log_.info(std::string("connected source=") + transport_->name() +
            " mode=" + to_string(mode_.mode()));
  notify_status(true, std::string("connected ") + transport_->name());
  return true;
}

void TransportSession::disconnect() {
  transport_->close();
  assembler_.reset();
  splitter_.reset();
  set_state(ConnectionState::Disconnected);
}

bool TransportSession::start() {
  if (running_.exchange(true)) return false;
  cancel_.rearm();
  reader_done_.store(false);

  reader_ = std::thread([this] { run_reader(); });
  if (opt_.stats_interval_ms > 0)
    stats_thread_ = std::thread([this] { run_statistics(); });
  return true;
}

void TransportSession::stop() {
  cancel_.cancel();
  if (reader_.joinable()) reader_.join();
  if (stats_thread_.joinable()) stats_thread_.join();

  if (running_.exchange(false) || transport_->is_open()) {
    const bool was_connected = state_.load() == ConnectionState::Connected;
    disconnect();
    if (was_connected) notify_status(false, "stopped");
    log_.info("session stopped " + stats_.summary());
  }
}

// ---------------------------------------------------------------------------
// run_reader()
// ------------
// Connect, read until failure, wait the fixed delay, repeat. Every blocking
// wait goes through cancel_ so stop() interrupts it.
// ---------------------------------------------------------------------------
void TransportSession::run_reader() {
  while (!cancel_.cancelled()) {
    if (state_.load() != ConnectionState::Connected) {
      if (!connect()) {
        if (!opt_.auto_reconnect) break;
        set_state(ConnectionState::Reconnecting);
        log_.info("retrying in " + std::to_string(opt_.reconnect_delay_ms) + "ms");
        if (!cancel_.wait_for(opt_.reconnect_delay_ms)) break;
        continue;
      }
    }

    const PollStatus st = poll_once(steady_now_ms());
    if (st == PollStatus::TransportError) {
      if (!opt_.auto_reconnect) break;
      log_.info("reconnecting in " + std::to_string(opt_.reconnect_delay_ms) + "ms");
      if (!cancel_.wait_for(opt_.reconnect_delay_ms)) break;
    }
  }
  reader_done_.store(true);
}

void TransportSession::run_statistics() {
  while (cancel_.wait_for(opt_.stats_interval_ms)) {
    const StatsSnapshot snap = stats_.snapshot();
    log_.info("stats mode=" + std::string(to_string(mode_.mode())) + " " + snap.summary());
    if (stats_observer_) stats_observer_(snap);
  }
}

// -------- read path --------

PollStatus TransportSession::poll_once(uint64_t now_ms) {
  if (state_.load() != ConnectionState::Connected || !transport_->is_open())
    return PollStatus::NotConnected;

  uint8_t buf[READ_CHUNK];
  size_t n = 0;
  std::string err;

  switch (transport_->recv(buf, sizeof(buf), n, err)) {
    case transport::RxResult::Ok:
      if (raw_observer_) raw_observer_(buf, n);
      process_bytes(buf, n, now_ms);
      return PollStatus::Data;

    case transport::RxResult::None:
      if (mode_.binary()) handle_binary(assembler_.poll(now_ms), nullptr, 0);
      return PollStatus::Idle;

    case transport::RxResult::Error:
      break;
  }

  stats_.record_error(ErrorKind::Transport);
  log_.warn(std::string("read failed source=") + transport_->name() + " " + err);
  transport_->close();
  assembler_.reset();
  splitter_.reset();
  set_state(opt_.auto_reconnect ? ConnectionState::Reconnecting : ConnectionState::Disconnected);
  notify_status(false, err.empty() ? std::string("read failed") : err);
  return PollStatus::TransportError;
}

void TransportSession::process_bytes(const uint8_t* data, size_t n, uint64_t now_ms) {
  if (!data || n == 0) return;
  if (mode_.binary()) handle_binary(assembler_.feed(data, n, now_ms), data, n);
  else                feed_text(data, n);
}

void TransportSession::handle_binary(const AssemblerOutput& out, const uint8_t* chunk, size_t n) {
  for (const auto& f : out.frames) {
    mode_.on_decode_success();
    registry_.dispatch_text(f.payload_text(), transport_->name(), f.type);
  }

  bool fell_back = false;
  for (size_t i = 0; i < out.errors.size(); ++i) {
    if (mode_.on_decode_failure()) fell_back = true;
  }
  if (!fell_back) return;

  log_.warn("no valid binary frame after " + std::to_string(mode_.failures()) +
            " errors, falling back to text protocol");
  assembler_.reset();
  if (mode_observer_) mode_observer_(ProtocolMode::Binary, ProtocolMode::Text);
  if (chunk) feed_text(chunk, n);
}

void TransportSession::feed_text(const uint8_t* data, size_t n) {
  SplitOutput out = splitter_.feed(data, n);
  for (ErrorKind e : out.errors) {
    stats_.record_error(e);
    log_.warn(std::string("text line dropped reason=") + to_string(e));
  }
  if (out.skipped > 0)
    log_.trace("skipped " + std::to_string(out.skipped) + " non-JSON text lines");
  for (const auto& line : out.lines) {
    stats_.record_received(line.size());
    registry_.dispatch_text(line, transport_->name());
  }
}

// -------- write path --------

bool TransportSession::send(const nlohmann::json& message) {
  return send_text(message.dump());
}

bool TransportSession::send_text(const std::string& payload) {
  if (payload.size() > opt_.max_payload) {
    log_.warn("payload of " + std::to_string(payload.size()) + " bytes exceeds max " +
              std::to_string(opt_.max_payload));
    return false;
  }
  if (state_.load() != ConnectionState::Connected) {
    log_.debug("send skipped, not connected");
    return false;
  }

  std::vector<uint8_t> wire;
  if (mode_.binary()) {
    wire = frame::encode(frame::TYPE_JSON, payload);
  } else {
    const std::string text = splitter_.wrap(payload);
    wire.assign(text.begin(), text.end());
  }

  // the reader may close the link after the state check; the transport
  // then refuses the write and it is counted like any failed write
  std::string err;
  if (transport_->send(wire.data(), wire.size(), err) != transport::TxResult::Ok) {
    stats_.record_error(ErrorKind::Transport);
    log_.warn(std::string("write failed source=") + transport_->name() + " " + err);
    return false;
  }
  stats_.record_sent(wire.size());
  log_.trace("sent " + std::to_string(wire.size()) + " bytes");
  return true;
}

} // namespace unimix
