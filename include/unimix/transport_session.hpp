#pragma once
/**
 * @page um-transport-session unimix Transport Session
 * @file transport_session.hpp
 * @brief Connection lifecycle, read loop, write path and reconnect for one serial link.
 *
 * @details
 * PURPOSE
 * -------
 * Ties the pieces together for one connection:
 *
 *   ITransport::recv -> FrameAssembler (binary) / LineSplitter (text)
 *                    -> MessageRegistry::dispatch_text -> handler
 *   send(json)       -> frame::encode / LineSplitter::wrap -> ITransport::send
 *
 * STATES
 * ------
 *   Disconnected -> Connecting -> Connected
 *   Connected --(I/O failure)--> Reconnecting --(fixed delay)--> Connecting
 * With auto-reconnect off, a failure ends in Disconnected and the read loop exits.
 *
 * THREADS
 * -------
 * start() spawns the read loop and, when the statistics interval is non-zero,
 * the statistics task. Both stop through one CancelToken; stop() joins them.
 * Handlers run on the read thread, so a slow handler throttles reading.
 * send() may be called from any thread while the reader runs.
 *
 * Tests skip start() and drive connect()/poll_once() directly with a scripted
 * transport and a synthetic clock.
 *
 * MODE FALLBACK
 * -------------
 * Frame errors reported by the assembler go to the ProtocolModeController.
 * When it falls back to text, the assembler is cleared and the chunk that
 * triggered the fallback is replayed through the line splitter, so a device
 * that only ever spoke text does not lose its first line.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

#include "unimix/cancel_token.hpp"
#include "unimix/frame_assembler.hpp"
#include "unimix/line_splitter.hpp"
#include "unimix/log.hpp"
#include "unimix/message_registry.hpp"
#include "unimix/mode_controller.hpp"
#include "unimix/protocol_statistics.hpp"
#include "unimix/transport/transport_base.hpp"

namespace unimix {

struct AppConfig;

enum class ConnectionState : uint8_t { Disconnected = 0, Connecting, Connected, Reconnecting };

const char* to_string(ConnectionState s);

struct SessionOptions {
  size_t max_payload = frame::MAX_PAYLOAD_LIMIT;
  uint32_t frame_timeout_ms = 1000;
  bool enable_binary = true;
  uint32_t fallback_threshold = 3;
  TextFraming text_framing = TextFraming::Newline;
  bool auto_reconnect = true;
  uint32_t reconnect_delay_ms = 5000;
  uint32_t stats_interval_ms = 30000;

  static SessionOptions from_config(const AppConfig& cfg);
};

/// Result of one poll_once() pass.
enum class PollStatus : uint8_t { Data, Idle, NotConnected, TransportError };

class TransportSession {
public:
  using StatusObserver = std::function<void(bool connected, const std::string& detail)>;
  using ModeObserver   = std::function<void(ProtocolMode from, ProtocolMode to)>;
  using StatsObserver  = std::function<void(const StatsSnapshot&)>;
  using RawObserver    = std::function<void(const uint8_t* data, size_t n)>;

  static constexpr size_t READ_CHUNK = 1024;

  TransportSession(std::unique_ptr<transport::ITransport> transport,
                   SessionOptions options,
                   MessageRegistry& registry,
                   Logger log = Logger::null());
  ~TransportSession();

  TransportSession(const TransportSession&) = delete;
  TransportSession& operator=(const TransportSession&) = delete;

  // -------- observers (set before start) --------
  void on_status(StatusObserver fn)   { status_observer_ = std::move(fn); }
  void on_mode_change(ModeObserver fn){ mode_observer_ = std::move(fn); }
  void on_stats(StatsObserver fn)     { stats_observer_ = std::move(fn); }
  void on_raw(RawObserver fn)         { raw_observer_ = std::move(fn); }

  // -------- lifecycle --------
  bool start();
  void stop();
  bool running() const { return running_.load(); }

  /// True once the read loop has exited on its own (auto-reconnect off).
  bool reader_finished() const { return reader_done_.load(); }

  /// Open the transport once. Connecting -> Connected, or Disconnected on failure.
  bool connect();

  /// Close the transport and clear reassembly state.
  void disconnect();

  /**
   * @brief One read from the transport, fed through the active framing.
   *
   * On a read error the transport is closed, Transport is counted and the
   * state becomes Reconnecting (or Disconnected without auto-reconnect).
   */
  PollStatus poll_once(uint64_t now_ms);

  /// Feed raw bytes as if the transport had delivered them.
  void process_bytes(const uint8_t* data, size_t n, uint64_t now_ms);

  // -------- write path --------
  bool send(const nlohmann::json& message);

  /// Send pre-serialized JSON text. Refuses payloads above max_payload.
  bool send_text(const std::string& payload);

  // -------- inspection --------
  ConnectionState state() const { return state_.load(); }
  ProtocolMode mode() const { return mode_.mode(); }
  ProtocolStatistics& statistics() { return stats_; }
  const ProtocolStatistics& statistics() const { return stats_; }
  const FrameAssembler& assembler() const { return assembler_; }
  const SessionOptions& options() const { return opt_; }
  const char* source_name() const { return transport_->name(); }

  static uint64_t steady_now_ms();

private:
  void run_reader();
  void run_statistics();
  void set_state(ConnectionState s);
  void handle_binary(const AssemblerOutput& out, const uint8_t* chunk, size_t n);
  void feed_text(const uint8_t* data, size_t n);
  void notify_status(bool connected, const std::string& detail);

  std::unique_ptr<transport::ITransport> transport_;
  SessionOptions opt_;
  MessageRegistry& registry_;
  Logger log_;

  ProtocolStatistics stats_;
  FrameAssembler assembler_;
  LineSplitter splitter_;
  ProtocolModeController mode_;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  std::atomic<bool> running_{false};
  std::atomic<bool> reader_done_{false};
  CancelToken cancel_;
  std::thread reader_;
  std::thread stats_thread_;

  StatusObserver status_observer_;
  ModeObserver mode_observer_;
  StatsObserver stats_observer_;
  RawObserver raw_observer_;
};

} // namespace unimix
