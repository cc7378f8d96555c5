/**
 * @file main.cpp
 * @brief unimix-bridge - long-running serial bridge between the mixer firmware and the host.
 *
 * Responsibilities:
 *  - Build the effective AppConfig (defaults < --config < .env < UNIMIX_* env < flags).
 *  - Open the serial port through TransportSession and keep it open (reconnect with fixed delay).
 *  - Dispatch incoming messages to typed handlers; each dispatched message becomes one
 *    JSON event line on stdout: {"event":"message","type":"StatusUpdate","source":"Serial","payload":{...}}
 *  - Answer GetStatus with a StatusUpdate carrying this host's device id.
 *  - Log to stderr (or Logging.LogFilePath) and log statistics every StatisticsIntervalMs.
 *  - Optional: --send <json> once per connect, --capture <file> for raw inbound bytes.
 *
 * Exit codes: 0 clean shutdown, 1 link gave up (auto-reconnect off), 2 bad configuration.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "unimix/config.hpp"
#include "unimix/frame_debug.hpp"
#include "unimix/log.hpp"
#include "unimix/message_registry.hpp"
#include "unimix/messages.hpp"
#include "unimix/transport/transport_linux_serial.hpp"
#include "unimix/transport_session.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

// One JSON object per line on stdout; the reader thread and main both write.
static std::mutex g_out_mu;
static void emit(const json& j) {
  std::lock_guard<std::mutex> lk(g_out_mu);
  std::cout << j.dump() << "\n" << std::flush;
}

static int64_t unix_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int main(int argc, char** argv) {
  CLI::App app{"unimix serial bridge"};

  std::string config_path, env_path, port, log_level, framing, device_id, send_json, capture_path;
  int baud = 0;
  uint32_t stats_interval = 0;
  bool text_only = false, no_reconnect = false, print_config = false;

  app.add_option("--config", config_path, "JSON configuration file");
  app.add_option("--env-file", env_path, "KEY=value file loaded into the environment (default: ./.env if present)");
  auto* opt_port  = app.add_option("--port", port, "Serial device (e.g. /dev/serial/by-id/...)");
  auto* opt_baud  = app.add_option("--baud", baud, "Baud rate");
  auto* opt_level = app.add_option("--log-level", log_level, "trace|debug|info|warn|error|off");
  auto* opt_fr    = app.add_option("--framing", framing, "Text framing: newline|markers")
                        ->check(CLI::IsMember({"newline", "markers"}, CLI::ignore_case));
  auto* opt_dev   = app.add_option("--device-id", device_id, "Device id reported in status replies");
  auto* opt_stats = app.add_option("--stats-interval", stats_interval, "Statistics log interval in ms (0 = off)");
  app.add_flag("--text", text_only, "Disable the binary protocol; speak line-delimited JSON only");
  app.add_flag("--no-reconnect", no_reconnect, "Exit instead of reconnecting when the link fails");
  app.add_option("--send", send_json, "JSON message to send after every (re)connect");
  app.add_option("--capture", capture_path, "Append raw inbound bytes as hex lines to this file");
  app.add_flag("--print-config", print_config, "Print the effective configuration and exit");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration --------
  unimix::AppConfig cfg;
  std::string err;

  if (!config_path.empty() && !unimix::load_config_file(config_path, cfg, err)) {
    std::cerr << "status=error " << err << "\n";
    return 2;
  }

  if (!env_path.empty()) {
    if (!unimix::load_env_file(env_path, err)) {
      std::cerr << "status=error " << err << "\n";
      return 2;
    }
  } else {
    std::error_code ec;
    if (fs::exists(".env", ec) && !unimix::load_env_file(".env", err)) {
      std::cerr << "status=error " << err << "\n";
      return 2;
    }
  }

  if (!unimix::apply_env_overrides(cfg, err)) {
    std::cerr << "status=error " << err << "\n";
    return 2;
  }

  if (opt_port->count())  cfg.serial.port_name = port;
  if (opt_baud->count())  cfg.serial.baud_rate = baud;
  if (opt_level->count()) cfg.logging.log_level = log_level;
  if (opt_dev->count())   cfg.device_id = device_id;
  if (opt_stats->count()) cfg.logging.statistics_interval_ms = stats_interval;
  if (opt_fr->count() && !unimix::parse_text_framing(framing, cfg.protocol.text_framing)) {
    std::cerr << "status=error reason=bad_value key=--framing value=" << framing << "\n";
    return 2;
  }
  if (text_only)    cfg.protocol.enable_binary = false;
  if (no_reconnect) cfg.serial.enable_auto_reconnect = false;
  if (!capture_path.empty()) cfg.logging.capture_path = capture_path;

  if (!unimix::validate_config(cfg, err)) {
    std::cerr << "status=error " << err << "\n";
    return 2;
  }

  if (print_config) {
    std::cout << unimix::config_to_json(cfg).dump(2) << "\n";
    return 0;
  }

  json send_doc;
  if (!send_json.empty()) {
    send_doc = json::parse(send_json, nullptr, /*allow_exceptions*/false);
    if (send_doc.is_discarded() || !send_doc.is_object()) {
      std::cerr << "status=error reason=invalid_json key=--send\n";
      return 2;
    }
  }

  // -------- logging --------
  std::ofstream log_file;
  std::ostream* log_sink = &std::cerr;
  if (!cfg.logging.log_file_path.empty()) {
    std::error_code ec;
    const fs::path lp(cfg.logging.log_file_path);
    if (lp.has_parent_path()) fs::create_directories(lp.parent_path(), ec);
    log_file.open(lp, std::ios::app);
    if (!log_file) {
      std::cerr << "status=error reason=cannot_open_log path=" << lp.string() << "\n";
      return 2;
    }
    log_sink = &log_file;
  }
  unimix::Logger root(log_sink, cfg.logging.level(), "bridge");

  std::ofstream capture;
  if (!cfg.logging.capture_path.empty()) {
    capture.open(cfg.logging.capture_path, std::ios::app);
    if (!capture) {
      std::cerr << "status=error reason=cannot_open_capture path=" << cfg.logging.capture_path << "\n";
      return 2;
    }
  }

  // -------- handlers --------
  unimix::MessageRegistry registry(nullptr, root.with_tag("registry"));
  unimix::TransportSession* session_ptr = nullptr;

  auto emit_message = [](const unimix::ParsedMessage& m) {
    emit(json{{"event", "message"},
              {"type", unimix::to_string(m.type)},
              {"source", m.source},
              {"payload", m.payload}});
  };

  bool registered = true;

  registered &= registry.register_typed<unimix::StatusUpdate>(unimix::MessageType::StatusUpdate,
    [&](const unimix::StatusUpdate& u, const unimix::ParsedMessage& m) {
      root.debug("status update device=" + u.device_id + " sessions=" + std::to_string(u.sessions.size()));
      emit_message(m);
    });

  registered &= registry.register_handler(unimix::MessageType::StatusMessage, emit_message);

  registered &= registry.register_typed<unimix::StatusRequest>(unimix::MessageType::GetStatus,
    [&](const unimix::StatusRequest& req, const unimix::ParsedMessage& m) {
      emit_message(m);
      unimix::StatusUpdate reply;
      reply.device_id  = cfg.device_id;
      reply.request_id = req.request_id;
      reply.timestamp  = unix_ms();
      if (session_ptr && !session_ptr->send(json(reply)))
        root.warn("status reply not sent request=" + req.request_id);
    });

  registered &= registry.register_typed<unimix::AssetRequest>(unimix::MessageType::GetAssets,
    [&](const unimix::AssetRequest& req, const unimix::ParsedMessage& m) {
      root.debug("asset request process=" + req.process_name);
      emit_message(m);
    });

  if (!registered) {
    std::cerr << "status=error reason=handler_registration\n";
    return 2;
  }

  // -------- session --------
  unimix::transport::SerialConfig sc;
  sc.path             = cfg.serial.port_name;
  sc.baud             = cfg.serial.baud_rate;
  sc.poll_ms          = cfg.serial.poll_interval_ms > 0 ? cfg.serial.poll_interval_ms : 1;
  sc.write_timeout_ms = cfg.serial.write_timeout_ms;
  sc.boot_delay_ms    = cfg.serial.boot_delay_ms;

  unimix::TransportSession session(std::make_unique<unimix::transport::LinuxSerial>(sc),
                                   unimix::SessionOptions::from_config(cfg),
                                   registry,
                                   root.with_tag("session"));
  session_ptr = &session;

  session.on_status([&](bool connected, const std::string& detail) {
    emit(json{{"event", "status"}, {"connected", connected}, {"detail", detail}});
    if (connected && !send_doc.is_null() && !session.send(send_doc))
      root.warn("initial message not sent");
  });
  session.on_mode_change([](unimix::ProtocolMode from, unimix::ProtocolMode to) {
    emit(json{{"event", "mode"}, {"from", unimix::to_string(from)}, {"to", unimix::to_string(to)}});
  });
  if (capture.is_open()) {
    session.on_raw([&capture](const uint8_t* data, size_t n) {
      capture << "RX " << unimix::to_hex(data, n) << "\n";
      capture.flush();
    });
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  root.info("starting port=" + cfg.serial.port_name + " baud=" + std::to_string(cfg.serial.baud_rate) +
            " binary=" + (cfg.protocol.enable_binary ? "on" : "off") +
            " device=" + cfg.device_id);
  session.start();

  while (!g_stop.load() && !session.reader_finished())
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const bool gave_up = session.reader_finished() && !g_stop.load();
  session.stop();
  session_ptr = nullptr;

  if (gave_up) {
    std::cerr << "status=error reason=link_down port=" << cfg.serial.port_name << "\n";
    return 1;
  }
  return 0;
}
