#pragma once
/**
 * @page um-config unimix Configuration
 * @file config.hpp
 * @brief AppConfig: defaults, JSON file, .env file, environment overrides.
 *
 * @details
 * PRECEDENCE (lowest to highest)
 * ------------------------------
 *   1) built-in defaults (the struct initializers below)
 *   2) JSON file passed with --config
 *   3) .env file (KEY=value lines, loaded into the environment without
 *      replacing variables that are already set)
 *   4) environment: UNIMIX_SERIAL_PORT, UNIMIX_BAUD_RATE, UNIMIX_LOG_LEVEL,
 *      UNIMIX_BINARY_PROTOCOL, UNIMIX_DEVICE_ID
 *   5) command-line flags (applied by the executables)
 *
 * JSON SHAPE
 * ----------
 * @code
 *   {
 *     "DeviceId": "desk-pc",
 *     "Serial":   { "PortName": "/dev/ttyUSB0", "BaudRate": 115200,
 *                   "WriteTimeoutMs": 1000, "BootDelayMs": 400,
 *                   "PollIntervalMs": 10, "EnableAutoReconnect": true,
 *                   "ReconnectDelayMs": 5000 },
 *     "Protocol": { "EnableBinaryProtocol": true, "MaxPayloadSize": 4096,
 *                   "FrameTimeoutMs": 1000, "FallbackThreshold": 3,
 *                   "TextFraming": "newline" },
 *     "Logging":  { "LogLevel": "Information", "LogFilePath": "",
 *                   "StatisticsIntervalMs": 30000, "CapturePath": "" }
 *   }
 * @endcode
 * Unknown keys are ignored. A known key with the wrong JSON type, or a value
 * out of range, rejects the whole load with a message in `err`.
 * MaxPayloadSize above 4096 is clamped to 4096.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

#include "unimix/line_splitter.hpp"
#include "unimix/log.hpp"

namespace unimix {

struct SerialSettings {
  std::string port_name = "/dev/ttyUSB0";
  int baud_rate = 115200;
  int write_timeout_ms = 1000;
  int boot_delay_ms = 400;
  int poll_interval_ms = 10;
  bool enable_auto_reconnect = true;
  int reconnect_delay_ms = 5000;
};

struct ProtocolSettings {
  bool enable_binary = true;
  size_t max_payload_size = 4096;
  uint32_t frame_timeout_ms = 1000;
  uint32_t fallback_threshold = 3;
  TextFraming text_framing = TextFraming::Newline;
};

struct LoggingSettings {
  std::string log_level = "Information";
  std::string log_file_path;            ///< empty: stderr
  uint32_t statistics_interval_ms = 30000;  ///< 0 disables the statistics task
  std::string capture_path;             ///< empty: no raw capture

  LogLevel level() const { return parse_log_level(log_level); }
};

struct AppConfig {
  std::string device_id = default_device_id();
  SerialSettings serial;
  ProtocolSettings protocol;
  LoggingSettings logging;

  /// Host name, or "unimix-host" when it cannot be read.
  static std::string default_device_id();
};

/// Overlay the keys present in @p j onto @p cfg.
bool apply_config_json(const nlohmann::json& j, AppConfig& cfg, std::string& err);

/// Read and apply a JSON config file.
bool load_config_file(const std::string& path, AppConfig& cfg, std::string& err);

/**
 * @brief Load KEY=value lines into the process environment.
 *
 * Blank lines and lines starting with '#' are skipped; surrounding double or
 * single quotes are removed. Existing variables win unless @p overwrite.
 * @return false when the file cannot be read (a missing .env is the caller's call).
 */
bool load_env_file(const std::string& path, std::string& err, bool overwrite = false);

/// Apply UNIMIX_* environment variables.
bool apply_env_overrides(AppConfig& cfg, std::string& err);

/// Range checks shared by every source.
bool validate_config(const AppConfig& cfg, std::string& err);

/// Effective configuration in the same shape as the file (--print-config).
nlohmann::json config_to_json(const AppConfig& cfg);

/// "true/false/1/0/yes/no/on/off", case-insensitive.
bool parse_bool(const std::string& s, bool& out);

} // namespace unimix
