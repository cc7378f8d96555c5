// ============================================================================
// config.cpp - implementation for unimix/config.hpp
// ============================================================================

#include "unimix/config.hpp"
#include "unimix/frame_codec.hpp"
#include "unimix/serial_io.hpp"

#include <unistd.h>   // gethostname

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

namespace unimix {

using nlohmann::json;

std::string AppConfig::default_device_id() {
  char buf[256] = {0};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') return buf;
  return "unimix-host";
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool parse_bool(const std::string& s, bool& out) {
  const std::string v = lower(trim(s));
  if (v == "true" || v == "1" || v == "yes" || v == "on")   { out = true;  return true; }
  if (v == "false" || v == "0" || v == "no" || v == "off")  { out = false; return true; }
  return false;
}

// -------- typed field readers --------
// Each returns false (with err) only when the key exists with a bad value.

static bool read_string(const json& sec, const char* key, std::string& out, std::string& err) {
  auto it = sec.find(key);
  if (it == sec.end()) return true;
  if (!it->is_string()) { err = std::string("reason=bad_type key=") + key + " want=string"; return false; }
  out = it->get<std::string>();
  return true;
}

static bool read_bool(const json& sec, const char* key, bool& out, std::string& err) {
  auto it = sec.find(key);
  if (it == sec.end()) return true;
  if (!it->is_boolean()) { err = std::string("reason=bad_type key=") + key + " want=bool"; return false; }
  out = it->get<bool>();
  return true;
}

static bool read_int(const json& sec, const char* key, long long lo, long long hi,
                     long long& out, std::string& err) {
  auto it = sec.find(key);
  if (it == sec.end()) return true;
  if (!it->is_number_integer()) { err = std::string("reason=bad_type key=") + key + " want=integer"; return false; }
  const long long v = it->get<long long>();
  if (v < lo || v > hi) {
    err = std::string("reason=out_of_range key=") + key + " value=" + std::to_string(v);
    return false;
  }
  out = v;
  return true;
}

template <typename T>
static bool read_num(const json& sec, const char* key, long long lo, long long hi,
                     T& out, std::string& err) {
  long long v = (long long)out;
  if (!read_int(sec, key, lo, hi, v, err)) return false;
  out = (T)v;
  return true;
}

static bool section(const json& j, const char* name, const json*& out, std::string& err) {
  out = nullptr;
  auto it = j.find(name);
  if (it == j.end()) return true;
  if (!it->is_object()) { err = std::string("reason=bad_type key=") + name + " want=object"; return false; }
  out = &*it;
  return true;
}

// ---------------------------------------------------------------------------
// apply_config_json()
// -------------------
// Works on a copy so a failed load leaves @p cfg untouched.
// ---------------------------------------------------------------------------
bool apply_config_json(const json& j, AppConfig& cfg, std::string& err) {
  if (!j.is_object()) { err = "reason=bad_type key=<root> want=object"; return false; }
  AppConfig c = cfg;

  if (!read_string(j, "DeviceId", c.device_id, err)) return false;

  const json* s = nullptr;
  if (!section(j, "Serial", s, err)) return false;
  if (s) {
    if (!read_string(*s, "PortName", c.serial.port_name, err)) return false;
    if (!read_num(*s, "BaudRate", 1, INT_MAX, c.serial.baud_rate, err)) return false;
    if (!read_num(*s, "WriteTimeoutMs", 1, 600000, c.serial.write_timeout_ms, err)) return false;
    if (!read_num(*s, "BootDelayMs", 0, 60000, c.serial.boot_delay_ms, err)) return false;
    if (!read_num(*s, "PollIntervalMs", 0, 60000, c.serial.poll_interval_ms, err)) return false;
    if (!read_bool(*s, "EnableAutoReconnect", c.serial.enable_auto_reconnect, err)) return false;
    if (!read_num(*s, "ReconnectDelayMs", 0, 3600000, c.serial.reconnect_delay_ms, err)) return false;
  }

  const json* p = nullptr;
  if (!section(j, "Protocol", p, err)) return false;
  if (p) {
    if (!read_bool(*p, "EnableBinaryProtocol", c.protocol.enable_binary, err)) return false;
    if (!read_num(*p, "MaxPayloadSize", 1, LLONG_MAX, c.protocol.max_payload_size, err)) return false;
    if (!read_num(*p, "FrameTimeoutMs", 0, 600000, c.protocol.frame_timeout_ms, err)) return false;
    if (!read_num(*p, "FallbackThreshold", 1, 1000000, c.protocol.fallback_threshold, err)) return false;
    std::string framing;
    if (!read_string(*p, "TextFraming", framing, err)) return false;
    if (!framing.empty() && !parse_text_framing(framing, c.protocol.text_framing)) {
      err = "reason=bad_value key=TextFraming value=" + framing;
      return false;
    }
  }

  const json* l = nullptr;
  if (!section(j, "Logging", l, err)) return false;
  if (l) {
    if (!read_string(*l, "LogLevel", c.logging.log_level, err)) return false;
    if (!read_string(*l, "LogFilePath", c.logging.log_file_path, err)) return false;
    if (!read_num(*l, "StatisticsIntervalMs", 0, 86400000, c.logging.statistics_interval_ms, err)) return false;
    if (!read_string(*l, "CapturePath", c.logging.capture_path, err)) return false;
  }

  c.protocol.max_payload_size = std::min(c.protocol.max_payload_size, frame::MAX_PAYLOAD_LIMIT);
  if (!validate_config(c, err)) return false;
  cfg = c;
  return true;
}

bool load_config_file(const std::string& path, AppConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "reason=cannot_open path=" + path; return false; }

  json j = json::parse(in, nullptr, /*allow_exceptions*/false, /*ignore_comments*/true);
  if (j.is_discarded()) { err = "reason=invalid_json path=" + path; return false; }
  return apply_config_json(j, cfg, err);
}

bool load_env_file(const std::string& path, std::string& err, bool overwrite) {
  std::ifstream in(path);
  if (!in) { err = "reason=cannot_open path=" + path; return false; }

  std::string line;
  while (std::getline(in, line)) {
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;
    const auto eq = t.find('=');
    if (eq == std::string::npos) continue;

    std::string key = trim(t.substr(0, eq));
    std::string val = trim(t.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    if (key.empty()) continue;
    if (::setenv(key.c_str(), val.c_str(), overwrite ? 1 : 0) != 0) {
      err = "reason=setenv_failed key=" + key;
      return false;
    }
  }
  return true;
}

static const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

bool apply_env_overrides(AppConfig& cfg, std::string& err) {
  AppConfig c = cfg;

  if (const char* v = env("UNIMIX_SERIAL_PORT")) c.serial.port_name = v;
  if (const char* v = env("UNIMIX_DEVICE_ID"))   c.device_id = v;
  if (const char* v = env("UNIMIX_LOG_LEVEL"))   c.logging.log_level = v;

  if (const char* v = env("UNIMIX_BAUD_RATE")) {
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || n <= 0 || n > INT_MAX) {
      err = std::string("reason=bad_value key=UNIMIX_BAUD_RATE value=") + v;
      return false;
    }
    c.serial.baud_rate = (int)n;
  }

  if (const char* v = env("UNIMIX_BINARY_PROTOCOL")) {
    if (!parse_bool(v, c.protocol.enable_binary)) {
      err = std::string("reason=bad_value key=UNIMIX_BINARY_PROTOCOL value=") + v;
      return false;
    }
  }

  if (!validate_config(c, err)) return false;
  cfg = c;
  return true;
}

bool validate_config(const AppConfig& cfg, std::string& err) {
  if (!baud_supported(cfg.serial.baud_rate)) {
    err = "reason=unsupported_baud baud=" + std::to_string(cfg.serial.baud_rate);
    return false;
  }
  if (cfg.protocol.max_payload_size == 0 || cfg.protocol.max_payload_size > frame::MAX_PAYLOAD_LIMIT) {
    err = "reason=out_of_range key=MaxPayloadSize value=" + std::to_string(cfg.protocol.max_payload_size);
    return false;
  }
  if (cfg.protocol.fallback_threshold == 0) {
    err = "reason=out_of_range key=FallbackThreshold value=0";
    return false;
  }
  if (cfg.serial.write_timeout_ms <= 0) {
    err = "reason=out_of_range key=WriteTimeoutMs value=" + std::to_string(cfg.serial.write_timeout_ms);
    return false;
  }
  return true;
}

json config_to_json(const AppConfig& cfg) {
  return json{
    {"DeviceId", cfg.device_id},
    {"Serial", {
      {"PortName", cfg.serial.port_name},
      {"BaudRate", cfg.serial.baud_rate},
      {"WriteTimeoutMs", cfg.serial.write_timeout_ms},
      {"BootDelayMs", cfg.serial.boot_delay_ms},
      {"PollIntervalMs", cfg.serial.poll_interval_ms},
      {"EnableAutoReconnect", cfg.serial.enable_auto_reconnect},
      {"ReconnectDelayMs", cfg.serial.reconnect_delay_ms}
    }},
    {"Protocol", {
      {"EnableBinaryProtocol", cfg.protocol.enable_binary},
      {"MaxPayloadSize", cfg.protocol.max_payload_size},
      {"FrameTimeoutMs", cfg.protocol.frame_timeout_ms},
      {"FallbackThreshold", cfg.protocol.fallback_threshold},
      {"TextFraming", to_string(cfg.protocol.text_framing)}
    }},
    {"Logging", {
      {"LogLevel", cfg.logging.log_level},
      {"LogFilePath", cfg.logging.log_file_path},
      {"StatisticsIntervalMs", cfg.logging.statistics_interval_ms},
      {"CapturePath", cfg.logging.capture_path}
    }}
  };
}

} // namespace unimix
