#pragma once
/**
 * @file log.hpp
 * @brief Explicit logger handles for unimix components.
 *
 * @details
 * PURPOSE
 * -------
 * Every component (assembler, registry, session, ...) receives a Logger at
 * construction and keeps its own tagged copy. There is no process-wide logger;
 * the bridge builds one root handle from the config and hands out tagged
 * children with with_tag().
 *
 * FORMAT
 * ------
 *   2026-01-31 12:00:00.123 [WRN] assembler: crc mismatch calc=0x1A2B want=0x0000
 *
 * THREADING
 * ---------
 * Copies share one mutex, so the reader, writer and statistics threads can log
 * through their own handles without interleaving lines on the same sink.
 *
 * A handle with a null sink (Logger::null()) accepts every call and writes
 * nothing; tests use it when output is irrelevant.
 */

#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace unimix {

enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Off };

/// Three-letter label used in log lines ("TRC", "DBG", ...).
const char* level_label(LogLevel lvl);

/// Map a config string ("debug", "Information", "warn", ...) to a level.
/// Unknown strings map to Info.
LogLevel parse_log_level(const std::string& s);

class Logger {
public:
  explicit Logger(std::ostream* sink = nullptr,
                  LogLevel min_level = LogLevel::Info,
                  std::string tag = "unimix");

  static Logger null() { return Logger(nullptr, LogLevel::Off); }

  /// Same sink, level and lock; different component tag.
  Logger with_tag(const std::string& tag) const;

  bool enabled(LogLevel lvl) const {
    return sink_ != nullptr && lvl >= min_level_ && min_level_ != LogLevel::Off;
  }

  void log(LogLevel lvl, const std::string& msg) const;

  void trace(const std::string& msg) const { log(LogLevel::Trace, msg); }
  void debug(const std::string& msg) const { log(LogLevel::Debug, msg); }
  void info (const std::string& msg) const { log(LogLevel::Info,  msg); }
  void warn (const std::string& msg) const { log(LogLevel::Warn,  msg); }
  void error(const std::string& msg) const { log(LogLevel::Error, msg); }

  LogLevel min_level() const { return min_level_; }
  const std::string& tag() const { return tag_; }

private:
  std::ostream* sink_;
  LogLevel min_level_;
  std::string tag_;
  std::shared_ptr<std::mutex> lock_;
};

/// Format a 16-bit value as 0xABCD.
std::string hex16(unsigned v);

/// Format a byte as 0xAB.
std::string hex8(unsigned v);

} // namespace unimix
