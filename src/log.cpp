// ============================================================================
// log.cpp - implementation for unimix/log.hpp
// ============================================================================

#include "unimix/log.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace unimix {

const char* level_label(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Trace: return "TRC";
    case LogLevel::Debug: return "DBG";
    case LogLevel::Info:  return "INF";
    case LogLevel::Warn:  return "WRN";
    case LogLevel::Error: return "ERR";
    case LogLevel::Off:   return "OFF";
  }
  return "???";
}

LogLevel parse_log_level(const std::string& s) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) v.push_back((char)std::tolower((unsigned char)c));

  if (v == "trace" || v == "verbose")                 return LogLevel::Trace;
  if (v == "debug")                                   return LogLevel::Debug;
  if (v == "info" || v == "information")              return LogLevel::Info;
  if (v == "warn" || v == "warning")                  return LogLevel::Warn;
  if (v == "error" || v == "fatal")                   return LogLevel::Error;
  if (v == "off" || v == "none")                      return LogLevel::Off;
  return LogLevel::Info;
}

Logger::Logger(std::ostream* sink, LogLevel min_level, std::string tag)
  : sink_(sink),
    min_level_(min_level),
    tag_(std::move(tag)),
    lock_(std::make_shared<std::mutex>()) {}

Logger Logger::with_tag(const std::string& tag) const {
  Logger child(*this);
  child.tag_ = tag;
  return child;
}

// -----------------------------------------------------------------------------
// log() - one line per call, timestamped with local wall-clock time.
// The stream is flushed per line so a crash never hides the last message.
// -----------------------------------------------------------------------------
void Logger::log(LogLevel lvl, const std::string& msg) const {
  if (!enabled(lvl)) return;

  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t secs = system_clock::to_time_t(now);
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm_local{};
  localtime_r(&secs, &tm_local);

  std::lock_guard<std::mutex> guard(*lock_);
  (*sink_) << std::put_time(&tm_local, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
           << " [" << level_label(lvl) << "] "
           << tag_ << ": " << msg << '\n';
  sink_->flush();
}

std::string hex16(unsigned v) {
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << (v & 0xFFFFu);
  return os.str();
}

std::string hex8(unsigned v) {
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << (v & 0xFFu);
  return os.str();
}

} // namespace unimix
