#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the framing, parsing and transport layers.
 *
 * Frame and message level errors are always recovered locally: counted in
 * ProtocolStatistics, logged, and followed by a resync. Only Transport errors
 * leave the read loop's normal path (they drive reconnect).
 */

#include <cstdint>

namespace unimix {

enum class ErrorKind : uint8_t {
  None = 0,
  Framing,             ///< bad start/end marker, length mismatch, noise before START
  Crc,                 ///< checksum mismatch
  EscapeSequence,      ///< dangling ESCAPE right before END
  BufferOverflow,      ///< declared or unterminated frame larger than allowed
  Timeout,             ///< partial frame older than the frame timeout
  Parse,               ///< payload is not valid JSON or has the wrong shape
  UnknownMessageType,  ///< no messageType, unresolvable type, or no handler
  Transport            ///< I/O failure on the underlying connection
};

inline const char* to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::None:               return "none";
    case ErrorKind::Framing:            return "framing";
    case ErrorKind::Crc:                return "crc";
    case ErrorKind::EscapeSequence:     return "escape_sequence";
    case ErrorKind::BufferOverflow:     return "buffer_overflow";
    case ErrorKind::Timeout:            return "timeout";
    case ErrorKind::Parse:              return "parse";
    case ErrorKind::UnknownMessageType: return "unknown_message_type";
    case ErrorKind::Transport:          return "transport";
  }
  return "unknown";
}

} // namespace unimix
