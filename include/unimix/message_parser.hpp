#pragma once
/**
 * @file message_parser.hpp
 * @brief Turn one JSON text (frame payload or text line) into a ParsedMessage.
 *
 * @details
 * Steps:
 *   1) parse JSON (no exceptions; nlohmann's non-throwing parse)   -> Parse
 *   2) require an object                                            -> Parse
 *   3) resolve `messageType` (number, numeric string, or name)      -> UnknownMessageType
 *      When the field is absent and the text came from a binary
 *      frame, the frame's type byte is used instead.
 *
 * A failed parse never throws; the ParseResult carries the ErrorKind and a
 * short human-readable detail for the debug log.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

#include "unimix/errors.hpp"
#include "unimix/message_types.hpp"

namespace unimix {

struct ParsedMessage {
  MessageType type = MessageType::Invalid;
  nlohmann::json payload;   ///< the whole JSON object, messageType included
  std::string source;       ///< transport identity, e.g. "Serial"
};

struct ParseResult {
  ErrorKind error = ErrorKind::None;
  ParsedMessage message;
  std::string detail;

  bool ok() const { return error == ErrorKind::None; }
};

ParseResult parse_message(const std::string& text,
                          const std::string& source,
                          std::optional<uint8_t> frame_type = std::nullopt);

} // namespace unimix
