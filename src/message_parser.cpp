// ============================================================================
// message_parser.cpp - implementation for unimix/message_parser.hpp
// ============================================================================

#include "unimix/message_parser.hpp"

namespace unimix {

ParseResult parse_message(const std::string& text,
                          const std::string& source,
                          std::optional<uint8_t> frame_type) {
  ParseResult r;
  r.message.source = source;

  nlohmann::json doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions*/false);
  if (doc.is_discarded()) {
    r.error = ErrorKind::Parse;
    r.detail = "invalid json (" + std::to_string(text.size()) + " bytes)";
    return r;
  }
  if (!doc.is_object()) {
    r.error = ErrorKind::Parse;
    r.detail = std::string("expected object, got ") + doc.type_name();
    return r;
  }

  auto it = doc.find("messageType");
  if (it != doc.end()) {
    if (!message_type_from_json(*it, r.message.type)) {
      r.error = ErrorKind::UnknownMessageType;
      r.detail = "unresolvable messageType " + it->dump();
      return r;
    }
  } else if (frame_type) {
    if (!message_type_from_int(*frame_type, r.message.type)) {
      r.error = ErrorKind::UnknownMessageType;
      r.detail = "no messageType and frame type " + std::to_string(*frame_type) + " is not a message type";
      return r;
    }
  } else {
    r.error = ErrorKind::UnknownMessageType;
    r.detail = "no messageType";
    return r;
  }

  r.message.payload = std::move(doc);
  return r;
}

} // namespace unimix
