// ============================================================================
// message_registry.cpp - implementation for unimix/message_registry.hpp
// ============================================================================

#include "unimix/message_registry.hpp"
#include "unimix/protocol_statistics.hpp"

#include <exception>

namespace unimix {

MessageRegistry::MessageRegistry(ProtocolStatistics* stats, Logger log)
  : stats_(stats), log_(std::move(log)) {}

bool MessageRegistry::register_handler(MessageType type, Handler handler) {
  if (type == MessageType::Invalid || !handler) return false;
  handlers_[type] = std::move(handler);
  log_.debug(std::string("handler registered type=") + to_string(type));
  return true;
}

bool MessageRegistry::unregister(MessageType type) {
  return handlers_.erase(type) > 0;
}

bool MessageRegistry::has_handler(MessageType type) const {
  return handlers_.find(type) != handlers_.end();
}

// ---------------------------------------------------------------------------
// dispatch()
// ----------
// The handler runs on the caller's thread. Shape errors surface as
// nlohmann::json::exception from register_typed's conversion. Nothing a
// handler throws leaves this function; it may run on the reader thread.
// ---------------------------------------------------------------------------
bool MessageRegistry::dispatch(const ParsedMessage& msg) {
  auto it = handlers_.find(msg.type);
  if (it == handlers_.end()) {
    log_.debug(std::string("no handler for ") + to_string(msg.type) + " from " + msg.source);
    if (stats_) stats_->record_error(ErrorKind::UnknownMessageType);
    return false;
  }

  log_.debug(std::string("processing ") + to_string(msg.type) + " from " + msg.source);
  try {
    it->second(msg);
    return true;
  } catch (const nlohmann::json::exception& e) {
    log_.debug(std::string("payload shape error for ") + to_string(msg.type) + ": " + e.what());
    if (stats_) stats_->record_error(ErrorKind::Parse);
  } catch (const std::exception& e) {
    log_.debug(std::string("handler for ") + to_string(msg.type) + " threw: " + e.what());
  } catch (...) {
    log_.warn(std::string("handler for ") + to_string(msg.type) + " threw a non-standard exception");
  }
  return false;
}

bool MessageRegistry::dispatch_text(const std::string& text,
                                    const std::string& source,
                                    std::optional<uint8_t> frame_type) {
  ParseResult r = parse_message(text, source, frame_type);
  if (!r.ok()) {
    log_.debug(std::string("dropped message from ") + source + " reason=" +
               to_string(r.error) + " " + r.detail);
    if (stats_) stats_->record_error(r.error);
    return false;
  }
  return dispatch(r.message);
}

} // namespace unimix
