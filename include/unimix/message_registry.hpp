#pragma once
/**
 * @page um-message-registry unimix Message Registry
 * @file message_registry.hpp
 * @brief O(1) message-type -> handler dispatch that never aborts the read loop.
 *
 * @details
 * PURPOSE
 * -------
 * The read loop hands every parsed message to dispatch(). The registry looks
 * the type up in a hash map and runs the handler synchronously on the caller's
 * thread, so a slow handler slows the reader (there is no queue).
 *
 * FAILURE POLICY
 * --------------
 * dispatch() returns false and logs at debug level, never throws, when:
 *   - no handler is registered for the type     (UnknownMessageType counted)
 *   - the payload does not fit the handler's     (Parse counted)
 *     expected shape (nlohmann::json::exception)
 *   - the handler throws any std::exception      (logged, not counted)
 *   - the handler throws anything else           (logged at warn, not counted)
 *
 * THREADING
 * ---------
 * Register everything before the session starts. dispatch() reads the map
 * without locking.
 *
 * EXAMPLE
 * -------
 * @code
 *   unimix::MessageRegistry reg(&stats, log);
 *   reg.register_typed<unimix::StatusRequest>(unimix::MessageType::GetStatus,
 *       [&](const unimix::StatusRequest& req, const unimix::ParsedMessage& m) {
 *         reply_with_status(req.request_id);
 *       });
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "unimix/log.hpp"
#include "unimix/message_parser.hpp"
#include "unimix/message_types.hpp"

namespace unimix {

class ProtocolStatistics;

class MessageRegistry {
public:
  using Handler = std::function<void(const ParsedMessage&)>;

  explicit MessageRegistry(ProtocolStatistics* stats = nullptr,
                           Logger log = Logger::null());

  /// Install (or replace) the handler for @p type. Invalid is rejected.
  bool register_handler(MessageType type, Handler handler);

  /**
   * @brief Install a handler that receives the payload converted to @p T.
   *
   * The conversion runs inside dispatch(); a payload that does not fit T is a
   * Parse error and the handler is not called.
   */
  template <typename T>
  bool register_typed(MessageType type, std::function<void(const T&, const ParsedMessage&)> fn) {
    if (!fn) return false;
    return register_handler(type, [fn](const ParsedMessage& m) {
      const T value = m.payload.get<T>();
      fn(value, m);
    });
  }

  /// Counters for dispatch failures; the owning session installs its own.
  void set_statistics(ProtocolStatistics* stats) { stats_ = stats; }

  bool unregister(MessageType type);
  bool has_handler(MessageType type) const;
  size_t size() const { return handlers_.size(); }

  /// Look up and run the handler. See FAILURE POLICY.
  bool dispatch(const ParsedMessage& msg);

  /**
   * @brief parse_message() then dispatch(), counting parse failures.
   *
   * Used by the session for both binary payloads (@p frame_type set) and
   * text lines.
   */
  bool dispatch_text(const std::string& text,
                     const std::string& source,
                     std::optional<uint8_t> frame_type = std::nullopt);

private:
  std::unordered_map<MessageType, Handler, MessageTypeHash> handlers_;
  ProtocolStatistics* stats_;
  Logger log_;
};

} // namespace unimix
