#pragma once
/**
 * @file message_types.hpp
 * @brief Message type identifiers and their name/number resolution.
 *
 * @details
 * The firmware sends `messageType` as a number (preferred). Older firmware
 * sends a string, either the upper-snake constant ("STATUS_UPDATE") or the
 * camel name ("StatusUpdate"). All forms, plus numeric strings ("3"), resolve
 * to the same enum. Comparison ignores case and underscores.
 *
 * Invalid (0) is never a dispatchable type.
 */

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

namespace unimix {

enum class MessageType : uint8_t {
  Invalid       = 0,
  StatusUpdate  = 1,
  StatusMessage = 2,
  GetStatus     = 3,
  GetAssets     = 4,
  AssetResponse = 5,
  SessionUpdate = 6
};

static constexpr int MESSAGE_TYPE_MAX = 6;

/// Camel name ("StatusUpdate"); "Invalid" for 0 and out-of-range values.
const char* to_string(MessageType t);

/// Upper-snake name ("STATUS_UPDATE") used by legacy firmware.
const char* legacy_name(MessageType t);

/// Resolve a number in [1, MESSAGE_TYPE_MAX].
bool message_type_from_int(long long v, MessageType& out);

/// Resolve a name or numeric string. Case and underscores are ignored.
bool message_type_from_string(const std::string& s, MessageType& out);

/// Resolve a JSON `messageType` value (number or string).
bool message_type_from_json(const nlohmann::json& v, MessageType& out);

struct MessageTypeHash {
  size_t operator()(MessageType t) const { return static_cast<size_t>(t); }
};

} // namespace unimix
