// ============================================================================
// message_types.cpp - implementation for unimix/message_types.hpp
// ============================================================================

#include "unimix/message_types.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace unimix {

const char* to_string(MessageType t) {
  switch (t) {
    case MessageType::StatusUpdate:  return "StatusUpdate";
    case MessageType::StatusMessage: return "StatusMessage";
    case MessageType::GetStatus:     return "GetStatus";
    case MessageType::GetAssets:     return "GetAssets";
    case MessageType::AssetResponse: return "AssetResponse";
    case MessageType::SessionUpdate: return "SessionUpdate";
    case MessageType::Invalid:       break;
  }
  return "Invalid";
}

const char* legacy_name(MessageType t) {
  switch (t) {
    case MessageType::StatusUpdate:  return "STATUS_UPDATE";
    case MessageType::StatusMessage: return "STATUS_MESSAGE";
    case MessageType::GetStatus:     return "GET_STATUS";
    case MessageType::GetAssets:     return "GET_ASSETS";
    case MessageType::AssetResponse: return "ASSET_RESPONSE";
    case MessageType::SessionUpdate: return "SESSION_UPDATE";
    case MessageType::Invalid:       break;
  }
  return "INVALID";
}

bool message_type_from_int(long long v, MessageType& out) {
  if (v < 1 || v > MESSAGE_TYPE_MAX) return false;
  out = static_cast<MessageType>(v);
  return true;
}

// "Status_Update" -> "statusupdate"
static std::string fold(const std::string& s) {
  std::string r;
  r.reserve(s.size());
  for (unsigned char c : s) {
    if (c == '_' || std::isspace(c)) continue;
    r.push_back((char)std::tolower(c));
  }
  return r;
}

bool message_type_from_string(const std::string& s, MessageType& out) {
  if (s.empty()) return false;

  // numeric string
  errno = 0;
  char* end = nullptr;
  const long long n = std::strtoll(s.c_str(), &end, 10);
  if (errno == 0 && end && end != s.c_str() && *end == '\0')
    return message_type_from_int(n, out);

  const std::string key = fold(s);
  for (int i = 1; i <= MESSAGE_TYPE_MAX; ++i) {
    const MessageType t = static_cast<MessageType>(i);
    if (key == fold(to_string(t))) {
      out = t;
      return true;
    }
  }
  return false;
}

bool message_type_from_json(const nlohmann::json& v, MessageType& out) {
  if (v.is_number_integer()) return message_type_from_int(v.get<long long>(), out);
  if (v.is_string())         return message_type_from_string(v.get<std::string>(), out);
  return false;
}

} // namespace unimix
