// ============================================================================
// messages.cpp - implementation for unimix/messages.hpp
// ============================================================================

#include "unimix/messages.hpp"

namespace unimix {

using nlohmann::json;

// -------- SessionInfo --------

void to_json(json& j, const SessionInfo& s) {
  j = json{
    {"processName", s.process_name},
    {"processId",   s.process_id},
    {"volume",      s.volume},
    {"isMuted",     s.is_muted},
    {"state",       s.state}
  };
}

void from_json(const json& j, SessionInfo& s) {
  j.at("processName").get_to(s.process_name);
  s.process_id = j.value("processId", 0);
  s.volume     = j.value("volume", 0.0);
  s.is_muted   = j.value("isMuted", false);
  s.state      = j.value("state", std::string());
}

// -------- StatusUpdate --------

void to_json(json& j, const StatusUpdate& s) {
  j = json{
    {"messageType", static_cast<int>(MessageType::StatusUpdate)},
    {"deviceId",    s.device_id},
    {"requestId",   s.request_id},
    {"timestamp",   s.timestamp},
    {"sessions",    s.sessions}
  };
}

void from_json(const json& j, StatusUpdate& s) {
  j.at("deviceId").get_to(s.device_id);
  s.request_id = j.value("requestId", std::string());
  s.timestamp  = j.value("timestamp", (int64_t)0);
  s.sessions.clear();
  if (j.contains("sessions")) j.at("sessions").get_to(s.sessions);
}

// -------- StatusRequest --------

void to_json(json& j, const StatusRequest& s) {
  j = json{
    {"messageType", static_cast<int>(MessageType::GetStatus)},
    {"deviceId",    s.device_id},
    {"requestId",   s.request_id}
  };
}

void from_json(const json& j, StatusRequest& s) {
  j.at("deviceId").get_to(s.device_id);
  s.request_id = j.value("requestId", std::string());
}

// -------- AssetRequest --------

void to_json(json& j, const AssetRequest& s) {
  j = json{
    {"messageType", static_cast<int>(MessageType::GetAssets)},
    {"deviceId",    s.device_id},
    {"requestId",   s.request_id},
    {"processName", s.process_name}
  };
}

void from_json(const json& j, AssetRequest& s) {
  j.at("deviceId").get_to(s.device_id);
  j.at("processName").get_to(s.process_name);
  s.request_id = j.value("requestId", std::string());
}

} // namespace unimix
