#pragma once
/**
 * @file messages.hpp
 * @brief Typed payload models exchanged with the mixer firmware.
 *
 * @details
 * Each model has nlohmann from_json/to_json overloads in the unimix namespace
 * (found by ADL), so handlers can be registered with
 * MessageRegistry::register_typed<T>() and outbound messages can be built as
 * structs and serialized with `nlohmann::json j = msg;`.
 *
 * from_json throws nlohmann::json::exception when a required field is missing
 * or has the wrong type. The registry treats that as a Parse error.
 *
 * Required fields:
 *   SessionInfo    processName
 *   StatusUpdate   deviceId
 *   StatusRequest  deviceId
 *   AssetRequest   deviceId, processName
 * Everything else defaults when absent.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "unimix/message_types.hpp"

namespace unimix {

/// One audio session row inside a status update.
struct SessionInfo {
  std::string process_name;
  int process_id = 0;
  double volume = 0.0;
  bool is_muted = false;
  std::string state;
};

/// Full mixer state pushed by either side.
struct StatusUpdate {
  std::string device_id;
  std::string request_id;
  int64_t timestamp = 0;            ///< unix milliseconds
  std::vector<SessionInfo> sessions;
};

/// "Send me your status."
struct StatusRequest {
  std::string device_id;
  std::string request_id;
};

/// "Send me the icon/metadata for this process."
struct AssetRequest {
  std::string device_id;
  std::string request_id;
  std::string process_name;
};

void to_json(nlohmann::json& j, const SessionInfo& s);
void from_json(const nlohmann::json& j, SessionInfo& s);

void to_json(nlohmann::json& j, const StatusUpdate& s);
void from_json(const nlohmann::json& j, StatusUpdate& s);

void to_json(nlohmann::json& j, const StatusRequest& s);
void from_json(const nlohmann::json& j, StatusRequest& s);

void to_json(nlohmann::json& j, const AssetRequest& s);
void from_json(const nlohmann::json& j, AssetRequest& s);

} // namespace unimix
