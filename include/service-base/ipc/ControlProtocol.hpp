#pragma once
#include "service-base/ServiceState.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace svcbase {
namespace ipc {

/// Value of the "type" field of every heartbeat
constexpr const char *kHeartbeatType = "heartbeat";

/// Liveness report sent to the monitor once per cycle
struct HeartbeatRecord {
  std::string sid;
  ServiceState state{ServiceState::Init};
  nlohmann::json infos = nlohmann::json::object(); // caller-supplied fields
};

/// Action requested by the monitor
enum class ControlAction { Start, Stop, Unknown };

/// Addressed start/stop instruction from the monitor
struct ControlCommand {
  std::string sid;
  ControlAction action{ControlAction::Unknown};
  std::string action_name; // as received, kept for logging
};

/// Build the heartbeat JSON object. sid/type/state override any caller
/// field with the same key.
nlohmann::json heartbeat_to_json(const HeartbeatRecord &record);

/// Serialize a heartbeat to its wire string
std::string serialize_heartbeat(const HeartbeatRecord &record);

/// Parse a control payload. Throws ProtocolError if it is not a JSON object
/// or has no "sid" field.
nlohmann::json parse_control(const std::string &json_str);

/// True only when "sid" is a string equal to sid
bool is_addressed_to(const nlohmann::json &msg, const std::string &sid);

/// Extract the command from a parsed message. Throws ProtocolError if
/// "action" is missing; a non-string action maps to Unknown.
ControlCommand control_from_json(const nlohmann::json &msg);

/// parse_control followed by control_from_json
ControlCommand deserialize_control(const std::string &json_str);

/// Serialize a control command (used by monitors and tests)
std::string serialize_control(const std::string &sid,
                              const std::string &action);

ControlAction action_from_string(const std::string &action);

} // namespace ipc
} // namespace svcbase
