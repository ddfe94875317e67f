#include "service-base/ipc/ControlProtocol.hpp"
#include "service-base/Errors.hpp"

namespace svcbase {
namespace ipc {

ControlAction action_from_string(const std::string &action) {
  if (action == "start")
    return ControlAction::Start;
  if (action == "stop")
    return ControlAction::Stop;
  return ControlAction::Unknown;
}

nlohmann::json heartbeat_to_json(const HeartbeatRecord &record) {
  nlohmann::json j =
      record.infos.is_object() ? record.infos : nlohmann::json::object();
  j["sid"] = record.sid;
  j["type"] = kHeartbeatType;
  j["state"] = to_string(record.state);
  return j;
}

std::string serialize_heartbeat(const HeartbeatRecord &record) {
  return heartbeat_to_json(record).dump();
}

nlohmann::json parse_control(const std::string &json_str) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw ProtocolError(std::string("control message is not JSON: ") +
                        e.what());
  }

  if (!j.is_object()) {
    throw ProtocolError("control message is not a JSON object");
  }
  if (!j.contains("sid")) {
    throw ProtocolError("control message has no 'sid'");
  }
  return j;
}

bool is_addressed_to(const nlohmann::json &msg, const std::string &sid) {
  auto it = msg.find("sid");
  return it != msg.end() && it->is_string() &&
         it->get_ref<const std::string &>() == sid;
}

ControlCommand control_from_json(const nlohmann::json &msg) {
  if (!msg.contains("action")) {
    throw ProtocolError("control message has no 'action'");
  }

  ControlCommand cmd;
  const auto &sid = msg.at("sid");
  cmd.sid = sid.is_string() ? sid.get<std::string>() : sid.dump();

  const auto &action = msg.at("action");
  if (action.is_string()) {
    cmd.action_name = action.get<std::string>();
    cmd.action = action_from_string(cmd.action_name);
  } else {
    cmd.action_name = action.dump();
    cmd.action = ControlAction::Unknown;
  }
  return cmd;
}

ControlCommand deserialize_control(const std::string &json_str) {
  return control_from_json(parse_control(json_str));
}

std::string serialize_control(const std::string &sid,
                              const std::string &action) {
  nlohmann::json j;
  j["sid"] = sid;
  j["action"] = action;
  return j.dump();
}

} // namespace ipc
} // namespace svcbase
