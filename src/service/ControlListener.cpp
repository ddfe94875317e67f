#include "service-base/service/ControlListener.hpp"
#include "service-base/Logger.hpp"

namespace svcbase {

ControlListener::ControlListener(std::string name, std::string sid,
                                 ServiceControl &service,
                                 ipc::ControlChannel &channel)
    : name_(std::move(name)), sid_(std::move(sid)), service_(service),
      channel_(channel) {}

void ControlListener::poll_once() { handle_message(channel_.receive()); }

void ControlListener::handle_message(const std::string &payload) {
  nlohmann::json msg = ipc::parse_control(payload);
  if (!ipc::is_addressed_to(msg, sid_)) {
    return;
  }

  ipc::ControlCommand cmd = ipc::control_from_json(msg);

  switch (cmd.action) {
  case ipc::ControlAction::Stop:
    SVC_LOG_INFO(name_, "CONTROL", "Remote stop received");
    commands_applied_++;
    service_.stop();
    break;
  case ipc::ControlAction::Start:
    SVC_LOG_INFO(name_, "CONTROL", "Remote start received");
    commands_applied_++;
    service_.run();
    break;
  case ipc::ControlAction::Unknown:
    SVC_LOG_DEBUG(name_, "CONTROL", "Ignoring unknown action '{}'",
                  cmd.action_name);
    break;
  }
}

void ControlListener::run_loop() {
  SVC_LOG_INFO(name_, "CONTROL", "Control loop started (sid={})", sid_);

  while (!stop_requested_) {
    poll_once();
  }

  SVC_LOG_INFO(name_, "CONTROL", "Control loop exited");
}

} // namespace svcbase
