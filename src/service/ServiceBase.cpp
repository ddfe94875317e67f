#include "service-base/service/ServiceBase.hpp"
#include "service-base/Errors.hpp"
#include "service-base/Logger.hpp"

namespace svcbase {

ServiceBase::ServiceBase(std::string name, std::string sid, WorkerBody &body)
    : name_(std::move(name)), sid_(std::move(sid)), body_(body) {}

void ServiceBase::set_state(ServiceState state) {
  if (!is_valid_state(state)) {
    SVC_LOG_ERROR(name_, "STATE",
                  "invalid server state {}, need in ServiceState",
                  static_cast<unsigned>(state));
    throw InvalidStateError("invalid server state, need in ServiceState");
  }
  state_.store(state);
  SVC_LOG_INFO(name_, "STATE", "set server state to {}", to_string(state));
}

void ServiceBase::set_state(const std::string &state) {
  auto parsed = state_from_string(state);
  if (!parsed) {
    SVC_LOG_ERROR(name_, "STATE",
                  "invalid server state '{}', need in ServiceState", state);
    throw InvalidStateError("invalid server state '" + state +
                            "', need in ServiceState");
  }
  set_state(*parsed);
}

void ServiceBase::start() {
  set_state(ServiceState::Starting);
  SVC_LOG_INFO(name_, "LIFECYCLE", "service starting");
  run();
}

void ServiceBase::stop() {
  set_state(ServiceState::Stopped);
  SVC_LOG_INFO(name_, "LIFECYCLE", "service stopped");
}

std::string ServiceBase::status() const { return to_string(state_.load()); }

void ServiceBase::run() {
  // Check-and-set in one step so concurrent callers cannot both enter
  ServiceState previous = state_.exchange(ServiceState::Started);
  if (previous == ServiceState::Started) {
    SVC_LOG_ERROR(name_, "LIFECYCLE",
                  "tried to run service, but state is already started");
    return;
  }
  SVC_LOG_INFO(name_, "STATE", "set server state to {} (was {})",
               to_string(ServiceState::Started), to_string(previous));

  body_.run();
}

} // namespace svcbase
