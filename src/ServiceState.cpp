#include "service-base/ServiceState.hpp"
#include "service-base/Errors.hpp"
#include <fmt/format.h>

namespace svcbase {

bool is_valid_state(ServiceState state) {
  switch (state) {
  case ServiceState::Init:
  case ServiceState::Starting:
  case ServiceState::Started:
  case ServiceState::Stopping:
  case ServiceState::Stopped:
    return true;
  }
  return false;
}

std::string to_string(ServiceState state) {
  switch (state) {
  case ServiceState::Init:
    return "init";
  case ServiceState::Starting:
    return "starting";
  case ServiceState::Started:
    return "started";
  case ServiceState::Stopping:
    return "stopping";
  case ServiceState::Stopped:
    return "stopped";
  }
  throw InvalidStateError(fmt::format("invalid service state value {}",
                                      static_cast<unsigned>(state)));
}

std::optional<ServiceState> state_from_string(const std::string &name) {
  if (name == "init")
    return ServiceState::Init;
  if (name == "starting")
    return ServiceState::Starting;
  if (name == "started")
    return ServiceState::Started;
  if (name == "stopping")
    return ServiceState::Stopping;
  if (name == "stopped")
    return ServiceState::Stopped;
  return std::nullopt;
}

} // namespace svcbase
