#pragma once
#include "service-base/ServiceState.hpp"
#include "service-base/WorkerBody.hpp"
#include "service-base/export.h"
#include <string>

namespace svcbase {

/// Identity used when the configuration does not name one
constexpr const char *kDefaultServiceId = "servicebase";

/// Lifecycle operations the control listener drives
class SERVICE_BASE_API ServiceControl {
public:
  virtual ~ServiceControl() = default;

  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void run() = 0;
  virtual std::string status() const = 0;
};

/// Lifecycle state machine shared by every worker process.
///
/// Owns the worker's identity and its StateCell. Transitions are unchecked
/// apart from the run() guard: a service already `started` never re-enters
/// its worker body.
class SERVICE_BASE_API ServiceBase : public ServiceControl {
public:
  /// `name` tags log lines, `sid` addresses control messages and heartbeats
  ServiceBase(std::string name, std::string sid, WorkerBody &body);

  ServiceBase(const ServiceBase &) = delete;
  ServiceBase &operator=(const ServiceBase &) = delete;

  /// Overwrite the state. Throws InvalidStateError (state unchanged) for a
  /// value outside ServiceState.
  void set_state(ServiceState state);

  /// Same as above for the external representation
  void set_state(const std::string &state);

  /// Enter `starting`, then run(). Returns when run() returns.
  void start() override;

  /// Enter `stopped` regardless of the current state
  void stop() override;

  /// Enter `started` and hand off to the worker body, unless already
  /// `started`, in which case the call is logged and ignored
  void run() override;

  /// External representation of the current state
  std::string status() const override;

  ServiceState state() const { return state_.load(); }
  bool is_started() const { return state() == ServiceState::Started; }

  const std::string &name() const { return name_; }
  const std::string &sid() const { return sid_; }

  /// Read-only view for the heartbeat reporter
  const StateCell &state_cell() const { return state_; }

private:
  const std::string name_;
  const std::string sid_;
  WorkerBody &body_;
  StateCell state_;
};

} // namespace svcbase
