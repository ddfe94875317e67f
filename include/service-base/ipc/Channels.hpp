#pragma once
#include "service-base/export.h"
#include <string>

namespace svcbase {
namespace ipc {

/// Default monitor endpoints
constexpr const char *kDefaultHeartbeatEndpoint = "tcp://localhost:8810";
constexpr const char *kDefaultControlEndpoint = "tcp://localhost:8820";

/// Point-to-point request/acknowledge channel to the monitor
class SERVICE_BASE_API HeartbeatChannel {
public:
  virtual ~HeartbeatChannel() = default;

  /// Send one request and block until exactly one reply arrives.
  /// Throws TransportError on failure.
  virtual std::string request(const std::string &payload) = 0;

  /// Make a blocked request() return with TransportError (shutdown only)
  virtual void interrupt() = 0;
};

/// Broadcast channel the monitor publishes control messages on
class SERVICE_BASE_API ControlChannel {
public:
  virtual ~ControlChannel() = default;

  /// Block until one message arrives. Throws TransportError on failure.
  virtual std::string receive() = 0;

  /// Make a blocked receive() return with TransportError (shutdown only)
  virtual void interrupt() = 0;
};

} // namespace ipc
} // namespace svcbase
