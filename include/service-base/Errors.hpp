#pragma once
#include <stdexcept>
#include <string>

namespace svcbase {

/// Base of every error raised by the service core
class ServiceError : public std::runtime_error {
public:
  explicit ServiceError(const std::string &what) : std::runtime_error(what) {}
};

/// A state value outside ServiceState. Signals a programming bug.
class InvalidStateError : public ServiceError {
public:
  explicit InvalidStateError(const std::string &what) : ServiceError(what) {}
};

/// Send/receive failure on the heartbeat or control channel
class TransportError : public ServiceError {
public:
  explicit TransportError(const std::string &what) : ServiceError(what) {}
};

/// Malformed heartbeat or control payload
class ProtocolError : public ServiceError {
public:
  explicit ProtocolError(const std::string &what) : ServiceError(what) {}
};

/// Unreadable or invalid service configuration
class ConfigError : public ServiceError {
public:
  explicit ConfigError(const std::string &what) : ServiceError(what) {}
};

} // namespace svcbase
