#pragma once
#include "service-base/ipc/Channels.hpp"
#include <string>
#include <zmq.hpp>

namespace svcbase {
namespace ipc {

/// REQ socket connected to the monitor's heartbeat REP socket
class SERVICE_BASE_API ZmqHeartbeatChannel : public HeartbeatChannel {
public:
  ZmqHeartbeatChannel(zmq::context_t &context, const std::string &endpoint);

  std::string request(const std::string &payload) override;

  /// Shuts the shared context down; every socket on it unblocks with ETERM
  void interrupt() override;

  const std::string &endpoint() const { return endpoint_; }

private:
  zmq::context_t &context_;
  zmq::socket_t socket_;
  std::string endpoint_;
};

/// SUB socket connected to the monitor's control PUB socket, subscribed to
/// every topic. Filtering by sid happens in ControlListener.
class SERVICE_BASE_API ZmqControlChannel : public ControlChannel {
public:
  ZmqControlChannel(zmq::context_t &context, const std::string &endpoint);

  std::string receive() override;

  void interrupt() override;

  const std::string &endpoint() const { return endpoint_; }

private:
  zmq::context_t &context_;
  zmq::socket_t socket_;
  std::string endpoint_;
};

} // namespace ipc
} // namespace svcbase
