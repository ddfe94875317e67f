#include "service-base/ipc/ZmqChannels.hpp"
#include "service-base/Errors.hpp"
#include "service-base/Logger.hpp"

namespace svcbase {
namespace ipc {

ZmqHeartbeatChannel::ZmqHeartbeatChannel(zmq::context_t &context,
                                         const std::string &endpoint)
    : context_(context), socket_(context, zmq::socket_type::req),
      endpoint_(endpoint) {
  try {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.connect(endpoint_);
  } catch (const zmq::error_t &e) {
    throw TransportError("heartbeat connect to " + endpoint_ +
                         " failed: " + e.what());
  }
  SVC_LOG_DEBUG("IPC", "HEARTBEAT", "REQ connected to {}", endpoint_);
}

std::string ZmqHeartbeatChannel::request(const std::string &payload) {
  try {
    if (!socket_.send(zmq::buffer(payload), zmq::send_flags::none)) {
      throw TransportError("heartbeat send to " + endpoint_ + " failed");
    }

    zmq::message_t reply;
    if (!socket_.recv(reply, zmq::recv_flags::none)) {
      throw TransportError("heartbeat receive from " + endpoint_ + " failed");
    }
    return reply.to_string();
  } catch (const zmq::error_t &e) {
    throw TransportError("heartbeat exchange with " + endpoint_ +
                         " failed: " + e.what());
  }
}

void ZmqHeartbeatChannel::interrupt() { context_.shutdown(); }

ZmqControlChannel::ZmqControlChannel(zmq::context_t &context,
                                     const std::string &endpoint)
    : context_(context), socket_(context, zmq::socket_type::sub),
      endpoint_(endpoint) {
  try {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::subscribe, "");
    socket_.connect(endpoint_);
  } catch (const zmq::error_t &e) {
    throw TransportError("control connect to " + endpoint_ +
                         " failed: " + e.what());
  }
  SVC_LOG_DEBUG("IPC", "CONTROL", "SUB connected to {}", endpoint_);
}

std::string ZmqControlChannel::receive() {
  try {
    zmq::message_t msg;
    if (!socket_.recv(msg, zmq::recv_flags::none)) {
      throw TransportError("control receive from " + endpoint_ + " failed");
    }
    return msg.to_string();
  } catch (const zmq::error_t &e) {
    throw TransportError("control receive from " + endpoint_ +
                         " failed: " + e.what());
  }
}

void ZmqControlChannel::interrupt() { context_.shutdown(); }

} // namespace ipc
} // namespace svcbase
