#pragma once
#include "service-base/ipc/Channels.hpp"
#include "service-base/ipc/ControlProtocol.hpp"
#include "service-base/service/ServiceBase.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace svcbase {

/// Applies remote start/stop commands addressed to this worker.
///
/// The control channel carries every worker's commands; messages for other
/// sids are dropped without a trace. A remote `start` calls run() directly,
/// so the `starting` state is skipped on a restart. Malformed payloads
/// throw ProtocolError and end the loop.
class ControlListener {
public:
  ControlListener(std::string name, std::string sid, ServiceControl &service,
                  ipc::ControlChannel &channel);

  ControlListener(const ControlListener &) = delete;
  ControlListener &operator=(const ControlListener &) = delete;

  /// Receive and apply exactly one message
  void poll_once();

  /// Apply one already-received payload
  void handle_message(const std::string &payload);

  /// Receive and apply messages until request_stop(). Exceptions propagate.
  void run_loop();

  /// End run_loop() after the message being handled
  void request_stop() { stop_requested_ = true; }

  uint64_t commands_applied() const { return commands_applied_.load(); }

private:
  std::string name_;
  std::string sid_;
  ServiceControl &service_;
  ipc::ControlChannel &channel_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> commands_applied_{0};
};

} // namespace svcbase
