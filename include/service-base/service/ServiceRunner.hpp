#pragma once
#include "service-base/ipc/Channels.hpp"
#include "service-base/service/ControlListener.hpp"
#include "service-base/service/HeartbeatReporter.hpp"
#include "service-base/service/ServiceBase.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace svcbase {

/// Boots a worker: runs ServiceBase::start(), the control loop and the
/// heartbeat loop on three threads sharing the service's state cell.
///
/// A loop that throws is logged and recorded; it is never restarted.
/// wait() rethrows the first failure so the process can exit.
class ServiceRunner {
public:
  ServiceRunner(ServiceBase &service, HeartbeatReporter &reporter,
                ControlListener &listener,
                ipc::HeartbeatChannel &heartbeat_channel,
                ipc::ControlChannel &control_channel);

  ~ServiceRunner();

  ServiceRunner(const ServiceRunner &) = delete;
  ServiceRunner &operator=(const ServiceRunner &) = delete;

  /// Start the three threads (returns immediately)
  void launch();

  /// Block until a loop fails or shutdown() is called.
  /// Rethrows the first loop failure.
  void wait();

  /// Like wait() with a timeout. Returns false on timeout.
  bool wait_for(std::chrono::milliseconds timeout);

  /// Stop the service, interrupt both channels and join every thread
  void shutdown();

  bool is_running() const { return launched_ && !stopping_; }
  bool has_failed() const;

private:
  void spawn(const std::string &loop_name, std::function<void()> body);
  void record_failure(const std::string &loop_name, std::exception_ptr error,
                      const std::string &reason);
  bool finished() const { return failure_ != nullptr || stopping_; }

  ServiceBase &service_;
  HeartbeatReporter &reporter_;
  ControlListener &listener_;
  ipc::HeartbeatChannel &heartbeat_channel_;
  ipc::ControlChannel &control_channel_;

  std::vector<std::thread> threads_;
  std::atomic<bool> launched_{false};
  std::atomic<bool> stopping_{false};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::exception_ptr failure_;
};

} // namespace svcbase
