#pragma once
#include "service-base/ServiceState.hpp"
#include "service-base/ipc/Channels.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace svcbase {

/// Fixed reporting cadence. Not configurable and not jittered.
constexpr std::chrono::milliseconds kHeartbeatInterval{10000};

/// Periodically tells the monitor "I am alive and in state X".
///
/// Each cycle is one synchronous request/acknowledge exchange, so a slow
/// monitor throttles the reporter. Send and receive failures are not
/// caught here: they end the loop, and the monitor sees heartbeat silence.
class HeartbeatReporter {
public:
  HeartbeatReporter(std::string name, std::string sid, const StateCell &state,
                    ipc::HeartbeatChannel &channel,
                    nlohmann::json infos = nlohmann::json::object(),
                    std::chrono::milliseconds interval = kHeartbeatInterval);

  HeartbeatReporter(const HeartbeatReporter &) = delete;
  HeartbeatReporter &operator=(const HeartbeatReporter &) = delete;

  /// Build, send and await acknowledgement of one heartbeat
  void report_once();

  /// Report, sleep, repeat until request_stop(). Exceptions propagate.
  void run_loop();

  /// End run_loop() after the current exchange; cuts the sleep short
  void request_stop();

  uint64_t reports_sent() const { return reports_sent_.load(); }
  std::chrono::milliseconds interval() const { return interval_; }

private:
  std::string name_;
  std::string sid_;
  const StateCell &state_;
  ipc::HeartbeatChannel &channel_;
  nlohmann::json infos_;
  std::chrono::milliseconds interval_;

  std::atomic<uint64_t> reports_sent_{0};
  std::atomic<bool> stop_requested_{false};
  std::mutex sleep_mutex_;
  std::condition_variable sleep_cv_;
};

} // namespace svcbase
