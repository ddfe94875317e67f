#include "service-base/service/HeartbeatReporter.hpp"
#include "service-base/Logger.hpp"
#include "service-base/ipc/ControlProtocol.hpp"

namespace svcbase {

HeartbeatReporter::HeartbeatReporter(std::string name, std::string sid,
                                     const StateCell &state,
                                     ipc::HeartbeatChannel &channel,
                                     nlohmann::json infos,
                                     std::chrono::milliseconds interval)
    : name_(std::move(name)), sid_(std::move(sid)), state_(state),
      channel_(channel), infos_(std::move(infos)), interval_(interval) {}

void HeartbeatReporter::report_once() {
  ipc::HeartbeatRecord record;
  record.sid = sid_;
  record.state = state_.load();
  record.infos = infos_;

  std::string payload = ipc::serialize_heartbeat(record);
  SVC_LOG_TRACE(name_, "HEARTBEAT", "Sending {}", payload);

  // Reply content is only an acknowledgement
  channel_.request(payload);
  reports_sent_++;

  SVC_LOG_DEBUG(name_, "HEARTBEAT", "Heartbeat #{} acknowledged (state={})",
                reports_sent_.load(), to_string(record.state));
}

void HeartbeatReporter::run_loop() {
  SVC_LOG_INFO(name_, "HEARTBEAT", "Heartbeat loop started (interval={}ms)",
               interval_.count());

  while (!stop_requested_) {
    report_once();

    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, interval_,
                       [this]() { return stop_requested_.load(); });
  }

  SVC_LOG_INFO(name_, "HEARTBEAT", "Heartbeat loop exited");
}

void HeartbeatReporter::request_stop() {
  {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    stop_requested_ = true;
  }
  sleep_cv_.notify_all();
}

} // namespace svcbase
