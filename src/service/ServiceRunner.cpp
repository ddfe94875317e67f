#include "service-base/service/ServiceRunner.hpp"
#include "service-base/Logger.hpp"

namespace svcbase {

ServiceRunner::ServiceRunner(ServiceBase &service, HeartbeatReporter &reporter,
                             ControlListener &listener,
                             ipc::HeartbeatChannel &heartbeat_channel,
                             ipc::ControlChannel &control_channel)
    : service_(service), reporter_(reporter), listener_(listener),
      heartbeat_channel_(heartbeat_channel), control_channel_(control_channel) {
}

ServiceRunner::~ServiceRunner() { shutdown(); }

void ServiceRunner::launch() {
  if (launched_.exchange(true)) {
    SVC_LOG_WARN(service_.name(), "RUNNER", "Service already launched");
    return;
  }

  SVC_LOG_INFO(service_.name(), "RUNNER", "Launching service {}",
               service_.sid());

  spawn("service", [this]() { service_.start(); });
  spawn("control", [this]() { listener_.run_loop(); });
  spawn("heartbeat", [this]() { reporter_.run_loop(); });
}

void ServiceRunner::spawn(const std::string &loop_name,
                          std::function<void()> body) {
  threads_.emplace_back([this, loop_name, body = std::move(body)]() {
    try {
      body();
    } catch (const std::exception &e) {
      record_failure(loop_name, std::current_exception(), e.what());
    } catch (...) {
      record_failure(loop_name, std::current_exception(), "unknown error");
    }
  });
}

void ServiceRunner::record_failure(const std::string &loop_name,
                                   std::exception_ptr error,
                                   const std::string &reason) {
  if (stopping_) {
    // Channels are interrupted on purpose during shutdown
    SVC_LOG_DEBUG(service_.name(), "RUNNER", "{} loop exited on shutdown: {}",
                  loop_name, reason);
    return;
  }

  SVC_LOG_ERROR(service_.name(), "RUNNER", "{} loop terminated: {}",
                loop_name, reason);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_) {
      failure_ = error;
    }
  }
  cv_.notify_all();
}

void ServiceRunner::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return finished(); });
  if (failure_) {
    std::rethrow_exception(failure_);
  }
}

bool ServiceRunner::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this]() { return finished(); })) {
    return false;
  }
  if (failure_) {
    std::rethrow_exception(failure_);
  }
  return true;
}

bool ServiceRunner::has_failed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_ != nullptr;
}

void ServiceRunner::shutdown() {
  if (!launched_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();

  SVC_LOG_INFO(service_.name(), "RUNNER", "Shutting down service {}",
               service_.sid());

  // Lets a well-behaved worker body return from run()
  if (service_.state() != ServiceState::Stopped) {
    service_.stop();
  }

  reporter_.request_stop();
  listener_.request_stop();
  heartbeat_channel_.interrupt();
  control_channel_.interrupt();

  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  SVC_LOG_INFO(service_.name(), "RUNNER", "Service {} shut down",
               service_.sid());
}

} // namespace svcbase
