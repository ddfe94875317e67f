#pragma once
#include "service-base/export.h"
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace svcbase {

/// Rotation limits for the worker log file
constexpr std::size_t kLogFileMaxBytes = 100 * 1024 * 1024;
constexpr std::size_t kLogFileBackups = 10;

/// Process-wide logging with service name and tag context
class SERVICE_BASE_API ServiceLogger {
public:
  static ServiceLogger &instance();

  // Console for operators, rotating file for the full trace
  void init(const std::string &log_file = "services.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // A second init() from main or a test only adjusts the level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, kLogFileMaxBytes, kLogFileBackups);
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("service", sinks.begin(),
                                                 sinks.end());
      logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e - %l : %v");
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("service")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      if (std::string(ex.what()).find("already exists") == std::string::npos) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      }
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("service");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &service, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, service, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &service, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, service, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &service, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, service, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &service, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, service, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &service, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, service, tag, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  ServiceLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &service,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::shared_ptr<spdlog::logger> logger;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      logger = logger_;
    }
    if (!logger || !logger->should_log(level))
      return;

    std::string msg =
        fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...);
    logger->log(level, "[{}] [{}] {}", service, tag, msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Map a level name ("trace", "debug", "info", "warn", "error") to spdlog
spdlog::level::level_enum parse_log_level(const std::string &level);

// Convenience macros
#define SVC_LOG_TRACE(service, tag, ...)                                       \
  svcbase::ServiceLogger::instance().trace(service, tag, __VA_ARGS__)
#define SVC_LOG_DEBUG(service, tag, ...)                                       \
  svcbase::ServiceLogger::instance().debug(service, tag, __VA_ARGS__)
#define SVC_LOG_INFO(service, tag, ...)                                        \
  svcbase::ServiceLogger::instance().info(service, tag, __VA_ARGS__)
#define SVC_LOG_WARN(service, tag, ...)                                        \
  svcbase::ServiceLogger::instance().warn(service, tag, __VA_ARGS__)
#define SVC_LOG_ERROR(service, tag, ...)                                       \
  svcbase::ServiceLogger::instance().error(service, tag, __VA_ARGS__)

} // namespace svcbase
