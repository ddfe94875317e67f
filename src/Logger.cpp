#include "service-base/Logger.hpp"

namespace svcbase {

// Defined out of line so every module shares one instance
ServiceLogger &ServiceLogger::instance() {
  static ServiceLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "trace")
    return spdlog::level::trace;
  return spdlog::level::info;
}

} // namespace svcbase
