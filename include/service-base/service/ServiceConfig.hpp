#pragma once
#include "service-base/ipc/Channels.hpp"
#include "service-base/service/ServiceBase.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

namespace svcbase {

/// Bootstrap settings of one worker process
struct ServiceConfig {
  std::string sid{kDefaultServiceId};  // unique within the fleet
  std::string name{kDefaultServiceId}; // tags log lines
  std::string heartbeat_endpoint{ipc::kDefaultHeartbeatEndpoint};
  std::string control_endpoint{ipc::kDefaultControlEndpoint};
  std::string log_file{"services.log"};
  std::string log_level{"info"};
  nlohmann::json infos = nlohmann::json::object(); // merged into heartbeats
};

/// Load a worker configuration from YAML. Missing keys keep their
/// defaults. Throws ConfigError if the file is missing or malformed.
ServiceConfig load_service_config(const std::string &path);

/// Same as above from an already-parsed YAML document
ServiceConfig service_config_from_yaml(const YAML::Node &root);

/// Convert a YAML node to JSON (scalars become int, double, bool or string)
nlohmann::json yaml_to_json(const YAML::Node &node);

} // namespace svcbase
