#include "service-base/service/ServiceConfig.hpp"
#include "service-base/Errors.hpp"
#include <filesystem>

namespace svcbase {

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    try {
      return node.as<int64_t>();
    } catch (const YAML::BadConversion &) {
      try {
        return node.as<double>();
      } catch (const YAML::BadConversion &) {
        try {
          return node.as<bool>();
        } catch (const YAML::BadConversion &) {
          return node.as<std::string>();
        }
      }
    }
  } else if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

static void read_string(const YAML::Node &root, const char *key,
                        std::string &out) {
  const YAML::Node value = root[key];
  if (!value) {
    return;
  }
  if (!value.IsScalar()) {
    throw ConfigError(std::string("config key '") + key +
                      "' must be a string");
  }
  out = value.as<std::string>();
}

ServiceConfig service_config_from_yaml(const YAML::Node &root) {
  ServiceConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("service config must be a mapping");
  }

  read_string(root, "sid", config.sid);
  read_string(root, "name", config.name);
  read_string(root, "log_file", config.log_file);
  read_string(root, "log_level", config.log_level);

  if (const YAML::Node endpoints = root["endpoints"]) {
    read_string(endpoints, "heartbeat", config.heartbeat_endpoint);
    read_string(endpoints, "control", config.control_endpoint);
  }

  if (const YAML::Node infos = root["infos"]) {
    if (!infos.IsMap()) {
      throw ConfigError("config key 'infos' must be a mapping");
    }
    config.infos = yaml_to_json(infos);
  }

  if (config.sid.empty()) {
    throw ConfigError("config key 'sid' must not be empty");
  }
  return config;
}

ServiceConfig load_service_config(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("config file not found: " + path);
  }

  try {
    return service_config_from_yaml(YAML::LoadFile(path));
  } catch (const YAML::Exception &e) {
    throw ConfigError("failed to parse config " + path + ": " + e.what());
  }
}

} // namespace svcbase
