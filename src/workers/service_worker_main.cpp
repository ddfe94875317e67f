#include "service-base/Errors.hpp"
#include "service-base/Logger.hpp"
#include "service-base/WorkerBody.hpp"
#include "service-base/ipc/ZmqChannels.hpp"
#include "service-base/service/ControlListener.hpp"
#include "service-base/service/HeartbeatReporter.hpp"
#include "service-base/service/ServiceBase.hpp"
#include "service-base/service/ServiceConfig.hpp"
#include "service-base/service/ServiceRunner.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

using namespace svcbase;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " [config.yaml] [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --sid <sid>          Override the service id\n";
  std::cout << "  --log-level <level>  trace|debug|info|warn|error\n";
  std::cout << "  -h, --help           Show this help\n";
}

int main(int argc, char **argv) {
  std::string config_path;
  std::string sid_override;
  std::string level_override;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--sid" && i + 1 < argc) {
      sid_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      level_override = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
      config_path = arg;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  ServiceConfig config;
  try {
    if (!config_path.empty()) {
      config = load_service_config(config_path);
    }
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (!sid_override.empty()) {
    config.sid = sid_override;
  }
  if (!level_override.empty()) {
    config.log_level = level_override;
  }

  ServiceLogger::instance().init(config.log_file,
                                 parse_log_level(config.log_level));

  SVC_LOG_INFO(config.name, "MAIN", "Worker starting (sid={})", config.sid);
  SVC_LOG_INFO(config.name, "MAIN", "Heartbeat endpoint: {}",
               config.heartbeat_endpoint);
  SVC_LOG_INFO(config.name, "MAIN", "Control endpoint:   {}",
               config.control_endpoint);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  try {
    zmq::context_t context;
    ipc::ZmqHeartbeatChannel heartbeat_channel(context,
                                               config.heartbeat_endpoint);
    ipc::ZmqControlChannel control_channel(context, config.control_endpoint);

    WorkerBody body;
    ServiceBase service(config.name, config.sid, body);
    HeartbeatReporter reporter(config.name, config.sid, service.state_cell(),
                               heartbeat_channel, config.infos);
    ControlListener listener(config.name, config.sid, service,
                             control_channel);

    ServiceRunner runner(service, reporter, listener, heartbeat_channel,
                         control_channel);
    runner.launch();

    while (g_running) {
      if (runner.wait_for(std::chrono::milliseconds(100))) {
        break;
      }
    }

    SVC_LOG_INFO(config.name, "MAIN", "Shutting down");
    runner.shutdown();

    SVC_LOG_INFO(config.name, "MAIN", "Worker exited cleanly");
    return 0;

  } catch (const std::exception &e) {
    SVC_LOG_ERROR(config.name, "MAIN", "Fatal error: {}", e.what());
    return 1;
  }
}
