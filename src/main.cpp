#include <getopt.h>
#include <signal.h>
#include <stdlib.h>

#include <exception>
#include <iostream>
#include <string>

#include "Config.hpp"
#include "Logger.hpp"
#include "Server.hpp"

using namespace sessionhub;

static void onTerminate(int) {
  stopSessionHub = true;
}

static void installSignalHandlers() {
  struct sigaction sa = {};
  sa.sa_handler       = onTerminate;
  sigemptyset(&sa.sa_mask);

  for (int sig : {SIGINT, SIGQUIT, SIGTERM}) {
    sigaction(sig, &sa, nullptr);
  }
}

static void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--config=<file>]\n\n"
            << "Every option can also be set through the environment, e.g. LISTEN_PORT=3000.\n";
  exit(0);
}

static ConfigMap hubOptions() {
  using T = ConfigValueType;
  using S = ConfigValueSettings;

  return {
      {"listen_address", T::STRING, "127.0.0.1", S::REQUIRED},
      {"listen_port", T::INT, "3000", S::REQUIRED},
      {"worker_threads", T::INT, "0", S::REQUIRED},
      {"log_level", T::STRING, "info", S::REQUIRED},
      {"topic_capacity", T::INT, "256", S::REQUIRED},
      {"ping_interval", T::INT, "30", S::REQUIRED},
      {"handshake_timeout", T::INT, "5", S::REQUIRED},
      {"websocket_path", T::STRING, "/ws", S::REQUIRED},
      {"prometheus_metric_prefix", T::STRING, "sessionhub", S::OPTIONAL},
      {"enable_redis", T::BOOL, "false", S::REQUIRED},
      {"redis_host", T::STRING, "localhost", S::REQUIRED},
      {"redis_port", T::INT, "6379", S::REQUIRED},
      {"redis_password", T::STRING, "", S::OPTIONAL},
      {"redis_prefix", T::STRING, "sessionhub", S::OPTIONAL},
      {"redis_pool_size", T::INT, "5", S::REQUIRED},
  };
}

static void checkLimits(const Config& cfg) {
  if (cfg.get<int>("topic_capacity") < 1) {
    throw std::runtime_error("topic_capacity must be at least 1.");
  }

  if (cfg.get<int>("handshake_timeout") < 0 || cfg.get<int>("ping_interval") < 0) {
    throw std::runtime_error("handshake_timeout and ping_interval can not be negative.");
  }
}

int main(int argc, char** argv) {
  static const struct option longOptions[] = {
      {"config", required_argument, nullptr, 'c'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  std::string cfgFile;
  int c;

  while ((c = getopt_long(argc, argv, "c:h", longOptions, nullptr)) != -1) {
    if (c == 'c') {
      cfgFile = optarg;
    } else {
      usage(argv[0]);
    }
  }

  Config cfg(hubOptions());

  try {
    if (!cfgFile.empty()) {
      LOG->info("Loading config from {}", cfgFile);
      cfg.setFile(cfgFile);
    }

    cfg.setLoadFromEnv(true);
    cfg.load();
    checkLimits(cfg);
    Logger::getInstance().setLevel(cfg.get<std::string>("log_level"));
  } catch (std::exception& e) {
    LOG->error("Error reading configuration: {}", e.what());
    return 1;
  }

  installSignalHandlers();

  Server server(cfg);
  server.start();

  LOG->info("Exiting.");
  return 0;
}
