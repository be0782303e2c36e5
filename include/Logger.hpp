#ifndef INCLUDE_LOGGER_HPP_
#define INCLUDE_LOGGER_HPP_

#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace sessionhub {

/**
 * Process wide spdlog logger, reached through the LOG macro.
 */
class Logger {
public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  // Accepts spdlog level names plus "warning".
  void setLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name == "warning" ? "warn" : name);

    if (level == spdlog::level::off && name != "off") {
      throw std::invalid_argument("Log level " + name + " is invalid.");
    }

    _logger->set_level(level);
  }

  std::shared_ptr<spdlog::logger> getLogger() { return _logger; }

private:
  Logger() : _logger(spdlog::stdout_logger_mt("sessionhub")) {
    _logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  }

  std::shared_ptr<spdlog::logger> _logger;
};

} // namespace sessionhub

#define LOG ::sessionhub::Logger::getInstance().getLogger()

#endif // INCLUDE_LOGGER_HPP_
