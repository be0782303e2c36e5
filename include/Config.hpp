#ifndef INCLUDE_CONFIG_HPP_
#define INCLUDE_CONFIG_HPP_

#include <cstdint>
#include <istream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace sessionhub {

template <class... Ts>
struct overload : Ts... { using Ts::operator()...; };
template <class... Ts>
overload(Ts...) -> overload<Ts...>;

enum class ConfigValueSettings : uint8_t {
  REQUIRED,
  OPTIONAL
};

enum class ConfigValueType : uint8_t {
  INT,
  BOOL,
  STRING
};

// One row of the option table handed to Config's constructor.
struct ConfigOptionDefinition {
  std::string name;
  ConfigValueType type;
  std::string defaultValue;
  ConfigValueSettings settings;
};

using ConfigMap   = std::vector<ConfigOptionDefinition>;
using ConfigValue = std::variant<int, bool, std::string>;

class InvalidConfigOptionException : public std::runtime_error {
public:
  explicit InvalidConfigOptionException(const std::string& optName, const std::string& origin = "") :
    runtime_error("Invalid config option \"" + optName + "\"" + (origin.empty() ? "" : " at " + origin)) {}
};

class SyntaxErrorException : public std::runtime_error {
public:
  explicit SyntaxErrorException(const std::string& origin) : runtime_error("Invalid syntax at " + origin) {}
};

class RequiredOptionMissingException : public std::runtime_error {
public:
  explicit RequiredOptionMissingException(const std::string& optName) :
    runtime_error("Missing required option \"" + optName + "\"") {}
};

struct ConfigOption {
  ConfigValueSettings settings;
  ConfigValue value;
  bool isSet;
};

/**
 * Typed options loaded, in order of increasing precedence, from defaults and
 * inline text, a config file and the environment.
 *
 * Files hold one "name = value" per line. Blank lines and lines starting with
 * # are ignored and values may be wrapped in single or double quotes.
 * Environment variables match the option name as is or in upper case.
 */
class Config {
public:
  Config() : _load_env(false) {}
  explicit Config(const ConfigMap& cfgMap);

  template <typename T>
  void defineOption(const std::string& optName, ConfigValueSettings settings = ConfigValueSettings::REQUIRED) {
    if (!_options.emplace(optName, ConfigOption{settings, T{}, false}).second) {
      throw std::runtime_error{"Redefinition of option \"" + optName + "\""};
    }
  }

  template <typename T>
  const T& get(const std::string& optName) const {
    auto it = _options.find(optName);
    if (it == _options.end()) {
      throw InvalidConfigOptionException{optName};
    }

    const auto* value = std::get_if<T>(&it->second.value);
    if (value == nullptr) {
      throw std::runtime_error{"Requested invalid type for config parameter \"" + optName + "\""};
    }

    return *value;
  }

  void setFile(const std::string& fileName) { _file = fileName; }
  void setLoadFromEnv(bool shouldLoad) { _load_env = shouldLoad; }
  void load();
  void clearValues();

  // Inline "name = value" lines, read before the file.
  Config& operator<<(const std::string& str) {
    _inline << str;
    return *this;
  }

private:
  std::map<std::string, ConfigOption> _options;
  std::stringstream _inline;
  std::string _file;
  bool _load_env;

  void _set(const std::string& name, const std::string& raw, const std::string& origin);
  void _parse(std::istream& in, const std::string& source);
  void _parseEnv();
};

} // namespace sessionhub

#endif // INCLUDE_CONFIG_HPP_
