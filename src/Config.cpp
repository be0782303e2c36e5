#include "Config.hpp"

#include <stdlib.h>
#include <strings.h>
#include <cctype>
#include <fstream>
#include <string>

namespace sessionhub {

static std::string trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return "";
  }

  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

static std::string unquote(const std::string& s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }

  return s;
}

static bool parseBool(const std::string& s, bool& out) {
  for (const char* t : {"true", "yes", "on", "1"}) {
    if (strcasecmp(s.c_str(), t) == 0) {
      out = true;
      return true;
    }
  }

  for (const char* f : {"false", "no", "off", "0"}) {
    if (strcasecmp(s.c_str(), f) == 0) {
      out = false;
      return true;
    }
  }

  return false;
}

Config::Config(const ConfigMap& cfgMap) : _load_env(false) {
  for (const auto& def : cfgMap) {
    switch (def.type) {
      case ConfigValueType::INT:
        defineOption<int>(def.name, def.settings);
        break;

      case ConfigValueType::BOOL:
        defineOption<bool>(def.name, def.settings);
        break;

      case ConfigValueType::STRING:
        defineOption<std::string>(def.name, def.settings);
        break;
    }

    if (!def.defaultValue.empty()) {
      _inline << def.name << " = " << def.defaultValue << "\n";
    }
  }
}

void Config::_set(const std::string& name, const std::string& raw, const std::string& origin) {
  auto it = _options.find(name);
  if (it == _options.end()) {
    throw InvalidConfigOptionException{name, origin};
  }

  auto& opt = it->second;

  std::visit(overload{
                 [&](int&) {
                   std::size_t used = 0;
                   int value        = 0;

                   try {
                     value = std::stoi(raw, &used);
                   } catch (std::exception&) {
                     used = 0;
                   }

                   if (used == 0 || used != raw.size()) {
                     throw std::runtime_error{"Invalid number for \"" + name + "\" at " + origin + ": " + raw};
                   }

                   opt.value = value;
                 },
                 [&](bool&) {
                   bool value = false;

                   if (!parseBool(raw, value)) {
                     throw std::runtime_error{"Invalid boolean for \"" + name + "\" at " + origin + ": " + raw};
                   }

                   opt.value = value;
                 },
                 [&](std::string&) {
                   opt.value = raw;
                 }},
             opt.value);

  opt.isSet = true;
}

void Config::_parse(std::istream& in, const std::string& source) {
  std::string line;
  unsigned int lineNo = 0;

  while (std::getline(in, line)) {
    lineNo++;

    const auto stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }

    const auto origin = source + ":" + std::to_string(lineNo);
    const auto eq     = stripped.find('=');

    if (eq == std::string::npos) {
      throw SyntaxErrorException{origin};
    }

    const auto name  = trim(stripped.substr(0, eq));
    const auto value = unquote(trim(stripped.substr(eq + 1)));

    if (name.empty() || value.empty()) {
      throw SyntaxErrorException{origin};
    }

    _set(name, value, origin);
  }
}

void Config::_parseEnv() {
  for (const auto& it : _options) {
    const char* value = getenv(it.first.c_str());

    if (value == nullptr) {
      std::string upper = it.first;
      for (auto& c : upper) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
      }

      value = getenv(upper.c_str());
    }

    if (value != nullptr) {
      _set(it.first, value, "environment");
    }
  }
}

/**
 * Load every source and check that all required options got a value.
 * @throws std::runtime_error (or one of the config exceptions) on the first problem.
 */
void Config::load() {
  _parse(_inline, "<inline>");
  _inline.clear();

  if (!_file.empty()) {
    std::ifstream f(_file);
    if (!f.is_open()) {
      throw std::runtime_error{"Could not open config file " + _file};
    }

    _parse(f, _file);
  }

  if (_load_env) {
    _parseEnv();
  }

  for (const auto& it : _options) {
    if (it.second.settings == ConfigValueSettings::REQUIRED && !it.second.isSet) {
      throw RequiredOptionMissingException{it.first};
    }
  }
}

void Config::clearValues() {
  for (auto& it : _options) {
    std::visit([](auto& v) { v = std::decay_t<decltype(v)>{}; }, it.second.value);
    it.second.isSet = false;
  }
}

} // namespace sessionhub
