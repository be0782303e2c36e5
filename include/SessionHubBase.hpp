#pragma once

#include "Config.hpp"

namespace sessionhub {

class SessionHubBase {
public:
  explicit SessionHubBase(Config& cfg) : _config(cfg) {};
  virtual ~SessionHubBase() {};

  Config& config() {
    return _config;
  }

protected:
  Config& _config;
};

}
