#pragma once

#include <stddef.h>
#include <stdint.h>
#include <chrono>
#include <string>

namespace sessionhub {

class Util final {
public:
  static const std::string base64Encode(const unsigned char* buffer, std::size_t length);
  static const std::string websocketAcceptKey(const std::string& secWebsocketKey);
  static std::string& strToLower(std::string& s);
  static int64_t getTimeSinceEpoch();

private:
  Util() {}
  ~Util() {}
};

} // namespace sessionhub
