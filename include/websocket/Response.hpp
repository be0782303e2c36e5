#pragma once

#include <stdint.h>
#include <string>
#include <string_view>

#include "websocket/Types.hpp"

namespace sessionhub {
namespace websocket {

// Server to client framing. Server frames are never masked.
class Response final {
public:
  static std::string encodeFrames(std::string_view data, FrameType frameType);
  static std::string encodeFragment(std::string_view fragment, uint8_t frameType, bool fin);

private:
  Response() {}
  ~Response() {}
};

} // namespace websocket
} // namespace sessionhub
