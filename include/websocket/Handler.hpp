#pragma once

#include <string>

#include "Forward.hpp"
#include "websocket/Types.hpp"

namespace sessionhub {
namespace websocket {

class Handler final {
public:
  static void HandleRequest(HandlerContext&& ctx, ParserStatus parserStatus, FrameType frameType, const std::string& data);

private:
  Handler() {}
  ~Handler() {}

  static void _hangup(HandlerContext& ctx);
};

} // namespace websocket
} // namespace sessionhub
