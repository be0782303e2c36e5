#include "websocket/Handler.hpp"

#include <string>

#include "Connection.hpp"
#include "HandlerContext.hpp"
#include "Logger.hpp"
#include "Multiplexer.hpp"
#include "websocket/Types.hpp"

namespace sessionhub {
namespace websocket {

static const char* describe(ParserStatus status) {
  switch (status) {
    case ParserStatus::PARSER_ERROR:
      return "sent an invalid frame";
    case ParserStatus::MAX_DATA_FRAME_SIZE_EXCEEDED:
      return "exceeded the max data frame size";
    case ParserStatus::MAX_CONTROL_FRAME_SIZE_EXCEEDED:
      return "exceeded the max control frame size";
    default:
      return "";
  }
}

/**
 * Process one complete frame from the client.
 * Text frames carry protocol commands, everything else is housekeeping.
 */
void Handler::HandleRequest(HandlerContext&& ctx, ParserStatus parserStatus, FrameType frameType,
                            const std::string& data) {
  auto conn = ctx.connection();

  if (parserStatus != ParserStatus::PARSER_OK) {
    LOG->debug("Client {} {}, hanging up.", conn->getPeerAddress(), describe(parserStatus));
    _hangup(ctx);
    return;
  }

  switch (frameType) {
    case FrameType::TEXT_FRAME:
      if (auto multiplexer = conn->getMultiplexer()) {
        multiplexer->handleFrame(data);
      }
      break;

    case FrameType::PING_FRAME:
      conn->sendFrame(data, FrameType::PONG_FRAME);
      break;

    case FrameType::CLOSE_FRAME:
      LOG->trace("Client {} sent close frame.", conn->getPeerAddress());
      conn->releaseSubscriptions();
      conn->sendFrame("", FrameType::CLOSE_FRAME);
      conn->closeAfterFlush();
      break;

    default:
      break;
  }
}

void Handler::_hangup(HandlerContext& ctx) {
  ctx.connection()->sendFrame("", FrameType::CLOSE_FRAME);
  ctx.connection()->close();
}

} // namespace websocket
} // namespace sessionhub
