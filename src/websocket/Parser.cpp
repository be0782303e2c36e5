#include "websocket/Parser.hpp"

#include <string>
#include <utility>

#include "Common.hpp"

namespace sessionhub {
namespace websocket {

// C entry points for ws_parser. A non-zero return aborts ws_parser_execute().
struct Parser::Hooks {
  static int onDataBegin(void* p, ws_frame_type_t type) {
    auto self = static_cast<Parser*>(p);
    self->_begin(self->_data, static_cast<FrameType>(type));
    return 0;
  }

  static int onDataPayload(void* p, const char* buf, size_t len) {
    auto self = static_cast<Parser*>(p);
    return self->_append(self->_data, buf, len, ParserStatus::MAX_DATA_FRAME_SIZE_EXCEEDED) ? 0 : 1;
  }

  static int onDataEnd(void* p) {
    auto self = static_cast<Parser*>(p);
    self->_callback(ParserStatus::PARSER_OK, self->_data.type, self->_data.payload);
    return 0;
  }

  static int onControlBegin(void* p, ws_frame_type_t type) {
    auto self = static_cast<Parser*>(p);
    self->_begin(self->_control, static_cast<FrameType>(type));
    return 0;
  }

  static int onControlPayload(void* p, const char* buf, size_t len) {
    auto self = static_cast<Parser*>(p);
    return self->_append(self->_control, buf, len, ParserStatus::MAX_CONTROL_FRAME_SIZE_EXCEEDED) ? 0 : 1;
  }

  static int onControlEnd(void* p) {
    auto self = static_cast<Parser*>(p);
    self->_callback(ParserStatus::PARSER_OK, self->_control.type, self->_control.payload);
    return 0;
  }
};

Parser::Parser() :
  _data{FrameType::TEXT_FRAME, "", WS_MAX_DATA_FRAME_SIZE},
  _control{FrameType::PING_FRAME, "", WS_MAX_CONTROL_FRAME_SIZE},
  _failed(false) {
  _callback = [](ParserStatus, FrameType, const std::string&) {};

  _hooks.on_data_begin      = &Hooks::onDataBegin;
  _hooks.on_data_payload    = &Hooks::onDataPayload;
  _hooks.on_data_end        = &Hooks::onDataEnd;
  _hooks.on_control_begin   = &Hooks::onControlBegin;
  _hooks.on_control_payload = &Hooks::onControlPayload;
  _hooks.on_control_end     = &Hooks::onControlEnd;

  ws_parser_init(&_ws_parser);
}

void Parser::_begin(Frame& frame, FrameType type) {
  frame.type = type;
  frame.payload.clear();
}

bool Parser::_append(Frame& frame, const char* data, size_t len, ParserStatus overflowStatus) {
  if (frame.payload.size() + len > frame.limit) {
    _fail(overflowStatus, frame);
    return false;
  }

  frame.payload.append(data, len);
  return true;
}

void Parser::_fail(ParserStatus status, const Frame& frame) {
  if (_failed) {
    return;
  }

  _failed = true;
  _callback(status, frame.type, frame.payload);
}

/**
 * Feed raw socket bytes. ws_parser unmasks the payload in place.
 */
void Parser::parse(char* buf, size_t len) {
  if (_failed) {
    return;
  }

  // Negative return values are protocol errors, positive ones come from our hooks.
  if (ws_parser_execute(&_ws_parser, &_hooks, this, buf, len) < 0) {
    _fail(ParserStatus::PARSER_ERROR, _data);
  }
}

} // namespace websocket
} // namespace sessionhub
