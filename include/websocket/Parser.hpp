#ifndef INCLUDE_WEBSOCKET_PARSER_HPP_
#define INCLUDE_WEBSOCKET_PARSER_HPP_

extern "C" {
#include <ws_parser.h>
}

#include <stddef.h>
#include <string>

#include "websocket/Types.hpp"

namespace sessionhub {
namespace websocket {

/**
 * Reassembles client frames with ws_parser and reports every complete data
 * message or control frame to the callback. Once a protocol error or size
 * limit is hit the parser reports it once and ignores further input.
 */
class Parser final {
  struct Hooks;

public:
  Parser();
  ~Parser() {}

  Parser(const Parser&)            = delete;
  Parser& operator=(const Parser&) = delete;

  void parse(char* buf, size_t len);
  void setCallback(ParserCallback callback) { _callback = std::move(callback); }
  bool hasFailed() const { return _failed; }

private:
  struct Frame {
    FrameType type;
    std::string payload;
    std::size_t limit;
  };

  ws_parser_t _ws_parser;
  ws_parser_callbacks_t _hooks;
  Frame _data;
  Frame _control;
  ParserCallback _callback;
  bool _failed;

  void _begin(Frame& frame, FrameType type);
  bool _append(Frame& frame, const char* data, size_t len, ParserStatus overflowStatus);
  void _fail(ParserStatus status, const Frame& frame);
};

} // namespace websocket
} // namespace sessionhub

#endif // INCLUDE_WEBSOCKET_PARSER_HPP_
