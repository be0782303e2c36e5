#pragma once

#include <string_view>

#include "Forward.hpp"
#include "http/Types.hpp"

namespace sessionhub {
namespace http {

/**
 * Answers the plain HTTP endpoints (health, metrics) and performs the
 * websocket upgrade. Every non-upgrade response closes the connection.
 */
class Handler final {
public:
  static void HandleRequest(HandlerContext&& ctx, Parser* req, RequestState reqState);

private:
  Handler() {}
  ~Handler() {}

  static void _route(HandlerContext& ctx, Parser* req);
  static void _serveHealth(HandlerContext& ctx, Parser* req);
  static void _serveMetrics(HandlerContext& ctx, Parser* req);
  static void _upgrade(HandlerContext& ctx, Parser* req);
  static void _reply(HandlerContext& ctx, Parser* req, Response& resp);
  static void _error(HandlerContext& ctx, Parser* req, int statusCode, std::string_view reason);
};

} // namespace http
} // namespace sessionhub
