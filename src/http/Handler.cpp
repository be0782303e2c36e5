#include "http/Handler.hpp"

#include <unistd.h>
#include <fmt/format.h>
#include <string>

#include "Config.hpp"
#include "Connection.hpp"
#include "HandlerContext.hpp"
#include "Logger.hpp"
#include "Server.hpp"
#include "Util.hpp"
#include "http/Parser.hpp"
#include "http/Response.hpp"
#include "metrics/JsonRenderer.hpp"
#include "metrics/PrometheusRenderer.hpp"

namespace sessionhub {
namespace http {

void Handler::HandleRequest(HandlerContext&& ctx, Parser* req, RequestState reqState) {
  switch (reqState) {
    case RequestState::REQ_INCOMPLETE:
      break;

    case RequestState::REQ_OK:
      _route(ctx, req);
      break;

    case RequestState::REQ_TO_BIG:
      _error(ctx, req, 413, "Request too large.");
      break;

    case RequestState::REQ_FAILED:
      LOG->debug("Client {} sent a malformed request: {}", ctx.connection()->getPeerAddress(), req->getErrorMessage());
      ctx.connection()->close();
      break;
  }
}

void Handler::_route(HandlerContext& ctx, Parser* req) {
  std::string method = req->getMethod();
  const auto& path   = req->getPath();

  Util::strToLower(method);

  if (method == "options") {
    Response resp(204);
    resp.setHeader("Access-Control-Allow-Methods", "GET, OPTIONS");
    resp.setHeader("Access-Control-Allow-Headers", "*");
    _reply(ctx, req, resp);
  } else if (method != "get") {
    _error(ctx, req, 405, "Only GET is supported.");
  } else if (path == "/api/health" || path == "/healthz") {
    _serveHealth(ctx, req);
  } else if (path == "/metrics" || path == "/metrics/") {
    _serveMetrics(ctx, req);
  } else if (path == ctx.config().get<std::string>("websocket_path")) {
    _upgrade(ctx, req);
  } else {
    _error(ctx, req, 404, "Not found.");
  }
}

void Handler::_serveHealth(HandlerContext& ctx, Parser* req) {
  Response resp(200, "{\"status\":\"ok\"}");
  resp.setHeader("Content-Type", "application/json");
  _reply(ctx, req, resp);
}

/**
 * Prometheus text format by default, JSON with ?format=json.
 */
void Handler::_serveMetrics(HandlerContext& ctx, Parser* req) {
  const auto metrics = ctx.server()->getAggregatedMetrics();
  Response resp(200);

  if (req->getQueryString("format") == "json") {
    resp.setHeader("Content-Type", "application/json");
    resp.setBody(metrics::JsonRenderer::RenderMetrics(metrics));
  } else {
    char hostname[256] = {0};
    gethostname(hostname, sizeof(hostname) - 1);

    const auto instance = fmt::format("{}:{}", hostname, ctx.config().get<int>("listen_port"));

    resp.setHeader("Content-Type", "text/plain; version=0.0.4");
    resp.setBody(metrics::PrometheusRenderer::RenderMetrics(metrics, ctx.config().get<std::string>("prometheus_metric_prefix"), instance));
  }

  _reply(ctx, req, resp);
}

void Handler::_upgrade(HandlerContext& ctx, Parser* req) {
  std::string upgrade = req->getHeader("upgrade");

  if (Util::strToLower(upgrade) != "websocket") {
    _error(ctx, req, 426, "This endpoint only speaks websocket.");
    return;
  }

  const auto key = req->getHeader("sec-websocket-key");
  if (key.empty()) {
    _error(ctx, req, 400, "Missing Sec-WebSocket-Key.");
    return;
  }

  Response resp(101);
  resp.setHeader("Upgrade", "websocket");
  resp.setHeader("Connection", "Upgrade");
  resp.setHeader("Sec-WebSocket-Accept", Util::websocketAcceptKey(key));

  const auto protocol = req->getHeader("sec-websocket-protocol");
  if (!protocol.empty()) {
    resp.setHeader("Sec-WebSocket-Protocol", protocol);
  }

  ctx.connection()->send(resp.get());
  ctx.connection()->upgrade(ctx.server()->getHub());

  LOG->debug("Client {} upgraded to websocket as connection {}.", ctx.connection()->getPeerAddress(),
             Identifier::toString(ctx.connection()->getId()));
}

void Handler::_reply(HandlerContext& ctx, Parser* req, Response& resp) {
  const auto origin = req->getHeader("origin");

  resp.setHeader("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
  resp.setHeader("Connection", "close");

  ctx.connection()->send(resp.get());
  ctx.connection()->closeAfterFlush();
}

void Handler::_error(HandlerContext& ctx, Parser* req, int statusCode, std::string_view reason) {
  Response resp(statusCode, fmt::format("<h1>{} {}</h1>\n{}\r\n", statusCode, Response::getStatusMsg(statusCode), reason));
  _reply(ctx, req, resp);
}

} // namespace http
} // namespace sessionhub
