#include "http/Response.hpp"

#include <strings.h>
#include <fmt/format.h>
#include <map>
#include <string>

namespace sessionhub {
namespace http {

Response::Response(int statusCode, std::string_view body) : _status_code(statusCode), _body(body) {}

void Response::setStatus(int statusCode) {
  _status_code = statusCode;
}

void Response::setHeader(std::string_view name, std::string_view value) {
  _headers[std::string(name)] = std::string(value);
}

bool Response::hasHeader(std::string_view name) const {
  for (const auto& header : _headers) {
    if (header.first.size() == name.size() && strncasecmp(header.first.data(), name.data(), name.size()) == 0) {
      return true;
    }
  }

  return false;
}

std::string Response::get() {
  if (!_body.empty()) {
    if (!hasHeader("Content-Length")) {
      setHeader("Content-Length", std::to_string(_body.size()));
    }

    if (!hasHeader("Content-Type")) {
      setHeader("Content-Type", "text/html");
    }
  }

  std::string out = fmt::format("HTTP/1.1 {} {}\r\n", _status_code, getStatusMsg(_status_code));

  for (const auto& header : _headers) {
    out += header.first + ": " + header.second + "\r\n";
  }

  out += "\r\n";
  out += _body;

  return out;
}

std::string Response::getStatusMsg(int statusCode) {
  static const std::map<int, std::string> reasons = {
      {100, "Continue"},
      {101, "Switching Protocols"},
      {200, "OK"},
      {204, "No Content"},
      {400, "Bad Request"},
      {403, "Forbidden"},
      {404, "Not Found"},
      {405, "Method Not Allowed"},
      {413, "Request Entity Too Large"},
      {426, "Upgrade Required"},
      {500, "Internal Server Error"},
      {503, "Service Unavailable"}};

  auto it = reasons.find(statusCode);
  return it == reasons.end() ? "Unknown" : it->second;
}

} // namespace http
} // namespace sessionhub
