#pragma once

#include <map>
#include <string>
#include <string_view>

namespace sessionhub {
namespace http {

using HeaderList = std::map<std::string, std::string>;

/**
 * HTTP/1.1 response builder.
 */
class Response final {
public:
  explicit Response(int statusCode = 200, std::string_view body = "");

  void setStatus(int statusCode);
  void setHeader(std::string_view name, std::string_view value);
  void setBody(std::string_view body) { _body = body; }
  bool hasHeader(std::string_view name) const;

  // Status line, headers and body. Content-Length and Content-Type are filled in for non-empty bodies.
  std::string get();

  static std::string getStatusMsg(int statusCode);

private:
  int _status_code;
  std::string _body;
  HeaderList _headers;
};

} // namespace http
} // namespace sessionhub
