#pragma once

#include <picohttpparser.h>
#include <stddef.h>
#include <map>
#include <string>
#include <string_view>

#include "http/Types.hpp"

namespace sessionhub {
namespace http {

// Largest request head we accept, and the most headers in it.
static constexpr std::size_t HTTP_BUFSIZ              = 8192;
static constexpr std::size_t HTTP_REQUEST_MAX_HEADERS = 64;

using ParameterList = std::map<std::string, std::string>;

/**
 * Incremental parser for a single request head.
 * Bytes are accumulated until picohttpparser sees the full head; the callback
 * runs after every parse() call with the resulting state.
 */
class Parser final {
public:
  Parser();
  ~Parser() {}

  void parse(const char* data, std::size_t len);
  void setCallback(ParserCallback callback) { _callback = std::move(callback); }

  const std::string& getMethod() const { return _method; }
  const std::string& getPath() const { return _path; }
  const ParameterList& getHeaders() const { return _headers; }
  const std::string& getErrorMessage() const { return _error_message; }

  // Names are case insensitive. Missing entries read as the empty string.
  std::string getHeader(std::string name) const;
  std::string getQueryString(std::string name) const;
  std::size_t numQueryString() const { return _query.size(); }

private:
  std::string _buf;
  std::size_t _parsed_len;
  bool _is_complete;
  std::string _method;
  std::string _path;
  std::string _error_message;
  ParameterList _headers;
  ParameterList _query;
  ParserCallback _callback;

  RequestState _parseHead();
  void _parseTarget(std::string_view target);
  static std::string _lookup(const ParameterList& list, std::string name);
};

} // namespace http
} // namespace sessionhub
