#include "http/Parser.hpp"

#include <string>
#include <utility>

#include "Logger.hpp"
#include "Util.hpp"

namespace sessionhub {
namespace http {

Parser::Parser() : _parsed_len(0), _is_complete(false) {
  _callback = [](Parser*, RequestState) {
    LOG->error("HTTP request parsed without a handler installed.");
  };
}

/**
 * Append raw bytes from the socket and try to parse the request head.
 * Anything after a complete head is ignored.
 */
void Parser::parse(const char* data, std::size_t len) {
  if (_is_complete) {
    return _callback(this, RequestState::REQ_OK);
  }

  if (_buf.size() + len > HTTP_BUFSIZ) {
    _error_message = "Request head exceeds " + std::to_string(HTTP_BUFSIZ) + " bytes.";
    return _callback(this, RequestState::REQ_TO_BIG);
  }

  _buf.append(data, len);

  const auto state = _parseHead();
  _callback(this, state);
}

RequestState Parser::_parseHead() {
  const char* method = nullptr;
  const char* target = nullptr;
  std::size_t methodLen = 0, targetLen = 0;
  int minorVersion = 0;

  struct phr_header headers[HTTP_REQUEST_MAX_HEADERS];
  std::size_t numHeaders = HTTP_REQUEST_MAX_HEADERS;

  const int ret = phr_parse_request(_buf.data(), _buf.size(), &method, &methodLen, &target, &targetLen,
                                    &minorVersion, headers, &numHeaders, _parsed_len);
  _parsed_len   = _buf.size();

  if (ret == -2) {
    return RequestState::REQ_INCOMPLETE;
  }

  if (ret < 0) {
    _error_message = "Malformed request head.";
    return RequestState::REQ_FAILED;
  }

  _method.assign(method, methodLen);
  _parseTarget(std::string_view(target, targetLen));

  for (std::size_t i = 0; i < numHeaders; i++) {
    // Continuation lines of a folded header have no name.
    if (headers[i].name == nullptr) {
      continue;
    }

    std::string name(headers[i].name, headers[i].name_len);
    _headers[Util::strToLower(name)] = std::string(headers[i].value, headers[i].value_len);
  }

  _is_complete = true;
  return RequestState::REQ_OK;
}

/**
 * Split the request target into path and query parameters.
 * Parameters without a value, or with an empty name, are dropped.
 */
void Parser::_parseTarget(std::string_view target) {
  const auto qs = target.find('?');
  _path         = std::string(target.substr(0, qs));

  if (qs == std::string_view::npos) {
    return;
  }

  auto rest = target.substr(qs + 1);

  while (!rest.empty()) {
    const auto amp  = rest.find('&');
    const auto pair = rest.substr(0, amp);
    const auto eq   = pair.find('=');

    if (eq != std::string_view::npos && eq > 0 && eq + 1 < pair.size()) {
      std::string name(pair.substr(0, eq));
      _query[Util::strToLower(name)] = std::string(pair.substr(eq + 1));
    }

    if (amp == std::string_view::npos) {
      break;
    }

    rest.remove_prefix(amp + 1);
  }
}

std::string Parser::_lookup(const ParameterList& list, std::string name) {
  auto it = list.find(Util::strToLower(name));
  return it == list.end() ? std::string() : it->second;
}

std::string Parser::getHeader(std::string name) const {
  return _lookup(_headers, std::move(name));
}

std::string Parser::getQueryString(std::string name) const {
  return _lookup(_query, std::move(name));
}

} // namespace http
} // namespace sessionhub
