#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "Message.hpp"

namespace sessionhub {

class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string& msg) : runtime_error(msg) {}
};

/**
 * Translates envelopes to and from their JSON wire form.
 * Every envelope is an object tagged by a snake_case "type" field.
 */
class Codec final {
public:
  static std::string encodeEvent(const Event& ev);
  static std::string encodeCommand(const Command& cmd);

  // Both throw DecodeError on malformed input.
  static Command decodeCommand(std::string_view data);
  static Event decodeEvent(std::string_view data);

  static const char* streamName(OutputStream stream);
  static const char* statusName(SessionStatus status);
  static bool parseStream(std::string_view name, OutputStream& out);
  static bool parseStatus(std::string_view name, SessionStatus& out);

private:
  Codec() {}
  ~Codec() {}

  static nlohmann::json _parseObject(std::string_view data);
  static std::string _getString(const nlohmann::json& j, const char* field);
  static SessionId _getSessionId(const nlohmann::json& j);
};

} // namespace sessionhub
