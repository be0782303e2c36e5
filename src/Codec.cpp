#include "Codec.hpp"

#include <fmt/format.h>
#include <string>

#include "Config.hpp"
#include "Identifier.hpp"

namespace sessionhub {

const char* Codec::streamName(OutputStream stream) {
  switch (stream) {
    case OutputStream::STDOUT:
      return "stdout";
    case OutputStream::STDERR:
      return "stderr";
  }

  return "stdout";
}

const char* Codec::statusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::IDLE:
      return "idle";
    case SessionStatus::RUNNING:
      return "running";
    case SessionStatus::COMPLETED:
      return "completed";
    case SessionStatus::ERROR:
      return "error";
    case SessionStatus::CANCELLED:
      return "cancelled";
  }

  return "idle";
}

bool Codec::parseStream(std::string_view name, OutputStream& out) {
  if (name == "stdout") {
    out = OutputStream::STDOUT;
  } else if (name == "stderr") {
    out = OutputStream::STDERR;
  } else {
    return false;
  }

  return true;
}

bool Codec::parseStatus(std::string_view name, SessionStatus& out) {
  for (auto status : {SessionStatus::IDLE, SessionStatus::RUNNING, SessionStatus::COMPLETED,
                      SessionStatus::ERROR, SessionStatus::CANCELLED}) {
    if (name == statusName(status)) {
      out = status;
      return true;
    }
  }

  return false;
}

std::string Codec::encodeEvent(const Event& ev) {
  nlohmann::json j;

  std::visit(overload{
                 [&](const event::Subscribed& e) {
                   j["type"]       = "subscribed";
                   j["session_id"] = Identifier::toString(e.session);
                 },
                 [&](const event::Unsubscribed& e) {
                   j["type"]       = "unsubscribed";
                   j["session_id"] = Identifier::toString(e.session);
                 },
                 [&](const event::Output& e) {
                   j["type"]       = "output";
                   j["session_id"] = Identifier::toString(e.session);
                   j["stream"]     = streamName(e.stream);
                   j["content"]    = e.content;
                 },
                 [&](const event::StatusChanged& e) {
                   j["type"]       = "status";
                   j["session_id"] = Identifier::toString(e.session);
                   j["status"]     = statusName(e.status);
                 },
                 [&](const event::Error& e) {
                   j["type"]    = "error";
                   j["message"] = e.message;
                 },
                 [&](const event::Pong&) {
                   j["type"] = "pong";
                 }},
             ev);

  // Output content is producer supplied and may not be valid UTF-8.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::encodeCommand(const Command& cmd) {
  nlohmann::json j;

  std::visit(overload{
                 [&](const command::Subscribe& c) {
                   j["type"]       = "subscribe";
                   j["session_id"] = Identifier::toString(c.session);
                 },
                 [&](const command::Unsubscribe& c) {
                   j["type"]       = "unsubscribe";
                   j["session_id"] = Identifier::toString(c.session);
                 },
                 [&](const command::Cancel& c) {
                   j["type"]       = "cancel";
                   j["session_id"] = Identifier::toString(c.session);
                 },
                 [&](const command::Ping&) {
                   j["type"] = "ping";
                 }},
             cmd);

  return j.dump();
}

nlohmann::json Codec::_parseObject(std::string_view data) {
  nlohmann::json j;

  try {
    j = nlohmann::json::parse(data.begin(), data.end());
  } catch (nlohmann::json::parse_error& e) {
    throw DecodeError(fmt::format("Invalid message format: {}", e.what()));
  }

  if (!j.is_object()) {
    throw DecodeError("Invalid message format: expected a JSON object");
  }

  return j;
}

std::string Codec::_getString(const nlohmann::json& j, const char* field) {
  auto it = j.find(field);

  if (it == j.end()) {
    throw DecodeError(fmt::format("Invalid message format: missing field `{}`", field));
  }

  if (!it->is_string()) {
    throw DecodeError(fmt::format("Invalid message format: field `{}` must be a string", field));
  }

  return it->get<std::string>();
}

SessionId Codec::_getSessionId(const nlohmann::json& j) {
  SessionId session;
  const auto str = _getString(j, "session_id");

  if (!Identifier::parse(str, session)) {
    throw DecodeError(fmt::format("Invalid message format: `{}` is not a valid session_id", str));
  }

  return session;
}

/**
 * Decode a command sent by a client.
 * @param data Text frame payload.
 * @throws DecodeError if the payload is not a known command.
 */
Command Codec::decodeCommand(std::string_view data) {
  const auto j    = _parseObject(data);
  const auto type = _getString(j, "type");

  if (type == "subscribe") {
    return command::Subscribe{_getSessionId(j)};
  } else if (type == "unsubscribe") {
    return command::Unsubscribe{_getSessionId(j)};
  } else if (type == "cancel") {
    return command::Cancel{_getSessionId(j)};
  } else if (type == "ping") {
    return command::Ping{};
  }

  throw DecodeError(fmt::format("Invalid message format: unknown type `{}`", type));
}

/**
 * Decode an event in wire form, as sent by producers through the ingress.
 * @throws DecodeError if the payload is not a known event.
 */
Event Codec::decodeEvent(std::string_view data) {
  const auto j    = _parseObject(data);
  const auto type = _getString(j, "type");

  if (type == "subscribed") {
    return event::Subscribed{_getSessionId(j)};
  } else if (type == "unsubscribed") {
    return event::Unsubscribed{_getSessionId(j)};
  } else if (type == "output") {
    OutputStream stream;
    const auto streamStr = _getString(j, "stream");

    if (!parseStream(streamStr, stream)) {
      throw DecodeError(fmt::format("Invalid message format: unknown stream `{}`", streamStr));
    }

    return event::Output{_getSessionId(j), stream, _getString(j, "content")};
  } else if (type == "status") {
    SessionStatus status;
    const auto statusStr = _getString(j, "status");

    if (!parseStatus(statusStr, status)) {
      throw DecodeError(fmt::format("Invalid message format: unknown status `{}`", statusStr));
    }

    return event::StatusChanged{_getSessionId(j), status};
  } else if (type == "error") {
    return event::Error{_getString(j, "message")};
  } else if (type == "pong") {
    return event::Pong{};
  }

  throw DecodeError(fmt::format("Invalid message format: unknown type `{}`", type));
}

} // namespace sessionhub
