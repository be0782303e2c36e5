#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "Identifier.hpp"

namespace sessionhub {

enum class OutputStream : uint8_t {
  STDOUT,
  STDERR
};

enum class SessionStatus : uint8_t {
  IDLE,
  RUNNING,
  COMPLETED,
  ERROR,
  CANCELLED
};

// Server -> client envelopes.
namespace event {

struct Subscribed {
  SessionId session;
  bool operator==(const Subscribed& o) const { return session == o.session; }
};

struct Unsubscribed {
  SessionId session;
  bool operator==(const Unsubscribed& o) const { return session == o.session; }
};

struct Output {
  SessionId session;
  OutputStream stream;
  std::string content;
  bool operator==(const Output& o) const { return session == o.session && stream == o.stream && content == o.content; }
};

struct StatusChanged {
  SessionId session;
  SessionStatus status;
  bool operator==(const StatusChanged& o) const { return session == o.session && status == o.status; }
};

struct Error {
  std::string message;
  bool operator==(const Error& o) const { return message == o.message; }
};

struct Pong {
  bool operator==(const Pong&) const { return true; }
};

} // namespace event

using Event = std::variant<event::Subscribed,
                           event::Unsubscribed,
                           event::Output,
                           event::StatusChanged,
                           event::Error,
                           event::Pong>;

// Client -> server envelopes.
namespace command {

struct Subscribe {
  SessionId session;
  bool operator==(const Subscribe& o) const { return session == o.session; }
};

struct Unsubscribe {
  SessionId session;
  bool operator==(const Unsubscribe& o) const { return session == o.session; }
};

struct Cancel {
  SessionId session;
  bool operator==(const Cancel& o) const { return session == o.session; }
};

struct Ping {
  bool operator==(const Ping&) const { return true; }
};

} // namespace command

using Command = std::variant<command::Subscribe,
                             command::Unsubscribe,
                             command::Cancel,
                             command::Ping>;

} // namespace sessionhub
