#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "Codec.hpp"
#include "Identifier.hpp"
#include "Message.hpp"
#include "catch.hpp"

using namespace sessionhub;

using Catch::Matchers::StartsWith;

static const char* SESSION_STR = "6f1c2b7e-0b1a-4d2e-9c3f-2a5b8e7d4c10";

static SessionId sessionId() {
  SessionId id;
  Identifier::parse(SESSION_STR, id);
  return id;
}

TEST_CASE("Identifier", "[codec]") {
  SessionId id;

  SECTION("Canonical form is accepted") {
    REQUIRE(Identifier::parse(SESSION_STR, id));
    REQUIRE(Identifier::toString(id) == SESSION_STR);
  }

  SECTION("Uppercase hex is accepted and rendered lowercase") {
    REQUIRE(Identifier::parse("6F1C2B7E-0B1A-4D2E-9C3F-2A5B8E7D4C10", id));
    REQUIRE(Identifier::toString(id) == SESSION_STR);
  }

  SECTION("Simple, braced and urn forms are accepted") {
    for (const char* form : {"6f1c2b7e0b1a4d2e9c3f2a5b8e7d4c10",
                             "{6f1c2b7e-0b1a-4d2e-9c3f-2a5b8e7d4c10}",
                             "urn:uuid:6f1c2b7e-0b1a-4d2e-9c3f-2a5b8e7d4c10",
                             "URN:UUID:6F1C2B7E-0B1A-4D2E-9C3F-2A5B8E7D4C10"}) {
      SessionId parsed;
      REQUIRE(Identifier::parse(form, parsed));
      REQUIRE(Identifier::toString(parsed) == SESSION_STR);
    }
  }

  SECTION("Malformed identifiers are rejected") {
    REQUIRE_FALSE(Identifier::parse("", id));
    REQUIRE_FALSE(Identifier::parse("not-a-uuid", id));
    REQUIRE_FALSE(Identifier::parse("{6f1c2b7e-0b1a-4d2e-9c3f-2a5b8e7d4c10", id));
    REQUIRE_FALSE(Identifier::parse("6f1c2b7e0b1a4d2e9c3f2a5b8e7d4c1", id));
    REQUIRE_FALSE(Identifier::parse("6f1c2b7e0b1a4d2e9c3f2a5b8e7d4c1z", id));
    REQUIRE_FALSE(Identifier::parse("urn:uuid:6f1c2b7e0b1a4d2e9c3f2a5b8e7d4c10", id));
    REQUIRE_FALSE(Identifier::parse("6f1c2b7e0-b1a-4d2e-9c3f-2a5b8e7d4c10", id));
    REQUIRE_FALSE(Identifier::parse("6f1c2b7e-0b1a-4d2e-9c3f-2a5b8e7d4c1g", id));
  }

  SECTION("Generated identifiers are unique") {
    REQUIRE(Identifier::generate() != Identifier::generate());
  }
}

TEST_CASE("Encode events", "[codec]") {
  const auto session = sessionId();

  SECTION("pong") {
    REQUIRE(Codec::encodeEvent(event::Pong{}) == "{\"type\":\"pong\"}");
  }

  SECTION("subscribed") {
    auto j = nlohmann::json::parse(Codec::encodeEvent(event::Subscribed{session}));
    REQUIRE(j["type"] == "subscribed");
    REQUIRE(j["session_id"] == SESSION_STR);
    REQUIRE(j.size() == 2);
  }

  SECTION("unsubscribed") {
    auto j = nlohmann::json::parse(Codec::encodeEvent(event::Unsubscribed{session}));
    REQUIRE(j["type"] == "unsubscribed");
    REQUIRE(j["session_id"] == SESSION_STR);
  }

  SECTION("output") {
    auto j = nlohmann::json::parse(Codec::encodeEvent(event::Output{session, OutputStream::STDERR, "hello\n"}));
    REQUIRE(j["type"] == "output");
    REQUIRE(j["session_id"] == SESSION_STR);
    REQUIRE(j["stream"] == "stderr");
    REQUIRE(j["content"] == "hello\n");
  }

  SECTION("status") {
    auto j = nlohmann::json::parse(Codec::encodeEvent(event::StatusChanged{session, SessionStatus::CANCELLED}));
    REQUIRE(j["type"] == "status");
    REQUIRE(j["status"] == "cancelled");
  }

  SECTION("error") {
    auto j = nlohmann::json::parse(Codec::encodeEvent(event::Error{"boom"}));
    REQUIRE(j["type"] == "error");
    REQUIRE(j["message"] == "boom");
  }

  SECTION("invalid UTF-8 in output content is replaced, not thrown") {
    std::string content = "ok \xff\xfe";
    REQUIRE_NOTHROW(Codec::encodeEvent(event::Output{session, OutputStream::STDOUT, content}));
  }
}

TEST_CASE("Decode commands", "[codec]") {
  const auto session = sessionId();

  SECTION("subscribe") {
    auto cmd = Codec::decodeCommand(std::string("{\"type\":\"subscribe\",\"session_id\":\"") + SESSION_STR + "\"}");
    REQUIRE(std::holds_alternative<command::Subscribe>(cmd));
    REQUIRE(std::get<command::Subscribe>(cmd).session == session);
  }

  SECTION("unsubscribe") {
    auto cmd = Codec::decodeCommand(std::string("{\"session_id\":\"") + SESSION_STR + "\",\"type\":\"unsubscribe\"}");
    REQUIRE(std::get<command::Unsubscribe>(cmd).session == session);
  }

  SECTION("cancel") {
    auto cmd = Codec::decodeCommand(std::string("{\"type\":\"cancel\",\"session_id\":\"") + SESSION_STR + "\"}");
    REQUIRE(std::get<command::Cancel>(cmd).session == session);
  }

  SECTION("ping") {
    REQUIRE(std::holds_alternative<command::Ping>(Codec::decodeCommand("{\"type\":\"ping\"}")));
  }

  SECTION("Unknown fields are ignored") {
    REQUIRE(std::holds_alternative<command::Ping>(Codec::decodeCommand("{\"type\":\"ping\",\"extra\":1}")));
  }

  SECTION("Commands survive an encode and decode") {
    Command cmd = command::Subscribe{session};
    REQUIRE(Codec::decodeCommand(Codec::encodeCommand(cmd)) == cmd);
  }
}

TEST_CASE("Decode malformed commands", "[codec]") {
  SECTION("Not JSON") {
    REQUIRE_THROWS_WITH(Codec::decodeCommand("hello"), StartsWith("Invalid message format: "));
  }

  SECTION("Not an object") {
    REQUIRE_THROWS_AS(Codec::decodeCommand("[1,2,3]"), DecodeError);
  }

  SECTION("Missing type") {
    REQUIRE_THROWS_AS(Codec::decodeCommand("{\"session_id\":\"6f1c2b7e-0b1a-4d2e-9c3f-2a5b8e7d4c10\"}"), DecodeError);
  }

  SECTION("Unknown type") {
    REQUIRE_THROWS_WITH(Codec::decodeCommand("{\"type\":\"explode\"}"), StartsWith("Invalid message format: "));
  }

  SECTION("Missing session_id") {
    REQUIRE_THROWS_AS(Codec::decodeCommand("{\"type\":\"subscribe\"}"), DecodeError);
  }

  SECTION("Invalid session_id") {
    REQUIRE_THROWS_AS(Codec::decodeCommand("{\"type\":\"subscribe\",\"session_id\":\"abc\"}"), DecodeError);
  }

  SECTION("session_id of wrong type") {
    REQUIRE_THROWS_AS(Codec::decodeCommand("{\"type\":\"subscribe\",\"session_id\":42}"), DecodeError);
  }

  SECTION("Server event sent as command") {
    REQUIRE_THROWS_AS(Codec::decodeCommand("{\"type\":\"pong\"}"), DecodeError);
  }
}

TEST_CASE("Decode events", "[codec]") {
  const auto session = sessionId();

  SECTION("output") {
    auto ev = Codec::decodeEvent(std::string("{\"type\":\"output\",\"session_id\":\"") + SESSION_STR +
                                 "\",\"stream\":\"stdout\",\"content\":\"hello\"}");
    REQUIRE(ev == Event{event::Output{session, OutputStream::STDOUT, "hello"}});
  }

  SECTION("status") {
    auto ev = Codec::decodeEvent(std::string("{\"type\":\"status\",\"session_id\":\"") + SESSION_STR +
                                 "\",\"status\":\"running\"}");
    REQUIRE(ev == Event{event::StatusChanged{session, SessionStatus::RUNNING}});
  }

  SECTION("Unknown stream") {
    REQUIRE_THROWS_AS(Codec::decodeEvent(std::string("{\"type\":\"output\",\"session_id\":\"") + SESSION_STR +
                                         "\",\"stream\":\"stdin\",\"content\":\"x\"}"),
                      DecodeError);
  }

  SECTION("Unknown status") {
    REQUIRE_THROWS_AS(Codec::decodeEvent(std::string("{\"type\":\"status\",\"session_id\":\"") + SESSION_STR +
                                         "\",\"status\":\"paused\"}"),
                      DecodeError);
  }

  SECTION("Every status name maps back to itself") {
    for (auto status : {SessionStatus::IDLE, SessionStatus::RUNNING, SessionStatus::COMPLETED,
                        SessionStatus::ERROR, SessionStatus::CANCELLED}) {
      SessionStatus parsed;
      REQUIRE(Codec::parseStatus(Codec::statusName(status), parsed));
      REQUIRE(parsed == status);
    }
  }
}
