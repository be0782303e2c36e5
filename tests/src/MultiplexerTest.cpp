#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "Codec.hpp"
#include "ConnectionHub.hpp"
#include "EventLoop.hpp"
#include "Identifier.hpp"
#include "Message.hpp"
#include "Multiplexer.hpp"
#include "catch.hpp"

using namespace sessionhub;

namespace {

// A connection whose outbound frames are collected instead of written to a socket.
struct TestClient {
  EventLoop loop;
  std::vector<Event> received;
  bool sendFails = false;
  std::unique_ptr<Multiplexer> mux;

  explicit TestClient(ConnectionHub& hub) {
    mux = std::make_unique<Multiplexer>(
        hub, Identifier::generate(),
        [this](const std::string& frame) {
          if (sendFails) {
            return false;
          }

          received.push_back(Codec::decodeEvent(frame));
          return true;
        },
        [this](std::function<void()> job) {
          loop.addJob(std::move(job));
        });

    mux->open();
  }

  void send(const Command& cmd) {
    mux->handleFrame(Codec::encodeCommand(cmd));
  }

  void pump() {
    for (int i = 0; i < 10; i++) {
      loop.processJobs();
    }
  }

  template <typename T>
  std::vector<T> all() const {
    std::vector<T> out;

    for (const auto& ev : received) {
      if (std::holds_alternative<T>(ev)) {
        out.push_back(std::get<T>(ev));
      }
    }

    return out;
  }
};

Event output(const SessionId& session, const std::string& content) {
  return event::Output{session, OutputStream::STDOUT, content};
}

} // namespace

TEST_CASE("Multiplexer commands", "[multiplexer]") {
  ConnectionHub hub;
  TestClient client(hub);
  const auto session = Identifier::generate();

  SECTION("Opening registers the connection") {
    REQUIRE(client.mux->isOpen());
    REQUIRE(hub.isRegistered(client.mux->id()));
  }

  SECTION("Ping is answered with exactly one pong") {
    client.send(command::Ping{});

    REQUIRE(client.received.size() == 1);
    REQUIRE(std::holds_alternative<event::Pong>(client.received[0]));
  }

  SECTION("Subscribe is acknowledged") {
    client.send(command::Subscribe{session});

    REQUIRE(client.received.size() == 1);
    REQUIRE(std::get<event::Subscribed>(client.received[0]).session == session);
    REQUIRE(client.mux->getForwarderCount() == 1);
    REQUIRE(hub.hasSubscribers(session));
  }

  SECTION("Malformed frames yield one error and the connection stays usable") {
    client.mux->handleFrame("this is not json");

    REQUIRE(client.received.size() == 1);
    const auto& err = std::get<event::Error>(client.received[0]);
    REQUIRE(err.message.rfind("Invalid message format: ", 0) == 0);
    REQUIRE(hub.getMetrics().protocol_error_count.load() == 1);

    client.send(command::Ping{});
    REQUIRE(client.received.size() == 2);
    REQUIRE(std::holds_alternative<event::Pong>(client.received[1]));
  }

  SECTION("Unknown command types are malformed frames") {
    client.mux->handleFrame(R"({"type":"explode"})");

    REQUIRE(client.all<event::Error>().size() == 1);
    REQUIRE(client.mux->isOpen());
  }

  SECTION("Unsubscribing from a session never subscribed to is still acknowledged") {
    client.send(command::Unsubscribe{session});

    REQUIRE(client.received.size() == 1);
    REQUIRE(std::get<event::Unsubscribed>(client.received[0]).session == session);
  }
}

TEST_CASE("Multiplexer forwarding", "[multiplexer]") {
  ConnectionHub hub;
  TestClient client(hub);
  const auto session = Identifier::generate();

  client.send(command::Subscribe{session});
  client.received.clear();

  SECTION("Events arrive in publish order") {
    for (int i = 0; i < 100; i++) {
      hub.publish(session, output(session, std::to_string(i)));
    }

    client.pump();

    auto outputs = client.all<event::Output>();
    REQUIRE(outputs.size() == 100);
    for (int i = 0; i < 100; i++) {
      REQUIRE(outputs[i].content == std::to_string(i));
    }
  }

  SECTION("Events of other sessions are not forwarded") {
    const auto other = Identifier::generate();
    hub.publish(other, output(other, "elsewhere"));
    client.pump();

    REQUIRE(client.received.empty());
  }

  SECTION("Subscribing twice does not duplicate delivery") {
    client.send(command::Subscribe{session});
    hub.publish(session, output(session, "once"));
    client.pump();

    REQUIRE(client.all<event::Subscribed>().size() == 1);
    REQUIRE(client.all<event::Output>().size() == 1);
    REQUIRE(client.mux->getForwarderCount() == 1);
  }

  SECTION("Unsubscribe stops forwarding and reclaims the topic") {
    client.send(command::Unsubscribe{session});
    REQUIRE(std::holds_alternative<event::Unsubscribed>(client.received.back()));

    client.pump();
    REQUIRE(client.mux->getForwarderCount() == 0);
    REQUIRE_FALSE(hub.hasSubscribers(session));
    REQUIRE(hub.getTopicCount() == 0);

    hub.publish(session, output(session, "late"));
    client.pump();
    REQUIRE(client.all<event::Output>().empty());
  }

  SECTION("Events buffered before unsubscribe may still follow the acknowledgement") {
    hub.publish(session, output(session, "buffered"));
    client.send(command::Unsubscribe{session});
    client.pump();

    REQUIRE(client.received.size() == 2);
    REQUIRE(std::holds_alternative<event::Unsubscribed>(client.received[0]));
    REQUIRE(std::get<event::Output>(client.received[1]).content == "buffered");
    REQUIRE(client.mux->getForwarderCount() == 0);
  }

  SECTION("Resubscribing before the drain keeps the forwarder") {
    client.send(command::Unsubscribe{session});
    client.send(command::Subscribe{session});
    client.pump();

    REQUIRE(client.mux->getForwarderCount() == 1);

    hub.publish(session, output(session, "still here"));
    client.pump();
    REQUIRE(client.all<event::Output>().size() == 1);
  }

  SECTION("Status events are forwarded") {
    hub.publish(session, event::StatusChanged{session, SessionStatus::COMPLETED});
    client.pump();

    REQUIRE(client.received.size() == 1);
    REQUIRE(std::get<event::StatusChanged>(client.received[0]).status == SessionStatus::COMPLETED);
  }
}

TEST_CASE("Multiplexer fan-out", "[multiplexer]") {
  for (int n : {1, 2, 5}) {
    ConnectionHub hub;
    const auto session = Identifier::generate();
    std::vector<std::unique_ptr<TestClient>> clients;

    for (int i = 0; i < n; i++) {
      clients.push_back(std::make_unique<TestClient>(hub));
      clients.back()->send(command::Subscribe{session});
    }

    const event::Output boom{session, OutputStream::STDERR, "boom"};
    hub.publish(session, boom);

    for (auto& client : clients) {
      client->pump();
      auto outputs = client->all<event::Output>();
      REQUIRE(outputs.size() == 1);
      REQUIRE(outputs[0] == boom);
    }
  }
}

TEST_CASE("Multiplexer cancel", "[multiplexer]") {
  ConnectionHub hub;
  TestClient requester(hub);
  TestClient watcher(hub);
  const auto session = Identifier::generate();

  requester.send(command::Subscribe{session});
  watcher.send(command::Subscribe{session});

  requester.send(command::Cancel{session});
  requester.pump();
  watcher.pump();

  for (auto* client : {&requester, &watcher}) {
    auto statuses = client->all<event::StatusChanged>();
    REQUIRE(statuses.size() == 1);
    REQUIRE(statuses[0].session == session);
    REQUIRE(statuses[0].status == SessionStatus::CANCELLED);
  }
}

TEST_CASE("Multiplexer lagging subscriber", "[multiplexer]") {
  ConnectionHub hub(4);
  TestClient client(hub);
  const auto session = Identifier::generate();

  client.send(command::Subscribe{session});

  for (int i = 0; i < 10; i++) {
    hub.publish(session, output(session, std::to_string(i)));
  }

  client.pump();

  auto outputs = client.all<event::Output>();
  REQUIRE(outputs.size() == 4);
  REQUIRE(outputs.front().content == "6");
  REQUIRE(outputs.back().content == "9");
  REQUIRE(hub.getMetrics().lagged_event_count.load() == 6);
  REQUIRE(client.mux->isOpen());
}

TEST_CASE("Multiplexer teardown", "[multiplexer]") {
  ConnectionHub hub;
  const auto session = Identifier::generate();

  SECTION("A failed send closes the connection") {
    TestClient client(hub);
    client.send(command::Subscribe{session});
    client.sendFails = true;

    hub.publish(session, output(session, "undeliverable"));
    client.pump();

    REQUIRE(client.mux->getState() == MultiplexerState::CLOSED);
    REQUIRE_FALSE(hub.isRegistered(client.mux->id()));
    REQUIRE_FALSE(hub.hasSubscribers(session));
    REQUIRE(hub.getTopicCount() == 0);
  }

  SECTION("close releases every subscription") {
    TestClient client(hub);
    const auto other = Identifier::generate();

    client.send(command::Subscribe{session});
    client.send(command::Subscribe{other});

    // Leaves a drain job queued for after the close.
    hub.publish(session, output(session, "pending"));
    client.mux->close();

    REQUIRE(client.mux->getForwarderCount() == 0);
    REQUIRE(hub.getConnectionCount() == 0);
    REQUIRE(hub.getTopicCount() == 0);

    client.received.clear();
    client.pump();
    REQUIRE(client.received.empty());
  }

  SECTION("Commands after close are ignored") {
    TestClient client(hub);
    client.mux->close();
    client.send(command::Ping{});

    REQUIRE(client.received.empty());
  }

  SECTION("Destroying the multiplexer unregisters it") {
    {
      TestClient client(hub);
      client.send(command::Subscribe{session});
    }

    REQUIRE(hub.getConnectionCount() == 0);
    REQUIRE_FALSE(hub.hasSubscribers(session));
  }

  SECTION("Other connections keep their subscriptions") {
    TestClient leaving(hub);
    TestClient staying(hub);

    leaving.send(command::Subscribe{session});
    staying.send(command::Subscribe{session});
    leaving.mux->close();

    hub.publish(session, output(session, "for the one left"));
    staying.pump();

    REQUIRE(staying.all<event::Output>().size() == 1);
    REQUIRE(hub.getConnectionCount() == 1);
  }
}
