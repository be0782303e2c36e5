#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ConnectionHub.hpp"
#include "Identifier.hpp"
#include "Message.hpp"
#include "Topic.hpp"

namespace sessionhub {

// Writes one encoded envelope to the connection. Returns false if the outbound path is gone.
using OutboundSender = std::function<bool(const std::string&)>;

// Runs a job on the thread that owns the multiplexer. Must be callable from any thread.
using JobScheduler = std::function<void(std::function<void()>)>;

enum class MultiplexerState {
  OPEN,
  CLOSING,
  CLOSED
};

class Multiplexer;

/**
 * Relays events from one subscription into the owning multiplexer's outbound
 * stream. Publisher threads only schedule a drain; the drain itself runs on
 * the multiplexer's thread.
 */
class Forwarder final : public std::enable_shared_from_this<Forwarder> {
public:
  Forwarder(Multiplexer& multiplexer, SubscriptionPtr subscription);
  ~Forwarder() {}

  void start();
  void drain();
  void retire();
  void resume();
  void cancel();

  bool isRetired() const { return _retired; }
  const SessionId& session() const { return _session; }

private:
  Multiplexer& _multiplexer;
  SubscriptionPtr _subscription;
  SessionId _session;
  std::shared_ptr<std::atomic<bool>> _scheduled;
  SubscriberNotifier _wakeup;
  uint64_t _lagged_reported;
  bool _retired;
  bool _cancelled;

  void _finish();
};

using ForwarderPtr  = std::shared_ptr<Forwarder>;
using ForwarderList = std::unordered_map<SessionId, ForwarderPtr>;

/**
 * Protocol state of one client connection. Decodes inbound frames into hub
 * operations and serializes acknowledgements and forwarded events into a
 * single ordered outbound stream.
 * Everything except the subscription notifiers runs on one thread.
 */
class Multiplexer final {
  friend class Forwarder;

public:
  Multiplexer(ConnectionHub& hub, const ConnectionId& connectionId, OutboundSender sender, JobScheduler scheduler);
  ~Multiplexer();

  Multiplexer(const Multiplexer&)            = delete;
  Multiplexer& operator=(const Multiplexer&) = delete;

  void open();
  void handleFrame(std::string_view data);
  void handleCommand(const Command& cmd);
  void close();

  MultiplexerState getState() const { return _state; }
  bool isOpen() const { return _state == MultiplexerState::OPEN; }
  const ConnectionId& id() const { return _connection_id; }
  std::size_t getForwarderCount() const { return _forwarder_list.size(); }

private:
  ConnectionHub& _hub;
  ConnectionId _connection_id;
  OutboundSender _sender;
  JobScheduler _scheduler;
  MultiplexerState _state;
  ForwarderList _forwarder_list;

  void _subscribe(const SessionId& session);
  void _unsubscribe(const SessionId& session);
  void _deliver(const Event& ev);
  void _removeForwarder(const SessionId& session, const Forwarder* forwarder);
};

} // namespace sessionhub
