#include "Multiplexer.hpp"

#include <utility>

#include "Codec.hpp"
#include "Config.hpp"
#include "Logger.hpp"

namespace sessionhub {

Forwarder::Forwarder(Multiplexer& multiplexer, SubscriptionPtr subscription) :
  _multiplexer(multiplexer), _subscription(std::move(subscription)), _lagged_reported(0),
  _retired(false), _cancelled(false) {
  _session   = _subscription->session();
  _scheduled = std::make_shared<std::atomic<bool>>(false);
}

/**
 * Hook the subscription up to the multiplexer's scheduler.
 * Wakeups are coalesced: at most one drain job is pending at any time.
 */
void Forwarder::start() {
  std::weak_ptr<Forwarder> weakSelf = shared_from_this();
  auto scheduled                    = _scheduled;
  auto scheduler                    = _multiplexer._scheduler;

  // Runs on publisher threads. Must not touch the forwarder itself.
  _wakeup = [weakSelf, scheduled, scheduler]() {
    if (scheduled->exchange(true)) {
      return;
    }

    scheduler([weakSelf, scheduled]() {
      scheduled->store(false);

      if (auto self = weakSelf.lock()) {
        self->drain();
      }
    });
  };

  _subscription->setNotifier(_wakeup);
}

/**
 * Relay everything currently buffered for this subscription.
 */
void Forwarder::drain() {
  if (_cancelled || !_subscription) {
    return;
  }

  // The multiplexer may drop its reference while we deliver.
  auto self = shared_from_this();
  Event ev;

  while (!_cancelled) {
    switch (_subscription->tryReceive(ev)) {
      case RecvStatus::OK:
        _multiplexer._deliver(ev);
        break;

      case RecvStatus::LAGGED: {
        auto lagged = _subscription->getLaggedCount();
        LOG->debug("Connection {} lagged behind on session {}, skipped {} events.",
                   Identifier::toString(_multiplexer.id()), Identifier::toString(_session), lagged - _lagged_reported);
        _multiplexer._hub.getMetrics().lagged_event_count += lagged - _lagged_reported;
        _lagged_reported = lagged;
        break;
      }

      case RecvStatus::EMPTY:
        if (_retired) {
          _finish();
        }
        return;

      case RecvStatus::CLOSED:
        _finish();
        return;
    }
  }
}

/**
 * Stop after what is already buffered has been delivered.
 */
void Forwarder::retire() {
  _retired = true;

  if (_wakeup) {
    _wakeup();
  }
}

void Forwarder::resume() {
  _retired = false;
}

void Forwarder::cancel() {
  _cancelled = true;
  _subscription.reset();
}

void Forwarder::_finish() {
  _cancelled = true;
  _subscription.reset();
  _multiplexer._removeForwarder(_session, this);
}

Multiplexer::Multiplexer(ConnectionHub& hub, const ConnectionId& connectionId, OutboundSender sender, JobScheduler scheduler) :
  _hub(hub), _connection_id(connectionId), _sender(std::move(sender)), _scheduler(std::move(scheduler)),
  _state(MultiplexerState::CLOSED) {}

Multiplexer::~Multiplexer() {
  close();
}

/**
 * Register the connection with the hub and start accepting commands.
 */
void Multiplexer::open() {
  if (_state == MultiplexerState::OPEN) {
    return;
  }

  _hub.registerConnection(_connection_id);
  _state = MultiplexerState::OPEN;
  LOG->debug("Connection {} opened.", Identifier::toString(_connection_id));
}

/**
 * Decode and dispatch one inbound text frame.
 * Malformed input is answered with an error envelope and the connection stays open.
 */
void Multiplexer::handleFrame(std::string_view data) {
  if (!isOpen()) {
    return;
  }

  Command cmd;

  try {
    cmd = Codec::decodeCommand(data);
  } catch (DecodeError& e) {
    LOG->debug("Connection {} sent a malformed frame: {}", Identifier::toString(_connection_id), e.what());
    _hub.getMetrics().protocol_error_count++;
    _deliver(event::Error{e.what()});
    return;
  }

  handleCommand(cmd);
}

void Multiplexer::handleCommand(const Command& cmd) {
  if (!isOpen()) {
    return;
  }

  std::visit(overload{
                 [&](const command::Subscribe& c) {
                   _subscribe(c.session);
                 },
                 [&](const command::Unsubscribe& c) {
                   _unsubscribe(c.session);
                 },
                 [&](const command::Cancel& c) {
                   LOG->debug("Connection {} requested cancel of session {}.",
                             Identifier::toString(_connection_id), Identifier::toString(c.session));
                   _hub.publish(c.session, event::StatusChanged{c.session, SessionStatus::CANCELLED});
                 },
                 [&](const command::Ping&) {
                   _deliver(event::Pong{});
                 }},
             cmd);
}

void Multiplexer::_subscribe(const SessionId& session) {
  LOG->debug("Connection {} subscribing to session {}.", Identifier::toString(_connection_id), Identifier::toString(session));

  auto sub = _hub.subscribe(_connection_id, session);
  auto it  = _forwarder_list.find(session);

  if (it != _forwarder_list.end()) {
    // Already forwarding this session, the new handle is released on return.
    it->second->resume();
  } else {
    auto forwarder = std::make_shared<Forwarder>(*this, std::move(sub));
    _forwarder_list.insert(std::make_pair(session, forwarder));
    forwarder->start();
  }

  _deliver(event::Subscribed{session});
}

/**
 * Events already buffered for the session may still arrive after the
 * acknowledgement.
 */
void Multiplexer::_unsubscribe(const SessionId& session) {
  LOG->debug("Connection {} unsubscribing from session {}.", Identifier::toString(_connection_id), Identifier::toString(session));

  _hub.unsubscribe(_connection_id, session);

  auto it = _forwarder_list.find(session);
  if (it != _forwarder_list.end()) {
    it->second->retire();
  }

  _deliver(event::Unsubscribed{session});
}

void Multiplexer::_deliver(const Event& ev) {
  if (!isOpen()) {
    return;
  }

  if (!_sender(Codec::encodeEvent(ev))) {
    LOG->debug("Outbound path of connection {} is gone.", Identifier::toString(_connection_id));
    close();
    return;
  }

  _hub.getMetrics().delivered_count++;
}

void Multiplexer::_removeForwarder(const SessionId& session, const Forwarder* forwarder) {
  auto it = _forwarder_list.find(session);

  if (it != _forwarder_list.end() && it->second.get() == forwarder) {
    _forwarder_list.erase(it);
  }

  if (isOpen()) {
    _hub.unsubscribe(_connection_id, session);
    _hub.reclaim(session);
  }
}

/**
 * Tear down every forwarder and unregister from the hub.
 * Safe to call more than once.
 */
void Multiplexer::close() {
  if (_state != MultiplexerState::OPEN) {
    return;
  }

  _state = MultiplexerState::CLOSING;

  ForwarderList forwarders;
  forwarders.swap(_forwarder_list);

  for (auto& forwarder : forwarders) {
    forwarder.second->cancel();
  }

  forwarders.clear();

  _hub.unregisterConnection(_connection_id);
  _state = MultiplexerState::CLOSED;

  LOG->debug("Connection {} closed.", Identifier::toString(_connection_id));
}

} // namespace sessionhub
