#include "ConnectionHub.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

#include "Logger.hpp"

namespace sessionhub {

void ConnectionHub::registerConnection(const ConnectionId& connectionId) {
  std::unique_lock<std::shared_mutex> lock(_connection_list_lock);
  _connection_list.emplace(connectionId, ConnectionRecord());
  LOG->trace("Registered connection {}.", Identifier::toString(connectionId));
}

/**
 * Forget a connection and reclaim every topic it was the last subscriber of.
 * Subscription handles owned by the connection must be released before this
 * is called for the reclaim to take effect.
 */
void ConnectionHub::unregisterConnection(const ConnectionId& connectionId) {
  SessionSet sessions;

  {
    std::unique_lock<std::shared_mutex> lock(_connection_list_lock);
    auto it = _connection_list.find(connectionId);
    if (it == _connection_list.end()) {
      return;
    }

    sessions.swap(it->second.subscriptions);
    _connection_list.erase(it);
  }

  for (const auto& session : sessions) {
    _topic_registry.removeIfOrphaned(session);
  }

  LOG->trace("Unregistered connection {}.", Identifier::toString(connectionId));
}

/**
 * Subscribe a connection to a session.
 * @returns A live subscription handle. The topic is created if it does not exist.
 */
SubscriptionPtr ConnectionHub::subscribe(const ConnectionId& connectionId, const SessionId& session) {
  std::unique_lock<std::shared_mutex> lock(_connection_list_lock);
  auto sub = _topic_registry.subscribe(session);

  auto it = _connection_list.find(connectionId);
  if (it != _connection_list.end()) {
    it->second.subscriptions.insert(session);
  }

  return sub;
}

/**
 * Drop a session from the connection's subscription set.
 * The caller is responsible for releasing the subscription handle and then
 * calling reclaim().
 */
void ConnectionHub::unsubscribe(const ConnectionId& connectionId, const SessionId& session) {
  std::unique_lock<std::shared_mutex> lock(_connection_list_lock);
  auto it = _connection_list.find(connectionId);

  if (it != _connection_list.end()) {
    it->second.subscriptions.erase(session);
  }
}

/**
 * Publish an event to all subscribers of a session.
 * Never blocks on slow subscribers. Publishing to a session nobody listens to
 * is not an error; the event is dropped.
 */
void ConnectionHub::publish(const SessionId& session, const Event& ev) {
  auto topic = _topic_registry.find(session);
  if (!topic) {
    topic = _topic_registry.getOrCreateSender(session);
  }

  _metrics.publish_count++;

  const bool delivered = topic->publish(ev) > 0;

  // Our own reference would keep the topic from being reclaimed.
  topic.reset();

  if (!delivered) {
    _topic_registry.removeIfOrphaned(session);
  }
}

TopicPtr ConnectionHub::getSessionSender(const SessionId& session) {
  return _topic_registry.getOrCreateSender(session);
}

bool ConnectionHub::hasSubscribers(const SessionId& session) {
  return _topic_registry.subscriberCount(session) > 0;
}

bool ConnectionHub::reclaim(const SessionId& session) {
  return _topic_registry.removeIfOrphaned(session);
}

bool ConnectionHub::isRegistered(const ConnectionId& connectionId) {
  std::shared_lock<std::shared_mutex> lock(_connection_list_lock);
  return _connection_list.find(connectionId) != _connection_list.end();
}

std::vector<SessionId> ConnectionHub::listSubscriptions(const ConnectionId& connectionId) {
  std::vector<SessionId> sessions;
  std::shared_lock<std::shared_mutex> lock(_connection_list_lock);

  auto it = _connection_list.find(connectionId);
  if (it != _connection_list.end()) {
    sessions.assign(it->second.subscriptions.begin(), it->second.subscriptions.end());
  }

  return sessions;
}

std::size_t ConnectionHub::getConnectionCount() {
  std::shared_lock<std::shared_mutex> lock(_connection_list_lock);
  return _connection_list.size();
}

/**
 * Close every topic so subscribers drain and finish.
 */
void ConnectionHub::shutdown() {
  _topic_registry.closeAll();
}

} // namespace sessionhub
