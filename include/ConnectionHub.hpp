#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Common.hpp"
#include "Identifier.hpp"
#include "Message.hpp"
#include "Topic.hpp"
#include "TopicRegistry.hpp"
#include "metrics/Types.hpp"

namespace sessionhub {

using SessionSet = std::unordered_set<SessionId>;

// Sessions a single connection is subscribed to.
struct ConnectionRecord {
  SessionSet subscriptions;
};

using ConnectionRecordList = std::unordered_map<ConnectionId, ConnectionRecord>;

/**
 * Shared state of all connections: the topic registry plus one record per
 * connection. Every operation is safe to call from any thread.
 * Lock order is connection records before topic registry before topic.
 */
class ConnectionHub final {
public:
  explicit ConnectionHub(std::size_t topicCapacity = DEFAULT_TOPIC_CAPACITY) : _topic_registry(topicCapacity) {}

  void registerConnection(const ConnectionId& connectionId);
  void unregisterConnection(const ConnectionId& connectionId);

  SubscriptionPtr subscribe(const ConnectionId& connectionId, const SessionId& session);
  void unsubscribe(const ConnectionId& connectionId, const SessionId& session);

  void publish(const SessionId& session, const Event& ev);
  TopicPtr getSessionSender(const SessionId& session);
  bool hasSubscribers(const SessionId& session);
  bool reclaim(const SessionId& session);

  bool isRegistered(const ConnectionId& connectionId);
  std::vector<SessionId> listSubscriptions(const ConnectionId& connectionId);
  std::size_t getConnectionCount();
  std::size_t getTopicCount() { return _topic_registry.size(); }

  void shutdown();

  TopicRegistry& getTopicRegistry() { return _topic_registry; }
  metrics::HubMetrics& getMetrics() { return _metrics; }

private:
  TopicRegistry _topic_registry;
  ConnectionRecordList _connection_list;
  std::shared_mutex _connection_list_lock;
  metrics::HubMetrics _metrics;
};

} // namespace sessionhub
