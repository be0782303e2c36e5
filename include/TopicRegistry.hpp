#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "Common.hpp"
#include "Identifier.hpp"
#include "Topic.hpp"

namespace sessionhub {

using TopicList = std::unordered_map<SessionId, TopicPtr>;

/**
 * Session id -> topic map. Topics are created lazily on first subscribe or
 * publish and reclaimed once they have no subscribers left.
 * Lookups take a shared lock, creation and removal an exclusive one.
 */
class TopicRegistry final {
public:
  explicit TopicRegistry(std::size_t topicCapacity = DEFAULT_TOPIC_CAPACITY) : _topic_capacity(topicCapacity) {}

  TopicPtr getOrCreateSender(const SessionId& session);
  TopicPtr find(const SessionId& session);
  SubscriptionPtr subscribe(const SessionId& session);
  bool removeIfOrphaned(const SessionId& session);
  std::size_t subscriberCount(const SessionId& session);
  std::size_t size();
  void closeAll();

private:
  TopicList _topic_list;
  std::shared_mutex _topic_list_lock;
  std::size_t _topic_capacity;

  TopicPtr _getOrCreate(const SessionId& session);
};

} // namespace sessionhub
