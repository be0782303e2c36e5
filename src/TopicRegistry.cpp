#include "TopicRegistry.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "Logger.hpp"

namespace sessionhub {

// Caller must hold _topic_list_lock exclusively.
TopicPtr TopicRegistry::_getOrCreate(const SessionId& session) {
  auto it = _topic_list.find(session);

  if (it == _topic_list.end()) {
    it = _topic_list.insert(std::make_pair(session, std::make_shared<Topic>(session, _topic_capacity))).first;
    LOG->trace("Created topic for session {}.", Identifier::toString(session));
  }

  return it->second;
}

/**
 * Get the topic for a session, creating it if it does not exist.
 * @param session Session id.
 */
TopicPtr TopicRegistry::getOrCreateSender(const SessionId& session) {
  {
    std::shared_lock<std::shared_mutex> lock(_topic_list_lock);
    auto it = _topic_list.find(session);
    if (it != _topic_list.end()) {
      return it->second;
    }
  }

  std::unique_lock<std::shared_mutex> lock(_topic_list_lock);
  return _getOrCreate(session);
}

/**
 * Look up a topic without creating it.
 * @returns nullptr if the session has no topic.
 */
TopicPtr TopicRegistry::find(const SessionId& session) {
  std::shared_lock<std::shared_mutex> lock(_topic_list_lock);
  auto it = _topic_list.find(session);

  return it == _topic_list.end() ? nullptr : it->second;
}

/**
 * Subscribe to a session's topic, creating the topic if needed.
 * Creation and subscription happen under the same exclusive lock as removal
 * so a topic can not be reclaimed between the two.
 */
SubscriptionPtr TopicRegistry::subscribe(const SessionId& session) {
  std::unique_lock<std::shared_mutex> lock(_topic_list_lock);
  return _getOrCreate(session)->subscribe();
}

/**
 * Remove the topic for a session if nobody is subscribed to it and nobody
 * else holds a handle to it, e.g. a producer kept from getOrCreateSender().
 * @returns true if a topic was removed.
 */
bool TopicRegistry::removeIfOrphaned(const SessionId& session) {
  std::unique_lock<std::shared_mutex> lock(_topic_list_lock);
  auto it = _topic_list.find(session);

  if (it == _topic_list.end() || it->second.use_count() > 1 || it->second->getSubscriberCount() > 0) {
    return false;
  }

  _topic_list.erase(it);
  LOG->trace("Removed orphaned topic for session {}.", Identifier::toString(session));

  return true;
}

std::size_t TopicRegistry::subscriberCount(const SessionId& session) {
  auto topic = find(session);
  return topic ? topic->getSubscriberCount() : 0;
}

std::size_t TopicRegistry::size() {
  std::shared_lock<std::shared_mutex> lock(_topic_list_lock);
  return _topic_list.size();
}

/**
 * Close every topic and forget about them.
 */
void TopicRegistry::closeAll() {
  TopicList topics;

  {
    std::unique_lock<std::shared_mutex> lock(_topic_list_lock);
    topics.swap(_topic_list);
  }

  for (auto& topic : topics) {
    topic.second->close();
  }
}

} // namespace sessionhub
