#pragma once

#include <stddef.h>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>

#include "Identifier.hpp"
#include "Message.hpp"

namespace sessionhub {

using TopicPtr           = std::shared_ptr<class Topic>;
using SubscriptionPtr    = std::unique_ptr<class Subscription>;
using SubscriberNotifier = std::function<void()>;

enum class RecvStatus {
  OK,
  EMPTY,
  LAGGED,
  CLOSED
};

/**
 * Fan-out channel for one session.
 * Events are kept in a ring buffer of fixed capacity. Every subscriber reads
 * through its own cursor; a subscriber that falls more than capacity events
 * behind loses the oldest ones. Publishing never waits for subscribers.
 */
class Topic final : public std::enable_shared_from_this<Topic> {
  friend class Subscription;

public:
  Topic(const SessionId& session, std::size_t capacity);
  ~Topic();

  SubscriptionPtr subscribe();
  std::size_t publish(const Event& ev);
  void close();

  std::size_t getSubscriberCount();
  const SessionId& session() const { return _session; }
  std::size_t capacity() const { return _capacity; }

private:
  SessionId _session;
  std::size_t _capacity;
  std::deque<Event> _buffer;
  uint64_t _head_seq;
  bool _is_closed;
  std::list<Subscription*> _subscriber_list;
  std::mutex _lock;

  uint64_t _nextSeq() const { return _head_seq + _buffer.size(); }
  RecvStatus _receive(Subscription* sub, Event& ev);
  void _removeSubscriber(std::list<Subscription*>::iterator it);
};

/**
 * A live handle to a topic. The topic counts it as a subscriber until the
 * handle is destroyed.
 */
class Subscription final {
  friend class Topic;

public:
  ~Subscription();

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Never blocks. LAGGED means events were dropped and the cursor moved to the oldest buffered one.
  RecvStatus tryReceive(Event& ev);

  // Called from the publishing thread, without any topic lock held. Runs once
  // immediately if something is already waiting to be received.
  void setNotifier(SubscriberNotifier notifier);

  uint64_t getLaggedCount() const { return _lagged_count; }
  const SessionId& session() const { return _topic->session(); }
  TopicPtr topic() { return _topic; }

private:
  Subscription(TopicPtr topic, uint64_t cursor);

  TopicPtr _topic;
  uint64_t _cursor;
  uint64_t _lagged_count;
  SubscriberNotifier _notifier;
  std::list<Subscription*>::iterator _topic_list_iterator;
};

} // namespace sessionhub
