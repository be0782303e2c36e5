#include "Topic.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "Common.hpp"

namespace sessionhub {

Topic::Topic(const SessionId& session, std::size_t capacity) :
  _session(session), _capacity(capacity > 0 ? capacity : 1), _head_seq(0), _is_closed(false) {}

Topic::~Topic() {}

/**
 * Add a subscriber to this topic.
 * The returned handle receives events published after this call returns.
 */
SubscriptionPtr Topic::subscribe() {
  std::lock_guard<std::mutex> lock(_lock);

  SubscriptionPtr sub(new Subscription(shared_from_this(), _nextSeq()));
  sub->_topic_list_iterator = _subscriber_list.insert(_subscriber_list.end(), sub.get());

  return sub;
}

/**
 * Publish an event to every current subscriber.
 * @param ev Event to publish.
 * @returns Number of subscribers that were notified.
 */
std::size_t Topic::publish(const Event& ev) {
  std::vector<SubscriberNotifier> notifiers;

  {
    std::lock_guard<std::mutex> lock(_lock);

    // Nobody can ever read it.
    if (_is_closed || _subscriber_list.empty()) {
      return 0;
    }

    _buffer.push_back(ev);

    if (_buffer.size() > _capacity) {
      _buffer.pop_front();
      _head_seq++;
    }

    notifiers.reserve(_subscriber_list.size());
    for (auto sub : _subscriber_list) {
      if (sub->_notifier) {
        notifiers.push_back(sub->_notifier);
      }
    }
  }

  for (auto& notify : notifiers) {
    notify();
  }

  return notifiers.size();
}

/**
 * Close the topic. Subscribers drain what is buffered and then see CLOSED.
 */
void Topic::close() {
  std::vector<SubscriberNotifier> notifiers;

  {
    std::lock_guard<std::mutex> lock(_lock);
    _is_closed = true;

    for (auto sub : _subscriber_list) {
      if (sub->_notifier) {
        notifiers.push_back(sub->_notifier);
      }
    }
  }

  for (auto& notify : notifiers) {
    notify();
  }
}

/**
 * Returns the number of subscribers on the topic.
 */
std::size_t Topic::getSubscriberCount() {
  std::lock_guard<std::mutex> lock(_lock);
  return _subscriber_list.size();
}

RecvStatus Topic::_receive(Subscription* sub, Event& ev) {
  std::lock_guard<std::mutex> lock(_lock);

  if (sub->_cursor < _head_seq) {
    sub->_lagged_count += _head_seq - sub->_cursor;
    sub->_cursor = _head_seq;
    return RecvStatus::LAGGED;
  }

  if (sub->_cursor < _nextSeq()) {
    ev = _buffer[sub->_cursor - _head_seq];
    sub->_cursor++;

    // Release events every subscriber has seen.
    uint64_t minCursor = sub->_cursor;
    for (auto s : _subscriber_list) {
      if (s->_cursor < minCursor) {
        minCursor = s->_cursor;
      }
    }

    while (_head_seq < minCursor && !_buffer.empty()) {
      _buffer.pop_front();
      _head_seq++;
    }

    return RecvStatus::OK;
  }

  return _is_closed ? RecvStatus::CLOSED : RecvStatus::EMPTY;
}

void Topic::_removeSubscriber(std::list<Subscription*>::iterator it) {
  std::lock_guard<std::mutex> lock(_lock);
  _subscriber_list.erase(it);

  if (_subscriber_list.empty()) {
    _buffer.clear();
    _head_seq = 0;
  }
}

Subscription::Subscription(TopicPtr topic, uint64_t cursor) :
  _topic(std::move(topic)), _cursor(cursor), _lagged_count(0) {}

Subscription::~Subscription() {
  _topic->_removeSubscriber(_topic_list_iterator);
}

RecvStatus Subscription::tryReceive(Event& ev) {
  return _topic->_receive(this, ev);
}

/**
 * Install the wakeup callback. Fires it right away if events were published
 * (or the topic was closed) before it was installed.
 */
void Subscription::setNotifier(SubscriberNotifier notifier) {
  SubscriberNotifier pending;

  {
    std::lock_guard<std::mutex> lock(_topic->_lock);
    _notifier = std::move(notifier);

    if (_notifier && (_cursor < _topic->_nextSeq() || _topic->_is_closed)) {
      pending = _notifier;
    }
  }

  if (pending) {
    pending();
  }
}

} // namespace sessionhub
