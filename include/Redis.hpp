#pragma once

#include <sw/redis++/redis++.h>
#include <sw/redis++/subscriber.h>
#include <functional>
#include <memory>
#include <string>

#include "SessionHubBase.hpp"

namespace sessionhub {

// Receives the channel name without redis_prefix, and the raw payload.
using RedisMsgCallback = std::function<void(const std::string& channel, const std::string& msg)>;

/**
 * Subscriber side of the Redis instance producers publish session events to.
 * Channels are namespaced under redis_prefix.
 */
class Redis final : public SessionHubBase {
public:
  explicit Redis(Config& cfg);

  // Replaces any previous subscription, e.g. after the connection was lost.
  void psubscribe(const std::string& pattern, RedisMsgCallback callback);
  void consume();

  static std::string prefixed(const std::string& prefix, const std::string& key);

private:
  std::unique_ptr<sw::redis::Redis> _client;
  std::unique_ptr<sw::redis::Subscriber> _subscriber;
  std::string _prefix;
};

} // namespace sessionhub
