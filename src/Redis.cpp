#include "Redis.hpp"

#include <sw/redis++/redis++.h>
#include <chrono>
#include <memory>
#include <string>

#include "Config.hpp"

namespace sessionhub {

Redis::Redis(Config& cfg) : SessionHubBase(cfg), _prefix(cfg.get<std::string>("redis_prefix")) {
  sw::redis::ConnectionOptions opts;
  opts.host           = config().get<std::string>("redis_host");
  opts.port           = config().get<int>("redis_port");
  opts.password       = config().get<std::string>("redis_password");
  opts.keep_alive     = true;
  opts.socket_timeout = std::chrono::seconds(5);

  sw::redis::ConnectionPoolOptions pool;
  pool.size         = static_cast<std::size_t>(config().get<int>("redis_pool_size"));
  pool.wait_timeout = std::chrono::seconds(5);

  _client = std::make_unique<sw::redis::Redis>(opts, pool);
}

std::string Redis::prefixed(const std::string& prefix, const std::string& key) {
  return prefix.empty() ? key : prefix + ":" + key;
}

void Redis::psubscribe(const std::string& pattern, RedisMsgCallback callback) {
  _subscriber = std::make_unique<sw::redis::Subscriber>(_client->subscriber());

  const std::size_t strip = _prefix.empty() ? 0 : _prefix.size() + 1;

  _subscriber->on_pmessage([strip, callback](std::string, std::string channel, std::string msg) {
    callback(channel.size() > strip ? channel.substr(strip) : channel, msg);
  });

  _subscriber->psubscribe(prefixed(_prefix, pattern));
}

// Blocks until one message arrives or the socket times out (sw::redis::TimeoutError).
void Redis::consume() {
  _subscriber->consume();
}

} // namespace sessionhub
