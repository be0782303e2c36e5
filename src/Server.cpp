#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fmt/format.h>
#include <sw/redis++/errors.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "Server.hpp"
#include "Common.hpp"
#include "EventIngress.hpp"
#include "Logger.hpp"
#include "Util.hpp"

namespace sessionhub {

std::atomic<bool> stopSessionHub{false};

Server::Server(Config& cfg) :
  _config(cfg), _server_socket(-1), _is_stopped(false), _hub(cfg.get<int>("topic_capacity")) {
  if (config().get<bool>("enable_redis")) {
    _redis = std::make_unique<Redis>(cfg);
  }
}

Server::~Server() {
  stop();
}

void Server::start() {
  signal(SIGPIPE, SIG_IGN);

  _listen();

  const auto count = _workerCount();
  for (unsigned int i = 1; i <= count; i++) {
    _workers.spawn(std::make_unique<Worker>(this, i));
  }

  _metrics.worker_count          = count;
  _metrics.server_start_unixtime = Util::getTimeSinceEpoch() / 1000;

  LOG->info("Started {} connection workers, websocket endpoint is {}.", count, config().get<std::string>("websocket_path"));

  if (_redis) {
    _ingestFromRedis();
  } else {
    LOG->info("Redis ingress is disabled.");
    while (!stopSessionHub) {
      _sleepUnlessStopped(EPOLL_MAX_TIMEOUT);
    }
  }

  stop();
}

unsigned int Server::_workerCount() {
  const int configured = config().get<int>("worker_threads");

  if (configured > 0) {
    return configured;
  }

  return std::max(1u, std::thread::hardware_concurrency());
}

void Server::_listen() {
  const auto address = config().get<std::string>("listen_address");
  const auto port    = config().get<int>("listen_port");

  struct sockaddr_in sin;
  memset(&sin, 0, sizeof(sin));
  sin.sin_family = AF_INET;
  sin.sin_port   = htons(port);

  if (inet_pton(AF_INET, address.c_str(), &sin.sin_addr) != 1) {
    LOG->critical("listen_address {} is not a valid IPv4 address.", address);
    exit(1);
  }

  _server_socket = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
  if (_server_socket == -1) {
    LOG->critical("socket() failed: {}.", strerror(errno));
    exit(1);
  }

  int on = 1;
  setsockopt(_server_socket, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

  if (::bind(_server_socket, reinterpret_cast<struct sockaddr*>(&sin), sizeof(sin)) == -1) {
    LOG->critical("Could not bind to {}:{}: {}.", address, port, strerror(errno));
    exit(1);
  }

  if (listen(_server_socket, SOMAXCONN) == -1) {
    LOG->critical("listen() failed: {}.", strerror(errno));
    exit(1);
  }

  LOG->info("Listening on {}:{}.", address, port);
}

void Server::_sleepUnlessStopped(std::size_t ms) {
  for (std::size_t slept = 0; slept < ms && !stopSessionHub; slept += EPOLL_MAX_TIMEOUT) {
    std::this_thread::sleep_for(std::chrono::milliseconds(std::min(EPOLL_MAX_TIMEOUT, ms - slept)));
  }
}

void Server::_subscribeRedis() {
  const auto pattern = fmt::format("{}:*", REDIS_SESSION_CHANNEL);

  _redis->psubscribe(pattern, [this](const std::string& channel, const std::string& payload) {
    _metrics.ingress_message_count++;

    if (!EventIngress::dispatch(_hub, channel, payload)) {
      _metrics.ingress_rejected_count++;
    }
  });

  LOG->info("Consuming producer events from Redis pattern {}.", Redis::prefixed(config().get<std::string>("redis_prefix"), pattern));
}

/**
 * Feed producer events from Redis into the hub until asked to stop.
 * A lost connection is retried every REDIS_RECONNECT_DELAY_MS.
 */
void Server::_ingestFromRedis() {
  bool subscribed = false;

  while (!stopSessionHub) {
    try {
      if (!subscribed) {
        _subscribeRedis();
        subscribed = true;
      }

      _redis->consume();
    } catch (sw::redis::TimeoutError&) {
      // Nothing published within the socket timeout.
    } catch (sw::redis::Error& e) {
      subscribed = false;
      _metrics.redis_connection_fail_count++;

      LOG->error("Lost Redis ingress: {} Retrying in {} ms.", e.what(), REDIS_RECONNECT_DELAY_MS);
      _sleepUnlessStopped(REDIS_RECONNECT_DELAY_MS);
    }
  }
}

void Server::stop() {
  if (_is_stopped.exchange(true)) {
    return;
  }

  LOG->info("Stopping.");

  // Close topics first so producers stop waking connections on workers being torn down.
  _hub.shutdown();
  _workers.stopAll();

  if (_server_socket != -1) {
    close(_server_socket);
    _server_socket = -1;
  }
}

metrics::AggregatedMetrics Server::getAggregatedMetrics() {
  metrics::AggregatedMetrics m;
  auto& hub = _hub.getMetrics();

  m.server_start_unixtime       = _metrics.server_start_unixtime;
  m.worker_count                = _metrics.worker_count;
  m.ingress_message_count       = _metrics.ingress_message_count;
  m.ingress_rejected_count      = _metrics.ingress_rejected_count;
  m.redis_connection_fail_count = _metrics.redis_connection_fail_count;

  m.topic_count          = _hub.getTopicCount();
  m.publish_count        = hub.publish_count;
  m.delivered_count      = hub.delivered_count;
  m.lagged_event_count   = hub.lagged_event_count;
  m.protocol_error_count = hub.protocol_error_count;

  unsigned long workers = 0;

  _workers.forEach([&](Worker& worker) {
    const auto& w = worker.getMetrics();

    m.current_connections_count += w.current_connections_count;
    m.total_connect_count += w.total_connect_count;
    m.total_disconnect_count += w.total_disconnect_count;
    m.eventloop_delay_ms += w.eventloop_delay_ms;
    workers++;
  });

  // Delay is reported as the average across workers.
  if (workers > 0) {
    m.eventloop_delay_ms /= workers;
  }

  return m;
}

} // namespace sessionhub
