#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ConnectionWorker.hpp"
#include "Common.hpp"
#include "Connection.hpp"
#include "HandlerContext.hpp"
#include "Logger.hpp"
#include "Server.hpp"
#include "Util.hpp"
#include "http/Handler.hpp"
#include "websocket/Handler.hpp"

namespace sessionhub {

Worker::Worker(Server* srv, unsigned int workerId) :
  SessionHubBase(srv->config()), _worker_id(workerId), _server(srv), _ev(std::make_shared<EventLoop>()),
  _delay_sample_start(0) {
  _epoll_fd = epoll_create1(0);
}

Worker::~Worker() {
  ConnectionTable connections;

  {
    std::lock_guard<std::mutex> lock(_connections_lock);
    connections.swap(_connections);
  }

  // Pending jobs may still hold on to connections, release hub state now.
  for (auto& it : connections) {
    it.second->releaseSubscriptions();
  }

  connections.clear();

  if (_epoll_fd != -1) {
    close(_epoll_fd);
  }

  LOG->debug("Worker {} shut down.", _worker_id);
}

void Worker::addTimer(int64_t delay, std::function<void(TimerCtx* ctx)> callback, bool repeat) {
  _ev->addTimer(delay, std::move(callback), repeat);
}

void Worker::addJob(std::function<void()> job) {
  _ev->addJob(std::move(job));
}

void Worker::_accept() {
  struct sockaddr_in peer;
  socklen_t peerLen = sizeof(peer);

  memset(&peer, 0, sizeof(peer));
  int fd = accept(_server->getServerSocket(), reinterpret_cast<struct sockaddr*>(&peer), &peerLen);

  if (fd == -1) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }

    if (errno == EMFILE || errno == ENFILE) {
      LOG->error("Out of file descriptors, can not accept more connections.");
    } else {
      LOG->error("accept() failed: {}.", strerror(errno));
    }

    return;
  }

  Worker* target = _server->nextWorker();
  (target ? target : this)->adopt(fd, peer);
}

void Worker::adopt(int fd, const struct sockaddr_in& peer) {
  auto conn = std::make_shared<Connection>(fd, peer, this, config());

  _installHandlers(conn);

  {
    std::lock_guard<std::mutex> lock(_connections_lock);

    if (conn->watch(EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR) == -1) {
      LOG->warn("Could not add client {} to epoll: {}.", conn->getPeerAddress(), strerror(errno));
      return;
    }

    _connections[fd] = conn;
  }

  _armTimers(conn);

  _metrics.current_connections_count++;
  _metrics.total_connect_count++;

  LOG->trace("Client {} assigned to worker {}.", conn->getPeerAddress(), _worker_id);
}

void Worker::_installHandlers(const ConnectionPtr& conn) {
  ConnectionWeakPtr weakConn = conn;

  conn->setHttpHandler([this, weakConn](http::Parser* req, http::RequestState state) {
    if (auto c = weakConn.lock()) {
      http::Handler::HandleRequest(HandlerContext(_config, _server, this, c), req, state);
    }
  });

  conn->setWebsocketHandler([this, weakConn](websocket::ParserStatus status, websocket::FrameType frameType, const std::string& data) {
    if (auto c = weakConn.lock()) {
      websocket::Handler::HandleRequest(HandlerContext(_config, _server, this, c), status, frameType, data);
    }
  });
}

/**
 * Handshake deadline and keepalive pings for a new client.
 */
void Worker::_armTimers(const ConnectionPtr& conn) {
  ConnectionWeakPtr weakConn = conn;
  const int handshakeTimeout = config().get<int>("handshake_timeout");
  const int pingInterval     = config().get<int>("ping_interval");

  addTimer(handshakeTimeout * 1000, [weakConn, handshakeTimeout](TimerCtx*) {
    auto c = weakConn.lock();

    if (c && !c->isClosed() && c->getState() != ConnectionState::WEBSOCKET) {
      LOG->debug("Client {} did not finish a request within {} seconds.", c->getPeerAddress(), handshakeTimeout);
      c->close();
    }
  });

  if (pingInterval <= 0) {
    return;
  }

  addTimer(
      pingInterval * 1000, [weakConn](TimerCtx* ctx) {
        auto c = weakConn.lock();

        if (!c || c->isClosed()) {
          ctx->repeat = false;
          return;
        }

        if (c->getState() == ConnectionState::WEBSOCKET) {
          c->sendFrame("", websocket::FrameType::PING_FRAME);
        }
      },
      true);
}

ConnectionPtr Worker::_lookup(int fd) {
  std::lock_guard<std::mutex> lock(_connections_lock);
  auto it = _connections.find(fd);

  return it == _connections.end() ? nullptr : it->second;
}

/**
 * Forget a closed client and release its subscriptions.
 */
void Worker::_drop(const ConnectionPtr& conn) {
  conn->releaseSubscriptions();
  conn->unwatch();

  {
    std::lock_guard<std::mutex> lock(_connections_lock);
    _connections.erase(conn->getFd());
  }

  _metrics.current_connections_count--;
  _metrics.total_disconnect_count++;
}

void Worker::_handleEvent(const struct epoll_event& event) {
  if (event.data.fd == _server->getServerSocket()) {
    if (event.events & EPOLLIN) {
      _accept();
    }
    return;
  }

  auto conn = _lookup(event.data.fd);
  if (!conn) {
    return;
  }

  if (event.events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) {
    conn->close();
  }

  if (!conn->isClosed() && (event.events & EPOLLOUT)) {
    conn->onWritable();
  }

  if (!conn->isClosed() && (event.events & EPOLLIN)) {
    conn->onReadable();
  }

  if (conn->isClosed()) {
    _drop(conn);
  }
}

// How late the delay sampling timer fires is how busy this loop is.
void Worker::_sampleDelay() {
  const auto now  = Util::getTimeSinceEpoch();
  const auto late = now - _delay_sample_start - static_cast<int64_t>(METRIC_DELAY_SAMPLE_RATE_MS);

  _metrics.eventloop_delay_ms = late < 0 ? 0 : late;
  _delay_sample_start         = now;
}

void Worker::_workerMain() {
  std::vector<struct epoll_event> events(MAXEVENTS);

  if (_epoll_fd == -1) {
    LOG->critical("epoll_create1() failed in worker {}: {}.", _worker_id, strerror(errno));
    exit(1);
  }

  struct epoll_event listener;
  memset(&listener, 0, sizeof(listener));
  listener.events  = EPOLLIN | EPOLLEXCLUSIVE;
  listener.data.fd = _server->getServerSocket();

  if (epoll_ctl(_epoll_fd, EPOLL_CTL_ADD, listener.data.fd, &listener) == -1) {
    LOG->critical("Worker {} could not watch the listening socket: {}.", _worker_id, strerror(errno));
    exit(1);
  }

  _delay_sample_start = Util::getTimeSinceEpoch();
  _ev->addTimer(METRIC_DELAY_SAMPLE_RATE_MS, [this](TimerCtx*) { _sampleDelay(); }, true);

  LOG->debug("Worker {} started.", _worker_id);

  while (!stopRequested()) {
    const auto nextTimer = static_cast<std::size_t>(_ev->getNextTimerDelay().count());
    const int timeout    = static_cast<int>(_ev->hasWork() && nextTimer < EPOLL_MAX_TIMEOUT ? nextTimer : EPOLL_MAX_TIMEOUT);

    int n = epoll_wait(_epoll_fd, events.data(), static_cast<int>(events.size()), timeout);

    if (n == -1 && errno != EINTR) {
      LOG->error("epoll_wait() failed in worker {}: {}.", _worker_id, strerror(errno));
    }

    for (int i = 0; i < n; i++) {
      _handleEvent(events[i]);
    }

    _ev->process();
  }
}

} // namespace sessionhub
