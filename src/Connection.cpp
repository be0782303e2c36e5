#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <string>
#include <utility>

#include "Connection.hpp"
#include "ConnectionHub.hpp"
#include "ConnectionWorker.hpp"
#include "Logger.hpp"
#include "Multiplexer.hpp"
#include "websocket/Response.hpp"

namespace sessionhub {

Connection::Connection(int fd, const struct sockaddr_in& peer, Worker* worker, Config& cfg) :
  SessionHubBase(cfg), _fd(fd), _worker(worker), _id(Identifier::generate()), _state(ConnectionState::HTTP),
  _closed(false), _close_after_flush(false), _send_offset(0) {
  char ip[INET_ADDRSTRLEN] = {0};
  inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
  _peer_address = ip;

  memset(&_epoll_event, 0, sizeof(_epoll_event));
  _recv_buffer.resize(NET_READ_BUFFER_SIZE);
  _http_parser = std::make_unique<http::Parser>();

  _configureSocket();

  LOG->trace("Client {} connected as {}.", _peer_address, Identifier::toString(_id));
}

Connection::~Connection() {
  releaseSubscriptions();
  ::close(_fd);

  LOG->trace("Client {} ({}) gone.", _peer_address, Identifier::toString(_id));
}

void Connection::_configureSocket() {
  int on = 1;

  fcntl(_fd, F_SETFL, fcntl(_fd, F_GETFL, 0) | O_NONBLOCK);
  setsockopt(_fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
  setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));

#ifdef TCP_USER_TIMEOUT
  // Give up on peers that stop acknowledging data after 10 seconds.
  int userTimeout = 10000;
  setsockopt(_fd, IPPROTO_TCP, TCP_USER_TIMEOUT, &userTimeout, sizeof(userTimeout));
#endif
}

/**
 * Switch to the websocket protocol and attach a multiplexer.
 * Envelopes go out as text frames, forwarder drains run as jobs on our worker.
 */
void Connection::upgrade(ConnectionHub& hub) {
  if (_state == ConnectionState::WEBSOCKET) {
    return;
  }

  _state = ConnectionState::WEBSOCKET;

  ConnectionWeakPtr weakSelf = shared_from_this();

  auto sender = [weakSelf](const std::string& envelope) {
    auto self = weakSelf.lock();
    if (!self || self->isClosed()) {
      return false;
    }

    self->sendFrame(envelope, websocket::FrameType::TEXT_FRAME);
    return !self->isClosed();
  };

  _multiplexer = std::make_unique<Multiplexer>(hub, _id, std::move(sender), _worker->getScheduler());
  _multiplexer->open();
}

void Connection::releaseSubscriptions() {
  if (_multiplexer) {
    _multiplexer->close();
  }
}

void Connection::onReadable() {
  if (_closed) {
    return;
  }

  ssize_t n = ::recv(_fd, _recv_buffer.data(), _recv_buffer.size(), 0);

  if (n > 0) {
    _feed(_recv_buffer.data(), n);
    return;
  }

  if (n == 0) {
    LOG->trace("Client {} closed its end.", _peer_address);
    close();
  } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
    LOG->trace("Client {} read error: {}.", _peer_address, strerror(errno));
    close();
  }
}

void Connection::_feed(char* data, std::size_t len) {
  if (_state == ConnectionState::WEBSOCKET) {
    _websocket_parser.parse(data, len);
    return;
  }

  _http_parser->parse(data, len);

  // The request handler upgraded us from inside the parser callback.
  if (_state == ConnectionState::WEBSOCKET) {
    _http_parser.reset();
  }
}

void Connection::onWritable() {
  std::lock_guard<std::mutex> lock(_send_lock);
  _flushLocked();
}

void Connection::send(std::string_view data) {
  std::lock_guard<std::mutex> lock(_send_lock);

  if (_closed) {
    return;
  }

  if (_send_buffer.size() - _send_offset + data.size() > NET_WRITE_BUFFER_MAX) {
    LOG->warn("Client {} has more than {} bytes pending, disconnecting.", _peer_address, NET_WRITE_BUFFER_MAX);
    close();
    return;
  }

  _send_buffer.append(data.data(), data.size());
  _flushLocked();
}

void Connection::sendFrame(std::string_view payload, websocket::FrameType frameType) {
  send(websocket::Response::encodeFrames(payload, frameType));
}

// Caller must hold _send_lock.
void Connection::_flushLocked() {
  while (!_closed && _send_offset < _send_buffer.size()) {
    ssize_t n = ::send(_fd, _send_buffer.data() + _send_offset, _send_buffer.size() - _send_offset, MSG_NOSIGNAL);

    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }

      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        _wantWritable(true);
        return;
      }

      LOG->trace("Client {} write error: {}.", _peer_address, strerror(errno));
      close();
      return;
    }

    _send_offset += n;
  }

  _send_buffer.clear();
  _send_offset = 0;
  _wantWritable(false);

  if (_close_after_flush) {
    close();
  }
}

void Connection::closeAfterFlush() {
  std::lock_guard<std::mutex> lock(_send_lock);

  _close_after_flush = true;
  if (_send_offset >= _send_buffer.size()) {
    close();
  }
}

/**
 * Shut the socket down. The worker notices on the next event and drops us,
 * the descriptor itself is closed on destruction.
 */
void Connection::close() {
  if (_closed) {
    return;
  }

  _closed = true;
  ::shutdown(_fd, SHUT_RDWR);
}

int Connection::watch(uint32_t epollEvents) {
  _epoll_event.events  = epollEvents;
  _epoll_event.data.fd = _fd;

  return epoll_ctl(_worker->getEpollFileDescriptor(), EPOLL_CTL_ADD, _fd, &_epoll_event);
}

void Connection::unwatch() {
  epoll_ctl(_worker->getEpollFileDescriptor(), EPOLL_CTL_DEL, _fd, nullptr);
}

void Connection::_wantWritable(bool enable) {
  const bool enabled = _epoll_event.events & EPOLLOUT;

  if (enable == enabled) {
    return;
  }

  if (enable) {
    _epoll_event.events |= EPOLLOUT;
  } else {
    _epoll_event.events &= ~EPOLLOUT;
  }

  epoll_ctl(_worker->getEpollFileDescriptor(), EPOLL_CTL_MOD, _fd, &_epoll_event);
}

void Connection::setHttpHandler(http::ParserCallback handler) {
  _http_parser->setCallback(std::move(handler));
}

void Connection::setWebsocketHandler(websocket::ParserCallback handler) {
  _websocket_parser.setCallback(std::move(handler));
}

} // namespace sessionhub
