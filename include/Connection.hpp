#pragma once

#include <netinet/in.h>
#include <stdint.h>
#include <sys/epoll.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"
#include "Forward.hpp"
#include "Identifier.hpp"
#include "SessionHubBase.hpp"
#include "http/Parser.hpp"
#include "websocket/Parser.hpp"
#include "websocket/Types.hpp"

namespace sessionhub {
using ConnectionPtr     = std::shared_ptr<Connection>;
using ConnectionWeakPtr = std::weak_ptr<Connection>;

enum class ConnectionState {
  HTTP,
  WEBSOCKET
};

/**
 * One accepted TCP client. Starts out speaking HTTP and is either answered
 * and closed, or upgraded to a websocket that carries the session protocol.
 * Owned by the worker whose epoll instance watches it.
 */
class Connection final : public SessionHubBase, public std::enable_shared_from_this<Connection> {
public:
  Connection(int fd, const struct sockaddr_in& peer, Worker* worker, Config& cfg);
  ~Connection();

  void onReadable();
  void onWritable();

  // Queue bytes for the client. Safe to call from any thread.
  void send(std::string_view data);
  void sendFrame(std::string_view payload, websocket::FrameType frameType);

  void closeAfterFlush();
  void close();
  bool isClosed() const { return _closed; }

  int watch(uint32_t epollEvents);
  void unwatch();

  void upgrade(ConnectionHub& hub);
  void releaseSubscriptions();
  Multiplexer* getMultiplexer() { return _multiplexer.get(); }

  ConnectionState getState() const { return _state; }
  int getFd() const { return _fd; }
  const ConnectionId& getId() const { return _id; }
  const std::string& getPeerAddress() const { return _peer_address; }

  void setHttpHandler(http::ParserCallback handler);
  void setWebsocketHandler(websocket::ParserCallback handler);

private:
  int _fd;
  Worker* _worker;
  ConnectionId _id;
  std::string _peer_address;
  ConnectionState _state;
  std::atomic<bool> _closed;
  bool _close_after_flush;

  struct epoll_event _epoll_event;
  std::vector<char> _recv_buffer;
  std::string _send_buffer;
  std::size_t _send_offset;
  std::mutex _send_lock;

  std::unique_ptr<http::Parser> _http_parser;
  websocket::Parser _websocket_parser;
  std::unique_ptr<Multiplexer> _multiplexer;

  void _configureSocket();
  void _feed(char* data, std::size_t len);
  void _flushLocked();
  void _wantWritable(bool enable);
};

} // namespace sessionhub
