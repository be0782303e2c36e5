#pragma once

#include <memory>

#include "Forward.hpp"
#include "SessionHubBase.hpp"

namespace sessionhub {

class HandlerContext final : public SessionHubBase {
public:
  HandlerContext(Config& cfg, Server* server, Worker* worker, std::shared_ptr<Connection> connection) :
    SessionHubBase(cfg), _server(server), _worker(worker), _connection(connection) {};

  ~HandlerContext() {}

  Server* server() { return _server; }
  Worker* worker() { return _worker; }
  std::shared_ptr<Connection> connection() { return _connection; }

private:
  Server* _server;
  Worker* _worker;
  std::shared_ptr<Connection> _connection;
};

} // namespace sessionhub
