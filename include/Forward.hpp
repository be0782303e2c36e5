#pragma once

// Forward declarations shared by headers that only pass these types around.
namespace sessionhub {

class Config;
class Connection;
class ConnectionHub;
class HandlerContext;
class Multiplexer;
class Server;
class Worker;

namespace http {
class Parser;
class Response;
} // namespace http

} // namespace sessionhub
