#ifndef INCLUDE_SERVER_HPP_
#define INCLUDE_SERVER_HPP_

#include <atomic>
#include <memory>
#include <string>

#include "Config.hpp"
#include "ConnectionHub.hpp"
#include "ConnectionWorker.hpp"
#include "Redis.hpp"
#include "Worker.hpp"
#include "metrics/Types.hpp"

namespace sessionhub {

// Set from the signal handler, polled by the main thread.
extern std::atomic<bool> stopSessionHub;

/**
 * Owns the listening socket, the connection workers, the hub they share and
 * the optional Redis ingress. start() blocks until stopSessionHub is set.
 */
class Server final {
public:
  explicit Server(Config& cfg);
  ~Server();

  void start();
  void stop();

  Config& config() { return _config; }
  int getServerSocket() const { return _server_socket; }
  Worker* nextWorker() { return _workers.next(); }
  ConnectionHub& getHub() { return _hub; }
  metrics::AggregatedMetrics getAggregatedMetrics();

private:
  Config& _config;
  int _server_socket;
  std::atomic<bool> _is_stopped;
  ConnectionHub _hub;
  WorkerPool<Worker> _workers;
  std::unique_ptr<Redis> _redis;
  metrics::ServerMetrics _metrics;

  void _listen();
  unsigned int _workerCount();
  void _ingestFromRedis();
  void _subscribeRedis();
  void _sleepUnlessStopped(std::size_t ms);
};

} // namespace sessionhub

#endif // INCLUDE_SERVER_HPP_
