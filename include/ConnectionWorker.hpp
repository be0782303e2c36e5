#pragma once

#include <netinet/in.h>
#include <sys/epoll.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "Config.hpp"
#include "Connection.hpp"
#include "EventLoop.hpp"
#include "Forward.hpp"
#include "SessionHubBase.hpp"
#include "Worker.hpp"
#include "metrics/Types.hpp"

namespace sessionhub {

using ConnectionTable = std::unordered_map<int, ConnectionPtr>;

/**
 * Epoll loop serving a share of the client connections. Every worker watches
 * the listening socket; accepted clients are handed out round-robin.
 */
class Worker final : public SessionHubBase, public WorkerBase {
public:
  Worker(Server* srv, unsigned int workerId);
  ~Worker();

  // Take ownership of an accepted socket. Safe to call from any thread.
  void adopt(int fd, const struct sockaddr_in& peer);

  void addTimer(int64_t delay, std::function<void(TimerCtx* ctx)> callback, bool repeat = false);
  void addJob(std::function<void()> job);

  // For callers that may outlive this worker, e.g. topic notifiers.
  std::function<void(std::function<void()>)> getScheduler() const { return EventLoop::weakScheduler(_ev); }

  unsigned int getWorkerId() const { return _worker_id; }
  int getEpollFileDescriptor() const { return _epoll_fd; }
  const metrics::WorkerMetrics& getMetrics() const { return _metrics; }

private:
  unsigned int _worker_id;
  Server* _server;
  int _epoll_fd;
  std::shared_ptr<EventLoop> _ev;
  ConnectionTable _connections;
  std::mutex _connections_lock;
  metrics::WorkerMetrics _metrics;
  int64_t _delay_sample_start;

  void _accept();
  void _installHandlers(const ConnectionPtr& conn);
  void _armTimers(const ConnectionPtr& conn);
  ConnectionPtr _lookup(int fd);
  void _drop(const ConnectionPtr& conn);
  void _handleEvent(const struct epoll_event& event);
  void _sampleDelay();

  void _workerMain() override;
};

} // namespace sessionhub
