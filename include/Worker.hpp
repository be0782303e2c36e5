#ifndef INCLUDE_WORKER_HPP_
#define INCLUDE_WORKER_HPP_

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sessionhub {

/**
 * A thread running _workerMain() until stop() is called.
 */
class WorkerBase {
public:
  WorkerBase() : _stop_requested(false) {}
  virtual ~WorkerBase() {}

  void run() {
    if (!_thread.joinable()) {
      _thread = std::thread([this]() { _workerMain(); });
    }
  }

  void stop() { _stop_requested = true; }
  bool stopRequested() const { return _stop_requested; }

  void join() {
    if (_thread.joinable()) {
      _thread.join();
    }
  }

private:
  std::thread _thread;
  std::atomic<bool> _stop_requested;

protected:
  virtual void _workerMain() = 0;
};

/**
 * Fixed set of workers with round-robin selection.
 */
template <class T>
class WorkerPool {
public:
  using WorkerList = std::vector<std::unique_ptr<T>>;

  void spawn(std::unique_ptr<T> worker) {
    std::lock_guard<std::mutex> lock(_lock);
    worker->run();
    _workers.push_back(std::move(worker));
  }

  // Workers stay valid until stopAll().
  T* next() {
    std::lock_guard<std::mutex> lock(_lock);

    if (_workers.empty()) {
      return nullptr;
    }

    return _workers[_next++ % _workers.size()].get();
  }

  template <typename Fn>
  void forEach(Fn&& fn) {
    std::lock_guard<std::mutex> lock(_lock);
    for (auto& worker : _workers) {
      fn(*worker);
    }
  }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(_lock);
    return _workers.size();
  }

  // Joins without holding the lock, running workers may still call next().
  void stopAll() {
    forEach([](T& worker) { worker.stop(); });

    for (std::size_t i = 0; i < size(); i++) {
      _workers[i]->join();
    }

    std::lock_guard<std::mutex> lock(_lock);
    _workers.clear();
  }

private:
  WorkerList _workers;
  std::size_t _next = 0;
  std::mutex _lock;
};

} // namespace sessionhub

#endif // INCLUDE_WORKER_HPP_
