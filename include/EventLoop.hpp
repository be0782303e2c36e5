#ifndef SESSIONHUB_EVENT_LOOP_HPP
#define SESSIONHUB_EVENT_LOOP_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sessionhub {

struct TimerCtx {
  std::chrono::milliseconds repeat_delay;
  std::function<void(TimerCtx* ctx)> callback;
  bool repeat;
};

using TimerQueue = std::multimap<std::chrono::milliseconds, TimerCtx>;
using JobQueue   = std::deque<std::function<void()>>;

/**
 * Jobs and timers for one worker thread.
 * addJob() and addTimer() may be called from any thread, the process
 * functions only from the owning one. Callbacks run without any lock held.
 */
class EventLoop {
public:
  void process() {
    processJobs();
    processTimers();
  }

  // Jobs queued while processing run on the next call.
  void processJobs() {
    JobQueue jobs;

    {
      std::lock_guard<std::mutex> lock(_job_lock);
      jobs.swap(_jobs);
    }

    for (auto& job : jobs) {
      job();
    }
  }

  // A repeating timer is rescheduled unless its callback clears ctx->repeat.
  void processTimers() {
    std::vector<TimerCtx> due;

    {
      std::lock_guard<std::mutex> lock(_timer_lock);
      const auto now = _now();
      auto end       = _timers.upper_bound(now);

      for (auto it = _timers.begin(); it != end; ++it) {
        due.push_back(std::move(it->second));
      }

      _timers.erase(_timers.begin(), end);
    }

    for (auto& timer : due) {
      timer.callback(&timer);

      if (timer.repeat) {
        std::lock_guard<std::mutex> lock(_timer_lock);
        const auto fireTime = _now() + timer.repeat_delay;
        _timers.emplace(fireTime, std::move(timer));
      }
    }
  }

  void addTimer(int64_t delay, std::function<void(TimerCtx* ctx)> callback, bool repeat = false) {
    std::lock_guard<std::mutex> lock(_timer_lock);
    const std::chrono::milliseconds delayMs(delay);
    _timers.emplace(_now() + delayMs, TimerCtx{delayMs, std::move(callback), repeat});
  }

  void addJob(std::function<void()> job) {
    std::lock_guard<std::mutex> lock(_job_lock);
    _jobs.push_back(std::move(job));
  }

  // Zero when a job is pending or a timer is overdue.
  std::chrono::milliseconds getNextTimerDelay() {
    {
      std::lock_guard<std::mutex> lock(_job_lock);
      if (!_jobs.empty()) {
        return std::chrono::milliseconds(0);
      }
    }

    std::lock_guard<std::mutex> lock(_timer_lock);
    if (_timers.empty()) {
      return std::chrono::milliseconds(0);
    }

    const auto delay = _timers.begin()->first - _now();
    return delay.count() < 0 ? std::chrono::milliseconds(0) : delay;
  }

  // Queues jobs on loop while it exists. Once it is destroyed jobs are dropped.
  static std::function<void(std::function<void()>)> weakScheduler(const std::shared_ptr<EventLoop>& loop) {
    std::weak_ptr<EventLoop> weakLoop = loop;

    return [weakLoop](std::function<void()> job) {
      if (auto l = weakLoop.lock()) {
        l->addJob(std::move(job));
      }
    };
  }

  bool hasWork() {
    std::lock_guard<std::mutex> jobLock(_job_lock);
    std::lock_guard<std::mutex> timerLock(_timer_lock);
    return !_jobs.empty() || !_timers.empty();
  }

private:
  TimerQueue _timers;
  JobQueue _jobs;
  std::mutex _timer_lock;
  std::mutex _job_lock;

  static std::chrono::milliseconds _now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch());
  }
};

} // namespace sessionhub

#endif
