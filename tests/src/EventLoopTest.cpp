#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "EventLoop.hpp"
#include "catch.hpp"

using namespace sessionhub;

TEST_CASE("EventLoop jobs", "[eventloop]") {
  EventLoop ev;
  bool ran = false;

  REQUIRE_FALSE(ev.hasWork());

  ev.addJob([&ran]() { ran = true; });

  SECTION("A pending job counts as work and makes the loop not wait") {
    REQUIRE(ev.hasWork());
    REQUIRE(ev.getNextTimerDelay() == std::chrono::milliseconds(0));
    REQUIRE_FALSE(ran);
  }

  SECTION("processJobs runs and removes it") {
    ev.processJobs();
    REQUIRE(ran);
    REQUIRE_FALSE(ev.hasWork());
  }
}

TEST_CASE("EventLoop job ordering", "[eventloop]") {
  EventLoop ev;
  std::vector<int> order;

  SECTION("Jobs run in the order they were added") {
    for (int i = 0; i < 5; i++) {
      ev.addJob([&order, i]() { order.push_back(i); });
    }

    ev.process();
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("A job queued by a job waits for the next pass") {
    ev.addJob([&]() {
      order.push_back(1);
      ev.addJob([&]() { order.push_back(2); });
    });

    ev.processJobs();
    REQUIRE(order == std::vector<int>{1});
    REQUIRE(ev.hasWork());

    ev.processJobs();
    REQUIRE(order == std::vector<int>{1, 2});
    REQUIRE_FALSE(ev.hasWork());
  }

  SECTION("Jobs may be added from other threads") {
    std::vector<std::thread> threads;
    int count = 0;

    for (int t = 0; t < 4; t++) {
      threads.emplace_back([&ev, &count]() {
        for (int i = 0; i < 100; i++) {
          ev.addJob([&count]() { count++; });
        }
      });
    }

    for (auto& t : threads) {
      t.join();
    }

    ev.processJobs();
    REQUIRE(count == 400);
  }
}

TEST_CASE("EventLoop timers", "[eventloop]") {
  EventLoop ev;
  int fired = 0;

  ev.addTimer(100, [&fired](TimerCtx*) { fired++; });

  SECTION("The next delay is close to the timer's") {
    REQUIRE(ev.hasWork());
    REQUIRE(ev.getNextTimerDelay() > std::chrono::milliseconds(90));
  }

  SECTION("Timers do not fire early") {
    ev.processTimers();
    REQUIRE(fired == 0);
  }

  SECTION("One-shot timers fire once") {
    std::this_thread::sleep_for(std::chrono::milliseconds(110));
    ev.processTimers();
    ev.processTimers();

    REQUIRE(fired == 1);
    REQUIRE_FALSE(ev.hasWork());
  }
}

TEST_CASE("EventLoop repeating timers", "[eventloop]") {
  EventLoop ev;
  int runCount = 0;

  ev.addTimer(
      10, [&runCount](TimerCtx* ctx) {
        if (++runCount == 2) {
          ctx->repeat = false;
        }
      },
      true);

  for (int i = 0; i < 20 && runCount < 2; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(15));
    ev.processTimers();
  }

  REQUIRE(runCount == 2);
  REQUIRE_FALSE(ev.hasWork());
}

TEST_CASE("EventLoop timer callbacks can add timers", "[eventloop]") {
  EventLoop ev;
  bool second = false;

  ev.addTimer(0, [&](TimerCtx*) {
    ev.addTimer(0, [&second](TimerCtx*) { second = true; });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  ev.processTimers();
  REQUIRE(ev.hasWork());

  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  ev.processTimers();
  REQUIRE(second);
}

TEST_CASE("EventLoop weak scheduler", "[eventloop]") {
  auto loop     = std::make_shared<EventLoop>();
  auto schedule = EventLoop::weakScheduler(loop);
  int ran       = 0;

  schedule([&ran]() { ran++; });
  loop->processJobs();
  REQUIRE(ran == 1);

  SECTION("Jobs scheduled after the loop is gone are dropped") {
    loop.reset();
    REQUIRE_NOTHROW(schedule([&ran]() { ran++; }));
    REQUIRE(ran == 1);
  }
}
