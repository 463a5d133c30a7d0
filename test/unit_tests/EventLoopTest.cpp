#include "EventLoop.hpp"

#include "FakeClock.hpp"
#include "TestHeaders.hpp"

using namespace wt;

TEST_CASE("EventLoop timers", "[EventLoop]") {
  shared_ptr<FakeClock> clock(new FakeClock());
  shared_ptr<EventLoop> loop(new EventLoop(clock));
  vector<string> fired;

  SECTION("Timers fire by deadline, ties in insertion order") {
    loop->addTimer(20, [&]() { fired.push_back("c"); });
    loop->addTimer(10, [&]() { fired.push_back("a"); });
    loop->addTimer(10, [&]() { fired.push_back("b"); });

    REQUIRE(loop->runExpiredTimers() == 0);
    clock->advance(10);
    REQUIRE(loop->runExpiredTimers() == 2);
    REQUIRE(fired == vector<string>({"a", "b"}));
    clock->advance(10);
    loop->runExpiredTimers();
    REQUIRE(fired == vector<string>({"a", "b", "c"}));
    REQUIRE(loop->numTimers() == 0);
  }

  SECTION("Cancelled timers never fire") {
    auto id = loop->addTimer(5, [&]() { fired.push_back("x"); });
    REQUIRE(id != 0);
    REQUIRE(loop->hasTimer(id));
    REQUIRE(loop->cancelTimer(id));
    REQUIRE_FALSE(loop->hasTimer(id));
    REQUIRE_FALSE(loop->cancelTimer(id));
    clock->advance(100);
    loop->runExpiredTimers();
    REQUIRE(fired.empty());
  }

  SECTION("A timer can cancel a later one with the same deadline") {
    EventLoop::TimerId second = 0;
    loop->addTimer(1, [&]() {
      fired.push_back("first");
      loop->cancelTimer(second);
    });
    second = loop->addTimer(1, [&]() { fired.push_back("second"); });
    clock->advance(1);
    loop->runExpiredTimers();
    REQUIRE(fired == vector<string>({"first"}));
  }

  SECTION("Negative delays fire on the next pass") {
    loop->addTimer(-5, [&]() { fired.push_back("now"); });
    loop->runExpiredTimers();
    REQUIRE(fired == vector<string>({"now"}));
  }
}

TEST_CASE("EventLoop posted callbacks", "[EventLoop]") {
  shared_ptr<FakeClock> clock(new FakeClock());
  shared_ptr<EventLoop> loop(new EventLoop(clock));
  vector<int> order;

  loop->post([&]() {
    order.push_back(1);
    loop->post([&]() { order.push_back(3); });
  });
  loop->post([&]() { order.push_back(2); });
  REQUIRE(order.empty());

  REQUIRE(loop->runExpiredTimers() == 3);
  REQUIRE(order == vector<int>({1, 2, 3}));
}

TEST_CASE("EventLoop fd watchers", "[EventLoop]") {
  shared_ptr<EventLoop> loop(
      new EventLoop(shared_ptr<Clock>(new SteadyClock())));
  int fds[2];
  FATAL_FAIL(::pipe(fds));

  int reads = 0;
  loop->watchRead(fds[0], [&]() {
    char c;
    FATAL_FAIL(::read(fds[0], &c, 1));
    reads++;
  });

  loop->runOnce(0);
  REQUIRE(reads == 0);

  FATAL_FAIL(::write(fds[1], "x", 1));
  REQUIRE(loop->runUntil([&]() { return reads == 1; }, 1000));

  loop->unwatchRead(fds[0]);
  FATAL_FAIL(::write(fds[1], "y", 1));
  loop->runOnce(20);
  REQUIRE(reads == 1);

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("EventLoop runUntil gives up at the timeout", "[EventLoop]") {
  shared_ptr<EventLoop> loop(
      new EventLoop(shared_ptr<Clock>(new SteadyClock())));
  int64_t start = loop->now();
  REQUIRE_FALSE(loop->runUntil([]() { return false; }, 50));
  REQUIRE(loop->now() - start >= 50);
}

TEST_CASE("EventLoop stop ends run", "[EventLoop]") {
  shared_ptr<EventLoop> loop(
      new EventLoop(shared_ptr<Clock>(new SteadyClock())));
  bool ran = false;
  loop->addTimer(10, [&]() {
    ran = true;
    loop->stop();
  });
  loop->run();
  REQUIRE(ran);
}
