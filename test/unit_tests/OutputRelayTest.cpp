#include "FakeClock.hpp"
#include "FakeConsumer.hpp"
#include "SessionBuffer.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
struct RelayFixture {
  RelayFixture(const SessionBufferConfig& config = SessionBufferConfig())
      : clock(new FakeClock(0)),
        loop(new EventLoop(clock)),
        buffer(new SessionBuffer(loop, config)),
        consumer(new FakeConsumer()) {
    buffer->connectView("ws", consumer);
  }

  void advanceTo(int64_t t) {
    clock->advance(t - clock->nowMs());
    loop->runExpiredTimers();
  }

  shared_ptr<FakeClock> clock;
  shared_ptr<EventLoop> loop;
  shared_ptr<SessionBuffer> buffer;
  shared_ptr<FakeConsumer> consumer;
};
}  // namespace

TEST_CASE("Isolated writes are relayed immediately", "[OutputRelay]") {
  RelayFixture f;
  f.buffer->addOutput("ws", "first");
  REQUIRE(f.consumer->outputs() == vector<string>({"first"}));

  f.advanceTo(100);
  f.buffer->addOutput("ws", "second");
  REQUIRE(f.consumer->outputs() == vector<string>({"first", "second"}));
  REQUIRE(f.loop->numTimers() == 0);
}

TEST_CASE("Bursts are coalesced within the window", "[OutputRelay]") {
  RelayFixture f;
  f.buffer->addOutput("ws", "a");
  f.advanceTo(1);
  f.buffer->addOutput("ws", "b");
  f.advanceTo(5);
  f.buffer->addOutput("ws", "c");
  REQUIRE(f.loop->numTimers() == 1);

  // Rescheduled at 5 + 16
  f.advanceTo(20);
  REQUIRE(f.consumer->outputs() == vector<string>({"a"}));
  f.advanceTo(21);
  REQUIRE(f.consumer->outputs() == vector<string>({"a", "bc"}));
  REQUIRE(f.loop->numTimers() == 0);
}

TEST_CASE("No byte is held past the max hold time", "[OutputRelay]") {
  SessionBufferConfig config;
  config.coalesceWindowMs = 50;
  config.maxHoldMs = 32;
  RelayFixture f(config);

  f.buffer->addOutput("ws", "0");
  f.advanceTo(10);
  f.buffer->addOutput("ws", "a");
  f.advanceTo(30);
  f.buffer->addOutput("ws", "b");
  f.advanceTo(40);
  f.buffer->addOutput("ws", "c");
  f.advanceTo(41);
  REQUIRE(f.consumer->outputs() == vector<string>({"0"}));
  // "a" arrived at 10
  f.advanceTo(42);
  REQUIRE(f.consumer->outputs() == vector<string>({"0", "abc"}));

  f.advanceTo(45);
  f.buffer->addOutput("ws", "d");
  f.clock->advance(32);
  f.buffer->addOutput("ws", "e");
  REQUIRE(f.consumer->outputs() == vector<string>({"0", "abc", "de"}));
  REQUIRE(f.loop->numTimers() == 0);
}

TEST_CASE("Large bursts skip the timer", "[OutputRelay]") {
  SessionBufferConfig config;
  config.immediateFlushBytes = 10;
  RelayFixture f(config);

  f.buffer->addOutput("ws", "x");
  f.advanceTo(1);
  f.buffer->addOutput("ws", "12345");
  REQUIRE(f.loop->numTimers() == 1);
  f.advanceTo(2);
  f.buffer->addOutput("ws", "67890");
  REQUIRE(f.consumer->outputs() == vector<string>({"x", "1234567890"}));
  REQUIRE(f.loop->numTimers() == 0);

  // The cancelled timer must not produce a duplicate
  f.advanceTo(100);
  REQUIRE(f.consumer->outputs().size() == 2);
}

TEST_CASE("Coalesced output keeps order without loss or duplication",
          "[OutputRelay]") {
  RelayFixture f;
  string expected;
  for (int i = 0; i < 200; i++) {
    string data = to_string(i) + ",";
    expected += data;
    f.buffer->addOutput("ws", data);
    f.advanceTo(f.clock->nowMs() + (i % 7));
  }
  f.advanceTo(f.clock->nowMs() + 100);
  REQUIRE(f.consumer->allOutput() == expected);
  REQUIRE(f.consumer->outputs().size() < 200);
  REQUIRE(f.buffer->getBuffer("ws") == expected);
}

TEST_CASE("A failed flush disconnects the session", "[OutputRelay]") {
  RelayFixture f;
  f.buffer->addOutput("ws", "kept ");
  f.consumer->setFailing(true);
  f.advanceTo(100);
  f.buffer->addOutput("ws", "history");
  REQUIRE_FALSE(f.buffer->isConnected("ws"));

  f.advanceTo(200);
  f.buffer->addOutput("ws", " more");
  REQUIRE(f.loop->numTimers() == 0);

  shared_ptr<FakeConsumer> fresh(new FakeConsumer("fresh"));
  f.buffer->connectView("ws", fresh);
  REQUIRE(fresh->outputs() == vector<string>({"kept history more"}));
}

TEST_CASE("Pending output is folded into the reconnect snapshot",
          "[OutputRelay]") {
  RelayFixture f;
  f.buffer->addOutput("ws", "a");
  f.advanceTo(1);
  f.buffer->addOutput("ws", "b");
  REQUIRE(f.loop->numTimers() == 1);

  SECTION("Disconnect then reconnect") {
    REQUIRE(f.buffer->disconnectView("ws", f.consumer));
    REQUIRE(f.loop->numTimers() == 0);
    f.advanceTo(50);

    shared_ptr<FakeConsumer> next(new FakeConsumer("next"));
    f.buffer->connectView("ws", next);
    f.advanceTo(100);
    REQUIRE(next->outputs() == vector<string>({"ab"}));
  }

  SECTION("Takeover by another view") {
    shared_ptr<FakeConsumer> next(new FakeConsumer("next"));
    f.buffer->connectView("ws", next);
    f.advanceTo(100);
    REQUIRE(next->outputs() == vector<string>({"ab"}));
    REQUIRE(f.consumer->outputs() == vector<string>({"a"}));

    f.buffer->addOutput("ws", "c");
    REQUIRE(next->outputs() == vector<string>({"ab", "c"}));
  }
}

TEST_CASE("Steady small writes are never held past 32 ms", "[OutputRelay]") {
  RelayFixture f;
  vector<int64_t> writeTimes;
  string written;
  size_t delivered = 0;
  int64_t worstDelay = 0;

  for (int64_t t = 0; t <= 140; t++) {
    f.advanceTo(t);
    if (t < 100 && t % 2 == 0) {
      string data(10, char('a' + (t / 2) % 26));
      f.buffer->addOutput("ws", data);
      for (int a = 0; a < 10; a++) {
        writeTimes.push_back(t);
      }
      written += data;
    }
    size_t total = f.consumer->allOutput().length();
    for (; delivered < total; delivered++) {
      worstDelay = max(worstDelay, t - writeTimes[delivered]);
    }
  }
  REQUIRE(f.consumer->allOutput() == written);
  REQUIRE(worstDelay <= 32);
}

TEST_CASE("Reaching 8192 pending bytes flushes at once", "[OutputRelay]") {
  RelayFixture f;
  f.buffer->addOutput("ws", "x");
  f.advanceTo(1);
  f.buffer->addOutput("ws", string(8191, 'a'));
  REQUIRE(f.consumer->outputs().size() == 1);
  f.buffer->addOutput("ws", "b");
  REQUIRE(f.consumer->outputs().size() == 2);
  REQUIRE(f.consumer->outputs()[1].length() == 8192);
  REQUIRE(f.loop->numTimers() == 0);
}
