#include "PipeChildProcess.hpp"

#include "TestHeaders.hpp"

using namespace wt;

namespace {
struct ChildRecorder {
  explicit ChildRecorder(shared_ptr<ChildProcess> _child)
      : child(_child), exited(false), exitCode(-2), exitSignal(-2) {
    child->onOutput([this](const string& data) { output += data; });
    child->onErrorOutput([this](const string& data) { error += data; });
    child->onSpawnError([this](const string& reason) { spawnError = reason; });
    child->onExit([this](int code, int signal) {
      exited = true;
      exitCode = code;
      exitSignal = signal;
      outputAtExit = output;
    });
  }

  shared_ptr<ChildProcess> child;
  string output;
  string error;
  string spawnError;
  string outputAtExit;
  bool exited;
  int exitCode;
  int exitSignal;
};

const int64_t WAIT_MS = 5000;
}  // namespace

TEST_CASE("Pipe children", "[PipeChildProcess]") {
  shared_ptr<EventLoop> loop(
      new EventLoop(shared_ptr<Clock>(new SteadyClock())));
  shared_ptr<PipeChildProcessSpawner> spawner(
      new PipeChildProcessSpawner(loop));

  SECTION("Input is echoed back and closing input ends the child") {
    ChildRecorder r(spawner->spawn("cat", {}, {}, "", 16 * 1024));
    REQUIRE(r.child->getPid() > 0);
    REQUIRE(r.child->isInputWritable());
    REQUIRE(r.child->write("hello\n"));
    REQUIRE(loop->runUntil([&]() { return r.output == "hello\n"; }, WAIT_MS));

    r.child->closeInput();
    REQUIRE_FALSE(r.child->isInputWritable());
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.exitSignal == 0);
    REQUIRE(r.child->hasExited());
    REQUIRE_FALSE(r.child->write("late"));
  }

  SECTION("Both streams are delivered before the exit") {
    ChildRecorder r(spawner->spawn(
        "/bin/sh", {"-c", "echo out; echo err 1>&2; exit 3"}, {}, "",
        16 * 1024));
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.exitCode == 3);
    REQUIRE(r.child->getExitCode() == 3);
    REQUIRE(r.child->getExitSignal() == 0);
    REQUIRE(r.outputAtExit == "out\n");
    REQUIRE(r.error == "err\n");
    REQUIRE_FALSE(r.child->kill(SIGTERM));
  }

  SECTION("Environment and working directory") {
    string tmp = fs::canonical("/tmp").string();
    ChildRecorder r(spawner->spawn("/bin/sh", {"-c", "echo $WT_TEST_VAR; pwd"},
                                   {{"WT_TEST_VAR", "from-test"}}, tmp,
                                   16 * 1024));
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.output == "from-test\n" + tmp + "\n");
  }

  SECTION("A missing executable is reported as a spawn error") {
    ChildRecorder r(
        spawner->spawn("wt-no-such-helper", {}, {}, "", 16 * 1024));
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.spawnError ==
            string("spawn wt-no-such-helper ") + strerror(ENOENT));
    REQUIRE(r.exitCode == 127);
    REQUIRE_FALSE(r.child->isInputWritable());
  }

  SECTION("A missing working directory is reported as a spawn error") {
    ChildRecorder r(spawner->spawn("/bin/sh", {"-c", "exit 0"}, {},
                                   "/nonexistent/wt-dir", 16 * 1024));
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.spawnError ==
            string("spawn /bin/sh failed: cannot enter /nonexistent/wt-dir: ") +
                strerror(ENOENT));
  }

  SECTION("Signals end the child") {
    ChildRecorder r(
        spawner->spawn("/bin/sh", {"-c", "exec sleep 30"}, {}, "", 16 * 1024));
    REQUIRE(r.child->kill(SIGTERM));
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.exitCode == -1);
    REQUIRE(r.exitSignal == SIGTERM);
    REQUIRE(r.child->getExitCode() == -1);
    REQUIRE(r.child->getExitSignal() == SIGTERM);
  }

  SECTION("A child that does not read applies backpressure") {
    ChildRecorder r(
        spawner->spawn("/bin/sh", {"-c", "exec sleep 30"}, {}, "", 16 * 1024));
    string big(1024 * 1024, 'x');
    REQUIRE_FALSE(r.child->write(big));
    REQUIRE(r.child->getPendingInput() > 0);
    REQUIRE(r.child->needsDrain());

    bool drained = false;
    r.child->onceDrain([&]() { drained = true; });
    loop->runOnce(10);
    REQUIRE_FALSE(drained);

    r.child->closeInput();
    REQUIRE(r.child->getPendingInput() == 0);
    REQUIRE(loop->runUntil([&]() { return drained; }, WAIT_MS));

    r.child->kill(SIGKILL);
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    REQUIRE(r.exitSignal == SIGKILL);
  }

  SECTION("An exit handler added late is still called") {
    ChildRecorder r(spawner->spawn("/bin/sh", {"-c", "exit 5"}, {}, "",
                                   16 * 1024));
    REQUIRE(loop->runUntil([&]() { return r.exited; }, WAIT_MS));
    int lateCode = -2;
    r.child->onExit([&](int code, int) { lateCode = code; });
    REQUIRE(lateCode == -2);
    loop->runOnce(0);
    REQUIRE(lateCode == 5);
  }
}
