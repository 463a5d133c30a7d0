#include "EventLoop.hpp"

namespace wt {
EventLoop::EventLoop(shared_ptr<Clock> _clock)
    : clock(_clock), running(false), nextTimerId(1) {}

EventLoop::TimerId EventLoop::addTimer(int64_t delayMs, Callback callback) {
  TimerId id = nextTimerId++;
  int64_t deadline = now() + max(int64_t(0), delayMs);
  // multimap inserts equal keys after the existing ones
  timers.insert(make_pair(deadline, make_pair(id, callback)));
  timerDeadlines[id] = deadline;
  VLOG(5) << "Added timer " << id << " for " << deadline;
  return id;
}

bool EventLoop::cancelTimer(TimerId id) {
  auto deadlineIt = timerDeadlines.find(id);
  if (deadlineIt == timerDeadlines.end()) {
    return false;
  }
  auto range = timers.equal_range(deadlineIt->second);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second.first == id) {
      timers.erase(it);
      break;
    }
  }
  timerDeadlines.erase(deadlineIt);
  VLOG(5) << "Cancelled timer " << id;
  return true;
}

bool EventLoop::hasTimer(TimerId id) const {
  return timerDeadlines.find(id) != timerDeadlines.end();
}

void EventLoop::post(Callback callback) { posted.push_back(callback); }

void EventLoop::watchRead(int fd, Callback callback) {
  readWatchers[fd] = callback;
}

void EventLoop::watchWrite(int fd, Callback callback) {
  writeWatchers[fd] = callback;
}

void EventLoop::unwatchRead(int fd) { readWatchers.erase(fd); }

void EventLoop::unwatchWrite(int fd) { writeWatchers.erase(fd); }

void EventLoop::unwatch(int fd) {
  unwatchRead(fd);
  unwatchWrite(fd);
}

int EventLoop::runExpiredTimers() {
  int invoked = 0;
  do {
    // Callbacks posted while draining run in the same pass
    while (!posted.empty()) {
      Callback callback = posted.front();
      posted.pop_front();
      callback();
      invoked++;
    }
    int64_t currentTime = now();
    while (!timers.empty() && timers.begin()->first <= currentTime) {
      auto it = timers.begin();
      TimerId id = it->second.first;
      Callback callback = it->second.second;
      timers.erase(it);
      timerDeadlines.erase(id);
      callback();
      invoked++;
    }
  } while (!posted.empty());
  return invoked;
}

void EventLoop::runOnce(int64_t maxWaitMs) {
  int64_t waitMs = max(int64_t(0), maxWaitMs);
  if (!posted.empty()) {
    waitMs = 0;
  } else if (!timers.empty()) {
    waitMs = min(waitMs, max(int64_t(0), timers.begin()->first - now()));
  }

  fd_set readFds, writeFds;
  FD_ZERO(&readFds);
  FD_ZERO(&writeFds);
  int maxFd = -1;
  for (auto &it : readWatchers) {
    FD_SET(it.first, &readFds);
    maxFd = max(maxFd, it.first);
  }
  for (auto &it : writeWatchers) {
    FD_SET(it.first, &writeFds);
    maxFd = max(maxFd, it.first);
  }

  timeval tv;
  tv.tv_sec = waitMs / 1000;
  tv.tv_usec = (waitMs % 1000) * 1000;
  int numReady = ::select(maxFd + 1, &readFds, &writeFds, NULL, &tv);
  if (numReady < 0) {
    if (GetErrno() != EINTR) {
      FATAL_FAIL(numReady);
    }
    VLOG(3) << "select interrupted by a signal";
  } else if (numReady > 0) {
    dispatchFds(readFds, writeFds);
  }
  runExpiredTimers();
}

void EventLoop::dispatchFds(const fd_set &readFds, const fd_set &writeFds) {
  vector<int> readable, writable;
  for (auto &it : readWatchers) {
    if (FD_ISSET(it.first, &readFds)) {
      readable.push_back(it.first);
    }
  }
  for (auto &it : writeWatchers) {
    if (FD_ISSET(it.first, &writeFds)) {
      writable.push_back(it.first);
    }
  }
  // A callback may unwatch (or close) another fd, so look each one up again.
  for (int fd : readable) {
    auto it = readWatchers.find(fd);
    if (it != readWatchers.end()) {
      Callback callback = it->second;
      callback();
    }
  }
  for (int fd : writable) {
    auto it = writeWatchers.find(fd);
    if (it != writeWatchers.end()) {
      Callback callback = it->second;
      callback();
    }
  }
}

bool EventLoop::runUntil(std::function<bool()> done, int64_t timeoutMs) {
  int64_t startTime = now();
  while (!done()) {
    int64_t waitMs = 10;
    if (timeoutMs >= 0) {
      int64_t remaining = startTime + timeoutMs - now();
      if (remaining <= 0) {
        break;
      }
      waitMs = min(waitMs, remaining);
    }
    runOnce(waitMs);
  }
  return done();
}

void EventLoop::run() {
  running = true;
  while (running) {
    runOnce(100);
  }
}
}  // namespace wt
