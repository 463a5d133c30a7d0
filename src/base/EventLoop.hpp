#ifndef __WT_EVENT_LOOP__
#define __WT_EVENT_LOOP__

#include "Clock.hpp"
#include "Headers.hpp"

namespace wt {
/**
 * @brief Single-threaded select() loop that dispatches fd readiness, timers
 * and deferred callbacks.
 *
 * All registry mutation in WorkTerm happens on the thread that drives this
 * loop, so the supervisor and the session buffer need no locking. Timers with
 * the same deadline fire in the order they were added.
 */
class EventLoop {
 public:
  typedef std::function<void()> Callback;
  typedef int64_t TimerId;

  explicit EventLoop(shared_ptr<Clock> _clock);

  /** @brief Current time of the loop's clock in milliseconds. */
  inline int64_t now() { return clock->nowMs(); }

  /**
   * @brief Schedules a one-shot callback `delayMs` from now.
   * @return An id that can be passed to cancelTimer. Never 0.
   */
  TimerId addTimer(int64_t delayMs, Callback callback);
  /**
   * @brief Cancels a pending timer.
   * @return false if the timer already fired or was never scheduled.
   */
  bool cancelTimer(TimerId id);
  /** @brief Returns true while the timer is still scheduled. */
  bool hasTimer(TimerId id) const;

  /** @brief Runs the callback on the next loop iteration. */
  void post(Callback callback);

  /** @brief Invokes `callback` whenever `fd` is readable. */
  void watchRead(int fd, Callback callback);
  /** @brief Invokes `callback` whenever `fd` is writable. */
  void watchWrite(int fd, Callback callback);
  void unwatchRead(int fd);
  void unwatchWrite(int fd);
  /** @brief Removes both watchers for `fd`. */
  void unwatch(int fd);

  /**
   * @brief Waits up to `maxWaitMs` for fd activity or the next timer, then
   * dispatches everything that is ready.
   */
  void runOnce(int64_t maxWaitMs);
  /**
   * @brief Fires posted callbacks and every timer whose deadline has passed.
   * @return The number of callbacks invoked.
   */
  int runExpiredTimers();
  /**
   * @brief Spins the loop until `done` returns true.
   * @param timeoutMs Gives up after this many milliseconds (-1 for never).
   * @return The final value of `done()`.
   */
  bool runUntil(std::function<bool()> done, int64_t timeoutMs = -1);
  /** @brief Spins the loop until stop() is called. */
  void run();
  void stop() { running = false; }

  /** @brief Number of timers that are still scheduled. */
  inline size_t numTimers() const { return timerDeadlines.size(); }

 protected:
  shared_ptr<Clock> clock;
  bool running;
  TimerId nextTimerId;
  /** @brief Ordered by deadline, ties broken by insertion. */
  multimap<int64_t, pair<TimerId, Callback>> timers;
  /** @brief Deadline of each live timer, used to locate it for cancel. */
  map<TimerId, int64_t> timerDeadlines;
  deque<Callback> posted;
  map<int, Callback> readWatchers;
  map<int, Callback> writeWatchers;

  void dispatchFds(const fd_set &readFds, const fd_set &writeFds);
};
}  // namespace wt

#endif  // __WT_EVENT_LOOP__
