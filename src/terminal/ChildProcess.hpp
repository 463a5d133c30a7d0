#ifndef __WT_CHILD_PROCESS__
#define __WT_CHILD_PROCESS__

#include "EventLoop.hpp"
#include "Headers.hpp"

namespace wt {
/**
 * @brief A running child with three byte streams (input, output, error).
 *
 * Handlers run on the event loop thread.  Exit handlers run once; one
 * registered after the child exited is posted right away.
 */
class ChildProcess : public std::enable_shared_from_this<ChildProcess> {
 public:
  typedef std::function<void(const string &)> DataHandler;
  /** @brief Receives the exit code, or -1 and the signal that killed it. */
  typedef std::function<void(int exitCode, int signal)> ExitHandler;
  typedef std::function<void()> DrainHandler;

  explicit ChildProcess(shared_ptr<EventLoop> _loop);
  virtual ~ChildProcess() {}

  virtual pid_t getPid() const = 0;

  /**
   * @brief True while the input stream can take more bytes (not closed,
   * not broken by the child going away).
   */
  virtual bool isInputWritable() const = 0;

  /**
   * @brief Queues `data` for the child's input.
   * @return true while the queued input is under the high-water mark.
   */
  virtual bool write(const string &data) = 0;

  /** @brief Bytes accepted by write() but not yet taken by the child. */
  virtual size_t getPendingInput() const = 0;
  virtual size_t getHighWaterMark() const = 0;

  /** @brief Closes the input stream; pending input is discarded. */
  virtual void closeInput() = 0;

  /**
   * @brief Sends `signal` to the child.
   * @return false if the child is already gone.
   */
  virtual bool kill(int signal) = 0;

  inline bool hasExited() const { return exited; }
  inline int getExitCode() const { return exitCode; }
  inline int getExitSignal() const { return exitSignal; }

  void onOutput(DataHandler handler) { outputHandler = handler; }
  void onErrorOutput(DataHandler handler) { errorOutputHandler = handler; }
  /** @brief Called with a reason when the child could not be started. */
  void onSpawnError(DataHandler handler) { spawnErrorHandler = handler; }
  void onExit(ExitHandler handler);
  /**
   * @brief Runs `handler` once the queued input has drained.  Posted right
   * away when nothing is waiting to drain or the input can no longer drain.
   */
  void onceDrain(DrainHandler handler);

  /** @brief True when the queued input reached the high-water mark. */
  inline bool needsDrain() const {
    return getPendingInput() >= getHighWaterMark();
  }

 protected:
  shared_ptr<EventLoop> loop;
  bool exited;
  int exitCode;
  int exitSignal;

  DataHandler outputHandler;
  DataHandler errorOutputHandler;
  DataHandler spawnErrorHandler;
  vector<ExitHandler> exitHandlers;
  vector<DrainHandler> drainHandlers;

  void emitOutput(const string &data);
  void emitErrorOutput(const string &data);
  void emitSpawnError(const string &reason);
  /** @brief Records the exit and runs the exit handlers. */
  void emitExit(int code, int signal);
  /** @brief Posts every waiting drain handler. */
  void emitDrain();
};

/**
 * @brief Starts child processes.  Tests substitute scripted children.
 */
class ChildProcessSpawner {
 public:
  virtual ~ChildProcessSpawner() {}

  /**
   * @brief Starts `file` with `args`.
   * @param env Variables added to (or replacing) the daemon's environment.
   * @throws std::runtime_error when the OS refuses to create the process.
   */
  virtual shared_ptr<ChildProcess> spawn(const string &file,
                                         const vector<string> &args,
                                         const map<string, string> &env,
                                         const string &cwd,
                                         size_t highWaterMark) = 0;
};
}  // namespace wt

#endif  // __WT_CHILD_PROCESS__
