#ifndef __WT_PROCESS_SUPERVISOR__
#define __WT_PROCESS_SUPERVISOR__

#include "ChildProcess.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "SessionBuffer.hpp"

namespace wt {
/** @brief What to run for a workspace. */
struct SpawnSpec {
  /** @brief Program name or path, resolved through PATH. */
  string helper;
  /** @brief Arguments placed before the geometry arguments. */
  vector<string> helperArgs;
  /** @brief Sent to the helper on the first spawn of a key only. */
  vector<string> startupCommands;
};

struct ProcessSupervisorConfig {
  size_t inputHighWaterMark = 16 * 1024;
  int64_t terminateGraceMs = 1000;
  int64_t killGraceMs = 500;
  int64_t shutdownGraceMs = 2000;
  int64_t shutdownKillGraceMs = 1000;
};

struct ProcessInfo {
  string key;
  pid_t pid;
  int cols;
  int rows;
  string cwd;
  bool active;
};

/**
 * @brief Owns the single child process of every workspace key.
 *
 * Child output goes into the SessionBuffer.  A key leaves the registry the
 * moment its termination starts, so a new child can be created for it while
 * the old one is still shutting down.
 */
class ProcessSupervisor {
 public:
  typedef std::function<void()> DoneCallback;

  ProcessSupervisor(shared_ptr<EventLoop> _loop,
                    shared_ptr<ChildProcessSpawner> _spawner,
                    shared_ptr<SessionBuffer> _sessionBuffer,
                    const ProcessSupervisorConfig& _config =
                        ProcessSupervisorConfig());
  ~ProcessSupervisor();

  /**
   * @brief Returns the live child for `key`, spawning one if there is none or
   * the current one can no longer take input.
   * @return An empty pointer if the spawn failed.  The failure is written to
   * the key's buffer.
   */
  shared_ptr<ChildProcess> getOrCreateProcess(const string& key,
                                              const SpawnSpec& spec,
                                              const string& cwd, int cols,
                                              int rows);

  /** @brief Writes to the child's input, or drops the data if it is closed. */
  void sendToProcess(const string& key, const string& data);
  /**
   * @brief Like sendToProcess.
   * @return false when the caller should waitForDrain before sending more.
   */
  bool sendToProcessWithBackpressure(const string& key, const string& data);
  /**
   * @brief Calls `done` once the key's pending input drained, or right away
   * (posted) if there is nothing to wait for.
   */
  void waitForDrain(const string& key, DoneCallback done);

  /** @brief Sends the resize sequence if the geometry changed. */
  void updateProcessSize(const string& key, int cols, int rows);

  /** @brief Marks the process as not watched.  It keeps running. */
  void deactivateProcess(const string& key);

  /** @brief Fire-and-forget terminateProcessAsync. */
  void terminateProcess(const string& key);
  /**
   * @brief Closes input, sends SIGTERM and escalates to SIGKILL after the
   * grace period.
   *
   * `done` runs once the child exited or the kill grace period elapsed.  It
   * runs even when the key has no process.
   */
  void terminateProcessAsync(const string& key, DoneCallback done);
  /**
   * @brief Terminates every child with the shutdown timings.  `done` runs
   * when all of them (and any termination already in flight) settled.
   */
  void terminateAllProcessesAsync(DoneCallback done);

  bool hasProcess(const string& key) const;
  bool isProcessActive(const string& key) const;
  vector<ProcessInfo> getProcessInfo() const;
  /** @brief Number of terminations still waiting for their child. */
  inline size_t numTerminating() const { return terminating.size(); }
  inline const ProcessSupervisorConfig& getConfig() const { return config; }

 protected:
  struct ManagedProcess {
    shared_ptr<ChildProcess> child;
    int cols;
    int rows;
    string cwd;
    bool active;
  };

  struct Termination {
    string key;
    shared_ptr<ChildProcess> child;
    vector<DoneCallback> callbacks;
    EventLoop::TimerId graceTimer = 0;
    EventLoop::TimerId killTimer = 0;
    bool finished = false;
  };

  shared_ptr<EventLoop> loop;
  shared_ptr<ChildProcessSpawner> spawner;
  shared_ptr<SessionBuffer> sessionBuffer;
  ProcessSupervisorConfig config;
  map<string, shared_ptr<ManagedProcess>> processes;
  set<shared_ptr<Termination>> terminating;
  /** @brief Keys that already received their startup commands. */
  set<string> bootstrappedKeys;

  shared_ptr<ManagedProcess> createNewProcess(const string& key,
                                              const SpawnSpec& spec,
                                              const string& cwd, int cols,
                                              int rows);
  void startTermination(const string& key, shared_ptr<ChildProcess> child,
                        int64_t graceMs, int64_t killGraceMs,
                        DoneCallback done);
  void finishTermination(shared_ptr<Termination> termination);
  shared_ptr<Termination> findTermination(const string& key) const;
};
}  // namespace wt

#endif  // __WT_PROCESS_SUPERVISOR__
