#ifndef __WT_TERMINAL_HOST__
#define __WT_TERMINAL_HOST__

#include "ChildProcess.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "Messages.hpp"
#include "ProcessSupervisor.hpp"
#include "SessionBuffer.hpp"
#include "TerminalConsumer.hpp"

namespace wt {
struct TerminalHostConfig {
  SpawnSpec spawnSpec;
  /** @brief Input longer than this is fed to the child in chunks. */
  size_t pasteChunkSize = 4096;
};

/**
 * @brief The operations a surrounding application performs on workspace
 * terminals.  Owns one ProcessSupervisor and one SessionBuffer.
 */
class TerminalHost {
 public:
  typedef std::function<void()> DoneCallback;

  TerminalHost(shared_ptr<EventLoop> _loop,
               shared_ptr<ChildProcessSpawner> spawner,
               const TerminalHostConfig& _config,
               const SessionBufferConfig& bufferConfig = SessionBufferConfig(),
               const ProcessSupervisorConfig& supervisorConfig =
                   ProcessSupervisorConfig());
  ~TerminalHost();

  /**
   * @brief Attaches `consumer` to the key's session (history first), then
   * makes sure the key has a running child.
   */
  void openSession(const string& key, shared_ptr<TerminalConsumer> consumer,
                   const string& cwd, int cols, int rows);
  /** @brief Detaches `consumer`.  The child keeps running. */
  void closeView(const string& key, shared_ptr<TerminalConsumer> consumer);

  /**
   * @brief Sends keyboard or paste input.  Large input is chunked and paced
   * by the child's backpressure; later input waits behind it.
   */
  void sendInput(const string& key, const string& data);
  void resize(const string& key, int cols, int rows);
  /** @brief Wipes the view and the history and asks the shell to redraw. */
  void clear(const string& key);
  /**
   * @brief Terminates the key's child, then clears its history, then tells
   * the consumer to start over.  `done` runs after all three.
   */
  void reset(const string& key, DoneCallback done);
  /** @brief Terminates the key's child and forgets its session. */
  void closeWorkspace(const string& key, DoneCallback done);

  void handleFrontendMessage(const string& key,
                             shared_ptr<TerminalConsumer> consumer,
                             const FrontendMessage& message);

  /** @brief Drops every session, then terminates every child. */
  void shutdown(DoneCallback done);

  string toJsonString() const;

  inline bool isResetting(const string& key) const {
    return resetWaiters.find(key) != resetWaiters.end();
  }
  /** @brief Bytes of input waiting behind a paste. */
  size_t getQueuedInput(const string& key) const;
  inline shared_ptr<SessionBuffer> getSessionBuffer() { return sessionBuffer; }
  inline shared_ptr<ProcessSupervisor> getSupervisor() { return supervisor; }

 protected:
  struct WorkspaceState {
    string cwd;
    int cols = 80;
    int rows = 24;
  };
  struct InputQueue {
    deque<string> pending;
    bool pumping = false;
  };

  shared_ptr<EventLoop> loop;
  TerminalHostConfig config;
  shared_ptr<SessionBuffer> sessionBuffer;
  shared_ptr<ProcessSupervisor> supervisor;
  map<string, WorkspaceState> workspaces;
  map<string, shared_ptr<InputQueue>> inputQueues;
  map<string, vector<DoneCallback>> resetWaiters;

  void ensureProcess(const string& key);
  void pumpInput(const string& key, shared_ptr<InputQueue> queue);
  void dropInput(const string& key);
  WorkspaceState& getWorkspace(const string& key);
};
}  // namespace wt

#endif  // __WT_TERMINAL_HOST__
