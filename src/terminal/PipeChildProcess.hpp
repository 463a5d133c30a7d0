#ifndef __WT_PIPE_CHILD_PROCESS__
#define __WT_PIPE_CHILD_PROCESS__

#include "ChildProcess.hpp"
#include "Headers.hpp"
#include "WriteBuffer.hpp"

namespace wt {
/**
 * @brief ChildProcess started with fork()/execvp() and connected through three
 * non-blocking pipes.
 *
 * The child runs in its own session.  Exit is detected by polling waitpid()
 * on a loop timer; whatever the child wrote before exiting is read before the
 * exit handlers run.
 */
class PipeChildProcess : public ChildProcess {
 public:
  PipeChildProcess(shared_ptr<EventLoop> _loop, size_t highWaterMark);
  /** @brief Kills and reaps a child that is still running. */
  virtual ~PipeChildProcess();

  /**
   * @brief Forks and executes `file`.  A failed chdir or exec in the child is
   * reported through the spawn error handler, followed by an exit.
   * @throws std::runtime_error if the pipes or the fork cannot be created.
   */
  void start(const string &file, const vector<string> &args,
             const map<string, string> &env, const string &cwd);

  virtual pid_t getPid() const { return pid; }
  virtual bool isInputWritable() const;
  virtual bool write(const string &data);
  virtual size_t getPendingInput() const { return writeBuffer.size(); }
  virtual size_t getHighWaterMark() const {
    return writeBuffer.getHighWaterMark();
  }
  virtual void closeInput();
  virtual bool kill(int signal);

 protected:
  pid_t pid;
  int inputFd;
  int outputFd;
  int errorFd;
  bool inputDestroyed;
  WriteBuffer writeBuffer;
  EventLoop::TimerId pollTimer;

  /** @return true if bytes were read. */
  bool readStream(int *fd, bool isError);
  void flushInput();
  void destroyInput();
  void schedulePoll();
  void pollExit();
  void closeFd(int *fd);
};

class PipeChildProcessSpawner : public ChildProcessSpawner {
 public:
  explicit PipeChildProcessSpawner(shared_ptr<EventLoop> _loop);
  virtual ~PipeChildProcessSpawner() {}

  virtual shared_ptr<ChildProcess> spawn(const string &file,
                                         const vector<string> &args,
                                         const map<string, string> &env,
                                         const string &cwd,
                                         size_t highWaterMark);

 protected:
  shared_ptr<EventLoop> loop;
};
}  // namespace wt

#endif  // __WT_PIPE_CHILD_PROCESS__
