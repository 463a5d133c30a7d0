#include "PipeChildProcess.hpp"

extern char **environ;

namespace wt {
#define READ_BUF_SIZE (16 * 1024)
#define EXIT_POLL_INTERVAL_MS (20)
// Upper bound on reads when draining a pipe after exit.  A grandchild may keep
// the pipe open and writing.
#define MAX_DRAIN_READS (64)

namespace {
enum SpawnStage { SPAWN_STAGE_CHDIR = 1, SPAWN_STAGE_EXEC = 2 };

struct SpawnFailure {
  int stage;
  int error;
};

void setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}
}  // namespace

PipeChildProcess::PipeChildProcess(shared_ptr<EventLoop> _loop,
                                   size_t highWaterMark)
    : ChildProcess(_loop),
      pid(-1),
      inputFd(-1),
      outputFd(-1),
      errorFd(-1),
      inputDestroyed(false),
      writeBuffer(highWaterMark),
      pollTimer(0) {}

PipeChildProcess::~PipeChildProcess() {
  if (pollTimer) {
    loop->cancelTimer(pollTimer);
    pollTimer = 0;
  }
  closeFd(&inputFd);
  closeFd(&outputFd);
  closeFd(&errorFd);
  if (!exited && pid > 0) {
    VLOG(1) << "Killing child " << pid << " on destruction";
    ::kill(pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
  }
}

void PipeChildProcess::start(const string &file, const vector<string> &args,
                             const map<string, string> &env,
                             const string &cwd) {
  if (pid > 0) {
    STFATAL << "Tried to start a child process twice";
  }

  // stdin, stdout, stderr and the exec status pipe
  int pipes[4][2];
  for (int a = 0; a < 4; a++) {
    pipes[a][0] = pipes[a][1] = -1;
  }
  auto closeAll = [&pipes]() {
    for (int a = 0; a < 4; a++) {
      for (int b = 0; b < 2; b++) {
        if (pipes[a][b] >= 0) {
          ::close(pipes[a][b]);
          pipes[a][b] = -1;
        }
      }
    }
  };
  for (int a = 0; a < 4; a++) {
    if (::pipe2(pipes[a], O_CLOEXEC) == -1) {
      auto localErrno = GetErrno();
      closeAll();
      throw std::runtime_error(string("Could not create pipe: ") +
                               strerror(localErrno));
    }
  }

  // Everything the child needs is built before the fork
  vector<string> argStrings;
  argStrings.push_back(file);
  argStrings.insert(argStrings.end(), args.begin(), args.end());
  vector<char *> argv;
  for (auto &it : argStrings) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  map<string, string> mergedEnv;
  for (char **it = environ; it && *it; it++) {
    string entry(*it);
    auto pos = entry.find('=');
    if (pos != string::npos) {
      mergedEnv[entry.substr(0, pos)] = entry.substr(pos + 1);
    }
  }
  for (auto &it : env) {
    mergedEnv[it.first] = it.second;
  }
  vector<string> envStrings;
  for (auto &it : mergedEnv) {
    envStrings.push_back(it.first + "=" + it.second);
  }
  vector<char *> envp;
  for (auto &it : envStrings) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);

  long maxFd = sysconf(_SC_OPEN_MAX);
  if (maxFd < 0 || maxFd > 65536) {
    maxFd = 65536;
  }

  pid_t childPid = fork();
  if (childPid == -1) {
    auto localErrno = GetErrno();
    closeAll();
    throw std::runtime_error(string("Could not fork: ") +
                             strerror(localErrno));
  }
  if (childPid == 0) {
    // child process: async-signal-safe calls only
    int statusFd = pipes[3][1];
    setsid();
    dup2(pipes[0][0], STDIN_FILENO);
    dup2(pipes[1][1], STDOUT_FILENO);
    dup2(pipes[2][1], STDERR_FILENO);
    ::signal(SIGPIPE, SIG_DFL);
    for (int fd = STDERR_FILENO + 1; fd < maxFd; fd++) {
      if (fd != statusFd) {
        ::close(fd);
      }
    }
    SpawnFailure failure;
    if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
      failure.stage = SPAWN_STAGE_CHDIR;
      failure.error = errno;
      ssize_t ignored = ::write(statusFd, &failure, sizeof(failure));
      (void)ignored;
      _exit(127);
    }
    environ = &envp[0];
    execvp(argv[0], &argv[0]);
    failure.stage = SPAWN_STAGE_EXEC;
    failure.error = errno;
    ssize_t ignored = ::write(statusFd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
  }

  // parent process
  pid = childPid;
  FATAL_FAIL(::close(pipes[0][0]));
  FATAL_FAIL(::close(pipes[1][1]));
  FATAL_FAIL(::close(pipes[2][1]));
  FATAL_FAIL(::close(pipes[3][1]));
  inputFd = pipes[0][1];
  outputFd = pipes[1][0];
  errorFd = pipes[2][0];

  // The write end closes on a successful exec, so this returns 0 bytes then.
  SpawnFailure failure;
  ssize_t statusBytes;
  do {
    statusBytes = ::read(pipes[3][0], &failure, sizeof(failure));
  } while (statusBytes == -1 && GetErrno() == EINTR);
  FATAL_FAIL(::close(pipes[3][0]));

  setNonBlocking(inputFd);
  setNonBlocking(outputFd);
  setNonBlocking(errorFd);
  loop->watchRead(outputFd, [this]() { readStream(&outputFd, false); });
  loop->watchRead(errorFd, [this]() { readStream(&errorFd, true); });
  schedulePoll();

  if (statusBytes == sizeof(failure)) {
    string reason;
    if (failure.stage == SPAWN_STAGE_CHDIR) {
      reason = "spawn " + file + " failed: cannot enter " + cwd + ": " +
               strerror(failure.error);
    } else {
      reason = "spawn " + file + " " + strerror(failure.error);
    }
    destroyInput();
    weak_ptr<ChildProcess> weakSelf = shared_from_this();
    loop->post([weakSelf, this, reason]() {
      if (weakSelf.lock()) {
        emitSpawnError(reason);
      }
    });
    return;
  }
  LOG(INFO) << "Started child " << pid << ": " << file;
}

bool PipeChildProcess::isInputWritable() const {
  return !exited && !inputDestroyed && inputFd >= 0;
}

bool PipeChildProcess::write(const string &data) {
  if (!isInputWritable()) {
    VLOG(1) << "Dropping " << data.length() << " bytes for child " << pid
            << ": input is closed";
    return false;
  }
  if (data.empty()) {
    return writeBuffer.canAcceptMore();
  }
  if (!writeBuffer.hasPendingData()) {
    ssize_t bytesWritten = ::write(inputFd, data.data(), data.length());
    if (bytesWritten < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        bytesWritten = 0;
      } else {
        LOG(INFO) << "Input of child " << pid
                  << " is gone: " << strerror(localErrno);
        destroyInput();
        return false;
      }
    }
    if (size_t(bytesWritten) == data.length()) {
      return true;
    }
    writeBuffer.enqueue(data.substr(bytesWritten));
  } else {
    writeBuffer.enqueue(data);
  }
  loop->watchWrite(inputFd, [this]() { flushInput(); });
  return writeBuffer.canAcceptMore();
}

void PipeChildProcess::flushInput() {
  while (writeBuffer.hasPendingData()) {
    size_t count;
    const char *data = writeBuffer.peekData(&count);
    ssize_t bytesWritten = ::write(inputFd, data, count);
    if (bytesWritten < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        return;
      }
      LOG(INFO) << "Input of child " << pid
                << " is gone: " << strerror(localErrno);
      destroyInput();
      return;
    }
    writeBuffer.consume(bytesWritten);
  }
  loop->unwatchWrite(inputFd);
  emitDrain();
}

void PipeChildProcess::destroyInput() {
  inputDestroyed = true;
  writeBuffer.clear();
  closeFd(&inputFd);
  emitDrain();
}

void PipeChildProcess::closeInput() {
  if (inputFd < 0) {
    return;
  }
  VLOG(1) << "Closing input of child " << pid << " with "
          << writeBuffer.size() << " bytes pending";
  destroyInput();
}

bool PipeChildProcess::kill(int signal) {
  if (exited || pid <= 0) {
    return false;
  }
  if (::kill(pid, signal) == -1) {
    VLOG(1) << "Could not signal child " << pid << ": "
            << strerror(GetErrno());
    return false;
  }
  return true;
}

bool PipeChildProcess::readStream(int *fd, bool isError) {
  char buf[READ_BUF_SIZE];
  ssize_t bytesRead = ::read(*fd, buf, READ_BUF_SIZE);
  if (bytesRead > 0) {
    string data(buf, bytesRead);
    VLOG(3) << "Read " << bytesRead << " bytes from child " << pid;
    if (isError) {
      emitErrorOutput(data);
    } else {
      emitOutput(data);
    }
    return true;
  }
  if (bytesRead == 0) {
    VLOG(1) << (isError ? "Error" : "Output") << " stream of child " << pid
            << " closed";
    closeFd(fd);
    return false;
  }
  auto localErrno = GetErrno();
  if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
      localErrno == EINTR) {
    return false;
  }
  LOG(WARNING) << "Error reading from child " << pid << ": "
               << strerror(localErrno);
  closeFd(fd);
  return false;
}

void PipeChildProcess::schedulePoll() {
  pollTimer = loop->addTimer(EXIT_POLL_INTERVAL_MS, [this]() {
    pollTimer = 0;
    pollExit();
  });
}

void PipeChildProcess::pollExit() {
  int status = 0;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == 0 || (rc == -1 && GetErrno() == EINTR)) {
    schedulePoll();
    return;
  }

  int code = -1;
  int signal = 0;
  if (rc == pid) {
    if (WIFEXITED(status)) {
      code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      signal = WTERMSIG(status);
    }
  } else {
    STERROR << "waitpid failed for child " << pid << ": "
            << strerror(GetErrno());
  }

  // Deliver whatever the child wrote before it went away
  for (int a = 0; a < MAX_DRAIN_READS && outputFd >= 0; a++) {
    if (!readStream(&outputFd, false)) break;
  }
  for (int a = 0; a < MAX_DRAIN_READS && errorFd >= 0; a++) {
    if (!readStream(&errorFd, true)) break;
  }
  closeFd(&outputFd);
  closeFd(&errorFd);
  inputDestroyed = true;
  writeBuffer.clear();
  closeFd(&inputFd);

  LOG(INFO) << "Child " << pid << " exited with code " << code
            << " signal " << signal;
  emitExit(code, signal);
}

void PipeChildProcess::closeFd(int *fd) {
  if (*fd < 0) {
    return;
  }
  loop->unwatch(*fd);
  FATAL_FAIL(::close(*fd));
  *fd = -1;
}

PipeChildProcessSpawner::PipeChildProcessSpawner(shared_ptr<EventLoop> _loop)
    : loop(_loop) {
  // A child that closed its input shows up as EPIPE instead of a signal
  ::signal(SIGPIPE, SIG_IGN);
}

shared_ptr<ChildProcess> PipeChildProcessSpawner::spawn(
    const string &file, const vector<string> &args,
    const map<string, string> &env, const string &cwd, size_t highWaterMark) {
  shared_ptr<PipeChildProcess> child(
      new PipeChildProcess(loop, highWaterMark));
  child->start(file, args, env, cwd);
  return child;
}
}  // namespace wt
