#include "ChildProcess.hpp"

namespace wt {
ChildProcess::ChildProcess(shared_ptr<EventLoop> _loop)
    : loop(_loop), exited(false), exitCode(-1), exitSignal(0) {}

void ChildProcess::onExit(ExitHandler handler) {
  if (exited) {
    int code = exitCode;
    int signal = exitSignal;
    loop->post([handler, code, signal]() { handler(code, signal); });
    return;
  }
  exitHandlers.push_back(handler);
}

void ChildProcess::onceDrain(DrainHandler handler) {
  if (exited || !isInputWritable() || !needsDrain()) {
    loop->post(handler);
    return;
  }
  drainHandlers.push_back(handler);
}

void ChildProcess::emitOutput(const string &data) {
  if (outputHandler) {
    outputHandler(data);
  }
}

void ChildProcess::emitErrorOutput(const string &data) {
  if (errorOutputHandler) {
    errorOutputHandler(data);
  } else {
    emitOutput(data);
  }
}

void ChildProcess::emitSpawnError(const string &reason) {
  LOG(WARNING) << "Child process failed to start: " << reason;
  if (spawnErrorHandler) {
    spawnErrorHandler(reason);
  }
}

void ChildProcess::emitExit(int code, int signal) {
  if (exited) {
    STERROR << "Child process " << getPid() << " exited twice";
    return;
  }
  // A handler may drop the last outside reference to this child
  shared_ptr<ChildProcess> self = shared_from_this();
  exited = true;
  exitCode = code;
  exitSignal = signal;
  emitDrain();
  vector<ExitHandler> handlers;
  handlers.swap(exitHandlers);
  for (auto &handler : handlers) {
    handler(code, signal);
  }
}

void ChildProcess::emitDrain() {
  vector<DrainHandler> handlers;
  handlers.swap(drainHandlers);
  for (auto &handler : handlers) {
    loop->post(handler);
  }
}
}  // namespace wt
