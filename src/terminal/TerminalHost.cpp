#include "TerminalHost.hpp"

#include "JsonLib.hpp"

namespace wt {
TerminalHost::TerminalHost(shared_ptr<EventLoop> _loop,
                           shared_ptr<ChildProcessSpawner> spawner,
                           const TerminalHostConfig& _config,
                           const SessionBufferConfig& bufferConfig,
                           const ProcessSupervisorConfig& supervisorConfig)
    : loop(_loop), config(_config) {
  if (config.pasteChunkSize == 0) {
    STFATAL << "Paste chunk size must be positive";
  }
  sessionBuffer.reset(new SessionBuffer(loop, bufferConfig));
  supervisor.reset(
      new ProcessSupervisor(loop, spawner, sessionBuffer, supervisorConfig));
}

TerminalHost::~TerminalHost() {
  inputQueues.clear();
  // Children go first so nothing writes into a destroyed buffer
  supervisor.reset();
  sessionBuffer.reset();
}

TerminalHost::WorkspaceState& TerminalHost::getWorkspace(const string& key) {
  auto it = workspaces.find(key);
  if (it == workspaces.end()) {
    WorkspaceState state;
    passwd* pwd = getpwuid(getuid());
    state.cwd = (pwd && pwd->pw_dir) ? string(pwd->pw_dir) : string("/");
    it = workspaces.insert(make_pair(key, state)).first;
  }
  return it->second;
}

void TerminalHost::openSession(const string& key,
                               shared_ptr<TerminalConsumer> consumer,
                               const string& cwd, int cols, int rows) {
  WorkspaceState& state = getWorkspace(key);
  if (!cwd.empty()) {
    state.cwd = cwd;
  }
  state.cols = cols;
  state.rows = rows;

  sessionBuffer->getOrCreateSession(key);
  sessionBuffer->connectView(key, consumer);
  ensureProcess(key);
}

void TerminalHost::ensureProcess(const string& key) {
  if (isResetting(key)) {
    LOG(INFO) << "Reset of " << key << " in progress, not spawning yet";
    return;
  }
  const WorkspaceState& state = getWorkspace(key);
  supervisor->getOrCreateProcess(key, config.spawnSpec, state.cwd, state.cols,
                                 state.rows);
}

void TerminalHost::closeView(const string& key,
                             shared_ptr<TerminalConsumer> consumer) {
  if (sessionBuffer->disconnectView(key, consumer)) {
    supervisor->deactivateProcess(key);
  }
}

void TerminalHost::sendInput(const string& key, const string& data) {
  if (data.empty()) {
    return;
  }
  auto it = inputQueues.find(key);
  bool pumping = it != inputQueues.end() && it->second->pumping;
  if (!pumping && data.length() <= config.pasteChunkSize) {
    supervisor->sendToProcess(key, data);
    return;
  }
  if (it == inputQueues.end()) {
    it = inputQueues
             .insert(make_pair(key, shared_ptr<InputQueue>(new InputQueue())))
             .first;
  }
  auto queue = it->second;
  queue->pending.push_back(data);
  if (!queue->pumping) {
    VLOG(1) << "Pasting " << data.length() << " bytes into " << key;
    pumpInput(key, queue);
  }
}

void TerminalHost::pumpInput(const string& key,
                             shared_ptr<InputQueue> queue) {
  queue->pumping = true;
  while (!queue->pending.empty()) {
    string& front = queue->pending.front();
    string chunk = front.substr(0, config.pasteChunkSize);
    front.erase(0, chunk.length());
    if (front.empty()) {
      queue->pending.pop_front();
    }
    if (!supervisor->sendToProcessWithBackpressure(key, chunk)) {
      weak_ptr<InputQueue> weakQueue = queue;
      supervisor->waitForDrain(key, [this, key, weakQueue]() {
        auto resumed = weakQueue.lock();
        // The queue is gone once the key was reset or closed
        if (resumed) {
          pumpInput(key, resumed);
        }
      });
      return;
    }
  }
  queue->pumping = false;
}

void TerminalHost::dropInput(const string& key) {
  auto it = inputQueues.find(key);
  if (it == inputQueues.end()) {
    return;
  }
  size_t dropped = 0;
  for (auto& data : it->second->pending) {
    dropped += data.length();
  }
  if (dropped) {
    LOG(INFO) << "Dropping " << dropped << " bytes of queued input for "
              << key;
  }
  inputQueues.erase(it);
}

size_t TerminalHost::getQueuedInput(const string& key) const {
  auto it = inputQueues.find(key);
  if (it == inputQueues.end()) {
    return 0;
  }
  size_t total = 0;
  for (auto& data : it->second->pending) {
    total += data.length();
  }
  return total;
}

void TerminalHost::resize(const string& key, int cols, int rows) {
  WorkspaceState& state = getWorkspace(key);
  state.cols = cols;
  state.rows = rows;
  supervisor->updateProcessSize(key, cols, rows);
}

void TerminalHost::clear(const string& key) {
  sessionBuffer->sendControl(key, ClearMessage());
  sessionBuffer->clearBuffer(key);
  // Ctrl-L makes the shell redraw its prompt
  supervisor->sendToProcess(key, "\x0c");
}

void TerminalHost::reset(const string& key, DoneCallback done) {
  auto it = resetWaiters.find(key);
  if (it != resetWaiters.end()) {
    LOG(INFO) << "Reset of " << key << " already in progress";
    it->second.push_back(done);
    return;
  }
  LOG(INFO) << "Resetting " << key;
  resetWaiters[key].push_back(done);
  dropInput(key);
  supervisor->terminateProcessAsync(key, [this, key]() {
    sessionBuffer->clearBuffer(key);
    sessionBuffer->sendControl(key, ResetMessage());
    vector<DoneCallback> waiters;
    waiters.swap(resetWaiters[key]);
    resetWaiters.erase(key);
    LOG(INFO) << "Reset of " << key << " finished";
    for (auto& waiter : waiters) {
      waiter();
    }
  });
}

void TerminalHost::closeWorkspace(const string& key, DoneCallback done) {
  LOG(INFO) << "Closing workspace " << key;
  dropInput(key);
  supervisor->terminateProcessAsync(key, [this, key, done]() {
    sessionBuffer->removeSession(key);
    workspaces.erase(key);
    done();
  });
}

void TerminalHost::handleFrontendMessage(const string& key,
                                         shared_ptr<TerminalConsumer> consumer,
                                         const FrontendMessage& message) {
  std::visit(
      overloaded{
          [&](const TerminalReady& ready) {
            if (sessionBuffer->getConsumer(key) != consumer) {
              openSession(key, consumer, ready.cwd, ready.cols, ready.rows);
              return;
            }
            WorkspaceState& state = getWorkspace(key);
            if (!ready.cwd.empty()) {
              state.cwd = ready.cwd;
            }
            state.cols = ready.cols;
            state.rows = ready.rows;
            ensureProcess(key);
          },
          [&](const TerminalInput& input) { sendInput(key, input.data); },
          [&](const TerminalResize& size) {
            resize(key, size.cols, size.rows);
          },
          [&](const ClearRequest&) { clear(key); },
          [&](const ResetRequest&) { reset(key, []() {}); },
          [&](const FrontendError& error) {
            LOG(ERROR) << "Frontend error from " << consumer->getId() << " ("
                       << key << "): " << error.message;
          },
      },
      message);
}

void TerminalHost::shutdown(DoneCallback done) {
  LOG(INFO) << "Shutting down terminal host";
  inputQueues.clear();
  sessionBuffer->removeAllSessions();
  supervisor->terminateAllProcessesAsync(done);
}

string TerminalHost::toJsonString() const {
  json status;
  status["sessions"] = json::array();
  for (auto& info : sessionBuffer->getSessionInfo()) {
    json session;
    session["key"] = info.key;
    session["bufferSize"] = info.bufferSize;
    session["lineCount"] = info.lineCount;
    session["chunkCount"] = info.chunkCount;
    session["connected"] = info.connected;
    status["sessions"].push_back(session);
  }
  status["processes"] = json::array();
  for (auto& info : supervisor->getProcessInfo()) {
    json process;
    process["key"] = info.key;
    process["pid"] = info.pid;
    process["cols"] = info.cols;
    process["rows"] = info.rows;
    process["cwd"] = info.cwd;
    process["active"] = info.active;
    status["processes"].push_back(process);
  }
  status["terminating"] = supervisor->numTerminating();
  // Keys and paths come off the wire and need not be valid UTF-8
  return status.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace wt
