#include "ProcessSupervisor.hpp"

#include "JsonLib.hpp"

namespace wt {
ProcessSupervisor::ProcessSupervisor(shared_ptr<EventLoop> _loop,
                                     shared_ptr<ChildProcessSpawner> _spawner,
                                     shared_ptr<SessionBuffer> _sessionBuffer,
                                     const ProcessSupervisorConfig& _config)
    : loop(_loop),
      spawner(_spawner),
      sessionBuffer(_sessionBuffer),
      config(_config) {}

ProcessSupervisor::~ProcessSupervisor() {
  for (auto& termination : terminating) {
    if (termination->graceTimer) {
      loop->cancelTimer(termination->graceTimer);
    }
    if (termination->killTimer) {
      loop->cancelTimer(termination->killTimer);
    }
  }
  terminating.clear();
  processes.clear();
}

shared_ptr<ChildProcess> ProcessSupervisor::getOrCreateProcess(
    const string& key, const SpawnSpec& spec, const string& cwd, int cols,
    int rows) {
  shared_ptr<ManagedProcess> managed;
  auto it = processes.find(key);
  if (it != processes.end()) {
    if (!it->second->child->hasExited() &&
        it->second->child->isInputWritable()) {
      managed = it->second;
    } else {
      LOG(INFO) << "Process " << it->second->child->getPid() << " for " << key
                << " can no longer take input, replacing it";
      auto stale = it->second->child;
      processes.erase(it);
      if (!stale->hasExited()) {
        startTermination(key, stale, config.terminateGraceMs,
                         config.killGraceMs, []() {});
      }
    }
  }

  if (!managed) {
    managed = createNewProcess(key, spec, cwd, cols, rows);
    if (!managed) {
      return shared_ptr<ChildProcess>();
    }
  }

  managed->active = true;
  updateProcessSize(key, cols, rows);
  return managed->child;
}

shared_ptr<ProcessSupervisor::ManagedProcess>
ProcessSupervisor::createNewProcess(const string& key, const SpawnSpec& spec,
                                    const string& cwd, int cols, int rows) {
  sessionBuffer->getOrCreateSession(key);

  bool includeStartup = bootstrappedKeys.find(key) == bootstrappedKeys.end() &&
                        !spec.startupCommands.empty();
  vector<string> args = spec.helperArgs;
  args.push_back(to_string(cols));
  args.push_back(to_string(rows));
  args.push_back(cwd);
  if (includeStartup) {
    json startupCommands = spec.startupCommands;
    args.push_back("--startup-commands");
    args.push_back(startupCommands.dump());
  }

  map<string, string> env = {
      {"TERM", "xterm-256color"},   {"FORCE_COLOR", "1"},
      {"COLORTERM", "truecolor"},   {"COLUMNS", to_string(cols)},
      {"LINES", to_string(rows)},
  };

  shared_ptr<ChildProcess> child;
  try {
    child = spawner->spawn(spec.helper, args, env, cwd,
                           config.inputHighWaterMark);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Could not spawn " << spec.helper << " for " << key << ": "
               << ex.what();
    sessionBuffer->addOutput(key, string("Shell error: ") + ex.what() + "\r\n");
    return shared_ptr<ManagedProcess>();
  }

  if (includeStartup) {
    bootstrappedKeys.insert(key);
  }

  shared_ptr<ManagedProcess> managed(new ManagedProcess());
  managed->child = child;
  managed->cols = cols;
  managed->rows = rows;
  managed->cwd = cwd;
  managed->active = true;

  child->onOutput(
      [this, key](const string& data) { sessionBuffer->addOutput(key, data); });
  child->onErrorOutput([this, key](const string& data) {
    string output = data;
    replaceAll(output, "\n", "\r\n");
    sessionBuffer->addOutput(key, output);
  });
  child->onSpawnError([this, key](const string& reason) {
    sessionBuffer->addOutput(key, "Shell error: " + reason + "\r\n");
  });
  ChildProcess* rawChild = child.get();
  child->onExit([this, key, rawChild](int exitCode, int signal) {
    auto it = processes.find(key);
    // A newer process may already own the key
    if (it != processes.end() && it->second->child.get() == rawChild) {
      LOG(INFO) << "Process for " << key << " exited (code " << exitCode
                << ", signal " << signal << ")";
      processes.erase(it);
    }
  });

  processes[key] = managed;
  LOG(INFO) << "Created process " << child->getPid() << " for " << key << " ("
            << cols << "x" << rows << " in " << cwd << ")";
  return managed;
}

void ProcessSupervisor::sendToProcess(const string& key, const string& data) {
  auto it = processes.find(key);
  if (it == processes.end()) {
    VLOG(1) << "Skip write: no process for " << key;
    return;
  }
  auto child = it->second->child;
  if (!child->isInputWritable()) {
    LOG(WARNING) << "Skip write: input closed for " << key;
    return;
  }
  child->write(data);
}

bool ProcessSupervisor::sendToProcessWithBackpressure(const string& key,
                                                      const string& data) {
  auto it = processes.find(key);
  if (it == processes.end() || !it->second->child->isInputWritable()) {
    VLOG(1) << "Skip write: no writable process for " << key;
    // Nothing will ever drain, so the caller must not wait
    return true;
  }
  return it->second->child->write(data);
}

void ProcessSupervisor::waitForDrain(const string& key, DoneCallback done) {
  auto it = processes.find(key);
  if (it == processes.end()) {
    loop->post(done);
    return;
  }
  it->second->child->onceDrain(done);
}

void ProcessSupervisor::updateProcessSize(const string& key, int cols,
                                          int rows) {
  auto it = processes.find(key);
  if (it == processes.end() || !it->second->child->isInputWritable()) {
    return;
  }
  auto managed = it->second;
  if (managed->cols == cols && managed->rows == rows) {
    return;
  }
  managed->cols = cols;
  managed->rows = rows;
  string resizeSequence =
      "\x1b[8;" + to_string(rows) + ";" + to_string(cols) + "t";
  VLOG(1) << "Resizing " << key << " to " << cols << "x" << rows;
  managed->child->write(resizeSequence);
}

void ProcessSupervisor::deactivateProcess(const string& key) {
  auto it = processes.find(key);
  if (it != processes.end()) {
    it->second->active = false;
  }
}

void ProcessSupervisor::terminateProcess(const string& key) {
  terminateProcessAsync(key, []() {});
}

void ProcessSupervisor::terminateProcessAsync(const string& key,
                                              DoneCallback done) {
  auto it = processes.find(key);
  if (it == processes.end()) {
    auto inFlight = findTermination(key);
    if (inFlight) {
      inFlight->callbacks.push_back(done);
    } else {
      loop->post(done);
    }
    return;
  }
  auto child = it->second->child;
  // Later getOrCreateProcess calls must not see the dying child
  processes.erase(it);
  startTermination(key, child, config.terminateGraceMs, config.killGraceMs,
                   done);
}

void ProcessSupervisor::terminateAllProcessesAsync(DoneCallback done) {
  size_t total = processes.size() + terminating.size();
  if (total == 0) {
    loop->post(done);
    return;
  }
  LOG(INFO) << "Terminating " << processes.size() << " processes ("
            << terminating.size() << " already terminating)";

  shared_ptr<size_t> remaining(new size_t(total));
  DoneCallback settled = [remaining, done]() {
    if (--(*remaining) == 0) {
      done();
    }
  };

  for (auto& termination : terminating) {
    termination->callbacks.push_back(settled);
  }
  map<string, shared_ptr<ManagedProcess>> toTerminate;
  toTerminate.swap(processes);
  for (auto& it : toTerminate) {
    try {
      startTermination(it.first, it.second->child, config.shutdownGraceMs,
                       config.shutdownKillGraceMs, settled);
    } catch (const std::exception& ex) {
      STERROR << "Error terminating " << it.first << ": " << ex.what();
      loop->post(settled);
    }
  }
}

void ProcessSupervisor::startTermination(const string& key,
                                         shared_ptr<ChildProcess> child,
                                         int64_t graceMs, int64_t killGraceMs,
                                         DoneCallback done) {
  shared_ptr<Termination> termination(new Termination());
  termination->key = key;
  termination->child = child;
  termination->callbacks.push_back(done);
  terminating.insert(termination);

  if (child->hasExited()) {
    finishTermination(termination);
    return;
  }

  LOG(INFO) << "Terminating process " << child->getPid() << " for " << key;
  child->closeInput();
  weak_ptr<Termination> weakTermination = termination;
  child->onExit([this, weakTermination](int, int) {
    auto t = weakTermination.lock();
    if (t) {
      finishTermination(t);
    }
  });
  if (!child->kill(SIGTERM)) {
    VLOG(1) << "SIGTERM not delivered to " << child->getPid();
  }

  termination->graceTimer =
      loop->addTimer(graceMs, [this, weakTermination, killGraceMs]() {
        auto t = weakTermination.lock();
        if (!t || t->finished) {
          return;
        }
        t->graceTimer = 0;
        if (!t->child->hasExited()) {
          LOG(WARNING) << "Process " << t->child->getPid() << " for " << t->key
                       << " ignored SIGTERM, sending SIGKILL";
          t->child->kill(SIGKILL);
        }
        t->killTimer = loop->addTimer(killGraceMs, [this, weakTermination]() {
          auto t2 = weakTermination.lock();
          if (t2) {
            t2->killTimer = 0;
            finishTermination(t2);
          }
        });
      });
}

void ProcessSupervisor::finishTermination(
    shared_ptr<Termination> termination) {
  if (termination->finished) {
    return;
  }
  termination->finished = true;
  if (termination->graceTimer) {
    loop->cancelTimer(termination->graceTimer);
    termination->graceTimer = 0;
  }
  if (termination->killTimer) {
    loop->cancelTimer(termination->killTimer);
    termination->killTimer = 0;
  }
  terminating.erase(termination);
  auto child = termination->child;
  if (child->hasExited()) {
    VLOG(1) << "Termination of " << termination->key << " finished (code "
            << child->getExitCode() << ", signal " << child->getExitSignal()
            << ")";
  } else {
    LOG(WARNING) << "Gave up waiting for process " << child->getPid()
                 << " of " << termination->key;
  }
  for (auto& callback : termination->callbacks) {
    loop->post(callback);
  }
  termination->callbacks.clear();
  termination->child.reset();
}

shared_ptr<ProcessSupervisor::Termination> ProcessSupervisor::findTermination(
    const string& key) const {
  for (auto& termination : terminating) {
    if (termination->key == key && !termination->finished) {
      return termination;
    }
  }
  return shared_ptr<Termination>();
}

bool ProcessSupervisor::hasProcess(const string& key) const {
  return processes.find(key) != processes.end();
}

bool ProcessSupervisor::isProcessActive(const string& key) const {
  auto it = processes.find(key);
  return it != processes.end() && it->second->active;
}

vector<ProcessInfo> ProcessSupervisor::getProcessInfo() const {
  vector<ProcessInfo> infos;
  for (auto& it : processes) {
    ProcessInfo info;
    info.key = it.first;
    info.pid = it.second->child->getPid();
    info.cols = it.second->cols;
    info.rows = it.second->rows;
    info.cwd = it.second->cwd;
    info.active = it.second->active;
    infos.push_back(info);
  }
  return infos;
}
}  // namespace wt
