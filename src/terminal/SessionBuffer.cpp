#include "SessionBuffer.hpp"

namespace wt {
SessionBuffer::SessionBuffer(shared_ptr<EventLoop> _loop,
                             const SessionBufferConfig& _config)
    : loop(_loop), config(_config) {}

SessionBuffer::~SessionBuffer() { removeAllSessions(); }

void SessionBuffer::getOrCreateSession(const string& key) {
  if (sessions.find(key) != sessions.end()) {
    return;
  }
  sessions[key] = shared_ptr<Session>(new Session());
  LOG(INFO) << "Created new terminal session for workspace: " << key;
}

bool SessionBuffer::hasSession(const string& key) const {
  return sessions.find(key) != sessions.end();
}

shared_ptr<SessionBuffer::Session> SessionBuffer::getSession(
    const string& key) const {
  auto it = sessions.find(key);
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  return it->second;
}

void SessionBuffer::connectView(const string& key,
                                shared_ptr<TerminalConsumer> consumer) {
  getOrCreateSession(key);
  auto session = getSession(key);
  if (session->consumer && session->consumer != consumer) {
    LOG(INFO) << "Disconnecting previous view " << session->consumer->getId()
              << " for workspace: " << key;
    session->connected = false;
  }
  // Anything still pending is already part of the snapshot.
  dropPending(session.get());

  session->consumer = consumer;
  session->connected = true;

  if (session->totalLength > 0 && !session->chunks.empty()) {
    string snapshot;
    snapshot.reserve(session->totalLength);
    for (const auto& chunk : session->chunks) {
      snapshot.append(chunk);
    }
    LOG(INFO) << "Restoring " << snapshot.length() << " bytes to view "
              << consumer->getId();
    deliver(key, session.get(), OutputMessage{snapshot});
  }
  LOG(INFO) << "Connected view " << consumer->getId()
            << " to session: " << key;
}

bool SessionBuffer::disconnectView(const string& key,
                                   shared_ptr<TerminalConsumer> consumer) {
  auto session = getSession(key);
  if (!session || session->consumer != consumer) {
    return false;
  }
  dropPending(session.get());
  session->consumer.reset();
  session->connected = false;
  LOG(INFO) << "Disconnected view " << consumer->getId()
            << " from session: " << key;
  return true;
}

void SessionBuffer::addOutput(const string& key, const string& data) {
  auto session = getSession(key);
  if (!session) {
    LOG(WARNING) << "No session found for workspace: " << key;
    return;
  }
  if (data.empty()) {
    return;
  }

  int64_t lines = countNewlines(data);
  session->chunks.push_back(data);
  session->chunkLines.push_back(lines);
  session->totalLength += data.length();
  session->totalLines += lines;
  trim(key, session.get());

  if (session->connected && session->consumer) {
    relay(key, session.get(), data);
  }
}

void SessionBuffer::trim(const string& key, Session* session) {
  int64_t originalSize = session->totalLength;
  int64_t originalLines = session->totalLines;
  bool trimmed = false;
  auto popFront = [session]() {
    session->totalLength -= session->chunks.front().length();
    session->totalLines -= session->chunkLines.front();
    session->chunks.pop_front();
    session->chunkLines.pop_front();
  };

  if (session->totalLength > config.maxBufferSize) {
    int64_t targetSize =
        int64_t(std::floor(config.maxBufferSize * config.trimRatio));
    while (session->totalLength > targetSize && !session->chunks.empty()) {
      popFront();
    }
    trimmed = true;
  }
  if (session->totalLines > config.maxHistoryLines) {
    int64_t targetLines =
        int64_t(std::floor(config.maxHistoryLines * config.trimRatio));
    while (session->totalLines > targetLines && !session->chunks.empty()) {
      popFront();
    }
    trimmed = true;
  }
  if (trimmed) {
    VLOG(1) << "Buffer trimmed for workspace: " << key << " (" << originalSize
            << " -> " << session->totalLength << " bytes, " << originalLines
            << " -> " << session->totalLines << " lines)";
  }
}

void SessionBuffer::relay(const string& key, Session* session,
                          const string& data) {
  int64_t now = loop->now();
  session->pending.append(data);
  if (!session->pendingSince) {
    session->pendingSince = now;
  }

  int64_t held = now - *session->pendingSince;
  if (int64_t(session->pending.length()) >= config.immediateFlushBytes ||
      held >= config.maxHoldMs) {
    cancelFlushTimer(session);
    flushPending(key, session);
    return;
  }

  if (session->lastFlush && now - *session->lastFlush < config.coalesceWindowMs) {
    cancelFlushTimer(session);
    // Never hold the oldest pending byte past maxHoldMs
    int64_t delay = min(config.coalesceWindowMs, config.maxHoldMs - held);
    session->flushTimer = loop->addTimer(delay, [this, key]() {
      auto timerSession = getSession(key);
      if (!timerSession) {
        return;
      }
      timerSession->flushTimer = 0;
      flushPending(key, timerSession.get());
    });
    VLOG(3) << "Coalescing " << session->pending.length()
            << " pending bytes for " << key << " for " << delay << "ms";
  } else {
    cancelFlushTimer(session);
    flushPending(key, session);
  }
}

void SessionBuffer::flushPending(const string& key, Session* session) {
  if (session->pending.empty()) {
    return;
  }
  string outputData;
  outputData.swap(session->pending);
  session->pendingSince.reset();
  session->lastFlush = loop->now();
  if (!session->connected || !session->consumer) {
    return;
  }
  VLOG(2) << "Flushing " << outputData.length() << " bytes to " << key;
  deliver(key, session, OutputMessage{outputData});
}

void SessionBuffer::cancelFlushTimer(Session* session) {
  if (session->flushTimer) {
    loop->cancelTimer(session->flushTimer);
    session->flushTimer = 0;
  }
}

void SessionBuffer::dropPending(Session* session) {
  cancelFlushTimer(session);
  session->pending.clear();
  session->pendingSince.reset();
}

bool SessionBuffer::deliver(const string& key, Session* session,
                            const ConsumerMessage& message) {
  if (!session->consumer) {
    return false;
  }
  try {
    session->consumer->send(message);
    return true;
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Error sending " << consumerMessageType(message)
                 << " to view " << session->consumer->getId() << " for "
                 << key << ": " << ex.what();
    session->connected = false;
    dropPending(session);
    return false;
  }
}

void SessionBuffer::clearBuffer(const string& key) {
  auto session = getSession(key);
  if (!session) {
    return;
  }
  session->chunks.clear();
  session->chunkLines.clear();
  session->totalLength = 0;
  session->totalLines = 0;
  dropPending(session.get());
  LOG(INFO) << "Cleared buffer for workspace: " << key;
}

bool SessionBuffer::sendControl(const string& key,
                                const ConsumerMessage& message) {
  auto session = getSession(key);
  if (!session || !session->connected || !session->consumer) {
    return false;
  }
  // Output produced before the control message goes out first
  if (!session->pending.empty()) {
    cancelFlushTimer(session.get());
    flushPending(key, session.get());
    if (!session->connected) {
      return false;
    }
  }
  return deliver(key, session.get(), message);
}

void SessionBuffer::removeSession(const string& key) {
  auto session = getSession(key);
  if (!session) {
    return;
  }
  dropPending(session.get());
  session->connected = false;
  session->consumer.reset();
  sessions.erase(key);
  LOG(INFO) << "Removed session for workspace: " << key;
}

void SessionBuffer::removeAllSessions() {
  if (sessions.empty()) {
    return;
  }
  LOG(INFO) << "Removing " << sessions.size() << " terminal sessions...";
  for (auto& it : sessions) {
    try {
      Session* session = it.second.get();
      dropPending(session);
      session->connected = false;
      session->consumer.reset();
      session->chunks.clear();
      session->chunkLines.clear();
      session->totalLength = 0;
      session->totalLines = 0;
    } catch (const std::exception& ex) {
      STERROR << "Error cleaning up session " << it.first << ": "
              << ex.what();
    }
  }
  sessions.clear();
}

bool SessionBuffer::isConnected(const string& key) const {
  auto session = getSession(key);
  return session ? session->connected : false;
}

shared_ptr<TerminalConsumer> SessionBuffer::getConsumer(
    const string& key) const {
  auto session = getSession(key);
  if (!session) {
    return shared_ptr<TerminalConsumer>();
  }
  return session->consumer;
}

string SessionBuffer::getBuffer(const string& key) const {
  auto session = getSession(key);
  if (!session) {
    return "";
  }
  string buffer;
  buffer.reserve(session->totalLength);
  for (const auto& chunk : session->chunks) {
    buffer.append(chunk);
  }
  return buffer;
}

vector<SessionInfo> SessionBuffer::getSessionInfo() const {
  vector<SessionInfo> infos;
  for (const auto& it : sessions) {
    SessionInfo info;
    info.key = it.first;
    info.bufferSize = it.second->totalLength;
    info.lineCount = it.second->totalLines;
    info.chunkCount = int64_t(it.second->chunks.size());
    info.connected = it.second->connected;
    infos.push_back(info);
  }
  return infos;
}
}  // namespace wt
