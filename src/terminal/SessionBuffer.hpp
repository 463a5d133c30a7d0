#ifndef __WT_SESSION_BUFFER__
#define __WT_SESSION_BUFFER__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "TerminalConsumer.hpp"

namespace wt {
struct SessionBufferConfig {
  /** @brief Byte cap on the retained history. */
  int64_t maxBufferSize = 50000;
  /** @brief Newline cap on the retained history. */
  int64_t maxHistoryLines = 1024;
  /** @brief Fraction of a cap kept after a trim. */
  double trimRatio = 0.7;
  int64_t coalesceWindowMs = 16;
  int64_t maxHoldMs = 32;
  int64_t immediateFlushBytes = 8192;
};

struct SessionInfo {
  string key;
  int64_t bufferSize;
  int64_t lineCount;
  int64_t chunkCount;
  bool connected;
};

/**
 * @brief Per-key bounded output history plus the relay that forwards new
 * output to the single attached consumer.
 *
 * History is kept as a list of immutable chunks and trimmed from the front.
 * Output for an attached consumer is coalesced: a pending batch is flushed
 * immediately when it reaches `immediateFlushBytes` or has been held for
 * `maxHoldMs`, otherwise within `coalesceWindowMs` of the previous flush.
 */
class SessionBuffer {
 public:
  SessionBuffer(shared_ptr<EventLoop> _loop,
                const SessionBufferConfig& _config = SessionBufferConfig());
  ~SessionBuffer();

  /** @brief Creates the session for `key` if it does not exist yet. */
  void getOrCreateSession(const string& key);
  bool hasSession(const string& key) const;

  /**
   * @brief Attaches `consumer`, replacing any previous one, and sends the
   * whole retained history to it as one snapshot.
   */
  void connectView(const string& key, shared_ptr<TerminalConsumer> consumer);
  /**
   * @brief Detaches `consumer` if it is still the attached one.
   * @return true if the consumer was detached.
   */
  bool disconnectView(const string& key, shared_ptr<TerminalConsumer> consumer);

  /**
   * @brief Appends child output to the history and relays it to the attached
   * consumer.
   */
  void addOutput(const string& key, const string& data);

  /** @brief Empties the history and any unrelayed output. */
  void clearBuffer(const string& key);

  /**
   * @brief Sends a non-output message to the attached consumer.
   * @return false if nothing is attached or the send failed.
   */
  bool sendControl(const string& key, const ConsumerMessage& message);

  void removeSession(const string& key);
  void removeAllSessions();

  bool isConnected(const string& key) const;
  shared_ptr<TerminalConsumer> getConsumer(const string& key) const;
  /** @brief Concatenation of the retained chunks. */
  string getBuffer(const string& key) const;
  vector<SessionInfo> getSessionInfo() const;

  inline const SessionBufferConfig& getConfig() const { return config; }

 protected:
  struct Session {
    deque<string> chunks;
    // Newlines in each chunk, same order as `chunks`
    deque<int64_t> chunkLines;
    int64_t totalLength = 0;
    int64_t totalLines = 0;

    shared_ptr<TerminalConsumer> consumer;
    bool connected = false;

    string pending;
    EventLoop::TimerId flushTimer = 0;
    optional<int64_t> lastFlush;
    optional<int64_t> pendingSince;
  };

  shared_ptr<EventLoop> loop;
  SessionBufferConfig config;
  map<string, shared_ptr<Session>> sessions;

  shared_ptr<Session> getSession(const string& key) const;
  void trim(const string& key, Session* session);
  void relay(const string& key, Session* session, const string& data);
  void flushPending(const string& key, Session* session);
  void cancelFlushTimer(Session* session);
  void dropPending(Session* session);
  bool deliver(const string& key, Session* session,
               const ConsumerMessage& message);
};
}  // namespace wt

#endif  // __WT_SESSION_BUFFER__
