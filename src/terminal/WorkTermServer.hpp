#ifndef __WT_WORKTERM_SERVER__
#define __WT_WORKTERM_SERVER__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "TerminalHost.hpp"
#include "ViewConnection.hpp"

namespace wt {
/**
 * @brief The wtserver daemon: accepts frontends on a UNIX socket and routes
 * their packets into a TerminalHost.
 */
class WorkTermServer {
 public:
  WorkTermServer(shared_ptr<EventLoop> _loop,
                 shared_ptr<SocketHandler> _socketHandler,
                 const SocketEndpoint& _endpoint,
                 shared_ptr<TerminalHost> _host);
  ~WorkTermServer();

  /** @brief Binds the socket and registers the accept watchers. */
  void start();
  /**
   * @brief Serves until a shutdown is requested, then terminates every child
   * and waits at most `shutdownTimeoutMs` for them.
   */
  void run(int64_t shutdownTimeoutMs);
  /**
   * @brief Stops accepting, drops every view and terminates all children.
   * `done` runs once the children are gone.
   */
  void shutdown(std::function<void()> done);

  /** @brief Async-signal-safe, used by the SIGINT/SIGTERM handler. */
  static void requestShutdown();
  static bool isShutdownRequested();
  /** @brief Clears a previous request (tests run several servers). */
  static void resetShutdownRequest();

  inline size_t numConnections() const { return connections.size(); }

 protected:
  shared_ptr<EventLoop> loop;
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<TerminalHost> host;
  map<int, shared_ptr<ViewConnection>> connections;
  bool listening;

  static volatile sig_atomic_t shutdownRequested;

  void pollAccept(int listenFd);
  void handleRead(int fd);
  void handlePacket(shared_ptr<ViewConnection> connection,
                    const Packet& packet);
  void attach(shared_ptr<ViewConnection> connection,
              const AttachRequest& request);
  void sendStatus(shared_ptr<ViewConnection> connection);
  void dropConnection(shared_ptr<ViewConnection> connection);
};
}  // namespace wt

#endif  // __WT_WORKTERM_SERVER__
