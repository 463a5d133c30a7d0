#ifndef __WT_PIPE_SOCKET_HANDLER__
#define __WT_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace wt {
/**
 * @brief Handles UNIX domain socket connections addressed by filesystem path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket, replacing any stale socket file,
   * and restricts it to the current user.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd and removes the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  map<string, set<int>> pipeServerSockets;
};
}  // namespace wt

#endif  // __WT_PIPE_SOCKET_HANDLER__
