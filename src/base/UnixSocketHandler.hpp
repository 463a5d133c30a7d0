#ifndef __WT_UNIX_SOCKET_HANDLER__
#define __WT_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace wt {
/**
 * @brief SocketHandler over POSIX descriptors.  Every socket is
 * non-blocking; writes retry on EAGAIN for a bounded time.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, no SIGPIPE).
   */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  set<int> activeSockets;
  recursive_mutex globalMutex;
};
}  // namespace wt

#endif  // __WT_UNIX_SOCKET_HANDLER__
