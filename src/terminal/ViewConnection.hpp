#ifndef __WT_VIEW_CONNECTION__
#define __WT_VIEW_CONNECTION__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "TerminalConsumer.hpp"

namespace wt {
/**
 * @brief One frontend connected to the daemon's view socket.
 *
 * Relayed messages become OUTPUT, CLEAR_VIEW and RESET_VIEW packets.  The
 * connection learns its workspace key from the first ATTACH packet.
 */
class ViewConnection : public TerminalConsumer {
 public:
  ViewConnection(shared_ptr<SocketHandler> _socketHandler, int _fd);
  virtual ~ViewConnection();

  /** @throws std::runtime_error once the socket is closed or broken. */
  virtual void send(const ConsumerMessage& message);
  virtual string getId() const { return id; }

  /** @brief Writes a raw packet to the frontend. */
  void sendPacket(const Packet& packet);

  /** @brief Tells the frontend the session is over and closes the socket. */
  void closeEndpoint();

  inline int getFd() const { return fd; }
  inline bool isOpen() const { return fd >= 0; }
  inline bool isAttached() const { return !key.empty(); }
  inline const string& getKey() const { return key; }
  inline void setKey(const string& _key) { key = _key; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int fd;
  string id;
  string key;
};
}  // namespace wt

#endif  // __WT_VIEW_CONNECTION__
