#ifndef __WT_SOCKET_HANDLER__
#define __WT_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace wt {
/**
 * @brief Abstract socket reads/writes, packet framing and lifecycle
 * management for the view socket.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Give up after the transfer timeout when nothing arrives.
   * @throws std::runtime_error on EOF, a read error or a timeout.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads a length-prefixed packet.
   * @returns false when the packet length is zero (empty message).
   * @throws std::runtime_error on an invalid length or a closed socket.
   */
  inline bool readPacket(int fd, Packet* packet) {
    int64_t length;
    readAll(fd, (char*)&length, sizeof(int64_t), true);
    if (length < 0 || length > MAX_PACKET_SIZE) {
      string s("Invalid size (<0 or >128 MB): ");
      s += std::to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, true);
    *packet = Packet(s);
    return true;
  }

  /**
   * @brief Serializes and writes a packet with a leading length prefix.
   */
  inline void writePacket(int fd, const Packet& packet) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length < 0 || length > MAX_PACKET_SIZE) {
      STFATAL << "Invalid message length: " << length;
    }
    writeAllOrThrow(fd, (const char*)&length, sizeof(int64_t), true);
    if (length) {
      writeAllOrThrow(fd, &s[0], length, true);
    }
  }

  /** @brief Writes a packet whose payload is a serialized protobuf. */
  template <typename T>
  inline void writeProtoPacket(int fd, uint8_t header, const T& t) {
    writePacket(fd, Packet(header, protoToString(t)));
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return -1 if no connection is waiting.
   */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
  virtual vector<int> getActiveSockets() = 0;

 protected:
  static const int64_t MAX_PACKET_SIZE = 128 * 1024 * 1024;
};
}  // namespace wt

#endif  // __WT_SOCKET_HANDLER__
