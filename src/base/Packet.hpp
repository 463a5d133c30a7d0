#ifndef __WT_PACKET_H__
#define __WT_PACKET_H__

#include "Headers.hpp"

namespace wt {
/**
 * @brief A typed frame on the view socket: one header byte followed by the
 * payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error if the bytes are too short to hold a header.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Packet is missing its header");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(1);
  }

  uint8_t getHeader() const { return header; }
  string getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = header;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  /** @brief A WorkTermPacketType value. */
  uint8_t header;
  string payload;
};
}  // namespace wt

#endif  // __WT_PACKET_H__
