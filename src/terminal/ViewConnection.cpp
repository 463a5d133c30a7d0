#include "ViewConnection.hpp"

namespace wt {
ViewConnection::ViewConnection(shared_ptr<SocketHandler> _socketHandler,
                               int _fd)
    : socketHandler(_socketHandler), fd(_fd), id(sole::uuid4().str()) {}

ViewConnection::~ViewConnection() {
  if (isOpen()) {
    closeEndpoint();
  }
}

void ViewConnection::send(const ConsumerMessage& message) {
  std::visit(overloaded{
                 [this](const OutputMessage& output) {
                   OutputData data;
                   data.set_data(output.data);
                   if (!isOpen()) {
                     throw std::runtime_error("View " + id + " is closed");
                   }
                   socketHandler->writeProtoPacket(fd, OUTPUT, data);
                 },
                 [this](const ClearMessage&) {
                   sendPacket(Packet(uint8_t(CLEAR_VIEW), ""));
                 },
                 [this](const ResetMessage&) {
                   sendPacket(Packet(uint8_t(RESET_VIEW), ""));
                 },
             },
             message);
}

void ViewConnection::sendPacket(const Packet& packet) {
  if (!isOpen()) {
    throw std::runtime_error("View " + id + " is closed");
  }
  socketHandler->writePacket(fd, packet);
}

void ViewConnection::closeEndpoint() {
  if (!isOpen()) {
    return;
  }
  try {
    socketHandler->writePacket(fd, Packet(uint8_t(SESSION_END), ""));
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Could not send SESSION_END to " << id << ": " << re.what();
  }
  socketHandler->close(fd);
  fd = -1;
}
}  // namespace wt
