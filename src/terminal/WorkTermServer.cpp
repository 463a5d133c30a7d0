#include "WorkTermServer.hpp"

namespace wt {
volatile sig_atomic_t WorkTermServer::shutdownRequested = 0;

WorkTermServer::WorkTermServer(shared_ptr<EventLoop> _loop,
                               shared_ptr<SocketHandler> _socketHandler,
                               const SocketEndpoint& _endpoint,
                               shared_ptr<TerminalHost> _host)
    : loop(_loop),
      socketHandler(_socketHandler),
      endpoint(_endpoint),
      host(_host),
      listening(false) {}

WorkTermServer::~WorkTermServer() {
  for (auto& it : connections) {
    loop->unwatch(it.first);
    it.second->closeEndpoint();
  }
  connections.clear();
  if (listening) {
    for (int fd : socketHandler->getEndpointFds(endpoint)) {
      loop->unwatch(fd);
    }
    socketHandler->stopListening(endpoint);
  }
}

void WorkTermServer::start() {
  fs::path socketPath(endpoint.name());
  if (socketPath.has_parent_path()) {
    fs::create_directories(socketPath.parent_path());
  }
  set<int> fds = socketHandler->listen(endpoint);
  listening = true;
  for (int fd : fds) {
    loop->watchRead(fd, [this, fd]() { pollAccept(fd); });
  }
  LOG(INFO) << "Listening on " << endpoint;
}

void WorkTermServer::run(int64_t shutdownTimeoutMs) {
  while (!isShutdownRequested()) {
    loop->runOnce(250);
  }
  LOG(INFO) << "Shutdown requested";
  bool finished = false;
  shutdown([&finished]() { finished = true; });
  if (!loop->runUntil([&finished]() { return finished; },
                      shutdownTimeoutMs)) {
    LOG(WARNING) << "Children still running after " << shutdownTimeoutMs
                 << " ms, exiting anyway";
  }
}

void WorkTermServer::shutdown(std::function<void()> done) {
  if (listening) {
    for (int fd : socketHandler->getEndpointFds(endpoint)) {
      loop->unwatch(fd);
    }
    socketHandler->stopListening(endpoint);
    listening = false;
  }
  map<int, shared_ptr<ViewConnection>> toClose;
  toClose.swap(connections);
  for (auto& it : toClose) {
    loop->unwatch(it.first);
    it.second->closeEndpoint();
  }
  host->shutdown(done);
}

void WorkTermServer::requestShutdown() { shutdownRequested = 1; }

bool WorkTermServer::isShutdownRequested() { return shutdownRequested != 0; }

void WorkTermServer::resetShutdownRequest() { shutdownRequested = 0; }

void WorkTermServer::pollAccept(int listenFd) {
  while (true) {
    int fd = socketHandler->accept(listenFd);
    if (fd < 0) {
      return;
    }
    shared_ptr<ViewConnection> connection(
        new ViewConnection(socketHandler, fd));
    connections[fd] = connection;
    loop->watchRead(fd, [this, fd]() { handleRead(fd); });
    LOG(INFO) << "Accepted view " << connection->getId() << " on fd " << fd;
  }
}

void WorkTermServer::handleRead(int fd) {
  auto it = connections.find(fd);
  if (it == connections.end()) {
    loop->unwatch(fd);
    return;
  }
  auto connection = it->second;
  try {
    Packet packet;
    if (!socketHandler->readPacket(fd, &packet)) {
      return;
    }
    handlePacket(connection, packet);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Dropping view " << connection->getId() << ": " << re.what();
    dropConnection(connection);
  } catch (const std::exception& ex) {
    STERROR << "Unexpected error from view " << connection->getId() << ": "
            << ex.what();
    dropConnection(connection);
  }
}

void WorkTermServer::handlePacket(shared_ptr<ViewConnection> connection,
                                  const Packet& packet) {
  uint8_t header = packet.getHeader();
  VLOG(2) << "Got packet " << int(header) << " from " << connection->getId();
  if (header == ATTACH) {
    attach(connection, stringToProto<AttachRequest>(packet.getPayload()));
    return;
  }
  if (header == STATUS) {
    sendStatus(connection);
    return;
  }
  if (!connection->isAttached()) {
    throw std::runtime_error("Got packet " + to_string(int(header)) +
                             " before ATTACH");
  }
  const string& key = connection->getKey();
  switch (header) {
    case INPUT: {
      auto input = stringToProto<InputData>(packet.getPayload());
      host->handleFrontendMessage(key, connection, TerminalInput{input.data()});
      break;
    }
    case RESIZE: {
      auto request = stringToProto<ResizeRequest>(packet.getPayload());
      if (request.cols() <= 0 || request.rows() <= 0) {
        LOG(WARNING) << "Ignoring invalid size " << request.cols() << "x"
                     << request.rows() << " from " << connection->getId();
        break;
      }
      host->handleFrontendMessage(
          key, connection, TerminalResize{request.cols(), request.rows()});
      break;
    }
    case READY: {
      auto request = stringToProto<ResizeRequest>(packet.getPayload());
      int cols = request.cols() > 0 ? request.cols() : 80;
      int rows = request.rows() > 0 ? request.rows() : 24;
      host->handleFrontendMessage(key, connection,
                                  TerminalReady{cols, rows, request.cwd()});
      break;
    }
    case CLEAR:
      host->handleFrontendMessage(key, connection, ClearRequest());
      break;
    case RESET:
      host->handleFrontendMessage(key, connection, ResetRequest());
      break;
    case FRONTEND_ERROR: {
      auto report = stringToProto<FrontendErrorReport>(packet.getPayload());
      host->handleFrontendMessage(key, connection,
                                  FrontendError{report.message()});
      break;
    }
    case DETACH:
      LOG(INFO) << "View " << connection->getId() << " detached from " << key;
      dropConnection(connection);
      break;
    default:
      throw std::runtime_error("Got unknown packet header: " +
                               to_string(int(header)));
  }
}

void WorkTermServer::attach(shared_ptr<ViewConnection> connection,
                            const AttachRequest& request) {
  if (request.key().empty()) {
    throw std::runtime_error("ATTACH without a workspace key");
  }
  if (connection->isAttached()) {
    if (connection->getKey() == request.key() &&
        host->getSessionBuffer()->getConsumer(request.key()) == connection &&
        host->getSessionBuffer()->isConnected(request.key())) {
      VLOG(1) << "View " << connection->getId() << " is already attached to "
              << request.key();
      return;
    }
    if (connection->getKey() != request.key()) {
      host->closeView(connection->getKey(), connection);
    }
  }
  connection->setKey(request.key());
  int cols = request.cols() > 0 ? request.cols() : 80;
  int rows = request.rows() > 0 ? request.rows() : 24;
  LOG(INFO) << "View " << connection->getId() << " attached to "
            << request.key();
  host->openSession(request.key(), connection, request.cwd(), cols, rows);
}

void WorkTermServer::sendStatus(shared_ptr<ViewConnection> connection) {
  StatusReply reply;
  reply.set_connection_id(connection->getId());
  reply.set_key(connection->getKey());
  reply.set_json(host->toJsonString());
  socketHandler->writeProtoPacket(connection->getFd(), STATUS_REPLY, reply);
}

void WorkTermServer::dropConnection(shared_ptr<ViewConnection> connection) {
  int fd = connection->getFd();
  loop->unwatch(fd);
  connections.erase(fd);
  if (connection->isAttached()) {
    host->closeView(connection->getKey(), connection);
  }
  connection->closeEndpoint();
}
}  // namespace wt
