#include "WorkTermServer.hpp"

#include "FakeChildProcess.hpp"
#include "JsonLib.hpp"
#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
const int64_t WAIT_MS = 5000;

struct ServerFixture {
  ServerFixture()
      : loop(new EventLoop(shared_ptr<Clock>(new SteadyClock()))),
        spawner(new FakeChildProcessSpawner(loop)),
        serverSocketHandler(new PipeSocketHandler()),
        clientSocketHandler(new PipeSocketHandler()) {
    TerminalHostConfig config;
    config.spawnSpec.helper = "pty-helper";
    host.reset(new TerminalHost(loop, spawner, config));

    string pathPattern = GetTempDirectory() + string("wt_server_XXXXXXXX");
    socketDirectory = string(mkdtemp(&pathPattern[0]));
    endpoint.set_name(socketDirectory + "/wtserver.sock");
    server.reset(
        new WorkTermServer(loop, serverSocketHandler, endpoint, host));
    server->start();
  }

  ~ServerFixture() {
    server.reset();
    host.reset();
    fs::remove_all(socketDirectory);
  }

  int connect() {
    size_t before = server->numConnections();
    int fd = clientSocketHandler->connect(endpoint);
    REQUIRE(fd >= 0);
    REQUIRE(loop->runUntil(
        [&]() { return server->numConnections() == before + 1; }, WAIT_MS));
    return fd;
  }

  template <typename T>
  void send(int fd, WorkTermPacketType header, const T& proto) {
    clientSocketHandler->writeProtoPacket(fd, header, proto);
  }

  void sendEmpty(int fd, WorkTermPacketType header) {
    clientSocketHandler->writePacket(fd, Packet(uint8_t(header), ""));
  }

  void attach(int fd, const string& key) {
    AttachRequest request;
    request.set_key(key);
    request.set_cwd("/tmp");
    request.set_cols(100);
    request.set_rows(30);
    send(fd, ATTACH, request);
    REQUIRE(loop->runUntil(
        [&]() { return host->getSessionBuffer()->isConnected(key); },
        WAIT_MS));
  }

  Packet receive(int fd) {
    REQUIRE(loop->runUntil(
        [&]() { return clientSocketHandler->hasData(fd); }, WAIT_MS));
    Packet packet;
    REQUIRE(clientSocketHandler->readPacket(fd, &packet));
    return packet;
  }

  shared_ptr<EventLoop> loop;
  shared_ptr<FakeChildProcessSpawner> spawner;
  shared_ptr<PipeSocketHandler> serverSocketHandler;
  shared_ptr<PipeSocketHandler> clientSocketHandler;
  shared_ptr<TerminalHost> host;
  shared_ptr<WorkTermServer> server;
  SocketEndpoint endpoint;
  string socketDirectory;
};
}  // namespace

TEST_CASE("Attaching a view", "[WorkTermServer]") {
  ServerFixture f;
  int fd = f.connect();
  f.attach(fd, "ws");

  REQUIRE(f.spawner->calls.size() == 1);
  REQUIRE(f.spawner->calls[0].args == vector<string>({"100", "30", "/tmp"}));
  auto child = f.spawner->last();

  child->produceOutput("$ ");
  Packet packet = f.receive(fd);
  REQUIRE(packet.getHeader() == OUTPUT);
  REQUIRE(stringToProto<OutputData>(packet.getPayload()).data() == "$ ");

  SECTION("Input and resize reach the child") {
    InputData input;
    input.set_data("ls\r");
    f.send(fd, INPUT, input);
    ResizeRequest resize;
    resize.set_cols(120);
    resize.set_rows(40);
    f.send(fd, RESIZE, resize);
    REQUIRE(f.loop->runUntil([&]() { return child->writes.size() == 2; },
                             WAIT_MS));
    REQUIRE(child->writes == vector<string>({"ls\r", "\x1b[8;40;120t"}));
  }

  SECTION("Clear is relayed to the view") {
    f.sendEmpty(fd, CLEAR);
    Packet clear = f.receive(fd);
    REQUIRE(clear.getHeader() == CLEAR_VIEW);
    REQUIRE(f.host->getSessionBuffer()->getBuffer("ws") == "");
  }

  SECTION("Reset is relayed after the child is gone") {
    f.sendEmpty(fd, RESET);
    Packet reset = f.receive(fd);
    REQUIRE(reset.getHeader() == RESET_VIEW);
    REQUIRE(child->hasExited());
    REQUIRE_FALSE(f.host->getSupervisor()->hasProcess("ws"));

    ResizeRequest ready;
    ready.set_cols(100);
    ready.set_rows(30);
    f.send(fd, READY, ready);
    REQUIRE(f.loop->runUntil([&]() { return f.spawner->calls.size() == 2; },
                             WAIT_MS));
  }

  SECTION("Status reports the host state") {
    f.sendEmpty(fd, STATUS);
    Packet reply = f.receive(fd);
    REQUIRE(reply.getHeader() == STATUS_REPLY);
    auto status = stringToProto<StatusReply>(reply.getPayload());
    REQUIRE(status.key() == "ws");
    REQUIRE_FALSE(status.connection_id().empty());
    json state = json::parse(status.json());
    REQUIRE(state["processes"][0]["key"] == "ws");
    REQUIRE(state["processes"][0]["pid"] == child->getPid());
  }

  SECTION("Detach keeps the process and a new view gets the history") {
    f.sendEmpty(fd, DETACH);
    Packet end = f.receive(fd);
    REQUIRE(end.getHeader() == SESSION_END);
    REQUIRE(f.loop->runUntil([&]() { return f.server->numConnections() == 0; },
                             WAIT_MS));
    REQUIRE(f.host->getSupervisor()->hasProcess("ws"));
    REQUIRE_FALSE(f.host->getSupervisor()->isProcessActive("ws"));
    f.clientSocketHandler->close(fd);

    int next = f.connect();
    f.attach(next, "ws");
    Packet history = f.receive(next);
    REQUIRE(history.getHeader() == OUTPUT);
    REQUIRE(stringToProto<OutputData>(history.getPayload()).data() == "$ ");
    REQUIRE(f.spawner->calls.size() == 1);
    f.clientSocketHandler->close(next);
  }

  SECTION("Attaching again to the same key does not replay the history") {
    AttachRequest again;
    again.set_key("ws");
    again.set_cols(100);
    again.set_rows(30);
    f.send(fd, ATTACH, again);
    f.sendEmpty(fd, STATUS);
    Packet reply = f.receive(fd);
    REQUIRE(reply.getHeader() == STATUS_REPLY);
    REQUIRE(f.spawner->calls.size() == 1);
    REQUIRE(f.host->getSessionBuffer()->isConnected("ws"));
  }

  SECTION("A closed socket detaches the view") {
    f.clientSocketHandler->close(fd);
    REQUIRE(f.loop->runUntil([&]() { return f.server->numConnections() == 0; },
                             WAIT_MS));
    REQUIRE_FALSE(f.host->getSessionBuffer()->isConnected("ws"));
    REQUIRE(f.host->getSupervisor()->hasProcess("ws"));
  }
}

TEST_CASE("Status with a working directory that is not UTF-8",
          "[WorkTermServer]") {
  ServerFixture f;
  int fd = f.connect();
  AttachRequest request;
  request.set_key("ws");
  request.set_cwd("/home/u/caf\xe9");
  request.set_cols(80);
  request.set_rows(24);
  f.send(fd, ATTACH, request);
  REQUIRE(f.loop->runUntil(
      [&]() { return f.host->getSessionBuffer()->isConnected("ws"); },
      WAIT_MS));

  f.sendEmpty(fd, STATUS);
  Packet reply = f.receive(fd);
  REQUIRE(reply.getHeader() == STATUS_REPLY);
  auto status = stringToProto<StatusReply>(reply.getPayload());
  json state = json::parse(status.json());
  REQUIRE(state["processes"][0]["cwd"] == "/home/u/caf\xef\xbf\xbd");
  REQUIRE(f.server->numConnections() == 1);
  f.clientSocketHandler->close(fd);
}

TEST_CASE("Closing a view connection", "[WorkTermServer]") {
  ServerFixture f;
  int fd = f.connect();
  shared_ptr<ViewConnection> view(
      new ViewConnection(f.clientSocketHandler, fd));
  REQUIRE(view->isOpen());

  view->closeEndpoint();
  REQUIRE_FALSE(view->isOpen());
  REQUIRE(view->getFd() == -1);
  REQUIRE_THROWS_AS(view->send(OutputMessage{"late"}), std::runtime_error);
  REQUIRE(f.loop->runUntil([&]() { return f.server->numConnections() == 0; },
                           WAIT_MS));
}

TEST_CASE("Packets before ATTACH end the connection", "[WorkTermServer]") {
  ServerFixture f;
  int fd = f.connect();

  InputData input;
  input.set_data("ls\r");
  f.send(fd, INPUT, input);
  Packet end = f.receive(fd);
  REQUIRE(end.getHeader() == SESSION_END);
  REQUIRE(f.loop->runUntil([&]() { return f.server->numConnections() == 0; },
                           WAIT_MS));
  REQUIRE(f.spawner->calls.empty());
  f.clientSocketHandler->close(fd);
}

TEST_CASE("Shutting the server down", "[WorkTermServer]") {
  ServerFixture f;
  int fd = f.connect();
  f.attach(fd, "ws");
  auto child = f.spawner->last();

  bool done = false;
  f.server->shutdown([&]() { done = true; });
  Packet end = f.receive(fd);
  REQUIRE(end.getHeader() == SESSION_END);
  REQUIRE(f.loop->runUntil([&]() { return done; }, WAIT_MS));
  REQUIRE(child->signals == vector<int>({SIGTERM}));
  REQUIRE(f.server->numConnections() == 0);
  REQUIRE_FALSE(fs::exists(f.endpoint.name()));
  f.clientSocketHandler->close(fd);
}

TEST_CASE("Shutdown requests are latched", "[WorkTermServer]") {
  WorkTermServer::resetShutdownRequest();
  REQUIRE_FALSE(WorkTermServer::isShutdownRequested());
  WorkTermServer::requestShutdown();
  REQUIRE(WorkTermServer::isShutdownRequested());
  WorkTermServer::resetShutdownRequest();
}
