#include "ServerConfig.hpp"

#include "TestHeaders.hpp"

using namespace wt;

namespace {
void loadIni(ServerConfig* config, const string& text) {
  CSimpleIniA ini(true, false, false);
  REQUIRE(ini.LoadData(text.c_str(), text.length()) >= 0);
  config->load(ini);
}

string writeTempFile(const string& contents) {
  string pathPattern = GetTempDirectory() + string("wt_config_XXXXXXXX");
  int fd = mkstemp(&pathPattern[0]);
  FATAL_FAIL(fd);
  FATAL_FAIL(::write(fd, contents.c_str(), contents.length()));
  ::close(fd);
  return pathPattern;
}
}  // namespace

TEST_CASE("Config defaults", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE(config.host.spawnSpec.helper == "wt-pty-helper");
  REQUIRE(config.host.pasteChunkSize == 4096);
  REQUIRE(config.buffer.maxBufferSize == 50000);
  REQUIRE(config.buffer.maxHistoryLines == 1024);
  REQUIRE(config.buffer.coalesceWindowMs == 16);
  REQUIRE(config.buffer.maxHoldMs == 32);
  REQUIRE(config.buffer.immediateFlushBytes == 8192);
  REQUIRE(config.process.terminateGraceMs == 1000);
  REQUIRE(config.maxLogSize == "20971520");
  REQUIRE(config.socketPath == ServerConfig::getDefaultSocketPath());
  REQUIRE(config.socketPath.find("workterm/wtserver.sock") != string::npos);
}

TEST_CASE("Loading every section", "[ServerConfig]") {
  ServerConfig config;
  loadIni(&config,
      "[Shell]\n"
      "helper = /usr/lib/workterm/pty-helper\n"
      "helper_args = --login  --shell /bin/zsh\n"
      "startup_commands = [\"source ~/.venv/bin/activate\", \"clear\"]\n"
      "paste_chunk_size = 1024\n"
      "[Buffer]\n"
      "max_buffer_size = 100000\n"
      "max_history_lines = 2048\n"
      "trim_ratio = 0.5\n"
      "[Relay]\n"
      "coalesce_window_ms = 8\n"
      "max_hold_ms = 20\n"
      "immediate_flush_bytes = 4096\n"
      "[Process]\n"
      "input_high_water_mark = 65536\n"
      "terminate_grace_ms = 300\n"
      "kill_grace_ms = 200\n"
      "shutdown_grace_ms = 1500\n"
      "shutdown_kill_grace_ms = 700\n"
      "[Networking]\n"
      "socket = /run/user/1000/wt.sock\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1048576\n");

  REQUIRE(config.host.spawnSpec.helper == "/usr/lib/workterm/pty-helper");
  REQUIRE(config.host.spawnSpec.helperArgs ==
          vector<string>({"--login", "--shell", "/bin/zsh"}));
  REQUIRE(config.host.spawnSpec.startupCommands ==
          vector<string>({"source ~/.venv/bin/activate", "clear"}));
  REQUIRE(config.host.pasteChunkSize == 1024);
  REQUIRE(config.buffer.maxBufferSize == 100000);
  REQUIRE(config.buffer.maxHistoryLines == 2048);
  REQUIRE(config.buffer.trimRatio == Approx(0.5));
  REQUIRE(config.buffer.coalesceWindowMs == 8);
  REQUIRE(config.buffer.maxHoldMs == 20);
  REQUIRE(config.buffer.immediateFlushBytes == 4096);
  REQUIRE(config.process.inputHighWaterMark == 65536);
  REQUIRE(config.process.terminateGraceMs == 300);
  REQUIRE(config.process.killGraceMs == 200);
  REQUIRE(config.process.shutdownGraceMs == 1500);
  REQUIRE(config.process.shutdownKillGraceMs == 700);
  REQUIRE(config.socketPath == "/run/user/1000/wt.sock");
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1048576");
}

TEST_CASE("Invalid values name their key", "[ServerConfig]") {
  ServerConfig config;

  auto requireError = [&config](const string& ini, const string& message) {
    try {
      loadIni(&config, ini);
      FAIL("Expected an error for " << ini);
    } catch (const std::runtime_error& re) {
      INFO(re.what());
      REQUIRE(string(re.what()).find(message) != string::npos);
    }
  };

  requireError("[Buffer]\nmax_buffer_size = lots\n",
               "[Buffer] max_buffer_size");
  requireError("[Buffer]\nmax_buffer_size = 0\n", "[Buffer] max_buffer_size");
  requireError("[Buffer]\ntrim_ratio = 1.5\n", "[Buffer] trim_ratio");
  requireError("[Relay]\nmax_hold_ms = 10ms\n", "[Relay] max_hold_ms");
  requireError("[Process]\nkill_grace_ms = -1\n", "[Process] kill_grace_ms");
  requireError("[Shell]\nstartup_commands = ls\n",
               "[Shell] startup_commands");
  requireError("[Shell]\nstartup_commands = {\"a\": 1}\n",
               "[Shell] startup_commands");
  requireError("[Shell]\nstartup_commands = [\"ok\", 3]\n",
               "[Shell] startup_commands");
  requireError("[Shell]\npaste_chunk_size = 0\n", "[Shell] paste_chunk_size");
}

TEST_CASE("Config files", "[ServerConfig]") {
  SECTION("A missing optional file keeps the defaults") {
    ServerConfig config;
    config.loadFile(GetTempDirectory() + "wt_no_such_config.ini", false);
    REQUIRE(config.host.spawnSpec.helper == "wt-pty-helper");
  }

  SECTION("A missing required file is an error") {
    ServerConfig config;
    REQUIRE_THROWS_AS(
        config.loadFile(GetTempDirectory() + "wt_no_such_config.ini", true),
        std::runtime_error);
  }

  SECTION("A file on disk is applied") {
    string path = writeTempFile("[Relay]\ncoalesce_window_ms = 5\n");
    ServerConfig config;
    config.loadFile(path, true);
    REQUIRE(config.buffer.coalesceWindowMs == 5);
    ::unlink(path.c_str());
  }
}
