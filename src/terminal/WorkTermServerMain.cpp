#include <cxxopts.hpp>

#include "EventLoop.hpp"
#include "LogHandler.hpp"
#include "PipeChildProcess.hpp"
#include "PipeSocketHandler.hpp"
#include "ServerConfig.hpp"
#include "WorkTermServer.hpp"

using namespace wt;

namespace {
void shutdownSignalHandler(int) { WorkTermServer::requestShutdown(); }
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  wt::HandleTerminate();

  cxxopts::Options options("wtserver",
                           "Terminal supervisor for workspace frontends");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("socket", "Path of the UNIX socket to listen on",
         cxxopts::value<std::string>()->default_value(""))  //
        ("helper", "PTY helper executable to spawn for each workspace",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "wtserver version " << WT_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    try {
      string cfgfilename = result["cfgfile"].as<string>();
      if (cfgfilename.empty()) {
        config.loadFile(ServerConfig::getDefaultConfigPath(), false);
      } else {
        config.loadFile(cfgfilename, true);
      }
    } catch (const std::runtime_error &re) {
      CLOG(ERROR, "stdout") << re.what() << endl;
      exit(1);
    }

    // The command line wins over the config file
    if (result.count("socket") && !result["socket"].as<string>().empty()) {
      config.socketPath = result["socket"].as<string>();
    }
    if (result.count("helper") && !result["helper"].as<string>().empty()) {
      config.host.spawnSpec.helper = result["helper"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory(), "wtserver",
                              result.count("logtostdout") > 0,
                              !result.count("logtostdout"), false,
                              config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("wtserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    ::signal(SIGINT, shutdownSignalHandler);
    ::signal(SIGTERM, shutdownSignalHandler);

    shared_ptr<EventLoop> loop(
        new EventLoop(shared_ptr<Clock>(new SteadyClock())));
    shared_ptr<ChildProcessSpawner> spawner(new PipeChildProcessSpawner(loop));
    shared_ptr<TerminalHost> host(new TerminalHost(
        loop, spawner, config.host, config.buffer, config.process));
    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());

    SocketEndpoint endpoint;
    endpoint.set_name(config.socketPath);
    {
      WorkTermServer server(loop, socketHandler, endpoint, host);
      server.start();
      LOG(INFO) << "wtserver " << WT_VERSION << " started, helper "
                << config.host.spawnSpec.helper;
      // Leave room for the SIGKILL pass before giving up on the children
      server.run(config.process.shutdownGraceMs +
                 config.process.shutdownKillGraceMs + 1000);
    }
    host.reset();
    LOG(INFO) << "wtserver exited cleanly";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    STFATAL << "wtserver failed: " << re.what();
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
