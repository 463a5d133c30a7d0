#include "ServerConfig.hpp"

#include "JsonLib.hpp"

namespace wt {
#define DEFAULT_PTY_HELPER "wt-pty-helper"

ServerConfig::ServerConfig()
    : socketPath(getDefaultSocketPath()),
      verbose(0),
      silent(false),
      maxLogSize("20971520") {
  host.spawnSpec.helper = DEFAULT_PTY_HELPER;
}

string ServerConfig::getDefaultConfigPath() {
  return sago::getConfigHome() + "/workterm/wtserver.ini";
}

string ServerConfig::getDefaultSocketPath() {
  return sago::getDataHome() + "/workterm/wtserver.sock";
}

void ServerConfig::loadFile(const string& filename, bool required) {
  if (!required && !fs::exists(filename)) {
    VLOG(1) << "No config file at " << filename << ", using defaults";
    return;
  }
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  load(ini);
  LOG(INFO) << "Loaded config file " << filename;
}

void ServerConfig::load(const CSimpleIniA& ini) {
  const char* value;

  if ((value = ini.GetValue("Shell", "helper", NULL))) {
    if (string(value).empty()) {
      throw std::runtime_error("Invalid value for [Shell] helper: empty");
    }
    host.spawnSpec.helper = value;
  }
  if ((value = ini.GetValue("Shell", "helper_args", NULL))) {
    host.spawnSpec.helperArgs.clear();
    for (auto& arg : split(value, ' ')) {
      if (!arg.empty()) {
        host.spawnSpec.helperArgs.push_back(arg);
      }
    }
  }
  if ((value = ini.GetValue("Shell", "startup_commands", NULL))) {
    host.spawnSpec.startupCommands = parseStartupCommands(value);
  }
  if ((value = ini.GetValue("Shell", "paste_chunk_size", NULL))) {
    host.pasteChunkSize = parseInteger("Shell", "paste_chunk_size", value, 1);
  }

  if ((value = ini.GetValue("Buffer", "max_buffer_size", NULL))) {
    buffer.maxBufferSize = parseInteger("Buffer", "max_buffer_size", value, 1);
  }
  if ((value = ini.GetValue("Buffer", "max_history_lines", NULL))) {
    buffer.maxHistoryLines =
        parseInteger("Buffer", "max_history_lines", value, 1);
  }
  if ((value = ini.GetValue("Buffer", "trim_ratio", NULL))) {
    buffer.trimRatio = parseRatio("Buffer", "trim_ratio", value);
  }

  if ((value = ini.GetValue("Relay", "coalesce_window_ms", NULL))) {
    buffer.coalesceWindowMs =
        parseInteger("Relay", "coalesce_window_ms", value, 0);
  }
  if ((value = ini.GetValue("Relay", "max_hold_ms", NULL))) {
    buffer.maxHoldMs = parseInteger("Relay", "max_hold_ms", value, 0);
  }
  if ((value = ini.GetValue("Relay", "immediate_flush_bytes", NULL))) {
    buffer.immediateFlushBytes =
        parseInteger("Relay", "immediate_flush_bytes", value, 1);
  }

  if ((value = ini.GetValue("Process", "input_high_water_mark", NULL))) {
    process.inputHighWaterMark =
        parseInteger("Process", "input_high_water_mark", value, 1);
  }
  if ((value = ini.GetValue("Process", "terminate_grace_ms", NULL))) {
    process.terminateGraceMs =
        parseInteger("Process", "terminate_grace_ms", value, 0);
  }
  if ((value = ini.GetValue("Process", "kill_grace_ms", NULL))) {
    process.killGraceMs = parseInteger("Process", "kill_grace_ms", value, 0);
  }
  if ((value = ini.GetValue("Process", "shutdown_grace_ms", NULL))) {
    process.shutdownGraceMs =
        parseInteger("Process", "shutdown_grace_ms", value, 0);
  }
  if ((value = ini.GetValue("Process", "shutdown_kill_grace_ms", NULL))) {
    process.shutdownKillGraceMs =
        parseInteger("Process", "shutdown_kill_grace_ms", value, 0);
  }

  if ((value = ini.GetValue("Networking", "socket", NULL))) {
    if (string(value).empty()) {
      throw std::runtime_error("Invalid value for [Networking] socket: empty");
    }
    socketPath = value;
  }

  if ((value = ini.GetValue("Debug", "verbose", NULL))) {
    verbose = int(parseInteger("Debug", "verbose", value, 0));
  }
  if ((value = ini.GetValue("Debug", "silent", NULL))) {
    silent = parseInteger("Debug", "silent", value, 0) != 0;
  }
  if ((value = ini.GetValue("Debug", "logsize", NULL))) {
    // Kept as a string, easylogging takes it that way
    int64_t logsize = parseInteger("Debug", "logsize", value, 0);
    if (logsize != 0) {
      maxLogSize = to_string(logsize);
    }
  }
}

int64_t ServerConfig::parseInteger(const string& section, const string& key,
                                   const string& value, int64_t minimum) {
  size_t pos = 0;
  int64_t result;
  try {
    result = std::stoll(value, &pos);
  } catch (const std::logic_error&) {
    pos = 0;
  }
  if (pos == 0 || pos != value.length()) {
    throw std::runtime_error("Invalid value for [" + section + "] " + key +
                             ": " + value);
  }
  if (result < minimum) {
    throw std::runtime_error("Invalid value for [" + section + "] " + key +
                             ": must be at least " + to_string(minimum));
  }
  return result;
}

double ServerConfig::parseRatio(const string& section, const string& key,
                                const string& value) {
  size_t pos = 0;
  double result = 0;
  try {
    result = std::stod(value, &pos);
  } catch (const std::logic_error&) {
    pos = 0;
  }
  if (pos == 0 || pos != value.length() || !(result > 0.0 && result <= 1.0)) {
    throw std::runtime_error("Invalid value for [" + section + "] " + key +
                             ": " + value + " (expected a number in (0,1])");
  }
  return result;
}

vector<string> ServerConfig::parseStartupCommands(const string& value) {
  json parsed;
  try {
    parsed = json::parse(value);
  } catch (const json::parse_error& pe) {
    throw std::runtime_error(
        string("Invalid value for [Shell] startup_commands: ") + pe.what());
  }
  if (!parsed.is_array()) {
    throw std::runtime_error(
        "Invalid value for [Shell] startup_commands: expected a JSON array");
  }
  vector<string> commands;
  for (auto& command : parsed) {
    if (!command.is_string()) {
      throw std::runtime_error(
          "Invalid value for [Shell] startup_commands: entries must be "
          "strings");
    }
    commands.push_back(command.get<string>());
  }
  return commands;
}
}  // namespace wt
