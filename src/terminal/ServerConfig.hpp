#ifndef __WT_SERVER_CONFIG__
#define __WT_SERVER_CONFIG__

#include "Headers.hpp"
#include "ProcessSupervisor.hpp"
#include "SessionBuffer.hpp"
#include "SimpleIni.h"
#include "TerminalHost.hpp"

namespace wt {
/**
 * @brief Settings of the wtserver daemon, read from an INI file and then
 * overridden by the command line.
 */
class ServerConfig {
 public:
  ServerConfig();

  TerminalHostConfig host;
  SessionBufferConfig buffer;
  ProcessSupervisorConfig process;
  string socketPath;
  int verbose;
  bool silent;
  string maxLogSize;

  /** @brief `<config home>/workterm/wtserver.ini` */
  static string getDefaultConfigPath();
  /** @brief `<data home>/workterm/wtserver.sock` */
  static string getDefaultSocketPath();

  /**
   * @brief Loads `filename`.
   * @param required When false a missing file leaves the defaults in place.
   * @throws std::runtime_error if the file cannot be loaded (and is required)
   * or holds an invalid value.
   */
  void loadFile(const string& filename, bool required);

  /**
   * @brief Applies every key present in `ini`.
   * @throws std::runtime_error naming the first invalid key.
   */
  void load(const CSimpleIniA& ini);

 protected:
  static int64_t parseInteger(const string& section, const string& key,
                              const string& value, int64_t minimum);
  static double parseRatio(const string& section, const string& key,
                           const string& value);
  static vector<string> parseStartupCommands(const string& value);
};
}  // namespace wt

#endif  // __WT_SERVER_CONFIG__
