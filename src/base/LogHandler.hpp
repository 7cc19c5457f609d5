#ifndef __TETHER_LOG_HANDLER__
#define __TETHER_LOG_HANDLER__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Options shared by every Tether binary that writes log files.
 */
struct LogOptions {
  string directory;
  string filenamePrefix;
  int verbosity = 0;
  bool logToStdout = false;
  bool redirectStderrToFile = false;
  bool appendPid = false;
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Configures easylogging++ for the relay server, client and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies `options` on top of `defaultConf`, reconfigures the
   * default logger and installs log rotation. Log files are created
   * owner-only and never reused.
   * @throws std::runtime_error if the log directory or file cannot be
   * created.
   */
  static void applyLogOptions(el::Configurations *defaultConf,
                              const LogOptions &options);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  static string logFilename(const LogOptions &options, const string &kind);

  static string createLogFile(const string &directory, const string &filename);

  static void redirectStderr(const string &path);
};
}  // namespace tether
#endif  // __TETHER_LOG_HANDLER__
