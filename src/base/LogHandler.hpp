#ifndef __SSHED_LOG_HANDLER__
#define __SSHED_LOG_HANDLER__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Configures easylogging++ for the sshed executables and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a new file under @p path.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return The full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              bool appendPid = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Keeps the default logger on the console only.
   *
   * Used by the guest, which is short lived and should not leave log files
   * behind on the remote machine.
   */
  static void setupConsoleLogging(el::Configurations *defaultConf,
                                  bool enabled);

  /**
   * @brief Applies a verbosity level for VLOG().
   */
  static void setVerbosity(int level);

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
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace sshed
#endif  // __SSHED_LOG_HANDLER__
