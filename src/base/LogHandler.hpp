#ifndef __PT_LOG_HANDLER__
#define __PT_LOG_HANDLER__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Configures easylogging++ so permterm can control its log files.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

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

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace pt
#endif  // __PT_LOG_HANDLER__
