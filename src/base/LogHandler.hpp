#ifndef __FDMUX_LOG_HANDLER__
#define __FDMUX_LOG_HANDLER__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Configures easylogging++ for fdmux processes and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging with `argc/argv` and returns the base
   * configuration (format, flushing, verbose format).
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file inside `path`.
   * @param filenamePrefix Prefix of the file; a timestamp and pid are added.
   * @param logToStdout Mirror every line to stdout as well.
   * @param maxLogSize Size in bytes after which the file is rolled.
   * @return Full path of the created log file.
   */
  static string setupLogFile(el::Configurations *defaultConf,
                             const string &path, const string &filenamePrefix,
                             bool logToStdout = false,
                             const string &maxLogSize = "20971520");

  /** @brief Deletes a rolled log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Configures the "stdout" logger to print bare messages. */
  static void setupStdoutLogger();

 private:
  /** @brief Creates `path` if needed and exclusively creates the log file. */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace fdmux
#endif  // __FDMUX_LOG_HANDLER__
