#ifndef __MS_LOG_HANDLER__
#define __MS_LOG_HANDLER__

#include "Headers.hpp"
#include "SimpleIni.h"

namespace ms {
/**
 * @brief Where and how much msserver logs.  Filled from the [Debug] section
 * of the config file and the command line.
 */
struct LogSettings {
  LogSettings()
      : directory(GetTempDirectory() + "msserver"),
        filenamePrefix("msserver"),
        maxLogSize("20971520"),
        verboseLevel(0),
        silent(false),
        toStdout(false),
        redirectStderr(true) {}

  string directory;
  string filenamePrefix;
  // Bytes, as the decimal string easylogging++ expects
  string maxLogSize;
  int verboseLevel;
  bool silent;
  bool toStdout;
  bool redirectStderr;
};

/**
 * @brief Configures easylogging++ for msserver: one rotating log file per
 * run, a bare "stdout" logger for console messages, and thread names that
 * tie each line to the listener or connection that wrote it.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /** @brief Reads verbose, silent, logsize and logdir from [Debug]. */
  static void loadDebugSection(const CSimpleIniA &ini, LogSettings *settings);

  /**
   * @brief Creates this run's log file and points conf at it.  Also moves
   * stderr into the log directory when the settings ask for it.
   * @return The log file path.
   * @throws std::runtime_error if the log file cannot be created.
   */
  static string configureFiles(const LogSettings &settings,
                               el::Configurations *conf);

  /**
   * @brief configureFiles, then makes conf the default logger configuration
   * and turns on rotation.
   */
  static string apply(const LogSettings &settings, el::Configurations *conf);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  static void nameMainThread();
  static void nameHttpThread(int fd);
  static void nameSessionThread(const string &sessionId);

 private:
  static string createLogFile(const string &directory,
                              const string &filename);
};
}  // namespace ms
#endif  // __MS_LOG_HANDLER__
