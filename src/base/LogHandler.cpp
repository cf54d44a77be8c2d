#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ms {
namespace {
string timestamp() {
  time_t rawtime;
  time(&rawtime);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", localtime(&rawtime));
  return string(buffer);
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts and the config file, not from easylogging's
  // own flags.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::loadDebugSection(const CSimpleIniA &ini,
                                  LogSettings *settings) {
  settings->verboseLevel =
      int(ini.GetLongValue("Debug", "verbose", settings->verboseLevel));
  settings->silent = ini.GetLongValue("Debug", "silent", 0) != 0;
  long logsize = ini.GetLongValue("Debug", "logsize", 0);
  if (logsize > 0) {
    settings->maxLogSize = to_string(logsize);
  }
  const char *logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir && strlen(logdir)) {
    settings->directory = logdir;
  }
}

string LogHandler::configureFiles(const LogSettings &settings,
                                  el::Configurations *conf) {
  string suffix = timestamp() + ".log";
  string logPath = createLogFile(settings.directory,
                                 settings.filenamePrefix + "-" + suffix);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, logPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                    settings.maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    settings.toStdout ? "true" : "false");
  if (settings.silent) {
    conf->setGlobally(el::ConfigurationType::Enabled, "false");
  }

  if (settings.redirectStderr) {
    string stderrPath = createLogFile(
        settings.directory, settings.filenamePrefix + "-stderr-" + suffix);
    FILE *stderrStream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stderrStream) {
      throw std::runtime_error("Cannot redirect stderr to " + stderrPath);
    }
    setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
  }
  return logPath;
}

string LogHandler::apply(const LogSettings &settings,
                         el::Configurations *conf) {
  string logPath = configureFiles(settings, conf);
  el::Loggers::setVerboseLevel(settings.verboseLevel);
  el::Loggers::reconfigureLogger("default", *conf);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  return logPath;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged
  remove(filename);
}

void LogHandler::nameMainThread() { el::Helpers::setThreadName("msserver"); }

void LogHandler::nameHttpThread(int fd) {
  el::Helpers::setThreadName("http-" + to_string(fd));
}

void LogHandler::nameSessionThread(const string &sessionId) {
  el::Helpers::setThreadName("ws-" + sessionId);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + directory +
                             ": " + ec.message());
  }
  string path = directory + "/" + filename;
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw std::runtime_error("Cannot create log file " + path + ": " +
                             strerror(GetErrno()));
  }
  ::close(fd);
  return path;
}
}  // namespace ms
