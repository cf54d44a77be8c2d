#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace ms;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      ms::LogHandler::setupLogHandler(&argc, &argv);
  ms::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  ms::HandleTerminate();
  // Sessions write to peers that tests have already hung up on
  ::signal(SIGPIPE, SIG_IGN);

  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  string logDirectoryPattern = GetTempDirectory() + string("ms_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  LogSettings logSettings;
  logSettings.directory = logDirectory;
  logSettings.filenamePrefix = "log";
  logSettings.toStdout = true;
  ms::LogHandler::apply(logSettings, &defaultConf);

  int result = Catch::Session().run(argc, argv);

  FATAL_FAIL(fs::remove_all(logDirectory.c_str()));
  return result;
}
