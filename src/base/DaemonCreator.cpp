#include "DaemonCreator.hpp"

namespace ms {
int DaemonCreator::create(bool terminateParent, const string &childPidFile) {
  pid_t pid = fork();
  if (pid < 0) {
    throw std::runtime_error(string("fork failed: ") + strerror(GetErrno()));
  }
  if (pid > 0) {
    if (terminateParent) {
      exit(EXIT_SUCCESS);
    }
    return PARENT;
  }

  if (setsid() < 0) {
    throw std::runtime_error(string("setsid failed: ") + strerror(GetErrno()));
  }
  signal(SIGHUP, SIG_IGN);

  // Second fork so the daemon can never reacquire a terminal
  pid = fork();
  if (pid < 0) {
    throw std::runtime_error(string("fork failed: ") + strerror(GetErrno()));
  }
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  if (!childPidFile.empty()) {
    int pidFilehandle =
        open(childPidFile.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0600);
    if (pidFilehandle == -1) {
      throw std::runtime_error("Error opening pidfile for writing: " +
                               childPidFile);
    }
    string pidString = to_string(getpid()) + "\n";
    FATAL_FAIL(write(pidFilehandle, pidString.c_str(), pidString.length()));
    FATAL_FAIL(close(pidFilehandle));
  }

  FATAL_FAIL(chdir("/"));

  int devNullOut = open("/dev/null", O_WRONLY);
  FATAL_FAIL(devNullOut);
  FATAL_FAIL(dup2(devNullOut, STDOUT_FILENO));
  FATAL_FAIL(dup2(devNullOut, STDERR_FILENO));
  int devNullIn = open("/dev/null", O_RDONLY);
  FATAL_FAIL(devNullIn);
  FATAL_FAIL(dup2(devNullIn, STDIN_FILENO));

  return CHILD;
}
}  // namespace ms
