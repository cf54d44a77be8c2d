#ifndef __MS_DAEMON_CREATOR__
#define __MS_DAEMON_CREATOR__

#include "Headers.hpp"

namespace ms {
/**
 * @brief Detaches msserver from its controlling terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Forks twice into a new session and points stdio at /dev/null.
   * @param terminateParent Whether the original process exits after forking.
   * @param childPidFile Pid file written by the daemon, empty for none.
   * @return PARENT in the original process, CHILD in the daemon.
   * @throws std::runtime_error when a fork or setsid fails.
   */
  static int create(bool terminateParent, const string &childPidFile);

  static const int PARENT = 1;
  static const int CHILD = 2;
};
}  // namespace ms

#endif  // __MS_DAEMON_CREATOR__
