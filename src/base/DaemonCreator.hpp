#ifndef __SSHED_DAEMON_CREATOR__
#define __SSHED_DAEMON_CREATOR__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Detaches the agent from its terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Forks twice, optionally exiting the parent, and redirects stdio to
   * /dev/null.
   * @param terminateParent Whether the parent should exit immediately after
   * forking.
   * @param childPidFile Optional path to a pid file that is written by the
   * daemon.
   * @return PARENT when running inside the original parent, CHILD inside the
   * daemon.
   */
  static int create(bool terminateParent, string childPidFile);

  static const int PARENT = 1;
  static const int CHILD = 2;
};
}  // namespace sshed

#endif  // __SSHED_DAEMON_CREATOR__
