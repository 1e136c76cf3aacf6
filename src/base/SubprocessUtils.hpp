#ifndef __SSHED_SUBPROCESS_UTILS__
#define __SSHED_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Runs child processes. Virtual so tests can stand in for the editor.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs argv[0] (looked up on PATH) with the remaining arguments and
   * waits for it to exit. The child shares our terminal.
   * @return The exit status, 128+N when killed by signal N, or -1 if the
   * child could not be started.
   */
  virtual int runAndWait(const vector<string>& argv);

  /**
   * @brief Finds an executable on PATH, like `which`.
   */
  virtual optional<string> findExecutable(const string& name);
};
}  // namespace sshed

#endif  // __SSHED_SUBPROCESS_UTILS__
