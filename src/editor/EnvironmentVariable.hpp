#ifndef __SSHED_ENVIRONMENT_VARIABLE__
#define __SSHED_ENVIRONMENT_VARIABLE__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Renders the shell command that exports one environment variable.
 */
class EnvironmentVariable {
 public:
  EnvironmentVariable(const string& _name, const string& _contents)
      : name(_name), contents(_contents) {}

  /**
   * @brief Command for @p shell (`bash`, `csh` or `fish`).
   * @param smart Map unknown shells to `csh` when their name ends in "csh"
   * and to `bash` otherwise. Without it unknown shells throw.
   */
  string generate(const string& shell, bool smart = true) const;

  /** @brief Basename of $SHELL, or `bash` when it is unset. */
  static string defaultShell();

  const string& getName() const { return name; }
  const string& getContents() const { return contents; }

 protected:
  string name;
  string contents;
};
}  // namespace sshed

#endif  // __SSHED_ENVIRONMENT_VARIABLE__
