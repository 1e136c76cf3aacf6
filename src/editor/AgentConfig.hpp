#ifndef __SSHED_AGENT_CONFIG__
#define __SSHED_AGENT_CONFIG__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief sshed-agent settings that can come from an INI file.
 *
 * ```
 * [Agent]
 * socket = /path/to/socket
 * max_connections = 8
 * editor = code --wait
 * context_lines = 3
 * [Debug]
 * verbose = 0
 * logsize = 20971520
 * logdir = /tmp/sshed
 * ```
 */
struct AgentConfig {
  AgentConfig();

  string socketAddress;
  int maxConnections;
  // Empty means choose from the environment
  string editor;
  int contextLines;
  int verbose;
  string logSize;
  string logDirectory;

  /**
   * @brief Overrides the defaults with the values present in @p filename.
   * @throws std::runtime_error if the file cannot be loaded or holds an
   * invalid value.
   */
  void loadFile(const string& filename);

  /**
   * @brief Parses a whole non-negative decimal number.
   * @throws std::runtime_error naming @p key otherwise.
   */
  static int parseCount(const string& key, const string& value);
};
}  // namespace sshed

#endif  // __SSHED_AGENT_CONFIG__
