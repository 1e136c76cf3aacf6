#ifndef __SSHED_SOCKET_LOCATOR__
#define __SSHED_SOCKET_LOCATOR__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Finds the agent socket the guest should talk to.
 */
class SocketLocator {
 public:
  /**
   * @brief Resolves @p socketAddress, or SSHED_SOCK when it is empty.
   *
   * A directory stands for the `socket` file inside it. The result must be a
   * socket owned by the current user with mode 0600. Every rejection is
   * logged with its reason.
   * @return The socket path, or nullopt to fall back to a local editor.
   */
  static optional<string> find(const string& socketAddress = "");
};
}  // namespace sshed

#endif  // __SSHED_SOCKET_LOCATOR__
