#ifndef __SSHED_EDIT_CLIENT__
#define __SSHED_EDIT_CLIENT__

#include "EditProtocol.hpp"
#include "PacketChannel.hpp"

namespace sshed {
/**
 * @brief Guest side of one edit: sends a file to the agent and turns the
 * reply back into file content.
 */
class EditClient {
 public:
  EditClient(shared_ptr<SocketHandler> _socketHandler, int _socketFd);

  /**
   * @brief Sends @p content and blocks until the editor on the agent side
   * has exited.
   * @return The new content, or nullopt when the file was not modified.
   * @throws ConnectionClosedError if the agent goes away.
   * @throws MalformedPacketError for a reply that does not parse.
   * @throws MalformedDiffError if a diff reply does not apply to @p content.
   */
  optional<string> requestEdit(const string& filename, const string& content);

 protected:
  shared_ptr<SocketHandler> socketHandler;
  PacketChannel channel;
};
}  // namespace sshed

#endif  // __SSHED_EDIT_CLIENT__
