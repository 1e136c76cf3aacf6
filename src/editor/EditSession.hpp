#ifndef __SSHED_EDIT_SESSION__
#define __SSHED_EDIT_SESSION__

#include "DiffEngine.hpp"
#include "EditProtocol.hpp"
#include "PacketChannel.hpp"
#include "SubprocessUtils.hpp"

namespace sshed {
/**
 * @brief Agent side of one connection: receive a file, edit it, answer.
 */
class EditSession {
 public:
  EditSession(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
              shared_ptr<SubprocessUtils> _subprocessUtils,
              const vector<string>& _editorCommand,
              const string& _workDirectory, int contextLines);

  /**
   * @brief Handles the request on this connection. The socket is left open.
   * @throws ConnectionClosedError when the guest goes away.
   * @throws UnknownProtocolVersionError before reading past the headers.
   * @throws MalformedPacketError for a request that does not parse.
   * @throws std::runtime_error when the file cannot be edited.
   */
  void run();

 protected:
  EditReply reply(const EditRequest& request, const string& original,
                  const string& edited);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  shared_ptr<SubprocessUtils> subprocessUtils;
  vector<string> editorCommand;
  string workDirectory;
  DiffEngine diffEngine;
  PacketChannel channel;
};
}  // namespace sshed

#endif  // __SSHED_EDIT_SESSION__
