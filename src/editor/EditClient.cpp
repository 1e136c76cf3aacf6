#include "EditClient.hpp"

#include "LineUtils.hpp"
#include "Patcher.hpp"

namespace sshed {
EditClient::EditClient(shared_ptr<SocketHandler> _socketHandler,
                       int _socketFd)
    : socketHandler(_socketHandler), channel(_socketHandler, _socketFd) {}

optional<string> EditClient::requestEdit(const string& filename,
                                         const string& content) {
  EditRequest request;
  request.filename = filename;
  request.filesize = content.length();
  request.acceptsDiff = true;
  channel.send(request.toHeaders(), content);
  VLOG(1) << "Sent " << filename << " (" << content.length() << " bytes)";

  Packet packet = channel.receive();
  EditReply reply = EditReply::fromHeaders(packet.getHeaders());
  if (!reply.modified) {
    VLOG(1) << "File was not modified";
    return nullopt;
  }
  if (!reply.differential) {
    VLOG(1) << "Received full content (" << packet.getBody().length()
            << " bytes)";
    return packet.getBody();
  }
  VLOG(1) << "Received a diff (" << packet.getBody().length() << " bytes)";
  Patcher patcher(splitLines(content), splitLines(packet.getBody()));
  return patcher.apply();
}
}  // namespace sshed
