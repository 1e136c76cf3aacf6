#ifndef __SSHED_PIPE_SOCKET_HANDLER__
#define __SSHED_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace sshed {
/**
 * @brief Handles UNIX domain stream sockets bound at a filesystem path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket named by the endpoint.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds a listening socket at the endpoint path, readable and
   * writable by the owner only.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd and removes the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace sshed

#endif  // __SSHED_PIPE_SOCKET_HANDLER__
