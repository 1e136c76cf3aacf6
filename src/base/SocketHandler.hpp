#ifndef __SSHED_SOCKET_HANDLER__
#define __SSHED_SOCKET_HANDLER__

#include "Errors.hpp"
#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace sshed {
/**
 * @brief Byte stream transport used by the packet layer.
 *
 * read() and write() follow the POSIX conventions, including -1 with errno
 * set to EAGAIN when nothing could be transferred yet.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  virtual bool hasData(int fd) = 0;
  /**
   * @return Bytes read, 0 once the peer has closed, -1 with errno on error.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Writes every byte, waiting out EAGAIN.
   * @throws ConnectionClosedError when the peer is gone.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count);
  inline void writeAllOrThrow(int fd, const string& s) {
    writeAllOrThrow(fd, s.data(), s.length());
  }

  /** @return The connected fd, or -1 with errno set. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @return The listening fds for @p endpoint. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @return A new connection, or -1 when none is pending. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
  /** @brief Connections opened by connect() or accept() and not closed. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace sshed

#endif  // __SSHED_SOCKET_HANDLER__
