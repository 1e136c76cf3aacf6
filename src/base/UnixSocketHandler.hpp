#ifndef __SSHED_UNIX_SOCKET_HANDLER__
#define __SSHED_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace sshed {
/**
 * @brief SocketHandler over non-blocking POSIX stream sockets.
 *
 * Every tracked descriptor has its own mutex so a read and a write on the
 * same socket never interleave. Descriptors are close-on-exec so editors
 * started by the agent do not inherit guest connections.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  // Upper bound on how long read() waits for the socket to become readable
  static const int READ_WAIT_SECONDS = 5;
  // write() gives up when the peer has not drained its buffer for this long
  static const int WRITE_STALL_SECONDS = 5;

  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Waits with select() until @p fd is readable or the timeout ends.
   */
  bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  void addToActiveSockets(int fd);
  /** @brief The mutex of a tracked socket, or null once it is closed. */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  void initSocket(int fd);
  void initServerSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> socketMutexes;
  // Guards socketMutexes and, in subclasses, the listening sockets
  recursive_mutex globalMutex;
};
}  // namespace sshed

#endif  // __SSHED_UNIX_SOCKET_HANDLER__
