#include "SocketHandler.hpp"

namespace sshed {
void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count) {
  const char* data = (const char*)buf;
  size_t written = 0;
  while (written < count) {
    ssize_t w = write(fd, data + written, count - written);
    if (w > 0) {
      written += w;
      continue;
    }
    if (w == 0) {
      throw ConnectionClosedError("Peer stopped accepting data");
    }
    auto localErrno = errno;
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      VLOG(4) << "Write to " << fd << " would block, retrying";
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    VLOG(1) << "Write to " << fd << " failed: " << strerror(localErrno);
    throw ConnectionClosedError(string("Write failed: ") +
                                strerror(localErrno));
  }
}
}  // namespace sshed
