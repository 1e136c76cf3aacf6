#include "UnixSocketHandler.hpp"

namespace sshed {
namespace {
#ifdef MSG_NOSIGNAL
const int SEND_FLAGS = MSG_NOSIGNAL;
#else
// Callers ignore SIGPIPE where MSG_NOSIGNAL is missing
const int SEND_FLAGS = 0;
#endif

bool wouldBlock(int e) { return e == EAGAIN || e == EWOULDBLOCK; }

void setDescriptorFlags(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(flags);
  FATAL_FAIL_UNLESS_EINVAL(::fcntl(fd, F_SETFL, flags | O_NONBLOCK));
  int descriptorFlags = ::fcntl(fd, F_GETFD);
  FATAL_FAIL_UNLESS_EINVAL(descriptorFlags);
  FATAL_FAIL_UNLESS_EINVAL(
      ::fcntl(fd, F_SETFD, descriptorFlags | FD_CLOEXEC));
}
}  // namespace

UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(fd, &readable);
  timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int ready = ::select(fd + 1, &readable, NULL, NULL, &timeout);
  if (ready == -1) {
    VLOG(4) << "select on " << fd << " failed: " << strerror(errno);
    return false;
  }
  return ready > 0 && FD_ISSET(fd, &readable);
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = socketMutexes.find(fd);
  if (it == socketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void* buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Read from closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  // Without data this returns -1/EAGAIN and the caller retries
  waitForData(fd, READ_WAIT_SECONDS, 0);
  lock_guard<recursive_mutex> guard(*socketMutex);
  if (getSocketMutex(fd) != socketMutex) {
    // Closed while waiting, the number may already belong to a new socket
    errno = EPIPE;
    return -1;
  }
  ssize_t bytesRead = ::read(fd, buf, count);
  auto localErrno = errno;
  if (bytesRead < 0 && !wouldBlock(localErrno) && localErrno != EINTR) {
    LOG(WARNING) << "Error reading from " << fd << ": "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void* buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Write to closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  const char* data = (const char*)buf;
  size_t written = 0;
  time_t lastProgress = time(NULL);
  while (written < count) {
    ssize_t w;
    {
      lock_guard<recursive_mutex> guard(*socketMutex);
      if (getSocketMutex(fd) != socketMutex) {
        errno = EPIPE;
        return -1;
      }
      w = ::send(fd, data + written, count - written, SEND_FLAGS);
    }
    if (w >= 0) {
      written += w;
      lastProgress = time(NULL);
      continue;
    }
    if (errno == EINTR) {
      continue;
    }
    if (!wouldBlock(errno)) {
      return -1;
    }
    if (time(NULL) > lastProgress + WRITE_STALL_SECONDS) {
      LOG(WARNING) << "Peer on " << fd << " stopped reading";
      errno = ETIMEDOUT;
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (!socketMutexes.insert(make_pair(fd, make_shared<recursive_mutex>()))
           .second) {
    STFATAL << "Socket is already tracked: " << fd;
  }
}

int UnixSocketHandler::accept(int listenFd) {
  sockaddr_un client;
  socklen_t clientLength = sizeof(client);
  int fd = ::accept(listenFd, (sockaddr*)&client, &clientLength);
  if (fd < 0) {
    auto acceptErrno = errno;
    if (!wouldBlock(acceptErrno) && acceptErrno != EINTR &&
        acceptErrno != ECONNABORTED) {
      STFATAL << "accept failed on " << listenFd << ": "
              << strerror(acceptErrno);
    }
    errno = acceptErrno;
    return -1;
  }
  VLOG(3) << "Accepted " << fd << " on " << listenFd;
  initSocket(fd);
  addToActiveSockets(fd);
  return fd;
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<recursive_mutex> globalGuard(globalMutex);
    auto it = socketMutexes.find(fd);
    if (it == socketMutexes.end()) {
      STERROR << "Tried to close a socket that is not open: " << fd;
      return;
    }
    socketMutex = it->second;
    // From here on read() and write() report the socket as closed
    socketMutexes.erase(it);
  }
  // Wait for a read or write in progress on another thread
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(1) << "Closing socket " << fd;
  // Wakes a reader blocked in select() on this socket
  if (::shutdown(fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
    VLOG(1) << "shutdown of " << fd << " failed: " << strerror(errno);
  }
  FATAL_FAIL(::close(fd));
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (const auto& it : socketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) { setDescriptorFlags(fd); }

void UnixSocketHandler::initServerSocket(int fd) { setDescriptorFlags(fd); }
}  // namespace sshed
