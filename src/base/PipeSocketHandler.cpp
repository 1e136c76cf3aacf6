#include "PipeSocketHandler.hpp"

namespace sshed {
namespace {
bool fillAddress(const string& pipePath, sockaddr_un* address) {
  memset(address, 0, sizeof(sockaddr_un));
  address->sun_family = AF_UNIX;
  if (pipePath.length() >= sizeof(address->sun_path)) {
    LOG(ERROR) << "Socket path is too long: " << pipePath;
    return false;
  }
  strncpy(address->sun_path, pipePath.c_str(), sizeof(address->sun_path) - 1);
  return true;
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.getName();
  sockaddr_un remote;
  if (!fillAddress(pipePath, &remote)) {
    SetErrno(ENAMETOOLONG);
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  // Connect while blocking, local sockets complete or fail immediately
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": " << localErrno
              << " " << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint;
  initSocket(sockFd);
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  if (!fillAddress(pipePath, &local)) {
    throw runtime_error("Socket path is too long: " + pipePath);
  }

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("Could not bind " + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::listen(fd, 5));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR));

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a pipe without calling listen() "
               "first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  if (::unlink(pipePath.c_str()) == -1 && errno != ENOENT) {
    LOG(WARNING) << "Could not remove socket " << pipePath << ": "
                 << strerror(errno);
  }
}
}  // namespace sshed
