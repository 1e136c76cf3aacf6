#include "FakeSocketHandler.hpp"

namespace sshed {
#define FAKE_READ_TIMEOUT (5)
#define FAKE_LISTEN_FD (1000)

FakeSocketHandler::FakeSocketHandler()
    : remoteHandler(NULL),
      nextFd(3),
      maxReadSize(0),
      lastReadRequest(0),
      readCount(0) {}

FakeSocketHandler::FakeSocketHandler(
    std::shared_ptr<FakeSocketHandler> remoteHandler_)
    : remoteHandler(remoteHandler_),
      nextFd(3),
      maxReadSize(0),
      lastReadRequest(0),
      readCount(0) {}

bool FakeSocketHandler::hasData(int fd) {
  lock_guard<mutex> guard(handlerMutex);
  auto it = inBuffers.find(fd);
  return (it != inBuffers.end() && !it->second.empty()) ||
         peerClosedFds.find(fd) != peerClosedFds.end();
}

ssize_t FakeSocketHandler::read(int fd, void* buf, size_t count) {
  unique_lock<mutex> lock(handlerMutex);
  lastReadRequest = count;
  readCount++;
  auto ready = [this, fd]() {
    if (closedFds.find(fd) != closedFds.end()) {
      return true;
    }
    auto it = inBuffers.find(fd);
    if (it != inBuffers.end() && !it->second.empty()) {
      return true;
    }
    return peerClosedFds.find(fd) != peerClosedFds.end();
  };
  if (!dataReady.wait_for(lock, std::chrono::seconds(FAKE_READ_TIMEOUT),
                          ready)) {
    errno = ECONNRESET;
    return -1;
  }
  if (closedFds.find(fd) != closedFds.end()) {
    errno = EPIPE;
    return -1;
  }
  auto it = inBuffers.find(fd);
  if (it == inBuffers.end() || it->second.empty()) {
    VLOG(1) << "Fake peer closed fd " << fd;
    return 0;
  }
  string& front = it->second.front();
  size_t n = min(count, front.length());
  if (maxReadSize > 0) {
    n = min(n, maxReadSize);
  }
  memcpy(buf, front.data(), n);
  if (n == front.length()) {
    it->second.pop_front();
  } else {
    front.erase(0, n);
  }
  return n;
}

ssize_t FakeSocketHandler::write(int fd, const void* buf, size_t count) {
  shared_ptr<FakeSocketHandler> remote;
  {
    lock_guard<mutex> guard(handlerMutex);
    if (closedFds.find(fd) != closedFds.end()) {
      errno = EPIPE;
      return -1;
    }
    outBuffers[fd].append((const char*)buf, count);
    remote = remoteHandler;
  }
  if (remote.get() != NULL) {
    remote->push(fd, (const char*)buf, count);
  }
  return count;
}

int FakeSocketHandler::connect(const SocketEndpoint& endpoint) {
  int fd = createConnection();
  shared_ptr<FakeSocketHandler> remote;
  {
    lock_guard<mutex> guard(handlerMutex);
    remote = remoteHandler;
  }
  if (remote.get() == NULL) {
    throw std::runtime_error("Invalid remote handler");
  }
  VLOG(1) << "CLIENT: Connecting to " << endpoint << " with fd " << fd;
  remote->addConnection(fd);
  return fd;
}

set<int> FakeSocketHandler::listen(const SocketEndpoint& endpoint) {
  return set<int>({FAKE_LISTEN_FD});
}

set<int> FakeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  return set<int>({FAKE_LISTEN_FD});
}

int FakeSocketHandler::accept(int fd) {
  lock_guard<mutex> guard(handlerMutex);
  if (futureConnections.empty()) {
    errno = EAGAIN;
    return -1;
  }
  int retval = futureConnections.front();
  futureConnections.pop_front();
  VLOG(1) << "SERVER: Accepting client with fd " << retval;
  return retval;
}

void FakeSocketHandler::stopListening(const SocketEndpoint& endpoint) {}

void FakeSocketHandler::close(int fd) {
  shared_ptr<FakeSocketHandler> remote;
  {
    lock_guard<mutex> guard(handlerMutex);
    closedFds.insert(fd);
    inBuffers.erase(fd);
    remote = remoteHandler;
  }
  dataReady.notify_all();
  if (remote.get() != NULL) {
    remote->closePeer(fd);
  }
}

vector<int> FakeSocketHandler::getActiveSockets() {
  lock_guard<mutex> guard(handlerMutex);
  vector<int> fds;
  for (const auto& it : inBuffers) {
    fds.push_back(it.first);
  }
  return fds;
}

void FakeSocketHandler::push(int fd, const char* buf, size_t count) {
  {
    lock_guard<mutex> guard(handlerMutex);
    VLOG(4) << "Accepting buffer for " << fd << " of size " << count;
    if (closedFds.find(fd) != closedFds.end()) {
      VLOG(1) << "Dropping buffer for closed fd: " << fd;
      return;
    }
    inBuffers[fd].push_back(string(buf, count));
  }
  dataReady.notify_all();
}

void FakeSocketHandler::closePeer(int fd) {
  {
    lock_guard<mutex> guard(handlerMutex);
    peerClosedFds.insert(fd);
  }
  dataReady.notify_all();
}

int FakeSocketHandler::createConnection() {
  lock_guard<mutex> guard(handlerMutex);
  int fd = nextFd++;
  registerFd(fd);
  return fd;
}

void FakeSocketHandler::addConnection(int fd) {
  lock_guard<mutex> guard(handlerMutex);
  VLOG(1) << "SERVER: Adding pending connection from " << fd;
  registerFd(fd);
  futureConnections.push_back(fd);
}

bool FakeSocketHandler::hasPendingConnection() {
  lock_guard<mutex> guard(handlerMutex);
  return !futureConnections.empty();
}

void FakeSocketHandler::setMaxReadSize(size_t maxReadSize_) {
  lock_guard<mutex> guard(handlerMutex);
  maxReadSize = maxReadSize_;
}

size_t FakeSocketHandler::getLastReadRequest() {
  lock_guard<mutex> guard(handlerMutex);
  return lastReadRequest;
}

int FakeSocketHandler::getReadCount() {
  lock_guard<mutex> guard(handlerMutex);
  return readCount;
}

string FakeSocketHandler::getWritten(int fd) {
  lock_guard<mutex> guard(handlerMutex);
  auto it = outBuffers.find(fd);
  if (it == outBuffers.end()) {
    return "";
  }
  return it->second;
}

void FakeSocketHandler::registerFd(int fd) {
  if (inBuffers.find(fd) == inBuffers.end()) {
    inBuffers[fd] = deque<string>();
  }
}
}  // namespace sshed
