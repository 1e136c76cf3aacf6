#include "EditServer.hpp"

namespace sshed {
EditServer::EditServer(shared_ptr<SocketHandler> _socketHandler,
                       const SocketEndpoint& _serverEndpoint,
                       shared_ptr<SubprocessUtils> _subprocessUtils,
                       const EditServerOptions& _options)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      subprocessUtils(_subprocessUtils),
      options(_options),
      halt(false),
      completedSessions(0) {
  if (options.maxConnections < 1) {
    STFATAL << "Invalid connection limit: " << options.maxConnections;
  }
  if (options.editorCommand.empty()) {
    STFATAL << "No editor command";
  }
  clientHandlerThreadPool.reset(new ThreadPool(options.maxConnections));
  socketHandler->listen(serverEndpoint);
}

EditServer::~EditServer() {}

void EditServer::run() {
  LOG(INFO) << "Serving edit requests on " << serverEndpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverFds = socketHandler->getEndpointFds(serverEndpoint);
  for (int i : serverFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }
  if (serverFds.size() > FD_SETSIZE) {
    LOG(FATAL) << "Tried to select() on too many FDs";
  }

  while (!isHalting()) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }
    for (int i : serverFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }

  LOG(INFO) << "Shutting down, closing open sessions";
  socketHandler->stopListening(serverEndpoint);
  closeClientSockets();
  // ThreadPool joins its workers after draining the queue
  clientHandlerThreadPool.reset();
}

void EditServer::closeClientSockets() {
  lock_guard<std::mutex> guard(clientSocketMutex);
  for (int fd : clientSockets) {
    VLOG(1) << "Closing guest socket " << fd;
    socketHandler->close(fd);
  }
  clientSockets.clear();
}

void EditServer::shutdown() { halt = true; }

bool EditServer::isHalting() { return halt; }

int EditServer::getCompletedSessions() { return completedSessions; }

bool EditServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return false;
  }
  VLOG(1) << "SERVER: got client socket fd: " << clientSocketFd;
  {
    lock_guard<std::mutex> guard(clientSocketMutex);
    clientSockets.insert(clientSocketFd);
  }
  clientHandlerThreadPool->enqueue(
      [this, clientSocketFd]() { this->clientHandler(clientSocketFd); });
  return true;
}

void EditServer::clientHandler(int clientSocketFd) {
  el::Helpers::setThreadName("edit-session-" + to_string(clientSocketFd));
  try {
    EditSession session(socketHandler, clientSocketFd, subprocessUtils,
                        options.editorCommand, options.workDirectory,
                        options.contextLines);
    session.run();
  } catch (const ConnectionClosedError& cce) {
    VLOG(1) << "Guest closed the connection: " << cce.what();
  } catch (const UnknownProtocolVersionError& upve) {
    LOG(ERROR) << upve.what() << ". Dropping connection.";
  } catch (const MalformedPacketError& mpe) {
    LOG(ERROR) << "Malformed request: " << mpe.what()
               << ". Dropping connection.";
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Edit session failed: " << re.what();
  }
  {
    lock_guard<std::mutex> guard(clientSocketMutex);
    if (clientSockets.erase(clientSocketFd)) {
      socketHandler->close(clientSocketFd);
    }
  }
  completedSessions++;
}
}  // namespace sshed
