#ifndef __SSHED_EDIT_SERVER__
#define __SSHED_EDIT_SERVER__

#include "EditSession.hpp"
#include "SocketHandler.hpp"
#include "SubprocessUtils.hpp"

namespace sshed {
/**
 * @brief Settings shared by every session of one agent.
 */
struct EditServerOptions {
  EditServerOptions()
      : maxConnections(8),
        contextLines(DiffEngine::DEFAULT_CONTEXT_LINES) {}

  vector<string> editorCommand;
  // Where temp copies of edited files are kept
  string workDirectory;
  int maxConnections;
  int contextLines;
};

/**
 * @brief Accepts guest connections and runs one EditSession for each on a
 * bounded worker pool.
 */
class EditServer {
 public:
  EditServer(shared_ptr<SocketHandler> _socketHandler,
             const SocketEndpoint& _serverEndpoint,
             shared_ptr<SubprocessUtils> _subprocessUtils,
             const EditServerOptions& _options);
  virtual ~EditServer();

  /**
   * @brief Serves until shutdown() is called. Open guest connections are
   * then closed, which ends their sessions, and run() returns once every
   * worker is done. A session waiting on the editor finishes when the
   * editor exits.
   */
  void run();

  /**
   * @brief Makes run() return. Safe to call from any thread or a signal
   * handler.
   */
  void shutdown();

  bool isHalting();

  /** @brief Number of sessions that have finished, successfully or not. */
  int getCompletedSessions();

 protected:
  bool acceptNewConnection(int fd);
  void clientHandler(int clientSocketFd);
  void closeClientSockets();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<SubprocessUtils> subprocessUtils;
  EditServerOptions options;
  shared_ptr<ThreadPool> clientHandlerThreadPool;
  // Guest sockets that are open, closed by whoever removes them first
  set<int> clientSockets;
  std::mutex clientSocketMutex;
  std::atomic<bool> halt;
  std::atomic<int> completedSessions;
};
}  // namespace sshed

#endif  // __SSHED_EDIT_SERVER__
