#ifndef __SSHED_FAKE_SOCKET_HANDLER__
#define __SSHED_FAKE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace sshed {
/**
 * @brief In-memory transport for tests.
 *
 * Every pushed chunk is delivered by its own read() call, optionally capped
 * to a maximum number of bytes per read. Writes are recorded and forwarded to
 * the remote handler when one is wired, using the same fd on both sides.
 */
class FakeSocketHandler : public SocketHandler {
 public:
  FakeSocketHandler();

  explicit FakeSocketHandler(std::shared_ptr<FakeSocketHandler> remoteHandler);

  inline void setRemoteHandler(
      std::shared_ptr<FakeSocketHandler> remoteHandler) {
    lock_guard<mutex> guard(handlerMutex);
    this->remoteHandler = remoteHandler;
  }

  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int connect(const SocketEndpoint& endpoint);
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual int accept(int fd);
  virtual void stopListening(const SocketEndpoint& endpoint);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

  /** @brief Queues a chunk that a later read() on @p fd returns. */
  void push(int fd, const char* buf, size_t count);
  inline void push(int fd, const string& s) { push(fd, s.data(), s.length()); }
  /**
   * @brief Marks the remote end of @p fd as closed: once queued chunks are
   * drained, read() returns 0.
   */
  void closePeer(int fd);
  /** @brief Registers a connection fd with an empty inbox. */
  int createConnection();
  /** @brief Queues an incoming connection for accept(). */
  void addConnection(int fd);
  bool hasPendingConnection();

  /** @brief Caps every read() to at most @p maxReadSize bytes (0 = no cap). */
  void setMaxReadSize(size_t maxReadSize);
  /** @brief The `count` argument of the most recent read() call. */
  size_t getLastReadRequest();
  int getReadCount();
  /** @brief Everything written to @p fd so far. */
  string getWritten(int fd);

 protected:
  void registerFd(int fd);

  std::shared_ptr<FakeSocketHandler> remoteHandler;
  unordered_map<int, deque<string>> inBuffers;
  unordered_map<int, string> outBuffers;
  unordered_set<int> closedFds;
  unordered_set<int> peerClosedFds;
  deque<int> futureConnections;
  mutex handlerMutex;
  condition_variable dataReady;
  int nextFd;
  size_t maxReadSize;
  size_t lastReadRequest;
  int readCount;
};
}  // namespace sshed

#endif  // __SSHED_FAKE_SOCKET_HANDLER__
