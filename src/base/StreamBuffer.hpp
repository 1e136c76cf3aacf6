#ifndef __SSHED_STREAM_BUFFER__
#define __SSHED_STREAM_BUFFER__

#include "DataStream.hpp"
#include "Errors.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace sshed {
/**
 * @brief Incremental reader over a connected stream socket.
 *
 * Bytes arrive in arbitrary chunks; StreamBuffer keeps whatever has been read
 * but not yet consumed and issues further fixed-size reads until a request
 * can be satisfied. Once the peer closes, everything buffered is discarded
 * and every later call throws ConnectionClosedError.
 */
class StreamBuffer {
 public:
  static constexpr size_t READ_CHUNK_SIZE = SOCKET_READ_CHUNK_SIZE;

  StreamBuffer(shared_ptr<SocketHandler> _socketHandler, int _socketFd);

  /**
   * @brief Returns exactly @p count bytes.
   * @throws ConnectionClosedError if the stream ends first.
   */
  string readExact(size_t count);

  /**
   * @brief Moves exactly @p count bytes into @p sink without holding more
   * than one read chunk in memory.
   */
  void readExact(size_t count, DataSink* sink);

  /**
   * @brief Returns everything before the first @p delimiter and consumes the
   * delimiter.
   */
  string readUntil(const string& delimiter);

  /** @brief Bytes read from the socket but not consumed yet. */
  inline size_t available() const { return buffer.length() - readOffset; }

  inline bool isClosed() const { return closed; }

  inline int getSocketFd() const { return socketFd; }

 protected:
  /**
   * @brief Issues one read on the socket and appends the result.
   */
  void fill();
  void consume(size_t count);
  [[noreturn]] void markClosed(const string& reason);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  string buffer;
  // Start of the unconsumed bytes inside buffer
  size_t readOffset;
  bool closed;
};
}  // namespace sshed

#endif  // __SSHED_STREAM_BUFFER__
