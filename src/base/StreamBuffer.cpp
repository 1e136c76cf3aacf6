#include "StreamBuffer.hpp"

namespace sshed {
StreamBuffer::StreamBuffer(shared_ptr<SocketHandler> _socketHandler,
                           int _socketFd)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      readOffset(0),
      closed(false) {}

string StreamBuffer::readExact(size_t count) {
  while (available() < count) {
    fill();
  }
  string s = buffer.substr(readOffset, count);
  consume(count);
  return s;
}

void StreamBuffer::readExact(size_t count, DataSink* sink) {
  size_t remaining = count;
  while (remaining > 0) {
    if (available() == 0) {
      fill();
    }
    size_t n = min(remaining, available());
    sink->write(buffer.data() + readOffset, n);
    consume(n);
    remaining -= n;
  }
}

string StreamBuffer::readUntil(const string& delimiter) {
  if (delimiter.empty()) {
    STFATAL << "Tried to read until an empty delimiter";
  }
  // Offset (relative to readOffset) where the next search starts, so bytes
  // are scanned once no matter how many reads it takes.
  size_t searchFrom = 0;
  while (true) {
    size_t pos = buffer.find(delimiter, readOffset + searchFrom);
    if (pos != string::npos) {
      size_t length = pos - readOffset;
      string s = buffer.substr(readOffset, length);
      consume(length + delimiter.length());
      return s;
    }
    if (available() >= delimiter.length()) {
      searchFrom = available() - delimiter.length() + 1;
    }
    fill();
  }
}

void StreamBuffer::fill() {
  if (closed) {
    throw ConnectionClosedError("Stream is closed");
  }
  // Drop consumed bytes once they make up most of the buffer
  if (readOffset > 0 && readOffset >= buffer.length() / 2) {
    buffer.erase(0, readOffset);
    readOffset = 0;
  }
  char chunk[READ_CHUNK_SIZE];
  while (true) {
    ssize_t bytesRead = socketHandler->read(socketFd, chunk, READ_CHUNK_SIZE);
    if (bytesRead == 0) {
      markClosed("Connection closed by peer");
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        VLOG(4) << "No data yet on " << socketFd << ", waiting...";
        continue;
      }
      markClosed(string("Error reading from socket: ") +
                 strerror(localErrno));
    }
    VLOG(4) << "Read " << bytesRead << " bytes from " << socketFd;
    buffer.append(chunk, bytesRead);
    return;
  }
}

void StreamBuffer::consume(size_t count) {
  readOffset += count;
  if (readOffset == buffer.length()) {
    buffer.clear();
    readOffset = 0;
  }
}

void StreamBuffer::markClosed(const string& reason) {
  VLOG(1) << "Stream on " << socketFd << " closed: " << reason << " ("
          << available() << " bytes discarded)";
  closed = true;
  buffer.clear();
  readOffset = 0;
  throw ConnectionClosedError(reason);
}
}  // namespace sshed
