#ifndef __SSHED_DATA_STREAM__
#define __SSHED_DATA_STREAM__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Sequential byte destination (a packet body being received, a patched
 * file being written).
 */
class DataSink {
 public:
  virtual ~DataSink() {}

  /**
   * @brief Appends all of @p buf.
   * @throws std::runtime_error when the destination cannot take the bytes.
   */
  virtual void write(const char* buf, size_t count) = 0;

  inline void write(const string& s) { write(s.data(), s.length()); }
};

/**
 * @brief Sequential byte source whose total length is known up front.
 */
class DataSource {
 public:
  virtual ~DataSource() {}

  /** @brief Number of bytes left to read. */
  virtual int64_t length() = 0;

  /**
   * @brief Reads up to @p count bytes.
   * @return Bytes read, 0 at end of data.
   */
  virtual size_t read(char* buf, size_t count) = 0;
};

class StringDataSink : public DataSink {
 public:
  StringDataSink() {}

  using DataSink::write;
  virtual void write(const char* buf, size_t count) {
    data.append(buf, count);
  }

  const string& getData() const { return data; }

 protected:
  string data;
};

class StringDataSource : public DataSource {
 public:
  explicit StringDataSource(const string& _data) : data(_data), pos(0) {}

  virtual int64_t length() { return data.length() - pos; }

  virtual size_t read(char* buf, size_t count) {
    size_t n = min(count, data.length() - pos);
    memcpy(buf, data.data() + pos, n);
    pos += n;
    return n;
  }

 protected:
  string data;
  size_t pos;
};

/**
 * @brief Writes into an open file descriptor. The descriptor is not owned.
 */
class FdDataSink : public DataSink {
 public:
  explicit FdDataSink(int _fd) : fd(_fd) {}

  using DataSink::write;
  virtual void write(const char* buf, size_t count);

 protected:
  int fd;
};

/**
 * @brief Reads from an open, seekable file descriptor. The descriptor is not
 * owned; reading starts at the current offset.
 */
class FdDataSource : public DataSource {
 public:
  explicit FdDataSource(int _fd) : fd(_fd) {}

  virtual int64_t length();
  virtual size_t read(char* buf, size_t count);

 protected:
  int fd;
};
}  // namespace sshed

#endif  // __SSHED_DATA_STREAM__
