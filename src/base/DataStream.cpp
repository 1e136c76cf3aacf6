#include "DataStream.hpp"

namespace sshed {
void FdDataSink::write(const char* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    ssize_t w = ::write(fd, buf + pos, count - pos);
    if (w < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error(string("Could not write to file: ") +
                               strerror(errno));
    }
    pos += w;
  }
}

int64_t FdDataSource::length() {
  struct stat st;
  if (::fstat(fd, &st) == -1) {
    throw std::runtime_error(string("Could not stat file: ") +
                             strerror(errno));
  }
  off_t offset = ::lseek(fd, 0, SEEK_CUR);
  if (offset == (off_t)-1) {
    throw std::runtime_error(string("Could not seek file: ") +
                             strerror(errno));
  }
  return int64_t(st.st_size) - int64_t(offset);
}

size_t FdDataSource::read(char* buf, size_t count) {
  while (true) {
    ssize_t r = ::read(fd, buf, count);
    if (r < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error(string("Could not read file: ") +
                               strerror(errno));
    }
    return r;
  }
}
}  // namespace sshed
