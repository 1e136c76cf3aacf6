#ifndef __SSHED_HEADERS__
#define __SSHED_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <arpa/inet.h>
#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <paths.h>
#include <pwd.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ThreadPool.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// The sshed protocol version spoken by this binary
static const int PROTOCOL_VERSION = 1;

// Size of every read request issued against a socket
static const size_t SOCKET_READ_CHUNK_SIZE = 4096;

// Environment variable that points the guest at the agent socket
const string SOCKET_ENVIRONMENT_VARIABLE = "SSHED_SOCK";

// Files created by sshed are readable and writable by the owner only
static const mode_t USER_ONLY_UMASK = 0177;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef SSHED_VERSION
#define SSHED_VERSION "unknown"
#endif

namespace sshed {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Splits on runs of whitespace, dropping empty fields.
 */
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::istringstream ss(s);
  std::string item;
  while (ss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline bool isWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

/**
 * @brief Removes leading and trailing whitespace.
 */
inline std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.length() && isWhitespace(s[start])) {
    start++;
  }
  size_t end = s.length();
  while (end > start && isWhitespace(s[end - 1])) {
    end--;
  }
  return s.substr(start, end - start);
}

inline bool hasSurroundingWhitespace(const std::string &s) {
  return !s.empty() && (isWhitespace(s.front()) || isWhitespace(s.back()));
}

inline bool isQuoted(const std::string &s) {
  return s.length() >= 2 && s.front() == '"' && s.back() == '"';
}

inline bool endsWith(const std::string &s, const std::string &suffix) {
  return s.length() >= suffix.length() &&
         s.compare(s.length() - suffix.length(), suffix.length(), suffix) == 0;
}

inline string GetTempDirectory() {
  const char *tmpDir = getenv("TMPDIR");
  if (tmpDir && tmpDir[0] == '/') {
    string s(tmpDir);
    if (s.back() != '/') {
      s += "/";
    }
    return s;
  }
  return string(_PATH_TMP);
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace sshed

#endif  // __SSHED_HEADERS__
