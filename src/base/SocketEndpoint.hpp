#ifndef __SSHED_SOCKET_ENDPOINT__
#define __SSHED_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Names a filesystem socket address.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name("") {}

  explicit SocketEndpoint(const string &_name) : name(_name) {}

  const string &getName() const { return name; }

  bool operator<(const SocketEndpoint &other) const {
    return name < other.name;
  }

 protected:
  string name;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.getName(), os;
}
}  // namespace sshed

#endif  // __SSHED_SOCKET_ENDPOINT__
