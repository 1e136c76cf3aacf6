#ifndef __SSHED_PACKET__
#define __SSHED_PACKET__

#include "HeaderSet.hpp"

namespace sshed {
/**
 * @brief One framed unit on the wire: a header block and a body of exactly
 * `Size` bytes.
 */
class Packet {
 public:
  Packet() {}
  Packet(const HeaderSet& _headers, const string& _body)
      : headers(_headers), body(_body) {}

  const HeaderSet& getHeaders() const { return headers; }
  const string& getBody() const { return body; }

  optional<HeaderValue> getHeader(const string& name) const {
    return headers.get(name);
  }

  bool operator==(const Packet& other) const {
    return headers == other.headers && body == other.body;
  }

 protected:
  HeaderSet headers;
  string body;
};
}  // namespace sshed

#endif  // __SSHED_PACKET__
