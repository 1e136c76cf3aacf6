#ifndef __SSHED_HEADER_SET__
#define __SSHED_HEADER_SET__

#include "HeaderValue.hpp"

namespace sshed {
/**
 * @brief Named header values of one packet.
 *
 * Names are case sensitive and unique. Iteration follows insertion order so
 * encoding is deterministic; equality ignores order.
 */
class HeaderSet {
 public:
  typedef vector<pair<string, HeaderValue>>::const_iterator const_iterator;

  HeaderSet() {}
  HeaderSet(std::initializer_list<pair<string, HeaderValue>> init);

  /**
   * @brief Sets @p name, keeping its position when it already exists.
   */
  void set(const string& name, const HeaderValue& value);
  /**
   * @brief Adds a header that must not exist yet.
   * @throws MalformedPacketError on a duplicate name.
   */
  void add(const string& name, const HeaderValue& value);
  bool has(const string& name) const;
  optional<HeaderValue> get(const string& name) const;
  void erase(const string& name);

  size_t size() const { return headers.size(); }
  bool empty() const { return headers.empty(); }
  const_iterator begin() const { return headers.begin(); }
  const_iterator end() const { return headers.end(); }

  bool operator==(const HeaderSet& other) const;
  bool operator!=(const HeaderSet& other) const { return !(*this == other); }

 protected:
  vector<pair<string, HeaderValue>> headers;
};

ostream& operator<<(ostream& os, const HeaderSet& self);
}  // namespace sshed

#endif  // __SSHED_HEADER_SET__
