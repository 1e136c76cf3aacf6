#ifndef __SSHED_ERRORS__
#define __SSHED_ERRORS__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief The peer ended the stream before a framing operation completed.
 *
 * At the session layer this is the normal end of a conversation.
 */
class ConnectionClosedError : public std::runtime_error {
 public:
  explicit ConnectionClosedError(const string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief Header text that does not parse, or a reserved header with the wrong
 * kind.
 */
class MalformedPacketError : public std::runtime_error {
 public:
  explicit MalformedPacketError(const string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief A diff that cannot be applied to the content it is patched against.
 */
class MalformedDiffError : public std::runtime_error {
 public:
  explicit MalformedDiffError(const string& what)
      : std::runtime_error(what) {}
};

/** @brief The peer speaks a protocol version outside the accepted set. */
class UnknownProtocolVersionError : public std::runtime_error {
 public:
  explicit UnknownProtocolVersionError(const string& what)
      : std::runtime_error(what) {}
};
}  // namespace sshed

#endif  // __SSHED_ERRORS__
