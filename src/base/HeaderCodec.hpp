#ifndef __SSHED_HEADER_CODEC__
#define __SSHED_HEADER_CODEC__

#include "HeaderSet.hpp"
#include "StreamBuffer.hpp"

namespace sshed {
/**
 * @brief Text encoding of a header block.
 *
 * A block is a sequence of `name: contents\n` lines ended by an empty line.
 * Names and contents are trimmed on decode; double quotes around either keep
 * surrounding whitespace, embedded colons in names, and String typing of
 * contents that would otherwise read as a number or boolean.
 */
class HeaderCodec {
 public:
  static const string HEADER_TERMINATOR;

  /**
   * @brief Renders one header line including its trailing newline.
   *
   * Names with surrounding whitespace, a colon or a leading or trailing
   * quote are written quoted. A name in which a quote is followed by a
   * colon (`a":b`) has no quoted form that decodes back to it, since the
   * decoder ends a quoted name at the first colon after a closing quote.
   * @throws MalformedPacketError for such names, for empty names and for
   * names or values that cannot be written on one line.
   */
  static string encodeHeaderLine(const string& name, const HeaderValue& value);

  /** @brief Renders every header followed by the blank terminator line. */
  static string encodeHeaders(const HeaderSet& headers);

  /**
   * @brief Parses one header line (without its newline).
   * @throws MalformedPacketError when the line is not `name: contents`.
   */
  static pair<string, HeaderValue> decodeHeaderLine(const string& line);

  /**
   * @brief Parses the text of a header block, without the terminator.
   */
  static HeaderSet decodeHeaderBlock(const string& block);

  /**
   * @brief Reads a header block from the stream up to and including the
   * blank terminator line.
   * @throws ConnectionClosedError if the stream ends before the terminator.
   */
  static HeaderSet decodeHeaders(StreamBuffer* stream);

  static string encodeName(const string& name);
  static string decodeName(const string& text);
};
}  // namespace sshed

#endif  // __SSHED_HEADER_CODEC__
