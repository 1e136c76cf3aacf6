#ifndef __SSHED_HEADER_VALUE__
#define __SSHED_HEADER_VALUE__

#include <variant>

#include "Errors.hpp"
#include "Headers.hpp"

namespace sshed {
/**
 * @brief A typed header value: exactly one of Integer, Float, Boolean or
 * String.
 */
class HeaderValue {
 public:
  // Matches the alternative order of the underlying variant
  enum Kind { INTEGER = 0, FLOAT = 1, BOOLEAN = 2, STRING = 3 };

  HeaderValue() : value(string()) {}
  HeaderValue(int v) : value(int64_t(v)) {}
  HeaderValue(int64_t v) : value(v) {}
  HeaderValue(double v) : value(v) {}
  HeaderValue(bool v) : value(v) {}
  HeaderValue(const char* v) : value(string(v)) {}
  HeaderValue(const string& v) : value(v) {}

  Kind getKind() const { return Kind(value.index()); }
  bool isInteger() const { return getKind() == INTEGER; }
  bool isFloat() const { return getKind() == FLOAT; }
  bool isBoolean() const { return getKind() == BOOLEAN; }
  bool isString() const { return getKind() == STRING; }

  /**
   * @brief Typed accessors.
   * @throws MalformedPacketError when the value holds another kind.
   */
  int64_t getInteger() const;
  double getFloat() const;
  bool getBoolean() const;
  const string& getString() const;

  /**
   * @brief Interprets header contents read from the wire.
   *
   * The text is trimmed, then tried as an Integer, a Float and a Boolean
   * (`True`/`False`) in that order. Anything else is a String, with one pair
   * of surrounding double quotes removed if present.
   */
  static HeaderValue coerce(const string& contents);

  /**
   * @brief Renders the value so that coerce() gives it back with the same
   * kind. Strings that would read back as another kind, or that have
   * surrounding whitespace or quotes, are wrapped in double quotes.
   * @throws MalformedPacketError if the value contains a newline.
   */
  string encode() const;

  /** @brief Human readable form for logging. */
  string toString() const;

  bool operator==(const HeaderValue& other) const {
    return value == other.value;
  }
  bool operator!=(const HeaderValue& other) const { return !(*this == other); }

  static string kindName(Kind kind);

 protected:
  std::variant<int64_t, double, bool, string> value;
};

inline ostream& operator<<(ostream& os, const HeaderValue& self) {
  return os << self.toString(), os;
}

/** @brief Parses an optionally signed run of digits that fits in 64 bits. */
bool parseIntegerLiteral(const string& text, int64_t* result);
/**
 * @brief Parses a decimal floating point literal, optionally with an
 * exponent, or one of inf/infinity/nan (any case, optional sign).
 */
bool parseFloatLiteral(const string& text, double* result);
}  // namespace sshed

#endif  // __SSHED_HEADER_VALUE__
