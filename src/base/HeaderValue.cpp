#include "HeaderValue.hpp"

#include <charconv>
#include <cmath>

namespace sshed {
namespace {
bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool equalsIgnoreCase(const string& a, const string& b) {
  if (a.length() != b.length()) {
    return false;
  }
  for (size_t i = 0; i < a.length(); i++) {
    if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i])) {
      return false;
    }
  }
  return true;
}

[[noreturn]] void wrongKind(HeaderValue::Kind expected, HeaderValue::Kind actual) {
  throw MalformedPacketError("Expected a header of kind " +
                             HeaderValue::kindName(expected) + " but got " +
                             HeaderValue::kindName(actual));
}
}  // namespace

bool parseIntegerLiteral(const string& text, int64_t* result) {
  size_t pos = 0;
  if (pos < text.length() && (text[pos] == '+' || text[pos] == '-')) {
    pos++;
  }
  if (pos == text.length()) {
    return false;
  }
  for (size_t i = pos; i < text.length(); i++) {
    if (!isDigit(text[i])) {
      return false;
    }
  }
  errno = 0;
  long long v = strtoll(text.c_str(), NULL, 10);
  if (errno == ERANGE) {
    // Too large for an Integer, it still reads as a Float
    return false;
  }
  *result = v;
  return true;
}

bool parseFloatLiteral(const string& text, double* result) {
  size_t pos = 0;
  if (pos < text.length() && (text[pos] == '+' || text[pos] == '-')) {
    pos++;
  }
  string rest = text.substr(pos);
  if (equalsIgnoreCase(rest, "inf") || equalsIgnoreCase(rest, "infinity") ||
      equalsIgnoreCase(rest, "nan")) {
    *result = strtod(text.c_str(), NULL);
    return true;
  }

  size_t digits = 0;
  while (pos < text.length() && isDigit(text[pos])) {
    pos++;
    digits++;
  }
  if (pos < text.length() && text[pos] == '.') {
    pos++;
    while (pos < text.length() && isDigit(text[pos])) {
      pos++;
      digits++;
    }
  }
  if (digits == 0) {
    return false;
  }
  if (pos < text.length() && (text[pos] == 'e' || text[pos] == 'E')) {
    pos++;
    if (pos < text.length() && (text[pos] == '+' || text[pos] == '-')) {
      pos++;
    }
    size_t exponentDigits = 0;
    while (pos < text.length() && isDigit(text[pos])) {
      pos++;
      exponentDigits++;
    }
    if (exponentDigits == 0) {
      return false;
    }
  }
  if (pos != text.length()) {
    return false;
  }
  // Out of range literals saturate to inf or 0 instead of failing
  *result = strtod(text.c_str(), NULL);
  return true;
}

int64_t HeaderValue::getInteger() const {
  if (!isInteger()) {
    wrongKind(INTEGER, getKind());
  }
  return std::get<int64_t>(value);
}

double HeaderValue::getFloat() const {
  if (!isFloat()) {
    wrongKind(FLOAT, getKind());
  }
  return std::get<double>(value);
}

bool HeaderValue::getBoolean() const {
  if (!isBoolean()) {
    wrongKind(BOOLEAN, getKind());
  }
  return std::get<bool>(value);
}

const string& HeaderValue::getString() const {
  if (!isString()) {
    wrongKind(STRING, getKind());
  }
  return std::get<string>(value);
}

HeaderValue HeaderValue::coerce(const string& contents) {
  string text = trim(contents);
  int64_t i;
  if (parseIntegerLiteral(text, &i)) {
    return HeaderValue(i);
  }
  double d;
  if (parseFloatLiteral(text, &d)) {
    return HeaderValue(d);
  }
  if (text == "True") {
    return HeaderValue(true);
  }
  if (text == "False") {
    return HeaderValue(false);
  }
  if (isQuoted(text)) {
    return HeaderValue(text.substr(1, text.length() - 2));
  }
  return HeaderValue(text);
}

string HeaderValue::encode() const {
  switch (getKind()) {
    case INTEGER:
      return std::to_string(std::get<int64_t>(value));
    case FLOAT: {
      double d = std::get<double>(value);
      if (std::isnan(d)) {
        return "nan";
      }
      if (std::isinf(d)) {
        return d < 0 ? "-inf" : "inf";
      }
      char buf[64];
      auto result = std::to_chars(buf, buf + sizeof(buf), d);
      if (result.ec != std::errc()) {
        STFATAL << "Could not format float header value";
      }
      string s(buf, result.ptr);
      int64_t unused;
      if (parseIntegerLiteral(s, &unused)) {
        // Keep whole numbers readable as Float
        s += ".0";
      }
      return s;
    }
    case BOOLEAN:
      return std::get<bool>(value) ? "True" : "False";
    case STRING: {
      const string& s = std::get<string>(value);
      if (s.find('\n') != string::npos) {
        throw MalformedPacketError("Header value contains a newline");
      }
      if (s.empty() || hasSurroundingWhitespace(s) || s.front() == '"' ||
          s.back() == '"' || !coerce(s).isString()) {
        return "\"" + s + "\"";
      }
      return s;
    }
  }
  STFATAL << "Invalid header value kind";
  return "";
}

string HeaderValue::toString() const {
  if (isString()) {
    return "\"" + std::get<string>(value) + "\"";
  }
  return encode();
}

string HeaderValue::kindName(Kind kind) {
  switch (kind) {
    case INTEGER:
      return "Integer";
    case FLOAT:
      return "Float";
    case BOOLEAN:
      return "Boolean";
    case STRING:
      return "String";
  }
  return "Unknown";
}
}  // namespace sshed
