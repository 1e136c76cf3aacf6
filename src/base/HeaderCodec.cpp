#include "HeaderCodec.hpp"

namespace sshed {
const string HeaderCodec::HEADER_TERMINATOR = "\n\n";

namespace {
// A quoted name ends at the first colon whose prefix is a complete quoted
// string; an unquoted name ends at the first colon.
size_t findNameSeparator(const string& line) {
  size_t pos = line.find(':');
  while (pos != string::npos) {
    string prefix = trim(line.substr(0, pos));
    if (prefix.empty() || prefix.front() != '"' || isQuoted(prefix)) {
      return pos;
    }
    pos = line.find(':', pos + 1);
  }
  return string::npos;
}
}  // namespace

string HeaderCodec::encodeName(const string& name) {
  if (name.empty()) {
    throw MalformedPacketError("Header name is empty");
  }
  if (name.find('\n') != string::npos) {
    throw MalformedPacketError("Header name contains a newline");
  }
  if (hasSurroundingWhitespace(name) || name.find(':') != string::npos ||
      name.front() == '"' || name.back() == '"') {
    string quoted = "\"" + name + "\"";
    if (findNameSeparator(quoted + ":") != quoted.length()) {
      throw MalformedPacketError("Header name cannot be quoted: " + name);
    }
    return quoted;
  }
  return name;
}

string HeaderCodec::decodeName(const string& text) {
  string name = trim(text);
  if (isQuoted(name)) {
    name = name.substr(1, name.length() - 2);
  }
  return name;
}

string HeaderCodec::encodeHeaderLine(const string& name,
                                     const HeaderValue& value) {
  return encodeName(name) + ": " + value.encode() + "\n";
}

string HeaderCodec::encodeHeaders(const HeaderSet& headers) {
  string s;
  for (const auto& it : headers) {
    s += encodeHeaderLine(it.first, it.second);
  }
  s += "\n";
  return s;
}

pair<string, HeaderValue> HeaderCodec::decodeHeaderLine(const string& line) {
  size_t separator = findNameSeparator(line);
  if (separator == string::npos) {
    throw MalformedPacketError("Header line has no name separator: " + line);
  }
  string name = decodeName(line.substr(0, separator));
  if (name.empty()) {
    throw MalformedPacketError("Header line has an empty name: " + line);
  }
  return make_pair(name, HeaderValue::coerce(line.substr(separator + 1)));
}

HeaderSet HeaderCodec::decodeHeaderBlock(const string& block) {
  HeaderSet headers;
  if (block.empty()) {
    return headers;
  }
  for (const string& line : split(block, '\n')) {
    auto header = decodeHeaderLine(line);
    headers.add(header.first, header.second);
  }
  // split() drops a trailing empty field
  if (block.back() == '\n') {
    throw MalformedPacketError("Header block contains an empty line");
  }
  return headers;
}

HeaderSet HeaderCodec::decodeHeaders(StreamBuffer* stream) {
  // A block without header lines is just the blank line
  string first = stream->readExact(1);
  if (first == "\n") {
    return HeaderSet();
  }
  string block = first + stream->readUntil(HEADER_TERMINATOR);
  VLOG(3) << "Received header block of " << block.length() << " bytes";
  return decodeHeaderBlock(block);
}
}  // namespace sshed
