#include "LineUtils.hpp"

namespace sshed {
vector<string> splitLines(const string& content) {
  vector<string> lines;
  size_t start = 0;
  while (start < content.length()) {
    size_t end = content.find('\n', start);
    if (end == string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, end + 1 - start));
    start = end + 1;
  }
  return lines;
}

string joinLines(const vector<string>& lines) {
  size_t length = 0;
  for (const auto& line : lines) {
    length += line.length();
  }
  string s;
  s.reserve(length);
  for (const auto& line : lines) {
    s += line;
  }
  return s;
}
}  // namespace sshed
