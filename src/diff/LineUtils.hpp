#ifndef __SSHED_LINE_UTILS__
#define __SSHED_LINE_UTILS__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief Splits content into lines, each keeping its '\n'. A final line
 * without a terminator is kept as is.
 */
vector<string> splitLines(const string& content);

/** @brief Concatenates lines produced by splitLines(). */
string joinLines(const vector<string>& lines);

inline bool hasLineTerminator(const string& line) {
  return !line.empty() && line.back() == '\n';
}
}  // namespace sshed

#endif  // __SSHED_LINE_UTILS__
