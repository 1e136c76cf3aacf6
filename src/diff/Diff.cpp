#include "Diff.hpp"

#include "LineUtils.hpp"

namespace sshed {
char HunkLine::prefix() const {
  switch (tag) {
    case CONTEXT:
      return ' ';
    case REMOVED:
      return '-';
    case ADDED:
      return '+';
  }
  return '?';
}

string formatRange(int64_t start, int64_t count) {
  if (count == 1) {
    return to_string(start);
  }
  return to_string(start) + "," + to_string(count);
}

string Hunk::header() const {
  return "@@ -" + formatRange(originalStart, originalCount) + " +" +
         formatRange(editedStart, editedCount) + " @@";
}

string Diff::serialize() const {
  if (hunks.empty()) {
    return "";
  }
  string s = "--- " + originalName + "\n+++ " + editedName + "\n";
  for (const auto& hunk : hunks) {
    s += hunk.header();
    s += "\n";
    for (const auto& line : hunk.lines) {
      s += line.prefix();
      s += line.content;
      if (!hasLineTerminator(line.content)) {
        s += "\n";
        s += NO_NEWLINE_MARKER;
        s += "\n";
      }
    }
  }
  return s;
}
}  // namespace sshed
