#ifndef __SSHED_DIFF__
#define __SSHED_DIFF__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief One line of a hunk. Content keeps its '\n' unless it is the last
 * line of a file without a trailing newline.
 */
struct HunkLine {
  enum Tag { CONTEXT, REMOVED, ADDED };

  HunkLine(Tag _tag, const string& _content) : tag(_tag), content(_content) {}

  Tag tag;
  string content;

  char prefix() const;

  bool operator==(const HunkLine& other) const {
    return tag == other.tag && content == other.content;
  }
};

/**
 * @brief A contiguous change region.
 *
 * Start values follow the unified diff convention: 1-based, except that an
 * empty range names the line it follows (0 for the top of the file).
 */
struct Hunk {
  Hunk()
      : originalStart(0), originalCount(0), editedStart(0), editedCount(0) {}

  int64_t originalStart;
  int64_t originalCount;
  int64_t editedStart;
  int64_t editedCount;
  vector<HunkLine> lines;

  /** @brief The `@@ -a,b +c,d @@` line, without newline. */
  string header() const;
};

/**
 * @brief An ordered list of hunks plus the two file identifier lines.
 */
struct Diff {
  string originalName;
  string editedName;
  vector<Hunk> hunks;

  bool empty() const { return hunks.empty(); }

  /**
   * @brief Unified diff text. A diff without hunks serializes to nothing.
   */
  string serialize() const;
};

static const char NO_NEWLINE_MARKER[] = "\\ No newline at end of file";

/** @brief Formats one side of a hunk header range, e.g. `3,2` or `7`. */
string formatRange(int64_t start, int64_t count);
}  // namespace sshed

#endif  // __SSHED_DIFF__
