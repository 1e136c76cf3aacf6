#ifndef __SSHED_DIFF_ENGINE__
#define __SSHED_DIFF_ENGINE__

#include "Diff.hpp"

namespace sshed {
/**
 * @brief Computes line level unified diffs.
 *
 * The edit script is a shortest one (Myers' O(ND) algorithm), grouped into
 * hunks with `contextLines` unchanged lines around each change. Changes
 * separated by at most twice that many unchanged lines share a hunk.
 */
class DiffEngine {
 public:
  static const int DEFAULT_CONTEXT_LINES = 3;

  explicit DiffEngine(int _contextLines = DEFAULT_CONTEXT_LINES);

  Diff generate(const vector<string>& originalLines,
                const vector<string>& editedLines,
                const string& originalName = "original",
                const string& editedName = "edited") const;

  /**
   * @brief True when sending @p diff is strictly smaller than sending the
   * edited content in full.
   */
  static bool shouldSendDiff(const Diff& diff, int64_t editedByteLength);
  static bool shouldSendDiff(const string& serializedDiff,
                             int64_t editedByteLength);

  int getContextLines() const { return contextLines; }

 protected:
  enum OpType { EQUAL, DELETE, INSERT };

  struct EditOp {
    OpType type;
    // Index into the original (EQUAL, DELETE) and edited (EQUAL, INSERT) lines
    size_t originalIndex;
    size_t editedIndex;
  };

  vector<EditOp> editScript(const vector<string>& originalLines,
                            const vector<string>& editedLines) const;

  int contextLines;
};
}  // namespace sshed

#endif  // __SSHED_DIFF_ENGINE__
