#ifndef __SSHED_PATCHER__
#define __SSHED_PATCHER__

#include "DataStream.hpp"
#include "Diff.hpp"
#include "Errors.hpp"

namespace sshed {
/**
 * @brief Applies a unified diff to the content it was computed against.
 *
 * Every context and removed line is checked against the original; any
 * mismatch aborts with MalformedDiffError rather than patching on a best
 * effort basis. A Patcher applies once.
 */
class Patcher {
 public:
  /**
   * @param _originalLines Content being patched, as produced by splitLines().
   * @param diffLines Diff text split into lines.
   * @throws MalformedDiffError if the diff cannot be parsed.
   */
  Patcher(const vector<string>& _originalLines, const vector<string>& diffLines);

  /**
   * @brief Groups diff lines into hunks. File identifier lines (`---`,
   * `+++`) and anything before the first `@@` line are skipped.
   * @throws MalformedDiffError on a bad hunk header or line prefix.
   */
  static vector<Hunk> parseHunks(const vector<string>& diffLines);

  /**
   * @brief Parses `@@ -a[,b] +c[,d] @@` into the range fields of @p hunk.
   */
  static void parseHunkHeader(const string& line, Hunk* hunk);

  /**
   * @brief Returns the patched content.
   * @throws MalformedDiffError when the diff does not match the original.
   */
  string apply();

  /**
   * @brief Writes the patched content to @p sink as it is produced. On error
   * the sink holds a partial result that must be discarded.
   */
  void apply(DataSink* sink);

  const vector<Hunk>& getHunks() const { return hunks; }

 protected:
  /** @brief Reads the original line under the cursor and checks it. */
  const string& expectOriginal(const string& expected, const Hunk& hunk);
  void copyUntil(int64_t line, DataSink* sink);

  vector<string> originalLines;
  vector<Hunk> hunks;
  // 1-based number of the next original line to read
  int64_t cursor;
  bool applied;
};
}  // namespace sshed

#endif  // __SSHED_PATCHER__
