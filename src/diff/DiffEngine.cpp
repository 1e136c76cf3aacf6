#include "DiffEngine.hpp"

namespace sshed {
namespace {
// Searches that get this expensive settle for a good split instead of the
// best one.
const int MIN_SEARCH_COST = 256;

// Maps every distinct line to a small integer so comparisons are cheap.
void internLines(const vector<string>& originalLines,
                 const vector<string>& editedLines, vector<int>* originalIds,
                 vector<int>* editedIds) {
  unordered_map<string, int> ids;
  for (const auto& line : originalLines) {
    auto it = ids.insert(make_pair(line, int(ids.size()))).first;
    originalIds->push_back(it->second);
  }
  for (const auto& line : editedLines) {
    auto it = ids.insert(make_pair(line, int(ids.size()))).first;
    editedIds->push_back(it->second);
  }
}

/**
 * @brief Linear space Myers search.
 *
 * Each range is split at a point on a shortest edit path found by running
 * the search from both ends at once, and both halves are compared
 * separately. Only two diagonal vectors are kept, so memory stays
 * proportional to the input whatever the number of differences.
 */
class LineComparer {
 public:
  LineComparer(const vector<int>& _a, const vector<int>& _b)
      : a(_a),
        b(_b),
        offset(int(_b.size()) + 1),
        forward(_a.size() + _b.size() + 3),
        backward(_a.size() + _b.size() + 3),
        deleted(_a.size(), false),
        inserted(_b.size(), false) {
    maxCost = max(MIN_SEARCH_COST,
                  int(std::sqrt(double(a.size() + b.size() + 3))));
  }

  void compare(int aLow, int aHigh, int bLow, int bHigh) {
    while (true) {
      while (aLow < aHigh && bLow < bHigh && a[aLow] == b[bLow]) {
        aLow++;
        bLow++;
      }
      while (aLow < aHigh && bLow < bHigh && a[aHigh - 1] == b[bHigh - 1]) {
        aHigh--;
        bHigh--;
      }
      if (aLow == aHigh || bLow == bHigh) {
        markChanged(aLow, aHigh, bLow, bHigh);
        return;
      }
      int x, y;
      split(aLow, aHigh, bLow, bHigh, &x, &y);
      if (x < aLow || x > aHigh || y < bLow || y > bHigh ||
          (x == aLow && y == bLow) || (x == aHigh && y == bHigh)) {
        // No progress possible, treat the whole range as replaced
        markChanged(aLow, aHigh, bLow, bHigh);
        return;
      }
      compare(aLow, x, bLow, y);
      aLow = x;
      bLow = y;
    }
  }

  const vector<bool>& getDeleted() const { return deleted; }
  const vector<bool>& getInserted() const { return inserted; }

 protected:
  int& fwd(int k) { return forward[offset + k]; }
  int& bwd(int k) { return backward[offset + k]; }

  void markChanged(int aLow, int aHigh, int bLow, int bHigh) {
    for (int i = aLow; i < aHigh; i++) {
      deleted[i] = true;
    }
    for (int j = bLow; j < bHigh; j++) {
      inserted[j] = true;
    }
  }

  // Diagonals are numbered k = x - y in absolute coordinates.
  void split(int aLow, int aHigh, int bLow, int bHigh, int* splitX,
             int* splitY) {
    const int minK = aLow - bHigh;
    const int maxK = aHigh - bLow;
    const int forwardMid = aLow - bLow;
    const int backwardMid = aHigh - bHigh;
    const bool odd = ((forwardMid - backwardMid) & 1) != 0;
    const int unreachable = int(a.size() + b.size()) + 1;

    int forwardMin = forwardMid, forwardMax = forwardMid;
    int backwardMin = backwardMid, backwardMax = backwardMid;
    fwd(forwardMid) = aLow;
    bwd(backwardMid) = aHigh;

    for (int cost = 1;; cost++) {
      if (forwardMin > minK) {
        fwd(--forwardMin - 1) = -1;
      } else {
        ++forwardMin;
      }
      if (forwardMax < maxK) {
        fwd(++forwardMax + 1) = -1;
      } else {
        --forwardMax;
      }
      for (int k = forwardMax; k >= forwardMin; k -= 2) {
        int x = fwd(k - 1) >= fwd(k + 1) ? fwd(k - 1) + 1 : fwd(k + 1);
        int y = x - k;
        while (x < aHigh && y < bHigh && a[x] == b[y]) {
          x++;
          y++;
        }
        fwd(k) = x;
        if (odd && backwardMin <= k && k <= backwardMax && bwd(k) <= x) {
          *splitX = x;
          *splitY = y;
          return;
        }
      }

      if (backwardMin > minK) {
        bwd(--backwardMin - 1) = unreachable;
      } else {
        ++backwardMin;
      }
      if (backwardMax < maxK) {
        bwd(++backwardMax + 1) = unreachable;
      } else {
        --backwardMax;
      }
      for (int k = backwardMax; k >= backwardMin; k -= 2) {
        int x = bwd(k - 1) < bwd(k + 1) ? bwd(k - 1) : bwd(k + 1) - 1;
        int y = x - k;
        while (x > aLow && y > bLow && a[x - 1] == b[y - 1]) {
          x--;
          y--;
        }
        bwd(k) = x;
        if (!odd && forwardMin <= k && k <= forwardMax && x <= fwd(k)) {
          *splitX = x;
          *splitY = y;
          return;
        }
      }

      if (cost >= maxCost) {
        splitAtFurthest(aLow, aHigh, bLow, bHigh, forwardMin, forwardMax,
                        backwardMin, backwardMax, splitX, splitY);
        return;
      }
    }
  }

  // Picks whichever search direction covered more of the range.
  void splitAtFurthest(int aLow, int aHigh, int bLow, int bHigh,
                       int forwardMin, int forwardMax, int backwardMin,
                       int backwardMax, int* splitX, int* splitY) {
    int forwardBest = -1, forwardBestX = aLow;
    for (int k = forwardMax; k >= forwardMin; k -= 2) {
      int x = min(fwd(k), aHigh);
      int y = x - k;
      if (y > bHigh) {
        x = bHigh + k;
        y = bHigh;
      }
      if (forwardBest < x + y) {
        forwardBest = x + y;
        forwardBestX = x;
      }
    }
    int backwardBest = aHigh + bHigh + 1, backwardBestX = aHigh;
    for (int k = backwardMax; k >= backwardMin; k -= 2) {
      int x = max(aLow, bwd(k));
      int y = x - k;
      if (y < bLow) {
        x = bLow + k;
        y = bLow;
      }
      if (x + y < backwardBest) {
        backwardBest = x + y;
        backwardBestX = x;
      }
    }
    if ((aHigh + bHigh) - backwardBest < forwardBest - (aLow + bLow)) {
      *splitX = forwardBestX;
      *splitY = forwardBest - forwardBestX;
    } else {
      *splitX = backwardBestX;
      *splitY = backwardBest - backwardBestX;
    }
  }

  const vector<int>& a;
  const vector<int>& b;
  const int offset;
  vector<int> forward;
  vector<int> backward;
  vector<bool> deleted;
  vector<bool> inserted;
  int maxCost;
};
}  // namespace

DiffEngine::DiffEngine(int _contextLines) : contextLines(_contextLines) {
  if (contextLines < 0) {
    STFATAL << "Invalid number of context lines: " << contextLines;
  }
}

vector<DiffEngine::EditOp> DiffEngine::editScript(
    const vector<string>& originalLines,
    const vector<string>& editedLines) const {
  vector<int> a, b;
  internLines(originalLines, editedLines, &a, &b);

  LineComparer comparer(a, b);
  comparer.compare(0, int(a.size()), 0, int(b.size()));
  const vector<bool>& deleted = comparer.getDeleted();
  const vector<bool>& inserted = comparer.getInserted();

  // Within a change, removals come before additions
  vector<EditOp> ops;
  ops.reserve(a.size() + b.size());
  size_t i = 0, j = 0;
  while (i < a.size() || j < b.size()) {
    if (i < a.size() && deleted[i]) {
      ops.push_back({DELETE, i++, j});
    } else if (j < b.size() && inserted[j]) {
      ops.push_back({INSERT, i, j++});
    } else {
      if (i >= a.size() || j >= b.size()) {
        STFATAL << "Edit script ran past the end of the input";
      }
      ops.push_back({EQUAL, i++, j++});
    }
  }
  return ops;
}

Diff DiffEngine::generate(const vector<string>& originalLines,
                          const vector<string>& editedLines,
                          const string& originalName,
                          const string& editedName) const {
  Diff diff;
  diff.originalName = originalName;
  diff.editedName = editedName;

  vector<EditOp> ops = editScript(originalLines, editedLines);
  const size_t context = contextLines;
  size_t i = 0;
  while (i < ops.size()) {
    if (ops[i].type == EQUAL) {
      i++;
      continue;
    }
    // ops[i] is the first change of a new hunk
    size_t begin = i >= context ? i - context : 0;
    size_t end = i;
    while (true) {
      while (end < ops.size() && ops[end].type != EQUAL) {
        end++;
      }
      size_t equalRun = 0;
      while (end + equalRun < ops.size() && ops[end + equalRun].type == EQUAL) {
        equalRun++;
      }
      if (end + equalRun < ops.size() && equalRun <= 2 * context) {
        // The next change is close enough to share this hunk
        end += equalRun;
        continue;
      }
      end += min(equalRun, context);
      break;
    }

    Hunk hunk;
    // Where each side starts, counting lines before the hunk
    size_t originalFirst = 0;
    size_t editedFirst = 0;
    for (size_t j = 0; j < begin; j++) {
      if (ops[j].type != INSERT) originalFirst++;
      if (ops[j].type != DELETE) editedFirst++;
    }
    for (size_t j = begin; j < end; j++) {
      const EditOp& op = ops[j];
      switch (op.type) {
        case EQUAL:
          hunk.lines.push_back(
              HunkLine(HunkLine::CONTEXT, originalLines[op.originalIndex]));
          hunk.originalCount++;
          hunk.editedCount++;
          break;
        case DELETE:
          hunk.lines.push_back(
              HunkLine(HunkLine::REMOVED, originalLines[op.originalIndex]));
          hunk.originalCount++;
          break;
        case INSERT:
          hunk.lines.push_back(
              HunkLine(HunkLine::ADDED, editedLines[op.editedIndex]));
          hunk.editedCount++;
          break;
      }
    }
    hunk.originalStart =
        hunk.originalCount == 0 ? originalFirst : originalFirst + 1;
    hunk.editedStart = hunk.editedCount == 0 ? editedFirst : editedFirst + 1;
    diff.hunks.push_back(hunk);
    i = end;
  }
  VLOG(2) << "Generated " << diff.hunks.size() << " hunks from "
          << ops.size() << " edit operations";
  return diff;
}

bool DiffEngine::shouldSendDiff(const Diff& diff, int64_t editedByteLength) {
  return shouldSendDiff(diff.serialize(), editedByteLength);
}

bool DiffEngine::shouldSendDiff(const string& serializedDiff,
                                int64_t editedByteLength) {
  return int64_t(serializedDiff.length()) < editedByteLength;
}
}  // namespace sshed
