#include "Patcher.hpp"

#include "LineUtils.hpp"

namespace sshed {
namespace {
bool startsWith(const string& s, const char* prefix) {
  return s.compare(0, strlen(prefix), prefix) == 0;
}

string stripNewline(const string& line) {
  if (hasLineTerminator(line)) {
    return line.substr(0, line.length() - 1);
  }
  return line;
}

// Parses digits at pos, advancing it.
bool parseNumber(const string& s, size_t* pos, int64_t* result) {
  size_t start = *pos;
  while (*pos < s.length() && isdigit((unsigned char)s[*pos])) {
    (*pos)++;
  }
  if (*pos == start || *pos - start > 18) {
    return false;
  }
  *result = stoll(s.substr(start, *pos - start));
  return true;
}

// Parses `start[,count]`, count defaulting to 1.
bool parseRange(const string& s, size_t* pos, int64_t* start,
                int64_t* count) {
  if (!parseNumber(s, pos, start)) {
    return false;
  }
  *count = 1;
  if (*pos < s.length() && s[*pos] == ',') {
    (*pos)++;
    return parseNumber(s, pos, count);
  }
  return true;
}
}  // namespace

Patcher::Patcher(const vector<string>& _originalLines,
                 const vector<string>& diffLines)
    : originalLines(_originalLines),
      hunks(parseHunks(diffLines)),
      cursor(1),
      applied(false) {}

void Patcher::parseHunkHeader(const string& rawLine, Hunk* hunk) {
  string line = stripNewline(rawLine);
  size_t pos = 0;
  if (!startsWith(line, "@@ -")) {
    throw MalformedDiffError("Invalid hunk header: " + line);
  }
  pos = 4;
  if (!parseRange(line, &pos, &hunk->originalStart, &hunk->originalCount)) {
    throw MalformedDiffError("Invalid original range in hunk header: " +
                             line);
  }
  if (line.compare(pos, 2, " +") != 0) {
    throw MalformedDiffError("Invalid hunk header: " + line);
  }
  pos += 2;
  if (!parseRange(line, &pos, &hunk->editedStart, &hunk->editedCount)) {
    throw MalformedDiffError("Invalid edited range in hunk header: " + line);
  }
  if (line.compare(pos, 3, " @@") != 0) {
    throw MalformedDiffError("Invalid hunk header: " + line);
  }
}

vector<Hunk> Patcher::parseHunks(const vector<string>& diffLines) {
  vector<Hunk> result;
  bool inHunk = false;
  // Lines the open hunk still expects from each side according to its header
  int64_t originalLeft = 0;
  int64_t editedLeft = 0;
  for (const string& line : diffLines) {
    if (startsWith(line, "@@")) {
      Hunk hunk;
      parseHunkHeader(line, &hunk);
      result.push_back(hunk);
      inHunk = true;
      originalLeft = hunk.originalCount;
      editedLeft = hunk.editedCount;
      continue;
    }
    bool hunkComplete = originalLeft <= 0 && editedLeft <= 0;
    if (!inHunk ||
        (hunkComplete && (startsWith(line, "---") || startsWith(line, "+++")))) {
      // File identifiers or preamble
      continue;
    }
    Hunk& hunk = result.back();
    if (line.empty()) {
      continue;
    }
    switch (line[0]) {
      case ' ':
        hunk.lines.push_back(HunkLine(HunkLine::CONTEXT, line.substr(1)));
        originalLeft--;
        editedLeft--;
        break;
      case '\n':
        // Some tools drop the space of empty context lines
        hunk.lines.push_back(HunkLine(HunkLine::CONTEXT, line));
        originalLeft--;
        editedLeft--;
        break;
      case '-':
        hunk.lines.push_back(HunkLine(HunkLine::REMOVED, line.substr(1)));
        originalLeft--;
        break;
      case '+':
        hunk.lines.push_back(HunkLine(HunkLine::ADDED, line.substr(1)));
        editedLeft--;
        break;
      case '\\':
        if (hunk.lines.empty()) {
          throw MalformedDiffError("No newline marker outside a hunk line");
        }
        hunk.lines.back().content = stripNewline(hunk.lines.back().content);
        break;
      default:
        throw MalformedDiffError("Invalid diff line: " + stripNewline(line));
    }
  }
  return result;
}

string Patcher::apply() {
  StringDataSink sink;
  apply(&sink);
  return sink.getData();
}

void Patcher::apply(DataSink* sink) {
  if (applied) {
    STFATAL << "Tried to apply a patch twice";
  }
  applied = true;

  const int64_t originalLength = originalLines.size();
  for (const auto& hunk : hunks) {
    // An empty original range names the line to insert after
    int64_t target =
        hunk.originalCount == 0 ? hunk.originalStart + 1 : hunk.originalStart;
    if (target < cursor) {
      throw MalformedDiffError("Hunk " + hunk.header() +
                               " overlaps the previous hunk");
    }
    if (target > originalLength + 1) {
      throw MalformedDiffError("Hunk " + hunk.header() +
                               " starts past the end of the file");
    }
    copyUntil(target, sink);
    for (const auto& line : hunk.lines) {
      switch (line.tag) {
        case HunkLine::CONTEXT:
          sink->write(expectOriginal(line.content, hunk));
          break;
        case HunkLine::REMOVED:
          expectOriginal(line.content, hunk);
          break;
        case HunkLine::ADDED:
          sink->write(line.content);
          break;
      }
    }
  }
  copyUntil(originalLength + 1, sink);
  VLOG(2) << "Applied " << hunks.size() << " hunks";
}

const string& Patcher::expectOriginal(const string& expected,
                                      const Hunk& hunk) {
  if (cursor > int64_t(originalLines.size())) {
    throw MalformedDiffError("Hunk " + hunk.header() +
                             " runs past the end of the file");
  }
  const string& actual = originalLines[cursor - 1];
  if (actual != expected) {
    throw MalformedDiffError("Line " + to_string(cursor) +
                             " does not match the diff: expected \"" +
                             stripNewline(expected) + "\" but found \"" +
                             stripNewline(actual) + "\"");
  }
  cursor++;
  return actual;
}

void Patcher::copyUntil(int64_t line, DataSink* sink) {
  while (cursor < line) {
    sink->write(originalLines[cursor - 1]);
    cursor++;
  }
}
}  // namespace sshed
