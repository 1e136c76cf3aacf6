#include "Patcher.hpp"

#include "LineUtils.hpp"
#include "TestHeaders.hpp"

using namespace sshed;

namespace {
const vector<string> FIRST_DIFF = {
    "--- tmp    2015-05-29 16:46:52.722077075 -0400\n",
    "+++ tmp2    2015-06-05 20:28:39.700598812 -0400\n",
    "@@ -1,5 +1,2 @@\n",
    " First line\n",
    "-Second line\n",
    "-third line\n",
    "-fourth line\n",
    "-fifth lyne\n",
    "+Fifth line.\n",
    "@@ -18,4 +15,9 @@\n",
    " Shared data here.\n",
    "-A removed line.\n",
    "+Added line\n",
    " Shared line\n",
    " Mystery line\n",
    "+Fifth line\n",
    "+6\n",
    "+7\n",
    "+8\n",
    "+9\n",
};

const string ORIGINAL = "Line one\n2\nTHREE!\nFour?\n";

string patch(const string& original, const vector<string>& diff) {
  Patcher patcher(splitLines(original), diff);
  return patcher.apply();
}
}  // namespace

TEST_CASE("Hunk headers are parsed", "[Patcher]") {
  Hunk hunk;
  Patcher::parseHunkHeader("@@ -18,4 +15,9 @@\n", &hunk);
  REQUIRE(hunk.originalStart == 18);
  REQUIRE(hunk.originalCount == 4);
  REQUIRE(hunk.editedStart == 15);
  REQUIRE(hunk.editedCount == 9);

  Patcher::parseHunkHeader("@@ -3 +4 @@ int main()", &hunk);
  REQUIRE(hunk.originalStart == 3);
  REQUIRE(hunk.originalCount == 1);
  REQUIRE(hunk.editedStart == 4);
  REQUIRE(hunk.editedCount == 1);

  REQUIRE_THROWS_AS(Patcher::parseHunkHeader("@@ -a,1 +1 @@", &hunk),
                    MalformedDiffError);
  REQUIRE_THROWS_AS(Patcher::parseHunkHeader("@@ -1,1 1 @@", &hunk),
                    MalformedDiffError);
  REQUIRE_THROWS_AS(Patcher::parseHunkHeader("@@ -1,1 +1", &hunk),
                    MalformedDiffError);
}

TEST_CASE("Diff text is split into hunks", "[Patcher]") {
  vector<Hunk> hunks = Patcher::parseHunks(FIRST_DIFF);
  REQUIRE(hunks.size() == 2);

  REQUIRE(hunks[0].header() == "@@ -1,5 +1,2 @@");
  REQUIRE(hunks[0].lines.size() == 6);
  REQUIRE(hunks[0].lines[0] == HunkLine(HunkLine::CONTEXT, "First line\n"));
  REQUIRE(hunks[0].lines[4] == HunkLine(HunkLine::REMOVED, "fifth lyne\n"));
  REQUIRE(hunks[0].lines[5] == HunkLine(HunkLine::ADDED, "Fifth line.\n"));

  REQUIRE(hunks[1].header() == "@@ -18,4 +15,9 @@");
  REQUIRE(hunks[1].lines.size() == 10);
  REQUIRE(hunks[1].lines[9] == HunkLine(HunkLine::ADDED, "9\n"));

  SECTION("Unknown line prefixes are rejected") {
    vector<string> diff = {"@@ -1 +1 @@\n", "*Line one\n"};
    REQUIRE_THROWS_AS(Patcher::parseHunks(diff), MalformedDiffError);
  }

  SECTION("Empty context lines without their space") {
    vector<string> diff = {"@@ -1,2 +1,2 @@\n", "\n", "-x\n", "+y\n"};
    vector<Hunk> parsed = Patcher::parseHunks(diff);
    REQUIRE(parsed[0].lines[0] == HunkLine(HunkLine::CONTEXT, "\n"));
  }
}

TEST_CASE("Patches are applied", "[Patcher]") {
  SECTION("Changed line") {
    REQUIRE(patch(ORIGINAL, {"--- a\n", "+++ b\n", "@@ -1,3 +1,4 @@\n",
                             " Line one\n", " 2\n", " THREE!\n", "+3.5\n"}) ==
            "Line one\n2\nTHREE!\n3.5\nFour?\n");
  }

  SECTION("Hunk in the middle") {
    REQUIRE(patch(ORIGINAL, {"@@ -2,2 +2,2 @@\n", " 2\n", "-THREE!\n",
                             "+3\n"}) == "Line one\n2\n3\nFour?\n");
  }

  SECTION("Insert at the top") {
    REQUIRE(patch(ORIGINAL, {"@@ -0,0 +1 @@\n", "+Line zero\n"}) ==
            "Line zero\n" + ORIGINAL);
  }

  SECTION("Append at the end") {
    REQUIRE(patch(ORIGINAL, {"@@ -4,0 +5 @@\n", "+Five\n"}) ==
            ORIGINAL + "Five\n");
  }

  SECTION("Into an empty file") {
    REQUIRE(patch("", {"@@ -0,0 +1,2 @@\n", "+a\n", "+b\n"}) == "a\nb\n");
  }

  SECTION("Missing newline at the end") {
    REQUIRE(patch(ORIGINAL, {"@@ -4 +4 @@\n", "-Four?\n", "+4\n",
                             "\\ No newline at end of file\n"}) ==
            "Line one\n2\nTHREE!\n4");
  }

  SECTION("Removed lines starting with dashes") {
    REQUIRE(patch("a\n-- b\nc\n",
                  {"--- x\n", "+++ y\n", "@@ -1,3 +1,2 @@\n", " a\n",
                   "--- b\n", " c\n"}) == "a\nc\n");
  }

  SECTION("Empty diff leaves the content alone") {
    REQUIRE(patch(ORIGINAL, {}) == ORIGINAL);
  }

  SECTION("Streaming into a sink") {
    Patcher patcher(splitLines(ORIGINAL), {"@@ -1 +1 @@\n", "-Line one\n",
                                           "+1\n"});
    StringDataSink sink;
    patcher.apply(&sink);
    REQUIRE(sink.getData() == "1\n2\nTHREE!\nFour?\n");
  }
}

TEST_CASE("Malformed patches are rejected", "[Patcher]") {
  SECTION("Removed line does not match") {
    REQUIRE_THROWS_AS(
        patch(ORIGINAL, {"--- tmp\n", "+++ tmp2\n", "@@ -1,3 +1,4 @@\n",
                         "-First line\n", "+Line one\n", " 2\n", " THREE!\n",
                         "+3.5\n"}),
        MalformedDiffError);
  }

  SECTION("Context line does not match") {
    REQUIRE_THROWS_AS(
        patch(ORIGINAL, {"--- tmp\n", "+++ tmp2\n", "@@ -1,3 +1,4 @@\n",
                         " Line one\n", " 2\n", " THREE?\n", "+3.5\n"}),
        MalformedDiffError);
  }

  SECTION("Hunk past the end of the file") {
    REQUIRE_THROWS_AS(patch(ORIGINAL, {"@@ -9 +9 @@\n", "-x\n", "+y\n"}),
                      MalformedDiffError);
  }

  SECTION("Hunk running past the end of the file") {
    REQUIRE_THROWS_AS(patch(ORIGINAL, {"@@ -4,2 +4,2 @@\n", " Four?\n",
                                       " Five\n"}),
                      MalformedDiffError);
  }

  SECTION("Hunks out of order") {
    REQUIRE_THROWS_AS(
        patch(ORIGINAL, {"@@ -3 +3 @@\n", "-THREE!\n", "+3\n", "@@ -1 +1 @@\n",
                         "-Line one\n", "+1\n"}),
        MalformedDiffError);
  }
}
