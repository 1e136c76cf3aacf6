#include "DiffEngine.hpp"

#include "LineUtils.hpp"
#include "Patcher.hpp"
#include "TestHeaders.hpp"

using namespace sshed;

namespace {
string applyDiff(const string& original, const Diff& diff) {
  Patcher patcher(splitLines(original), splitLines(diff.serialize()));
  return patcher.apply();
}

string numberedLines(int first, int last) {
  string s;
  for (int i = first; i <= last; i++) {
    s += to_string(i) + "\n";
  }
  return s;
}
}  // namespace

TEST_CASE("Line splitting keeps terminators", "[DiffEngine]") {
  REQUIRE(splitLines("") == vector<string>());
  REQUIRE(splitLines("a\nb\n") == vector<string>({"a\n", "b\n"}));
  REQUIRE(splitLines("a\n\nb") == vector<string>({"a\n", "\n", "b"}));
  REQUIRE(joinLines(splitLines("x\ny")) == "x\ny");
}

TEST_CASE("A single changed line", "[DiffEngine]") {
  vector<string> original = {"A\n", "B\n", "C\n"};
  vector<string> edited = {"A\n", "X\n", "C\n"};

  SECTION("Without context the hunk starts at the change") {
    Diff diff = DiffEngine(0).generate(original, edited);
    REQUIRE(diff.hunks.size() == 1);
    const Hunk& hunk = diff.hunks[0];
    REQUIRE(hunk.originalStart == 2);
    REQUIRE(hunk.editedStart == 2);
    REQUIRE(hunk.lines == vector<HunkLine>({HunkLine(HunkLine::REMOVED, "B\n"),
                                            HunkLine(HunkLine::ADDED, "X\n")}));
    REQUIRE(diff.serialize() ==
            "--- original\n+++ edited\n@@ -2 +2 @@\n-B\n+X\n");
  }

  SECTION("Default context") {
    Diff diff = DiffEngine().generate(original, edited, "a.txt", "a.txt");
    REQUIRE(diff.serialize() ==
            "--- a.txt\n+++ a.txt\n@@ -1,3 +1,3 @@\n A\n-B\n+X\n C\n");
  }

  Diff diff = DiffEngine().generate(original, edited);
  REQUIRE(applyDiff(joinLines(original), diff) == joinLines(edited));
}

TEST_CASE("Identical content has no hunks", "[DiffEngine]") {
  Diff diff = DiffEngine().generate(splitLines("same\nlines\n"),
                                    splitLines("same\nlines\n"));
  REQUIRE(diff.empty());
  REQUIRE(diff.serialize() == "");
}

TEST_CASE("Nearby changes share a hunk", "[DiffEngine]") {
  string original = numberedLines(1, 30);

  SECTION("Gap of six unchanged lines") {
    string edited = original;
    edited.replace(edited.find("5\n"), 2, "five\n");
    edited.replace(edited.find("12\n"), 3, "twelve\n");
    Diff diff = DiffEngine().generate(splitLines(original), splitLines(edited));
    REQUIRE(diff.hunks.size() == 1);
    REQUIRE(diff.hunks[0].header() == "@@ -2,14 +2,14 @@");
    REQUIRE(applyDiff(original, diff) == edited);
  }

  SECTION("Gap of seven unchanged lines") {
    string edited = original;
    edited.replace(edited.find("5\n"), 2, "five\n");
    edited.replace(edited.find("13\n"), 3, "thirteen\n");
    Diff diff = DiffEngine().generate(splitLines(original), splitLines(edited));
    REQUIRE(diff.hunks.size() == 2);
    REQUIRE(diff.hunks[0].header() == "@@ -2,7 +2,7 @@");
    REQUIRE(diff.hunks[1].header() == "@@ -10,7 +10,7 @@");
    REQUIRE(applyDiff(original, diff) == edited);
  }
}

TEST_CASE("Empty ranges name the preceding line", "[DiffEngine]") {
  SECTION("Insert at the top") {
    Diff diff = DiffEngine(0).generate(splitLines("b\n"), splitLines("a\nb\n"));
    REQUIRE(diff.hunks[0].header() == "@@ -0,0 +1 @@");
    REQUIRE(applyDiff("b\n", diff) == "a\nb\n");
  }

  SECTION("Delete everything") {
    Diff diff = DiffEngine().generate(splitLines("a\nb\n"), splitLines(""));
    REQUIRE(diff.hunks[0].header() == "@@ -1,2 +0,0 @@");
    REQUIRE(applyDiff("a\nb\n", diff) == "");
  }

  SECTION("Insert in the middle") {
    Diff diff =
        DiffEngine(0).generate(splitLines("a\nc\n"), splitLines("a\nb\nc\n"));
    REQUIRE(diff.hunks[0].header() == "@@ -1,0 +2 @@");
    REQUIRE(applyDiff("a\nc\n", diff) == "a\nb\nc\n");
  }
}

TEST_CASE("Missing final newline is marked", "[DiffEngine]") {
  Diff diff = DiffEngine().generate(splitLines("a\nb"), splitLines("a\nb\n"));
  REQUIRE(diff.serialize() ==
          "--- original\n+++ edited\n@@ -1,2 +1,2 @@\n a\n-b\n"
          "\\ No newline at end of file\n+b\n");
  REQUIRE(applyDiff("a\nb", diff) == "a\nb\n");

  Diff reverse = DiffEngine().generate(splitLines("a\nb\n"), splitLines("a\nb"));
  REQUIRE(applyDiff("a\nb\n", reverse) == "a\nb");
}

TEST_CASE("Removed lines that look like file headers survive",
          "[DiffEngine]") {
  string original = "keep\n-- comment\n++ other\nend\n";
  string edited = "keep\nend\n";
  Diff diff = DiffEngine().generate(splitLines(original), splitLines(edited));
  REQUIRE(diff.serialize().find("\n--- comment\n") != string::npos);
  REQUIRE(applyDiff(original, diff) == edited);
}

TEST_CASE("Diffs of unrelated content round trip", "[DiffEngine]") {
  string original =
      "int main() {\n  return 0;\n}\n\nvoid f() {}\n\nvoid g() {}\n";
  string edited =
      "#include <stdio.h>\n\nint main() {\n  printf(\"hi\");\n  return 1;\n"
      "}\n\nvoid g() {}\nvoid h() {}\n";
  for (int context = 0; context <= 4; context++) {
    Diff diff =
        DiffEngine(context).generate(splitLines(original), splitLines(edited));
    REQUIRE(applyDiff(original, diff) == edited);
  }
}

TEST_CASE("Whole file rewrites stay cheap", "[DiffEngine]") {
  string original;
  string edited;
  for (int i = 0; i < 20000; i++) {
    original += "line number " + to_string(i) + "\n";
    edited += "line number " + to_string(i) + "\r\n";
  }

  SECTION("Every line changed") {
    Diff diff = DiffEngine().generate(splitLines(original), splitLines(edited));
    REQUIRE(!diff.empty());
    REQUIRE(applyDiff(original, diff) == edited);
    REQUIRE(!DiffEngine::shouldSendDiff(diff, edited.length()));
  }

  SECTION("Every other line changed") {
    vector<string> originalLines = splitLines(original);
    vector<string> editedLines = originalLines;
    for (size_t i = 0; i < editedLines.size(); i += 2) {
      editedLines[i] = "rewritten " + to_string(i) + "\n";
    }
    Diff diff = DiffEngine().generate(originalLines, editedLines);
    REQUIRE(applyDiff(original, diff) == joinLines(editedLines));
  }

  SECTION("Unrelated content on both sides") {
    vector<string> replacement;
    for (int i = 0; i < 15000; i++) {
      replacement.push_back("other " + to_string(i) + "\n");
    }
    Diff diff = DiffEngine().generate(splitLines(original), replacement);
    REQUIRE(diff.hunks.size() == 1);
    REQUIRE(diff.hunks[0].header() == "@@ -1,20000 +1,15000 @@");
    REQUIRE(applyDiff(original, diff) == joinLines(replacement));
  }
}

TEST_CASE("Diffs are only sent when strictly smaller", "[DiffEngine]") {
  REQUIRE(DiffEngine::shouldSendDiff("0123456789", 11));
  REQUIRE(!DiffEngine::shouldSendDiff("0123456789", 10));
  REQUIRE(!DiffEngine::shouldSendDiff("0123456789", 9));

  SECTION("Small edit to a large file") {
    string original = numberedLines(1, 500);
    string edited = original;
    edited.replace(edited.find("250\n"), 4, "changed\n");
    Diff diff = DiffEngine().generate(splitLines(original), splitLines(edited));
    REQUIRE(DiffEngine::shouldSendDiff(diff, edited.length()));
  }

  SECTION("Rewrite of a small file") {
    Diff diff = DiffEngine().generate(splitLines("a\n"), splitLines("b\n"));
    REQUIRE(!DiffEngine::shouldSendDiff(diff, 2));
  }
}
