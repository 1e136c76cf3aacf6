#include "EditorChooser.hpp"

#include "TestHeaders.hpp"

using namespace sshed;

namespace {
class FakeExecutableFinder : public SubprocessUtils {
 public:
  explicit FakeExecutableFinder(const set<string>& _installed)
      : installed(_installed) {}

  virtual int runAndWait(const vector<string>& argv) { return 0; }

  virtual optional<string> findExecutable(const string& name) {
    if (installed.find(name) == installed.end()) {
      return nullopt;
    }
    return "/usr/bin/" + name;
  }

 protected:
  set<string> installed;
};

// Clears the editor variables for the lifetime of the object
class ScopedEditorEnvironment {
 public:
  ScopedEditorEnvironment() {
    for (const char* name : {"EDITOR", "VISUAL", "SUDO_EDITOR"}) {
      const char* value = ::getenv(name);
      if (value) {
        saved[name] = value;
      }
      ::unsetenv(name);
    }
  }

  ~ScopedEditorEnvironment() {
    for (const char* name : {"EDITOR", "VISUAL", "SUDO_EDITOR"}) {
      ::unsetenv(name);
    }
    for (const auto& it : saved) {
      ::setenv(it.first.c_str(), it.second.c_str(), 1);
    }
  }

 private:
  map<string, string> saved;
};
}  // namespace

TEST_CASE("Editor selection order", "[EditorChooser]") {
  ScopedEditorEnvironment environment;
  shared_ptr<SubprocessUtils> finder(
      new FakeExecutableFinder({"nano", "ed"}));
  EditorChooser chooser(finder);

  SECTION("Explicit command wins") {
    ::setenv("EDITOR", "vim", 1);
    REQUIRE(chooser.chooseEditor("code --wait") ==
            vector<string>({"code", "--wait"}));
  }

  SECTION("EDITOR before VISUAL") {
    ::setenv("VISUAL", "emacs", 1);
    ::setenv("EDITOR", "vim -n", 1);
    REQUIRE(chooser.chooseEditor() == vector<string>({"vim", "-n"}));
  }

  SECTION("VISUAL before SUDO_EDITOR") {
    ::setenv("SUDO_EDITOR", "vi", 1);
    ::setenv("VISUAL", "emacs", 1);
    REQUIRE(chooser.chooseEditor() == vector<string>({"emacs"}));
  }

  SECTION("An editor that runs sshed itself is skipped") {
    ::setenv("EDITOR", "/usr/bin/sshed", 1);
    REQUIRE(chooser.chooseEditor() == vector<string>({"/usr/bin/nano"}));
  }

  SECTION("Fallback editors are searched on PATH") {
    REQUIRE(chooser.chooseEditor() == vector<string>({"/usr/bin/nano"}));
  }
}

TEST_CASE("No editor at all", "[EditorChooser]") {
  ScopedEditorEnvironment environment;
  shared_ptr<SubprocessUtils> finder(new FakeExecutableFinder(set<string>()));
  EditorChooser chooser(finder);
  REQUIRE_THROWS_AS(chooser.chooseEditor(), std::runtime_error);
}

TEST_CASE("Executables are found on PATH", "[EditorChooser]") {
  SubprocessUtils subprocessUtils;
  auto sh = subprocessUtils.findExecutable("sh");
  REQUIRE(sh);
  REQUIRE(::access(sh->c_str(), X_OK) == 0);
  REQUIRE(!subprocessUtils.findExecutable("sshed-no-such-editor-xyz"));

  REQUIRE(subprocessUtils.runAndWait({"sh", "-c", "exit 3"}) == 3);
  REQUIRE(subprocessUtils.runAndWait({"true"}) == 0);
  REQUIRE(subprocessUtils.runAndWait({"sshed-no-such-editor-xyz"}) == -1);
}
