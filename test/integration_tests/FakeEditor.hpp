#ifndef __SSHED_FAKE_EDITOR__
#define __SSHED_FAKE_EDITOR__

#include "SubprocessUtils.hpp"
#include "TempFile.hpp"
#include "TestHeaders.hpp"

namespace sshed {
/**
 * @brief Stands in for the user's editor: rewrites the file it is given with
 * a function of its contents.
 */
class FakeEditor : public SubprocessUtils {
 public:
  typedef std::function<string(const string&)> EditFunction;

  explicit FakeEditor(EditFunction _edit, int _exitStatus = 0)
      : edit(_edit), exitStatus(_exitStatus), invocations(0) {}

  virtual int runAndWait(const vector<string>& argv) {
    lock_guard<mutex> guard(editorMutex);
    invocations++;
    lastArgv = argv;
    if (exitStatus < 0) {
      return exitStatus;
    }
    const string& path = argv.back();
    auto contents = readFileContents(path);
    REQUIRE(contents);
    // Like most editors, save by replacing the file
    string replacement = path + ".swp";
    writeFileContents(replacement, edit(*contents));
    REQUIRE(::rename(replacement.c_str(), path.c_str()) == 0);
    return exitStatus;
  }

  virtual optional<string> findExecutable(const string& name) {
    return "/usr/bin/" + name;
  }

  int getInvocations() {
    lock_guard<mutex> guard(editorMutex);
    return invocations;
  }

  vector<string> getLastArgv() {
    lock_guard<mutex> guard(editorMutex);
    return lastArgv;
  }

 protected:
  EditFunction edit;
  int exitStatus;
  int invocations;
  vector<string> lastArgv;
  mutex editorMutex;
};
}  // namespace sshed

#endif  // __SSHED_FAKE_EDITOR__
