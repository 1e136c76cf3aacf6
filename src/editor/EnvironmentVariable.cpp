#include "EnvironmentVariable.hpp"

namespace sshed {
namespace {
const map<string, string> SHELL_FORMATS = {
    {"bash", "export {name}={contents}"},
    {"csh", "setenv {name} {contents}"},
    {"fish", "setenv {name} {contents}"},
};

void replaceAll(string* s, const string& from, const string& to) {
  size_t pos = 0;
  while ((pos = s->find(from, pos)) != string::npos) {
    s->replace(pos, from.length(), to);
    pos += to.length();
  }
}
}  // namespace

string EnvironmentVariable::generate(const string& shell, bool smart) const {
  string knownShell = shell;
  if (SHELL_FORMATS.find(knownShell) == SHELL_FORMATS.end()) {
    if (!smart) {
      throw runtime_error("Unknown shell: " + shell);
    }
    knownShell = endsWith(shell, "csh") ? "csh" : "bash";
    VLOG(1) << "Treating shell " << shell << " as " << knownShell;
  }
  string command = SHELL_FORMATS.at(knownShell);
  // contents first so a value containing "{name}" is left alone
  replaceAll(&command, "{contents}", contents);
  size_t namePos = command.find("{name}");
  command.replace(namePos, string("{name}").length(), name);
  return command;
}

string EnvironmentVariable::defaultShell() {
  const char* shellEnv = ::getenv("SHELL");
  if (shellEnv == NULL || shellEnv[0] == '\0') {
    return "bash";
  }
  string shell = fs::path(shellEnv).filename().string();
  return shell.empty() ? "bash" : shell;
}
}  // namespace sshed
