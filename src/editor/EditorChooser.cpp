#include "EditorChooser.hpp"

namespace sshed {
namespace {
const vector<string> EDITOR_VARIABLES = {"EDITOR", "VISUAL", "SUDO_EDITOR"};
const vector<string> FALLBACK_EDITORS = {"sensible-editor", "xdg-open", "nano",
                                         "ed"};
const vector<string> GRAPHICAL_VARIABLES = {
    "DISPLAY",          // X11
    "WAYLAND_DISPLAY",  // Wayland
    "TERM_PROGRAM",     // macOS
};

string getEnvironment(const string& name) {
  const char* value = ::getenv(name.c_str());
  return value == NULL ? "" : string(value);
}
}  // namespace

vector<string> EditorChooser::chooseEditor(const string& explicitCommand) {
  string editor = explicitCommand;
  if (editor.empty()) {
    for (const auto& variable : EDITOR_VARIABLES) {
      editor = getEnvironment(variable);
      if (!editor.empty()) {
        VLOG(1) << "Editor from " << variable << ": " << editor;
        break;
      }
    }
    if (editor.find("sshed") != string::npos) {
      VLOG(1) << "Ignoring editor that runs sshed: " << editor;
      editor.clear();
    }
  }
  if (editor.empty()) {
    for (const auto& candidate : FALLBACK_EDITORS) {
      auto path = subprocessUtils->findExecutable(candidate);
      if (path) {
        editor = *path;
        break;
      }
    }
  }
  vector<string> argv = splitWhitespace(editor);
  if (argv.empty()) {
    throw runtime_error("Could not find an editor, please set EDITOR");
  }
  VLOG(1) << "Chosen editor: " << editor;
  return argv;
}

bool EditorChooser::isGraphicalSession() {
  for (const auto& variable : GRAPHICAL_VARIABLES) {
    if (!getEnvironment(variable).empty()) {
      return true;
    }
  }
  return false;
}
}  // namespace sshed
