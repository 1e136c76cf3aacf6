#ifndef __SSHED_EDITOR_CHOOSER__
#define __SSHED_EDITOR_CHOOSER__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace sshed {
/**
 * @brief Picks the editor command from the environment.
 */
class EditorChooser {
 public:
  explicit EditorChooser(shared_ptr<SubprocessUtils> _subprocessUtils)
      : subprocessUtils(_subprocessUtils) {}

  /**
   * @brief Returns the editor argv, without the file to edit.
   *
   * An explicit command wins. Otherwise EDITOR, VISUAL and SUDO_EDITOR are
   * tried in order; when none is set, or the one found would run sshed
   * itself, the first of sensible-editor, xdg-open, nano and ed on PATH is
   * used.
   * @throws std::runtime_error when nothing usable is found.
   */
  vector<string> chooseEditor(const string& explicitCommand = "");

  /**
   * @brief True when DISPLAY, WAYLAND_DISPLAY or TERM_PROGRAM is set.
   */
  static bool isGraphicalSession();

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
};
}  // namespace sshed

#endif  // __SSHED_EDITOR_CHOOSER__
