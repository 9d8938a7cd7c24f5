/**
 * @file uicontrol.hpp
 * @brief Actions of the disksweep TUI and their keys
 *
 * One table, ACTIONS, drives both the top menu (entries in table order) and
 * the keyboard dispatch. Adding an action means adding an ActionID and one
 * table row; SweepUI::handleGlobalShortcut() then needs the matching case.
 *
 * @see SweepUI
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <optional>
#include <string>
#include <vector>

/**
 * @enum ActionID
 * @brief Everything the user can trigger from the menu or a key
 *
 * Space toggles the mark of the row under the cursor. It belongs to the
 * result list and is not an action here.
 */
enum class ActionID {
  Rescan,
  ShowCategories,
  ShowDuplicates,
  MarkRedundant, ///< every group member except the first
  MarkCategory,  ///< all files of the category under the cursor
  ClearMarks,
  CancelScan, ///< also stops a running cleanup
  DeleteMarkedFiles,
  Quit
};

/**
 * @struct ActionInfo
 * @brief Key and menu label of one action
 */
struct ActionInfo {
  ActionID m_id;

  /** @brief Case-sensitive key ('d' and 'D' are different actions) */
  char m_shortcut;

  std::string m_label;

  /** @brief Menu text with the key in front, e.g. "(q) Quit" */
  std::string menuTitle() const {
    return std::string("(") + m_shortcut + ") " + m_label;
  }
};

/**
 * @brief All actions in menu order
 */
inline const std::vector<ActionInfo> ACTIONS = {
    {ActionID::Rescan, 'r', "Rescan"},
    {ActionID::ShowCategories, 'c', "Categories"},
    {ActionID::ShowDuplicates, 'd', "Duplicates"},
    {ActionID::MarkRedundant, 'm', "Mark Copies"},
    {ActionID::MarkCategory, 'a', "Mark Category"},
    {ActionID::ClearMarks, 'u', "Unmark All"},
    {ActionID::CancelScan, 'x', "Cancel"},
    {ActionID::DeleteMarkedFiles, 'D', "Delete Marked"},
    {ActionID::Quit, 'q', "Quit"}};

inline std::vector<std::string> getMenuEntries() {
  std::vector<std::string> entries;
  entries.reserve(ACTIONS.size());
  for (const auto &action : ACTIONS) {
    entries.push_back(action.menuTitle());
  }
  return entries;
}

/**
 * @brief Action bound to a key, if any
 */
inline std::optional<ActionID> findActionByKey(char key) {
  for (const auto &action : ACTIONS) {
    if (action.m_shortcut == key) {
      return action.m_id;
    }
  }
  return std::nullopt;
}

/**
 * @brief Action of a menu entry, if the index is valid
 */
inline std::optional<ActionID> findActionByIndex(int index) {
  if (index < 0 || static_cast<std::size_t>(index) >= ACTIONS.size()) {
    return std::nullopt;
  }
  return ACTIONS[static_cast<std::size_t>(index)].m_id;
}

#endif // UI_CONTROL_HPP
