/**
 * @file sweepui.cpp
 * @brief Implementation of the SweepUI class
 *
 * Key implementation areas:
 * - Destructor and resource cleanup
 * - Asynchronous scanning with progress display
 * - Category and duplicate views
 * - Marking and deletion through the session's cleaner
 * - Virtualized view management for large result lists
 * - Animation thread management
 *
 * @see SweepUI
 * @see sweepui.hpp
 */

#include "sweepui.hpp"
#include "cleaner.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

SweepUI::~SweepUI() {
  if (m_session) {
    m_session->requestCancel();
  }

  stopAnimation();

  // Wait for background tasks to complete
  if (m_scan_future.valid()) {
    m_scan_future.wait();
  }
  if (m_clean_future.valid()) {
    m_clean_future.wait();
  }

  // FTXUI leaves the terminal in a clean state only after some output
  std::cout << "disksweep terminated. Final status: " << m_current_status
            << std::endl;
}

// ============================================================================
// ASYNC SCANNING
// ============================================================================

/**
 * @brief Starts a scan session in the background
 *
 * Implementation flow:
 * 1. Waits for a previous watcher to finish
 * 2. Drops the previous results and marks
 * 3. Starts the animation thread so the progress panel refreshes
 * 4. Starts the ScanSession and a watcher task that waits for it and posts
 *    updateUIAfterScan() back to the UI thread
 *
 * @see updateUIAfterScan()
 */
void SweepUI::startScanAsync() {
  if (m_scan_future.valid()) {
    m_scan_future.wait();
  }

  m_result = nullptr;
  m_entries.clear();
  m_panel_files.clear();
  m_visible_files.clear();
  m_label_index.clear();
  m_marked.clear();
  m_removed.clear();

  try {
    m_session = ScanSession::start(m_root, m_config);
  } catch (const std::exception &e) {
    m_session.reset();
    m_current_status = std::string("Cannot start scan: ") + e.what();
    return;
  }

  m_scanning = true;
  m_current_status = "Scanning " + m_root.string() + " ...";
  startAnimation();

  auto session = m_session;
  m_scan_future = std::async(std::launch::async, [this, session]() {
    session->wait();
    m_screen.Post([this]() {
      m_scanning = false;
      updateUIAfterScan();
      stopAnimation();
    });
  });
}

/**
 * @brief Takes over the results of the finished session
 *
 * Called on the UI thread. A ScanError (invalid root) ends up in the status
 * line with an empty list.
 */
void SweepUI::updateUIAfterScan() {
  try {
    m_result = &m_session->results();
  } catch (const ScanError &e) {
    m_result = nullptr;
    m_current_status = std::string("Scan failed: ") + e.what();
    rebuildEntries();
    return;
  }

  rebuildEntries();

  const auto &stats = m_result->statistics;
  m_current_status =
      std::string(m_result->isCancelled() ? "Scan cancelled (partial): "
                                          : "Scan finished: ") +
      std::to_string(stats.totalFiles) + " files, " +
      formatBytes(static_cast<long long>(stats.totalBytes)) + ", " +
      std::to_string(m_result->duplicateGroups.size()) +
      " duplicate groups (" +
      formatBytes(static_cast<long long>(stats.wastedBytes)) + " wasted).";
}

// ============================================================================
// VIEW BUILDING
// ============================================================================

/**
 * @brief Rebuilds the rows of the current view from the scan result
 *
 * Categories view: one header per non-empty category followed by its files
 * in scan order. Duplicates view: one header per group followed by its
 * members; every member but the first is flagged redundant.
 *
 * Paths removed by a cleanup are left out.
 */
void SweepUI::rebuildEntries() {
  m_entries.clear();

  if (m_result) {
    const auto &records = m_result->records;

    if (m_view_state == ViewState::Categories) {
      std::map<Category, std::vector<size_t>> byCategory;
      for (size_t i = 0; i < records.size(); ++i) {
        if (m_removed.count(records[i].getPath()) == 0) {
          byCategory[records[i].getCategory()].push_back(i);
        }
      }

      for (Category category : allCategories()) {
        auto it = byCategory.find(category);
        if (it == byCategory.end()) {
          continue;
        }

        std::uintmax_t bytes = 0;
        for (size_t index : it->second) {
          bytes += records[index].getFileSize();
        }

        ListEntry header;
        header.m_category = category;
        header.m_label = "== " + categoryName(category) + ": " +
                         std::to_string(it->second.size()) + " files, " +
                         formatBytes(static_cast<long long>(bytes)) +
                         (isSafeToDelete(category) ? " (usually safe to delete)"
                                                   : "") +
                         " ==";
        m_entries.push_back(header);

        for (size_t index : it->second) {
          ListEntry entry;
          entry.m_path = records[index].getPath();
          entry.m_size = records[index].getFileSize();
          entry.m_category = category;
          m_entries.push_back(entry);
        }
      }
    } else {
      int groupNumber = 0;
      for (const auto &group : m_result->duplicateGroups) {
        ++groupNumber;

        ListEntry header;
        header.m_category = Category::DuplicateCandidate;
        header.m_label = "== Group " + std::to_string(groupNumber) + ": " +
                         std::to_string(group.paths.size()) + " x " +
                         formatBytes(static_cast<long long>(group.fileSize)) +
                         ", wasted " +
                         formatBytes(static_cast<long long>(group.wastedSpace)) +
                         " ==";
        m_entries.push_back(header);

        for (size_t i = 0; i < group.paths.size(); ++i) {
          if (m_removed.count(group.paths[i]) > 0) {
            continue;
          }
          ListEntry entry;
          entry.m_path = group.paths[i];
          entry.m_size = group.fileSize;
          entry.m_category = records[group.recordIndices[i]].getCategory();
          entry.m_redundant = i > 0;
          m_entries.push_back(entry);
        }
      }
    }
  }

  m_virtual_offset = 0;
  m_selected = 0;
  refreshLabels();
}

/**
 * @brief Recomputes row labels and the label lookup, keeps the selection
 */
void SweepUI::refreshLabels() {
  int absolute = selectedIndex();

  m_panel_files.clear();
  m_panel_files.reserve(m_entries.size());
  m_label_index.clear();

  for (size_t i = 0; i < m_entries.size(); ++i) {
    const auto &entry = m_entries[i];
    std::string label = entry.m_label;
    if (!entry.isHeader()) {
      label = (m_marked.count(entry.m_path) ? "[x] " : "[ ] ") +
              entry.m_path.string() + (entry.m_redundant ? " (copy)" : "");
    }
    m_label_index[label] = i;
    m_panel_files.push_back(std::move(label));
  }

  updateVirtualizedView(absolute);
}

void SweepUI::showCategories() {
  m_view_state = ViewState::Categories;
  rebuildEntries();
  m_current_status = "Category view. Space marks a file, 'a' its category.";
}

void SweepUI::showDuplicates() {
  if (m_result && m_result->duplicateGroups.empty()) {
    m_current_status = "No duplicates found.";
    return;
  }
  m_view_state = ViewState::Duplicates;
  rebuildEntries();
  m_current_status = "Duplicate view. 'm' marks every copy but the first.";
}

// ============================================================================
// VIRTUALIZATION
// ============================================================================

/**
 * @brief Updates the virtualized view window for large result lists
 *
 * Algorithm:
 * 1. Clamps the requested row to the list
 * 2. Centers it in a window of VISIBLE_ITEMS rows
 * 3. Shifts the window back when it would run past the end
 * 4. Copies the window to m_visible_files and selects the row in it
 *
 * @see VISIBLE_ITEMS
 */
void SweepUI::updateVirtualizedView(int absolute) {
  int total_items = static_cast<int>(m_panel_files.size());
  if (total_items == 0) {
    m_visible_files.clear();
    m_virtual_offset = 0;
    m_selected = 0;
    return;
  }

  absolute = std::max(0, std::min(absolute, total_items - 1));

  int start = std::max(0, absolute - VISIBLE_ITEMS / 2);
  int end = std::min(start + VISIBLE_ITEMS, total_items);
  if (end == total_items) {
    start = std::max(0, end - VISIBLE_ITEMS);
  }

  m_virtual_offset = start;
  m_visible_files.assign(m_panel_files.begin() + start,
                         m_panel_files.begin() + end);
  m_selected = absolute - start;
}

// ============================================================================
// MARKING
// ============================================================================

void SweepUI::toggleMark() {
  const ListEntry *entry = safe_at(m_entries, selectedIndex());
  if (!entry || entry->isHeader()) {
    return;
  }

  if (m_marked.erase(entry->m_path) == 0) {
    m_marked.insert(entry->m_path);
  }
  refreshLabels();
  m_current_status = std::to_string(m_marked.size()) + " file(s) marked.";
}

/**
 * @brief Marks every member of every duplicate group except the first
 */
void SweepUI::markRedundant() {
  if (!m_result) {
    return;
  }

  size_t added = 0;
  for (const auto &path : m_result->redundantDuplicates()) {
    if (m_removed.count(path) == 0 && m_marked.insert(path).second) {
      ++added;
    }
  }
  refreshLabels();
  m_current_status = "Marked " + std::to_string(added) +
                     " redundant copies, " + std::to_string(m_marked.size()) +
                     " file(s) marked.";
}

/**
 * @brief Marks all files of the category of the row under the cursor
 */
void SweepUI::markCategory() {
  const ListEntry *entry = safe_at(m_entries, selectedIndex());
  if (!m_result || !entry) {
    return;
  }

  Category category = entry->m_category;
  for (const auto &path : m_result->pathsInCategory(category)) {
    if (m_removed.count(path) == 0) {
      m_marked.insert(path);
    }
  }
  refreshLabels();
  m_current_status = "Marked category " + categoryName(category) + ", " +
                     std::to_string(m_marked.size()) + " file(s) marked.";
}

void SweepUI::clearMarks() {
  m_marked.clear();
  refreshLabels();
  m_current_status = "All marks cleared.";
}

// ============================================================================
// UI SETUP
// ============================================================================

/**
 * @brief Initializes the UI components and starts the first scan
 *
 * @see setupTopMenu()
 * @see setupResultPanel()
 * @see setupMainLayout()
 * @see startScanAsync()
 */
void SweepUI::initialize() {
  setupTopMenu();
  setupResultPanel();
  setupMainLayout();

  startScanAsync();
}

/**
 * @brief Creates the result list with custom rendering and navigation
 *
 * Rendering features:
 * - Header rows bold and cyan
 * - Files of disposable categories in yellow, marked files in green
 * - Right-aligned sizes in gray
 * - Highlights selected item with inverted colors and bold
 *
 * Event handling:
 * - Arrow keys, PageUp/PageDown, Home/End move over the whole list and keep
 *   the virtualized window around the selection
 * - Space toggles the mark of the selected file
 * - Other characters are left to the global shortcut handler
 */
void SweepUI::setupResultPanel() {
  auto menu_option = MenuOption::Vertical();
  menu_option.entries_option.transform = [this](EntryState state) {
    const ListEntry *entry = nullptr;
    auto it = m_label_index.find(state.label);
    if (it != m_label_index.end()) {
      entry = &m_entries[it->second];
    }

    auto name_element = text(state.label);
    Element size_element = text("");

    if (entry) {
      if (entry->isHeader()) {
        name_element = name_element | bold | color(Color::Cyan);
      } else {
        if (m_marked.count(entry->m_path)) {
          name_element = name_element | color(Color::Green);
        } else if (isSafeToDelete(entry->m_category)) {
          name_element = name_element | color(Color::Yellow);
        }
        size_element = text(formatBytes(static_cast<long long>(entry->m_size))) |
                       color(Color::GrayLight);
      }
    }

    auto row = hbox({name_element | size(WIDTH, LESS_THAN, 100), filler(),
                     size_element | align_right});

    if (state.focused) {
      row = row | inverted | bold;
    }

    return row;
  };

  m_menu = Menu(&m_visible_files, &m_selected, menu_option);

  m_menu = m_menu | CatchEvent([this](Event event) {
             if (m_scanning || m_cleaning || m_panel_files.empty()) {
               return false;
             }

             int absolute = selectedIndex();
             int page = std::max(5, Terminal::Size().dimy - 10);

             if (event == Event::ArrowDown) {
               updateVirtualizedView(absolute + 1);
             } else if (event == Event::ArrowUp) {
               updateVirtualizedView(absolute - 1);
             } else if (event == Event::PageDown) {
               updateVirtualizedView(absolute + page);
             } else if (event == Event::PageUp) {
               updateVirtualizedView(absolute - page);
             } else if (event == Event::Home) {
               updateVirtualizedView(0);
             } else if (event == Event::End) {
               updateVirtualizedView(static_cast<int>(m_panel_files.size()) - 1);
             } else if (event == Event::Character(' ')) {
               toggleMark();
             } else {
               return false;
             }
             return true;
           });

  m_main_view = createPanelWithTable();
}

/**
 * @brief Creates the main panel
 *
 * While a session or cleanup runs, shows a progress panel:
 * - Spinner and phase name
 * - Items processed (and the total once known) with a gauge
 * - Bytes processed and the item currently worked on
 *
 * Otherwise shows the result list with a header and page information.
 */
Component SweepUI::createPanelWithTable() {
  return Renderer(m_menu, [this] {
    int terminal_height = Terminal::Size().dimy;
    int available_height = std::max(5, terminal_height - 9);

    std::string title = m_root.string() + "  [" +
                        (m_view_state == ViewState::Categories ? "categories"
                                                               : "duplicates") +
                        "]";

    // PROGRESS STATE
    if ((m_scanning || m_cleaning) && m_session) {
      static const std::vector<std::string> spinner = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                                       "⠴", "⠦", "⠧", "⠇", "⠏"};
      static size_t frame = 0;
      frame = (frame + 1) % spinner.size();

      ProgressSnapshot snap = m_session->pollProgress();

      std::string counts = std::to_string(snap.itemsProcessed);
      if (snap.itemsTotal) {
        counts += " / " + std::to_string(*snap.itemsTotal);
      }
      counts += " files, " +
                formatBytes(static_cast<long long>(snap.bytesProcessed));

      Element gauge_element = text("");
      if (auto fraction = snap.fraction()) {
        gauge_element = hbox({gauge(static_cast<float>(*fraction)) |
                                  color(Color::Cyan) | size(WIDTH, EQUAL, 50),
                              text(" " + std::to_string(static_cast<int>(
                                             *fraction * 100)) +
                                   "%")}) |
                        center;
      }

      std::string current = snap.currentItem;
      if (current.size() > 80) {
        current = "..." + current.substr(current.size() - 77);
      }

      return vbox({text(title) | bold | color(Color::Green), separator(),
                   vbox({text("") | flex,
                         hbox({text(spinner[frame]) | color(Color::Cyan) |
                                   bold | size(WIDTH, EQUAL, 2),
                               text(phaseName(snap.phase) +
                                    (snap.cancelled ? " (cancelling)" : "")) |
                                   color(Color::GrayLight)}) |
                             center,
                         text("") | size(HEIGHT, EQUAL, 1),
                         text(counts) | color(Color::Yellow) | center,
                         gauge_element,
                         text(current) | color(Color::GrayLight) | center,
                         text("") | flex}) |
                       flex}) |
             border;
    }

    // NORMAL STATE
    std::string path_display = title;
    if (m_panel_files.size() > VISIBLE_ITEMS) {
      path_display += " [" + std::to_string(selectedIndex() + 1) + "/" +
                      std::to_string(m_panel_files.size()) + "]";
    }
    if (!m_marked.empty()) {
      path_display += "  marked: " + std::to_string(m_marked.size());
    }

    auto header = hbox({text("Entry") | bold, filler(),
                        text("Size") | bold | align_right}) |
                  color(Color::Cyan);

    return vbox({text(path_display) | bold | color(Color::Green), separator(),
                 header, separator(),
                 m_menu->Render() | vscroll_indicator | frame |
                     size(HEIGHT, EQUAL, available_height)}) |
           border;
  });
}

/**
 * @brief Arranges menu bar, main panel and status line vertically
 */
void SweepUI::setupMainLayout() {
  m_document =
      Container::Vertical({m_top_menu, Renderer([] { return separator(); }),
                           m_main_view | flex, Renderer([this] {
                             return text("STATUS: " + m_current_status) |
                                    color(Color::GrayLight) | hcenter;
                           })});
}

/**
 * @brief Initializes the top menu bar; Return runs the selected action
 */
void SweepUI::setupTopMenu() {
  m_menu_entries = ::getMenuEntries(); // from uicontrol.hpp
  m_top_menu =
      Menu(&m_menu_entries, &m_top_menu_selected, MenuOption::Horizontal());

  m_top_menu = m_top_menu | CatchEvent([this](Event event) {
                 if (event == Event::Return) {
                   auto action = findActionByIndex(m_top_menu_selected);
                   return action && runAction(*action);
                 }
                 return false;
               });
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void SweepUI::run() {
  auto global_handler = CatchEvent(m_document, [this](Event event) {
    if (event.is_character()) {
      return handleGlobalShortcut(event.character()[0]);
    }
    return false;
  });

  m_screen.Loop(global_handler);
}

// ============================================================================
// KEYBOARD SHORTCUTS AND ACTIONS
// ============================================================================

bool SweepUI::handleGlobalShortcut(char key) {
  auto action = findActionByKey(key);
  return action && runAction(*action);
}

/**
 * @brief Executes an action from the menu or a key
 *
 * While a scan or cleanup runs only CancelScan and Quit are accepted.
 */
bool SweepUI::runAction(ActionID action) {
  bool busy = m_scanning || m_cleaning;
  if (busy && action != ActionID::CancelScan && action != ActionID::Quit) {
    m_current_status = "Busy, press 'x' to cancel.";
    return true;
  }

  switch (action) {
  case ActionID::Quit:
    m_screen.Exit();
    return true;

  case ActionID::Rescan:
    startScanAsync();
    return true;

  case ActionID::ShowCategories:
    showCategories();
    return true;

  case ActionID::ShowDuplicates:
    showDuplicates();
    return true;

  case ActionID::MarkRedundant:
    markRedundant();
    return true;

  case ActionID::MarkCategory:
    markCategory();
    return true;

  case ActionID::ClearMarks:
    clearMarks();
    return true;

  case ActionID::CancelScan:
    if (busy && m_session) {
      m_session->requestCancel();
      m_current_status = "Cancelling...";
    } else {
      m_current_status = "Nothing to cancel.";
    }
    return true;

  case ActionID::DeleteMarkedFiles:
    deleteMarkedFiles();
    return true;
  }
  return false;
}

// ============================================================================
// DELETE OPERATIONS
// ============================================================================

/**
 * @brief Confirms and runs the cleanup of all marked files
 *
 * The batch runs on a background task so the progress panel stays live.
 * Removed paths disappear from the list; failures and skips are counted in
 * the status line and written to the log.
 */
void SweepUI::deleteMarkedFiles() {
  if (!m_session || !m_result) {
    m_current_status = "No scan results.";
    return;
  }
  if (m_marked.empty()) {
    m_current_status = "No files marked. Use space, 'a' or 'm' to mark.";
    return;
  }

  std::vector<std::filesystem::path> selection(m_marked.begin(),
                                               m_marked.end());

  if (!showDeleteConfirmation(selection)) {
    m_current_status = "Delete cancelled.";
    return;
  }

  if (m_clean_future.valid()) {
    m_clean_future.wait();
  }

  m_cleaning = true;
  startAnimation();

  auto session = m_session;
  m_clean_future = std::async(std::launch::async, [this, session, selection]() {
    std::vector<CleanupOutcome> outcomes;
    std::string error;
    try {
      outcomes = session->clean(selection);
    } catch (const std::exception &e) {
      error = e.what();
      spdlog::error("Cleanup failed: {}", error);
    }

    m_screen.Post([this, outcomes, error]() {
      m_cleaning = false;
      stopAnimation();

      if (!error.empty()) {
        m_current_status = "✗ Cleanup failed: " + error;
        return;
      }

      for (const auto &outcome : outcomes) {
        m_marked.erase(outcome.path);
        if (outcome.isRemoved() ||
            outcome.reason == CleanupOutcome::Reason::AlreadyGone) {
          m_removed.insert(outcome.path);
        }
      }
      rebuildEntries();

      auto summary = Cleaner::summarize(outcomes);
      m_current_status =
          "✓ Deleted " + std::to_string(summary.deleted + summary.backedUp) +
          " file(s), trashed " + std::to_string(summary.trashed) +
          ", freed " +
          formatBytes(static_cast<long long>(summary.bytesFreed)) +
          ". Failed: " + std::to_string(summary.failed) +
          ", skipped: " + std::to_string(summary.skipped) + ".";
    });
  });
}

/**
 * @brief Shows a modal dialog summarizing the deletion
 *
 * Lists the number of files, their current total size, the first few paths,
 * and whether safe mode and backups are active. 'y' confirms, 'n' or ESC
 * cancels.
 */
bool SweepUI::showDeleteConfirmation(
    const std::vector<std::filesystem::path> &selection) {
  m_dialog_active = true;
  bool confirmed = false;
  auto dialog_screen = ScreenInteractive::TerminalOutput();

  std::uintmax_t estimate = Cleaner::estimateCleanupSize(selection);

  auto dialog_renderer = Renderer([&] {
    std::vector<Element> content = {
        text("DELETE " + std::to_string(selection.size()) + " FILE(S)?") |
            bold | color(Color::Red) | hcenter,
        separator(),
        text("Size: " + formatBytes(static_cast<long long>(estimate)))};

    const size_t preview = 5;
    for (size_t i = 0; i < selection.size() && i < preview; ++i) {
      content.push_back(text("  " + selection[i].string()) |
                        color(Color::Yellow));
    }
    if (selection.size() > preview) {
      content.push_back(text("  ... and " +
                             std::to_string(selection.size() - preview) +
                             " more") |
                        color(Color::GrayLight));
    }

    content.push_back(separator());
    if (m_config.safeMode) {
      content.push_back(text("Safe mode: protected paths will be skipped"));
    } else {
      content.push_back(text("SAFE MODE IS OFF") | color(Color::Magenta) |
                        bold);
    }
    if (m_config.backupBeforeDelete) {
      content.push_back(text("Backup to: " + m_config.backupDir.string()));
    }
    if (m_config.useTrash) {
      content.push_back(text("Files are moved to the trash"));
    }

    content.push_back(separator());
    content.push_back(text("") | size(HEIGHT, EQUAL, 1));
    content.push_back(
        hbox({text("Press ") | color(Color::GrayLight),
              text("'y'") | bold | color(Color::Green),
              text(" to confirm, ") | color(Color::GrayLight),
              text("'n'") | bold | color(Color::Red),
              text(" or ") | color(Color::GrayLight), text("ESC") | bold,
              text(" to cancel") | color(Color::GrayLight)}) |
        hcenter);

    return vbox(content) | border | center;
  });

  auto dialog_handler = CatchEvent(dialog_renderer, [&](Event event) {
    if (event == Event::Character('y') || event == Event::Character('Y')) {
      confirmed = true;
      dialog_screen.Exit();
      return true;
    }
    if (event == Event::Character('n') || event == Event::Character('N') ||
        event == Event::Escape) {
      confirmed = false;
      dialog_screen.Exit();
      return true;
    }
    return false;
  });

  dialog_screen.Loop(dialog_handler);
  m_dialog_active = false;

  return confirmed;
}

// ============================================================================
// ANIMATION THREAD
// ============================================================================

/**
 * @brief Starts a thread that requests a frame every 50 ms
 *
 * Keeps the progress panel updating while the pipeline works; the UI thread
 * itself only wakes up on events.
 */
void SweepUI::startAnimation() {
  if (m_animating)
    return;

  m_animating = true;
  m_animation_thread = std::thread([this]() {
    while (m_animating) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      if (m_animating) {
        m_screen.RequestAnimationFrame(); // Force UI refresh
      }
    }
  });
}

/**
 * @brief Stops the animation thread and redraws once more
 */
void SweepUI::stopAnimation() {
  m_animating = false;
  if (m_animation_thread.joinable()) {
    m_animation_thread.join();
  }

  // Without a final frame the last spinner frame stays visible
  m_screen.RequestAnimationFrame();
}
