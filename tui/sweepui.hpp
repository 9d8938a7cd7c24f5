/**
 * @file sweepui.hpp
 * @brief Terminal user interface for disksweep using FTXUI
 *
 * This header defines the SweepUI class which runs a scan session in the
 * background, shows its live progress, and lets the user browse the results
 * by category or by duplicate group, mark files and delete them.
 *
 * Key features:
 * - Asynchronous scanning with a live progress panel
 * - Virtualized rendering for large result lists (100 visible items at a time)
 * - Category and duplicate-group views
 * - Marking of single files, whole categories or all redundant copies
 * - Deletion through the Cleaner with a confirmation dialog
 * - Full-screen terminal UI using FTXUI library
 *
 * @see ScanSession
 * @see Cleaner
 */

#ifndef SWEEPUI_HPP
#define SWEEPUI_HPP

#include "scansession.hpp"
#include "uicontrol.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <iostream>
#include <set>
#include <unordered_map>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "utils.hpp"

using namespace ftxui;

/**
 * @class SweepUI
 * @brief Terminal front end for scanning and cleaning a directory
 *
 * Architecture:
 * - Asynchronous scanning: a ScanSession runs the pipeline; a watcher task
 *   waits for it and posts the results back to the UI thread
 * - Progress: while a session runs, the animation thread requests frames and
 *   the renderer polls ScanSession::pollProgress()
 * - Virtualized rendering: only VISIBLE_ITEMS list rows exist at a time
 * - View states: Categories, Duplicates (enum-based state machine)
 *
 * The result list mixes header rows (a category or a duplicate group) with
 * file rows. Marks are kept per path and survive switching views.
 *
 * @see ScanSession
 * @see UIControl
 */
class SweepUI {
private:
  // ===== UI State =====

  /** @brief Index of the selected row within m_visible_files */
  int m_selected = 0;

  /**
   * @enum ViewState
   * @brief Grouping of the result list
   */
  enum class ViewState { Categories, Duplicates };

  ViewState m_view_state = ViewState::Categories;

  /**
   * @struct ListEntry
   * @brief One row of the result list
   *
   * Header rows have an empty path. For file rows in the duplicate view
   * m_redundant tells whether the file is a copy (not the group's first).
   */
  struct ListEntry {
    std::filesystem::path m_path;
    std::uintmax_t m_size = 0;
    Category m_category = Category::Other;
    bool m_redundant = false;
    std::string m_label;

    bool isHeader() const { return m_path.empty(); }
  };

  // ===== Scan and Results =====

  /** @brief Directory being scanned */
  std::filesystem::path m_root;

  /** @brief Settings used for every session */
  SweepConfig m_config;

  /** @brief Current (or last) session, nullptr before the first scan */
  std::shared_ptr<ScanSession> m_session;

  /** @brief Results of the last finished session */
  const ScanResult *m_result = nullptr;

  /** @brief Rows of the current view */
  std::vector<ListEntry> m_entries;

  /** @brief Display strings of all rows, parallel to m_entries */
  std::vector<std::string> m_panel_files;

  /** @brief Marked file paths */
  std::set<std::filesystem::path> m_marked;

  /** @brief Paths removed by a cleanup since the last scan */
  std::set<std::filesystem::path> m_removed;

  // ===== UI Components =====

  /** @brief Top menu bar component */
  Component m_top_menu;

  /** @brief Result list component */
  Component m_menu;

  /** @brief Primary view component */
  Component m_main_view;

  /** @brief Document/content area component */
  Component m_document;

  /**
   * @brief Creates the panel showing either scan progress or the result list
   *
   * @return Component FTXUI component for the main panel
   */
  Component createPanelWithTable();

  /** @brief Current status message displayed in the UI */
  std::string m_current_status = "Ready.";

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  /** @brief Menu entry labels for the top menu */
  std::vector<std::string> m_menu_entries;

  /** @brief Index of currently selected item in the top menu bar */
  int m_top_menu_selected = 0;

  // ===== Threading and Async Operations =====

  /** @brief Waits for the session and posts its results to the UI thread */
  std::future<void> m_scan_future;

  /** @brief Runs a cleanup batch off the UI thread */
  std::future<void> m_clean_future;

  /** @brief True while a scan session runs */
  std::atomic<bool> m_scanning{false};

  /** @brief True while a cleanup batch runs */
  std::atomic<bool> m_cleaning{false};

  // ===== Virtualization (Performance Optimization) =====

  /** @brief Maximum number of items to render at once (performance limit) */
  static constexpr int VISIBLE_ITEMS = 100;

  /** @brief Index in m_entries of the first visible row */
  int m_virtual_offset = 0;

  /** @brief Rows currently handed to the menu (virtualized view) */
  std::vector<std::string> m_visible_files;

  /** @brief Row index lookup used by the entry renderer */
  std::unordered_map<std::string, size_t> m_label_index;

  // ===== Asynchronous Operations =====

  /**
   * @brief Starts a scan session and a watcher for its completion
   *
   * @see updateUIAfterScan()
   */
  void startScanAsync();

  /**
   * @brief Takes over the results of a finished session
   *
   * Runs on the UI thread. Reports a ScanError in the status line.
   */
  void updateUIAfterScan();

  // ===== Virtualization =====

  /**
   * @brief Moves the visible window so the selected row stays inside it
   *
   * @param absolute Index in m_entries that should be selected
   */
  void updateVirtualizedView(int absolute);

  /** @brief Index in m_entries of the selected row */
  int selectedIndex() const { return m_virtual_offset + m_selected; }

  // ===== View Building =====

  /** @brief Rebuilds m_entries for the current view state */
  void rebuildEntries();

  /** @brief Recomputes labels (mark boxes) and the visible window */
  void refreshLabels();

  void showCategories();
  void showDuplicates();

  // ===== Marking =====

  void toggleMark();
  void markRedundant();
  void markCategory();
  void clearMarks();

  /**
   * @brief Executes a menu action
   * @return true, the event is consumed
   *
   * @see ActionID
   */
  bool runAction(ActionID action);

  // ===== UI Setup and Management =====

  void setupTopMenu();
  void setupResultPanel();

  // ===== Deletion Functionality =====

  /**
   * @brief Displays confirmation dialog before deleting the marked files
   *
   * @param selection Marked paths in list order
   * @return true if user confirmed deletion, false if cancelled
   */
  bool showDeleteConfirmation(const std::vector<std::filesystem::path> &selection);

  /**
   * @brief Deletes the marked files through the session's cleaner
   *
   * Runs asynchronously; the outcome summary ends up in the status line.
   */
  void deleteMarkedFiles();

  // ===== Dialog State =====

  /** @brief Flag indicating whether a modal dialog is currently active */
  bool m_dialog_active = false;

  // ===== Animation Thread =====

  /** @brief Background thread that keeps the progress panel moving */
  std::thread m_animation_thread;

  /** @brief Thread-safe flag indicating if animation is currently running */
  std::atomic<bool> m_animating{false};

  void startAnimation();
  void stopAnimation();

public:
  /**
   * @brief Constructs a SweepUI for a directory
   *
   * @note The FTXUI screen is initialized but not started until run() is called
   */
  SweepUI(std::filesystem::path root, SweepConfig config)
      : m_root(std::move(root)), m_config(std::move(config)) {}

  /**
   * @brief Stops animation and waits for background work to finish
   */
  ~SweepUI();

  /**
   * @brief Builds the components and starts the first scan
   *
   * Must be called before run().
   */
  void initialize();

  /**
   * @brief Arranges menu bar, main panel and status line
   */
  void setupMainLayout();

  /**
   * @brief Handles global keyboard shortcuts
   *
   * @param key The character code of the pressed key
   * @return true if the shortcut was handled, false if not recognized
   */
  bool handleGlobalShortcut(char key);

  /**
   * @brief Starts the main UI event loop
   *
   * Blocks until the user quits the application.
   */
  void run();
};

#endif // SWEEPUI_HPP
