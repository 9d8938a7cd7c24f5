/**
 * @file cleaner.hpp
 * @brief Removal of user-selected files with safety and backup options
 */

#ifndef CLEANER_HPP
#define CLEANER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "cancellationtoken.hpp"
#include "cleanupoutcome.hpp"
#include "progresstracker.hpp"

/**
 * @struct CleanupOptions
 * @brief Behaviour switches for one cleanup batch
 */
struct CleanupOptions {
  /** @brief Refuse paths that FileSafety does not allow */
  bool safeMode = true;

  /** @brief Copy every file into backupDir before removing it */
  bool backupBeforeDelete = false;

  /** @brief Backup destination; absolute file paths are mirrored below it */
  std::filesystem::path backupDir;

  /** @brief Move files to the trash instead of unlinking them */
  bool useTrash = false;

  /**
   * @brief Trash directory holding files/ and info/
   *
   * Empty means Cleaner::defaultTrashDir().
   */
  std::filesystem::path trashDir;

  /**
   * @brief Directories the selection was drawn from
   *
   * In safe mode a path outside all of them is protected. Empty disables
   * the check.
   */
  std::vector<std::filesystem::path> coveredRoots;
};

/**
 * @class Cleaner
 * @brief Removes selected files and reports one outcome per path
 *
 * Every path is handled on its own: a failure is recorded and the batch
 * continues. The cleaner never retries and never removes directories.
 *
 * Per path, in order:
 * 1. The path is inspected with symlink_status. A missing path is
 *    Skipped(AlreadyGone), one that cannot be inspected Failed(StatFailed),
 *    anything but a regular file Skipped(NotRegularFile).
 * 2. The parent directory is resolved to its real location. All later steps
 *    work on the resolved path, so a symbolic link to a directory cannot
 *    carry a removal outside the covered roots.
 * 3. In safe mode FileSafety::checkDeletion() must permit the resolved path,
 *    otherwise Skipped(Protected).
 * 4. With backupBeforeDelete the file is copied below backupDir and the copy
 *    verified by size. Any problem is Failed(BackupFailed) and the original
 *    stays in place.
 * 5. The path is checked again right before it is removed. With useTrash it
 *    is moved into the trash (Failed(TrashFailed) on error), otherwise
 *    unlinked (Failed(RemoveFailed) on error).
 *
 * Example usage:
 * @code
 * CleanupOptions options;
 * options.coveredRoots = {"/home/user/Downloads"};
 * Cleaner cleaner(options);
 * for (const auto &outcome : cleaner.clean(selection))
 *   std::cout << outcome.path << ": " << statusName(outcome.status) << "\n";
 * @endcode
 *
 * @see FileSafety
 * @see CleanupOutcome
 */
class Cleaner {
private:
  CleanupOptions m_options;

  CleanupOutcome cleanOne(const std::filesystem::path &path) const;

  /**
   * @brief Copies a file below the backup directory
   * @param source File to back up
   * @param target Receives the backup location on success
   * @param error Receives the failure description
   * @return true if the copy exists and has the source's size
   */
  bool backupFile(const std::filesystem::path &source,
                  std::filesystem::path &target, std::string &error) const;

  /**
   * @brief Moves a file into the trash, freedesktop.org layout
   *
   * The file goes to files/<name> and a matching info/<name>.trashinfo
   * records its original path and the deletion time. Names already taken
   * get a numeric suffix. Across filesystems the file is copied and the
   * original removed.
   *
   * @param source File to move
   * @param target Receives the location inside files/ on success
   * @param error Receives the failure description
   */
  bool moveToTrash(const std::filesystem::path &source,
                   std::filesystem::path &target, std::string &error) const;

public:
  explicit Cleaner(CleanupOptions options = {});

  const CleanupOptions &options() const { return m_options; }

  /**
   * @brief Processes a selection
   *
   * @param selected Paths to remove, typically taken from a ScanResult
   * @param progress Optional tracker, advanced in Phase::Cleaning per path
   * @param cancel Optional token; once set, the remaining paths are
   *               Skipped(Cancelled)
   * @return One outcome per selected path, in the same order
   */
  std::vector<CleanupOutcome>
  clean(const std::vector<std::filesystem::path> &selected,
        ProgressTracker *progress = nullptr,
        const CancellationToken *cancel = nullptr) const;

  /**
   * @brief Sum of the current sizes of the given paths
   *
   * Paths that are missing or not regular files count as zero.
   */
  static std::uintmax_t
  estimateCleanupSize(const std::vector<std::filesystem::path> &paths);

  static CleanupSummary summarize(const std::vector<CleanupOutcome> &outcomes);

  /**
   * @brief $XDG_DATA_HOME/Trash, or ~/.local/share/Trash
   * @return Empty if neither variable is set
   */
  static std::filesystem::path defaultTrashDir();
};

#endif // CLEANER_HPP
