#ifndef CLEANUPOUTCOME_HPP
#define CLEANUPOUTCOME_HPP

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @brief Result of trying to remove one selected path
 *
 * Exactly one outcome is produced per selected path, in selection order.
 * Failed carries StatFailed, BackupFailed, TrashFailed or RemoveFailed;
 * Skipped carries Protected, AlreadyGone, NotRegularFile or Cancelled.
 */
struct CleanupOutcome {
  enum class Status { Deleted, BackedUpAndDeleted, Trashed, Failed, Skipped };

  enum class Reason {
    None,
    Protected,
    AlreadyGone,
    NotRegularFile,
    StatFailed,
    BackupFailed,
    TrashFailed,
    RemoveFailed,
    Cancelled
  };

  std::filesystem::path path;
  Status status = Status::Skipped;
  Reason reason = Reason::None;

  /** @brief Human-readable explanation (OS error text, protection rule) */
  std::string detail;

  std::uintmax_t bytesFreed = 0;

  /** @brief Location of the backup copy, empty when none was made */
  std::filesystem::path backupPath;

  /** @brief Where the file went in the trash, empty unless Trashed */
  std::filesystem::path trashPath;

  bool isRemoved() const {
    return status == Status::Deleted ||
           status == Status::BackedUpAndDeleted || status == Status::Trashed;
  }
};

inline std::string statusName(CleanupOutcome::Status status) {
  switch (status) {
  case CleanupOutcome::Status::Deleted:
    return "deleted";
  case CleanupOutcome::Status::BackedUpAndDeleted:
    return "backed-up-and-deleted";
  case CleanupOutcome::Status::Trashed:
    return "moved-to-trash";
  case CleanupOutcome::Status::Failed:
    return "failed";
  case CleanupOutcome::Status::Skipped:
    return "skipped";
  }
  return "unknown";
}

inline std::string reasonName(CleanupOutcome::Reason reason) {
  switch (reason) {
  case CleanupOutcome::Reason::None:
    return "none";
  case CleanupOutcome::Reason::Protected:
    return "protected";
  case CleanupOutcome::Reason::AlreadyGone:
    return "already-gone";
  case CleanupOutcome::Reason::NotRegularFile:
    return "not-regular-file";
  case CleanupOutcome::Reason::StatFailed:
    return "stat-failed";
  case CleanupOutcome::Reason::BackupFailed:
    return "backup-failed";
  case CleanupOutcome::Reason::TrashFailed:
    return "trash-failed";
  case CleanupOutcome::Reason::RemoveFailed:
    return "remove-failed";
  case CleanupOutcome::Reason::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

/**
 * @brief Per-status tally of a cleanup batch
 */
struct CleanupSummary {
  std::size_t deleted = 0;
  std::size_t backedUp = 0;
  std::size_t trashed = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  std::uintmax_t bytesFreed = 0;
};

#endif // CLEANUPOUTCOME_HPP
