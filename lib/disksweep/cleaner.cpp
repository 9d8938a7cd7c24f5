/**
 * @file cleaner.cpp
 * @brief Implementation of the Cleaner
 */

#include "cleaner.hpp"
#include "filesafety.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Real location of a path whose last component is kept as is
 *
 * Links in the directories above the file are resolved; the file itself is
 * never followed.
 */
fs::path resolveParent(const fs::path &path, std::error_code &ec) {
  fs::path absolute = fs::absolute(path, ec);
  if (ec)
    return {};
  fs::path parent = fs::canonical(absolute.parent_path(), ec);
  if (ec)
    return {};
  return parent / absolute.filename();
}

/** @brief Percent-encoding for the Path key of a .trashinfo file */
std::string encodeTrashPath(const std::string &path) {
  static const char HEX[] = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : path) {
    bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                 (c >= '0' && c <= '9') || c == '/' || c == '-' || c == '_' ||
                 c == '.' || c == '~';
    if (plain) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += HEX[c >> 4];
      out += HEX[c & 0x0F];
    }
  }
  return out;
}

std::string deletionDate() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

// Upper bound on numeric suffixes tried for a free trash name
constexpr int MAX_TRASH_NAME_ATTEMPTS = 10000;

} // namespace

Cleaner::Cleaner(CleanupOptions options) : m_options(std::move(options)) {}

std::vector<CleanupOutcome>
Cleaner::clean(const std::vector<fs::path> &selected, ProgressTracker *progress,
               const CancellationToken *cancel) const {
  std::vector<CleanupOutcome> outcomes;
  outcomes.reserve(selected.size());

  if (!cancel && progress)
    cancel = &progress->token();

  if (progress)
    progress->setTotal(Phase::Cleaning, selected.size());

  spdlog::info("Cleaning {} path(s) (safe mode {}, backup {}, trash {})",
               selected.size(), m_options.safeMode ? "on" : "off",
               m_options.backupBeforeDelete ? "on" : "off",
               m_options.useTrash ? "on" : "off");

  for (const auto &path : selected) {
    CleanupOutcome outcome;
    if (cancel && cancel->isCancelled()) {
      outcome.path = path;
      outcome.status = CleanupOutcome::Status::Skipped;
      outcome.reason = CleanupOutcome::Reason::Cancelled;
      outcome.detail = "cleanup cancelled";
    } else {
      if (progress)
        progress->setCurrentItem(path.string());
      outcome = cleanOne(path);
    }

    if (outcome.isRemoved()) {
      spdlog::info("{} {} ({} bytes)", statusName(outcome.status),
                   outcome.path.string(), outcome.bytesFreed);
    } else if (outcome.reason != CleanupOutcome::Reason::Cancelled) {
      spdlog::warn("{} {}: {} ({})", statusName(outcome.status),
                   outcome.path.string(), reasonName(outcome.reason),
                   outcome.detail);
    }

    if (progress)
      progress->advance(Phase::Cleaning, 1, outcome.bytesFreed);
    outcomes.push_back(std::move(outcome));
  }

  if (progress)
    progress->finish();
  return outcomes;
}

CleanupOutcome Cleaner::cleanOne(const fs::path &path) const {
  CleanupOutcome outcome;
  outcome.path = path;

  auto skip = [&outcome](CleanupOutcome::Reason reason, std::string detail) {
    outcome.status = CleanupOutcome::Status::Skipped;
    outcome.reason = reason;
    outcome.detail = std::move(detail);
    return outcome;
  };
  auto fail = [&outcome](CleanupOutcome::Reason reason, std::string detail) {
    outcome.status = CleanupOutcome::Status::Failed;
    outcome.reason = reason;
    outcome.detail = std::move(detail);
    return outcome;
  };

  std::error_code ec;
  auto status = fs::symlink_status(path, ec);
  if (status.type() == fs::file_type::not_found)
    return skip(CleanupOutcome::Reason::AlreadyGone, "file no longer exists");
  if (ec)
    return fail(CleanupOutcome::Reason::StatFailed,
                "cannot inspect file: " + ec.message());
  if (!fs::is_regular_file(status))
    return skip(CleanupOutcome::Reason::NotRegularFile, "not a regular file");

  fs::path target = resolveParent(path, ec);
  if (ec)
    return fail(CleanupOutcome::Reason::StatFailed,
                "cannot resolve parent directory: " + ec.message());

  if (m_options.safeMode) {
    auto check =
        FileSafety::checkDeletion(target.string(), m_options.coveredRoots);
    if (!FileSafety::isDeletionPermitted(check))
      return skip(CleanupOutcome::Reason::Protected,
                  FileSafety::getStatusMessage(check, target.string()));
  }

  std::uintmax_t size = fs::file_size(target, ec);
  if (ec)
    size = 0;

  bool backedUp = false;
  if (m_options.backupBeforeDelete) {
    fs::path copy;
    std::string error;
    if (!backupFile(target, copy, error))
      return fail(CleanupOutcome::Reason::BackupFailed, error);
    outcome.backupPath = copy;
    backedUp = true;
  }

  // The file may have been removed by someone else in the meantime
  status = fs::symlink_status(target, ec);
  if (status.type() == fs::file_type::not_found)
    return skip(CleanupOutcome::Reason::AlreadyGone,
                "file vanished before removal");
  if (ec)
    return fail(CleanupOutcome::Reason::StatFailed,
                "cannot inspect file: " + ec.message());
  if (!fs::is_regular_file(status))
    return skip(CleanupOutcome::Reason::NotRegularFile,
                "replaced by a non-regular file");

  if (m_options.useTrash) {
    fs::path trashed;
    std::string error;
    if (!moveToTrash(target, trashed, error))
      return fail(CleanupOutcome::Reason::TrashFailed, error);
    outcome.status = CleanupOutcome::Status::Trashed;
    outcome.reason = CleanupOutcome::Reason::None;
    outcome.trashPath = trashed;
    outcome.bytesFreed = size;
    return outcome;
  }

  if (!fs::remove(target, ec) || ec) {
    if (!ec)
      return skip(CleanupOutcome::Reason::AlreadyGone,
                  "file vanished before removal");
    return fail(CleanupOutcome::Reason::RemoveFailed, ec.message());
  }

  outcome.status = backedUp ? CleanupOutcome::Status::BackedUpAndDeleted
                            : CleanupOutcome::Status::Deleted;
  outcome.reason = CleanupOutcome::Reason::None;
  outcome.bytesFreed = size;
  return outcome;
}

bool Cleaner::backupFile(const fs::path &source, fs::path &target,
                         std::string &error) const {
  if (m_options.backupDir.empty()) {
    error = "no backup directory configured";
    return false;
  }

  fs::path absolute = fs::absolute(source).lexically_normal();
  target = m_options.backupDir / absolute.relative_path();

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    error = "cannot create " + target.parent_path().string() + ": " +
            ec.message();
    return false;
  }

  fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "cannot copy to " + target.string() + ": " + ec.message();
    return false;
  }

  auto sourceSize = fs::file_size(source, ec);
  if (ec) {
    error = "cannot read size of " + source.string() + ": " + ec.message();
    return false;
  }
  auto copySize = fs::file_size(target, ec);
  if (ec || copySize != sourceSize) {
    error = "backup copy " + target.string() + " is incomplete";
    return false;
  }
  return true;
}

bool Cleaner::moveToTrash(const fs::path &source, fs::path &target,
                          std::string &error) const {
  fs::path trash =
      m_options.trashDir.empty() ? defaultTrashDir() : m_options.trashDir;
  if (trash.empty()) {
    error = "no trash directory available";
    return false;
  }

  std::error_code ec;
  fs::path filesDir = trash / "files";
  fs::path infoDir = trash / "info";
  fs::create_directories(filesDir, ec);
  if (!ec)
    fs::create_directories(infoDir, ec);
  if (ec) {
    error = "cannot create " + trash.string() + ": " + ec.message();
    return false;
  }

  // Creating the info file exclusively reserves the name
  const std::string stem = source.stem().string();
  const std::string extension = source.extension().string();
  fs::path infoFile;
  for (int attempt = 1;; ++attempt) {
    if (attempt > MAX_TRASH_NAME_ATTEMPTS) {
      error = "no free name in " + filesDir.string();
      return false;
    }

    std::string name = attempt == 1
                           ? source.filename().string()
                           : stem + "." + std::to_string(attempt) + extension;
    infoFile = infoDir / (name + ".trashinfo");
    int fd = ::open(infoFile.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
      if (errno == EEXIST)
        continue;
      error = "cannot create " + infoFile.string() + ": " + std::strerror(errno);
      return false;
    }
    ::close(fd);

    target = filesDir / name;
    if (!fs::exists(target, ec))
      break;
    // A stray entry in files/ without info keeps its name
    fs::remove(infoFile, ec);
  }

  std::ofstream info(infoFile, std::ios::trunc);
  info << "[Trash Info]\n"
       << "Path=" << encodeTrashPath(source.string()) << "\n"
       << "DeletionDate=" << deletionDate() << "\n";
  info.close();
  if (!info) {
    error = "cannot write " + infoFile.string();
    fs::remove(infoFile, ec);
    return false;
  }

  fs::rename(source, target, ec);
  if (ec == std::errc::cross_device_link) {
    ec.clear();
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (!ec)
      fs::remove(source, ec);
    if (ec) {
      std::error_code cleanup;
      fs::remove(target, cleanup);
    }
  }
  if (ec) {
    error = "cannot move to " + target.string() + ": " + ec.message();
    std::error_code cleanup;
    fs::remove(infoFile, cleanup);
    return false;
  }
  return true;
}

fs::path Cleaner::defaultTrashDir() {
  if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    return fs::path(xdg) / "Trash";
  if (const char *home = std::getenv("HOME"); home && *home)
    return fs::path(home) / ".local" / "share" / "Trash";
  return {};
}

std::uintmax_t Cleaner::estimateCleanupSize(const std::vector<fs::path> &paths) {
  std::uintmax_t total = 0;
  for (const auto &path : paths) {
    std::error_code ec;
    if (!fs::is_regular_file(fs::symlink_status(path, ec)))
      continue;
    auto size = fs::file_size(path, ec);
    if (!ec)
      total += size;
  }
  return total;
}

CleanupSummary Cleaner::summarize(const std::vector<CleanupOutcome> &outcomes) {
  CleanupSummary summary;
  for (const auto &outcome : outcomes) {
    switch (outcome.status) {
    case CleanupOutcome::Status::Deleted:
      ++summary.deleted;
      break;
    case CleanupOutcome::Status::BackedUpAndDeleted:
      ++summary.backedUp;
      break;
    case CleanupOutcome::Status::Trashed:
      ++summary.trashed;
      break;
    case CleanupOutcome::Status::Failed:
      ++summary.failed;
      break;
    case CleanupOutcome::Status::Skipped:
      ++summary.skipped;
      break;
    }
    summary.bytesFreed += outcome.bytesFreed;
  }
  return summary;
}
