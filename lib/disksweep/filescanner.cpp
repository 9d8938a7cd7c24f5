/**
 * @file filescanner.cpp
 * @brief Implementation of directory traversal for disk scans
 *
 * This file implements the FileScanner class: the directory walk, exclusion
 * matching, link handling and per-entry error reporting.
 */

#include "filescanner.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ratio>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

std::string lowerExtension(std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}

ScanWarning::Kind classifyError(const std::error_code &ec) {
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted) {
    return ScanWarning::Kind::PermissionDenied;
  }
  if (ec == std::errc::no_such_file_or_directory ||
      ec == std::errc::not_a_directory) {
    return ScanWarning::Kind::Vanished;
  }
  if (ec == std::errc::too_many_symbolic_link_levels) {
    return ScanWarning::Kind::BrokenLink;
  }
  return ScanWarning::Kind::Other;
}

// Report the current path every this many files
constexpr std::uint64_t CURRENT_ITEM_INTERVAL = 64;

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

/** @brief Whole days since modified; files from the future are 0 days old */
std::int64_t ageInDays(fs::file_time_type modified) {
  auto elapsed = fs::file_time_type::clock::now() - modified;
  auto days = std::chrono::duration_cast<Days>(elapsed).count();
  return days < 0 ? 0 : days;
}

} // namespace

/**
 * @brief Scans a directory tree and collects categorized file records
 *
 * Walk order:
 * 1. Validate and canonicalize the root (ScanError on failure)
 * 2. Pop a directory from the stack, list it sorted by name
 * 3. Visit each entry (cancellation is polled before each one)
 * 4. Push the subdirectories found in reverse order so they are walked
 *    in name order
 *
 * @see visitEntry()
 * @see recordFile()
 */
ScanResult FileScanner::scan(const fs::path &root, const ScanOptions &options,
                             ProgressTracker &progress,
                             const CancellationToken &cancel) const {
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    throw ScanError("Scan root does not exist: " + root.string());
  }
  if (!fs::is_directory(root, ec)) {
    throw ScanError("Scan root is not a directory: " + root.string());
  }

  fs::path canonicalRoot = fs::canonical(root, ec);
  if (ec) {
    throw ScanError("Cannot resolve scan root " + root.string() + ": " +
                    ec.message());
  }

  auto start = std::chrono::steady_clock::now();
  spdlog::info("Starting scan of {}", canonicalRoot.string());

  ScanResult result;
  result.root = canonicalRoot;

  WalkState state{options, {}, {}, {}, {}, result, progress};
  for (const auto &prefix : options.excludeDirs) {
    state.excluded.push_back(normalizePrefix(prefix));
  }
  for (const auto &ext : options.excludedExtensions) {
    state.excludedExtensions.insert(lowerExtension(ext));
  }

  progress.beginPhase(Phase::Scanning);

  std::vector<fs::path> stack;
  if (isExcluded(canonicalRoot, state)) {
    spdlog::info("Scan root {} is excluded, nothing to scan",
                 canonicalRoot.string());
  } else {
    stack.push_back(canonicalRoot);
    state.visitedDirs.insert(canonicalRoot);
  }

  bool cancelled = false;
  while (!stack.empty() && !cancelled) {
    fs::path dir = std::move(stack.back());
    stack.pop_back();

    std::vector<fs::path> subdirs;
    for (const auto &entry : listDirectory(dir, state)) {
      if (cancel.isCancelled()) {
        cancelled = true;
        break;
      }
      visitEntry(entry, state, subdirs);
    }

    for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
      stack.push_back(std::move(*it));
    }
  }

  // A cancel that arrives after the last entry still marks the result
  if (cancel.isCancelled()) {
    cancelled = true;
  }

  result.status = cancelled ? ScanStatus::Cancelled : ScanStatus::Complete;
  result.updateStatistics();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  spdlog::info("Scan {} in {} ms: {} files, {} bytes, {} warnings",
               cancelled ? "cancelled" : "completed", result.duration.count(),
               result.statistics.totalFiles, result.statistics.totalBytes,
               result.warnings.size());

  return result;
}

bool FileScanner::isUnderPrefix(const fs::path &path, const fs::path &prefix) {
  if (prefix.empty())
    return false;

  auto p = path.begin();
  for (auto q = prefix.begin(); q != prefix.end(); ++q, ++p) {
    if (q->empty())
      break; // trailing separator
    if (p == path.end() || *p != *q)
      return false;
  }
  return true;
}

fs::path FileScanner::normalizePrefix(const fs::path &prefix) {
  std::error_code ec;
  fs::path normalized = fs::weakly_canonical(fs::absolute(prefix, ec), ec);
  if (ec) {
    normalized = fs::absolute(prefix, ec).lexically_normal();
  }
  if (!normalized.has_filename() && normalized != normalized.root_path()) {
    normalized = normalized.parent_path();
  }
  return normalized;
}

std::vector<fs::directory_entry>
FileScanner::listDirectory(const fs::path &dir, WalkState &state) const {
  std::vector<fs::directory_entry> entries;
  std::error_code ec;

  fs::directory_iterator it(dir, ec);
  if (ec) {
    addWarning(state, dir, ec);
    return entries;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      addWarning(state, dir, ec);
      break;
    }
    entries.push_back(*it);
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });
  return entries;
}

/**
 * @brief Classifies a directory entry and dispatches it
 *
 * - Symbolic links are skipped unless followSymlinks is set; followed links
 *   are resolved to their real path first (broken links become warnings)
 * - Entries whose resolved path is excluded are dropped with everything
 *   below them
 * - Directories already entered through another link are not re-entered
 * - Sockets, FIFOs and device nodes are ignored
 */
void FileScanner::visitEntry(const fs::directory_entry &entry, WalkState &state,
                             std::vector<fs::path> &subdirs) const {
  std::error_code ec;
  const fs::path &path = entry.path();

  fs::file_status linkStatus = entry.symlink_status(ec);
  if (ec) {
    addWarning(state, path, ec);
    return;
  }

  fs::path resolved = path;
  fs::file_status status = linkStatus;

  if (fs::is_symlink(linkStatus)) {
    if (!state.options.followSymlinks) {
      spdlog::debug("Skipping symbolic link {}", path.string());
      return;
    }

    resolved = fs::canonical(path, ec);
    if (ec) {
      state.result.warnings.push_back(
          {path, ScanWarning::Kind::BrokenLink,
           "Broken symbolic link: " + ec.message()});
      spdlog::debug("Broken symbolic link {}: {}", path.string(), ec.message());
      return;
    }
    status = fs::status(resolved, ec);
    if (ec) {
      addWarning(state, path, ec);
      return;
    }
  }

  if (isExcluded(resolved, state)) {
    spdlog::debug("Excluded {}", resolved.string());
    return;
  }

  if (fs::is_directory(status)) {
    if (state.visitedDirs.insert(resolved).second) {
      subdirs.push_back(resolved);
    } else {
      spdlog::debug("Directory {} already visited", resolved.string());
    }
    return;
  }

  if (fs::is_regular_file(status)) {
    recordFile(resolved, state);
  }
}

void FileScanner::recordFile(const fs::path &resolved, WalkState &state) const {
  if (!state.visitedFiles.insert(resolved.string()).second) {
    return; // already recorded through another link
  }

  std::error_code ec;
  std::uintmax_t size = fs::file_size(resolved, ec);
  if (ec) {
    addWarning(state, resolved, ec);
    return;
  }

  fs::file_time_type modified = fs::last_write_time(resolved, ec);
  if (ec) {
    addWarning(state, resolved, ec);
    return;
  }

  state.progress.advance(Phase::Scanning, 1, size);
  if (state.filesVisited++ % CURRENT_ITEM_INTERVAL == 0) {
    state.progress.setCurrentItem(resolved.string());
  }

  const ScanOptions &options = state.options;
  std::string filename = resolved.filename().string();

  if (!options.includeHidden && !filename.empty() && filename.front() == '.') {
    return;
  }
  if (size < options.minFileSize) {
    return;
  }
  if (options.maxFileAgeDays && ageInDays(modified) > *options.maxFileAgeDays) {
    return;
  }

  std::string extension = resolved.extension().string();
  if (!state.excludedExtensions.empty() &&
      state.excludedExtensions.count(lowerExtension(extension))) {
    return;
  }

  Category category = m_categorizer.categorize(resolved, extension, size);
  bool oversized = options.maxFileSize && size > *options.maxFileSize;

  state.result.records.emplace_back(resolved, size, modified, category,
                                    oversized);
}

bool FileScanner::isExcluded(const fs::path &path,
                             const WalkState &state) const {
  return std::any_of(state.excluded.begin(), state.excluded.end(),
                     [&path](const fs::path &prefix) {
                       return isUnderPrefix(path, prefix);
                     });
}

void FileScanner::addWarning(WalkState &state, const fs::path &path,
                             const std::error_code &ec) {
  ScanWarning warning{path, classifyError(ec), ec.message()};
  spdlog::debug("Scan warning ({}) {}: {}", warningKindName(warning.kind),
                path.string(), warning.message);
  state.result.warnings.push_back(std::move(warning));
}
