/**
 * @file filescanner.hpp
 * @brief Directory traversal and file record collection
 *
 * This header defines the FileScanner class which walks a directory tree,
 * applies exclusion rules and size filters, categorizes every regular file
 * and reports progress while doing so.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "cancellationtoken.hpp"
#include "filecategorizer.hpp"
#include "progresstracker.hpp"
#include "scanresult.hpp"

/**
 * @struct ScanOptions
 * @brief Traversal filters, taken from SweepConfig
 */
struct ScanOptions {
  /** @brief Path prefixes whose entries are never visited */
  std::vector<std::filesystem::path> excludeDirs;

  /** @brief Files above this size are recorded but never hashed */
  std::optional<std::uintmax_t> maxFileSize;

  /** @brief Files below this size are not recorded */
  std::uintmax_t minFileSize = 0;

  /**
   * @brief Files last modified more than this many whole days ago are not
   *        recorded; unset records files of any age
   */
  std::optional<unsigned int> maxFileAgeDays;

  /** @brief Record files whose name starts with '.' */
  bool includeHidden = false;

  /** @brief Enter symbolic links (each target at most once) */
  bool followSymlinks = false;

  /** @brief Extensions (".exe", "dll", ...) whose files are not recorded */
  std::vector<std::string> excludedExtensions;
};

/**
 * @class FileScanner
 * @brief Walks a directory tree and builds the FileRecord list of a scan
 *
 * FileScanner performs a single-threaded depth-first walk with an explicit
 * stack. Entries of each directory are visited in name order so two scans of
 * an unchanged tree produce the same records in the same order.
 *
 * Key features:
 * - Component-wise exclusion of path prefixes (on resolved paths)
 * - Symbolic-link cycle protection (each real directory entered once)
 * - Each real file recorded at most once, however many links point to it
 * - Oversized files flagged so duplicate analysis skips them
 * - Unreadable entries collected as ScanWarning, never fatal
 * - Cooperative cancellation between directory entries
 *
 * @see FileCategorizer
 * @see ProgressTracker
 * @see ScanResult
 */
class FileScanner {
private:
  /** @brief Categorizer applied to every recorded file */
  const FileCategorizer &m_categorizer;

  /**
   * @brief Mutable state of one walk
   */
  struct WalkState {
    const ScanOptions &options;
    std::vector<std::filesystem::path> excluded;
    std::unordered_set<std::string> excludedExtensions;
    std::set<std::filesystem::path> visitedDirs;
    std::unordered_set<std::string> visitedFiles;
    ScanResult &result;
    ProgressTracker &progress;
    std::uint64_t filesVisited = 0;
  };

public:
  /**
   * @brief Constructs a FileScanner with the given categorizer
   *
   * @param categorizer Must outlive the scanner
   */
  explicit FileScanner(const FileCategorizer &categorizer)
      : m_categorizer(categorizer) {}

  /**
   * @brief Scans a directory tree
   *
   * @param root Directory to walk
   * @param options Exclusions and size filters
   * @param progress Receives Phase::Scanning updates, one per visited file,
   *                 before the file is categorized
   * @param cancel Polled before every directory entry
   *
   * @return ScanResult with records, warnings and statistics. Duplicate
   *         groups are left empty. status is ScanStatus::Cancelled when the
   *         walk stopped early; the records gathered so far are valid.
   *
   * @throws ScanError if root does not exist or is not a directory
   */
  ScanResult scan(const std::filesystem::path &root, const ScanOptions &options,
                  ProgressTracker &progress,
                  const CancellationToken &cancel) const;

  /**
   * @brief Tests whether path lies at or below prefix, comparing whole
   *        components ("/a/b" covers "/a/b/c" but not "/a/bc")
   */
  static bool isUnderPrefix(const std::filesystem::path &path,
                            const std::filesystem::path &prefix);

  /**
   * @brief Makes an exclusion prefix absolute and resolves existing parts
   */
  static std::filesystem::path
  normalizePrefix(const std::filesystem::path &prefix);

private:
  /**
   * @brief Lists a directory sorted by file name
   *
   * Errors opening or reading the directory become warnings; whatever was
   * read before the error is returned.
   */
  std::vector<std::filesystem::directory_entry>
  listDirectory(const std::filesystem::path &dir, WalkState &state) const;

  /**
   * @brief Handles one directory entry
   *
   * Regular files are recorded; directories (or links to them, when
   * following links) are appended to subdirs.
   */
  void visitEntry(const std::filesystem::directory_entry &entry,
                  WalkState &state,
                  std::vector<std::filesystem::path> &subdirs) const;

  /** @brief Records a regular file whose real path is resolved */
  void recordFile(const std::filesystem::path &resolved, WalkState &state) const;

  bool isExcluded(const std::filesystem::path &path,
                  const WalkState &state) const;

  static void addWarning(WalkState &state, const std::filesystem::path &path,
                         const std::error_code &ec);
};

#endif // FILESCANNER_HPP
