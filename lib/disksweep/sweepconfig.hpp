#ifndef SWEEPCONFIG_HPP
#define SWEEPCONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cleaner.hpp"
#include "filescanner.hpp"

/**
 * @struct SweepConfig
 * @brief Settings consumed by a scan session and the cleaner
 *
 * Populated by ConfigLoader and command-line flags; the library only reads
 * it. Defaults favour safety: protected paths are refused, hidden files and
 * symbolic links are left alone.
 */
struct SweepConfig {
  std::vector<std::filesystem::path> excludeDirs = {
      "/bin", "/sbin", "/usr/bin", "/usr/sbin", "/proc", "/sys", "/dev"};

  /** @brief Files above this size are listed but not hashed */
  std::optional<std::uintmax_t> maxFileSize;

  std::uintmax_t minFileSize = 0;

  /** @brief Skip files not modified within this many days; unset keeps all */
  std::optional<unsigned int> maxFileAgeDays;

  bool safeMode = true;
  bool backupBeforeDelete = false;
  std::filesystem::path backupDir;

  /** @brief Move removed files to the trash instead of unlinking them */
  bool useTrash = false;

  bool includeHidden = false;
  bool followSymlinks = false;
  std::vector<std::string> excludedExtensions;

  /** @brief "sha256" (default), any OpenSSL digest name, or "fnv1a" */
  std::string hashAlgorithm = "sha256";

  /** @brief Hashing threads; 0 uses the hardware concurrency */
  std::size_t workers = 0;

  /** @brief spdlog level name ("info", "debug", ...) */
  std::string logLevel = "info";

  ScanOptions scanOptions() const {
    ScanOptions options;
    options.excludeDirs = excludeDirs;
    options.maxFileSize = maxFileSize;
    options.minFileSize = minFileSize;
    options.maxFileAgeDays = maxFileAgeDays;
    options.includeHidden = includeHidden;
    options.followSymlinks = followSymlinks;
    options.excludedExtensions = excludedExtensions;
    return options;
  }

  CleanupOptions cleanupOptions(
      std::vector<std::filesystem::path> coveredRoots = {}) const {
    CleanupOptions options;
    options.safeMode = safeMode;
    options.backupBeforeDelete = backupBeforeDelete;
    options.backupDir = backupDir;
    options.useTrash = useTrash;
    options.coveredRoots = std::move(coveredRoots);
    return options;
  }
};

#endif // SWEEPCONFIG_HPP
