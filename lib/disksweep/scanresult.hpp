/**
 * @file scanresult.hpp
 * @brief Result types produced by a scan session
 */

#ifndef SCANRESULT_HPP
#define SCANRESULT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "category.hpp"
#include "filerecord.hpp"

/**
 * @brief Raised when the scan root is missing or not a directory
 *
 * This is the only failure that stops the pipeline; everything else is
 * reported per file.
 */
class ScanError : public std::runtime_error {
public:
  explicit ScanError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Non-fatal problem with a single directory entry
 */
struct ScanWarning {
  enum class Kind { PermissionDenied, BrokenLink, Vanished, Other };

  std::filesystem::path path;
  Kind kind = Kind::Other;
  std::string message;
};

/**
 * @brief Short label for a warning kind ("permission-denied", ...)
 */
std::string warningKindName(ScanWarning::Kind kind);

/**
 * @brief A file that could not be hashed; it takes no part in grouping
 */
struct HashFailure {
  std::filesystem::path path;
  std::string reason;
};

/**
 * @brief Files sharing size and content hash
 *
 * Always has at least two members. Paths are sorted; recordIndices follow
 * the same order and address ScanResult::records.
 */
struct DuplicateGroup {
  std::string hash;
  std::uintmax_t fileSize = 0;
  std::vector<std::filesystem::path> paths;
  std::vector<std::size_t> recordIndices;

  /** @brief Bytes reclaimable by keeping one copy: (members - 1) * size */
  std::uintmax_t wastedSpace = 0;
};

struct ScanStatistics {
  std::uint64_t totalFiles = 0;
  std::uintmax_t totalBytes = 0;
  std::map<Category, std::uint64_t> filesPerCategory;
  std::map<Category, std::uintmax_t> bytesPerCategory;
  std::uint64_t duplicateFiles = 0;
  std::uintmax_t wastedBytes = 0;
};

enum class ScanStatus { Complete, Cancelled };

/**
 * @brief Everything one scan session produced
 *
 * records is the arena every other field refers into; it is not reordered
 * or resized once duplicate analysis has started.
 */
struct ScanResult {
  std::filesystem::path root;
  std::vector<FileRecord> records;
  std::vector<DuplicateGroup> duplicateGroups;
  std::vector<ScanWarning> warnings;
  std::vector<HashFailure> hashFailures;
  ScanStatistics statistics;
  ScanStatus status = ScanStatus::Complete;
  std::chrono::milliseconds duration{0};

  bool isCancelled() const { return status == ScanStatus::Cancelled; }

  /**
   * @brief Recomputes statistics from records and duplicateGroups
   */
  void updateStatistics();

  /**
   * @brief Paths of all records in a category, in scan order
   */
  std::vector<std::filesystem::path> pathsInCategory(Category category) const;

  /**
   * @brief Every group member except the first, i.e. the copies to remove
   */
  std::vector<std::filesystem::path> redundantDuplicates() const;
};

#endif // SCANRESULT_HPP
