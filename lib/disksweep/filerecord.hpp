#ifndef FILERECORD_HPP
#define FILERECORD_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "category.hpp"

/**
 * @brief One regular file found by a scan
 *
 * Path, size, timestamp and category are fixed at construction. The content
 * hash is filled in later by the duplicate finder, exactly once, by the
 * single worker that hashed this file; the record itself carries no lock.
 */
class FileRecord {
private:
  std::filesystem::path m_path;
  std::uintmax_t m_size;
  std::filesystem::file_time_type m_modified;
  Category m_category;
  bool m_hashExcluded;
  std::optional<std::string> m_hash;
  std::optional<std::size_t> m_groupId;

public:
  FileRecord(std::filesystem::path path, std::uintmax_t size,
             std::filesystem::file_time_type modified, Category category,
             bool hashExcluded = false)
      : m_path(std::move(path)), m_size(size), m_modified(modified),
        m_category(category), m_hashExcluded(hashExcluded) {}

  const std::filesystem::path &getPath() const { return m_path; }
  std::uintmax_t getFileSize() const { return m_size; }
  std::filesystem::file_time_type getModified() const { return m_modified; }
  Category getCategory() const { return m_category; }

  /** @brief True for files above the configured size limit */
  bool isHashExcluded() const { return m_hashExcluded; }

  const std::optional<std::string> &getHash() const { return m_hash; }
  bool hasHash() const { return m_hash.has_value(); }

  /**
   * @brief Stores the content hash
   * @return false if a hash was already assigned (the stored one is kept)
   */
  bool assignHash(std::string hash) {
    if (m_hash)
      return false;
    m_hash = std::move(hash);
    return true;
  }

  /** @brief Index into ScanResult::duplicateGroups, if the file has copies */
  const std::optional<std::size_t> &getGroupId() const { return m_groupId; }
  bool isDuplicate() const { return m_groupId.has_value(); }
  void setGroupId(std::size_t id) { m_groupId = id; }
};

#endif // FILERECORD_HPP
