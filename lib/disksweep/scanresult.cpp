#include "scanresult.hpp"

std::string warningKindName(ScanWarning::Kind kind) {
  switch (kind) {
  case ScanWarning::Kind::PermissionDenied:
    return "permission-denied";
  case ScanWarning::Kind::BrokenLink:
    return "broken-link";
  case ScanWarning::Kind::Vanished:
    return "vanished";
  case ScanWarning::Kind::Other:
    return "error";
  }
  return "error";
}

void ScanResult::updateStatistics() {
  ScanStatistics stats;

  for (const auto &record : records) {
    stats.totalFiles++;
    stats.totalBytes += record.getFileSize();
    stats.filesPerCategory[record.getCategory()]++;
    stats.bytesPerCategory[record.getCategory()] += record.getFileSize();
  }

  for (const auto &group : duplicateGroups) {
    stats.duplicateFiles += group.paths.size();
    stats.wastedBytes += group.wastedSpace;
  }

  statistics = std::move(stats);
}

std::vector<std::filesystem::path>
ScanResult::pathsInCategory(Category category) const {
  std::vector<std::filesystem::path> paths;
  for (const auto &record : records) {
    if (record.getCategory() == category) {
      paths.push_back(record.getPath());
    }
  }
  return paths;
}

std::vector<std::filesystem::path> ScanResult::redundantDuplicates() const {
  std::vector<std::filesystem::path> paths;
  for (const auto &group : duplicateGroups) {
    for (std::size_t i = 1; i < group.paths.size(); ++i) {
      paths.push_back(group.paths[i]);
    }
  }
  return paths;
}
