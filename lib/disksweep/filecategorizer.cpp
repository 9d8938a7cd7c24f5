/**
 * @file filecategorizer.cpp
 * @brief Implementation of the rule-based file categorizer
 */

#include "filecategorizer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool isDigits(const std::string &value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

bool startsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

/**
 * @brief Rule matching any parent directory name in the given set
 */
CategoryRule directoryRule(const std::string &name, Category category,
                           std::unordered_set<std::string> names) {
  return {name, category, [names](const CategoryInput &in) {
            return std::any_of(
                in.directories.begin(), in.directories.end(),
                [&names](const std::string &dir) { return names.count(dir); });
          }};
}

/**
 * @brief Rule matching the extension against the given set
 */
CategoryRule extensionRule(const std::string &name, Category category,
                           std::unordered_set<std::string> extensions) {
  return {name, category, [extensions](const CategoryInput &in) {
            return !in.extension.empty() && extensions.count(in.extension);
          }};
}

// "report (1).pdf", "photo (12).jpg"
bool hasCopyCounter(const std::string &stem) {
  if (!endsWith(stem, ")"))
    return false;

  auto open = stem.rfind(" (");
  if (open == std::string::npos)
    return false;

  return isDigits(stem.substr(open + 2, stem.size() - open - 3));
}

} // namespace

FileCategorizer::FileCategorizer() : m_rules(defaultRules()) {}

FileCategorizer::FileCategorizer(std::vector<CategoryRule> rules)
    : m_rules(std::move(rules)) {}

CategoryInput FileCategorizer::makeInput(const std::filesystem::path &path,
                                         const std::string &extension,
                                         std::uintmax_t size) {
  CategoryInput input;
  input.filename = toLower(path.filename().string());
  input.size = size;

  input.extension = toLower(extension);
  if (!input.extension.empty() && input.extension.front() != '.') {
    input.extension.insert(input.extension.begin(), '.');
  }

  for (const auto &component : path.parent_path()) {
    std::string dir = component.string();
    if (dir.empty() || dir == "/")
      continue;
    input.directories.push_back(toLower(dir));
  }

  return input;
}

Category FileCategorizer::categorize(const std::filesystem::path &path,
                                     const std::string &extension,
                                     std::uintmax_t size) const {
  CategoryInput input = makeInput(path, extension, size);

  for (const auto &rule : m_rules) {
    if (rule.matches && rule.matches(input)) {
      return rule.category;
    }
  }
  return Category::Other;
}

std::string FileCategorizer::matchingRule(const std::filesystem::path &path,
                                          const std::string &extension,
                                          std::uintmax_t size) const {
  CategoryInput input = makeInput(path, extension, size);

  for (const auto &rule : m_rules) {
    if (rule.matches && rule.matches(input)) {
      return rule.name;
    }
  }
  return "fallback";
}

std::vector<CategoryRule> FileCategorizer::defaultRules() {
  std::vector<CategoryRule> rules;

  // 1. Path components
  rules.push_back(directoryRule("cache-dir", Category::Cache,
                                {".cache", "cache", "caches", "__pycache__",
                                 ".gradle", ".npm", ".thumbnails"}));
  rules.push_back(directoryRule("log-dir", Category::Log, {"log", "logs"}));
  rules.push_back(
      directoryRule("temp-dir", Category::Temporary, {"tmp", "temp", ".tmp"}));

  // 2. File names
  rules.push_back({"temp-name", Category::Temporary,
                   [](const CategoryInput &in) {
                     const std::string &name = in.filename;
                     if (startsWith(name, "~") || startsWith(name, ".#") ||
                         endsWith(name, "~")) {
                       return true;
                     }
                     // core dumps: "core" or "core.<pid>"
                     if (in.size > 0 &&
                         (name == "core" ||
                          (startsWith(name, "core.") &&
                           isDigits(name.substr(5))))) {
                       return true;
                     }
                     return false;
                   }});

  rules.push_back({"copy-name", Category::DuplicateCandidate,
                   [](const CategoryInput &in) {
                     static const std::unordered_set<std::string> backupExt = {
                         ".bak", ".old", ".orig", ".backup"};
                     if (backupExt.count(in.extension))
                       return true;

                     std::string stem = in.filename.substr(
                         0, in.filename.size() - in.extension.size());
                     return hasCopyCounter(stem) ||
                            stem.find(" - copy") != std::string::npos ||
                            startsWith(stem, "copy of ");
                   }});

  // 3. Extensions
  rules.push_back(
      extensionRule("log-ext", Category::Log, {".log", ".out", ".err"}));
  rules.push_back(extensionRule(
      "temp-ext", Category::Temporary,
      {".tmp", ".temp", ".swp", ".part", ".crdownload"}));
  rules.push_back(extensionRule("cache-ext", Category::Cache, {".cache"}));
  rules.push_back(extensionRule("archive-ext", Category::Archive,
                                {".zip", ".tar", ".gz", ".tgz", ".bz2", ".xz",
                                 ".7z", ".rar", ".zst", ".iso"}));
  rules.push_back(extensionRule(
      "media-ext", Category::Media,
      {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp", ".heic",
       ".svg", ".raw", ".mp3", ".wav", ".flac", ".ogg", ".aac", ".m4a",
       ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".webm"}));
  rules.push_back(extensionRule(
      "document-ext", Category::Document,
      {".pdf", ".doc", ".docx", ".odt", ".txt", ".md", ".rtf", ".xls",
       ".xlsx", ".ods", ".ppt", ".pptx", ".odp", ".csv", ".epub"}));
  rules.push_back(extensionRule("executable-ext", Category::Executable,
                                {".exe", ".msi", ".bin", ".run", ".appimage",
                                 ".sh", ".deb", ".rpm", ".so", ".dll"}));

  return rules;
}
