/**
 * @file filecategorizer.hpp
 * @brief Rule-based file classification
 *
 * This header defines the FileCategorizer class which maps a file's path,
 * extension and size to a Category using an ordered rule table.
 */

#ifndef FILECATEGORIZER_HPP
#define FILECATEGORIZER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "category.hpp"

/**
 * @struct CategoryInput
 * @brief Normalized view of a file handed to every rule predicate
 *
 * All strings are lowercased. The extension always carries its leading dot
 * (".log") or is empty.
 */
struct CategoryInput {
  /** @brief Parent directory names, outermost first (file name excluded) */
  std::vector<std::string> directories;

  /** @brief File name including extension */
  std::string filename;

  /** @brief Extension with leading dot, or empty */
  std::string extension;

  /** @brief File size in bytes */
  std::uintmax_t size = 0;
};

/**
 * @struct CategoryRule
 * @brief One entry of the categorization table
 */
struct CategoryRule {
  std::string name;
  Category category;
  std::function<bool(const CategoryInput &)> matches;
};

/**
 * @class FileCategorizer
 * @brief Assigns a Category to a file by evaluating rules top-to-bottom
 *
 * The first rule whose predicate matches decides the category; files that
 * match no rule are Category::Other. Categorization never touches the
 * filesystem, so the same input always yields the same category.
 *
 * Default rule order (see defaultRules()):
 * 1. Cache, log and temp directory components in the path
 * 2. Temporary and copy-like file names
 * 3. Extension tables (log, temp, cache, archive, media, document,
 *    executable)
 *
 * Directory matches come first so that "~/.cache/app/index.html" is a cache
 * file, not a document.
 *
 * Example usage:
 * @code
 * FileCategorizer categorizer;
 * Category c = categorizer.categorize("/var/log/syslog", "", 4096);
 * // c == Category::Log
 * @endcode
 */
class FileCategorizer {
private:
  std::vector<CategoryRule> m_rules;

public:
  /**
   * @brief Constructs a categorizer with the default rule table
   */
  FileCategorizer();

  /**
   * @brief Constructs a categorizer with a custom rule table
   *
   * @param rules Rules in priority order; evaluated first to last
   */
  explicit FileCategorizer(std::vector<CategoryRule> rules);

  /**
   * @brief Classifies a file
   *
   * @param path Absolute or relative file path
   * @param extension Extension with or without leading dot, any case
   * @param size File size in bytes
   *
   * @return Category of the first matching rule, Category::Other otherwise
   */
  Category categorize(const std::filesystem::path &path,
                      const std::string &extension, std::uintmax_t size) const;

  /**
   * @brief Convenience overload taking the extension from the path
   */
  Category categorize(const std::filesystem::path &path,
                      std::uintmax_t size) const {
    return categorize(path, path.extension().string(), size);
  }

  /**
   * @brief Name of the rule that decides the category, or "fallback"
   *
   * Used for debug logging and tests.
   */
  std::string matchingRule(const std::filesystem::path &path,
                           const std::string &extension,
                           std::uintmax_t size) const;

  const std::vector<CategoryRule> &rules() const { return m_rules; }

  /**
   * @brief The built-in rule table in priority order
   */
  static std::vector<CategoryRule> defaultRules();

  /**
   * @brief Builds the normalized predicate input for a file
   */
  static CategoryInput makeInput(const std::filesystem::path &path,
                                 const std::string &extension,
                                 std::uintmax_t size);
};

#endif // FILECATEGORIZER_HPP
