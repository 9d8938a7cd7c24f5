#ifndef CATEGORY_HPP
#define CATEGORY_HPP

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Coarse classification tag assigned to every scanned file
 *
 * The set is closed: every FileRecord carries exactly one of these values.
 * The order of the enumerators is the display order used by the front ends.
 *
 * @see FileCategorizer
 */
enum class Category {
  Log,
  Temporary,
  Cache,
  DuplicateCandidate,
  Document,
  Media,
  Archive,
  Executable,
  Other
};

/**
 * @brief Returns all categories in declaration order
 */
const std::vector<Category> &allCategories();

/**
 * @brief Stable lowercase name of a category ("log", "duplicate-candidate", ...)
 *
 * Used on the command line (--clean-category) and in log output.
 */
std::string categoryName(Category category);

/**
 * @brief Parses a name produced by categoryName()
 *
 * Matching is case-insensitive; "duplicate_candidate" is accepted as an
 * alias of "duplicate-candidate".
 *
 * @return The category, or std::nullopt for unknown names
 */
std::optional<Category> categoryFromName(const std::string &name);

/**
 * @brief Human-readable one-line description for summaries and the TUI
 */
std::string categoryDescription(Category category);

/**
 * @brief Whether files of this category are generally disposable
 *
 * Logs, temporary files, caches and copies are; documents, media, archives,
 * executables and unclassified files are not.
 */
bool isSafeToDelete(Category category);

#endif // CATEGORY_HPP
