#include "category.hpp"

#include <algorithm>
#include <cctype>

const std::vector<Category> &allCategories() {
  static const std::vector<Category> categories = {
      Category::Log,     Category::Temporary, Category::Cache,
      Category::DuplicateCandidate, Category::Document, Category::Media,
      Category::Archive, Category::Executable, Category::Other};
  return categories;
}

std::string categoryName(Category category) {
  switch (category) {
  case Category::Log:
    return "log";
  case Category::Temporary:
    return "temporary";
  case Category::Cache:
    return "cache";
  case Category::DuplicateCandidate:
    return "duplicate-candidate";
  case Category::Document:
    return "document";
  case Category::Media:
    return "media";
  case Category::Archive:
    return "archive";
  case Category::Executable:
    return "executable";
  case Category::Other:
    return "other";
  }
  return "other";
}

std::optional<Category> categoryFromName(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) {
                   return c == '_' ? '-' : static_cast<char>(std::tolower(c));
                 });

  for (Category category : allCategories()) {
    if (categoryName(category) == lowered) {
      return category;
    }
  }
  return std::nullopt;
}

std::string categoryDescription(Category category) {
  switch (category) {
  case Category::Log:
    return "Log files from applications and system";
  case Category::Temporary:
    return "Temporary files that can be safely deleted";
  case Category::Cache:
    return "Application cache files";
  case Category::DuplicateCandidate:
    return "Backups and copies of other files";
  case Category::Document:
    return "Documents and text files";
  case Category::Media:
    return "Images, audio and video";
  case Category::Archive:
    return "Compressed archives and disk images";
  case Category::Executable:
    return "Programs, installers and libraries";
  case Category::Other:
    return "Unclassified files";
  }
  return "Unclassified files";
}

bool isSafeToDelete(Category category) {
  switch (category) {
  case Category::Log:
  case Category::Temporary:
  case Category::Cache:
  case Category::DuplicateCandidate:
    return true;
  default:
    return false;
  }
}
