/**
 * @file testhelpers.hpp
 * @brief Temporary directory trees for filesystem tests
 */

#ifndef TESTHELPERS_HPP
#define TESTHELPERS_HPP

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "filecategorizer.hpp"

/**
 * @class TempTree
 * @brief Creates a fresh directory on construction, removes it on destruction
 *
 * The directory lives below the system temp directory and is named after the
 * test so parallel test executables never share one.
 */
class TempTree {
public:
    explicit TempTree(const std::string &name) {
        root = std::filesystem::temp_directory_path() /
               ("disksweep_" + name + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
        root = std::filesystem::canonical(root);
    }

    ~TempTree() {
        std::error_code ec;
        // Restore permissions a test may have removed
        std::filesystem::permissions(root, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(root, ec);
    }

    TempTree(const TempTree &) = delete;
    TempTree &operator=(const TempTree &) = delete;

    /**
     * @brief Writes a file below the root, creating parent directories
     * @return Absolute path of the file
     */
    std::filesystem::path write(const std::string &relative,
                                const std::string &content) const {
        std::filesystem::path path = root / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::filesystem::path mkdir(const std::string &relative) const {
        std::filesystem::path path = root / relative;
        std::filesystem::create_directories(path);
        return path;
    }

    std::filesystem::path root;
};

/**
 * @brief Default categorizer without the directory-name rules
 *
 * Test trees live below the temp directory, whose own name would make every
 * file "temporary" under the default rules.
 */
inline FileCategorizer nameOnlyCategorizer() {
    auto rules = FileCategorizer::defaultRules();
    rules.erase(std::remove_if(rules.begin(), rules.end(),
                               [](const CategoryRule &rule) {
                                   return rule.name.size() > 4 &&
                                          rule.name.compare(rule.name.size() - 4, 4, "-dir") == 0;
                               }),
                rules.end());
    return FileCategorizer(std::move(rules));
}

#endif // TESTHELPERS_HPP
