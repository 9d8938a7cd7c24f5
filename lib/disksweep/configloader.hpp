/**
 * @file configloader.hpp
 * @brief JSON persistence of SweepConfig
 */

#ifndef CONFIGLOADER_HPP
#define CONFIGLOADER_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

#include "sweepconfig.hpp"

/**
 * @brief Raised for unreadable or malformed configuration files
 */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @class ConfigLoader
 * @brief Reads and writes the user's disksweep configuration
 *
 * The file is a JSON object with snake_case keys mirroring SweepConfig:
 * @code
 * {
 *   "exclude_dirs": ["/proc", "/home/user/keep"],
 *   "max_file_size": "2GiB",
 *   "safe_mode": true,
 *   "backup_before_delete": true,
 *   "backup_dir": "/home/user/.local/share/disksweep/backup",
 *   "hash_algorithm": "sha256"
 * }
 * @endcode
 *
 * Keys that are absent keep their defaults, unknown keys are ignored. A key
 * with the wrong type or an invalid value makes load() throw ConfigError.
 */
class ConfigLoader {
public:
  /**
   * @brief $XDG_CONFIG_HOME/disksweep/config.json, or
   *        ~/.config/disksweep/config.json when XDG_CONFIG_HOME is unset
   */
  static std::filesystem::path defaultPath();

  /**
   * @brief Loads a configuration file
   *
   * @param path File to read; a missing file yields the defaults
   * @throws ConfigError if the file cannot be read or holds invalid values
   */
  static SweepConfig load(const std::filesystem::path &path);

  /**
   * @brief Parses configuration from JSON text
   * @throws ConfigError on syntax errors or invalid values
   */
  static SweepConfig parse(const std::string &text);

  /**
   * @brief Writes a configuration, creating parent directories as needed
   * @throws ConfigError if the file cannot be written
   */
  static void save(const SweepConfig &config,
                   const std::filesystem::path &path);

  /** @brief Serializes a configuration as indented JSON */
  static std::string dump(const SweepConfig &config);
};

#endif // CONFIGLOADER_HPP
