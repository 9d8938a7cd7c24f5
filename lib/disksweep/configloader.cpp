#include "configloader.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const json *find(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return nullptr;
  return &*it;
}

bool readBool(const json &j, const char *key, bool fallback) {
  const json *value = find(j, key);
  if (!value)
    return fallback;
  if (!value->is_boolean())
    throw ConfigError(std::string("'") + key + "' must be true or false");
  return value->get<bool>();
}

std::string readString(const json &j, const char *key,
                       const std::string &fallback) {
  const json *value = find(j, key);
  if (!value)
    return fallback;
  if (!value->is_string())
    throw ConfigError(std::string("'") + key + "' must be a string");
  return value->get<std::string>();
}

/** @brief Sizes are either a non-negative integer or a string for parseSize */
std::uintmax_t readSize(const json &value, const char *key) {
  if (value.is_number_unsigned())
    return value.get<std::uintmax_t>();
  if (value.is_number_integer())
    throw ConfigError(std::string("'") + key + "' must not be negative");
  if (value.is_string()) {
    try {
      return parseSize(value.get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw ConfigError(std::string("'") + key + "': " + e.what());
    }
  }
  throw ConfigError(std::string("'") + key +
                    "' must be a byte count or a size string");
}

std::vector<std::string> readStringList(const json &j, const char *key,
                                        std::vector<std::string> fallback) {
  const json *value = find(j, key);
  if (!value)
    return fallback;
  if (!value->is_array())
    throw ConfigError(std::string("'") + key + "' must be a list of strings");

  std::vector<std::string> items;
  for (const auto &item : *value) {
    if (!item.is_string())
      throw ConfigError(std::string("'") + key + "' must be a list of strings");
    items.push_back(item.get<std::string>());
  }
  return items;
}

const char *LOG_LEVELS[] = {"trace", "debug", "info", "warn",
                            "error", "critical", "off"};

bool isLogLevel(const std::string &name) {
  for (const char *level : LOG_LEVELS) {
    if (name == level)
      return true;
  }
  return false;
}

SweepConfig fromJson(const json &j) {
  if (!j.is_object())
    throw ConfigError("configuration must be a JSON object");

  SweepConfig config;

  std::vector<std::string> defaultExcludes;
  for (const auto &dir : config.excludeDirs)
    defaultExcludes.push_back(dir.string());
  auto excludes = readStringList(j, "exclude_dirs", defaultExcludes);
  config.excludeDirs.assign(excludes.begin(), excludes.end());

  if (const json *value = find(j, "max_file_size"))
    config.maxFileSize = readSize(*value, "max_file_size");
  if (const json *value = find(j, "min_file_size"))
    config.minFileSize = readSize(*value, "min_file_size");
  if (const json *value = find(j, "max_file_age_days")) {
    if (!value->is_number_unsigned() ||
        value->get<std::uintmax_t>() > std::numeric_limits<unsigned int>::max())
      throw ConfigError("'max_file_age_days' must be a non-negative integer");
    config.maxFileAgeDays = value->get<unsigned int>();
  }

  config.safeMode = readBool(j, "safe_mode", config.safeMode);
  config.backupBeforeDelete =
      readBool(j, "backup_before_delete", config.backupBeforeDelete);
  config.backupDir = readString(j, "backup_dir", config.backupDir.string());
  config.useTrash = readBool(j, "use_trash", config.useTrash);
  config.includeHidden = readBool(j, "include_hidden", config.includeHidden);
  config.followSymlinks = readBool(j, "follow_symlinks", config.followSymlinks);
  config.excludedExtensions =
      readStringList(j, "excluded_extensions", config.excludedExtensions);

  config.hashAlgorithm = readString(j, "hash_algorithm", config.hashAlgorithm);
  if (config.hashAlgorithm.empty())
    throw ConfigError("'hash_algorithm' must not be empty");

  if (const json *value = find(j, "workers")) {
    if (!value->is_number_unsigned())
      throw ConfigError("'workers' must be a non-negative integer");
    config.workers = value->get<std::size_t>();
  }

  config.logLevel = readString(j, "log_level", config.logLevel);
  if (!isLogLevel(config.logLevel))
    throw ConfigError("'log_level' must be one of trace, debug, info, warn, "
                      "error, critical, off");

  if (config.backupBeforeDelete && config.backupDir.empty())
    throw ConfigError("'backup_before_delete' requires 'backup_dir'");

  return config;
}

} // namespace

fs::path ConfigLoader::defaultPath() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return fs::path(xdg) / "disksweep" / "config.json";
  if (const char *home = std::getenv("HOME"); home && *home)
    return fs::path(home) / ".config" / "disksweep" / "config.json";
  return fs::path("disksweep.json");
}

SweepConfig ConfigLoader::load(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    spdlog::debug("No configuration at {}, using defaults", path.string());
    return SweepConfig{};
  }

  std::ifstream in(path);
  if (!in)
    throw ConfigError("cannot open configuration file " + path.string());

  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    auto config = parse(buffer.str());
    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
  } catch (const ConfigError &e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

SweepConfig ConfigLoader::parse(const std::string &text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ConfigError(std::string("malformed JSON: ") + e.what());
  }
  return fromJson(j);
}

std::string ConfigLoader::dump(const SweepConfig &config) {
  json j;
  json excludes = json::array();
  for (const auto &dir : config.excludeDirs)
    excludes.push_back(dir.string());
  j["exclude_dirs"] = excludes;
  if (config.maxFileSize)
    j["max_file_size"] = *config.maxFileSize;
  j["min_file_size"] = config.minFileSize;
  if (config.maxFileAgeDays)
    j["max_file_age_days"] = *config.maxFileAgeDays;
  j["safe_mode"] = config.safeMode;
  j["backup_before_delete"] = config.backupBeforeDelete;
  j["backup_dir"] = config.backupDir.string();
  j["use_trash"] = config.useTrash;
  j["include_hidden"] = config.includeHidden;
  j["follow_symlinks"] = config.followSymlinks;
  j["excluded_extensions"] = config.excludedExtensions;
  j["hash_algorithm"] = config.hashAlgorithm;
  j["workers"] = config.workers;
  j["log_level"] = config.logLevel;
  return j.dump(4);
}

void ConfigLoader::save(const SweepConfig &config, const fs::path &path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec)
      throw ConfigError("cannot create " + path.parent_path().string() + ": " +
                        ec.message());
  }

  std::ofstream out(path);
  if (!out)
    throw ConfigError("cannot write configuration file " + path.string());
  out << dump(config) << "\n";
  if (!out)
    throw ConfigError("error while writing " + path.string());
}
