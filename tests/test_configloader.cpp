/**
 * @file test_configloader.cpp
 * @brief Unit tests for the ConfigLoader class
 *
 * This file contains Google Test unit tests that verify JSON configuration
 * parsing, validation, defaults and round-tripping through a file.
 *
 * @see ConfigLoader
 * @see SweepConfig
 */

#include <gtest/gtest.h>
#include "configloader.hpp"
#include "testhelpers.hpp"

#include <cstdlib>

/**
 * @test EmptyObjectGivesDefaults
 * @brief Every key is optional
 */
TEST(ConfigLoaderTest, EmptyObjectGivesDefaults) {
    SweepConfig config = ConfigLoader::parse("{}");
    SweepConfig defaults;

    EXPECT_EQ(config.excludeDirs, defaults.excludeDirs);
    EXPECT_FALSE(config.maxFileSize.has_value());
    EXPECT_EQ(config.minFileSize, 0u);
    EXPECT_FALSE(config.maxFileAgeDays.has_value());
    EXPECT_TRUE(config.safeMode);
    EXPECT_FALSE(config.backupBeforeDelete);
    EXPECT_FALSE(config.useTrash);
    EXPECT_FALSE(config.includeHidden);
    EXPECT_FALSE(config.followSymlinks);
    EXPECT_EQ(config.hashAlgorithm, "sha256");
    EXPECT_EQ(config.workers, 0u);
    EXPECT_EQ(config.logLevel, "info");
}

/**
 * @test ParsesAllKeys
 * @brief Snake_case keys map onto SweepConfig fields
 */
TEST(ConfigLoaderTest, ParsesAllKeys) {
    SweepConfig config = ConfigLoader::parse(R"({
        "exclude_dirs": ["/mnt/archive", "/srv"],
        "max_file_size": "500MB",
        "min_file_size": 1,
        "max_file_age_days": 365,
        "safe_mode": false,
        "backup_before_delete": true,
        "backup_dir": "/var/backups/disksweep",
        "use_trash": true,
        "include_hidden": true,
        "follow_symlinks": true,
        "excluded_extensions": [".iso", "vmdk"],
        "hash_algorithm": "fnv1a",
        "workers": 3,
        "log_level": "debug"
    })");

    EXPECT_EQ(config.excludeDirs,
              (std::vector<std::filesystem::path>{"/mnt/archive", "/srv"}));
    ASSERT_TRUE(config.maxFileSize.has_value());
    EXPECT_EQ(*config.maxFileSize, 500000000u);
    EXPECT_EQ(config.minFileSize, 1u);
    EXPECT_EQ(config.maxFileAgeDays, 365u);
    EXPECT_FALSE(config.safeMode);
    EXPECT_TRUE(config.useTrash);
    EXPECT_TRUE(config.backupBeforeDelete);
    EXPECT_EQ(config.backupDir, "/var/backups/disksweep");
    EXPECT_TRUE(config.includeHidden);
    EXPECT_TRUE(config.followSymlinks);
    EXPECT_EQ(config.excludedExtensions, (std::vector<std::string>{".iso", "vmdk"}));
    EXPECT_EQ(config.hashAlgorithm, "fnv1a");
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.logLevel, "debug");

    auto scan = config.scanOptions();
    EXPECT_EQ(scan.maxFileSize, config.maxFileSize);
    EXPECT_EQ(scan.maxFileAgeDays, 365u);
    EXPECT_TRUE(scan.followSymlinks);

    auto cleanup = config.cleanupOptions({"/data"});
    EXPECT_FALSE(cleanup.safeMode);
    EXPECT_EQ(cleanup.backupDir, config.backupDir);
    EXPECT_TRUE(cleanup.useTrash);
    EXPECT_EQ(cleanup.coveredRoots, (std::vector<std::filesystem::path>{"/data"}));
}

TEST(ConfigLoaderTest, NullMeansDefault) {
    SweepConfig config = ConfigLoader::parse(R"({"max_file_size": null, "workers": null})");
    EXPECT_FALSE(config.maxFileSize.has_value());
    EXPECT_EQ(config.workers, 0u);
}

/**
 * @test RejectsInvalidValues
 * @brief Wrong types and out-of-range values are ConfigErrors
 */
TEST(ConfigLoaderTest, RejectsInvalidValues) {
    EXPECT_THROW(ConfigLoader::parse(R"({"safe_mode": "yes"})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"max_file_size": -1})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"max_file_size": "huge"})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"max_file_size": 1.5})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"exclude_dirs": "/srv"})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"exclude_dirs": [1]})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"hash_algorithm": ""})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"workers": -2})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"max_file_age_days": -7})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"max_file_age_days": "old"})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"use_trash": 1})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"log_level": "verbose"})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"({"backup_before_delete": true})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse(R"([1, 2])"), ConfigError);
}

TEST(ConfigLoaderTest, RejectsMalformedJson) {
    try {
        ConfigLoader::parse("{ \"safe_mode\": ");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("malformed"), std::string::npos);
    }
}

/**
 * @test MissingFileGivesDefaults
 */
TEST(ConfigLoaderTest, MissingFileGivesDefaults) {
    TempTree tree("config_missing");
    SweepConfig config = ConfigLoader::load(tree.root / "nope.json");
    EXPECT_EQ(config.hashAlgorithm, "sha256");
    EXPECT_TRUE(config.safeMode);
}

/**
 * @test SaveThenLoad
 * @brief A saved configuration loads back unchanged; errors name the file
 */
TEST(ConfigLoaderTest, SaveThenLoad) {
    TempTree tree("config_save");
    auto path = tree.root / "nested" / "config.json";

    SweepConfig config;
    config.maxFileSize = 4096;
    config.excludeDirs = {"/mnt"};
    config.backupBeforeDelete = true;
    config.backupDir = "/backups";
    config.hashAlgorithm = "sha512";
    config.workers = 2;
    config.maxFileAgeDays = 90;
    config.useTrash = true;
    ConfigLoader::save(config, path);

    SweepConfig loaded = ConfigLoader::load(path);
    EXPECT_EQ(loaded.maxFileSize, config.maxFileSize);
    EXPECT_EQ(loaded.excludeDirs, config.excludeDirs);
    EXPECT_TRUE(loaded.backupBeforeDelete);
    EXPECT_EQ(loaded.backupDir, config.backupDir);
    EXPECT_EQ(loaded.hashAlgorithm, "sha512");
    EXPECT_EQ(loaded.workers, 2u);
    EXPECT_EQ(loaded.maxFileAgeDays, 90u);
    EXPECT_TRUE(loaded.useTrash);

    auto broken = tree.write("broken.json", R"({"workers": "many"})");
    try {
        ConfigLoader::load(broken);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("broken.json"), std::string::npos);
    }
}

TEST(ConfigLoaderTest, DefaultPathFollowsXdg) {
    const char *old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";

    ::setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
    EXPECT_EQ(ConfigLoader::defaultPath(), "/xdg/config/disksweep/config.json");

    ::unsetenv("XDG_CONFIG_HOME");
    if (const char *home = std::getenv("HOME")) {
        EXPECT_EQ(ConfigLoader::defaultPath(),
                  std::filesystem::path(home) / ".config" / "disksweep" / "config.json");
    }

    if (old) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    }
}
