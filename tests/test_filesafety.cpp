/**
 * @file test_filesafety.cpp
 * @brief Unit tests for the FileSafety class
 *
 * This file contains Google Test unit tests that verify the protected-path
 * policy used in safe mode: system path and system tree protection, home
 * directory protection, the scan-root boundary, virtual filesystem detection
 * and mount point detection.
 *
 * @see FileSafety
 */

#include <gtest/gtest.h>
#include "filesafety.hpp"
#include "testhelpers.hpp"

#include <cstdlib>

/**
 * @class FileSafetyTest
 * @brief Test fixture for FileSafety unit tests
 *
 * Provides a fresh temporary directory holding one regular file. Temporary
 * filesystems are not protected, so the file is a legitimate cleanup target.
 */
class FileSafetyTest : public ::testing::Test {
protected:
    TempTree tree{"safety"};
    std::filesystem::path test_file;

    void SetUp() override {
        test_file = tree.write("test.txt", "test");
    }
};

/**
 * @test BlocksSystemPaths
 * @brief Verifies that critical system directories are blocked from deletion
 *
 * Expected behavior: All return DeletionStatus::BlockedSystemPath
 *
 * @see FileSafety::CRITICAL_PATHS
 */
TEST_F(FileSafetyTest, BlocksSystemPaths) {
    EXPECT_EQ(FileSafety::checkDeletion("/"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/etc"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/usr/"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/proc"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/tmp"),
              FileSafety::DeletionStatus::BlockedSystemPath);
}

/**
 * @test BlocksFilesInsideSystemTrees
 * @brief Files below /etc, /usr or /var/lib are protected, not just the
 *        directories themselves
 *
 * @see FileSafety::SYSTEM_TREES
 */
TEST_F(FileSafetyTest, BlocksFilesInsideSystemTrees) {
    EXPECT_EQ(FileSafety::checkDeletion("/etc/passwd"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/usr/lib/libc.so.6"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/var/lib/dpkg/status"),
              FileSafety::DeletionStatus::BlockedSystemPath);
    EXPECT_EQ(FileSafety::checkDeletion("/usr/../etc/shadow"),
              FileSafety::DeletionStatus::BlockedSystemPath);

    // Prefixes match whole components only
    EXPECT_FALSE(FileSafety::isSystemPath("/etcetera/file"));
    EXPECT_FALSE(FileSafety::isSystemPath("/var/log/old.log"));
}

/**
 * @test BlocksUserHome
 * @brief Verifies that the user's home directory is never permitted
 *
 * When HOME is itself a critical path (/root) the system check fires first.
 *
 * @see FileSafety::isUserHome()
 */
TEST_F(FileSafetyTest, BlocksUserHome) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);

    auto status = FileSafety::checkDeletion(home);
    EXPECT_FALSE(FileSafety::isDeletionPermitted(status));
    if (!FileSafety::isSystemPath(std::filesystem::path(home).lexically_normal().string())) {
        EXPECT_EQ(status, FileSafety::DeletionStatus::BlockedHome);
    }
}

/**
 * @test AllowsNormalFiles
 * @brief Verifies that regular files in non-protected locations are allowed
 */
TEST_F(FileSafetyTest, AllowsNormalFiles) {
    EXPECT_EQ(FileSafety::checkDeletion(test_file.string()),
              FileSafety::DeletionStatus::Allowed);
    EXPECT_EQ(FileSafety::checkDeletion(test_file.string(), {tree.root}),
              FileSafety::DeletionStatus::Allowed);
}

/**
 * @test BlocksPathsOutsideScanRoots
 * @brief With covered roots given, everything outside them is blocked
 */
TEST_F(FileSafetyTest, BlocksPathsOutsideScanRoots) {
    auto scanned = tree.mkdir("scanned");
    auto inside = tree.write("scanned/inner/file.bin", "x");
    auto outside = tree.write("elsewhere.bin", "x");
    auto sibling = tree.write("scanned-not/file.bin", "x");

    std::vector<std::filesystem::path> roots{scanned};
    EXPECT_EQ(FileSafety::checkDeletion(inside.string(), roots),
              FileSafety::DeletionStatus::Allowed);
    EXPECT_EQ(FileSafety::checkDeletion(outside.string(), roots),
              FileSafety::DeletionStatus::BlockedOutsideScanRoots);
    EXPECT_EQ(FileSafety::checkDeletion(sibling.string(), roots),
              FileSafety::DeletionStatus::BlockedOutsideScanRoots);

    EXPECT_TRUE(FileSafety::isInsideRoots(inside.string(), roots));
    EXPECT_FALSE(FileSafety::isInsideRoots(sibling.string(), roots));
    EXPECT_FALSE(FileSafety::isInsideRoots(inside.string(), {}));
}

/**
 * @test DetectsVirtualFilesystems
 * @brief Verifies detection of virtual and pseudo-filesystems
 *
 * /proc/self is below a system tree, so the filesystem check is exercised
 * directly.
 *
 * @see FileSafety::isProtectedFilesystem()
 */
TEST_F(FileSafetyTest, DetectsVirtualFilesystems) {
    EXPECT_TRUE(FileSafety::isProtectedFilesystem("/proc/self"));
    EXPECT_FALSE(FileSafety::isProtectedFilesystem(test_file.string()));

    // statfs failure counts as protected
    EXPECT_TRUE(FileSafety::isProtectedFilesystem((tree.root / "missing").string()));
}

/**
 * @test GetsMountPoints
 * @brief Verifies retrieval of system mount point information
 *
 * Expected behavior:
 * - Returns non-empty vector of mount points
 * - Root filesystem (/) is present in the list and flagged is_root
 *
 * @see FileSafety::getMountPoints()
 */
TEST_F(FileSafetyTest, GetsMountPoints) {
    auto mounts = FileSafety::getMountPoints();

    EXPECT_FALSE(mounts.empty());

    bool has_root = false;
    for (const auto& mount : mounts) {
        if (mount.mountpoint == "/") {
            has_root = true;
            EXPECT_TRUE(mount.is_root);
            break;
        }
    }
    EXPECT_TRUE(has_root);
    EXPECT_TRUE(FileSafety::isMountPoint("/"));
    EXPECT_FALSE(FileSafety::isMountPoint(test_file.string()));
}

/**
 * @test FindsOwningMount
 * @brief The longest matching mountpoint wins; prefixes match whole
 *        components only
 */
TEST_F(FileSafetyTest, FindsOwningMount) {
    std::vector<FileSafety::MountInfo> mounts(4);
    mounts[0].mountpoint = "/";
    mounts[0].is_root = true;
    mounts[1].mountpoint = "/media/usb";
    mounts[1].is_removable = true;
    mounts[2].mountpoint = "/media/usb/nested";
    mounts[3].mountpoint = "/data";

    auto mount = FileSafety::findMount("/media/usb/photos/a.jpg", mounts);
    ASSERT_TRUE(mount.has_value());
    EXPECT_EQ(mount->mountpoint, "/media/usb");
    EXPECT_TRUE(mount->is_removable);

    EXPECT_EQ(FileSafety::findMount("/media/usb/nested/x", mounts)->mountpoint,
              "/media/usb/nested");
    EXPECT_EQ(FileSafety::findMount("/database/x", mounts)->mountpoint, "/");
    EXPECT_FALSE(FileSafety::findMount("/x", {}).has_value());
}

/**
 * @test StatusMessages
 * @brief Verifies generation of human-readable status messages
 *
 * Messages include both the reason and the path being checked.
 */
TEST_F(FileSafetyTest, StatusMessages) {
    auto msg = FileSafety::getStatusMessage(
        FileSafety::DeletionStatus::BlockedSystemPath,
        "/etc"
    );
    EXPECT_NE(msg.find("system"), std::string::npos);
    EXPECT_NE(msg.find("/etc"), std::string::npos);

    msg = FileSafety::getStatusMessage(
        FileSafety::DeletionStatus::BlockedOutsideScanRoots, "/data/x");
    EXPECT_NE(msg.find("outside"), std::string::npos);
}

TEST_F(FileSafetyTest, WarningsStillPermitDeletion) {
    EXPECT_TRUE(FileSafety::isDeletionPermitted(FileSafety::DeletionStatus::Allowed));
    EXPECT_TRUE(FileSafety::isDeletionPermitted(
        FileSafety::DeletionStatus::WarningRemovableMedia));
    EXPECT_FALSE(FileSafety::isDeletionPermitted(
        FileSafety::DeletionStatus::BlockedMountPoint));
}

/**
 * @test IsUserHome
 * @brief Verifies user home directory detection
 *
 * @note Test is conditional on HOME environment variable being set
 */
TEST_F(FileSafetyTest, IsUserHome) {
    const char* home = std::getenv("HOME");
    if (home) {
        EXPECT_TRUE(FileSafety::isUserHome(
            std::filesystem::path(home).lexically_normal().string()));
        EXPECT_FALSE(FileSafety::isUserHome(test_file.string()));
    }
}
