/**
 * @file test_cleaner.cpp
 * @brief Unit tests for the Cleaner class
 *
 * This file contains Google Test unit tests that verify per-path cleanup
 * outcomes: deletion, skipped and failed paths, safe mode, backups,
 * cancellation and progress reporting.
 *
 * @see Cleaner
 * @see CleanupOutcome
 */

#include <gtest/gtest.h>
#include "cleaner.hpp"
#include "testhelpers.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

using Status = CleanupOutcome::Status;
using Reason = CleanupOutcome::Reason;

/**
 * @class CleanerTest
 * @brief Test fixture providing a temporary tree treated as the scan root
 *
 * options.coveredRoots is set to the tree, as a ScanSession would do for its
 * scan root.
 */
class CleanerTest : public ::testing::Test {
protected:
    TempTree tree{"cleaner"};
    CleanupOptions options;

    void SetUp() override {
        options.coveredRoots = {tree.root};
    }

    static std::string readFile(const fs::path &path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }
};

/**
 * @test DeletesSelectedFiles
 * @brief Every selected file is removed and its size reported as freed
 */
TEST_F(CleanerTest, DeletesSelectedFiles) {
    auto a = tree.write("a.tmp", std::string(100, 'a'));
    auto b = tree.write("sub/b.log", std::string(50, 'b'));

    auto outcomes = Cleaner(options).clean({a, b});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].path, a);
    EXPECT_EQ(outcomes[0].status, Status::Deleted);
    EXPECT_EQ(outcomes[0].bytesFreed, 100u);
    EXPECT_EQ(outcomes[1].status, Status::Deleted);
    EXPECT_EQ(outcomes[1].bytesFreed, 50u);
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(b));
    EXPECT_TRUE(fs::exists(tree.root / "sub")) << "directories are never removed";
}

/**
 * @test AlreadyGoneDoesNotStopTheBatch
 * @brief A path removed externally after the scan is skipped, the rest
 *        of the selection is still processed
 */
TEST_F(CleanerTest, AlreadyGoneDoesNotStopTheBatch) {
    auto gone = tree.write("gone.tmp", "x");
    auto kept = tree.write("next.tmp", "yy");
    fs::remove(gone);

    auto outcomes = Cleaner(options).clean({gone, kept});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].status, Status::Skipped);
    EXPECT_EQ(outcomes[0].reason, Reason::AlreadyGone);
    EXPECT_EQ(outcomes[0].bytesFreed, 0u);
    EXPECT_EQ(outcomes[1].status, Status::Deleted);
    EXPECT_FALSE(fs::exists(kept));
}

TEST_F(CleanerTest, SkipsDirectoriesAndLinks) {
    auto dir = tree.mkdir("folder");
    auto target = tree.write("target.txt", "data");
    auto link = tree.root / "link.txt";
    fs::create_symlink(target, link);

    auto outcomes = Cleaner(options).clean({dir, link});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].reason, Reason::NotRegularFile);
    EXPECT_EQ(outcomes[1].reason, Reason::NotRegularFile);
    EXPECT_TRUE(fs::exists(dir));
    EXPECT_TRUE(fs::exists(target));
}

/**
 * @test SafeModeProtectsSystemFiles
 * @brief System files and files outside the scan root are never touched
 */
TEST_F(CleanerTest, SafeModeProtectsSystemFiles) {
    TempTree other("cleaner_other");
    auto outside = other.write("outside.tmp", "keep me");

    auto outcomes = Cleaner(options).clean({"/etc/passwd", outside});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].status, Status::Skipped);
    EXPECT_EQ(outcomes[0].reason, Reason::Protected);
    EXPECT_NE(outcomes[0].detail.find("system"), std::string::npos);
    EXPECT_EQ(outcomes[1].status, Status::Skipped);
    EXPECT_EQ(outcomes[1].reason, Reason::Protected);
    EXPECT_EQ(readFile(outside), "keep me");
}

/**
 * @test UnsafeModeIgnoresScanRoots
 * @brief With safe mode off, the scan-root boundary no longer applies
 */
TEST_F(CleanerTest, UnsafeModeIgnoresScanRoots) {
    TempTree other("cleaner_unsafe");
    auto outside = other.write("outside.tmp", "bye");

    options.safeMode = false;
    auto outcomes = Cleaner(options).clean({outside});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, Status::Deleted);
    EXPECT_FALSE(fs::exists(outside));
}

/**
 * @test LinkedDirectoryCannotLeaveScanRoot
 * @brief A directory symlink inside the root that points elsewhere does not
 *        make its target removable
 *
 * The selected path is lexically below the root, but the file it names
 * lives outside; safe mode judges the real location.
 */
TEST_F(CleanerTest, LinkedDirectoryCannotLeaveScanRoot) {
    TempTree outside("cleaner_linked");
    auto victim = outside.write("victim.txt", "not yours");
    fs::create_directory_symlink(outside.root, tree.root / "link");

    auto outcomes = Cleaner(options).clean({tree.root / "link" / "victim.txt"});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].path, tree.root / "link" / "victim.txt");
    EXPECT_EQ(outcomes[0].status, Status::Skipped);
    EXPECT_EQ(outcomes[0].reason, Reason::Protected);
    EXPECT_NE(outcomes[0].detail.find(victim.string()), std::string::npos);
    EXPECT_EQ(readFile(victim), "not yours");
}

TEST_F(CleanerTest, LinkedDirectoryInsideRootIsRemovable) {
    auto file = tree.write("real/data.tmp", "1234");
    fs::create_directory_symlink(tree.root / "real", tree.root / "alias");

    auto outcomes = Cleaner(options).clean({tree.root / "alias" / "data.tmp"});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, Status::Deleted);
    EXPECT_EQ(outcomes[0].bytesFreed, 4u);
    EXPECT_FALSE(fs::exists(file));
    EXPECT_TRUE(fs::is_symlink(tree.root / "alias"));
}

/**
 * @test UninspectablePathIsAFailure
 * @brief Only a path that is really absent counts as already gone
 *
 * A symbolic link loop (ELOOP) and an over-long file name (ENAMETOOLONG)
 * both make lstat fail without saying anything about the file. Neither
 * depends on the permissions of the test user.
 */
TEST_F(CleanerTest, UninspectablePathIsAFailure) {
    fs::create_symlink(tree.root / "loop_b", tree.root / "loop_a");
    fs::create_symlink(tree.root / "loop_a", tree.root / "loop_b");
    fs::path looped = tree.root / "loop_a" / "file.txt";
    fs::path tooLong = tree.root / std::string(300, 'n');

    auto outcomes = Cleaner(options).clean({looped, tooLong});

    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto &outcome : outcomes) {
        EXPECT_EQ(outcome.status, Status::Failed) << outcome.path;
        EXPECT_EQ(outcome.reason, Reason::StatFailed) << outcome.path;
        EXPECT_FALSE(outcome.detail.empty());
    }
    EXPECT_EQ(Cleaner::summarize(outcomes).failed, 2u);
}

/**
 * @test BackupMirrorsAbsolutePath
 * @brief With backups on, the file is copied below backupDir first
 */
TEST_F(CleanerTest, BackupMirrorsAbsolutePath) {
    TempTree backups("cleaner_backup");
    auto file = tree.write("docs/report.pdf", "pdf bytes");

    options.backupBeforeDelete = true;
    options.backupDir = backups.root;
    auto outcomes = Cleaner(options).clean({file});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, Status::BackedUpAndDeleted);
    EXPECT_EQ(outcomes[0].bytesFreed, 9u);

    fs::path expected = backups.root / file.relative_path();
    EXPECT_EQ(outcomes[0].backupPath, expected);
    EXPECT_EQ(readFile(expected), "pdf bytes");
    EXPECT_FALSE(fs::exists(file));
}

/**
 * @test FailedBackupKeepsOriginal
 * @brief A backup directory that cannot be created fails the path and
 *        leaves the original untouched
 */
TEST_F(CleanerTest, FailedBackupKeepsOriginal) {
    TempTree backups("cleaner_badbackup");
    auto blocker = backups.write("not-a-dir", "regular file");
    auto file = tree.write("keep.dat", "original");

    options.backupBeforeDelete = true;
    options.backupDir = blocker / "backups";
    auto outcomes = Cleaner(options).clean({file});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, Status::Failed);
    EXPECT_EQ(outcomes[0].reason, Reason::BackupFailed);
    EXPECT_FALSE(outcomes[0].detail.empty());
    EXPECT_EQ(outcomes[0].bytesFreed, 0u);
    EXPECT_EQ(readFile(file), "original");
}

TEST_F(CleanerTest, BackupWithoutDirectoryFails) {
    auto file = tree.write("keep.dat", "original");
    options.backupBeforeDelete = true;

    auto outcomes = Cleaner(options).clean({file});
    EXPECT_EQ(outcomes[0].reason, Reason::BackupFailed);
    EXPECT_TRUE(fs::exists(file));
}

/**
 * @test CancelledBatchSkipsRemainingPaths
 * @brief Every path after cancellation is Skipped(Cancelled), one outcome
 *        per path is still produced
 */
TEST_F(CleanerTest, CancelledBatchSkipsRemainingPaths) {
    auto a = tree.write("a", "1");
    auto b = tree.write("b", "2");
    CancellationToken token;
    token.cancel();

    auto outcomes = Cleaner(options).clean({a, b}, nullptr, &token);

    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto &outcome : outcomes) {
        EXPECT_EQ(outcome.status, Status::Skipped);
        EXPECT_EQ(outcome.reason, Reason::Cancelled);
    }
    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));
}

/**
 * @class CleanerTrashTest
 * @brief Cleaner fixture with useTrash on and a private trash directory
 */
class CleanerTrashTest : public CleanerTest {
protected:
    TempTree trash{"cleaner_trash"};

    void SetUp() override {
        CleanerTest::SetUp();
        options.useTrash = true;
        options.trashDir = trash.root;
    }
};

/**
 * @test MovesFileWithTrashInfo
 * @brief The file lands in files/ and info/ records where it came from
 */
TEST_F(CleanerTrashTest, MovesFileWithTrashInfo) {
    auto file = tree.write("old report.pdf", "pdf bytes");

    auto outcomes = Cleaner(options).clean({file});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, Status::Trashed);
    EXPECT_EQ(outcomes[0].reason, Reason::None);
    EXPECT_EQ(outcomes[0].bytesFreed, 9u);
    EXPECT_TRUE(outcomes[0].isRemoved());
    EXPECT_FALSE(fs::exists(file));

    fs::path moved = trash.root / "files" / "old report.pdf";
    EXPECT_EQ(outcomes[0].trashPath, moved);
    EXPECT_EQ(readFile(moved), "pdf bytes");

    std::string info = readFile(trash.root / "info" / "old report.pdf.trashinfo");
    EXPECT_EQ(info.rfind("[Trash Info]\n", 0), 0u);
    EXPECT_NE(info.find("Path=" + tree.root.string() + "/old%20report.pdf\n"),
              std::string::npos);
    EXPECT_NE(info.find("DeletionDate="), std::string::npos);
}

TEST_F(CleanerTrashTest, SameNameGetsSuffix) {
    auto first = tree.write("a/notes.txt", "first");
    auto second = tree.write("b/notes.txt", "second");

    auto outcomes = Cleaner(options).clean({first, second});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].trashPath, trash.root / "files" / "notes.txt");
    EXPECT_EQ(outcomes[1].trashPath, trash.root / "files" / "notes.2.txt");
    EXPECT_EQ(readFile(outcomes[0].trashPath), "first");
    EXPECT_EQ(readFile(outcomes[1].trashPath), "second");
    EXPECT_TRUE(fs::exists(trash.root / "info" / "notes.2.txt.trashinfo"));

    auto summary = Cleaner::summarize(outcomes);
    EXPECT_EQ(summary.trashed, 2u);
    EXPECT_EQ(summary.deleted, 0u);
    EXPECT_EQ(summary.bytesFreed, 11u);
}

/**
 * @test UnusableTrashKeepsFile
 * @brief A trash directory that cannot be created fails the path and
 *        leaves the file where it was
 */
TEST_F(CleanerTrashTest, UnusableTrashKeepsFile) {
    auto blocker = trash.write("plain-file", "x");
    auto file = tree.write("keep.log", "log line");
    options.trashDir = blocker / "Trash";

    auto outcomes = Cleaner(options).clean({file});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, Status::Failed);
    EXPECT_EQ(outcomes[0].reason, Reason::TrashFailed);
    EXPECT_EQ(readFile(file), "log line");
}

TEST_F(CleanerTrashTest, SafeModeStillApplies) {
    TempTree other("cleaner_trash_other");
    auto outside = other.write("outside.tmp", "stay");

    auto outcomes = Cleaner(options).clean({outside});

    EXPECT_EQ(outcomes[0].reason, Reason::Protected);
    EXPECT_TRUE(fs::exists(outside));
    EXPECT_FALSE(fs::exists(trash.root / "files" / "outside.tmp"));
}

TEST(CleanerTrashLocationTest, FollowsXdgDataHome) {
    const char *saved = std::getenv("XDG_DATA_HOME");
    std::string previous = saved ? saved : "";

    ::setenv("XDG_DATA_HOME", "/data/home", 1);
    EXPECT_EQ(Cleaner::defaultTrashDir(), fs::path("/data/home/Trash"));

    ::unsetenv("XDG_DATA_HOME");
    const char *home = std::getenv("HOME");
    if (home && *home) {
        EXPECT_EQ(Cleaner::defaultTrashDir(),
                  fs::path(home) / ".local" / "share" / "Trash");
    }

    if (saved) {
        ::setenv("XDG_DATA_HOME", previous.c_str(), 1);
    }
}

TEST_F(CleanerTest, ReportsProgress) {
    auto a = tree.write("a", "1234");
    auto b = tree.write("b", "56");
    ProgressTracker progress;

    Cleaner(options).clean({a, b, tree.root / "missing"}, &progress);

    // finish() returns to Idle but keeps the counters
    auto snap = progress.snapshot();
    EXPECT_EQ(snap.phase, Phase::Idle);
    EXPECT_EQ(snap.itemsProcessed, 3u);
    ASSERT_TRUE(snap.itemsTotal.has_value());
    EXPECT_EQ(*snap.itemsTotal, 3u);
    EXPECT_EQ(snap.bytesProcessed, 6u);
}

TEST_F(CleanerTest, EstimateAndSummary) {
    auto a = tree.write("a", std::string(10, 'a'));
    auto b = tree.write("b", std::string(20, 'b'));
    auto dir = tree.mkdir("d");

    EXPECT_EQ(Cleaner::estimateCleanupSize({a, b, dir, tree.root / "missing"}), 30u);

    auto outcomes = Cleaner(options).clean({a, "/etc/passwd", tree.root / "missing"});
    auto summary = Cleaner::summarize(outcomes);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_EQ(summary.backedUp, 0u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.skipped, 2u);
    EXPECT_EQ(summary.bytesFreed, 10u);
}

TEST(CleanupOutcomeTest, Names) {
    EXPECT_EQ(statusName(CleanupOutcome::Status::BackedUpAndDeleted),
              "backed-up-and-deleted");
    EXPECT_EQ(reasonName(CleanupOutcome::Reason::AlreadyGone), "already-gone");
    EXPECT_EQ(reasonName(CleanupOutcome::Reason::BackupFailed), "backup-failed");
    EXPECT_EQ(statusName(CleanupOutcome::Status::Trashed), "moved-to-trash");
    EXPECT_EQ(reasonName(CleanupOutcome::Reason::StatFailed), "stat-failed");
}
