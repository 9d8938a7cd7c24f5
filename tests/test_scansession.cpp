/**
 * @file test_scansession.cpp
 * @brief Unit tests for the ScanSession pipeline
 *
 * These tests run the whole scan → categorize → deduplicate pipeline on a
 * temporary tree and clean through the session.
 *
 * @see ScanSession
 */

#include <gtest/gtest.h>
#include "scansession.hpp"
#include "testhelpers.hpp"

#include <atomic>
#include <future>

namespace fs = std::filesystem;

/**
 * @class ScanSessionTest
 * @brief Fixture with a small tree holding one duplicate pair
 */
class ScanSessionTest : public ::testing::Test {
protected:
    TempTree tree{"session"};
    SweepConfig config;
    fs::path a, b, c;

    void SetUp() override {
        a = tree.write("photos/a.jpg", std::string(2000, 'p'));
        b = tree.write("backup/a-copy.jpg", std::string(2000, 'p'));
        c = tree.write("notes.txt", "unique");
        config.workers = 2;
    }
};

/**
 * @test RunsFullPipeline
 * @brief After wait() the results hold records, groups and statistics
 */
TEST_F(ScanSessionTest, RunsFullPipeline) {
    auto session = ScanSession::start(tree.root, config);
    session->wait();

    ASSERT_TRUE(session->isFinished());
    const ScanResult &result = session->results();

    EXPECT_FALSE(result.isCancelled());
    EXPECT_EQ(result.root, tree.root);
    EXPECT_EQ(result.records.size(), 3u);
    ASSERT_EQ(result.duplicateGroups.size(), 1u);
    EXPECT_EQ(result.duplicateGroups[0].paths, (std::vector<fs::path>{b, a}));
    EXPECT_EQ(result.statistics.totalFiles, 3u);
    EXPECT_EQ(result.statistics.totalBytes, 4006u);
    EXPECT_EQ(result.statistics.duplicateFiles, 2u);
    EXPECT_EQ(result.statistics.wastedBytes, 2000u);
    EXPECT_EQ(result.redundantDuplicates(), (std::vector<fs::path>{a}));

    auto snap = session->pollProgress();
    EXPECT_EQ(snap.phase, Phase::Idle);
}

/**
 * @test MissingRootIsReportedByResults
 * @brief start() succeeds; results() rethrows the ScanError
 */
TEST_F(ScanSessionTest, MissingRootIsReportedByResults) {
    auto session = ScanSession::start(tree.root / "does-not-exist", config);
    session->wait();
    EXPECT_THROW(session->results(), ScanError);
}

TEST_F(ScanSessionTest, UnknownHashAlgorithmThrowsAtStart) {
    config.hashAlgorithm = "no-such-digest";
    EXPECT_THROW(ScanSession::start(tree.root, config), std::invalid_argument);
}

/**
 * @test CancelledSessionKeepsPartialResults
 * @brief Cancellation marks the results instead of discarding them
 *
 * The categorizer holds the scan on its first file until the test has
 * requested cancellation, so the cancel always lands mid-scan.
 */
TEST_F(ScanSessionTest, CancelledSessionKeepsPartialResults) {
    for (int i = 0; i < 200; ++i) {
        tree.write("bulk/" + std::to_string(i) + ".bin", std::string(64, 'b'));
    }

    std::promise<void> reached;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<int> seen{0};
    std::vector<CategoryRule> rules = {
        {"hold-first-file", Category::Other, [&](const CategoryInput &) {
             if (seen++ == 0) {
                 reached.set_value();
                 released.wait();
             }
             return false;
         }}};

    auto session = ScanSession::start(tree.root, config, FileCategorizer(std::move(rules)));
    reached.get_future().wait();
    session->requestCancel();
    session->requestCancel();
    release.set_value();
    session->wait();

    const ScanResult &result = session->results();
    EXPECT_TRUE(result.isCancelled());
    EXPECT_EQ(seen.load(), 1);
    EXPECT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.duplicateGroups.empty());
    EXPECT_TRUE(session->pollProgress().cancelled);
}

/**
 * @test CleansInsideScanRoot
 * @brief clean() removes selected files and refuses paths outside the root
 */
TEST_F(ScanSessionTest, CleansInsideScanRoot) {
    TempTree other("session_other");
    auto outside = other.write("elsewhere.jpg", "x");

    auto session = ScanSession::start(tree.root, config);
    session->wait();
    auto selection = session->results().redundantDuplicates();
    selection.push_back(outside);

    auto outcomes = session->clean(selection);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].path, a);
    EXPECT_EQ(outcomes[0].status, CleanupOutcome::Status::Deleted);
    EXPECT_EQ(outcomes[1].status, CleanupOutcome::Status::Skipped);
    EXPECT_EQ(outcomes[1].reason, CleanupOutcome::Reason::Protected);
    EXPECT_FALSE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));
    EXPECT_TRUE(fs::exists(outside));

    // The results describe the tree as scanned
    EXPECT_EQ(session->results().records.size(), 3u);
}

/**
 * @test CleanAfterCancelledScan
 * @brief Cancelling the scan does not pre-cancel a later cleanup
 */
TEST_F(ScanSessionTest, CleanAfterCancelledScan) {
    auto session = ScanSession::start(tree.root, config);
    session->requestCancel();
    session->wait();

    auto outcomes = session->clean({c});
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, CleanupOutcome::Status::Deleted);
}

/**
 * @test DroppingTheHandleStopsThePipeline
 * @brief Releasing the last handle cancels and joins the background task
 */
TEST_F(ScanSessionTest, DroppingTheHandleStopsThePipeline) {
    auto session = ScanSession::start(tree.root, config);
    session.reset();

    // The tree can be removed safely once the session is gone
    SUCCEED();
}
