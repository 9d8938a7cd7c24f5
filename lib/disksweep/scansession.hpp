/**
 * @file scansession.hpp
 * @brief Asynchronous scan pipeline used by the front ends
 *
 * A ScanSession runs scan, categorization and duplicate detection on a
 * background task and exposes progress, results, cancellation and cleanup
 * to the presentation layer.
 */

#ifndef SCANSESSION_HPP
#define SCANSESSION_HPP

#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "cleanupoutcome.hpp"
#include "filecategorizer.hpp"
#include "ihashcalculator.hpp"
#include "progresstracker.hpp"
#include "scanresult.hpp"
#include "sweepconfig.hpp"

/**
 * @class ScanSession
 * @brief One run of the scan → categorize → deduplicate pipeline
 *
 * Sessions are created by start() and may be shared between front-end
 * threads. Destroying the last handle cancels a running pipeline and waits
 * for it to stop. A new scan means a new session; results of an earlier one
 * are never modified by a later one.
 *
 * Example usage:
 * @code
 * auto session = ScanSession::start("/home/user", config);
 * while (!session->isFinished()) {
 *   auto snap = session->pollProgress();
 *   render(snap);
 * }
 * const ScanResult &result = session->results();
 * auto outcomes = session->clean(result.redundantDuplicates());
 * @endcode
 *
 * @see ProgressTracker
 * @see ScanResult
 * @see Cleaner
 */
class ScanSession {
private:
  std::filesystem::path m_root;
  SweepConfig m_config;
  FileCategorizer m_categorizer;
  std::unique_ptr<IHashCalculator> m_hasher;
  ProgressTracker m_progress;
  ScanResult m_result;
  std::shared_future<void> m_done;

  /** @brief Cancels the running cleanup; replaced by every clean() call */
  std::mutex m_cleanMutex;
  CancellationToken m_cleanToken;

  /** @brief Restricts construction to start() while allowing make_shared */
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

  /** @brief Pipeline body, runs on the background task */
  void run();

public:
  ScanSession(ConstructionKey, std::filesystem::path root, SweepConfig config,
              FileCategorizer categorizer);
  ScanSession(const ScanSession &) = delete;
  ScanSession &operator=(const ScanSession &) = delete;
  ~ScanSession();

  /**
   * @brief Starts a scan of root in the background
   *
   * @param categorizer Rule table for the scan; the default rules unless
   *                    given
   * @throws std::invalid_argument if config.hashAlgorithm is unknown
   * @note An invalid root is reported by results(), not here
   */
  static std::shared_ptr<ScanSession>
  start(const std::filesystem::path &root, const SweepConfig &config,
        FileCategorizer categorizer = FileCategorizer());

  const std::filesystem::path &root() const { return m_root; }
  const SweepConfig &config() const { return m_config; }

  ProgressSnapshot pollProgress() const { return m_progress.snapshot(); }

  bool isFinished() const;

  /** @brief Blocks until the pipeline has stopped */
  void wait() const;

  /**
   * @brief Asks the pipeline to stop at the next check
   *
   * Idempotent. Results remain available and are flagged cancelled. A
   * cleanup in progress stops too; its remaining paths are skipped.
   */
  void requestCancel();

  /**
   * @brief The finished scan
   *
   * @throws std::logic_error while the pipeline is still running
   * @throws ScanError if the root was missing or not a directory
   */
  const ScanResult &results() const;

  /**
   * @brief Removes selected files with the session's cleanup settings
   *
   * The scan root is the only covered root, so in safe mode nothing outside
   * the scanned tree can be removed. Cleaning does not modify results().
   *
   * @throws std::logic_error while the pipeline is still running
   */
  std::vector<CleanupOutcome>
  clean(const std::vector<std::filesystem::path> &selected);
};

#endif // SCANSESSION_HPP
