/**
 * @file progresstracker.hpp
 * @brief Thread-safe progress counters shared by the pipeline stages
 */

#ifndef PROGRESSTRACKER_HPP
#define PROGRESSTRACKER_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "cancellationtoken.hpp"

/**
 * @enum Phase
 * @brief Pipeline stage currently reporting progress
 */
enum class Phase { Idle, Scanning, Hashing, Cleaning };

/**
 * @brief Display name of a phase ("Idle", "Scanning", ...)
 */
std::string phaseName(Phase phase);

/**
 * @struct ProgressSnapshot
 * @brief Point-in-time copy of the tracker state
 */
struct ProgressSnapshot {
  Phase phase = Phase::Idle;
  std::uint64_t itemsProcessed = 0;

  /** @brief Total item count, std::nullopt while unknown (e.g. during a walk) */
  std::optional<std::uint64_t> itemsTotal;

  std::uint64_t bytesProcessed = 0;
  bool cancelled = false;

  /** @brief Path most recently reported by the producer */
  std::string currentItem;

  /**
   * @brief Fraction in [0, 1], or std::nullopt when the total is unknown
   */
  std::optional<double> fraction() const {
    if (!itemsTotal || *itemsTotal == 0)
      return std::nullopt;
    double f = static_cast<double>(itemsProcessed) /
               static_cast<double>(*itemsTotal);
    return f > 1.0 ? 1.0 : f;
  }
};

/**
 * @class ProgressTracker
 * @brief Mutable progress state shared between producers and one observer
 *
 * Producers (the traversal thread, hashing workers, the cleaner) call
 * advance(); the presentation layer calls snapshot() concurrently. A tracker
 * is created per scan session and passed explicitly; there is no global
 * instance.
 *
 * Counters belong to the current phase. Reporting progress for a different
 * phase switches to it and resets the counters, so values never decrease
 * within a phase.
 *
 * Cancellation is delegated to a CancellationToken that the pipeline stages
 * receive separately; cancel() here and token().cancel() are equivalent.
 *
 * @see CancellationToken
 * @see ProgressSnapshot
 */
class ProgressTracker {
private:
  mutable std::mutex m_mutex;
  Phase m_phase = Phase::Idle;
  std::uint64_t m_items = 0;
  std::optional<std::uint64_t> m_total;
  std::uint64_t m_bytes = 0;
  std::string m_current;
  CancellationToken m_token;

  /** @brief Switches phase and clears counters. Caller holds m_mutex. */
  void enterPhaseLocked(Phase phase);

public:
  ProgressTracker() = default;

  /**
   * @brief Constructs a tracker that reports through an existing token
   */
  explicit ProgressTracker(CancellationToken token) : m_token(std::move(token)) {}

  ProgressTracker(const ProgressTracker &) = delete;
  ProgressTracker &operator=(const ProgressTracker &) = delete;

  /**
   * @brief Adds to the counters of a phase
   *
   * @param phase Reporting phase; switches the tracker if it differs
   * @param itemsDelta Items finished since the last call
   * @param bytesDelta Bytes covered by those items
   */
  void advance(Phase phase, std::uint64_t itemsDelta, std::uint64_t bytesDelta);

  /**
   * @brief Announces the expected item count of a phase
   */
  void setTotal(Phase phase, std::uint64_t total);

  /**
   * @brief Records the path currently being worked on
   */
  void setCurrentItem(const std::string &item);

  /**
   * @brief Enters a phase with zeroed counters
   */
  void beginPhase(Phase phase);

  /**
   * @brief Returns to Idle, keeping the cancellation state
   */
  void finish();

  /**
   * @brief Returns to Idle and clears counters (not the cancellation flag)
   */
  void reset();

  ProgressSnapshot snapshot() const;

  void cancel() const { m_token.cancel(); }
  bool isCancelled() const { return m_token.isCancelled(); }

  /** @brief Token observed by the pipeline stages */
  const CancellationToken &token() const { return m_token; }
};

#endif // PROGRESSTRACKER_HPP
