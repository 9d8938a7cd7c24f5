#ifndef DUPLICATEFINDER_HPP
#define DUPLICATEFINDER_HPP

#include "cancellationtoken.hpp"
#include "filerecord.hpp"
#include "ihashcalculator.hpp"
#include "progresstracker.hpp"
#include "scanresult.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Outcome of one duplicate analysis run
 */
struct DuplicateReport {
    std::vector<DuplicateGroup> groups;
    std::vector<HashFailure> hashFailures;

    /** @brief Files hashed (or reused) successfully */
    std::uint64_t filesHashed = 0;

    /** @brief True when cancellation left some candidates unhashed */
    bool cancelled = false;
};

/**
 * @brief Service for duplicate file detection based on size and content hash
 *
 * DuplicateFinder works in two phases to keep hashing cost down:
 * 1. Group records by exact size. A size shared by no other file cannot have
 *    a duplicate, so those files are never read.
 * 2. Hash the remaining candidates on a bounded worker pool and split each
 *    size group by hash. Every sub-group with two or more members becomes a
 *    DuplicateGroup.
 *
 * Records flagged hash-excluded (oversized) take no part. A record that
 * already carries a hash (from an earlier run) is not read again.
 *
 * Each worker writes the hash of exactly the records it was given, so the
 * records need no locking. The final groups are sorted, which makes the
 * result independent of the order in which workers finish.
 *
 * @see IHashCalculator
 * @see DuplicateGroup
 *
 * Example usage:
 * @code
 * EvpHashCalculator sha256;
 * DuplicateFinder finder(sha256);
 * auto report = finder.findDuplicates(result.records, tracker, tracker.token());
 * std::cout << "Wasted space: "
 *           << DuplicateFinder::calculateWastedSpace(report.groups) << " bytes\n";
 * @endcode
 */
class DuplicateFinder {
private:
    const IHashCalculator& m_hasher;
    std::size_t m_workers;

public:
    /**
     * @param hasher Shared by all workers; must outlive the finder
     * @param workers Pool size; 0 means std::thread::hardware_concurrency()
     */
    explicit DuplicateFinder(const IHashCalculator& hasher, std::size_t workers = 0)
        : m_hasher(hasher), m_workers(workers) {}

    /**
     * @brief Find duplicate groups and annotate the records
     *
     * Assigns the content hash of every hashed candidate and the group id of
     * every group member.
     *
     * @param records Scan records (hash and group id fields are modified!)
     * @param progress Receives Phase::Hashing updates, one per finished file
     * @param cancel Polled before each file and between chunk batches
     *
     * @return Groups (sorted by wasted space, largest first), hash failures
     *         and the cancellation state
     */
    DuplicateReport findDuplicates(std::vector<FileRecord>& records,
                                   ProgressTracker& progress,
                                   const CancellationToken& cancel) const;

    /**
     * @brief Size groups that need hashing: record indices keyed by size,
     *        only sizes shared by at least two hashable records
     */
    static std::map<std::uintmax_t, std::vector<std::size_t>>
    candidateSizeGroups(const std::vector<FileRecord>& records);

    /**
     * @brief Calculate total wasted space
     */
    static std::uintmax_t calculateWastedSpace(const std::vector<DuplicateGroup>& groups) {
        std::uintmax_t total = 0;
        for (const auto& group : groups) {
            total += group.wastedSpace;
        }
        return total;
    }

    /** @brief Effective pool size */
    std::size_t workerCount() const;
};

#endif // DUPLICATEFINDER_HPP
