/**
 * @file duplicatefinder.cpp
 * @brief Size pre-filtering, parallel hashing and hash grouping
 */

#include "duplicatefinder.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Result slot of one hash task, written only by that task
 */
struct HashSlot {
    enum class State { Pending, Done, Failed, Abandoned };

    State state = State::Pending;
    std::string reason;
};

/**
 * @brief Checks that a file still matches its scan record after hashing
 *
 * @return Empty string if unchanged, otherwise the reason for rejection
 */
std::string verifyUnchanged(const FileRecord& record, std::uintmax_t bytesRead) {
    if (bytesRead != record.getFileSize()) {
        return "modified during hashing (read " + std::to_string(bytesRead) +
               " of " + std::to_string(record.getFileSize()) + " bytes)";
    }

    std::error_code ec;
    auto size = fs::file_size(record.getPath(), ec);
    if (ec) {
        return "vanished during hashing: " + ec.message();
    }
    auto modified = fs::last_write_time(record.getPath(), ec);
    if (ec) {
        return "vanished during hashing: " + ec.message();
    }
    if (size != record.getFileSize() || modified != record.getModified()) {
        return "modified during hashing";
    }
    return {};
}

} // namespace

std::size_t DuplicateFinder::workerCount() const {
    if (m_workers > 0) {
        return m_workers;
    }
    unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

std::map<std::uintmax_t, std::vector<std::size_t>>
DuplicateFinder::candidateSizeGroups(const std::vector<FileRecord>& records) {
    std::map<std::uintmax_t, std::vector<std::size_t>> bySize;

    for (std::size_t i = 0; i < records.size(); ++i) {
        if (!records[i].isHashExcluded()) {
            bySize[records[i].getFileSize()].push_back(i);
        }
    }

    // Unique sizes cannot have duplicates
    for (auto it = bySize.begin(); it != bySize.end();) {
        if (it->second.size() < 2) {
            it = bySize.erase(it);
        } else {
            ++it;
        }
    }

    return bySize;
}

/**
 * @brief Finds duplicate groups among the scan records
 *
 * Implementation flow:
 * 1. Build candidate size groups (no file is read for unique sizes)
 * 2. Post one hash task per candidate to a boost::asio::thread_pool
 * 3. Each task polls cancellation, hashes the file in chunks, checks that
 *    the file did not change meanwhile and stores the hash in its record
 * 4. After join, split every size group by hash and keep sub-groups of two
 *    or more
 * 5. Sort groups and annotate records with their group id
 */
DuplicateReport DuplicateFinder::findDuplicates(std::vector<FileRecord>& records,
                                                ProgressTracker& progress,
                                                const CancellationToken& cancel) const {
    DuplicateReport report;

    auto sizeGroups = candidateSizeGroups(records);

    std::vector<std::size_t> candidates;
    for (const auto& [size, indices] : sizeGroups) {
        candidates.insert(candidates.end(), indices.begin(), indices.end());
    }

    spdlog::info("Duplicate detection: {} candidates in {} size groups ({} records)",
                 candidates.size(), sizeGroups.size(), records.size());

    progress.beginPhase(Phase::Hashing);
    progress.setTotal(Phase::Hashing, candidates.size());

    std::vector<HashSlot> slots(candidates.size());

    if (!candidates.empty()) {
        std::size_t workers = std::min(workerCount(), candidates.size());
        boost::asio::thread_pool pool(workers);

        for (std::size_t slot = 0; slot < candidates.size(); ++slot) {
            boost::asio::post(pool, [&, slot]() {
                FileRecord& record = records[candidates[slot]];
                HashSlot& result = slots[slot];

                if (cancel.isCancelled()) {
                    result.state = HashSlot::State::Abandoned;
                    return;
                }

                if (record.hasHash()) {
                    result.state = HashSlot::State::Done;
                    progress.advance(Phase::Hashing, 1, record.getFileSize());
                    return;
                }

                try {
                    HashDigest digest =
                        m_hasher.calculateHash(record.getPath().string(), &cancel);
                    std::string changed = verifyUnchanged(record, digest.bytesRead);
                    if (changed.empty()) {
                        record.assignHash(std::move(digest.hex));
                        result.state = HashSlot::State::Done;
                    } else {
                        result.state = HashSlot::State::Failed;
                        result.reason = std::move(changed);
                    }
                } catch (const HashCancelled&) {
                    result.state = HashSlot::State::Abandoned;
                    return;
                } catch (const std::exception& e) {
                    result.state = HashSlot::State::Failed;
                    result.reason = e.what();
                }

                progress.advance(Phase::Hashing, 1, record.getFileSize());
            });
        }

        pool.join();
    }

    for (std::size_t slot = 0; slot < slots.size(); ++slot) {
        const FileRecord& record = records[candidates[slot]];
        switch (slots[slot].state) {
        case HashSlot::State::Done:
            report.filesHashed++;
            break;
        case HashSlot::State::Failed:
            spdlog::warn("Failed to hash {}: {}", record.getPath().string(),
                         slots[slot].reason);
            report.hashFailures.push_back({record.getPath(), slots[slot].reason});
            break;
        case HashSlot::State::Abandoned:
        case HashSlot::State::Pending:
            report.cancelled = true;
            break;
        }
    }

    // Split each size group by hash
    for (const auto& [size, indices] : sizeGroups) {
        std::unordered_map<std::string, std::vector<std::size_t>> byHash;
        for (std::size_t index : indices) {
            const auto& hash = records[index].getHash();
            if (hash) {
                byHash[*hash].push_back(index);
            }
        }

        for (auto& [hash, members] : byHash) {
            if (members.size() < 2) {
                continue; // same size, different content
            }

            std::sort(members.begin(), members.end(),
                      [&records](std::size_t a, std::size_t b) {
                          return records[a].getPath() < records[b].getPath();
                      });

            DuplicateGroup group;
            group.hash = hash;
            group.fileSize = size;
            group.recordIndices = members;
            for (std::size_t index : members) {
                group.paths.push_back(records[index].getPath());
            }
            group.wastedSpace = (members.size() - 1) * size;

            report.groups.push_back(std::move(group));
        }
    }

    std::sort(report.groups.begin(), report.groups.end(),
              [](const DuplicateGroup& a, const DuplicateGroup& b) {
                  if (a.wastedSpace != b.wastedSpace)
                      return a.wastedSpace > b.wastedSpace;
                  if (a.hash != b.hash)
                      return a.hash < b.hash;
                  return a.paths.front() < b.paths.front();
              });

    for (std::size_t id = 0; id < report.groups.size(); ++id) {
        for (std::size_t index : report.groups[id].recordIndices) {
            records[index].setGroupId(id);
        }
    }

    if (cancel.isCancelled()) {
        report.cancelled = true;
    }

    spdlog::info("Found {} groups of duplicate files ({} bytes reclaimable, {} hash failures{})",
                 report.groups.size(), calculateWastedSpace(report.groups),
                 report.hashFailures.size(), report.cancelled ? ", cancelled" : "");

    return report;
}
