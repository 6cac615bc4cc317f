#pragma once

#include <courier/transfer/transfer.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace courier::transfer {

/**
 * Registry of transfer progress keyed by source URL.
 *
 * One instance is shared by every component that reports or observes progress; it is passed
 * by reference rather than reached through a global. All operations are total and guarded by
 * a single shared_mutex, so the critical section never spans network or disk I/O.
 *
 * Writing Stopped into a record is the cancellation channel: the transfer that owns the key
 * observes it through cancellationFor() on its next chunk.
 */
class ProgressStore {
public:
    ProgressStore() = default;
    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    /**
     * Replace the record for key (last write wins).
     *
     * Rejected, returning false, when the current record belongs to the same transfer
     * (equal startTime) and has already reached a terminal status, and when a stop was
     * requested for key at or after snapshot.startTime unless the snapshot itself is Stopped.
     * A transfer of the same URL started after the last stop request always overwrites.
     */
    bool put(const std::string& key, const TransferProgress& snapshot);

    [[nodiscard]] std::optional<TransferProgress> get(const std::string& key) const;

    /// All current snapshots, ordered by key.
    [[nodiscard]] std::vector<TransferProgress> listActive() const;

    /// Record a stop request for key and move its record to Stopped if it is not terminal.
    /// Returns true on transition.
    bool markStopped(const std::string& key);

    /// markStopped() for every key. Returns the number of records changed.
    std::size_t markAllStopped();

    /// Predicate that turns true once the record for key is Stopped.
    [[nodiscard]] ShouldCancel cancellationFor(std::string key) const;

    bool erase(const std::string& key);

    /// Drop every terminal record. Returns the number removed.
    std::size_t clearTerminal();

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        TransferProgress progress;
        std::optional<std::chrono::system_clock::time_point> stopRequestedAt;
    };

    std::map<std::string, Entry> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace courier::transfer
