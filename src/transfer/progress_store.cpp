/*
 * courier/src/transfer/progress_store.cpp
 *
 * In-memory ProgressStore (per-process).
 *
 * - Ordered map so listActive() is stable between calls with no intervening writes
 * - shared_mutex: readers (status queries, cancellation polls) never exclude each other
 * - Terminal records of a transfer are frozen against further writes from that transfer
 * - A stop request is remembered per key, so every transfer of that URL started before the
 *   request is refused, not only the one whose snapshot the record currently holds
 */

#include <courier/transfer/progress_store.hpp>

#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace courier::transfer {

namespace {

constexpr const char* kStoppedByUser = "Download stopped by user";

void stopRecord(TransferProgress& progress) {
    progress.status = TransferStatus::Stopped;
    progress.error = kStoppedByUser;
}

} // namespace

bool ProgressStore::put(const std::string& key, const TransferProgress& snapshot) {
    std::unique_lock lk(mutex_);
    auto it = table_.find(key);
    if (it == table_.end()) {
        table_.emplace(key, Entry{snapshot, std::nullopt});
        return true;
    }
    auto& entry = it->second;
    if (isTerminal(entry.progress.status) && entry.progress.startTime == snapshot.startTime)
        return false;
    // Transfers started before a stop request may only report that they stopped
    if (entry.stopRequestedAt && snapshot.startTime <= *entry.stopRequestedAt &&
        snapshot.status != TransferStatus::Stopped) {
        return false;
    }
    entry.progress = snapshot;
    return true;
}

std::optional<TransferProgress> ProgressStore::get(const std::string& key) const {
    std::shared_lock lk(mutex_);
    auto it = table_.find(key);
    if (it == table_.end())
        return std::nullopt;
    return it->second.progress;
}

std::vector<TransferProgress> ProgressStore::listActive() const {
    std::shared_lock lk(mutex_);
    std::vector<TransferProgress> out;
    out.reserve(table_.size());
    for (const auto& [key, entry] : table_)
        out.push_back(entry.progress);
    return out;
}

bool ProgressStore::markStopped(const std::string& key) {
    std::unique_lock lk(mutex_);
    auto it = table_.find(key);
    if (it == table_.end())
        return false;
    auto& entry = it->second;
    entry.stopRequestedAt = std::chrono::system_clock::now();
    if (isTerminal(entry.progress.status))
        return false;
    stopRecord(entry.progress);
    return true;
}

std::size_t ProgressStore::markAllStopped() {
    std::size_t changed = 0;
    {
        std::unique_lock lk(mutex_);
        const auto now = std::chrono::system_clock::now();
        for (auto& [key, entry] : table_) {
            entry.stopRequestedAt = now;
            if (isTerminal(entry.progress.status))
                continue;
            stopRecord(entry.progress);
            ++changed;
        }
    }
    spdlog::debug("ProgressStore: stop requested for {} transfer(s)", changed);
    return changed;
}

ShouldCancel ProgressStore::cancellationFor(std::string key) const {
    return [this, key = std::move(key)]() {
        std::shared_lock lk(mutex_);
        auto it = table_.find(key);
        return it != table_.end() && it->second.progress.status == TransferStatus::Stopped;
    };
}

bool ProgressStore::erase(const std::string& key) {
    std::unique_lock lk(mutex_);
    return table_.erase(key) > 0;
}

std::size_t ProgressStore::clearTerminal() {
    std::unique_lock lk(mutex_);
    return std::erase_if(table_,
                         [](const auto& kv) { return isTerminal(kv.second.progress.status); });
}

std::size_t ProgressStore::size() const {
    std::shared_lock lk(mutex_);
    return table_.size();
}

} // namespace courier::transfer
