#pragma once

#include <courier/transfer/download_manager.hpp>
#include <courier/transfer/transfer.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace courier::transfer {

struct BatchOptions {
    std::filesystem::path splitsDir{"splits"};
    std::uint64_t splitThresholdBytes{kDefaultSplitThresholdBytes};
    std::uint64_t partSizeBytes{kDefaultSplitThresholdBytes};
    std::size_t maxConcurrentTransfers{0}; // 0 = one worker per URL
};

/**
 * Outcome of one URL in a batch. status is always terminal.
 *
 * A Completed item carries result, and parts when the file was split. A split failure leaves
 * the item Completed with splitError set and parts empty.
 */
struct BatchItem {
    std::string url;
    TransferStatus status{TransferStatus::Failed};
    std::optional<TransferResult> result;
    std::vector<PartFile> parts;
    std::optional<Error> error;
    std::optional<Error> splitError;

    [[nodiscard]] bool succeeded() const noexcept { return status == TransferStatus::Completed; }
};

struct BatchFailure {
    std::string url;
    std::string cause;
};

struct BatchResult {
    std::vector<BatchItem> items; // input order
    std::size_t successCount{0};
    std::vector<BatchFailure> failures;
};

/**
 * Runs many fetches concurrently over one DownloadManager and one ProgressStore.
 * A failing item never affects its siblings; fetchAll() returns only after every item is
 * terminal.
 */
class BatchOrchestrator {
public:
    /// Invoked once per item as it finishes, serialized across workers.
    using ItemCallback = std::function<void(std::size_t index, const BatchItem& item)>;

    BatchOrchestrator(IDownloadManager& manager, BatchOptions options);

    BatchResult fetchAll(const std::vector<std::string>& urls,
                         const ItemCallback& onItemDone = {});

    /// Fetch a single URL and split it when it exceeds the threshold.
    BatchItem fetchOne(const std::string& url);

    [[nodiscard]] const BatchOptions& options() const noexcept { return options_; }

private:
    void splitIfNeeded(BatchItem& item) const;

    IDownloadManager& manager_;
    BatchOptions options_;
};

} // namespace courier::transfer
