/*
 * courier/src/transfer/batch_orchestrator.cpp
 *
 * Fan-out over boost::asio::thread_pool. Each worker writes only its own pre-sized result slot,
 * so items come back in input order without further synchronization; the per-item callback is
 * serialized with a mutex.
 */

#include <courier/transfer/batch_orchestrator.hpp>
#include <courier/transfer/file_splitter.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>

namespace courier::transfer {

BatchOrchestrator::BatchOrchestrator(IDownloadManager& manager, BatchOptions options)
    : manager_(manager), options_(std::move(options)) {}

BatchItem BatchOrchestrator::fetchOne(const std::string& url) {
    BatchItem item;
    item.url = url;

    auto fetched = manager_.fetch(url);
    if (!fetched.ok()) {
        item.status = fetched.error().code == ErrorCode::Cancelled ? TransferStatus::Stopped
                                                                    : TransferStatus::Failed;
        item.error = fetched.error();
        return item;
    }

    item.status = TransferStatus::Completed;
    item.result = std::move(fetched).value();
    splitIfNeeded(item);
    return item;
}

void BatchOrchestrator::splitIfNeeded(BatchItem& item) const {
    const auto& result = *item.result;
    if (!needsSplit(result.fileSize, options_.splitThresholdBytes))
        return;

    spdlog::info("{} is {} bytes (threshold {}), splitting", result.fileName, result.fileSize,
                 options_.splitThresholdBytes);
    auto split = splitFile(result.filePath, options_.partSizeBytes, options_.splitsDir);
    if (!split.ok()) {
        item.splitError = split.error();
        return;
    }
    item.parts = std::move(split).value();
}

BatchResult BatchOrchestrator::fetchAll(const std::vector<std::string>& urls,
                                        const ItemCallback& onItemDone) {
    BatchResult out;
    if (urls.empty())
        return out;

    out.items.resize(urls.size());

    std::size_t workers = urls.size();
    if (options_.maxConcurrentTransfers > 0)
        workers = std::min(workers, options_.maxConcurrentTransfers);

    spdlog::debug("Batch of {} URL(s) on {} worker(s)", urls.size(), workers);

    std::mutex callbackMutex;
    {
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < urls.size(); ++i) {
            boost::asio::post(pool, [this, i, &urls, &out, &onItemDone, &callbackMutex] {
                BatchItem item;
                try {
                    item = fetchOne(urls[i]);
                } catch (const std::exception& ex) {
                    item.url = urls[i];
                    item.status = TransferStatus::Failed;
                    item.error = Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
                }
                out.items[i] = std::move(item);

                if (onItemDone) {
                    std::lock_guard<std::mutex> lk(callbackMutex);
                    onItemDone(i, out.items[i]);
                }
            });
        }
        pool.join();
    }

    for (const auto& item : out.items) {
        if (item.succeeded()) {
            ++out.successCount;
        } else {
            out.failures.push_back(
                BatchFailure{item.url, item.error ? item.error->message : "unknown error"});
        }
    }

    spdlog::info("Batch finished: {}/{} succeeded", out.successCount, out.items.size());
    return out;
}

} // namespace courier::transfer
