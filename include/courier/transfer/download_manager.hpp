#pragma once

#include <courier/transfer/progress_store.hpp>
#include <courier/transfer/transfer.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace courier::transfer {

/**
 * Static configuration of a DownloadManager.
 */
struct DownloadOptions {
    std::filesystem::path downloadsDir{"downloads"};
    HttpOptions http{};
};

/**
 * Drives single streaming fetches and reports their progress into a ProgressStore.
 *
 * fetch() is safe to call concurrently from several threads; each call owns its HTTP handle,
 * staging file and digest, and shares only the store.
 */
class IDownloadManager {
public:
    virtual ~IDownloadManager() = default;

    /**
     * Fetch url into the downloads directory.
     *
     * Errors:
     * - NetworkError: connection failure, timeout, non-2xx status, body longer or shorter
     *   than Content-Length
     * - IoError: staging file could not be created, written or committed
     * - Cancelled: shouldCancel turned true, or the record was moved to Stopped
     *
     * On any error the partial file has been removed and the store holds Failed or Stopped
     * for url before this returns.
     */
    virtual Expected<TransferResult> fetch(const std::string& url,
                                           const ShouldCancel& shouldCancel) = 0;

    /// fetch() cancelled through the store record for url.
    Expected<TransferResult> fetch(const std::string& url) {
        return fetch(url, store().cancellationFor(url));
    }

    [[nodiscard]] virtual ProgressStore& store() noexcept = 0;
    [[nodiscard]] virtual const DownloadOptions& options() const noexcept = 0;
};

/**
 * Construct the default manager. Null dependencies fall back to the libcurl adapter and
 * the local disk writer.
 */
std::unique_ptr<IDownloadManager>
makeDownloadManager(ProgressStore& store, DownloadOptions options,
                    std::unique_ptr<IHttpAdapter> http = nullptr,
                    std::unique_ptr<IDiskWriter> disk = nullptr);

} // namespace courier::transfer
