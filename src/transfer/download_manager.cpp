/*
 * courier/src/transfer/download_manager.cpp
 *
 * DownloadManager (single stream per URL):
 * - Register the transfer as Downloading before the request goes out, so a stop can target it
 *   while it is still connecting
 * - Resolve the file name and expected size from the response head
 * - Per chunk: Content-Length bound, staging write, SHA-256 update, counter, store put
 * - Commit (fsync + unique rename) and publish Completed, unless a stop won the race
 * - Every failure path removes the staging file and leaves Stopped or Failed in the store
 */

#include <courier/transfer/download_manager.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace courier::transfer {

namespace {

constexpr const char* kStoppedMessage = "Download stopped by user";

std::string initialFileName(const std::string& url) {
    auto fromUrl = fileNameFromUrl(url);
    return sanitizeFileName(fromUrl ? *fromUrl : std::string{});
}

std::string resolveFileName(const std::string& url, const ResponseHead& head) {
    if (auto cd = head.header("content-disposition")) {
        if (auto name = fileNameFromContentDisposition(*cd))
            return sanitizeFileName(*name);
    }
    return initialFileName(url);
}

// ---- DownloadManager implementation ----
class DownloadManager final : public IDownloadManager {
public:
    DownloadManager(ProgressStore& store, DownloadOptions options,
                    std::unique_ptr<IHttpAdapter> http, std::unique_ptr<IDiskWriter> disk)
        : store_(store), options_(std::move(options)), http_(std::move(http)),
          disk_(std::move(disk)) {
        if (!http_)
            http_ = makeCurlHttpAdapter();
        if (!disk_)
            disk_ = makeDiskWriter();
    }

    using IDownloadManager::fetch;

    Expected<TransferResult> fetch(const std::string& url,
                                   const ShouldCancel& shouldCancel) override {
        if (url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }

        TransferProgress progress;
        progress.url = url;
        progress.fileName = initialFileName(url);
        progress.status = TransferStatus::Downloading;
        progress.startTime = std::chrono::system_clock::now();
        store_.put(url, progress);

        std::unique_ptr<IStagedFile> staged;
        auto verifier = makeIntegrityVerifierSha256();

        try {
            HeadCallback onHead = [&](const ResponseHead& head) -> Expected<void> {
                if (!head.isSuccess()) {
                    return Error{ErrorCode::NetworkError,
                                 "HTTP " + std::to_string(head.status) + " for " + url};
                }
                progress.fileName = resolveFileName(url, head);
                progress.fileSize = head.contentLength().value_or(0);

                auto created = disk_->createStagingFile(options_.downloadsDir, progress.fileName);
                if (!created.ok())
                    return created.error();
                staged = std::move(created).value();

                spdlog::info("Downloading {} -> {} ({} bytes expected)", url, progress.fileName,
                             progress.fileSize);
                if (!store_.put(url, progress))
                    return Error{ErrorCode::Cancelled, kStoppedMessage};
                return Expected<void>{};
            };

            ChunkSink sink = [&](std::span<const std::byte> chunk) -> Expected<void> {
                if (!staged) {
                    return Error{ErrorCode::Unknown, "Body chunk arrived before response head"};
                }
                if (progress.fileSize > 0 &&
                    progress.downloadedBytes + chunk.size() > progress.fileSize) {
                    return Error{ErrorCode::NetworkError,
                                 "Response body exceeds Content-Length (" +
                                     std::to_string(progress.fileSize) + " bytes)"};
                }
                auto wr = staged->write(chunk);
                if (!wr.ok())
                    return wr.error();
                verifier->update(chunk);
                progress.downloadedBytes += chunk.size();
                if (!store_.put(url, progress))
                    return Error{ErrorCode::Cancelled, kStoppedMessage};
                return Expected<void>{};
            };

            auto streamed = http_->stream(url, options_.http, onHead, sink, shouldCancel);
            if (!streamed.ok())
                return failTransfer(progress, staged, streamed.error());

            if (!staged) {
                return failTransfer(
                    progress, staged,
                    Error{ErrorCode::Unknown, "Stream ended without a response head"});
            }
            if (progress.fileSize > 0 && progress.downloadedBytes < progress.fileSize) {
                return failTransfer(progress, staged,
                                    Error{ErrorCode::NetworkError,
                                          "Connection closed after " +
                                              std::to_string(progress.downloadedBytes) + " of " +
                                              std::to_string(progress.fileSize) + " bytes"});
            }

            auto committed = staged->commit();
            if (!committed.ok())
                return failTransfer(progress, staged, committed.error());
            const auto finalPath = committed.value();

            TransferResult out;
            out.filePath = finalPath;
            out.fileName = finalPath.filename().string();
            out.fileSize = progress.downloadedBytes;
            out.sha256 = verifier->finalize();

            progress.fileSize = progress.downloadedBytes;
            progress.status = TransferStatus::Completed;
            if (!store_.put(url, progress)) {
                // A stop landed between the last chunk and completion
                std::error_code ec;
                std::filesystem::remove(finalPath, ec);
                spdlog::info("Stopped {} at completion; removed {}", url, finalPath.string());
                return Error{ErrorCode::Cancelled, kStoppedMessage};
            }

            spdlog::info("Downloaded {} ({} bytes, sha256 {})", out.filePath.string(),
                         out.fileSize, out.sha256);
            return out;
        } catch (const std::exception& ex) {
            return failTransfer(progress, staged,
                                Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()});
        }
    }

    [[nodiscard]] ProgressStore& store() noexcept override { return store_; }
    [[nodiscard]] const DownloadOptions& options() const noexcept override { return options_; }

private:
    Error failTransfer(TransferProgress& progress, std::unique_ptr<IStagedFile>& staged,
                       Error err) {
        if (staged) {
            staged->discard();
            staged.reset();
        }

        if (err.code == ErrorCode::Cancelled) {
            err.message = kStoppedMessage;
            progress.status = TransferStatus::Stopped;
            spdlog::info("Stopped {} after {} bytes", progress.url, progress.downloadedBytes);
        } else {
            progress.status = TransferStatus::Failed;
            spdlog::warn("Download failed for {}: {}", progress.url, err.message);
        }
        progress.error = err.message;
        // Rejected when the record was already stopped; the terminal state stands either way
        store_.put(progress.url, progress);
        return err;
    }

    ProgressStore& store_;
    DownloadOptions options_;

    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IDiskWriter> disk_;
};

} // namespace

std::unique_ptr<IDownloadManager> makeDownloadManager(ProgressStore& store,
                                                      DownloadOptions options,
                                                      std::unique_ptr<IHttpAdapter> http,
                                                      std::unique_ptr<IDiskWriter> disk) {
    return std::make_unique<DownloadManager>(store, std::move(options), std::move(http),
                                             std::move(disk));
}

} // namespace courier::transfer
