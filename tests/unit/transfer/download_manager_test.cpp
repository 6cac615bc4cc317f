#include <gtest/gtest.h>

#include "../../support/scripted_http_adapter.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <courier/transfer/download_manager.hpp>
#include <courier/transfer/progress_store.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace courier::transfer;
using courier::test_support::chunked;
using courier::test_support::FailingDiskWriter;
using courier::test_support::make_payload;
using courier::test_support::okResponse;
using courier::test_support::read_file;
using courier::test_support::ScriptedHttpAdapter;
using courier::test_support::ScriptedResponse;
using courier::test_support::TempDirScope;
using courier::test_support::write_file;

namespace fs = std::filesystem;

namespace {

std::size_t countFiles(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec))
        return 0;
    std::size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file())
            ++n;
    }
    return n;
}

// Commits normally, then stops the transfer before the manager can publish Completed.
class StopOnCommitDiskWriter : public IDiskWriter {
public:
    StopOnCommitDiskWriter(ProgressStore& store, std::string url)
        : store_(store), url_(std::move(url)), inner_(makeDiskWriter()) {}

    Expected<std::unique_ptr<IStagedFile>> createStagingFile(const fs::path& dir,
                                                             std::string_view fileName) override {
        auto inner = inner_->createStagingFile(dir, fileName);
        if (!inner.ok())
            return inner.error();
        std::unique_ptr<IStagedFile> wrapped =
            std::make_unique<Staged>(std::move(inner).value(), store_, url_);
        return wrapped;
    }

private:
    class Staged : public IStagedFile {
    public:
        Staged(std::unique_ptr<IStagedFile> inner, ProgressStore& store, std::string url)
            : inner_(std::move(inner)), store_(store), url_(std::move(url)) {}
        const fs::path& path() const noexcept override { return inner_->path(); }
        Expected<void> write(std::span<const std::byte> data) override {
            return inner_->write(data);
        }
        Expected<fs::path> commit() override {
            auto r = inner_->commit();
            store_.markStopped(url_);
            return r;
        }
        void discard() noexcept override { inner_->discard(); }

    private:
        std::unique_ptr<IStagedFile> inner_;
        ProgressStore& store_;
        std::string url_;
    };

    ProgressStore& store_;
    std::string url_;
    std::unique_ptr<IDiskWriter> inner_;
};

class DownloadManagerTest : public ::testing::Test {
protected:
    DownloadManagerTest()
        : tmp_(TempDirScope::unique_under("courier_dm")),
          shared_(std::make_shared<ScriptedHttpAdapter::Shared>()) {}

    std::unique_ptr<IDownloadManager> makeManager(std::unique_ptr<IDiskWriter> disk = nullptr) {
        DownloadOptions opts;
        opts.downloadsDir = downloadsDir();
        return makeDownloadManager(store_, opts, std::make_unique<ScriptedHttpAdapter>(shared_),
                                   std::move(disk));
    }

    fs::path downloadsDir() const { return tmp_ / "downloads"; }

    void script(const std::string& url, ScriptedResponse response) {
        shared_->scripts[url] = std::move(response);
    }

    TempDirScope tmp_;
    ProgressStore store_;
    std::shared_ptr<ScriptedHttpAdapter::Shared> shared_;
};

} // namespace

TEST_F(DownloadManagerTest, StreamsBodyToDiskWithDigest) {
    const std::string url = "https://files.example/pub/abc.txt";
    script(url, okResponse({"a", "b", "c"}));
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    EXPECT_EQ(res.value().fileName, "abc.txt");
    EXPECT_EQ(res.value().fileSize, 3u);
    EXPECT_EQ(res.value().filePath, downloadsDir() / "abc.txt");
    EXPECT_EQ(res.value().sha256,
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(read_file(res.value().filePath), "abc");

    auto rec = store_.get(url);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, TransferStatus::Completed);
    EXPECT_EQ(rec->downloadedBytes, 3u);
    EXPECT_EQ(rec->fileSize, 3u);
    EXPECT_FALSE(rec->error.has_value());
    EXPECT_EQ(countFiles(downloadsDir()), 1u);
}

TEST_F(DownloadManagerTest, EmptyUrlIsInvalidArgument) {
    auto dm = makeManager();
    auto res = dm->fetch("");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(shared_->calls.load(), 0);
}

TEST_F(DownloadManagerTest, ContentDispositionNamesTheFile) {
    const std::string url = "https://cdn.example/dl?id=42";
    auto response = okResponse({"pdfdata"});
    response.headers.push_back({"Content-Disposition", "attachment; filename=\"report.pdf\""});
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    EXPECT_EQ(res.value().fileName, "report.pdf");
    EXPECT_EQ(store_.get(url)->fileName, "report.pdf");
}

TEST_F(DownloadManagerTest, ExistingFileIsNotOverwritten) {
    const std::string url = "https://files.example/data.bin";
    write_file(downloadsDir() / "data.bin", "older");
    script(url, okResponse({"newer"}));
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    EXPECT_EQ(res.value().fileName, "data (1).bin");
    EXPECT_EQ(read_file(downloadsDir() / "data.bin"), "older");
    EXPECT_EQ(read_file(res.value().filePath), "newer");
}

TEST_F(DownloadManagerTest, ProgressIsMonotonicAndBounded) {
    const std::string url = "https://files.example/big.iso";
    const auto payload = make_payload(64 * 1024);
    auto response = okResponse(chunked(payload, 4096));
    std::vector<std::uint64_t> seen;
    response.beforeChunk = [&](std::size_t) {
        auto rec = store_.get(url);
        ASSERT_TRUE(rec.has_value());
        EXPECT_EQ(rec->status, TransferStatus::Downloading);
        EXPECT_LE(rec->downloadedBytes, rec->fileSize);
        seen.push_back(rec->downloadedBytes);
    };
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    ASSERT_EQ(seen.size(), 16u);
    for (std::size_t i = 1; i < seen.size(); ++i)
        EXPECT_GE(seen[i], seen[i - 1]);
    EXPECT_EQ(store_.get(url)->downloadedBytes, payload.size());
}

TEST_F(DownloadManagerTest, StopThroughStoreRemovesPartialFile) {
    const std::string url = "https://files.example/stop.bin";
    auto response = okResponse(chunked(make_payload(8192), 1024));
    response.beforeChunk = [&](std::size_t i) {
        if (i == 3)
            store_.markStopped(url);
    };
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(res.error().message, "Download stopped by user");

    auto rec = store_.get(url);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, TransferStatus::Stopped);
    EXPECT_EQ(rec->downloadedBytes, 3072u);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, StopIsHonouredWithCustomPredicate) {
    const std::string url = "https://files.example/stop2.bin";
    auto response = okResponse(chunked(make_payload(4096), 1024));
    response.beforeChunk = [&](std::size_t i) {
        if (i == 1)
            store_.markStopped(url);
    };
    script(url, response);
    auto dm = makeManager();

    // The predicate never fires; the rejected store write still ends the transfer
    auto res = dm->fetch(url, [] { return false; });
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Stopped);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, StopRacingCompletionWins) {
    const std::string url = "https://files.example/race.bin";
    script(url, okResponse({"payload"}));
    auto dm = makeManager(std::make_unique<StopOnCommitDiskWriter>(store_, url));

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Stopped);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, HttpErrorStatusFails) {
    const std::string url = "https://files.example/missing";
    ScriptedResponse response;
    response.status = 404;
    response.chunks = {"not found"};
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    EXPECT_NE(res.error().message.find("404"), std::string::npos);

    auto rec = store_.get(url);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, TransferStatus::Failed);
    ASSERT_TRUE(rec->error.has_value());
    EXPECT_EQ(*rec->error, res.error().message);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, ConnectionFailureIsRecorded) {
    const std::string url = "https://unreachable.example/file";
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Failed);
}

TEST_F(DownloadManagerTest, MidStreamErrorRemovesPartialFile) {
    const std::string url = "https://files.example/flaky.bin";
    auto response = okResponse(chunked(make_payload(4096), 512));
    response.failBeforeChunk = 4;
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Failed);
    EXPECT_EQ(store_.get(url)->downloadedBytes, 2048u);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, DiskWriteFailureIsIoError) {
    const std::string url = "https://files.example/full.bin";
    script(url, okResponse(chunked(make_payload(4096), 1024)));
    auto dm = makeManager(std::make_unique<FailingDiskWriter>(false, 2));

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Failed);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, StagingCreateFailureIsIoError) {
    const std::string url = "https://files.example/nospace.bin";
    script(url, okResponse({"x"}));
    auto dm = makeManager(std::make_unique<FailingDiskWriter>(true, 0));

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Failed);
}

TEST_F(DownloadManagerTest, UnknownSizeCompletesWithReceivedBytes) {
    const std::string url = "https://files.example/stream";
    auto response = okResponse({"12345", "67890"}, /*withLength=*/false);
    response.beforeChunk = [&](std::size_t) {
        auto rec = store_.get(url);
        ASSERT_TRUE(rec.has_value());
        EXPECT_EQ(rec->fileSize, 0u);
        EXPECT_FALSE(percentComplete(*rec).has_value());
    };
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    EXPECT_EQ(res.value().fileSize, 10u);
    auto rec = store_.get(url);
    EXPECT_EQ(rec->fileSize, 10u);
    EXPECT_EQ(rec->status, TransferStatus::Completed);
}

TEST_F(DownloadManagerTest, BodyLongerThanContentLengthFails) {
    const std::string url = "https://files.example/liar.bin";
    ScriptedResponse response;
    response.headers.push_back({"Content-Length", "4"});
    response.chunks = {"abcd", "efgh"};
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    auto rec = store_.get(url);
    EXPECT_EQ(rec->status, TransferStatus::Failed);
    EXPECT_LE(rec->downloadedBytes, rec->fileSize);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, TruncatedBodyFails) {
    const std::string url = "https://files.example/short.bin";
    ScriptedResponse response;
    response.headers.push_back({"Content-Length", "100"});
    response.chunks = {"0123456789"};
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    EXPECT_NE(res.error().message.find("10 of 100"), std::string::npos);
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, RefetchAfterFailureStartsFresh) {
    const std::string url = "https://files.example/retry.bin";
    ScriptedResponse broken;
    broken.status = 503;
    script(url, broken);
    auto dm = makeManager();

    ASSERT_FALSE(dm->fetch(url).ok());
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Failed);

    script(url, okResponse({"ok"}));
    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    auto rec = store_.get(url);
    EXPECT_EQ(rec->status, TransferStatus::Completed);
    EXPECT_FALSE(rec->error.has_value());
}

TEST_F(DownloadManagerTest, StopReachesTransferSharingItsUrl) {
    const std::string url = "https://files.example/twice.bin";
    auto response = okResponse(chunked(make_payload(4096), 1024));
    response.beforeChunk = [&](std::size_t i) {
        if (i != 1)
            return;
        // A second transfer of the same URL takes over the record, then everything is stopped
        TransferProgress sibling;
        sibling.url = url;
        sibling.fileName = "twice.bin";
        sibling.status = TransferStatus::Downloading;
        sibling.startTime = std::chrono::system_clock::now();
        ASSERT_TRUE(store_.put(url, sibling));
        store_.markAllStopped();
        sibling.downloadedBytes = 1024;
        EXPECT_FALSE(store_.put(url, sibling));
    };
    script(url, response);
    auto dm = makeManager();

    auto res = dm->fetch(url, [] { return false; });
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Stopped);
    EXPECT_TRUE(store_.cancellationFor(url)());
    EXPECT_EQ(countFiles(downloadsDir()), 0u);
}

TEST_F(DownloadManagerTest, LongNameIsShortenedKeepingExtension) {
    const std::string url = "https://files.example/" + std::string(240, 'a') + ".bin";
    script(url, okResponse({"first"}));
    auto dm = makeManager();

    auto res = dm->fetch(url);
    ASSERT_TRUE(res.ok()) << res.error().message;
    EXPECT_EQ(res.value().fileName, std::string(kMaxFileNameBytes - 4, 'a') + ".bin");
    EXPECT_EQ(read_file(res.value().filePath), "first");
    EXPECT_EQ(store_.get(url)->status, TransferStatus::Completed);

    // The collision suffix still fits
    auto again = dm->fetch(url);
    ASSERT_TRUE(again.ok()) << again.error().message;
    EXPECT_EQ(again.value().fileName, std::string(kMaxFileNameBytes - 4, 'a') + " (1).bin");
    EXPECT_EQ(countFiles(downloadsDir()), 2u);
}
