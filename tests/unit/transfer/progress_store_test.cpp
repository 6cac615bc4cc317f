#include <gtest/gtest.h>

#include <courier/transfer/progress_store.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace courier::transfer;

namespace {

TransferProgress makeProgress(const std::string& url, TransferStatus status,
                              std::uint64_t downloaded = 0, std::uint64_t size = 0) {
    TransferProgress p;
    p.url = url;
    p.fileName = "file.bin";
    p.fileSize = size;
    p.downloadedBytes = downloaded;
    p.status = status;
    p.startTime = std::chrono::system_clock::now();
    return p;
}

} // namespace

TEST(ProgressStore, GetReturnsLastPut) {
    ProgressStore store;
    auto p = makeProgress("https://a/x", TransferStatus::Downloading, 10, 100);
    EXPECT_TRUE(store.put(p.url, p));

    p.downloadedBytes = 50;
    EXPECT_TRUE(store.put(p.url, p));

    auto got = store.get(p.url);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->downloadedBytes, 50u);
    EXPECT_EQ(got->status, TransferStatus::Downloading);
}

TEST(ProgressStore, GetUnknownKeyIsEmpty) {
    ProgressStore store;
    EXPECT_FALSE(store.get("https://nowhere").has_value());
    EXPECT_TRUE(store.listActive().empty());
}

TEST(ProgressStore, TerminalRecordIsFrozenForSameTransfer) {
    ProgressStore store;
    auto p = makeProgress("https://a/x", TransferStatus::Downloading, 10, 100);
    store.put(p.url, p);
    ASSERT_TRUE(store.markStopped(p.url));

    // A late chunk update from the same transfer must not resurrect it
    p.downloadedBytes = 20;
    EXPECT_FALSE(store.put(p.url, p));
    auto got = store.get(p.url);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->status, TransferStatus::Stopped);
    EXPECT_EQ(got->downloadedBytes, 10u);
    ASSERT_TRUE(got->error.has_value());
    EXPECT_EQ(*got->error, "Download stopped by user");
}

TEST(ProgressStore, NewTransferOfSameUrlOverwritesTerminal) {
    ProgressStore store;
    auto first = makeProgress("https://a/x", TransferStatus::Failed);
    store.put(first.url, first);

    auto second = first;
    second.status = TransferStatus::Downloading;
    second.error.reset();
    second.startTime = first.startTime + std::chrono::seconds(1);
    EXPECT_TRUE(store.put(second.url, second));
    EXPECT_EQ(store.get(second.url)->status, TransferStatus::Downloading);
}

TEST(ProgressStore, MarkStoppedIgnoresTerminalAndMissing) {
    ProgressStore store;
    auto done = makeProgress("https://a/done", TransferStatus::Completed, 5, 5);
    store.put(done.url, done);

    EXPECT_FALSE(store.markStopped(done.url));
    EXPECT_FALSE(store.markStopped("https://a/missing"));
    EXPECT_EQ(store.get(done.url)->status, TransferStatus::Completed);
}

TEST(ProgressStore, MarkAllStoppedCountsOnlyActive) {
    ProgressStore store;
    for (const auto* url : {"https://a/1", "https://a/2", "https://a/3"}) {
        auto p = makeProgress(url, TransferStatus::Downloading);
        store.put(url, p);
    }
    auto failed = makeProgress("https://a/4", TransferStatus::Failed);
    store.put(failed.url, failed);

    EXPECT_EQ(store.markAllStopped(), 3u);
    EXPECT_EQ(store.markAllStopped(), 0u);
    for (const auto& p : store.listActive()) {
        if (p.url == failed.url)
            EXPECT_EQ(p.status, TransferStatus::Failed);
        else
            EXPECT_EQ(p.status, TransferStatus::Stopped);
    }
}

TEST(ProgressStore, CancellationPredicateFollowsRecord) {
    ProgressStore store;
    auto p = makeProgress("https://a/x", TransferStatus::Downloading);
    auto cancel = store.cancellationFor(p.url);

    EXPECT_FALSE(cancel()); // no record yet
    store.put(p.url, p);
    EXPECT_FALSE(cancel());
    store.markStopped(p.url);
    EXPECT_TRUE(cancel());
}

TEST(ProgressStore, ListActiveIsStableWithoutWrites) {
    ProgressStore store;
    for (const auto* url : {"https://c", "https://a", "https://b"}) {
        auto p = makeProgress(url, TransferStatus::Downloading);
        store.put(url, p);
    }
    auto first = store.listActive();
    auto second = store.listActive();
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.front().url, "https://a");
}

TEST(ProgressStore, ClearTerminalKeepsActive) {
    ProgressStore store;
    auto active = makeProgress("https://a/active", TransferStatus::Downloading);
    auto done = makeProgress("https://a/done", TransferStatus::Completed);
    auto failed = makeProgress("https://a/failed", TransferStatus::Failed);
    store.put(active.url, active);
    store.put(done.url, done);
    store.put(failed.url, failed);

    EXPECT_EQ(store.clearTerminal(), 2u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.get(active.url).has_value());
    EXPECT_TRUE(store.erase(active.url));
    EXPECT_FALSE(store.erase(active.url));
}

TEST(ProgressStore, ConcurrentWritersAndReaders) {
    ProgressStore store;
    constexpr int kThreads = 8;
    constexpr int kUpdates = 500;
    std::atomic<bool> done{false};

    std::thread reader([&] {
        while (!done.load()) {
            for (const auto& p : store.listActive())
                EXPECT_LE(p.downloadedBytes, static_cast<std::uint64_t>(kUpdates));
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&store, t] {
            auto p = makeProgress("https://a/" + std::to_string(t), TransferStatus::Downloading);
            for (int i = 1; i <= kUpdates; ++i) {
                p.downloadedBytes = static_cast<std::uint64_t>(i);
                store.put(p.url, p);
            }
        });
    }
    for (auto& w : writers)
        w.join();
    done = true;
    reader.join();

    ASSERT_EQ(store.size(), static_cast<std::size_t>(kThreads));
    for (const auto& p : store.listActive())
        EXPECT_EQ(p.downloadedBytes, static_cast<std::uint64_t>(kUpdates));
}

TEST(ProgressStore, StopReachesEveryTransferSharingAKey) {
    ProgressStore store;
    auto first = makeProgress("https://a/x", TransferStatus::Downloading, 10, 4096);
    auto second = first;
    second.startTime = first.startTime + std::chrono::milliseconds(1);
    second.downloadedBytes = 0;
    store.put(first.url, first);
    store.put(second.url, second); // the record now holds the later transfer

    EXPECT_EQ(store.markAllStopped(), 1u);

    // Neither transfer may write the record back to Downloading
    first.downloadedBytes = 1024;
    EXPECT_FALSE(store.put(first.url, first));
    second.downloadedBytes = 1024;
    EXPECT_FALSE(store.put(second.url, second));
    EXPECT_EQ(store.get(first.url)->status, TransferStatus::Stopped);
    EXPECT_TRUE(store.cancellationFor(first.url)());

    // Each may still record that it stopped
    first.status = TransferStatus::Stopped;
    EXPECT_TRUE(store.put(first.url, first));
    EXPECT_TRUE(store.cancellationFor(second.url)());

    // A transfer started after the request is unaffected
    auto later = makeProgress("https://a/x", TransferStatus::Downloading);
    later.startTime = std::chrono::system_clock::now() + std::chrono::seconds(1);
    EXPECT_TRUE(store.put(later.url, later));
    EXPECT_FALSE(store.cancellationFor(later.url)());
}

TEST(ProgressStore, StopAfterSiblingCompletedStillStopsTheOther) {
    ProgressStore store;
    auto running = makeProgress("https://a/x", TransferStatus::Downloading, 10, 100);
    auto finished = makeProgress("https://a/x", TransferStatus::Completed, 100, 100);
    finished.startTime = running.startTime + std::chrono::milliseconds(1);
    store.put(running.url, running);
    store.put(finished.url, finished);

    EXPECT_FALSE(store.markStopped(running.url)); // record is terminal
    running.downloadedBytes = 20;
    EXPECT_FALSE(store.put(running.url, running));
    EXPECT_EQ(store.get(running.url)->status, TransferStatus::Completed);
}

TEST(ProgressStore, EraseForgetsStopRequest) {
    ProgressStore store;
    auto p = makeProgress("https://a/x", TransferStatus::Downloading);
    store.put(p.url, p);
    store.markStopped(p.url);
    ASSERT_TRUE(store.erase(p.url));

    EXPECT_TRUE(store.put(p.url, p));
    EXPECT_EQ(store.get(p.url)->status, TransferStatus::Downloading);
}
