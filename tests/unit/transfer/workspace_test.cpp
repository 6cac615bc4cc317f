#include <gtest/gtest.h>

#include "../../support/temp_dir_scope.hpp"

#include <courier/transfer/workspace.hpp>

#include <filesystem>

using namespace courier::transfer;
using courier::test_support::TempDirScope;
using courier::test_support::write_file;

namespace fs = std::filesystem;

TEST(Workspace, EnsureCreatesBothDirectories) {
    auto tmp = TempDirScope::unique_under("courier_ws_ensure");
    Workspace ws(tmp / "a" / "downloads", tmp / "b" / "splits");
    ASSERT_TRUE(ws.ensure().ok());
    EXPECT_TRUE(fs::is_directory(ws.downloadsDir()));
    EXPECT_TRUE(fs::is_directory(ws.splitsDir()));
}

TEST(Workspace, ListDownloadsSortedFilesOnly) {
    auto tmp = TempDirScope::unique_under("courier_ws_list");
    Workspace ws(tmp / "downloads", tmp / "splits");
    write_file(tmp / "downloads" / "b.bin", "bb");
    write_file(tmp / "downloads" / "a.txt", "a");
    fs::create_directories(tmp / "downloads" / "subdir");

    auto entries = ws.listDownloads();
    ASSERT_TRUE(entries.ok()) << entries.error().message;
    ASSERT_EQ(entries.value().size(), 2u);
    EXPECT_EQ(entries.value()[0].path.filename().string(), "a.txt");
    EXPECT_EQ(entries.value()[0].sizeBytes, 1u);
    EXPECT_EQ(entries.value()[1].path.filename().string(), "b.bin");
    EXPECT_EQ(entries.value()[1].sizeBytes, 2u);
}

TEST(Workspace, MissingDirectoryListsEmpty) {
    auto tmp = TempDirScope::unique_under("courier_ws_missing");
    Workspace ws(tmp / "nope", tmp / "nope2");
    auto entries = ws.listDownloads();
    ASSERT_TRUE(entries.ok());
    EXPECT_TRUE(entries.value().empty());

    auto purged = ws.purge();
    ASSERT_TRUE(purged.ok());
    EXPECT_EQ(purged.value().downloadsRemoved, 0u);
    EXPECT_EQ(purged.value().splitsRemoved, 0u);
}

TEST(Workspace, PurgeRemovesFilesButKeepsDirectories) {
    auto tmp = TempDirScope::unique_under("courier_ws_purge");
    Workspace ws(tmp / "downloads", tmp / "splits");
    write_file(tmp / "downloads" / "a", "1");
    write_file(tmp / "downloads" / "b", "2");
    write_file(tmp / "splits" / "a.part1", "1");

    auto purged = ws.purge();
    ASSERT_TRUE(purged.ok()) << purged.error().message;
    EXPECT_EQ(purged.value().downloadsRemoved, 2u);
    EXPECT_EQ(purged.value().splitsRemoved, 1u);
    EXPECT_TRUE(fs::is_directory(tmp / "downloads"));
    EXPECT_TRUE(fs::is_empty(tmp / "downloads"));
    EXPECT_TRUE(fs::is_empty(tmp / "splits"));
}
