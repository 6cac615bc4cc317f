#include <courier/transfer/workspace.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace courier::transfer {

namespace fs = std::filesystem;

namespace {

Expected<std::size_t> removeRegularFiles(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec))
        return std::size_t{0};

    std::size_t removed = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fileEc;
        if (!it->is_regular_file(fileEc))
            continue;
        if (fs::remove(it->path(), fileEc)) {
            ++removed;
        } else if (fileEc) {
            return Error{ErrorCode::IoError,
                         "Failed to remove " + it->path().string() + ": " + fileEc.message()};
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to list " + dir.string() + ": " + ec.message()};
    }
    return removed;
}

} // namespace

Workspace::Workspace(fs::path downloadsDir, fs::path splitsDir)
    : downloadsDir_(std::move(downloadsDir)), splitsDir_(std::move(splitsDir)) {}

Expected<void> Workspace::ensure() const {
    for (const auto& dir : {downloadsDir_, splitsDir_}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create " + dir.string() + ": " + ec.message()};
        }
    }
    return Expected<void>{};
}

Expected<std::vector<WorkspaceEntry>> Workspace::listDownloads() const {
    std::vector<WorkspaceEntry> out;
    std::error_code ec;
    if (!fs::exists(downloadsDir_, ec))
        return out;

    for (fs::directory_iterator it(downloadsDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fileEc;
        if (!it->is_regular_file(fileEc))
            continue;
        auto size = it->file_size(fileEc);
        out.push_back(WorkspaceEntry{it->path(), fileEc ? 0 : size});
    }
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to list " + downloadsDir_.string() + ": " + ec.message()};
    }
    std::sort(out.begin(), out.end(), [](const WorkspaceEntry& a, const WorkspaceEntry& b) {
        return a.path.filename() < b.path.filename();
    });
    return out;
}

Expected<PurgeReport> Workspace::purge() const {
    PurgeReport report;
    auto downloads = removeRegularFiles(downloadsDir_);
    if (!downloads.ok())
        return downloads.error();
    report.downloadsRemoved = downloads.value();

    auto splits = removeRegularFiles(splitsDir_);
    if (!splits.ok())
        return splits.error();
    report.splitsRemoved = splits.value();

    spdlog::info("Purged {} download(s) and {} part(s)", report.downloadsRemoved,
                 report.splitsRemoved);
    return report;
}

} // namespace courier::transfer
