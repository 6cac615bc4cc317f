#pragma once

#include <courier/transfer/transfer.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace courier::transfer {

struct WorkspaceEntry {
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
};

struct PurgeReport {
    std::size_t downloadsRemoved{0};
    std::size_t splitsRemoved{0};
};

/**
 * The two local directories a transfer touches: finished downloads and split parts.
 */
class Workspace {
public:
    Workspace(std::filesystem::path downloadsDir, std::filesystem::path splitsDir);

    /// Create both directories if missing.
    Expected<void> ensure() const;

    /// Regular files in the downloads directory, sorted by name. Missing directory = empty.
    Expected<std::vector<WorkspaceEntry>> listDownloads() const;

    /// Remove every regular file in both directories.
    Expected<PurgeReport> purge() const;

    [[nodiscard]] const std::filesystem::path& downloadsDir() const noexcept {
        return downloadsDir_;
    }
    [[nodiscard]] const std::filesystem::path& splitsDir() const noexcept { return splitsDir_; }

private:
    std::filesystem::path downloadsDir_;
    std::filesystem::path splitsDir_;
};

} // namespace courier::transfer
