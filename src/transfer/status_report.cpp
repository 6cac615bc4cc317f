#include <courier/transfer/status_report.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <iterator>

namespace courier::transfer {

std::string formatBytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 4> kUnits = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < kUnits.size() - 1) {
        size /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", size, kUnits[unit]);
}

std::string renderStatusReport(const std::vector<TransferProgress>& transfers) {
    if (transfers.empty())
        return "No active transfers\n";

    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "Active transfers ({})\n", transfers.size());
    for (const auto& t : transfers) {
        fmt::format_to(it, "\n{}\n", t.fileName);
        if (auto pct = percentComplete(t)) {
            fmt::format_to(it, "  Size:     {}\n", formatBytes(t.fileSize));
            fmt::format_to(it, "  Progress: {:.1f}%\n", *pct);
        } else {
            fmt::format_to(it, "  Size:     ?\n");
            fmt::format_to(it, "  Progress: ? ({} received)\n", formatBytes(t.downloadedBytes));
        }
        fmt::format_to(it, "  Status:   {}\n", toString(t.status));
        if (t.error && t.status != TransferStatus::Downloading)
            fmt::format_to(it, "  Error:    {}\n", *t.error);
    }
    return out;
}

} // namespace courier::transfer
