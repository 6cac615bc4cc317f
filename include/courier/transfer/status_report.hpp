#pragma once

#include <courier/transfer/transfer.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace courier::transfer {

/// Human-readable size with two decimals: "512.00 B", "1.50 KB", "3.00 GB".
[[nodiscard]] std::string formatBytes(std::uint64_t bytes);

/**
 * Multi-line report of the given snapshots (one block per transfer: name, size, progress,
 * status). Unknown sizes print "?" for size and progress.
 */
[[nodiscard]] std::string renderStatusReport(const std::vector<TransferProgress>& transfers);

} // namespace courier::transfer
