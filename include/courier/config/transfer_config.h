#pragma once

#include <courier/transfer/batch_orchestrator.hpp>
#include <courier/transfer/download_manager.hpp>
#include <courier/transfer/transfer.hpp>

#include <filesystem>
#include <string>

namespace courier::config {

struct LoggingConfig {
    std::string level{"warn"};
    std::filesystem::path file; // empty = console only
};

/**
 * Effective settings for one courier process.
 *
 * [core]      data_dir
 * [transfer]  downloads_dir, splits_dir, split_threshold_bytes, part_size_bytes,
 *             max_concurrent_transfers, connect_timeout_ms, idle_timeout_ms,
 *             follow_redirects, max_redirects, user_agent, ca_path, tls_insecure
 * [logging]   level, file
 */
struct TransferConfig {
    std::filesystem::path dataDir;
    transfer::DownloadOptions download;
    transfer::BatchOptions batch;
    LoggingConfig logging;
};

/// Defaults rooted at dataDir ("<dataDir>/downloads", "<dataDir>/splits").
TransferConfig defaultTransferConfig(const std::filesystem::path& dataDir);

/**
 * Build the effective config from config_path (a missing file yields defaults).
 * Malformed numeric or boolean values are InvalidArgument.
 */
transfer::Expected<TransferConfig> loadTransferConfig(const std::filesystem::path& config_path);

/**
 * Reject settings the pipeline cannot honor: zero part size, part size above the split
 * threshold (a file one byte over the threshold must yield at least two parts), empty
 * directories.
 */
transfer::Expected<void> validate(const TransferConfig& cfg);

} // namespace courier::config
