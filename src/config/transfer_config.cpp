#include <courier/config/config_helpers.h>
#include <courier/config/transfer_config.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace courier::config {

using transfer::Error;
using transfer::ErrorCode;
using transfer::Expected;

namespace {

Error invalidValue(const std::string& section, const std::string& key, const std::string& raw) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for [" + section + "] " + key + ": '" + raw + "'"};
}

// Applies a u64 setting if present. Returns false (and sets err) when malformed.
template <typename T>
bool readU64(const std::filesystem::path& path, const std::string& section,
             const std::string& key, T& target, std::optional<Error>& err) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty())
        return true;
    auto v = parse_u64(raw);
    if (!v) {
        err = invalidValue(section, key, raw);
        return false;
    }
    target = static_cast<T>(*v);
    return true;
}

bool readBool(const std::filesystem::path& path, const std::string& section,
              const std::string& key, bool& target, std::optional<Error>& err) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty())
        return true;
    auto v = parse_bool(raw);
    if (!v) {
        err = invalidValue(section, key, raw);
        return false;
    }
    target = *v;
    return true;
}

bool readMillis(const std::filesystem::path& path, const std::string& key,
                std::chrono::milliseconds& target, std::optional<Error>& err) {
    std::uint64_t ms = static_cast<std::uint64_t>(target.count());
    if (!readU64(path, "transfer", key, ms, err))
        return false;
    target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    return true;
}

} // namespace

TransferConfig defaultTransferConfig(const std::filesystem::path& dataDir) {
    TransferConfig cfg;
    cfg.dataDir = dataDir;
    cfg.download.downloadsDir = dataDir / "downloads";
    cfg.batch.splitsDir = dataDir / "splits";
    return cfg;
}

Expected<TransferConfig> loadTransferConfig(const std::filesystem::path& config_path) {
    auto cfg = defaultTransferConfig(resolve_data_dir_from_config(config_path));

    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config at '{}', using defaults", config_path.string());
        return cfg;
    }

    if (auto v = parse_config_value(config_path, "transfer", "downloads_dir"); !v.empty())
        cfg.download.downloadsDir = expand_tilde(v);
    if (auto v = parse_config_value(config_path, "transfer", "splits_dir"); !v.empty())
        cfg.batch.splitsDir = expand_tilde(v);
    if (auto v = parse_config_value(config_path, "transfer", "user_agent"); !v.empty())
        cfg.download.http.userAgent = v;
    if (auto v = parse_config_value(config_path, "transfer", "ca_path"); !v.empty())
        cfg.download.http.caPath = expand_tilde(v).string();
    if (auto v = parse_config_value(config_path, "logging", "level"); !v.empty())
        cfg.logging.level = v;
    if (auto v = parse_config_value(config_path, "logging", "file"); !v.empty())
        cfg.logging.file = expand_tilde(v);

    std::optional<Error> err;
    auto& http = cfg.download.http;
    bool ok = readU64(config_path, "transfer", "split_threshold_bytes",
                      cfg.batch.splitThresholdBytes, err) &&
              readU64(config_path, "transfer", "part_size_bytes", cfg.batch.partSizeBytes, err) &&
              readU64(config_path, "transfer", "max_concurrent_transfers",
                      cfg.batch.maxConcurrentTransfers, err) &&
              readU64(config_path, "transfer", "max_redirects", http.maxRedirects, err) &&
              readMillis(config_path, "connect_timeout_ms", http.connectTimeout, err) &&
              readMillis(config_path, "idle_timeout_ms", http.idleTimeout, err) &&
              readBool(config_path, "transfer", "follow_redirects", http.followRedirects, err) &&
              readBool(config_path, "transfer", "tls_insecure", http.tlsInsecure, err);
    if (!ok)
        return *err;

    return cfg;
}

Expected<void> validate(const TransferConfig& cfg) {
    if (cfg.download.downloadsDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "downloads_dir must not be empty"};
    }
    if (cfg.batch.splitsDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "splits_dir must not be empty"};
    }
    if (cfg.batch.partSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "part_size_bytes must be greater than zero"};
    }
    if (cfg.batch.partSizeBytes > cfg.batch.splitThresholdBytes) {
        return Error{ErrorCode::InvalidArgument,
                     "part_size_bytes (" + std::to_string(cfg.batch.partSizeBytes) +
                         ") must not exceed split_threshold_bytes (" +
                         std::to_string(cfg.batch.splitThresholdBytes) + ")"};
    }
    if (cfg.download.http.connectTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "connect_timeout_ms must be greater than zero"};
    }
    if (cfg.download.http.idleTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "idle_timeout_ms must be greater than zero"};
    }
    return Expected<void>{};
}

} // namespace courier::config
