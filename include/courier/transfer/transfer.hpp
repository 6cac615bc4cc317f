#pragma once

/*
 * courier Transfer Pipeline - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data types shared by the progress store, download manager,
 * file splitter and batch orchestrator, plus the narrow interfaces the download manager
 * depends on (HTTP adapter, disk writer, integrity verifier).
 *
 * Design principles:
 * - Every transfer is keyed by its source URL in an injectable ProgressStore
 * - Cancellation is cooperative and observed once per body chunk
 * - Partial files never outlive a failed or cancelled transfer
 * - Oversized files are split into dense, 1-based parts that concatenate to the original
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::transfer {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Lifecycle of a single transfer. Pending is never observable through the store.
 */
enum class TransferStatus { Pending, Downloading, Completed, Stopped, Failed };

/**
 * Canonical error codes for transfer operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Cancelled,
    IoError,
    SplitError,
    Unknown
};

inline constexpr std::uint64_t kGiB = 1024ull * 1024ull * 1024ull;

/// Longest name sanitizeFileName() returns, leaving room under NAME_MAX (255) for the
/// " (N)" collision suffix and the ".partN" split suffix.
inline constexpr std::size_t kMaxFileNameBytes = 200;
inline constexpr std::size_t kMaxExtensionBytes = 16;

/// Files strictly larger than this are split before delivery.
inline constexpr std::uint64_t kDefaultSplitThresholdBytes = 2 * kGiB;

[[nodiscard]] constexpr bool isTerminal(TransferStatus s) noexcept {
    return s == TransferStatus::Completed || s == TransferStatus::Stopped ||
           s == TransferStatus::Failed;
}

[[nodiscard]] constexpr std::string_view toString(TransferStatus s) noexcept {
    switch (s) {
        case TransferStatus::Pending:
            return "pending";
        case TransferStatus::Downloading:
            return "downloading";
        case TransferStatus::Completed:
            return "completed";
        case TransferStatus::Stopped:
            return "stopped";
        case TransferStatus::Failed:
            return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::NetworkError:
            return "network_error";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::IoError:
            return "io_error";
        case ErrorCode::SplitError:
            return "split_error";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Progress snapshot for one transfer. The ProgressStore owns these records.
 */
struct TransferProgress {
    std::string url;
    std::string fileName;
    std::uint64_t fileSize{0}; // 0 = unknown (no Content-Length)
    std::uint64_t downloadedBytes{0};
    TransferStatus status{TransferStatus::Pending};
    std::chrono::system_clock::time_point startTime{};
    std::optional<std::string> error{};

    bool operator==(const TransferProgress&) const = default;
};

/**
 * Percentage complete in [0, 100], or nullopt when the total size is unknown.
 */
[[nodiscard]] inline std::optional<double> percentComplete(const TransferProgress& p) noexcept {
    if (p.fileSize == 0)
        return std::nullopt;
    return (static_cast<long double>(p.downloadedBytes) * 100.0L) /
           static_cast<long double>(p.fileSize);
}

/**
 * Successful fetch. Ownership of filePath passes to the caller.
 */
struct TransferResult {
    std::filesystem::path filePath;
    std::string fileName;
    std::uint64_t fileSize{0};
    std::string sha256; // lower-case hex
};

/**
 * One fragment of a split file. Index is 1-based and dense.
 */
struct PartFile {
    std::size_t index{0};
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to cancel at the next chunk
using ChunkSink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Response status line and headers, delivered once before the first body chunk.
 */
struct ResponseHead {
    long status{0};
    std::vector<Header> headers;

    /// Case-insensitive lookup; first occurrence wins.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] std::optional<std::uint64_t> contentLength() const;
    [[nodiscard]] bool isSuccess() const noexcept { return status >= 200 && status < 300; }
};

/**
 * Per-request transport options.
 */
struct HttpOptions {
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds idleTimeout{60000}; // abort when no bytes arrive for this long
    bool followRedirects{true};
    long maxRedirects{5};
    std::string userAgent{"courier/1.0"};
    bool tlsInsecure{false};
    std::string caPath; // empty = system default
};

using HeadCallback = std::function<Expected<void>(const ResponseHead&)>;

/**
 * HTTP adapter abstraction (libcurl implementation in http_adapter_curl.cpp).
 *
 * stream() issues a GET and reports exactly {head, body chunks}:
 * - onHead is called once, before the first chunk, with the final response (after redirects)
 * - sink is called for each body chunk, in arrival order, on the calling thread
 * - shouldCancel is polled before each chunk is handed to the sink
 * An error returned from onHead or sink aborts the stream and is returned unchanged.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Expected<void> stream(std::string_view url, const HttpOptions& options,
                                  const HeadCallback& onHead, const ChunkSink& sink,
                                  const ShouldCancel& shouldCancel) = 0;
};

/**
 * Streaming SHA-256 calculator.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    /// Lower-case hex digest; empty on failure.
    virtual std::string finalize() = 0;
};

/**
 * Exclusively owned staging file. Discarded on destruction unless committed.
 */
class IStagedFile {
public:
    virtual ~IStagedFile() = default;

    [[nodiscard]] virtual const std::filesystem::path& path() const noexcept = 0;

    virtual Expected<void> write(std::span<const std::byte> data) = 0;

    /**
     * Flush, fsync and rename into the target directory under fileName, or a
     * "name (N).ext" variant if fileName is already taken. Returns the final path.
     */
    virtual Expected<std::filesystem::path> commit() = 0;

    /// Remove the staging file. Safe to call more than once.
    virtual void discard() noexcept = 0;
};

/**
 * Disk writer for staging downloads in the downloads directory.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create a fresh staging file in dir for a download that will be named fileName.
     * The directory is created on demand.
     */
    virtual Expected<std::unique_ptr<IStagedFile>>
    createStagingFile(const std::filesystem::path& dir, std::string_view fileName) = 0;
};

// ======================
// Factories / utilities
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256();

/// SHA-256 of a file on disk (lower-case hex).
Expected<std::string> sha256File(const std::filesystem::path& path);

/// File name from a Content-Disposition value (filename*= preferred over filename=).
[[nodiscard]] std::optional<std::string> fileNameFromContentDisposition(std::string_view value);

/// Last path segment of a URL, percent-decoded, without query or fragment.
[[nodiscard]] std::optional<std::string> fileNameFromUrl(std::string_view url);

/// Strip directory components and control characters, shorten to kMaxFileNameBytes keeping
/// the extension; never returns an empty name.
[[nodiscard]] std::string sanitizeFileName(std::string_view name);

} // namespace courier::transfer
