/*
 * courier/src/transfer/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Staging file ".courier-<stamp>-<seq>.part" next to its final location in the downloads
 *   directory; its length does not depend on the final name
 * - One open stream per staging file, owned by the transfer that created it
 * - Commit = flush + fsync + no-clobber rename to "<name>", or "<stem> (N)<ext>" if taken
 * - A staging file that is not committed is removed when its handle is destroyed
 */

#include <courier/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace courier::transfer {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_stagingCounter{0};

// ---------- Helpers (platform-specific sync) ----------

Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

void fsync_dir_best_effort(const fs::path& dir) {
#if !defined(_WIN32)
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return;
    if (::fsync(fd) != 0) {
        spdlog::debug("fsync(dir) failed for {} (continuing)", dir.string());
    }
    ::close(fd);
#else
    (void)dir;
#endif
}

fs::path candidate_name(const fs::path& dir, std::string_view fileName, int attempt) {
    if (attempt == 0)
        return dir / std::string(fileName);
    fs::path base(std::string{fileName});
    auto stem = base.stem().string();
    auto ext = base.extension().string();
    return dir / (stem + " (" + std::to_string(attempt) + ")" + ext);
}

// Rename src to dst only if dst does not exist. Returns false (no error) when dst is taken.
Expected<bool> rename_no_clobber(const fs::path& src, const fs::path& dst) {
#if defined(_WIN32)
    if (MoveFileExW(src.wstring().c_str(), dst.wstring().c_str(), MOVEFILE_WRITE_THROUGH))
        return true;
    if (GetLastError() == ERROR_ALREADY_EXISTS || GetLastError() == ERROR_FILE_EXISTS)
        return false;
    return Error{ErrorCode::IoError, "MoveFileEx failed: " + src.string() + " -> " + dst.string()};
#else
    // link() fails with EEXIST instead of replacing, which rename() would do silently
    if (::link(src.c_str(), dst.c_str()) == 0) {
        ::unlink(src.c_str());
        return true;
    }
    if (errno == EEXIST)
        return false;
    std::error_code ec(errno, std::generic_category());
    if (errno == EPERM || errno == ENOTSUP || errno == EXDEV) {
        // Filesystems without hard links: check-then-rename
        if (fs::exists(dst))
            return false;
        fs::rename(src, dst, ec);
        if (!ec)
            return true;
    }
    return Error{ErrorCode::IoError,
                 "rename failed (" + ec.message() + "): " + src.string() + " -> " + dst.string()};
#endif
}

class StagedFile final : public IStagedFile {
public:
    StagedFile(fs::path dir, std::string fileName, fs::path stagingPath, std::ofstream out)
        : dir_(std::move(dir)), fileName_(std::move(fileName)), path_(std::move(stagingPath)),
          out_(std::move(out)) {}

    ~StagedFile() override {
        if (!committed_)
            discard();
    }

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const fs::path& path() const noexcept override { return path_; }

    Expected<void> write(std::span<const std::byte> data) override {
        if (committed_ || discarded_) {
            return Error{ErrorCode::IoError, "write on closed staging file: " + path_.string()};
        }
        out_.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!out_.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + path_.string()};
        }
        return Expected<void>{};
    }

    Expected<fs::path> commit() override {
        if (committed_ || discarded_) {
            return Error{ErrorCode::IoError, "commit on closed staging file: " + path_.string()};
        }
        out_.flush();
        if (!out_.good()) {
            return Error{ErrorCode::IoError, "flush failed on: " + path_.string()};
        }
        out_.close();

        auto synced = fsync_file(path_);
        if (!synced.ok())
            return synced.error();

        for (int attempt = 0; attempt < 10000; ++attempt) {
            auto target = candidate_name(dir_, fileName_, attempt);
            auto moved = rename_no_clobber(path_, target);
            if (!moved.ok())
                return moved.error();
            if (moved.value()) {
                committed_ = true;
                fsync_dir_best_effort(dir_);
                return target;
            }
        }
        return Error{ErrorCode::IoError, "No free file name for " + fileName_ + " in " +
                                             dir_.string()};
    }

    void discard() noexcept override {
        if (discarded_)
            return;
        discarded_ = true;
        if (out_.is_open())
            out_.close();
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            spdlog::warn("discard: failed to remove staging file {}: {}", path_.string(),
                         ec.message());
        }
    }

private:
    fs::path dir_;
    std::string fileName_;
    fs::path path_;
    std::ofstream out_;
    bool committed_{false};
    bool discarded_{false};
};

class DiskWriter final : public IDiskWriter {
public:
    Expected<std::unique_ptr<IStagedFile>> createStagingFile(const fs::path& dir,
                                                             std::string_view fileName) override {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory " + dir.string() + ": " + ec.message()};
        }

        auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                          std::chrono::steady_clock::now().time_since_epoch())
                          .count();
        auto seq = g_stagingCounter.fetch_add(1, std::memory_order_relaxed);
        std::string fn =
            ".courier-" + std::to_string(now_ns) + "-" + std::to_string(seq) + ".part";
        fs::path stagingFile = dir / fn;

        std::ofstream os(stagingFile, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError,
                         "Failed to create staging file: " + stagingFile.string()};
        }

        return std::unique_ptr<IStagedFile>(std::make_unique<StagedFile>(
            dir, std::string(fileName), std::move(stagingFile), std::move(os)));
    }
};

} // namespace

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace courier::transfer
