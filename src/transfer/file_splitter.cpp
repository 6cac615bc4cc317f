/*
 * courier/src/transfer/file_splitter.cpp
 *
 * Sequential split/join with a fixed 1 MiB copy buffer, so memory use does not depend on
 * part size. Parts are written in index order; a failure part-way leaves nothing behind.
 */

#include <courier/transfer/file_splitter.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace courier::transfer {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferBytes = 1 << 20;

Error splitFailure(std::vector<PartFile>& written, std::string message) {
    removeParts(written);
    written.clear();
    spdlog::warn("split failed: {}", message);
    return Error{ErrorCode::SplitError, std::move(message)};
}

} // namespace

void removeParts(const std::vector<PartFile>& parts) noexcept {
    for (const auto& part : parts) {
        std::error_code ec;
        fs::remove(part.path, ec);
        if (ec)
            spdlog::debug("removeParts: {}: {}", part.path.string(), ec.message());
    }
}

Expected<std::vector<PartFile>> splitFile(const fs::path& source, std::uint64_t maxPartBytes,
                                          const fs::path& splitsDir) {
    if (maxPartBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "Part size must be greater than zero"};
    }

    std::vector<PartFile> parts;

    std::error_code ec;
    const auto total = fs::file_size(source, ec);
    if (ec) {
        return splitFailure(parts, "Cannot stat " + source.string() + ": " + ec.message());
    }
    fs::create_directories(splitsDir, ec);
    if (ec) {
        return splitFailure(parts,
                            "Cannot create " + splitsDir.string() + ": " + ec.message());
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return splitFailure(parts, "Cannot open " + source.string());
    }

    const auto baseName = sanitizeFileName(source.filename().string());
    const auto expectedParts = partCount(total, maxPartBytes);
    parts.reserve(static_cast<std::size_t>(expectedParts));

    std::vector<char> buffer(kCopyBufferBytes);
    for (std::uint64_t index = 1; index <= expectedParts; ++index) {
        const std::uint64_t offset = (index - 1) * maxPartBytes;
        const std::uint64_t want = std::min<std::uint64_t>(maxPartBytes, total - offset);

        PartFile part;
        part.index = static_cast<std::size_t>(index);
        part.path = splitsDir / (baseName + ".part" + std::to_string(index));

        std::ofstream out(part.path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return splitFailure(parts, "Cannot create " + part.path.string());
        }
        parts.push_back(part);

        std::uint64_t copied = 0;
        while (copied < want) {
            const auto chunk =
                static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), want - copied));
            in.read(buffer.data(), chunk);
            const auto got = in.gcount();
            if (got <= 0) {
                return splitFailure(parts, "Unexpected end of " + source.string() + " at byte " +
                                               std::to_string(offset + copied));
            }
            out.write(buffer.data(), got);
            if (!out) {
                return splitFailure(parts, "Write failed on " + part.path.string());
            }
            copied += static_cast<std::uint64_t>(got);
        }

        out.close();
        if (!out) {
            return splitFailure(parts, "Close failed on " + part.path.string());
        }
        parts.back().sizeBytes = copied;
    }

    spdlog::info("Split {} ({} bytes) into {} part(s) under {}", source.string(), total,
                 parts.size(), splitsDir.string());
    return parts;
}

Expected<std::uint64_t> joinParts(const std::vector<PartFile>& parts,
                                  const fs::path& destination) {
    std::vector<const PartFile*> ordered;
    ordered.reserve(parts.size());
    for (const auto& p : parts)
        ordered.push_back(&p);
    std::sort(ordered.begin(), ordered.end(),
              [](const PartFile* a, const PartFile* b) { return a->index < b->index; });
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        if (ordered[i]->index != i + 1) {
            return Error{ErrorCode::InvalidArgument,
                         "Parts are not indexed 1.." + std::to_string(ordered.size()) +
                             " (found index " + std::to_string(ordered[i]->index) + ")"};
        }
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Cannot create " + destination.string()};
    }

    std::vector<char> buffer(kCopyBufferBytes);
    std::uint64_t total = 0;
    for (const auto* part : ordered) {
        std::ifstream in(part->path, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::IoError, "Cannot open " + part->path.string()};
        }
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = in.gcount();
            if (got > 0) {
                out.write(buffer.data(), got);
                total += static_cast<std::uint64_t>(got);
            }
        }
        if (!in.eof()) {
            return Error{ErrorCode::IoError, "Read failed on " + part->path.string()};
        }
        if (!out) {
            return Error{ErrorCode::IoError, "Write failed on " + destination.string()};
        }
    }

    out.close();
    if (!out) {
        return Error{ErrorCode::IoError, "Close failed on " + destination.string()};
    }
    return total;
}

} // namespace courier::transfer
