#pragma once

#include <courier/transfer/transfer.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace courier::transfer {

/// True when a file of sizeBytes must be split before delivery (strictly above threshold).
[[nodiscard]] constexpr bool needsSplit(std::uint64_t sizeBytes,
                                        std::uint64_t thresholdBytes) noexcept {
    return sizeBytes > thresholdBytes;
}

/// ceil(sizeBytes / maxPartBytes); 0 for an empty file or a zero part size.
[[nodiscard]] constexpr std::uint64_t partCount(std::uint64_t sizeBytes,
                                                std::uint64_t maxPartBytes) noexcept {
    if (maxPartBytes == 0)
        return 0;
    return sizeBytes / maxPartBytes + (sizeBytes % maxPartBytes != 0 ? 1 : 0);
}

/**
 * Split source into "<source filename>.part<N>" files (N from 1) of exactly maxPartBytes,
 * the last part possibly shorter, written under splitsDir.
 *
 * - InvalidArgument when maxPartBytes is 0
 * - SplitError when the source cannot be read or a part cannot be written; parts written so
 *   far are removed
 * The source is left untouched.
 */
Expected<std::vector<PartFile>> splitFile(const std::filesystem::path& source,
                                          std::uint64_t maxPartBytes,
                                          const std::filesystem::path& splitsDir);

/**
 * Concatenate parts in index order into destination (created or truncated).
 * Parts must be indexed 1..N without gaps, in any order.
 */
Expected<std::uint64_t> joinParts(const std::vector<PartFile>& parts,
                                  const std::filesystem::path& destination);

/// Remove every part file; missing files are ignored.
void removeParts(const std::vector<PartFile>& parts) noexcept;

} // namespace courier::transfer
