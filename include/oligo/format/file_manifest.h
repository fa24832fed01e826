// =============================================================================
// oligo-codec - File Manifest
// =============================================================================
// Self-description record carried by Header oligos, so a decoder can recover
// the file geometry without out-of-band configuration.
//
// Wire Layout (22 bytes, little-endian):
//   offset  0  u64  fileSize
//   offset  8  u16  chunkSize
//   offset 10  u8   nsym (Reed-Solomon parity symbols per chunk)
//   offset 11  u8   version
//   offset 12  u64  fingerprint (xxHash64 of the original bytes)
//   offset 20  u16  CRC-16/CCITT over bytes 0..19
// =============================================================================

#ifndef OLIGO_FORMAT_FILE_MANIFEST_H
#define OLIGO_FORMAT_FILE_MANIFEST_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "oligo/common/error.h"
#include "oligo/common/types.h"

namespace oligo::format {

inline constexpr std::size_t kManifestSize = 22;

inline constexpr std::uint8_t kManifestVersion = 1;

/// @brief Geometry and identity of an encoded file.
struct FileManifest {
    std::uint64_t fileSize = 0;
    std::uint16_t chunkSize = static_cast<std::uint16_t>(kDefaultChunkSize);
    std::uint8_t nsym = static_cast<std::uint8_t>(kDefaultErrorCorrectionSymbols);
    std::uint8_t version = kManifestVersion;
    Fingerprint fingerprint = 0;

    /// @brief Chunks needed for fileSize (an empty file still has one).
    [[nodiscard]] std::uint64_t expectedChunks() const noexcept {
        if (fileSize == 0 || chunkSize == 0) {
            return 1;
        }
        return (fileSize + chunkSize - 1) / chunkSize;
    }

    /// @brief Payload length of chunk @p chunkIdx.
    [[nodiscard]] std::size_t chunkPayloadSize(std::uint64_t chunkIdx) const noexcept {
        const std::uint64_t start = chunkIdx * chunkSize;
        if (start >= fileSize) {
            return 0;
        }
        const std::uint64_t remaining = fileSize - start;
        return static_cast<std::size_t>(remaining < chunkSize ? remaining : chunkSize);
    }

    [[nodiscard]] std::array<std::uint8_t, kManifestSize> serialize() const;

    bool operator==(const FileManifest&) const = default;
};

/// @brief Parse and verify a serialized manifest.
/// @return kFormatError on bad length, version or geometry;
///         kChecksumError on CRC-16 mismatch.
[[nodiscard]] Result<FileManifest> parseFileManifest(std::span<const std::uint8_t> bytes);

}  // namespace oligo::format

#endif  // OLIGO_FORMAT_FILE_MANIFEST_H
