// =============================================================================
// oligo-codec - File Manifest Implementation
// =============================================================================

#include "oligo/format/file_manifest.h"

#include <fmt/format.h>

#include "oligo/algo/checksum.h"

namespace oligo::format {

namespace {

constexpr std::size_t kCrcOffset = kManifestSize - 2;

template <typename T>
void writeLE(std::uint8_t* dst, T value) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        dst[i] = static_cast<std::uint8_t>(static_cast<std::uint64_t>(value) >> (8 * i));
    }
}

template <typename T>
T readLE(const std::uint8_t* src) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return static_cast<T>(value);
}

}  // namespace

std::array<std::uint8_t, kManifestSize> FileManifest::serialize() const {
    std::array<std::uint8_t, kManifestSize> out{};
    writeLE(out.data() + 0, fileSize);
    writeLE(out.data() + 8, chunkSize);
    out[10] = nsym;
    out[11] = version;
    writeLE(out.data() + 12, fingerprint);
    const std::uint16_t crc = algo::crc16Ccitt(std::span<const std::uint8_t>(out.data(), kCrcOffset));
    writeLE(out.data() + kCrcOffset, crc);
    return out;
}

Result<FileManifest> parseFileManifest(std::span<const std::uint8_t> bytes) {
    if (bytes.size() != kManifestSize) {
        return makeError<FileManifest>(
            ErrorCode::kFormatError,
            fmt::format("manifest is {} bytes, expected {}", bytes.size(), kManifestSize));
    }

    const auto stored = readLE<std::uint16_t>(bytes.data() + kCrcOffset);
    const std::uint16_t computed = algo::crc16Ccitt(bytes.first(kCrcOffset));
    if (stored != computed) {
        return makeError<FileManifest>(
            ErrorCode::kChecksumError,
            fmt::format("manifest CRC-16 mismatch: stored 0x{:04x}, computed 0x{:04x}", stored,
                        computed));
    }

    FileManifest manifest;
    manifest.fileSize = readLE<std::uint64_t>(bytes.data() + 0);
    manifest.chunkSize = readLE<std::uint16_t>(bytes.data() + 8);
    manifest.nsym = bytes[10];
    manifest.version = bytes[11];
    manifest.fingerprint = readLE<std::uint64_t>(bytes.data() + 12);

    if (manifest.version != kManifestVersion) {
        return makeError<FileManifest>(ErrorCode::kFormatError,
                                       fmt::format("unsupported manifest version {}",
                                                   static_cast<unsigned>(manifest.version)));
    }
    if (manifest.chunkSize == 0 ||
        static_cast<std::size_t>(manifest.chunkSize) + kChunkCrcSize + manifest.nsym >
            kMaxCodewordLength) {
        return makeError<FileManifest>(
            ErrorCode::kFormatError,
            fmt::format("manifest geometry chunk size {} with {} parity symbols is invalid",
                        manifest.chunkSize, static_cast<unsigned>(manifest.nsym)));
    }
    return manifest;
}

}  // namespace oligo::format
